#pragma once
#include "metaquorum/filemeta/MergeVersions.hpp"
#include "metaquorum/metacache/MetaCacheEntry.hpp"

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace MQ::MetaCache {

using VersionLists = std::vector<std::vector<Meta::ShallowVersion>>;
using MergeFunction = std::function<std::vector<Meta::ShallowVersion>(std::size_t quorum,
                                                                      bool strict,
                                                                      std::size_t requestedVersions,
                                                                      VersionLists const& candidates)>;

// Counters describing the last resolve call.
struct MetadataResolutionStats {
    std::size_t dirExists = 0;
    std::size_t objsValid = 0;
    std::size_t objsAgree = 0;
};

struct MetadataResolutionParams {
    std::size_t   dirQuorum         = 0;
    std::size_t   objQuorum         = 0;
    std::size_t   requestedVersions = 0;
    std::string   bucket;
    bool          strict = false;
    VersionLists  candidates; // cleared and refilled by every resolve call
    MergeFunction merge = &Meta::mergeFileMetaVersions;

    MetadataResolutionStats stats;
};

/*
 * One slot per disk for a single listing position. Absent slots mean the disk had nothing
 * for this position; slot order follows disk order and is kept by the caller.
 */
class MetaCacheEntries {
public:
    MetaCacheEntries() = default;
    explicit MetaCacheEntries(std::size_t slotCount) : slots_(slotCount) {}
    explicit MetaCacheEntries(std::vector<std::optional<MetaCacheEntry>> slots) : slots_(std::move(slots)) {}

    [[nodiscard]] auto size() const -> std::size_t { return this->slots_.size(); }
    [[nodiscard]] auto empty() const -> bool { return this->slots_.empty(); }
    [[nodiscard]] auto slots() const -> std::vector<std::optional<MetaCacheEntry>> const& { return this->slots_; }
    [[nodiscard]] auto slots() -> std::vector<std::optional<MetaCacheEntry>>& { return this->slots_; }
    [[nodiscard]] auto operator[](std::size_t index) -> std::optional<MetaCacheEntry>& { return this->slots_[index]; }
    [[nodiscard]] auto operator[](std::size_t index) const -> std::optional<MetaCacheEntry> const& { return this->slots_[index]; }

    /*
     * Picks the canonical entry for this position, or nothing when quorum cannot be reached.
     * A directory wins only with `dirQuorum` directory reports. Objects need `objQuorum` decodable
     * reports; when they do not all agree the version lists are merged through `params.merge`.
     */
    [[nodiscard]] auto resolve(MetadataResolutionParams& params) const -> std::optional<MetaCacheEntry>;

    // First present slot, and the total slot count.
    [[nodiscard]] auto firstFound() const -> std::pair<std::optional<MetaCacheEntry>, std::size_t>;

private:
    std::vector<std::optional<MetaCacheEntry>> slots_;
};

// Result of one sorted listing, with the bookkeeping used to continue it.
class MetaCacheEntriesSorted {
public:
    MetaCacheEntriesSorted() = default;
    explicit MetaCacheEntriesSorted(MetaCacheEntries entries) : o(std::move(entries)) {}

    // Present entries in order.
    [[nodiscard]] auto entries() const -> std::vector<MetaCacheEntry const*>;

    // Drops every slot up to and including the last entry whose name is not after `marker`.
    auto forwardPast(std::optional<std::string_view> marker) -> void;

    MetaCacheEntries           o;
    std::optional<std::string> listId;
    bool                       reuse = false;
    std::optional<std::string> lastSkippedEntry;
};

} // namespace MQ::MetaCache
