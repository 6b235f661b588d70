#pragma once
#include "metaquorum/core/Error.hpp"
#include "metaquorum/filemeta/FileMeta.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace MQ::MetaCache {

inline constexpr std::string_view kSlashSeparator = "/";

/*
 * One disk's report for one name during a listing: nothing, a directory marker (no metadata,
 * name ends with '/'), or the encoded object metadata. The decoded version list is memoised
 * in `cached` the first time it is needed and never replaced afterwards.
 */
struct MetaCacheEntry {
    std::string                   name;
    std::vector<std::byte>        metadata;
    std::optional<Meta::FileMeta> cached;
    std::optional<Error>          error;
    bool                          reusable = false;

    [[nodiscard]] auto isDir() const -> bool;
    [[nodiscard]] auto isObject() const -> bool { return !this->metadata.empty(); }
    [[nodiscard]] auto isObjectDir() const -> bool;

    // True when the entry is a direct child of `dir`. Names nested deeper, and names that do not start with `dir`, are not.
    [[nodiscard]] auto isInDir(std::string_view dir, std::string_view separator = kSlashSeparator) const -> bool;

    // Decoded versions, or nullptr for directories and undecodable metadata.
    [[nodiscard]] auto xlMeta() -> Meta::FileMeta const*;

    [[nodiscard]] auto isLatestDeleteMarker() -> bool;

    /*
     * Compares two observations of the same listing position. Returns the entry that should be
     * preferred (if any) and whether the two agree. Both entries may have their decode memo
     * filled as a side effect.
     */
    [[nodiscard]] auto matches(MetaCacheEntry& other, bool strict) -> std::pair<std::optional<MetaCacheEntry>, bool>;

    // The transported fields; the decode memo and the reuse hint are local.
    [[nodiscard]] auto operator==(MetaCacheEntry const& other) const -> bool {
        return this->name == other.name && this->metadata == other.metadata && this->error == other.error;
    }
};

} // namespace MQ::MetaCache
