#pragma once
#include "metaquorum/core/Error.hpp"
#include "metaquorum/io/ByteStream.hpp"
#include "metaquorum/metacache/MetaCacheEntry.hpp"
#include "metaquorum/rmp/Rmp.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string_view>
#include <utility>
#include <vector>

namespace MQ::MetaCache {

inline constexpr std::uint8_t kMetacacheStreamVersion = 1;

enum class EntryType : std::uint8_t {
    Close,
    Object,
    Error,
};

inline constexpr std::array<std::pair<EntryType, std::uint8_t>, 3> kEntryTypeWire{{
    {EntryType::Close, 0},
    {EntryType::Object, 1},
    {EntryType::Error, 2},
}};

namespace detail {
[[nodiscard]] consteval auto entryTypeWireUnique() -> bool {
    for (std::size_t i = 0; i < kEntryTypeWire.size(); ++i) {
        for (std::size_t j = i + 1; j < kEntryTypeWire.size(); ++j) {
            if (kEntryTypeWire[i].first == kEntryTypeWire[j].first || kEntryTypeWire[i].second == kEntryTypeWire[j].second) {
                return false;
            }
        }
    }
    return true;
}
} // namespace detail

static_assert(detail::entryTypeWireUnique(), "kEntryTypeWire must be a bijection");

[[nodiscard]] constexpr auto entryTypeToWire(EntryType type) -> std::uint8_t {
    for (auto const& [candidate, wire] : kEntryTypeWire) {
        if (candidate == type) {
            return wire;
        }
    }
    return 0;
}

[[nodiscard]] constexpr auto entryTypeFromWire(std::uint8_t wire) -> std::optional<EntryType> {
    for (auto const& [type, candidate] : kEntryTypeWire) {
        if (candidate == wire) {
            return type;
        }
    }
    return std::nullopt;
}

/*
 * Writes a metacache stream: one version byte followed by records of
 *   tag | name (str) | metadata (bin) | error code (u32) | error message (str)
 * The stream is terminated by close(). The writer does not own the sink.
 */
class MetacacheWriter {
public:
    explicit MetacacheWriter(IO::ByteWriter& out) : out_(out) {}

    // Writes the version byte if it has not been written yet.
    auto init() -> Expected<void>;

    // Rejects the whole batch, before writing anything, if any entry has an empty name.
    auto write(std::span<MetaCacheEntry const> entries) -> Expected<void>;

    // Single record; the name is written as is.
    auto writeObj(MetaCacheEntry const& entry) -> Expected<void>;

    auto close() -> Expected<void>;
    auto writeErr(std::uint32_t code, std::string_view message) -> Expected<void>;

    [[nodiscard]] auto created() const -> bool { return this->created_; }

private:
    auto writeRecord(EntryType                  type,
                     std::string_view           name,
                     std::span<std::byte const> metadata,
                     std::uint32_t              code,
                     std::string_view           message) -> Expected<void>;

    IO::ByteWriter& out_;
    bool            created_ = false;
};

/*
 * Reads a metacache stream produced by MetacacheWriter. The version byte is checked on first
 * use and a bad version fails every later call. Error records, and object records carrying
 * an error code, are returned as failures. Input is read ahead in chunks, so the source
 * should not be read by anyone else while the reader is alive.
 */
class MetacacheReader {
public:
    explicit MetacacheReader(IO::ByteReader& in) : in_(in) {}

    // Next entry, or nullopt once the close record has been read.
    auto next() -> Expected<std::optional<MetaCacheEntry>>;

    // Like next() but the entry stays in place for the following call.
    auto peek() -> Expected<std::optional<MetaCacheEntry>>;

    // Discards up to `count` entries. Reaching the close record early is not an error.
    auto skip(std::size_t count) -> Expected<void>;

    auto readAll() -> Expected<std::vector<MetaCacheEntry>>;

    [[nodiscard]] auto closed() const -> bool { return this->closed_; }

private:
    auto checkInit() -> Expected<void>;
    auto readRecord() -> Expected<std::optional<MetaCacheEntry>>;

    Rmp::StreamUnpacker                      in_;
    bool                                     init_   = false;
    bool                                     closed_ = false;
    std::optional<Error>                     err_;
    std::optional<Expected<MetaCacheEntry>>  current_;
};

} // namespace MQ::MetaCache
