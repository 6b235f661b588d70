#pragma once
#include "metaquorum/core/Error.hpp"
#include "metaquorum/filemeta/VersionHeader.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

namespace MQ::Meta {

inline constexpr std::array<std::byte, 4> kXl2Magic{std::byte{'X'}, std::byte{'L'}, std::byte{'2'}, std::byte{' '}};
inline constexpr std::uint16_t            kXlVersionMajor  = 1;
inline constexpr std::uint16_t            kXlVersionMinor  = 3;
inline constexpr std::uint8_t             kXlHeaderVersion = 3;
inline constexpr std::uint8_t             kXlMetaVersion   = 2;

// A version header together with its still-encoded payload.
struct ShallowVersion {
    VersionHeader          header;
    std::vector<std::byte> meta;

    auto operator==(ShallowVersion const&) const -> bool = default;
};

// Result of validating the fixed eight byte prefix of a metadata blob.
struct Xl2Prefix {
    std::span<std::byte const> payload;
    std::uint16_t              major = 0;
    std::uint16_t              minor = 0;
};

/*
 * Decoded metadata of one object on one disk: every version it knows about, newest first.
 *
 * Layout on disk:
 *   "XL2 " | u16 LE major | u16 LE minor | bin( pfix headerVersion, pfix metaVersion,
 *                                                array[ [bin header, bin meta], ... ] )
 */
struct FileMeta {
    std::uint8_t                metaVersion = kXlMetaVersion;
    std::vector<ShallowVersion> versions;

    auto operator==(FileMeta const&) const -> bool = default;

    [[nodiscard]] static auto load(std::span<std::byte const> bytes) -> Expected<FileMeta>;
    [[nodiscard]] auto        marshal() const -> Expected<std::vector<std::byte>>;

    // Newest modification time across all versions; empty when there are none.
    [[nodiscard]] auto latestModTime() const -> std::optional<std::int64_t>;

    // Inserts keeping newest-first order. A version with the same id replaces the old one.
    auto addVersion(ShallowVersion version) -> void;

    [[nodiscard]] static auto isXl2V1Format(std::span<std::byte const> bytes) -> bool;
    [[nodiscard]] static auto checkXl2V1(std::span<std::byte const> bytes) -> Expected<Xl2Prefix>;

    /*
     * Looks only at the first header of a payload returned by checkXl2V1. A payload with no
     * versions, or one that cannot be read, is reported as a delete marker.
     */
    [[nodiscard]] static auto isLatestDeleteMarker(std::span<std::byte const> payload) -> bool;
};

} // namespace MQ::Meta
