#pragma once
#include "metaquorum/core/Error.hpp"
#include "metaquorum/rmp/Rmp.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace MQ::Meta {

enum class VersionType : std::uint8_t {
    Invalid = 0,
    Object  = 1,
    Delete  = 2,
    Legacy  = 3,
};

[[nodiscard]] auto versionTypeToString(VersionType type) -> std::string_view;

namespace VersionFlags {
inline constexpr std::uint8_t FreeVersion = 1 << 0;
inline constexpr std::uint8_t UsesDataDir = 1 << 1;
inline constexpr std::uint8_t InlineData  = 1 << 2;
} // namespace VersionFlags

using VersionId = std::array<std::uint8_t, 16>;
using Signature = std::array<std::uint8_t, 4>;

/*
 * Summary of one object version, small enough to compare across disks without decoding the
 * full version payload. Equality is field-wise; the erasure fields take part in it.
 */
struct VersionHeader {
    VersionId     versionId{};
    std::int64_t  modTime = 0; // nanoseconds since the Unix epoch
    Signature     signature{};
    VersionType   type  = VersionType::Invalid;
    std::uint8_t  flags = 0;
    std::uint8_t  ecN   = 0;
    std::uint8_t  ecM   = 0;

    auto operator==(VersionHeader const&) const -> bool = default;

    [[nodiscard]] auto hasEc() const -> bool { return ecN > 0 && ecM > 0; }

    // Erasure layouts only conflict when both sides declare one.
    [[nodiscard]] auto matchesEc(VersionHeader const& other) const -> bool;

    // Same version id and type with compatible erasure layout.
    [[nodiscard]] auto matchesNotStrict(VersionHeader const& other) const -> bool;

    // Total order used when two disks disagree: newer first, then by type, signature, id, flags.
    [[nodiscard]] auto sortsBefore(VersionHeader const& other) const -> bool;

    [[nodiscard]] auto freeVersion() const -> bool { return (flags & VersionFlags::FreeVersion) != 0; }

    [[nodiscard]] auto withoutEc() const -> VersionHeader {
        auto copy = *this;
        copy.ecN  = 0;
        copy.ecM  = 0;
        return copy;
    }

    // Seven element array: id, mod time, signature, type, flags, ec data, ec parity.
    [[nodiscard]] auto encode(Rmp::Packer& out) const -> Expected<void>;

    // `bytes` must hold exactly one encoded header.
    [[nodiscard]] static auto decode(std::span<std::byte const> bytes) -> Expected<VersionHeader>;
};

// Canonical 8-4-4-4-12 hex form, used by the tools.
[[nodiscard]] auto versionIdToString(VersionId const& id) -> std::string;

} // namespace MQ::Meta
