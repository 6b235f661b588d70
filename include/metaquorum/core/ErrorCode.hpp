#pragma once
#include "metaquorum/core/Error.hpp"

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace MQ {

/*
 * Stable numeric error codes that cross process and wire boundaries.
 * High 16 bits carry the error type (category), low 16 bits the code within it.
 */
namespace ErrorTypes {
inline constexpr std::uint16_t System   = 0x0000;
inline constexpr std::uint16_t FileMeta = 0x0001;
inline constexpr std::uint16_t Storage  = 0x0002;
inline constexpr std::uint16_t Disk     = 0x0003;
inline constexpr std::uint16_t Iam      = 0x0004;
inline constexpr std::uint16_t Policy   = 0x0005;
inline constexpr std::uint16_t Crypto   = 0x0006;
inline constexpr std::uint16_t Notify   = 0x0007;
inline constexpr std::uint16_t Api      = 0x0008;
inline constexpr std::uint16_t Network  = 0x0009;
inline constexpr std::uint16_t Config   = 0x000A;
inline constexpr std::uint16_t Auth     = 0x000B;
inline constexpr std::uint16_t Bucket   = 0x000C;
inline constexpr std::uint16_t Object   = 0x000D;
inline constexpr std::uint16_t Query    = 0x000E;
inline constexpr std::uint16_t Admin    = 0x000F;
} // namespace ErrorTypes

class ErrorCode {
public:
    constexpr ErrorCode() = default;
    constexpr ErrorCode(std::uint16_t type, std::uint16_t specific)
        : code_((static_cast<std::uint32_t>(type) << 16) | specific) {}

    [[nodiscard]] static constexpr auto fromU32(std::uint32_t raw) -> ErrorCode {
        ErrorCode code;
        code.code_ = raw;
        return code;
    }

    [[nodiscard]] constexpr auto asU32() const -> std::uint32_t { return code_; }
    [[nodiscard]] constexpr auto type() const -> std::uint16_t { return static_cast<std::uint16_t>(code_ >> 16); }
    [[nodiscard]] constexpr auto specific() const -> std::uint16_t { return static_cast<std::uint16_t>(code_ & 0xFFFFu); }

    [[nodiscard]] auto typeName() const -> std::string_view;
    [[nodiscard]] auto isSystemError() const -> bool;
    [[nodiscard]] auto isStorageError() const -> bool;
    [[nodiscard]] auto isAuthError() const -> bool;

    // "FileMeta:0001:0004"
    [[nodiscard]] auto toString() const -> std::string;

    constexpr auto operator==(ErrorCode const&) const -> bool = default;

private:
    std::uint32_t code_ = 0;
};

// Wire numbering of Error::Code inside ErrorTypes::FileMeta. Append only.
inline constexpr std::array<std::pair<Error::Code, std::uint16_t>, 12> kFileMetaCodes{{
    {Error::Code::FileNotFound, 0x0001},
    {Error::Code::FileVersionNotFound, 0x0002},
    {Error::Code::VolumeNotFound, 0x0003},
    {Error::Code::FileCorrupt, 0x0004},
    {Error::Code::DoneForNow, 0x0005},
    {Error::Code::MethodNotAllowed, 0x0006},
    {Error::Code::Unexpected, 0x0007},
    {Error::Code::Io, 0x0008},
    {Error::Code::UnsupportedVersion, 0x0009},
    {Error::Code::MalformedInput, 0x000A},
    {Error::Code::InvalidArgument, 0x000B},
    {Error::Code::InvalidError, 0x000C},
}};

namespace detail {
[[nodiscard]] consteval auto fileMetaCodesUnique() -> bool {
    for (std::size_t i = 0; i < kFileMetaCodes.size(); ++i) {
        if (kFileMetaCodes[i].second == 0) {
            return false;
        }
        for (std::size_t j = i + 1; j < kFileMetaCodes.size(); ++j) {
            if (kFileMetaCodes[i].first == kFileMetaCodes[j].first || kFileMetaCodes[i].second == kFileMetaCodes[j].second) {
                return false;
            }
        }
    }
    return true;
}

// Every Error::Code needs a number; code 0 on the wire means no error.
[[nodiscard]] consteval auto fileMetaCodesComplete() -> bool {
    for (int raw = static_cast<int>(Error::Code::InvalidError); raw <= static_cast<int>(Error::Code::InvalidArgument); ++raw) {
        bool found = false;
        for (auto const& [code, specific] : kFileMetaCodes) {
            found = found || code == static_cast<Error::Code>(raw);
        }
        if (!found) {
            return false;
        }
    }
    return true;
}
} // namespace detail

static_assert(detail::fileMetaCodesUnique(), "kFileMetaCodes must map each error code to a distinct non-zero number");
static_assert(detail::fileMetaCodesComplete(), "kFileMetaCodes must cover every Error::Code");

[[nodiscard]] auto toErrorCode(Error const& error) -> ErrorCode;

/*
 * Rebuilds an error received as (code, message). Io codes and codes outside the registry
 * come back as Error::other(message) so the text is never lost. Code 0 means "no error".
 */
[[nodiscard]] auto errorFromCode(std::uint32_t code, std::string message) -> std::optional<Error>;

} // namespace MQ
