#pragma once
#include "metaquorum/core/Error.hpp"
#include "metaquorum/io/ByteStream.hpp"

#include <msgpack.hpp>

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

/*
 * MessagePack glue for the metacache stream and the on-disk metadata format, on top of
 * msgpack-cxx. Packing goes into an owned sbuffer that is flushed to a ByteWriter. Reading
 * either unpacks from a byte span or pulls values one at a time from a ByteReader.
 *
 * Fields with a fixed wire form (positive fixint tags, the five byte 0xce error code) are
 * checked against the marker byte; every other field accepts any encoding of its type.
 */
namespace MQ::Rmp {

namespace Marker {
inline constexpr std::uint8_t PositiveFixMax = 0x7f;
inline constexpr std::uint8_t FixArray       = 0x90;
inline constexpr std::uint8_t FixStr         = 0xa0;
inline constexpr std::uint8_t Bin8           = 0xc4;
inline constexpr std::uint8_t Bin16          = 0xc5;
inline constexpr std::uint8_t U32            = 0xce;
inline constexpr std::uint8_t Str8           = 0xd9;
inline constexpr std::uint8_t Str16          = 0xda;
inline constexpr std::uint8_t Str32          = 0xdb;
} // namespace Marker

class Packer : public msgpack::packer<msgpack::sbuffer> {
public:
    Packer() : msgpack::packer<msgpack::sbuffer>(sbuffer) {}

    Packer(Packer const&)            = delete;
    Packer& operator=(Packer const&) = delete;

    // Positive fixint; values above 0x7f are rejected.
    auto packPfix(std::uint8_t value) -> Expected<void>;
    auto packStr(std::string_view value) -> Expected<void>;
    auto packBin(std::span<std::byte const> value) -> Expected<void>;

    [[nodiscard]] auto bytes() const -> std::span<std::byte const>;
    [[nodiscard]] auto size() const -> std::size_t { return this->sbuffer.size(); }
    [[nodiscard]] auto toVector() const -> std::vector<std::byte>;

    // Writes the packed bytes to `out` and empties the buffer.
    auto flushTo(IO::ByteWriter& out) -> Expected<void>;

private:
    msgpack::sbuffer sbuffer;
};

// Unpacks the value starting at `offset` and advances it. A value cut short is Code::Unexpected.
[[nodiscard]] auto unpack(std::span<std::byte const> bytes, std::size_t& offset) -> Expected<msgpack::object_handle>;

// Same, requiring the value at `offset` to be a positive fixint.
[[nodiscard]] auto unpackPfix(std::span<std::byte const> bytes, std::size_t& offset) -> Expected<std::uint8_t>;

/*
 * Pulls MessagePack values from a ByteReader. Bytes are read ahead into the unpacker's buffer,
 * so the reader must not be shared with anything else while the StreamUnpacker is in use.
 */
class StreamUnpacker {
public:
    explicit StreamUnpacker(IO::ByteReader& in);

    auto next() -> Expected<msgpack::object_handle>;

    // Marker byte of the next value, without consuming it.
    auto peekMarker() -> Expected<std::uint8_t>;

    auto readPfix() -> Expected<std::uint8_t>;
    auto readU32() -> Expected<std::uint32_t>;
    auto readStr() -> Expected<std::string>;
    auto readBin() -> Expected<std::vector<std::byte>>;

private:
    // Reads more input into the unpacker; zero at end of stream.
    auto fill() -> Expected<std::size_t>;

    IO::ByteReader&   in_;
    msgpack::unpacker unpacker_;
};

// Typed access to unpacked values. A value of another type is Code::MalformedInput.
// Spans point into the object and live as long as its handle.
[[nodiscard]] auto asUint(msgpack::object const& object) -> Expected<std::uint64_t>;
[[nodiscard]] auto asInt(msgpack::object const& object) -> Expected<std::int64_t>;
[[nodiscard]] auto asBool(msgpack::object const& object) -> Expected<bool>;
[[nodiscard]] auto asStr(msgpack::object const& object) -> Expected<std::string>;
[[nodiscard]] auto asBin(msgpack::object const& object) -> Expected<std::span<std::byte const>>;
[[nodiscard]] auto asArray(msgpack::object const& object) -> Expected<std::span<msgpack::object const>>;

[[nodiscard]] auto isValidUtf8(std::string_view text) -> bool;

} // namespace MQ::Rmp
