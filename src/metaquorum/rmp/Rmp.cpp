#include "metaquorum/rmp/Rmp.hpp"

#include <cstdio>
#include <limits>
#include <string>

namespace MQ::Rmp {
namespace {

constexpr std::size_t kReadChunk = 64 * 1024;

// The metacache stream carries scalars only; bound containers so a corrupt header cannot
// make the unpacker reserve room for billions of elements.
constexpr std::size_t kStreamContainerLimit = 1024;

// Decoded values are copied out of the read buffer so it can be reused for the next chunk.
auto copy_payload(msgpack::type::object_type, std::size_t, void*) -> bool {
    return false;
}

[[nodiscard]] auto marker_error(std::string_view expected, std::uint8_t marker) -> Error {
    char text[64];
    std::snprintf(text, sizeof(text), "expected %.*s, got marker 0x%02x", static_cast<int>(expected.size()), expected.data(), marker);
    return Error{Error::Code::MalformedInput, text};
}

[[nodiscard]] auto type_error(std::string_view expected) -> Error {
    return Error{Error::Code::MalformedInput, "expected " + std::string{expected}};
}

[[nodiscard]] auto length_error(std::string_view what, std::size_t length) -> Error {
    return Error{Error::Code::InvalidArgument, std::string{what} + " length " + std::to_string(length) + " exceeds u32"};
}

[[nodiscard]] auto eof_error() -> Error {
    return Error{Error::Code::Unexpected, "unexpected end of stream"};
}

[[nodiscard]] auto decode_error(msgpack::unpack_error const& error) -> Error {
    return Error{Error::Code::MalformedInput, std::string{"msgpack: "} + error.what()};
}

} // namespace

auto Packer::packPfix(std::uint8_t value) -> Expected<void> {
    if (value > Marker::PositiveFixMax) {
        return std::unexpected(Error{Error::Code::InvalidArgument, "positive fixint out of range: " + std::to_string(value)});
    }
    this->pack_uint8(value);
    return {};
}

auto Packer::packStr(std::string_view value) -> Expected<void> {
    if (value.size() > std::numeric_limits<std::uint32_t>::max()) {
        return std::unexpected(length_error("str", value.size()));
    }
    auto const length = static_cast<std::uint32_t>(value.size());
    this->pack_str(length);
    this->pack_str_body(value.data(), length);
    return {};
}

auto Packer::packBin(std::span<std::byte const> value) -> Expected<void> {
    if (value.size() > std::numeric_limits<std::uint32_t>::max()) {
        return std::unexpected(length_error("bin", value.size()));
    }
    auto const length = static_cast<std::uint32_t>(value.size());
    this->pack_bin(length);
    this->pack_bin_body(reinterpret_cast<char const*>(value.data()), length);
    return {};
}

auto Packer::bytes() const -> std::span<std::byte const> {
    return {reinterpret_cast<std::byte const*>(this->sbuffer.data()), this->sbuffer.size()};
}

auto Packer::toVector() const -> std::vector<std::byte> {
    auto view = this->bytes();
    return {view.begin(), view.end()};
}

auto Packer::flushTo(IO::ByteWriter& out) -> Expected<void> {
    if (this->sbuffer.size() == 0) {
        return {};
    }
    if (auto written = out.writeAll(this->bytes()); !written) {
        return written;
    }
    this->sbuffer.clear();
    return {};
}

auto unpack(std::span<std::byte const> bytes, std::size_t& offset) -> Expected<msgpack::object_handle> {
    if (offset >= bytes.size()) {
        return std::unexpected(eof_error());
    }
    // Every element takes at least one byte, so nothing larger than the rest of the input is legal.
    auto const remaining = bytes.size() - offset;
    msgpack::unpack_limit const limit{remaining, remaining, remaining, remaining, remaining};
    try {
        return msgpack::unpack(reinterpret_cast<char const*>(bytes.data()), bytes.size(), offset, nullptr, nullptr, limit);
    } catch (msgpack::insufficient_bytes const&) {
        return std::unexpected(eof_error());
    } catch (msgpack::unpack_error const& error) {
        return std::unexpected(decode_error(error));
    }
}

auto unpackPfix(std::span<std::byte const> bytes, std::size_t& offset) -> Expected<std::uint8_t> {
    if (offset >= bytes.size()) {
        return std::unexpected(eof_error());
    }
    auto const marker = std::to_integer<std::uint8_t>(bytes[offset]);
    if (marker > Marker::PositiveFixMax) {
        return std::unexpected(marker_error("positive fixint", marker));
    }
    ++offset;
    return marker;
}

StreamUnpacker::StreamUnpacker(IO::ByteReader& in)
    : in_(in),
      unpacker_(&copy_payload,
                nullptr,
                MSGPACK_UNPACKER_INIT_BUFFER_SIZE,
                msgpack::unpack_limit{kStreamContainerLimit, kStreamContainerLimit}) {}

auto StreamUnpacker::fill() -> Expected<std::size_t> {
    this->unpacker_.reserve_buffer(kReadChunk);
    std::span<std::byte> window{reinterpret_cast<std::byte*>(this->unpacker_.buffer()), this->unpacker_.buffer_capacity()};
    auto got = this->in_.readSome(window);
    if (!got) {
        return got;
    }
    this->unpacker_.buffer_consumed(*got);
    return got;
}

auto StreamUnpacker::next() -> Expected<msgpack::object_handle> {
    msgpack::object_handle handle;
    try {
        while (!this->unpacker_.next(handle)) {
            auto got = this->fill();
            if (!got) {
                return std::unexpected(got.error());
            }
            if (*got == 0) {
                return std::unexpected(eof_error());
            }
        }
    } catch (msgpack::unpack_error const& error) {
        return std::unexpected(decode_error(error));
    }
    return handle;
}

auto StreamUnpacker::peekMarker() -> Expected<std::uint8_t> {
    while (this->unpacker_.nonparsed_size() == 0) {
        auto got = this->fill();
        if (!got) {
            return std::unexpected(got.error());
        }
        if (*got == 0) {
            return std::unexpected(eof_error());
        }
    }
    return static_cast<std::uint8_t>(this->unpacker_.nonparsed_buffer()[0]);
}

auto StreamUnpacker::readPfix() -> Expected<std::uint8_t> {
    auto marker = this->peekMarker();
    if (!marker) {
        return marker;
    }
    if (*marker > Marker::PositiveFixMax) {
        return std::unexpected(marker_error("positive fixint", *marker));
    }
    auto handle = this->next();
    if (!handle) {
        return std::unexpected(handle.error());
    }
    return static_cast<std::uint8_t>(handle->get().via.u64);
}

auto StreamUnpacker::readU32() -> Expected<std::uint32_t> {
    auto marker = this->peekMarker();
    if (!marker) {
        return std::unexpected(marker.error());
    }
    if (*marker != Marker::U32) {
        return std::unexpected(marker_error("u32", *marker));
    }
    auto handle = this->next();
    if (!handle) {
        return std::unexpected(handle.error());
    }
    return static_cast<std::uint32_t>(handle->get().via.u64);
}

auto StreamUnpacker::readStr() -> Expected<std::string> {
    auto handle = this->next();
    if (!handle) {
        return std::unexpected(handle.error());
    }
    return asStr(handle->get());
}

auto StreamUnpacker::readBin() -> Expected<std::vector<std::byte>> {
    auto handle = this->next();
    if (!handle) {
        return std::unexpected(handle.error());
    }
    return asBin(handle->get()).transform([](std::span<std::byte const> view) { return std::vector<std::byte>{view.begin(), view.end()}; });
}

auto asUint(msgpack::object const& object) -> Expected<std::uint64_t> {
    if (object.type != msgpack::type::POSITIVE_INTEGER) {
        return std::unexpected(type_error("unsigned integer"));
    }
    return object.via.u64;
}

auto asInt(msgpack::object const& object) -> Expected<std::int64_t> {
    if (object.type == msgpack::type::NEGATIVE_INTEGER) {
        return object.via.i64;
    }
    if (object.type != msgpack::type::POSITIVE_INTEGER) {
        return std::unexpected(type_error("integer"));
    }
    if (object.via.u64 > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
        return std::unexpected(Error{Error::Code::MalformedInput, "u64 value does not fit in i64"});
    }
    return static_cast<std::int64_t>(object.via.u64);
}

auto asBool(msgpack::object const& object) -> Expected<bool> {
    if (object.type != msgpack::type::BOOLEAN) {
        return std::unexpected(type_error("bool"));
    }
    return object.via.boolean;
}

auto asStr(msgpack::object const& object) -> Expected<std::string> {
    if (object.type != msgpack::type::STR) {
        return std::unexpected(type_error("str"));
    }
    std::string value{object.via.str.ptr, object.via.str.size};
    if (!isValidUtf8(value)) {
        return std::unexpected(Error{Error::Code::MalformedInput, "string field is not valid UTF-8"});
    }
    return value;
}

auto asBin(msgpack::object const& object) -> Expected<std::span<std::byte const>> {
    if (object.type != msgpack::type::BIN) {
        return std::unexpected(type_error("bin"));
    }
    return std::span<std::byte const>{reinterpret_cast<std::byte const*>(object.via.bin.ptr), object.via.bin.size};
}

auto asArray(msgpack::object const& object) -> Expected<std::span<msgpack::object const>> {
    if (object.type != msgpack::type::ARRAY) {
        return std::unexpected(type_error("array"));
    }
    return std::span<msgpack::object const>{object.via.array.ptr, object.via.array.size};
}

auto isValidUtf8(std::string_view text) -> bool {
    auto const* bytes = reinterpret_cast<unsigned char const*>(text.data());
    std::size_t i     = 0;
    std::size_t n     = text.size();
    while (i < n) {
        auto const lead = bytes[i];
        if (lead < 0x80) {
            ++i;
            continue;
        }
        std::size_t   extra = 0;
        std::uint32_t cp    = 0;
        std::uint32_t min   = 0;
        if ((lead & 0xe0) == 0xc0) {
            extra = 1;
            cp    = lead & 0x1f;
            min   = 0x80;
        } else if ((lead & 0xf0) == 0xe0) {
            extra = 2;
            cp    = lead & 0x0f;
            min   = 0x800;
        } else if ((lead & 0xf8) == 0xf0) {
            extra = 3;
            cp    = lead & 0x07;
            min   = 0x10000;
        } else {
            return false;
        }
        if (i + extra >= n) {
            return false;
        }
        for (std::size_t k = 1; k <= extra; ++k) {
            auto const cont = bytes[i + k];
            if ((cont & 0xc0) != 0x80) {
                return false;
            }
            cp = (cp << 6) | (cont & 0x3f);
        }
        if (cp < min || cp > 0x10ffff || (cp >= 0xd800 && cp <= 0xdfff)) {
            return false;
        }
        i += extra + 1;
    }
    return true;
}

} // namespace MQ::Rmp
