#include "metaquorum/io/ByteStream.hpp"

#include <array>

namespace MQ::IO {
namespace {

template <typename T>
[[nodiscard]] auto read_big_endian(ByteReader& reader) -> Expected<T> {
    std::array<std::byte, sizeof(T)> buffer{};
    if (auto read = reader.readExact(buffer); !read) {
        return std::unexpected(read.error());
    }
    T value = 0;
    for (auto byte : buffer) {
        value = static_cast<T>((value << 8) | static_cast<T>(std::to_integer<std::uint8_t>(byte)));
    }
    return value;
}

template <typename T>
[[nodiscard]] auto write_big_endian(ByteWriter& writer, T value) -> Expected<void> {
    std::array<std::byte, sizeof(T)> buffer{};
    for (std::size_t i = 0; i < sizeof(T); ++i) {
        auto const shift = 8 * (sizeof(T) - 1 - i);
        buffer[i]        = static_cast<std::byte>((value >> shift) & 0xFFu);
    }
    return writer.writeAll(buffer);
}

} // namespace

auto ByteReader::readSome(std::span<std::byte> buffer) -> Expected<std::size_t> {
    if (buffer.empty()) {
        return 0;
    }
    if (auto read = this->readExact(buffer.first(1)); !read) {
        if (read.error().code == Error::Code::Unexpected) {
            return 0;
        }
        return std::unexpected(read.error());
    }
    return 1;
}

auto ByteReader::readU8() -> Expected<std::uint8_t> {
    return read_big_endian<std::uint8_t>(*this);
}

auto ByteReader::readU16Be() -> Expected<std::uint16_t> {
    return read_big_endian<std::uint16_t>(*this);
}

auto ByteReader::readU32Be() -> Expected<std::uint32_t> {
    return read_big_endian<std::uint32_t>(*this);
}

auto ByteReader::readU64Be() -> Expected<std::uint64_t> {
    return read_big_endian<std::uint64_t>(*this);
}

auto ByteWriter::writeU8(std::uint8_t value) -> Expected<void> {
    return write_big_endian(*this, value);
}

auto ByteWriter::writeU16Be(std::uint16_t value) -> Expected<void> {
    return write_big_endian(*this, value);
}

auto ByteWriter::writeU32Be(std::uint32_t value) -> Expected<void> {
    return write_big_endian(*this, value);
}

auto ByteWriter::writeU64Be(std::uint64_t value) -> Expected<void> {
    return write_big_endian(*this, value);
}

} // namespace MQ::IO
