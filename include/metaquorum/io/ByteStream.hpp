#pragma once
#include "metaquorum/core/Error.hpp"

#include <cstddef>
#include <cstdint>
#include <span>

namespace MQ::IO {

/*
 * Source of bytes for the metacache codecs. Implementations provide readExact, which must
 * either fill the whole buffer or fail; a stream that ends early reports Error::Code::Unexpected.
 * The big-endian helpers are built on top of it.
 *
 * readSome returns whatever is available, at least one byte, or zero at end of stream. The
 * default reads a single byte through readExact; transports override it to read in bulk.
 */
class ByteReader {
public:
    virtual ~ByteReader() = default;

    [[nodiscard]] virtual auto readExact(std::span<std::byte> buffer) -> Expected<void> = 0;
    [[nodiscard]] virtual auto readSome(std::span<std::byte> buffer) -> Expected<std::size_t>;

    [[nodiscard]] auto readU8() -> Expected<std::uint8_t>;
    [[nodiscard]] auto readU16Be() -> Expected<std::uint16_t>;
    [[nodiscard]] auto readU32Be() -> Expected<std::uint32_t>;
    [[nodiscard]] auto readU64Be() -> Expected<std::uint64_t>;
};

/*
 * Sink of bytes. writeAll must write the complete buffer or fail.
 */
class ByteWriter {
public:
    virtual ~ByteWriter() = default;

    [[nodiscard]] virtual auto writeAll(std::span<std::byte const> buffer) -> Expected<void> = 0;

    [[nodiscard]] auto writeU8(std::uint8_t value) -> Expected<void>;
    [[nodiscard]] auto writeU16Be(std::uint16_t value) -> Expected<void>;
    [[nodiscard]] auto writeU32Be(std::uint32_t value) -> Expected<void>;
    [[nodiscard]] auto writeU64Be(std::uint64_t value) -> Expected<void>;
};

} // namespace MQ::IO
