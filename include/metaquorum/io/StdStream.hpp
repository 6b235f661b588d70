#pragma once
#include "metaquorum/io/ByteStream.hpp"

#include <istream>
#include <ostream>

namespace MQ::IO {

// Adapters over caller-owned iostreams (files, string streams).
class IStreamReader final : public ByteReader {
public:
    explicit IStreamReader(std::istream& stream) : stream_(stream) {}

    auto readExact(std::span<std::byte> buffer) -> Expected<void> override;
    auto readSome(std::span<std::byte> buffer) -> Expected<std::size_t> override;

private:
    std::istream& stream_;
};

class OStreamWriter final : public ByteWriter {
public:
    explicit OStreamWriter(std::ostream& stream) : stream_(stream) {}

    auto writeAll(std::span<std::byte const> buffer) -> Expected<void> override;
    auto flush() -> Expected<void>;

private:
    std::ostream& stream_;
};

} // namespace MQ::IO
