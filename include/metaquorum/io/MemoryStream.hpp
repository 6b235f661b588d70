#pragma once
#include "metaquorum/io/ByteStream.hpp"

#include <cstddef>
#include <limits>
#include <utility>
#include <vector>

namespace MQ::IO {

// Appends to an owned buffer. A capacity can be set to simulate a full device.
class MemoryWriter final : public ByteWriter {
public:
    MemoryWriter() = default;
    explicit MemoryWriter(std::size_t capacity) : capacity_(capacity) {}

    auto writeAll(std::span<std::byte const> buffer) -> Expected<void> override;

    [[nodiscard]] auto data() const -> std::vector<std::byte> const& { return data_; }
    [[nodiscard]] auto size() const -> std::size_t { return data_.size(); }
    [[nodiscard]] auto take() -> std::vector<std::byte> { return std::move(data_); }

private:
    std::vector<std::byte> data_;
    std::size_t            capacity_ = std::numeric_limits<std::size_t>::max();
};

class MemoryReader final : public ByteReader {
public:
    explicit MemoryReader(std::vector<std::byte> data) : data_(std::move(data)) {}

    auto readExact(std::span<std::byte> buffer) -> Expected<void> override;
    auto readSome(std::span<std::byte> buffer) -> Expected<std::size_t> override;

    [[nodiscard]] auto remaining() const -> std::size_t { return data_.size() - position_; }
    [[nodiscard]] auto position() const -> std::size_t { return position_; }

private:
    std::vector<std::byte> data_;
    std::size_t            position_ = 0;
};

} // namespace MQ::IO
