#include "metaquorum/io/MemoryStream.hpp"

#include <algorithm>

namespace MQ::IO {

auto MemoryWriter::writeAll(std::span<std::byte const> buffer) -> Expected<void> {
    if (buffer.size() > this->capacity_ - this->data_.size()) {
        return std::unexpected(Error::io(std::errc::no_space_on_device, "memory writer capacity exceeded"));
    }
    this->data_.insert(this->data_.end(), buffer.begin(), buffer.end());
    return {};
}

auto MemoryReader::readExact(std::span<std::byte> buffer) -> Expected<void> {
    if (buffer.size() > this->remaining()) {
        this->position_ = this->data_.size();
        return std::unexpected(Error{Error::Code::Unexpected, "unexpected end of stream"});
    }
    std::copy_n(this->data_.begin() + static_cast<std::ptrdiff_t>(this->position_), buffer.size(), buffer.begin());
    this->position_ += buffer.size();
    return {};
}

auto MemoryReader::readSome(std::span<std::byte> buffer) -> Expected<std::size_t> {
    auto const take = std::min(buffer.size(), this->remaining());
    std::copy_n(this->data_.begin() + static_cast<std::ptrdiff_t>(this->position_), take, buffer.begin());
    this->position_ += take;
    return take;
}

} // namespace MQ::IO
