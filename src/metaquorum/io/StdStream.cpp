#include "metaquorum/io/StdStream.hpp"

namespace MQ::IO {

auto IStreamReader::readExact(std::span<std::byte> buffer) -> Expected<void> {
    if (buffer.empty()) {
        return {};
    }
    this->stream_.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(buffer.size()));
    auto const got = this->stream_.gcount();
    if (static_cast<std::size_t>(got) == buffer.size()) {
        return {};
    }
    if (this->stream_.eof()) {
        return std::unexpected(Error{Error::Code::Unexpected, "unexpected end of stream"});
    }
    return std::unexpected(Error::io(std::errc::io_error, "input stream read failed"));
}

// Blocks for the first byte, then takes what the stream buffer already holds.
auto IStreamReader::readSome(std::span<std::byte> buffer) -> Expected<std::size_t> {
    if (buffer.empty()) {
        return 0;
    }
    auto* data = reinterpret_cast<char*>(buffer.data());
    this->stream_.read(data, 1);
    if (this->stream_.gcount() == 0) {
        if (this->stream_.eof()) {
            return 0;
        }
        return std::unexpected(Error::io(std::errc::io_error, "input stream read failed"));
    }
    auto const more = this->stream_.readsome(data + 1, static_cast<std::streamsize>(buffer.size() - 1));
    return 1 + static_cast<std::size_t>(more);
}

auto OStreamWriter::writeAll(std::span<std::byte const> buffer) -> Expected<void> {
    this->stream_.write(reinterpret_cast<char const*>(buffer.data()), static_cast<std::streamsize>(buffer.size()));
    if (!this->stream_) {
        return std::unexpected(Error::io(std::errc::io_error, "output stream write failed"));
    }
    return {};
}

auto OStreamWriter::flush() -> Expected<void> {
    this->stream_.flush();
    if (!this->stream_) {
        return std::unexpected(Error::io(std::errc::io_error, "output stream flush failed"));
    }
    return {};
}

} // namespace MQ::IO
