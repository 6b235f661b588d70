#include "metaquorum/io/FdStream.hpp"

#include <cerrno>
#include <cstring>
#include <string>

#include <unistd.h>

namespace MQ::IO {
namespace {

[[nodiscard]] auto errno_error(std::string_view operation, int err) -> Error {
    std::string message{operation};
    message.append(": ");
    message.append(std::strerror(err));
    return Error::io(static_cast<std::errc>(err), std::move(message));
}

} // namespace

FdReader::~FdReader() {
    if (this->owned_ && this->fd_ >= 0) {
        ::close(this->fd_);
    }
}

auto FdReader::readExact(std::span<std::byte> buffer) -> Expected<void> {
    std::size_t done = 0;
    while (done < buffer.size()) {
        auto const got = ::read(this->fd_, buffer.data() + done, buffer.size() - done);
        if (got < 0) {
            if (errno == EINTR) {
                continue;
            }
            return std::unexpected(errno_error("read", errno));
        }
        if (got == 0) {
            return std::unexpected(Error{Error::Code::Unexpected, "unexpected end of stream"});
        }
        done += static_cast<std::size_t>(got);
    }
    return {};
}

auto FdReader::readSome(std::span<std::byte> buffer) -> Expected<std::size_t> {
    if (buffer.empty()) {
        return 0;
    }
    for (;;) {
        auto const got = ::read(this->fd_, buffer.data(), buffer.size());
        if (got >= 0) {
            return static_cast<std::size_t>(got);
        }
        if (errno != EINTR) {
            return std::unexpected(errno_error("read", errno));
        }
    }
}

FdWriter::~FdWriter() {
    if (this->owned_ && this->fd_ >= 0) {
        ::close(this->fd_);
    }
}

auto FdWriter::writeAll(std::span<std::byte const> buffer) -> Expected<void> {
    std::size_t done = 0;
    while (done < buffer.size()) {
        auto const put = ::write(this->fd_, buffer.data() + done, buffer.size() - done);
        if (put < 0) {
            if (errno == EINTR) {
                continue;
            }
            return std::unexpected(errno_error("write", errno));
        }
        done += static_cast<std::size_t>(put);
    }
    return {};
}

} // namespace MQ::IO
