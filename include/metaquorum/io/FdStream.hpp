#pragma once
#include "metaquorum/io/ByteStream.hpp"

namespace MQ::IO {

/*
 * POSIX descriptor transports (files, pipes, sockets). The descriptor is borrowed unless
 * ownership is requested, in which case it is closed on destruction. EINTR is retried,
 * short transfers are looped until complete.
 */
class FdReader final : public ByteReader {
public:
    explicit FdReader(int fd, bool owned = false) : fd_(fd), owned_(owned) {}
    ~FdReader() override;

    FdReader(FdReader const&)            = delete;
    FdReader& operator=(FdReader const&) = delete;

    auto readExact(std::span<std::byte> buffer) -> Expected<void> override;
    auto readSome(std::span<std::byte> buffer) -> Expected<std::size_t> override;

private:
    int  fd_;
    bool owned_;
};

class FdWriter final : public ByteWriter {
public:
    explicit FdWriter(int fd, bool owned = false) : fd_(fd), owned_(owned) {}
    ~FdWriter() override;

    FdWriter(FdWriter const&)            = delete;
    FdWriter& operator=(FdWriter const&) = delete;

    auto writeAll(std::span<std::byte const> buffer) -> Expected<void> override;

private:
    int  fd_;
    bool owned_;
};

} // namespace MQ::IO
