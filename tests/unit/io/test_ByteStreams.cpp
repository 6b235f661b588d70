#include "metaquorum/io/FdStream.hpp"
#include "metaquorum/io/MemoryStream.hpp"
#include "metaquorum/io/StdStream.hpp"

#include <doctest/doctest.h>

#include <unistd.h>

#include <array>
#include <cstddef>
#include <sstream>
#include <string>
#include <vector>

using namespace MQ;
using namespace MQ::IO;

namespace {

auto bytes(std::initializer_list<unsigned> values) -> std::vector<std::byte> {
    std::vector<std::byte> out;
    for (auto v : values) {
        out.push_back(static_cast<std::byte>(v));
    }
    return out;
}

} // namespace

TEST_SUITE("io.memory") {
    TEST_CASE("Big-endian helpers") {
        MemoryWriter writer;
        REQUIRE(writer.writeU8(0x7f));
        REQUIRE(writer.writeU16Be(0x0102));
        REQUIRE(writer.writeU32Be(0x03040506));
        REQUIRE(writer.writeU64Be(0x0708090a0b0c0d0eull));
        CHECK(writer.data() == bytes({0x7f, 0x01, 0x02, 0x03, 0x04, 0x05, 0x06, 0x07, 0x08, 0x09, 0x0a, 0x0b, 0x0c, 0x0d, 0x0e}));

        MemoryReader reader(writer.take());
        CHECK(reader.readU8().value() == 0x7f);
        CHECK(reader.readU16Be().value() == 0x0102);
        CHECK(reader.readU32Be().value() == 0x03040506u);
        CHECK(reader.readU64Be().value() == 0x0708090a0b0c0d0eull);
        CHECK(reader.remaining() == 0);
    }

    TEST_CASE("Short read reports end of stream") {
        MemoryReader reader(bytes({0x01, 0x02}));
        auto         value = reader.readU32Be();
        REQUIRE_FALSE(value);
        CHECK(value.error().code == Error::Code::Unexpected);
        CHECK(value.error().isEof());
        CHECK(reader.remaining() == 0);
    }

    TEST_CASE("Partial reads take what is left") {
        MemoryReader             reader(bytes({0x01, 0x02, 0x03}));
        std::array<std::byte, 2> window{};
        CHECK(reader.readSome(window).value() == 2);
        CHECK(window[1] == std::byte{0x02});
        CHECK(reader.readSome(window).value() == 1);
        CHECK(window[0] == std::byte{0x03});
        CHECK(reader.readSome(window).value() == 0);
    }

    TEST_CASE("Capacity limit fails the write without partial data") {
        MemoryWriter writer(3);
        REQUIRE(writer.writeU16Be(0xaaaa));
        auto full = writer.writeU16Be(0xbbbb);
        REQUIRE_FALSE(full);
        CHECK(full.error().code == Error::Code::Io);
        CHECK(full.error().ioKind == std::errc::no_space_on_device);
        CHECK(writer.size() == 2);
        CHECK(writer.writeU8(0xcc));
        CHECK(writer.size() == 3);
    }
}

TEST_SUITE("io.stdstream") {
    TEST_CASE("iostream adapters") {
        std::stringstream buffer;
        OStreamWriter     writer(buffer);
        REQUIRE(writer.writeU32Be(0xdeadbeef));
        REQUIRE(writer.flush());

        IStreamReader reader(buffer);
        CHECK(reader.readU32Be().value() == 0xdeadbeefu);

        auto past = reader.readU8();
        REQUIRE_FALSE(past);
        CHECK(past.error().code == Error::Code::Unexpected);
    }

    TEST_CASE("Partial reads stop at end of stream") {
        std::istringstream       input("abcde");
        IStreamReader            reader(input);
        std::array<std::byte, 8> window{};
        auto                     got = reader.readSome(window);
        REQUIRE(got.has_value());
        CHECK(*got >= 1);
        CHECK(*got <= 5);
        CHECK(window[0] == std::byte{'a'});

        std::size_t total = *got;
        while (total < 5) {
            auto more = reader.readSome(window);
            REQUIRE(more.has_value());
            REQUIRE(*more > 0);
            total += *more;
        }
        CHECK(total == 5);
        CHECK(reader.readSome(window).value() == 0);
    }
}

TEST_SUITE("io.fd") {
    TEST_CASE("Pipe round trip and end of stream") {
        std::array<int, 2> fds{};
        REQUIRE(::pipe(fds.data()) == 0);

        FdReader reader(fds[0], true);
        {
            FdWriter writer(fds[1], true);
            REQUIRE(writer.writeU16Be(0xcafe));
            REQUIRE(writer.writeU8(0x01));
        }

        CHECK(reader.readU16Be().value() == 0xcafe);
        CHECK(reader.readU8().value() == 0x01);

        auto eof = reader.readU8();
        REQUIRE_FALSE(eof);
        CHECK(eof.error().code == Error::Code::Unexpected);
    }

    TEST_CASE("Partial reads from a pipe") {
        std::array<int, 2> fds{};
        REQUIRE(::pipe(fds.data()) == 0);

        FdReader reader(fds[0], true);
        {
            FdWriter writer(fds[1], true);
            REQUIRE(writer.writeU32Be(0x01020304));
        }

        std::array<std::byte, 16> window{};
        auto                      got = reader.readSome(window);
        REQUIRE(got.has_value());
        CHECK(*got == 4);
        CHECK(window[3] == std::byte{0x04});
        CHECK(reader.readSome(window).value() == 0);
    }

    TEST_CASE("Invalid descriptor reports the errno") {
        FdReader reader(-1);
        auto     value = reader.readU8();
        REQUIRE_FALSE(value);
        CHECK(value.error().code == Error::Code::Io);
        CHECK(value.error().ioKind == std::errc::bad_file_descriptor);
    }
}
