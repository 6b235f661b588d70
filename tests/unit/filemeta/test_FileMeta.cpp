#include "MetaTestHelper.hpp"
#include "metaquorum/filemeta/FileMeta.hpp"
#include "metaquorum/rmp/Rmp.hpp"

#include <doctest/doctest.h>

#include <vector>

using namespace MQ;
using namespace MQ::Meta;
using MQ::Testing::asBytes;
using MQ::Testing::header;

TEST_SUITE("filemeta.header") {
    TEST_CASE("Header encode and decode") {
        auto original = header(7, -5, VersionType::Delete, 0, 0, VersionFlags::FreeVersion);
        Rmp::Packer packer;
        REQUIRE(original.encode(packer));
        auto decoded = VersionHeader::decode(packer.bytes());
        REQUIRE(decoded.has_value());
        CHECK(*decoded == original);
        CHECK(decoded->freeVersion());
        CHECK_FALSE(decoded->hasEc());
    }

    TEST_CASE("Wrong field count is corrupt") {
        Rmp::Packer packer;
        packer.pack_array(3);
        packer.pack_uint8(1);
        packer.pack_uint8(2);
        packer.pack_uint8(3);
        auto decoded = VersionHeader::decode(packer.bytes());
        REQUIRE_FALSE(decoded);
        CHECK(decoded.error().code == Error::Code::FileCorrupt);
    }

    TEST_CASE("Trailing bytes after a header are corrupt") {
        Rmp::Packer packer;
        REQUIRE(header(4, 10).encode(packer));
        packer.pack_nil();
        auto decoded = VersionHeader::decode(packer.bytes());
        REQUIRE_FALSE(decoded);
        CHECK(decoded.error().code == Error::Code::FileCorrupt);
    }

    TEST_CASE("Truncated header reports end of input") {
        Rmp::Packer packer;
        REQUIRE(header(4, 10).encode(packer));
        auto bytes   = packer.toVector();
        bytes.resize(bytes.size() - 3);
        auto decoded = VersionHeader::decode(bytes);
        REQUIRE_FALSE(decoded);
        CHECK(decoded.error().code == Error::Code::Unexpected);
    }

    TEST_CASE("Sort order") {
        auto older = header(1, 100);
        auto newer = header(2, 200);
        CHECK(newer.sortsBefore(older));
        CHECK_FALSE(older.sortsBefore(newer));
        CHECK_FALSE(older.sortsBefore(older));

        auto object = header(3, 100, VersionType::Object);
        auto marker = header(3, 100, VersionType::Delete);
        CHECK(object.sortsBefore(marker));
        CHECK_FALSE(marker.sortsBefore(object));
    }

    TEST_CASE("Erasure layout compatibility") {
        auto a = header(1, 100, VersionType::Object, 2, 2);
        auto b = header(1, 100, VersionType::Object, 4, 2);
        auto c = header(1, 100, VersionType::Object, 0, 0);
        CHECK_FALSE(a.matchesEc(b));
        CHECK(a.matchesEc(c));
        CHECK(c.matchesEc(b));
        CHECK(a.matchesNotStrict(c));
        CHECK_FALSE(a.matchesNotStrict(b));
        CHECK_FALSE(a.matchesNotStrict(header(1, 100, VersionType::Delete, 2, 2)));
        CHECK(a.withoutEc() == c);
    }

    TEST_CASE("Version id text form") {
        VersionId id{0x01, 0x23, 0x45, 0x67, 0x89, 0xab, 0xcd, 0xef, 0x00, 0x11, 0x22, 0x33, 0x44, 0x55, 0x66, 0x77};
        CHECK(versionIdToString(id) == "01234567-89ab-cdef-0011-223344556677");
        CHECK(versionTypeToString(VersionType::Legacy) == "legacy");
    }
}

TEST_SUITE("filemeta.format") {
    TEST_CASE("Marshal and load") {
        FileMeta meta;
        meta.addVersion(Testing::version(header(1, 100)));
        meta.addVersion(Testing::version(header(2, 300, VersionType::Delete)));
        meta.addVersion(Testing::version(header(3, 200)));
        REQUIRE(meta.versions.size() == 3);
        CHECK(meta.versions[0].header.modTime == 300);
        CHECK(meta.versions[1].header.modTime == 200);
        CHECK(meta.versions[2].header.modTime == 100);

        auto bytes = meta.marshal();
        REQUIRE(bytes.has_value());
        CHECK(FileMeta::isXl2V1Format(*bytes));

        auto loaded = FileMeta::load(*bytes);
        REQUIRE(loaded.has_value());
        CHECK(*loaded == meta);
        CHECK(loaded->latestModTime() == 300);

        auto prefix = FileMeta::checkXl2V1(*bytes);
        REQUIRE(prefix.has_value());
        CHECK(prefix->major == kXlVersionMajor);
        CHECK(prefix->minor == kXlVersionMinor);
        CHECK(FileMeta::isLatestDeleteMarker(prefix->payload));
    }

    TEST_CASE("Adding a known version id replaces it") {
        FileMeta meta;
        meta.addVersion(Testing::version(header(1, 100)));
        meta.addVersion(Testing::version(header(1, 500)));
        REQUIRE(meta.versions.size() == 1);
        CHECK(meta.versions[0].header.modTime == 500);
    }

    TEST_CASE("Latest modification time is the maximum") {
        FileMeta meta;
        CHECK_FALSE(meta.latestModTime().has_value());
        meta.versions.push_back(Testing::version(header(1, 100)));
        meta.versions.push_back(Testing::version(header(2, 900)));
        meta.versions.push_back(Testing::version(header(3, 400)));
        CHECK(meta.latestModTime() == 900);
    }

    TEST_CASE("Prefix validation") {
        auto tooShort = FileMeta::checkXl2V1(asBytes({'X', 'L', '2'}));
        REQUIRE_FALSE(tooShort);
        CHECK(tooShort.error().code == Error::Code::FileCorrupt);

        auto badMagic = FileMeta::checkXl2V1(asBytes({'X', 'L', '1', ' ', 1, 0, 3, 0}));
        REQUIRE_FALSE(badMagic);
        CHECK(badMagic.error().code == Error::Code::FileCorrupt);

        auto badMajor = FileMeta::checkXl2V1(asBytes({'X', 'L', '2', ' ', 2, 0, 0, 0}));
        REQUIRE_FALSE(badMajor);
        CHECK(badMajor.error().code == Error::Code::UnsupportedVersion);

        auto newerMinor = FileMeta::checkXl2V1(asBytes({'X', 'L', '2', ' ', 1, 0, 4, 0}));
        REQUIRE_FALSE(newerMinor);
        CHECK(newerMinor.error().code == Error::Code::UnsupportedVersion);

        auto olderMinor = FileMeta::checkXl2V1(asBytes({'X', 'L', '2', ' ', 1, 0, 2, 0}));
        REQUIRE(olderMinor.has_value());
        CHECK(olderMinor->payload.empty());
        CHECK_FALSE(FileMeta::isXl2V1Format(asBytes({'n', 'o', 'p', 'e', 0, 0, 0, 0})));
    }

    TEST_CASE("Truncated metadata does not load") {
        auto bytes = Testing::metaBytes({header(1, 100)});
        bytes.pop_back();
        CHECK_FALSE(FileMeta::load(bytes).has_value());
    }

    TEST_CASE("Bytes after the version list are corrupt") {
        Rmp::Packer body;
        REQUIRE(body.packPfix(kXlHeaderVersion));
        REQUIRE(body.packPfix(kXlMetaVersion));
        body.pack_array(0);
        body.pack_nil();
        Rmp::Packer envelope;
        REQUIRE(envelope.packBin(body.bytes()));

        auto bytes  = asBytes({'X', 'L', '2', ' ', 1, 0, 3, 0});
        auto packed = envelope.bytes();
        bytes.insert(bytes.end(), packed.begin(), packed.end());
        auto loaded = FileMeta::load(bytes);
        REQUIRE_FALSE(loaded);
        CHECK(loaded.error().code == Error::Code::FileCorrupt);
    }

    TEST_CASE("Unknown header version is unsupported") {
        Rmp::Packer body;
        REQUIRE(body.packPfix(kXlHeaderVersion + 1));
        REQUIRE(body.packPfix(kXlMetaVersion));
        body.pack_array(0);
        Rmp::Packer envelope;
        REQUIRE(envelope.packBin(body.bytes()));

        auto bytes  = asBytes({'X', 'L', '2', ' ', 1, 0, 3, 0});
        auto packed = envelope.bytes();
        bytes.insert(bytes.end(), packed.begin(), packed.end());
        auto loaded = FileMeta::load(bytes);
        REQUIRE_FALSE(loaded);
        CHECK(loaded.error().code == Error::Code::UnsupportedVersion);
    }

    TEST_CASE("Delete marker fast path") {
        auto objectFirst = Testing::metaBytes({header(2, 200), header(1, 100, VersionType::Delete)});
        auto prefix      = FileMeta::checkXl2V1(objectFirst);
        REQUIRE(prefix.has_value());
        CHECK_FALSE(FileMeta::isLatestDeleteMarker(prefix->payload));

        auto empty       = Testing::metaBytes({});
        auto emptyPrefix = FileMeta::checkXl2V1(empty);
        REQUIRE(emptyPrefix.has_value());
        CHECK(FileMeta::isLatestDeleteMarker(emptyPrefix->payload));

        auto garbage = asBytes({0x01, 0x02, 0x03});
        CHECK(FileMeta::isLatestDeleteMarker(garbage));
    }
}
