#include "MetaTestHelper.hpp"
#include "tools/MetacacheJson.hpp"

#include <doctest/doctest.h>

using namespace MQ;
using namespace MQ::Meta;
using namespace MQ::Testing;

TEST_SUITE("tools.json") {
TEST_CASE("Entry kinds are labelled") {
    auto dir = dirEntry("photos/");
    CHECK(Tools::entryToJson(dir, false)["kind"] == "dir");

    auto prefix = dirEntry("photos");
    CHECK(Tools::entryToJson(prefix, false)["kind"] == "prefix");

    auto object = objectEntry("photos/cat.jpg", {header(1, 100)});
    auto json   = Tools::entryToJson(object, false);
    CHECK(json["kind"] == "object");
    CHECK(json["name"] == "photos/cat.jpg");
    CHECK(json["metadataSize"] == object.metadata.size());
    CHECK_FALSE(json.contains("versions"));

    auto objectDir = objectEntry("photos/album/", {header(1, 100)});
    CHECK(Tools::entryToJson(objectDir, false)["kind"] == "object_dir");
}

TEST_CASE("Decoding lists version headers newest first") {
    auto entry = objectEntry("obj", {header(2, 200, VersionType::Delete, 0, 0), header(1, 100, VersionType::Object, 4, 2, VersionFlags::FreeVersion)});
    auto json  = Tools::entryToJson(entry, true);

    CHECK(json["metaVersion"] == kXlMetaVersion);
    CHECK(json["latestDeleteMarker"] == true);
    REQUIRE(json["versions"].size() == 2);

    auto const& newest = json["versions"][0];
    CHECK(newest["type"] == "delete");
    CHECK(newest["modTime"] == 200);
    CHECK(newest["versionId"] == versionIdToString(versionId(2)));

    auto const& older = json["versions"][1];
    CHECK(older["type"] == "object");
    CHECK(older["freeVersion"] == true);
    CHECK(older["ecN"] == 4);
    CHECK(older["ecM"] == 2);
    CHECK(older["metaSize"] == 2);
}

TEST_CASE("Undecodable metadata is flagged") {
    MetaCache::MetaCacheEntry entry;
    entry.name     = "broken";
    entry.metadata = asBytes({'X', 'L', '2', ' ', 0x01});
    auto json      = Tools::entryToJson(entry, true);
    CHECK(json["decodeError"] == true);
    CHECK_FALSE(json.contains("versions"));
}

TEST_CASE("Entry errors are described") {
    auto entry  = dirEntry("gone/");
    entry.error = Error{Error::Code::FileNotFound, "gone"};
    auto json   = Tools::entryToJson(entry, false);
    CHECK(json["error"] == "file_not_found:gone");
}
}
