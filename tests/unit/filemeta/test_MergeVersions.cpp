#include "MetaTestHelper.hpp"
#include "metaquorum/filemeta/MergeVersions.hpp"

#include <doctest/doctest.h>

#include <cstdint>
#include <vector>

using namespace MQ;
using namespace MQ::Meta;
using MQ::Testing::header;
using MQ::Testing::version;

namespace {

auto list(std::vector<VersionHeader> const& headers) -> std::vector<ShallowVersion> {
    std::vector<ShallowVersion> out;
    for (auto const& h : headers) {
        out.push_back(version(h));
    }
    return out;
}

auto mod_times(std::vector<ShallowVersion> const& versions) -> std::vector<std::int64_t> {
    std::vector<std::int64_t> out;
    for (auto const& v : versions) {
        out.push_back(v.header.modTime);
    }
    return out;
}

} // namespace

TEST_SUITE("filemeta.merge") {
    TEST_CASE("Identical lists merge to themselves") {
        auto disk   = list({header(3, 300), header(2, 200), header(1, 100)});
        auto merged = mergeFileMetaVersions(3, false, 0, {disk, disk, disk});
        CHECK(merged == disk);
    }

    TEST_CASE("Too few lists or a single list") {
        auto disk = list({header(1, 100)});
        CHECK(mergeFileMetaVersions(3, false, 0, {disk, disk}).empty());
        CHECK(mergeFileMetaVersions(1, false, 0, {disk}) == disk);
        CHECK(mergeFileMetaVersions(1, false, 0, {}).empty());
    }

    TEST_CASE("Version missing on one disk") {
        auto full    = list({header(2, 200), header(1, 100)});
        auto partial = list({header(1, 100)});

        CHECK(mod_times(mergeFileMetaVersions(2, false, 0, {full, full, partial})) == std::vector<std::int64_t>{200, 100});
        CHECK(mod_times(mergeFileMetaVersions(3, false, 0, {full, full, partial})) == std::vector<std::int64_t>{100});
    }

    TEST_CASE("Signature differences only merge when not strict") {
        auto a = header(1, 100);
        auto b = a;
        b.signature = {0xff, 0xff, 0xff, 0xff};

        auto relaxed = mergeFileMetaVersions(2, false, 0, {list({a}), list({b})});
        REQUIRE(relaxed.size() == 1);
        CHECK(relaxed.front().header.versionId == a.versionId);

        CHECK(mergeFileMetaVersions(2, true, 0, {list({a}), list({b})}).empty());
    }

    TEST_CASE("Requested versions stop merging early") {
        auto disk   = list({header(3, 300), header(2, 200), header(1, 100)});
        auto merged = mergeFileMetaVersions(2, false, 1, {disk, disk});
        CHECK(mod_times(merged) == std::vector<std::int64_t>{300, 200, 100});
    }

    TEST_CASE("Free versions do not count towards the request") {
        auto disk = list({header(3, 300, VersionType::Object, 2, 2, VersionFlags::FreeVersion), header(2, 200), header(1, 100)});
        auto merged = mergeFileMetaVersions(2, false, 1, {disk, disk});
        CHECK(mod_times(merged) == std::vector<std::int64_t>{300, 200, 100});
    }
}
