#include "MetaTestHelper.hpp"
#include "metaquorum/metacache/MetaCacheEntries.hpp"

#include <doctest/doctest.h>

#include <optional>
#include <vector>

using namespace MQ;
using namespace MQ::MetaCache;
using MQ::Testing::dirEntry;
using MQ::Testing::header;
using MQ::Testing::objectEntry;

namespace {

auto params_for(std::size_t dirQuorum, std::size_t objQuorum, bool strict = false) -> MetadataResolutionParams {
    MetadataResolutionParams params;
    params.dirQuorum = dirQuorum;
    params.objQuorum = objQuorum;
    params.strict    = strict;
    params.bucket    = "bucket";
    return params;
}

auto group(std::vector<std::optional<MetaCacheEntry>> slots) -> MetaCacheEntries {
    return MetaCacheEntries{std::move(slots)};
}

} // namespace

TEST_SUITE("metacache.resolve") {
    TEST_CASE("Empty group resolves to nothing") {
        auto params = params_for(1, 1);
        CHECK_FALSE(MetaCacheEntries{}.resolve(params).has_value());
        CHECK_FALSE(MetaCacheEntries{3}.resolve(params).has_value());
    }

    TEST_CASE("Unanimous objects are returned unchanged") {
        auto objA   = objectEntry("objA", {header(1, 100)});
        auto params = params_for(1, 2);
        auto result = group({objA, objA, objA}).resolve(params);
        REQUIRE(result.has_value());
        CHECK(*result == objA);
        CHECK_FALSE(result->reusable);
        CHECK(params.stats.objsValid == 3);
        CHECK(params.stats.objsAgree == 3);
        CHECK(params.stats.dirExists == 0);
        CHECK(params.candidates.size() == 3);
    }

    TEST_CASE("Too few decodable objects") {
        auto objA = objectEntry("objA", {header(1, 100)});
        MetaCacheEntry bad;
        bad.name     = "objA";
        bad.metadata = Testing::asBytes({0x00, 0x01});

        auto params = params_for(1, 2);
        CHECK_FALSE(group({objA, std::nullopt, std::nullopt}).resolve(params).has_value());
        CHECK(params.stats.objsValid == 1);

        CHECK_FALSE(group({objA, bad, std::nullopt}).resolve(params).has_value());
        CHECK(params.stats.objsValid == 1);
        CHECK(params.candidates.size() == 1);
    }

    TEST_CASE("Directory precedence") {
        auto dir    = dirEntry("x/");
        auto object = objectEntry("x/", {header(1, 100)});

        auto met    = params_for(2, 1);
        auto result = group({dir, object, dir}).resolve(met);
        REQUIRE(result.has_value());
        CHECK(result->isDir());
        CHECK(met.stats.dirExists == 2);

        auto missed = params_for(3, 1);
        CHECK_FALSE(group({dir, object, dir}).resolve(missed).has_value());
        CHECK(missed.stats.objsValid == 1);
    }

    TEST_CASE("Empty names are ignored") {
        auto objA   = objectEntry("objA", {header(1, 100)});
        auto params = params_for(1, 1);
        auto result = group({dirEntry(""), objA}).resolve(params);
        REQUIRE(result.has_value());
        CHECK(result->name == "objA");
        CHECK(params.stats.dirExists == 0);
    }

    TEST_CASE("Disagreement goes through the merge") {
        auto both  = objectEntry("objA", {header(2, 200), header(1, 100)});
        auto older = objectEntry("objA", {header(1, 100)});

        SUBCASE("Merge without a result drops the name") {
            auto        params     = params_for(1, 2, true);
            std::size_t mergeCalls = 0;
            params.merge           = [&](std::size_t quorum, bool strict, std::size_t, VersionLists const& candidates) {
                ++mergeCalls;
                CHECK(quorum == 2);
                CHECK(strict);
                CHECK(candidates.size() == 2);
                return std::vector<Meta::ShallowVersion>{};
            };
            CHECK_FALSE(group({both, older, std::nullopt}).resolve(params).has_value());
            CHECK(mergeCalls == 1);
            CHECK(params.stats.objsValid == 2);
            CHECK(params.stats.objsAgree == 1);
        }

        SUBCASE("Merged versions are re-encoded") {
            auto params = params_for(1, 2, true);
            auto result = group({both, older, std::nullopt}).resolve(params);
            REQUIRE(result.has_value());
            CHECK(result->name == "objA");
            CHECK(result->reusable);
            REQUIRE(result->cached.has_value());
            REQUIRE(result->cached->versions.size() == 1);
            CHECK(result->cached->versions.front().header.modTime == 100);

            auto reloaded = Meta::FileMeta::load(result->metadata);
            REQUIRE(reloaded.has_value());
            CHECK(*reloaded == *result->cached);
        }
    }

    TEST_CASE("Stats are reset on every call") {
        auto objA   = objectEntry("objA", {header(1, 100)});
        auto params = params_for(1, 1);
        REQUIRE(group({objA, objA}).resolve(params).has_value());
        CHECK(params.stats.objsAgree == 2);
        REQUIRE(group({objA}).resolve(params).has_value());
        CHECK(params.stats.objsAgree == 1);
        CHECK(params.candidates.size() == 1);
    }

    TEST_CASE("First present slot") {
        auto b = dirEntry("b/");
        auto [found, total] = group({std::nullopt, b, dirEntry("c/")}).firstFound();
        REQUIRE(found.has_value());
        CHECK(found->name == "b/");
        CHECK(total == 3);

        auto [none, count] = MetaCacheEntries{2}.firstFound();
        CHECK_FALSE(none.has_value());
        CHECK(count == 2);
    }
}

TEST_SUITE("metacache.sorted") {
    TEST_CASE("Forward past a marker") {
        MetaCacheEntriesSorted sorted{group({dirEntry("a/"), std::nullopt, dirEntry("b/"), dirEntry("c/")})};
        CHECK(sorted.entries().size() == 3);

        sorted.forwardPast(std::nullopt);
        CHECK(sorted.o.size() == 4);

        sorted.forwardPast("zzz");
        CHECK(sorted.o.size() == 4);

        sorted.forwardPast("a/");
        auto present = sorted.entries();
        REQUIRE(present.size() == 2);
        CHECK(present[0]->name == "b/");
        CHECK(present[1]->name == "c/");
        CHECK(sorted.o.size() == 2);
    }
}
