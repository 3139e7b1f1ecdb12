#include <doctest/doctest.h>
#include "waypoint/match_cache.hpp"

using namespace waypoint;

namespace {

MatchResultPtr resultFor(RecordId id) {
    auto record = std::make_shared<RouteRecord>();
    record->id = id;
    auto result = std::make_shared<MatchResult>();
    result->record = record;
    return result;
}

CacheOptions smallCache(size_t capacity) {
    CacheOptions options;
    options.initialCapacity = capacity;
    options.minCapacity = 1;
    options.maxCapacity = 100;
    options.adjustInterval = 0;
    return options;
}

}  // namespace

TEST_CASE("MatchCache basic get and set") {
    MatchCache cache(smallCache(3));

    CHECK_FALSE(cache.get("/a", 0).has_value());

    auto value = resultFor(1);
    cache.set("/a", value, 0);
    auto hit = cache.get("/a", 0);
    REQUIRE(hit.has_value());
    CHECK(*hit == value);

    SUBCASE("Cached no-match is a hit") {
        cache.set("/missing", nullptr, 0);
        auto cached = cache.get("/missing", 0);
        REQUIRE(cached.has_value());
        CHECK(*cached == nullptr);
    }

    SUBCASE("Overwrite keeps one entry") {
        cache.set("/a", resultFor(2), 0);
        CHECK(cache.size() == 1);
        CHECK((*cache.get("/a", 0))->record->id == 2);
    }

    SUBCASE("Stats count hits and misses") {
        auto stats = cache.stats();
        CHECK(stats.hits == 1);
        CHECK(stats.misses == 1);
        CHECK(stats.hitRate() == doctest::Approx(0.5));
        CHECK(stats.size == 1);
        CHECK(stats.capacity == 3);
    }
}

TEST_CASE("MatchCache evicts the least recently used key") {
    MatchCache cache(smallCache(3));
    cache.set("/a", resultFor(1), 0);
    cache.set("/b", resultFor(2), 0);
    cache.set("/c", resultFor(3), 0);

    SUBCASE("capacity + 1 distinct keys evict exactly the oldest") {
        cache.set("/d", resultFor(4), 0);
        CHECK(cache.size() == 3);
        CHECK_FALSE(cache.contains("/a"));
        CHECK(cache.contains("/b"));
        CHECK(cache.contains("/c"));
        CHECK(cache.contains("/d"));
        CHECK(cache.stats().evictions == 1);
    }

    SUBCASE("Access refreshes recency") {
        CHECK(cache.get("/a", 0).has_value());
        cache.set("/d", resultFor(4), 0);
        CHECK(cache.contains("/a"));
        CHECK_FALSE(cache.contains("/b"));
    }

    SUBCASE("Overwrite refreshes recency") {
        cache.set("/a", resultFor(10), 0);
        cache.set("/d", resultFor(4), 0);
        CHECK(cache.contains("/a"));
        CHECK_FALSE(cache.contains("/b"));
    }
}

TEST_CASE("MatchCache routes version") {
    MatchCache cache(smallCache(3));
    cache.set("/a", resultFor(1), 1);
    CHECK(cache.get("/a", 1).has_value());

    CHECK_FALSE(cache.get("/a", 2).has_value());
    CHECK_FALSE(cache.contains("/a"));
    CHECK(cache.stats().invalidations == 1);
}

TEST_CASE("MatchCache invalidate and clear") {
    MatchCache cache(smallCache(3));
    cache.set("/a", resultFor(1), 0);
    cache.set("/b", resultFor(2), 0);

    CHECK(cache.invalidate("/a"));
    CHECK_FALSE(cache.invalidate("/a"));
    CHECK_FALSE(cache.contains("/a"));
    CHECK(cache.contains("/b"));

    cache.clear();
    CHECK(cache.size() == 0);
}

TEST_CASE("MatchCache resize clamps and evicts from the tail") {
    CacheOptions options;
    options.initialCapacity = 5;
    options.minCapacity = 2;
    options.maxCapacity = 8;
    options.adjustInterval = 0;
    MatchCache cache(options);

    for (int i = 0; i < 5; ++i) {
        cache.set("/" + std::to_string(i), resultFor(i), 0);
    }
    CHECK(cache.size() == 5);

    CHECK(cache.resize(1) == 2);
    CHECK(cache.capacity() == 2);
    CHECK(cache.size() == 2);
    CHECK(cache.contains("/4"));
    CHECK(cache.contains("/3"));

    CHECK(cache.resize(1000) == 8);
    CHECK(cache.capacity() == 8);
}

TEST_CASE("MatchCache disabled") {
    MatchCache cache(smallCache(3));
    cache.set("/a", resultFor(1), 0);
    cache.setEnabled(false);

    CHECK_FALSE(cache.enabled());
    CHECK(cache.size() == 0);
    cache.set("/b", resultFor(2), 0);
    CHECK_FALSE(cache.get("/b", 0).has_value());
    CHECK(cache.size() == 0);

    cache.setEnabled(true);
    cache.set("/b", resultFor(2), 0);
    CHECK(cache.get("/b", 0).has_value());
}

TEST_CASE("MatchCache adaptive capacity") {
    CacheOptions options;
    options.initialCapacity = 100;
    options.minCapacity = 50;
    options.maxCapacity = 500;
    options.adjustInterval = 10;
    options.growStep = 20;
    options.shrinkStep = 20;

    SUBCASE("Low hit rate grows the cache") {
        MatchCache cache(options);
        for (int i = 0; i < 10; ++i) {
            cache.get("/miss" + std::to_string(i), 0);
        }
        CHECK(cache.capacity() == 120);
        CHECK(cache.stats().adjustments == 1);
    }

    SUBCASE("High hit rate shrinks the cache") {
        MatchCache cache(options);
        cache.set("/hot", resultFor(1), 0);
        for (int i = 0; i < 10; ++i) {
            cache.get("/hot", 0);
        }
        CHECK(cache.capacity() == 80);
    }

    SUBCASE("Rate within the band leaves capacity alone") {
        MatchCache cache(options);
        cache.set("/hot", resultFor(1), 0);
        for (int i = 0; i < 7; ++i) {
            cache.get("/hot", 0);
        }
        for (int i = 0; i < 3; ++i) {
            cache.get("/cold" + std::to_string(i), 0);
        }
        CHECK(cache.capacity() == 100);
        CHECK(cache.stats().adjustments == 0);
    }

    SUBCASE("Growth is bounded by the maximum") {
        options.initialCapacity = 490;
        MatchCache cache(options);
        for (int round = 0; round < 3; ++round) {
            for (int i = 0; i < 10; ++i) {
                cache.get("/miss", 0);
            }
        }
        CHECK(cache.capacity() == 500);
    }

    SUBCASE("Shrinking is bounded by the minimum") {
        options.initialCapacity = 55;
        MatchCache cache(options);
        cache.set("/hot", resultFor(1), 0);
        for (int round = 0; round < 3; ++round) {
            for (int i = 0; i < 10; ++i) {
                cache.get("/hot", 0);
            }
        }
        CHECK(cache.capacity() == 50);
    }
}
