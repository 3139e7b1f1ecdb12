#include <doctest/doctest.h>
#include "waypoint/location.hpp"
#include "waypoint/route_record.hpp"

using namespace waypoint;

TEST_CASE("parseUrl splits path, query and hash") {
    SUBCASE("Full URL") {
        auto parsed = parseUrl("/search?q=router&page=2#results");
        CHECK(parsed.path == "/search");
        CHECK(parsed.query.size() == 2);
        CHECK(parsed.query.at("q") == "router");
        CHECK(parsed.query.at("page") == "2");
        CHECK(parsed.hash == "#results");
    }

    SUBCASE("Hash before query mark belongs to the hash") {
        auto parsed = parseUrl("/a#frag?notquery");
        CHECK(parsed.path == "/a");
        CHECK(parsed.query.empty());
        CHECK(parsed.hash == "#frag?notquery");
    }

    SUBCASE("Bare path is normalized") {
        auto parsed = parseUrl("users//42/");
        CHECK(parsed.path == "/users/42");
        CHECK(parsed.query.empty());
        CHECK(parsed.hash.empty());
    }

    SUBCASE("Empty string is the root") {
        CHECK(parseUrl("").path == "/");
        CHECK(parseUrl("?x=1").path == "/");
    }
}

TEST_CASE("Query codec") {
    SUBCASE("Decodes escapes and plus signs") {
        auto query = parseQuery("?name=John+Doe&city=S%C3%A3o%20Paulo&flag");
        CHECK(query.at("name") == "John Doe");
        CHECK(query.at("city") == "S\xC3\xA3o Paulo");
        CHECK(query.at("flag").empty());
    }

    SUBCASE("Skips empty pairs and empty keys") {
        auto query = parseQuery("a=1&&=2&b=");
        CHECK(query.size() == 2);
        CHECK(query.at("a") == "1");
        CHECK(query.at("b").empty());
    }

    SUBCASE("Stringify is ordered and encoded") {
        Query query{{"z", "last"}, {"a", "x y"}};
        CHECK(stringifyQuery(query) == "a=x%20y&z=last");
        CHECK(stringifyQuery({}).empty());
    }
}

TEST_CASE("Percent encoding") {
    CHECK(encodeComponent("abc-_.~") == "abc-_.~");
    CHECK(encodeComponent("a b/c") == "a%20b%2Fc");
    CHECK(decodeComponent("a%20b%2Fc") == "a b/c");
    CHECK(decodeComponent("100%") == "100%");
    CHECK(decodeComponent("%zz") == "%zz");
    CHECK(decodeComponent("a+b") == "a+b");
    CHECK(decodeComponent("a+b", true) == "a b");
    CHECK(decodeComponent(encodeComponent("\xE2\x9C\x93 ok")) == "\xE2\x9C\x93 ok");
}

TEST_CASE("normalizePath") {
    CHECK(normalizePath("") == "/");
    CHECK(normalizePath("/") == "/");
    CHECK(normalizePath("//") == "/");
    CHECK(normalizePath("a/b") == "/a/b");
    CHECK(normalizePath("/a//b///c/") == "/a/b/c");
}

TEST_CASE("buildFullPath and hashes") {
    CHECK(buildFullPath("/a", {}, "") == "/a");
    CHECK(buildFullPath("/a", {{"k", "v"}}, "top") == "/a?k=v#top");
    CHECK(buildFullPath("/a", {}, "#top") == "/a#top");
    CHECK(normalizeHash("#") == "");
    CHECK(normalizeHash("x") == "#x");
}

TEST_CASE("RawLocation") {
    SUBCASE("Implicit from string") {
        RawLocation location = "/users/1?tab=posts";
        CHECK(location.path == "/users/1?tab=posts");
        CHECK_FALSE(location.name.has_value());
    }

    SUBCASE("Named with builders") {
        auto location = RawLocation::named("user", {{"id", "7"}})
                            .withQuery({{"tab", "info"}})
                            .withHash("bio")
                            .withForce();
        CHECK(location.name == "user");
        CHECK(location.params.at("id") == "7");
        CHECK(location.force);
        CHECK(location.describe() == "{name: user}");
    }

    SUBCASE("Describe uses the full path") {
        RawLocation location("/a");
        location.withQuery({{"b", "1"}}).withHash("c");
        CHECK(location.describe() == "/a?b=1#c");
    }
}

TEST_CASE("isSameLocation") {
    auto record = std::make_shared<RouteRecord>();
    record->id = 3;
    record->path = "/a";

    ResolvedLocation a;
    a.path = "/a";
    a.matched = {record};

    ResolvedLocation b = a;
    CHECK(isSameLocation(a, b));

    b.query = {{"x", "1"}};
    CHECK_FALSE(isSameLocation(a, b));

    b = a;
    b.hash = "#h";
    CHECK_FALSE(isSameLocation(a, b));

    SUBCASE("Unmatched locations are never the same") {
        CHECK_FALSE(isSameLocation(startLocation(), startLocation()));
    }

    SUBCASE("Different leaf records differ") {
        auto other = std::make_shared<RouteRecord>(*record);
        other->id = 4;
        ResolvedLocation c = a;
        c.matched = {other};
        CHECK_FALSE(isSameLocation(a, c));
    }
}

TEST_CASE("startLocation") {
    const auto& start = startLocation();
    CHECK(start.path == "/");
    CHECK(start.fullPath == "/");
    CHECK(start.matched.empty());
    CHECK(start.leaf() == nullptr);
}
