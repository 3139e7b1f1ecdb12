#include <doctest/doctest.h>
#include "waypoint/json_serialization.hpp"

#include <string>

using namespace waypoint;
using namespace waypoint::json_serialization;

TEST_CASE("RawLocation JSON") {
    SUBCASE("Plain string is a path") {
        RawLocation location;
        from_json(nlohmann::json("/user/1?x=2"), location);
        CHECK(location.path == "/user/1?x=2");
        CHECK_FALSE(location.name.has_value());
    }

    SUBCASE("Named object") {
        auto j = nlohmann::json::parse(
            R"({"name": "user", "params": {"id": "3"}, "query": {"q": "a"}, "hash": "top"})");
        RawLocation location;
        from_json(j, location);
        REQUIRE(location.name.has_value());
        CHECK(*location.name == "user");
        CHECK(location.params == Params{{"id", "3"}});
        CHECK(location.query == Query{{"q", "a"}});
        CHECK(location.hash == "top");
        CHECK_FALSE(location.force);

        nlohmann::json back;
        to_json(back, location);
        CHECK(back["name"] == "user");
        CHECK(back["params"]["id"] == "3");
        CHECK_FALSE(back.contains("path"));
    }

    SUBCASE("Object needs a target") {
        RawLocation location;
        CHECK_THROWS_AS(from_json(nlohmann::json::parse(R"({"query": {}})"), location),
                        InvalidConfigError);
        CHECK_THROWS_AS(from_json(nlohmann::json(42), location), InvalidConfigError);
    }
}

TEST_CASE("Route table loading") {
    const char* table = R"([
        {"path": "/", "name": "home"},
        {"path": "/old", "redirect": "/"},
        {"path": "/user/:id", "name": "user", "meta": {"title": "User"},
         "children": [
            {"path": "", "name": "profile"},
            {"path": "posts", "name": "posts"}
         ]}
    ])";

    auto routes = parseRouteTable(table);
    REQUIRE(routes.size() == 3);
    CHECK(routes[0].name == "home");
    REQUIRE(routes[1].redirect.has_value());
    CHECK(routes[1].redirect->path == "/");
    CHECK(routes[2].meta["title"] == "User");
    REQUIRE(routes[2].children.size() == 2);
    CHECK(routes[2].children[0].path.empty());

    MatcherRegistry registry;
    for (const auto& route : routes) {
        REQUIRE(registry.addRoute(route).isSuccess());
    }
    CHECK(registry.size() == 5);

    auto posts = registry.resolve("/user/4/posts");
    REQUIRE(posts.isSuccess());
    CHECK(posts.value().name == "posts");

    auto profile = registry.resolve("/user/4");
    REQUIRE(profile.isSuccess());
    CHECK(profile.value().name == "profile");
    CHECK(profile.value().meta.empty());

    SUBCASE("Malformed tables") {
        CHECK_THROWS_AS(parseRouteTable("{not json"), InvalidConfigError);
        CHECK_THROWS_AS(parseRouteTable(R"({"path": "/"})"), InvalidConfigError);
        CHECK_THROWS_AS(parseRouteTable(R"([{"name": "nopath"}])"), InvalidConfigError);
        CHECK_THROWS_AS(parseRouteTable(R"([{"path": "/", "name": 7}])"), InvalidConfigError);
        CHECK_THROWS_AS(parseRouteTable(R"([{"path": "/", "children": {}}])"),
                        InvalidConfigError);
    }
}

TEST_CASE("Options JSON") {
    SUBCASE("Absent keys keep defaults") {
        RouterOptions options;
        from_json(nlohmann::json::parse(R"({"maxRedirects": 3, "cache": {"enabled": false}})"),
                  options);
        CHECK(options.maxRedirects == 3);
        CHECK_FALSE(options.cache.enabled);
        CHECK(options.cache.initialCapacity == 100);
        CHECK(options.hotspotLimit == 500);
    }

    SUBCASE("Hotspot TTL is in milliseconds") {
        RouterOptions options;
        from_json(nlohmann::json::parse(R"({"hotspotTtl": 1500, "logLevel": "debug"})"),
                  options);
        CHECK(options.hotspotTtl == std::chrono::milliseconds(1500));
        CHECK(options.logLevel == "debug");
    }

    SUBCASE("Invalid values are rejected") {
        RouterOptions options;
        CHECK_THROWS_AS(
            from_json(nlohmann::json::parse(R"({"cache": {"minCapacity": 600}})"), options),
            InvalidConfigError);
        CHECK_THROWS_AS(from_json(nlohmann::json::parse(R"({"maxRedirects": "ten"})"), options),
                        InvalidConfigError);
        CHECK_THROWS_AS(from_json(nlohmann::json::parse(R"({"logLevel": "chatty"})"), options),
                        InvalidConfigError);
    }
}

TEST_CASE("Resolved locations and statistics JSON") {
    MatcherRegistry registry;
    auto id = registry.addRoute(RouteDefinition("/user/:id").withName("user")).value();
    auto resolved = registry.resolve("/user/8?tab=posts#latest").value();

    nlohmann::json j;
    to_json(j, resolved);
    CHECK(j["path"] == "/user/8");
    CHECK(j["fullPath"] == "/user/8?tab=posts#latest");
    CHECK(j["name"] == "user");
    CHECK(j["params"]["id"] == "8");
    CHECK(j["query"]["tab"] == "posts");
    CHECK(j["hash"] == "#latest");
    REQUIRE(j["matched"].size() == 1);
    CHECK(j["matched"][0]["id"] == id);
    CHECK_FALSE(j.contains("redirectedFrom"));

    nlohmann::json record;
    to_json(record, *registry.getRecord(id));
    CHECK(record["path"] == "/user/:id");
    CHECK(record["group"] == std::string(MatcherRegistry::DEFAULT_GROUP));
    CHECK(record["beforeEnter"] == 0);
    CHECK(record["hasComponent"] == false);

    registry.match("/user/8");
    registry.match("/user/8");
    auto text = to_pretty_json(registry.stats());
    auto stats = nlohmann::json::parse(text);
    CHECK(stats["routes"] == 1);
    CHECK(stats["cache"]["hits"].get<uint64_t>() >= 1);
    REQUIRE(stats["hotspots"].is_array());
    REQUIRE_FALSE(stats["hotspots"].empty());
    CHECK(stats["hotspots"][0]["path"] == "/user/8");
    CHECK(stats["hotspots"][0]["avgMatchTimeUs"].is_number());
}

TEST_CASE("NavigationFailure JSON") {
    ResolvedLocation from;
    from.fullPath = "/a";
    ResolvedLocation to;
    to.fullPath = "/b";

    nlohmann::json j;
    to_json(j, NavigationFailure{NavigationFailureKind::Aborted, from, to});
    CHECK(j["type"] == 4);
    CHECK(j["kind"] == "aborted");
    CHECK(j["from"] == "/a");
    CHECK(j["to"] == "/b");
    CHECK(j["message"].get<std::string>().find("/b") != std::string::npos);
}
