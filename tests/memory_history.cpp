#include <doctest/doctest.h>
#include "waypoint/history.hpp"

#include <vector>

using namespace waypoint;

TEST_CASE("MemoryHistory push and replace") {
    MemoryHistory history("/start");
    CHECK(history.current() == "/start");
    CHECK(history.length() == 1);

    history.push("/a", {{"n", 1}});
    history.push("/b", nullptr);
    CHECK(history.current() == "/b");
    CHECK(history.position() == 2);

    history.replace("/c", {{"n", 3}});
    CHECK(history.current() == "/c");
    CHECK(history.state()["n"] == 3);
    CHECK(history.locations() == std::vector<std::string>{"/start", "/a", "/c"});

    SUBCASE("Push after going back drops the forward entries") {
        history.go(-2);
        history.push("/d", nullptr);
        CHECK(history.locations() == std::vector<std::string>{"/start", "/d"});
    }
}

TEST_CASE("MemoryHistory go notifies listeners") {
    MemoryHistory history("/");
    history.push("/a", nullptr);
    history.push("/b", nullptr);

    struct Pop {
        std::string to;
        std::string from;
        PopInfo info;
    };
    std::vector<Pop> pops;
    auto unlisten = history.listen([&](const std::string& to, const std::string& from,
                                       PopInfo info) { pops.push_back({to, from, info}); });

    history.go(-1);
    REQUIRE(pops.size() == 1);
    CHECK(pops[0].to == "/a");
    CHECK(pops[0].from == "/b");
    CHECK(pops[0].info.delta == -1);
    CHECK(pops[0].info.direction == PopDirection::Back);

    SUBCASE("Go clamps to the stack") {
        history.go(10);
        REQUIRE(pops.size() == 2);
        CHECK(pops[1].info.delta == 1);
        CHECK(pops[1].info.direction == PopDirection::Forward);
        CHECK(history.current() == "/b");
    }

    SUBCASE("No movement notifies nobody") {
        history.go(-1);
        history.go(-5);
        CHECK(pops.size() == 2);
        CHECK(history.current() == "/");
    }

    SUBCASE("Unregistered listeners stop hearing") {
        unlisten();
        unlisten();
        history.go(1);
        CHECK(pops.size() == 1);
    }
}
