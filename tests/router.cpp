#include <doctest/doctest.h>
#include "waypoint/router.hpp"

#include <string>
#include <vector>

using namespace waypoint;

namespace {

struct RouterFixture {
    MemoryHistory history{"/"};
    Router router{history};

    RouterFixture() {
        router.addRoute(RouteDefinition("/").withName("home"));
        router.addRoute(RouteDefinition("/user/:id").withName("user"));
        router.addRoute(RouteDefinition("/files/*").withName("files"));
    }

    NavigationResult settle(Completion<NavigationResult> completion) {
        REQUIRE(completion.ready());
        return completion.value();
    }
};

}  // namespace

TEST_CASE("Router start") {
    MemoryHistory history("/user/7?tab=a#bio");
    Router router(history);
    router.addRoute(RouteDefinition("/user/:id").withName("user"));

    CHECK_FALSE(router.started());
    CHECK_FALSE(router.isReady().ready());
    CHECK(router.currentRoute().path == "/");
    CHECK(router.currentRoute().matched.empty());

    auto ready = router.start();
    REQUIRE(ready.ready());
    CHECK(ready.value().ok());
    CHECK(router.started());
    CHECK(router.isReady().ready());

    const auto& route = router.currentRoute();
    CHECK(route.name == "user");
    CHECK(route.params.at("id") == "7");
    CHECK(route.query.at("tab") == "a");
    CHECK(route.hash == "#bio");
    CHECK(history.length() == 1);

    SUBCASE("Starting twice returns the first navigation") {
        auto again = router.start();
        REQUIRE(again.ready());
        CHECK(again.value().generation() == ready.value().generation());
    }
}

TEST_CASE("Router start on an unknown location") {
    MemoryHistory history("/nowhere");
    Router router(history);
    auto ready = router.start();
    REQUIRE(ready.ready());
    CHECK(ready.value().isError());
    CHECK(ready.value().error()->errorCode() == WaypointErrorCode::ROUTE_NOT_FOUND);
}

TEST_CASE("Router rejects invalid options") {
    MemoryHistory history;
    RouterOptions options;
    options.hotspotLimit = 0;
    CHECK_THROWS_AS(Router(history, options), InvalidConfigError);

    CHECK_THROWS_AS(Router(history, RouterOptions{}.withLogLevel("loud")), InvalidConfigError);
}

TEST_CASE_FIXTURE(RouterFixture, "Router resolves the basic table") {
    auto user = router.resolve("/user/42");
    REQUIRE(user.isSuccess());
    CHECK(user.value().name == "user");
    CHECK(user.value().params == Params{{"id", "42"}});

    auto files = router.resolve("/files/a/b.txt");
    REQUIRE(files.isSuccess());
    CHECK(files.value().params.at("pathMatch") == "a/b.txt");

    auto home = router.resolve("/");
    REQUIRE(home.isSuccess());
    CHECK(home.value().name == "home");

    auto named = router.resolve(RawLocation::named("user", {{"id", "5"}}).withQuery({{"q", "x"}}));
    REQUIRE(named.isSuccess());
    CHECK(named.value().fullPath == "/user/5?q=x");

    auto missing = router.resolve("/missing");
    CHECK(missing.isError());
    CHECK(missing.error().target() == "/missing");
}

TEST_CASE_FIXTURE(RouterFixture, "Router push and replace drive history") {
    REQUIRE(settle(router.start()).ok());

    CHECK(settle(router.push("/user/1")).ok());
    CHECK(settle(router.push(RawLocation::named("user", {{"id", "2"}}))).ok());
    CHECK(history.locations() == std::vector<std::string>{"/", "/user/1", "/user/2"});

    CHECK(settle(router.replace("/files/readme")).ok());
    CHECK(history.locations() == std::vector<std::string>{"/", "/user/1", "/files/readme"});
    CHECK(router.currentRoute().name == "files");
    CHECK(history.state()["generation"] == 4);

    SUBCASE("Unmatched push reports an error and keeps the location") {
        int errors = 0;
        router.onError([&](const WaypointError&) { ++errors; });
        auto result = settle(router.push("/missing"));
        CHECK(result.isError());
        CHECK(errors == 1);
        CHECK(router.currentRoute().path == "/files/readme");
    }
}

TEST_CASE_FIXTURE(RouterFixture, "Router history traversal") {
    REQUIRE(settle(router.start()).ok());
    REQUIRE(settle(router.push("/user/1")).ok());
    REQUIRE(settle(router.push("/user/2")).ok());

    auto back = router.back();
    REQUIRE(back.ready());
    CHECK(back.value().ok());
    CHECK(router.currentRoute().path == "/user/1");
    CHECK(history.position() == 1);

    auto forward = router.forward();
    REQUIRE(forward.ready());
    CHECK(forward.value().ok());
    CHECK(router.currentRoute().path == "/user/2");

    auto twoBack = router.go(-2);
    REQUIRE(twoBack.ready());
    CHECK(router.currentRoute().path == "/");

    SUBCASE("go(0) is a duplicate") {
        auto stay = router.go(0);
        REQUIRE(stay.ready());
        CHECK(stay.value().isFailure(NavigationFailureKind::Duplicated));
    }

    SUBCASE("Aborted traversal restores the position") {
        router.beforeEach(syncGuard([](const ResolvedLocation&, const ResolvedLocation&) {
            return GuardResult::abort();
        }));
        auto blocked = router.forward();
        REQUIRE(blocked.ready());
        CHECK(blocked.value().isFailure(NavigationFailureKind::Aborted));
        CHECK(router.currentRoute().path == "/");
        CHECK(history.position() == 0);
        CHECK(history.current() == "/");
    }

    SUBCASE("Traversal past the start settles nothing") {
        auto pastStart = router.back();
        CHECK_FALSE(pastStart.ready());

        auto next = router.forward();
        REQUIRE(pastStart.ready());
        CHECK(pastStart.value().isFailure(NavigationFailureKind::Cancelled));
        REQUIRE(next.ready());
        CHECK(next.value().ok());
    }
}

TEST_CASE_FIXTURE(RouterFixture, "Router notifies route changes") {
    std::vector<std::string> changes;
    auto unsubscribe = router.onRouteChange(
        [&](const ResolvedLocation& to, const ResolvedLocation& from) {
            changes.push_back(from.path + "->" + to.path);
        });

    REQUIRE(settle(router.start()).ok());
    REQUIRE(settle(router.push("/user/3")).ok());
    CHECK(changes == std::vector<std::string>{"/->/", "/->/user/3"});

    unsubscribe();
    REQUIRE(settle(router.push("/user/4")).ok());
    CHECK(changes.size() == 2);

    SUBCASE("Failed navigations change nothing") {
        router.onRouteChange([&](const ResolvedLocation&, const ResolvedLocation&) {
            changes.push_back("unexpected");
        });
        settle(router.push("/user/4"));
        CHECK(changes.size() == 2);
    }
}

TEST_CASE_FIXTURE(RouterFixture, "Router dynamic route table") {
    REQUIRE(settle(router.start()).ok());

    SUBCASE("Nested registration by parent name") {
        auto child = router.addRoute("user", RouteDefinition("posts/:postId").withName("posts"));
        REQUIRE(child.isSuccess());
        auto resolved = router.resolve("/user/1/posts/9");
        REQUIRE(resolved.isSuccess());
        CHECK(resolved.value().matched.size() == 2);
        CHECK(resolved.value().params == Params{{"id", "1"}, {"postId", "9"}});
    }

    SUBCASE("Unknown parent") {
        CHECK_THROWS_AS(router.addRoute("nobody", RouteDefinition("x")), ParentNotFoundError);
    }

    SUBCASE("Invalid pattern") {
        auto bad = router.addRoute(RouteDefinition("/a/*/b"));
        CHECK(bad.isError());
    }

    SUBCASE("Removing a route makes it unreachable") {
        REQUIRE(router.resolve("/user/1").isSuccess());
        CHECK(router.removeRoute("user"));
        CHECK_FALSE(router.hasRoute("user"));
        CHECK(router.resolve("/user/1").isError());
        CHECK(settle(router.push("/user/1")).isError());
        CHECK(router.getRoutes().size() == 2);
    }

    SUBCASE("New routes are matchable immediately") {
        CHECK(router.resolve("/about").isError());
        router.addRoute(RouteDefinition("/about"));
        CHECK(settle(router.push("/about")).ok());
    }
}

TEST_CASE_FIXTURE(RouterFixture, "Router guard redirect to login") {
    router.addRoute(RouteDefinition("/login").withName("login"));
    router.addRoute(RouteDefinition("/admin")
                        .withMeta({{"requiresAuth", true}})
                        .withChild(RouteDefinition("settings").withName("settings")));

    bool loggedIn = false;
    router.beforeEach(syncGuard([&](const ResolvedLocation& to, const ResolvedLocation&) {
        for (const auto& record : to.matched) {
            if (record->meta.value("requiresAuth", false) && !loggedIn) {
                return GuardResult::redirect(
                    RawLocation::named("login").withQuery({{"next", to.fullPath}}));
            }
        }
        return GuardResult::proceed();
    }));

    REQUIRE(settle(router.start()).ok());

    auto denied = settle(router.push("/admin/settings"));
    CHECK(denied.ok());
    CHECK(router.currentRoute().name == "login");
    CHECK(router.currentRoute().query.at("next") == "/admin/settings");
    CHECK(router.currentRoute().redirectedFrom == "/admin/settings");

    loggedIn = true;
    CHECK(settle(router.push("/admin/settings")).ok());
    CHECK(router.currentRoute().name == "settings");
}
