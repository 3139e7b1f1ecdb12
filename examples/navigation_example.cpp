/**
 * @file navigation_example.cpp
 * @brief Example driving a router over an in-memory history
 *
 * Shows guards protecting routes, asynchronous confirmation, redirects and
 * history traversal.
 */

#include "waypoint/json_serialization.hpp"
#include "waypoint/router.hpp"

#include <iostream>
#include <utility>
#include <vector>

using namespace waypoint;

namespace {

void report(const char* action, const NavigationResult& result) {
    std::cout << action << " -> ";
    if (result.ok()) {
        std::cout << "at " << result.to().fullPath;
        if (result.redirects() > 0) {
            std::cout << " after " << result.redirects() << " redirect(s)";
        }
    } else if (result.isFailure()) {
        nlohmann::json j;
        json_serialization::to_json(j, *result.failure());
        std::cout << j.dump();
    } else {
        std::cout << "error: " << result.error()->what();
    }
    std::cout << "\n";
}

}  // namespace

int main() {
    MemoryHistory history("/");
    Router router(history, RouterOptions{}.withLogLevel("warn"));

    router.addRoute(RouteDefinition("/").withName("home"));
    router.addRoute(RouteDefinition("/login").withName("login"));
    router.addRoute(RouteDefinition("/dashboard")
                        .withName("dashboard")
                        .withMeta({{"requiresAuth", true}}));

    // Unsaved edits ask for confirmation before leaving; the answer arrives later
    std::vector<GuardCallback> pendingConfirmations;
    router.addRoute(RouteDefinition("/editor").withName("editor").withBeforeLeave(
        [&](const ResolvedLocation&, const ResolvedLocation&, GuardCallback done) {
            pendingConfirmations.push_back(std::move(done));
        }));

    bool authenticated = false;
    router.beforeEach(syncGuard([&](const ResolvedLocation& to, const ResolvedLocation&) {
        if (to.meta.value("requiresAuth", false) && !authenticated) {
            return GuardResult::redirect(RawLocation::named("login"));
        }
        return GuardResult::proceed();
    }));

    router.onRouteChange([](const ResolvedLocation& to, const ResolvedLocation& from) {
        std::cout << "  route changed " << from.fullPath << " => " << to.fullPath << "\n";
    });

    router.start().then([](const NavigationResult& result) { report("start", result); });

    router.push("/dashboard").then(
        [](const NavigationResult& result) { report("push /dashboard", result); });

    authenticated = true;
    router.push("/dashboard").then(
        [](const NavigationResult& result) { report("push /dashboard", result); });

    router.push("/editor").then(
        [](const NavigationResult& result) { report("push /editor", result); });

    // First attempt to leave is declined, the second one accepted
    for (auto answer : {GuardResult::abort(), GuardResult::proceed()}) {
        router.push("/").then([](const NavigationResult& result) { report("push /", result); });
        std::cout << "  waiting for " << pendingConfirmations.size() << " confirmation(s)\n";
        auto confirmations = std::move(pendingConfirmations);
        pendingConfirmations.clear();
        for (auto& confirm : confirmations) {
            confirm(answer);
        }
    }

    router.back().then([](const NavigationResult& result) { report("back", result); });

    std::cout << "History:";
    for (const auto& location : history.locations()) {
        std::cout << " " << location;
    }
    std::cout << "\n";
    return 0;
}
