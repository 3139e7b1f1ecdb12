/**
 * @file route_table_example.cpp
 * @brief Example loading a route table from JSON and resolving locations
 *
 * This example shows how to:
 * 1. Parse a nested route table from JSON
 * 2. Resolve paths and named locations against it
 * 3. Warm the match cache from hotspots and print registry statistics
 */

#include "waypoint/json_serialization.hpp"
#include "waypoint/matcher_registry.hpp"

#include <iostream>

using namespace waypoint;

namespace {

const char* kRouteTable = R"([
  {"path": "/", "name": "home"},
  {"path": "/about", "name": "about", "meta": {"title": "About us"}},
  {"path": "/legacy-about", "redirect": "/about"},
  {"path": "/user/:id", "name": "user", "children": [
    {"path": "", "name": "user-overview"},
    {"path": "posts/:postId?", "name": "user-posts"}
  ]},
  {"path": "/files/*", "name": "files"}
])";

void printResolved(const char* label, const RawLocation& target, MatcherRegistry& registry) {
    auto resolved = registry.resolve(target);
    if (resolved.isError()) {
        std::cout << label << ": " << resolved.error().what() << "\n";
        return;
    }
    nlohmann::json j;
    json_serialization::to_json(j, resolved.value());
    std::cout << label << ": " << j.dump() << "\n";
}

}  // namespace

int main() {
    try {
        MatcherRegistry registry;
        for (const auto& route : json_serialization::parseRouteTable(kRouteTable)) {
            auto added = registry.addRoute(route);
            if (added.isError()) {
                std::cerr << "Failed to add " << route.path << ": " << added.error().what() << "\n";
                return 1;
            }
        }
        std::cout << "Loaded " << registry.size() << " routes\n\n";

        printResolved("user", "/user/42", registry);
        printResolved("posts", "/user/42/posts/7?sort=new#comments", registry);
        printResolved("files", "/files/docs/guide.pdf", registry);
        printResolved("named", RawLocation::named("user-posts", {{"id", "9"}}), registry);
        printResolved("missing", "/nope", registry);

        // Simulate traffic, then rebuild the cache from the hottest paths
        for (int i = 0; i < 50; ++i) {
            registry.match("/user/42");
            registry.match(i % 2 == 0 ? "/about" : "/files/a.txt");
        }
        registry.cache().clear();
        std::cout << "\nPreheated " << registry.preheat() << " paths\n";

        std::cout << "\nRegistry statistics:\n"
                  << json_serialization::to_pretty_json(registry.stats()) << "\n";
    } catch (const WaypointError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
