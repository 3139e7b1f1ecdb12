#include <benchmark/benchmark.h>
#include "waypoint/match_cache.hpp"
#include "waypoint/matcher_registry.hpp"
#include <random>
#include <string>
#include <vector>

using namespace waypoint;

std::vector<std::string> generateKeys(size_t count) {
    std::vector<std::string> keys;
    keys.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        keys.push_back("/item/" + std::to_string(i));
    }
    return keys;
}

// Skewed access pattern: a few paths take most lookups
std::vector<size_t> generateSkewedIndices(size_t keyCount, size_t count) {
    std::mt19937 gen(7);
    std::geometric_distribution<size_t> dist(0.05);
    std::vector<size_t> indices;
    indices.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        indices.push_back(dist(gen) % keyCount);
    }
    return indices;
}

static void BM_MatchCache_Hit(benchmark::State& state) {
    MatchCache cache(CacheOptions{}.withCapacity(500, 50, 500));
    auto keys = generateKeys(400);
    auto value = std::make_shared<const MatchResult>();
    for (const auto& key : keys) {
        cache.set(key, value, 1);
    }

    size_t i = 0;
    for (auto _ : state) {
        auto result = cache.get(keys[i++ % keys.size()], 1);
        benchmark::DoNotOptimize(result);
    }
}
BENCHMARK(BM_MatchCache_Hit);

static void BM_MatchCache_Eviction(benchmark::State& state) {
    MatchCache cache(CacheOptions{}.withCapacity(50, 50, 50));
    auto keys = generateKeys(1000);
    auto value = std::make_shared<const MatchResult>();

    size_t i = 0;
    for (auto _ : state) {
        cache.set(keys[i++ % keys.size()], value, 1);
    }
    state.counters["evictions"] = static_cast<double>(cache.stats().evictions);
}
BENCHMARK(BM_MatchCache_Eviction);

static void BM_MatchCache_Adaptive(benchmark::State& state) {
    CacheOptions options;
    options.adjustInterval = 200;
    MatchCache cache(options);
    auto keys = generateKeys(state.range(0));
    auto indices = generateSkewedIndices(keys.size(), 4096);
    auto value = std::make_shared<const MatchResult>();

    size_t i = 0;
    for (auto _ : state) {
        const auto& key = keys[indices[i++ % indices.size()]];
        if (!cache.get(key, 1)) {
            cache.set(key, value, 1);
        }
    }
    auto stats = cache.stats();
    state.counters["hitRate"] = stats.hitRate();
    state.counters["capacity"] = static_cast<double>(stats.capacity);
}
BENCHMARK(BM_MatchCache_Adaptive)->Range(64, 4096);

static void BM_Registry_Preheat(benchmark::State& state) {
    RouterOptions options;
    options.logLevel = "off";
    MatcherRegistry registry(options);
    registry.addRoute(RouteDefinition("/item/:id"));
    auto keys = generateKeys(100);
    for (const auto& key : keys) {
        registry.match(key);
    }

    for (auto _ : state) {
        registry.cache().clear();
        auto warmed = registry.preheat();
        benchmark::DoNotOptimize(warmed);
    }
}
BENCHMARK(BM_Registry_Preheat);
