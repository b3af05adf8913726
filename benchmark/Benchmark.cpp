#include <Lanescan/Lanescan.hpp>
#include <benchmark/benchmark.h>
#include <cstddef>
#include <random>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

struct DummyVal
{
    std::size_t value;
};

using Entries = std::vector<std::pair<std::string, DummyVal>>;

static Entries DistinctKeys()
{
    return {
        {"key1", {1001}},
        {"now4", {1002}},
        {"something", {1003}},
        {"another", {1004}},
        {"interesting", {1005}},
        {"thanks", {1006}},
    };
}

static Entries OverlappingKeys()
{
    return {
        {"key1", {1001}},
        {"key1longer", {1002}},
        {"key", {1003}},
        {"now4", {1004}},
        {"something", {1005}},
        {"something_b", {1006}},
    };
}

// 10000 queries picking one of two stored keys at random
static std::vector<std::string> QueryStream(const char* first, const char* second)
{
    std::mt19937 rng(12345);
    std::bernoulli_distribution coin(0.5);

    std::vector<std::string> queries;
    queries.reserve(10000);
    for (std::size_t i = 0; i < 10000; ++i)
    {
        queries.emplace_back(coin(rng) ? first : second);
    }
    return queries;
}

template<typename Strategy>
static void BM_ScanMapGet(benchmark::State& state, Entries entries, const char* first, const char* second)
{
    using Map = Lanescan::PerfectScanMap<DummyVal, 8, Lanescan::Simd::Width128, Strategy>;

    auto built = Map::TryBuild(std::move(entries));
    if (!built)
    {
        state.SkipWithError(built.Error().error.message);
        return;
    }

    const Map& map = built.Value();
    for (const auto& [key, value] : map)
    {
        const DummyVal* found = map.Get(key);
        if (found == nullptr || found->value != value.value)
        {
            state.SkipWithError("Stored key did not round-trip");
            return;
        }
    }

    const auto queries = QueryStream(first, second);
    std::size_t next = 0;

    for (auto _ : state)
    {
        benchmark::DoNotOptimize(map.Get(queries[next]));
        next = next + 1 == queries.size() ? 0 : next + 1;
    }

    state.SetItemsProcessed(state.iterations());
}

static void BM_UnorderedMapGet(benchmark::State& state, Entries entries, const char* first, const char* second)
{
    const std::unordered_map<std::string, DummyVal> map(entries.begin(), entries.end());
    const auto queries = QueryStream(first, second);
    std::size_t next = 0;

    for (auto _ : state)
    {
        auto it = map.find(queries[next]);
        benchmark::DoNotOptimize(it != map.end() ? &it->second : nullptr);
        next = next + 1 == queries.size() ? 0 : next + 1;
    }

    state.SetItemsProcessed(state.iterations());
}

template<typename Width>
static void BM_TryBuild(benchmark::State& state, Entries entries)
{
    using Map = Lanescan::PerfectScanMap<DummyVal, 16, Width>;

    for (auto _ : state)
    {
        auto built = Map::TryBuild(entries);
        benchmark::DoNotOptimize(built.IsOk());
    }
}

// BENCHMARK_CAPTURE pastes its first argument into an identifier, so template-ids need a plain name.
static constexpr auto BM_ScanMapGet_BitmaskScan = BM_ScanMapGet<Lanescan::BitmaskScan>;
static constexpr auto BM_ScanMapGet_DescendingMaxScan = BM_ScanMapGet<Lanescan::DescendingMaxScan>;
static constexpr auto BM_TryBuild_Width128 = BM_TryBuild<Lanescan::Simd::Width128>;
static constexpr auto BM_TryBuild_Width256 = BM_TryBuild<Lanescan::Simd::Width256>;

BENCHMARK_CAPTURE(BM_ScanMapGet_BitmaskScan, Distinct, DistinctKeys(), "key1", "another");
BENCHMARK_CAPTURE(BM_ScanMapGet_DescendingMaxScan, Distinct, DistinctKeys(), "key1", "another");
BENCHMARK_CAPTURE(BM_UnorderedMapGet, Distinct, DistinctKeys(), "key1", "another");

BENCHMARK_CAPTURE(BM_ScanMapGet_BitmaskScan, Overlapping, OverlappingKeys(), "key1", "key1longer");
BENCHMARK_CAPTURE(BM_ScanMapGet_DescendingMaxScan, Overlapping, OverlappingKeys(), "key1", "key1longer");
BENCHMARK_CAPTURE(BM_UnorderedMapGet, Overlapping, OverlappingKeys(), "key1", "key1longer");

BENCHMARK_CAPTURE(BM_TryBuild_Width128, Overlapping, OverlappingKeys());
BENCHMARK_CAPTURE(BM_TryBuild_Width256, Overlapping, OverlappingKeys());

BENCHMARK_MAIN();
