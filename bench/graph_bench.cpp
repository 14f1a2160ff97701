// Google Benchmark: reverse index, distance pass and path following on random first-link maps
#include <benchmark/benchmark.h>

#include <cstdint>
#include <string>
#include <utility>

#include "dist/distance_engine.hpp"
#include "graphs/edge_store.hpp"
#include "graphs/graph_context.hpp"
#include "graphs/reverse_index.hpp"
#include "rng/splitmix64.hpp"
#include "walk/path_follower.hpp"

// n entries, each linked to a random entry; roughly 1 in 16 unresolved.
static graphs::EdgeStore make_random_store(std::size_t n, std::uint64_t seed) {
    rng::SplitMix64 g(seed);
    graphs::EdgeStoreBuilder b;
    b.reserve(n);
    for (std::size_t i = 0; i < n; ++i) {
        const std::string from = std::to_string(i);
        if (g.uniform_index(16) == 0) b.add_unresolved(from);
        else b.add(from, std::to_string(g.uniform_index(n)));
    }
    return std::move(b).build();
}

static void BM_ReverseIndex_Serial(benchmark::State& state) {
    const auto store = make_random_store(static_cast<std::size_t>(state.range(0)), 0xC0FFEEULL);
    for (auto _ : state) {
        auto r = graphs::ReverseIndex::build(store);
        benchmark::DoNotOptimize(r.edge_count());
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}

static void BM_ReverseIndex_Parallel(benchmark::State& state) {
    const auto store = make_random_store(static_cast<std::size_t>(state.range(0)), 0xC0FFEEULL);
    for (auto _ : state) {
        auto r = graphs::ReverseIndex::build_parallel(store);
        benchmark::DoNotOptimize(r.edge_count());
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}

BENCHMARK(BM_ReverseIndex_Serial)->Arg(1 << 16)->Arg(1 << 20)->UseRealTime()->Unit(benchmark::kMillisecond);
BENCHMARK(BM_ReverseIndex_Parallel)->Arg(1 << 16)->Arg(1 << 20)->UseRealTime()->Unit(benchmark::kMillisecond);

static void BM_DistancePass(benchmark::State& state) {
    const graphs::GraphContext ctx(make_random_store(static_cast<std::size_t>(state.range(0)), 0xBEEFULL));
    // Largest in-degree node makes a target with a non-trivial basin
    graphs::node_id target = 0;
    for (graphs::node_id n = 0; n < ctx.edges().node_count(); ++n) {
        if (ctx.reverse().in_degree(n) > ctx.reverse().in_degree(target)) target = n;
    }
    for (auto _ : state) {
        auto rep = dist::compute_distances(ctx, target);
        benchmark::DoNotOptimize(rep.reached_entries);
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}

BENCHMARK(BM_DistancePass)->Arg(1 << 16)->Arg(1 << 20)->UseRealTime()->Unit(benchmark::kMillisecond);

static void BM_FollowPath(benchmark::State& state) {
    const auto store = make_random_store(1 << 18, 0xFACEULL);
    rng::SplitMix64 g(1);
    for (auto _ : state) {
        const auto start = static_cast<graphs::node_id>(g.uniform_index(store.node_count()));
        auto p = walk::follow_path(store, start, core::no_node);
        benchmark::DoNotOptimize(p.nodes.size());
    }
    state.SetItemsProcessed(state.iterations());
}

BENCHMARK(BM_FollowPath)->UseRealTime()->Unit(benchmark::kMicrosecond);

BENCHMARK_MAIN();
