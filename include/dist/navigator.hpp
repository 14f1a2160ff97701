// navigator.hpp — single steps toward / away from the target, and distance-bucket sampling
#pragma once

#include <cstddef>
#include <cstdint>

#include "core/config.hpp"
#include "dist/distance_table.hpp"
#include "graphs/graph_context.hpp"
#include "rng/splitmix64.hpp"

namespace dist {

enum class Direction : std::uint8_t { toward, away };

enum class StepStatus : std::uint8_t {
    ok,
    unknown_node,      // not an entry (toward) / not interned (away)
    no_successor,      // entry with an unresolved link
    no_predecessors,   // nothing links to the node
    not_a_predecessor  // requested 'via' node does not link to the node
};

struct StepResult {
    StepStatus  status{StepStatus::unknown_node};
    node_id     node{core::no_node};
    std::size_t choices{0}; // predecessor count for away-steps

    explicit operator bool() const noexcept { return status == StepStatus::ok; }
};

// Neither step mutates the context, so any sequence of forward and backward
// steps can be taken against the same structures.
[[nodiscard]] StepResult step_toward(const graphs::GraphContext& ctx, node_id from);

// Away-step through a specific predecessor.
[[nodiscard]] StepResult step_away(const graphs::GraphContext& ctx, node_id from, node_id via);

// Away-step through a uniformly random predecessor.
template <rng::IndexRng Rng>
[[nodiscard]] StepResult step_away(const graphs::GraphContext& ctx, node_id from, Rng& rng) {
    if (from >= ctx.edges().node_count()) return {StepStatus::unknown_node, core::no_node, 0};
    const auto preds = ctx.reverse().predecessors(from);
    if (preds.empty()) return {StepStatus::no_predecessors, core::no_node, 0};
    return {StepStatus::ok, preds[rng.uniform_index(preds.size())], preds.size()};
}

template <rng::IndexRng Rng>
[[nodiscard]] StepResult step(const graphs::GraphContext& ctx, node_id from, Direction dir, Rng& rng) {
    return dir == Direction::toward ? step_toward(ctx, from) : step_away(ctx, from, rng);
}

enum class SampleStatus : std::uint8_t { ok, empty_bucket };

struct SampleResult {
    SampleStatus status{SampleStatus::empty_bucket};
    node_id      node{core::no_node};
    std::size_t  bucket_size{0};

    explicit operator bool() const noexcept { return status == SampleStatus::ok; }
};

// Uniform over the nodes recorded at exactly distance d.
template <rng::IndexRng Rng>
[[nodiscard]] SampleResult sample_at_distance(const DistanceBuckets& buckets, distance_t d, Rng& rng) {
    const auto bucket = buckets.at(d);
    if (bucket.empty()) return {};
    return {SampleStatus::ok, bucket[rng.uniform_index(bucket.size())], bucket.size()};
}

[[nodiscard]] const char* to_string(StepStatus s) noexcept;

} // namespace dist
