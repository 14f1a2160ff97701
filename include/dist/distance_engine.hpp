// distance_engine.hpp — layered reverse BFS from the target over the Reverse Index
#pragma once

#include <atomic>
#include <cstddef>
#include <functional>
#include <string_view>
#include <vector>

#include "core/config.hpp"
#include "dist/distance_table.hpp"
#include "graphs/graph_context.hpp"

namespace dist {

// Reported once per finished layer (layer 0 is the target alone).
struct LayerInfo {
    std::size_t index{0};
    std::size_t size{0};
    std::size_t discovered{0}; // total nodes with a distance so far
    double      seconds{0.0};  // wall time spent on this layer
};

struct DistanceOptions {
    // Checked between layers; when set the pass stops and returns what it has.
    const std::atomic<bool>* cancel{nullptr};
    std::function<void(const LayerInfo&)> on_layer;
};

struct DistanceReport {
    DistanceTable            table;
    std::vector<std::size_t> layer_sizes;
    std::size_t              reached_entries{0}; // store entries with a distance
    std::size_t              store_entries{0};
    double                   coverage{0.0};      // reached_entries / store_entries
    double                   seconds{0.0};
    bool                     complete{false};
    bool                     target_on_cycle{false};
};

// Expansion:
//   layer 0     = {target}
//   layer k + 1 = union of reverse[n] for n in layer k, minus every node seen in
//                 any earlier layer; each new node gets distance k + 1.
// The seen-set is a transient bitset owned by the pass; the Reverse Index is
// only read, so the same context serves any number of later queries.
//
// If the target is itself a predecessor of a layer-k node it lies on a cycle
// of length k + 1, which becomes its recorded distance. Otherwise the target
// is recorded at 0 once the pass completes.
[[nodiscard]] DistanceReport compute_distances(const graphs::GraphContext& ctx,
                                               node_id target,
                                               const DistanceOptions& opt = {});

// Unknown target title: empty, complete table with zero coverage.
[[nodiscard]] DistanceReport compute_distances(const graphs::GraphContext& ctx,
                                               std::string_view target,
                                               const DistanceOptions& opt = {});

} // namespace dist
