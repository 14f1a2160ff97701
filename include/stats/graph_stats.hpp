// graph_stats.hpp — whole-graph summaries: terminal cycles, dead ends, reach counts
#pragma once

#include <cstddef>
#include <cstdint>
#include <utility>
#include <vector>

#include "core/config.hpp"
#include "graphs/graph_context.hpp"

namespace stats {

using core::node_id;

// A terminal cycle of the first-link graph. Nodes are listed in walk order,
// starting from the smallest id on the cycle. basin counts every node whose
// walk ends in this cycle, the cycle nodes included.
struct Cycle {
    std::vector<node_id> nodes;
    std::uint64_t        basin{0};
};

struct GraphStats {
    std::size_t entries{0};
    std::size_t interned{0};
    std::size_t resolved_links{0};
    std::size_t unresolved_links{0};
    std::size_t successor_only{0}; // titles only ever seen as a successor
    std::size_t self_loops{0};

    // Sorted by basin (largest first), then by first node.
    std::vector<Cycle> cycles;

    // reach[n]: number of other nodes whose forward walk passes through n.
    // Cycle nodes are all reached by their whole basin.
    std::vector<std::uint64_t> reach;

    [[nodiscard]] std::size_t dead_ends() const noexcept { return unresolved_links + successor_only; }
    [[nodiscard]] std::size_t cycle_nodes() const noexcept {
        std::size_t c = 0;
        for (const auto& cy : cycles) c += cy.nodes.size();
        return c;
    }
};

// Peels the graph from its in-degree-0 nodes (Kahn order), pushing each node's
// count onto its successor; what remains unpeeled is exactly the union of the
// cycles, whose members then share their basin size.
[[nodiscard]] GraphStats analyze(const graphs::GraphContext& ctx);

// The k nodes with the largest reach, largest first (ties by id).
[[nodiscard]] std::vector<std::pair<node_id, std::uint64_t>> top_reach(const GraphStats& s, std::size_t k);

} // namespace stats
