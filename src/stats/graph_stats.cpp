// graph_stats.cpp

#include "stats/graph_stats.hpp"

#include <algorithm>
#include <deque>

#include "util/bitset_vector.hpp"

namespace stats {

GraphStats analyze(const graphs::GraphContext& ctx) {
    const auto& store   = ctx.edges();
    const auto& reverse = ctx.reverse();
    const auto& succ    = store.successors();
    const std::size_t n = store.node_count();

    GraphStats s;
    s.entries  = store.size();
    s.interned = n;
    s.successor_only = n - store.size();
    store.for_each_entry([&](node_id id, const graphs::Link& l) {
        if (!l.is_resolved()) { ++s.unresolved_links; return; }
        ++s.resolved_links;
        if (l.target == id) ++s.self_loops;
    });

    std::vector<std::uint32_t> indeg(n);
    std::deque<node_id> q;
    for (std::size_t i = 0; i < n; ++i) {
        indeg[i] = static_cast<std::uint32_t>(reverse.in_degree(static_cast<node_id>(i)));
        if (indeg[i] == 0) q.push_back(static_cast<node_id>(i));
    }

    s.reach.assign(n, 0);
    while (!q.empty()) {
        const node_id u = q.front();
        q.pop_front();
        const node_id v = succ[u];
        if (v == core::no_node) continue;
        s.reach[v] += s.reach[u] + 1;
        if (--indeg[v] == 0) q.push_back(v);
    }

    // Unpeeled nodes: each still has in-degree >= 1 and out-degree 1, so they
    // form disjoint cycles. Ascending scan means each cycle starts at its min id.
    BitsetVector done(n);
    for (std::size_t i = 0; i < n; ++i) {
        if (indeg[i] == 0 || done.get(i)) continue;
        Cycle c;
        node_id u = static_cast<node_id>(i);
        do {
            done.set(u);
            c.nodes.push_back(u);
            c.basin += s.reach[u];
            u = succ[u];
            FIRSTLINK_ASSERT_H(u != core::no_node, "stats::analyze: unpeeled node without successor");
        } while (u != static_cast<node_id>(i));
        c.basin += c.nodes.size();
        for (node_id m : c.nodes) s.reach[m] = c.basin - 1;
        s.cycles.push_back(std::move(c));
    }

    std::sort(s.cycles.begin(), s.cycles.end(), [](const Cycle& a, const Cycle& b) {
        if (a.basin != b.basin) return a.basin > b.basin;
        return a.nodes.front() < b.nodes.front();
    });
    return s;
}

std::vector<std::pair<node_id, std::uint64_t>> top_reach(const GraphStats& s, std::size_t k) {
    std::vector<std::pair<node_id, std::uint64_t>> all;
    all.reserve(s.reach.size());
    for (std::size_t i = 0; i < s.reach.size(); ++i) all.emplace_back(static_cast<node_id>(i), s.reach[i]);

    k = std::min(k, all.size());
    auto by_reach = [](const auto& a, const auto& b) {
        if (a.second != b.second) return a.second > b.second;
        return a.first < b.first;
    };
    std::partial_sort(all.begin(), all.begin() + static_cast<std::ptrdiff_t>(k), all.end(), by_reach);
    all.resize(k);
    return all;
}

} // namespace stats
