// distance_engine.cpp

#include "dist/distance_engine.hpp"

#include <optional>
#include <utility>

#include "util/bitset_vector.hpp"
#include "util/timing.hpp"

namespace dist {

namespace {

bool cancelled(const DistanceOptions& opt) noexcept {
    return opt.cancel && opt.cancel->load(std::memory_order_relaxed);
}

} // namespace

DistanceReport compute_distances(const graphs::GraphContext& ctx, node_id target, const DistanceOptions& opt) {
    const auto& store   = ctx.edges();
    const auto& reverse = ctx.reverse();
    const std::size_t n = store.node_count();

    util::Stopwatch total, layer_clock;
    DistanceReport rep;
    rep.store_entries = store.size();
    rep.table = DistanceTable(n, target);

    if (target >= n) {
        rep.table.mark_complete();
        rep.complete = true;
        return rep;
    }

    BitsetVector seen(n);
    seen.set(target);

    std::vector<node_id> frontier{target};
    std::vector<node_id> next;
    std::optional<distance_t> cycle_len;
    std::size_t discovered = 0; // excluding the target

    rep.layer_sizes.push_back(1);
    if (opt.on_layer) opt.on_layer(LayerInfo{0, 1, 1, layer_clock.lap()});

    distance_t k = 0;
    bool stopped = false;
    while (!frontier.empty()) {
        if (cancelled(opt)) { stopped = true; break; }

        next.clear();
        for (node_id u : frontier) {
            for (node_id p : reverse.predecessors(u)) {
                if (p == target) {
                    if (!cycle_len) {
                        cycle_len = k + 1;
                        rep.table.assign(target, *cycle_len);
                    }
                    continue;
                }
                if (seen.test_and_set(p)) {
                    next.push_back(p);
                    const bool fresh = rep.table.assign(p, k + 1);
                    FIRSTLINK_ASSERT_H(fresh, "compute_distances: node assigned twice");
                    (void)fresh;
                }
            }
        }
        ++k;
        frontier.swap(next);
        if (frontier.empty()) break;

        discovered += frontier.size();
        rep.layer_sizes.push_back(frontier.size());
        if (opt.on_layer) {
            opt.on_layer(LayerInfo{static_cast<std::size_t>(k), frontier.size(), discovered + 1, layer_clock.lap()});
        }
    }

    if (!stopped) {
        if (!cycle_len) rep.table.assign(target, 0);
        rep.table.mark_complete();
        rep.complete = true;
    }
    rep.target_on_cycle = cycle_len.has_value();

    // Every discovered node has a resolved link, so it is an entry.
    rep.reached_entries = discovered + ((store.contains(target) && rep.table.contains(target)) ? 1 : 0);
    rep.coverage = rep.store_entries ? static_cast<double>(rep.reached_entries) / static_cast<double>(rep.store_entries)
                                     : 0.0;
    rep.seconds = total.seconds();
    return rep;
}

DistanceReport compute_distances(const graphs::GraphContext& ctx, std::string_view target, const DistanceOptions& opt) {
    const auto id = ctx.find(target);
    return compute_distances(ctx, id ? *id : core::no_node, opt);
}

} // namespace dist
