// navigator.cpp

#include "dist/navigator.hpp"

#include <algorithm>

namespace dist {

StepResult step_toward(const graphs::GraphContext& ctx, node_id from) {
    const auto link = ctx.edges().link(from);
    if (!link) return {StepStatus::unknown_node, core::no_node, 0};
    if (!link->is_resolved()) return {StepStatus::no_successor, core::no_node, 0};
    return {StepStatus::ok, link->target, 1};
}

StepResult step_away(const graphs::GraphContext& ctx, node_id from, node_id via) {
    if (from >= ctx.edges().node_count()) return {StepStatus::unknown_node, core::no_node, 0};
    const auto preds = ctx.reverse().predecessors(from);
    if (preds.empty()) return {StepStatus::no_predecessors, core::no_node, 0};
    // predecessor sets are sorted by id
    if (!std::binary_search(preds.begin(), preds.end(), via)) {
        return {StepStatus::not_a_predecessor, core::no_node, preds.size()};
    }
    return {StepStatus::ok, via, preds.size()};
}

const char* to_string(StepStatus s) noexcept {
    switch (s) {
    case StepStatus::ok:                return "ok";
    case StepStatus::unknown_node:      return "unknown-node";
    case StepStatus::no_successor:      return "no-successor";
    case StepStatus::no_predecessors:   return "no-predecessors";
    case StepStatus::not_a_predecessor: return "not-a-predecessor";
    }
    return "?";
}

} // namespace dist
