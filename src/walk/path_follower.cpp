// path_follower.cpp

#include "walk/path_follower.hpp"

#include <utility>

namespace walk {

Walker::Walker(const graphs::EdgeStore& store, node_id start, node_id target)
    : store_(&store), target_(target) {
    history_.push_back(start);
    seen_.insert(start);
    if (start == target_) status_ = Status::at_target;
}

Walker::Status Walker::advance() {
    if (status_ != Status::running) return status_;

    const auto next = store_->successor(position());
    if (!next) {
        status_ = Status::stalled;
        return status_;
    }

    history_.push_back(*next);
    if (*next == target_) {
        status_ = Status::at_target;
    } else if (!seen_.insert(*next).second) {
        status_ = Status::looping;
    }
    return status_;
}

Path follow_path(const graphs::EdgeStore& store, node_id start, node_id target) {
    Path p;
    if (start != target && !store.contains(start)) {
        p.nodes.push_back(start);
        p.outcome  = Outcome::dead_end;
        p.dead_end = DeadEnd::unknown_node;
        return p;
    }

    Walker w(store, start, target);
    while (w.running()) w.advance();

    switch (w.status()) {
    case Walker::Status::at_target:
        p.outcome = Outcome::reached_target;
        break;
    case Walker::Status::looping:
        p.outcome  = Outcome::cycle;
        p.repeated = w.position();
        break;
    default:
        p.outcome  = Outcome::dead_end;
        p.dead_end = DeadEnd::unresolved;
        break;
    }
    p.nodes = w.history();
    return p;
}

NamedPath follow_path(const graphs::EdgeStore& store, std::string_view start, std::string_view target) {
    NamedPath out;
    const auto s = store.find(start);
    if (!s && start != target) {
        out.titles.emplace_back(start);
        out.outcome  = Outcome::dead_end;
        out.dead_end = DeadEnd::unknown_node;
        return out;
    }
    if (!s) {
        // start == target but the title was never interned
        out.titles.emplace_back(start);
        out.outcome = Outcome::reached_target;
        return out;
    }

    const auto t = store.find(target);
    const Path p = follow_path(store, *s, t ? *t : core::no_node);

    out.titles.reserve(p.nodes.size());
    for (node_id n : p.nodes) out.titles.push_back(store.name(n));
    out.outcome  = p.outcome;
    out.dead_end = p.dead_end;
    if (p.outcome == Outcome::cycle) out.repeated = store.name(p.repeated);
    return out;
}

const char* to_string(Outcome o) noexcept {
    switch (o) {
    case Outcome::reached_target: return "reached-target";
    case Outcome::cycle:          return "cycle";
    case Outcome::dead_end:       return "dead-end";
    }
    return "?";
}

const char* to_string(DeadEnd d) noexcept {
    switch (d) {
    case DeadEnd::none:         return "none";
    case DeadEnd::unresolved:   return "unresolved";
    case DeadEnd::unknown_node: return "unknown-node";
    }
    return "?";
}

} // namespace walk
