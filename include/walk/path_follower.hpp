// path_follower.hpp — follow first links from a start node until target, cycle, or dead end
#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

#include "core/config.hpp"
#include "graphs/edge_store.hpp"

namespace walk {

using core::node_id;

enum class Outcome : std::uint8_t { reached_target, cycle, dead_end };

// Why a walk dead-ended. unknown_node: the start itself is not an entry.
enum class DeadEnd : std::uint8_t { none, unresolved, unknown_node };

// Single-step cursor over the successor function. Keeps its own visit history
// so revisits are detected in O(1); the race simulator drives several of these
// in lock-step and follow_path() drives one to completion.
class Walker {
public:
    enum class Status : std::uint8_t {
        running,
        at_target, // position == target
        looping,   // position was already in the history
        stalled    // position has no successor
    };

    Walker(const graphs::EdgeStore& store, node_id start, node_id target);

    // Moves one edge. No-op unless running.
    Status advance();

    [[nodiscard]] Status  status()   const noexcept { return status_; }
    [[nodiscard]] bool    running()  const noexcept { return status_ == Status::running; }
    [[nodiscard]] node_id position() const noexcept { return history_.back(); }
    [[nodiscard]] std::size_t steps() const noexcept { return history_.size() - 1; }

    // Every position taken, start first; a looping walker ends with the repeat.
    [[nodiscard]] const std::vector<node_id>& history() const noexcept { return history_; }

private:
    const graphs::EdgeStore*    store_;
    node_id                     target_;
    std::vector<node_id>        history_;
    std::unordered_set<node_id> seen_;
    Status                      status_{Status::running};
};

struct Path {
    std::vector<node_id> nodes;
    Outcome outcome{Outcome::dead_end};
    DeadEnd dead_end{DeadEnd::none};
    node_id repeated{core::no_node}; // set for Outcome::cycle

    [[nodiscard]] std::size_t steps() const noexcept { return nodes.empty() ? 0 : nodes.size() - 1; }
};

// Same walk, rendered as titles. Used where the start may not be interned.
struct NamedPath {
    std::vector<std::string> titles;
    Outcome outcome{Outcome::dead_end};
    DeadEnd dead_end{DeadEnd::none};
    std::string repeated;

    [[nodiscard]] std::size_t steps() const noexcept { return titles.empty() ? 0 : titles.size() - 1; }
};

// Walk length is bounded by the number of distinct nodes. A start that is not an
// entry of the store (and is not the target) yields a one-node dead end.
[[nodiscard]] Path follow_path(const graphs::EdgeStore& store, node_id start, node_id target);

[[nodiscard]] NamedPath follow_path(const graphs::EdgeStore& store, std::string_view start, std::string_view target);

[[nodiscard]] const char* to_string(Outcome o) noexcept;
[[nodiscard]] const char* to_string(DeadEnd d) noexcept;

} // namespace walk
