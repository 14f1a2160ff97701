// race.hpp — lock-step race of several walkers toward the target
#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <stdexcept>
#include <unordered_set>
#include <utility>
#include <vector>

#include "core/config.hpp"
#include "graphs/edge_store.hpp"
#include "rng/splitmix64.hpp"

namespace sim {

using core::node_id;

enum class RacerState : std::uint8_t {
    running,
    looping, // revisited a node of its own history; can no longer win
    stalled, // dead end; can no longer win
    won
};

enum class RaceOutcome : std::uint8_t {
    won,        // one or more winners (ties are reported as a set)
    no_winner,  // nobody left running
    round_limit // stopped by RaceOptions::max_rounds
};

struct RaceOptions {
    std::size_t max_rounds{0}; // 0 = until decided
    bool        record_trace{true};
};

struct RoundSnapshot {
    std::size_t             round{0};
    std::vector<node_id>    positions; // indexed like the starts
    std::vector<RacerState> states;
};

struct RaceResult {
    std::vector<node_id>       starts;
    std::vector<std::size_t>   winners; // indices into starts
    RaceOutcome                outcome{RaceOutcome::no_winner};
    std::size_t                rounds{0};
    std::vector<RoundSnapshot> trace;   // trace[0] holds the starting positions

    [[nodiscard]] bool has_winner() const noexcept { return outcome == RaceOutcome::won; }
    [[nodiscard]] bool is_tie()     const noexcept { return winners.size() > 1; }
};

// Every running participant moves one edge per round using the walker's
// successor semantics. The race ends after the first round in which anybody
// stands on the target; all participants there that round are winners.
// Participants that loop or dead-end drop out while the others continue.
// A start equal to the target wins at round 0 without any step.
//
// Throws std::invalid_argument on an empty cohort or duplicate starts.
[[nodiscard]] RaceResult race(const graphs::EdgeStore& store,
                              std::span<const node_id> starts,
                              node_id target,
                              const RaceOptions& opt = {});

// Picks count distinct store entries uniformly at random.
// Throws std::invalid_argument if the store has fewer than count entries.
template <rng::IndexRng Rng>
[[nodiscard]] std::vector<node_id> pick_entrants(const graphs::EdgeStore& store, std::size_t count, Rng& rng) {
    if (count > store.size()) throw std::invalid_argument("pick_entrants: not enough entries in store");
    std::vector<node_id> out;
    out.reserve(count);
    const std::size_t n = store.node_count();

    if (count * 2 <= store.size()) {
        std::unordered_set<node_id> taken;
        while (out.size() < count) {
            const auto id = static_cast<node_id>(rng.uniform_index(n));
            if (!store.contains(id) || !taken.insert(id).second) continue;
            out.push_back(id);
        }
        return out;
    }

    // Dense request: partial Fisher-Yates over the materialized entries.
    std::vector<node_id> pool;
    pool.reserve(store.size());
    store.for_each_entry([&](node_id id, const graphs::Link&) { pool.push_back(id); });
    for (std::size_t i = 0; i < count; ++i) {
        const std::size_t j = i + rng.uniform_index(pool.size() - i);
        std::swap(pool[i], pool[j]);
        out.push_back(pool[i]);
    }
    return out;
}

[[nodiscard]] const char* to_string(RacerState s) noexcept;
[[nodiscard]] const char* to_string(RaceOutcome o) noexcept;

} // namespace sim
