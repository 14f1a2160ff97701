// race.cpp

#include "sim/race.hpp"

#include <unordered_set>
#include <utility>

#include "walk/path_follower.hpp"

namespace sim {

namespace {

RacerState state_of(const walk::Walker& w) noexcept {
    switch (w.status()) {
    case walk::Walker::Status::running:   return RacerState::running;
    case walk::Walker::Status::at_target: return RacerState::won;
    case walk::Walker::Status::looping:   return RacerState::looping;
    case walk::Walker::Status::stalled:   return RacerState::stalled;
    }
    return RacerState::stalled;
}

void snapshot(RaceResult& res, const std::vector<walk::Walker>& walkers, std::size_t round) {
    RoundSnapshot s;
    s.round = round;
    s.positions.reserve(walkers.size());
    s.states.reserve(walkers.size());
    for (const auto& w : walkers) {
        s.positions.push_back(w.position());
        s.states.push_back(state_of(w));
    }
    res.trace.push_back(std::move(s));
}

// Indices of walkers standing on the target.
std::vector<std::size_t> collect_winners(const std::vector<walk::Walker>& walkers) {
    std::vector<std::size_t> out;
    for (std::size_t i = 0; i < walkers.size(); ++i) {
        if (walkers[i].status() == walk::Walker::Status::at_target) out.push_back(i);
    }
    return out;
}

} // namespace

RaceResult race(const graphs::EdgeStore& store, std::span<const node_id> starts, node_id target, const RaceOptions& opt) {
    if (starts.empty()) throw std::invalid_argument("race: at least one participant is required");
    {
        std::unordered_set<node_id> unique(starts.begin(), starts.end());
        if (unique.size() != starts.size()) throw std::invalid_argument("race: participants must be distinct");
    }

    RaceResult res;
    res.starts.assign(starts.begin(), starts.end());

    std::vector<walk::Walker> walkers;
    walkers.reserve(starts.size());
    for (node_id s : starts) walkers.emplace_back(store, s, target);

    if (opt.record_trace) snapshot(res, walkers, 0);

    std::size_t round = 0;
    for (;;) {
        res.winners = collect_winners(walkers);
        if (!res.winners.empty()) { res.outcome = RaceOutcome::won; break; }

        bool any_running = false;
        for (const auto& w : walkers) any_running = any_running || w.running();
        if (!any_running) { res.outcome = RaceOutcome::no_winner; break; }

        if (opt.max_rounds && round >= opt.max_rounds) { res.outcome = RaceOutcome::round_limit; break; }

        ++round;
        for (auto& w : walkers) w.advance();
        if (opt.record_trace) snapshot(res, walkers, round);
    }

    res.rounds = round;
    return res;
}

const char* to_string(RacerState s) noexcept {
    switch (s) {
    case RacerState::running: return "running";
    case RacerState::looping: return "looping";
    case RacerState::stalled: return "stalled";
    case RacerState::won:     return "won";
    }
    return "?";
}

const char* to_string(RaceOutcome o) noexcept {
    switch (o) {
    case RaceOutcome::won:         return "won";
    case RaceOutcome::no_winner:   return "no-winner";
    case RaceOutcome::round_limit: return "round-limit";
    }
    return "?";
}

} // namespace sim
