// app.cpp — command dispatch and result printing

#include "app/app.hpp"

#include <algorithm>
#include <csignal>
#include <iomanip>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "dist/distance_engine.hpp"
#include "dist/navigator.hpp"
#include "io/edge_loader.hpp"
#include "io/log.hpp"
#include "io/progress.hpp"
#include "rng/splitmix64.hpp"
#include "sim/race.hpp"
#include "stats/graph_stats.hpp"
#include "util/timing.hpp"
#include "walk/path_follower.hpp"

namespace app {

namespace {

using core::node_id;

std::atomic<bool> g_interrupted{false};

void on_sigint(int) {
    if (g_interrupted.exchange(true)) {
        std::signal(SIGINT, SIG_DFL);
        std::raise(SIGINT);
    }
}

std::string title_of(const graphs::GraphContext& ctx, node_id n) {
    return n == core::no_node ? std::string("-") : ctx.name(n);
}

// Distance pass with the progress bar and per-layer debug timing attached.
dist::DistanceReport distances(const graphs::GraphContext& ctx, const cli::Options& opt,
                               const std::atomic<bool>& cancel) {
    io::LayerProgress bar(ctx.edges().node_count(), opt.progress && io::stderr_is_tty());
    dist::DistanceOptions dopt;
    dopt.cancel = &cancel;
    dopt.on_layer = [&](const dist::LayerInfo& li) {
        io::log::debug("layer ", li.index, ": ", li.size, " nodes, ", li.discovered, " total, ",
                       std::fixed, std::setprecision(3), li.seconds, "s");
        bar.on_layer(li);
    };
    auto rep = dist::compute_distances(ctx, std::string_view(opt.target), dopt);
    bar.finish();

    if (!ctx.find(opt.target)) io::log::warn("target '", opt.target, "' is not in the edge map");
    if (!rep.complete) io::log::warn("distance pass interrupted after ", rep.layer_sizes.size(), " layers");
    io::log::info("distances: ", rep.table.size(), " nodes in ", rep.layer_sizes.size(), " layers (",
                  std::fixed, std::setprecision(2), rep.seconds, "s)");
    return rep;
}

void print_path(const graphs::GraphContext& ctx, const std::string& start, const cli::Options& opt,
                std::ostream& out) {
    const auto p = walk::follow_path(ctx.edges(), std::string_view(start), std::string_view(opt.target));
    for (std::size_t i = 0; i < p.titles.size(); ++i) out << (i ? " -> " : "") << p.titles[i];
    out << "\n  " << walk::to_string(p.outcome);
    if (p.outcome == walk::Outcome::cycle) out << " at " << p.repeated;
    if (p.outcome == walk::Outcome::dead_end) out << " (" << walk::to_string(p.dead_end) << ")";
    out << ", " << p.steps() << " steps\n";
}

int cmd_path(const graphs::GraphContext& ctx, const cli::Options& opt, std::ostream& out) {
    for (const auto& t : opt.args) print_path(ctx, t, opt, out);
    return 0;
}

int cmd_distance(const graphs::GraphContext& ctx, const cli::Options& opt,
                 const std::atomic<bool>& cancel, std::ostream& out) {
    const auto rep = distances(ctx, opt, cancel);
    for (const auto& t : opt.args) {
        out << t << ": ";
        const auto id = ctx.find(t);
        if (!id) { out << "unknown title\n"; continue; }
        if (auto d = rep.table.distance(*id)) out << *d << "\n";
        else out << (rep.complete ? "does not reach " + opt.target : std::string("unknown (interrupted)")) << "\n";
    }
    return 0;
}

int cmd_coverage(const graphs::GraphContext& ctx, const cli::Options& opt,
                 const std::atomic<bool>& cancel, std::ostream& out) {
    const auto rep = distances(ctx, opt, cancel);
    out << "target:   " << opt.target << "\n";
    out << "reached:  " << rep.reached_entries << " / " << rep.store_entries << " entries\n";
    out << "coverage: " << std::fixed << std::setprecision(4) << rep.coverage << "\n";
    out << "complete: " << (rep.complete ? "yes" : "no") << "\n";
    if (rep.target_on_cycle) {
        out << "target on cycle of length " << rep.table.distance(rep.table.target()).value_or(0) << "\n";
    }
    out << "layers:";
    for (auto s : rep.layer_sizes) out << " " << s;
    out << "\n";
    return 0;
}

int cmd_step(const graphs::GraphContext& ctx, const cli::Options& opt, std::ostream& out) {
    const auto& title = opt.args[0];
    const auto from = ctx.find(title);
    dist::StepResult r;
    if (!from) {
        r.status = dist::StepStatus::unknown_node;
    } else if (opt.toward) {
        r = dist::step_toward(ctx, *from);
    } else if (opt.via) {
        const auto via = ctx.find(*opt.via);
        r = dist::step_away(ctx, *from, via.value_or(core::no_node));
    } else {
        rng::SplitMix64 g(opt.seed);
        r = dist::step_away(ctx, *from, g);
    }

    out << title << (opt.toward ? " -> " : " <- ");
    if (r) {
        out << ctx.name(r.node);
        if (!opt.toward) out << "  (" << r.choices << " predecessors)";
        out << "\n";
    } else {
        out << "none: " << dist::to_string(r.status) << "\n";
    }
    return 0;
}

int cmd_sample(const graphs::GraphContext& ctx, const cli::Options& opt,
               const std::atomic<bool>& cancel, std::ostream& out) {
    const auto rep = distances(ctx, opt, cancel);
    const auto buckets = dist::DistanceBuckets::build(rep.table);
    rng::SplitMix64 g(opt.seed);
    for (std::size_t i = 0; i < opt.count; ++i) {
        const auto s = dist::sample_at_distance(buckets, opt.sample_distance, g);
        if (!s) {
            out << "no titles at distance " << opt.sample_distance << "\n";
            return 0;
        }
        out << ctx.name(s.node) << "\n";
    }
    return 0;
}

int cmd_race(const graphs::GraphContext& ctx, const cli::Options& opt, std::ostream& out) {
    std::vector<node_id> starts;
    if (opt.random_racers > 0) {
        if (opt.random_racers > ctx.edges().size()) {
            throw cli::UsageError("race: --random " + std::to_string(opt.random_racers) + " exceeds the " +
                                  std::to_string(ctx.edges().size()) + " entries in the map");
        }
        rng::SplitMix64 g(opt.seed);
        starts = sim::pick_entrants(ctx.edges(), opt.random_racers, g);
    } else {
        for (const auto& t : opt.args) {
            const auto id = ctx.find(t);
            if (!id) {
                out << "unknown title: " << t << "\n";
                return 0;
            }
            starts.push_back(*id);
        }
    }

    sim::RaceOptions ropt;
    ropt.max_rounds = opt.max_rounds;
    const auto target = ctx.find(opt.target).value_or(core::no_node);
    const auto res = sim::race(ctx.edges(), starts, target, ropt);

    for (const auto& snap : res.trace) {
        out << "round " << snap.round << ":";
        for (std::size_t i = 0; i < snap.positions.size(); ++i) {
            out << (i ? " | " : " ") << title_of(ctx, snap.positions[i]);
            if (snap.states[i] != sim::RacerState::running) out << " [" << sim::to_string(snap.states[i]) << "]";
        }
        out << "\n";
    }

    switch (res.outcome) {
    case sim::RaceOutcome::won:
        out << (res.is_tie() ? "tie: " : "winner: ");
        for (std::size_t i = 0; i < res.winners.size(); ++i) {
            out << (i ? ", " : "") << ctx.name(res.starts[res.winners[i]]);
        }
        out << " after " << res.rounds << " rounds\n";
        break;
    case sim::RaceOutcome::no_winner:
        out << "no winner after " << res.rounds << " rounds\n";
        break;
    case sim::RaceOutcome::round_limit:
        out << "undecided after " << res.rounds << " rounds (round limit)\n";
        break;
    }
    return 0;
}

int cmd_stats(const graphs::GraphContext& ctx, const cli::Options& opt,
              const std::atomic<bool>& cancel, std::ostream& out) {
    util::Stopwatch sw;
    const auto s = stats::analyze(ctx);
    io::log::info("graph statistics in ", std::fixed, std::setprecision(2), sw.seconds(), "s");

    out << "entries:          " << s.entries << "\n";
    out << "titles:           " << s.interned << "\n";
    out << "resolved links:   " << s.resolved_links << "\n";
    out << "dead ends:        " << s.dead_ends() << " (" << s.unresolved_links << " unresolved, "
        << s.successor_only << " without entry)\n";
    out << "self loops:       " << s.self_loops << "\n";
    out << "terminal cycles:  " << s.cycles.size() << " (" << s.cycle_nodes() << " nodes)\n";

    const std::size_t shown = std::min<std::size_t>(s.cycles.size(), opt.top);
    for (std::size_t i = 0; i < shown; ++i) {
        const auto& c = s.cycles[i];
        out << "  len " << c.nodes.size() << ", basin " << c.basin << ":";
        for (std::size_t j = 0; j < c.nodes.size(); ++j) out << (j ? " -> " : " ") << ctx.name(c.nodes[j]);
        out << "\n";
    }

    out << "top reach:\n";
    for (const auto& [n, r] : stats::top_reach(s, opt.top)) out << "  " << r << "  " << ctx.name(n) << "\n";

    const auto rep = distances(ctx, opt, cancel);
    const auto hist = dist::DistanceBuckets::build(rep.table).histogram();
    out << "distance histogram (" << opt.target << "):\n";
    for (std::size_t d = 0; d < hist.size(); ++d) out << "  " << d << "  " << hist[d] << "\n";
    return 0;
}

} // namespace

int run_command(const graphs::GraphContext& ctx, const cli::Options& opt,
                const std::atomic<bool>& cancel, std::ostream& out) {
    switch (opt.command) {
    case cli::Command::path:     return cmd_path(ctx, opt, out);
    case cli::Command::distance: return cmd_distance(ctx, opt, cancel, out);
    case cli::Command::coverage: return cmd_coverage(ctx, opt, cancel, out);
    case cli::Command::step:     return cmd_step(ctx, opt, out);
    case cli::Command::sample:   return cmd_sample(ctx, opt, cancel, out);
    case cli::Command::race:     return cmd_race(ctx, opt, out);
    case cli::Command::stats:    return cmd_stats(ctx, opt, cancel, out);
    }
    return 1;
}

std::atomic<bool>& interrupt_flag() { return g_interrupted; }

void install_interrupt_handler() { std::signal(SIGINT, on_sigint); }

int run(const cli::Options& opt, const std::atomic<bool>& cancel, std::ostream& out) {
    util::Stopwatch sw;
    auto store = io::load_edges(opt.edges);
    io::log::info("loaded ", opt.edges, " in ", std::fixed, std::setprecision(2), sw.lap(), "s");

    graphs::ContextOptions copt;
    copt.parallel_build = opt.parallel_build;
    const graphs::GraphContext ctx(std::move(store), copt);
    io::log::info("reverse index: ", ctx.reverse().edge_count(), " edges (",
                  opt.parallel_build ? "parallel" : "serial", ", ", std::fixed, std::setprecision(2),
                  sw.lap(), "s)");

    return run_command(ctx, opt, cancel, out);
}

} // namespace app
