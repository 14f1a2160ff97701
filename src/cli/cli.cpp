// cli.cpp — Command-line parsing implementation using cxxopts

#include "cli/cli.hpp"

#include <cxxopts.hpp>
#include <algorithm>
#include <charconv>
#include <cstddef>
#include <cstdlib>
#include <string>
#include <string_view>

namespace cli {

static inline std::optional<std::uint64_t> to_u64(std::string_view x) {
    std::uint64_t out = 0;
    const char* b = x.data();
    const char* e = b + x.size();
    auto res = std::from_chars(b, e, out);
    if (res.ec != std::errc{} || res.ptr != e) return std::nullopt;
    return out;
}

std::optional<Command> parse_command(std::string_view s) noexcept {
    if (s == "path")     return Command::path;
    if (s == "distance") return Command::distance;
    if (s == "coverage") return Command::coverage;
    if (s == "step")     return Command::step;
    if (s == "sample")   return Command::sample;
    if (s == "race")     return Command::race;
    if (s == "stats")    return Command::stats;
    return std::nullopt;
}

const char* to_string(Command c) noexcept {
    switch (c) {
    case Command::path:     return "path";
    case Command::distance: return "distance";
    case Command::coverage: return "coverage";
    case Command::step:     return "step";
    case Command::sample:   return "sample";
    case Command::race:     return "race";
    case Command::stats:    return "stats";
    }
    return "?";
}

// Per-command positional checks.
static void check_command_args(Options& opt) {
    const auto n = opt.args.size();
    const std::string name = to_string(opt.command);
    switch (opt.command) {
    case Command::path:
    case Command::distance:
        if (n == 0) throw UsageError(name + ": expected at least one title");
        break;
    case Command::coverage:
    case Command::stats:
        if (n != 0) throw UsageError(name + ": takes no positional arguments");
        break;
    case Command::step:
        if (n != 2) throw UsageError("step: expected <title> toward|away");
        if (opt.args[1] == "toward") opt.toward = true;
        else if (opt.args[1] == "away") opt.toward = false;
        else throw UsageError("step: direction must be 'toward' or 'away'");
        if (opt.toward && opt.via) throw UsageError("step: --via only applies to 'away'");
        break;
    case Command::sample: {
        if (n != 1) throw UsageError("sample: expected a distance");
        auto d = to_u64(opt.args[0]);
        if (!d || *d >= core::no_distance) throw UsageError("sample: invalid distance '" + opt.args[0] + "'");
        opt.sample_distance = static_cast<core::distance_t>(*d);
        if (opt.count == 0) throw UsageError("sample: --count must be positive");
        break;
    }
    case Command::race:
        if (opt.random_racers > 0 && n > 0) throw UsageError("race: give titles or --random, not both");
        if (opt.random_racers == 0 && n == 0) throw UsageError("race: expected titles or --random N");
        for (std::size_t i = 1; i < n; ++i) {
            if (std::find(opt.args.begin(), opt.args.begin() + static_cast<std::ptrdiff_t>(i), opt.args[i]) !=
                opt.args.begin() + static_cast<std::ptrdiff_t>(i)) {
                throw UsageError("race: '" + opt.args[i] + "' is entered twice");
            }
        }
        break;
    }
}

Options parse_args(int argc, char** argv, bool& want_help, std::string& help_text) {
    Options opt;
    want_help = false;

    std::string level_s;
    std::string command_s;
    std::string via_s;
    std::uint64_t seed_val = 0;

    cxxopts::Options desc("firstlink", "Queries over the first-link graph of an encyclopedia");
    desc.custom_help("--edges <file|dir> [options]");
    desc.positional_help("<command> [args...]");
    desc.add_options()
        ("h,help", "Show this help")
        ("e,edges", "Edge map: JSON file or directory of *.json shards", cxxopts::value<std::string>(opt.edges))
        ("t,target", "Target title", cxxopts::value<std::string>(opt.target)->default_value(core::default_target))
        ("threads", "Worker threads for parallel builds (0 = all)", cxxopts::value<int>(opt.threads)->default_value("0"))
        ("seed", "RNG seed (default: SEED env or built-in)", cxxopts::value<std::uint64_t>(seed_val))
        ("log-level", "error | warn | info | debug", cxxopts::value<std::string>(level_s)->default_value("info"))
        ("log-file", "Append log lines to this file", cxxopts::value<std::string>(opt.log_file))
        ("no-progress", "Disable the progress bar")
        ("parallel-build", "Build the reverse index with TBB")
    ;
    desc.add_options("Commands")
        ("via", "step away: go through this predecessor", cxxopts::value<std::string>(via_s))
        ("count", "sample: number of draws", cxxopts::value<std::size_t>(opt.count)->default_value("1"))
        ("random", "race: N random participants", cxxopts::value<std::size_t>(opt.random_racers)->default_value("0"))
        ("max-rounds", "race: stop after R rounds (0 = until decided)", cxxopts::value<std::size_t>(opt.max_rounds)->default_value("0"))
        ("top", "stats: number of top reach counts", cxxopts::value<std::size_t>(opt.top)->default_value("10"))
        ("command", "path | distance | coverage | step | sample | race | stats", cxxopts::value<std::string>(command_s))
        ("args", "Command arguments", cxxopts::value<std::vector<std::string>>(opt.args))
    ;
    desc.parse_positional({"command", "args"});
    help_text = desc.help({"", "Commands"});

    cxxopts::ParseResult result;
    try {
        result = desc.parse(argc, argv);
    } catch (const cxxopts::exceptions::exception& e) {
        throw UsageError(e.what());
    }
    if (result.count("help")) { want_help = true; return opt; }

    if (opt.edges.empty()) throw UsageError("--edges is required");
    if (command_s.empty()) throw UsageError("missing command");
    auto cmd = parse_command(command_s);
    if (!cmd) throw UsageError("unknown command '" + command_s + "'");
    opt.command = *cmd;

    auto level = io::log::parse_level(level_s);
    if (!level) throw UsageError("invalid --log-level '" + level_s + "'");
    opt.log_level = *level;

    opt.progress = result.count("no-progress") == 0;
    opt.parallel_build = result.count("parallel-build") > 0;
    if (opt.threads < 0) throw UsageError("--threads must be >= 0");
    if (result.count("via")) opt.via = via_s;

    // Deterministic by default; SEED env overrides when --seed is absent
    if (result.count("seed")) {
        opt.seed = seed_val;
    } else if (const char* es = std::getenv("SEED")) {
        if (auto v = to_u64(es); v && *v != 0ULL) opt.seed = *v;
    }

    check_command_args(opt);
    return opt;
}

} // namespace cli
