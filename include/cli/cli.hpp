// cli.hpp — Command-line parsing interface (cxxopts)
#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "core/config.hpp"
#include "io/log.hpp"

namespace cli {

enum class Command { path, distance, coverage, step, sample, race, stats };

// Malformed command line; main() prints the help text and exits with 2.
class UsageError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct Options {
    std::string edges;                        // file or shard directory
    std::string target = core::default_target;

    // 0 => let TBB decide
    int threads = 0;

    // --seed, else SEED env, else FIRSTLINK_DEFAULT_SEED
    std::uint64_t seed = FIRSTLINK_DEFAULT_SEED;

    io::log::Level log_level = io::log::Level::info;
    std::string    log_file;
    bool           progress = true;
    bool           parallel_build = false;

    Command                  command = Command::coverage;
    std::vector<std::string> args;            // positional titles after the command

    // step
    bool                       toward = true;
    std::optional<std::string> via;
    // sample
    core::distance_t sample_distance = 0;
    std::size_t      count = 1;
    // race
    std::size_t random_racers = 0;
    std::size_t max_rounds = 0;               // 0 => until decided
    // stats
    std::size_t top = 10;
};

[[nodiscard]] std::optional<Command> parse_command(std::string_view s) noexcept;
[[nodiscard]] const char* to_string(Command c) noexcept;

// Parse CLI arguments with cxxopts.
// Sets want_help/help_text for --help; throws UsageError on a malformed line.
Options parse_args(int argc, char** argv, bool& want_help, std::string& help_text);

} // namespace cli
