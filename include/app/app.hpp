// app.hpp — runs one CLI command against a loaded graph context
#pragma once

#include <atomic>
#include <iosfwd>

#include "cli/cli.hpp"
#include "graphs/graph_context.hpp"

namespace app {

// Loads the edge map named by opt.edges, builds the context, dispatches the
// command and prints its results to out. Returns the process exit status.
// io::LoadError and std::invalid_argument propagate to the caller, and so does
// cli::UsageError for arguments that only fail against the loaded map.
int run(const cli::Options& opt, const std::atomic<bool>& cancel, std::ostream& out);

// Dispatch against an existing context.
int run_command(const graphs::GraphContext& ctx, const cli::Options& opt,
                const std::atomic<bool>& cancel, std::ostream& out);

// SIGINT: the first interrupt sets interrupt_flag() so a distance pass stops
// between layers; a second one restores the default action and re-raises.
std::atomic<bool>& interrupt_flag();
void install_interrupt_handler();

} // namespace app
