// Main entry: load a first-link map and answer one query about it
#include <cstdlib>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

#include <tbb/global_control.h>

#include "app/app.hpp"
#include "cli/cli.hpp"
#include "io/edge_loader.hpp"
#include "io/log.hpp"

int main(int argc, char** argv) {
    // Parse CLI
    bool want_help = false; std::string help_text;
    cli::Options opt;
    try {
        opt = cli::parse_args(argc, argv, want_help, help_text);
    } catch (const cli::UsageError& e) {
        std::cerr << "firstlink: " << e.what() << "\n\n" << help_text;
        return 2;
    }
    if (want_help) { std::cout << help_text; return 0; }

    io::log::set_level(opt.log_level);
    if (!opt.log_file.empty()) {
        try {
            io::log::open_file(opt.log_file);
        } catch (const std::runtime_error& e) {
            io::log::error(e.what());
            return 1;
        }
    }

    // Cap TBB workers for the parallel reverse build (0 => library default)
    std::unique_ptr<tbb::global_control> limit;
    if (opt.threads > 0) {
        limit = std::make_unique<tbb::global_control>(tbb::global_control::max_allowed_parallelism,
                                                      static_cast<std::size_t>(opt.threads));
    }

    // First Ctrl-C stops the distance pass between layers, the second one exits
    app::install_interrupt_handler();

    io::log::debug("command=", cli::to_string(opt.command), " target=", opt.target, " seed=", opt.seed);

    int rc = 1;
    try {
        rc = app::run(opt, app::interrupt_flag(), std::cout);
    } catch (const cli::UsageError& e) {
        io::log::error(e.what());
        rc = 2;
    } catch (const io::LoadError& e) {
        io::log::error("load failed: ", e.what());
        rc = 1;
    } catch (const std::invalid_argument& e) {
        io::log::error(e.what());
        rc = 1;
    }
    std::cout.flush();
    io::log::close_file();
    return rc;
}
