// progress.hpp — terminal progress bar for the distance pass (indicators)
#pragma once

#include <algorithm>
#include <cstddef>
#include <iomanip>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include <unistd.h>

#include <indicators/cursor_control.hpp>
#include <indicators/progress_bar.hpp>

#include "dist/distance_engine.hpp"

namespace io {

inline bool stderr_is_tty() noexcept { return ::isatty(STDERR_FILENO) == 1; }

// 1234567 -> "1.23M"
inline std::string format_count(unsigned long long v) {
    static const char* suf[] = {"", "K", "M", "B", "T", "P", "E"};
    int si = 0;
    double x = static_cast<double>(v);
    while (x >= 1000.0 && si < 6) { x /= 1000.0; ++si; }
    std::ostringstream oss;
    if (si == 0) oss << v;
    else if (x >= 100.0) oss << std::fixed << std::setprecision(0) << x << suf[si];
    else if (x >= 10.0)  oss << std::fixed << std::setprecision(1) << x << suf[si];
    else                 oss << std::fixed << std::setprecision(2) << x << suf[si];
    return oss.str();
}

// Shows nodes discovered so far against the number of interned titles,
// with "layer k" in the postfix. A disabled instance does nothing.
class LayerProgress {
public:
    LayerProgress(std::size_t total, bool enabled) : total_(std::max<std::size_t>(total, 1)) {
        if (!enabled) return;
        indicators::show_console_cursor(false);
        bar_ = std::make_unique<indicators::ProgressBar>(
            indicators::option::BarWidth{40},
            indicators::option::Start{"["},
            indicators::option::Fill{"="},
            indicators::option::Lead{">"},
            indicators::option::Remainder{" "},
            indicators::option::End{"]"},
            indicators::option::PrefixText{"BFS "},
            indicators::option::ForegroundColor{indicators::Color::green},
            indicators::option::ShowElapsedTime{true},
            indicators::option::ShowRemainingTime{false},
            indicators::option::MaxPostfixTextLen{40},
            indicators::option::MaxProgress{total_},
            indicators::option::Stream{std::cerr},
            indicators::option::FontStyles{std::vector<indicators::FontStyle>{indicators::FontStyle::bold}}
        );
    }

    LayerProgress(const LayerProgress&) = delete;
    LayerProgress& operator=(const LayerProgress&) = delete;

    ~LayerProgress() { finish(); }

    [[nodiscard]] bool active() const noexcept { return bar_ != nullptr; }

    void on_layer(const dist::LayerInfo& info) {
        if (!bar_) return;
        std::ostringstream oss;
        oss << "layer " << info.index << "  " << format_count(info.discovered) << "/" << format_count(total_);
        bar_->set_option(indicators::option::PostfixText{oss.str()});
        bar_->set_progress(std::min(info.discovered, total_));
    }

    void finish() {
        if (!bar_) return;
        if (!bar_->is_completed()) bar_->mark_as_completed();
        indicators::show_console_cursor(true);
        bar_.reset();
    }

private:
    std::size_t total_;
    std::unique_ptr<indicators::ProgressBar> bar_;
};

} // namespace io
