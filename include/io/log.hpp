// log.hpp — levelled logging to stderr and an optional log file
#pragma once

#include <filesystem>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>

namespace io::log {

enum class Level : int { error = 0, warn = 1, info = 2, debug = 3 };

void  set_level(Level l) noexcept;
Level level() noexcept;
[[nodiscard]] inline bool enabled(Level l) noexcept { return static_cast<int>(l) <= static_cast<int>(level()); }

// "error", "warn", "info", "debug" (case-sensitive).
[[nodiscard]] std::optional<Level> parse_level(std::string_view s) noexcept;
[[nodiscard]] const char* to_string(Level l) noexcept;

// Mirrors every line into the file (appending). Throws std::runtime_error if
// the file cannot be opened.
void open_file(const std::filesystem::path& p);
void close_file();

// Writes "[YYYY-mm-dd HH:MM:SS] LEVEL: msg" to stderr and the log file.
void write(Level l, const std::string& msg);

template <class... Args>
void emit(Level l, Args&&... args) {
    if (!enabled(l)) return;
    std::ostringstream oss;
    (oss << ... << std::forward<Args>(args));
    write(l, oss.str());
}

template <class... Args> void error(Args&&... a) { emit(Level::error, std::forward<Args>(a)...); }
template <class... Args> void warn (Args&&... a) { emit(Level::warn,  std::forward<Args>(a)...); }
template <class... Args> void info (Args&&... a) { emit(Level::info,  std::forward<Args>(a)...); }
template <class... Args> void debug(Args&&... a) { emit(Level::debug, std::forward<Args>(a)...); }

} // namespace io::log
