// log.cpp

#include "io/log.hpp"

#include <atomic>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <fstream>
#include <mutex>
#include <stdexcept>

namespace io::log {

namespace {

std::atomic<int> g_level{static_cast<int>(Level::info)};
std::mutex       g_mu;
std::ofstream    g_file;

std::string timestamp() {
    const auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm{};
    localtime_r(&now, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
    return buf;
}

const char* tag(Level l) noexcept {
    switch (l) {
    case Level::error: return "ERROR";
    case Level::warn:  return "WARN";
    case Level::info:  return "INFO";
    case Level::debug: return "DEBUG";
    }
    return "?";
}

} // namespace

void set_level(Level l) noexcept { g_level.store(static_cast<int>(l), std::memory_order_relaxed); }
Level level() noexcept { return static_cast<Level>(g_level.load(std::memory_order_relaxed)); }

std::optional<Level> parse_level(std::string_view s) noexcept {
    if (s == "error") return Level::error;
    if (s == "warn")  return Level::warn;
    if (s == "info")  return Level::info;
    if (s == "debug") return Level::debug;
    return std::nullopt;
}

const char* to_string(Level l) noexcept {
    switch (l) {
    case Level::error: return "error";
    case Level::warn:  return "warn";
    case Level::info:  return "info";
    case Level::debug: return "debug";
    }
    return "?";
}

void open_file(const std::filesystem::path& p) {
    std::lock_guard<std::mutex> lk(g_mu);
    if (g_file.is_open()) g_file.close();
    g_file.open(p, std::ios::app);
    if (!g_file) throw std::runtime_error("cannot open log file " + p.string());
}

void close_file() {
    std::lock_guard<std::mutex> lk(g_mu);
    if (g_file.is_open()) g_file.close();
}

void write(Level l, const std::string& msg) {
    const std::string line = "[" + timestamp() + "] " + tag(l) + ": " + msg + "\n";
    std::lock_guard<std::mutex> lk(g_mu);
    std::fputs(line.c_str(), stderr);
    if (g_file.is_open()) {
        g_file << line;
        g_file.flush();
    }
}

} // namespace io::log
