// io_tests.cpp
// JSON loading (single file and shard directories), log levels, count formatting.

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>

#include "io/edge_loader.hpp"
#include "io/log.hpp"
#include "io/progress.hpp"
#include "rng/splitmix64.hpp"

namespace fs = std::filesystem;

namespace {

// Scratch directory removed on scope exit.
struct TempDir {
    fs::path path;
    TempDir() {
        rng::SplitMix64 g(static_cast<std::uint64_t>(std::chrono::steady_clock::now().time_since_epoch().count()));
        path = fs::temp_directory_path() / ("firstlink_test_" + std::to_string(g.next_u64()));
        fs::create_directories(path);
    }
    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path, ec);
    }
    fs::path write(const std::string& name, const std::string& body) const {
        const auto p = path / name;
        std::ofstream(p) << body;
        return p;
    }
};

} // namespace

TEST_CASE("single file with resolved, empty and null links")
{
    io::log::set_level(io::log::Level::error);
    TempDir dir;
    auto f = dir.write("edges.json", R"({"A": "B", "B": "Philosophy", "C": "", "D": null})");

    auto s = io::load_edges(f);
    CHECK(s.size() == 4);
    CHECK(s.node_count() == 5);
    CHECK(s.successor(*s.find("A")) == s.find("B"));
    REQUIRE(s.link(*s.find("C")).has_value());
    CHECK_FALSE(s.link(*s.find("C"))->is_resolved());
    CHECK_FALSE(s.link(*s.find("D"))->is_resolved());
    CHECK_FALSE(s.contains(*s.find("Philosophy")));
}

TEST_CASE("shard directory merges in filename order")
{
    io::log::set_level(io::log::Level::error);
    TempDir dir;
    dir.write("b.json", R"({"B": "C", "A": "B"})");
    dir.write("a.json", R"({"A": "B"})");
    dir.write("notes.txt", "not json");

    auto shards = io::list_shards(dir.path);
    REQUIRE(shards.size() == 2);
    CHECK(shards[0].filename() == "a.json");

    auto s = io::load_edges(dir.path);
    CHECK(s.size() == 2);
    CHECK(s.successor(*s.find("B")) == s.find("C"));
    // a.json is read first, so A gets the first id
    CHECK(*s.find("A") == 0);
}

TEST_CASE("malformed input raises LoadError naming the file")
{
    io::log::set_level(io::log::Level::error);
    TempDir dir;

    SUBCASE("invalid JSON") {
        auto f = dir.write("bad.json", R"({"A": "B",)");
        CHECK_THROWS_AS((void)io::load_edges(f), io::LoadError);
    }
    SUBCASE("top level is not an object") {
        auto f = dir.write("arr.json", R"(["A", "B"])");
        CHECK_THROWS_AS((void)io::load_edges(f), io::LoadError);
    }
    SUBCASE("non-string value") {
        auto f = dir.write("num.json", R"({"A": 3})");
        CHECK_THROWS_AS((void)io::load_edges(f), io::LoadError);
    }
    SUBCASE("empty key") {
        auto f = dir.write("key.json", R"({"": "A"})");
        CHECK_THROWS_AS((void)io::load_edges(f), io::LoadError);
    }
    SUBCASE("conflicting duplicate across shards") {
        dir.write("1.json", R"({"A": "B"})");
        dir.write("2.json", R"({"A": "C"})");
        try {
            (void)io::load_edges(dir.path);
            FAIL("expected LoadError");
        } catch (const io::LoadError& e) {
            CHECK(e.file().filename() == "2.json");
            CHECK(std::string(e.what()).find("2.json") != std::string::npos);
        }
    }
    SUBCASE("missing file") {
        CHECK_THROWS_AS((void)io::load_edges(dir.path / "nope.json"), io::LoadError);
    }
    SUBCASE("directory without shards") {
        CHECK_THROWS_AS((void)io::load_edges(dir.path), io::LoadError);
    }
}

TEST_CASE("log level parsing and file mirror")
{
    CHECK(io::log::parse_level("debug") == io::log::Level::debug);
    CHECK(io::log::parse_level("warn") == io::log::Level::warn);
    CHECK_FALSE(io::log::parse_level("verbose").has_value());

    io::log::set_level(io::log::Level::warn);
    CHECK(io::log::enabled(io::log::Level::error));
    CHECK_FALSE(io::log::enabled(io::log::Level::info));

    TempDir dir;
    const auto f = dir.path / "run.log";
    io::log::open_file(f);
    io::log::warn("layer ", 3, " took ", 0.5, "s");
    io::log::debug("hidden");
    io::log::close_file();

    std::ifstream in(f);
    std::string line;
    REQUIRE(static_cast<bool>(std::getline(in, line)));
    CHECK(line.find("WARN: layer 3 took 0.5s") != std::string::npos);
    CHECK(line.front() == '[');
    CHECK_FALSE(static_cast<bool>(std::getline(in, line)));
}

TEST_CASE("format_count")
{
    CHECK(io::format_count(999) == "999");
    CHECK(io::format_count(1234) == "1.23K");
    CHECK(io::format_count(56'700'000) == "56.7M");
}
