// walk_tests.cpp
// follow_path classification and the single-step Walker.

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <string>
#include <vector>

#include "walk/path_follower.hpp"
#include "test_graphs.hpp"

using fixtures::id;
using fixtures::make_store;

TEST_CASE("chain reaching the target within k steps")
{
    auto s = make_store({{"A", "B"}, {"B", "C"}, {"C", "Philosophy"}, {"Philosophy", "Knowledge"}});
    const auto T = id(s, "Philosophy");

    auto p = walk::follow_path(s, id(s, "A"), T);
    CHECK(p.outcome == walk::Outcome::reached_target);
    CHECK(p.steps() == 3);
    REQUIRE(p.nodes.size() == 4);
    CHECK(p.nodes.front() == id(s, "A"));
    CHECK(p.nodes.back() == T);

    auto q = walk::follow_path(s, id(s, "C"), T);
    CHECK(q.outcome == walk::Outcome::reached_target);
    CHECK(q.steps() == 1);
}

TEST_CASE("three-cycle without the target reports the repeated start")
{
    auto s = make_store({{"A", "B"}, {"B", "C"}, {"C", "A"}, {"Philosophy", ""}});
    auto p = walk::follow_path(s, id(s, "A"), id(s, "Philosophy"));

    CHECK(p.outcome == walk::Outcome::cycle);
    CHECK(p.repeated == id(s, "A"));
    CHECK(p.nodes == std::vector<graphs::node_id>{id(s, "A"), id(s, "B"), id(s, "C"), id(s, "A")});
    CHECK(p.steps() == 3);
}

TEST_CASE("cycle entered from a tail repeats the cycle entry")
{
    auto s = make_store({{"X", "A"}, {"A", "B"}, {"B", "A"}});
    auto p = walk::follow_path(s, id(s, "X"), core::no_node);
    CHECK(p.outcome == walk::Outcome::cycle);
    CHECK(p.repeated == id(s, "A"));
    CHECK(p.steps() == 3);
}

TEST_CASE("dead ends")
{
    auto s = make_store({{"A", "B"}, {"B", ""}, {"C", "Nowhere"}, {"T", "T"}});
    const auto T = id(s, "T");

    SUBCASE("unresolved link") {
        auto p = walk::follow_path(s, id(s, "A"), T);
        CHECK(p.outcome == walk::Outcome::dead_end);
        CHECK(p.dead_end == walk::DeadEnd::unresolved);
        CHECK(p.nodes.back() == id(s, "B"));
    }
    SUBCASE("successor-only title has no link") {
        auto p = walk::follow_path(s, id(s, "C"), T);
        CHECK(p.outcome == walk::Outcome::dead_end);
        CHECK(p.steps() == 1);
    }
    SUBCASE("start that is not an entry") {
        auto p = walk::follow_path(s, id(s, "Nowhere"), T);
        CHECK(p.outcome == walk::Outcome::dead_end);
        CHECK(p.dead_end == walk::DeadEnd::unknown_node);
        CHECK(p.steps() == 0);
    }
}

TEST_CASE("start equal to the target is reached in zero steps")
{
    auto s = make_store({{"T", "A"}, {"A", "T"}});
    auto p = walk::follow_path(s, id(s, "T"), id(s, "T"));
    CHECK(p.outcome == walk::Outcome::reached_target);
    CHECK(p.steps() == 0);
}

TEST_CASE("title overload")
{
    auto s = make_store({{"A", "B"}, {"B", "Philosophy"}});

    auto p = walk::follow_path(s, "A", "Philosophy");
    CHECK(p.outcome == walk::Outcome::reached_target);
    CHECK(p.titles == std::vector<std::string>{"A", "B", "Philosophy"});

    auto u = walk::follow_path(s, "Unknown", "Philosophy");
    CHECK(u.outcome == walk::Outcome::dead_end);
    CHECK(u.dead_end == walk::DeadEnd::unknown_node);
    CHECK(u.titles == std::vector<std::string>{"Unknown"});

    // target never interned: the walk still terminates
    auto v = walk::follow_path(s, "A", "Elsewhere");
    CHECK(v.outcome == walk::Outcome::dead_end);
    CHECK(v.steps() == 2);

    CHECK(std::string(walk::to_string(walk::Outcome::cycle)) == "cycle");
}

TEST_CASE("walker advances one edge at a time")
{
    auto s = make_store({{"A", "B"}, {"B", "A"}});
    walk::Walker w(s, id(s, "A"), core::no_node);

    CHECK(w.running());
    CHECK(w.advance() == walk::Walker::Status::running);
    CHECK(w.position() == id(s, "B"));
    CHECK(w.advance() == walk::Walker::Status::looping);
    CHECK(w.position() == id(s, "A"));
    CHECK(w.steps() == 2);

    // no-op once finished
    CHECK(w.advance() == walk::Walker::Status::looping);
    CHECK(w.steps() == 2);
}
