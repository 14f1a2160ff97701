// graphs_tests.cpp
// Edge store interning and the reverse index (serial and TBB builds).

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <algorithm>
#include <stdexcept>

#include "graphs/edge_store.hpp"
#include "graphs/graph_context.hpp"
#include "graphs/reverse_index.hpp"
#include "test_graphs.hpp"

using fixtures::id;
using fixtures::make_store;

TEST_CASE("edge store interns keys and successor-only titles")
{
    auto s = make_store({{"A", "B"}, {"B", "C"}, {"D", ""}});

    CHECK(s.size() == 3);       // A, B, D
    CHECK(s.node_count() == 4); // + C
    CHECK(s.contains(id(s, "A")));
    CHECK_FALSE(s.contains(id(s, "C")));
    CHECK_FALSE(s.find("Z").has_value());
    CHECK(s.name(id(s, "C")) == "C");

    CHECK(s.successor(id(s, "A")) == id(s, "B"));
    CHECK_FALSE(s.successor(id(s, "C")).has_value());
    CHECK_FALSE(s.successor(id(s, "D")).has_value());

    auto l = s.link(id(s, "D"));
    REQUIRE(l.has_value());
    CHECK_FALSE(l->is_resolved());
    CHECK_FALSE(s.link(id(s, "C")).has_value());

    CHECK_THROWS_AS((void)s.name(99), std::out_of_range);
}

TEST_CASE("builder accepts identical duplicates and rejects conflicts")
{
    graphs::EdgeStoreBuilder b;
    b.add("A", "B");
    b.add("A", "B");
    CHECK(b.size() == 1); // entries only; B is interned as a successor
    CHECK_THROWS_AS(b.add("A", "C"), std::invalid_argument);
    CHECK_THROWS_AS(b.add_unresolved("A"), std::invalid_argument);
    CHECK_THROWS_AS(b.add("", "B"), std::invalid_argument);

    // A successor-only title may later become an entry
    b.add("B", "A");
    auto s = std::move(b).build();
    CHECK(s.size() == 2);
    CHECK(s.successor(id(s, "B")) == id(s, "A"));
    // rejected adds intern nothing
    CHECK(s.node_count() == 2);
    CHECK_FALSE(s.find("C").has_value());
}

TEST_CASE("rejected add keeps the builder unchanged")
{
    graphs::EdgeStoreBuilder b;
    b.add_unresolved("U");
    b.add("A", "B");
    CHECK_THROWS_AS(b.add("U", "New"), std::invalid_argument);
    CHECK_THROWS_AS(b.add("A", "Other"), std::invalid_argument);
    CHECK_THROWS_AS(b.add("A", "U"), std::invalid_argument);
    b.add("A", "B");
    b.add_unresolved("U");

    auto s = std::move(b).build();
    CHECK(s.size() == 2);
    CHECK(s.node_count() == 3); // U, A, B
    CHECK_FALSE(s.find("New").has_value());
    CHECK_FALSE(s.find("Other").has_value());
}

TEST_CASE("for_each_entry visits every key once")
{
    auto s = make_store({{"A", "B"}, {"C", ""}, {"B", "B"}});
    std::size_t resolved = 0, unresolved = 0;
    s.for_each_entry([&](graphs::node_id, const graphs::Link& l) {
        (l.is_resolved() ? resolved : unresolved) += 1;
    });
    CHECK(resolved == 2);
    CHECK(unresolved == 1);
}

TEST_CASE("reverse index holds exactly the predecessors")
{
    auto s = make_store({{"A", "T"}, {"B", "T"}, {"C", "A"}, {"T", "A"}, {"D", ""}});
    auto r = graphs::ReverseIndex::build(s);

    CHECK(r.node_count() == s.node_count());
    CHECK(r.edge_count() == 4);

    auto preds = r.predecessors(id(s, "T"));
    REQUIRE(preds.size() == 2);
    CHECK(std::is_sorted(preds.begin(), preds.end()));
    CHECK(std::find(preds.begin(), preds.end(), id(s, "A")) != preds.end());
    CHECK(std::find(preds.begin(), preds.end(), id(s, "B")) != preds.end());

    CHECK(r.in_degree(id(s, "A")) == 2);
    CHECK_FALSE(r.has_predecessors(id(s, "D")));
    CHECK(r.predecessors(1000).empty());
}

TEST_CASE("p in reverse[n] iff edge[p] == n on a random graph")
{
    auto s = fixtures::random_store(2000, 42);
    auto r = graphs::ReverseIndex::build(s);

    std::size_t total = 0;
    for (graphs::node_id n = 0; n < s.node_count(); ++n) {
        for (graphs::node_id p : r.predecessors(n)) {
            CHECK(s.successor(p) == n);
        }
        total += r.in_degree(n);
    }
    for (graphs::node_id p = 0; p < s.node_count(); ++p) {
        if (auto n = s.successor(p)) {
            auto preds = r.predecessors(*n);
            CHECK(std::binary_search(preds.begin(), preds.end(), p));
        }
    }
    CHECK(total == r.edge_count());
}

TEST_CASE("parallel reverse build matches the serial build")
{
    auto s = fixtures::random_store(50000, 7, 8);
    auto serial   = graphs::ReverseIndex::build(s);
    auto parallel = graphs::ReverseIndex::build_parallel(s, 512);
    CHECK(serial == parallel);

    graphs::GraphContext ctx(fixtures::random_store(1000, 3), graphs::ContextOptions{true, 64});
    CHECK(ctx.reverse() == graphs::ReverseIndex::build(ctx.edges()));
}

TEST_CASE("empty store")
{
    graphs::EdgeStoreBuilder b;
    auto s = std::move(b).build();
    CHECK(s.empty());
    auto r = graphs::ReverseIndex::build(s);
    CHECK(r.edge_count() == 0);
    CHECK(graphs::ReverseIndex::build_parallel(s) == r);
}
