// reverse_index.cpp — serial and TBB-partitioned construction of the predecessor sets

#include "graphs/reverse_index.hpp"

#include <algorithm>
#include <utility>

#include <tbb/blocked_range.h>
#include <tbb/parallel_for.h>
#include <tbb/parallel_reduce.h>

namespace graphs {

namespace {

using EdgePairs = std::vector<std::pair<node_id, node_id>>; // (successor, predecessor)

} // namespace

ReverseIndex ReverseIndex::build(const EdgeStore& store) {
    const auto& succ = store.successors();
    const std::size_t n = store.node_count();

    ReverseIndex r;
    r.offsets_.assign(n + 1, 0);
    for (std::size_t p = 0; p < n; ++p) {
        if (succ[p] != core::no_node) ++r.offsets_[succ[p] + 1];
    }
    for (std::size_t i = 0; i < n; ++i) r.offsets_[i + 1] += r.offsets_[i];

    r.preds_.resize(r.offsets_[n]);
    std::vector<std::uint64_t> cursor(r.offsets_.begin(), r.offsets_.end() - 1);
    // Ascending p keeps every bucket sorted without a second pass.
    for (std::size_t p = 0; p < n; ++p) {
        const node_id s = succ[p];
        if (s == core::no_node) continue;
        r.preds_[cursor[s]++] = static_cast<node_id>(p);
    }
    return r;
}

ReverseIndex ReverseIndex::build_parallel(const EdgeStore& store, std::size_t grain) {
    const auto& succ = store.successors();
    const std::size_t n = store.node_count();
    if (grain == 0) grain = 1;

    // Partial reverse maps per key range, merged by concatenation.
    EdgePairs pairs = tbb::parallel_reduce(
        tbb::blocked_range<std::size_t>(0, n, grain),
        EdgePairs{},
        [&](const tbb::blocked_range<std::size_t>& range, EdgePairs acc) {
            for (std::size_t p = range.begin(); p != range.end(); ++p) {
                if (succ[p] != core::no_node) acc.emplace_back(succ[p], static_cast<node_id>(p));
            }
            return acc;
        },
        [](EdgePairs lhs, EdgePairs rhs) {
            if (lhs.size() < rhs.size()) std::swap(lhs, rhs);
            lhs.insert(lhs.end(), rhs.begin(), rhs.end());
            return lhs;
        });

    FIRSTLINK_ASSERT_H(pairs.size() <= store.size(), "ReverseIndex::build_parallel: more edges than entries");

    ReverseIndex r;
    r.offsets_.assign(n + 1, 0);
    for (const auto& e : pairs) ++r.offsets_[e.first + 1];
    for (std::size_t i = 0; i < n; ++i) r.offsets_[i + 1] += r.offsets_[i];

    r.preds_.resize(pairs.size());
    std::vector<std::uint64_t> cursor(r.offsets_.begin(), r.offsets_.end() - 1);
    for (const auto& e : pairs) r.preds_[cursor[e.first]++] = e.second;

    // The merge above may interleave partitions; restore id order per set.
    tbb::parallel_for(tbb::blocked_range<std::size_t>(0, n, grain),
        [&](const tbb::blocked_range<std::size_t>& range) {
            for (std::size_t s = range.begin(); s != range.end(); ++s) {
                std::sort(r.preds_.begin() + static_cast<std::ptrdiff_t>(r.offsets_[s]),
                          r.preds_.begin() + static_cast<std::ptrdiff_t>(r.offsets_[s + 1]));
            }
        });
    return r;
}

} // namespace graphs
