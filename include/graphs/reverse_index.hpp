// reverse_index.hpp — node -> predecessors, built once from an EdgeStore
#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

#include "core/config.hpp"
#include "graphs/edge_store.hpp"

namespace graphs {

// Compressed (CSR) predecessor sets: preds_[offsets_[n] .. offsets_[n+1]) are
// exactly the entries p with link(p) == Resolved(n), sorted by id.
//
// Built in a single pass over the store and never mutated afterwards; rebuild
// wholesale if the store changes.
class ReverseIndex {
public:
    ReverseIndex() = default;

    // Counting-sort build on the calling thread.
    [[nodiscard]] static ReverseIndex build(const EdgeStore& store);

    // Partitions the key range across TBB workers, merges the partial edge
    // lists and sorts each predecessor set. Same result as build().
    [[nodiscard]] static ReverseIndex build_parallel(const EdgeStore& store, std::size_t grain = 1u << 16);

    [[nodiscard]] std::span<const node_id> predecessors(node_id n) const noexcept {
        if (static_cast<std::size_t>(n) + 1 >= offsets_.size()) return {};
        return {preds_.data() + offsets_[n], preds_.data() + offsets_[n + 1]};
    }

    [[nodiscard]] std::size_t in_degree(node_id n) const noexcept { return predecessors(n).size(); }
    [[nodiscard]] bool has_predecessors(node_id n) const noexcept { return in_degree(n) != 0; }

    [[nodiscard]] std::size_t node_count() const noexcept { return offsets_.empty() ? 0 : offsets_.size() - 1; }
    [[nodiscard]] std::size_t edge_count() const noexcept { return preds_.size(); }

    friend bool operator==(const ReverseIndex&, const ReverseIndex&) = default;

private:
    std::vector<std::uint64_t> offsets_;
    std::vector<node_id>       preds_;
};

} // namespace graphs
