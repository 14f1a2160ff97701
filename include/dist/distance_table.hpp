// distance_table.hpp — persistent node -> distance-to-target table and its inverted index
#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

#include "core/config.hpp"

namespace dist {

using core::node_id;
using core::distance_t;

// Append-only: a node's distance, once assigned, never changes, so readers
// never observe a moving value. Absence after a complete pass means the node's
// forward walk never reaches the target.
class DistanceTable {
public:
    DistanceTable() = default;
    DistanceTable(std::size_t node_count, node_id target)
        : dist_(node_count, core::no_distance), target_(target) {}

    [[nodiscard]] std::optional<distance_t> distance(node_id n) const noexcept {
        if (n >= dist_.size() || dist_[n] == core::no_distance) return std::nullopt;
        return dist_[n];
    }
    [[nodiscard]] bool contains(node_id n) const noexcept { return distance(n).has_value(); }

    // Returns false (and leaves the entry alone) if n already has a distance.
    bool assign(node_id n, distance_t d);

    [[nodiscard]] node_id     target()     const noexcept { return target_; }
    [[nodiscard]] std::size_t size()       const noexcept { return assigned_; }
    [[nodiscard]] std::size_t node_count() const noexcept { return dist_.size(); }
    [[nodiscard]] bool        complete()   const noexcept { return complete_; }
    void mark_complete() noexcept { complete_ = true; }

    [[nodiscard]] distance_t max_distance() const noexcept { return max_; }

    template <class F>
    void for_each(F&& f) const {
        for (std::size_t i = 0; i < dist_.size(); ++i) {
            if (dist_[i] != core::no_distance) f(static_cast<node_id>(i), dist_[i]);
        }
    }

private:
    std::vector<distance_t> dist_;
    node_id     target_{core::no_node};
    std::size_t assigned_{0};
    distance_t  max_{0};
    bool        complete_{false};
};

// Inverted index distance -> nodes, for repeated sampling and histograms.
class DistanceBuckets {
public:
    DistanceBuckets() = default;

    [[nodiscard]] static DistanceBuckets build(const DistanceTable& table);

    [[nodiscard]] std::span<const node_id> at(distance_t d) const noexcept {
        if (static_cast<std::size_t>(d) + 1 >= offsets_.size()) return {};
        return {nodes_.data() + offsets_[d], nodes_.data() + offsets_[d + 1]};
    }

    // Number of distance values covered (max distance + 1), 0 if empty.
    [[nodiscard]] std::size_t bucket_count() const noexcept { return offsets_.empty() ? 0 : offsets_.size() - 1; }
    [[nodiscard]] std::size_t node_count()   const noexcept { return nodes_.size(); }

    // count per distance, index = distance
    [[nodiscard]] std::vector<std::size_t> histogram() const;

private:
    std::vector<std::size_t> offsets_;
    std::vector<node_id>     nodes_;
};

} // namespace dist
