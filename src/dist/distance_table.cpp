// distance_table.cpp

#include "dist/distance_table.hpp"

#include <algorithm>
#include <stdexcept>

namespace dist {

bool DistanceTable::assign(node_id n, distance_t d) {
    if (n >= dist_.size()) throw std::out_of_range("DistanceTable::assign: node id out of range");
    if (d == core::no_distance) throw std::invalid_argument("DistanceTable::assign: reserved distance value");
    if (dist_[n] != core::no_distance) return false;
    dist_[n] = d;
    ++assigned_;
    max_ = std::max(max_, d);
    return true;
}

DistanceBuckets DistanceBuckets::build(const DistanceTable& table) {
    DistanceBuckets b;
    if (table.size() == 0) return b;

    const std::size_t nb = static_cast<std::size_t>(table.max_distance()) + 1;
    b.offsets_.assign(nb + 1, 0);
    table.for_each([&](node_id, distance_t d) { ++b.offsets_[d + 1]; });
    for (std::size_t i = 0; i < nb; ++i) b.offsets_[i + 1] += b.offsets_[i];

    b.nodes_.resize(table.size());
    std::vector<std::size_t> cursor(b.offsets_.begin(), b.offsets_.end() - 1);
    table.for_each([&](node_id n, distance_t d) { b.nodes_[cursor[d]++] = n; });
    return b;
}

std::vector<std::size_t> DistanceBuckets::histogram() const {
    std::vector<std::size_t> h(bucket_count(), 0);
    for (std::size_t d = 0; d < h.size(); ++d) h[d] = offsets_[d + 1] - offsets_[d];
    return h;
}

} // namespace dist
