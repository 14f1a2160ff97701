// graph_context.hpp — caller-owned bundle of the immutable graph structures
#pragma once

#include <cstddef>
#include <optional>
#include <string_view>
#include <utility>

#include "graphs/edge_store.hpp"
#include "graphs/reverse_index.hpp"

namespace graphs {

struct ContextOptions {
    bool        parallel_build{false}; // TBB reverse build
    std::size_t grain{1u << 16};
};

// Owns the Edge Store and the Reverse Index derived from it. Construct once per
// session and pass it explicitly; independent contexts (e.g. test fixtures)
// may coexist. Both members are read-only after construction.
class GraphContext {
public:
    explicit GraphContext(EdgeStore store, const ContextOptions& opt = {})
        : store_(std::move(store)),
          reverse_(opt.parallel_build ? ReverseIndex::build_parallel(store_, opt.grain)
                                      : ReverseIndex::build(store_)) {}

    GraphContext(const GraphContext&) = delete;
    GraphContext& operator=(const GraphContext&) = delete;

    [[nodiscard]] const EdgeStore&    edges()   const noexcept { return store_; }
    [[nodiscard]] const ReverseIndex& reverse() const noexcept { return reverse_; }

    [[nodiscard]] std::optional<node_id> find(std::string_view title) const { return store_.find(title); }
    [[nodiscard]] const std::string& name(node_id n) const { return store_.name(n); }

private:
    EdgeStore    store_;
    ReverseIndex reverse_;
};

} // namespace graphs
