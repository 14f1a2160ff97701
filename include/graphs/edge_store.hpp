// edge_store.hpp — immutable first-link mapping: title -> {Resolved(successor) | Unresolved}
#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "core/config.hpp"
#include "util/bitset_vector.hpp"

namespace graphs {

using core::node_id;

// Outgoing link of one store entry. Unresolved means the upstream parser found
// no usable first link; it is not the same thing as a self-loop.
struct Link {
    enum class Kind : std::uint8_t { resolved, unresolved };

    Kind    kind{Kind::unresolved};
    node_id target{core::no_node};

    static constexpr Link to(node_id n) noexcept { return Link{Kind::resolved, n}; }
    static constexpr Link none() noexcept { return Link{}; }

    [[nodiscard]] constexpr bool is_resolved() const noexcept { return kind == Kind::resolved; }
    friend constexpr bool operator==(const Link&, const Link&) = default;
};

class EdgeStoreBuilder;

// Every distinct title seen either as a key or as a successor gets a dense id.
// Only keys are *entries*; a title that appears solely as somebody's successor
// is interned (so it can be named and reached) but has no known successor.
//
// Not copyable: the lookup table holds views into the owned title storage.
class EdgeStore {
public:
    EdgeStore() = default;
    EdgeStore(EdgeStore&&) = default;
    EdgeStore& operator=(EdgeStore&&) = default;
    EdgeStore(const EdgeStore&) = delete;
    EdgeStore& operator=(const EdgeStore&) = delete;

    // Number of entries (keys of the mapping).
    [[nodiscard]] std::size_t size() const noexcept { return entries_; }
    // Number of interned titles (entries + successor-only titles).
    [[nodiscard]] std::size_t node_count() const noexcept { return names_.size(); }
    [[nodiscard]] bool empty() const noexcept { return entries_ == 0; }

    [[nodiscard]] std::optional<node_id> find(std::string_view title) const;
    [[nodiscard]] const std::string& name(node_id n) const;

    [[nodiscard]] bool contains(node_id n) const noexcept {
        return n < names_.size() && is_entry_.get(n);
    }
    [[nodiscard]] bool contains(std::string_view title) const {
        auto id = find(title);
        return id && contains(*id);
    }

    // nullopt when n is not an entry of the store.
    [[nodiscard]] std::optional<Link> link(node_id n) const noexcept {
        if (!contains(n)) return std::nullopt;
        const node_id s = succ_[n];
        return s == core::no_node ? Link::none() : Link::to(s);
    }

    // Successor if n is an entry with a resolved link.
    [[nodiscard]] std::optional<node_id> successor(node_id n) const noexcept {
        if (n >= succ_.size() || succ_[n] == core::no_node) return std::nullopt;
        return succ_[n];
    }

    // Calls f(node, Link) for every entry, in id order.
    template <class F>
    void for_each_entry(F&& f) const {
        const std::size_t n = names_.size();
        for (std::size_t i = 0; i < n; ++i) {
            if (!is_entry_.get(i)) continue;
            const node_id id = static_cast<node_id>(i);
            f(id, succ_[i] == core::no_node ? Link::none() : Link::to(succ_[i]));
        }
    }

    // Raw successor array indexed by id; no_node for unresolved and non-entries.
    [[nodiscard]] const std::vector<node_id>& successors() const noexcept { return succ_; }

private:
    friend class EdgeStoreBuilder;

    std::deque<std::string>                       names_;
    std::unordered_map<std::string_view, node_id> ids_;
    std::vector<node_id>                          succ_;
    BitsetVector                                  is_entry_;
    std::size_t                                   entries_{0};
};

// Accumulates (title, link) pairs, possibly from several shards, and freezes
// them into an EdgeStore. An empty successor title means Unresolved.
class EdgeStoreBuilder {
public:
    EdgeStoreBuilder() = default;

    void reserve(std::size_t n);

    // Throws std::invalid_argument if title already maps to a different link.
    // Identical duplicates are accepted and ignored.
    void add(std::string_view title, std::string_view successor);
    void add_unresolved(std::string_view title) { add(title, std::string_view{}); }

    [[nodiscard]] std::size_t size() const noexcept { return store_.entries_; }

    [[nodiscard]] EdgeStore build() &&;

private:
    EdgeStore store_;

    node_id intern_(std::string_view title);
};

} // namespace graphs
