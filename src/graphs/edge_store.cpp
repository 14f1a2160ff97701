// edge_store.cpp — interning and freezing of the first-link mapping

#include "graphs/edge_store.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>
#include <utility>

namespace graphs {

std::optional<node_id> EdgeStore::find(std::string_view title) const {
    auto it = ids_.find(title);
    if (it == ids_.end()) return std::nullopt;
    return it->second;
}

const std::string& EdgeStore::name(node_id n) const {
    if (n >= names_.size()) throw std::out_of_range("EdgeStore::name: node id out of range");
    return names_[n];
}

void EdgeStoreBuilder::reserve(std::size_t n) {
    store_.ids_.reserve(n);
    store_.succ_.reserve(n);
}

node_id EdgeStoreBuilder::intern_(std::string_view title) {
    auto it = store_.ids_.find(title);
    if (it != store_.ids_.end()) return it->second;

    if (store_.names_.size() >= static_cast<std::size_t>(core::no_node)) {
        throw std::length_error("EdgeStoreBuilder: node id space exhausted");
    }
    const node_id id = static_cast<node_id>(store_.names_.size());
    // deque keeps element addresses stable, so the view stays valid
    const std::string& owned = store_.names_.emplace_back(title);
    store_.ids_.emplace(std::string_view(owned), id);
    store_.succ_.push_back(core::no_node);
    return id;
}

void EdgeStoreBuilder::add(std::string_view title, std::string_view successor) {
    if (title.empty()) throw std::invalid_argument("EdgeStoreBuilder: empty title");

    // Existing entry: compare without interning, so a rejected add leaves the store untouched.
    auto it = store_.ids_.find(title);
    if (it != store_.ids_.end() && it->second < store_.is_entry_.size() && store_.is_entry_.get(it->second)) {
        const node_id from = it->second;
        const node_id have = store_.succ_[from];
        node_id want = core::no_node;
        bool same = successor.empty() && have == core::no_node;
        if (!successor.empty()) {
            auto st = store_.ids_.find(successor);
            if (st != store_.ids_.end()) want = st->second;
            same = want != core::no_node && want == have;
        }
        if (same) return;
        const std::string have_s = have == core::no_node ? std::string("<unresolved>") : store_.names_[have];
        const std::string want_s = successor.empty() ? std::string("<unresolved>") : std::string(successor);
        throw std::invalid_argument("conflicting links for '" + std::string(title) + "': '" + have_s +
                                    "' vs '" + want_s + "'");
    }

    const node_id from = intern_(title);
    const node_id to   = successor.empty() ? core::no_node : intern_(successor);

    auto& flags = store_.is_entry_;
    if (flags.size() < store_.names_.size()) {
        flags.resize(std::max(store_.names_.size(), flags.size() * 2));
    }
    flags.set(from);
    store_.succ_[from] = to;
    ++store_.entries_;
}

EdgeStore EdgeStoreBuilder::build() && {
    store_.is_entry_.resize(store_.names_.size());
    return std::move(store_);
}

} // namespace graphs
