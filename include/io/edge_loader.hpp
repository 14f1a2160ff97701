// edge_loader.hpp — JSON first-link maps into an EdgeStore (nlohmann/json)
#pragma once

#include <cstddef>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

#include "graphs/edge_store.hpp"

namespace io {

// Malformed or unreadable input. The message names the offending file.
class LoadError : public std::runtime_error {
public:
    LoadError(const std::filesystem::path& file, const std::string& what)
    : std::runtime_error(file.string() + ": " + what), file_(file) {}

    [[nodiscard]] const std::filesystem::path& file() const noexcept { return file_; }

private:
    std::filesystem::path file_;
};

// Merges one JSON object { "title": "successor", ... } into the builder.
// An empty string or null successor marks the title as unresolved.
// Returns the number of keys read.
std::size_t merge_file(graphs::EdgeStoreBuilder& builder, const std::filesystem::path& file);

// The *.json shards of a directory in filename order.
[[nodiscard]] std::vector<std::filesystem::path> list_shards(const std::filesystem::path& dir);

// Loads a single file, or every shard of a directory in filename order.
// Throws LoadError on any malformed input; nothing is returned in that case.
[[nodiscard]] graphs::EdgeStore load_edges(const std::filesystem::path& path);

} // namespace io
