// edge_loader.cpp

#include "io/edge_loader.hpp"

#include <algorithm>
#include <fstream>
#include <string>
#include <string_view>
#include <utility>
#include <system_error>

#include <nlohmann/json.hpp>

#include "io/log.hpp"

namespace io {

namespace fs = std::filesystem;

namespace {

using json = nlohmann::json;

// Streams a flat { "title": "successor" | null } object into the builder
// without materializing the document. Any other shape stops the parse and
// leaves the reason in error.
class EdgeMapSax final : public nlohmann::json_sax<json> {
public:
    explicit EdgeMapSax(graphs::EdgeStoreBuilder& b) : b_(b) {}

    std::string error;
    std::size_t keys{0};

    bool null() override { return link({}); }
    bool string(string_t& v) override { return link(v); }

    bool boolean(bool) override { return reject("non-string value"); }
    bool number_integer(number_integer_t) override { return reject("non-string value"); }
    bool number_unsigned(number_unsigned_t) override { return reject("non-string value"); }
    bool number_float(number_float_t, const string_t&) override { return reject("non-string value"); }
    bool binary(binary_t&) override { return reject("non-string value"); }

    bool start_object(std::size_t) override {
        if (depth_ != 0) return reject("non-string value");
        ++depth_;
        return true;
    }
    bool end_object() override {
        --depth_;
        return true;
    }
    bool start_array(std::size_t) override { return reject("non-string value"); }
    bool end_array() override { return true; }

    bool key(string_t& k) override {
        key_ = k;
        return true;
    }

    bool parse_error(std::size_t, const std::string&, const nlohmann::detail::exception& e) override {
        error = std::string("invalid JSON: ") + e.what();
        return false;
    }

private:
    bool link(std::string_view succ) {
        if (depth_ != 1) return reject("top level must be a JSON object");
        try {
            b_.add(key_, succ); // empty successor = unresolved
        } catch (const std::invalid_argument& e) {
            error = e.what();
            return false;
        } catch (const std::length_error& e) {
            error = e.what();
            return false;
        }
        ++keys;
        return true;
    }

    bool reject(const char* why) {
        error = depth_ == 0 ? "top level must be a JSON object" : std::string(why) + " for \"" + key_ + "\"";
        return false;
    }

    graphs::EdgeStoreBuilder& b_;
    std::string key_;
    int depth_{0};
};

} // namespace

std::size_t merge_file(graphs::EdgeStoreBuilder& builder, const fs::path& file) {
    std::ifstream in(file, std::ios::binary);
    if (!in) throw LoadError(file, "cannot open file");

    EdgeMapSax sax(builder);
    if (!json::sax_parse(in, &sax)) {
        throw LoadError(file, sax.error.empty() ? std::string("invalid JSON") : sax.error);
    }
    log::debug("loaded ", sax.keys, " entries from ", file.string());
    return sax.keys;
}

std::vector<fs::path> list_shards(const fs::path& dir) {
    std::vector<fs::path> out;
    std::error_code ec;
    for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        if (it->is_regular_file() && it->path().extension() == ".json") out.push_back(it->path());
    }
    if (ec) throw LoadError(dir, "cannot list directory: " + ec.message());
    std::sort(out.begin(), out.end(), [](const fs::path& a, const fs::path& b) {
        return a.filename().string() < b.filename().string();
    });
    return out;
}

graphs::EdgeStore load_edges(const fs::path& path) {
    graphs::EdgeStoreBuilder builder;
    std::error_code ec;
    if (fs::is_directory(path, ec)) {
        const auto shards = list_shards(path);
        if (shards.empty()) throw LoadError(path, "no *.json shards in directory");
        for (const auto& f : shards) merge_file(builder, f);
        log::info("merged ", shards.size(), " shards from ", path.string());
    } else {
        merge_file(builder, path);
    }
    auto store = std::move(builder).build();
    log::info("edge store: ", store.size(), " entries, ", store.node_count(), " titles");
    return store;
}

} // namespace io
