#include <codegraph/graph/embeddings.h>

#include <spdlog/spdlog.h>
#include <fstream>

namespace codegraph::graph {

Result<EmbeddingSet> parseEmbeddings(const nlohmann::json& doc) {
    if (!doc.is_array()) {
        return Error{ErrorCode::InvalidData, "Embeddings must be a JSON array of arrays"};
    }
    EmbeddingSet set;
    set.vectors.reserve(doc.size());
    for (std::size_t i = 0; i < doc.size(); ++i) {
        const auto& row = doc[i];
        if (!row.is_array() || row.empty()) {
            return Error{ErrorCode::InvalidData,
                         fmt::format("Embedding {} is not a non-empty array", i)};
        }
        std::vector<float> v;
        v.reserve(row.size());
        for (const auto& x : row) {
            if (!x.is_number()) {
                return Error{ErrorCode::InvalidData,
                             fmt::format("Embedding {} contains a non-numeric value", i)};
            }
            v.push_back(x.get<float>());
        }
        if (!set.vectors.empty() && v.size() != set.width()) {
            return Error{ErrorCode::InvalidData,
                         fmt::format("Embedding {} has width {}, expected {}", i, v.size(),
                                     set.width())};
        }
        set.vectors.push_back(std::move(v));
    }
    return set;
}

Result<EmbeddingSet> loadEmbeddings(const std::optional<std::filesystem::path>& path) {
    if (!path) {
        return EmbeddingSet{};
    }
    std::error_code ec;
    if (!std::filesystem::exists(*path, ec)) {
        spdlog::info("No embeddings at {}; building structural graph only", path->string());
        return EmbeddingSet{};
    }
    std::ifstream ifs(*path);
    if (!ifs) {
        return Error{ErrorCode::IOError, "Cannot open embeddings: " + path->string()};
    }
    nlohmann::json doc;
    try {
        ifs >> doc;
    } catch (const nlohmann::json::exception& e) {
        return Error{ErrorCode::InvalidData,
                     fmt::format("Malformed embeddings {}: {}", path->string(), e.what())};
    }
    auto set = parseEmbeddings(doc);
    if (set) {
        spdlog::debug("Loaded {} embeddings (width {}) from {}", set.value().size(),
                      set.value().width(), path->string());
    }
    return set;
}

} // namespace codegraph::graph
