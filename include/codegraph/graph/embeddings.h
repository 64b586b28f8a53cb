#pragma once

#include <codegraph/core/types.h>

#include <nlohmann/json.hpp>
#include <filesystem>
#include <optional>
#include <vector>

namespace codegraph::graph {

/**
 * @brief Externally produced vectors, index-aligned with files or methods.
 */
struct EmbeddingSet {
    std::vector<std::vector<float>> vectors;

    bool empty() const noexcept { return vectors.empty(); }
    std::size_t size() const noexcept { return vectors.size(); }
    std::size_t width() const noexcept { return vectors.empty() ? 0 : vectors.front().size(); }
};

/**
 * @brief Parse a JSON array of number arrays. Every vector must have the same,
 * non-zero width; otherwise ErrorCode::InvalidData.
 */
Result<EmbeddingSet> parseEmbeddings(const nlohmann::json& doc);

/**
 * @brief Load embeddings from a file. An unset path or a missing file yields an
 * empty set.
 */
Result<EmbeddingSet> loadEmbeddings(const std::optional<std::filesystem::path>& path);

} // namespace codegraph::graph
