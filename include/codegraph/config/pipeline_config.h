#pragma once

#include <codegraph/core/types.h>

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace codegraph::config {

/**
 * @brief Settings for one extraction + write run.
 *
 * Values are resolved as: explicit overrides > CODEGRAPH_* environment >
 * config.toml > defaults (see resolvePipelineConfig).
 */
struct PipelineConfig {
    std::filesystem::path sourceRoot;
    std::filesystem::path databasePath{"codegraph.db"};

    // Imports starting with this prefix are tagged "internal" (empty disables)
    std::string internalImportPrefix;

    std::size_t workers{0}; // 0 = hardware concurrency, capped at MAX_WORKERS
    std::size_t channelCapacity{DEFAULT_CHANNEL_CAPACITY};
    std::size_t batchSize{DEFAULT_BATCH_SIZE};
    std::size_t batchSizeWithEmbeddings{DEFAULT_BATCH_SIZE_WITH_EMBEDDINGS};

    std::vector<std::string> excludedDirectories{".git",  ".idea", "build",
                                                 "target", "out",  "node_modules"};

    std::string embeddingType;
    std::optional<std::filesystem::path> fileEmbeddingsPath;
    std::optional<std::filesystem::path> methodEmbeddingsPath;
    std::optional<std::filesystem::path> errorReportPath;

    bool enableWal{true};

    std::size_t effectiveWorkers() const;
};

/**
 * @brief Build a PipelineConfig from defaults, the config file and the environment.
 *
 * Environment variables: CODEGRAPH_DB, CODEGRAPH_INTERNAL_PREFIX, CODEGRAPH_WORKERS,
 * CODEGRAPH_CHANNEL_CAPACITY, CODEGRAPH_BATCH_SIZE, CODEGRAPH_BATCH_SIZE_EMBEDDINGS,
 * CODEGRAPH_EXCLUDE_DIRS, CODEGRAPH_EMBEDDING_TYPE.
 */
PipelineConfig resolvePipelineConfig(const std::filesystem::path& configPath);

} // namespace codegraph::config
