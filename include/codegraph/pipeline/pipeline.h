#pragma once

#include <codegraph/config/pipeline_config.h>
#include <codegraph/core/types.h>
#include <codegraph/extraction/extraction_pipeline.h>
#include <codegraph/graph/graph_store.h>
#include <codegraph/graph/graph_writer.h>
#include <codegraph/manifest/dependency_extractor.h>

#include <memory>
#include <vector>

namespace codegraph::pipeline {

struct RunReport {
    std::size_t filesDiscovered = 0;
    std::size_t filesParsed = 0;
    std::size_t parseFailures = 0;
    std::size_t manifestsScanned = 0;
    std::size_t dependencyKeys = 0;
    std::size_t batchesWritten = 0;
    std::size_t nodes = 0;         // nodes in the store after the write
    std::size_t relationships = 0; // relationships in the store after the write
};

/**
 * @brief Runs the stages of a build: walk, concurrent extraction, manifest
 * scan, embedding load and the guarded graph write.
 *
 * Each stage is exposed on its own so the CLI can persist intermediate
 * artifacts and replay a write without re-parsing.
 */
class Pipeline {
public:
    explicit Pipeline(config::PipelineConfig config);

    // Walk the source root and parse every file. Persists the error report when
    // one is configured.
    Result<extraction::ExtractionResult> extract() const;

    Result<manifest::ManifestScan> scanDependencies() const;

    Result<std::unique_ptr<graph::GraphStore>> openStore() const;

    // Load configured embeddings and write the records through the schema guard
    Result<graph::WriteReport> write(graph::GraphStore& store,
                                     const std::vector<extraction::FileRecord>& records,
                                     const manifest::DependencyMap& dependencies) const;

    Result<RunReport> run() const;

    const config::PipelineConfig& config() const noexcept { return config_; }

private:
    config::PipelineConfig config_;
};

} // namespace codegraph::pipeline
