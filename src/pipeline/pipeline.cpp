#include <codegraph/graph/embeddings.h>
#include <codegraph/pipeline/pipeline.h>
#include <codegraph/scan/source_walker.h>

#include <spdlog/spdlog.h>
#include <chrono>

namespace codegraph::pipeline {

Pipeline::Pipeline(config::PipelineConfig config) : config_(std::move(config)) {}

Result<extraction::ExtractionResult> Pipeline::extract() const {
    scan::WalkOptions walk;
    walk.excludedDirectories = config_.excludedDirectories;
    auto files = scan::walkSourceTree(config_.sourceRoot, walk);
    if (!files) {
        spdlog::error("Cannot walk {}: {}", config_.sourceRoot.string(), files.error().message);
        return files.error();
    }
    spdlog::info("Discovered {} source files under {}", files.value().size(),
                 config_.sourceRoot.string());

    extraction::ExtractionOptions options;
    options.workers = config_.effectiveWorkers();
    options.channelCapacity = config_.channelCapacity;
    options.extractor.internalImportPrefix = config_.internalImportPrefix;

    auto start = std::chrono::steady_clock::now();
    auto result = extraction::extractFiles(files.value(), options);
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
    spdlog::info("Parsed {} files ({} failures) with {} workers in {} ms",
                 result.records.size(), result.errors.size(), options.workers, elapsed.count());

    if (config_.errorReportPath) {
        if (auto saved = result.errors.save(*config_.errorReportPath); !saved) {
            return saved.error();
        }
        spdlog::debug("Wrote error report to {}", config_.errorReportPath->string());
    }
    return result;
}

Result<manifest::ManifestScan> Pipeline::scanDependencies() const {
    return manifest::scanManifests(config_.sourceRoot, config_.excludedDirectories);
}

Result<std::unique_ptr<graph::GraphStore>> Pipeline::openStore() const {
    graph::GraphStoreConfig cfg;
    cfg.enable_wal = config_.enableWal;
    return graph::makeSqliteGraphStore(config_.databasePath.string(), cfg);
}

Result<graph::WriteReport> Pipeline::write(graph::GraphStore& store,
                                           const std::vector<extraction::FileRecord>& records,
                                           const manifest::DependencyMap& dependencies) const {
    auto fileEmbeddings = graph::loadEmbeddings(config_.fileEmbeddingsPath);
    if (!fileEmbeddings)
        return fileEmbeddings.error();
    auto methodEmbeddings = graph::loadEmbeddings(config_.methodEmbeddingsPath);
    if (!methodEmbeddings)
        return methodEmbeddings.error();

    graph::WriterOptions options;
    options.batchSize = config_.batchSize;
    options.batchSizeWithEmbeddings = config_.batchSizeWithEmbeddings;
    options.embeddingType = config_.embeddingType;

    graph::GraphWriter writer(store, options);
    return writer.write(records, dependencies, fileEmbeddings.value(), methodEmbeddings.value());
}

Result<RunReport> Pipeline::run() const {
    RunReport report;

    auto extracted = extract();
    if (!extracted)
        return extracted.error();
    const auto& records = extracted.value().records;
    report.filesParsed = records.size();
    report.parseFailures = extracted.value().errors.size();
    report.filesDiscovered = report.filesParsed + report.parseFailures;

    auto deps = scanDependencies();
    if (!deps)
        return deps.error();
    report.manifestsScanned = deps.value().manifestsScanned();
    report.dependencyKeys = deps.value().map.size();

    auto store = openStore();
    if (!store)
        return store.error();

    auto written = write(*store.value(), records, deps.value().map);
    if (!written)
        return written.error();
    report.batchesWritten = written.value().batchesWritten;

    auto nodes = store.value()->countNodes();
    if (!nodes)
        return nodes.error();
    auto edges = store.value()->countEdges();
    if (!edges)
        return edges.error();
    report.nodes = nodes.value();
    report.relationships = edges.value();

    spdlog::info("Run complete: {} files parsed, {} parse failures, {} batches, {} nodes, "
                 "{} relationships",
                 report.filesParsed, report.parseFailures, report.batchesWritten, report.nodes,
                 report.relationships);
    return report;
}

} // namespace codegraph::pipeline
