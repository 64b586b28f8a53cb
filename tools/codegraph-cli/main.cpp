#include <codegraph/config/config_helpers.h>
#include <codegraph/config/pipeline_config.h>
#include <codegraph/extraction/extraction_artifact.h>
#include <codegraph/pipeline/pipeline.h>

#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <iostream>
#include <optional>
#include <string>

using json = nlohmann::json;
using namespace codegraph;

namespace {

struct CommonOptions {
    std::string configPath;
    std::string sourceRoot;
    std::string databasePath;
    std::string internalPrefix;
    std::size_t workers = 0;
    std::size_t batchSize = 0;
    std::size_t batchSizeWithEmbeddings = 0;
    std::string fileEmbeddings;
    std::string methodEmbeddings;
    std::string embeddingType;
    std::string errorReport;
    bool noWal = false;
};

// Flags > environment > config.toml > defaults
config::PipelineConfig buildConfig(const CommonOptions& o) {
    auto cfg = config::resolvePipelineConfig(config::get_config_path(o.configPath));
    if (!o.sourceRoot.empty())
        cfg.sourceRoot = o.sourceRoot;
    if (!o.databasePath.empty())
        cfg.databasePath = o.databasePath;
    if (!o.internalPrefix.empty())
        cfg.internalImportPrefix = o.internalPrefix;
    if (o.workers > 0)
        cfg.workers = o.workers;
    if (o.batchSize > 0)
        cfg.batchSize = o.batchSize;
    if (o.batchSizeWithEmbeddings > 0)
        cfg.batchSizeWithEmbeddings = o.batchSizeWithEmbeddings;
    if (!o.fileEmbeddings.empty())
        cfg.fileEmbeddingsPath = o.fileEmbeddings;
    if (!o.methodEmbeddings.empty())
        cfg.methodEmbeddingsPath = o.methodEmbeddings;
    if (!o.embeddingType.empty())
        cfg.embeddingType = o.embeddingType;
    if (!o.errorReport.empty())
        cfg.errorReportPath = o.errorReport;
    if (o.noWal)
        cfg.enableWal = false;
    return cfg;
}

int fail(const Error& error) {
    std::cerr << "Error: " << error.message << " (" << errorToString(error.code) << ")"
              << std::endl;
    return 1;
}

void addSourceOptions(CLI::App* cmd, CommonOptions& o) {
    cmd->add_option("source", o.sourceRoot, "Source tree root")->required();
    cmd->add_option("--internal-prefix", o.internalPrefix,
                    "Imports starting with this prefix are internal");
    cmd->add_option("-j,--workers", o.workers, "Parser worker threads (0 = auto)");
}

void addWriteOptions(CLI::App* cmd, CommonOptions& o) {
    cmd->add_option("--batch-size", o.batchSize, "Records per write batch");
    cmd->add_option("--batch-size-embeddings", o.batchSizeWithEmbeddings,
                    "Records per write batch when embeddings are written");
    cmd->add_option("--file-embeddings", o.fileEmbeddings, "JSON array of per-file vectors");
    cmd->add_option("--method-embeddings", o.methodEmbeddings,
                    "JSON array of per-method vectors");
    cmd->add_option("--embedding-type", o.embeddingType, "Model tag stored with embeddings");
    cmd->add_flag("--no-wal", o.noWal, "Disable SQLite WAL mode");
}

int runExtract(const config::PipelineConfig& cfg, const std::string& output) {
    pipeline::Pipeline p(cfg);
    auto extracted = p.extract();
    if (!extracted)
        return fail(extracted.error());
    if (auto saved = extraction::saveArtifact(extracted.value().records, output); !saved)
        return fail(saved.error());
    std::cout << "Parsed " << extracted.value().records.size() << " files ("
              << extracted.value().errors.size() << " failures) -> " << output << std::endl;
    return 0;
}

int runDeps(const config::PipelineConfig& cfg, const std::string& output) {
    pipeline::Pipeline p(cfg);
    auto scan = p.scanDependencies();
    if (!scan)
        return fail(scan.error());
    if (auto saved = scan.value().map.save(output); !saved)
        return fail(saved.error());
    std::cout << "Scanned " << scan.value().manifestsScanned() << " manifests, "
              << scan.value().map.size() << " dependency keys -> " << output << std::endl;
    return 0;
}

int runWrite(const config::PipelineConfig& cfg, const std::string& artifactPath,
             const std::string& depsPath) {
    auto records = extraction::loadArtifact(artifactPath);
    if (!records)
        return fail(records.error());

    manifest::DependencyMap deps;
    if (!depsPath.empty()) {
        auto loaded = manifest::DependencyMap::load(depsPath);
        if (!loaded)
            return fail(loaded.error());
        deps = std::move(loaded).value();
    }

    pipeline::Pipeline p(cfg);
    auto store = p.openStore();
    if (!store)
        return fail(store.error());
    auto report = p.write(*store.value(), records.value(), deps);
    if (!report)
        return fail(report.error());
    std::cout << "Wrote " << report.value().batchesWritten << " batches: "
              << report.value().nodeWrites << " node writes, "
              << report.value().relationshipWrites << " relationship writes, "
              << report.value().unresolvedLinks << " unresolved links" << std::endl;
    return 0;
}

int runAll(const config::PipelineConfig& cfg, bool asJson) {
    pipeline::Pipeline p(cfg);
    auto report = p.run();
    if (!report)
        return fail(report.error());
    const auto& r = report.value();
    if (asJson) {
        json out = {{"files_discovered", r.filesDiscovered},
                    {"files_parsed", r.filesParsed},
                    {"parse_failures", r.parseFailures},
                    {"manifests_scanned", r.manifestsScanned},
                    {"dependency_keys", r.dependencyKeys},
                    {"batches_written", r.batchesWritten},
                    {"nodes", r.nodes},
                    {"relationships", r.relationships}};
        std::cout << out.dump(2) << std::endl;
    } else {
        std::cout << "Files parsed:     " << r.filesParsed << "\n"
                  << "Parse failures:   " << r.parseFailures << "\n"
                  << "Manifests:        " << r.manifestsScanned << "\n"
                  << "Dependency keys:  " << r.dependencyKeys << "\n"
                  << "Batches written:  " << r.batchesWritten << "\n"
                  << "Nodes:            " << r.nodes << "\n"
                  << "Relationships:    " << r.relationships << std::endl;
    }
    return 0;
}

int runStats(const config::PipelineConfig& cfg, bool asJson) {
    pipeline::Pipeline p(cfg);
    auto store = p.openStore();
    if (!store)
        return fail(store.error());
    auto nodes = store.value()->nodeCountsByLabel();
    if (!nodes)
        return fail(nodes.error());
    auto edges = store.value()->edgeCountsByType();
    if (!edges)
        return fail(edges.error());

    if (asJson) {
        std::cout << json{{"nodes", nodes.value()}, {"relationships", edges.value()}}.dump(2)
                  << std::endl;
        return 0;
    }
    std::cout << "Nodes" << std::endl;
    for (const auto& [label, count] : nodes.value())
        std::cout << "  " << label << ": " << count << std::endl;
    std::cout << "Relationships" << std::endl;
    for (const auto& [type, count] : edges.value())
        std::cout << "  " << type << ": " << count << std::endl;
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    CLI::App app{"Build a property graph from a Java source tree", "codegraph"};
    app.set_version_flag("--version", "0.1.0");
    app.require_subcommand(1);

    CommonOptions opts;
    bool verbose = false;
    bool quiet = false;
    bool asJson = false;
    app.add_option("-c,--config", opts.configPath, "Path to config.toml");
    app.add_option("-d,--db", opts.databasePath, "Graph database path");
    app.add_flag("-v,--verbose", verbose, "Enable debug logging");
    app.add_flag("-q,--quiet", quiet, "Only log warnings and errors");

    auto* extractCmd = app.add_subcommand("extract", "Parse sources into an extraction artifact");
    std::string artifactOut = "extraction.json";
    addSourceOptions(extractCmd, opts);
    extractCmd->add_option("-o,--output", artifactOut, "Artifact path")->default_val(artifactOut);
    extractCmd->add_option("--errors", opts.errorReport, "Write parse errors to this file");

    auto* depsCmd = app.add_subcommand("deps", "Extract the dependency map from build manifests");
    std::string depsOut = "dependencies.json";
    depsCmd->add_option("source", opts.sourceRoot, "Source tree root")->required();
    depsCmd->add_option("-o,--output", depsOut, "Dependency map path")->default_val(depsOut);

    auto* writeCmd = app.add_subcommand("write", "Write an extraction artifact into the graph");
    std::string artifactIn;
    std::string depsIn;
    writeCmd->add_option("artifact", artifactIn, "Extraction artifact")
        ->required()
        ->check(CLI::ExistingFile);
    writeCmd->add_option("--deps", depsIn, "Dependency map artifact")->check(CLI::ExistingFile);
    addWriteOptions(writeCmd, opts);

    auto* runCmd = app.add_subcommand("run", "Extract, resolve and write in one pass");
    addSourceOptions(runCmd, opts);
    addWriteOptions(runCmd, opts);
    runCmd->add_option("--errors", opts.errorReport, "Write parse errors to this file");
    runCmd->add_flag("--json", asJson, "Print the run report as JSON");

    auto* statsCmd = app.add_subcommand("stats", "Show node and relationship counts");
    statsCmd->add_flag("--json", asJson, "Print counts as JSON");

    CLI11_PARSE(app, argc, argv);

    spdlog::set_pattern("[%H:%M:%S] [%l] %v");
    spdlog::set_level(verbose ? spdlog::level::debug
                              : (quiet ? spdlog::level::warn : spdlog::level::info));

    auto cfg = buildConfig(opts);
    if (*extractCmd)
        return runExtract(cfg, artifactOut);
    if (*depsCmd)
        return runDeps(cfg, depsOut);
    if (*writeCmd)
        return runWrite(cfg, artifactIn, depsIn);
    if (*runCmd)
        return runAll(cfg, asJson);
    if (*statsCmd)
        return runStats(cfg, asJson);
    return 0;
}
