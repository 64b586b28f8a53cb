#include <codegraph/config/config_helpers.h>
#include <codegraph/config/pipeline_config.h>

#include <spdlog/spdlog.h>
#include <algorithm>
#include <thread>

namespace codegraph::config {

namespace {

void applySize(std::size_t& target, const std::string& raw, const char* what) {
    if (raw.empty())
        return;
    if (auto v = parse_positive(raw)) {
        target = *v;
    } else {
        spdlog::warn("Ignoring invalid value '{}' for {}", raw, what);
    }
}

} // namespace

std::size_t PipelineConfig::effectiveWorkers() const {
    std::size_t n = workers;
    if (n == 0) {
        n = std::max<std::size_t>(1, std::thread::hardware_concurrency());
    }
    return std::clamp<std::size_t>(n, 1, MAX_WORKERS);
}

PipelineConfig resolvePipelineConfig(const std::filesystem::path& configPath) {
    PipelineConfig cfg;

    // 1) config.toml
    if (!configPath.empty() && std::filesystem::exists(configPath)) {
        spdlog::debug("Reading configuration from {}", configPath.string());
        if (auto v = parse_config_value(configPath, "graph", "database_path"); !v.empty())
            cfg.databasePath = expand_tilde(v);
        if (auto v = parse_config_value(configPath, "graph", "enable_wal"); !v.empty())
            cfg.enableWal = (v == "true" || v == "1");
        if (auto v = parse_config_value(configPath, "pipeline", "internal_prefix"); !v.empty())
            cfg.internalImportPrefix = v;
        applySize(cfg.workers, parse_config_value(configPath, "pipeline", "workers"),
                  "pipeline.workers");
        applySize(cfg.channelCapacity,
                  parse_config_value(configPath, "pipeline", "channel_capacity"),
                  "pipeline.channel_capacity");
        applySize(cfg.batchSize, parse_config_value(configPath, "pipeline", "batch_size"),
                  "pipeline.batch_size");
        applySize(cfg.batchSizeWithEmbeddings,
                  parse_config_value(configPath, "pipeline", "batch_size_embeddings"),
                  "pipeline.batch_size_embeddings");
        if (auto v = parse_config_value(configPath, "pipeline", "exclude_dirs"); !v.empty())
            cfg.excludedDirectories = parse_string_list(v);
        if (auto v = parse_config_value(configPath, "embeddings", "type"); !v.empty())
            cfg.embeddingType = v;
        if (auto v = parse_config_value(configPath, "embeddings", "files"); !v.empty())
            cfg.fileEmbeddingsPath = expand_tilde(v);
        if (auto v = parse_config_value(configPath, "embeddings", "methods"); !v.empty())
            cfg.methodEmbeddingsPath = expand_tilde(v);
    }

    // 2) environment overrides the file
    if (auto v = env_value("CODEGRAPH_DB"))
        cfg.databasePath = expand_tilde(*v);
    if (auto v = env_value("CODEGRAPH_INTERNAL_PREFIX"))
        cfg.internalImportPrefix = *v;
    if (auto v = env_value("CODEGRAPH_WORKERS"))
        applySize(cfg.workers, *v, "CODEGRAPH_WORKERS");
    if (auto v = env_value("CODEGRAPH_CHANNEL_CAPACITY"))
        applySize(cfg.channelCapacity, *v, "CODEGRAPH_CHANNEL_CAPACITY");
    if (auto v = env_value("CODEGRAPH_BATCH_SIZE"))
        applySize(cfg.batchSize, *v, "CODEGRAPH_BATCH_SIZE");
    if (auto v = env_value("CODEGRAPH_BATCH_SIZE_EMBEDDINGS"))
        applySize(cfg.batchSizeWithEmbeddings, *v, "CODEGRAPH_BATCH_SIZE_EMBEDDINGS");
    if (auto v = env_value("CODEGRAPH_EXCLUDE_DIRS"))
        cfg.excludedDirectories = parse_string_list(*v);
    if (auto v = env_value("CODEGRAPH_EMBEDDING_TYPE"))
        cfg.embeddingType = *v;

    return cfg;
}

} // namespace codegraph::config
