#include <gtest/gtest.h>
#include <codegraph/config/config_helpers.h>
#include <codegraph/config/pipeline_config.h>

#include "temp_dir_scope.hpp"

#include <algorithm>
#include <cstdlib>
#include <optional>

using namespace codegraph;
using namespace codegraph::config;
using codegraph::test_support::TempDirScope;

namespace {

// Sets an environment variable for the lifetime of the guard
class ScopedEnv {
public:
    ScopedEnv(const char* name, const char* value) : name_(name) {
        if (const char* old = std::getenv(name))
            previous_ = old;
        ::setenv(name, value, 1);
    }
    ~ScopedEnv() {
        if (previous_)
            ::setenv(name_, previous_->c_str(), 1);
        else
            ::unsetenv(name_);
    }

private:
    const char* name_;
    std::optional<std::string> previous_;
};

} // namespace

TEST(ConfigHelpersTest, UnquoteStripsMatchingQuotes) {
    EXPECT_EQ(unquote("  \"value\" "), "value");
    EXPECT_EQ(unquote("'single'"), "single");
    EXPECT_EQ(unquote("\"mismatched'"), "\"mismatched'");
}

TEST(ConfigHelpersTest, ParsePositiveRejectsGarbageAndZero) {
    EXPECT_EQ(parse_positive("16"), std::optional<std::size_t>(16));
    EXPECT_EQ(parse_positive(" 8 "), std::optional<std::size_t>(8));
    EXPECT_FALSE(parse_positive("0").has_value());
    EXPECT_FALSE(parse_positive("-3").has_value());
    EXPECT_FALSE(parse_positive("12abc").has_value());
    EXPECT_FALSE(parse_positive("").has_value());
}

TEST(ConfigHelpersTest, ParseStringListAcceptsCommaAndArrayForms) {
    EXPECT_EQ(parse_string_list("a, b,c"), (std::vector<std::string>{"a", "b", "c"}));
    EXPECT_EQ(parse_string_list("[\"build\", 'target']"),
              (std::vector<std::string>{"build", "target"}));
    EXPECT_TRUE(parse_string_list("").empty());
}

TEST(ConfigHelpersTest, ParseConfigValueReadsSectionKey) {
    auto dir = TempDirScope::unique_under("codegraph_config");
    auto path = dir.write("config.toml", "# comment\n"
                                         "[graph]\n"
                                         "database_path = \"/tmp/graph.db\" # trailing\n"
                                         "[pipeline]\n"
                                         "workers = 4\n");
    EXPECT_EQ(parse_config_value(path, "graph", "database_path"), "/tmp/graph.db");
    EXPECT_EQ(parse_config_value(path, "pipeline", "workers"), "4");
    EXPECT_EQ(parse_config_value(path, "pipeline", "missing"), "");
    EXPECT_EQ(parse_config_value(path, "graph", "workers"), "");
}

TEST(PipelineConfigTest, DefaultsWithoutConfigFile) {
    auto cfg = resolvePipelineConfig({});
    EXPECT_EQ(cfg.batchSize, DEFAULT_BATCH_SIZE);
    EXPECT_EQ(cfg.batchSizeWithEmbeddings, DEFAULT_BATCH_SIZE_WITH_EMBEDDINGS);
    EXPECT_TRUE(cfg.enableWal);
    EXPECT_NE(std::find(cfg.excludedDirectories.begin(), cfg.excludedDirectories.end(), ".git"),
              cfg.excludedDirectories.end());
    EXPECT_GE(cfg.effectiveWorkers(), 1u);
    EXPECT_LE(cfg.effectiveWorkers(), MAX_WORKERS);
}

TEST(PipelineConfigTest, FileValuesAreOverriddenByEnvironment) {
    auto dir = TempDirScope::unique_under("codegraph_config");
    auto path = dir.write("config.toml", "[pipeline]\n"
                                         "batch_size = 500\n"
                                         "batch_size_embeddings = 50\n"
                                         "internal_prefix = \"com.acme\"\n"
                                         "exclude_dirs = [\"gen\", \"vendor\"]\n"
                                         "[embeddings]\n"
                                         "type = \"minilm\"\n");

    ScopedEnv env("CODEGRAPH_BATCH_SIZE", "123");
    auto cfg = resolvePipelineConfig(path);
    EXPECT_EQ(cfg.batchSize, 123u);
    EXPECT_EQ(cfg.batchSizeWithEmbeddings, 50u);
    EXPECT_EQ(cfg.internalImportPrefix, "com.acme");
    EXPECT_EQ(cfg.excludedDirectories, (std::vector<std::string>{"gen", "vendor"}));
    EXPECT_EQ(cfg.embeddingType, "minilm");
}

TEST(PipelineConfigTest, InvalidNumericValueKeepsDefault) {
    ScopedEnv env("CODEGRAPH_BATCH_SIZE", "lots");
    auto cfg = resolvePipelineConfig({});
    EXPECT_EQ(cfg.batchSize, DEFAULT_BATCH_SIZE);
}

TEST(PipelineConfigTest, WorkerCountIsCapped) {
    PipelineConfig cfg;
    cfg.workers = 1000;
    EXPECT_EQ(cfg.effectiveWorkers(), MAX_WORKERS);
    cfg.workers = 3;
    EXPECT_EQ(cfg.effectiveWorkers(), 3u);
}
