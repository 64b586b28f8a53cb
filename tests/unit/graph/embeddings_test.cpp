#include <gtest/gtest.h>
#include <codegraph/graph/embeddings.h>

#include "temp_dir_scope.hpp"

using namespace codegraph;
using namespace codegraph::graph;
using codegraph::test_support::TempDirScope;
using nlohmann::json;

TEST(EmbeddingsTest, ParsesUniformVectors) {
    auto set = parseEmbeddings(json::parse("[[0.5, 1, -2], [0, 0, 0.25]]"));
    ASSERT_TRUE(set) << set.error().message;
    EXPECT_EQ(set.value().size(), 2u);
    EXPECT_EQ(set.value().width(), 3u);
    EXPECT_FLOAT_EQ(set.value().vectors[0][2], -2.0f);
}

TEST(EmbeddingsTest, RejectsRaggedOrNonNumeric) {
    for (const char* doc : {"[[1, 2], [3]]", "[[1, \"x\"]]", "[[]]", "{\"a\": [1]}"}) {
        auto set = parseEmbeddings(json::parse(doc));
        ASSERT_FALSE(set) << doc;
        EXPECT_EQ(set.error().code, ErrorCode::InvalidData) << doc;
    }
}

TEST(EmbeddingsTest, AbsentSourceMeansNoEmbeddings) {
    auto unset = loadEmbeddings(std::nullopt);
    ASSERT_TRUE(unset);
    EXPECT_TRUE(unset.value().empty());

    auto dir = TempDirScope::unique_under("codegraph_embeddings");
    auto missing = loadEmbeddings(dir.path() / "files.json");
    ASSERT_TRUE(missing);
    EXPECT_TRUE(missing.value().empty());
}

TEST(EmbeddingsTest, LoadsFromFile) {
    auto dir = TempDirScope::unique_under("codegraph_embeddings");
    auto path = dir.write("methods.json", "[[1.0, 2.0]]");
    auto set = loadEmbeddings(path);
    ASSERT_TRUE(set) << set.error().message;
    EXPECT_EQ(set.value().width(), 2u);

    auto bad = loadEmbeddings(dir.write("bad.json", "[[1.0,"));
    ASSERT_FALSE(bad);
    EXPECT_EQ(bad.error().code, ErrorCode::InvalidData);
}
