#include <gtest/gtest.h>
#include <codegraph/extraction/extraction_pipeline.h>

#include <algorithm>
#include <string>
#include <vector>

#include "temp_dir_scope.hpp"

using namespace codegraph;
using namespace codegraph::extraction;
using codegraph::test_support::TempDirScope;

namespace {

std::vector<scan::SourceFile> writeTree(const TempDirScope& dir, int goodFiles) {
    std::vector<scan::SourceFile> files;
    for (int i = 0; i < goodFiles; ++i) {
        auto rel = "pkg/C" + std::to_string(i) + ".java";
        auto abs = dir.write(rel, "package pkg;\nclass C" + std::to_string(i) +
                                      " { void m() { helper(); } void helper() {} }\n");
        files.push_back({abs, rel});
    }
    auto bad = dir.write("pkg/Bad.java", "class Bad { void m() {\n");
    files.push_back({bad, "pkg/Bad.java"});
    files.push_back({dir.path() / "pkg/Missing.java", "pkg/Missing.java"});
    return files;
}

} // namespace

TEST(ExtractionPipelineTest, ParsesConcurrentlyAndCollectsFailures) {
    auto dir = TempDirScope::unique_under("codegraph_extract");
    auto files = writeTree(dir, 25);

    ExtractionOptions options;
    options.workers = 4;
    options.channelCapacity = 2;
    auto result = extractFiles(files, options);

    ASSERT_EQ(result.records.size(), 25u);
    EXPECT_TRUE(std::is_sorted(
        result.records.begin(), result.records.end(),
        [](const FileRecord& a, const FileRecord& b) { return a.path < b.path; }));
    for (const auto& r : result.records) {
        ASSERT_EQ(r.methods.size(), 2u);
        EXPECT_EQ(r.methods[0].calls.size(), 1u);
    }

    ASSERT_EQ(result.errors.size(), 2u);
    std::vector<std::string> failed;
    for (const auto& e : result.errors.errors())
        failed.push_back(e.path);
    std::sort(failed.begin(), failed.end());
    EXPECT_EQ(failed, (std::vector<std::string>{"pkg/Bad.java", "pkg/Missing.java"}));
}

TEST(ExtractionPipelineTest, ResultDoesNotDependOnWorkerCount) {
    auto dir = TempDirScope::unique_under("codegraph_extract");
    auto files = writeTree(dir, 10);

    ExtractionOptions serial;
    serial.workers = 1;
    ExtractionOptions parallel;
    parallel.workers = 8;

    auto a = extractFiles(files, serial);
    auto b = extractFiles(files, parallel);
    ASSERT_EQ(a.records.size(), b.records.size());
    for (std::size_t i = 0; i < a.records.size(); ++i) {
        EXPECT_EQ(a.records[i].path, b.records[i].path);
        ASSERT_EQ(a.records[i].methods.size(), b.records[i].methods.size());
        EXPECT_EQ(a.records[i].methods[0].signature, b.records[i].methods[0].signature);
    }
    EXPECT_EQ(a.errors.size(), b.errors.size());
}

TEST(ExtractionPipelineTest, EmptyInput) {
    auto result = extractFiles({}, ExtractionOptions{});
    EXPECT_TRUE(result.records.empty());
    EXPECT_TRUE(result.errors.empty());
}
