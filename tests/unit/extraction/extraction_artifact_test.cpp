#include <gtest/gtest.h>
#include <codegraph/extraction/declaration_extractor.h>
#include <codegraph/extraction/error_collector.h>
#include <codegraph/extraction/extraction_artifact.h>

#include "temp_dir_scope.hpp"

#include <fstream>

using namespace codegraph;
using namespace codegraph::extraction;
using codegraph::test_support::TempDirScope;
using nlohmann::json;

TEST(ExtractionArtifactTest, FileObjectCarriesCountsAndSplitTypes) {
    DeclarationExtractor extractor;
    auto rec = extractor.extract("package p;\n"
                                 "interface Shape { double area(); }\n"
                                 "class Square implements Shape {\n"
                                 "  public double area() { return 1; }\n"
                                 "}\n",
                                 "p/Shapes.java");
    ASSERT_TRUE(rec) << rec.error().message;

    json j = rec.value();
    EXPECT_EQ(j["path"], "p/Shapes.java");
    EXPECT_EQ(j["method_count"], 2);
    EXPECT_EQ(j["class_count"], 1);
    EXPECT_EQ(j["interface_count"], 1);
    ASSERT_EQ(j["classes"].size(), 1u);
    EXPECT_EQ(j["classes"][0]["name"], "Square");
    ASSERT_EQ(j["interfaces"].size(), 1u);
    EXPECT_EQ(j["interfaces"][0]["method_count"], 1);

    const auto& method = j["methods"][1];
    EXPECT_EQ(method["method_signature"], "p.Square#area():double");
    EXPECT_EQ(method["class_name"], "Square");
    EXPECT_EQ(method["containing_type"], "class");

    // Declaration order survives the split into classes and interfaces
    auto back = j.get<FileRecord>();
    ASSERT_EQ(back.types.size(), 2u);
    EXPECT_EQ(kindOf(back.types[0]), TypeKind::Interface);
    EXPECT_EQ(kindOf(back.types[1]), TypeKind::Class);
}

TEST(ExtractionArtifactTest, LoadToleratesMissingOptionalFields) {
    json doc = json::array({json{
        {"path", "A.java"},
        {"methods", json::array({json{{"name", "run"},
                                      {"method_signature", "A#run():void"},
                                      {"class_name", nullptr},
                                      {"calls", json::array({json{{"method_name", "go"}}})}}})}}});
    auto records = artifactFromJson(doc);
    ASSERT_TRUE(records) << records.error().message;
    ASSERT_EQ(records.value().size(), 1u);

    const auto& r = records.value()[0];
    EXPECT_EQ(r.language, "java");
    EXPECT_EQ(r.ecosystem, "maven");
    EXPECT_TRUE(r.types.empty());
    ASSERT_EQ(r.methods.size(), 1u);
    EXPECT_FALSE(r.methods[0].className.has_value());
    EXPECT_EQ(r.methods[0].returnType, "void");
    ASSERT_EQ(r.methods[0].calls.size(), 1u);
    EXPECT_EQ(r.methods[0].calls[0].kind, CallKind::SameClass);
}

TEST(ExtractionArtifactTest, RejectsMalformedDocuments) {
    auto notArray = artifactFromJson(json::object());
    ASSERT_FALSE(notArray);
    EXPECT_EQ(notArray.error().code, ErrorCode::InvalidData);

    auto noPath = artifactFromJson(json::array({json{{"code", ""}}}));
    ASSERT_FALSE(noPath);
    EXPECT_EQ(noPath.error().code, ErrorCode::InvalidData);

    auto badKind = artifactFromJson(json::array({json{
        {"path", "A.java"},
        {"methods",
         json::array({json{{"name", "m"},
                           {"calls", json::array({json{{"method_name", "x"},
                                                       {"kind", "virtual"}}})}}})}}}));
    ASSERT_FALSE(badKind);
    EXPECT_EQ(badKind.error().code, ErrorCode::InvalidData);
}

TEST(ExtractionArtifactTest, SaveAndLoadFile) {
    auto dir = TempDirScope::unique_under("codegraph_artifact");
    DeclarationExtractor extractor;
    auto rec = extractor.extract("class A { void a() { b(); } void b() {} }", "A.java");
    ASSERT_TRUE(rec) << rec.error().message;

    auto path = dir.path() / "extraction.json";
    ASSERT_TRUE(saveArtifact({rec.value()}, path));
    auto loaded = loadArtifact(path);
    ASSERT_TRUE(loaded) << loaded.error().message;
    ASSERT_EQ(loaded.value().size(), 1u);
    EXPECT_EQ(loaded.value()[0].methods.size(), 2u);
    EXPECT_EQ(loaded.value()[0].methods[0].calls.size(), 1u);

    auto missing = loadArtifact(dir.path() / "missing.json");
    ASSERT_FALSE(missing);
    EXPECT_EQ(missing.error().code, ErrorCode::FileNotFound);
}

TEST(ErrorCollectorTest, MergeAndPersist) {
    ErrorCollector a;
    a.record("A.java", "A.java:3: unbalanced '{'");
    ErrorCollector b;
    b.record(ParseError{"B.java", "unterminated literal at line 1"});
    a.merge(b);
    ASSERT_EQ(a.size(), 2u);

    auto j = a.toJson();
    ASSERT_TRUE(j.is_array());
    EXPECT_EQ(j[1]["path"], "B.java");

    auto dir = TempDirScope::unique_under("codegraph_errors");
    auto path = dir.path() / "errors.json";
    ASSERT_TRUE(a.save(path));
    std::ifstream in(path);
    json saved;
    in >> saved;
    EXPECT_EQ(saved, j);
}
