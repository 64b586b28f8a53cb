#include <gtest/gtest.h>
#include <codegraph/extraction/declaration_extractor.h>
#include <codegraph/manifest/dependency_extractor.h>
#include <codegraph/graph/graph_schema.h>
#include <codegraph/graph/graph_writer.h>

#include "temp_dir_scope.hpp"

#include <algorithm>

using namespace codegraph;
using namespace codegraph::graph;
using codegraph::extraction::DeclarationExtractor;
using codegraph::extraction::ExtractorOptions;
using codegraph::extraction::FileRecord;
using codegraph::test_support::TempDirScope;

namespace {

class GraphWriterTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto s = makeSqliteGraphStore((dir_.path() / "graph.db").string());
        ASSERT_TRUE(s) << s.error().message;
        store_ = std::move(s).value();
    }

    FileRecord parse(const std::string& path, const std::string& source) {
        DeclarationExtractor extractor(ExtractorOptions{"com.acme"});
        auto rec = extractor.extract(source, path);
        EXPECT_TRUE(rec) << (rec ? "" : rec.error().message);
        return rec ? rec.value() : FileRecord{};
    }

    Result<WriteReport> write(const std::vector<FileRecord>& records,
                              const manifest::DependencyMap& deps = {},
                              const EmbeddingSet& files = {}, const EmbeddingSet& methods = {}) {
        GraphWriter writer(*store_, WriterOptions{});
        return writer.write(records, deps, files, methods);
    }

    std::size_t nodes(const char* label) { return store_->countNodes(std::string(label)).value(); }
    std::size_t edges(const char* type) { return store_->countEdges(std::string(type)).value(); }

    TempDirScope dir_ = TempDirScope::unique_under("codegraph_writer");
    std::unique_ptr<GraphStore> store_;
};

} // namespace

TEST(GraphWriterHelpersTest, AncestorDirectories) {
    EXPECT_EQ(ancestorDirectories("A.java"), (std::vector<std::string>{""}));
    EXPECT_EQ(ancestorDirectories("src/main/A.java"),
              (std::vector<std::string>{"", "src", "src/main"}));
}

TEST(GraphWriterHelpersTest, BaseTypeName) {
    EXPECT_EQ(baseTypeName("List<Map<String, Integer>>"), "List");
    EXPECT_EQ(baseTypeName("String[]"), "String");
    EXPECT_EQ(baseTypeName("Object..."), "Object");
    EXPECT_EQ(baseTypeName("java.util.Map.Entry<K, V>"), "java.util.Map.Entry");
}

TEST_F(GraphWriterTest, StructureAndSameClassCall) {
    auto report = write({parse("src/A.java", "class A {\n"
                                             "  /** Runs. */\n"
                                             "  void a() { b(); }\n"
                                             "  void b() {}\n"
                                             "}\n")});
    ASSERT_TRUE(report) << report.error().message;

    EXPECT_EQ(nodes(kDirectory), 2u);
    EXPECT_EQ(nodes(kFile), 1u);
    EXPECT_EQ(nodes(kClass), 1u);
    EXPECT_EQ(nodes(kMethod), 2u);
    EXPECT_EQ(nodes(kDoc), 1u);
    EXPECT_EQ(edges(kContains), 2u);
    EXPECT_EQ(edges(kDefines), 1u);
    EXPECT_EQ(edges(kDeclares), 2u);
    EXPECT_EQ(edges(kContainsMethod), 2u);
    EXPECT_EQ(edges(kHasDoc), 1u);

    auto calls = store_->findEdges(kCalls);
    ASSERT_TRUE(calls) << calls.error().message;
    ASSERT_EQ(calls.value().size(), 1u);
    EXPECT_EQ(calls.value()[0].src.key, "A#a():void");
    EXPECT_EQ(calls.value()[0].dst.key, "A#b():void");
    EXPECT_EQ(calls.value()[0].properties["type"], "same_class");
    EXPECT_GT(report.value().batchesWritten, 0u);
}

TEST_F(GraphWriterTest, SecondWriteChangesNothing) {
    std::vector<FileRecord> records{
        parse("p/Base.java", "package p;\nclass Base { void close() {} }\n"),
        parse("p/Child.java", "package p;\nimport java.util.List;\n"
                              "class Child extends Base {\n"
                              "  void close(List<String> items) { super.close(); }\n"
                              "}\n")};
    ASSERT_TRUE(write(records));
    auto nodeCount = store_->countNodes().value();
    auto edgeCount = store_->countEdges().value();

    ASSERT_TRUE(write(records));
    EXPECT_EQ(store_->countNodes().value(), nodeCount);
    EXPECT_EQ(store_->countEdges().value(), edgeCount);
}

TEST_F(GraphWriterTest, InheritanceAndSuperCalls) {
    ASSERT_TRUE(write({parse("p/Base.java", "package p;\nclass Base { void close() {} }\n"),
                       parse("p/Child.java", "package p;\nclass Child extends Base {\n"
                                             "  void close() { super.close(); }\n"
                                             "}\n")}));

    auto extends = store_->findEdges(kExtends);
    ASSERT_TRUE(extends);
    ASSERT_EQ(extends.value().size(), 1u);
    EXPECT_EQ(extends.value()[0].src.key, "p/Child.java::Child");
    EXPECT_EQ(extends.value()[0].dst.key, "p/Base.java::Base");

    auto calls = store_->findEdges(kCalls);
    ASSERT_TRUE(calls);
    ASSERT_EQ(calls.value().size(), 1u);
    EXPECT_EQ(calls.value()[0].dst.key, "p.Base#close():void");
    EXPECT_EQ(calls.value()[0].properties["type"], "super");
}

TEST_F(GraphWriterTest, StaticCallsAndInstantiation) {
    ASSERT_TRUE(write({parse("Util.java", "class Util { static void help() {} }\n"),
                       parse("A.java", "class A {\n"
                                       "  void a() { Util.help(); Util u = new Util(); }\n"
                                       "}\n")}));

    auto calls = store_->findEdges(kCalls);
    ASSERT_TRUE(calls);
    ASSERT_EQ(calls.value().size(), 1u);
    EXPECT_EQ(calls.value()[0].dst.key, "Util#help():void");
    EXPECT_EQ(calls.value()[0].properties["qualifier"], "Util");

    auto created = store_->findEdges(kInstantiates);
    ASSERT_TRUE(created);
    ASSERT_EQ(created.value().size(), 1u);
    EXPECT_EQ(created.value()[0].dst.key, "Util.java::Util");
}

TEST_F(GraphWriterTest, AmbiguousParameterTypeIsLeftUnlinked) {
    auto report = write({parse("p/Z.java", "package p;\nclass Z {}\n"),
                         parse("q/Z.java", "package q;\nclass Z {}\n"),
                         parse("Y.java", "class Y {}\n"),
                         parse("U.java", "class U { void use(Z z, Y y) {} }\n")});
    ASSERT_TRUE(report) << report.error().message;

    EXPECT_EQ(nodes(kParameter), 2u);
    EXPECT_EQ(edges(kHasParameter), 2u);

    auto ofType = store_->findEdges(kOfType);
    ASSERT_TRUE(ofType);
    ASSERT_EQ(ofType.value().size(), 1u);
    EXPECT_EQ(ofType.value()[0].src.key, "U#use(Z,Y):void@1");
    EXPECT_EQ(ofType.value()[0].dst.key, "Y.java::Y");
    EXPECT_GE(report.value().unresolvedLinks, 1u);
}

TEST_F(GraphWriterTest, ExternalImportsCarryDependencyVersions) {
    auto deps = manifest::buildDependencyMap(
        {}, {manifest::Coordinate{"com.fasterxml.jackson.core", "jackson-databind", "2.15.0"}});
    ASSERT_TRUE(write({parse("A.java", "package com.acme;\n"
                                       "import com.fasterxml.jackson.core.JsonFactory;\n"
                                       "import com.acme.shared.Money;\n"
                                       "import java.util.List;\n"
                                       "class A {}\n")},
                      deps));

    EXPECT_EQ(nodes(kImport), 3u);
    EXPECT_EQ(edges(kImports), 3u);

    auto dep = store_->findNodes(NodeMatch{{kExternalDependency}, {}});
    ASSERT_TRUE(dep);
    ASSERT_EQ(dep.value().size(), 1u);
    EXPECT_EQ(dep.value()[0].properties["package"], "com.fasterxml.jackson.core");
    EXPECT_EQ(dep.value()[0].properties["version"], "2.15.0");
    EXPECT_EQ(dep.value()[0].properties["artifact_id"], "jackson-databind");

    auto dependsOn = store_->findEdges(kDependsOn);
    ASSERT_TRUE(dependsOn);
    ASSERT_EQ(dependsOn.value().size(), 1u);
    EXPECT_EQ(dependsOn.value()[0].src.key, "com.fasterxml.jackson.core.JsonFactory");
}

TEST_F(GraphWriterTest, EmbeddingsAreStoredOnFilesAndMethods) {
    EmbeddingSet files{{{0.5f, 0.25f}}};
    EmbeddingSet methods{{{1.0f, 0.0f}, {0.0f, 1.0f}}};
    ASSERT_TRUE(write({parse("A.java", "class A { void a() {} void b() {} }\n")}, {}, files,
                      methods));

    auto file = store_->findNodes(NodeMatch{{kFile}, {{"path", "A.java"}}});
    ASSERT_TRUE(file);
    ASSERT_EQ(file.value().size(), 1u);
    EXPECT_EQ(file.value()[0].properties["embedding"].size(), 2u);
    EXPECT_EQ(file.value()[0].properties["embedding_type"], "unknown");

    auto b = store_->findNodes(NodeMatch{{kMethod}, {{"name", "b"}}});
    ASSERT_TRUE(b);
    ASSERT_EQ(b.value().size(), 1u);
    EXPECT_EQ(b.value()[0].properties["embedding"][1], 1.0);
}

TEST_F(GraphWriterTest, EmbeddingCountMismatchWritesNothing) {
    EmbeddingSet files{{{0.5f}, {0.25f}}};
    auto r = write({parse("A.java", "class A {}\n")}, {}, files);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::InvalidData);
    EXPECT_EQ(store_->countNodes().value(), 0u);
}
