#include <gtest/gtest.h>
#include <codegraph/graph/schema_guard.h>
#include <codegraph/metadata/database.h>

#include "temp_dir_scope.hpp"

using namespace codegraph;
using namespace codegraph::graph;
using codegraph::test_support::TempDirScope;

namespace {

// Reports a fixed constraint list and ignores schema requests
class FrozenSchemaStore final : public GraphStore {
public:
    explicit FrozenSchemaStore(std::vector<std::string> constraints)
        : constraints_(std::move(constraints)) {}

    Result<std::size_t> upsertNodes(const std::vector<GraphNode>& nodes) override {
        writes_ += nodes.size();
        return nodes.size();
    }
    Result<MergeStats> mergeEdges(const std::vector<GraphEdge>& edges) override {
        writes_ += edges.size();
        return MergeStats{edges.size(), 0};
    }
    Result<MergeStats> mergeEdgesToUniqueMatch(const std::vector<UniqueMatchEdge>& edges) override {
        writes_ += edges.size();
        return MergeStats{edges.size(), 0};
    }
    Result<std::vector<std::string>> listConstraints() override { return constraints_; }
    Result<void> applySchema() override {
        ++applyCalls_;
        return {};
    }
    Result<std::size_t> countNodes(const std::optional<std::string>&) override {
        return std::size_t{0};
    }
    Result<std::size_t> countEdges(const std::optional<std::string>&) override {
        return std::size_t{0};
    }
    Result<std::map<std::string, std::size_t>> nodeCountsByLabel() override {
        return std::map<std::string, std::size_t>{};
    }
    Result<std::map<std::string, std::size_t>> edgeCountsByType() override {
        return std::map<std::string, std::size_t>{};
    }
    Result<std::vector<NodeView>> findNodes(const NodeMatch&) override {
        return std::vector<NodeView>{};
    }
    Result<std::vector<EdgeView>> findEdges(std::string_view) override {
        return std::vector<EdgeView>{};
    }

    std::size_t writes() const { return writes_; }
    int applyCalls() const { return applyCalls_; }

private:
    std::vector<std::string> constraints_;
    std::size_t writes_ = 0;
    int applyCalls_ = 0;
};

std::vector<std::string> allButMethodSignature() {
    std::vector<std::string> names;
    for (const auto& constraint : managedConstraints()) {
        if (constraint.name != "method_signature")
            names.push_back(constraint.name);
    }
    return names;
}

} // namespace

TEST(SchemaGuardTest, FreshStorePassesWithoutRepair) {
    auto dir = TempDirScope::unique_under("codegraph_guard");
    auto store = makeSqliteGraphStore((dir.path() / "graph.db").string());
    ASSERT_TRUE(store) << store.error().message;

    SchemaGuard guard(*store.value());
    auto missing = guard.missingConstraints();
    ASSERT_TRUE(missing);
    EXPECT_TRUE(missing.value().empty());
    ASSERT_TRUE(guard.ensure());
    EXPECT_FALSE(guard.repaired());
}

TEST(SchemaGuardTest, DroppedConstraintIsRecreated) {
    auto dir = TempDirScope::unique_under("codegraph_guard");
    auto dbPath = (dir.path() / "graph.db").string();
    auto store = makeSqliteGraphStore(dbPath);
    ASSERT_TRUE(store) << store.error().message;

    {
        metadata::Database db;
        ASSERT_TRUE(db.open(dbPath));
        ASSERT_TRUE(db.execute("DROP INDEX method_signature"));
        ASSERT_TRUE(db.execute("DROP TRIGGER method_signature_exists"));
    }

    SchemaGuard guard(*store.value());
    auto missing = guard.missingConstraints();
    ASSERT_TRUE(missing);
    EXPECT_EQ(missing.value(),
              (std::vector<std::string>{"method_signature", "method_signature_exists"}));

    ASSERT_TRUE(guard.ensure());
    EXPECT_TRUE(guard.repaired());
    EXPECT_TRUE(guard.missingConstraints().value().empty());

    metadata::Database db;
    ASSERT_TRUE(db.open(dbPath));
    auto trigger = db.schemaObjectExists("trigger", "method_signature_exists");
    ASSERT_TRUE(trigger);
    EXPECT_TRUE(trigger.value());
}

TEST(SchemaGuardTest, FailsWhenRepairDoesNotTakeEffect) {
    FrozenSchemaStore store(allButMethodSignature());
    SchemaGuard guard(store);

    auto r = guard.ensure();
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::SchemaMissing);
    EXPECT_NE(r.error().message.find("method_signature"), std::string::npos);
    EXPECT_EQ(store.applyCalls(), 1);
    EXPECT_EQ(store.writes(), 0u);
}
