#include <gtest/gtest.h>
#include <codegraph/metadata/database.h>

#include "temp_dir_scope.hpp"

using namespace codegraph;
using namespace codegraph::metadata;
using codegraph::test_support::TempDirScope;

namespace {

class DatabaseTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(db_.open((dir_.path() / "test.db").string()));
        ASSERT_TRUE(db_.execute("CREATE TABLE kv (k TEXT PRIMARY KEY, v INTEGER NOT NULL)"));
    }

    std::int64_t count() {
        auto stmt = db_.prepare("SELECT COUNT(*) FROM kv");
        EXPECT_TRUE(stmt);
        auto step = stmt.value().step();
        EXPECT_TRUE(step && step.value());
        return stmt.value().getInt64(0);
    }

    TempDirScope dir_ = TempDirScope::unique_under("codegraph_db");
    Database db_;
};

} // namespace

TEST_F(DatabaseTest, BindStepAndRead) {
    auto insert = db_.prepare("INSERT INTO kv (k, v) VALUES (?, ?)");
    ASSERT_TRUE(insert) << insert.error().message;
    ASSERT_TRUE(insert.value().bindAll("a", 1));
    ASSERT_TRUE(insert.value().execute());
    ASSERT_TRUE(insert.value().reset());
    ASSERT_TRUE(insert.value().bindAll(std::string("b"), std::int64_t{2}));
    ASSERT_TRUE(insert.value().execute());

    auto select = db_.prepare("SELECT k, v FROM kv ORDER BY k");
    ASSERT_TRUE(select);
    auto& stmt = select.value();
    ASSERT_TRUE(stmt.step().value());
    EXPECT_EQ(stmt.getString(0), "a");
    EXPECT_EQ(stmt.getInt(1), 1);
    ASSERT_TRUE(stmt.step().value());
    EXPECT_EQ(stmt.getString(0), "b");
    EXPECT_FALSE(stmt.step().value());
}

TEST_F(DatabaseTest, ConstraintFailureMapsToConstraintViolation) {
    ASSERT_TRUE(db_.execute("INSERT INTO kv (k, v) VALUES ('a', 1)"));
    auto insert = db_.prepare("INSERT INTO kv (k, v) VALUES (?, ?)");
    ASSERT_TRUE(insert);
    ASSERT_TRUE(insert.value().bindAll("a", 2));
    auto r = insert.value().execute();
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::ConstraintViolation);
}

TEST_F(DatabaseTest, FailedTransactionRollsBack) {
    auto r = db_.transaction([&]() -> Result<void> {
        if (auto e = db_.execute("INSERT INTO kv (k, v) VALUES ('x', 1)"); !e)
            return e;
        return Error{ErrorCode::InvalidData, "abort"};
    });
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::InvalidData);
    EXPECT_FALSE(db_.inTransaction());
    EXPECT_EQ(count(), 0);

    ASSERT_TRUE(db_.transaction(
        [&]() -> Result<void> { return db_.execute("INSERT INTO kv (k, v) VALUES ('y', 2)"); }));
    EXPECT_EQ(count(), 1);
}

TEST_F(DatabaseTest, SchemaObjectExists) {
    auto table = db_.schemaObjectExists("table", "kv");
    ASSERT_TRUE(table);
    EXPECT_TRUE(table.value());

    auto index = db_.schemaObjectExists("index", "kv_missing");
    ASSERT_TRUE(index);
    EXPECT_FALSE(index.value());
}
