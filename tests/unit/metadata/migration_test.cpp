#include <gtest/gtest.h>
#include <codegraph/metadata/migration.h>

#include "temp_dir_scope.hpp"

using namespace codegraph;
using namespace codegraph::metadata;
using codegraph::test_support::TempDirScope;

namespace {

Migration sqlMigration(int version, std::string name, std::string sql) {
    Migration m;
    m.version = version;
    m.name = std::move(name);
    m.upSQL = std::move(sql);
    return m;
}

} // namespace

TEST(MigrationManagerTest, AppliesPendingMigrationsInOrder) {
    auto dir = TempDirScope::unique_under("codegraph_migration");
    Database db;
    ASSERT_TRUE(db.open((dir.path() / "m.db").string()));

    MigrationManager mm(db);
    ASSERT_TRUE(mm.initialize());
    mm.registerMigration(sqlMigration(2, "index", "CREATE INDEX idx_t_a ON t(a)"));
    mm.registerMigration(sqlMigration(1, "table", "CREATE TABLE t (a TEXT)"));

    Migration seed;
    seed.version = 3;
    seed.name = "seed";
    seed.upFunc = [](Database& d) { return d.execute("INSERT INTO t (a) VALUES ('x')"); };
    mm.registerMigration(std::move(seed));

    EXPECT_TRUE(mm.needsMigration().value());
    ASSERT_TRUE(mm.migrate());
    EXPECT_EQ(mm.getCurrentVersion().value(), 3);
    EXPECT_FALSE(mm.needsMigration().value());

    auto history = mm.getHistory();
    ASSERT_TRUE(history) << history.error().message;
    ASSERT_EQ(history.value().size(), 3u);
    EXPECT_EQ(history.value()[0].name, "table");
    EXPECT_TRUE(history.value()[2].success);

    // Re-running is a no-op
    ASSERT_TRUE(mm.migrate());
    EXPECT_EQ(mm.getHistory().value().size(), 3u);
}

TEST(MigrationManagerTest, FailedMigrationIsRecordedAndStops) {
    auto dir = TempDirScope::unique_under("codegraph_migration");
    Database db;
    ASSERT_TRUE(db.open((dir.path() / "m.db").string()));

    MigrationManager mm(db);
    ASSERT_TRUE(mm.initialize());
    mm.registerMigrations({sqlMigration(1, "table", "CREATE TABLE t (a TEXT)"),
                           sqlMigration(2, "broken", "CREATE TABLE"),
                           sqlMigration(3, "after", "CREATE TABLE u (b TEXT)")});

    auto r = mm.migrate();
    ASSERT_FALSE(r);
    EXPECT_EQ(mm.getCurrentVersion().value(), 1);
    EXPECT_FALSE(db.schemaObjectExists("table", "u").value());

    auto history = mm.getHistory().value();
    ASSERT_EQ(history.size(), 2u);
    EXPECT_FALSE(history[1].success);
    EXPECT_FALSE(history[1].error.empty());
}
