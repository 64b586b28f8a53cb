#pragma once

#include <codegraph/metadata/database.h>

#include <chrono>
#include <functional>
#include <map>
#include <string>
#include <vector>

namespace codegraph::metadata {

/**
 * @brief Database migration definition
 */
struct Migration {
    int version;       ///< Migration version number
    std::string name;  ///< Human-readable name
    std::string upSQL; ///< SQL to apply migration

    /**
     * @brief Custom migration function (for complex migrations)
     */
    std::function<Result<void>(Database&)> upFunc;
};

/**
 * @brief Migration history entry
 */
struct MigrationHistory {
    int version;
    std::string name;
    std::chrono::system_clock::time_point appliedAt;
    std::chrono::milliseconds duration;
    bool success;
    std::string error;
};

/**
 * @brief Forward-only migration manager backed by the migration_history table
 */
class MigrationManager {
public:
    explicit MigrationManager(Database& db);

    /**
     * @brief Initialize migration system (create tables)
     */
    Result<void> initialize();

    void registerMigration(Migration migration);
    void registerMigrations(std::vector<Migration> migrations);

    /**
     * @brief Get current schema version (0 when nothing applied)
     */
    Result<int> getCurrentVersion();

    int getLatestVersion() const;

    Result<bool> needsMigration();

    /**
     * @brief Apply all pending migrations, each in its own transaction
     */
    Result<void> migrate();

    Result<std::vector<MigrationHistory>> getHistory();

private:
    Database& db_;
    std::map<int, Migration> migrations_;

    Result<void> applyMigration(const Migration& migration);

    Result<void> recordMigration(int version, const std::string& name,
                                 std::chrono::milliseconds duration, bool success,
                                 const std::string& error = "");
};

} // namespace codegraph::metadata
