#pragma once

#include <disambig/metadata/database.h>
#include <chrono>
#include <functional>
#include <map>
#include <string>
#include <vector>

namespace disambig::metadata {

/**
 * @brief Database migration definition
 */
struct Migration {
    int version;                    ///< Migration version number
    std::string name;               ///< Human-readable name
    std::string upSQL;              ///< SQL to apply migration

    /**
     * @brief Custom migration function (for complex migrations)
     */
    std::function<Result<void>(Database&)> upFunc;
};

/**
 * @brief Applies versioned schema migrations and records them in migration_history
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

    Result<int> getCurrentVersion();
    int getLatestVersion() const;
    Result<bool> needsMigration();

    /**
     * @brief Apply all pending migrations
     */
    Result<void> migrate();

private:
    Database& db_;
    std::map<int, Migration> migrations_;

    Result<void> applyMigration(const Migration& migration);
    Result<void> recordMigration(int version, const std::string& name,
                                 std::chrono::milliseconds duration, bool success,
                                 const std::string& error = "");
    Result<void> createMigrationTables();
};

/**
 * @brief Built-in migrations creating the candidate store tables
 */
class CandidateStoreMigrations {
public:
    static std::vector<Migration> getAllMigrations();

private:
    // Version 1: works, agents, relations, identifiers, taxonomies, tags
    static Migration createInitialSchema();

    // Version 2: lookup indexes for the batched join columns
    static Migration createLookupIndexes();
};

} // namespace disambig::metadata
