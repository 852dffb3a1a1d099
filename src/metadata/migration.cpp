#include <disambig/metadata/migration.h>
#include <spdlog/spdlog.h>

namespace disambig::metadata {

MigrationManager::MigrationManager(Database& db) : db_(db) {
}

Result<void> MigrationManager::initialize() {
    return createMigrationTables();
}

void MigrationManager::registerMigration(Migration migration) {
    migrations_[migration.version] = std::move(migration);
}

void MigrationManager::registerMigrations(std::vector<Migration> migrations) {
    for (auto& migration : migrations) {
        registerMigration(std::move(migration));
    }
}

Result<int> MigrationManager::getCurrentVersion() {
    auto stmtResult = db_.prepare(
        "SELECT MAX(version) FROM migration_history WHERE success = 1"
    );
    if (!stmtResult) return stmtResult.error();

    Statement stmt = std::move(stmtResult).value();
    auto stepResult = stmt.step();
    if (!stepResult) return stepResult.error();

    if (stepResult.value() && !stmt.isNull(0)) {
        return stmt.getInt(0);
    }

    return 0; // No migrations applied yet
}

int MigrationManager::getLatestVersion() const {
    if (migrations_.empty()) return 0;
    return migrations_.rbegin()->first;
}

Result<bool> MigrationManager::needsMigration() {
    auto currentResult = getCurrentVersion();
    if (!currentResult) return currentResult.error();

    return currentResult.value() < getLatestVersion();
}

Result<void> MigrationManager::migrate() {
    auto currentResult = getCurrentVersion();
    if (!currentResult) return currentResult.error();

    int currentVersion = currentResult.value();
    const int targetVersion = getLatestVersion();
    if (currentVersion >= targetVersion) {
        spdlog::debug("Already at version {}", currentVersion);
        return {};
    }

    for (const auto& [version, migration] : migrations_) {
        if (version <= currentVersion) {
            continue;
        }
        spdlog::debug("Applying migration {} '{}'", version, migration.name);

        auto start = std::chrono::steady_clock::now();
        auto result = applyMigration(migration);
        auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start
        );

        if (!result) {
            auto recordResult = recordMigration(
                version, migration.name, duration, false, result.error().message
            );
            if (!recordResult) {
                spdlog::warn("Failed to record failed migration {}: {}", version,
                             recordResult.error().message);
            }
            return result;
        }

        auto recordResult = recordMigration(version, migration.name, duration, true);
        if (!recordResult) return recordResult;

        currentVersion = version;
    }

    spdlog::debug("Migration complete. Now at version {}", currentVersion);
    return {};
}

Result<void> MigrationManager::applyMigration(const Migration& migration) {
    return db_.transaction([&]() -> Result<void> {
        if (migration.upFunc) {
            return migration.upFunc(db_);
        } else if (!migration.upSQL.empty()) {
            return db_.execute(migration.upSQL);
        } else {
            return Error{ErrorCode::InvalidData,
                        "Migration has no up function or SQL"};
        }
    });
}

Result<void> MigrationManager::recordMigration(int version, const std::string& name,
                                               std::chrono::milliseconds duration,
                                               bool success, const std::string& error) {
    auto stmtResult = db_.prepare(
        "INSERT INTO migration_history (version, name, applied_at, duration_ms, success, error) "
        "VALUES (?, ?, ?, ?, ?, ?)"
    );
    if (!stmtResult) return stmtResult.error();

    Statement stmt = std::move(stmtResult).value();
    auto appliedAt = static_cast<int64_t>(std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count());
    auto bindResult = stmt.bindAll(
        version, name, appliedAt, static_cast<int64_t>(duration.count()), success ? 1 : 0, error
    );
    if (!bindResult) return bindResult;

    return stmt.execute();
}

Result<void> MigrationManager::createMigrationTables() {
    return db_.execute(R"(
        CREATE TABLE IF NOT EXISTS migration_history (
            version INTEGER NOT NULL,
            name TEXT NOT NULL,
            applied_at INTEGER NOT NULL,
            duration_ms INTEGER NOT NULL,
            success INTEGER NOT NULL,
            error TEXT
        );
    )");
}

std::vector<Migration> CandidateStoreMigrations::getAllMigrations() {
    return {createInitialSchema(), createLookupIndexes()};
}

Migration CandidateStoreMigrations::createInitialSchema() {
    Migration m;
    m.version = 1;
    m.name = "Initial candidate store schema";
    m.upSQL = R"(
        CREATE TABLE share_source (
            id INTEGER PRIMARY KEY,
            name TEXT NOT NULL UNIQUE,
            long_title TEXT
        );

        CREATE TABLE share_creativework (
            id INTEGER PRIMARY KEY,
            type TEXT NOT NULL,
            title TEXT NOT NULL DEFAULT '',
            description TEXT NOT NULL DEFAULT '',
            language TEXT,
            date_published TEXT
        );

        CREATE TABLE share_agent (
            id INTEGER PRIMARY KEY,
            type TEXT NOT NULL,
            name TEXT NOT NULL,
            given_name TEXT NOT NULL DEFAULT '',
            family_name TEXT NOT NULL DEFAULT ''
        );

        CREATE TABLE share_agentworkrelation (
            id INTEGER PRIMARY KEY,
            type TEXT NOT NULL,
            creative_work_id INTEGER NOT NULL REFERENCES share_creativework(id),
            agent_id INTEGER NOT NULL REFERENCES share_agent(id),
            cited_as TEXT NOT NULL DEFAULT '',
            order_cited INTEGER
        );

        CREATE TABLE share_workidentifier (
            id INTEGER PRIMARY KEY,
            uri TEXT NOT NULL UNIQUE,
            host TEXT NOT NULL,
            scheme TEXT NOT NULL,
            creative_work_id INTEGER NOT NULL REFERENCES share_creativework(id)
        );

        CREATE TABLE share_agentidentifier (
            id INTEGER PRIMARY KEY,
            uri TEXT NOT NULL UNIQUE,
            host TEXT NOT NULL,
            scheme TEXT NOT NULL,
            agent_id INTEGER NOT NULL REFERENCES share_agent(id)
        );

        CREATE TABLE share_subjecttaxonomy (
            id INTEGER PRIMARY KEY,
            source_id INTEGER NOT NULL UNIQUE REFERENCES share_source(id)
        );

        CREATE TABLE share_subject (
            id INTEGER PRIMARY KEY,
            name TEXT NOT NULL,
            uri TEXT,
            parent_id INTEGER REFERENCES share_subject(id),
            central_synonym_id INTEGER REFERENCES share_subject(id),
            taxonomy_id INTEGER NOT NULL REFERENCES share_subjecttaxonomy(id)
        );

        CREATE TABLE share_tag (
            id INTEGER PRIMARY KEY,
            name TEXT NOT NULL UNIQUE
        );

        CREATE TABLE share_throughtags (
            id INTEGER PRIMARY KEY,
            tag_id INTEGER NOT NULL REFERENCES share_tag(id),
            creative_work_id INTEGER NOT NULL REFERENCES share_creativework(id),
            UNIQUE (tag_id, creative_work_id)
        );
    )";
    return m;
}

Migration CandidateStoreMigrations::createLookupIndexes() {
    Migration m;
    m.version = 2;
    m.name = "Lookup indexes";
    m.upSQL = R"(
        CREATE INDEX idx_agentworkrelation_work ON share_agentworkrelation(creative_work_id);
        CREATE INDEX idx_agentworkrelation_agent ON share_agentworkrelation(agent_id);
        CREATE INDEX idx_workidentifier_work ON share_workidentifier(creative_work_id);
        CREATE INDEX idx_agentidentifier_agent ON share_agentidentifier(agent_id);
        CREATE INDEX idx_subject_taxonomy_name ON share_subject(taxonomy_id, name);
        CREATE INDEX idx_subject_uri ON share_subject(uri);
        CREATE INDEX idx_subject_central_name ON share_subject(central_synonym_id, name);
    )";
    return m;
}

} // namespace disambig::metadata
