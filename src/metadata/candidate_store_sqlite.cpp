#include <disambig/metadata/candidate_store.h>
#include <disambig/metadata/database.h>
#include <disambig/metadata/migration.h>

#include <spdlog/spdlog.h>

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <system_error>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

namespace disambig::metadata {

std::optional<std::int64_t> Candidate::intField(std::string_view column) const {
    auto it = fields.find(std::string(column));
    if (it == fields.end() || !it->is_number_integer()) {
        return std::nullopt;
    }
    return it->get<std::int64_t>();
}

std::optional<std::string> Candidate::stringField(std::string_view column) const {
    auto it = fields.find(std::string(column));
    if (it == fields.end() || !it->is_string()) {
        return std::nullopt;
    }
    return it->get<std::string>();
}

namespace {

Result<void> bindValue(Statement& stmt, int index, const sql::SqlValue& value) {
    return std::visit([&](const auto& v) -> Result<void> { return stmt.bind(index, v); }, value);
}

Result<void> bindParams(Statement& stmt, const std::vector<sql::SqlValue>& params) {
    for (std::size_t i = 0; i < params.size(); ++i) {
        auto br = bindValue(stmt, static_cast<int>(i + 1), params[i]);
        if (!br) return br;
    }
    return {};
}

nlohmann::json columnValue(const Statement& stmt, int column) {
    switch (stmt.columnType(column)) {
        case SQLITE_INTEGER:
            return stmt.getInt64(column);
        case SQLITE_FLOAT:
            return stmt.getDouble(column);
        case SQLITE_NULL:
            return nullptr;
        default:
            return stmt.getString(column);
    }
}

// Existing stores are never migrated; every table the schema reads from must already exist
Result<void> requireTables(Database& db, const Schema& schema) {
    for (const auto& name : schema.typeNames()) {
        const auto* type = schema.find(name);
        auto exists = db.tableExists(type->table);
        if (!exists) return exists.error();
        if (!exists.value()) {
            return Error{ErrorCode::InvalidData,
                         "store " + db.path() + " has no table " + type->table};
        }
    }
    return {};
}

} // namespace

class SqliteCandidateStore final : public CandidateStore {
public:
    SqliteCandidateStore(Database db, Schema schema)
        : db_(std::move(db)), schema_(std::move(schema)) {}

    static Result<std::unique_ptr<SqliteCandidateStore>> createWithPath(const std::string& dbPath,
                                                                        Schema schema) {
        std::error_code ec;
        const bool inMemory = dbPath == ":memory:";
        const bool fresh = inMemory || !std::filesystem::exists(dbPath, ec);

        Database db;
        const auto mode = inMemory ? ConnectionMode::Memory
                                   : (fresh ? ConnectionMode::Create : ConnectionMode::ReadOnly);
        auto rOpen = db.open(dbPath, mode);
        if (!rOpen) return rOpen.error();

        if (fresh) {
            auto rFK = db.execute("PRAGMA foreign_keys = ON");
            if (!rFK) spdlog::warn("Enabling foreign_keys failed during store init: {}",
                                   rFK.error().message);

            MigrationManager mm(db);
            auto rInit = mm.initialize();
            if (!rInit) return rInit.error();
            mm.registerMigrations(CandidateStoreMigrations::getAllMigrations());
            auto rMig = mm.migrate();
            if (!rMig) return rMig.error();
        } else {
            auto rTables = requireTables(db, schema);
            if (!rTables) return rTables.error();
            spdlog::debug("Opened existing store {} read-only", dbPath);
        }

        return std::make_unique<SqliteCandidateStore>(std::move(db), std::move(schema));
    }

    const Schema& schema() const override { return schema_; }

    Result<std::vector<NodeJoinRow>> runNodeJoin(const TypeSchema& target,
                                                 const sql::BoundQuery& query) override {
        auto stmtR = db_.prepare(query.sql);
        if (!stmtR) return stmtR.error();
        auto stmt = std::move(stmtR).value();

        auto br = bindParams(stmt, query.params);
        if (!br) return br.error();

        std::vector<NodeJoinRow> out;
        while (true) {
            auto step = stmt.step();
            if (!step) return step.error();
            if (!step.value()) break;
            NodeJoinRow row;
            row.nodeId = stmt.getString(0);
            row.candidate = readCandidate(target, stmt, 1);
            out.push_back(std::move(row));
        }
        return out;
    }

    Result<std::optional<Candidate>> getById(const TypeSchema& target, std::int64_t id) override {
        auto rows = getByIds(target, {id});
        if (!rows) return rows.error();
        if (rows.value().empty()) {
            return std::optional<Candidate>{};
        }
        return std::optional<Candidate>{std::move(rows.value().front())};
    }

    Result<std::vector<Candidate>> getByIds(const TypeSchema& target,
                                            const std::vector<std::int64_t>& ids) override {
        if (ids.empty()) return std::vector<Candidate>{};

        sql::QuerySpec spec;
        spec.table = target.table;
        spec.conditions.push_back(target.table + ".id IN (" + sql::placeholders(ids.size()) + ")");
        spec.orderBy = target.table + ".id";

        auto stmtR = db_.prepare(sql::buildSelect(spec));
        if (!stmtR) return stmtR.error();
        auto stmt = std::move(stmtR).value();
        for (std::size_t i = 0; i < ids.size(); ++i) {
            auto br = stmt.bind(static_cast<int>(i + 1), static_cast<int64_t>(ids[i]));
            if (!br) return br.error();
        }
        return readAll(target, stmt);
    }

    Result<std::optional<Candidate>> findSubject(const SubjectScope& scope, std::string_view field,
                                                 std::string_view value) override {
        const auto* subject = schema_.find("subject");
        const auto* taxonomy = schema_.find("subjecttaxonomy");
        if (!subject || !taxonomy) {
            return Error{ErrorCode::NotSupported, "schema has no subject taxonomy types"};
        }
        auto column = subject->column(field);
        if (!column) {
            return Error{ErrorCode::InvalidArgument,
                         "unknown subject field: " + std::string(field)};
        }

        sql::QuerySpec spec;
        spec.table = subject->table;
        spec.columns = {subject->table + ".*"};
        if (scope.central) {
            spec.conditions.push_back(subject->table + ".central_synonym_id IS NULL");
        } else {
            if (!scope.sourceId) {
                return Error{ErrorCode::InvalidArgument, "source scoped lookup without a source"};
            }
            spec.from = subject->table + " INNER JOIN " + taxonomy->table + " ON " +
                        taxonomy->table + ".id = " + subject->table + ".taxonomy_id";
            spec.conditions.push_back(taxonomy->table + ".source_id = ?");
        }
        spec.conditions.push_back(subject->table + "." + *column + " = ?");
        spec.orderBy = subject->table + ".id";
        spec.limit = 1;

        auto stmtR = db_.prepare(sql::buildSelect(spec));
        if (!stmtR) return stmtR.error();
        auto stmt = std::move(stmtR).value();

        int index = 1;
        if (!scope.central) {
            auto br = stmt.bind(index++, static_cast<int64_t>(*scope.sourceId));
            if (!br) return br.error();
        }
        auto br = stmt.bind(index, value);
        if (!br) return br.error();

        auto rows = readAll(*subject, stmt);
        if (!rows) return rows.error();
        if (rows.value().empty()) {
            return std::optional<Candidate>{};
        }
        return std::optional<Candidate>{std::move(rows.value().front())};
    }

    Result<std::int64_t> countAgentRelations(std::int64_t workId) override {
        const auto* relation = schema_.find("agentworkrelation");
        if (!relation) {
            return Error{ErrorCode::NotSupported, "schema has no agentworkrelation type"};
        }
        auto stmtR = db_.prepare("SELECT COUNT(*) FROM " + relation->table +
                                 " WHERE creative_work_id = ?");
        if (!stmtR) return stmtR.error();
        auto stmt = std::move(stmtR).value();
        auto br = stmt.bind(1, static_cast<int64_t>(workId));
        if (!br) return br.error();
        auto step = stmt.step();
        if (!step) return step.error();
        return step.value() ? stmt.getInt64(0) : std::int64_t{0};
    }

    Result<std::vector<AgentWorkRelationRecord>>
    agentRelationsForWork(std::int64_t workId) override {
        const auto* relation = schema_.find("agentworkrelation");
        const auto* agent = schema_.find("agent");
        if (!relation || !agent) {
            return Error{ErrorCode::NotSupported, "schema has no agent/work relation types"};
        }

        sql::QuerySpec spec;
        spec.table = relation->table;
        spec.conditions.push_back(relation->table + ".creative_work_id = ?");
        spec.orderBy = relation->table + ".id";

        auto stmtR = db_.prepare(sql::buildSelect(spec));
        if (!stmtR) return stmtR.error();
        auto stmt = std::move(stmtR).value();
        auto br = stmt.bind(1, static_cast<int64_t>(workId));
        if (!br) return br.error();

        auto relations = readAll(*relation, stmt);
        if (!relations) return relations.error();

        std::vector<std::int64_t> agentIds;
        std::unordered_set<std::int64_t> seen;
        for (const auto& r : relations.value()) {
            if (auto agentId = r.intField("agent_id"); agentId && seen.insert(*agentId).second) {
                agentIds.push_back(*agentId);
            }
        }
        auto agents = getByIds(*agent, agentIds);
        if (!agents) return agents.error();

        std::unordered_map<std::int64_t, Candidate> agentsById;
        for (auto& a : agents.value()) {
            auto id = a.id;
            agentsById.emplace(id, std::move(a));
        }

        std::vector<AgentWorkRelationRecord> out;
        out.reserve(relations.value().size());
        for (auto& r : relations.value()) {
            auto agentId = r.intField("agent_id");
            auto it = agentId ? agentsById.find(*agentId) : agentsById.end();
            if (it == agentsById.end()) {
                spdlog::warn("agent/work relation {} references a missing agent", r.id);
                continue;
            }
            out.push_back(AgentWorkRelationRecord{std::move(r), it->second});
        }
        return out;
    }

private:
    Database db_;
    Schema schema_;

    Candidate readCandidate(const TypeSchema& target, const Statement& stmt, int firstColumn) const {
        Candidate c;
        c.type = target.name;
        c.concreteType = target.name;
        for (int col = firstColumn; col < stmt.columnCount(); ++col) {
            c.fields[stmt.columnName(col)] = columnValue(stmt, col);
        }
        if (auto id = c.intField("id")) {
            c.id = *id;
        }
        if (target.typeColumn) {
            if (auto tag = c.stringField(*target.typeColumn)) {
                c.concreteType = schema_.subtypeFromTag(*tag);
            }
        }
        return c;
    }

    Result<std::vector<Candidate>> readAll(const TypeSchema& target, Statement& stmt) const {
        std::vector<Candidate> out;
        while (true) {
            auto step = stmt.step();
            if (!step) return step.error();
            if (!step.value()) break;
            out.push_back(readCandidate(target, stmt, 0));
        }
        return out;
    }
};

Result<std::unique_ptr<CandidateStore>> makeSqliteCandidateStore(const std::string& dbPath,
                                                                 Schema schema) {
    auto r = SqliteCandidateStore::createWithPath(dbPath, std::move(schema));
    if (!r) return r.error();
    return std::unique_ptr<CandidateStore>(std::move(r).value());
}

} // namespace disambig::metadata
