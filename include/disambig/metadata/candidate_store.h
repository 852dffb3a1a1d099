#pragma once

#include <disambig/core/types.h>
#include <disambig/metadata/query_helpers.h>
#include <disambig/metadata/schema.h>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace disambig::metadata {

/**
 * A persisted record considered as a possible match for a node.
 */
struct Candidate {
    std::string type;         // Base type (e.g. "agentworkrelation")
    std::int64_t id = 0;      // Primary key within the base type's table
    std::string concreteType; // Subtype name (e.g. "creator"), the base type when not polymorphic
    nlohmann::json fields = nlohmann::json::object(); // column -> value

    // Integer column value; nullopt when absent or NULL
    std::optional<std::int64_t> intField(std::string_view column) const;
    std::optional<std::string> stringField(std::string_view column) const;

    friend bool operator==(const Candidate& a, const Candidate& b) {
        return a.type == b.type && a.id == b.id;
    }
};

/**
 * One row of a batched node join.
 */
struct NodeJoinRow {
    std::string nodeId;
    Candidate candidate;
};

/**
 * An existing agent/work relation together with its agent.
 */
struct AgentWorkRelationRecord {
    Candidate relation;
    Candidate agent;
};

/**
 * Taxonomy scope for subject lookups.
 */
struct SubjectScope {
    bool central = true;                  // central_synonym IS NULL
    std::optional<std::int64_t> sourceId; // taxonomy owned by this source (when not central)
};

/**
 * Read-only access to persisted canonical records.
 */
class CandidateStore {
public:
    virtual ~CandidateStore() = default;

    virtual const Schema& schema() const = 0;

    // Executes one batched join built by the sql::NodeJoinQueryBuilder family
    virtual Result<std::vector<NodeJoinRow>> runNodeJoin(const TypeSchema& target,
                                                         const sql::BoundQuery& query) = 0;

    virtual Result<std::optional<Candidate>> getById(const TypeSchema& target,
                                                     std::int64_t id) = 0;

    // Single IN (...) query; unknown ids are skipped
    virtual Result<std::vector<Candidate>> getByIds(const TypeSchema& target,
                                                    const std::vector<std::int64_t>& ids) = 0;

    // First subject (lowest id) in scope whose `field` equals `value`
    virtual Result<std::optional<Candidate>>
    findSubject(const SubjectScope& scope, std::string_view field, std::string_view value) = 0;

    virtual Result<std::int64_t> countAgentRelations(std::int64_t workId) = 0;

    // Relations of a work ordered by id, each with its agent
    virtual Result<std::vector<AgentWorkRelationRecord>>
    agentRelationsForWork(std::int64_t workId) = 0;
};

/**
 * Open a SQLite backed store at dbPath.
 *
 * An existing file is opened read-only and must already contain the schema's tables.
 * A missing file, or ":memory:" for a private in-memory database, is created and migrated.
 */
Result<std::unique_ptr<CandidateStore>> makeSqliteCandidateStore(const std::string& dbPath,
                                                                 Schema schema);

} // namespace disambig::metadata
