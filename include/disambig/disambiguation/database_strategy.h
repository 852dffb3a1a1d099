#pragma once

#include <disambig/config/disambiguation_config.h>
#include <disambig/core/types.h>
#include <disambig/disambiguation/match_set.h>
#include <disambig/graph/graph.h>
#include <disambig/metadata/candidate_store.h>

#include <cstddef>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace disambig::disambiguation {

using NodeList = std::vector<const graph::Node*>;

struct PassCompleted {
    std::size_t matchesAdded = 0;
};

/**
 * A related node resolves to more than one persisted record where exactly one is required.
 * Needs an external merge decision.
 */
struct MergeRequired {
    graph::NodeId nodeId;        // node whose lookup key is ambiguous
    std::string relationName;    // relation holding the ambiguous node
    graph::NodeId relatedNodeId; // node with several matches
    std::vector<metadata::Candidate> candidates;
    std::string message;
};

using PassOutcome = std::variant<PassCompleted, MergeRequired>;

/**
 * Matching passes against a read-only candidate store.
 *
 * Every pass reads and extends the MatchSet it is handed; the graph is never modified. Passes
 * depend on the results of earlier ones, so callers run them in a fixed order (see
 * Disambiguator::defaultPlan). Store failures propagate as errors; "no match" never does.
 */
class DatabaseStrategy {
public:
    DatabaseStrategy(const graph::Graph& graph, metadata::CandidateStore& store,
                     config::DisambiguationConfig config = {});

    // Resolves nodes whose id is an obfuscated record reference; blank and malformed ids are
    // skipped
    Result<void> initialPass(const NodeList& nodes, MatchSet& matches);

    // Exact match on every attribute in one batched query
    Result<void> matchByAttrs(const NodeList& nodes, MatchSet& matches,
                              std::string_view targetType,
                              const std::vector<std::string>& attrNames,
                              const std::vector<std::string>& allowedSubtypes = {});

    // Uses the single match of every named relation as lookup key. Nodes with an unmatched
    // relation are left out; a relation with several matches yields MergeRequired.
    Result<PassOutcome> matchByManyToOne(const NodeList& nodes, MatchSet& matches,
                                         std::string_view targetType,
                                         const std::vector<std::string>& relationNames,
                                         const std::vector<std::string>& allowedSubtypes = {});

    // Matches nodes to the records referenced by the matches of their reverse relation
    // (e.g. a work through the matches of its identifiers)
    Result<void> matchByOneToMany(const NodeList& nodes, MatchSet& matches,
                                  std::string_view targetType, std::string_view relationName);

    Result<void> matchSubjects(const NodeList& nodes, MatchSet& matches);

    // Fuzzy, name based matching of agent/work relations of already matched works
    Result<void> matchAgentWorkRelations(const NodeList& nodes, MatchSet& matches);

    const config::DisambiguationConfig& config() const { return config_; }

private:
    Result<const metadata::TypeSchema*> targetSchema(std::string_view targetType) const;

    Result<std::size_t> matchQuery(const std::vector<const graph::Node*>& nodes,
                                   MatchSet& matches, const metadata::TypeSchema& target,
                                   std::vector<std::string> columns,
                                   metadata::sql::NodeJoinQueryBuilder::ValueGetter getValues,
                                   const std::vector<std::string>& allowedSubtypes);

    bool isA(const graph::Node& node, std::string_view baseType) const;

    const graph::Graph& graph_;
    metadata::CandidateStore& store_;
    config::DisambiguationConfig config_;
};

} // namespace disambig::disambiguation
