#pragma once

#include <disambig/config/disambiguation_config.h>
#include <disambig/core/types.h>
#include <disambig/disambiguation/database_strategy.h>
#include <disambig/disambiguation/match_set.h>

#include <string>
#include <variant>
#include <vector>

namespace disambig::disambiguation {

enum class PassKind { Initial, Attrs, ManyToOne, OneToMany, Subjects, AgentWorkRelations };

const char* passKindName(PassKind kind);

/**
 * One step of a matching plan.
 *
 * nodeType selects the nodes whose base type matches (all nodes when empty). names holds the
 * attributes (Attrs), relations (ManyToOne) or the reverse relation (OneToMany, first entry).
 */
struct PlanStep {
    PassKind kind = PassKind::Initial;
    std::string nodeType;
    std::vector<std::string> names;
    std::vector<std::string> allowedSubtypes;
};

struct Resolved {
    MatchSet matches;
};

using DisambiguationOutcome = std::variant<Resolved, MergeRequired>;

/**
 * Runs a matching plan over one graph with a fresh MatchSet.
 *
 * Nodes that already have matches are not offered to later steps, except to the initial pass.
 * The first MergeRequired ends the run.
 */
class Disambiguator {
public:
    Disambiguator(const graph::Graph& graph, metadata::CandidateStore& store,
                  config::DisambiguationConfig config = {});

    static std::vector<PlanStep> defaultPlan();

    Result<DisambiguationOutcome> run(const std::vector<PlanStep>& plan = defaultPlan());

private:
    NodeList selectNodes(const PlanStep& step, const MatchSet& matches) const;

    const graph::Graph& graph_;
    metadata::CandidateStore& store_;
    DatabaseStrategy strategy_;
};

} // namespace disambig::disambiguation
