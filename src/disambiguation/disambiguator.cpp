#include <disambig/disambiguation/disambiguator.h>

#include <spdlog/spdlog.h>

#include <utility>

namespace disambig::disambiguation {

const char* passKindName(PassKind kind) {
    switch (kind) {
        case PassKind::Initial: return "initial";
        case PassKind::Attrs: return "attrs";
        case PassKind::ManyToOne: return "many-to-one";
        case PassKind::OneToMany: return "one-to-many";
        case PassKind::Subjects: return "subjects";
        case PassKind::AgentWorkRelations: return "agent-work-relations";
    }
    return "unknown";
}

Disambiguator::Disambiguator(const graph::Graph& graph, metadata::CandidateStore& store,
                             config::DisambiguationConfig config)
    : graph_(graph), store_(store), strategy_(graph, store, std::move(config)) {}

std::vector<PlanStep> Disambiguator::defaultPlan() {
    return {
        {PassKind::Initial, "", {}, {}},
        {PassKind::Attrs, "workidentifier", {"uri"}, {}},
        {PassKind::Attrs, "agentidentifier", {"uri"}, {}},
        {PassKind::Subjects, "subject", {}, {}},
        {PassKind::Attrs, "tag", {"name"}, {}},
        {PassKind::OneToMany, "creativework", {"identifiers"}, {}},
        {PassKind::OneToMany, "agent", {"identifiers"}, {}},
        {PassKind::ManyToOne, "throughtags", {"tag", "creative_work"}, {}},
        {PassKind::AgentWorkRelations, "agentworkrelation", {}, {}},
    };
}

NodeList Disambiguator::selectNodes(const PlanStep& step, const MatchSet& matches) const {
    NodeList selected;
    for (const auto* node : graph_.nodes()) {
        if (!step.nodeType.empty()) {
            const auto* type = store_.schema().baseTypeOf(node->type());
            if (!type || type->name != step.nodeType) {
                continue;
            }
        }
        if (step.kind != PassKind::Initial && matches.hasMatches(node->id())) {
            continue;
        }
        selected.push_back(node);
    }
    return selected;
}

Result<DisambiguationOutcome> Disambiguator::run(const std::vector<PlanStep>& plan) {
    MatchSet matches;

    for (const auto& step : plan) {
        const auto nodes = selectNodes(step, matches);
        spdlog::debug("{} pass over {} {} nodes", passKindName(step.kind), nodes.size(),
                      step.nodeType.empty() ? "graph" : step.nodeType);
        if (nodes.empty()) {
            continue;
        }

        Result<void> result;
        switch (step.kind) {
            case PassKind::Initial:
                result = strategy_.initialPass(nodes, matches);
                break;
            case PassKind::Attrs:
                result = strategy_.matchByAttrs(nodes, matches, step.nodeType, step.names,
                                                step.allowedSubtypes);
                break;
            case PassKind::ManyToOne: {
                auto outcome = strategy_.matchByManyToOne(nodes, matches, step.nodeType,
                                                          step.names, step.allowedSubtypes);
                if (!outcome) {
                    return outcome.error();
                }
                if (auto* merge = std::get_if<MergeRequired>(&outcome.value())) {
                    spdlog::info("Merge required for {}: {}", merge->nodeId, merge->message);
                    return DisambiguationOutcome{std::move(*merge)};
                }
                break;
            }
            case PassKind::OneToMany:
                if (step.names.empty()) {
                    return Error{ErrorCode::InvalidArgument,
                                 "one-to-many step for " + step.nodeType + " names no relation"};
                }
                result = strategy_.matchByOneToMany(nodes, matches, step.nodeType,
                                                    step.names.front());
                break;
            case PassKind::Subjects:
                result = strategy_.matchSubjects(nodes, matches);
                break;
            case PassKind::AgentWorkRelations:
                result = strategy_.matchAgentWorkRelations(nodes, matches);
                break;
        }
        if (!result) {
            return result.error();
        }
    }

    spdlog::debug("Disambiguation matched {} of {} nodes", matches.size(), graph_.size());
    return DisambiguationOutcome{Resolved{std::move(matches)}};
}

} // namespace disambig::disambiguation
