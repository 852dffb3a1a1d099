#include <disambig/disambiguation/relation_comparator.h>

#include <algorithm>
#include <optional>
#include <string>

namespace disambig::disambiguation {

namespace {

// First character, not first byte: "Émile" and "Öskar" share a UTF-8 lead byte
std::optional<std::string> initial(const std::string& part) {
    if (part.empty()) {
        return std::nullopt;
    }
    return normalize::firstCodePoint(part);
}

std::optional<std::int64_t> nodeOrderCited(const graph::Node& node) {
    const auto& value = node.attr("order_cited");
    if (value.is_number_integer()) {
        return value.get<std::int64_t>();
    }
    return std::nullopt;
}

} // namespace

NameKey compareNames(const normalize::ParsedName& name, const normalize::ParsedName& target) {
    return {
        name.fullName == target.fullName,
        name.first == target.first && name.last == target.last,
        initial(name.first) == initial(target.first) && name.last == target.last,
    };
}

ComparableAgentWorkRelation::ComparableAgentWorkRelation(const NodeRelationNames& node,
                                                         const CandidateRelationNames& candidate)
    : candidate_(&candidate), citedAsKey_(compareNames(candidate.citedAs, node.citedAs)) {
    const auto agentKey = compareNames(candidate.agentName, node.agentName);
    const auto& relation = candidate.record->relation;

    std::copy(citedAsKey_.begin(), citedAsKey_.end(), sortKey_.begin());
    std::copy(agentKey.begin(), agentKey.end(), sortKey_.begin() + 3);
    sortKey_[6] = relation.intField("order_cited") == nodeOrderCited(*node.relation);
    sortKey_[7] = relation.concreteType == node.relation->type();
}

bool ComparableAgentWorkRelation::validMatch() const {
    return std::any_of(citedAsKey_.begin(), citedAsKey_.end(), [](bool b) { return b; });
}

const CandidateRelationNames*
selectBestRelation(const NodeRelationNames& node,
                   const std::vector<CandidateRelationNames>& candidates) {
    std::optional<ComparableAgentWorkRelation> best;
    for (const auto& candidate : candidates) {
        ComparableAgentWorkRelation comparable(node, candidate);
        if (!comparable.validMatch()) {
            continue;
        }
        if (!best || best->sortKey() < comparable.sortKey()) {
            best = comparable;
        }
    }
    return best ? &best->candidate() : nullptr;
}

} // namespace disambig::disambiguation
