#pragma once

#include <disambig/graph/node.h>
#include <disambig/metadata/candidate_store.h>
#include <disambig/normalize/name_parser.h>

#include <array>
#include <vector>

namespace disambig::disambiguation {

// {full name equal, (first, last) equal, (first initial, last) equal}
using NameKey = std::array<bool, 3>;

// cited-as NameKey, agent name NameKey, order_cited equal, concrete type equal
using SortKey = std::array<bool, 8>;

NameKey compareNames(const normalize::ParsedName& name, const normalize::ParsedName& target);

/**
 * An incoming relation node with its parsed names.
 */
struct NodeRelationNames {
    const graph::Node* relation = nullptr;
    const graph::Node* agent = nullptr;
    normalize::ParsedName citedAs;
    normalize::ParsedName agentName;
};

/**
 * A persisted relation with its parsed names.
 */
struct CandidateRelationNames {
    const metadata::AgentWorkRelationRecord* record = nullptr;
    normalize::ParsedName citedAs;
    normalize::ParsedName agentName;
};

/**
 * Score of one persisted relation against one incoming relation node.
 */
class ComparableAgentWorkRelation {
public:
    ComparableAgentWorkRelation(const NodeRelationNames& node,
                                const CandidateRelationNames& candidate);

    // At least one cited-as component matched
    bool validMatch() const;

    const SortKey& sortKey() const { return sortKey_; }
    const CandidateRelationNames& candidate() const { return *candidate_; }

private:
    const CandidateRelationNames* candidate_;
    NameKey citedAsKey_;
    SortKey sortKey_;
};

/**
 * Highest sort key among the valid candidates; ties go to the earliest candidate.
 * nullptr when no candidate is valid.
 */
const CandidateRelationNames*
selectBestRelation(const NodeRelationNames& node,
                   const std::vector<CandidateRelationNames>& candidates);

} // namespace disambig::disambiguation
