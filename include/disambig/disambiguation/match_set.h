#pragma once

#include <disambig/graph/node.h>
#include <disambig/metadata/candidate_store.h>

#include <nlohmann/json_fwd.hpp>

#include <cstddef>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace disambig::disambiguation {

/**
 * Node -> candidate set association built up by the matching passes.
 *
 * Candidates are deduplicated per node on (type, id). Nodes and their candidates keep the
 * order in which they were first added.
 */
class MatchSet {
public:
    // Returns false when the candidate was already recorded for the node
    bool addMatch(const graph::NodeId& nodeId, metadata::Candidate candidate);
    std::size_t addMatches(const graph::NodeId& nodeId, std::vector<metadata::Candidate> candidates);

    bool hasMatches(std::string_view nodeId) const;

    // Empty when the node has no match
    const std::vector<metadata::Candidate>& getMatches(std::string_view nodeId) const;

    const std::vector<graph::NodeId>& nodeIds() const { return order_; }
    std::size_t size() const { return order_.size(); }
    bool empty() const { return order_.empty(); }

    // {"<node id>": [{"type": ..., "id": ...}, ...], ...}
    nlohmann::json toJson() const;

private:
    std::unordered_map<graph::NodeId, std::vector<metadata::Candidate>> matches_;
    std::vector<graph::NodeId> order_;
};

} // namespace disambig::disambiguation
