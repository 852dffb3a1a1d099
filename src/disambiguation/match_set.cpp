#include <disambig/disambiguation/match_set.h>

#include <nlohmann/json.hpp>

#include <algorithm>

namespace disambig::disambiguation {

bool MatchSet::addMatch(const graph::NodeId& nodeId, metadata::Candidate candidate) {
    auto [it, inserted] = matches_.try_emplace(nodeId);
    auto& candidates = it->second;
    if (std::find(candidates.begin(), candidates.end(), candidate) != candidates.end()) {
        return false;
    }
    if (inserted || candidates.empty()) {
        order_.push_back(nodeId);
    }
    candidates.push_back(std::move(candidate));
    return true;
}

std::size_t MatchSet::addMatches(const graph::NodeId& nodeId,
                                 std::vector<metadata::Candidate> candidates) {
    std::size_t added = 0;
    for (auto& candidate : candidates) {
        if (addMatch(nodeId, std::move(candidate))) {
            ++added;
        }
    }
    return added;
}

bool MatchSet::hasMatches(std::string_view nodeId) const {
    auto it = matches_.find(graph::NodeId(nodeId));
    return it != matches_.end() && !it->second.empty();
}

const std::vector<metadata::Candidate>& MatchSet::getMatches(std::string_view nodeId) const {
    static const std::vector<metadata::Candidate> kNone;
    auto it = matches_.find(graph::NodeId(nodeId));
    return it == matches_.end() ? kNone : it->second;
}

nlohmann::json MatchSet::toJson() const {
    auto out = nlohmann::json::object();
    for (const auto& nodeId : order_) {
        auto& list = out[nodeId] = nlohmann::json::array();
        for (const auto& candidate : getMatches(nodeId)) {
            list.push_back({{"type", candidate.type}, {"id", candidate.id}});
        }
    }
    return out;
}

} // namespace disambig::disambiguation
