#pragma once

#include <disambig/core/types.h>
#include <disambig/graph/node.h>

#include <nlohmann/json_fwd.hpp>

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace disambig::graph {

/**
 * Mutable set of nodes under resolution for one document.
 *
 * Owns its nodes; pointers stay valid until the node is removed. Iteration follows insertion
 * order.
 */
class Graph {
public:
    Graph() = default;

    Graph(Graph&&) noexcept = default;
    Graph& operator=(Graph&&) noexcept = default;
    Graph(const Graph&) = delete;
    Graph& operator=(const Graph&) = delete;

    Result<Node*> addNode(NodeId id, std::string type);

    Node* get(std::string_view id);
    const Node* get(std::string_view id) const;

    // Points relation `relationName` of node `source` at node `target`, replacing any old edge
    Result<void> link(std::string_view source, const std::string& relationName,
                      std::string_view target);

    // Removes the node and detaches every relation pointing at it
    bool remove(std::string_view id);

    const Node* related(const Node& node, std::string_view relationName) const;

    // Nodes whose relation `edge` points at `node`, in link order
    std::vector<const Node*> inbound(const Node& node, std::string_view edge) const;

    std::vector<Node*> nodes();
    std::vector<const Node*> nodes() const;

    std::size_t size() const { return order_.size(); }
    bool empty() const { return order_.empty(); }

private:
    // (relation name, source id)
    using InboundEdge = std::pair<std::string, NodeId>;

    void unindex(const NodeId& source, const std::string& relationName, const NodeId& target);

    std::unordered_map<NodeId, std::unique_ptr<Node>> nodes_;
    std::vector<NodeId> order_;
    std::unordered_map<NodeId, std::vector<InboundEdge>> inbound_; // target -> edges into it
};

/**
 * Builds a graph from a JSON-LD document of the form {"@graph": [{"@id", "@type", ...}]}.
 *
 * Property values shaped like {"@id": ...} become to-one relations; arrays of references
 * describe reverse relations and are skipped. Everything else is an attribute.
 */
Result<Graph> loadJsonLdGraph(const nlohmann::json& document);

} // namespace disambig::graph
