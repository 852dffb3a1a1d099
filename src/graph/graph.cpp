#include <disambig/graph/graph.h>

#include <algorithm>
#include <string>
#include <utility>

namespace disambig::graph {

Node::Node(NodeId id, std::string type) : id_(std::move(id)), type_(std::move(type)) {}

const nlohmann::json& Node::attr(std::string_view name) const {
    static const nlohmann::json kNull;
    auto it = attrs_.find(std::string(name));
    return it == attrs_.end() ? kNull : *it;
}

std::optional<std::string> Node::stringAttr(std::string_view name) const {
    const auto& value = attr(name);
    if (!value.is_string()) {
        return std::nullopt;
    }
    return value.get<std::string>();
}

void Node::setAttr(const std::string& name, nlohmann::json value) {
    attrs_[name] = std::move(value);
}

bool Node::setAttrs(nlohmann::json attrs) {
    if (!attrs.is_object()) {
        return false;
    }
    attrs_ = std::move(attrs);
    return true;
}

std::optional<NodeId> Node::related(std::string_view relationName) const {
    auto it = relations_.find(relationName);
    if (it == relations_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void Node::setRelated(const std::string& relationName, NodeId target) {
    relations_[relationName] = std::move(target);
}

void Node::clearRelated(std::string_view relationName) {
    if (auto it = relations_.find(relationName); it != relations_.end()) {
        relations_.erase(it);
    }
}

Result<Node*> Graph::addNode(NodeId id, std::string type) {
    if (id.empty()) {
        return Error{ErrorCode::InvalidArgument, "node id must be non-empty"};
    }
    if (nodes_.contains(id)) {
        return Error{ErrorCode::InvalidData, "duplicate node id " + id};
    }
    auto node = std::make_unique<Node>(id, std::move(type));
    Node* raw = node.get();
    order_.push_back(id);
    nodes_.emplace(std::move(id), std::move(node));
    return raw;
}

Node* Graph::get(std::string_view id) {
    auto it = nodes_.find(std::string(id));
    return it == nodes_.end() ? nullptr : it->second.get();
}

const Node* Graph::get(std::string_view id) const {
    auto it = nodes_.find(std::string(id));
    return it == nodes_.end() ? nullptr : it->second.get();
}

Result<void> Graph::link(std::string_view source, const std::string& relationName,
                         std::string_view target) {
    Node* from = get(source);
    if (!from) {
        return Error{ErrorCode::NotFound, "no node " + std::string(source)};
    }
    if (!get(target)) {
        return Error{ErrorCode::NotFound, "node " + from->id() + " references unknown node " +
                                              std::string(target) + " via " + relationName};
    }
    if (auto previous = from->related(relationName)) {
        unindex(from->id(), relationName, *previous);
    }
    from->setRelated(relationName, NodeId(target));
    inbound_[NodeId(target)].emplace_back(relationName, from->id());
    return {};
}

void Graph::unindex(const NodeId& source, const std::string& relationName, const NodeId& target) {
    auto it = inbound_.find(target);
    if (it == inbound_.end()) {
        return;
    }
    auto& edges = it->second;
    edges.erase(std::remove(edges.begin(), edges.end(), InboundEdge{relationName, source}),
                edges.end());
    if (edges.empty()) {
        inbound_.erase(it);
    }
}

bool Graph::remove(std::string_view id) {
    auto it = nodes_.find(std::string(id));
    if (it == nodes_.end()) {
        return false;
    }
    const NodeId removed = it->first;

    for (const auto& [relationName, target] : it->second->relations()) {
        unindex(removed, relationName, target);
    }
    if (auto edges = inbound_.find(removed); edges != inbound_.end()) {
        for (const auto& [relationName, source] : edges->second) {
            if (auto src = nodes_.find(source); src != nodes_.end()) {
                src->second->clearRelated(relationName);
            }
        }
        inbound_.erase(edges);
    }

    nodes_.erase(it);
    order_.erase(std::remove(order_.begin(), order_.end(), removed), order_.end());
    return true;
}

const Node* Graph::related(const Node& node, std::string_view relationName) const {
    auto target = node.related(relationName);
    if (!target) {
        return nullptr;
    }
    return get(*target);
}

std::vector<const Node*> Graph::inbound(const Node& node, std::string_view edge) const {
    std::vector<const Node*> out;
    auto it = inbound_.find(node.id());
    if (it == inbound_.end()) {
        return out;
    }
    for (const auto& [relationName, source] : it->second) {
        if (relationName == edge) {
            out.push_back(nodes_.at(source).get());
        }
    }
    return out;
}

std::vector<Node*> Graph::nodes() {
    std::vector<Node*> out;
    out.reserve(order_.size());
    for (const auto& id : order_) {
        out.push_back(nodes_.at(id).get());
    }
    return out;
}

std::vector<const Node*> Graph::nodes() const {
    std::vector<const Node*> out;
    out.reserve(order_.size());
    for (const auto& id : order_) {
        out.push_back(nodes_.at(id).get());
    }
    return out;
}

} // namespace disambig::graph
