#pragma once

#include <nlohmann/json.hpp>

#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace disambig::graph {

using NodeId = std::string;

/**
 * An entity extracted from a harvested document.
 *
 * Attributes are a JSON object (attribute name -> scalar value). To-one relations map a
 * relation name to the id of another node in the same graph; reverse relations are derived
 * by the owning Graph.
 */
class Node {
public:
    Node(NodeId id, std::string type);

    const NodeId& id() const { return id_; }
    const std::string& type() const { return type_; }

    // Locally scoped temporary id ("_:...") as opposed to a reference to a persisted record
    bool isBlank() const { return id_.starts_with("_:"); }

    const nlohmann::json& attrs() const { return attrs_; }

    // Value of an attribute, or a null json when absent
    const nlohmann::json& attr(std::string_view name) const;

    // String attribute; nullopt when absent or not a string
    std::optional<std::string> stringAttr(std::string_view name) const;

    void setAttr(const std::string& name, nlohmann::json value);

    // Replaces every attribute; non-object values are rejected
    bool setAttrs(nlohmann::json attrs);

    std::optional<NodeId> related(std::string_view relationName) const;

    const std::map<std::string, NodeId, std::less<>>& relations() const { return relations_; }

private:
    friend class Graph;

    // Edges change through Graph::link so its reverse index stays current
    void setRelated(const std::string& relationName, NodeId target);
    void clearRelated(std::string_view relationName);

    NodeId id_;
    std::string type_;
    nlohmann::json attrs_ = nlohmann::json::object();
    std::map<std::string, NodeId, std::less<>> relations_;
};

} // namespace disambig::graph
