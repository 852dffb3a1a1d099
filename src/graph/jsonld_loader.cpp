#include <disambig/graph/graph.h>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <utility>

namespace disambig::graph {

namespace {

bool isReference(const nlohmann::json& value) {
    return value.is_object() && value.contains("@id");
}

bool isReferenceList(const nlohmann::json& value) {
    return value.is_array() && !value.empty() &&
           std::all_of(value.begin(), value.end(), [](const auto& v) { return isReference(v); });
}

std::string lowerCopy(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string referenceId(const nlohmann::json& ref) {
    const auto& id = ref.at("@id");
    return id.is_string() ? id.get<std::string>() : id.dump();
}

} // namespace

Result<Graph> loadJsonLdGraph(const nlohmann::json& document) {
    if (!document.is_object() || !document.contains("@graph") ||
        !document.at("@graph").is_array()) {
        return Error{ErrorCode::InvalidData, "expected an object with an @graph array"};
    }

    Graph graph;
    std::vector<std::pair<Node*, std::pair<std::string, std::string>>> pendingRelations;

    for (const auto& element : document.at("@graph")) {
        if (!element.is_object() || !element.contains("@id") || !element.contains("@type") ||
            !element.at("@type").is_string()) {
            return Error{ErrorCode::InvalidData, "graph element without @id/@type"};
        }

        auto added = graph.addNode(referenceId(element),
                                   lowerCopy(element.at("@type").get<std::string>()));
        if (!added) {
            return added.error();
        }
        Node* node = added.value();

        nlohmann::json attrs = nlohmann::json::object();
        for (const auto& [key, value] : element.items()) {
            if (key == "@id" || key == "@type") {
                continue;
            }
            if (isReference(value)) {
                pendingRelations.push_back({node, {key, referenceId(value)}});
            } else if (isReferenceList(value)) {
                continue;
            } else {
                attrs[key] = value;
            }
        }
        node->setAttrs(std::move(attrs));
    }

    for (const auto& [node, relation] : pendingRelations) {
        auto linked = graph.link(node->id(), relation.first, relation.second);
        if (!linked) {
            return Error{ErrorCode::InvalidData, linked.error().message};
        }
    }

    spdlog::debug("Loaded graph with {} nodes and {} relations", graph.size(),
                  pendingRelations.size());
    return graph;
}

} // namespace disambig::graph
