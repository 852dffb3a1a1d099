#include <disambig/disambiguation/database_strategy.h>
#include <disambig/disambiguation/id_obfuscator.h>
#include <disambig/disambiguation/relation_comparator.h>
#include <disambig/normalize/name_parser.h>

#include <spdlog/spdlog.h>

#include <memory>
#include <set>
#include <unordered_map>
#include <unordered_set>
#include <utility>

namespace disambig::disambiguation {

using metadata::Candidate;
using metadata::TypeSchema;
namespace sql = metadata::sql;

DatabaseStrategy::DatabaseStrategy(const graph::Graph& graph, metadata::CandidateStore& store,
                                   config::DisambiguationConfig config)
    : graph_(graph), store_(store), config_(std::move(config)) {}

Result<const TypeSchema*> DatabaseStrategy::targetSchema(std::string_view targetType) const {
    const auto* target = store_.schema().find(targetType);
    if (!target) {
        return Error{ErrorCode::InvalidArgument, "unknown target type: " + std::string(targetType)};
    }
    return target;
}

bool DatabaseStrategy::isA(const graph::Node& node, std::string_view baseType) const {
    const auto* type = store_.schema().baseTypeOf(node.type());
    return type && type->name == baseType;
}

Result<void> DatabaseStrategy::initialPass(const NodeList& nodes, MatchSet& matches) {
    const auto& schema = store_.schema();
    std::size_t resolved = 0;

    for (const auto* node : nodes) {
        if (node->isBlank()) {
            continue;
        }
        auto decoded = IdObfuscator::decode(node->id());
        if (!decoded) {
            spdlog::debug("Ignoring malformed id {}", node->id());
            continue;
        }
        const auto* target = schema.findByContentType(decoded.value().contentTypeId);
        if (!target) {
            spdlog::debug("Ignoring id {} of unknown content type {}", node->id(),
                          decoded.value().contentTypeId);
            continue;
        }
        auto record = store_.getById(*target, decoded.value().pk);
        if (!record) {
            return record.error();
        }
        if (!record.value()) {
            spdlog::debug("Ignoring id {}: no {} {}", node->id(), target->name,
                          decoded.value().pk);
            continue;
        }
        if (matches.addMatch(node->id(), std::move(*record.value()))) {
            ++resolved;
        }
    }
    spdlog::debug("initial pass: {} of {} nodes resolved by id", resolved, nodes.size());
    return {};
}

Result<std::size_t>
DatabaseStrategy::matchQuery(const std::vector<const graph::Node*>& nodes, MatchSet& matches,
                             const TypeSchema& target, std::vector<std::string> columns,
                             sql::NodeJoinQueryBuilder::ValueGetter getValues,
                             const std::vector<std::string>& allowedSubtypes) {
    if (nodes.empty()) {
        return std::size_t{0};
    }

    std::unique_ptr<sql::NodeJoinQueryBuilder> builder;
    if (!allowedSubtypes.empty()) {
        if (!target.typeColumn) {
            return Error{ErrorCode::InvalidArgument,
                         target.name + " has no subtypes to constrain on"};
        }
        std::vector<std::string> tags;
        tags.reserve(allowedSubtypes.size());
        for (const auto& subtype : allowedSubtypes) {
            const auto* base = store_.schema().baseTypeOf(subtype);
            if (!base || base->name != target.name) {
                return Error{ErrorCode::InvalidArgument,
                             subtype + " is not a subtype of " + target.name};
            }
            tags.push_back(store_.schema().subtypeTag(subtype));
        }
        builder = std::make_unique<sql::ConstrainedTypeQueryBuilder>(
            target.table, std::move(columns), std::move(getValues), *target.typeColumn,
            std::move(tags));
    } else {
        builder = std::make_unique<sql::NodeJoinQueryBuilder>(target.table, std::move(columns),
                                                              std::move(getValues));
    }

    auto rows = store_.runNodeJoin(target, builder->build(nodes));
    if (!rows) {
        return rows.error();
    }

    std::size_t added = 0;
    for (auto& row : rows.value()) {
        if (matches.addMatch(row.nodeId, std::move(row.candidate))) {
            ++added;
        }
    }
    return added;
}

Result<void> DatabaseStrategy::matchByAttrs(const NodeList& nodes, MatchSet& matches,
                                            std::string_view targetType,
                                            const std::vector<std::string>& attrNames,
                                            const std::vector<std::string>& allowedSubtypes) {
    auto target = targetSchema(targetType);
    if (!target) {
        return target.error();
    }
    if (attrNames.empty()) {
        return Error{ErrorCode::InvalidArgument, "no attributes to match on"};
    }

    std::vector<std::string> columns;
    columns.reserve(attrNames.size());
    for (const auto& attr : attrNames) {
        auto it = target.value()->attributes.find(attr);
        if (it == target.value()->attributes.end()) {
            return Error{ErrorCode::InvalidArgument,
                         std::string(targetType) + " has no attribute " + attr};
        }
        columns.push_back(it->second);
    }

    auto getValues = [attrNames](const graph::Node& node) {
        std::vector<sql::SqlValue> values;
        values.reserve(attrNames.size());
        for (const auto& attr : attrNames) {
            values.push_back(sql::toSqlValue(node.attr(attr)));
        }
        return values;
    };

    auto added = matchQuery(nodes, matches, *target.value(), std::move(columns),
                            std::move(getValues), allowedSubtypes);
    if (!added) {
        return added.error();
    }
    spdlog::debug("{} by attrs: {} nodes, {} matches added", targetType, nodes.size(),
                  added.value());
    return {};
}

Result<PassOutcome>
DatabaseStrategy::matchByManyToOne(const NodeList& nodes, MatchSet& matches,
                                   std::string_view targetType,
                                   const std::vector<std::string>& relationNames,
                                   const std::vector<std::string>& allowedSubtypes) {
    auto target = targetSchema(targetType);
    if (!target) {
        return target.error();
    }
    if (relationNames.empty()) {
        return Error{ErrorCode::InvalidArgument, "no relations to match on"};
    }

    std::vector<std::string> columns;
    columns.reserve(relationNames.size());
    for (const auto& name : relationNames) {
        const auto* relation = target.value()->relation(name);
        if (!relation) {
            return Error{ErrorCode::InvalidArgument,
                         std::string(targetType) + " has no relation " + name};
        }
        columns.push_back(relation->column);
    }

    std::vector<const graph::Node*> keyed;
    std::unordered_map<graph::NodeId, std::vector<sql::SqlValue>> keys;

    for (const auto* node : nodes) {
        std::vector<sql::SqlValue> values;
        bool complete = true;
        for (const auto& name : relationNames) {
            const auto* related = graph_.related(*node, name);
            if (!related) {
                complete = false;
                continue;
            }
            const auto& relatedMatches = matches.getMatches(related->id());
            if (relatedMatches.size() > 1) {
                MergeRequired merge;
                merge.nodeId = node->id();
                merge.relationName = name;
                merge.relatedNodeId = related->id();
                merge.candidates = relatedMatches;
                merge.message = "Multiple matches for node " + related->id();
                spdlog::debug("{} by many-to-one: {}", targetType, merge.message);
                return PassOutcome{std::move(merge)};
            }
            if (relatedMatches.empty()) {
                complete = false;
                continue;
            }
            values.emplace_back(relatedMatches.front().id);
        }
        if (complete) {
            keyed.push_back(node);
            keys.emplace(node->id(), std::move(values));
        }
    }

    auto getValues = [&keys](const graph::Node& node) { return keys.at(node.id()); };
    auto added = matchQuery(keyed, matches, *target.value(), std::move(columns),
                            std::move(getValues), allowedSubtypes);
    if (!added) {
        return added.error();
    }
    spdlog::debug("{} by many-to-one: {} of {} nodes keyed, {} matches added", targetType,
                  keyed.size(), nodes.size(), added.value());
    return PassOutcome{PassCompleted{added.value()}};
}

Result<void> DatabaseStrategy::matchByOneToMany(const NodeList& nodes, MatchSet& matches,
                                                std::string_view targetType,
                                                std::string_view relationName) {
    auto target = targetSchema(targetType);
    if (!target) {
        return target.error();
    }
    const auto* reverse = target.value()->reverseRelation(relationName);
    if (!reverse) {
        return Error{ErrorCode::InvalidArgument, std::string(targetType) +
                                                     " has no reverse relation " +
                                                     std::string(relationName)};
    }
    const auto* source = store_.schema().find(reverse->sourceType);
    const auto* edge = source ? source->relation(reverse->edge) : nullptr;
    if (!edge) {
        return Error{ErrorCode::InvalidState,
                     "reverse relation " + std::string(relationName) + " has no foreign key"};
    }

    std::size_t added = 0;
    for (const auto* node : nodes) {
        std::set<std::int64_t> ids;
        for (const auto* related : graph_.inbound(*node, reverse->edge)) {
            if (!isA(*related, source->name)) {
                continue;
            }
            for (const auto& candidate : matches.getMatches(related->id())) {
                if (candidate.type != source->name) {
                    continue;
                }
                if (auto fk = candidate.intField(edge->column)) {
                    ids.insert(*fk);
                }
            }
        }
        if (ids.empty()) {
            continue;
        }

        auto records =
            store_.getByIds(*target.value(), std::vector<std::int64_t>(ids.begin(), ids.end()));
        if (!records) {
            return records.error();
        }
        added += matches.addMatches(node->id(), std::move(records).value());
    }
    spdlog::debug("{} by one-to-many via {}: {} nodes, {} matches added", targetType,
                  relationName, nodes.size(), added);
    return {};
}

Result<void> DatabaseStrategy::matchSubjects(const NodeList& nodes, MatchSet& matches) {
    std::size_t added = 0;
    for (const auto* node : nodes) {
        metadata::SubjectScope scope;
        if (node->related("central_synonym")) {
            if (!config_.sourceId) {
                continue;
            }
            scope.central = false;
            scope.sourceId = config_.sourceId;
        }

        for (const char* field : {"uri", "name"}) {
            auto value = node->stringAttr(field);
            if (!value || value->empty()) {
                continue;
            }
            auto found = store_.findSubject(scope, field, *value);
            if (!found) {
                return found.error();
            }
            if (found.value()) {
                if (matches.addMatch(node->id(), std::move(*found.value()))) {
                    ++added;
                }
                break;
            }
        }
    }
    spdlog::debug("subjects: {} nodes, {} matches added", nodes.size(), added);
    return {};
}

Result<void> DatabaseStrategy::matchAgentWorkRelations(const NodeList& nodes, MatchSet& matches) {
    // Lengths are in characters, not bytes
    const auto oversized = [limit = config_.maxNameLength](const std::string& citedAs,
                                                           const std::string& agentName) {
        return normalize::utf8Length(citedAs) > limit || normalize::utf8Length(agentName) > limit;
    };

    std::vector<const graph::Node*> workNodes;
    std::unordered_set<graph::NodeId> seenWorks;
    for (const auto* node : nodes) {
        const auto* work = graph_.related(*node, "creative_work");
        if (work && seenWorks.insert(work->id()).second) {
            workNodes.push_back(work);
        }
    }

    std::size_t added = 0;
    for (const auto* workNode : workNodes) {
        const auto workMatches = matches.getMatches(workNode->id());
        for (const auto& work : workMatches) {
            if (work.type != "creativework") {
                continue;
            }

            auto count = store_.countAgentRelations(work.id);
            if (!count) {
                return count.error();
            }
            if (count.value() > config_.maxAgentRelations) {
                spdlog::debug("Skipping work {} with {} agent relations (limit {})", work.id,
                              count.value(), config_.maxAgentRelations);
                continue;
            }

            std::vector<const graph::Node*> relationNodes;
            for (const auto* related : graph_.inbound(*workNode, "creative_work")) {
                if (isA(*related, "agentworkrelation") && !matches.hasMatches(related->id())) {
                    relationNodes.push_back(related);
                }
            }
            if (relationNodes.empty()) {
                continue;
            }

            auto records = store_.agentRelationsForWork(work.id);
            if (!records) {
                return records.error();
            }

            std::vector<CandidateRelationNames> candidates;
            candidates.reserve(records.value().size());
            for (const auto& record : records.value()) {
                const auto citedAs = record.relation.stringField("cited_as").value_or("");
                const auto agentName = record.agent.stringField("name").value_or("");
                if (oversized(citedAs, agentName)) {
                    spdlog::debug("Not comparing oversized names of relation {}",
                                  record.relation.id);
                    continue;
                }
                candidates.push_back({&record, normalize::parseHumanName(citedAs),
                                      normalize::parseHumanName(agentName)});
            }

            for (const auto* relationNode : relationNodes) {
                const auto* agent = graph_.related(*relationNode, "agent");
                if (!agent) {
                    continue;
                }
                const auto citedAs = relationNode->stringAttr("cited_as").value_or("");
                const auto agentName = agent->stringAttr("name").value_or("");
                if (oversized(citedAs, agentName)) {
                    spdlog::debug("Not comparing oversized names of node {}", relationNode->id());
                    continue;
                }

                NodeRelationNames names{relationNode, agent, normalize::parseHumanName(citedAs),
                                        normalize::parseHumanName(agentName)};
                const auto* best = selectBestRelation(names, candidates);
                if (!best) {
                    continue;
                }
                matches.addMatch(agent->id(), best->record->agent);
                if (matches.addMatch(relationNode->id(), best->record->relation)) {
                    ++added;
                }
            }
        }
    }
    spdlog::debug("agent/work relations: {} works, {} relations matched", workNodes.size(),
                  added);
    return {};
}

} // namespace disambig::disambiguation
