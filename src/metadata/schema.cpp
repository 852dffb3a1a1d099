#include <disambig/metadata/schema.h>

#include <spdlog/spdlog.h>

#include <algorithm>

namespace disambig::metadata {

const RelationSpec* TypeSchema::relation(std::string_view relationName) const {
    auto it = std::find_if(relations.begin(), relations.end(),
                           [&](const RelationSpec& r) { return r.name == relationName; });
    return it == relations.end() ? nullptr : &(*it);
}

const ReverseRelationSpec* TypeSchema::reverseRelation(std::string_view relationName) const {
    auto it = std::find_if(reverseRelations.begin(), reverseRelations.end(),
                           [&](const ReverseRelationSpec& r) { return r.name == relationName; });
    return it == reverseRelations.end() ? nullptr : &(*it);
}

std::optional<std::string> TypeSchema::column(std::string_view name) const {
    if (auto it = attributes.find(name); it != attributes.end()) {
        return it->second;
    }
    if (const auto* rel = relation(name)) {
        return rel->column;
    }
    return std::nullopt;
}

Schema::Schema(std::string appLabel) : appLabel_(std::move(appLabel)) {}

Result<void> Schema::registerType(TypeSchema type) {
    if (type.name.empty() || type.table.empty()) {
        return Error{ErrorCode::InvalidArgument, "type name and table must be non-empty"};
    }
    if (types_.contains(type.name)) {
        return Error{ErrorCode::InvalidArgument, "type already registered: " + type.name};
    }
    if (byContentType_.contains(type.contentTypeId)) {
        return Error{ErrorCode::InvalidArgument,
                     "content type id already registered: " + std::to_string(type.contentTypeId)};
    }
    if (std::find(type.subtypes.begin(), type.subtypes.end(), type.name) == type.subtypes.end()) {
        type.subtypes.insert(type.subtypes.begin(), type.name);
    }
    for (const auto& subtype : type.subtypes) {
        if (concreteToBase_.contains(subtype)) {
            return Error{ErrorCode::InvalidArgument,
                         "subtype " + subtype + " already belongs to another type"};
        }
    }

    for (const auto& subtype : type.subtypes) {
        concreteToBase_.emplace(subtype, type.name);
    }
    byContentType_.emplace(type.contentTypeId, type.name);
    auto name = type.name;
    types_.emplace(std::move(name), std::move(type));
    return {};
}

const TypeSchema* Schema::find(std::string_view name) const {
    auto it = types_.find(name);
    return it == types_.end() ? nullptr : &it->second;
}

const TypeSchema* Schema::findByContentType(int contentTypeId) const {
    auto it = byContentType_.find(contentTypeId);
    return it == byContentType_.end() ? nullptr : find(it->second);
}

const TypeSchema* Schema::baseTypeOf(std::string_view concreteType) const {
    auto it = concreteToBase_.find(concreteType);
    return it == concreteToBase_.end() ? nullptr : find(it->second);
}

std::string Schema::subtypeTag(std::string_view subtype) const {
    std::string tag;
    tag.reserve(appLabel_.size() + 1 + subtype.size());
    tag += appLabel_;
    tag += '.';
    tag += subtype;
    return tag;
}

std::string Schema::subtypeFromTag(std::string_view tag) const {
    if (tag.size() > appLabel_.size() && tag.starts_with(appLabel_) &&
        tag[appLabel_.size()] == '.') {
        return std::string(tag.substr(appLabel_.size() + 1));
    }
    return std::string(tag);
}

std::vector<std::string> Schema::typeNames() const {
    std::vector<std::string> names;
    names.reserve(types_.size());
    for (const auto& [name, _] : types_) {
        names.push_back(name);
    }
    return names;
}

namespace {

TypeSchema identifierType(std::string name, int contentTypeId, std::string ownerRelation,
                          std::string ownerType) {
    TypeSchema t;
    t.table = "share_" + name;
    t.name = std::move(name);
    t.contentTypeId = contentTypeId;
    t.attributes = {{"uri", "uri"}, {"host", "host"}, {"scheme", "scheme"}};
    t.relations.push_back({ownerRelation, ownerRelation + "_id", std::move(ownerType)});
    return t;
}

} // namespace

Schema Schema::share() {
    Schema schema;
    std::vector<TypeSchema> types;

    TypeSchema source;
    source.name = "source";
    source.table = "share_source";
    source.contentTypeId = 1;
    source.attributes = {{"name", "name"}, {"long_title", "long_title"}};
    types.push_back(std::move(source));

    TypeSchema work;
    work.name = "creativework";
    work.table = "share_creativework";
    work.contentTypeId = 10;
    work.attributes = {{"title", "title"},
                       {"description", "description"},
                       {"language", "language"},
                       {"date_published", "date_published"}};
    work.reverseRelations = {{"identifiers", "workidentifier", "creative_work"},
                             {"agent_relations", "agentworkrelation", "creative_work"},
                             {"tag_relations", "throughtags", "creative_work"}};
    work.typeColumn = "type";
    work.subtypes = {"creativework", "article",      "book",         "conferencepaper",
                     "dataset",      "dissertation", "lesson",       "poster",
                     "preprint",     "presentation", "project",      "projectregistration",
                     "publication",  "registration", "report",       "repository",
                     "retraction",   "software",     "thesis",       "workingpaper"};
    types.push_back(std::move(work));

    TypeSchema agent;
    agent.name = "agent";
    agent.table = "share_agent";
    agent.contentTypeId = 11;
    agent.attributes = {
        {"name", "name"}, {"given_name", "given_name"}, {"family_name", "family_name"}};
    agent.reverseRelations = {{"identifiers", "agentidentifier", "agent"},
                              {"work_relations", "agentworkrelation", "agent"}};
    agent.typeColumn = "type";
    agent.subtypes = {"agent",      "organization", "consortium",
                      "department", "institution",  "person"};
    types.push_back(std::move(agent));

    TypeSchema relation;
    relation.name = "agentworkrelation";
    relation.table = "share_agentworkrelation";
    relation.contentTypeId = 12;
    relation.attributes = {{"cited_as", "cited_as"}, {"order_cited", "order_cited"}};
    relation.relations = {{"creative_work", "creative_work_id", "creativework"},
                          {"agent", "agent_id", "agent"}};
    relation.typeColumn = "type";
    relation.subtypes = {"agentworkrelation", "contributor",
                         "creator",           "principalinvestigator",
                         "principalinvestigatorcontact", "funder",
                         "host",              "publisher"};
    types.push_back(std::move(relation));

    types.push_back(identifierType("workidentifier", 13, "creative_work", "creativework"));
    types.push_back(identifierType("agentidentifier", 14, "agent", "agent"));

    TypeSchema subject;
    subject.name = "subject";
    subject.table = "share_subject";
    subject.contentTypeId = 15;
    subject.attributes = {{"name", "name"}, {"uri", "uri"}};
    subject.relations = {{"parent", "parent_id", "subject"},
                         {"central_synonym", "central_synonym_id", "subject"},
                         {"taxonomy", "taxonomy_id", "subjecttaxonomy"}};
    types.push_back(std::move(subject));

    TypeSchema taxonomy;
    taxonomy.name = "subjecttaxonomy";
    taxonomy.table = "share_subjecttaxonomy";
    taxonomy.contentTypeId = 16;
    taxonomy.relations = {{"source", "source_id", "source"}};
    types.push_back(std::move(taxonomy));

    TypeSchema tag;
    tag.name = "tag";
    tag.table = "share_tag";
    tag.contentTypeId = 17;
    tag.attributes = {{"name", "name"}};
    types.push_back(std::move(tag));

    TypeSchema throughTags;
    throughTags.name = "throughtags";
    throughTags.table = "share_throughtags";
    throughTags.contentTypeId = 18;
    throughTags.relations = {{"tag", "tag_id", "tag"},
                             {"creative_work", "creative_work_id", "creativework"}};
    types.push_back(std::move(throughTags));

    for (auto& t : types) {
        auto r = schema.registerType(std::move(t));
        if (!r) {
            spdlog::error("default schema registration failed: {}", r.error().message);
        }
    }
    return schema;
}

} // namespace disambig::metadata
