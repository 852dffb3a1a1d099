#pragma once

#include <disambig/core/types.h>

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace disambig::metadata {

/**
 * To-one relation stored as a foreign key column on the owning table.
 */
struct RelationSpec {
    std::string name;       // Relation name as it appears on graph nodes (e.g. "creative_work")
    std::string column;     // FK column (e.g. "creative_work_id")
    std::string targetType; // Base type of the referenced record
};

/**
 * Reverse side of another type's to-one relation (e.g. creativework.identifiers).
 */
struct ReverseRelationSpec {
    std::string name;       // e.g. "identifiers"
    std::string sourceType; // Type owning the FK (e.g. "workidentifier")
    std::string edge;       // Relation name on the source type (e.g. "creative_work")
};

/**
 * Static description of one persisted target type.
 */
struct TypeSchema {
    std::string name;  // Logical base type (e.g. "creativework")
    std::string table; // Backing table (e.g. "share_creativework")
    int contentTypeId = 0;
    std::map<std::string, std::string, std::less<>> attributes; // attribute -> column
    std::vector<RelationSpec> relations;
    std::vector<ReverseRelationSpec> reverseRelations;
    std::optional<std::string> typeColumn; // Subtype discriminator, when polymorphic
    std::vector<std::string> subtypes;     // Concrete subtypes, base name included

    const RelationSpec* relation(std::string_view relationName) const;
    const ReverseRelationSpec* reverseRelation(std::string_view relationName) const;

    // Column for an attribute or a to-one relation name
    std::optional<std::string> column(std::string_view name) const;
};

/**
 * Registry of target types. Replaces runtime model introspection with a description
 * assembled once at startup.
 */
class Schema {
public:
    explicit Schema(std::string appLabel = "share");

    Result<void> registerType(TypeSchema type);

    const TypeSchema* find(std::string_view name) const;
    const TypeSchema* findByContentType(int contentTypeId) const;

    // Base type for a concrete node type ("article" -> creativework)
    const TypeSchema* baseTypeOf(std::string_view concreteType) const;

    // "<app_label>.<subtype>" as stored in discriminator columns
    std::string subtypeTag(std::string_view subtype) const;
    std::string subtypeFromTag(std::string_view tag) const;

    const std::string& appLabel() const { return appLabel_; }
    std::vector<std::string> typeNames() const;

    // Default description of the share_* tables
    static Schema share();

private:
    std::string appLabel_;
    std::map<std::string, TypeSchema, std::less<>> types_;
    std::map<int, std::string> byContentType_;
    std::map<std::string, std::string, std::less<>> concreteToBase_;
};

} // namespace disambig::metadata
