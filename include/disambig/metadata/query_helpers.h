#pragma once

#include <disambig/graph/node.h>

#include <nlohmann/json_fwd.hpp>

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace disambig::metadata::sql {

struct QuerySpec {
    std::string table;                // Simple table form
    std::optional<std::string> from;  // Optional full FROM clause (e.g., with JOINs)
    std::vector<std::string> columns; // empty => "*"
    std::vector<std::string> conditions;
    std::optional<std::string> orderBy;
    std::optional<int> limit;
};

// Build a basic SELECT statement
std::string buildSelect(const QuerySpec& spec);

// "?, ?, ?" with `count` placeholders
std::string placeholders(std::size_t count);

using SqlValue = std::variant<std::nullptr_t, std::int64_t, double, std::string>;

// Scalar json -> bindable value; objects and arrays bind as their JSON text
SqlValue toSqlValue(const nlohmann::json& value);

/**
 * SQL text plus positional parameters, ready for Statement binding.
 */
struct BoundQuery {
    std::string sql;
    std::vector<SqlValue> params;
};

/**
 * Builds one query resolving many nodes against a target table:
 *
 *   WITH nodes(node_id, c1, c2) AS (VALUES (?, ?, ?), (?, ?, ?), ...)
 *   SELECT nodes.node_id, t.* FROM nodes INNER JOIN t ON (nodes.c1 = t.c1 AND ...)
 *
 * Each result row carries the originating node id next to the target record.
 */
class NodeJoinQueryBuilder {
public:
    using ValueGetter = std::function<std::vector<SqlValue>(const graph::Node&)>;

    NodeJoinQueryBuilder(std::string tableName, std::vector<std::string> columnNames,
                         ValueGetter getValues);
    virtual ~NodeJoinQueryBuilder() = default;

    BoundQuery build(const std::vector<const graph::Node*>& nodes) const;

    const std::string& tableName() const { return tableName_; }
    const std::vector<std::string>& columnNames() const { return columnNames_; }

protected:
    virtual std::vector<std::string> joinConditions() const;
    virtual std::vector<SqlValue> params(const std::vector<const graph::Node*>& nodes) const;

private:
    std::string tableName_;
    std::vector<std::string> columnNames_;
    ValueGetter getValues_;
};

/**
 * Same join, restricted to rows whose subtype discriminator is one of the allowed tags.
 */
class ConstrainedTypeQueryBuilder final : public NodeJoinQueryBuilder {
public:
    ConstrainedTypeQueryBuilder(std::string tableName, std::vector<std::string> columnNames,
                                ValueGetter getValues, std::string typeColumn,
                                std::vector<std::string> allowedTags);

protected:
    std::vector<std::string> joinConditions() const override;
    std::vector<SqlValue> params(const std::vector<const graph::Node*>& nodes) const override;

private:
    std::string typeColumn_;
    std::vector<std::string> allowedTags_;
};

} // namespace disambig::metadata::sql
