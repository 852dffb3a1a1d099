#include <disambig/metadata/query_helpers.h>

#include <nlohmann/json.hpp>

#include <cstddef>
#include <numeric>
#include <string>
#include <string_view>
#include <vector>

namespace disambig::metadata::sql {

namespace {

inline std::string joinWithSeparator(const std::vector<std::string>& items,
                                     std::string_view separator) {
    if (items.empty()) {
        return {};
    }

    const auto totalChars =
        std::accumulate(items.begin(), items.end(), static_cast<std::size_t>(0),
                        [](std::size_t sum, const std::string& part) { return sum + part.size(); });
    const auto separatorsSize = separator.size() * (items.size() - 1);

    std::string joined;
    joined.reserve(totalChars + separatorsSize);

    joined.append(items.front());
    for (std::size_t idx = 1; idx < items.size(); ++idx) {
        joined.append(separator);
        joined.append(items[idx]);
    }
    return joined;
}

inline std::string joinComma(const std::vector<std::string>& items) {
    return joinWithSeparator(items, ", ");
}

inline std::string joinAnd(const std::vector<std::string>& items) {
    return joinWithSeparator(items, " AND ");
}

template <typename OptString>
inline void appendClause(std::string& sql, std::string_view keyword, const OptString& opt) {
    if (opt && !opt->empty()) {
        sql += ' ';
        sql += keyword;
        sql += ' ';
        sql += *opt;
    }
}

template <typename Container>
inline void appendListClause(std::string& sql, std::string_view keyword, const Container& c) {
    if (!c.empty()) {
        sql += ' ';
        sql += keyword;
        sql += ' ';
        sql += joinAnd(c);
    }
}

} // namespace

std::string buildSelect(const QuerySpec& spec) {
    const std::string cols = spec.columns.empty() ? std::string{"*"} : joinComma(spec.columns);
    std::string sql;
    sql.reserve(64 + cols.size() + spec.table.size());
    sql += "SELECT ";
    sql += cols;
    sql += " FROM ";
    sql += (spec.from && !spec.from->empty()) ? *spec.from : spec.table;

    appendListClause(sql, "WHERE", spec.conditions);
    appendClause(sql, "ORDER BY", spec.orderBy);
    if (spec.limit && *spec.limit > 0) {
        sql += " LIMIT ";
        sql += std::to_string(*spec.limit);
    }
    return sql;
}

std::string placeholders(std::size_t count) {
    std::string out;
    out.reserve(count * 3);
    for (std::size_t i = 0; i < count; ++i) {
        if (i > 0) {
            out += ", ";
        }
        out += '?';
    }
    return out;
}

SqlValue toSqlValue(const nlohmann::json& value) {
    if (value.is_null()) {
        return nullptr;
    }
    if (value.is_string()) {
        return value.get<std::string>();
    }
    if (value.is_boolean()) {
        return static_cast<std::int64_t>(value.get<bool>() ? 1 : 0);
    }
    if (value.is_number_integer()) {
        return value.get<std::int64_t>();
    }
    if (value.is_number_float()) {
        return value.get<double>();
    }
    return value.dump();
}

NodeJoinQueryBuilder::NodeJoinQueryBuilder(std::string tableName,
                                           std::vector<std::string> columnNames,
                                           ValueGetter getValues)
    : tableName_(std::move(tableName)), columnNames_(std::move(columnNames)),
      getValues_(std::move(getValues)) {}

BoundQuery NodeJoinQueryBuilder::build(const std::vector<const graph::Node*>& nodes) const {
    const std::string row = "(" + placeholders(columnNames_.size() + 1) + ")";
    std::vector<std::string> rows(nodes.size(), row);

    BoundQuery query;
    query.sql.reserve(128 + rows.size() * row.size());
    query.sql += "WITH nodes(node_id";
    for (const auto& column : columnNames_) {
        query.sql += ", ";
        query.sql += column;
    }
    query.sql += ") AS (VALUES ";
    query.sql += joinComma(rows);
    query.sql += ") SELECT nodes.node_id, ";
    query.sql += tableName_;
    query.sql += ".* FROM nodes INNER JOIN ";
    query.sql += tableName_;
    query.sql += " ON (";
    query.sql += joinAnd(joinConditions());
    query.sql += ")";

    query.params = params(nodes);
    return query;
}

std::vector<std::string> NodeJoinQueryBuilder::joinConditions() const {
    std::vector<std::string> conditions;
    conditions.reserve(columnNames_.size());
    for (const auto& column : columnNames_) {
        conditions.push_back("nodes." + column + " = " + tableName_ + "." + column);
    }
    return conditions;
}

std::vector<SqlValue>
NodeJoinQueryBuilder::params(const std::vector<const graph::Node*>& nodes) const {
    std::vector<SqlValue> out;
    out.reserve(nodes.size() * (columnNames_.size() + 1));
    for (const auto* node : nodes) {
        out.emplace_back(node->id());
        auto values = getValues_(*node);
        values.resize(columnNames_.size(), nullptr);
        for (auto& value : values) {
            out.push_back(std::move(value));
        }
    }
    return out;
}

ConstrainedTypeQueryBuilder::ConstrainedTypeQueryBuilder(std::string tableName,
                                                         std::vector<std::string> columnNames,
                                                         ValueGetter getValues,
                                                         std::string typeColumn,
                                                         std::vector<std::string> allowedTags)
    : NodeJoinQueryBuilder(std::move(tableName), std::move(columnNames), std::move(getValues)),
      typeColumn_(std::move(typeColumn)), allowedTags_(std::move(allowedTags)) {}

std::vector<std::string> ConstrainedTypeQueryBuilder::joinConditions() const {
    auto conditions = NodeJoinQueryBuilder::joinConditions();
    conditions.push_back(tableName() + "." + typeColumn_ + " IN (" +
                         placeholders(allowedTags_.size()) + ")");
    return conditions;
}

std::vector<SqlValue>
ConstrainedTypeQueryBuilder::params(const std::vector<const graph::Node*>& nodes) const {
    auto out = NodeJoinQueryBuilder::params(nodes);
    for (const auto& tag : allowedTags_) {
        out.emplace_back(tag);
    }
    return out;
}

} // namespace disambig::metadata::sql
