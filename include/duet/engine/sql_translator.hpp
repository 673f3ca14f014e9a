#pragma once

#include "filter_translator.hpp"
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace duet {
namespace engine {

/**
 * @brief A parameterized SQL statement. Values are never interpolated.
 */
struct SqlStatement {
    std::string sql;
    std::vector<nlohmann::json> params;
};

/**
 * @brief Translated list query for the relational store.
 */
struct SqlQuery {
    SqlStatement select;                     ///< Paginated, sorted, projected rows
    SqlStatement count;                      ///< Unpaginated COUNT(*) over the same filters
    std::vector<std::string> json_columns;   ///< Result columns holding embedded JSON arrays
};

inline std::string quote_identifier(const std::string& name) {
    return "\"" + name + "\"";
}

/**
 * @brief QueryOptions -> SQLite SELECT.
 *
 * Column names are checked against the registered table; every operand is a
 * bound parameter. JSON array operators go through json_each(), textSearch is
 * a case-insensitive all-terms match, range operators are rejected.
 */
class SqlFilterTranslator : public IFilterTranslator<SqlQuery> {
public:
    explicit SqlFilterTranslator(TableLookup lookup = nullptr, int default_page_size = 20)
        : lookup_(std::move(lookup))
        , default_page_size_(default_page_size)
    {}

    std::string backend_name() const override { return "sqlite"; }

    Expected<SqlQuery> translate(
        const backend::TableHandle& table,
        const QueryOptions& options
    ) const override {
        if (auto valid = options.validate(); !valid) {
            return tl::unexpected(valid.error());
        }

        SqlQuery query;
        const std::string from = " FROM " + quote_identifier(table.name) + " t";

        // Projection
        std::string projection;
        if (options.select.empty()) {
            projection = "t.*";
        } else {
            for (const auto& column : options.select) {
                if (auto checked = check_column(table, column); !checked) {
                    return tl::unexpected(checked.error());
                }
                if (!projection.empty()) projection += ", ";
                projection += "t." + quote_identifier(column);
            }
        }
        for (const auto& inc : options.include) {
            auto sub = include_subquery(table, inc);
            if (!sub) {
                return tl::unexpected(sub.error());
            }
            projection += ", " + *sub + " AS " + quote_identifier(inc.table);
            query.json_columns.push_back(inc.table);
        }

        // Filters
        std::vector<std::string> clauses;
        std::vector<nlohmann::json> params;
        for (const auto& filter : options.effective_filters()) {
            auto clause = translate_filter(table, filter, params);
            if (!clause) {
                return tl::unexpected(clause.error());
            }
            clauses.push_back(*clause);
        }

        std::string where = join_where(clauses);
        query.count.sql = "SELECT COUNT(*)" + from + where;
        query.count.params = params;

        // Ordering and pagination
        std::string order;
        std::string limit;
        std::vector<nlohmann::json> select_params = params;
        const auto& pagination = options.pagination;
        if (pagination.has_value() && pagination->cursor.has_value()) {
            if (table.composite_key()) {
                return tl::unexpected(Error{
                    ErrorCode::ValidationFailed,
                    "Cursor pagination needs a single-column primary key",
                    table.name
                });
            }
            if (!options.sort.empty()) {
                return tl::unexpected(Error{
                    ErrorCode::ValidationFailed,
                    "Cursor pagination orders by the primary key; explicit sort is not allowed",
                    table.name
                });
            }
            const std::string key = "t." + quote_identifier(table.primary_key.front());
            std::vector<std::string> cursor_clauses = clauses;
            cursor_clauses.push_back(key + " > ?");
            where = join_where(cursor_clauses);
            select_params.push_back(table.key_value(0, *pagination->cursor));
            order = " ORDER BY " + key + " ASC";
            limit = " LIMIT ?";
            select_params.push_back(pagination->page_size.value_or(default_page_size_));
        } else {
            for (const auto& sort : options.sort) {
                if (auto checked = check_column(table, sort.column); !checked) {
                    return tl::unexpected(checked.error());
                }
                order += order.empty() ? " ORDER BY " : ", ";
                order += "t." + quote_identifier(sort.column) + (sort.ascending ? " ASC" : " DESC");
            }
            if (pagination.has_value()) {
                const int size = pagination->page_size.value_or(default_page_size_);
                const int page = pagination->page.value_or(1);
                limit = " LIMIT ? OFFSET ?";
                select_params.push_back(size);
                select_params.push_back(static_cast<long long>(page - 1) * size);
            }
        }

        query.select.sql = "SELECT " + projection + from + where + order + limit;
        query.select.params = std::move(select_params);
        return query;
    }

private:
    static std::string join_where(const std::vector<std::string>& clauses) {
        if (clauses.empty()) {
            return {};
        }
        std::string where = " WHERE ";
        for (size_t i = 0; i < clauses.size(); ++i) {
            if (i > 0) where += " AND ";
            where += "(" + clauses[i] + ")";
        }
        return where;
    }

    static Expected<const backend::Column*> check_column(
        const backend::TableHandle& table,
        const std::string& column
    ) {
        const backend::Column* found = backend::is_valid_identifier(column) ? table.find_column(column) : nullptr;
        if (found == nullptr) {
            return tl::unexpected(Error{
                ErrorCode::ValidationFailed,
                "Unknown column '" + column + "'",
                table.name
            });
        }
        return found;
    }

    Expected<std::string> include_subquery(
        const backend::TableHandle& table,
        const IncludeSpec& inc
    ) const {
        if (!backend::is_valid_identifier(inc.table) || !backend::is_valid_identifier(inc.foreign_key)) {
            return tl::unexpected(Error{ErrorCode::ValidationFailed, "Invalid include hint", inc.table});
        }
        if (auto checked = check_column(table, inc.local_key); !checked) {
            return tl::unexpected(checked.error());
        }

        std::vector<std::string> fields = inc.fields;
        if (fields.empty()) {
            const backend::TableHandle* related = lookup_ ? lookup_(inc.table) : nullptr;
            if (related == nullptr) {
                return tl::unexpected(Error{
                    ErrorCode::ValidationFailed,
                    "Include of an unregistered table must list its fields",
                    inc.table
                });
            }
            for (const auto& column : related->columns) {
                fields.push_back(column.name);
            }
        }

        std::string object;
        for (const auto& field : fields) {
            if (!backend::is_valid_identifier(field)) {
                return tl::unexpected(Error{ErrorCode::ValidationFailed, "Invalid include field", field});
            }
            if (!object.empty()) object += ", ";
            object += "'" + field + "', r." + quote_identifier(field);
        }

        return "(SELECT COALESCE(json_group_array(json_object(" + object + ")), '[]') FROM " +
               quote_identifier(inc.table) + " r WHERE r." + quote_identifier(inc.foreign_key) +
               " = t." + quote_identifier(inc.local_key) + ")";
    }

    Expected<std::string> translate_filter(
        const backend::TableHandle& table,
        const FilterCondition& filter,
        std::vector<nlohmann::json>& params
    ) const {
        auto checked = check_column(table, filter.column);
        if (!checked) {
            return tl::unexpected(checked.error());
        }
        const backend::Column* column = *checked;
        const std::string col = "t." + quote_identifier(filter.column);

        switch (filter.op) {
            case Operator::Eq:
                if (filter.value.is_null()) {
                    return col + " IS NULL";
                }
                params.push_back(filter.value);
                return col + " = ?";
            case Operator::Neq:
                if (filter.value.is_null()) {
                    return col + " IS NOT NULL";
                }
                params.push_back(filter.value);
                return col + " <> ?";
            case Operator::Gt:
            case Operator::Gte:
            case Operator::Lt:
            case Operator::Lte: {
                if (!filter.value.is_number() && !filter.value.is_string()) {
                    return tl::unexpected(invalid_operand_error(filter, "needs a number or string"));
                }
                params.push_back(filter.value);
                const char* sym = filter.op == Operator::Gt ? " > ?"
                                : filter.op == Operator::Gte ? " >= ?"
                                : filter.op == Operator::Lt ? " < ?" : " <= ?";
                return col + sym;
            }
            case Operator::Like:
                if (!filter.value.is_string()) {
                    return tl::unexpected(invalid_operand_error(filter, "needs a string pattern"));
                }
                // SQLite LIKE ignores ASCII case; GLOB is the case-sensitive form.
                params.push_back(like_to_glob(filter.value.get<std::string>()));
                return col + " GLOB ?";
            case Operator::ILike:
                if (!filter.value.is_string()) {
                    return tl::unexpected(invalid_operand_error(filter, "needs a string pattern"));
                }
                params.push_back(filter.value);
                return "lower(" + col + ") LIKE lower(?) ESCAPE '\\'";
            case Operator::In: {
                if (!filter.value.is_array()) {
                    return tl::unexpected(invalid_operand_error(filter, "needs an array operand"));
                }
                if (filter.value.empty()) {
                    return std::string("0");
                }
                std::string placeholders;
                for (const auto& item : filter.value) {
                    if (!placeholders.empty()) placeholders += ", ";
                    placeholders += "?";
                    params.push_back(item);
                }
                return col + " IN (" + placeholders + ")";
            }
            case Operator::Is:
                if (filter.value.is_null()) {
                    return col + " IS NULL";
                }
                if (!filter.value.is_boolean()) {
                    return tl::unexpected(invalid_operand_error(filter, "accepts only null, true or false"));
                }
                params.push_back(filter.value.get<bool>() ? 1 : 0);
                return col + " IS ?";
            case Operator::Contains:
                return json_containment(filter, column, col, params);
            case Operator::ContainedBy:
                if (auto ok = require_json_array(filter, column); !ok) {
                    return tl::unexpected(ok.error());
                }
                params.push_back(filter.value.dump());
                return "NOT EXISTS (SELECT 1 FROM json_each(" + col + ") c "
                       "WHERE c.value NOT IN (SELECT value FROM json_each(?)))";
            case Operator::Overlaps:
                if (auto ok = require_json_array(filter, column); !ok) {
                    return tl::unexpected(ok.error());
                }
                params.push_back(filter.value.dump());
                return "EXISTS (SELECT 1 FROM json_each(" + col + ") c "
                       "WHERE c.value IN (SELECT value FROM json_each(?)))";
            case Operator::TextSearch: {
                if (!filter.value.is_string()) {
                    return tl::unexpected(invalid_operand_error(filter, "needs a search string"));
                }
                auto terms = split_terms(filter.value.get<std::string>());
                if (terms.empty()) {
                    return tl::unexpected(invalid_operand_error(filter, "needs at least one search term"));
                }
                std::string clause;
                for (const auto& term : terms) {
                    if (!clause.empty()) clause += " AND ";
                    clause += "instr(lower(" + col + "), lower(?)) > 0";
                    params.push_back(term);
                }
                return clause;
            }
            case Operator::RangeGt:
            case Operator::RangeLt:
            case Operator::RangeGte:
            case Operator::RangeLte:
            case Operator::RangeAdjacent:
                return tl::unexpected(unsupported_operator_error(filter.op, backend_name()));
        }
        return tl::unexpected(unsupported_operator_error(filter.op, backend_name()));
    }

    static Expected<void> require_json_array(const FilterCondition& filter, const backend::Column* column) {
        if (column->type != backend::ColumnType::Json) {
            return tl::unexpected(invalid_operand_error(filter, "needs a JSON column"));
        }
        if (!filter.value.is_array()) {
            return tl::unexpected(invalid_operand_error(filter, "needs an array operand"));
        }
        return {};
    }

    /// Array operand: every element present. Object operand: every scalar member equal.
    static Expected<std::string> json_containment(
        const FilterCondition& filter,
        const backend::Column* column,
        const std::string& col,
        std::vector<nlohmann::json>& params
    ) {
        if (column->type != backend::ColumnType::Json) {
            return tl::unexpected(invalid_operand_error(filter, "needs a JSON column"));
        }
        if (filter.value.is_array()) {
            params.push_back(filter.value.dump());
            return "NOT EXISTS (SELECT 1 FROM json_each(?) v "
                   "WHERE v.value NOT IN (SELECT value FROM json_each(" + col + ")))";
        }
        if (filter.value.is_object() && !filter.value.empty()) {
            std::string clause;
            for (auto it = filter.value.begin(); it != filter.value.end(); ++it) {
                if (it.value().is_structured() || !backend::is_valid_identifier(it.key())) {
                    return tl::unexpected(invalid_operand_error(filter, "accepts only flat objects"));
                }
                if (!clause.empty()) clause += " AND ";
                clause += "json_extract(" + col + ", '$." + it.key() + "') = ?";
                params.push_back(it.value().is_boolean() ? nlohmann::json(it.value().get<bool>() ? 1 : 0)
                                                         : it.value());
            }
            return clause;
        }
        return tl::unexpected(invalid_operand_error(filter, "needs an array or object operand"));
    }

    /// Translate a LIKE pattern to GLOB, escaping GLOB metacharacters.
    static std::string like_to_glob(const std::string& pattern) {
        std::string glob;
        for (size_t i = 0; i < pattern.size(); ++i) {
            const char ch = pattern[i];
            if (ch == '\\' && i + 1 < pattern.size()) {
                append_glob_literal(glob, pattern[++i]);
            } else if (ch == '%') {
                glob += '*';
            } else if (ch == '_') {
                glob += '?';
            } else {
                append_glob_literal(glob, ch);
            }
        }
        return glob;
    }

    static void append_glob_literal(std::string& glob, char ch) {
        if (ch == '*' || ch == '?' || ch == '[') {
            glob += '[';
            glob += ch;
            glob += ']';
        } else {
            glob += ch;
        }
    }

    static std::vector<std::string> split_terms(const std::string& text) {
        std::vector<std::string> terms;
        std::istringstream stream(text);
        std::string term;
        while (stream >> term) {
            terms.push_back(term);
        }
        return terms;
    }

    TableLookup lookup_;
    int default_page_size_;
};

} // namespace engine
} // namespace duet
