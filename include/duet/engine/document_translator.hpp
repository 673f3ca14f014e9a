#pragma once

#include "filter_translator.hpp"
#include <algorithm>
#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace duet {
namespace engine {

using DocumentPredicate = std::function<bool(const Record&)>;

/**
 * @brief Translated list query for the document store.
 *
 * Evaluated in memory: filter, count, sort, paginate, embed, project.
 */
struct DocumentQuery {
    std::vector<DocumentPredicate> predicates;
    std::vector<SortSpec> sort;
    std::optional<std::string> cursor_key;      ///< Key column when cursor paginating
    nlohmann::json cursor_value;                ///< Rows with key > this are returned
    size_t offset = 0;
    std::optional<size_t> limit;
    std::vector<std::string> select;
    std::vector<IncludeSpec> include;

    bool matches(const Record& record) const {
        return std::all_of(predicates.begin(), predicates.end(),
                           [&record](const DocumentPredicate& p) { return p(record); });
    }

    /// Stable multi-key ordering; missing or incomparable fields sort last.
    void order(std::vector<Record>& rows) const {
        if (cursor_key.has_value()) {
            const std::string key = *cursor_key;
            std::stable_sort(rows.begin(), rows.end(), [&key](const Record& a, const Record& b) {
                return less_by(a, b, key, true);
            });
            return;
        }
        if (sort.empty()) {
            return;
        }
        std::stable_sort(rows.begin(), rows.end(), [this](const Record& a, const Record& b) {
            for (const auto& spec : sort) {
                if (less_by(a, b, spec.column, spec.ascending)) return true;
                if (less_by(b, a, spec.column, spec.ascending)) return false;
            }
            return false;
        });
    }

    /// Apply cursor/offset and limit to already ordered rows.
    std::vector<Record> paginate(std::vector<Record> rows) const {
        if (cursor_key.has_value()) {
            const std::string key = *cursor_key;
            rows.erase(std::remove_if(rows.begin(), rows.end(), [&](const Record& row) {
                auto it = row.find(key);
                if (it == row.end()) return true;
                auto cmp = compare_json(*it, cursor_value);
                return !cmp.has_value() || *cmp <= 0;
            }), rows.end());
        } else if (offset > 0) {
            if (offset >= rows.size()) {
                rows.clear();
            } else {
                rows.erase(rows.begin(), rows.begin() + static_cast<std::ptrdiff_t>(offset));
            }
        }
        if (limit.has_value() && rows.size() > *limit) {
            rows.resize(*limit);
        }
        return rows;
    }

    /// Keep selected fields plus embedded relations.
    Record project(const Record& row) const {
        if (select.empty()) {
            return row;
        }
        Record out = Record::object();
        for (const auto& field : select) {
            auto it = row.find(field);
            if (it != row.end()) out[field] = *it;
        }
        for (const auto& inc : include) {
            auto it = row.find(inc.table);
            if (it != row.end()) out[inc.table] = *it;
        }
        return out;
    }

private:
    static bool less_by(const Record& a, const Record& b, const std::string& column, bool ascending) {
        auto ia = a.find(column);
        auto ib = b.find(column);
        const bool has_a = ia != a.end() && !ia->is_null();
        const bool has_b = ib != b.end() && !ib->is_null();
        if (!has_a || !has_b) {
            return has_a && !has_b;
        }
        auto cmp = compare_json(*ia, *ib);
        if (!cmp.has_value()) {
            return false;
        }
        return ascending ? *cmp < 0 : *cmp > 0;
    }
};

/**
 * @brief QueryOptions -> in-memory predicates for the document store.
 *
 * The store is schemaless, so fields are not checked against the table.
 * textSearch and the range operators have no document equivalent.
 */
class DocumentFilterTranslator : public IFilterTranslator<DocumentQuery> {
public:
    explicit DocumentFilterTranslator(int default_page_size = 20)
        : default_page_size_(default_page_size)
    {}

    std::string backend_name() const override { return "document"; }

    Expected<DocumentQuery> translate(
        const backend::TableHandle& table,
        const QueryOptions& options
    ) const override {
        if (auto valid = options.validate(); !valid) {
            return tl::unexpected(valid.error());
        }

        DocumentQuery query;
        for (const auto& filter : options.effective_filters()) {
            auto predicate = translate_filter(filter);
            if (!predicate) {
                return tl::unexpected(predicate.error());
            }
            query.predicates.push_back(std::move(*predicate));
        }

        query.sort = options.sort;
        query.select = options.select;
        query.include = options.include;

        if (options.pagination.has_value()) {
            const auto& p = *options.pagination;
            const int size = p.page_size.value_or(default_page_size_);
            query.limit = static_cast<size_t>(size);
            if (p.cursor.has_value()) {
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
                query.cursor_key = table.primary_key.front();
                query.cursor_value = table.key_value(0, *p.cursor);
            } else {
                query.offset = static_cast<size_t>(p.page.value_or(1) - 1) * static_cast<size_t>(size);
            }
        }
        return query;
    }

private:
    Expected<DocumentPredicate> translate_filter(const FilterCondition& filter) const {
        const std::string column = filter.column;
        const nlohmann::json value = filter.value;

        switch (filter.op) {
            case Operator::Eq:
                return DocumentPredicate([column, value](const Record& r) {
                    return json_equal(field(r, column), value);
                });
            case Operator::Neq:
                return DocumentPredicate([column, value](const Record& r) {
                    return !json_equal(field(r, column), value);
                });
            case Operator::Gt:
            case Operator::Gte:
            case Operator::Lt:
            case Operator::Lte: {
                if (!value.is_number() && !value.is_string()) {
                    return tl::unexpected(invalid_operand_error(filter, "needs a number or string"));
                }
                const Operator op = filter.op;
                return DocumentPredicate([column, value, op](const Record& r) {
                    auto cmp = compare_json(field(r, column), value);
                    if (!cmp.has_value()) return false;
                    switch (op) {
                        case Operator::Gt: return *cmp > 0;
                        case Operator::Gte: return *cmp >= 0;
                        case Operator::Lt: return *cmp < 0;
                        default: return *cmp <= 0;
                    }
                });
            }
            case Operator::Like:
            case Operator::ILike: {
                if (!value.is_string()) {
                    return tl::unexpected(invalid_operand_error(filter, "needs a string pattern"));
                }
                const bool fold = filter.op == Operator::ILike;
                const std::string pattern = value.get<std::string>();
                return DocumentPredicate([column, pattern, fold](const Record& r) {
                    const auto& v = field(r, column);
                    return v.is_string() && like_match(v.get<std::string>(), pattern, fold);
                });
            }
            case Operator::In:
                if (!value.is_array()) {
                    return tl::unexpected(invalid_operand_error(filter, "needs an array operand"));
                }
                return DocumentPredicate([column, value](const Record& r) {
                    const auto& v = field(r, column);
                    return std::any_of(value.begin(), value.end(),
                                       [&v](const nlohmann::json& item) { return json_equal(v, item); });
                });
            case Operator::Is:
                if (!value.is_null() && !value.is_boolean()) {
                    return tl::unexpected(invalid_operand_error(filter, "accepts only null, true or false"));
                }
                return DocumentPredicate([column, value](const Record& r) {
                    return field(r, column) == value;
                });
            case Operator::Contains:
                if (!value.is_array() && !value.is_object()) {
                    return tl::unexpected(invalid_operand_error(filter, "needs an array or object operand"));
                }
                return DocumentPredicate([column, value](const Record& r) {
                    return contains(field(r, column), value);
                });
            case Operator::ContainedBy:
                if (!value.is_array()) {
                    return tl::unexpected(invalid_operand_error(filter, "needs an array operand"));
                }
                return DocumentPredicate([column, value](const Record& r) {
                    const auto& v = field(r, column);
                    return v.is_array() && contains(value, v);
                });
            case Operator::Overlaps:
                if (!value.is_array()) {
                    return tl::unexpected(invalid_operand_error(filter, "needs an array operand"));
                }
                return DocumentPredicate([column, value](const Record& r) {
                    const auto& v = field(r, column);
                    if (!v.is_array()) return false;
                    return std::any_of(v.begin(), v.end(), [&value](const nlohmann::json& item) {
                        return std::any_of(value.begin(), value.end(),
                                           [&item](const nlohmann::json& other) { return json_equal(item, other); });
                    });
                });
            case Operator::TextSearch:
            case Operator::RangeGt:
            case Operator::RangeLt:
            case Operator::RangeGte:
            case Operator::RangeLte:
            case Operator::RangeAdjacent:
                return tl::unexpected(unsupported_operator_error(filter.op, backend_name()));
        }
        return tl::unexpected(unsupported_operator_error(filter.op, backend_name()));
    }

    static const nlohmann::json& field(const Record& record, const std::string& column) {
        static const nlohmann::json null_value;
        auto it = record.find(column);
        return it == record.end() ? null_value : *it;
    }

    /// Array: every needle element present. Object: every needle member equal.
    static bool contains(const nlohmann::json& haystack, const nlohmann::json& needle) {
        if (needle.is_array()) {
            if (!haystack.is_array()) return false;
            return std::all_of(needle.begin(), needle.end(), [&haystack](const nlohmann::json& item) {
                return std::any_of(haystack.begin(), haystack.end(),
                                   [&item](const nlohmann::json& h) { return json_equal(h, item); });
            });
        }
        if (!haystack.is_object()) return false;
        for (auto it = needle.begin(); it != needle.end(); ++it) {
            auto found = haystack.find(it.key());
            if (found == haystack.end() || !json_equal(*found, it.value())) {
                return false;
            }
        }
        return true;
    }

    int default_page_size_;
};

} // namespace engine
} // namespace duet
