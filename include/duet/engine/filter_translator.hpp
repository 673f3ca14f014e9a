#pragma once

#include "../backend/table.hpp"
#include "../types.hpp"
#include <cctype>
#include <functional>
#include <optional>
#include <string>

namespace duet {
namespace engine {

/// Looks up a registered table by name (for include hints); nullptr if unknown.
using TableLookup = std::function<const backend::TableHandle*(const std::string&)>;

/**
 * @brief Converts backend-neutral QueryOptions into one backend's query form.
 *
 * One implementation per backend; all share the input shape. An operator the
 * backend cannot express fails with UnsupportedOperator naming the operator
 * and the backend. Filters are never dropped silently.
 *
 * @tparam BackendQuery Backend-specific query representation
 */
template<typename BackendQuery>
class IFilterTranslator {
public:
    virtual ~IFilterTranslator() = default;

    /// Name reported in UnsupportedOperator errors.
    virtual std::string backend_name() const = 0;

    virtual Expected<BackendQuery> translate(
        const backend::TableHandle& table,
        const QueryOptions& options
    ) const = 0;
};

inline Error unsupported_operator_error(Operator op, const std::string& backend_name) {
    return Error{
        ErrorCode::UnsupportedOperator,
        std::string("Operator '") + operator_to_string(op) + "' is not supported by the " +
            backend_name + " backend",
        std::string(operator_to_string(op))
    };
}

inline Error invalid_operand_error(const FilterCondition& filter, const std::string& expectation) {
    return Error{
        ErrorCode::ValidationFailed,
        std::string("Operator '") + operator_to_string(filter.op) + "' on column '" +
            filter.column + "' " + expectation,
        filter.value.dump()
    };
}

/**
 * @brief SQL LIKE semantics: '%' matches any run, '_' one character,
 * backslash escapes the next character.
 */
inline bool like_match(const std::string& text, const std::string& pattern, bool case_insensitive) {
    auto fold = [case_insensitive](char ch) {
        return case_insensitive ? static_cast<char>(std::tolower(static_cast<unsigned char>(ch))) : ch;
    };

    // Iterative wildcard match with single-star backtracking.
    size_t t = 0;
    size_t p = 0;
    size_t star_p = std::string::npos;
    size_t star_t = 0;
    while (t < text.size()) {
        if (p < pattern.size() && pattern[p] == '\\' && p + 1 < pattern.size()) {
            if (fold(pattern[p + 1]) == fold(text[t])) {
                p += 2;
                ++t;
                continue;
            }
        } else if (p < pattern.size() && pattern[p] == '%') {
            star_p = p++;
            star_t = t;
            continue;
        } else if (p < pattern.size() && (pattern[p] == '_' || fold(pattern[p]) == fold(text[t]))) {
            ++p;
            ++t;
            continue;
        }
        if (star_p == std::string::npos) {
            return false;
        }
        p = star_p + 1;
        t = ++star_t;
    }
    while (p < pattern.size() && pattern[p] == '%') {
        ++p;
    }
    return p == pattern.size();
}

/**
 * @brief Order two JSON scalars of the same family.
 *
 * Numbers compare numerically, strings lexicographically, booleans false < true.
 * Mismatched or non-scalar values are incomparable (nullopt).
 */
inline std::optional<int> compare_json(const nlohmann::json& a, const nlohmann::json& b) {
    if (a.is_number() && b.is_number()) {
        const double x = a.get<double>();
        const double y = b.get<double>();
        return x < y ? -1 : (x > y ? 1 : 0);
    }
    if (a.is_string() && b.is_string()) {
        const int cmp = a.get_ref<const std::string&>().compare(b.get_ref<const std::string&>());
        return cmp < 0 ? -1 : (cmp > 0 ? 1 : 0);
    }
    if (a.is_boolean() && b.is_boolean()) {
        const bool x = a.get<bool>();
        const bool y = b.get<bool>();
        return x == y ? 0 : (x ? 1 : -1);
    }
    return std::nullopt;
}

/// Equality that treats 1 and 1.0 as equal.
inline bool json_equal(const nlohmann::json& a, const nlohmann::json& b) {
    if (a.is_number() && b.is_number()) {
        return a.get<double>() == b.get<double>();
    }
    return a == b;
}

} // namespace engine
} // namespace duet
