#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include <tl/expected.hpp>

namespace duet {

// ============================================================================
// Records
// ============================================================================

/// Generic entity. Identity is the primary-key field (usually "id").
using Record = nlohmann::json;

/// Record identity as seen by the cache and the backends. Composite keys are
/// the key values joined with ':'.
using RecordId = std::string;

/**
 * @brief Which physical store a handle talks to.
 */
enum class BackendKind {
    Primary,    ///< Low-latency key/document store
    Secondary   ///< Relational SQL store (fallback, transactions)
};

[[nodiscard]] inline const char* backend_to_string(BackendKind kind) {
    switch (kind) {
        case BackendKind::Primary: return "primary";
        case BackendKind::Secondary: return "secondary";
    }
    return "unknown";
}

inline BackendKind other_backend(BackendKind kind) {
    return kind == BackendKind::Primary ? BackendKind::Secondary : BackendKind::Primary;
}

/// Render a JSON id value (string or number) as a RecordId.
inline RecordId id_to_string(const nlohmann::json& value) {
    if (value.is_string()) {
        return value.get<std::string>();
    }
    if (value.is_null()) {
        return {};
    }
    return value.dump();
}

// ============================================================================
// Error Types
// ============================================================================

/**
 * @brief Error codes organized by category range
 *
 * - 100-199: Configuration errors
 * - 200-299: Backend/connection errors
 * - 300-399: Query and validation errors
 * - 400-499: Runtime (cancellation, deadlines)
 * - 500-599: Cache errors
 * - 600-699: Transaction errors
 * - 700-799: Query origin errors
 */
enum class ErrorCode {
    // Configuration errors (100-199)
    InvalidConfig = 100,
    NoBackendConfigured = 101,
    TableNotRegistered = 102,

    // Backend errors (200-299)
    BackendUnavailable = 200,
    BackendNotConfigured = 201,
    OperationRejected = 202,

    // Query errors (300-399)
    ValidationFailed = 300,
    NotFound = 301,
    UnsupportedOperator = 302,
    ToolNotFound = 303,

    // Runtime errors (400-499)
    RequestCancelled = 400,
    RequestTimeout = 401,

    // Cache errors (500-599)
    CacheFailure = 500,

    // Transaction errors (600-699)
    TransactionBeginFailed = 600,
    TransactionCommitFailed = 601,
    TransactionAborted = 602,

    // Origin errors (700-799)
    OriginRequestFailed = 700,
    OriginResponseInvalid = 701,

    // Unknown
    Unknown = 999
};

/**
 * @brief Coarse classes callers branch on (retry vs. abort).
 */
enum class ErrorClass {
    Configuration,
    Connection,
    Operation,
    Validation,
    NotFound,
    UnsupportedOperator,
    Cancelled,
    Cache,
    Transaction,
    Origin,
    Unknown
};

inline ErrorClass classify(ErrorCode code) {
    switch (code) {
        case ErrorCode::InvalidConfig:
        case ErrorCode::NoBackendConfigured:
        case ErrorCode::TableNotRegistered:
            return ErrorClass::Configuration;
        case ErrorCode::BackendUnavailable:
        case ErrorCode::BackendNotConfigured:
            return ErrorClass::Connection;
        case ErrorCode::OperationRejected:
            return ErrorClass::Operation;
        case ErrorCode::ValidationFailed:
            return ErrorClass::Validation;
        case ErrorCode::NotFound:
        case ErrorCode::ToolNotFound:
            return ErrorClass::NotFound;
        case ErrorCode::UnsupportedOperator:
            return ErrorClass::UnsupportedOperator;
        case ErrorCode::RequestCancelled:
        case ErrorCode::RequestTimeout:
            return ErrorClass::Cancelled;
        case ErrorCode::CacheFailure:
            return ErrorClass::Cache;
        case ErrorCode::TransactionBeginFailed:
        case ErrorCode::TransactionCommitFailed:
        case ErrorCode::TransactionAborted:
            return ErrorClass::Transaction;
        case ErrorCode::OriginRequestFailed:
        case ErrorCode::OriginResponseInvalid:
            return ErrorClass::Origin;
        case ErrorCode::Unknown:
            return ErrorClass::Unknown;
    }
    return ErrorClass::Unknown;
}

[[nodiscard]] inline const char* error_class_to_string(ErrorClass cls) {
    switch (cls) {
        case ErrorClass::Configuration: return "configuration";
        case ErrorClass::Connection: return "connection";
        case ErrorClass::Operation: return "operation";
        case ErrorClass::Validation: return "validation";
        case ErrorClass::NotFound: return "not_found";
        case ErrorClass::UnsupportedOperator: return "unsupported_operator";
        case ErrorClass::Cancelled: return "cancelled";
        case ErrorClass::Cache: return "cache";
        case ErrorClass::Transaction: return "transaction";
        case ErrorClass::Origin: return "origin";
        case ErrorClass::Unknown: return "unknown";
    }
    return "unknown";
}

/// Only connectivity-class failures justify trying the other backend.
inline bool is_recoverable(ErrorCode code) {
    return classify(code) == ErrorClass::Connection;
}

/**
 * @brief Error information with code, message, and optional context
 *
 * Value type representing a library error. Used with tl::expected for
 * composable error handling without exceptions. Backend operations also
 * record which backend failed and the logical operation name so callers can
 * decide between retry and abort without inspecting internals.
 */
struct Error {
    ErrorCode code;                      ///< Categorized error code
    std::string message;                 ///< Human-readable error description
    std::optional<std::string> context;  ///< Additional context (table, path, operator)
    std::optional<BackendKind> backend;  ///< Backend that produced the error, if any
    std::string operation;               ///< Logical operation name ("getAll", "update", ...)

    Error(ErrorCode code, std::string message, std::optional<std::string> context = std::nullopt)
        : code(code), message(std::move(message)), context(std::move(context)) {}

    ErrorClass error_class() const { return classify(code); }

    bool recoverable() const { return is_recoverable(code); }

    Error& with_backend(BackendKind kind) {
        backend = kind;
        return *this;
    }

    Error& with_operation(std::string op) {
        operation = std::move(op);
        return *this;
    }

    std::string to_string() const {
        std::string result = "[" + std::to_string(static_cast<int>(code)) + "] " + message;
        if (!operation.empty()) {
            result += " | Operation: " + operation;
        }
        if (backend.has_value()) {
            result += std::string(" | Backend: ") + backend_to_string(*backend);
        }
        if (context.has_value()) {
            result += " | Context: " + *context;
        }
        return result;
    }
};

// Expected type alias
template<typename T>
using Expected = tl::expected<T, Error>;

// ============================================================================
// Call Context (timeouts and cancellation)
// ============================================================================

/**
 * @brief Per-call deadline and cancellation signal passed to every backend call.
 *
 * Copies share the same cancellation flag.
 *
 * @threadsafety Safe to copy across threads; the flag is atomic.
 */
struct CallContext {
    std::shared_ptr<std::atomic<bool>> cancelled;                    ///< Shared cancellation flag (may be null)
    std::optional<std::chrono::steady_clock::time_point> deadline;   ///< Absolute deadline, if any

    static CallContext with_timeout(std::chrono::milliseconds timeout) {
        CallContext ctx;
        if (timeout.count() > 0) {
            ctx.deadline = std::chrono::steady_clock::now() + timeout;
        }
        return ctx;
    }

    static CallContext cancellable() {
        CallContext ctx;
        ctx.cancelled = std::make_shared<std::atomic<bool>>(false);
        return ctx;
    }

    void cancel() const {
        if (cancelled) {
            cancelled->store(true, std::memory_order_release);
        }
    }

    bool is_cancelled() const {
        return cancelled && cancelled->load(std::memory_order_acquire);
    }

    bool expired() const {
        return deadline.has_value() && std::chrono::steady_clock::now() >= *deadline;
    }

    /// Remaining budget, or nullopt when there is no deadline.
    std::optional<std::chrono::milliseconds> remaining() const {
        if (!deadline) {
            return std::nullopt;
        }
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
            *deadline - std::chrono::steady_clock::now());
        return left.count() > 0 ? left : std::chrono::milliseconds(0);
    }

    Expected<void> check() const {
        if (is_cancelled()) {
            return tl::unexpected(Error{ErrorCode::RequestCancelled, "Request cancelled"});
        }
        if (expired()) {
            return tl::unexpected(Error{ErrorCode::RequestTimeout, "Request deadline exceeded"});
        }
        return {};
    }
};

// ============================================================================
// Filter Operators
// ============================================================================

/**
 * @brief Closed set of filter operators.
 *
 * Translators switch over every enumerator without a default label, so a new
 * operator does not compile until each backend decides how to handle it.
 */
enum class Operator {
    Eq,
    Neq,
    Gt,
    Gte,
    Lt,
    Lte,
    Like,
    ILike,
    In,
    Is,
    Contains,
    ContainedBy,
    Overlaps,
    TextSearch,
    RangeGt,
    RangeLt,
    RangeGte,
    RangeLte,
    RangeAdjacent
};

[[nodiscard]] inline const char* operator_to_string(Operator op) {
    switch (op) {
        case Operator::Eq: return "eq";
        case Operator::Neq: return "neq";
        case Operator::Gt: return "gt";
        case Operator::Gte: return "gte";
        case Operator::Lt: return "lt";
        case Operator::Lte: return "lte";
        case Operator::Like: return "like";
        case Operator::ILike: return "ilike";
        case Operator::In: return "in";
        case Operator::Is: return "is";
        case Operator::Contains: return "contains";
        case Operator::ContainedBy: return "containedBy";
        case Operator::Overlaps: return "overlaps";
        case Operator::TextSearch: return "textSearch";
        case Operator::RangeGt: return "rangeGt";
        case Operator::RangeLt: return "rangeLt";
        case Operator::RangeGte: return "rangeGte";
        case Operator::RangeLte: return "rangeLte";
        case Operator::RangeAdjacent: return "rangeAdjacent";
    }
    return "unknown";
}

inline std::optional<Operator> operator_from_string(const std::string& name) {
    static const Operator all[] = {
        Operator::Eq, Operator::Neq, Operator::Gt, Operator::Gte, Operator::Lt,
        Operator::Lte, Operator::Like, Operator::ILike, Operator::In, Operator::Is,
        Operator::Contains, Operator::ContainedBy, Operator::Overlaps,
        Operator::TextSearch, Operator::RangeGt, Operator::RangeLt,
        Operator::RangeGte, Operator::RangeLte, Operator::RangeAdjacent
    };
    for (Operator op : all) {
        if (name == operator_to_string(op)) {
            return op;
        }
    }
    return std::nullopt;
}

// ============================================================================
// Query Options
// ============================================================================

/**
 * @brief Single backend-neutral filter condition.
 */
struct FilterCondition {
    std::string column;       ///< Column / document field name
    Operator op;              ///< Comparison operator
    nlohmann::json value;     ///< Operand (scalar, array for in/contains/overlaps, null for is)

    bool operator==(const FilterCondition& other) const {
        return column == other.column && op == other.op && value == other.value;
    }

    bool operator!=(const FilterCondition& other) const {
        return !(*this == other);
    }
};

struct SortSpec {
    std::string column;
    bool ascending = true;

    bool operator==(const SortSpec& other) const {
        return column == other.column && ascending == other.ascending;
    }
};

/**
 * @brief Page/pageSize XOR cursor pagination.
 *
 * Pages are 1-based. A cursor is the last primary-key value the caller saw;
 * the next page holds keys strictly greater than it.
 */
struct Pagination {
    std::optional<int> page;
    std::optional<int> page_size;
    std::optional<std::string> cursor;

    bool operator==(const Pagination& other) const {
        return page == other.page && page_size == other.page_size && cursor == other.cursor;
    }
};

/**
 * @brief Relation hint: embed rows of `table` whose `foreign_key` equals the
 * parent's `local_key` as an array field named after the related table.
 */
struct IncludeSpec {
    std::string table;
    std::string foreign_key;
    std::string local_key = "id";
    std::vector<std::string> fields;   ///< Empty = all columns of the related table

    bool operator==(const IncludeSpec& other) const {
        return table == other.table && foreign_key == other.foreign_key &&
               local_key == other.local_key && fields == other.fields;
    }
};

/// Full-text shortcut, translated as a textSearch filter.
struct SearchSpec {
    std::string column;
    std::string query;

    bool operator==(const SearchSpec& other) const {
        return column == other.column && query == other.query;
    }
};

/**
 * @brief Backend-neutral query description.
 *
 * Filters are ordered and AND-combined.
 */
struct QueryOptions {
    std::vector<FilterCondition> filters;
    std::optional<Pagination> pagination;
    std::vector<SortSpec> sort;
    std::vector<std::string> select;          ///< Projection (empty = all fields)
    std::vector<IncludeSpec> include;
    std::optional<SearchSpec> search;
    bool count = false;                       ///< Also compute the unpaginated total

    /// All filters, with the search shortcut appended as a textSearch condition.
    std::vector<FilterCondition> effective_filters() const {
        std::vector<FilterCondition> all = filters;
        if (search.has_value()) {
            all.push_back(FilterCondition{search->column, Operator::TextSearch, search->query});
        }
        return all;
    }

    Expected<void> validate() const {
        if (pagination.has_value()) {
            const auto& p = *pagination;
            const bool paged = p.page.has_value();
            const bool cursored = p.cursor.has_value();
            if (paged && cursored) {
                return tl::unexpected(Error{
                    ErrorCode::ValidationFailed,
                    "Pagination accepts either page/pageSize or cursor, not both"
                });
            }
            if (paged && *p.page < 1) {
                return tl::unexpected(Error{ErrorCode::ValidationFailed, "Page numbers start at 1"});
            }
            if (p.page_size.has_value() && *p.page_size < 1) {
                return tl::unexpected(Error{ErrorCode::ValidationFailed, "Page size must be positive"});
            }
        }
        for (const auto& filter : filters) {
            if (filter.column.empty()) {
                return tl::unexpected(Error{ErrorCode::ValidationFailed, "Filter column cannot be empty"});
            }
        }
        for (const auto& inc : include) {
            if (inc.table.empty() || inc.foreign_key.empty() || inc.local_key.empty()) {
                return tl::unexpected(Error{
                    ErrorCode::ValidationFailed,
                    "Include hints need table, foreign_key and local_key"
                });
            }
        }
        return {};
    }

    /// Stable serialization used in list cache keys.
    nlohmann::json to_json() const {
        nlohmann::json j = nlohmann::json::object();
        if (!filters.empty()) {
            j["filters"] = nlohmann::json::array();
            for (const auto& f : filters) {
                j["filters"].push_back({{"column", f.column}, {"op", operator_to_string(f.op)}, {"value", f.value}});
            }
        }
        if (pagination.has_value()) {
            nlohmann::json p = nlohmann::json::object();
            if (pagination->page) p["page"] = *pagination->page;
            if (pagination->page_size) p["pageSize"] = *pagination->page_size;
            if (pagination->cursor) p["cursor"] = *pagination->cursor;
            j["pagination"] = p;
        }
        if (!sort.empty()) {
            j["sort"] = nlohmann::json::array();
            for (const auto& s : sort) {
                j["sort"].push_back({{"column", s.column}, {"ascending", s.ascending}});
            }
        }
        if (!select.empty()) j["select"] = select;
        if (!include.empty()) {
            j["include"] = nlohmann::json::array();
            for (const auto& inc : include) {
                j["include"].push_back({
                    {"table", inc.table}, {"foreignKey", inc.foreign_key},
                    {"localKey", inc.local_key}, {"fields", inc.fields}
                });
            }
        }
        if (search.has_value()) {
            j["search"] = {{"column", search->column}, {"query", search->query}};
        }
        if (count) j["count"] = true;
        return j;
    }

    /// Inverse of to_json(); unknown operators and wrong types are ValidationFailed.
    static Expected<QueryOptions> from_json(const nlohmann::json& j) {
        if (!j.is_object()) {
            return tl::unexpected(Error{ErrorCode::ValidationFailed, "Query options must be a JSON object"});
        }
        QueryOptions options;
        try {
            for (const auto& f : j.value("filters", nlohmann::json::array())) {
                const auto name = f.at("op").get<std::string>();
                auto op = operator_from_string(name);
                if (!op) {
                    return tl::unexpected(Error{ErrorCode::UnsupportedOperator, "Unknown filter operator", name});
                }
                options.filters.push_back(FilterCondition{
                    f.at("column").get<std::string>(), *op, f.value("value", nlohmann::json())
                });
            }
            if (auto p = j.find("pagination"); p != j.end()) {
                Pagination pagination;
                if (p->contains("page")) pagination.page = p->at("page").get<int>();
                if (p->contains("pageSize")) pagination.page_size = p->at("pageSize").get<int>();
                if (p->contains("cursor")) pagination.cursor = p->at("cursor").get<std::string>();
                options.pagination = pagination;
            }
            for (const auto& s : j.value("sort", nlohmann::json::array())) {
                options.sort.push_back(SortSpec{s.at("column").get<std::string>(), s.value("ascending", true)});
            }
            options.select = j.value("select", std::vector<std::string>{});
            for (const auto& inc : j.value("include", nlohmann::json::array())) {
                options.include.push_back(IncludeSpec{
                    inc.at("table").get<std::string>(),
                    inc.at("foreignKey").get<std::string>(),
                    inc.value("localKey", std::string("id")),
                    inc.value("fields", std::vector<std::string>{})
                });
            }
            if (auto s = j.find("search"); s != j.end()) {
                options.search = SearchSpec{s->at("column").get<std::string>(), s->at("query").get<std::string>()};
            }
            options.count = j.value("count", false);
        } catch (const nlohmann::json::exception& e) {
            return tl::unexpected(Error{ErrorCode::ValidationFailed, "Malformed query options", e.what()});
        }
        if (auto valid = options.validate(); !valid) {
            return tl::unexpected(valid.error());
        }
        return options;
    }
};

/**
 * @brief One page of results with the optional unpaginated total.
 */
struct Page {
    std::vector<Record> records;
    std::optional<size_t> total_count;
};

// ============================================================================
// Observability
// ============================================================================

/**
 * @brief Emitted on every fallback transition from one backend to the other.
 */
struct FallbackEvent {
    std::string operation;
    BackendKind from_backend;
    BackendKind to_backend;
    ErrorCode error_code;
    std::string error_message;
    std::chrono::system_clock::time_point timestamp;

    ErrorClass error_class() const { return classify(error_code); }
};

} // namespace duet
