#pragma once

#include "../backend/client.hpp"
#include "../config.hpp"
#include "../log.hpp"
#include "../types.hpp"
#include "content_hash.hpp"
#include "semantic_store.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>

namespace duet {
namespace engine {

/**
 * @brief The real query endpoint behind the cache (GraphQL-style).
 */
class IQueryOrigin {
public:
    virtual ~IQueryOrigin() = default;

    /// Returns the response `data` payload.
    virtual Expected<nlohmann::json> execute(
        const std::string& query,
        const nlohmann::json& variables,
        const CallContext& ctx = CallContext{}
    ) = 0;
};

/**
 * @brief Typed outcome of QueryResultCache::execute(). Failures are values.
 */
struct QueryResult {
    bool success = false;
    std::string query;
    nlohmann::json variables = nlohmann::json::object();
    nlohmann::json data;
    std::optional<std::string> error;
    bool from_cache = false;

    static QueryResult failure(std::string message) {
        QueryResult result;
        result.error = std::move(message);
        return result;
    }

    nlohmann::json to_json() const {
        if (!success) {
            return nlohmann::json{{"success", false}, {"error", error.value_or("Unknown error")}};
        }
        return nlohmann::json{
            {"success", true},
            {"query", query},
            {"variables", variables},
            {"data", data}
        };
    }
};

/**
 * @brief Content-addressed, time-bounded cache in front of a query origin.
 *
 * Rows live in the relational store (`gql_cache` by default) keyed by the
 * SHA-256 of query and canonical variables. A row is fresh while
 * `now - created_at < ttl`. Fresh responses are mirrored into the semantic
 * store, best-effort.
 *
 * Cache reads and writes never fail the call: errors are logged and treated
 * as misses. Origin failures come back as `{success:false, error}`.
 */
class QueryResultCache {
public:
    using WallClock = std::function<std::chrono::system_clock::time_point()>;

    QueryResultCache(
        std::shared_ptr<backend::IRelationalClient> store,
        std::shared_ptr<IQueryOrigin> origin,
        std::shared_ptr<ISemanticStore> semantic_store,
        QueryCacheConfig config = QueryCacheConfig{},
        WallClock clock = nullptr
    )
        : store_(std::move(store))
        , origin_(std::move(origin))
        , semantic_store_(std::move(semantic_store))
        , config_(std::move(config))
        , clock_(clock ? std::move(clock) : WallClock([] { return std::chrono::system_clock::now(); }))
    {}

    /// Row layout: (id TEXT PRIMARY KEY, query TEXT, variables JSON, response JSON, created_at TIMESTAMP).
    static backend::TableHandle table_handle(const std::string& name) {
        using backend::Column;
        using backend::ColumnType;
        return backend::TableHandle{
            name,
            {
                Column{"id", ColumnType::Text, false},
                Column{"query", ColumnType::Text, false},
                Column{"variables", ColumnType::Json, true},
                Column{"response", ColumnType::Json, true},
                Column{"created_at", ColumnType::Timestamp, false}
            },
            {"id"}
        };
    }

    /// Create/register the cache table. Call once before execute().
    Expected<void> initialize() {
        return store_->register_table(table_handle(config_.table_name));
    }

    QueryResult execute(
        const std::string& query,
        const nlohmann::json& variables = nlohmann::json::object(),
        bool use_cache = true,
        const CallContext& ctx = CallContext{}
    ) {
        if (query.empty()) {
            return QueryResult::failure("Query text cannot be empty");
        }
        const nlohmann::json vars = variables.is_null() ? nlohmann::json::object() : variables;
        const std::string id = query_content_hash(query, vars);

        if (use_cache) {
            if (auto cached = lookup(id, ctx)) {
                QueryResult result;
                result.success = true;
                result.query = query;
                result.variables = vars;
                result.data = std::move(*cached);
                result.from_cache = true;
                return result;
            }
        }

        origin_requests_.fetch_add(1, std::memory_order_relaxed);
        auto response = origin_->execute(query, vars, ctx);
        if (!response) {
            DUET_ERROR("Query origin failed: {}", response.error().to_string());
            return QueryResult::failure(response.error().message);
        }

        if (use_cache) {
            write_back(id, query, vars, *response, ctx);
        }

        QueryResult result;
        result.success = true;
        result.query = query;
        result.variables = vars;
        result.data = std::move(*response);
        return result;
    }

    /// Requests sent to the origin so far (cache misses plus uncached calls).
    uint64_t origin_requests() const {
        return origin_requests_.load(std::memory_order_relaxed);
    }

    const QueryCacheConfig& config() const { return config_; }

private:
    long long now_ms() const {
        return std::chrono::duration_cast<std::chrono::milliseconds>(clock_().time_since_epoch()).count();
    }

    std::optional<nlohmann::json> lookup(const std::string& id, const CallContext& ctx) {
        auto row = store_->get(config_.table_name, id, ctx);
        if (!row) {
            DUET_WARN("Query cache read failed, treating as miss: {}", row.error().to_string());
            return std::nullopt;
        }
        if (!row->has_value()) {
            return std::nullopt;
        }

        const Record& cached = **row;
        auto created = cached.find("created_at");
        auto response = cached.find("response");
        if (created == cached.end() || !created->is_number_integer() || response == cached.end()) {
            DUET_WARN("Query cache row {} is malformed, treating as miss", id);
            return std::nullopt;
        }

        const long long age_ms = now_ms() - created->get<long long>();
        const long long ttl_ms = std::chrono::duration_cast<std::chrono::milliseconds>(config_.ttl).count();
        if (age_ms >= ttl_ms) {
            DUET_DEBUG("Query cache row {} expired ({} ms old)", id, age_ms);
            return std::nullopt;
        }
        return *response;
    }

    void write_back(
        const std::string& id,
        const std::string& query,
        const nlohmann::json& variables,
        const nlohmann::json& response,
        const CallContext& ctx
    ) {
        Record row{
            {"id", id},
            {"query", query},
            {"variables", variables},
            {"response", response},
            {"created_at", now_ms()}
        };
        auto stored = store_->upsert(config_.table_name, row, "id", ctx);
        if (!stored) {
            DUET_WARN("Query cache write failed: {}", stored.error().to_string());
        }

        if (semantic_store_) {
            if (auto ok = ctx.check(); !ok) {
                DUET_WARN("Semantic store write skipped: {}", ok.error().to_string());
                return;
            }
            auto embedded = semantic_store_->store(response.dump(), ctx);
            if (!embedded) {
                DUET_WARN("Semantic store write failed: {}", embedded.error().to_string());
            }
        }
    }

    std::shared_ptr<backend::IRelationalClient> store_;
    std::shared_ptr<IQueryOrigin> origin_;
    std::shared_ptr<ISemanticStore> semantic_store_;
    QueryCacheConfig config_;
    WallClock clock_;
    std::atomic<uint64_t> origin_requests_{0};
};

} // namespace engine
} // namespace duet
