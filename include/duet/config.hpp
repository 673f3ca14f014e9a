#pragma once

#include "types.hpp"
#include <chrono>
#include <cstdlib>
#include <optional>
#include <stdexcept>
#include <string>

namespace duet {

// ============================================================================
// Cache Configuration
// ============================================================================

/**
 * @brief TTL assignment by payload size class.
 *
 * Larger list results get shorter TTLs because they change more often;
 * single-record lookups get the longest TTL.
 */
struct TtlPolicy {
    size_t large_list_threshold = 100;                          ///< More rows than this is "large"
    size_t medium_list_threshold = 50;                          ///< More rows than this is "medium"
    std::chrono::milliseconds large_list_ttl{60000};            ///< 1 minute
    std::chrono::milliseconds medium_list_ttl{180000};          ///< 3 minutes
    std::chrono::milliseconds small_list_ttl{300000};           ///< 5 minutes
    std::chrono::milliseconds item_ttl{600000};                 ///< 10 minutes

    std::chrono::milliseconds ttl_for_list(size_t rows) const {
        if (rows > large_list_threshold) {
            return large_list_ttl;
        }
        if (rows > medium_list_threshold) {
            return medium_list_ttl;
        }
        return small_list_ttl;
    }

    std::chrono::milliseconds ttl_for_item() const {
        return item_ttl;
    }

    bool operator==(const TtlPolicy& other) const {
        return large_list_threshold == other.large_list_threshold &&
               medium_list_threshold == other.medium_list_threshold &&
               large_list_ttl == other.large_list_ttl &&
               medium_list_ttl == other.medium_list_ttl &&
               small_list_ttl == other.small_list_ttl &&
               item_ttl == other.item_ttl;
    }
};

struct CacheConfig {
    bool enabled = true;
    size_t max_entries = 500;
    std::chrono::milliseconds default_ttl{300000};
    bool debug = false;                                          ///< Log hits/misses at debug level
    TtlPolicy ttl_policy;

    bool operator==(const CacheConfig& other) const {
        return enabled == other.enabled && max_entries == other.max_entries &&
               default_ttl == other.default_ttl && debug == other.debug &&
               ttl_policy == other.ttl_policy;
    }
};

struct QueryCacheConfig {
    std::chrono::minutes ttl{60};
    std::string table_name = "gql_cache";
    std::optional<std::string> endpoint_url;
    std::optional<std::string> api_key;

    bool operator==(const QueryCacheConfig& other) const {
        return ttl == other.ttl && table_name == other.table_name &&
               endpoint_url == other.endpoint_url && api_key == other.api_key;
    }
};

// ============================================================================
// Process Configuration
// ============================================================================

/**
 * @brief Complete process-wide configuration.
 *
 * Resolved once at startup (from_env() or by hand), validated, and immutable
 * afterwards. The default backend kind cannot change for the process lifetime.
 *
 * @threadsafety Safe to copy and pass by value across threads
 */
struct Config {
    BackendKind default_backend = BackendKind::Primary;      ///< Backend tried first
    std::optional<std::string> document_store_path;          ///< Primary: ":memory:" or snapshot file
    std::optional<std::string> sqlite_path;                  ///< Secondary: ":memory:" or database file

    CacheConfig cache;
    QueryCacheConfig query_cache;

    size_t batch_chunk_size = 10;                            ///< Items per batch chunk (> 0)
    std::chrono::milliseconds operation_timeout{0};          ///< Default per-call deadline (0 = none)
    int default_page_size = 20;                              ///< Used when pagination omits page_size
    std::string log_level = "info";

    bool primary_configured() const {
        return document_store_path.has_value() && !document_store_path->empty();
    }

    bool secondary_configured() const {
        return sqlite_path.has_value() && !sqlite_path->empty();
    }

    Expected<void> validate() const {
        if (!primary_configured() && !secondary_configured()) {
            return tl::unexpected(Error{
                ErrorCode::NoBackendConfigured,
                "Neither the document store nor the SQLite store is configured"
            });
        }
        if (cache.enabled && cache.max_entries == 0) {
            return tl::unexpected(Error{ErrorCode::InvalidConfig, "cache.max_entries must be positive"});
        }
        if (cache.default_ttl.count() <= 0) {
            return tl::unexpected(Error{ErrorCode::InvalidConfig, "cache.default_ttl must be positive"});
        }
        const auto& policy = cache.ttl_policy;
        if (policy.medium_list_threshold > policy.large_list_threshold) {
            return tl::unexpected(Error{
                ErrorCode::InvalidConfig,
                "Medium list threshold cannot exceed the large list threshold"
            });
        }
        if (policy.large_list_ttl.count() <= 0 || policy.medium_list_ttl.count() <= 0 ||
            policy.small_list_ttl.count() <= 0 || policy.item_ttl.count() <= 0) {
            return tl::unexpected(Error{ErrorCode::InvalidConfig, "Cache TTLs must be positive"});
        }
        if (batch_chunk_size == 0) {
            return tl::unexpected(Error{ErrorCode::InvalidConfig, "batch_chunk_size must be positive"});
        }
        if (operation_timeout.count() < 0) {
            return tl::unexpected(Error{ErrorCode::InvalidConfig, "operation_timeout cannot be negative"});
        }
        if (default_page_size <= 0) {
            return tl::unexpected(Error{ErrorCode::InvalidConfig, "default_page_size must be positive"});
        }
        if (query_cache.ttl.count() <= 0) {
            return tl::unexpected(Error{ErrorCode::InvalidConfig, "query_cache.ttl must be positive"});
        }
        if (query_cache.table_name.empty()) {
            return tl::unexpected(Error{ErrorCode::InvalidConfig, "query_cache.table_name cannot be empty"});
        }
        return {};
    }

    /**
     * @brief Resolve configuration from DUET_* environment variables.
     *
     * Fails on malformed values and when no backend is configured.
     */
    static Expected<Config> from_env() {
        Config config;

        if (auto value = env("DUET_DEFAULT_BACKEND")) {
            if (*value == "primary") {
                config.default_backend = BackendKind::Primary;
            } else if (*value == "secondary") {
                config.default_backend = BackendKind::Secondary;
            } else {
                return tl::unexpected(Error{
                    ErrorCode::InvalidConfig,
                    "DUET_DEFAULT_BACKEND must be 'primary' or 'secondary'",
                    *value
                });
            }
        }

        config.document_store_path = env("DUET_DOCUMENT_STORE_PATH");
        config.sqlite_path = env("DUET_SQLITE_PATH");

        if (auto value = env("DUET_CACHE_ENABLED")) {
            auto parsed = parse_bool("DUET_CACHE_ENABLED", *value);
            if (!parsed) return tl::unexpected(parsed.error());
            config.cache.enabled = *parsed;
        }

        auto& policy = config.cache.ttl_policy;
        struct SizeSetting { const char* name; size_t* target; };
        for (const auto& setting : {
                 SizeSetting{"DUET_CACHE_MAX_ENTRIES", &config.cache.max_entries},
                 SizeSetting{"DUET_CACHE_LARGE_LIST_THRESHOLD", &policy.large_list_threshold},
                 SizeSetting{"DUET_CACHE_MEDIUM_LIST_THRESHOLD", &policy.medium_list_threshold},
                 SizeSetting{"DUET_BATCH_CHUNK_SIZE", &config.batch_chunk_size}}) {
            if (auto value = env(setting.name)) {
                auto parsed = parse_number(setting.name, *value);
                if (!parsed) return tl::unexpected(parsed.error());
                *setting.target = static_cast<size_t>(*parsed);
            }
        }

        struct DurationSetting { const char* name; std::chrono::milliseconds* target; };
        for (const auto& setting : {
                 DurationSetting{"DUET_CACHE_DEFAULT_TTL_MS", &config.cache.default_ttl},
                 DurationSetting{"DUET_CACHE_LARGE_LIST_TTL_MS", &policy.large_list_ttl},
                 DurationSetting{"DUET_CACHE_MEDIUM_LIST_TTL_MS", &policy.medium_list_ttl},
                 DurationSetting{"DUET_CACHE_SMALL_LIST_TTL_MS", &policy.small_list_ttl},
                 DurationSetting{"DUET_CACHE_ITEM_TTL_MS", &policy.item_ttl},
                 DurationSetting{"DUET_OPERATION_TIMEOUT_MS", &config.operation_timeout}}) {
            if (auto value = env(setting.name)) {
                auto parsed = parse_number(setting.name, *value);
                if (!parsed) return tl::unexpected(parsed.error());
                *setting.target = std::chrono::milliseconds(*parsed);
            }
        }

        if (auto value = env("DUET_DEFAULT_PAGE_SIZE")) {
            auto parsed = parse_number("DUET_DEFAULT_PAGE_SIZE", *value);
            if (!parsed) return tl::unexpected(parsed.error());
            config.default_page_size = static_cast<int>(*parsed);
        }
        if (auto value = env("DUET_QUERY_CACHE_TTL_MINUTES")) {
            auto parsed = parse_number("DUET_QUERY_CACHE_TTL_MINUTES", *value);
            if (!parsed) return tl::unexpected(parsed.error());
            config.query_cache.ttl = std::chrono::minutes(*parsed);
        }
        config.query_cache.endpoint_url = env("DUET_GRAPHQL_URL");
        config.query_cache.api_key = env("DUET_GRAPHQL_API_KEY");

        if (auto value = env("DUET_LOG_LEVEL")) {
            config.log_level = *value;
        }

        if (auto result = config.validate(); !result) {
            return tl::unexpected(result.error());
        }
        return config;
    }

    bool operator==(const Config& other) const {
        return default_backend == other.default_backend &&
               document_store_path == other.document_store_path &&
               sqlite_path == other.sqlite_path &&
               cache == other.cache &&
               query_cache == other.query_cache &&
               batch_chunk_size == other.batch_chunk_size &&
               operation_timeout == other.operation_timeout &&
               default_page_size == other.default_page_size &&
               log_level == other.log_level;
    }

    bool operator!=(const Config& other) const {
        return !(*this == other);
    }

private:
    static std::optional<std::string> env(const char* name) {
        const char* raw = std::getenv(name);
        if (raw == nullptr || *raw == '\0') {
            return std::nullopt;
        }
        return std::string(raw);
    }

    static Expected<long long> parse_number(const char* name, const std::string& value) {
        try {
            size_t consumed = 0;
            long long parsed = std::stoll(value, &consumed);
            if (consumed != value.size() || parsed < 0) {
                throw std::invalid_argument(value);
            }
            return parsed;
        } catch (const std::exception&) {
            return tl::unexpected(Error{
                ErrorCode::InvalidConfig,
                std::string(name) + " must be a non-negative integer",
                value
            });
        }
    }

    static Expected<bool> parse_bool(const char* name, const std::string& value) {
        if (value == "1" || value == "true" || value == "yes") return true;
        if (value == "0" || value == "false" || value == "no") return false;
        return tl::unexpected(Error{
            ErrorCode::InvalidConfig,
            std::string(name) + " must be a boolean",
            value
        });
    }
};

} // namespace duet
