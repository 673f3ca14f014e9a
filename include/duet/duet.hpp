#pragma once

/**
 * @file duet.hpp
 * @brief Main convenience header for the Duet data-access layer
 *
 * Include this single header to get access to all public Duet APIs.
 *
 * Duet is a C++17 data-access layer that serves reads and writes from a
 * primary document store and a secondary SQL store, falling back from one
 * to the other on connection-class failures, with an in-process record
 * cache and a content-addressed query result cache in front of a
 * GraphQL-style origin.
 *
 * Quick Start:
 * @code
 * #include <duet/duet.hpp>
 *
 * int main() {
 *     auto config = duet::Config::from_env();
 *     if (!config) {
 *         std::cerr << "Error: " << config.error().to_string() << std::endl;
 *         return 1;
 *     }
 *     duet::log::init(config->log_level);
 *
 *     auto access = duet::DataAccess::create(*config);
 *     if (!access) {
 *         std::cerr << "Error: " << access.error().to_string() << std::endl;
 *         return 1;
 *     }
 *
 *     duet::backend::TableHandle tools{"tools",
 *         {{"id", duet::backend::ColumnType::Text, false},
 *          {"name", duet::backend::ColumnType::Text, false}},
 *         {"id"}};
 *     auto collection = (*access)->collection(tools);
 *     auto created = collection->create({{"name", "Tool A"}});
 *     return created ? 0 : 1;
 * }
 * @endcode
 *
 * Key Components:
 * - duet::DataAccess: process-wide facade, created once at startup
 * - duet::Collection: CRUD, paging, batch and raw queries over one table
 * - duet::Config: backend locations, cache TTLs, batch sizing
 * - duet::Error: structured errors with a recoverability class
 *
 * Thread Safety:
 * - DataAccess and Collection are safe to use from multiple threads
 * - Stale cache entries are refreshed on background tasks owned by DataAccess
 */

// Core types
#include "types.hpp"
#include "config.hpp"
#include "log.hpp"

// Public API
#include "data_access.hpp"

// Backends
#include "backend/client.hpp"
#include "backend/table.hpp"
#include "backend/document_backend.hpp"
#include "backend/sqlite_backend.hpp"
#include "backend/unconfigured_backend.hpp"

// Engine components (optional, for advanced usage)
#include "engine/cache_store.hpp"
#include "engine/fallback_coordinator.hpp"
#include "engine/batch_executor.hpp"
#include "engine/transaction_runner.hpp"
#include "engine/query_result_cache.hpp"
#include "engine/query_tool.hpp"
#include "engine/semantic_store.hpp"

// Query origin
#include "origin/graphql_origin.hpp"

/**
 * @namespace duet
 * @brief Main namespace for the Duet library
 *
 * Internal implementation details are in nested namespaces:
 * - duet::backend: store adapters and table descriptions
 * - duet::engine: caching, fallback, batching, transactions, translators
 * - duet::origin: remote query origins
 */
