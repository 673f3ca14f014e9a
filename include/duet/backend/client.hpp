#pragma once

#include "../config.hpp"
#include "../types.hpp"
#include "table.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace duet {
namespace backend {

/**
 * @brief Thin handle over one physical store.
 *
 * Implementations declare their kind at construction; callers never probe the
 * concrete type. Every call takes a CallContext and must return
 * RequestCancelled/RequestTimeout when the context says so.
 *
 * Design principles:
 * - Synchronous: all operations block until complete
 * - Thread-safe: handles are shared by all in-flight requests
 * - Absence is not an error: get() returns nullopt for a missing id
 */
class IBackendClient {
public:
    virtual ~IBackendClient() = default;

    /// Declared capability, fixed for the lifetime of the handle.
    virtual BackendKind kind() const = 0;

    /// Short adapter name for logs ("document", "sqlite", ...).
    virtual std::string name() const = 0;

    /**
     * @brief Make a table known to the adapter (creating it where needed).
     *
     * Called once per collection before any data operation.
     */
    virtual Expected<void> register_table(const TableHandle& table) = 0;

    virtual Expected<std::optional<Record>> get(
        const std::string& table,
        const RecordId& id,
        const CallContext& ctx = CallContext{}
    ) = 0;

    virtual Expected<std::vector<Record>> list(
        const std::string& table,
        const QueryOptions& options,
        const CallContext& ctx = CallContext{}
    ) = 0;

    /// Rows matching the filters, ignoring pagination/sort/projection.
    virtual Expected<size_t> count(
        const std::string& table,
        const QueryOptions& options,
        const CallContext& ctx = CallContext{}
    ) = 0;

    /// Insert a record; generates an id when the key is absent. Returns the stored row.
    virtual Expected<Record> insert(
        const std::string& table,
        const Record& data,
        const CallContext& ctx = CallContext{}
    ) = 0;

    /// Merge `patch` into an existing row. Missing id is NotFound.
    virtual Expected<Record> update(
        const std::string& table,
        const RecordId& id,
        const Record& patch,
        const CallContext& ctx = CallContext{}
    ) = 0;

    /// Returns whether a row was deleted.
    virtual Expected<bool> remove(
        const std::string& table,
        const RecordId& id,
        const CallContext& ctx = CallContext{}
    ) = 0;

    /// Delete many rows at once; returns how many existed.
    virtual Expected<size_t> remove_many(
        const std::string& table,
        const std::vector<RecordId>& ids,
        const CallContext& ctx = CallContext{}
    ) = 0;

    /// Escape hatch: adapter-native query text, rows returned untransformed.
    virtual Expected<std::vector<Record>> raw_query(
        const std::string& query,
        const std::vector<nlohmann::json>& params,
        const CallContext& ctx = CallContext{}
    ) = 0;
};

/**
 * @brief Relational capability: transactions and keyed upserts.
 *
 * Only the Secondary store implements this; the Primary has no transaction
 * primitive and can never be handed to a transaction body.
 */
class IRelationalClient : public IBackendClient {
public:
    virtual Expected<void> begin(const CallContext& ctx = CallContext{}) = 0;
    virtual Expected<void> commit(const CallContext& ctx = CallContext{}) = 0;
    virtual Expected<void> rollback() = 0;

    /// INSERT .. ON CONFLICT(conflict_column) DO UPDATE; returns the stored row.
    virtual Expected<Record> upsert(
        const std::string& table,
        const Record& data,
        const std::string& conflict_column,
        const CallContext& ctx = CallContext{}
    ) = 0;
};

/**
 * @brief The two process-wide backend handles plus the default selection.
 *
 * Read-only after startup.
 */
struct BackendSet {
    std::shared_ptr<IBackendClient> primary;
    std::shared_ptr<IRelationalClient> secondary;
    BackendKind default_backend = BackendKind::Primary;

    IBackendClient& get(BackendKind kind) const {
        if (kind == BackendKind::Primary) {
            return *primary;
        }
        return *secondary;
    }

    Expected<void> validate() const {
        if (!primary || !secondary) {
            return tl::unexpected(Error{
                ErrorCode::NoBackendConfigured,
                "Both backend handles must be present"
            });
        }
        if (primary->kind() != BackendKind::Primary) {
            return tl::unexpected(Error{
                ErrorCode::InvalidConfig,
                "Primary handle declares a different backend kind",
                primary->name()
            });
        }
        if (secondary->kind() != BackendKind::Secondary) {
            return tl::unexpected(Error{
                ErrorCode::InvalidConfig,
                "Secondary handle declares a different backend kind",
                secondary->name()
            });
        }
        return {};
    }
};

/**
 * @brief Single configuration-resolution step, run once at startup.
 *
 * Opens the configured adapters, substitutes a "not configured" handle for a
 * missing side, and fails with NoBackendConfigured when neither side is set.
 *
 * @param config Validated process configuration
 * @return Expected<BackendSet> Resolved handles or configuration error
 */
Expected<BackendSet> resolve_backends(const Config& config);

} // namespace backend
} // namespace duet
