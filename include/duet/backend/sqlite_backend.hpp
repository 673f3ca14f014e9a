#pragma once

#include "../engine/sql_translator.hpp"
#include "client.hpp"

#include <memory>
#include <mutex>
#include <sqlite3.h>
#include <string>
#include <unordered_map>
#include <vector>

namespace duet {
namespace backend {

/**
 * @brief Secondary adapter: relational store over SQLite.
 *
 * Registered tables are created on demand. All values are bound parameters;
 * writes return the stored row through RETURNING. JSON columns are stored as
 * text and parsed back on read.
 *
 * One connection is shared by all callers and serialized by a recursive
 * mutex. begin() keeps the mutex held on the calling thread until commit()
 * or rollback(), so a transaction body sees no interleaved statements.
 *
 * Cancellation and deadlines are enforced through the progress handler:
 * a running statement is interrupted once the CallContext fires.
 */
class SqliteBackend : public IRelationalClient {
public:
    static constexpr const char* kMemoryPath = ":memory:";

    static Expected<std::shared_ptr<SqliteBackend>> open(const std::string& path, int default_page_size = 20);

    ~SqliteBackend() override;

    SqliteBackend(const SqliteBackend&) = delete;
    SqliteBackend& operator=(const SqliteBackend&) = delete;

    BackendKind kind() const override { return BackendKind::Secondary; }

    std::string name() const override { return "sqlite"; }

    Expected<void> register_table(const TableHandle& table) override;

    Expected<std::optional<Record>> get(const std::string& table, const RecordId& id, const CallContext& ctx = CallContext{}) override;

    Expected<std::vector<Record>> list(const std::string& table, const QueryOptions& options, const CallContext& ctx = CallContext{}) override;

    Expected<size_t> count(const std::string& table, const QueryOptions& options, const CallContext& ctx = CallContext{}) override;

    Expected<Record> insert(const std::string& table, const Record& data, const CallContext& ctx = CallContext{}) override;

    Expected<Record> update(const std::string& table, const RecordId& id, const Record& patch, const CallContext& ctx = CallContext{}) override;

    Expected<bool> remove(const std::string& table, const RecordId& id, const CallContext& ctx = CallContext{}) override;

    Expected<size_t> remove_many(const std::string& table, const std::vector<RecordId>& ids, const CallContext& ctx = CallContext{}) override;

    Expected<std::vector<Record>> raw_query(
        const std::string& query,
        const std::vector<nlohmann::json>& params,
        const CallContext& ctx = CallContext{}
    ) override;

    Expected<void> begin(const CallContext& ctx = CallContext{}) override;

    Expected<void> commit(const CallContext& ctx = CallContext{}) override;

    Expected<void> rollback() override;

    Expected<Record> upsert(
        const std::string& table,
        const Record& data,
        const std::string& conflict_column,
        const CallContext& ctx = CallContext{}
    ) override;

    /// Whether a transaction is open on this connection.
    bool in_transaction() const;

private:
    struct StatementResult {
        std::vector<Record> rows;
        int changes = 0;
    };

    SqliteBackend(sqlite3* db, std::string path, int default_page_size);

    Expected<const TableHandle*> find_table(const std::string& table) const;

    /// Prepare, bind, step to completion. `table` drives column typing on read.
    Expected<StatementResult> run(
        const engine::SqlStatement& statement,
        const CallContext& ctx,
        const TableHandle* table,
        const std::vector<std::string>& json_columns = {}
    );

    Expected<void> exec(const std::string& sql, const CallContext& ctx);

    /// "pk1" = ? AND "pk2" = ? with the typed key values appended to params.
    Expected<std::string> key_clause(const TableHandle& table, const RecordId& id, std::vector<nlohmann::json>& params) const;

    Expected<void> check_columns(const TableHandle& table, const Record& data) const;

    Error map_error(int rc, const std::string& prefix, const CallContext& ctx) const;

    Error tag(Error error) const;

    sqlite3* db_ = nullptr;
    std::string path_;
    engine::SqlFilterTranslator translator_;
    std::unordered_map<std::string, TableHandle> tables_;
    bool in_transaction_ = false;
    mutable std::recursive_mutex mutex_;
};

} // namespace backend
} // namespace duet
