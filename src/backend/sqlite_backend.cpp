#include "duet/backend/sqlite_backend.hpp"
#include "duet/engine/id_generator.hpp"
#include "duet/log.hpp"

#include <algorithm>
#include <utility>

namespace duet {
namespace backend {

namespace {

using StatementPtr = std::unique_ptr<sqlite3_stmt, decltype(&sqlite3_finalize)>;

// Opcodes between progress-handler checks.
constexpr int kProgressInterval = 1000;

int progress_callback(void* arg) {
    const auto* ctx = static_cast<const CallContext*>(arg);
    return (ctx->is_cancelled() || ctx->expired()) ? 1 : 0;
}

/// Installs the cancellation hook for the lifetime of one statement.
class ProgressGuard {
public:
    ProgressGuard(sqlite3* db, const CallContext& ctx)
        : db_(db)
    {
        if (ctx.cancelled || ctx.deadline) {
            sqlite3_progress_handler(db_, kProgressInterval, &progress_callback,
                                     const_cast<CallContext*>(&ctx));
            installed_ = true;
        }
    }

    ~ProgressGuard() {
        if (installed_) {
            sqlite3_progress_handler(db_, 0, nullptr, nullptr);
        }
    }

    ProgressGuard(const ProgressGuard&) = delete;
    ProgressGuard& operator=(const ProgressGuard&) = delete;

private:
    sqlite3* db_;
    bool installed_ = false;
};

std::string quote(const std::string& name) {
    return engine::quote_identifier(name);
}

int bind_value(sqlite3_stmt* stmt, int index, const nlohmann::json& value) {
    if (value.is_null()) {
        return sqlite3_bind_null(stmt, index);
    }
    if (value.is_boolean()) {
        return sqlite3_bind_int(stmt, index, value.get<bool>() ? 1 : 0);
    }
    if (value.is_number_integer()) {
        return sqlite3_bind_int64(stmt, index, value.get<sqlite3_int64>());
    }
    if (value.is_number()) {
        return sqlite3_bind_double(stmt, index, value.get<double>());
    }
    if (value.is_string()) {
        const auto& text = value.get_ref<const std::string&>();
        return sqlite3_bind_text(stmt, index, text.c_str(), static_cast<int>(text.size()), SQLITE_TRANSIENT);
    }
    const std::string text = value.dump();
    return sqlite3_bind_text(stmt, index, text.c_str(), static_cast<int>(text.size()), SQLITE_TRANSIENT);
}

/// Column value as stored; JSON columns become strings here and are parsed in read_row().
nlohmann::json column_value(sqlite3_stmt* stmt, int index) {
    switch (sqlite3_column_type(stmt, index)) {
        case SQLITE_INTEGER:
            return static_cast<long long>(sqlite3_column_int64(stmt, index));
        case SQLITE_FLOAT:
            return sqlite3_column_double(stmt, index);
        case SQLITE_TEXT:
        case SQLITE_BLOB: {
            const auto* data = static_cast<const char*>(sqlite3_column_blob(stmt, index));
            const int size = sqlite3_column_bytes(stmt, index);
            return data != nullptr ? std::string(data, static_cast<size_t>(size)) : std::string();
        }
        default:
            return nullptr;
    }
}

nlohmann::json parse_json_text(const nlohmann::json& value) {
    if (!value.is_string()) {
        return value;
    }
    auto parsed = nlohmann::json::parse(value.get_ref<const std::string&>(), nullptr, false);
    return parsed.is_discarded() ? value : parsed;
}

Record read_row(sqlite3_stmt* stmt, const TableHandle* table, const std::vector<std::string>& json_columns) {
    Record row = Record::object();
    const int columns = sqlite3_column_count(stmt);
    for (int i = 0; i < columns; ++i) {
        const std::string name = sqlite3_column_name(stmt, i);
        nlohmann::json value = column_value(stmt, i);

        if (std::find(json_columns.begin(), json_columns.end(), name) != json_columns.end()) {
            value = parse_json_text(value);
        } else if (table != nullptr && !value.is_null()) {
            if (const Column* column = table->find_column(name)) {
                if (column->type == ColumnType::Boolean && value.is_number_integer()) {
                    value = value.get<long long>() != 0;
                } else if (column->type == ColumnType::Json) {
                    value = parse_json_text(value);
                }
            }
        }
        row[name] = std::move(value);
    }
    return row;
}

/// JSON columns are always stored as serialized text.
nlohmann::json storage_value(const TableHandle& table, const std::string& column, const nlohmann::json& value) {
    const Column* declared = table.find_column(column);
    if (declared != nullptr && declared->type == ColumnType::Json && !value.is_null()) {
        return value.dump();
    }
    return value;
}

} // namespace

// ============================================================================
// Lifecycle
// ============================================================================

Expected<std::shared_ptr<SqliteBackend>> SqliteBackend::open(const std::string& path, int default_page_size) {
    if (path.empty()) {
        return tl::unexpected(Error{ErrorCode::InvalidConfig, "SQLite path cannot be empty"});
    }

    sqlite3* db = nullptr;
    const int rc = sqlite3_open_v2(path.c_str(), &db,
                                   SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX,
                                   nullptr);
    if (rc != SQLITE_OK) {
        std::string message = "Failed to open SQLite database";
        if (db != nullptr && sqlite3_errmsg(db) != nullptr) {
            message += std::string(": ") + sqlite3_errmsg(db);
        }
        if (db != nullptr) {
            sqlite3_close(db);
        }
        Error error{ErrorCode::BackendUnavailable, std::move(message), path};
        error.with_backend(BackendKind::Secondary);
        return tl::unexpected(error);
    }
    sqlite3_busy_timeout(db, 5000);

    auto instance = std::shared_ptr<SqliteBackend>(new SqliteBackend(db, path, default_page_size));
    if (auto pragma = instance->exec("PRAGMA foreign_keys = ON", CallContext{}); !pragma) {
        return tl::unexpected(pragma.error());
    }
    return instance;
}

SqliteBackend::SqliteBackend(sqlite3* db, std::string path, int default_page_size)
    : db_(db)
    , path_(std::move(path))
    , translator_([this](const std::string& name) -> const TableHandle* {
          auto it = tables_.find(name);
          return it == tables_.end() ? nullptr : &it->second;
      }, default_page_size)
{}

SqliteBackend::~SqliteBackend() {
    if (in_transaction_) {
        DUET_WARN("SQLite connection closed with an open transaction; rolling back");
        sqlite3_exec(db_, "ROLLBACK", nullptr, nullptr, nullptr);
    }
    if (db_ != nullptr) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

// ============================================================================
// Schema
// ============================================================================

Expected<void> SqliteBackend::register_table(const TableHandle& table) {
    if (auto valid = table.validate(); !valid) {
        return tl::unexpected(tag(valid.error()));
    }

    const bool rowid_key = !table.composite_key() &&
                           table.find_column(table.primary_key.front())->type == ColumnType::Integer;

    std::string sql = "CREATE TABLE IF NOT EXISTS " + quote(table.name) + " (";
    for (size_t i = 0; i < table.columns.size(); ++i) {
        const auto& column = table.columns[i];
        if (i > 0) sql += ", ";
        sql += quote(column.name) + " " + column_type_to_sql(column.type);
        if (rowid_key && column.name == table.primary_key.front()) {
            sql += " PRIMARY KEY";
        } else if (!column.nullable) {
            sql += " NOT NULL";
        }
    }
    if (!rowid_key) {
        sql += ", PRIMARY KEY (";
        for (size_t i = 0; i < table.primary_key.size(); ++i) {
            if (i > 0) sql += ", ";
            sql += quote(table.primary_key[i]);
        }
        sql += ")";
    }
    sql += ")";

    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (auto created = exec(sql, CallContext{}); !created) {
        return created;
    }
    tables_[table.name] = table;
    return {};
}

Expected<const TableHandle*> SqliteBackend::find_table(const std::string& table) const {
    auto it = tables_.find(table);
    if (it == tables_.end()) {
        return tl::unexpected(tag(Error{ErrorCode::TableNotRegistered, "Table is not registered", table}));
    }
    return &it->second;
}

// ============================================================================
// Reads
// ============================================================================

Expected<std::optional<Record>> SqliteBackend::get(const std::string& table, const RecordId& id, const CallContext& ctx) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    auto handle = find_table(table);
    if (!handle) {
        return tl::unexpected(handle.error());
    }

    engine::SqlStatement statement;
    auto where = key_clause(**handle, id, statement.params);
    if (!where) {
        return tl::unexpected(where.error());
    }
    statement.sql = "SELECT * FROM " + quote(table) + " WHERE " + *where + " LIMIT 1";

    auto result = run(statement, ctx, *handle);
    if (!result) {
        return tl::unexpected(result.error());
    }
    if (result->rows.empty()) {
        return std::optional<Record>{};
    }
    return std::optional<Record>{std::move(result->rows.front())};
}

Expected<std::vector<Record>> SqliteBackend::list(const std::string& table, const QueryOptions& options, const CallContext& ctx) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    auto handle = find_table(table);
    if (!handle) {
        return tl::unexpected(handle.error());
    }
    auto query = translator_.translate(**handle, options);
    if (!query) {
        return tl::unexpected(tag(query.error()));
    }
    auto result = run(query->select, ctx, *handle, query->json_columns);
    if (!result) {
        return tl::unexpected(result.error());
    }
    return std::move(result->rows);
}

Expected<size_t> SqliteBackend::count(const std::string& table, const QueryOptions& options, const CallContext& ctx) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    auto handle = find_table(table);
    if (!handle) {
        return tl::unexpected(handle.error());
    }
    auto query = translator_.translate(**handle, options);
    if (!query) {
        return tl::unexpected(tag(query.error()));
    }
    auto result = run(query->count, ctx, nullptr);
    if (!result) {
        return tl::unexpected(result.error());
    }
    if (result->rows.empty() || result->rows.front().empty()) {
        return size_t{0};
    }
    return static_cast<size_t>(result->rows.front().begin()->get<long long>());
}

// ============================================================================
// Writes
// ============================================================================

Expected<Record> SqliteBackend::insert(const std::string& table, const Record& data, const CallContext& ctx) {
    if (!data.is_object()) {
        return tl::unexpected(tag(Error{ErrorCode::ValidationFailed, "Records must be JSON objects", table}));
    }

    std::lock_guard<std::recursive_mutex> lock(mutex_);
    auto handle = find_table(table);
    if (!handle) {
        return tl::unexpected(handle.error());
    }
    const TableHandle& schema = **handle;
    if (auto checked = check_columns(schema, data); !checked) {
        return tl::unexpected(checked.error());
    }

    Record row = data;
    if (schema.id_of(row).empty()) {
        const Column* key = schema.find_column(schema.primary_key.front());
        if (schema.composite_key()) {
            return tl::unexpected(tag(Error{
                ErrorCode::ValidationFailed,
                "Composite-key records must carry every key column",
                table
            }));
        }
        if (key->type != ColumnType::Integer) {
            row[key->name] = engine::generate_uuid();
        } else {
            row.erase(key->name);
        }
    }

    engine::SqlStatement statement;
    if (row.empty()) {
        statement.sql = "INSERT INTO " + quote(table) + " DEFAULT VALUES RETURNING *";
    } else {
        std::string columns;
        std::string placeholders;
        for (auto it = row.begin(); it != row.end(); ++it) {
            if (!columns.empty()) {
                columns += ", ";
                placeholders += ", ";
            }
            columns += quote(it.key());
            placeholders += "?";
            statement.params.push_back(storage_value(schema, it.key(), it.value()));
        }
        statement.sql = "INSERT INTO " + quote(table) + " (" + columns + ") VALUES (" + placeholders + ") RETURNING *";
    }

    auto result = run(statement, ctx, &schema);
    if (!result) {
        return tl::unexpected(result.error());
    }
    if (result->rows.empty()) {
        return tl::unexpected(tag(Error{ErrorCode::Unknown, "Insert returned no row", table}));
    }
    return std::move(result->rows.front());
}

Expected<Record> SqliteBackend::update(const std::string& table, const RecordId& id, const Record& patch, const CallContext& ctx) {
    if (!patch.is_object()) {
        return tl::unexpected(tag(Error{ErrorCode::ValidationFailed, "Patches must be JSON objects", table}));
    }

    std::lock_guard<std::recursive_mutex> lock(mutex_);
    auto handle = find_table(table);
    if (!handle) {
        return tl::unexpected(handle.error());
    }
    const TableHandle& schema = **handle;
    if (auto checked = check_columns(schema, patch); !checked) {
        return tl::unexpected(checked.error());
    }

    if (patch.empty()) {
        auto current = get(table, id, ctx);
        if (!current) {
            return tl::unexpected(current.error());
        }
        if (!current->has_value()) {
            return tl::unexpected(tag(Error{ErrorCode::NotFound, "Record not found", table + ":" + id}));
        }
        return std::move(**current);
    }

    engine::SqlStatement statement;
    std::string assignments;
    for (auto it = patch.begin(); it != patch.end(); ++it) {
        if (!assignments.empty()) assignments += ", ";
        assignments += quote(it.key()) + " = ?";
        statement.params.push_back(storage_value(schema, it.key(), it.value()));
    }
    auto where = key_clause(schema, id, statement.params);
    if (!where) {
        return tl::unexpected(where.error());
    }
    statement.sql = "UPDATE " + quote(table) + " SET " + assignments + " WHERE " + *where + " RETURNING *";

    auto result = run(statement, ctx, &schema);
    if (!result) {
        return tl::unexpected(result.error());
    }
    if (result->rows.empty()) {
        return tl::unexpected(tag(Error{ErrorCode::NotFound, "Record not found", table + ":" + id}));
    }
    return std::move(result->rows.front());
}

Expected<bool> SqliteBackend::remove(const std::string& table, const RecordId& id, const CallContext& ctx) {
    auto removed = remove_many(table, {id}, ctx);
    if (!removed) {
        return tl::unexpected(removed.error());
    }
    return *removed > 0;
}

Expected<size_t> SqliteBackend::remove_many(const std::string& table, const std::vector<RecordId>& ids, const CallContext& ctx) {
    if (ids.empty()) {
        return size_t{0};
    }

    std::lock_guard<std::recursive_mutex> lock(mutex_);
    auto handle = find_table(table);
    if (!handle) {
        return tl::unexpected(handle.error());
    }

    engine::SqlStatement statement;
    std::string where;
    for (const auto& id : ids) {
        auto clause = key_clause(**handle, id, statement.params);
        if (!clause) {
            return tl::unexpected(clause.error());
        }
        if (!where.empty()) where += " OR ";
        where += "(" + *clause + ")";
    }
    statement.sql = "DELETE FROM " + quote(table) + " WHERE " + where;

    auto result = run(statement, ctx, *handle);
    if (!result) {
        return tl::unexpected(result.error());
    }
    return static_cast<size_t>(result->changes);
}

Expected<Record> SqliteBackend::upsert(
    const std::string& table,
    const Record& data,
    const std::string& conflict_column,
    const CallContext& ctx
) {
    if (!data.is_object() || data.empty()) {
        return tl::unexpected(tag(Error{ErrorCode::ValidationFailed, "Upsert needs a non-empty JSON object", table}));
    }

    std::lock_guard<std::recursive_mutex> lock(mutex_);
    auto handle = find_table(table);
    if (!handle) {
        return tl::unexpected(handle.error());
    }
    const TableHandle& schema = **handle;
    if (auto checked = check_columns(schema, data); !checked) {
        return tl::unexpected(checked.error());
    }
    if (!schema.has_column(conflict_column) || !data.contains(conflict_column)) {
        return tl::unexpected(tag(Error{
            ErrorCode::ValidationFailed,
            "Upsert conflict column must be declared and present in the record",
            conflict_column
        }));
    }

    engine::SqlStatement statement;
    std::string columns;
    std::string placeholders;
    std::string assignments;
    for (auto it = data.begin(); it != data.end(); ++it) {
        if (!columns.empty()) {
            columns += ", ";
            placeholders += ", ";
        }
        columns += quote(it.key());
        placeholders += "?";
        statement.params.push_back(storage_value(schema, it.key(), it.value()));
        if (it.key() != conflict_column) {
            if (!assignments.empty()) assignments += ", ";
            assignments += quote(it.key()) + " = excluded." + quote(it.key());
        }
    }
    if (assignments.empty()) {
        // Keep RETURNING populated when only the key is supplied.
        assignments = quote(conflict_column) + " = excluded." + quote(conflict_column);
    }
    statement.sql = "INSERT INTO " + quote(table) + " (" + columns + ") VALUES (" + placeholders + ")"
                    " ON CONFLICT(" + quote(conflict_column) + ") DO UPDATE SET " + assignments + " RETURNING *";

    auto result = run(statement, ctx, &schema);
    if (!result) {
        return tl::unexpected(result.error());
    }
    if (result->rows.empty()) {
        return tl::unexpected(tag(Error{ErrorCode::Unknown, "Upsert returned no row", table}));
    }
    return std::move(result->rows.front());
}

Expected<std::vector<Record>> SqliteBackend::raw_query(
    const std::string& query,
    const std::vector<nlohmann::json>& params,
    const CallContext& ctx
) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    auto result = run(engine::SqlStatement{query, params}, ctx, nullptr);
    if (!result) {
        return tl::unexpected(result.error());
    }
    return std::move(result->rows);
}

// ============================================================================
// Transactions
// ============================================================================

Expected<void> SqliteBackend::begin(const CallContext& ctx) {
    mutex_.lock();
    if (in_transaction_) {
        mutex_.unlock();
        return tl::unexpected(tag(Error{
            ErrorCode::TransactionBeginFailed,
            "A transaction is already open on this connection; nesting is not supported",
            path_
        }));
    }
    auto started = exec("BEGIN IMMEDIATE", ctx);
    if (!started) {
        mutex_.unlock();
        Error error = started.error();
        if (error.code != ErrorCode::RequestCancelled && error.code != ErrorCode::RequestTimeout) {
            error.code = ErrorCode::TransactionBeginFailed;
        }
        return tl::unexpected(error);
    }
    // The lock stays held by this thread until commit() or rollback().
    in_transaction_ = true;
    return {};
}

Expected<void> SqliteBackend::commit(const CallContext& ctx) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (!in_transaction_) {
        return tl::unexpected(tag(Error{ErrorCode::TransactionCommitFailed, "No open transaction to commit", path_}));
    }
    auto committed = exec("COMMIT", ctx);
    if (!committed) {
        // Still open: the caller is expected to roll back.
        Error error = committed.error();
        error.code = ErrorCode::TransactionCommitFailed;
        return tl::unexpected(error);
    }
    in_transaction_ = false;
    mutex_.unlock();
    return {};
}

Expected<void> SqliteBackend::rollback() {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (!in_transaction_) {
        return tl::unexpected(tag(Error{ErrorCode::TransactionAborted, "No open transaction to roll back", path_}));
    }
    auto rolled_back = exec("ROLLBACK", CallContext{});
    in_transaction_ = false;
    mutex_.unlock();
    if (!rolled_back) {
        Error error = rolled_back.error();
        error.code = ErrorCode::TransactionAborted;
        return tl::unexpected(error);
    }
    return {};
}

bool SqliteBackend::in_transaction() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return in_transaction_;
}

// ============================================================================
// Statement plumbing
// ============================================================================

Expected<SqliteBackend::StatementResult> SqliteBackend::run(
    const engine::SqlStatement& statement,
    const CallContext& ctx,
    const TableHandle* table,
    const std::vector<std::string>& json_columns
) {
    if (auto ok = ctx.check(); !ok) {
        return tl::unexpected(tag(ok.error()));
    }

    sqlite3_stmt* raw = nullptr;
    int rc = sqlite3_prepare_v2(db_, statement.sql.c_str(), -1, &raw, nullptr);
    StatementPtr stmt(raw, &sqlite3_finalize);
    if (rc != SQLITE_OK) {
        return tl::unexpected(map_error(rc, "Failed to prepare statement", ctx));
    }
    if (!stmt) {
        return tl::unexpected(tag(Error{ErrorCode::ValidationFailed, "Empty SQL statement"}));
    }
    if (sqlite3_bind_parameter_count(stmt.get()) != static_cast<int>(statement.params.size())) {
        return tl::unexpected(tag(Error{
            ErrorCode::ValidationFailed,
            "Statement expects " + std::to_string(sqlite3_bind_parameter_count(stmt.get())) +
                " parameter(s), got " + std::to_string(statement.params.size()),
            statement.sql
        }));
    }
    for (size_t i = 0; i < statement.params.size(); ++i) {
        rc = bind_value(stmt.get(), static_cast<int>(i + 1), statement.params[i]);
        if (rc != SQLITE_OK) {
            return tl::unexpected(map_error(rc, "Failed to bind parameter " + std::to_string(i + 1), ctx));
        }
    }

    ProgressGuard guard(db_, ctx);
    StatementResult result;
    while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
        result.rows.push_back(read_row(stmt.get(), table, json_columns));
    }
    if (rc != SQLITE_DONE) {
        return tl::unexpected(map_error(rc, "Statement failed", ctx));
    }
    result.changes = sqlite3_changes(db_);
    DUET_TRACE("sqlite: {} ({} row(s))", statement.sql, result.rows.size());
    return result;
}

Expected<void> SqliteBackend::exec(const std::string& sql, const CallContext& ctx) {
    ProgressGuard guard(db_, ctx);
    char* err_msg = nullptr;
    const int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err_msg);
    if (rc != SQLITE_OK) {
        std::string detail = err_msg != nullptr ? err_msg : "Unknown SQLite error";
        sqlite3_free(err_msg);
        Error error = map_error(rc, "SQLite exec failed", ctx);
        error.message = "SQLite exec failed: " + detail;
        return tl::unexpected(error);
    }
    return {};
}

Expected<std::string> SqliteBackend::key_clause(
    const TableHandle& table,
    const RecordId& id,
    std::vector<nlohmann::json>& params
) const {
    auto parts = table.split_id(id);
    if (!parts) {
        return tl::unexpected(tag(parts.error()));
    }
    std::string clause;
    for (size_t i = 0; i < parts->size(); ++i) {
        if (i > 0) clause += " AND ";
        clause += quote(table.primary_key[i]) + " = ?";
        params.push_back(table.key_value(i, (*parts)[i]));
    }
    return clause;
}

Expected<void> SqliteBackend::check_columns(const TableHandle& table, const Record& data) const {
    for (auto it = data.begin(); it != data.end(); ++it) {
        if (!table.has_column(it.key())) {
            return tl::unexpected(tag(Error{
                ErrorCode::ValidationFailed,
                "Unknown column '" + it.key() + "'",
                table.name
            }));
        }
    }
    return {};
}

Error SqliteBackend::map_error(int rc, const std::string& prefix, const CallContext& ctx) const {
    const char* detail = sqlite3_errmsg(db_);
    std::string message = prefix + ": " + (detail != nullptr ? detail : sqlite3_errstr(rc));

    ErrorCode code = ErrorCode::Unknown;
    switch (rc & 0xff) {
        case SQLITE_INTERRUPT:
            if (auto state = ctx.check(); !state) {
                return tag(state.error());
            }
            code = ErrorCode::RequestCancelled;
            break;
        case SQLITE_CONSTRAINT:
        case SQLITE_MISMATCH:
        case SQLITE_RANGE:
        case SQLITE_ERROR:
        case SQLITE_READONLY:
        case SQLITE_TOOBIG:
            code = ErrorCode::OperationRejected;
            break;
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
        case SQLITE_IOERR:
        case SQLITE_CANTOPEN:
        case SQLITE_FULL:
        case SQLITE_NOTADB:
        case SQLITE_CORRUPT:
        case SQLITE_PROTOCOL:
            code = ErrorCode::BackendUnavailable;
            break;
        default:
            break;
    }
    return tag(Error{code, std::move(message), path_});
}

Error SqliteBackend::tag(Error error) const {
    error.with_backend(BackendKind::Secondary);
    return error;
}

} // namespace backend
} // namespace duet
