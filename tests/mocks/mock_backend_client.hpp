#pragma once

#include "duet/backend/client.hpp"
#include <chrono>
#include <algorithm>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace duet {
namespace testing {

/**
 * @brief Mock backend client for unit testing
 *
 * Simulates a store in memory without any real I/O.
 * Supports:
 * - Either backend kind (Primary or Secondary)
 * - Per-operation call counting
 * - Error injection per operation, once or persistently, and per record id
 * - Snapshot transactions (rollback restores the pre-begin state)
 * - Artificial latency for concurrency tests
 * - A one-shot hook between list()'s read and its return, for race tests
 *
 * list() understands eq filters and page/pageSize only.
 */
class MockBackendClient : public backend::IRelationalClient {
public:
    explicit MockBackendClient(BackendKind kind = BackendKind::Primary, std::string name = "mock")
        : kind_(kind)
        , name_(std::move(name))
    {}

    // Configuration
    int delay_ms = 0;                                   ///< Artificial latency per data call

    /// Every subsequent `op` call fails with `code` until clear_failures().
    void fail_with(const std::string& op, ErrorCode code) {
        std::lock_guard<std::mutex> lock(mutex_);
        persistent_failures_[op] = code;
    }

    /// Only the next `op` call fails with `code`.
    void fail_next(const std::string& op, ErrorCode code) {
        std::lock_guard<std::mutex> lock(mutex_);
        one_shot_failures_[op] = code;
    }

    /// get/update/remove on `id` fail with `code`.
    void fail_for_id(const RecordId& id, ErrorCode code) {
        std::lock_guard<std::mutex> lock(mutex_);
        id_failures_[id] = code;
    }

    /// Run `hook` once, after the next list() has read its rows and before it returns.
    void on_next_list_read(std::function<void()> hook) {
        std::lock_guard<std::mutex> lock(mutex_);
        list_hook_ = std::move(hook);
    }

    void clear_failures() {
        std::lock_guard<std::mutex> lock(mutex_);
        persistent_failures_.clear();
        one_shot_failures_.clear();
        id_failures_.clear();
    }

    // State tracking
    int call_count(const std::string& op) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = calls_.find(op);
        return it == calls_.end() ? 0 : it->second;
    }

    int total_calls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        int total = 0;
        for (const auto& [op, n] : calls_) {
            total += n;
        }
        return total;
    }

    void reset_counts() {
        std::lock_guard<std::mutex> lock(mutex_);
        calls_.clear();
    }

    /// Put a row directly into storage, bypassing counters and failures.
    void seed(const std::string& table, const Record& row) {
        std::lock_guard<std::mutex> lock(mutex_);
        tables_[table][row.at("id").get<std::string>()] = row;
    }

    size_t row_count(const std::string& table) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = tables_.find(table);
        return it == tables_.end() ? 0 : it->second.size();
    }

    std::vector<std::string> registered_tables() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return std::vector<std::string>(registered_.begin(), registered_.end());
    }

    bool in_transaction() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return snapshot_.has_value();
    }

    BackendKind kind() const override { return kind_; }

    std::string name() const override { return name_; }

    Expected<void> register_table(const backend::TableHandle& table) override {
        std::lock_guard<std::mutex> lock(mutex_);
        registered_.insert(table.name);
        tables_[table.name];
        return {};
    }

    Expected<std::optional<Record>> get(const std::string& table, const RecordId& id, const CallContext& ctx = CallContext{}) override {
        auto guard = enter("get", ctx, id);
        if (!guard) return tl::unexpected(guard.error());
        std::lock_guard<std::mutex> lock(mutex_);
        auto& rows = tables_[table];
        auto it = rows.find(id);
        if (it == rows.end()) {
            return std::optional<Record>{};
        }
        return std::optional<Record>{it->second};
    }

    Expected<std::vector<Record>> list(const std::string& table, const QueryOptions& options, const CallContext& ctx = CallContext{}) override {
        auto guard = enter("list", ctx);
        if (!guard) return tl::unexpected(guard.error());
        std::vector<Record> out;
        std::function<void()> hook;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            out = matching(table, options);
            hook = std::move(list_hook_);
            list_hook_ = nullptr;
        }
        if (hook) {
            hook();
        }
        if (options.pagination && options.pagination->page) {
            const size_t size = static_cast<size_t>(options.pagination->page_size.value_or(20));
            const size_t start = (static_cast<size_t>(*options.pagination->page) - 1) * size;
            if (start >= out.size()) {
                return std::vector<Record>{};
            }
            out = std::vector<Record>(out.begin() + start, out.begin() + std::min(out.size(), start + size));
        }
        return out;
    }

    Expected<size_t> count(const std::string& table, const QueryOptions& options, const CallContext& ctx = CallContext{}) override {
        auto guard = enter("count", ctx);
        if (!guard) return tl::unexpected(guard.error());
        std::lock_guard<std::mutex> lock(mutex_);
        return matching(table, options).size();
    }

    Expected<Record> insert(const std::string& table, const Record& data, const CallContext& ctx = CallContext{}) override {
        auto guard = enter("insert", ctx);
        if (!guard) return tl::unexpected(guard.error());
        std::lock_guard<std::mutex> lock(mutex_);
        Record row = data;
        if (!row.contains("id")) {
            row["id"] = "mock-" + std::to_string(++next_id_);
        }
        const auto id = row.at("id").get<std::string>();
        auto& rows = tables_[table];
        if (rows.count(id) > 0) {
            return tl::unexpected(Error{ErrorCode::OperationRejected, "Duplicate id", id});
        }
        rows[id] = row;
        return row;
    }

    Expected<Record> update(const std::string& table, const RecordId& id, const Record& patch, const CallContext& ctx = CallContext{}) override {
        auto guard = enter("update", ctx, id);
        if (!guard) return tl::unexpected(guard.error());
        std::lock_guard<std::mutex> lock(mutex_);
        auto& rows = tables_[table];
        auto it = rows.find(id);
        if (it == rows.end()) {
            return tl::unexpected(Error{ErrorCode::NotFound, "Record not found", id});
        }
        for (const auto& [key, value] : patch.items()) {
            it->second[key] = value;
        }
        return it->second;
    }

    Expected<bool> remove(const std::string& table, const RecordId& id, const CallContext& ctx = CallContext{}) override {
        auto guard = enter("remove", ctx, id);
        if (!guard) return tl::unexpected(guard.error());
        std::lock_guard<std::mutex> lock(mutex_);
        return tables_[table].erase(id) > 0;
    }

    Expected<size_t> remove_many(const std::string& table, const std::vector<RecordId>& ids, const CallContext& ctx = CallContext{}) override {
        auto guard = enter("remove_many", ctx);
        if (!guard) return tl::unexpected(guard.error());
        std::lock_guard<std::mutex> lock(mutex_);
        size_t removed = 0;
        for (const auto& id : ids) {
            removed += tables_[table].erase(id);
        }
        return removed;
    }

    Expected<std::vector<Record>> raw_query(
        const std::string& query,
        const std::vector<nlohmann::json>& params,
        const CallContext& ctx = CallContext{}
    ) override {
        auto guard = enter("raw_query", ctx);
        if (!guard) return tl::unexpected(guard.error());
        return std::vector<Record>{Record{{"query", query}, {"params", params}}};
    }

    Expected<void> begin(const CallContext& ctx = CallContext{}) override {
        auto guard = enter("begin", ctx);
        if (!guard) return guard;
        std::lock_guard<std::mutex> lock(mutex_);
        if (snapshot_) {
            return tl::unexpected(Error{ErrorCode::TransactionBeginFailed, "Transaction already open"});
        }
        snapshot_ = tables_;
        return {};
    }

    Expected<void> commit(const CallContext& ctx = CallContext{}) override {
        auto guard = enter("commit", ctx);
        if (!guard) return guard;
        std::lock_guard<std::mutex> lock(mutex_);
        snapshot_.reset();
        return {};
    }

    Expected<void> rollback() override {
        auto guard = enter("rollback", CallContext{});
        std::lock_guard<std::mutex> lock(mutex_);
        if (snapshot_) {
            tables_ = std::move(*snapshot_);
            snapshot_.reset();
        }
        return guard;
    }

    Expected<Record> upsert(
        const std::string& table,
        const Record& data,
        const std::string& conflict_column,
        const CallContext& ctx = CallContext{}
    ) override {
        auto guard = enter("upsert", ctx);
        if (!guard) return tl::unexpected(guard.error());
        std::lock_guard<std::mutex> lock(mutex_);
        const auto key = data.at(conflict_column).get<std::string>();
        auto& row = tables_[table][key];
        if (row.is_null()) {
            row = data;
        } else {
            for (const auto& [k, v] : data.items()) {
                row[k] = v;
            }
        }
        return row;
    }

private:
    using Tables = std::map<std::string, std::map<RecordId, Record>>;

    Expected<void> enter(const std::string& op, const CallContext& ctx, const RecordId& id = RecordId{}) {
        if (delay_ms > 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms));
        }
        std::lock_guard<std::mutex> lock(mutex_);
        ++calls_[op];
        if (auto ok = ctx.check(); !ok) {
            return tl::unexpected(ok.error());
        }
        if (auto it = one_shot_failures_.find(op); it != one_shot_failures_.end()) {
            const ErrorCode code = it->second;
            one_shot_failures_.erase(it);
            return tl::unexpected(injected(code, op));
        }
        if (auto it = persistent_failures_.find(op); it != persistent_failures_.end()) {
            return tl::unexpected(injected(it->second, op));
        }
        if (!id.empty()) {
            if (auto it = id_failures_.find(id); it != id_failures_.end()) {
                return tl::unexpected(injected(it->second, op));
            }
        }
        return {};
    }

    Error injected(ErrorCode code, const std::string& op) const {
        Error error{code, "Injected " + op + " failure"};
        error.with_backend(kind_);
        return error;
    }

    std::vector<Record> matching(const std::string& table, const QueryOptions& options) {
        std::vector<Record> out;
        for (const auto& [id, row] : tables_[table]) {
            bool keep = true;
            for (const auto& filter : options.filters) {
                if (filter.op == Operator::Eq && row.value(filter.column, nlohmann::json()) != filter.value) {
                    keep = false;
                }
            }
            if (keep) {
                out.push_back(row);
            }
        }
        return out;
    }

    BackendKind kind_;
    std::string name_;
    Tables tables_;
    std::optional<Tables> snapshot_;
    std::set<std::string> registered_;
    std::map<std::string, int> calls_;
    std::map<std::string, ErrorCode> persistent_failures_;
    std::map<std::string, ErrorCode> one_shot_failures_;
    std::map<RecordId, ErrorCode> id_failures_;
    std::function<void()> list_hook_;
    int next_id_ = 0;
    mutable std::mutex mutex_;
};

} // namespace testing
} // namespace duet
