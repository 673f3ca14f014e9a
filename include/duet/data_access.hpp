#pragma once

#include "backend/client.hpp"
#include "backend/table.hpp"
#include "config.hpp"
#include "engine/batch_executor.hpp"
#include "engine/cache_store.hpp"
#include "engine/fallback_coordinator.hpp"
#include "engine/transaction_runner.hpp"
#include "log.hpp"
#include "types.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace duet {

/**
 * @brief Per-call overrides: backend choice, deadline and cancellation.
 */
struct CallOptions {
    std::optional<BackendKind> backend;                 ///< Try this backend first
    std::optional<std::chrono::milliseconds> timeout;   ///< Overrides Config::operation_timeout
    std::shared_ptr<std::atomic<bool>> cancel;          ///< Caller-owned cancellation flag
};

/**
 * @brief Per-collection record hooks. Raw query results are never transformed.
 *
 * `on_error` and `on_success` observe every facade call on the collection
 * (background refreshes excluded). They run on the calling thread, after the
 * operation has finished; batch calls report each failed item to `on_error`
 * and the successful records to `on_success` once.
 */
struct CollectionOptions {
    std::function<Record(const Record&)> transform_before_save;
    std::function<Record(const Record&)> transform_after_fetch;
    std::function<void(const Error& error, const std::string& operation)> on_error;
    std::function<void(const std::string& operation, const nlohmann::json& data)> on_success;
};

struct BatchUpdateItem {
    RecordId id;
    Record data;
};

using RecordCache = engine::CacheStore<nlohmann::json>;

namespace detail {

/**
 * @brief Process-wide state shared by the facade and every collection.
 *
 * Owns the background refresh tasks and joins them on destruction. Tasks
 * hold no reference to the core, so the last Collection or DataAccess
 * handle going away is what destroys it.
 */
class DataAccessCore {
public:
    DataAccessCore(Config config, backend::BackendSet backends, RecordCache::Clock cache_clock)
        : config(std::move(config))
        , coordinator(std::move(backends))
        , cache(this->config.cache, std::move(cache_clock))
        , batch(this->config.batch_chunk_size)
    {}

    ~DataAccessCore() {
        wait_for_refreshes();
    }

    DataAccessCore(const DataAccessCore&) = delete;
    DataAccessCore& operator=(const DataAccessCore&) = delete;

    CallContext make_context(const CallOptions& options) const {
        CallContext ctx = CallContext::with_timeout(options.timeout.value_or(config.operation_timeout));
        ctx.cancelled = options.cancel;
        return ctx;
    }

    void schedule_refresh(std::function<void()> task) {
        std::lock_guard<std::mutex> lock(tasks_mutex_);
        tasks_.erase(std::remove_if(tasks_.begin(), tasks_.end(), [](std::future<void>& f) {
            return f.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
        }), tasks_.end());
        tasks_.push_back(std::async(std::launch::async, std::move(task)));
    }

    void wait_for_refreshes() {
        std::vector<std::future<void>> pending;
        {
            std::lock_guard<std::mutex> lock(tasks_mutex_);
            pending.swap(tasks_);
        }
        for (auto& task : pending) {
            task.wait();
        }
    }

    Config config;
    engine::FallbackCoordinator coordinator;
    RecordCache cache;
    engine::BatchExecutor batch;

private:
    std::mutex tasks_mutex_;
    std::vector<std::future<void>> tasks_;
};

/**
 * @brief Backend reads and writes for one table, without caching.
 *
 * Non-owning: `core` stays valid for every copy captured by a refresh task
 * because ~DataAccessCore joins those tasks first.
 */
struct TableAccess {
    DataAccessCore* core = nullptr;
    backend::TableHandle table;
    CollectionOptions options;

    std::string list_key(const char* kind, const QueryOptions& query) const {
        return table.name + ":list:" + kind + ":" + query.to_json().dump();
    }

    std::string item_key(const RecordId& id) const {
        return table.name + ":item:" + id;
    }

    Record after_fetch(const Record& row) const {
        return options.transform_after_fetch ? options.transform_after_fetch(row) : row;
    }

    Record before_save(const Record& row) const {
        return options.transform_before_save ? options.transform_before_save(row) : row;
    }

    Expected<std::vector<Record>> fetch_list(const QueryOptions& query, const CallContext& ctx, std::optional<BackendKind> preferred) const {
        auto rows = core->coordinator.execute("getAll", [&](backend::IBackendClient& client) {
            return client.list(table.name, query, ctx);
        }, ctx, preferred);
        if (rows) {
            for (auto& row : *rows) {
                row = after_fetch(row);
            }
        }
        return rows;
    }

    Expected<Page> fetch_page(const QueryOptions& query, const CallContext& ctx, std::optional<BackendKind> preferred) const {
        auto page = core->coordinator.execute("getPage", [&](backend::IBackendClient& client) -> Expected<Page> {
            auto rows = client.list(table.name, query, ctx);
            if (!rows) {
                return tl::unexpected(rows.error());
            }
            Page result;
            result.records = std::move(*rows);
            if (query.count) {
                auto total = client.count(table.name, query, ctx);
                if (!total) {
                    return tl::unexpected(total.error());
                }
                result.total_count = *total;
            }
            return result;
        }, ctx, preferred);
        if (page) {
            for (auto& row : page->records) {
                row = after_fetch(row);
            }
        }
        return page;
    }

    Expected<std::optional<Record>> fetch_item(const RecordId& id, const CallContext& ctx, std::optional<BackendKind> preferred) const {
        auto record = core->coordinator.execute("getById", [&](backend::IBackendClient& client) {
            return client.get(table.name, id, ctx);
        }, ctx, preferred);
        if (record && record->has_value()) {
            **record = after_fetch(**record);
        }
        return record;
    }

    Expected<Record> create_one(const Record& data, const CallContext& ctx, std::optional<BackendKind> preferred) const {
        const Record prepared = before_save(data);
        auto created = core->coordinator.execute("create", [&](backend::IBackendClient& client) {
            return client.insert(table.name, prepared, ctx);
        }, ctx, preferred);
        if (created) {
            *created = after_fetch(*created);
        }
        return created;
    }

    Expected<Record> update_one(const RecordId& id, const Record& patch, const CallContext& ctx, std::optional<BackendKind> preferred) const {
        const Record prepared = before_save(patch);
        auto updated = core->coordinator.execute("update", [&](backend::IBackendClient& client) {
            return client.update(table.name, id, prepared, ctx);
        }, ctx, preferred);
        if (updated) {
            *updated = after_fetch(*updated);
        }
        return updated;
    }

    static nlohmann::json page_to_json(const Page& page) {
        nlohmann::json j{{"records", page.records}};
        if (page.total_count) {
            j["total"] = *page.total_count;
        }
        return j;
    }

    static Page page_from_json(const nlohmann::json& j) {
        Page page;
        page.records = j.at("records").get<std::vector<Record>>();
        if (j.contains("total")) {
            page.total_count = j.at("total").get<size_t>();
        }
        return page;
    }
};

} // namespace detail

/**
 * @brief CRUD/query surface over one table.
 *
 * Every call goes through the fallback coordinator. List and item reads are
 * cached (`<table>:list:...`, `<table>:item:<id>`); single mutations
 * invalidate the table's list keys and the touched item key, batch
 * mutations clear the whole cache. Stale hits are served immediately and
 * refreshed in the background by the first reader that sees them; a refresh
 * that races with an invalidation is dropped.
 *
 * Cheap to copy; copies share the process-wide state.
 */
class Collection {
public:
    Collection(std::shared_ptr<detail::DataAccessCore> core, backend::TableHandle table, CollectionOptions options)
        : core_(std::move(core))
        , access_{core_.get(), std::move(table), std::move(options)}
    {}

    const backend::TableHandle& table() const { return access_.table; }

    const std::string& name() const { return access_.table.name; }

    Expected<std::vector<Record>> get_all(const QueryOptions& query = QueryOptions{}, const CallOptions& call = CallOptions{}) {
        if (auto valid = query.validate(); !valid) {
            return reported("getAll", Expected<std::vector<Record>>(tl::unexpected(tagged(valid.error(), "getAll"))));
        }
        const std::string key = access_.list_key("all", query);

        auto cached = core_->cache.get(key);
        if (cached.found()) {
            if (cached.refresh_claimed) {
                schedule_list_refresh(key, query, call.backend, cached.generation);
            }
            return reported("getAll", Expected<std::vector<Record>>(cached.value->get<std::vector<Record>>()));
        }

        auto rows = access_.fetch_list(query, core_->make_context(call), call.backend);
        if (rows) {
            core_->cache.set(key, *rows, core_->config.cache.ttl_policy.ttl_for_list(rows->size()));
        }
        return reported("getAll", std::move(rows));
    }

    /// Rows plus the unpaginated total when `query.count` is set.
    Expected<Page> get_page(const QueryOptions& query, const CallOptions& call = CallOptions{}) {
        if (auto valid = query.validate(); !valid) {
            return reported("getPage", Expected<Page>(tl::unexpected(tagged(valid.error(), "getPage"))));
        }
        const std::string key = access_.list_key("page", query);

        auto cached = core_->cache.get(key);
        if (cached.found()) {
            if (cached.refresh_claimed) {
                schedule_page_refresh(key, query, call.backend, cached.generation);
            }
            return reported("getPage", Expected<Page>(detail::TableAccess::page_from_json(*cached.value)));
        }

        auto page = access_.fetch_page(query, core_->make_context(call), call.backend);
        if (page) {
            core_->cache.set(key, detail::TableAccess::page_to_json(*page),
                             core_->config.cache.ttl_policy.ttl_for_list(page->records.size()));
        }
        return reported("getPage", std::move(page));
    }

    /// nullopt when no record has that id (absence is not an error).
    Expected<std::optional<Record>> get_by_id(const RecordId& id, const CallOptions& call = CallOptions{}) {
        const std::string key = access_.item_key(id);

        auto cached = core_->cache.get(key);
        if (cached.found()) {
            if (cached.refresh_claimed) {
                schedule_item_refresh(key, id, call.backend, cached.generation);
            }
            return reported("getById", Expected<std::optional<Record>>(std::optional<Record>{*cached.value}));
        }

        auto record = access_.fetch_item(id, core_->make_context(call), call.backend);
        if (record && record->has_value()) {
            core_->cache.set(key, **record, core_->config.cache.ttl_policy.ttl_for_item());
        }
        return reported("getById", std::move(record));
    }

    Expected<Record> create(const Record& data, const CallOptions& call = CallOptions{}) {
        auto created = access_.create_one(data, core_->make_context(call), call.backend);
        if (created) {
            invalidate_lists();
            core_->cache.remove(access_.item_key(access_.table.id_of(*created)));
        }
        return reported("create", std::move(created));
    }

    Expected<Record> update(const RecordId& id, const Record& patch, const CallOptions& call = CallOptions{}) {
        auto updated = access_.update_one(id, patch, core_->make_context(call), call.backend);
        if (updated) {
            core_->cache.remove(access_.item_key(id));
            invalidate_lists();
        }
        return reported("update", std::move(updated));
    }

    Expected<bool> remove(const RecordId& id, const CallOptions& call = CallOptions{}) {
        const CallContext ctx = core_->make_context(call);
        auto removed = core_->coordinator.execute("remove", [&](backend::IBackendClient& client) {
            return client.remove(access_.table.name, id, ctx);
        }, ctx, call.backend);
        if (removed) {
            core_->cache.remove(access_.item_key(id));
            invalidate_lists();
        }
        return reported("remove", std::move(removed));
    }

    /// results[i] is the created record or the error for data[i].
    std::vector<Expected<Record>> batch_create(const std::vector<Record>& data, const CallOptions& call = CallOptions{}) {
        const CallContext ctx = core_->make_context(call);
        const detail::TableAccess& access = access_;
        auto results = core_->batch.run(data, [&access, &ctx, &call](const Record& item) {
            return access.create_one(item, ctx, call.backend);
        }, ctx);
        core_->cache.clear();
        report_batch("batchCreate", results);
        return results;
    }

    /// results[i] is the updated record or the error for items[i].
    std::vector<Expected<Record>> batch_update(const std::vector<BatchUpdateItem>& items, const CallOptions& call = CallOptions{}) {
        const CallContext ctx = core_->make_context(call);
        const detail::TableAccess& access = access_;
        auto results = core_->batch.run(items, [&access, &ctx, &call](const BatchUpdateItem& item) {
            return access.update_one(item.id, item.data, ctx, call.backend);
        }, ctx);
        core_->cache.clear();
        report_batch("batchUpdate", results);
        return results;
    }

    /// True only when every chunk was deleted without error.
    bool batch_remove(const std::vector<RecordId>& ids, const CallOptions& call = CallOptions{}) {
        const CallContext ctx = core_->make_context(call);
        const bool ok = core_->batch.run_chunks(ids, [&](const std::vector<RecordId>& chunk) {
            auto removed = core_->coordinator.execute("batchRemove", [&](backend::IBackendClient& client) {
                return client.remove_many(access_.table.name, chunk, ctx);
            }, ctx, call.backend);
            if (!removed) {
                notify_error(removed.error(), "batchRemove");
            }
            return removed;
        }, ctx);
        core_->cache.clear();
        if (ok) {
            notify_success("batchRemove", nlohmann::json(ids));
        }
        return ok;
    }

    Expected<size_t> count(const QueryOptions& query = QueryOptions{}, const CallOptions& call = CallOptions{}) {
        const CallContext ctx = core_->make_context(call);
        auto total = core_->coordinator.execute("count", [&](backend::IBackendClient& client) {
            return client.count(access_.table.name, query, ctx);
        }, ctx, call.backend);
        return reported("count", std::move(total));
    }

    /**
     * @brief Adapter-native query, rows returned untransformed and uncached.
     *
     * Runs on the Secondary unless `call.backend` names another; never falls back.
     */
    Expected<std::vector<Record>> execute_raw_query(
        const std::string& query,
        const std::vector<nlohmann::json>& params = {},
        const CallOptions& call = CallOptions{}
    ) {
        const CallContext ctx = core_->make_context(call);
        const BackendKind kind = call.backend.value_or(BackendKind::Secondary);
        auto rows = core_->coordinator.backends().get(kind).raw_query(query, params, ctx);
        if (!rows) {
            Error error = rows.error();
            if (!error.backend) error.with_backend(kind);
            rows = tl::unexpected(error.with_operation("executeRawQuery"));
        }
        return reported("executeRawQuery", std::move(rows));
    }

private:
    void invalidate_lists() {
        core_->cache.remove_prefix(access_.table.name + ":list:");
    }

    static Error tagged(Error error, const char* operation) {
        return error.with_operation(operation);
    }

    void notify_error(const Error& error, const char* operation) const {
        if (access_.options.on_error) {
            access_.options.on_error(error, operation);
        }
    }

    void notify_success(const char* operation, const nlohmann::json& data) const {
        if (access_.options.on_success) {
            access_.options.on_success(operation, data);
        }
    }

    static nlohmann::json to_payload(const std::vector<Record>& rows) { return rows; }
    static nlohmann::json to_payload(const Page& page) { return detail::TableAccess::page_to_json(page); }
    static nlohmann::json to_payload(const std::optional<Record>& record) { return record.value_or(nlohmann::json()); }
    static nlohmann::json to_payload(const Record& record) { return record; }
    static nlohmann::json to_payload(bool value) { return value; }
    static nlohmann::json to_payload(size_t value) { return value; }

    template<typename T>
    Expected<T> reported(const char* operation, Expected<T> result) const {
        if (!result) {
            notify_error(result.error(), operation);
        } else if (access_.options.on_success) {
            notify_success(operation, to_payload(*result));
        }
        return result;
    }

    void report_batch(const char* operation, const std::vector<Expected<Record>>& results) const {
        nlohmann::json succeeded = nlohmann::json::array();
        for (const auto& result : results) {
            if (result) {
                succeeded.push_back(*result);
            } else {
                notify_error(result.error(), operation);
            }
        }
        if (!succeeded.empty()) {
            notify_success(operation, succeeded);
        }
    }

    // Background refreshes use a fresh context: the triggering caller may be gone.
    // They capture a TableAccess copy, never the owning core pointer.

    void schedule_list_refresh(const std::string& key, const QueryOptions& query,
                               std::optional<BackendKind> preferred, uint64_t generation) {
        const detail::TableAccess access = access_;
        core_->schedule_refresh([access, key, query, preferred, generation]() {
            detail::DataAccessCore& core = *access.core;
            const CallContext ctx = core.make_context(CallOptions{});
            auto rows = access.fetch_list(query, ctx, preferred);
            const auto ttl = rows ? core.config.cache.ttl_policy.ttl_for_list(rows->size())
                                  : core.config.cache.default_ttl;
            core.cache.refresh(key, [&rows]() -> Expected<nlohmann::json> {
                if (!rows) return tl::unexpected(rows.error());
                return nlohmann::json(*rows);
            }, ttl, generation);
        });
    }

    void schedule_page_refresh(const std::string& key, const QueryOptions& query,
                               std::optional<BackendKind> preferred, uint64_t generation) {
        const detail::TableAccess access = access_;
        core_->schedule_refresh([access, key, query, preferred, generation]() {
            detail::DataAccessCore& core = *access.core;
            const CallContext ctx = core.make_context(CallOptions{});
            auto page = access.fetch_page(query, ctx, preferred);
            const auto ttl = page ? core.config.cache.ttl_policy.ttl_for_list(page->records.size())
                                  : core.config.cache.default_ttl;
            core.cache.refresh(key, [&page]() -> Expected<nlohmann::json> {
                if (!page) return tl::unexpected(page.error());
                return detail::TableAccess::page_to_json(*page);
            }, ttl, generation);
        });
    }

    void schedule_item_refresh(const std::string& key, const RecordId& id,
                               std::optional<BackendKind> preferred, uint64_t generation) {
        const detail::TableAccess access = access_;
        core_->schedule_refresh([access, key, id, preferred, generation]() {
            detail::DataAccessCore& core = *access.core;
            const CallContext ctx = core.make_context(CallOptions{});
            auto record = access.fetch_item(id, ctx, preferred);
            if (record && !record->has_value()) {
                core.cache.remove_if_generation(key, generation);
                return;
            }
            core.cache.refresh(key, [&record]() -> Expected<nlohmann::json> {
                if (!record) return tl::unexpected(record.error());
                return **record;
            }, core.config.cache.ttl_policy.ttl_for_item(), generation);
        });
    }

    std::shared_ptr<detail::DataAccessCore> core_;
    detail::TableAccess access_;
};

/**
 * @brief Process-wide data access facade.
 *
 * Created once at startup from a resolved configuration; hands out
 * Collection handles that share its backends, cache and coordinator.
 *
 * @code
 * auto access = duet::DataAccess::create(*duet::Config::from_env());
 * auto tools = (*access)->collection(tools_table);
 * auto created = tools->create({{"name", "Tool A"}});
 * @endcode
 */
class DataAccess {
public:
    /// Resolve backends from `config` (single startup step) and build the facade.
    static Expected<std::unique_ptr<DataAccess>> create(Config config) {
        auto backends = backend::resolve_backends(config);
        if (!backends) {
            return tl::unexpected(backends.error());
        }
        return create(std::move(config), std::move(*backends));
    }

    /// Build over already resolved handles; `cache_clock` is for tests.
    static Expected<std::unique_ptr<DataAccess>> create(
        Config config,
        backend::BackendSet backends,
        RecordCache::Clock cache_clock = nullptr
    ) {
        if (auto valid = backends.validate(); !valid) {
            return tl::unexpected(valid.error());
        }
        return std::unique_ptr<DataAccess>(
            new DataAccess(std::move(config), std::move(backends), std::move(cache_clock)));
    }

    ~DataAccess() {
        core_->wait_for_refreshes();
    }

    DataAccess(const DataAccess&) = delete;
    DataAccess& operator=(const DataAccess&) = delete;

    /// Register `table` with both backends and return its handle.
    Expected<Collection> collection(const backend::TableHandle& table, CollectionOptions options = CollectionOptions{}) {
        if (auto valid = table.validate(); !valid) {
            return tl::unexpected(valid.error());
        }
        const auto& backends = core_->coordinator.backends();
        for (backend::IBackendClient* client : {static_cast<backend::IBackendClient*>(backends.primary.get()),
                                                static_cast<backend::IBackendClient*>(backends.secondary.get())}) {
            if (auto registered = client->register_table(table); !registered) {
                return tl::unexpected(registered.error());
            }
        }
        DUET_DEBUG("Registered collection '{}'", table.name);
        return Collection(core_, table, std::move(options));
    }

    /**
     * @brief Run `fn(IRelationalClient&)` in a Secondary-store transaction.
     *
     * `fn` returns Expected<R>. An error value or an exception rolls back;
     * the original error/exception is what the caller sees. The record cache
     * is cleared afterwards, since writes inside the body bypass per-key
     * invalidation.
     */
    template<typename Fn>
    auto with_transaction(Fn&& fn, const CallOptions& call = CallOptions{})
        -> std::invoke_result_t<Fn&, backend::IRelationalClient&> {
        auto core = core_;
        engine::TransactionRunner runner(core->coordinator.backends().secondary, [core]() { core->cache.clear(); });
        try {
            auto result = runner.run(std::forward<Fn>(fn), core->make_context(call));
            if (!result) {
                core->cache.clear();
            }
            return result;
        } catch (...) {
            core->cache.clear();
            throw;
        }
    }

    /// Raw query without a collection; see Collection::execute_raw_query.
    Expected<std::vector<Record>> execute_raw_query(
        const std::string& query,
        const std::vector<nlohmann::json>& params = {},
        const CallOptions& call = CallOptions{}
    ) {
        const CallContext ctx = core_->make_context(call);
        const BackendKind kind = call.backend.value_or(BackendKind::Secondary);
        auto rows = core_->coordinator.backends().get(kind).raw_query(query, params, ctx);
        if (!rows) {
            Error error = rows.error();
            if (!error.backend) error.with_backend(kind);
            return tl::unexpected(error.with_operation("executeRawQuery"));
        }
        return rows;
    }

    /// get/set/remove/clear/refresh/stats over the shared record cache.
    RecordCache& cache() { return core_->cache; }

    void set_fallback_listener(engine::FallbackListener listener) {
        core_->coordinator.set_listener(std::move(listener));
    }

    uint64_t fallback_count() const { return core_->coordinator.fallback_count(); }

    /// Block until scheduled stale-entry refreshes have finished.
    void wait_for_refreshes() { core_->wait_for_refreshes(); }

    const Config& config() const { return core_->config; }

    const backend::BackendSet& backends() const { return core_->coordinator.backends(); }

private:
    DataAccess(Config config, backend::BackendSet backends, RecordCache::Clock cache_clock)
        : core_(std::make_shared<detail::DataAccessCore>(std::move(config), std::move(backends), std::move(cache_clock)))
    {}

    std::shared_ptr<detail::DataAccessCore> core_;
};

} // namespace duet
