#pragma once

#include "../engine/document_translator.hpp"
#include "../engine/id_generator.hpp"
#include "../log.hpp"
#include "client.hpp"

#include <cstdio>
#include <fstream>
#include <map>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <sstream>
#include <string>
#include <unordered_map>
#include <vector>

namespace duet {
namespace backend {

/**
 * @brief Primary adapter: in-process key/document store.
 *
 * Documents are JSON objects addressed as `table:<name>:<id>`. With a file
 * path the whole store is written through to a JSON snapshot after every
 * mutation and reloaded on open; ":memory:" keeps everything in process.
 *
 * There is no transaction primitive. Reads take a shared lock, writes an
 * exclusive one.
 */
class DocumentBackend : public IBackendClient {
public:
    static constexpr const char* kMemoryPath = ":memory:";

    static Expected<std::shared_ptr<DocumentBackend>> open(const std::string& path, int default_page_size = 20) {
        if (path.empty()) {
            return tl::unexpected(Error{ErrorCode::InvalidConfig, "Document store path cannot be empty"});
        }
        auto instance = std::shared_ptr<DocumentBackend>(new DocumentBackend(path, default_page_size));
        if (path != kMemoryPath) {
            auto loaded = instance->load_snapshot();
            if (!loaded) {
                return tl::unexpected(loaded.error());
            }
        }
        return instance;
    }

    DocumentBackend(const DocumentBackend&) = delete;
    DocumentBackend& operator=(const DocumentBackend&) = delete;

    BackendKind kind() const override { return BackendKind::Primary; }

    std::string name() const override { return "document"; }

    Expected<void> register_table(const TableHandle& table) override {
        if (auto valid = table.validate(); !valid) {
            return valid;
        }
        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto& entry = tables_[table.name];
        entry.handle = table;
        return {};
    }

    Expected<std::optional<Record>> get(const std::string& table, const RecordId& id, const CallContext& ctx = CallContext{}) override {
        if (auto ok = ctx.check(); !ok) {
            return tl::unexpected(tag(ok.error()));
        }
        std::shared_lock<std::shared_mutex> lock(mutex_);
        auto data = find_table(table);
        if (!data) {
            return tl::unexpected(data.error());
        }
        auto it = (*data)->rows.find(id);
        if (it == (*data)->rows.end()) {
            return std::optional<Record>{};
        }
        return std::optional<Record>{it->second};
    }

    Expected<std::vector<Record>> list(const std::string& table, const QueryOptions& options, const CallContext& ctx = CallContext{}) override {
        if (auto ok = ctx.check(); !ok) {
            return tl::unexpected(tag(ok.error()));
        }
        std::shared_lock<std::shared_mutex> lock(mutex_);
        auto data = find_table(table);
        if (!data) {
            return tl::unexpected(data.error());
        }
        auto query = translator_.translate((*data)->handle, options);
        if (!query) {
            return tl::unexpected(tag(query.error()));
        }

        auto matched = collect(**data, *query, ctx);
        if (!matched) {
            return tl::unexpected(matched.error());
        }
        query->order(*matched);
        auto rows = query->paginate(std::move(*matched));

        for (auto& row : rows) {
            for (const auto& inc : query->include) {
                auto embedded = embed(row, inc);
                if (!embedded) {
                    return tl::unexpected(embedded.error());
                }
                row[inc.table] = std::move(*embedded);
            }
            row = query->project(row);
        }
        return rows;
    }

    Expected<size_t> count(const std::string& table, const QueryOptions& options, const CallContext& ctx = CallContext{}) override {
        if (auto ok = ctx.check(); !ok) {
            return tl::unexpected(tag(ok.error()));
        }
        std::shared_lock<std::shared_mutex> lock(mutex_);
        auto data = find_table(table);
        if (!data) {
            return tl::unexpected(data.error());
        }
        QueryOptions filters_only;
        filters_only.filters = options.filters;
        filters_only.search = options.search;
        auto query = translator_.translate((*data)->handle, filters_only);
        if (!query) {
            return tl::unexpected(tag(query.error()));
        }
        auto matched = collect(**data, *query, ctx);
        if (!matched) {
            return tl::unexpected(matched.error());
        }
        return matched->size();
    }

    Expected<Record> insert(const std::string& table, const Record& data, const CallContext& ctx = CallContext{}) override {
        if (auto ok = ctx.check(); !ok) {
            return tl::unexpected(tag(ok.error()));
        }
        if (!data.is_object()) {
            return tl::unexpected(tag(Error{ErrorCode::ValidationFailed, "Records must be JSON objects", table}));
        }
        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto found = find_table(table);
        if (!found) {
            return tl::unexpected(found.error());
        }
        TableData& target = **found;

        Record row = data;
        RecordId id = target.handle.id_of(row);
        if (id.empty()) {
            if (target.handle.composite_key()) {
                return tl::unexpected(tag(Error{
                    ErrorCode::ValidationFailed,
                    "Composite-key records must carry every key column",
                    table
                }));
            }
            row[target.handle.primary_key.front()] = next_id(target);
            id = target.handle.id_of(row);
        }
        if (target.rows.count(id) > 0) {
            return tl::unexpected(tag(Error{ErrorCode::OperationRejected, "Duplicate primary key", key_for(table, id)}));
        }

        target.rows.emplace(id, row);
        if (auto saved = persist(); !saved) {
            target.rows.erase(id);
            return tl::unexpected(saved.error());
        }
        return row;
    }

    Expected<Record> update(const std::string& table, const RecordId& id, const Record& patch, const CallContext& ctx = CallContext{}) override {
        if (auto ok = ctx.check(); !ok) {
            return tl::unexpected(tag(ok.error()));
        }
        if (!patch.is_object()) {
            return tl::unexpected(tag(Error{ErrorCode::ValidationFailed, "Patches must be JSON objects", table}));
        }
        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto found = find_table(table);
        if (!found) {
            return tl::unexpected(found.error());
        }
        TableData& target = **found;
        auto it = target.rows.find(id);
        if (it == target.rows.end()) {
            return tl::unexpected(tag(Error{ErrorCode::NotFound, "Record not found", key_for(table, id)}));
        }

        Record merged = it->second;
        for (auto field = patch.begin(); field != patch.end(); ++field) {
            merged[field.key()] = field.value();
        }
        if (target.handle.id_of(merged) != id) {
            return tl::unexpected(tag(Error{
                ErrorCode::ValidationFailed,
                "Primary key columns cannot be changed by update",
                key_for(table, id)
            }));
        }

        Record previous = it->second;
        it->second = merged;
        if (auto saved = persist(); !saved) {
            it->second = std::move(previous);
            return tl::unexpected(saved.error());
        }
        return merged;
    }

    Expected<bool> remove(const std::string& table, const RecordId& id, const CallContext& ctx = CallContext{}) override {
        auto removed = remove_many(table, {id}, ctx);
        if (!removed) {
            return tl::unexpected(removed.error());
        }
        return *removed > 0;
    }

    Expected<size_t> remove_many(const std::string& table, const std::vector<RecordId>& ids, const CallContext& ctx = CallContext{}) override {
        if (auto ok = ctx.check(); !ok) {
            return tl::unexpected(tag(ok.error()));
        }
        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto found = find_table(table);
        if (!found) {
            return tl::unexpected(found.error());
        }
        TableData& target = **found;

        std::map<RecordId, Record> removed;
        for (const auto& id : ids) {
            auto it = target.rows.find(id);
            if (it != target.rows.end()) {
                removed.emplace(it->first, std::move(it->second));
                target.rows.erase(it);
            }
        }
        if (removed.empty()) {
            return size_t{0};
        }
        if (auto saved = persist(); !saved) {
            target.rows.insert(removed.begin(), removed.end());
            return tl::unexpected(saved.error());
        }
        return removed.size();
    }

    /**
     * @brief Read-only command set: `KEYS <prefix>`, `GET <table> <id>`, `COUNT <table>`.
     */
    Expected<std::vector<Record>> raw_query(
        const std::string& query,
        const std::vector<nlohmann::json>& params,
        const CallContext& ctx = CallContext{}
    ) override {
        if (auto ok = ctx.check(); !ok) {
            return tl::unexpected(tag(ok.error()));
        }
        if (!params.empty()) {
            return tl::unexpected(tag(Error{ErrorCode::ValidationFailed, "Document commands take no parameters", query}));
        }

        std::istringstream stream(query);
        std::vector<std::string> words;
        std::string word;
        while (stream >> word) {
            words.push_back(word);
        }
        if (words.empty()) {
            return tl::unexpected(tag(Error{ErrorCode::ValidationFailed, "Empty document command"}));
        }

        std::shared_lock<std::shared_mutex> lock(mutex_);
        std::vector<Record> result;
        if (words[0] == "KEYS" && words.size() <= 2) {
            const std::string prefix = words.size() == 2 ? words[1] : "";
            for (const auto& [table, data] : tables_) {
                for (const auto& row : data.rows) {
                    std::string key = key_for(table, row.first);
                    if (key.compare(0, prefix.size(), prefix) == 0) {
                        result.push_back(Record{{"key", std::move(key)}});
                    }
                }
            }
            return result;
        }
        if (words[0] == "GET" && words.size() == 3) {
            auto data = find_table(words[1]);
            if (!data) {
                return tl::unexpected(data.error());
            }
            auto it = (*data)->rows.find(words[2]);
            if (it != (*data)->rows.end()) {
                result.push_back(it->second);
            }
            return result;
        }
        if (words[0] == "COUNT" && words.size() == 2) {
            auto data = find_table(words[1]);
            if (!data) {
                return tl::unexpected(data.error());
            }
            result.push_back(Record{{"count", (*data)->rows.size()}});
            return result;
        }
        return tl::unexpected(tag(Error{ErrorCode::ValidationFailed, "Unknown document command", query}));
    }

    /// Storage key of a row, e.g. `table:tools:42`.
    static std::string key_for(const std::string& table, const RecordId& id) {
        return "table:" + table + ":" + id;
    }

private:
    struct TableData {
        TableHandle handle;
        std::map<RecordId, Record> rows;
    };

    DocumentBackend(std::string path, int default_page_size)
        : path_(std::move(path))
        , translator_(default_page_size)
    {}

    Error tag(Error error) const {
        error.with_backend(BackendKind::Primary);
        return error;
    }

    Expected<TableData*> find_table(const std::string& table) {
        auto it = tables_.find(table);
        if (it == tables_.end() || it->second.handle.name.empty()) {
            return tl::unexpected(tag(Error{ErrorCode::TableNotRegistered, "Table is not registered", table}));
        }
        return &it->second;
    }

    Expected<std::vector<Record>> collect(const TableData& data, const engine::DocumentQuery& query, const CallContext& ctx) const {
        std::vector<Record> matched;
        size_t scanned = 0;
        for (const auto& row : data.rows) {
            if (++scanned % 256 == 0) {
                if (auto ok = ctx.check(); !ok) {
                    return tl::unexpected(tag(ok.error()));
                }
            }
            if (query.matches(row.second)) {
                matched.push_back(row.second);
            }
        }
        return matched;
    }

    Expected<nlohmann::json> embed(const Record& parent, const IncludeSpec& inc) {
        auto related = find_table(inc.table);
        if (!related) {
            return tl::unexpected(related.error());
        }
        nlohmann::json out = nlohmann::json::array();
        auto local = parent.find(inc.local_key);
        if (local == parent.end() || local->is_null()) {
            return out;
        }
        for (const auto& row : (*related)->rows) {
            auto fk = row.second.find(inc.foreign_key);
            if (fk == row.second.end() || !engine::json_equal(*fk, *local)) {
                continue;
            }
            if (inc.fields.empty()) {
                out.push_back(row.second);
                continue;
            }
            Record projected = Record::object();
            for (const auto& field : inc.fields) {
                auto value = row.second.find(field);
                projected[field] = value == row.second.end() ? nlohmann::json() : *value;
            }
            out.push_back(std::move(projected));
        }
        return out;
    }

    /// UUID for text keys; max + 1 for integer keys.
    nlohmann::json next_id(const TableData& data) const {
        const std::string& key = data.handle.primary_key.front();
        const Column* column = data.handle.find_column(key);
        if (column != nullptr && column->type == ColumnType::Integer) {
            long long max_id = 0;
            for (const auto& row : data.rows) {
                auto it = row.second.find(key);
                if (it != row.second.end() && it->is_number_integer()) {
                    max_id = std::max(max_id, it->get<long long>());
                }
            }
            return max_id + 1;
        }
        return engine::generate_uuid();
    }

    Expected<void> persist() const {
        if (path_ == kMemoryPath) {
            return {};
        }
        nlohmann::json root;
        root["documents"] = nlohmann::json::object();
        for (const auto& [table, data] : tables_) {
            for (const auto& row : data.rows) {
                root["documents"][key_for(table, row.first)] = row.second;
            }
        }

        const std::string tmp = path_ + ".tmp";
        {
            std::ofstream out(tmp);
            if (!out.is_open()) {
                return tl::unexpected(tag(Error{
                    ErrorCode::BackendUnavailable,
                    "Failed to open document snapshot for writing",
                    tmp
                }));
            }
            out << root.dump();
            if (!out.good()) {
                return tl::unexpected(tag(Error{ErrorCode::BackendUnavailable, "Failed to write document snapshot", tmp}));
            }
        }
        if (std::rename(tmp.c_str(), path_.c_str()) != 0) {
            return tl::unexpected(tag(Error{ErrorCode::BackendUnavailable, "Failed to replace document snapshot", path_}));
        }
        return {};
    }

    /// Missing file means an empty store. Rows are re-attached when their table registers.
    Expected<void> load_snapshot() {
        std::ifstream in(path_);
        if (!in.is_open()) {
            DUET_INFO("Document store starting empty: {}", path_);
            return {};
        }

        nlohmann::json root;
        try {
            in >> root;
        } catch (const std::exception& e) {
            return tl::unexpected(tag(Error{
                ErrorCode::BackendUnavailable,
                std::string("Failed to parse document snapshot: ") + e.what(),
                path_
            }));
        }
        if (!root.contains("documents") || !root["documents"].is_object()) {
            return tl::unexpected(tag(Error{
                ErrorCode::BackendUnavailable,
                "Invalid document snapshot: missing 'documents' object",
                path_
            }));
        }

        for (auto it = root["documents"].begin(); it != root["documents"].end(); ++it) {
            const std::string& key = it.key();
            // table:<name>:<id>; ids may themselves contain ':'
            const size_t first = key.find(':');
            const size_t second = first == std::string::npos ? std::string::npos : key.find(':', first + 1);
            if (first == std::string::npos || second == std::string::npos || key.compare(0, first, "table") != 0) {
                DUET_WARN("Skipping malformed document key '{}' in {}", key, path_);
                continue;
            }
            const std::string table = key.substr(first + 1, second - first - 1);
            tables_[table].rows.emplace(key.substr(second + 1), it.value());
        }
        DUET_INFO("Document store loaded {} table(s) from {}", tables_.size(), path_);
        return {};
    }

    std::string path_;
    engine::DocumentFilterTranslator translator_;
    std::unordered_map<std::string, TableData> tables_;
    mutable std::shared_mutex mutex_;
};

} // namespace backend
} // namespace duet
