#pragma once

#include "../types.hpp"
#include <algorithm>
#include <cctype>
#include <string>
#include <vector>

namespace duet {
namespace backend {

/**
 * @brief Storage class of a column.
 */
enum class ColumnType {
    Text,
    Integer,
    Real,
    Boolean,
    Json,       ///< Objects/arrays, stored as JSON text in SQL
    Timestamp   ///< Epoch milliseconds
};

[[nodiscard]] inline const char* column_type_to_sql(ColumnType type) {
    switch (type) {
        case ColumnType::Text: return "TEXT";
        case ColumnType::Integer: return "INTEGER";
        case ColumnType::Real: return "REAL";
        case ColumnType::Boolean: return "INTEGER";
        case ColumnType::Json: return "TEXT";
        case ColumnType::Timestamp: return "INTEGER";
    }
    return "TEXT";
}

struct Column {
    std::string name;
    ColumnType type = ColumnType::Text;
    bool nullable = true;

    bool operator==(const Column& other) const {
        return name == other.name && type == other.type && nullable == other.nullable;
    }
};

/// Identifiers are interpolated into SQL, so only [A-Za-z_][A-Za-z0-9_]* is allowed.
inline bool is_valid_identifier(const std::string& name) {
    if (name.empty() || (std::isalpha(static_cast<unsigned char>(name[0])) == 0 && name[0] != '_')) {
        return false;
    }
    return std::all_of(name.begin(), name.end(), [](unsigned char ch) {
        return std::isalnum(ch) != 0 || ch == '_';
    });
}

/**
 * @brief Typed table description consumed by both backend adapters.
 *
 * The relational schema itself lives elsewhere; this handle only carries what
 * the adapters need: column names/types and the primary key.
 */
struct TableHandle {
    std::string name;
    std::vector<Column> columns;
    std::vector<std::string> primary_key{"id"};   ///< One or more columns (composite keys join with ':')

    const Column* find_column(const std::string& column) const {
        auto it = std::find_if(columns.begin(), columns.end(),
                               [&column](const Column& c) { return c.name == column; });
        return it == columns.end() ? nullptr : &*it;
    }

    bool has_column(const std::string& column) const {
        return find_column(column) != nullptr;
    }

    bool composite_key() const {
        return primary_key.size() > 1;
    }

    Expected<void> validate() const {
        if (!is_valid_identifier(name)) {
            return tl::unexpected(Error{ErrorCode::InvalidConfig, "Invalid table name", name});
        }
        if (columns.empty()) {
            return tl::unexpected(Error{ErrorCode::InvalidConfig, "Table has no columns", name});
        }
        for (const auto& column : columns) {
            if (!is_valid_identifier(column.name)) {
                return tl::unexpected(Error{ErrorCode::InvalidConfig, "Invalid column name", column.name});
            }
        }
        if (primary_key.empty()) {
            return tl::unexpected(Error{ErrorCode::InvalidConfig, "Table needs a primary key", name});
        }
        for (const auto& key : primary_key) {
            if (!has_column(key)) {
                return tl::unexpected(Error{
                    ErrorCode::InvalidConfig,
                    "Primary key column is not declared: " + key,
                    name
                });
            }
        }
        return {};
    }

    /// Extract the record id; empty when any key column is missing or null.
    RecordId id_of(const Record& record) const {
        RecordId id;
        for (size_t i = 0; i < primary_key.size(); ++i) {
            auto it = record.find(primary_key[i]);
            if (it == record.end() || it->is_null()) {
                return {};
            }
            if (i > 0) {
                id += ':';
            }
            id += id_to_string(*it);
        }
        return id;
    }

    /// Split a (possibly composite) id into per-key-column parts.
    Expected<std::vector<std::string>> split_id(const RecordId& id) const {
        std::vector<std::string> parts;
        if (!composite_key()) {
            parts.push_back(id);
            return parts;
        }
        size_t start = 0;
        while (true) {
            const size_t pos = id.find(':', start);
            parts.push_back(id.substr(start, pos == std::string::npos ? std::string::npos : pos - start));
            if (pos == std::string::npos) {
                break;
            }
            start = pos + 1;
        }
        if (parts.size() != primary_key.size()) {
            return tl::unexpected(Error{
                ErrorCode::ValidationFailed,
                "Composite id does not match the primary key arity",
                name + ":" + id
            });
        }
        return parts;
    }

    /// Typed JSON value for a key part, following the declared column type.
    nlohmann::json key_value(size_t index, const std::string& part) const {
        const Column* column = find_column(primary_key[index]);
        if (column != nullptr && column->type == ColumnType::Integer) {
            try {
                size_t consumed = 0;
                long long value = std::stoll(part, &consumed);
                if (consumed == part.size()) {
                    return value;
                }
            } catch (const std::exception&) {
                // Not numeric; keep the text form.
            }
        }
        return part;
    }

    bool operator==(const TableHandle& other) const {
        return name == other.name && columns == other.columns && primary_key == other.primary_key;
    }
};

} // namespace backend
} // namespace duet
