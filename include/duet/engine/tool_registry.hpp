#pragma once

#include "../types.hpp"
#include <functional>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace duet {
namespace engine {

/** @brief Callable type for tool execution; takes JSON arguments and returns JSON result or Error. */
using ToolHandler = std::function<Expected<nlohmann::json>(const nlohmann::json&)>;

/** @brief Holds metadata and handler for a single registered tool. */
struct ToolEntry {
    std::string name;                    ///< Unique tool name used for invocation
    std::string description;             ///< Human-readable description of what the tool does
    nlohmann::json parameters_schema;    ///< JSON Schema describing expected parameters
    ToolHandler handler;                 ///< Callable that executes the tool logic
};

/**
 * @brief Registry exposing data-access capabilities to tool-calling agents.
 *
 * Tools are registered with an explicit JSON schema. invoke() validates the
 * arguments against that schema (required fields, property types), fills in
 * schema defaults, then calls the handler.
 *
 * @threadsafety All public methods are thread-safe. Read operations use shared
 * locks; register_tool uses an exclusive lock.
 */
class ToolRegistry {
public:
    void register_tool(const std::string& name, const std::string& description,
                       nlohmann::json schema, ToolHandler handler) {
        std::unique_lock lock(mutex_);
        tools_.insert_or_assign(name, ToolEntry{name, description, std::move(schema), std::move(handler)});
    }

    bool has_tool(const std::string& name) const {
        std::shared_lock lock(mutex_);
        return tools_.find(name) != tools_.end();
    }

    /** @brief Validate, apply defaults and invoke a registered tool. */
    Expected<nlohmann::json> invoke(const std::string& name, const nlohmann::json& args) const {
        ToolEntry entry;
        {
            std::shared_lock lock(mutex_);
            auto it = tools_.find(name);
            if (it == tools_.end()) {
                return tl::unexpected(Error{ErrorCode::ToolNotFound, "Tool not found: " + name});
            }
            entry = it->second;
        }

        const nlohmann::json provided = args.is_null() ? nlohmann::json::object() : args;
        if (!provided.is_object()) {
            return tl::unexpected(Error{ErrorCode::ValidationFailed, "Tool arguments must be a JSON object", name});
        }
        if (auto message = validate_args(provided, entry.parameters_schema); !message.empty()) {
            return tl::unexpected(Error{ErrorCode::ValidationFailed, message, name});
        }
        return entry.handler(with_defaults(provided, entry.parameters_schema));
    }

    /** @brief Copy of the parameters schema, or nullopt if the tool is unknown. */
    std::optional<nlohmann::json> get_parameters_schema(const std::string& name) const {
        std::shared_lock lock(mutex_);
        auto it = tools_.find(name);
        if (it == tools_.end()) {
            return std::nullopt;
        }
        return it->second.parameters_schema;
    }

    /** @brief Function-calling schema for one tool, or empty JSON if not found. */
    nlohmann::json get_tool_schema(const std::string& name) const {
        std::shared_lock lock(mutex_);
        auto it = tools_.find(name);
        if (it == tools_.end()) {
            return nlohmann::json{};
        }
        return build_schema_json(it->second);
    }

    nlohmann::json get_all_schemas() const {
        std::shared_lock lock(mutex_);
        nlohmann::json schemas = nlohmann::json::array();
        for (const auto& [name, entry] : tools_) {
            schemas.push_back(build_schema_json(entry));
        }
        return schemas;
    }

    std::vector<std::string> get_tool_names() const {
        std::shared_lock lock(mutex_);
        std::vector<std::string> names;
        names.reserve(tools_.size());
        for (const auto& [name, _] : tools_) {
            names.push_back(name);
        }
        return names;
    }

    size_t size() const {
        std::shared_lock lock(mutex_);
        return tools_.size();
    }

    /**
     * @brief Check arguments against a parameters schema.
     *
     * @return Empty string if valid, otherwise a description of the first problem
     */
    static std::string validate_args(const nlohmann::json& args, const nlohmann::json& params) {
        if (auto required = params.find("required"); required != params.end()) {
            for (const auto& req : *required) {
                const auto& field = req.get_ref<const std::string&>();
                if (!args.contains(field)) {
                    return "Missing required argument: " + field;
                }
            }
        }

        auto props_it = params.find("properties");
        if (props_it == params.end()) {
            return "";
        }
        for (const auto& [key, prop] : props_it->items()) {
            auto arg_it = args.find(key);
            if (arg_it == args.end()) {
                continue;
            }
            auto type_it = prop.find("type");
            if (type_it == prop.end() || !type_it->is_string()) {
                continue;
            }
            const auto& expected_type = type_it->get_ref<const std::string&>();
            if (!type_matches(*arg_it, expected_type)) {
                return "Argument '" + key + "' has wrong type: expected " +
                       expected_type + ", got " + json_type_name(*arg_it);
            }
        }
        return "";
    }

private:
    static nlohmann::json with_defaults(const nlohmann::json& args, const nlohmann::json& params) {
        nlohmann::json filled = args;
        auto props_it = params.find("properties");
        if (props_it == params.end()) {
            return filled;
        }
        for (const auto& [key, prop] : props_it->items()) {
            auto default_it = prop.find("default");
            if (default_it != prop.end() && !filled.contains(key)) {
                filled[key] = *default_it;
            }
        }
        return filled;
    }

    static bool type_matches(const nlohmann::json& val, std::string_view expected) {
        if (expected == "integer") return val.is_number_integer();
        if (expected == "number") return val.is_number();
        if (expected == "string") return val.is_string();
        if (expected == "boolean") return val.is_boolean();
        if (expected == "object") return val.is_object();
        if (expected == "array") return val.is_array();
        return false;
    }

    static const char* json_type_name(const nlohmann::json& val) {
        if (val.is_null()) return "null";
        if (val.is_boolean()) return "boolean";
        if (val.is_number_integer()) return "integer";
        if (val.is_number_float()) return "number";
        if (val.is_string()) return "string";
        if (val.is_array()) return "array";
        if (val.is_object()) return "object";
        return "unknown";
    }

    static nlohmann::json build_schema_json(const ToolEntry& entry) {
        return nlohmann::json{
            {"type", "function"},
            {"function", {
                {"name", entry.name},
                {"description", entry.description},
                {"parameters", entry.parameters_schema}
            }}
        };
    }

    std::unordered_map<std::string, ToolEntry> tools_;
    mutable std::shared_mutex mutex_;
};

} // namespace engine
} // namespace duet
