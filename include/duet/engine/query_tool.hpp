#pragma once

#include "query_result_cache.hpp"
#include "tool_registry.hpp"

#include <memory>

namespace duet {
namespace engine {

inline constexpr const char* kGqlQueryToolName = "GqlQuery";

/// Parameters schema of the GqlQuery tool.
inline nlohmann::json gql_query_schema() {
    return nlohmann::json{
        {"type", "object"},
        {"properties", {
            {"query", {{"type", "string"}, {"description", "GraphQL query (or mutation) string"}}},
            {"variables", {{"type", "object"}, {"description", "Optional variables object"}}},
            {"cache", {
                {"type", "boolean"},
                {"default", true},
                {"description", "Cache the response in the relational and semantic stores"}
            }}
        }},
        {"required", nlohmann::json::array({"query"})}
    };
}

/**
 * @brief Register the GqlQuery tool backed by `cache`.
 *
 * The tool result is the QueryResult object; origin failures are reported as
 * `{success:false, error}` results, not tool errors.
 */
inline void register_query_tool(ToolRegistry& registry, std::shared_ptr<QueryResultCache> cache) {
    registry.register_tool(
        kGqlQueryToolName,
        "Execute a GraphQL query against the configured endpoint, with result caching",
        gql_query_schema(),
        [cache = std::move(cache)](const nlohmann::json& args) -> Expected<nlohmann::json> {
            const auto variables = args.value("variables", nlohmann::json::object());
            const bool use_cache = args.value("cache", true);
            return cache->execute(args.at("query").get<std::string>(), variables, use_cache).to_json();
        });
}

} // namespace engine
} // namespace duet
