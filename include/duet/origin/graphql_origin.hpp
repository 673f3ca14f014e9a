#pragma once

#include "../engine/query_result_cache.hpp"

#include <chrono>
#include <memory>
#include <optional>
#include <string>

namespace duet {
namespace origin {

struct GraphQLOriginConfig {
    std::string endpoint_url;
    std::optional<std::string> api_key;                   ///< Sent as `apikey` and bearer token
    std::chrono::milliseconds default_timeout{30000};     ///< Used when the call has no deadline
};

/**
 * @brief Production IQueryOrigin: POSTs `{query, variables}` JSON over libcurl.
 *
 * The call deadline becomes the transfer timeout and cancellation aborts the
 * transfer. Non-2xx status, an unparseable body or a top-level `errors`
 * array is OriginRequestFailed / OriginResponseInvalid.
 */
class GraphQLOrigin : public engine::IQueryOrigin {
public:
    static Expected<std::shared_ptr<GraphQLOrigin>> create(GraphQLOriginConfig config);

    Expected<nlohmann::json> execute(
        const std::string& query,
        const nlohmann::json& variables,
        const CallContext& ctx = CallContext{}
    ) override;

    const GraphQLOriginConfig& config() const { return config_; }

private:
    explicit GraphQLOrigin(GraphQLOriginConfig config);

    GraphQLOriginConfig config_;
};

} // namespace origin
} // namespace duet
