#include "duet/origin/graphql_origin.hpp"
#include "duet/log.hpp"

#include <algorithm>
#include <curl/curl.h>
#include <memory>
#include <mutex>

namespace duet {
namespace origin {

// File-scope statics for idempotent global initialization
static std::once_flag g_curl_init_flag;
static CURLcode g_curl_init_result = CURLE_OK;

namespace {

using CurlHandle = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;
using HeaderList = std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)>;

size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* body = static_cast<std::string*>(userdata);
    body->append(ptr, size * nmemb);
    return size * nmemb;
}

// Non-zero aborts the transfer with CURLE_ABORTED_BY_CALLBACK.
int progress_callback(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    const auto* ctx = static_cast<const CallContext*>(clientp);
    return ctx->is_cancelled() ? 1 : 0;
}

Error origin_error(ErrorCode code, std::string message, const std::string& url) {
    return Error{code, std::move(message), url};
}

} // namespace

Expected<std::shared_ptr<GraphQLOrigin>> GraphQLOrigin::create(GraphQLOriginConfig config) {
    if (config.endpoint_url.empty()) {
        return tl::unexpected(Error{ErrorCode::InvalidConfig, "GraphQL endpoint URL cannot be empty"});
    }
    std::call_once(g_curl_init_flag, []() {
        g_curl_init_result = curl_global_init(CURL_GLOBAL_DEFAULT);
    });
    if (g_curl_init_result != CURLE_OK) {
        return tl::unexpected(Error{
            ErrorCode::InvalidConfig,
            std::string("libcurl initialization failed: ") + curl_easy_strerror(g_curl_init_result)
        });
    }
    return std::shared_ptr<GraphQLOrigin>(new GraphQLOrigin(std::move(config)));
}

GraphQLOrigin::GraphQLOrigin(GraphQLOriginConfig config)
    : config_(std::move(config))
{}

Expected<nlohmann::json> GraphQLOrigin::execute(
    const std::string& query,
    const nlohmann::json& variables,
    const CallContext& ctx
) {
    if (auto ok = ctx.check(); !ok) {
        return tl::unexpected(ok.error());
    }

    CurlHandle curl(curl_easy_init(), &curl_easy_cleanup);
    if (!curl) {
        return tl::unexpected(origin_error(ErrorCode::OriginRequestFailed, "Failed to create curl handle", config_.endpoint_url));
    }

    const std::string payload = nlohmann::json{{"query", query}, {"variables", variables}}.dump();

    curl_slist* raw_headers = nullptr;
    raw_headers = curl_slist_append(raw_headers, "Content-Type: application/json");
    raw_headers = curl_slist_append(raw_headers, "Accept: application/json");
    if (config_.api_key) {
        raw_headers = curl_slist_append(raw_headers, ("apikey: " + *config_.api_key).c_str());
        raw_headers = curl_slist_append(raw_headers, ("Authorization: Bearer " + *config_.api_key).c_str());
    }
    HeaderList headers(raw_headers, &curl_slist_free_all);

    const auto timeout = ctx.remaining().value_or(config_.default_timeout);
    // 0 means "no timeout" to curl; an exhausted budget must still time out.
    const long timeout_ms = std::max<long>(1, static_cast<long>(timeout.count()));

    std::string body;
    curl_easy_setopt(curl.get(), CURLOPT_URL, config_.endpoint_url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_POST, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, payload.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(payload.size()));
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, timeout_ms);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &body);
    curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(curl.get(), CURLOPT_XFERINFOFUNCTION, progress_callback);
    curl_easy_setopt(curl.get(), CURLOPT_XFERINFODATA, const_cast<CallContext*>(&ctx));

    const CURLcode rc = curl_easy_perform(curl.get());
    if (rc == CURLE_ABORTED_BY_CALLBACK) {
        return tl::unexpected(Error{ErrorCode::RequestCancelled, "GraphQL request cancelled", config_.endpoint_url});
    }
    if (rc == CURLE_OPERATION_TIMEDOUT) {
        return tl::unexpected(Error{ErrorCode::RequestTimeout, "GraphQL request timed out", config_.endpoint_url});
    }
    if (rc != CURLE_OK) {
        return tl::unexpected(origin_error(
            ErrorCode::OriginRequestFailed,
            std::string("GraphQL request failed: ") + curl_easy_strerror(rc),
            config_.endpoint_url));
    }

    long status = 0;
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &status);
    if (status < 200 || status >= 300) {
        return tl::unexpected(origin_error(
            ErrorCode::OriginRequestFailed,
            "GraphQL endpoint returned HTTP " + std::to_string(status),
            config_.endpoint_url));
    }

    auto parsed = nlohmann::json::parse(body, nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object()) {
        return tl::unexpected(origin_error(ErrorCode::OriginResponseInvalid, "GraphQL response is not a JSON object", config_.endpoint_url));
    }
    if (auto errors = parsed.find("errors"); errors != parsed.end() && errors->is_array() && !errors->empty()) {
        std::string message = "GraphQL errors";
        const auto& first = errors->front();
        if (first.is_object() && first.contains("message") && first["message"].is_string()) {
            message += ": " + first["message"].get<std::string>();
        }
        return tl::unexpected(origin_error(ErrorCode::OriginRequestFailed, std::move(message), config_.endpoint_url));
    }

    auto data = parsed.find("data");
    if (data == parsed.end()) {
        return tl::unexpected(origin_error(ErrorCode::OriginResponseInvalid, "GraphQL response has no 'data' member", config_.endpoint_url));
    }
    DUET_DEBUG("GraphQL request to {} returned {} bytes", config_.endpoint_url, body.size());
    return *data;
}

} // namespace origin
} // namespace duet
