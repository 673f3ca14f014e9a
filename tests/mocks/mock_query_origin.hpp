#pragma once

#include "duet/engine/query_result_cache.hpp"
#include "duet/engine/semantic_store.hpp"
#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace duet {
namespace testing {

/**
 * @brief Mock query origin returning a canned `data` payload
 *
 * Records every (query, variables) pair it receives.
 */
class MockQueryOrigin : public engine::IQueryOrigin {
public:
    // Configuration
    nlohmann::json response = nlohmann::json{{"items", nlohmann::json::array()}};
    bool should_fail = false;
    ErrorCode failure_code = ErrorCode::OriginRequestFailed;
    std::string error_message = "Mock origin error";

    std::function<void()> on_response;   ///< Runs after a successful response is produced

    // State tracking
    int call_count = 0;
    std::vector<std::pair<std::string, nlohmann::json>> received;

    Expected<nlohmann::json> execute(
        const std::string& query,
        const nlohmann::json& variables,
        const CallContext& ctx = CallContext{}
    ) override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++call_count;
        received.emplace_back(query, variables);
        if (auto ok = ctx.check(); !ok) {
            return tl::unexpected(ok.error());
        }
        if (should_fail) {
            return tl::unexpected(Error{failure_code, error_message});
        }
        if (on_response) {
            on_response();
        }
        return response;
    }

private:
    std::mutex mutex_;
};

/**
 * @brief Semantic store that records stored texts and can be made to fail.
 */
class MockSemanticStore : public engine::ISemanticStore {
public:
    bool should_fail = false;
    int call_count = 0;
    std::vector<std::string> stored;

    Expected<void> store(const std::string& text, const CallContext& ctx = CallContext{}) override {
        ++call_count;
        if (auto ok = ctx.check(); !ok) {
            return ok;
        }
        if (should_fail) {
            return tl::unexpected(Error{ErrorCode::CacheFailure, "Mock semantic store error"});
        }
        stored.push_back(text);
        return {};
    }
};

} // namespace testing
} // namespace duet
