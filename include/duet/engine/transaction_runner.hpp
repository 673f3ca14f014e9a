#pragma once

#include "../backend/client.hpp"
#include "../log.hpp"
#include "../types.hpp"

#include <functional>
#include <memory>
#include <type_traits>
#include <utility>

namespace duet {
namespace engine {

/**
 * @brief BEGIN -> RUN -> COMMIT | ROLLBACK wrapper over the relational backend.
 *
 * Only an IRelationalClient can be handed to the body, so the document store
 * is excluded by type. The body returns Expected<R>:
 * - an error value rolls back and is returned unchanged;
 * - an exception rolls back and is rethrown unchanged;
 * - a failed BEGIN returns before the body runs.
 * A rollback failure is logged and never replaces the original error.
 */
class TransactionRunner {
public:
    explicit TransactionRunner(
        std::shared_ptr<backend::IRelationalClient> client,
        std::function<void()> on_commit = nullptr
    )
        : client_(std::move(client))
        , on_commit_(std::move(on_commit))
    {}

    template<typename Fn>
    auto run(Fn&& fn, const CallContext& ctx = CallContext{})
        -> std::invoke_result_t<Fn&, backend::IRelationalClient&> {
        using Result = std::invoke_result_t<Fn&, backend::IRelationalClient&>;

        auto started = client_->begin(ctx);
        if (!started) {
            Error error = started.error();
            error.with_operation("withTransaction");
            return Result(tl::unexpected(std::move(error)));
        }

        Result result = [&]() -> Result {
            try {
                return fn(*client_);
            } catch (...) {
                rollback_after_failure("exception in transaction body");
                throw;
            }
        }();

        if (!result) {
            rollback_after_failure(result.error().to_string());
            return result;
        }

        auto committed = client_->commit(ctx);
        if (!committed) {
            Error error = committed.error();
            error.with_operation("withTransaction");
            rollback_after_failure(error.to_string());
            return Result(tl::unexpected(std::move(error)));
        }

        if (on_commit_) {
            on_commit_();
        }
        return result;
    }

private:
    void rollback_after_failure(const std::string& cause) {
        DUET_DEBUG("Rolling back transaction: {}", cause);
        auto rolled_back = client_->rollback();
        if (!rolled_back) {
            DUET_ERROR("Error rolling back transaction: {}", rolled_back.error().to_string());
        }
    }

    std::shared_ptr<backend::IRelationalClient> client_;
    std::function<void()> on_commit_;
};

} // namespace engine
} // namespace duet
