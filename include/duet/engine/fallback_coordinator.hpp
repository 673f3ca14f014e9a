#pragma once

#include "../backend/client.hpp"
#include "../log.hpp"
#include "../types.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>

namespace duet {
namespace engine {

using FallbackListener = std::function<void(const FallbackEvent&)>;

/**
 * @brief Runs one logical operation against the preferred backend and, on a
 * recoverable failure, exactly once against the other.
 *
 * ATTEMPT_PRIMARY -> DONE | CLASSIFY
 * CLASSIFY        -> ATTEMPT_SECONDARY (recoverable) | DONE_ERROR (fatal)
 * ATTEMPT_SECONDARY -> DONE | DONE_ERROR
 *
 * Nothing is written back to the failed backend after a fallback. A context
 * that is cancelled or past its deadline never reaches the second attempt.
 *
 * @threadsafety Thread-safe; the backend set is read-only after construction.
 */
class FallbackCoordinator {
public:
    explicit FallbackCoordinator(backend::BackendSet backends)
        : backends_(std::move(backends))
    {}

    const backend::BackendSet& backends() const { return backends_; }

    BackendKind default_backend() const { return backends_.default_backend; }

    /// Receive every fallback event in-process, in addition to the log line.
    void set_listener(FallbackListener listener) {
        std::lock_guard<std::mutex> lock(listener_mutex_);
        listener_ = std::move(listener);
    }

    uint64_t fallback_count() const {
        return fallbacks_.load(std::memory_order_relaxed);
    }

    /**
     * @brief Execute `fn(client)` with single-step fallback.
     *
     * @param operation Logical operation name used in errors and events
     * @param fn Callable taking IBackendClient& and returning Expected<T>
     * @param ctx Caller deadline/cancellation
     * @param preferred Backend to try first (defaults to the process default)
     * @return Result from whichever backend answered, or the final error
     *         tagged with the failing backend and the operation name
     */
    template<typename Fn>
    auto execute(
        const std::string& operation,
        Fn&& fn,
        const CallContext& ctx,
        std::optional<BackendKind> preferred = std::nullopt
    ) -> std::invoke_result_t<Fn&, backend::IBackendClient&> {
        using Result = std::invoke_result_t<Fn&, backend::IBackendClient&>;

        const BackendKind first = preferred.value_or(backends_.default_backend);
        if (auto ok = ctx.check(); !ok) {
            return Result(tl::unexpected(annotate(ok.error(), first, operation)));
        }

        Result result = fn(backends_.get(first));
        if (result) {
            return result;
        }

        Error primary_error = annotate(result.error(), first, operation);
        if (!primary_error.recoverable()) {
            return Result(tl::unexpected(std::move(primary_error)));
        }
        if (auto ok = ctx.check(); !ok) {
            return Result(tl::unexpected(annotate(ok.error(), first, operation)));
        }

        const BackendKind second = other_backend(first);
        emit(FallbackEvent{
            operation,
            first,
            second,
            primary_error.code,
            primary_error.message,
            std::chrono::system_clock::now()
        });

        Result retry = fn(backends_.get(second));
        if (retry) {
            return retry;
        }
        return Result(tl::unexpected(annotate(retry.error(), second, operation)));
    }

private:
    static Error annotate(Error error, BackendKind kind, const std::string& operation) {
        if (!error.backend.has_value()) {
            error.with_backend(kind);
        }
        error.with_operation(operation);
        return error;
    }

    void emit(const FallbackEvent& event) {
        fallbacks_.fetch_add(1, std::memory_order_relaxed);
        DUET_WARN("fallback operation={} from={} to={} error_class={} error_code={} message=\"{}\"",
                  event.operation,
                  backend_to_string(event.from_backend),
                  backend_to_string(event.to_backend),
                  error_class_to_string(event.error_class()),
                  static_cast<int>(event.error_code),
                  event.error_message);

        FallbackListener listener;
        {
            std::lock_guard<std::mutex> lock(listener_mutex_);
            listener = listener_;
        }
        if (listener) {
            listener(event);
        }
    }

    backend::BackendSet backends_;
    FallbackListener listener_;
    std::mutex listener_mutex_;
    std::atomic<uint64_t> fallbacks_{0};
};

} // namespace engine
} // namespace duet
