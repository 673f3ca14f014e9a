#pragma once

#include "../log.hpp"
#include "../types.hpp"

#include <algorithm>
#include <future>
#include <string>
#include <type_traits>
#include <vector>

namespace duet {
namespace engine {

/**
 * @brief Splits N-item mutations into bounded chunks.
 *
 * Chunks run one after another; the items of one chunk run concurrently.
 * Results keep the input order regardless of completion order. Once the
 * context is cancelled or expired, the items of the remaining chunks are not
 * started and report the context error in their slots.
 *
 * @threadsafety The per-item callable must be safe to invoke concurrently.
 */
class BatchExecutor {
public:
    explicit BatchExecutor(size_t chunk_size = 10)
        : chunk_size_(std::max<size_t>(1, chunk_size))
    {}

    size_t chunk_size() const { return chunk_size_; }

    /// Number of chunks needed for `items` items.
    size_t chunk_count(size_t items) const {
        return (items + chunk_size_ - 1) / chunk_size_;
    }

    /**
     * @brief Per-item execution with isolated failures.
     *
     * @param items Inputs; results[i] corresponds to items[i]
     * @param fn Callable `Expected<R>(const Item&)`
     */
    template<typename Item, typename Fn>
    auto run(const std::vector<Item>& items, Fn fn, const CallContext& ctx) const
        -> std::vector<std::invoke_result_t<Fn&, const Item&>> {
        using Result = std::invoke_result_t<Fn&, const Item&>;

        std::vector<Result> results;
        results.reserve(items.size());

        for (size_t start = 0; start < items.size(); start += chunk_size_) {
            const size_t end = std::min(items.size(), start + chunk_size_);

            if (auto ok = ctx.check(); !ok) {
                for (size_t i = start; i < items.size(); ++i) {
                    results.push_back(Result(tl::unexpected(ok.error())));
                }
                break;
            }

            std::vector<std::future<Result>> pending;
            pending.reserve(end - start);
            for (size_t i = start; i < end; ++i) {
                const Item& item = items[i];
                pending.push_back(std::async(std::launch::async, [&fn, &item]() { return fn(item); }));
            }
            for (auto& future : pending) {
                results.push_back(future.get());
            }
        }
        return results;
    }

    /**
     * @brief Chunk-level execution collapsed to a single outcome.
     *
     * @param items Inputs split into chunks
     * @param chunk_fn Callable `Expected<X>(const std::vector<Item>&)` run once per chunk
     * @return true only when every chunk succeeded. The first failing chunk
     *         is logged and stops the batch; earlier chunks stay applied.
     */
    template<typename Item, typename Fn>
    bool run_chunks(const std::vector<Item>& items, Fn chunk_fn, const CallContext& ctx) const {
        for (size_t start = 0; start < items.size(); start += chunk_size_) {
            if (auto ok = ctx.check(); !ok) {
                DUET_WARN("Batch stopped before chunk {}: {}", start / chunk_size_ + 1, ok.error().to_string());
                return false;
            }
            const size_t end = std::min(items.size(), start + chunk_size_);
            std::vector<Item> chunk(items.begin() + static_cast<std::ptrdiff_t>(start),
                                    items.begin() + static_cast<std::ptrdiff_t>(end));
            auto result = chunk_fn(chunk);
            if (!result) {
                DUET_ERROR("Batch chunk {} failed: {}", start / chunk_size_ + 1, result.error().to_string());
                return false;
            }
        }
        return true;
    }

private:
    size_t chunk_size_;
};

} // namespace engine
} // namespace duet
