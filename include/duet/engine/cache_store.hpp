#pragma once

#include "../config.hpp"
#include "../log.hpp"
#include "../types.hpp"

#include <chrono>
#include <functional>
#include <list>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace duet {
namespace engine {

/**
 * @brief Snapshot of cache counters.
 */
struct CacheStats {
    uint64_t hits = 0;
    uint64_t misses = 0;
    uint64_t stale_hits = 0;
    uint64_t sets = 0;
    uint64_t evictions = 0;
    uint64_t refreshes = 0;
    size_t size = 0;
    size_t max_size = 0;

    /// hits / (hits + misses), 0 when nothing was looked up.
    double hit_rate() const {
        const uint64_t lookups = hits + misses;
        return lookups == 0 ? 0.0 : static_cast<double>(hits) / static_cast<double>(lookups);
    }

    /// stale_hits / (hits + stale_hits), 0 when nothing was served.
    double stale_hit_rate() const {
        const uint64_t served = hits + stale_hits;
        return served == 0 ? 0.0 : static_cast<double>(stale_hits) / static_cast<double>(served);
    }

    nlohmann::json to_json() const {
        return nlohmann::json{
            {"hits", hits},
            {"misses", misses},
            {"staleHits", stale_hits},
            {"sets", sets},
            {"evictions", evictions},
            {"refreshes", refreshes},
            {"size", size},
            {"maxSize", max_size},
            {"hitRate", hit_rate()},
            {"staleHitRate", stale_hit_rate()}
        };
    }
};

/**
 * @brief Bounded LRU map with per-entry TTL and stale-while-revalidate reads.
 *
 * An entry is fresh while `now - inserted_at < ttl`. Stale entries are still
 * returned (and counted as stale hits) until evicted, replaced or removed;
 * the first reader that observes staleness is handed the refresh claim so
 * exactly one background refresh is scheduled per stale entry.
 *
 * Reads move the entry to the most-recently-used position; they do not
 * extend its freshness window.
 *
 * Every set() stamps the entry with a new generation. A refresh that was
 * claimed at generation G only stores its value while the entry still
 * carries G, so a remove, prefix invalidation or clear that lands while the
 * refresh is fetching is never undone by it.
 *
 * @tparam Value Cached payload (copied in and out)
 *
 * @threadsafety All operations are guarded by a single mutex.
 */
template<typename Value>
class CacheStore {
public:
    using TimePoint = std::chrono::steady_clock::time_point;
    using Clock = std::function<TimePoint()>;

    struct Lookup {
        std::optional<Value> value;
        bool stale = false;
        bool refresh_claimed = false;   ///< Caller owns the single refresh for this stale entry
        uint64_t generation = 0;        ///< Pass to refresh() to make the write conditional

        bool found() const { return value.has_value(); }
    };

    explicit CacheStore(CacheConfig config, Clock clock = nullptr)
        : config_(std::move(config))
        , clock_(clock ? std::move(clock) : Clock([] { return std::chrono::steady_clock::now(); }))
    {}

    CacheStore(const CacheStore&) = delete;
    CacheStore& operator=(const CacheStore&) = delete;

    bool enabled() const { return config_.enabled; }

    const CacheConfig& config() const { return config_; }

    /// Never fails; a miss is a normal outcome. Disabled caches always miss.
    Lookup get(const std::string& key) {
        Lookup result;
        if (!config_.enabled) {
            return result;
        }

        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(key);
        if (it == entries_.end()) {
            ++stats_.misses;
            debug_log("miss", key);
            return result;
        }

        Entry& entry = it->second;
        lru_.splice(lru_.begin(), lru_, entry.lru_pos);

        result.value = entry.value;
        result.generation = entry.generation;
        result.stale = clock_() - entry.inserted_at >= entry.ttl;
        if (result.stale) {
            ++stats_.stale_hits;
            if (!entry.refreshing) {
                entry.refreshing = true;
                result.refresh_claimed = true;
            }
            debug_log("stale", key);
        } else {
            ++stats_.hits;
            debug_log("hit", key);
        }
        return result;
    }

    /// Insert or replace; `ttl` defaults to the configured default TTL.
    void set(const std::string& key, Value value, std::optional<std::chrono::milliseconds> ttl = std::nullopt) {
        if (!config_.enabled) {
            return;
        }

        std::lock_guard<std::mutex> lock(mutex_);
        store_locked(key, std::move(value), ttl.value_or(config_.default_ttl));
    }

    bool remove(const std::string& key) {
        std::lock_guard<std::mutex> lock(mutex_);
        return erase(key);
    }

    /// Remove every key starting with `prefix`; returns how many were removed.
    size_t remove_prefix(const std::string& prefix) {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<std::string> doomed;
        for (const auto& [key, entry] : entries_) {
            if (key.compare(0, prefix.size(), prefix) == 0) {
                doomed.push_back(key);
            }
        }
        for (const auto& key : doomed) {
            erase(key);
        }
        if (config_.debug && !doomed.empty()) {
            DUET_DEBUG("Cache invalidated {} key(s) with prefix '{}'", doomed.size(), prefix);
        }
        return doomed.size();
    }

    /// Drop every entry and reset the statistics.
    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        entries_.clear();
        lru_.clear();
        stats_ = CacheStats{};
        if (config_.debug) {
            DUET_DEBUG("Cache cleared");
        }
    }

    /**
     * @brief Re-fetch and store a value, counting a refresh on success.
     *
     * A failed fetch leaves the current entry in place and releases any
     * refresh claim so a later reader can try again.
     *
     * With `generation` (from the Lookup that claimed the refresh) the value
     * is stored only if the entry still exists at that generation; otherwise
     * it is discarded and the fetched value is still returned.
     */
    Expected<Value> refresh(
        const std::string& key,
        const std::function<Expected<Value>()>& fetcher,
        std::optional<std::chrono::milliseconds> ttl = std::nullopt,
        std::optional<uint64_t> generation = std::nullopt
    ) {
        auto fresh = fetcher();
        if (!fresh) {
            release_refresh(key);
            DUET_WARN("Cache refresh failed for '{}': {}", key, fresh.error().to_string());
            return fresh;
        }
        if (!config_.enabled) {
            return fresh;
        }

        std::lock_guard<std::mutex> lock(mutex_);
        if (generation) {
            auto it = entries_.find(key);
            if (it == entries_.end() || it->second.generation != *generation) {
                debug_log("refresh discarded", key);
                return fresh;
            }
        }
        store_locked(key, *fresh, ttl.value_or(config_.default_ttl));
        ++stats_.refreshes;
        return fresh;
    }

    /// Remove `key` only if it still carries `generation`.
    bool remove_if_generation(const std::string& key, uint64_t generation) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(key);
        if (it == entries_.end() || it->second.generation != generation) {
            return false;
        }
        return erase(key);
    }

    /// Give up a refresh claim without replacing the entry.
    void release_refresh(const std::string& key) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(key);
        if (it != entries_.end()) {
            it->second.refreshing = false;
        }
    }

    CacheStats stats() const {
        std::lock_guard<std::mutex> lock(mutex_);
        CacheStats snapshot = stats_;
        snapshot.size = entries_.size();
        snapshot.max_size = config_.max_entries;
        return snapshot;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_.size();
    }

private:
    struct Entry {
        Value value;
        TimePoint inserted_at;
        std::chrono::milliseconds ttl;
        typename std::list<std::string>::iterator lru_pos;
        bool refreshing;
        uint64_t generation;
    };

    void store_locked(const std::string& key, Value value, std::chrono::milliseconds entry_ttl) {
        const auto now = clock_();
        const uint64_t generation = ++next_generation_;

        auto it = entries_.find(key);
        if (it != entries_.end()) {
            Entry& entry = it->second;
            entry.value = std::move(value);
            entry.inserted_at = now;
            entry.ttl = entry_ttl;
            entry.refreshing = false;
            entry.generation = generation;
            lru_.splice(lru_.begin(), lru_, entry.lru_pos);
        } else {
            lru_.push_front(key);
            entries_.emplace(key, Entry{std::move(value), now, entry_ttl, lru_.begin(), false, generation});
            evict_overflow();
        }
        ++stats_.sets;
        if (config_.debug) {
            DUET_DEBUG("Cache SET: {} (TTL: {}ms)", key, entry_ttl.count());
        }
    }

    bool erase(const std::string& key) {
        auto it = entries_.find(key);
        if (it == entries_.end()) {
            return false;
        }
        lru_.erase(it->second.lru_pos);
        entries_.erase(it);
        return true;
    }

    void evict_overflow() {
        while (entries_.size() > config_.max_entries && !lru_.empty()) {
            const std::string victim = lru_.back();
            lru_.pop_back();
            entries_.erase(victim);
            ++stats_.evictions;
            if (config_.debug) {
                DUET_DEBUG("Cache EVICT: {}", victim);
            }
        }
    }

    void debug_log(const char* outcome, const std::string& key) const {
        if (config_.debug) {
            DUET_DEBUG("Cache {}: {}", outcome, key);
        }
    }

    CacheConfig config_;
    Clock clock_;
    std::unordered_map<std::string, Entry> entries_;
    std::list<std::string> lru_;   ///< Front = most recently used
    CacheStats stats_;
    uint64_t next_generation_ = 0;   ///< Never reset, so clear() cannot recycle a generation
    mutable std::mutex mutex_;
};

} // namespace engine
} // namespace duet
