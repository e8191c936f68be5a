// SPDX-License-Identifier: MIT

// src/suspense_cache.hpp
#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <unordered_map>

#include "lib/async/event_loop.hpp"
#include "src/cache_entry.hpp"
#include "src/fetch_policy.hpp"
#include "src/query_client.hpp"
#include "src/request_key.hpp"

namespace query_suspense {

/// Configuration for a SuspenseCache.
struct SuspenseCacheConfig {
    FetchPolicy default_fetch_policy = FetchPolicy::CacheFirst;  ///< Used by Bind() without a policy
    bool enforce_loop_thread = true;                             ///< Terminate on off-loop access

    /// Preset matching the client's default watch options.
    static SuspenseCacheConfig Defaults() {
        return SuspenseCacheConfig{
            .default_fetch_policy = FetchPolicy::CacheFirst,
            .enforce_loop_thread = true,
        };
    }
};

/// Counters for registry activity.
struct SuspenseCacheStats {
    uint64_t entries_created = 0;      ///< Entries inserted into the registry
    uint64_t evictions = 0;            ///< Entries removed when their last consumer released
    uint64_t fetches_started = 0;      ///< Fetch functions that returned a pending handle
    uint64_t store_hits = 0;           ///< Entries created from an already-settled handle
    uint64_t handle_replacements = 0;  ///< Handles replaced by a refetch
    uint64_t stale_discards = 0;       ///< Settlements/updates for evicted entries or replaced handles
    uint64_t background_updates = 0;   ///< Store updates applied without suspending
};

// SuspenseCache - registry mapping RequestKey -> CacheEntry.
//
// Guarantees at most one outstanding fetch per key: GetOrCreate() only calls
// its fetch function when the key is absent, and every consumer of the key
// shares the entry's handle. Entries live while their consumer count is at
// least one; Release() of the last consumer removes the entry.
//
// Releasing an entry does not cancel its fetch. A handle that settles after
// its entry was evicted, or after a refetch replaced it, is discarded
// silently (counted in stats().stale_discards).
//
// Thread safety: Not thread-safe. All methods must be called from the event
// loop thread (enforced when config.enforce_loop_thread is set).
//
// Lifetime: Must outlive every ConsumerBinding that refers to it. Handles may
// outlive the cache; their settlement is then ignored.
class SuspenseCache {
public:
    using FetchFn = std::function<QueryHandlePtr()>;

    SuspenseCache(IEventLoop& loop, IQueryClient& client,
                  SuspenseCacheConfig config = SuspenseCacheConfig::Defaults());
    ~SuspenseCache();

    SuspenseCache(const SuspenseCache&) = delete;
    SuspenseCache& operator=(const SuspenseCache&) = delete;
    SuspenseCache(SuspenseCache&&) = delete;
    SuspenseCache& operator=(SuspenseCache&&) = delete;

    // Return the entry for request.key(), creating it if absent. On creation
    // fetch() is called exactly once and its handle stored with policy; the
    // new entry has a consumer count of zero until Retain(). An existing entry
    // is returned untouched and fetch() is not called.
    std::shared_ptr<CacheEntry> GetOrCreate(const QueryRequest& request,
                                            FetchPolicy policy,
                                            const FetchFn& fetch);

    // Increment the consumer count. Throws std::logic_error if absent.
    void Retain(const RequestKey& key);

    // Decrement the consumer count; at zero the entry is removed and its
    // store subscription cancelled. Throws std::logic_error if absent.
    void Release(const RequestKey& key);

    // Replace the entry's handle with a new fetch. The consumer count is
    // preserved and listeners are notified. Throws std::logic_error if absent.
    void Refetch(const RequestKey& key, FetchPolicy policy, const FetchFn& fetch);

    // Read-only probe; does not change the consumer count.
    std::shared_ptr<const CacheEntry> Lookup(const RequestKey& key) const;

    std::size_t Size() const { return entries_.size(); }
    bool Empty() const { return entries_.empty(); }

    IQueryClient& client() { return client_; }
    const SuspenseCacheConfig& config() const { return config_; }
    const SuspenseCacheStats& stats() const { return stats_; }

private:
    std::shared_ptr<CacheEntry>& FindOrThrow(const RequestKey& key, const char* func);

    // Install handle as the entry's current handle and watch its settlement.
    void AttachHandle(const std::shared_ptr<CacheEntry>& entry, QueryHandlePtr handle,
                      FetchPolicy policy);

    // Notify the entry's listeners on the next loop iteration, unless the
    // entry is evicted or its handle replaced again by then.
    void ScheduleNotify(const std::shared_ptr<CacheEntry>& entry);

    void OnHandleSettled(const std::weak_ptr<CacheEntry>& weak_entry,
                         const QueryHandle& handle);
    void OnStoreUpdate(const std::weak_ptr<CacheEntry>& weak_entry, QueryResultPtr result);

    void Subscribe(const std::shared_ptr<CacheEntry>& entry);
    void Unsubscribe(CacheEntry& entry);

    // Fail-fast thread check - works in release builds
    void RequireLoopThread(const char* func) const;

    IEventLoop& loop_;
    IQueryClient& client_;
    SuspenseCacheConfig config_;
    SuspenseCacheStats stats_;
    std::unordered_map<RequestKey, std::shared_ptr<CacheEntry>, RequestKeyHash> entries_;

    // Settle callbacks and store callbacks check this before touching the
    // cache; reset in the destructor.
    std::shared_ptr<SuspenseCache*> self_;
};

}  // namespace query_suspense
