// SPDX-License-Identifier: MIT

// src/suspense_cache.cpp
#include "src/suspense_cache.hpp"

#include <cstdio>
#include <exception>
#include <stdexcept>

#include <fmt/format.h>

namespace query_suspense {

SuspenseCache::SuspenseCache(IEventLoop& loop, IQueryClient& client,
                             SuspenseCacheConfig config)
    : loop_(loop),
      client_(client),
      config_(config),
      self_(std::make_shared<SuspenseCache*>(this)) {}

SuspenseCache::~SuspenseCache() {
    self_.reset();
    for (auto& [key, entry] : entries_) {
        entry->evicted_ = true;
        Unsubscribe(*entry);
    }
}

std::shared_ptr<CacheEntry> SuspenseCache::GetOrCreate(const QueryRequest& request,
                                                       FetchPolicy policy,
                                                       const FetchFn& fetch) {
    RequireLoopThread(__func__);

    const RequestKey& key = request.key();
    if (auto it = entries_.find(key); it != entries_.end()) {
        return it->second;
    }

    // Insert before fetching so a re-entrant request for the same key
    // attaches to this entry instead of starting a second fetch.
    auto entry = std::make_shared<CacheEntry>(CacheEntry::PrivateTag{}, request);
    entries_.emplace(key, entry);
    ++stats_.entries_created;

    QueryHandlePtr handle;
    try {
        handle = fetch();
    } catch (...) {
        entries_.erase(key);
        entry->evicted_ = true;
        throw;
    }
    if (!handle) {
        entries_.erase(key);
        entry->evicted_ = true;
        throw std::logic_error(fmt::format(
            "SuspenseCache::GetOrCreate: fetch for {} returned no handle", key.ToString()));
    }

    if (handle->IsPending()) {
        ++stats_.fetches_started;
    } else {
        ++stats_.store_hits;
    }
    AttachHandle(entry, std::move(handle), policy);
    return entry;
}

void SuspenseCache::Retain(const RequestKey& key) {
    RequireLoopThread(__func__);
    auto& entry = FindOrThrow(key, __func__);
    ++entry->consumer_count_;
}

void SuspenseCache::Release(const RequestKey& key) {
    RequireLoopThread(__func__);
    auto entry = FindOrThrow(key, __func__);
    if (entry->consumer_count_ == 0) {
        throw std::logic_error(fmt::format(
            "SuspenseCache::Release: {} has no consumers", key.ToString()));
    }
    if (--entry->consumer_count_ > 0) return;

    entries_.erase(key);
    entry->evicted_ = true;
    Unsubscribe(*entry);
    // The fetch keeps running; its settlement will find the entry evicted.
    entry->handle_.reset();
    ++stats_.evictions;
}

void SuspenseCache::Refetch(const RequestKey& key, FetchPolicy policy, const FetchFn& fetch) {
    RequireLoopThread(__func__);
    auto entry = FindOrThrow(key, __func__);

    QueryHandlePtr handle = fetch();
    if (!handle) {
        throw std::logic_error(fmt::format(
            "SuspenseCache::Refetch: fetch for {} returned no handle", key.ToString()));
    }
    if (entry->evicted_) return;  // Released from inside fetch()

    Unsubscribe(*entry);
    if (handle->IsPending()) ++stats_.fetches_started;
    ++stats_.handle_replacements;
    AttachHandle(entry, std::move(handle), policy);
    ScheduleNotify(entry);
}

std::shared_ptr<const CacheEntry> SuspenseCache::Lookup(const RequestKey& key) const {
    auto it = entries_.find(key);
    if (it == entries_.end()) return nullptr;
    return it->second;
}

std::shared_ptr<CacheEntry>& SuspenseCache::FindOrThrow(const RequestKey& key, const char* func) {
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        throw std::logic_error(fmt::format(
            "SuspenseCache::{}: no entry for {}", func, key.ToString()));
    }
    return it->second;
}

void SuspenseCache::AttachHandle(const std::shared_ptr<CacheEntry>& entry,
                                 QueryHandlePtr handle, FetchPolicy policy) {
    entry->handle_ = handle;
    entry->policy_ = policy;

    std::weak_ptr<SuspenseCache*> weak_self = self_;
    std::weak_ptr<CacheEntry> weak_entry = entry;
    // Runs immediately for an already-settled handle.
    handle->OnSettled([weak_self, weak_entry](const QueryHandle& settled) {
        auto self = weak_self.lock();
        if (!self) return;
        (*self)->OnHandleSettled(weak_entry, settled);
    });
}

void SuspenseCache::OnHandleSettled(const std::weak_ptr<CacheEntry>& weak_entry,
                                    const QueryHandle& handle) {
    auto entry = weak_entry.lock();
    if (!entry || entry->evicted_ || entry->handle_.get() != &handle) {
        ++stats_.stale_discards;
        return;
    }
    if (entry->policy_ == FetchPolicy::CacheAndNetwork && handle.IsFulfilled()) {
        Subscribe(entry);
    }
}

void SuspenseCache::OnStoreUpdate(const std::weak_ptr<CacheEntry>& weak_entry,
                                  QueryResultPtr result) {
    auto entry = weak_entry.lock();
    if (!entry || entry->evicted_) {
        ++stats_.stale_discards;
        return;
    }
    // A refetch in flight owns the next value; a rejected handle stays rejected.
    if (!result || !entry->handle_ || !entry->handle_->IsFulfilled()) return;
    if (entry->handle_->value()->data == result->data) return;

    entry->handle_ = QueryHandle::Resolved(std::move(result));
    ++stats_.background_updates;
    ScheduleNotify(entry);
}

void SuspenseCache::ScheduleNotify(const std::shared_ptr<CacheEntry>& entry) {
    std::weak_ptr<SuspenseCache*> weak_self = self_;
    std::weak_ptr<CacheEntry> weak_entry = entry;
    std::weak_ptr<QueryHandle> weak_handle = entry->handle_;
    // Deferred so listeners never run inside the client's own callbacks.
    loop_.Defer([weak_self, weak_entry, weak_handle]() {
        if (weak_self.expired()) return;
        auto entry = weak_entry.lock();
        auto handle = weak_handle.lock();
        if (!entry || !handle || entry->evicted_ || entry->handle_ != handle) return;
        entry->NotifyListeners();
    });
}

void SuspenseCache::Subscribe(const std::shared_ptr<CacheEntry>& entry) {
    if (entry->store_subscription_) return;

    std::weak_ptr<SuspenseCache*> weak_self = self_;
    std::weak_ptr<CacheEntry> weak_entry = entry;
    entry->store_subscription_ = client_.SubscribeStore(
        entry->request_,
        [weak_self, weak_entry](QueryResultPtr result) {
            auto self = weak_self.lock();
            if (!self) return;
            (*self)->OnStoreUpdate(weak_entry, std::move(result));
        });
}

void SuspenseCache::Unsubscribe(CacheEntry& entry) {
    if (!entry.store_subscription_) return;
    auto id = *entry.store_subscription_;
    entry.store_subscription_.reset();
    client_.Unsubscribe(id);
}

void SuspenseCache::RequireLoopThread(const char* func) const {
    if (!config_.enforce_loop_thread || loop_.IsInEventLoopThread()) return;
    std::fprintf(stderr, "SuspenseCache::%s called off event loop thread\n", func);
    std::terminate();
}

}  // namespace query_suspense
