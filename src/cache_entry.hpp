// SPDX-License-Identifier: MIT

// src/cache_entry.hpp
#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <vector>

#include "src/fetch_policy.hpp"
#include "src/query_client.hpp"
#include "src/query_request.hpp"

namespace query_suspense {

class SuspenseCache;

// CacheEntry - shared state for one RequestKey.
//
// State machine (absent means the key is not in the registry):
//   absent -> Pending           first GetOrCreate() with a fetch
//   Pending -> Resolved         handle settles (fulfilled or rejected)
//   Resolved -> Pending         Refetch() replaces the handle, count preserved
//   Pending/Resolved -> absent  consumer count reaches zero in Release()
//
// An entry holds at most one handle; a new fetch replaces it. Entries are
// created and mutated only by SuspenseCache; consumers get read access.
//
// Thread safety: Not thread-safe. Event loop thread only.
class CacheEntry {
public:
    enum class State {
        Pending,
        Resolved
    };

    using ListenerId = uint64_t;
    using Listener = std::function<void()>;

    struct PrivateTag {
    private:
        friend class SuspenseCache;
        PrivateTag() = default;
    };

    // Created by SuspenseCache only.
    CacheEntry(PrivateTag, QueryRequest request)
        : request_(std::move(request)) {}

    CacheEntry(const CacheEntry&) = delete;
    CacheEntry& operator=(const CacheEntry&) = delete;

    const RequestKey& key() const { return request_.key(); }
    const QueryRequest& request() const { return request_; }
    const QueryHandlePtr& handle() const { return handle_; }
    FetchPolicy policy() const { return policy_; }
    uint32_t consumer_count() const { return consumer_count_; }
    bool evicted() const { return evicted_; }
    bool has_store_subscription() const { return store_subscription_.has_value(); }

    State state() const {
        return handle_ && !handle_->IsPending() ? State::Resolved : State::Pending;
    }

    // Listeners run when the handle is replaced (refetch or background
    // store update), so consumers can read the new handle.
    ListenerId AddListener(Listener listener) {
        ListenerId id = ++next_listener_id_;
        listeners_.emplace(id, std::move(listener));
        return id;
    }

    void RemoveListener(ListenerId id) { listeners_.erase(id); }

    std::size_t listener_count() const { return listeners_.size(); }

private:
    friend class SuspenseCache;

    void NotifyListeners() {
        // A listener may unbind any binding on this entry, itself included.
        // Removed ids are skipped; their owners may already be destroyed.
        std::vector<ListenerId> ids;
        ids.reserve(listeners_.size());
        for (const auto& [id, listener] : listeners_) ids.push_back(id);
        for (ListenerId id : ids) {
            auto it = listeners_.find(id);
            if (it == listeners_.end()) continue;
            Listener listener = it->second;  // Survives its own removal
            listener();
        }
    }

    QueryRequest request_;
    QueryHandlePtr handle_;
    FetchPolicy policy_ = FetchPolicy::CacheFirst;
    uint32_t consumer_count_ = 0;
    bool evicted_ = false;
    std::optional<IQueryClient::SubscriptionId> store_subscription_;
    std::map<ListenerId, Listener> listeners_;
    ListenerId next_listener_id_ = 0;
};

}  // namespace query_suspense
