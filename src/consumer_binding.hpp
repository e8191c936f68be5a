// SPDX-License-Identifier: MIT

// src/consumer_binding.hpp
#pragma once

#include <expected>
#include <functional>
#include <memory>
#include <optional>

#include "lib/async/error.hpp"
#include "src/cache_entry.hpp"
#include "src/fetch_policy.hpp"
#include "src/query_request.hpp"
#include "src/suspense_cache.hpp"

namespace query_suspense {

// ReadOutcome - result of ConsumerBinding::ReadOrSuspend().
//
// Either suspended (the consumer must wait for suspended_on() to settle and
// read again) or ready with the handle's value or error.
class ReadOutcome {
public:
    static ReadOutcome Suspend(QueryHandlePtr handle) {
        return ReadOutcome(std::move(handle), QueryResultPtr{});
    }

    static ReadOutcome Ready(std::expected<QueryResultPtr, Error> result) {
        return ReadOutcome(nullptr, std::move(result));
    }

    bool IsSuspended() const { return suspended_on_ != nullptr; }
    const QueryHandlePtr& suspended_on() const { return suspended_on_; }

    // Meaningful only when not suspended.
    const std::expected<QueryResultPtr, Error>& result() const { return result_; }

private:
    ReadOutcome(QueryHandlePtr suspended_on, std::expected<QueryResultPtr, Error> result)
        : suspended_on_(std::move(suspended_on)), result_(std::move(result)) {}

    QueryHandlePtr suspended_on_;
    std::expected<QueryResultPtr, Error> result_;
};

// ConsumerBinding - one logical subscriber's attachment to a CacheEntry.
//
// Lifecycle:
//   Unbound --Bind()--> Bound --Rebind(new key)--> Bound (old key released)
//      ^                  |
//      +----Unbind()------+   (also on destruction)
//
// Bind()/Rebind() validate before touching the registry and throw
// BindingError for a missing cache, a non-query document or a fetch policy
// that cannot suspend. Nothing is retained when they throw.
//
// ReadOrSuspend() is the suspension point. Repeated reads of a fulfilled
// handle with no intervening Rebind() return the identical result pointer.
//
// Thread safety: Not thread-safe. Event loop thread only.
class ConsumerBinding {
public:
    using UpdateCallback = std::function<void()>;

    // cache may be null; Bind() then throws MissingContext.
    explicit ConsumerBinding(SuspenseCache* cache) : cache_(cache) {}
    ~ConsumerBinding();

    ConsumerBinding(const ConsumerBinding&) = delete;
    ConsumerBinding& operator=(const ConsumerBinding&) = delete;
    ConsumerBinding(ConsumerBinding&&) = delete;
    ConsumerBinding& operator=(ConsumerBinding&&) = delete;

    // Start watching request. Throws std::logic_error if already bound.
    void Bind(const QueryRequest& request, FetchPolicy policy);
    // Bind with the cache's configured default fetch policy.
    void Bind(const QueryRequest& request);

    // Re-evaluate with new inputs. A structurally equal key keeps the entry
    // and never fetches; a different key binds the new one, then releases the
    // old one. If binding the new key throws, the binding stays on its old
    // entry. Binds if currently unbound.
    void Rebind(const QueryRequest& request, FetchPolicy policy);
    void Rebind(const QueryRequest& request);

    // Stop watching. Releases the entry exactly once; later calls are no-ops.
    void Unbind();

    // Pending -> suspended; fulfilled -> value; rejected -> error.
    // Throws std::logic_error when unbound.
    ReadOutcome ReadOrSuspend();

    // Fetch the bound key again from the network. Every consumer of the
    // entry re-suspends until the new fetch settles.
    // Throws std::logic_error when unbound.
    void Refetch();

    // Called when the entry's handle is replaced (refetch or background
    // store update). Survives Rebind().
    void OnUpdate(UpdateCallback cb);

    bool IsBound() const { return entry_ != nullptr; }
    const std::optional<QueryRequest>& request() const { return request_; }
    const RequestKey* key() const { return request_ ? &request_->key() : nullptr; }
    FetchPolicy policy() const { return policy_; }
    const QueryHandlePtr& handle() const { return handle_; }

private:
    // Throws BindingError; touches nothing.
    void Validate(const QueryRequest& request, FetchPolicy policy) const;

    // Resolve and attach to request.key(). Caller has validated.
    void Attach(const QueryRequest& request, FetchPolicy policy);

    // Remove listener from entry and release key.
    void Detach(CacheEntry& entry, std::optional<CacheEntry::ListenerId> listener,
                const RequestKey& key);

    QueryHandlePtr StartFetch(const QueryRequest& request, FetchPolicy policy);
    FetchPolicy DefaultPolicy() const;

    SuspenseCache* cache_;
    std::shared_ptr<CacheEntry> entry_;
    std::optional<QueryRequest> request_;
    FetchPolicy policy_ = FetchPolicy::CacheFirst;
    QueryHandlePtr handle_;
    std::optional<CacheEntry::ListenerId> listener_;
    UpdateCallback on_update_;
};

}  // namespace query_suspense
