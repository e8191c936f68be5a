// SPDX-License-Identifier: MIT

// lib/async/awaitable_handle.hpp
#pragma once

#include <atomic>
#include <cstdint>
#include <cstdio>
#include <exception>
#include <functional>
#include <memory>
#include <optional>
#include <utility>
#include <vector>

#include "lib/async/error.hpp"

namespace query_suspense {

// AwaitableHandle<T> - one in-flight or completed unit of fetch work.
//
// State machine:
//   Pending -> Fulfilled   (Fulfill)
//   Pending -> Rejected    (Reject)
//
// A handle settles exactly once. Later Fulfill()/Reject() calls return false
// and leave the handle untouched, so a handle only ever reports the result of
// the operation that created it.
//
// The fulfilled value is kept as shared_ptr<const T>; value() returns the
// same pointer for the lifetime of the handle.
//
// Thread safety: Not thread-safe. Settle and observe from the event loop thread.
//
// Lifetime: Must be managed via shared_ptr (use the static factories).
template <typename T>
class AwaitableHandle {
public:
    enum class State {
        Pending,
        Fulfilled,
        Rejected
    };

    using Value = std::shared_ptr<const T>;
    using SettleCallback = std::function<void(const AwaitableHandle&)>;
    using WaiterToken = uint64_t;

    struct PrivateTag {};  // Force use of the factories

    explicit AwaitableHandle(PrivateTag) : id_(NextId()) {}

    AwaitableHandle(const AwaitableHandle&) = delete;
    AwaitableHandle& operator=(const AwaitableHandle&) = delete;
    AwaitableHandle(AwaitableHandle&&) = delete;
    AwaitableHandle& operator=(AwaitableHandle&&) = delete;

    static std::shared_ptr<AwaitableHandle> Create() {
        return std::make_shared<AwaitableHandle>(PrivateTag{});
    }

    static std::shared_ptr<AwaitableHandle> Resolved(Value value) {
        auto handle = Create();
        handle->Fulfill(std::move(value));
        return handle;
    }

    static std::shared_ptr<AwaitableHandle> Failed(Error error) {
        auto handle = Create();
        handle->Reject(std::move(error));
        return handle;
    }

    // Settle with a value. Returns false if already settled.
    bool Fulfill(Value value) {
        if (state_ != State::Pending) return false;
        if (!value) {
            std::fprintf(stderr, "AwaitableHandle::Fulfill called with null value\n");
            std::terminate();
        }
        value_ = std::move(value);
        state_ = State::Fulfilled;
        NotifyWaiters();
        return true;
    }

    // Settle with an error. Returns false if already settled.
    bool Reject(Error error) {
        if (state_ != State::Pending) return false;
        error_ = std::move(error);
        state_ = State::Rejected;
        NotifyWaiters();
        return true;
    }

    // Register a callback for settlement. Runs immediately if already settled.
    // Returns a token for CancelWaiter().
    WaiterToken OnSettled(SettleCallback cb) {
        WaiterToken token = ++next_token_;
        if (state_ != State::Pending) {
            cb(*this);
            return token;
        }
        waiters_.push_back({token, std::move(cb)});
        return token;
    }

    // Drop a waiter that has not run yet. Unknown tokens are ignored.
    void CancelWaiter(WaiterToken token) {
        for (auto it = waiters_.begin(); it != waiters_.end(); ++it) {
            if (it->token == token) {
                waiters_.erase(it);
                return;
            }
        }
    }

    State state() const { return state_; }
    bool IsPending() const { return state_ == State::Pending; }
    bool IsFulfilled() const { return state_ == State::Fulfilled; }
    bool IsRejected() const { return state_ == State::Rejected; }

    // Valid only when fulfilled; null otherwise.
    const Value& value() const { return value_; }

    // Valid only when rejected.
    const Error& error() const { return *error_; }

    uint64_t id() const { return id_; }
    std::size_t waiter_count() const { return waiters_.size(); }

private:
    struct Waiter {
        WaiterToken token;
        SettleCallback callback;
    };

    static uint64_t NextId() {
        static std::atomic<uint64_t> counter{0};
        return ++counter;
    }

    void NotifyWaiters() {
        // Waiters may register or cancel other waiters while running.
        auto waiters = std::move(waiters_);
        waiters_.clear();
        for (auto& w : waiters) {
            w.callback(*this);
        }
    }

    uint64_t id_;
    State state_ = State::Pending;
    Value value_;
    std::optional<Error> error_;
    std::vector<Waiter> waiters_;
    WaiterToken next_token_ = 0;
};

}  // namespace query_suspense
