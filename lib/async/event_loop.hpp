// SPDX-License-Identifier: MIT

// lib/async/event_loop.hpp
#pragma once

#include <chrono>
#include <functional>

namespace query_suspense {

/// Event loop interface for the single logical execution context.
///
/// Implement this to integrate query-suspense with an existing scheduler
/// (asio, libuv, a UI frame loop, etc.). AsioEventLoop provides an
/// implementation over asio::io_context.
///
/// Every registry mutation, policy decision and handle transition happens on
/// the loop thread. Callbacks passed to Defer() and Schedule() are invoked on
/// the loop thread.
class IEventLoop {
public:
    using Task = std::function<void()>;

    virtual ~IEventLoop() = default;

    /// Schedule a callback for the next event loop iteration.
    virtual void Defer(Task fn) = 0;

    /// Schedule a callback after a delay.
    /// @param delay  Minimum time before callback fires
    /// @param fn     Callback to invoke
    virtual void Schedule(std::chrono::milliseconds delay, Task fn) = 0;

    /// Return true if the caller is on the event loop thread.
    virtual bool IsInEventLoopThread() const = 0;
};

}  // namespace query_suspense
