// SPDX-License-Identifier: MIT

// lib/async/asio_event_loop.hpp
#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <thread>

#include <asio.hpp>

#include "lib/async/event_loop.hpp"

namespace query_suspense {

/// ASIO-based implementation of IEventLoop.
///
/// The loop thread is the thread that constructed the loop until Run(),
/// Poll() or RunOne() is called, which rebinds it to the calling thread.
class AsioEventLoop : public IEventLoop {
public:
    explicit AsioEventLoop(asio::io_context& ctx)
        : ctx_(ctx)
        , thread_id_(std::this_thread::get_id()) {}

    void Defer(Task fn) override {
        asio::post(ctx_, std::move(fn));
    }

    void Schedule(std::chrono::milliseconds delay, Task fn) override {
        auto timer = std::make_shared<asio::steady_timer>(ctx_, delay);
        timer->async_wait([timer, fn = std::move(fn)](std::error_code ec) {
            if (!ec) fn();
        });
    }

    bool IsInEventLoopThread() const override {
        return std::this_thread::get_id() == thread_id_.load();
    }

    // Sets thread_id_ to the calling thread before running the event loop.
    void Run() {
        thread_id_.store(std::this_thread::get_id());
        Restart();
        ctx_.run();
    }
    void Stop() { ctx_.stop(); }

    // Runs every ready handler; returns the number executed.
    std::size_t Poll() {
        thread_id_.store(std::this_thread::get_id());
        Restart();
        return ctx_.poll();
    }
    std::size_t RunOne() {
        thread_id_.store(std::this_thread::get_id());
        Restart();
        return ctx_.run_one();
    }

    asio::io_context& context() { return ctx_; }

private:
    // io_context stops itself once it runs out of work; tests drain the
    // loop repeatedly between bindings.
    void Restart() {
        if (ctx_.stopped()) ctx_.restart();
    }

    asio::io_context& ctx_;
    std::atomic<std::thread::id> thread_id_;
};

}  // namespace query_suspense
