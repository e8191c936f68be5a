// SPDX-License-Identifier: MIT

// src/asio_suspense.hpp
#pragma once

#include <expected>
#include <memory>

#include <asio.hpp>

#include "lib/async/error.hpp"
#include "src/consumer_binding.hpp"

namespace query_suspense {

// Await the settlement of handle. Resumes on the coroutine's executor,
// never inside the code that settled the handle.
inline asio::awaitable<void> AsyncWaitSettled(QueryHandlePtr handle) {
    auto executor = co_await asio::this_coro::executor;
    co_await asio::async_initiate<decltype(asio::use_awaitable), void()>(
        [handle, executor](auto handler) {
            // The settle callback must be copyable; the handler is move-only.
            auto handler_ptr = std::make_shared<decltype(handler)>(std::move(handler));
            handle->OnSettled([handler_ptr, executor](const QueryHandle&) {
                asio::post(executor, [handler_ptr]() mutable {
                    std::move(*handler_ptr)();
                });
            });
        },
        asio::use_awaitable);
}

// Read the binding's data, suspending the coroutine while the entry is
// pending. Re-reads after every wake-up, so a refetch that replaced the
// handle in the meantime is waited on as well.
//
// The binding must stay bound until the read completes; ReadOrSuspend()
// throws std::logic_error otherwise.
inline asio::awaitable<std::expected<QueryResultPtr, Error>> AsyncRead(ConsumerBinding& binding) {
    for (;;) {
        ReadOutcome outcome = binding.ReadOrSuspend();
        if (!outcome.IsSuspended()) {
            co_return outcome.result();
        }
        co_await AsyncWaitSettled(outcome.suspended_on());
    }
}

}  // namespace query_suspense
