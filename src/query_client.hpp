// SPDX-License-Identifier: MIT

// src/query_client.hpp
#pragma once

#include <cstdint>
#include <functional>

#include "src/fetch_policy.hpp"
#include "src/query_request.hpp"

namespace query_suspense {

// IQueryClient - the data-fetching client the suspense cache delegates to.
//
// The client issues network operations, normalizes results into its store and
// settles the handles it returns. The suspense cache never talks to the
// network itself.
//
// All methods are called from the event loop thread. Handles may be settled
// synchronously or later from the loop; callbacks passed to SubscribeStore()
// must also run on the loop thread.
class IQueryClient {
public:
    using SubscriptionId = uint64_t;
    using StoreCallback = std::function<void(QueryResultPtr)>;

    virtual ~IQueryClient() = default;

    // Issue one operation for the request. With FetchPolicy::NoCache the
    // result must not be written to the shared store.
    virtual QueryHandlePtr StartFetch(const QueryRequest& request, FetchPolicy policy) = 0;

    // Synchronous store read. Returns nullptr when the store cannot satisfy
    // the request.
    virtual QueryResultPtr ReadStoreSync(const QueryRequest& request) = 0;

    // Watch the store for changes to the request's data. on_update receives
    // the new result each time the store changes.
    virtual SubscriptionId SubscribeStore(const QueryRequest& request, StoreCallback on_update) = 0;

    // Stop a subscription. Unknown ids are ignored.
    virtual void Unsubscribe(SubscriptionId id) = 0;
};

}  // namespace query_suspense
