// SPDX-License-Identifier: MIT

// src/fetch_policy.hpp
#pragma once

#include <expected>
#include <string_view>

#include "lib/async/error.hpp"

namespace query_suspense {

enum class FetchPolicy {
    CacheFirst,       // "cache-first"
    NetworkOnly,      // "network-only"
    NoCache,          // "no-cache"
    CacheAndNetwork,  // "cache-and-network"
    CacheOnly,        // "cache-only" - never fetches, rejected
    Standby,          // "standby" - never fetches, rejected
};

std::string_view ToString(FetchPolicy policy);

// Parse a dashed policy name ("cache-first", "network-only", ...).
std::expected<FetchPolicy, Error> ParseFetchPolicy(std::string_view name);

// Return false for policies that never produce a settling fetch.
constexpr bool IsSuspensePolicy(FetchPolicy policy) {
    switch (policy) {
        case FetchPolicy::CacheFirst:
        case FetchPolicy::NetworkOnly:
        case FetchPolicy::NoCache:
        case FetchPolicy::CacheAndNetwork:
            return true;
        case FetchPolicy::CacheOnly:
        case FetchPolicy::Standby:
            return false;
    }
    return false;
}

enum class FetchDecision {
    Reuse,             // Keep the entry's current handle, no fetch
    ResolveFromStore,  // New already-fulfilled handle from the store, no suspension
    StartFetch,        // New fetch, consumer suspends
};

std::string_view ToString(FetchDecision decision);

struct ResolveInput {
    FetchPolicy policy = FetchPolicy::CacheFirst;
    bool key_changed = true;        // First bind, or key differs from the last resolution
    bool has_handle = false;        // Registry already holds an entry with a handle for the key
    bool store_has_result = false;  // Store can satisfy the request synchronously
    bool refetch = false;           // Explicit refetch of the bound key
};

// Decide how a consumer obtains its handle. Pure; no side effects.
//
//   policy             | unchanged key | changed key, entry | changed key, no entry
//   -------------------+---------------+--------------------+-----------------------
//   cache-first        | Reuse         | Reuse              | ResolveFromStore if the
//                      |               |                    | store has it, else StartFetch
//   network-only       | Reuse         | Reuse              | StartFetch
//   no-cache           | Reuse         | Reuse              | StartFetch
//   cache-and-network  | Reuse         | Reuse              | StartFetch
//
// "changed key, entry" means another consumer already holds the key: its
// handle is shared so a key never has two fetches in flight. refetch always
// yields StartFetch. cache-only and standby yield InvalidPolicy.
std::expected<FetchDecision, Error> ResolveFetch(const ResolveInput& input);

}  // namespace query_suspense
