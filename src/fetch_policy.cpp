// SPDX-License-Identifier: MIT

// src/fetch_policy.cpp
#include "src/fetch_policy.hpp"

#include <fmt/format.h>

namespace query_suspense {

std::string_view ToString(FetchPolicy policy) {
    switch (policy) {
        case FetchPolicy::CacheFirst:
            return "cache-first";
        case FetchPolicy::NetworkOnly:
            return "network-only";
        case FetchPolicy::NoCache:
            return "no-cache";
        case FetchPolicy::CacheAndNetwork:
            return "cache-and-network";
        case FetchPolicy::CacheOnly:
            return "cache-only";
        case FetchPolicy::Standby:
            return "standby";
    }
    return "unknown";
}

std::expected<FetchPolicy, Error> ParseFetchPolicy(std::string_view name) {
    for (auto policy : {FetchPolicy::CacheFirst, FetchPolicy::NetworkOnly,
                        FetchPolicy::NoCache, FetchPolicy::CacheAndNetwork,
                        FetchPolicy::CacheOnly, FetchPolicy::Standby}) {
        if (ToString(policy) == name) return policy;
    }
    return std::unexpected(Error{
        ErrorCode::InvalidPolicy,
        fmt::format("Unknown fetch policy `{}`.", name)});
}

std::string_view ToString(FetchDecision decision) {
    switch (decision) {
        case FetchDecision::Reuse:
            return "reuse";
        case FetchDecision::ResolveFromStore:
            return "resolve-from-store";
        case FetchDecision::StartFetch:
            return "start-fetch";
    }
    return "unknown";
}

std::expected<FetchDecision, Error> ResolveFetch(const ResolveInput& input) {
    if (!IsSuspensePolicy(input.policy)) {
        return std::unexpected(Error{
            ErrorCode::InvalidPolicy,
            fmt::format("The fetch policy `{}` is not supported with suspense.",
                        ToString(input.policy))});
    }

    if (input.refetch) return FetchDecision::StartFetch;
    if (!input.key_changed || input.has_handle) return FetchDecision::Reuse;

    switch (input.policy) {
        case FetchPolicy::CacheFirst:
            return input.store_has_result ? FetchDecision::ResolveFromStore
                                          : FetchDecision::StartFetch;
        case FetchPolicy::NetworkOnly:
        case FetchPolicy::NoCache:
        case FetchPolicy::CacheAndNetwork:
            return FetchDecision::StartFetch;
        case FetchPolicy::CacheOnly:
        case FetchPolicy::Standby:
            break;
    }
    return FetchDecision::StartFetch;
}

}  // namespace query_suspense
