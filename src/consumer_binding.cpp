// SPDX-License-Identifier: MIT

// src/consumer_binding.cpp
#include "src/consumer_binding.hpp"

#include <stdexcept>
#include <string_view>

#include <fmt/format.h>

namespace query_suspense {

namespace {

std::string_view OperationLabel(OperationType type) {
    switch (type) {
        case OperationType::Query:
            return "Query";
        case OperationType::Mutation:
            return "Mutation";
        case OperationType::Subscription:
            return "Subscription";
    }
    return "Unknown";
}

}  // namespace

ConsumerBinding::~ConsumerBinding() {
    Unbind();
}

void ConsumerBinding::Bind(const QueryRequest& request, FetchPolicy policy) {
    if (IsBound()) {
        throw std::logic_error("ConsumerBinding::Bind called while bound; use Rebind()");
    }
    Validate(request, policy);
    Attach(request, policy);
}

void ConsumerBinding::Bind(const QueryRequest& request) {
    Bind(request, DefaultPolicy());
}

void ConsumerBinding::Rebind(const QueryRequest& request, FetchPolicy policy) {
    Validate(request, policy);
    if (!IsBound()) {
        Attach(request, policy);
        return;
    }

    if (request.key() == request_->key()) {
        // Structurally equal key: keep the entry, nothing is fetched.
        request_ = request;
        policy_ = policy;
        return;
    }

    // Attach to the new key before letting go of the old one, so a failed
    // attach leaves the binding on its previous entry.
    auto old_entry = std::move(entry_);
    auto old_listener = listener_;
    auto old_request = std::move(request_);
    auto old_policy = policy_;
    auto old_handle = std::move(handle_);
    entry_.reset();
    listener_.reset();
    request_.reset();
    try {
        Attach(request, policy);
    } catch (...) {
        entry_ = std::move(old_entry);
        listener_ = old_listener;
        request_ = std::move(old_request);
        policy_ = old_policy;
        handle_ = std::move(old_handle);
        throw;
    }
    Detach(*old_entry, old_listener, old_request->key());
}

void ConsumerBinding::Rebind(const QueryRequest& request) {
    Rebind(request, DefaultPolicy());
}

void ConsumerBinding::Unbind() {
    if (!entry_) return;

    auto entry = std::move(entry_);
    auto listener = listener_;
    RequestKey key = request_->key();
    entry_.reset();
    listener_.reset();
    handle_.reset();
    request_.reset();
    Detach(*entry, listener, key);
}

void ConsumerBinding::Detach(CacheEntry& entry, std::optional<CacheEntry::ListenerId> listener,
                             const RequestKey& key) {
    if (listener) entry.RemoveListener(*listener);
    cache_->Release(key);
}

ReadOutcome ConsumerBinding::ReadOrSuspend() {
    if (!entry_) {
        throw std::logic_error("ConsumerBinding::ReadOrSuspend called while unbound");
    }

    // The entry tracks the latest handle (refetch, background update).
    handle_ = entry_->handle();
    if (handle_->IsPending()) {
        return ReadOutcome::Suspend(handle_);
    }
    if (handle_->IsRejected()) {
        return ReadOutcome::Ready(std::unexpected(handle_->error()));
    }
    return ReadOutcome::Ready(handle_->value());
}

void ConsumerBinding::Refetch() {
    if (!entry_) {
        throw std::logic_error("ConsumerBinding::Refetch called while unbound");
    }

    auto decision = ResolveFetch(ResolveInput{
        .policy = policy_,
        .key_changed = false,
        .has_handle = true,
        .refetch = true,
    });
    if (!decision) throw BindingError(decision.error());

    // Refetches always go to the network; no-cache results stay out of the store.
    FetchPolicy network_policy =
        policy_ == FetchPolicy::NoCache ? FetchPolicy::NoCache : FetchPolicy::NetworkOnly;
    QueryRequest request = *request_;
    cache_->Refetch(request.key(), policy_, [this, &request, network_policy]() {
        return StartFetch(request, network_policy);
    });
    handle_ = entry_->handle();
}

void ConsumerBinding::OnUpdate(UpdateCallback cb) {
    on_update_ = std::move(cb);
}

void ConsumerBinding::Validate(const QueryRequest& request, FetchPolicy policy) const {
    if (!cache_) {
        throw BindingError(Error{
            ErrorCode::MissingContext,
            "Could not find a suspense cache. Construct the consumer with the "
            "SuspenseCache that wraps the query client."});
    }

    const auto& query = request.query();
    if (!query || !query->IsQuery()) {
        OperationType type = query ? query->operation() : OperationType::Query;
        throw BindingError(Error{
            ErrorCode::InvalidOperation,
            fmt::format("Running a Query requires a graphql Query, but a {} was used instead.",
                        OperationLabel(type))});
    }

    // Only the policy matters here; the full decision is made in Attach().
    auto decision = ResolveFetch(ResolveInput{.policy = policy});
    if (!decision) throw BindingError(decision.error());
}

void ConsumerBinding::Attach(const QueryRequest& request, FetchPolicy policy) {
    const RequestKey& key = request.key();
    auto existing = cache_->Lookup(key);

    QueryResultPtr stored;
    if (!existing && policy == FetchPolicy::CacheFirst) {
        stored = cache_->client().ReadStoreSync(request);
    }

    auto decision = ResolveFetch(ResolveInput{
        .policy = policy,
        .key_changed = true,
        .has_handle = existing && existing->handle(),
        .store_has_result = stored != nullptr,
    });
    if (!decision) throw BindingError(decision.error());

    std::shared_ptr<CacheEntry> entry;
    switch (*decision) {
        case FetchDecision::ResolveFromStore:
            entry = cache_->GetOrCreate(request, policy, [&stored]() {
                return QueryHandle::Resolved(stored);
            });
            break;
        case FetchDecision::Reuse:
        case FetchDecision::StartFetch:
            // GetOrCreate() only fetches when the key is still absent.
            entry = cache_->GetOrCreate(request, policy, [this, &request, policy]() {
                return StartFetch(request, policy);
            });
            break;
    }

    cache_->Retain(key);
    entry_ = entry;
    request_ = request;
    policy_ = policy;
    handle_ = entry->handle();
    listener_ = entry->AddListener([this]() {
        if (on_update_) on_update_();
    });
}

QueryHandlePtr ConsumerBinding::StartFetch(const QueryRequest& request, FetchPolicy policy) {
    return cache_->client().StartFetch(request, policy);
}

FetchPolicy ConsumerBinding::DefaultPolicy() const {
    return cache_ ? cache_->config().default_fetch_policy : FetchPolicy::CacheFirst;
}

}  // namespace query_suspense
