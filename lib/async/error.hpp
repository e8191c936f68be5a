// SPDX-License-Identifier: MIT

// lib/async/error.hpp
#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace query_suspense {

/// Error codes for binding, fetch and state failures.
enum class ErrorCode {
    // Binding (raised synchronously, before any suspension)
    InvalidPolicy,       ///< Fetch policy cannot produce a settling fetch
    MissingContext,      ///< No suspense cache available to the consumer
    InvalidOperation,    ///< Document is not a query (mutation, subscription)

    // Fetch (delivered through a rejected handle)
    NetworkError,        ///< Transport failed or no response was available
    GraphQLError,        ///< Server answered with errors instead of data
    FetchCancelled,      ///< Client abandoned the operation before it settled

    // State
    InvalidState,        ///< Method called in wrong binding or entry state
};

/// Error payload carried by rejected handles and expected-style returns.
struct Error {
    ErrorCode code;        ///< Classified error code
    std::string message;   ///< Human-readable description
};

/// Return a short category string for an error code (e.g. "binding", "fetch").
constexpr std::string_view error_category(ErrorCode code) {
    switch (code) {
        case ErrorCode::InvalidPolicy:
        case ErrorCode::MissingContext:
        case ErrorCode::InvalidOperation:
            return "binding";
        case ErrorCode::NetworkError:
        case ErrorCode::GraphQLError:
        case ErrorCode::FetchCancelled:
            return "fetch";
        case ErrorCode::InvalidState:
            return "state";
    }
    return "unknown";
}

/// Exception thrown when a consumer cannot be bound.
///
/// Binding errors are programmer errors: they are thrown from Bind()/Rebind()
/// before the registry is touched, never deferred into a suspended state.
class BindingError : public std::invalid_argument {
public:
    explicit BindingError(Error error)
        : std::invalid_argument(error.message), error_(std::move(error)) {}

    ErrorCode code() const { return error_.code; }
    const Error& error() const { return error_; }

private:
    Error error_;
};

}  // namespace query_suspense
