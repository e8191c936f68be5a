// SPDX-License-Identifier: MIT

// src/query_document.hpp
#pragma once

#include <memory>
#include <string>
#include <string_view>

namespace query_suspense {

enum class OperationType {
    Query,
    Mutation,
    Subscription,
};

std::string_view ToString(OperationType type);

// QueryDocument - an already-validated operation document.
//
// Parsing and validation belong to the client; the document only reads the
// leading operation keyword and name so the binding layer can refuse
// non-query operations:
//   "query CharacterQuery($id: ID!) { ... }"  -> Query, "CharacterQuery"
//   "mutation ShouldThrow { ... }"            -> Mutation, "ShouldThrow"
//   "{ greeting }"                            -> Query, ""
//
// id() is the SHA-256 of the document text and is the query identity used
// by RequestKey. Documents are immutable and shared via shared_ptr.
class QueryDocument {
public:
    static std::shared_ptr<const QueryDocument> Create(std::string text);

    const std::string& text() const { return text_; }
    const std::string& id() const { return id_; }
    OperationType operation() const { return operation_; }
    const std::string& operation_name() const { return operation_name_; }

    bool IsQuery() const { return operation_ == OperationType::Query; }

    // Lowercase hex SHA-256 of text.
    static std::string ComputeId(std::string_view text);

private:
    QueryDocument(std::string text, std::string id, OperationType operation,
                  std::string operation_name)
        : text_(std::move(text)),
          id_(std::move(id)),
          operation_(operation),
          operation_name_(std::move(operation_name)) {}

    std::string text_;
    std::string id_;
    OperationType operation_;
    std::string operation_name_;
};

}  // namespace query_suspense
