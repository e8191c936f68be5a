// SPDX-License-Identifier: MIT

// src/query_request.hpp
#pragma once

#include <memory>
#include <string_view>

#include <rapidjson/document.h>

#include "lib/async/awaitable_handle.hpp"
#include "src/query_document.hpp"
#include "src/request_key.hpp"

namespace query_suspense {

// QueryResult - data returned for one request, with the variables it was
// fetched with. Results are shared read-only (shared_ptr<const QueryResult>).
struct QueryResult {
    rapidjson::Document data;
    rapidjson::Document variables;
};

using QueryResultPtr = std::shared_ptr<const QueryResult>;
using QueryHandle = AwaitableHandle<QueryResult>;
using QueryHandlePtr = std::shared_ptr<QueryHandle>;

// Build a result by deep-copying data and variables.
QueryResultPtr MakeQueryResult(const rapidjson::Value& data, const rapidjson::Value& variables);

// Parse JSON text into a document. Invalid text yields a document whose
// HasParseError() is true.
rapidjson::Document ParseJson(std::string_view json);

// QueryRequest - a query document plus its variables and derived key.
//
// Copyable; the document and variables are shared, the key is computed once.
class QueryRequest {
public:
    static QueryRequest Make(std::shared_ptr<const QueryDocument> query,
                             const rapidjson::Value& variables);

    // Variables given as JSON text, e.g. R"({"id": "1"})". Empty text means
    // no variables.
    static QueryRequest Make(std::shared_ptr<const QueryDocument> query,
                             std::string_view variables_json = {});

    const std::shared_ptr<const QueryDocument>& query() const { return query_; }
    const rapidjson::Document& variables() const { return *variables_; }
    const RequestKey& key() const { return key_; }

private:
    QueryRequest(std::shared_ptr<const QueryDocument> query,
                 std::shared_ptr<const rapidjson::Document> variables,
                 RequestKey key)
        : query_(std::move(query)),
          variables_(std::move(variables)),
          key_(std::move(key)) {}

    std::shared_ptr<const QueryDocument> query_;
    std::shared_ptr<const rapidjson::Document> variables_;
    RequestKey key_;
};

}  // namespace query_suspense
