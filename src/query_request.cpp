// SPDX-License-Identifier: MIT

// src/query_request.cpp
#include "src/query_request.hpp"

#include <stdexcept>
#include <string>

namespace query_suspense {

QueryResultPtr MakeQueryResult(const rapidjson::Value& data, const rapidjson::Value& variables) {
    auto result = std::make_shared<QueryResult>();
    result->data.CopyFrom(data, result->data.GetAllocator());
    if (variables.IsNull()) {
        result->variables.SetObject();
    } else {
        result->variables.CopyFrom(variables, result->variables.GetAllocator());
    }
    return result;
}

rapidjson::Document ParseJson(std::string_view json) {
    rapidjson::Document doc;
    doc.Parse(json.data(), json.size());
    return doc;
}

QueryRequest QueryRequest::Make(std::shared_ptr<const QueryDocument> query,
                                const rapidjson::Value& variables) {
    auto copy = std::make_shared<rapidjson::Document>();
    if (variables.IsNull()) {
        copy->SetObject();
    } else {
        copy->CopyFrom(variables, copy->GetAllocator());
    }
    RequestKey key = RequestKey::Make(*query, *copy);
    return QueryRequest(std::move(query), std::move(copy), std::move(key));
}

QueryRequest QueryRequest::Make(std::shared_ptr<const QueryDocument> query,
                                std::string_view variables_json) {
    if (variables_json.empty()) {
        rapidjson::Value none;
        return Make(std::move(query), none);
    }
    rapidjson::Document parsed = ParseJson(variables_json);
    if (parsed.HasParseError()) {
        throw std::invalid_argument(
            "Invalid variables JSON: " + std::string(variables_json));
    }
    return Make(std::move(query), parsed);
}

}  // namespace query_suspense
