// SPDX-License-Identifier: MIT

// src/request_key.hpp
#pragma once

#include <cstddef>
#include <string>

#include <rapidjson/document.h>

#include "src/query_document.hpp"

namespace query_suspense {

// Render a JSON value so that deep-equal values produce identical text:
// - object members are sorted by name (recursively)
// - doubles with an integral value are written as integers (1.0 -> 1)
// - null at the top level is written as {} (no variables)
std::string CanonicalizeJson(const rapidjson::Value& value);

// RequestKey - canonical identity of (query, variables).
//
// Two requests with the same query document and deep-equal variables map to
// the same key regardless of the identity of the variables object. Keys are
// immutable values; compare with == and hash with RequestKeyHash.
class RequestKey {
public:
    static RequestKey Make(const QueryDocument& query, const rapidjson::Value& variables);

    const std::string& query_id() const { return query_id_; }
    const std::string& variables() const { return variables_; }
    std::size_t hash() const { return hash_; }

    // "<operation name>:<variables>" for diagnostics. Anonymous operations
    // use the first 12 characters of the query id.
    std::string ToString() const;

    friend bool operator==(const RequestKey& a, const RequestKey& b) {
        return a.hash_ == b.hash_ && a.query_id_ == b.query_id_ &&
               a.variables_ == b.variables_;
    }

private:
    RequestKey(std::string query_id, std::string label, std::string variables);

    std::string query_id_;
    std::string label_;
    std::string variables_;
    std::size_t hash_;
};

struct RequestKeyHash {
    std::size_t operator()(const RequestKey& key) const { return key.hash(); }
};

}  // namespace query_suspense
