// SPDX-License-Identifier: MIT

// src/query_document.cpp
#include "src/query_document.hpp"

#include <openssl/sha.h>

#include <cctype>
#include <iomanip>
#include <sstream>

namespace query_suspense {

namespace {

bool IsNameChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

// Skip whitespace, commas and '#' line comments (insignificant in GraphQL).
std::size_t SkipIgnored(std::string_view text, std::size_t pos) {
    while (pos < text.size()) {
        char c = text[pos];
        if (c == '#') {
            auto newline = text.find('\n', pos);
            if (newline == std::string_view::npos) return text.size();
            pos = newline + 1;
        } else if (std::isspace(static_cast<unsigned char>(c)) || c == ',') {
            ++pos;
        } else {
            break;
        }
    }
    return pos;
}

std::string_view ReadName(std::string_view text, std::size_t& pos) {
    std::size_t start = pos;
    while (pos < text.size() && IsNameChar(text[pos])) ++pos;
    return text.substr(start, pos - start);
}

}  // namespace

std::string_view ToString(OperationType type) {
    switch (type) {
        case OperationType::Query:
            return "query";
        case OperationType::Mutation:
            return "mutation";
        case OperationType::Subscription:
            return "subscription";
    }
    return "unknown";
}

std::shared_ptr<const QueryDocument> QueryDocument::Create(std::string text) {
    std::string_view view = text;
    OperationType operation = OperationType::Query;
    std::string operation_name;

    std::size_t pos = SkipIgnored(view, 0);
    std::string_view keyword = ReadName(view, pos);
    if (keyword == "mutation") {
        operation = OperationType::Mutation;
    } else if (keyword == "subscription") {
        operation = OperationType::Subscription;
    }
    if (!keyword.empty()) {
        pos = SkipIgnored(view, pos);
        operation_name = std::string(ReadName(view, pos));
    }

    std::string id = ComputeId(view);
    return std::shared_ptr<const QueryDocument>(new QueryDocument(
        std::move(text), std::move(id), operation, std::move(operation_name)));
}

std::string QueryDocument::ComputeId(std::string_view text) {
    unsigned char digest[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(text.data()), text.size(), digest);

    std::ostringstream oss;
    for (int i = 0; i < SHA256_DIGEST_LENGTH; ++i) {
        oss << std::hex << std::setfill('0') << std::setw(2)
            << static_cast<int>(digest[i]);
    }
    return oss.str();
}

}  // namespace query_suspense
