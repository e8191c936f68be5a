// SPDX-License-Identifier: MIT

// src/request_key.cpp
#include "src/request_key.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <functional>
#include <limits>
#include <string_view>
#include <vector>

#include <fmt/format.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

namespace query_suspense {

namespace {

using Writer = rapidjson::Writer<rapidjson::StringBuffer>;

void WriteCanonical(const rapidjson::Value& value, Writer& writer) {
    switch (value.GetType()) {
        case rapidjson::kNullType:
            writer.Null();
            break;
        case rapidjson::kFalseType:
            writer.Bool(false);
            break;
        case rapidjson::kTrueType:
            writer.Bool(true);
            break;
        case rapidjson::kStringType:
            writer.String(value.GetString(), value.GetStringLength());
            break;
        case rapidjson::kNumberType:
            if (value.IsInt64()) {
                writer.Int64(value.GetInt64());
            } else if (value.IsUint64()) {
                writer.Uint64(value.GetUint64());
            } else {
                double d = value.GetDouble();
                // 1 and 1.0 are the same variable value
                if (std::isfinite(d) && std::trunc(d) == d &&
                    d >= static_cast<double>(std::numeric_limits<int64_t>::min()) &&
                    d < static_cast<double>(std::numeric_limits<int64_t>::max())) {
                    writer.Int64(static_cast<int64_t>(d));
                } else {
                    writer.Double(d);
                }
            }
            break;
        case rapidjson::kArrayType:
            writer.StartArray();
            for (const auto& element : value.GetArray()) {
                WriteCanonical(element, writer);
            }
            writer.EndArray();
            break;
        case rapidjson::kObjectType: {
            std::vector<const rapidjson::Value::Member*> members;
            members.reserve(value.MemberCount());
            for (const auto& member : value.GetObject()) {
                members.push_back(&member);
            }
            std::sort(members.begin(), members.end(), [](const auto* a, const auto* b) {
                return std::string_view(a->name.GetString(), a->name.GetStringLength()) <
                       std::string_view(b->name.GetString(), b->name.GetStringLength());
            });
            writer.StartObject();
            for (const auto* member : members) {
                writer.Key(member->name.GetString(), member->name.GetStringLength());
                WriteCanonical(member->value, writer);
            }
            writer.EndObject();
            break;
        }
    }
}

}  // namespace

std::string CanonicalizeJson(const rapidjson::Value& value) {
    if (value.IsNull()) return "{}";

    rapidjson::StringBuffer buffer;
    Writer writer(buffer);
    WriteCanonical(value, writer);
    return std::string(buffer.GetString(), buffer.GetSize());
}

RequestKey::RequestKey(std::string query_id, std::string label, std::string variables)
    : query_id_(std::move(query_id)),
      label_(std::move(label)),
      variables_(std::move(variables)) {
    std::size_t h = std::hash<std::string>{}(query_id_);
    // boost::hash_combine mixing
    h ^= std::hash<std::string>{}(variables_) + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2);
    hash_ = h;
}

RequestKey RequestKey::Make(const QueryDocument& query, const rapidjson::Value& variables) {
    std::string label = query.operation_name().empty()
        ? query.id().substr(0, 12)
        : query.operation_name();
    return RequestKey(query.id(), std::move(label), CanonicalizeJson(variables));
}

std::string RequestKey::ToString() const {
    return fmt::format("{}:{}", label_, variables_);
}

}  // namespace query_suspense
