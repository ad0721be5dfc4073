/*
 * AEVUMDB COMMUNITY LICENSE
 * Version 1.0, February 2026
 *
 * Copyright (c) 2026 Ananda Firmansyah.
 * Official Organization: AevumDB (https://github.com/aevumdb)
 *
 * This source code is licensed under the AevumDB Community License.
 * You may not use this file except in compliance with the License.
 */

/**
 * @file value.cpp
 * @brief Out-of-line members of the value tree and the canonical value ordering.
 */

#include "docgate/bson/value.hpp"

#include "docgate/infra/id_generator.hpp"
#include "docgate/infra/string.hpp"

#include <algorithm>

namespace docgate::bson {

// ============================================================================
//  ObjectId
// ============================================================================

ObjectId ObjectId::generate()
{
    return ObjectId(infra::IdGenerator::generate());
}

std::optional<ObjectId> ObjectId::parse(const std::string& hex)
{
    if (hex.size() != 24) {
        return std::nullopt;
    }
    std::vector<std::uint8_t> raw;
    if (!infra::String::from_hex(hex, raw)) {
        return std::nullopt;
    }
    Bytes bytes{};
    std::copy(raw.begin(), raw.end(), bytes.begin());
    return ObjectId(bytes);
}

std::string ObjectId::to_string() const
{
    return infra::String::to_hex(bytes_.data(), bytes_.size());
}

// ============================================================================
//  Document
// ============================================================================

const Value* Document::find(const std::string& key) const
{
    for (const auto& field : fields_) {
        if (field.first == key) {
            return &field.second;
        }
    }
    return nullptr;
}

Value* Document::find(const std::string& key)
{
    for (auto& field : fields_) {
        if (field.first == key) {
            return &field.second;
        }
    }
    return nullptr;
}

void Document::set(const std::string& key, Value value)
{
    if (Value* existing = find(key)) {
        *existing = std::move(value);
        return;
    }
    fields_.emplace_back(key, std::move(value));
}

void Document::append(std::string key, Value value)
{
    fields_.emplace_back(std::move(key), std::move(value));
}

bool Document::erase(const std::string& key)
{
    auto it = std::find_if(fields_.begin(), fields_.end(),
                           [&key](const Field& f) { return f.first == key; });
    if (it == fields_.end()) {
        return false;
    }
    fields_.erase(it);
    return true;
}

// ============================================================================
//  Value
// ============================================================================

const char* type_name(Type type)
{
    switch (type) {
    case Type::NULL_VALUE:
        return "null";
    case Type::BOOL:
        return "bool";
    case Type::INT64:
        return "long";
    case Type::DOUBLE:
        return "double";
    case Type::STRING:
        return "string";
    case Type::OBJECT_ID:
        return "objectId";
    case Type::DATE_TIME:
        return "date";
    case Type::BINARY:
        return "binData";
    case Type::DOCUMENT:
        return "object";
    case Type::ARRAY:
        return "array";
    }
    return "unknown";
}

bool Value::truthy() const
{
    return std::visit(
        [](const auto& v) -> bool {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, Null>) {
                return false;
            } else if constexpr (std::is_same_v<T, bool>) {
                return v;
            } else if constexpr (std::is_same_v<T, std::int64_t>) {
                return v != 0;
            } else if constexpr (std::is_same_v<T, double>) {
                return v != 0.0;
            } else if constexpr (std::is_same_v<T, std::string> || std::is_same_v<T, ObjectId> ||
                                 std::is_same_v<T, DateTime> || std::is_same_v<T, Binary> ||
                                 std::is_same_v<T, Document> || std::is_same_v<T, Array>) {
                return true;
            } else {
                static_assert(always_false_v<T>, "unhandled value kind");
            }
        },
        data_);
}

namespace {

/// Cross-type ordering rank. Int64 and Double share a rank.
int canonical_rank(Type type)
{
    switch (type) {
    case Type::NULL_VALUE:
        return 1;
    case Type::INT64:
    case Type::DOUBLE:
        return 2;
    case Type::STRING:
        return 3;
    case Type::DOCUMENT:
        return 4;
    case Type::ARRAY:
        return 5;
    case Type::BINARY:
        return 6;
    case Type::OBJECT_ID:
        return 7;
    case Type::BOOL:
        return 8;
    case Type::DATE_TIME:
        return 9;
    }
    return 0;
}

template <typename T> int three_way(const T& a, const T& b)
{
    if (a < b)
        return -1;
    if (b < a)
        return 1;
    return 0;
}

} // namespace

int compare(const Value& lhs, const Value& rhs)
{
    const int lrank = canonical_rank(lhs.type());
    const int rrank = canonical_rank(rhs.type());
    if (lrank != rrank) {
        return lrank < rrank ? -1 : 1;
    }

    switch (lhs.type()) {
    case Type::NULL_VALUE:
        return 0;
    case Type::INT64:
    case Type::DOUBLE:
        if (lhs.is_int64() && rhs.is_int64())
            return three_way(lhs.as_int64(), rhs.as_int64());
        return three_way(lhs.as_number(), rhs.as_number());
    case Type::STRING:
        return three_way(lhs.as_string(), rhs.as_string());
    case Type::DOCUMENT: {
        const auto& a = lhs.as_document();
        const auto& b = rhs.as_document();
        auto ia = a.begin();
        auto ib = b.begin();
        for (; ia != a.end() && ib != b.end(); ++ia, ++ib) {
            if (int c = three_way(ia->first, ib->first))
                return c;
            if (int c = compare(ia->second, ib->second))
                return c;
        }
        return three_way(a.size(), b.size());
    }
    case Type::ARRAY: {
        const auto& a = lhs.as_array();
        const auto& b = rhs.as_array();
        const std::size_t n = std::min(a.size(), b.size());
        for (std::size_t i = 0; i < n; ++i) {
            if (int c = compare(a[i], b[i]))
                return c;
        }
        return three_way(a.size(), b.size());
    }
    case Type::BINARY: {
        const auto& a = lhs.as_binary();
        const auto& b = rhs.as_binary();
        if (int c = three_way(a.data.size(), b.data.size()))
            return c;
        if (int c = three_way(a.subtype, b.subtype))
            return c;
        return three_way(a.data, b.data);
    }
    case Type::OBJECT_ID:
        return three_way(lhs.as_object_id(), rhs.as_object_id());
    case Type::BOOL:
        return three_way(lhs.as_bool(), rhs.as_bool());
    case Type::DATE_TIME:
        return three_way(lhs.as_date_time().millis, rhs.as_date_time().millis);
    }
    return 0;
}

} // namespace docgate::bson
