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
 * @file sanitizer.cpp
 * @brief Implementation of the string cleaning and bounding rules.
 */

#include "docgate/security/sanitizer.hpp"

#include "docgate/bson/json_codec.hpp"
#include "docgate/error.hpp"
#include "docgate/infra/string.hpp"

#include <utility>

namespace docgate::security {

namespace {

/// Number of UTF-8 code points, counting every non-continuation byte.
std::size_t code_points(const std::string& s)
{
    std::size_t count = 0;
    for (char c : s) {
        if ((static_cast<unsigned char>(c) & 0xC0) != 0x80) {
            count++;
        }
    }
    return count;
}

} // namespace

Sanitizer::Sanitizer(const PolicyConfig& policy)
    : max_string_length_(policy.max_string_length), max_depth_(policy.max_depth),
      max_document_bytes_(policy.max_document_bytes)
{
}

std::string Sanitizer::sanitize_string(const bson::Value& value) const
{
    if (!value.is_string()) {
        throw SanitizationError(std::string("Expected string input, got ") +
                                bson::type_name(value.type()));
    }
    return sanitize_string(value.as_string());
}

/**
 * @brief Cleans a single string.
 *
 * The length bound is checked on the raw input, before anything is stripped, so a
 * payload padded with control bytes cannot sneak past it.
 */
std::string Sanitizer::sanitize_string(const std::string& value) const
{
    if (code_points(value) > max_string_length_) {
        throw SanitizationError("String exceeds maximum length " +
                                std::to_string(max_string_length_));
    }
    return infra::String::trim(infra::String::strip_control(value));
}

void Sanitizer::check_depth(const bson::Value& node, int depth) const
{
    if (depth > max_depth_) {
        throw DepthExceeded("Structure exceeds maximum depth " + std::to_string(max_depth_));
    }

    if (node.is_document()) {
        for (const auto& field : node.as_document()) {
            check_depth(field.second, depth + 1);
        }
    } else if (node.is_array()) {
        for (const auto& item : node.as_array()) {
            check_depth(item, depth + 1);
        }
    }
}

/**
 * @brief Rebuilds the tree bottom-up.
 *
 * Keys that collapse onto the same cleaned name keep the position of the first
 * occurrence and the value of the last one. A key that only starts with `$` once
 * cleaned is rejected.
 */
bson::Value Sanitizer::sanitize_structure(const bson::Value& node) const
{
    return std::visit(
        [this](const auto& v) -> bson::Value {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::string>) {
                return sanitize_string(v);
            } else if constexpr (std::is_same_v<T, bson::Document>) {
                bson::Document clean;
                for (const auto& [key, child] : v) {
                    std::string name = sanitize_string(key);
                    // Operator names are checked on the raw keys; cleaning must not mint one.
                    if (name != key && !name.empty() && name[0] == '$') {
                        throw SanitizationError("Key cleans to reserved operator name '" + name +
                                                "'");
                    }
                    clean.set(std::move(name), sanitize_structure(child));
                }
                return clean;
            } else if constexpr (std::is_same_v<T, bson::Array>) {
                bson::Array clean;
                clean.reserve(v.size());
                for (const auto& child : v) {
                    clean.push_back(sanitize_structure(child));
                }
                return clean;
            } else if constexpr (std::is_same_v<T, bson::Null> || std::is_same_v<T, bool> ||
                                 std::is_same_v<T, std::int64_t> || std::is_same_v<T, double> ||
                                 std::is_same_v<T, bson::ObjectId> ||
                                 std::is_same_v<T, bson::DateTime> ||
                                 std::is_same_v<T, bson::Binary>) {
                return v;
            } else {
                static_assert(bson::always_false_v<T>, "unhandled value kind");
            }
        },
        node.storage());
}

bson::Value Sanitizer::sanitize_query(const bson::Value& query) const
{
    check_depth(query, 0);
    return sanitize_structure(query);
}

bson::Value Sanitizer::sanitize_document(const bson::Value& document) const
{
    // 1. Size bound on the serialized form, before any recursive work.
    const std::size_t size = bson::JsonCodec::serialize(document).size();
    if (size > max_document_bytes_) {
        throw SanitizationError("Document size " + std::to_string(size) + " exceeds limit " +
                                std::to_string(max_document_bytes_));
    }

    // 2. Depth bound.
    check_depth(document, 0);

    // 3. Rebuild.
    return sanitize_structure(document);
}

} // namespace docgate::security
