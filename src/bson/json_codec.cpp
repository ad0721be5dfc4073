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
 * @file json_codec.cpp
 * @brief Implementation of the extended JSON codec on top of cJSON.
 */

#include "docgate/bson/json_codec.hpp"

#include "docgate/error.hpp"
#include "docgate/infra/base64.hpp"
#include "docgate/infra/string.hpp"

#include <cerrno>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <limits>
#include <memory>

namespace docgate::bson {

namespace {

/// Largest magnitude an IEEE double represents exactly as an integer (2^53).
constexpr double kMaxSafeInteger = 9007199254740992.0;

[[noreturn]] void malformed(const std::string& op, const std::string& detail)
{
    throw ValidationError("Malformed extended JSON for '" + op + "': " + detail, op);
}

bool parse_int64(const std::string& text, std::int64_t& out)
{
    if (text.empty()) {
        return false;
    }
    char* end = nullptr;
    errno = 0;
    long long parsed = std::strtoll(text.c_str(), &end, 10);
    if (errno != 0 || end == text.c_str() || *end != '\0') {
        return false;
    }
    out = static_cast<std::int64_t>(parsed);
    return true;
}

/// Days since 1970-01-01 for a proleptic Gregorian civil date.
std::int64_t days_from_civil(std::int64_t y, unsigned m, unsigned d)
{
    y -= m <= 2;
    const std::int64_t era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<std::int64_t>(doe) - 719468;
}

/// Parses `YYYY-MM-DDTHH:MM:SS[.fff]Z`.
bool parse_iso8601(const std::string& text, std::int64_t& millis)
{
    int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0, consumed = 0;
    if (std::sscanf(text.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d%n", &year, &month, &day, &hour,
                    &minute, &second, &consumed) != 6) {
        return false;
    }
    if (month < 1 || month > 12 || day < 1 || day > 31 || hour > 23 || minute > 59 ||
        second > 60) {
        return false;
    }

    std::size_t pos = static_cast<std::size_t>(consumed);
    int fraction = 0;
    if (pos < text.size() && text[pos] == '.') {
        int digits = 0;
        ++pos;
        while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9') {
            if (digits < 3) {
                fraction = fraction * 10 + (text[pos] - '0');
                digits++;
            }
            ++pos;
        }
        if (digits == 0) {
            return false;
        }
        while (digits++ < 3) {
            fraction *= 10;
        }
    }
    if (pos + 1 != text.size() || text[pos] != 'Z') {
        return false;
    }

    const std::int64_t days =
        days_from_civil(year, static_cast<unsigned>(month), static_cast<unsigned>(day));
    millis = ((days * 24 + hour) * 60 + minute) * 60 * 1000LL + second * 1000LL + fraction;
    return true;
}

Value decode_date(const cJSON* body)
{
    if (cJSON_IsNumber(body)) {
        return DateTime{static_cast<std::int64_t>(body->valuedouble)};
    }
    if (cJSON_IsString(body)) {
        std::int64_t millis = 0;
        if (!parse_iso8601(body->valuestring, millis)) {
            malformed("$date", "expected ISO-8601 UTC timestamp");
        }
        return DateTime{millis};
    }
    if (cJSON_IsObject(body)) {
        const cJSON* inner = body->child;
        if (inner && !inner->next && inner->string && std::string(inner->string) == "$numberLong" &&
            cJSON_IsString(inner)) {
            std::int64_t millis = 0;
            if (parse_int64(inner->valuestring, millis)) {
                return DateTime{millis};
            }
        }
    }
    malformed("$date", "unsupported representation");
}

Value decode_binary(const cJSON* body)
{
    const cJSON* payload = cJSON_GetObjectItemCaseSensitive(body, "base64");
    const cJSON* subtype = cJSON_GetObjectItemCaseSensitive(body, "subType");
    if (!cJSON_IsObject(body) || !cJSON_IsString(payload) || !cJSON_IsString(subtype) ||
        cJSON_GetArraySize(body) != 2) {
        malformed("$binary", "expected {\"base64\": ..., \"subType\": ...}");
    }

    std::string sub_hex = subtype->valuestring;
    if (sub_hex.size() == 1) {
        sub_hex = "0" + sub_hex;
    }
    std::vector<std::uint8_t> sub_bytes;
    if (sub_hex.size() != 2 || !infra::String::from_hex(sub_hex, sub_bytes)) {
        malformed("$binary", "subType must be one or two hex digits");
    }

    Binary bin;
    bin.subtype = sub_bytes[0];
    if (!infra::Base64::decode(payload->valuestring, bin.data)) {
        malformed("$binary", "invalid base64 payload");
    }
    return bin;
}

/**
 * Attempts to decode a single-key extended JSON object.
 *
 * @return true and fills `out` when `node` is one of the recognized wrappers.
 */
bool decode_extended(const cJSON* node, Value& out)
{
    const cJSON* only = node->child;
    if (!only || only->next || !only->string) {
        return false;
    }
    const std::string key = only->string;

    if (key == "$oid") {
        if (!cJSON_IsString(only)) {
            malformed(key, "expected a hex string");
        }
        auto oid = ObjectId::parse(only->valuestring);
        if (!oid) {
            malformed(key, "expected 24 hexadecimal digits");
        }
        out = *oid;
        return true;
    }
    if (key == "$date") {
        out = decode_date(only);
        return true;
    }
    if (key == "$binary") {
        out = decode_binary(only);
        return true;
    }
    if (key == "$numberLong") {
        std::int64_t parsed = 0;
        if (!cJSON_IsString(only) || !parse_int64(only->valuestring, parsed)) {
            malformed(key, "expected a decimal string");
        }
        out = parsed;
        return true;
    }
    return false;
}

cJSON* make_wrapper(const char* key, cJSON* body)
{
    cJSON* obj = cJSON_CreateObject();
    cJSON_AddItemToObject(obj, key, body);
    return obj;
}

} // namespace

Value JsonCodec::parse(const std::string& text)
{
    CJsonPtr root(cJSON_Parse(text.c_str()));
    if (!root) {
        throw ValidationError("Invalid JSON syntax");
    }
    return from_cjson(root.get());
}

std::string JsonCodec::serialize(const Value& value)
{
    CJsonPtr root(to_cjson(value));
    char* raw = cJSON_PrintUnformatted(root.get());
    if (!raw) {
        throw std::runtime_error("JSON serialization failed (out of memory)");
    }
    std::string out(raw);
    cJSON_free(raw);
    return out;
}

Value JsonCodec::from_cjson(const cJSON* node)
{
    if (!node || cJSON_IsNull(node)) {
        return Null{};
    }
    if (cJSON_IsBool(node)) {
        return cJSON_IsTrue(node) != 0;
    }
    if (cJSON_IsNumber(node)) {
        const double d = node->valuedouble;
        if (std::isfinite(d) && std::floor(d) == d && std::fabs(d) <= kMaxSafeInteger) {
            return static_cast<std::int64_t>(d);
        }
        return d;
    }
    if (cJSON_IsString(node)) {
        return std::string(node->valuestring ? node->valuestring : "");
    }
    if (cJSON_IsArray(node)) {
        Array arr;
        const cJSON* item = nullptr;
        cJSON_ArrayForEach(item, node)
        {
            arr.push_back(from_cjson(item));
        }
        return arr;
    }
    if (cJSON_IsObject(node)) {
        Value ext;
        if (decode_extended(node, ext)) {
            return ext;
        }
        Document doc;
        const cJSON* item = nullptr;
        cJSON_ArrayForEach(item, node)
        {
            doc.append(item->string ? item->string : "", from_cjson(item));
        }
        return doc;
    }
    // cJSON_Raw and invalid nodes never come out of cJSON_Parse.
    return Null{};
}

cJSON* JsonCodec::to_cjson(const Value& value)
{
    return std::visit(
        [](const auto& v) -> cJSON* {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, Null>) {
                return cJSON_CreateNull();
            } else if constexpr (std::is_same_v<T, bool>) {
                return cJSON_CreateBool(v ? 1 : 0);
            } else if constexpr (std::is_same_v<T, std::int64_t>) {
                constexpr std::int64_t kSafe = 9007199254740992LL;
                if (v >= -kSafe && v <= kSafe) {
                    return cJSON_CreateNumber(static_cast<double>(v));
                }
                return make_wrapper("$numberLong", cJSON_CreateString(std::to_string(v).c_str()));
            } else if constexpr (std::is_same_v<T, double>) {
                return cJSON_CreateNumber(v);
            } else if constexpr (std::is_same_v<T, std::string>) {
                return cJSON_CreateString(v.c_str());
            } else if constexpr (std::is_same_v<T, ObjectId>) {
                return make_wrapper("$oid", cJSON_CreateString(v.to_string().c_str()));
            } else if constexpr (std::is_same_v<T, DateTime>) {
                cJSON* inner =
                    make_wrapper("$numberLong", cJSON_CreateString(std::to_string(v.millis).c_str()));
                return make_wrapper("$date", inner);
            } else if constexpr (std::is_same_v<T, Binary>) {
                char sub[3];
                std::snprintf(sub, sizeof(sub), "%02x", static_cast<unsigned>(v.subtype));
                cJSON* body = cJSON_CreateObject();
                cJSON_AddStringToObject(body, "base64", infra::Base64::encode(v.data).c_str());
                cJSON_AddStringToObject(body, "subType", sub);
                return make_wrapper("$binary", body);
            } else if constexpr (std::is_same_v<T, Document>) {
                cJSON* obj = cJSON_CreateObject();
                for (const auto& [key, child] : v) {
                    cJSON_AddItemToObject(obj, key.c_str(), JsonCodec::to_cjson(child));
                }
                return obj;
            } else if constexpr (std::is_same_v<T, Array>) {
                cJSON* arr = cJSON_CreateArray();
                for (const auto& child : v) {
                    cJSON_AddItemToArray(arr, JsonCodec::to_cjson(child));
                }
                return arr;
            } else {
                static_assert(always_false_v<T>, "unhandled value kind");
            }
        },
        value.storage());
}

} // namespace docgate::bson
