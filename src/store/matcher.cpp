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
 * @file matcher.cpp
 * @brief Implementation of filter evaluation.
 */

#include "docgate/store/matcher.hpp"

#include "docgate/store/field_path.hpp"
#include "docgate/store/store.hpp"

#include <functional>
#include <regex>
#include <string>
#include <vector>

namespace docgate::store {

namespace {

using Candidates = std::vector<const bson::Value*>;

/// Longest string `$regex` will scan; the std::regex matcher recurses per character.
constexpr std::size_t kMaxRegexSubject = 4096;

bool same_bracket(const bson::Value& a, const bson::Value& b)
{
    return (a.is_number() && b.is_number()) || a.type() == b.type();
}

/// Applies `pred` to every candidate and, for array candidates, to each element.
bool any_expanded(const Candidates& candidates, const std::function<bool(const bson::Value&)>& pred)
{
    for (const bson::Value* candidate : candidates) {
        if (pred(*candidate)) {
            return true;
        }
        if (candidate->is_array()) {
            for (const auto& item : candidate->as_array()) {
                if (pred(item)) {
                    return true;
                }
            }
        }
    }
    return false;
}

bool is_evaluation_operator(const std::string& op)
{
    return op == "$where" || op == "$expr" || op == "$jsonSchema" || op == "$text";
}

bool is_operator_document(const bson::Document& doc)
{
    if (doc.empty()) {
        return false;
    }
    for (const auto& field : doc) {
        if (field.first.empty() || field.first[0] != '$') {
            return false;
        }
    }
    return true;
}

bool matches_eq(const Candidates& candidates, const bson::Value& arg)
{
    if (arg.is_null() && candidates.empty()) {
        return true;
    }
    return any_expanded(candidates,
                        [&arg](const bson::Value& v) { return Matcher::equals(v, arg); });
}

bool matches_in(const Candidates& candidates, const bson::Value& arg, const std::string& op)
{
    if (!arg.is_array()) {
        throw StoreError(op + " needs an array");
    }
    for (const auto& item : arg.as_array()) {
        if (matches_eq(candidates, item)) {
            return true;
        }
    }
    return false;
}

bool matches_type(const bson::Value& value, const bson::Value& arg)
{
    if (arg.is_string()) {
        const std::string& name = arg.as_string();
        if (name == "number") {
            return value.is_number();
        }
        if (name == "int") {
            return value.is_int64();
        }
        return name == bson::type_name(value.type());
    }
    if (arg.is_number()) {
        switch (static_cast<int>(arg.as_number())) {
        case 1:
            return value.is_double();
        case 2:
            return value.is_string();
        case 3:
            return value.is_document();
        case 4:
            return value.is_array();
        case 5:
            return value.is_binary();
        case 7:
            return value.is_object_id();
        case 8:
            return value.is_bool();
        case 9:
            return value.is_date_time();
        case 10:
            return value.is_null();
        case 16:
        case 18:
            return value.is_int64();
        default:
            return false;
        }
    }
    throw StoreError("$type needs a type name or code");
}

bool evaluate_operators(const Candidates& candidates, const bson::Document& ops);

bool matches_elem(const bson::Value& item, const bson::Document& spec)
{
    const bool operator_form = is_operator_document(spec) &&
                               spec.front().first != "$and" && spec.front().first != "$or" &&
                               spec.front().first != "$nor";
    if (operator_form) {
        return evaluate_operators({&item}, spec);
    }
    return item.is_document() && Matcher::matches(item.as_document(), spec);
}

bool evaluate_operator(const Candidates& candidates, const std::string& op, const bson::Value& arg)
{
    if (op == "$eq") {
        return matches_eq(candidates, arg);
    }
    if (op == "$ne") {
        return !matches_eq(candidates, arg);
    }
    if (op == "$gt" || op == "$gte" || op == "$lt" || op == "$lte") {
        return any_expanded(candidates, [&op, &arg](const bson::Value& v) {
            if (!same_bracket(v, arg)) {
                return false;
            }
            const int c = bson::compare(v, arg);
            if (op == "$gt")
                return c > 0;
            if (op == "$gte")
                return c >= 0;
            if (op == "$lt")
                return c < 0;
            return c <= 0;
        });
    }
    if (op == "$in") {
        return matches_in(candidates, arg, op);
    }
    if (op == "$nin") {
        return !matches_in(candidates, arg, op);
    }
    if (op == "$exists") {
        return candidates.empty() != arg.truthy();
    }
    if (op == "$type") {
        return any_expanded(candidates,
                            [&arg](const bson::Value& v) { return matches_type(v, arg); });
    }
    if (op == "$regex") {
        if (!arg.is_string()) {
            throw StoreError("$regex needs a string pattern");
        }
        std::regex pattern;
        try {
            pattern = std::regex(arg.as_string(), std::regex::ECMAScript);
        } catch (const std::regex_error& e) {
            throw StoreError("Invalid regular expression: " + std::string(e.what()));
        }
        return any_expanded(candidates, [&pattern](const bson::Value& v) {
            if (!v.is_string()) {
                return false;
            }
            if (v.as_string().size() > kMaxRegexSubject) {
                throw StoreError("$regex cannot scan strings longer than " +
                                 std::to_string(kMaxRegexSubject) + " bytes");
            }
            return std::regex_search(v.as_string(), pattern);
        });
    }
    if (op == "$not") {
        if (!arg.is_document()) {
            throw StoreError("$not needs an operator document");
        }
        return !evaluate_operators(candidates, arg.as_document());
    }
    if (op == "$size") {
        if (!arg.is_number()) {
            throw StoreError("$size needs a number");
        }
        for (const bson::Value* candidate : candidates) {
            if (candidate->is_array() &&
                static_cast<double>(candidate->as_array().size()) == arg.as_number()) {
                return true;
            }
        }
        return false;
    }
    if (op == "$all") {
        if (!arg.is_array()) {
            throw StoreError("$all needs an array");
        }
        if (arg.as_array().empty()) {
            return false;
        }
        for (const auto& item : arg.as_array()) {
            if (!matches_eq(candidates, item)) {
                return false;
            }
        }
        return true;
    }
    if (op == "$elemMatch") {
        if (!arg.is_document()) {
            throw StoreError("$elemMatch needs an object");
        }
        for (const bson::Value* candidate : candidates) {
            if (!candidate->is_array()) {
                continue;
            }
            for (const auto& item : candidate->as_array()) {
                if (matches_elem(item, arg.as_document())) {
                    return true;
                }
            }
        }
        return false;
    }
    if (is_evaluation_operator(op)) {
        throw StoreError("Operator " + op + " is not supported by this store");
    }
    throw StoreError("Unknown operator: " + op);
}

bool evaluate_operators(const Candidates& candidates, const bson::Document& ops)
{
    for (const auto& [op, arg] : ops) {
        if (!evaluate_operator(candidates, op, arg)) {
            return false;
        }
    }
    return true;
}

const bson::Array& logical_clauses(const std::string& op, const bson::Value& arg)
{
    if (!arg.is_array() || arg.as_array().empty()) {
        throw StoreError(op + " needs a non-empty array");
    }
    for (const auto& clause : arg.as_array()) {
        if (!clause.is_document()) {
            throw StoreError(op + " entries must be objects");
        }
    }
    return arg.as_array();
}

} // namespace

bool Matcher::equals(const bson::Value& lhs, const bson::Value& rhs)
{
    return same_bracket(lhs, rhs) && bson::compare(lhs, rhs) == 0;
}

bool Matcher::matches(const bson::Document& doc, const bson::Document& filter)
{
    for (const auto& [key, condition] : filter) {
        if (key == "$and") {
            for (const auto& clause : logical_clauses(key, condition)) {
                if (!matches(doc, clause.as_document())) {
                    return false;
                }
            }
        } else if (key == "$or") {
            bool any = false;
            for (const auto& clause : logical_clauses(key, condition)) {
                if (matches(doc, clause.as_document())) {
                    any = true;
                    break;
                }
            }
            if (!any) {
                return false;
            }
        } else if (key == "$nor") {
            for (const auto& clause : logical_clauses(key, condition)) {
                if (matches(doc, clause.as_document())) {
                    return false;
                }
            }
        } else if (!key.empty() && key[0] == '$') {
            if (is_evaluation_operator(key)) {
                throw StoreError("Operator " + key + " is not supported by this store");
            }
            throw StoreError("Unknown top level operator: " + key);
        } else {
            const Candidates candidates = FieldPath::resolve(doc, key);
            const bool operator_form =
                condition.is_document() && is_operator_document(condition.as_document());
            const bool ok = operator_form
                                ? evaluate_operators(candidates, condition.as_document())
                                : matches_eq(candidates, condition);
            if (!ok) {
                return false;
            }
        }
    }
    return true;
}

} // namespace docgate::store
