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
 * @file validator.cpp
 * @brief Implementation of the operator, stage and namespace allowlists.
 */

#include "docgate/security/validator.hpp"

#include "docgate/error.hpp"
#include "docgate/infra/logger.hpp"

#include <cctype>

namespace docgate::security {

namespace {

[[noreturn]] void reject(const std::string& message, const std::string& offender,
                         const std::string& location)
{
    // Only names and paths are logged, never the rejected values.
    infra::Logger::log(infra::LogLevel::WARN,
                       "Security: " + message + (location.empty() ? "" : " (at " + location + ")"));
    throw ValidationError(message, offender, location);
}

std::string child_path(const std::string& parent, const std::string& key)
{
    return parent.empty() ? key : parent + "." + key;
}

std::string index_path(const std::string& parent, std::size_t index)
{
    return parent + "[" + std::to_string(index) + "]";
}

void validate_name(const std::string& kind, const std::string& name)
{
    if (name.empty() || name.size() > 64) {
        reject(kind + " name must be between 1 and 64 characters", name, kind);
    }
    for (char c : name) {
        const auto uc = static_cast<unsigned char>(c);
        if (!std::isalnum(uc) && c != '_' && c != '-') {
            reject(kind + " name must be alphanumeric with underscores/hyphens", name, kind);
        }
    }
}

} // namespace

// ============================================================================
//  QueryValidator
// ============================================================================

const std::set<std::string>& QueryValidator::safe_operators()
{
    static const std::set<std::string> ops = {
        "$eq",  "$ne",  "$gt",     "$gte", "$lt",  "$lte",  "$in",  "$nin",       "$exists",
        "$type", "$regex", "$and", "$or",  "$not", "$nor", "$size", "$elemMatch", "$all"};
    return ops;
}

const std::set<std::string>& QueryValidator::dangerous_operators()
{
    static const std::set<std::string> ops = {"$where", "$expr", "$jsonSchema", "$text"};
    return ops;
}

void QueryValidator::validate(const bson::Value& query, bool dangerous_mode)
{
    if (!query.is_document()) {
        reject("Query must be an object", "", "");
    }
    validate_node(query, dangerous_mode, "");
}

/**
 * @brief Depth-first walk over mappings and sequences.
 *
 * Scalars are skipped: only keys can carry operators. Recursion depth is bounded by the
 * JSON parser's nesting limit, and the sanitizer enforces the tighter policy bound right
 * after this pass.
 */
void QueryValidator::validate_node(const bson::Value& node, bool dangerous_mode,
                                   const std::string& path)
{
    if (node.is_document()) {
        for (const auto& [key, value] : node.as_document()) {
            const std::string here = child_path(path, key);

            if (!key.empty() && key[0] == '$') {
                const bool dangerous = dangerous_operators().count(key) > 0;
                if (dangerous && !dangerous_mode) {
                    reject("Dangerous operator '" + key + "' not allowed in safe mode", key, here);
                }
                if (!dangerous && safe_operators().count(key) == 0) {
                    reject("Unknown or forbidden operator: " + key, key, here);
                }
            }

            validate_node(value, dangerous_mode, here);
        }
    } else if (node.is_array()) {
        const auto& items = node.as_array();
        for (std::size_t i = 0; i < items.size(); ++i) {
            validate_node(items[i], dangerous_mode, index_path(path, i));
        }
    }
}

// ============================================================================
//  AggregationValidator
// ============================================================================

const std::set<std::string>& AggregationValidator::safe_stages()
{
    static const std::set<std::string> stages = {
        "$match", "$project",   "$sort",  "$limit", "$skip",  "$group", "$unwind",
        "$lookup", "$addFields", "$count", "$facet", "$bucket", "$sample"};
    return stages;
}

const std::set<std::string>& AggregationValidator::dangerous_stages()
{
    static const std::set<std::string> stages = {"$out",      "$merge",       "$geoNear",
                                                 "$graphLookup", "$function", "$accumulator",
                                                 "$expr"};
    return stages;
}

void AggregationValidator::validate(const bson::Value& pipeline, bool dangerous_mode,
                                    std::size_t max_stages)
{
    // 1. Shape and length
    if (!pipeline.is_array()) {
        reject("Pipeline must be an array of stages", "", "pipeline");
    }
    const auto& stages = pipeline.as_array();
    if (stages.size() > max_stages) {
        reject("Pipeline exceeds maximum " + std::to_string(max_stages) + " stages", "",
               "pipeline");
    }

    for (std::size_t i = 0; i < stages.size(); ++i) {
        const std::string here = index_path("pipeline", i);
        const bson::Value& stage = stages[i];

        // 2. Singleton mapping
        if (!stage.is_document()) {
            reject("Stage " + std::to_string(i) + " must be an object", "", here);
        }
        if (stage.as_document().size() != 1) {
            reject("Stage " + std::to_string(i) + " must contain exactly one operation", "",
                   here);
        }

        // 3. Name classification
        const std::string& name = stage.as_document().front().first;
        const bool dangerous = dangerous_stages().count(name) > 0;
        if (dangerous && !dangerous_mode) {
            reject("Dangerous stage '" + name + "' not allowed in safe mode", name, here);
        }
        if (!dangerous && safe_stages().count(name) == 0) {
            reject("Unknown or forbidden stage: " + name, name, here);
        }
    }
}

// ============================================================================
//  NamespaceValidator
// ============================================================================

void NamespaceValidator::validate_database(const std::string& name)
{
    validate_name("database", name);
}

void NamespaceValidator::validate_collection(const std::string& name)
{
    validate_name("collection", name);
}

} // namespace docgate::security
