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
 * @file operation_executor.cpp
 * @brief Shared steps of the executor contract.
 */

#include "docgate/executor/operation_executor.hpp"

#include "docgate/security/validator.hpp"

namespace docgate::executor {

OperationExecutor::OperationExecutor(store::Store& store, const security::PolicyConfig& policy)
    : store_(store), policy_(policy), sanitizer_(policy)
{
}

void OperationExecutor::require_dangerous(const std::string& message) const
{
    if (!policy_.dangerous_mode) {
        infra::Logger::log(infra::LogLevel::WARN, "Security: " + message);
        throw PermissionDenied(message);
    }
}

void OperationExecutor::validate_namespace(const std::string& database,
                                           const std::string& collection)
{
    security::NamespaceValidator::validate_database(database);
    security::NamespaceValidator::validate_collection(collection);
}

bson::Document OperationExecutor::prepare_query(const bson::Value& query) const
{
    security::QueryValidator::validate(query, policy_.dangerous_mode);
    return sanitizer_.sanitize_query(query).as_document();
}

std::int64_t OperationExecutor::effective_limit(const std::optional<std::int64_t>& requested) const
{
    const std::int64_t limit = requested ? *requested : policy_.default_limit;
    if (limit <= 0 || limit > policy_.max_document_count) {
        return policy_.max_document_count;
    }
    return limit;
}

bson::Document OperationExecutor::normalize(bson::Document doc)
{
    if (bson::Value* id = doc.find("_id")) {
        if (id->is_object_id()) {
            *id = id->as_object_id().to_string();
        }
    }
    return doc;
}

bson::Value OperationExecutor::render_id(const bson::Value& id)
{
    if (id.is_object_id()) {
        return id.as_object_id().to_string();
    }
    return id;
}

} // namespace docgate::executor
