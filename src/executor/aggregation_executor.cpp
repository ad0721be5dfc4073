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
 * @file aggregation_executor.cpp
 * @brief Implementation of pipeline execution and index creation.
 */

#include "docgate/executor/aggregation_executor.hpp"

#include "docgate/security/validator.hpp"

#include <string>

namespace docgate::executor {

AggregationExecutor::AggregationExecutor(store::Store& store,
                                         const security::PolicyConfig& policy)
    : OperationExecutor(store, policy)
{
}

bson::Document AggregationExecutor::aggregate_pipeline(
    const std::string& database, const std::string& collection, const bson::Value& pipeline,
    const std::optional<std::int64_t>& limit) const
{
    validate_namespace(database, collection);
    security::AggregationValidator::validate(pipeline, policy_.dangerous_mode,
                                             policy_.max_pipeline_stages);

    bson::Array stages;
    bool has_limit = false;
    for (const auto& stage : pipeline.as_array()) {
        bson::Value clean = sanitizer_.sanitize_query(stage);
        if (clean.as_document().front().first == "$limit") {
            has_limit = true;
        }
        stages.push_back(std::move(clean));
    }

    const std::int64_t bound = effective_limit(limit);
    if (!has_limit) {
        // A trailing write stage must stay last.
        auto at = stages.end();
        if (!stages.empty()) {
            const std::string& last = stages.back().as_document().front().first;
            if (last == "$out" || last == "$merge") {
                --at;
            }
        }
        stages.insert(at, bson::Document{{"$limit", bound}});
    }

    auto docs = dispatch("Aggregation failed",
                         [&] { return store_.aggregate(database, collection, stages); });

    bson::Array results;
    results.reserve(docs.size());
    for (auto& doc : docs) {
        results.push_back(normalize(std::move(doc)));
    }
    const auto count = static_cast<std::int64_t>(results.size());

    infra::Logger::log(infra::LogLevel::DEBUG,
                       "Executor: aggregate on " + database + "." + collection + " ran " +
                           std::to_string(stages.size()) + " stage(s), " +
                           std::to_string(count) + " result(s)");

    return bson::Document{{"results", std::move(results)},
                          {"count", count},
                          {"pipeline", std::move(stages)},
                          {"hasMore", count == bound}};
}

bson::Document AggregationExecutor::create_index(const std::string& database,
                                                 const std::string& collection,
                                                 const bson::Value& keys,
                                                 const std::optional<std::string>& name,
                                                 bool unique, bool background) const
{
    require_dangerous("Index creation requires dangerous mode");
    validate_namespace(database, collection);
    if (!keys.is_document() || keys.as_document().empty()) {
        throw ValidationError("Index keys must be a non-empty object", "", "keys");
    }
    const bson::Value clean = sanitizer_.sanitize_query(keys);

    store::IndexSpec spec;
    spec.keys = clean.as_document();
    spec.name = name;
    spec.unique = unique;
    spec.background = background;

    const std::string index_name = dispatch(
        "Index creation failed", [&] { return store_.create_index(database, collection, spec); });

    infra::Logger::log(infra::LogLevel::INFO, "Executor: Created index '" + index_name + "' on " +
                                                  database + "." + collection);

    bson::Document options{{"background", background}};
    if (name) {
        options.append("name", *name);
    }
    if (unique) {
        options.append("unique", true);
    }
    return bson::Document{
        {"indexName", index_name}, {"keys", clean}, {"options", std::move(options)}};
}

} // namespace docgate::executor
