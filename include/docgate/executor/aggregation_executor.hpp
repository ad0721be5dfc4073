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
 * @file aggregation_executor.hpp
 * @brief Aggregation pipelines and index creation.
 */

#pragma once

#include "docgate/executor/operation_executor.hpp"

namespace docgate::executor {

/**
 * @class AggregationExecutor
 * @brief Runs pipelines and builds indexes on a collection.
 */
class AggregationExecutor : public OperationExecutor {
  public:
    AggregationExecutor(store::Store& store, const security::PolicyConfig& policy);

    /**
     * @brief Validates, sanitizes and runs a pipeline.
     *
     * When no top-level stage is `$limit`, a terminal `{"$limit": bound}` is appended, where
     * `bound` is the effective limit. The returned `pipeline` is the one that was dispatched.
     *
     * @return `{results, count, pipeline, hasMore}`.
     * @throws ValidationError, SanitizationError, ExecutionFailed
     */
    bson::Document aggregate_pipeline(const std::string& database, const std::string& collection,
                                      const bson::Value& pipeline,
                                      const std::optional<std::int64_t>& limit) const;

    /**
     * @brief Creates an index. Requires dangerous mode.
     *
     * @return `{indexName, keys, options}`; `options` always carries `background` and adds
     * `name` when given and `unique` when true.
     */
    bson::Document create_index(const std::string& database, const std::string& collection,
                                const bson::Value& keys, const std::optional<std::string>& name,
                                bool unique, bool background) const;
};

} // namespace docgate::executor
