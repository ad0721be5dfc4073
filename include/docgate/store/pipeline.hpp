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
 * @file pipeline.hpp
 * @brief Aggregation stage engine for the in-memory store.
 *
 * @details
 * Stages are applied one after another to a materialized document vector. Supported:
 * `$match`, `$project`, `$sort`, `$limit`, `$skip`, `$count`, `$unwind`, `$addFields`,
 * `$group`, `$sample`, `$facet`, `$lookup` and (as the last stage) `$out`. Any other stage
 * raises `StoreError`.
 *
 * Expressions inside `$project`, `$addFields` and `$group` understand field references
 * (`"$path"`, `"$$ROOT"`), `$literal`, `$type`, `$add`, `$subtract`, `$multiply`,
 * `$divide`, `$concat`, `$size`, `$ifNull`, `$toUpper` and `$toLower`.
 */

#pragma once

#include "docgate/bson/value.hpp"
#include "docgate/store/deadline.hpp"

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace docgate::store {

/**
 * @struct StageContext
 * @brief Access to sibling collections for `$lookup` and `$out`.
 *
 * The callbacks run under the lock the caller already holds.
 */
struct StageContext {
    std::function<std::vector<bson::Document>(const std::string&)> load_collection;
    std::function<void(const std::string&, std::vector<bson::Document>)> replace_collection;
    Deadline* deadline = nullptr;
};

/**
 * @class Pipeline
 * @brief Static stage and expression evaluators.
 */
class Pipeline {
  public:
    /**
     * @brief Runs `stages` over `input`.
     *
     * @throws StoreError on an unsupported or malformed stage.
     */
    static std::vector<bson::Document> run(std::vector<bson::Document> input,
                                           const bson::Array& stages, StageContext& ctx);

    /// @brief Whether the pipeline ends in `$out` and therefore needs a writer lock.
    static bool writes(const bson::Array& stages);

    /**
     * @brief Applies an inclusion or exclusion projection.
     *
     * `_id` is included unless explicitly excluded. Mixing inclusion and exclusion on
     * other fields is an error.
     */
    static bson::Document project(const bson::Document& doc, const bson::Document& spec);

    /// @brief Stable multi-key sort; every direction must be 1 or -1.
    static void sort(std::vector<bson::Document>& docs, const bson::Document& spec);

    /// @brief Evaluates an expression; `std::nullopt` stands for a missing field.
    static std::optional<bson::Value> evaluate(const bson::Value& expr, const bson::Document& doc);
};

} // namespace docgate::store
