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
 * @file validator.hpp
 * @brief Closed-allowlist checks for query operators, pipeline stages and namespaces.
 *
 * @details
 * The validator is the first gate every structured input passes. It inspects names
 * only (never values) and either returns normally or throws `ValidationError` naming
 * the offending key and where it was found.
 *
 * **Operator rule:** a `$`-prefixed key must be in SAFE, or in DANGEROUS while dangerous
 * mode is on. Anything else is rejected; there is no pass-through for unknown operators.
 *
 * **Stage rule:** same lists idea for pipeline stages, but an unknown stage name is
 * rejected in both modes and dangerous mode only unlocks the DANGEROUS list. The
 * asymmetry with the operator rule is intentional.
 *
 * The dangerous-mode flag is an explicit argument of every call.
 */

#pragma once

#include "docgate/bson/value.hpp"

#include <cstddef>
#include <set>
#include <string>

namespace docgate::security {

/**
 * @class QueryValidator
 * @brief Recursively checks every operator key of a filter.
 */
class QueryValidator {
  public:
    /// @brief $eq, $ne, $gt, $gte, $lt, $lte, $in, $nin, $exists, $type, $regex, $and,
    /// $or, $not, $nor, $size, $elemMatch, $all.
    static const std::set<std::string>& safe_operators();

    /// @brief $where, $expr, $jsonSchema, $text.
    static const std::set<std::string>& dangerous_operators();

    /**
     * @brief Validates a filter mapping.
     *
     * Visits every mapping in the tree, including mappings held in sequences at any
     * depth.
     *
     * @param query The filter; must be a mapping.
     * @param dangerous_mode Whether the DANGEROUS list is unlocked.
     * @throws ValidationError on the first forbidden key.
     */
    static void validate(const bson::Value& query, bool dangerous_mode);

  private:
    static void validate_node(const bson::Value& node, bool dangerous_mode,
                              const std::string& path);
};

/**
 * @class AggregationValidator
 * @brief Checks pipeline length, stage shape and stage names.
 */
class AggregationValidator {
  public:
    /// @brief $match, $project, $sort, $limit, $skip, $group, $unwind, $lookup,
    /// $addFields, $count, $facet, $bucket, $sample.
    static const std::set<std::string>& safe_stages();

    /// @brief $out, $merge, $geoNear, $graphLookup, $function, $accumulator, $expr.
    static const std::set<std::string>& dangerous_stages();

    /**
     * @brief Validates a pipeline.
     *
     * Order of checks:
     * 1. the pipeline is a sequence no longer than `max_stages`;
     * 2. each stage is a mapping with exactly one key;
     * 3. each stage name is allowed under the current mode.
     *
     * Stage bodies are not inspected here.
     *
     * @throws ValidationError with `location()` set to `pipeline[i]`.
     */
    static void validate(const bson::Value& pipeline, bool dangerous_mode,
                         std::size_t max_stages);
};

/**
 * @class NamespaceValidator
 * @brief Database and collection name hygiene.
 *
 * Names must be 1 to 64 characters drawn from `[A-Za-z0-9_-]`.
 */
class NamespaceValidator {
  public:
    static void validate_database(const std::string& name);
    static void validate_collection(const std::string& name);
};

} // namespace docgate::security
