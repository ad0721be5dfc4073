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
 * @file policy.hpp
 * @brief Immutable run-time policy of the gateway.
 */

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>

namespace docgate::security {

/**
 * @struct PolicyConfig
 * @brief Limits and the dangerous-mode switch, fixed for the lifetime of the process.
 *
 * @details
 * Built once by the settings loader and then only ever handed out by `const` reference
 * or copied into the executors. There is no global instance: whoever needs the policy
 * receives it explicitly.
 */
struct PolicyConfig {
    /// @brief Permits writes, index creation and the dangerous operator/stage lists.
    bool dangerous_mode = false;

    /// @brief Upper bound on documents returned by one find/aggregate call.
    std::int64_t max_document_count = 1000;

    /// @brief Upper bound on aggregation pipeline length.
    std::size_t max_pipeline_stages = 20;

    /// @brief Upper bound on any single string (key or value), in UTF-8 code points.
    std::size_t max_string_length = 1000;

    /// @brief Upper bound on nesting depth of filters and documents.
    int max_depth = 10;

    /// @brief Upper bound on the serialized size of inserted/updated documents.
    std::size_t max_document_bytes = 16 * 1024 * 1024;

    /// @brief Time budget handed to the store connection.
    std::chrono::seconds timeout{30};

    /// @brief Limit applied to find/aggregate calls that do not name one.
    std::int64_t default_limit = 100;
};

} // namespace docgate::security
