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
 * @file operation_executor.hpp
 * @brief Shared orchestration contract of every gateway operation.
 *
 * @details
 * Each operation runs the same sequence:
 * 1. **Permission:** state-mutating operations fail with `PermissionDenied` unless
 *    dangerous mode is on, before any other work.
 * 2. **Validate:** namespace names, then the structured inputs (filter or pipeline).
 * 3. **Sanitize:** filters and stages with `sanitize_query`, documents and update
 *    specifications with `sanitize_document`.
 * 4. **Dispatch:** the store call. Any failure it reports becomes `ExecutionFailed`.
 * 5. **Normalize:** the top-level `_id` of each returned document is rendered as a string
 *    when it is an `ObjectId`.
 *
 * Executors keep no state between calls besides their copy of the policy.
 */

#pragma once

#include "docgate/bson/value.hpp"
#include "docgate/error.hpp"
#include "docgate/infra/logger.hpp"
#include "docgate/security/policy.hpp"
#include "docgate/security/sanitizer.hpp"
#include "docgate/store/store.hpp"

#include <cstdint>
#include <exception>
#include <optional>
#include <string>

namespace docgate::executor {

/**
 * @class OperationExecutor
 * @brief Base of the per-entity executors.
 */
class OperationExecutor {
  public:
    const security::PolicyConfig& policy() const { return policy_; }

  protected:
    OperationExecutor(store::Store& store, const security::PolicyConfig& policy);

    /// @throws PermissionDenied when dangerous mode is off.
    void require_dangerous(const std::string& message) const;

    /// @throws ValidationError if either name is malformed.
    static void validate_namespace(const std::string& database, const std::string& collection);

    /// @brief Validates and sanitizes a filter; returns the cleaned mapping.
    bson::Document prepare_query(const bson::Value& query) const;

    /**
     * @brief Resolves a requested page size.
     *
     * Absent uses `default_limit`; non-positive or above `max_document_count` is clamped to
     * `max_document_count`.
     */
    std::int64_t effective_limit(const std::optional<std::int64_t>& requested) const;

    /// @brief Rewrites a top-level `ObjectId` `_id` into its canonical string.
    static bson::Document normalize(bson::Document doc);

    /// @brief Identifier as reported to callers: `ObjectId` as hex, anything else as is.
    static bson::Value render_id(const bson::Value& id);

    /**
     * @brief Runs a store call, translating its failures into `ExecutionFailed`.
     *
     * Gateway errors pass through untouched; anything else is reported as
     * `"<failure>: <what>"`.
     */
    template <typename Fn> auto dispatch(const std::string& failure, Fn&& fn) const -> decltype(fn())
    {
        try {
            return fn();
        } catch (const Error&) {
            throw;
        } catch (const std::exception& e) {
            infra::Logger::log(infra::LogLevel::ERROR, "Executor: " + failure + ": " + e.what());
            throw ExecutionFailed(failure + ": " + e.what());
        }
    }

    store::Store& store_;
    const security::PolicyConfig policy_;
    const security::Sanitizer sanitizer_;
};

} // namespace docgate::executor
