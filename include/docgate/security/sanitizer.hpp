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
 * @file sanitizer.hpp
 * @brief String cleaning and resource bounding for untrusted value trees.
 *
 * @details
 * The sanitizer is the second gate after the validator. It never looks at operator
 * semantics; it only enforces size, depth and string hygiene:
 * - strings longer than `max_string_length` are rejected, never truncated;
 * - ASCII control characters are stripped and surrounding whitespace trimmed;
 * - nesting deeper than `max_depth` is rejected;
 * - documents larger than `max_document_bytes` once serialized are rejected.
 *
 * Every method is a pure function of its input. On failure the input is untouched and
 * no partial result escapes.
 */

#pragma once

#include "docgate/bson/value.hpp"
#include "docgate/security/policy.hpp"

#include <string>

namespace docgate::security {

/**
 * @class Sanitizer
 * @brief Stateless cleaner parameterized by the policy limits.
 */
class Sanitizer {
  public:
    explicit Sanitizer(const PolicyConfig& policy);

    /**
     * @brief Cleans a string-typed value.
     *
     * @throws SanitizationError if `value` is not a string or exceeds the length bound.
     */
    std::string sanitize_string(const bson::Value& value) const;

    /**
     * @brief Cleans a raw string: length check, control-character strip, whitespace trim.
     *
     * Idempotent: `sanitize_string(sanitize_string(s)) == sanitize_string(s)`.
     *
     * @throws SanitizationError if `value` exceeds the length bound.
     */
    std::string sanitize_string(const std::string& value) const;

    /**
     * @brief Verifies that no node lies deeper than `max_depth`.
     *
     * The node passed in sits at `depth`; each mapping or sequence level adds one. A
     * scalar reached at depth `max_depth + 1` is a violation, so a value wrapped in
     * 10 mappings passes and one wrapped in 11 does not.
     *
     * @throws DepthExceeded
     */
    void check_depth(const bson::Value& node, int depth = 0) const;

    /**
     * @brief Rebuilds a tree with every string key and string value cleaned.
     *
     * Sequences are mapped element-wise under the same rule; other scalars are copied.
     * Key order and shape are preserved.
     *
     * @throws SanitizationError if a key only gains a leading `$` through cleaning.
     */
    bson::Value sanitize_structure(const bson::Value& node) const;

    /// @brief Depth check from the root, then `sanitize_structure`.
    bson::Value sanitize_query(const bson::Value& query) const;

    /**
     * @brief Size check, depth check, then `sanitize_structure`.
     *
     * @throws SanitizationError when the compact JSON encoding exceeds
     * `max_document_bytes`.
     */
    bson::Value sanitize_document(const bson::Value& document) const;

  private:
    std::size_t max_string_length_;
    int max_depth_;
    std::size_t max_document_bytes_;
};

} // namespace docgate::security
