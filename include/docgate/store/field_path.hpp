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
 * @file field_path.hpp
 * @brief Dotted-path access into documents (`"address.city"`, `"tags.0"`).
 */

#pragma once

#include "docgate/bson/value.hpp"

#include <string>
#include <vector>

namespace docgate::store {

/**
 * @class FieldPath
 * @brief Static helpers to read, write and remove values addressed by a dotted path.
 *
 * Numeric segments index into arrays. Writes create intermediate mappings as needed.
 */
class FieldPath {
  public:
    static std::vector<std::string> split(const std::string& path);

    /// @brief Single-valued lookup; `nullptr` when any segment is missing.
    static const bson::Value* get(const bson::Document& doc, const std::string& path);

    /**
     * @brief Multi-valued lookup with implicit array traversal.
     *
     * A path that crosses an array of mappings continues into each element, so
     * `items.sku` over `{items: [{sku: 1}, {sku: 2}]}` yields both `1` and `2`.
     */
    static std::vector<const bson::Value*> resolve(const bson::Document& doc,
                                                   const std::string& path);

    /**
     * @brief Writes `value` at `path`.
     *
     * @return false when an intermediate segment holds a scalar and cannot be descended.
     */
    static bool set(bson::Document& doc, const std::string& path, bson::Value value);

    /// @brief Removes the value at `path`. Returns false if nothing was removed.
    static bool erase(bson::Document& doc, const std::string& path);
};

} // namespace docgate::store
