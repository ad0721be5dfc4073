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
 * @file matcher.hpp
 * @brief Filter evaluation for the in-memory store.
 *
 * @details
 * Evaluates the query-operator subset that the gateway lets through in safe mode:
 * comparison (`$eq`, `$ne`, `$gt`, `$gte`, `$lt`, `$lte`, `$in`, `$nin`), element
 * (`$exists`, `$type`), `$regex`, logical (`$and`, `$or`, `$nor`, `$not`) and array
 * (`$size`, `$all`, `$elemMatch`) operators.
 *
 * Semantics follow the document-store convention:
 * - a bare value is an implicit `$eq`;
 * - equality against an array field also matches when any element is equal;
 * - range comparisons only match values of the same canonical type bracket;
 * - `{field: null}` matches both explicit null and a missing field.
 *
 * The evaluation-heavy operators (`$where`, `$expr`, `$jsonSchema`, `$text`) are not
 * implemented and raise `StoreError`.
 */

#pragma once

#include "docgate/bson/value.hpp"

namespace docgate::store {

/**
 * @class Matcher
 * @brief Stateless predicate `filter(document) -> bool`.
 */
class Matcher {
  public:
    /**
     * @brief Tests a document against a filter.
     *
     * @throws StoreError on a malformed or unsupported filter.
     */
    static bool matches(const bson::Document& doc, const bson::Document& filter);

    /// @brief Equality used by the matcher: numeric across Int64/Double, structural
    /// otherwise.
    static bool equals(const bson::Value& lhs, const bson::Value& rhs);
};

} // namespace docgate::store
