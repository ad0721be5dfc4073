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
 * @file json_codec.hpp
 * @brief Conversion between wire JSON (cJSON) and the `bson::Value` tree.
 *
 * @details
 * The transport speaks plain JSON. Identifier, date, binary and 64-bit integer scalars
 * travel in canonical extended JSON form and are decoded here, before any validation
 * looks at the tree:
 *
 * | JSON                                              | Value    |
 * |---------------------------------------------------|----------|
 * | `{"$oid": "<24 hex>"}`                            | ObjectId |
 * | `{"$date": <ms>}`, `{"$date": {"$numberLong": "<ms>"}}`, `{"$date": "<ISO-8601 UTC>"}` | DateTime |
 * | `{"$binary": {"base64": "...", "subType": "hh"}}` | Binary   |
 * | `{"$numberLong": "<digits>"}`                     | Int64    |
 *
 * Only single-key objects are candidates. `{"$oid": "...", "x": 1}` stays an ordinary
 * mapping and is left for the validator to reject.
 */

#pragma once

#include "docgate/bson/value.hpp"

#include <cJSON.h>
#include <memory>
#include <string>

namespace docgate::bson {

/// @brief RAII owner for cJSON trees.
struct CJsonDeleter {
    void operator()(cJSON* node) const { cJSON_Delete(node); }
};
using CJsonPtr = std::unique_ptr<cJSON, CJsonDeleter>;

/**
 * @class JsonCodec
 * @brief Static converters between JSON text, cJSON trees and `Value`.
 */
class JsonCodec {
  public:
    /**
     * @brief Parses JSON text into a value tree.
     *
     * @throws ValidationError on a syntax error or malformed extended JSON.
     */
    static Value parse(const std::string& text);

    /**
     * @brief Serializes a value tree to compact JSON text.
     *
     * The byte length of this string is the "serialized size" used by the document size
     * bound.
     */
    static std::string serialize(const Value& value);

    /**
     * @brief Converts a borrowed cJSON node.
     *
     * @param node The node to convert; `nullptr` yields `Null`.
     * @throws ValidationError on malformed extended JSON.
     */
    static Value from_cjson(const cJSON* node);

    /**
     * @brief Builds a cJSON tree from a value.
     *
     * @warning The caller assumes ownership of the returned pointer and must release it
     * with `cJSON_Delete` (or attach it to a parent that is).
     */
    static cJSON* to_cjson(const Value& value);
};

} // namespace docgate::bson
