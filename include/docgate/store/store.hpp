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
 * @file store.hpp
 * @brief Abstract document-store contract consumed by the executors.
 *
 * @details
 * The gateway never talks to a concrete driver. Executors receive a `Store&` and call
 * only the methods below, always with input that already passed validation and
 * sanitization. Implementations report every failure by throwing `StoreError`; the
 * executors translate it into `ExecutionFailed`.
 */

#pragma once

#include "docgate/bson/value.hpp"

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace docgate::store {

/**
 * @class StoreError
 * @brief Any failure reported by a store implementation.
 */
class StoreError : public std::runtime_error {
  public:
    explicit StoreError(const std::string& message) : std::runtime_error(message) {}
};

/**
 * @struct FindOptions
 * @brief Cursor modifiers passed through to `Store::find`.
 */
struct FindOptions {
    std::optional<bson::Document> projection;
    std::optional<bson::Document> sort;
    std::int64_t skip = 0;
    std::int64_t limit = 0; ///< 0 means unlimited.
};

struct InsertOutcome {
    bson::Value inserted_id;
    bool acknowledged = true;
};

struct UpdateOutcome {
    std::int64_t matched = 0;
    std::int64_t modified = 0;
    std::optional<bson::Value> upserted_id;
    bool acknowledged = true;
};

struct DeleteOutcome {
    std::int64_t deleted = 0;
    bool acknowledged = true;
};

/**
 * @struct IndexSpec
 * @brief Index definition: ordered key pattern plus options.
 */
struct IndexSpec {
    bson::Document keys;
    std::optional<std::string> name; ///< Derived from the key pattern when absent.
    bool unique = false;
    bool background = true;
};

/**
 * @class Store
 * @brief Driver interface. All methods may throw `StoreError`.
 */
class Store {
  public:
    virtual ~Store() = default;

    // ========================================================================
    //  METADATA
    // ========================================================================

    /// @brief One `{name, sizeOnDisk, empty}` entry per database.
    virtual std::vector<bson::Document> list_databases() = 0;

    /// @brief `dbStats`-shaped summary: collections, objects, avgObjSize, dataSize,
    /// storageSize, indexes, indexSize.
    virtual bson::Document database_stats(const std::string& db) = 0;

    virtual std::vector<std::string> list_collections(const std::string& db) = 0;

    /// @brief `collStats`-shaped summary: count, size, storageSize, avgObjSize, nindexes,
    /// totalIndexSize.
    virtual bson::Document collection_stats(const std::string& db, const std::string& coll) = 0;

    /// @brief One `{v, key, name, unique?}` entry per index.
    virtual std::vector<bson::Document> list_indexes(const std::string& db,
                                                     const std::string& coll) = 0;

    // ========================================================================
    //  READS
    // ========================================================================

    virtual std::vector<bson::Document> find(const std::string& db, const std::string& coll,
                                             const bson::Document& filter,
                                             const FindOptions& options) = 0;

    virtual std::optional<bson::Document>
    find_one(const std::string& db, const std::string& coll, const bson::Document& filter,
             const std::optional<bson::Document>& projection) = 0;

    virtual std::int64_t count(const std::string& db, const std::string& coll,
                               const bson::Document& filter) = 0;

    virtual std::vector<bson::Document> aggregate(const std::string& db,
                                                  const std::string& coll,
                                                  const bson::Array& pipeline) = 0;

    // ========================================================================
    //  WRITES
    // ========================================================================

    virtual InsertOutcome insert_one(const std::string& db, const std::string& coll,
                                     const bson::Document& document) = 0;

    virtual UpdateOutcome update_many(const std::string& db, const std::string& coll,
                                      const bson::Document& filter,
                                      const bson::Document& update, bool upsert) = 0;

    virtual DeleteOutcome delete_many(const std::string& db, const std::string& coll,
                                      const bson::Document& filter) = 0;

    /// @return The name of the created (or already existing) index.
    virtual std::string create_index(const std::string& db, const std::string& coll,
                                     const IndexSpec& spec) = 0;
};

} // namespace docgate::store
