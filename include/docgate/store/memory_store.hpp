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
 * @file memory_store.hpp
 * @brief In-process reference implementation of the `Store` contract.
 *
 * @details
 * Keeps every database in RAM: database name -> collection name -> ordered documents plus
 * index metadata. Nothing is persisted; the store lives as long as the process.
 *
 * **Core Responsibilities:**
 * - **Concurrency Control:** `std::shared_mutex` reader/writer lock. Reads take a shared
 *   lock, writes (and pipelines ending in `$out`) an exclusive one.
 * - **Identity:** documents without `_id` receive a fresh `ObjectId`; every collection
 *   carries the implicit unique `_id_` index.
 * - **Constraints:** unique indexes are enforced on insert, update and upsert.
 * - **Time budget:** scans abort with `StoreError` once the configured timeout elapses.
 */

#pragma once

#include "docgate/store/store.hpp"

#include <chrono>
#include <map>
#include <shared_mutex>
#include <string>
#include <vector>

namespace docgate::store {

/**
 * @class MemoryStore
 * @brief Thread-safe in-memory document store.
 */
class MemoryStore : public Store {
  public:
    /**
     * @param timeout Per-operation budget for scans.
     */
    explicit MemoryStore(std::chrono::seconds timeout);
    ~MemoryStore() override;

    std::vector<bson::Document> list_databases() override;
    bson::Document database_stats(const std::string& db) override;
    std::vector<std::string> list_collections(const std::string& db) override;
    bson::Document collection_stats(const std::string& db, const std::string& coll) override;
    std::vector<bson::Document> list_indexes(const std::string& db,
                                             const std::string& coll) override;

    std::vector<bson::Document> find(const std::string& db, const std::string& coll,
                                     const bson::Document& filter,
                                     const FindOptions& options) override;
    std::optional<bson::Document> find_one(const std::string& db, const std::string& coll,
                                           const bson::Document& filter,
                                           const std::optional<bson::Document>& projection) override;
    std::int64_t count(const std::string& db, const std::string& coll,
                       const bson::Document& filter) override;
    std::vector<bson::Document> aggregate(const std::string& db, const std::string& coll,
                                          const bson::Array& pipeline) override;

    /// @note Acquires a **Writer Lock** (Exclusive).
    InsertOutcome insert_one(const std::string& db, const std::string& coll,
                             const bson::Document& document) override;

    /**
     * @brief Applies `$set`, `$unset`, `$inc` and `$push` to every match.
     *
     * All-or-nothing: the new versions are staged, checked against unique indexes, and
     * only then committed.
     *
     * @note Acquires a **Writer Lock** (Exclusive).
     */
    UpdateOutcome update_many(const std::string& db, const std::string& coll,
                              const bson::Document& filter, const bson::Document& update,
                              bool upsert) override;

    /// @note Acquires a **Writer Lock** (Exclusive).
    DeleteOutcome delete_many(const std::string& db, const std::string& coll,
                              const bson::Document& filter) override;

    /**
     * @brief Records an index definition and validates existing data against it.
     *
     * Re-creating an identical index returns its name; the same name with different keys
     * or options is an error.
     *
     * @note Acquires a **Writer Lock** (Exclusive).
     */
    std::string create_index(const std::string& db, const std::string& coll,
                             const IndexSpec& spec) override;

  private:
    struct Index {
        std::string name;
        bson::Document keys;
        bool unique = false;
    };

    struct Collection {
        std::vector<bson::Document> documents;
        std::vector<Index> indexes;
    };

    using Database = std::map<std::string, Collection>;

    /// @brief Concurrency primitive for thread-safe memory access.
    mutable std::shared_mutex rw_lock_;

    /// @brief Database -> collection -> data. Ordered so listings are stable.
    std::map<std::string, Database> databases_;

    std::chrono::seconds timeout_;

    // --- Internal Logic (callers hold the lock) ---

    const Collection* lookup(const std::string& db, const std::string& coll) const;
    Collection& get_collection(const std::string& db, const std::string& coll);
    std::vector<bson::Document> scan(const Collection& collection, const bson::Document& filter,
                                     const FindOptions& options) const;
    std::vector<bson::Document> run_pipeline(const std::string& db, const std::string& coll,
                                             const bson::Array& pipeline);
    void check_unique(const std::string& coll, const Collection& collection,
                      const std::vector<bson::Document>& candidates,
                      const std::vector<std::size_t>& replaced) const;
};

} // namespace docgate::store
