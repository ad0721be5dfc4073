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
 * @file metadata_executor.hpp
 * @brief Read-only database and collection introspection.
 */

#pragma once

#include "docgate/executor/operation_executor.hpp"

namespace docgate::executor {

/**
 * @class MetadataExecutor
 * @brief Lists and describes databases, collections and indexes.
 *
 * Statistics missing from the store's summary are reported as 0.
 */
class MetadataExecutor : public OperationExecutor {
  public:
    MetadataExecutor(store::Store& store, const security::PolicyConfig& policy);

    /// @return Array of `{name, sizeOnDisk, empty}`.
    bson::Array list_databases() const;

    bson::Document get_database_stats(const std::string& database) const;

    /// @return Array of `{name, type: "collection"}`.
    bson::Array list_collections(const std::string& database) const;

    /**
     * @brief Indexes, headline statistics and an `_id` type sample of up to 5 documents.
     *
     * @return `{collection, database, indexes, stats, sampleSchema}`.
     */
    bson::Document describe_collection(const std::string& database,
                                       const std::string& collection) const;

    bson::Document get_collection_stats(const std::string& database,
                                        const std::string& collection) const;

    bson::Array list_indexes(const std::string& database, const std::string& collection) const;
};

} // namespace docgate::executor
