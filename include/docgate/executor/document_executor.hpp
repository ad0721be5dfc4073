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
 * @file document_executor.hpp
 * @brief Document CRUD operations.
 */

#pragma once

#include "docgate/executor/operation_executor.hpp"

namespace docgate::executor {

/**
 * @struct FindRequest
 * @brief Arguments of `find_documents`. Only `query` is untrusted structure; the
 * cursor options are passed to the store unchanged.
 */
struct FindRequest {
    std::string database;
    std::string collection;
    bson::Value query = bson::Document{};
    std::optional<bson::Document> projection;
    std::optional<bson::Document> sort;
    std::optional<std::int64_t> limit;
    std::int64_t skip = 0;
};

/**
 * @class DocumentExecutor
 * @brief Reads and writes individual documents.
 *
 * Insert, update and delete require dangerous mode.
 */
class DocumentExecutor : public OperationExecutor {
  public:
    DocumentExecutor(store::Store& store, const security::PolicyConfig& policy);

    /**
     * @brief Runs a filtered, paged find.
     *
     * @return `{documents, count, hasMore, query}` where `query` is the sanitized filter and
     * `hasMore` is `count == effective limit`.
     */
    bson::Document find_documents(const FindRequest& request) const;

    /// @return The first matching document, or `null`.
    bson::Value find_one_document(const std::string& database, const std::string& collection,
                                  const bson::Value& query,
                                  const std::optional<bson::Document>& projection) const;

    std::int64_t count_documents(const std::string& database, const std::string& collection,
                                 const bson::Value& query) const;

    /// @return `{insertedId, acknowledged}`.
    bson::Document insert_document(const std::string& database, const std::string& collection,
                                   const bson::Value& document) const;

    /**
     * @brief Updates every match of `query`.
     *
     * The filter goes through the query validator; the update specification is only
     * sanitized, since its `$set`-style keys are not query operators.
     *
     * @return `{matchedCount, modifiedCount, upsertedId, acknowledged}`.
     */
    bson::Document update_document(const std::string& database, const std::string& collection,
                                   const bson::Value& query, const bson::Value& update,
                                   bool upsert) const;

    /// @return `{deletedCount, acknowledged}`.
    bson::Document delete_document(const std::string& database, const std::string& collection,
                                   const bson::Value& query) const;
};

} // namespace docgate::executor
