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
 * @file document_executor.cpp
 * @brief Implementation of the document CRUD operations.
 */

#include "docgate/executor/document_executor.hpp"

namespace docgate::executor {

namespace {

const char* kWriteRequiresDangerous = "Write operations require dangerous mode";

const bson::Value& require_object(const bson::Value& value, const std::string& what)
{
    if (!value.is_document()) {
        throw ValidationError(what + " must be an object", "", what);
    }
    return value;
}

} // namespace

DocumentExecutor::DocumentExecutor(store::Store& store, const security::PolicyConfig& policy)
    : OperationExecutor(store, policy)
{
}

bson::Document DocumentExecutor::find_documents(const FindRequest& request) const
{
    validate_namespace(request.database, request.collection);
    const bson::Document query = prepare_query(request.query);

    store::FindOptions options;
    options.projection = request.projection;
    options.sort = request.sort;
    options.skip = request.skip;
    options.limit = effective_limit(request.limit);

    auto docs = dispatch("Query failed", [&] {
        return store_.find(request.database, request.collection, query, options);
    });

    bson::Array documents;
    documents.reserve(docs.size());
    for (auto& doc : docs) {
        documents.push_back(normalize(std::move(doc)));
    }
    const auto count = static_cast<std::int64_t>(documents.size());

    infra::Logger::log(infra::LogLevel::DEBUG, "Executor: find on " + request.database + "." +
                                                   request.collection + " returned " +
                                                   std::to_string(count));

    return bson::Document{{"documents", std::move(documents)},
                          {"count", count},
                          {"hasMore", count == options.limit},
                          {"query", query}};
}

bson::Value DocumentExecutor::find_one_document(const std::string& database,
                                                const std::string& collection,
                                                const bson::Value& query,
                                                const std::optional<bson::Document>& projection) const
{
    validate_namespace(database, collection);
    const bson::Document filter = prepare_query(query);

    auto doc = dispatch("Find one failed", [&] {
        return store_.find_one(database, collection, filter, projection);
    });
    if (!doc) {
        return bson::Null{};
    }
    return normalize(std::move(*doc));
}

std::int64_t DocumentExecutor::count_documents(const std::string& database,
                                               const std::string& collection,
                                               const bson::Value& query) const
{
    validate_namespace(database, collection);
    const bson::Document filter = prepare_query(query);

    return dispatch("Count failed",
                    [&] { return store_.count(database, collection, filter); });
}

bson::Document DocumentExecutor::insert_document(const std::string& database,
                                                 const std::string& collection,
                                                 const bson::Value& document) const
{
    require_dangerous(kWriteRequiresDangerous);
    validate_namespace(database, collection);
    const bson::Value clean = sanitizer_.sanitize_document(require_object(document, "document"));

    auto outcome = dispatch("Insert failed", [&] {
        return store_.insert_one(database, collection, clean.as_document());
    });

    infra::Logger::log(infra::LogLevel::INFO,
                       "Executor: Inserted one document into " + database + "." + collection);
    return bson::Document{{"insertedId", render_id(outcome.inserted_id)},
                          {"acknowledged", outcome.acknowledged}};
}

bson::Document DocumentExecutor::update_document(const std::string& database,
                                                 const std::string& collection,
                                                 const bson::Value& query,
                                                 const bson::Value& update, bool upsert) const
{
    require_dangerous(kWriteRequiresDangerous);
    validate_namespace(database, collection);
    const bson::Document filter = prepare_query(query);
    const bson::Value clean = sanitizer_.sanitize_document(require_object(update, "update"));

    auto outcome = dispatch("Update failed", [&] {
        return store_.update_many(database, collection, filter, clean.as_document(), upsert);
    });

    infra::Logger::log(infra::LogLevel::INFO, "Executor: Updated " +
                                                  std::to_string(outcome.modified) +
                                                  " document(s) in " + database + "." +
                                                  collection);
    return bson::Document{
        {"matchedCount", outcome.matched},
        {"modifiedCount", outcome.modified},
        {"upsertedId", outcome.upserted_id ? render_id(*outcome.upserted_id) : bson::Null{}},
        {"acknowledged", outcome.acknowledged}};
}

bson::Document DocumentExecutor::delete_document(const std::string& database,
                                                 const std::string& collection,
                                                 const bson::Value& query) const
{
    require_dangerous(kWriteRequiresDangerous);
    validate_namespace(database, collection);
    const bson::Document filter = prepare_query(query);

    auto outcome = dispatch("Delete failed",
                            [&] { return store_.delete_many(database, collection, filter); });

    infra::Logger::log(infra::LogLevel::INFO, "Executor: Deleted " +
                                                  std::to_string(outcome.deleted) +
                                                  " document(s) from " + database + "." +
                                                  collection);
    return bson::Document{{"deletedCount", outcome.deleted},
                          {"acknowledged", outcome.acknowledged}};
}

} // namespace docgate::executor
