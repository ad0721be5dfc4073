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
 * @file metadata_executor.cpp
 * @brief Implementation of the introspection operations.
 */

#include "docgate/executor/metadata_executor.hpp"

#include "docgate/security/validator.hpp"

namespace docgate::executor {

namespace {

constexpr std::int64_t kSampleSize = 5;

bson::Value stat(const bson::Document& stats, const std::string& key)
{
    const bson::Value* value = stats.find(key);
    if (value == nullptr || !value->is_number()) {
        return std::int64_t{0};
    }
    return *value;
}

bson::Array to_array(std::vector<bson::Document> docs)
{
    bson::Array out;
    out.reserve(docs.size());
    for (auto& doc : docs) {
        out.push_back(std::move(doc));
    }
    return out;
}

} // namespace

MetadataExecutor::MetadataExecutor(store::Store& store, const security::PolicyConfig& policy)
    : OperationExecutor(store, policy)
{
}

bson::Array MetadataExecutor::list_databases() const
{
    return to_array(
        dispatch("Failed to list databases", [&] { return store_.list_databases(); }));
}

bson::Document MetadataExecutor::get_database_stats(const std::string& database) const
{
    security::NamespaceValidator::validate_database(database);
    const bson::Document stats = dispatch("Failed to get database stats",
                                          [&] { return store_.database_stats(database); });

    return bson::Document{{"database", database},
                          {"collections", stat(stats, "collections")},
                          {"objects", stat(stats, "objects")},
                          {"avgObjSize", stat(stats, "avgObjSize")},
                          {"dataSize", stat(stats, "dataSize")},
                          {"storageSize", stat(stats, "storageSize")},
                          {"indexes", stat(stats, "indexes")},
                          {"indexSize", stat(stats, "indexSize")}};
}

bson::Array MetadataExecutor::list_collections(const std::string& database) const
{
    security::NamespaceValidator::validate_database(database);
    const auto names = dispatch("Failed to list collections",
                                [&] { return store_.list_collections(database); });

    bson::Array out;
    out.reserve(names.size());
    for (const auto& name : names) {
        out.push_back(bson::Document{{"name", name}, {"type", "collection"}});
    }
    return out;
}

bson::Document MetadataExecutor::describe_collection(const std::string& database,
                                                     const std::string& collection) const
{
    validate_namespace(database, collection);

    return dispatch("Failed to describe collection", [&] {
        bson::Array indexes = to_array(store_.list_indexes(database, collection));
        const bson::Document stats = store_.collection_stats(database, collection);

        const bson::Array sample_pipeline{
            bson::Document{{"$sample", bson::Document{{"size", kSampleSize}}}}};
        bson::Array schema;
        for (const auto& doc : store_.aggregate(database, collection, sample_pipeline)) {
            const bson::Value* id = doc.find("_id");
            schema.push_back(bson::Document{
                {"_id", id != nullptr ? bson::type_name(id->type()) : "missing"}});
        }

        return bson::Document{{"collection", collection},
                              {"database", database},
                              {"indexes", std::move(indexes)},
                              {"stats", bson::Document{{"count", stat(stats, "count")},
                                                       {"size", stat(stats, "size")},
                                                       {"storageSize", stat(stats, "storageSize")},
                                                       {"avgObjSize", stat(stats, "avgObjSize")}}},
                              {"sampleSchema", std::move(schema)}};
    });
}

bson::Document MetadataExecutor::get_collection_stats(const std::string& database,
                                                      const std::string& collection) const
{
    validate_namespace(database, collection);
    const bson::Document stats = dispatch("Failed to get collection stats", [&] {
        return store_.collection_stats(database, collection);
    });

    return bson::Document{{"collection", collection},
                          {"database", database},
                          {"count", stat(stats, "count")},
                          {"size", stat(stats, "size")},
                          {"storageSize", stat(stats, "storageSize")},
                          {"avgObjSize", stat(stats, "avgObjSize")},
                          {"indexCount", stat(stats, "nindexes")},
                          {"indexSize", stat(stats, "totalIndexSize")}};
}

bson::Array MetadataExecutor::list_indexes(const std::string& database,
                                           const std::string& collection) const
{
    validate_namespace(database, collection);
    return to_array(dispatch("Failed to list indexes",
                             [&] { return store_.list_indexes(database, collection); }));
}

} // namespace docgate::executor
