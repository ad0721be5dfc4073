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
 * @file gateway.cpp
 * @brief Tool catalog and argument decoding.
 */

#include "docgate/gateway/gateway.hpp"

#include "docgate/infra/logger.hpp"

#include <cmath>
#include <initializer_list>
#include <optional>
#include <utility>

namespace docgate::gateway {

namespace {

// ============================================================================
//  ARGUMENT DECODING
// ============================================================================

const bson::Value* present(const bson::Document& args, const std::string& key)
{
    const bson::Value* value = args.find(key);
    if (value == nullptr || value->is_null()) {
        return nullptr;
    }
    return value;
}

const bson::Value& required(const bson::Document& args, const std::string& key)
{
    const bson::Value* value = present(args, key);
    if (value == nullptr) {
        throw InvalidArguments("Missing required argument: '" + key + "'");
    }
    return *value;
}

std::string required_string(const bson::Document& args, const std::string& key)
{
    const bson::Value& value = required(args, key);
    if (!value.is_string()) {
        throw InvalidArguments("Argument '" + key + "' must be a string");
    }
    return value.as_string();
}

bson::Value value_or(const bson::Document& args, const std::string& key, bson::Value fallback)
{
    const bson::Value* value = present(args, key);
    return value != nullptr ? *value : std::move(fallback);
}

std::optional<bson::Document> optional_document(const bson::Document& args,
                                                const std::string& key)
{
    const bson::Value* value = present(args, key);
    if (value == nullptr) {
        return std::nullopt;
    }
    if (!value->is_document()) {
        throw InvalidArguments("Argument '" + key + "' must be an object");
    }
    return value->as_document();
}

std::optional<std::int64_t> optional_integer(const bson::Document& args, const std::string& key)
{
    const bson::Value* value = present(args, key);
    if (value == nullptr) {
        return std::nullopt;
    }
    if (value->is_int64()) {
        return value->as_int64();
    }
    // JSON has one number type; integral doubles are accepted.
    if (value->is_double() && std::isfinite(value->as_double()) &&
        std::trunc(value->as_double()) == value->as_double() &&
        std::fabs(value->as_double()) < 9.0e15) {
        return static_cast<std::int64_t>(value->as_double());
    }
    throw InvalidArguments("Argument '" + key + "' must be an integer");
}

bool optional_bool(const bson::Document& args, const std::string& key, bool fallback)
{
    const bson::Value* value = present(args, key);
    if (value == nullptr) {
        return fallback;
    }
    if (!value->is_bool()) {
        throw InvalidArguments("Argument '" + key + "' must be a boolean");
    }
    return value->as_bool();
}

std::optional<std::string> optional_string(const bson::Document& args, const std::string& key)
{
    const bson::Value* value = present(args, key);
    if (value == nullptr) {
        return std::nullopt;
    }
    if (!value->is_string()) {
        throw InvalidArguments("Argument '" + key + "' must be a string");
    }
    return value->as_string();
}

// ============================================================================
//  INPUT SCHEMAS
// ============================================================================

struct Property {
    const char* name;
    const char* type;
    const char* description;
};

const Property kDatabase{"database", "string", "Database name"};
const Property kCollection{"collection", "string", "Collection name"};
const Property kQuery{"query", "object", "Filter document"};

bson::Document schema(std::initializer_list<Property> properties,
                      std::initializer_list<const char*> required_names)
{
    bson::Document props;
    for (const auto& p : properties) {
        props.append(p.name, bson::Document{{"type", p.type}, {"description", p.description}});
    }
    bson::Array names;
    for (const char* name : required_names) {
        names.push_back(name);
    }
    return bson::Document{
        {"type", "object"}, {"properties", std::move(props)}, {"required", std::move(names)}};
}

} // namespace

// ============================================================================
//  REGISTRY
// ============================================================================

Gateway::Gateway(store::Store& store, const security::PolicyConfig& policy)
    : documents_(store, policy), aggregations_(store, policy), metadata_(store, policy)
{
    add({"list_databases", "List all databases with their size", schema({}, {})},
        [this](const bson::Document&) -> bson::Value { return metadata_.list_databases(); });

    add({"get_database_stats", "Get storage statistics for a database",
         schema({kDatabase}, {"database"})},
        [this](const bson::Document& args) -> bson::Value {
            return metadata_.get_database_stats(required_string(args, "database"));
        });

    add({"list_collections", "List the collections of a database",
         schema({kDatabase}, {"database"})},
        [this](const bson::Document& args) -> bson::Value {
            return metadata_.list_collections(required_string(args, "database"));
        });

    add({"describe_collection", "Describe a collection: indexes, statistics and sample schema",
         schema({kDatabase, kCollection}, {"database", "collection"})},
        [this](const bson::Document& args) -> bson::Value {
            return metadata_.describe_collection(required_string(args, "database"),
                                                 required_string(args, "collection"));
        });

    add({"get_collection_stats", "Get storage statistics for a collection",
         schema({kDatabase, kCollection}, {"database", "collection"})},
        [this](const bson::Document& args) -> bson::Value {
            return metadata_.get_collection_stats(required_string(args, "database"),
                                                  required_string(args, "collection"));
        });

    add({"list_indexes", "List the indexes of a collection",
         schema({kDatabase, kCollection}, {"database", "collection"})},
        [this](const bson::Document& args) -> bson::Value {
            return metadata_.list_indexes(required_string(args, "database"),
                                          required_string(args, "collection"));
        });

    add({"find_documents", "Find documents matching a filter",
         schema({kDatabase, kCollection, kQuery,
                 {"projection", "object", "Fields to include or exclude"},
                 {"sort", "object", "Sort specification"},
                 {"limit", "integer", "Maximum number of documents (default 100)"},
                 {"skip", "integer", "Number of documents to skip"}},
                {"database", "collection"})},
        [this](const bson::Document& args) -> bson::Value {
            executor::FindRequest request;
            request.database = required_string(args, "database");
            request.collection = required_string(args, "collection");
            request.query = value_or(args, "query", bson::Document{});
            request.projection = optional_document(args, "projection");
            request.sort = optional_document(args, "sort");
            request.limit = optional_integer(args, "limit");
            request.skip = optional_integer(args, "skip").value_or(0);
            return documents_.find_documents(request);
        });

    add({"find_one_document", "Find the first document matching a filter",
         schema({kDatabase, kCollection, kQuery,
                 {"projection", "object", "Fields to include or exclude"}},
                {"database", "collection"})},
        [this](const bson::Document& args) -> bson::Value {
            return documents_.find_one_document(required_string(args, "database"),
                                                required_string(args, "collection"),
                                                value_or(args, "query", bson::Document{}),
                                                optional_document(args, "projection"));
        });

    add({"count_documents", "Count documents matching a filter",
         schema({kDatabase, kCollection, kQuery}, {"database", "collection"})},
        [this](const bson::Document& args) -> bson::Value {
            return documents_.count_documents(required_string(args, "database"),
                                              required_string(args, "collection"),
                                              value_or(args, "query", bson::Document{}));
        });

    add({"aggregate_pipeline", "Run an aggregation pipeline",
         schema({kDatabase, kCollection, {"pipeline", "array", "Aggregation stages"},
                 {"limit", "integer", "Maximum number of results (default 100)"}},
                {"database", "collection", "pipeline"})},
        [this](const bson::Document& args) -> bson::Value {
            return aggregations_.aggregate_pipeline(
                required_string(args, "database"), required_string(args, "collection"),
                required(args, "pipeline"), optional_integer(args, "limit"));
        });

    add({"insert_document", "Insert one document (requires dangerous mode)",
         schema({kDatabase, kCollection, {"document", "object", "Document to insert"}},
                {"database", "collection", "document"})},
        [this](const bson::Document& args) -> bson::Value {
            return documents_.insert_document(required_string(args, "database"),
                                              required_string(args, "collection"),
                                              required(args, "document"));
        });

    add({"update_document", "Update documents matching a filter (requires dangerous mode)",
         schema({kDatabase, kCollection, kQuery,
                 {"update", "object", "Update operators"},
                 {"upsert", "boolean", "Insert when nothing matches"}},
                {"database", "collection", "query", "update"})},
        [this](const bson::Document& args) -> bson::Value {
            return documents_.update_document(
                required_string(args, "database"), required_string(args, "collection"),
                required(args, "query"), required(args, "update"),
                optional_bool(args, "upsert", false));
        });

    add({"delete_document", "Delete documents matching a filter (requires dangerous mode)",
         schema({kDatabase, kCollection, kQuery}, {"database", "collection", "query"})},
        [this](const bson::Document& args) -> bson::Value {
            return documents_.delete_document(required_string(args, "database"),
                                              required_string(args, "collection"),
                                              required(args, "query"));
        });

    add({"create_index", "Create an index on a collection (requires dangerous mode)",
         schema({kDatabase, kCollection, {"keys", "object", "Index key pattern"},
                 {"name", "string", "Index name"},
                 {"unique", "boolean", "Reject duplicate keys"},
                 {"background", "boolean", "Build in the background (default true)"}},
                {"database", "collection", "keys"})},
        [this](const bson::Document& args) -> bson::Value {
            return aggregations_.create_index(
                required_string(args, "database"), required_string(args, "collection"),
                required(args, "keys"), optional_string(args, "name"),
                optional_bool(args, "unique", false), optional_bool(args, "background", true));
        });

    infra::Logger::log(infra::LogLevel::INFO, "Gateway: Registered " +
                                                  std::to_string(catalog_.size()) + " tools" +
                                                  (policy.dangerous_mode ? " (dangerous mode)"
                                                                         : " (safe mode)"));
}

void Gateway::add(ToolInfo info, Tool tool)
{
    registry_.emplace(info.name, std::move(tool));
    catalog_.push_back(std::move(info));
}

bson::Value Gateway::call(const std::string& name, const bson::Document& args) const
{
    auto it = registry_.find(name);
    if (it == registry_.end()) {
        infra::Logger::log(infra::LogLevel::WARN, "Gateway: Unknown tool '" + name + "'");
        throw UnknownTool(name);
    }
    infra::Logger::log(infra::LogLevel::DEBUG, "Gateway: Calling tool '" + name + "'");
    return it->second(args);
}

} // namespace docgate::gateway
