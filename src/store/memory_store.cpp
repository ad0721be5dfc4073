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
 * @file memory_store.cpp
 * @brief Implementation of the in-memory reference store.
 *
 * @details
 * Every read is a full scan under a shared lock; every write is staged on copies and
 * committed under an exclusive lock once all constraints hold, so a failed write leaves
 * the collection untouched.
 */

#include "docgate/store/memory_store.hpp"

#include "docgate/bson/json_codec.hpp"
#include "docgate/infra/logger.hpp"
#include "docgate/store/deadline.hpp"
#include "docgate/store/field_path.hpp"
#include "docgate/store/matcher.hpp"
#include "docgate/store/pipeline.hpp"

#include <algorithm>
#include <cmath>
#include <mutex>
#include <set>

namespace docgate::store {

namespace {

struct ValueLess {
    bool operator()(const bson::Value& a, const bson::Value& b) const
    {
        return bson::compare(a, b) < 0;
    }
};

const bson::Document& id_key_pattern()
{
    static const bson::Document keys{{"_id", 1}};
    return keys;
}

std::int64_t document_size(const bson::Document& doc)
{
    return static_cast<std::int64_t>(bson::JsonCodec::serialize(doc).size());
}

/// Tuple of the indexed values, `null` standing in for missing fields.
bson::Value index_key(const bson::Document& doc, const bson::Document& keys)
{
    bson::Array tuple;
    for (const auto& field : keys) {
        const bson::Value* value = FieldPath::get(doc, field.first);
        tuple.push_back(value ? *value : bson::Value(bson::Null{}));
    }
    return tuple;
}

std::string default_index_name(const bson::Document& keys)
{
    std::string name;
    for (const auto& [field, direction] : keys) {
        if (!name.empty()) {
            name += "_";
        }
        name += field + "_";
        if (direction.is_string()) {
            name += direction.as_string();
        } else {
            name += std::to_string(static_cast<std::int64_t>(direction.as_number()));
        }
    }
    return name;
}

/// Puts `_id` first, generating one if the document has none.
bson::Document with_identity(const bson::Document& doc)
{
    bson::Document out;
    const bson::Value* id = doc.find("_id");
    if (id && id->is_array()) {
        throw StoreError("The '_id' value cannot be of type array");
    }
    out.append("_id", id ? *id : bson::Value(bson::ObjectId::generate()));
    for (const auto& [key, value] : doc) {
        if (key != "_id") {
            out.append(key, value);
        }
    }
    return out;
}

// ============================================================================
//  Update operators
// ============================================================================

void require_update_shape(const bson::Document& update)
{
    if (update.empty()) {
        throw StoreError("Update document must not be empty");
    }
    for (const auto& [op, arg] : update) {
        if (op.empty() || op[0] != '$') {
            throw StoreError("Update document requires atomic operators");
        }
        if (op != "$set" && op != "$unset" && op != "$inc" && op != "$push") {
            throw StoreError("Unsupported update operator: " + op);
        }
        if (!arg.is_document()) {
            throw StoreError("Modifiers operate on fields but " + op + " was not an object");
        }
    }
}

void guard_id(const bson::Document& doc, const std::string& path, const bson::Value* next)
{
    if (path != "_id" && path.rfind("_id.", 0) != 0) {
        return;
    }
    const bson::Value* current = doc.find("_id");
    if (!next || !current || FieldPath::get(doc, path) == nullptr ||
        !Matcher::equals(*FieldPath::get(doc, path), *next)) {
        throw StoreError("Performing an update on the path '_id' would modify the immutable "
                         "field '_id'");
    }
}

void apply_update(bson::Document& doc, const bson::Document& update)
{
    for (const auto& [op, arg] : update) {
        for (const auto& [path, value] : arg.as_document()) {
            if (op == "$set") {
                guard_id(doc, path, &value);
                if (!FieldPath::set(doc, path, value)) {
                    throw StoreError("Cannot create field '" + path + "' in a non-object");
                }
            } else if (op == "$unset") {
                guard_id(doc, path, nullptr);
                FieldPath::erase(doc, path);
            } else if (op == "$inc") {
                if (!value.is_number()) {
                    throw StoreError("Cannot increment with non-numeric argument: " + path);
                }
                guard_id(doc, path, nullptr);
                const bson::Value* current = FieldPath::get(doc, path);
                bson::Value next = value;
                if (current) {
                    if (!current->is_number()) {
                        throw StoreError("Cannot apply $inc to a value of non-numeric type: " +
                                         path);
                    }
                    if (current->is_int64() && value.is_int64()) {
                        next = current->as_int64() + value.as_int64();
                    } else {
                        next = current->as_number() + value.as_number();
                    }
                }
                if (!FieldPath::set(doc, path, std::move(next))) {
                    throw StoreError("Cannot create field '" + path + "' in a non-object");
                }
            } else if (op == "$push") {
                guard_id(doc, path, nullptr);
                bson::Array items;
                if (value.is_document() && value.as_document().contains("$each")) {
                    const bson::Value* each = value.as_document().find("$each");
                    if (!each->is_array()) {
                        throw StoreError("The argument to $each must be an array");
                    }
                    items = each->as_array();
                } else {
                    items.push_back(value);
                }

                const bson::Value* current = FieldPath::get(doc, path);
                bson::Array next;
                if (current) {
                    if (!current->is_array()) {
                        throw StoreError("The field '" + path + "' must be an array");
                    }
                    next = current->as_array();
                }
                next.insert(next.end(), items.begin(), items.end());
                if (!FieldPath::set(doc, path, std::move(next))) {
                    throw StoreError("Cannot create field '" + path + "' in a non-object");
                }
            }
        }
    }
}

/// Equality fields of a filter, used to seed an upserted document.
void seed_from_filter(const bson::Document& filter, bson::Document& seed)
{
    for (const auto& [key, condition] : filter) {
        if (key == "$and" && condition.is_array()) {
            for (const auto& clause : condition.as_array()) {
                if (clause.is_document()) {
                    seed_from_filter(clause.as_document(), seed);
                }
            }
        } else if (!key.empty() && key[0] == '$') {
            continue;
        } else if (condition.is_document() && !condition.as_document().empty() &&
                   condition.as_document().front().first.rfind("$", 0) == 0) {
            if (const bson::Value* eq = condition.as_document().find("$eq")) {
                FieldPath::set(seed, key, *eq);
            }
        } else {
            FieldPath::set(seed, key, condition);
        }
    }
}

} // namespace

// ============================================================================
//  Lifecycle
// ============================================================================

MemoryStore::MemoryStore(std::chrono::seconds timeout) : timeout_(timeout)
{
    infra::Logger::log(infra::LogLevel::INFO, "Store: In-memory store online (timeout " +
                                                  std::to_string(timeout_.count()) + "s)");
}

MemoryStore::~MemoryStore()
{
    infra::Logger::log(infra::LogLevel::DEBUG, "Store: Releasing in-memory store");
}

// ============================================================================
//  Internal helpers
// ============================================================================

const MemoryStore::Collection* MemoryStore::lookup(const std::string& db,
                                                   const std::string& coll) const
{
    auto d = databases_.find(db);
    if (d == databases_.end()) {
        return nullptr;
    }
    auto c = d->second.find(coll);
    return c == d->second.end() ? nullptr : &c->second;
}

MemoryStore::Collection& MemoryStore::get_collection(const std::string& db,
                                                     const std::string& coll)
{
    auto& database = databases_[db];
    auto it = database.find(coll);
    if (it == database.end()) {
        infra::Logger::log(infra::LogLevel::DEBUG,
                           "Store: Creating collection " + db + "." + coll);
        it = database.emplace(coll, Collection{}).first;
    }
    return it->second;
}

/**
 * @brief Verifies every unique index over the would-be collection contents.
 *
 * @param candidates New document versions.
 * @param replaced Positions in `collection.documents` that the candidates supersede.
 */
void MemoryStore::check_unique(const std::string& coll, const Collection& collection,
                               const std::vector<bson::Document>& candidates,
                               const std::vector<std::size_t>& replaced) const
{
    const std::set<std::size_t> skip(replaced.begin(), replaced.end());

    auto verify = [&](const std::string& name, const bson::Document& keys) {
        std::set<bson::Value, ValueLess> seen;
        auto add = [&](const bson::Document& doc) {
            if (!seen.insert(index_key(doc, keys)).second) {
                throw StoreError("E11000 duplicate key error collection: " + coll +
                                 " index: " + name);
            }
        };
        for (std::size_t i = 0; i < collection.documents.size(); ++i) {
            if (skip.count(i) == 0) {
                add(collection.documents[i]);
            }
        }
        for (const auto& doc : candidates) {
            add(doc);
        }
    };

    verify("_id_", id_key_pattern());
    for (const auto& index : collection.indexes) {
        if (index.unique) {
            verify(index.name, index.keys);
        }
    }
}

std::vector<bson::Document> MemoryStore::scan(const Collection& collection,
                                              const bson::Document& filter,
                                              const FindOptions& options) const
{
    if (options.skip < 0) {
        throw StoreError("skip must be non-negative");
    }
    if (options.limit < 0) {
        throw StoreError("limit must be non-negative");
    }

    Deadline deadline(timeout_);
    const bool sorted = options.sort && !options.sort->empty();
    const auto wanted = static_cast<std::size_t>(options.skip + options.limit);

    std::vector<bson::Document> out;
    for (const auto& doc : collection.documents) {
        deadline.check();
        if (Matcher::matches(doc, filter)) {
            out.push_back(doc);
            // Without a sort the scan can stop once the page is complete.
            if (!sorted && options.limit > 0 && out.size() >= wanted) {
                break;
            }
        }
    }

    if (sorted) {
        Pipeline::sort(out, *options.sort);
    }

    const auto drop = std::min(out.size(), static_cast<std::size_t>(options.skip));
    out.erase(out.begin(), out.begin() + static_cast<std::ptrdiff_t>(drop));
    if (options.limit > 0 && out.size() > static_cast<std::size_t>(options.limit)) {
        out.resize(static_cast<std::size_t>(options.limit));
    }

    if (options.projection && !options.projection->empty()) {
        for (auto& doc : out) {
            doc = Pipeline::project(doc, *options.projection);
        }
    }
    return out;
}

std::vector<bson::Document> MemoryStore::run_pipeline(const std::string& db,
                                                      const std::string& coll,
                                                      const bson::Array& pipeline)
{
    Deadline deadline(timeout_);

    StageContext ctx;
    ctx.deadline = &deadline;
    ctx.load_collection = [this, &db](const std::string& name) {
        const Collection* c = lookup(db, name);
        return c ? c->documents : std::vector<bson::Document>{};
    };
    ctx.replace_collection = [this, &db](const std::string& name,
                                         std::vector<bson::Document> docs) {
        Collection& target = get_collection(db, name);
        for (auto& doc : docs) {
            doc = with_identity(doc);
        }
        std::vector<std::size_t> all(target.documents.size());
        for (std::size_t i = 0; i < all.size(); ++i) {
            all[i] = i;
        }
        check_unique(db + "." + name, target, docs, all);
        infra::Logger::log(infra::LogLevel::DEBUG, "Store: $out replaced " + db + "." + name +
                                                       " with " + std::to_string(docs.size()) +
                                                       " documents");
        target.documents = std::move(docs);
    };

    const Collection* source = lookup(db, coll);
    std::vector<bson::Document> input = source ? source->documents : std::vector<bson::Document>{};
    return Pipeline::run(std::move(input), pipeline, ctx);
}

// ============================================================================
//  Metadata
// ============================================================================

std::vector<bson::Document> MemoryStore::list_databases()
{
    std::shared_lock lock(rw_lock_);
    std::vector<bson::Document> out;
    for (const auto& [name, database] : databases_) {
        std::int64_t size = 0;
        bool empty = true;
        for (const auto& entry : database) {
            for (const auto& doc : entry.second.documents) {
                size += document_size(doc);
                empty = false;
            }
        }
        out.push_back(bson::Document{{"name", name}, {"sizeOnDisk", size}, {"empty", empty}});
    }
    return out;
}

bson::Document MemoryStore::database_stats(const std::string& db)
{
    std::shared_lock lock(rw_lock_);
    std::int64_t collections = 0;
    std::int64_t objects = 0;
    std::int64_t data_size = 0;
    std::int64_t indexes = 0;
    std::int64_t index_size = 0;

    auto d = databases_.find(db);
    if (d != databases_.end()) {
        for (const auto& entry : d->second) {
            const Collection& c = entry.second;
            collections++;
            indexes += 1 + static_cast<std::int64_t>(c.indexes.size());
            for (const auto& doc : c.documents) {
                objects++;
                data_size += document_size(doc);
                index_size += static_cast<std::int64_t>(
                    bson::JsonCodec::serialize(index_key(doc, id_key_pattern())).size());
                for (const auto& index : c.indexes) {
                    index_size += static_cast<std::int64_t>(
                        bson::JsonCodec::serialize(index_key(doc, index.keys)).size());
                }
            }
        }
    }

    return bson::Document{{"db", db},
                          {"collections", collections},
                          {"objects", objects},
                          {"avgObjSize", objects ? static_cast<double>(data_size) /
                                                       static_cast<double>(objects)
                                                 : 0.0},
                          {"dataSize", data_size},
                          {"storageSize", data_size},
                          {"indexes", indexes},
                          {"indexSize", index_size}};
}

std::vector<std::string> MemoryStore::list_collections(const std::string& db)
{
    std::shared_lock lock(rw_lock_);
    std::vector<std::string> out;
    auto d = databases_.find(db);
    if (d != databases_.end()) {
        for (const auto& entry : d->second) {
            out.push_back(entry.first);
        }
    }
    return out;
}

bson::Document MemoryStore::collection_stats(const std::string& db, const std::string& coll)
{
    std::shared_lock lock(rw_lock_);
    const Collection* c = lookup(db, coll);

    std::int64_t count = 0;
    std::int64_t size = 0;
    std::int64_t index_size = 0;
    std::int64_t nindexes = 0;
    if (c) {
        nindexes = 1 + static_cast<std::int64_t>(c->indexes.size());
        for (const auto& doc : c->documents) {
            count++;
            size += document_size(doc);
            index_size += static_cast<std::int64_t>(
                bson::JsonCodec::serialize(index_key(doc, id_key_pattern())).size());
            for (const auto& index : c->indexes) {
                index_size += static_cast<std::int64_t>(
                    bson::JsonCodec::serialize(index_key(doc, index.keys)).size());
            }
        }
    }

    return bson::Document{{"ns", db + "." + coll},
                          {"count", count},
                          {"size", size},
                          {"storageSize", size},
                          {"avgObjSize", count ? size / count : std::int64_t{0}},
                          {"nindexes", nindexes},
                          {"totalIndexSize", index_size}};
}

std::vector<bson::Document> MemoryStore::list_indexes(const std::string& db,
                                                      const std::string& coll)
{
    std::shared_lock lock(rw_lock_);
    std::vector<bson::Document> out;
    const Collection* c = lookup(db, coll);
    if (!c) {
        return out;
    }

    out.push_back(bson::Document{{"v", 2}, {"key", id_key_pattern()}, {"name", "_id_"}});
    for (const auto& index : c->indexes) {
        bson::Document entry{{"v", 2}, {"key", index.keys}, {"name", index.name}};
        if (index.unique) {
            entry.append("unique", true);
        }
        out.push_back(std::move(entry));
    }
    return out;
}

// ============================================================================
//  Reads
// ============================================================================

std::vector<bson::Document> MemoryStore::find(const std::string& db, const std::string& coll,
                                              const bson::Document& filter,
                                              const FindOptions& options)
{
    std::shared_lock lock(rw_lock_);
    const Collection* c = lookup(db, coll);
    if (!c) {
        return {};
    }
    infra::Logger::log(infra::LogLevel::TRACE, "Store: Scanning " + db + "." + coll);
    return scan(*c, filter, options);
}

std::optional<bson::Document> MemoryStore::find_one(const std::string& db,
                                                    const std::string& coll,
                                                    const bson::Document& filter,
                                                    const std::optional<bson::Document>& projection)
{
    FindOptions options;
    options.projection = projection;
    options.limit = 1;

    std::shared_lock lock(rw_lock_);
    const Collection* c = lookup(db, coll);
    if (!c) {
        return std::nullopt;
    }
    auto docs = scan(*c, filter, options);
    if (docs.empty()) {
        return std::nullopt;
    }
    return std::move(docs.front());
}

std::int64_t MemoryStore::count(const std::string& db, const std::string& coll,
                                const bson::Document& filter)
{
    std::shared_lock lock(rw_lock_);
    const Collection* c = lookup(db, coll);
    if (!c) {
        return 0;
    }

    Deadline deadline(timeout_);
    std::int64_t n = 0;
    for (const auto& doc : c->documents) {
        deadline.check();
        if (Matcher::matches(doc, filter)) {
            n++;
        }
    }
    return n;
}

std::vector<bson::Document> MemoryStore::aggregate(const std::string& db,
                                                   const std::string& coll,
                                                   const bson::Array& pipeline)
{
    if (Pipeline::writes(pipeline)) {
        std::unique_lock lock(rw_lock_);
        return run_pipeline(db, coll, pipeline);
    }
    std::shared_lock lock(rw_lock_);
    return run_pipeline(db, coll, pipeline);
}

// ============================================================================
//  Writes
// ============================================================================

InsertOutcome MemoryStore::insert_one(const std::string& db, const std::string& coll,
                                      const bson::Document& document)
{
    std::unique_lock lock(rw_lock_);
    bson::Document stored = with_identity(document);

    Collection& c = get_collection(db, coll);
    check_unique(db + "." + coll, c, {stored}, {});

    InsertOutcome outcome;
    outcome.inserted_id = *stored.find("_id");
    c.documents.push_back(std::move(stored));

    infra::Logger::log(infra::LogLevel::TRACE, "Store: Inserted document into " + db + "." +
                                                   coll);
    return outcome;
}

UpdateOutcome MemoryStore::update_many(const std::string& db, const std::string& coll,
                                       const bson::Document& filter, const bson::Document& update,
                                       bool upsert)
{
    require_update_shape(update);

    std::unique_lock lock(rw_lock_);
    UpdateOutcome outcome;
    Deadline deadline(timeout_);

    // 1. Stage new versions of every match.
    const Collection* existing = lookup(db, coll);
    std::vector<std::size_t> positions;
    std::vector<bson::Document> staged;
    if (existing) {
        for (std::size_t i = 0; i < existing->documents.size(); ++i) {
            deadline.check();
            const bson::Document& doc = existing->documents[i];
            if (!Matcher::matches(doc, filter)) {
                continue;
            }
            bson::Document next = doc;
            apply_update(next, update);
            outcome.matched++;
            if (next != doc) {
                outcome.modified++;
            }
            positions.push_back(i);
            staged.push_back(std::move(next));
        }
    }

    // 2. Upsert when nothing matched.
    if (outcome.matched == 0 && upsert) {
        bson::Document seed;
        seed_from_filter(filter, seed);
        apply_update(seed, update);
        bson::Document stored = with_identity(seed);

        Collection& c = get_collection(db, coll);
        check_unique(db + "." + coll, c, {stored}, {});
        outcome.upserted_id = *stored.find("_id");
        c.documents.push_back(std::move(stored));
        infra::Logger::log(infra::LogLevel::DEBUG, "Store: Upserted into " + db + "." + coll);
        return outcome;
    }

    if (staged.empty()) {
        return outcome;
    }

    // 3. Constraint check, then commit.
    Collection& c = get_collection(db, coll);
    check_unique(db + "." + coll, c, staged, positions);
    for (std::size_t i = 0; i < positions.size(); ++i) {
        c.documents[positions[i]] = std::move(staged[i]);
    }

    infra::Logger::log(infra::LogLevel::DEBUG, "Store: Updated " + std::to_string(outcome.modified) +
                                                   " document(s) in " + db + "." + coll);
    return outcome;
}

DeleteOutcome MemoryStore::delete_many(const std::string& db, const std::string& coll,
                                       const bson::Document& filter)
{
    std::unique_lock lock(rw_lock_);
    DeleteOutcome outcome;
    auto d = databases_.find(db);
    if (d == databases_.end() || d->second.count(coll) == 0) {
        return outcome;
    }

    Collection& c = d->second[coll];
    Deadline deadline(timeout_);
    std::vector<bson::Document> kept;
    kept.reserve(c.documents.size());
    for (auto& doc : c.documents) {
        deadline.check();
        if (Matcher::matches(doc, filter)) {
            outcome.deleted++;
        } else {
            kept.push_back(doc);
        }
    }
    c.documents = std::move(kept);

    infra::Logger::log(infra::LogLevel::DEBUG, "Store: Deleted " +
                                                   std::to_string(outcome.deleted) +
                                                   " document(s) from " + db + "." + coll);
    return outcome;
}

std::string MemoryStore::create_index(const std::string& db, const std::string& coll,
                                      const IndexSpec& spec)
{
    if (spec.keys.empty()) {
        throw StoreError("Index keys must not be empty");
    }
    for (const auto& [field, direction] : spec.keys) {
        const bool numeric = direction.is_number() && direction.as_number() != 0.0 &&
                             std::floor(direction.as_number()) == direction.as_number();
        if (field.empty() || field[0] == '$' || !(numeric || direction.is_string())) {
            throw StoreError("bad index key pattern for field '" + field + "'");
        }
    }

    const std::string name = spec.name ? *spec.name : default_index_name(spec.keys);
    if (name.empty()) {
        throw StoreError("Index name must not be empty");
    }

    std::unique_lock lock(rw_lock_);
    Collection& c = get_collection(db, coll);

    if (spec.keys == id_key_pattern() || name == "_id_") {
        if (name != "_id_" || spec.keys != id_key_pattern() || spec.unique) {
            throw StoreError("The _id_ index is implicit and cannot be redefined");
        }
        return name;
    }

    for (const auto& index : c.indexes) {
        if (index.name == name) {
            if (index.keys == spec.keys && index.unique == spec.unique) {
                return name;
            }
            throw StoreError("An existing index has the same name as the requested index "
                             "but different options: " + name);
        }
        if (index.keys == spec.keys) {
            throw StoreError("Index already exists with a different name: " + index.name);
        }
    }

    c.indexes.push_back({name, spec.keys, spec.unique});
    try {
        check_unique(db + "." + coll, c, {}, {});
    } catch (const StoreError&) {
        c.indexes.pop_back();
        throw;
    }

    infra::Logger::log(infra::LogLevel::INFO, "Index: Created " + name + " on " + db + "." + coll +
                                                  (spec.background ? " (background)" : ""));
    return name;
}

} // namespace docgate::store
