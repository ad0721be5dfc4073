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
 * @file memory_store_test.cpp
 * @brief Tests of the in-memory store backend.
 */

#include "docgate/store/memory_store.hpp"
#include "framework.hpp"
#include "test_util.hpp"

#include <chrono>
#include <string>
#include <vector>

using namespace docgate;
using docgate::store::FindOptions;
using docgate::store::IndexSpec;
using docgate::store::MemoryStore;
using docgate::store::StoreError;
using docgate::test::doc;
using docgate::test::json;
using docgate::test::parse;

namespace {

std::string render(const std::vector<bson::Document>& docs)
{
    bson::Array out(docs.begin(), docs.end());
    return json(out);
}

/// Three people in `hr.people`, inserted with explicit ids.
void seed_people(MemoryStore& store)
{
    store.insert_one("hr", "people", doc(R"({"_id":1,"name":"ann","age":31,"team":"a"})"));
    store.insert_one("hr", "people", doc(R"({"_id":2,"name":"bob","age":25,"team":"b"})"));
    store.insert_one("hr", "people", doc(R"({"_id":3,"name":"cid","age":40,"team":"a"})"));
}

} // namespace

// ============================================================================
//  READS
// ============================================================================

void test_store_find_filters_and_sorts()
{
    MemoryStore store(std::chrono::seconds(30));
    seed_people(store);

    FindOptions options;
    options.sort = doc(R"({"age":-1})");
    auto docs = store.find("hr", "people", doc(R"({"age":{"$gte":30}})"), options);

    ASSERT_EQ(docs.size(), static_cast<std::size_t>(2));
    ASSERT_EQ(json(docs[0]), std::string(R"({"_id":3,"name":"cid","age":40,"team":"a"})"));
    ASSERT_EQ(json(docs[1]), std::string(R"({"_id":1,"name":"ann","age":31,"team":"a"})"));
}

void test_store_find_skip_limit_projection()
{
    MemoryStore store(std::chrono::seconds(30));
    seed_people(store);

    FindOptions options;
    options.sort = doc(R"({"_id":1})");
    options.skip = 1;
    options.limit = 1;
    options.projection = doc(R"({"name":1,"_id":0})");
    auto docs = store.find("hr", "people", bson::Document{}, options);

    ASSERT_EQ(render(docs), std::string(R"([{"name":"bob"}])"));
}

void test_store_find_rejects_negative_paging()
{
    MemoryStore store(std::chrono::seconds(30));
    seed_people(store);

    FindOptions options;
    options.skip = -1;
    ASSERT_THROWS(StoreError, store.find("hr", "people", bson::Document{}, options));
}

void test_store_missing_collection_reads_empty()
{
    MemoryStore store(std::chrono::seconds(30));

    ASSERT_TRUE(store.find("nowhere", "none", bson::Document{}, FindOptions{}).empty());
    ASSERT_FALSE(store.find_one("nowhere", "none", bson::Document{}, std::nullopt).has_value());
    ASSERT_EQ(store.count("nowhere", "none", bson::Document{}), static_cast<std::int64_t>(0));
    ASSERT_TRUE(store.list_indexes("nowhere", "none").empty());
    ASSERT_TRUE(store.list_collections("nowhere").empty());
}

void test_store_find_one_and_count()
{
    MemoryStore store(std::chrono::seconds(30));
    seed_people(store);

    auto found = store.find_one("hr", "people", doc(R"({"team":"b"})"), doc(R"({"name":1})"));
    ASSERT_TRUE(found.has_value());
    ASSERT_EQ(json(*found), std::string(R"({"_id":2,"name":"bob"})"));

    ASSERT_EQ(store.count("hr", "people", doc(R"({"team":"a"})")), static_cast<std::int64_t>(2));
    ASSERT_EQ(store.count("hr", "people", doc(R"({"$or":[{"age":25},{"name":"cid"}]})")),
              static_cast<std::int64_t>(2));
}

void test_store_exhausted_budget_aborts_scan()
{
    MemoryStore store(std::chrono::seconds(0));
    store.insert_one("hr", "people", doc(R"({"_id":1})"));

    ASSERT_THROWS(StoreError, store.find("hr", "people", bson::Document{}, FindOptions{}));
    ASSERT_THROWS(StoreError, store.count("hr", "people", bson::Document{}));
}

void test_store_regex_bounds_subject_length()
{
    MemoryStore store(std::chrono::seconds(30));
    store.insert_one("hr", "notes", bson::Document{{"_id", 1}, {"text", std::string(64, 'a') + "c"}});

    ASSERT_EQ(store.count("hr", "notes", doc(R"({"text":{"$regex":"(a|b)*c"}})")),
              static_cast<std::int64_t>(1));

    store.insert_one("hr", "notes",
                     bson::Document{{"_id", 2}, {"text", std::string(20000, 'a')}});
    ASSERT_THROWS(StoreError, store.count("hr", "notes", doc(R"({"text":{"$regex":"(a|b)*c"}})")));
}

// ============================================================================
//  WRITES
// ============================================================================

void test_store_insert_generates_object_id()
{
    MemoryStore store(std::chrono::seconds(30));
    auto outcome = store.insert_one("hr", "people", doc(R"({"name":"dee"})"));

    ASSERT_TRUE(outcome.inserted_id.is_object_id());
    ASSERT_TRUE(outcome.acknowledged);

    auto stored = store.find_one("hr", "people", bson::Document{}, std::nullopt);
    ASSERT_TRUE(stored.has_value());
    ASSERT_EQ(stored->front().first, std::string("_id"));
    ASSERT_TRUE(bson::compare(stored->front().second, outcome.inserted_id) == 0);
}

void test_store_insert_rejects_duplicate_id()
{
    MemoryStore store(std::chrono::seconds(30));
    seed_people(store);

    ASSERT_THROWS(StoreError, store.insert_one("hr", "people", doc(R"({"_id":2})")));
    ASSERT_EQ(store.count("hr", "people", bson::Document{}), static_cast<std::int64_t>(3));
}

void test_store_update_operators()
{
    MemoryStore store(std::chrono::seconds(30));
    seed_people(store);

    auto outcome = store.update_many(
        "hr", "people", doc(R"({"_id":1})"),
        doc(R"({"$set":{"team":"c"},"$inc":{"age":1},"$unset":{"name":""},"$push":{"tags":"x"}})"),
        false);

    ASSERT_EQ(outcome.matched, static_cast<std::int64_t>(1));
    ASSERT_EQ(outcome.modified, static_cast<std::int64_t>(1));
    ASSERT_FALSE(outcome.upserted_id.has_value());

    auto updated = store.find_one("hr", "people", doc(R"({"_id":1})"), std::nullopt);
    ASSERT_EQ(json(*updated), std::string(R"({"_id":1,"age":32,"team":"c","tags":["x"]})"));
}

void test_store_update_counts_unchanged_matches()
{
    MemoryStore store(std::chrono::seconds(30));
    seed_people(store);

    auto outcome =
        store.update_many("hr", "people", doc(R"({"team":"a"})"), doc(R"({"$set":{"age":40}})"),
                          false);

    ASSERT_EQ(outcome.matched, static_cast<std::int64_t>(2));
    ASSERT_EQ(outcome.modified, static_cast<std::int64_t>(1));
}

void test_store_upsert_seeds_from_filter()
{
    MemoryStore store(std::chrono::seconds(30));
    seed_people(store);

    auto outcome = store.update_many("hr", "people", doc(R"({"name":"eve","age":{"$gt":5}})"),
                                     doc(R"({"$set":{"team":"z"}})"), true);

    ASSERT_EQ(outcome.matched, static_cast<std::int64_t>(0));
    ASSERT_TRUE(outcome.upserted_id.has_value());
    ASSERT_TRUE(outcome.upserted_id->is_object_id());

    auto created = store.find_one("hr", "people", doc(R"({"name":"eve"})"), doc(R"({"_id":0})"));
    ASSERT_TRUE(created.has_value());
    ASSERT_EQ(json(*created), std::string(R"({"name":"eve","team":"z"})"));
}

void test_store_update_rejects_malformed_specs()
{
    MemoryStore store(std::chrono::seconds(30));
    seed_people(store);
    const auto all = bson::Document{};

    ASSERT_THROWS(StoreError, store.update_many("hr", "people", all, doc(R"({"age":1})"), false));
    ASSERT_THROWS(StoreError,
                  store.update_many("hr", "people", all, doc(R"({"$rename":{"a":"b"}})"), false));
    ASSERT_THROWS(StoreError,
                  store.update_many("hr", "people", all, doc(R"({"$inc":{"name":1}})"), false));
    ASSERT_THROWS(StoreError,
                  store.update_many("hr", "people", all, doc(R"({"$set":{"_id":9}})"), false));

    // A failed update leaves every document untouched.
    ASSERT_EQ(store.count("hr", "people", doc(R"({"name":"ann"})")), static_cast<std::int64_t>(1));
}

void test_store_delete_many()
{
    MemoryStore store(std::chrono::seconds(30));
    seed_people(store);

    auto outcome = store.delete_many("hr", "people", doc(R"({"team":"a"})"));
    ASSERT_EQ(outcome.deleted, static_cast<std::int64_t>(2));
    ASSERT_EQ(store.count("hr", "people", bson::Document{}), static_cast<std::int64_t>(1));

    auto missing = store.delete_many("hr", "ghosts", bson::Document{});
    ASSERT_EQ(missing.deleted, static_cast<std::int64_t>(0));
}

// ============================================================================
//  INDEXES
// ============================================================================

void test_store_unique_index_enforced()
{
    MemoryStore store(std::chrono::seconds(30));
    store.insert_one("hr", "people", doc(R"({"_id":1,"email":"a@x"})"));

    IndexSpec spec;
    spec.keys = doc(R"({"email":1})");
    spec.unique = true;
    ASSERT_EQ(store.create_index("hr", "people", spec), std::string("email_1"));

    try {
        store.insert_one("hr", "people", doc(R"({"_id":2,"email":"a@x"})"));
        ASSERT_TRUE(false);
    } catch (const StoreError& e) {
        ASSERT_EQ(std::string(e.what()),
                  std::string("E11000 duplicate key error collection: hr.people index: email_1"));
    }
    ASSERT_EQ(store.count("hr", "people", bson::Document{}), static_cast<std::int64_t>(1));
}

void test_store_unique_index_rolled_back_on_conflict()
{
    MemoryStore store(std::chrono::seconds(30));
    store.insert_one("hr", "people", doc(R"({"_id":1,"email":"a@x"})"));
    store.insert_one("hr", "people", doc(R"({"_id":2,"email":"a@x"})"));

    IndexSpec spec;
    spec.keys = doc(R"({"email":1})");
    spec.unique = true;
    ASSERT_THROWS(StoreError, store.create_index("hr", "people", spec));
    ASSERT_EQ(store.list_indexes("hr", "people").size(), static_cast<std::size_t>(1));
}

void test_store_index_listing_and_recreation()
{
    MemoryStore store(std::chrono::seconds(30));

    IndexSpec spec;
    spec.keys = doc(R"({"team":1,"age":-1})");
    ASSERT_EQ(store.create_index("hr", "people", spec), std::string("team_1_age_-1"));
    ASSERT_EQ(store.create_index("hr", "people", spec), std::string("team_1_age_-1"));

    auto indexes = store.list_indexes("hr", "people");
    ASSERT_EQ(indexes.size(), static_cast<std::size_t>(2));
    ASSERT_EQ(json(indexes[0]), std::string(R"({"v":2,"key":{"_id":1},"name":"_id_"})"));
    ASSERT_EQ(json(indexes[1]),
              std::string(R"({"v":2,"key":{"team":1,"age":-1},"name":"team_1_age_-1"})"));

    IndexSpec renamed = spec;
    renamed.name = "other";
    ASSERT_THROWS(StoreError, store.create_index("hr", "people", renamed));

    IndexSpec bad;
    bad.keys = doc(R"({"$where":1})");
    ASSERT_THROWS(StoreError, store.create_index("hr", "people", bad));
}

// ============================================================================
//  METADATA
// ============================================================================

void test_store_metadata()
{
    MemoryStore store(std::chrono::seconds(30));
    seed_people(store);
    store.insert_one("hr", "teams", doc(R"({"_id":"a"})"));
    store.insert_one("ops", "logs", doc(R"({"_id":1})"));

    auto databases = store.list_databases();
    ASSERT_EQ(databases.size(), static_cast<std::size_t>(2));
    ASSERT_EQ(databases[0].find("name")->as_string(), std::string("hr"));
    ASSERT_FALSE(databases[0].find("empty")->as_bool());

    auto collections = store.list_collections("hr");
    ASSERT_EQ(collections.size(), static_cast<std::size_t>(2));
    ASSERT_EQ(collections[0], std::string("people"));
    ASSERT_EQ(collections[1], std::string("teams"));

    auto stats = store.collection_stats("hr", "people");
    ASSERT_EQ(stats.find("ns")->as_string(), std::string("hr.people"));
    ASSERT_EQ(stats.find("count")->as_int64(), static_cast<std::int64_t>(3));
    ASSERT_EQ(stats.find("nindexes")->as_int64(), static_cast<std::int64_t>(1));
    ASSERT_TRUE(stats.find("size")->as_int64() > 0);
    ASSERT_EQ(stats.find("avgObjSize")->as_int64(), stats.find("size")->as_int64() / 3);

    auto db_stats = store.database_stats("hr");
    ASSERT_EQ(db_stats.find("collections")->as_int64(), static_cast<std::int64_t>(2));
    ASSERT_EQ(db_stats.find("objects")->as_int64(), static_cast<std::int64_t>(4));
    ASSERT_EQ(db_stats.find("indexes")->as_int64(), static_cast<std::int64_t>(2));

    auto empty_stats = store.database_stats("missing");
    ASSERT_EQ(empty_stats.find("objects")->as_int64(), static_cast<std::int64_t>(0));
}

// ============================================================================
//  AGGREGATION
// ============================================================================

void test_store_aggregate_group()
{
    MemoryStore store(std::chrono::seconds(30));
    seed_people(store);

    auto out = store.aggregate(
        "hr", "people",
        parse(R"([{"$group":{"_id":"$team","n":{"$sum":1},"oldest":{"$max":"$age"}}},)"
              R"({"$sort":{"_id":1}}])")
            .as_array());

    ASSERT_EQ(render(out),
              std::string(R"([{"_id":"a","n":2,"oldest":40},{"_id":"b","n":1,"oldest":25}])"));
}

void test_store_aggregate_unwind_and_count()
{
    MemoryStore store(std::chrono::seconds(30));
    store.insert_one("hr", "people", doc(R"({"_id":1,"skills":["c","go"]})"));
    store.insert_one("hr", "people", doc(R"({"_id":2,"skills":[]})"));
    store.insert_one("hr", "people", doc(R"({"_id":3,"skills":["sql"]})"));

    auto unwound = store.aggregate(
        "hr", "people", parse(R"([{"$unwind":"$skills"},{"$project":{"skills":1}}])").as_array());
    ASSERT_EQ(render(unwound), std::string(R"([{"_id":1,"skills":"c"},{"_id":1,"skills":"go"},)"
                                           R"({"_id":3,"skills":"sql"}])"));

    auto counted = store.aggregate(
        "hr", "people", parse(R"([{"$unwind":"$skills"},{"$count":"total"}])").as_array());
    ASSERT_EQ(render(counted), std::string(R"([{"total":3}])"));
}

void test_store_aggregate_lookup_and_facet()
{
    MemoryStore store(std::chrono::seconds(30));
    seed_people(store);
    store.insert_one("hr", "teams", doc(R"({"_id":"a","floor":2})"));

    auto joined = store.aggregate(
        "hr", "people",
        parse(R"([{"$match":{"_id":1}},)"
              R"({"$lookup":{"from":"teams","localField":"team","foreignField":"_id","as":"t"}},)"
              R"({"$project":{"t":1,"_id":0}}])")
            .as_array());
    ASSERT_EQ(render(joined), std::string(R"([{"t":[{"_id":"a","floor":2}]}])"));

    auto faceted = store.aggregate(
        "hr", "people",
        parse(R"([{"$facet":{"young":[{"$match":{"age":{"$lt":30}}},{"$count":"n"}],)"
              R"("all":[{"$count":"n"}]}}])")
            .as_array());
    ASSERT_EQ(render(faceted), std::string(R"([{"young":[{"n":1}],"all":[{"n":3}]}])"));
}

void test_store_aggregate_out_replaces_target()
{
    MemoryStore store(std::chrono::seconds(30));
    seed_people(store);
    store.insert_one("hr", "archive", doc(R"({"_id":99})"));

    auto out = store.aggregate(
        "hr", "people", parse(R"([{"$match":{"team":"a"}},{"$out":"archive"}])").as_array());

    ASSERT_TRUE(out.empty());
    ASSERT_EQ(store.count("hr", "archive", bson::Document{}), static_cast<std::int64_t>(2));
    ASSERT_EQ(store.count("hr", "archive", doc(R"({"_id":99})")), static_cast<std::int64_t>(0));
}

void test_store_aggregate_rejects_bad_stages()
{
    MemoryStore store(std::chrono::seconds(30));
    seed_people(store);

    ASSERT_THROWS(StoreError, store.aggregate("hr", "people", parse(R"([{"$nope":{}}])").as_array()));
    ASSERT_THROWS(StoreError,
                  store.aggregate("hr", "people", parse(R"([{"$merge":"x"}])").as_array()));
    ASSERT_THROWS(StoreError, store.aggregate("hr", "people",
                                              parse(R"([{"$out":"x"},{"$match":{}}])").as_array()));
    ASSERT_THROWS(StoreError,
                  store.aggregate("hr", "people", parse(R"([{"$limit":0}])").as_array()));
}
