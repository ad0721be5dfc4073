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
 * @file bson_test.cpp
 * @brief Unit tests for the value tree and the JSON codec.
 */

#include "docgate/bson/json_codec.hpp"
#include "docgate/bson/value.hpp"
#include "docgate/error.hpp"
#include "framework.hpp"
#include "test_util.hpp"

#include <string>

using namespace docgate;
using docgate::test::json;
using docgate::test::parse;

/**
 * @brief Key order of objects must survive a parse/serialize cycle.
 */
void test_codec_preserves_key_order()
{
    const std::string text = R"({"z":1,"a":{"y":"s","b":[1,2.5,null,true]}})";
    ASSERT_EQ(json(parse(text)), text);
}

void test_codec_integral_numbers_are_int64()
{
    bson::Value v = parse(R"({"n":42,"d":2.5,"big":1e300})");
    const auto& d = v.as_document();
    ASSERT_TRUE(d.find("n")->is_int64());
    ASSERT_TRUE(d.find("d")->is_double());
    ASSERT_TRUE(d.find("big")->is_double());
}

/**
 * @brief Canonical extended JSON wrappers decode into their scalar kinds.
 */
void test_codec_extended_json()
{
    bson::Value v = parse(R"({
        "id": {"$oid": "507f1f77bcf86cd799439011"},
        "at": {"$date": "1970-01-02T00:00:00.5Z"},
        "ms": {"$date": {"$numberLong": "1000"}},
        "n": {"$numberLong": "9007199254740993"},
        "bin": {"$binary": {"base64": "Zm9v", "subType": "0"}}
    })");
    const auto& d = v.as_document();

    ASSERT_TRUE(d.find("id")->is_object_id());
    ASSERT_EQ(d.find("id")->as_object_id().to_string(), std::string("507f1f77bcf86cd799439011"));
    ASSERT_EQ(d.find("at")->as_date_time().millis, static_cast<std::int64_t>(86400500));
    ASSERT_EQ(d.find("ms")->as_date_time().millis, static_cast<std::int64_t>(1000));
    ASSERT_EQ(d.find("n")->as_int64(), static_cast<std::int64_t>(9007199254740993LL));
    ASSERT_EQ(d.find("bin")->as_binary().data.size(), static_cast<std::size_t>(3));

    // Above 2^53 the integer travels back as $numberLong.
    ASSERT_EQ(json(*d.find("n")), std::string(R"({"$numberLong":"9007199254740993"})"));
}

/**
 * @brief A wrapper with extra keys is an ordinary mapping, left for the validator.
 */
void test_codec_extended_json_needs_single_key()
{
    bson::Value v = parse(R"({"$oid":"507f1f77bcf86cd799439011","x":1})");
    ASSERT_TRUE(v.is_document());
    ASSERT_EQ(v.as_document().size(), static_cast<std::size_t>(2));
}

void test_codec_rejects_malformed_extended_json()
{
    ASSERT_THROWS(ValidationError, parse(R"({"$oid":"xyz"})"));
    ASSERT_THROWS(ValidationError, parse(R"({"$date":"yesterday"})"));
    ASSERT_THROWS(ValidationError, parse(R"({"$numberLong":"12a"})"));
    ASSERT_THROWS(ValidationError, parse(R"({"$binary":{"base64":"***","subType":"00"}})"));
}

void test_codec_rejects_syntax_errors()
{
    ASSERT_THROWS(ValidationError, parse("{\"a\": "));
}

void test_object_id_parse()
{
    auto oid = bson::ObjectId::parse("507F1F77BCF86CD799439011");
    ASSERT_TRUE(oid.has_value());
    ASSERT_EQ(oid->to_string(), std::string("507f1f77bcf86cd799439011"));
    ASSERT_FALSE(bson::ObjectId::parse("507f1f77").has_value());
    ASSERT_TRUE(bson::ObjectId::generate() != bson::ObjectId::generate());
}

void test_document_operations()
{
    bson::Document d;
    d.append("a", 1);
    d.append("b", "two");
    d.set("a", 3);
    ASSERT_EQ(d.size(), static_cast<std::size_t>(2));
    ASSERT_EQ(d.front().first, std::string("a"));
    ASSERT_EQ(d.find("a")->as_int64(), static_cast<std::int64_t>(3));

    ASSERT_TRUE(d.erase("a"));
    ASSERT_FALSE(d.erase("a"));
    ASSERT_FALSE(d.contains("a"));
    ASSERT_TRUE(d.find("missing") == nullptr);
}

/**
 * @brief Cross-type ordering: null < numbers < strings < objects < arrays.
 */
void test_value_compare()
{
    ASSERT_TRUE(bson::compare(bson::Value(1), bson::Value(1.0)) == 0);
    ASSERT_TRUE(bson::compare(bson::Value(1), bson::Value(2.5)) < 0);
    ASSERT_TRUE(bson::compare(bson::Value(), bson::Value(0)) < 0);
    ASSERT_TRUE(bson::compare(bson::Value(99), bson::Value("a")) < 0);
    ASSERT_TRUE(bson::compare(bson::Value("b"), bson::Value("a")) > 0);
    ASSERT_TRUE(bson::compare(parse(R"({"a":1})"), parse("[1]")) < 0);
}

void test_type_names()
{
    ASSERT_EQ(std::string(bson::type_name(bson::Type::OBJECT_ID)), std::string("objectId"));
    ASSERT_EQ(std::string(bson::type_name(bson::Type::INT64)), std::string("long"));
    ASSERT_EQ(std::string(bson::type_name(bson::Type::DOCUMENT)), std::string("object"));
}
