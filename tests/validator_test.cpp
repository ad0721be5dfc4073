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
 * @file validator_test.cpp
 * @brief Unit tests for operator, stage and namespace allowlists.
 *
 * @details
 * Each rejection is checked for the offender and location it reports, since those are
 * the only parts of a rejected request that reach the logs and the caller.
 */

#include "docgate/error.hpp"
#include "docgate/security/validator.hpp"
#include "framework.hpp"
#include "test_util.hpp"

#include <string>

using namespace docgate;
using docgate::security::AggregationValidator;
using docgate::security::NamespaceValidator;
using docgate::security::QueryValidator;
using docgate::test::parse;

namespace {

/// Runs `fn` and returns the ValidationError it raised.
template <typename Fn> ValidationError capture(Fn fn)
{
    try {
        fn();
    } catch (const ValidationError& e) {
        return e;
    }
    return ValidationError("no error raised");
}

bson::Value stages(std::size_t n)
{
    bson::Array out;
    for (std::size_t i = 0; i < n; ++i) {
        out.push_back(bson::Document{{"$skip", 0}});
    }
    return out;
}

} // namespace

void test_query_where_depends_on_mode()
{
    const bson::Value query = parse(R"({"$where":"this.a > 1"})");
    ASSERT_THROWS(ValidationError, QueryValidator::validate(query, false));
    QueryValidator::validate(query, true);
}

void test_query_unknown_operator_always_rejected()
{
    const bson::Value query = parse(R"({"a":{"$custom":1}})");
    ASSERT_THROWS(ValidationError, QueryValidator::validate(query, false));
    ASSERT_THROWS(ValidationError, QueryValidator::validate(query, true));
}

void test_query_safe_operators_accepted()
{
    QueryValidator::validate(parse(R"({"age":{"$gt":18}})"), false);
    QueryValidator::validate(
        parse(R"({"$or":[{"a":{"$in":[1,2]}},{"b":{"$not":{"$regex":"^x"}}}],"c":{"$exists":true}})"),
        false);
}

/**
 * @brief Operators nested in arrays report an indexed path.
 */
void test_query_rejection_location()
{
    const bson::Value query = parse(R"({"$or":[{"a":1},{"age":{"$expr":1}}]})");
    auto e = capture([&] { QueryValidator::validate(query, false); });
    ASSERT_EQ(e.offender(), std::string("$expr"));
    ASSERT_EQ(e.location(), std::string("$or[1].age.$expr"));
}

void test_query_must_be_object()
{
    ASSERT_THROWS(ValidationError, QueryValidator::validate(parse("[1,2]"), false));
}

void test_pipeline_length_bound()
{
    AggregationValidator::validate(stages(20), false, 20);
    ASSERT_THROWS(ValidationError, AggregationValidator::validate(stages(21), false, 20));
}

/**
 * @brief `$out` after a harmless `$match` is still refused in safe mode.
 */
void test_pipeline_out_rejected_in_safe_mode()
{
    const bson::Value pipeline = parse(R"([{"$match":{"status":"active"}},{"$out":"archive"}])");
    auto e = capture([&] { AggregationValidator::validate(pipeline, false, 20); });
    ASSERT_EQ(e.offender(), std::string("$out"));
    ASSERT_EQ(e.location(), std::string("pipeline[1]"));
    ASSERT_TRUE(std::string(e.what()).find("$out") != std::string::npos);

    AggregationValidator::validate(pipeline, true, 20);
}

void test_pipeline_stage_shape()
{
    ASSERT_THROWS(ValidationError,
                  AggregationValidator::validate(parse(R"({"$match":{}})"), false, 20));
    ASSERT_THROWS(ValidationError, AggregationValidator::validate(parse("[1]"), false, 20));
    ASSERT_THROWS(ValidationError,
                  AggregationValidator::validate(parse(R"([{"$match":{},"$sort":{"a":1}}])"),
                                                 false, 20));
    ASSERT_THROWS(ValidationError,
                  AggregationValidator::validate(parse(R"([{"$unknown":{}}])"), true, 20));
}

void test_namespace_names()
{
    NamespaceValidator::validate_database("shop-2024_eu");
    ASSERT_THROWS(ValidationError, NamespaceValidator::validate_database(""));
    ASSERT_THROWS(ValidationError, NamespaceValidator::validate_database(std::string(65, 'a')));
    ASSERT_THROWS(ValidationError, NamespaceValidator::validate_collection("users.$cmd"));

    auto e = capture([] { NamespaceValidator::validate_collection("a b"); });
    ASSERT_EQ(e.location(), std::string("collection"));
}
