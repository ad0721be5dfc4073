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
 * @file gateway_test.cpp
 * @brief Tests of the tool registry and its argument checks.
 */

#include "docgate/error.hpp"
#include "docgate/gateway/gateway.hpp"
#include "framework.hpp"
#include "recording_store.hpp"
#include "test_util.hpp"

#include <string>

using namespace docgate;
using docgate::gateway::Gateway;
using docgate::gateway::InvalidArguments;
using docgate::gateway::UnknownTool;
using docgate::test::doc;
using docgate::test::json;
using docgate::test::RecordingStore;

void test_gateway_catalog_order()
{
    RecordingStore store;
    Gateway gateway(store, security::PolicyConfig{});

    const auto& tools = gateway.tools();
    ASSERT_EQ(tools.size(), static_cast<std::size_t>(14));
    ASSERT_EQ(tools.front().name, std::string("list_databases"));
    ASSERT_EQ(tools.back().name, std::string("create_index"));

    for (const auto& tool : tools) {
        ASSERT_FALSE(tool.description.empty());
        ASSERT_EQ(tool.input_schema.find("type")->as_string(), std::string("object"));
    }
}

void test_gateway_schema_lists_required_arguments()
{
    RecordingStore store;
    Gateway gateway(store, security::PolicyConfig{});

    for (const auto& tool : gateway.tools()) {
        if (tool.name == "update_document") {
            ASSERT_EQ(json(*tool.input_schema.find("required")),
                      std::string(R"(["database","collection","query","update"])"));
        }
    }
}

void test_gateway_unknown_tool()
{
    RecordingStore store;
    Gateway gateway(store, security::PolicyConfig{});

    ASSERT_THROWS(UnknownTool, gateway.call("drop_database", doc(R"({"database":"x"})")));
}

void test_gateway_argument_checks()
{
    RecordingStore store;
    Gateway gateway(store, security::PolicyConfig{});

    ASSERT_THROWS(InvalidArguments, gateway.call("list_collections", bson::Document{}));
    ASSERT_THROWS(InvalidArguments, gateway.call("list_collections", doc(R"({"database":7})")));
    ASSERT_THROWS(InvalidArguments,
                  gateway.call("find_documents",
                               doc(R"({"database":"a","collection":"b","limit":"ten"})")));
    ASSERT_THROWS(InvalidArguments,
                  gateway.call("find_documents",
                               doc(R"({"database":"a","collection":"b","sort":[1]})")));
    ASSERT_THROWS(InvalidArguments,
                  gateway.call("aggregate_pipeline", doc(R"({"database":"a","collection":"b"})")));
    ASSERT_TRUE(store.calls.empty());
}

/**
 * @brief An explicit `null` counts as an omitted optional argument.
 */
void test_gateway_null_means_absent()
{
    RecordingStore store;
    Gateway gateway(store, security::PolicyConfig{});

    gateway.call("find_documents",
                 doc(R"({"database":"a","collection":"b","query":null,"limit":null})"));
    ASSERT_EQ(store.calls.size(), static_cast<std::size_t>(1));
    ASSERT_EQ(json(*store.last_filter), std::string("{}"));
}

void test_gateway_structured_payload_reaches_validator()
{
    RecordingStore store;
    Gateway gateway(store, security::PolicyConfig{});

    ASSERT_THROWS(ValidationError,
                  gateway.call("count_documents",
                               doc(R"({"database":"a","collection":"b","query":"nope"})")));
    ASSERT_THROWS(PermissionDenied,
                  gateway.call("insert_document",
                               doc(R"({"database":"a","collection":"b","document":{"x":1}})")));
    ASSERT_TRUE(store.calls.empty());
}
