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
 * @file gateway.hpp
 * @brief Named tool registry over the executors.
 *
 * @details
 * The `Gateway` is the only object the transport talks to. It maps a tool name and an
 * argument mapping onto one executor operation. Argument handling is limited to shape:
 * required names must be present strings, options must have the right type. Structured
 * payloads (`query`, `pipeline`, `document`, `update`, `keys`) are forwarded as received
 * and judged by the validator and sanitizer.
 */

#pragma once

#include "docgate/bson/value.hpp"
#include "docgate/executor/aggregation_executor.hpp"
#include "docgate/executor/document_executor.hpp"
#include "docgate/executor/metadata_executor.hpp"
#include "docgate/security/policy.hpp"
#include "docgate/store/store.hpp"

#include <functional>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

namespace docgate::gateway {

/// @brief The requested tool name is not registered.
class UnknownTool : public std::runtime_error {
  public:
    explicit UnknownTool(const std::string& name) : std::runtime_error("Unknown tool: " + name) {}
};

/// @brief A tool argument is missing or has the wrong type.
class InvalidArguments : public std::runtime_error {
  public:
    explicit InvalidArguments(const std::string& message) : std::runtime_error(message) {}
};

/**
 * @struct ToolInfo
 * @brief Catalog entry advertised by `tools/list`.
 */
struct ToolInfo {
    std::string name;
    std::string description;
    bson::Document input_schema;
};

/**
 * @class Gateway
 * @brief Owns one executor per entity and routes tool calls to them.
 */
class Gateway {
  public:
    Gateway(store::Store& store, const security::PolicyConfig& policy);

    // Registered tools capture `this`.
    Gateway(const Gateway&) = delete;
    Gateway& operator=(const Gateway&) = delete;

    /// @brief Registered tools, in catalog order.
    const std::vector<ToolInfo>& tools() const { return catalog_; }

    /**
     * @brief Runs one tool.
     *
     * @throws UnknownTool, InvalidArguments, docgate::Error
     */
    bson::Value call(const std::string& name, const bson::Document& args) const;

  private:
    using Tool = std::function<bson::Value(const bson::Document&)>;

    void add(ToolInfo info, Tool tool);

    executor::DocumentExecutor documents_;
    executor::AggregationExecutor aggregations_;
    executor::MetadataExecutor metadata_;

    std::vector<ToolInfo> catalog_;
    std::map<std::string, Tool> registry_;
};

} // namespace docgate::gateway
