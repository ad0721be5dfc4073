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
 * @file dispatcher.hpp
 * @brief JSON-RPC 2.0 adapter in front of the gateway.
 *
 * @details
 * Declares the `Dispatcher`, the protocol layer between the line transport and the
 * `Gateway`. It decodes one request envelope, routes the method, and encodes either a
 * `result` or an `error` object. It performs no validation of tool payloads.
 *
 * **Error codes:**
 * | Code   | Cause                                |
 * |--------|--------------------------------------|
 * | -32700 | Unparseable JSON                     |
 * | -32600 | Not a JSON-RPC 2.0 request object    |
 * | -32601 | Unknown method or tool               |
 * | -32602 | Missing or mistyped parameters       |
 * | -32001 | ValidationError                      |
 * | -32002 | SanitizationError                    |
 * | -32003 | PermissionDenied                     |
 * | -32004 | ExecutionFailed                      |
 * | -32603 | Anything else                        |
 *
 * Every error object carries `data.type` naming the failure class.
 */

#pragma once

#include "docgate/bson/value.hpp"
#include "docgate/gateway/gateway.hpp"

#include <cJSON.h>

#include <optional>
#include <string>

namespace docgate::network {

/**
 * @class Dispatcher
 * @brief Turns request lines into response lines.
 */
class Dispatcher {
  public:
    explicit Dispatcher(const gateway::Gateway& gateway);

    /**
     * @brief Processes one request.
     *
     * @param raw_json A single JSON-RPC message.
     * @return The serialized response, or `std::nullopt` for a notification (no `id`).
     *
     * @code
     * // Request:
     * {"jsonrpc": "2.0", "id": 7, "method": "tools/call",
     *  "params": {"name": "count_documents",
     *             "arguments": {"database": "shop", "collection": "orders"}}}
     * // Response:
     * {"jsonrpc": "2.0", "id": 7, "result": {"content": [{"type": "text", "text": "42"}]}}
     * @endcode
     */
    std::optional<std::string> process(const std::string& raw_json);

    /// @brief True once a `shutdown` request has been answered.
    bool shutdown_requested() const { return shutdown_requested_; }

  private:
    /// @brief Runs one method. Throws on failure; the caller encodes the error.
    bson::Value route(const std::string& method, const cJSON* params);

    bson::Value call_tool(const cJSON* params) const;

    const gateway::Gateway& gateway_;
    bool shutdown_requested_ = false;
};

} // namespace docgate::network
