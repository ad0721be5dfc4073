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
 * @file dispatcher.cpp
 * @brief Implementation of the JSON-RPC request pipeline.
 *
 * @details
 * `Dispatcher::process` runs every message through the same phases:
 * 1. **Ingest**: parse the line and check the 2.0 envelope.
 * 2. **Route**: select the method; for `tools/call`, decode the arguments into a value
 *    tree and hand them to the gateway.
 * 3. **Respond**: encode the result, or map the raised exception onto an error code.
 */

#include "docgate/network/dispatcher.hpp"

#include "docgate/bson/json_codec.hpp"
#include "docgate/error.hpp"
#include "docgate/infra/logger.hpp"
#include "docgate/version.hpp"

#include <stdexcept>
#include <utility>

namespace docgate::network {

namespace {

constexpr int kParseError = -32700;
constexpr int kInvalidRequest = -32600;
constexpr int kMethodNotFound = -32601;
constexpr int kInvalidParams = -32602;
constexpr int kInternalError = -32603;

/// @brief Protocol-level failure raised while routing.
class RpcFailure : public std::runtime_error {
  public:
    RpcFailure(int code, const std::string& type, const std::string& message)
        : std::runtime_error(message), code_(code), type_(type)
    {
    }

    int code() const { return code_; }
    const std::string& type() const { return type_; }

  private:
    int code_;
    std::string type_;
};

int code_for(ErrorKind kind)
{
    switch (kind) {
    case ErrorKind::VALIDATION:
        return -32001;
    case ErrorKind::SANITIZATION:
        return -32002;
    case ErrorKind::PERMISSION:
        return -32003;
    case ErrorKind::EXECUTION:
        return -32004;
    case ErrorKind::CONFIGURATION:
        break;
    }
    return kInternalError;
}

std::string result_envelope(const bson::Value& id, bson::Value result)
{
    return bson::JsonCodec::serialize(
        bson::Document{{"jsonrpc", "2.0"}, {"id", id}, {"result", std::move(result)}});
}

std::string error_envelope(const bson::Value& id, int code, const std::string& message,
                           bson::Document data)
{
    bson::Document error{{"code", code}, {"message", message}, {"data", std::move(data)}};
    return bson::JsonCodec::serialize(
        bson::Document{{"jsonrpc", "2.0"}, {"id", id}, {"error", std::move(error)}});
}

std::string error_envelope(const bson::Value& id, int code, const std::string& message,
                           const std::string& type)
{
    return error_envelope(id, code, message, bson::Document{{"type", type}});
}

} // namespace

Dispatcher::Dispatcher(const gateway::Gateway& gateway) : gateway_(gateway) {}

std::optional<std::string> Dispatcher::process(const std::string& raw_json)
{
    // 1. INGEST
    bson::CJsonPtr req(cJSON_Parse(raw_json.c_str()));
    if (!req) {
        infra::Logger::log(infra::LogLevel::WARN, "Dispatcher: Rejected unparseable message");
        return error_envelope(bson::Null{}, kParseError, "Parse error", "ParseError");
    }
    if (!cJSON_IsObject(req.get())) {
        return error_envelope(bson::Null{}, kInvalidRequest, "Invalid Request: expected an object",
                              "InvalidRequest");
    }

    const cJSON* id_node = cJSON_GetObjectItemCaseSensitive(req.get(), "id");
    if (id_node != nullptr && !cJSON_IsString(id_node) && !cJSON_IsNumber(id_node) &&
        !cJSON_IsNull(id_node)) {
        return error_envelope(bson::Null{}, kInvalidRequest,
                              "Invalid Request: 'id' must be a string, number or null",
                              "InvalidRequest");
    }
    const bool notification = (id_node == nullptr);
    const bson::Value id = bson::JsonCodec::from_cjson(id_node);

    const cJSON* version = cJSON_GetObjectItemCaseSensitive(req.get(), "jsonrpc");
    const cJSON* method = cJSON_GetObjectItemCaseSensitive(req.get(), "method");
    if (!cJSON_IsString(version) || std::string(version->valuestring) != "2.0" ||
        !cJSON_IsString(method) || method->valuestring == nullptr) {
        return error_envelope(id, kInvalidRequest,
                              "Invalid Request: expected jsonrpc \"2.0\" and a method name",
                              "InvalidRequest");
    }
    const std::string method_name = method->valuestring;
    const cJSON* params = cJSON_GetObjectItemCaseSensitive(req.get(), "params");

    // 2. ROUTE & 3. RESPOND
    std::string response;
    try {
        response = result_envelope(id, route(method_name, params));
    } catch (const RpcFailure& e) {
        response = error_envelope(id, e.code(), e.what(), e.type());
    } catch (const gateway::UnknownTool& e) {
        response = error_envelope(id, kMethodNotFound, e.what(), "UnknownTool");
    } catch (const gateway::InvalidArguments& e) {
        response = error_envelope(id, kInvalidParams, e.what(), "InvalidParams");
    } catch (const ValidationError& e) {
        bson::Document data{{"type", to_string(e.kind())}};
        if (!e.offender().empty()) {
            data.append("offender", e.offender());
        }
        if (!e.location().empty()) {
            data.append("location", e.location());
        }
        response = error_envelope(id, code_for(e.kind()), e.what(), std::move(data));
    } catch (const Error& e) {
        response = error_envelope(id, code_for(e.kind()), e.what(), to_string(e.kind()));
    } catch (const std::exception& e) {
        infra::Logger::log(infra::LogLevel::ERROR,
                           "Dispatcher: Internal error in '" + method_name + "': " + e.what());
        response = error_envelope(id, kInternalError, std::string("Internal error: ") + e.what(),
                                  "InternalError");
    }

    if (notification) {
        return std::nullopt;
    }
    return response;
}

bson::Value Dispatcher::route(const std::string& method, const cJSON* params)
{
    infra::Logger::log(infra::LogLevel::DEBUG, "Dispatcher: " + method);

    if (method == "initialize") {
        return bson::Document{
            {"protocolVersion", DOCGATE_PROTOCOL_VERSION},
            {"capabilities", bson::Document{{"tools", bson::Document{}}}},
            {"serverInfo", bson::Document{{"name", "docgate"}, {"version", DOCGATE_VERSION}}}};
    }
    if (method == "tools/list") {
        bson::Array tools;
        for (const auto& tool : gateway_.tools()) {
            tools.push_back(bson::Document{{"name", tool.name},
                                           {"description", tool.description},
                                           {"inputSchema", tool.input_schema}});
        }
        return bson::Document{{"tools", std::move(tools)}};
    }
    if (method == "tools/call") {
        return call_tool(params);
    }
    if (method == "ping") {
        return bson::Document{};
    }
    if (method == "shutdown") {
        infra::Logger::log(infra::LogLevel::INFO, "Dispatcher: Shutdown requested");
        shutdown_requested_ = true;
        return bson::Document{};
    }
    if (method.rfind("notifications/", 0) == 0) {
        return bson::Null{};
    }
    throw RpcFailure(kMethodNotFound, "MethodNotFound", "Method not found: " + method);
}

bson::Value Dispatcher::call_tool(const cJSON* params) const
{
    if (!cJSON_IsObject(params)) {
        throw RpcFailure(kInvalidParams, "InvalidParams", "Invalid params: expected an object");
    }
    const cJSON* name = cJSON_GetObjectItemCaseSensitive(params, "name");
    if (!cJSON_IsString(name) || name->valuestring == nullptr) {
        throw RpcFailure(kInvalidParams, "InvalidParams", "Invalid params: missing tool name");
    }
    const cJSON* arguments = cJSON_GetObjectItemCaseSensitive(params, "arguments");
    if (arguments != nullptr && !cJSON_IsObject(arguments) && !cJSON_IsNull(arguments)) {
        throw RpcFailure(kInvalidParams, "InvalidParams",
                         "Invalid params: 'arguments' must be an object");
    }

    // Extended JSON is decoded here; malformed wrappers surface as ValidationError.
    const bson::Value args = bson::JsonCodec::from_cjson(arguments);
    const bson::Document empty;
    bson::Value result =
        gateway_.call(name->valuestring, args.is_document() ? args.as_document() : empty);

    bson::Document out{{"content", bson::Array{bson::Document{
                                       {"type", "text"},
                                       {"text", bson::JsonCodec::serialize(result)}}}}};
    if (result.is_document()) {
        out.append("structuredContent", std::move(result));
    }
    return out;
}

} // namespace docgate::network
