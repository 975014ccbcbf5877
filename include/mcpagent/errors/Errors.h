//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Errors.h
// Purpose: Typed JSON-RPC error structures and the agent's exception family
//==========================================================================================================

#pragma once

#include <optional>
#include <stdexcept>
#include <string>

#include "mcpagent/JSONRPCTypes.h"

namespace mcpagent {
namespace errors {

// Categorization of common JSON-RPC and MCP error codes.
enum class ErrorCategory {
    JsonRpcParse,
    JsonRpcInvalidRequest,
    JsonRpcMethodNotFound,
    JsonRpcInvalidParams,
    JsonRpcInternal,
    McpInvalidRequestId,
    McpMethodNotAllowed,
    McpResourceNotFound,
    McpToolNotFound,
    McpPromptNotFound,
    Unknown
};

// Typed error payload as carried in a JSON-RPC error response.
struct McpError {
    int code{0};
    std::string message;
    std::optional<JSONValue> data;
    ErrorCategory category{ErrorCategory::Unknown};
};

// Map a JSON-RPC/MCP numeric error code to an ErrorCategory.
//
// Args:
//   code: The integer error code (JSON-RPC standard or MCP-specific).
//
// Returns:
//   ErrorCategory corresponding to the code, or Unknown when unmapped.
inline ErrorCategory errorCategoryFromCode(int code) {
    switch (code) {
        case JSONRPCErrorCodes::ParseError: return ErrorCategory::JsonRpcParse;
        case JSONRPCErrorCodes::InvalidRequest: return ErrorCategory::JsonRpcInvalidRequest;
        case JSONRPCErrorCodes::MethodNotFound: return ErrorCategory::JsonRpcMethodNotFound;
        case JSONRPCErrorCodes::InvalidParams: return ErrorCategory::JsonRpcInvalidParams;
        case JSONRPCErrorCodes::InternalError: return ErrorCategory::JsonRpcInternal;
        case JSONRPCErrorCodes::InvalidRequestId: return ErrorCategory::McpInvalidRequestId;
        case JSONRPCErrorCodes::MethodNotAllowed: return ErrorCategory::McpMethodNotAllowed;
        case JSONRPCErrorCodes::ResourceNotFound: return ErrorCategory::McpResourceNotFound;
        case JSONRPCErrorCodes::ToolNotFound: return ErrorCategory::McpToolNotFound;
        case JSONRPCErrorCodes::PromptNotFound: return ErrorCategory::McpPromptNotFound;
        default: return ErrorCategory::Unknown;
    }
}

// Convert a JSON-RPC error value to McpError. Servers do not always send the
// { code, message, data? } shape, so anything else is kept verbatim as data with code 0.
inline McpError mcpErrorFromErrorValue(const JSONValue& errVal) {
    McpError e;
    const JSONValue* code = errVal.find("code");
    const JSONValue* msg = errVal.find("message");
    if (code && std::holds_alternative<int64_t>(code->value) && msg && msg->isString()) {
        e.code = static_cast<int>(std::get<int64_t>(code->value));
        e.message = std::get<std::string>(msg->value);
        if (const JSONValue* data = errVal.find("data")) {
            e.data = *data;
        }
    } else {
        e.message = SerializeJSON(errVal);
        e.data = errVal;
    }
    e.category = errorCategoryFromCode(e.code);
    return e;
}

// Extract McpError from a JSONRPCResponse if it carries an error.
inline std::optional<McpError> mcpErrorFromResponse(const JSONRPCResponse& response) {
    if (!response.error.has_value()) {
        return std::nullopt;
    }
    return mcpErrorFromErrorValue(response.error.value());
}

// Human-readable rendering used in exception messages and logs.
inline std::string describe(const McpError& err) {
    if (err.code == 0) {
        return err.message;
    }
    return err.message + " (code " + std::to_string(err.code) + ")";
}

} // namespace errors

//==========================================================================================================
// McpAgentError
// Purpose: Base of all errors raised by the agent core. Carries the server's typed error payload when
//          the failure originated in a JSON-RPC error response.
//==========================================================================================================
class McpAgentError : public std::runtime_error {
public:
    explicit McpAgentError(const std::string& what,
                           std::optional<errors::McpError> rpcError = std::nullopt)
        : std::runtime_error(what), rpcError_(std::move(rpcError)) {}

    const std::optional<errors::McpError>& RpcError() const noexcept { return rpcError_; }

private:
    std::optional<errors::McpError> rpcError_;
};

// Process spawn/IO failure, end of stream, malformed line, id mismatch, timeout, cancellation,
// or a handshake/discovery error payload.
class ConnectionError : public McpAgentError {
public:
    using McpAgentError::McpAgentError;
};

// Unregistered tool name, or a failed tools/call or resources/read.
class ToolError : public McpAgentError {
public:
    using McpAgentError::McpAgentError;
};

// Language-model provider failure, deadline expiry, or unregistered provider kind.
class ProviderError : public McpAgentError {
public:
    using McpAgentError::McpAgentError;
};

} // namespace mcpagent
