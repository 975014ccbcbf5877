//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Protocol.h
// Purpose: MCP protocol data structures and constants used by the agent
//==========================================================================================================

#pragma once

#include "JSONRPCTypes.h"
#include <optional>
#include <string>
#include <vector>

namespace mcpagent {
//==========================================================================================================
// MCP Protocol types and constants
// Purpose: Shared protocol structures, capabilities, and method names.
//==========================================================================================================
///////////////////////////////////////// Protocol constants ///////////////////////////////////////////
// MCP protocol revision advertised in initialize
constexpr const char* PROTOCOL_VERSION = "2024-11-05";

// Client identity sent in initialize when the caller does not override it
constexpr const char* DEFAULT_CLIENT_NAME = "mcp-agent";
constexpr const char* DEFAULT_CLIENT_VERSION = "1.0.0";

///////////////////////////////////////// Implementation ///////////////////////////////////////////
// Implementation information
struct Implementation {
    std::string name;
    std::string version;

    Implementation() = default;
    Implementation(std::string name, std::string version)
        : name(std::move(name)), version(std::move(version)) {}
};

///////////////////////////////////////// Capabilities ///////////////////////////////////////////
// Capability classes the client announces; each is serialized as an empty object when enabled.
struct ClientCapabilities {
    bool tools = true;
    bool resources = true;
};

///////////////////////////////////////// Server process ///////////////////////////////////////////
//==========================================================================================================
// ServerDescriptor
// Purpose: How to launch an MCP server: `command` followed by `args`, inheriting the environment.
//==========================================================================================================
struct ServerDescriptor {
    std::vector<std::string> command;
    std::vector<std::string> args;

    // Full argv in launch order.
    std::vector<std::string> Argv() const {
        std::vector<std::string> out(command);
        out.insert(out.end(), args.begin(), args.end());
        return out;
    }
};

///////////////////////////////////////// Tools ///////////////////////////////////////////
// Tool structures
struct Tool {
    std::string name;
    std::string description;
    JSONValue inputSchema;  // JSON Schema for tool parameters

    Tool() = default;
    Tool(std::string name, std::string description, JSONValue inputSchema = JSONValue{JSONValue::Object{}})
        : name(std::move(name)), description(std::move(description)),
          inputSchema(std::move(inputSchema)) {}
};

///////////////////////////////////////// Resources ///////////////////////////////////////////
// Resource structures
struct Resource {
    std::string uri;
    std::string name;
    std::optional<std::string> description;
    std::optional<std::string> mimeType;

    Resource() = default;
    Resource(std::string uri, std::string name,
             std::optional<std::string> description = std::nullopt,
             std::optional<std::string> mimeType = std::nullopt)
        : uri(std::move(uri)), name(std::move(name)),
          description(std::move(description)), mimeType(std::move(mimeType)) {}
};

/////////////////////////////////////// Paged list results /////////////////////////////////////////
struct ToolsListResult {
    std::vector<Tool> tools;
    std::optional<std::string> nextCursor;
};

struct ResourcesListResult {
    std::vector<Resource> resources;
    std::optional<std::string> nextCursor;
};

// Result-shape parsing shared by the client and the tests' scripted servers.
ToolsListResult ParseToolsListResult(const JSONValue& result);
ResourcesListResult ParseResourcesListResult(const JSONValue& result);

// Serialized forms as they appear inside tools/list and resources/list results.
JSONValue ToolToJSON(const Tool& tool);
JSONValue ResourceToJSON(const Resource& resource);

///////////////////////////////////////// Method names ///////////////////////////////////////////
namespace Methods {
    // Client to server
    constexpr const char* Initialize = "initialize";
    constexpr const char* ListTools = "tools/list";
    constexpr const char* CallTool = "tools/call";
    constexpr const char* ListResources = "resources/list";
    constexpr const char* ReadResource = "resources/read";

    // Server to client
    constexpr const char* Ping = "ping";

    // Notifications
    constexpr const char* Initialized = "notifications/initialized";
    constexpr const char* Log = "notifications/message";
}

} // namespace mcpagent
