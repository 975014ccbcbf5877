//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Client.h
// Purpose: MCP protocol driver - synchronous JSON-RPC client for one spawned server process
//==========================================================================================================

#pragma once

#include "Transport.h"
#include "JSONRPCTypes.h"
#include "Protocol.h"
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace mcpagent {

//==========================================================================================================
// ConnectionState
// Purpose: Lifecycle of one driver. Disconnected -> Connecting -> Initialized -> Discovering -> Ready,
//          back to Disconnected on Disconnect(). Failures before Ready, and transport faults after
//          it, end in Failed. Connect() is accepted from Disconnected or Failed.
//==========================================================================================================
enum class ConnectionState {
    Disconnected,
    Connecting,
    Initialized,
    Discovering,
    Ready,
    Failed
};

const char* ToString(ConnectionState state);

//==========================================================================================================
// MCP Client interface
// Purpose: Operations the orchestrator needs from a protocol driver.
// Notes:
//   - One request in flight at a time; all methods except Cancel() belong to the owning thread.
//==========================================================================================================
class IClient {
public:
    virtual ~IClient() = default;

    ////////////////////////////////////////// Connection management ///////////////////////////////////////////
    //==========================================================================================================
    // Spawns the server, performs the initialize handshake, sends notifications/initialized, then
    // discovers tools and resources.
    // Throws:
    //   ConnectionError on spawn failure, a handshake error payload, a handshake transport fault, or
    //   cancellation. The state is Failed and the process terminated afterwards. Discovery failures are
    //   logged, not raised; a transport fault during discovery leaves the driver Failed for the next call.
    //==========================================================================================================
    virtual void Connect() = 0;

    //==========================================================================================================
    // Terminates the server process. Registries are kept. Idempotent; never throws.
    //==========================================================================================================
    virtual void Disconnect() = 0;

    //==========================================================================================================
    // Aborts the in-flight request from any thread by killing the server. The pending call fails and the
    // driver ends in Failed; Connect() again to continue. A no-op when nothing is in flight.
    //==========================================================================================================
    virtual void Cancel() = 0;

    virtual ConnectionState GetState() const = 0;
    virtual bool IsReady() const = 0;

    ////////////////////////////////////////// Discovery ///////////////////////////////////////////
    //==========================================================================================================
    // Re-lists tools (resources) on a Ready connection and upserts the results into the registry.
    // Throws:
    //   ConnectionError when not Ready, on a transport fault, or on an error payload.
    //==========================================================================================================
    virtual void RefreshTools() = 0;
    virtual void RefreshResources() = 0;

    virtual std::vector<Tool> GetTools() const = 0;
    virtual std::vector<Resource> GetResources() const = 0;
    virtual std::optional<Tool> FindTool(const std::string& name) const = 0;

    // Server identity reported in the initialize result, when it sent one.
    virtual std::optional<Implementation> GetServerInfo() const = 0;

    ////////////////////////////////////////// Invocation ///////////////////////////////////////////
    //==========================================================================================================
    // Invokes a registered tool.
    // Args:
    //   name: Tool name; must be present in the registry.
    //   arguments: JSON object passed as `arguments`.
    // Returns:
    //   The `content` payload of the result (an empty array when absent).
    // Throws:
    //   ToolError for an unknown name (nothing is sent) or an error payload.
    //   ConnectionError when not Ready, on a transport fault, or on cancellation; the driver is Failed.
    //==========================================================================================================
    virtual JSONValue CallTool(const std::string& name, const JSONValue& arguments) = 0;

    //==========================================================================================================
    // Reads a resource and returns the first content entry's `text`, or an empty string.
    // Throws:
    //   ToolError on an error payload.
    //   ConnectionError when not Ready, on a transport fault, or on cancellation.
    //==========================================================================================================
    virtual std::string ReadResource(const std::string& uri) = 0;
};

//==========================================================================================================
// Client
// Purpose: IClient over an ITransport produced by a factory for every Connect().
//==========================================================================================================
class Client : public IClient {
public:
    Client(ServerDescriptor server,
           std::unique_ptr<ITransportFactory> transportFactory,
           Implementation clientInfo = Implementation(DEFAULT_CLIENT_NAME, DEFAULT_CLIENT_VERSION));
    virtual ~Client();

    Client(const Client&) = delete;
    Client& operator=(const Client&) = delete;

    void Connect() override;
    void Disconnect() override;
    void Cancel() override;
    ConnectionState GetState() const override;
    bool IsReady() const override;

    void RefreshTools() override;
    void RefreshResources() override;
    std::vector<Tool> GetTools() const override;
    std::vector<Resource> GetResources() const override;
    std::optional<Tool> FindTool(const std::string& name) const override;
    std::optional<Implementation> GetServerInfo() const override;

    JSONValue CallTool(const std::string& name, const JSONValue& arguments) override;
    std::string ReadResource(const std::string& uri) override;

    //==========================================================================================================
    // SetRequestTimeoutMs
    // Purpose: Deadline for one request/response round trip. 0 disables it.
    // Args:
    //   timeoutMs: Milliseconds (default 30000, or MCPAGENT_REQUEST_TIMEOUT_MS).
    //==========================================================================================================
    void SetRequestTimeoutMs(uint64_t timeoutMs);

    // Id of the most recent request, or 0 before the first one.
    int64_t GetLastRequestId() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

//==========================================================================================================
// Client factory interface
// Purpose: Creates clients for a server command line.
//==========================================================================================================
class IClientFactory {
public:
    virtual ~IClientFactory() = default;

    virtual std::unique_ptr<IClient> CreateClient(const ServerDescriptor& server,
                                                  const Implementation& clientInfo) = 0;
};

//==========================================================================================================
// ClientFactory
// Purpose: Builds process-backed clients.
//==========================================================================================================
class ClientFactory : public IClientFactory {
public:
    std::unique_ptr<IClient> CreateClient(const ServerDescriptor& server,
                                          const Implementation& clientInfo) override;
};

} // namespace mcpagent
