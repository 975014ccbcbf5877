//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Client.cpp
// Purpose: MCP protocol driver implementation
//==========================================================================================================

#include <atomic>
#include <chrono>
#include <format>
#include <mutex>
#include <string>

#include "env/EnvVars.h"
#include "logging/Logger.h"
#include "mcpagent/CapabilityRegistry.h"
#include "mcpagent/Client.h"
#include "mcpagent/ProcessTransport.hpp"
#include "mcpagent/errors/Errors.h"

namespace mcpagent {

namespace {
// Upper bound on list pages followed during one discovery pass.
constexpr int MaxDiscoveryPages = 64;
}

const char* ToString(ConnectionState state) {
    switch (state) {
        case ConnectionState::Disconnected: return "Disconnected";
        case ConnectionState::Connecting: return "Connecting";
        case ConnectionState::Initialized: return "Initialized";
        case ConnectionState::Discovering: return "Discovering";
        case ConnectionState::Ready: return "Ready";
        case ConnectionState::Failed: return "Failed";
    }
    return "Unknown";
}

class Client::Impl {
public:
    ServerDescriptor server;
    std::unique_ptr<ITransportFactory> transportFactory;
    Implementation clientInfo;
    ClientCapabilities capabilities;

    // transportMutex guards the pointer only; I/O happens on the owner thread without it.
    mutable std::mutex transportMutex;
    std::unique_ptr<ITransport> transport;

    std::atomic<ConnectionState> state{ConnectionState::Disconnected};
    std::atomic<bool> cancelRequested{false};
    // True while roundTrip owns the transport; guarded by transportMutex.
    bool requestInFlight{false};
    std::atomic<int64_t> lastId{0};
    std::chrono::milliseconds requestTimeout{30000};

    CapabilityRegistry registry;
    std::optional<Implementation> serverInfo;

    Impl(ServerDescriptor srv, std::unique_ptr<ITransportFactory> factory, Implementation info)
        : server(std::move(srv)), transportFactory(std::move(factory)), clientInfo(std::move(info)) {
        requestTimeout = std::chrono::milliseconds(
            GetEnvUInt64OrDefault(EnvNames::RequestTimeoutMs, 30000));
    }

    ~Impl() {
        terminateTransport();
    }

    void setState(ConnectionState s) {
        const ConnectionState prev = state.exchange(s);
        if (prev != s) {
            LOG_DEBUG("Client: state {} -> {}", ToString(prev), ToString(s));
        }
    }

    void terminateTransport() {
        std::unique_ptr<ITransport> doomed;
        {
            std::lock_guard<std::mutex> lk(transportMutex);
            doomed = std::move(transport);
        }
        if (doomed) {
            doomed->Terminate();
        }
    }

    // Marks the connection unusable after a transport fault and reaps the server.
    void failConnection() {
        setState(ConnectionState::Failed);
        terminateTransport();
    }

    ITransport& activeTransport() {
        std::lock_guard<std::mutex> lk(transportMutex);
        if (!transport) {
            throw ConnectionError("Client: not connected");
        }
        return *transport;
    }

    std::chrono::milliseconds remaining(std::chrono::steady_clock::time_point deadline) const {
        if (requestTimeout.count() <= 0) {
            return std::chrono::milliseconds(0);
        }
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
        if (left.count() <= 0) {
            throw ConnectionError(std::format("Client: no response within {} ms",
                                              static_cast<long long>(requestTimeout.count())));
        }
        return left;
    }

    //==========================================================================================================
    // Answers a server-initiated request so the server is never left waiting on us.
    //==========================================================================================================
    void answerServerRequest(ITransport& t, const JSONValue& message, std::chrono::milliseconds timeout) {
        JSONRPCRequest incoming;
        if (!incoming.FromValue(message)) {
            return;
        }
        std::string reply;
        if (incoming.method == Methods::Ping) {
            reply = JSONRPCResponse(incoming.id, JSONValue{JSONValue::Object{}}).Serialize();
        } else {
            LOG_WARN("Client: server request '{}' not supported", incoming.method);
            reply = CreateErrorResponse(incoming.id, JSONRPCErrorCodes::MethodNotFound,
                                        "Method not found: " + incoming.method)->Serialize();
        }
        t.WriteLine(reply, timeout);
    }

    void setInFlight(bool busy) {
        std::lock_guard<std::mutex> lk(transportMutex);
        requestInFlight = busy;
    }

    //==========================================================================================================
    // roundTrip
    // Purpose: Sends one request and blocks for the reply carrying the same id.
    // Returns:
    //   The response, which may carry an error payload; interpreting it is the caller's job.
    // Throws:
    //   ConnectionError on any transport fault, malformed line, id mismatch, or cancellation. The connection
    //   is failed and the server terminated before the exception leaves.
    //==========================================================================================================
    JSONRPCResponse roundTrip(const std::string& method, std::optional<JSONValue> params) {
        setInFlight(true);
        try {
            JSONRPCResponse response = exchange(method, std::move(params));
            setInFlight(false);
            // A Cancel() that raced the reply still wins; it has already interrupted the transport.
            if (cancelRequested.load()) {
                throw ConnectionError(std::format("Client: {} cancelled", method));
            }
            return response;
        } catch (const ConnectionError& e) {
            setInFlight(false);
            LOG_ERROR("Client: {} failed: {}", method, e.what());
            failConnection();
            if (cancelRequested.load()) {
                throw ConnectionError(std::format("Client: {} cancelled", method));
            }
            throw;
        }
    }

    // One request/reply exchange. Notifications are skipped and server requests answered while waiting.
    JSONRPCResponse exchange(const std::string& method, std::optional<JSONValue> params) {
        if (cancelRequested.load()) {
            throw ConnectionError(std::format("Client: {} cancelled", method));
        }
        ITransport& t = activeTransport();
        if (!t.IsRunning()) {
            throw ConnectionError("Client: server process is not running");
        }
        const int64_t id = ++lastId;
        const auto deadline = std::chrono::steady_clock::now() + requestTimeout;
        JSONRPCRequest request(id, method, std::move(params));
        t.WriteLine(request.Serialize(), remaining(deadline));

        for (;;) {
            const std::string line = t.ReadLine(remaining(deadline));
            JSONValue message;
            try {
                message = ParseJSON(line);
            } catch (const std::runtime_error& e) {
                throw ConnectionError(std::format("Client: malformed line from server ({}): {}", e.what(), line));
            }
            switch (ClassifyMessage(message)) {
                case MessageKind::Notification:
                    LOG_DEBUG("Client: skipping notification {}", message.stringOr("method", ""));
                    continue;
                case MessageKind::Request:
                    answerServerRequest(t, message, remaining(deadline));
                    continue;
                case MessageKind::Response:
                    break;
                case MessageKind::Unknown:
                    throw ConnectionError(std::format("Client: unrecognized message from server: {}", line));
            }
            JSONRPCResponse response;
            if (!response.FromValue(message)) {
                throw ConnectionError(std::format("Client: malformed response: {}", line));
            }
            if (!std::holds_alternative<int64_t>(response.id) || std::get<int64_t>(response.id) != id) {
                throw ConnectionError(std::format("Client: response id {} does not match request id {}",
                                                  FormatId(response.id), id));
            }
            return response;
        }
    }

    void sendNotification(const std::string& method) {
        try {
            JSONRPCNotification notification(method);
            activeTransport().WriteLine(notification.Serialize(), requestTimeout);
        } catch (const ConnectionError& e) {
            LOG_ERROR("Client: {} failed: {}", method, e.what());
            failConnection();
            throw;
        }
    }

    JSONValue buildInitializeParams() const {
        JSONValue::Object paramsObj;
        paramsObj["protocolVersion"] = std::make_shared<JSONValue>(std::string(PROTOCOL_VERSION));
        JSONValue::Object caps;
        if (capabilities.tools) caps["tools"] = std::make_shared<JSONValue>(JSONValue::Object{});
        if (capabilities.resources) caps["resources"] = std::make_shared<JSONValue>(JSONValue::Object{});
        paramsObj["capabilities"] = std::make_shared<JSONValue>(caps);
        JSONValue::Object ci;
        ci["name"] = std::make_shared<JSONValue>(clientInfo.name);
        ci["version"] = std::make_shared<JSONValue>(clientInfo.version);
        paramsObj["clientInfo"] = std::make_shared<JSONValue>(ci);
        return JSONValue{paramsObj};
    }

    void initialize() {
        LOG_INFO("Initializing MCP client");
        JSONRPCResponse response = roundTrip(Methods::Initialize, buildInitializeParams());
        if (auto err = errors::mcpErrorFromResponse(response)) {
            throw ConnectionError("Client: initialize rejected: " + errors::describe(err.value()), err);
        }
        serverInfo.reset();
        if (response.result.has_value()) {
            const JSONValue& result = response.result.value();
            if (const JSONValue* info = result.find("serverInfo"); info && info->isObject()) {
                serverInfo = Implementation(info->stringOr("name", ""), info->stringOr("version", ""));
            }
            const std::string version = result.stringOr("protocolVersion", "");
            if (!version.empty() && version != PROTOCOL_VERSION) {
                LOG_WARN("Client: server negotiated protocol {} (requested {})", version, PROTOCOL_VERSION);
            }
        }
        setState(ConnectionState::Initialized);
        sendNotification(Methods::Initialized);
        if (serverInfo.has_value()) {
            LOG_INFO("Connected to {} {}", serverInfo->name, serverInfo->version);
        }
    }

    //==========================================================================================================
    // discover
    // Purpose: Pages through tools/list or resources/list and upserts every entry.
    // Args:
    //   tolerant: When true any failure is logged and discovery of that class stops; otherwise it raises
    //             ConnectionError. A transport fault has already failed the connection either way, so the
    //             next request reports it. Cancellation always raises.
    //==========================================================================================================
    template <typename ParseFn, typename UpsertFn>
    void discover(const char* method, bool tolerant, ParseFn parse, UpsertFn upsert) {
        std::optional<std::string> cursor;
        for (int page = 0; page < MaxDiscoveryPages; ++page) {
            std::optional<JSONValue> params;
            if (cursor.has_value()) {
                JSONValue::Object p;
                p["cursor"] = std::make_shared<JSONValue>(cursor.value());
                params = JSONValue{p};
            }
            JSONRPCResponse response;
            try {
                response = roundTrip(method, std::move(params));
            } catch (const ConnectionError& e) {
                if (!tolerant || cancelRequested.load()) {
                    throw;
                }
                LOG_WARN("Client: {} skipped: {}", method, e.what());
                return;
            }
            if (auto err = errors::mcpErrorFromResponse(response)) {
                if (tolerant) {
                    LOG_WARN("Client: {} failed: {}", method, errors::describe(err.value()));
                    return;
                }
                throw ConnectionError(std::format("Client: {} failed: {}", method, errors::describe(err.value())), err);
            }
            const JSONValue result = response.result.value_or(JSONValue{JSONValue::Object{}});
            auto listed = parse(result);
            std::size_t added = upsert(listed);
            LOG_DEBUG("Client: {} page {} listed {} entries", method, page + 1, added);
            if (!listed.nextCursor.has_value()) {
                return;
            }
            cursor = listed.nextCursor;
        }
        LOG_WARN("Client: {} stopped after {} pages", method, MaxDiscoveryPages);
    }

    void discoverTools(bool tolerant) {
        discover(Methods::ListTools, tolerant, ParseToolsListResult, [this](const ToolsListResult& r) {
            std::size_t n = 0;
            for (const auto& tool : r.tools) {
                if (registry.UpsertTool(tool)) ++n;
            }
            return n;
        });
        LOG_INFO("Discovered {} tools", registry.ToolCount());
    }

    void discoverResources(bool tolerant) {
        discover(Methods::ListResources, tolerant, ParseResourcesListResult, [this](const ResourcesListResult& r) {
            std::size_t n = 0;
            for (const auto& resource : r.resources) {
                if (registry.UpsertResource(resource)) ++n;
            }
            return n;
        });
        LOG_INFO("Discovered {} resources", registry.ResourceCount());
    }

    void requireReady(const char* op) const {
        if (state.load() != ConnectionState::Ready) {
            throw ConnectionError(std::format("Client: {} requires a ready connection (state {})",
                                              op, ToString(state.load())));
        }
    }
};

Client::Client(ServerDescriptor server, std::unique_ptr<ITransportFactory> transportFactory,
               Implementation clientInfo)
    : pImpl(std::make_unique<Impl>(std::move(server), std::move(transportFactory), std::move(clientInfo))) {
}

Client::~Client() = default;

void Client::Connect() {
    FUNC_SCOPE();
    const ConnectionState current = pImpl->state.load();
    if (current != ConnectionState::Disconnected && current != ConnectionState::Failed) {
        throw ConnectionError(std::format("Client: Connect() not allowed in state {}", ToString(current)));
    }
    pImpl->terminateTransport();
    pImpl->cancelRequested.store(false);
    pImpl->setState(ConnectionState::Connecting);

    try {
        if (!pImpl->transportFactory) {
            throw ConnectionError("Client: no transport factory");
        }
        auto transport = pImpl->transportFactory->CreateTransport();
        transport->Start(pImpl->server);
        {
            std::lock_guard<std::mutex> lk(pImpl->transportMutex);
            pImpl->transport = std::move(transport);
        }
        pImpl->initialize();
        pImpl->setState(ConnectionState::Discovering);
        pImpl->discoverTools(true);
        pImpl->discoverResources(true);
        if (pImpl->cancelRequested.load()) {
            throw ConnectionError("Client: connect cancelled");
        }
        pImpl->setState(ConnectionState::Ready);
    } catch (const ConnectionError& e) {
        LOG_ERROR("Client: connect failed: {}", e.what());
        pImpl->failConnection();
        throw;
    }
}

void Client::Disconnect() {
    FUNC_SCOPE();
    pImpl->terminateTransport();
    pImpl->setState(ConnectionState::Disconnected);
}

void Client::Cancel() {
    {
        std::lock_guard<std::mutex> lk(pImpl->transportMutex);
        const ConnectionState s = pImpl->state.load();
        const bool connecting = s == ConnectionState::Connecting || s == ConnectionState::Initialized ||
                                s == ConnectionState::Discovering;
        if (!pImpl->requestInFlight && !connecting) {
            LOG_DEBUG("Client: Cancel() with no request in flight (state {})", ToString(s));
            return;
        }
        pImpl->cancelRequested.store(true);
        if (pImpl->transport) {
            LOG_WARN("Client: cancelling in-flight request");
            pImpl->transport->Interrupt();
        }
    }
    ConnectionState current = pImpl->state.load();
    if (current != ConnectionState::Disconnected) {
        pImpl->state.compare_exchange_strong(current, ConnectionState::Failed);
    }
}

ConnectionState Client::GetState() const {
    return pImpl->state.load();
}

bool Client::IsReady() const {
    return pImpl->state.load() == ConnectionState::Ready;
}

void Client::RefreshTools() {
    FUNC_SCOPE();
    pImpl->requireReady("RefreshTools");
    pImpl->discoverTools(false);
}

void Client::RefreshResources() {
    FUNC_SCOPE();
    pImpl->requireReady("RefreshResources");
    pImpl->discoverResources(false);
}

std::vector<Tool> Client::GetTools() const {
    return pImpl->registry.Tools();
}

std::vector<Resource> Client::GetResources() const {
    return pImpl->registry.Resources();
}

std::optional<Tool> Client::FindTool(const std::string& name) const {
    return pImpl->registry.FindTool(name);
}

std::optional<Implementation> Client::GetServerInfo() const {
    return pImpl->serverInfo;
}

JSONValue Client::CallTool(const std::string& name, const JSONValue& arguments) {
    FUNC_SCOPE();
    if (!pImpl->registry.HasTool(name)) {
        throw ToolError(std::format("Tool '{}' not found", name));
    }
    JSONValue::Object paramsObj;
    paramsObj["name"] = std::make_shared<JSONValue>(name);
    paramsObj["arguments"] = std::make_shared<JSONValue>(arguments.isNull() ? JSONValue{JSONValue::Object{}} : arguments);
    LOG_DEBUG("Calling tool: {}", name);

    pImpl->requireReady("CallTool");
    JSONRPCResponse response = pImpl->roundTrip(Methods::CallTool, JSONValue{paramsObj});
    if (auto err = errors::mcpErrorFromResponse(response)) {
        throw ToolError(std::format("Failed to call tool '{}': {}", name, errors::describe(err.value())), err);
    }
    if (response.result.has_value()) {
        if (const JSONValue* content = response.result->find("content")) {
            return *content;
        }
    }
    return JSONValue{JSONValue::Array{}};
}

std::string Client::ReadResource(const std::string& uri) {
    FUNC_SCOPE();
    JSONValue::Object paramsObj;
    paramsObj["uri"] = std::make_shared<JSONValue>(uri);

    pImpl->requireReady("ReadResource");
    JSONRPCResponse response = pImpl->roundTrip(Methods::ReadResource, JSONValue{paramsObj});
    if (auto err = errors::mcpErrorFromResponse(response)) {
        throw ToolError(std::format("Failed to read resource '{}': {}", uri, errors::describe(err.value())), err);
    }
    if (!response.result.has_value()) {
        return std::string();
    }
    const JSONValue* contents = response.result->find("contents");
    if (!contents || !contents->isArray()) {
        return std::string();
    }
    const auto& arr = std::get<JSONValue::Array>(contents->value);
    if (arr.empty() || !arr.front()) {
        return std::string();
    }
    return arr.front()->stringOr("text", "");
}

void Client::SetRequestTimeoutMs(uint64_t timeoutMs) {
    pImpl->requestTimeout = std::chrono::milliseconds(timeoutMs);
}

int64_t Client::GetLastRequestId() const {
    return pImpl->lastId.load();
}

std::unique_ptr<IClient> ClientFactory::CreateClient(const ServerDescriptor& server,
                                                     const Implementation& clientInfo) {
    return std::make_unique<Client>(server, std::make_unique<ProcessTransportFactory>(), clientInfo);
}

} // namespace mcpagent
