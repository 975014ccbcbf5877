//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_client_process.cpp
// Purpose: Client end-to-end tests against the fake MCP server subprocess
//==========================================================================================================

#include <gtest/gtest.h>
#include "mcpagent/Client.h"
#include "mcpagent/ProcessTransport.hpp"
#include "mcpagent/errors/Errors.h"
#include <chrono>

using namespace mcpagent;
using namespace std::chrono_literals;

namespace {

ServerDescriptor fakeServer(const std::string& mode) {
    ServerDescriptor d;
    d.command = {FAKE_MCP_SERVER_PATH};
    d.args = {mode};
    return d;
}

std::unique_ptr<Client> makeClient(const std::string& mode, uint64_t timeoutMs = 5000) {
    auto factory = std::make_unique<ProcessTransportFactory>();
    factory->SetTerminateGraceMs(500);
    auto client = std::make_unique<Client>(fakeServer(mode), std::move(factory));
    client->SetRequestTimeoutMs(timeoutMs);
    return client;
}

JSONValue textArgs(const std::string& text) {
    JSONValue::Object o;
    o["text"] = std::make_shared<JSONValue>(text);
    return JSONValue{o};
}

std::string firstText(const JSONValue& content) {
    if (!content.isArray()) return std::string();
    const auto& arr = std::get<JSONValue::Array>(content.value);
    if (arr.empty() || !arr.front()) return std::string();
    return arr.front()->stringOr("text", "");
}

} // namespace

TEST(ClientProcess, ConnectListsToolsAndResources) {
    auto client = makeClient("normal");
    client->Connect();
    ASSERT_TRUE(client->IsReady());

    auto tools = client->GetTools();
    ASSERT_EQ(tools.size(), 2u);
    EXPECT_EQ(tools[0].name, "echo");
    EXPECT_EQ(tools[1].name, "list_files");
    auto resources = client->GetResources();
    ASSERT_EQ(resources.size(), 1u);
    EXPECT_EQ(resources[0].uri, "file:///readme.txt");
    ASSERT_TRUE(client->GetServerInfo().has_value());
    EXPECT_EQ(client->GetServerInfo()->name, "fake-mcp-server");

    client->Disconnect();
    EXPECT_EQ(client->GetState(), ConnectionState::Disconnected);
}

TEST(ClientProcess, CallToolAndReadResource) {
    auto client = makeClient("normal");
    client->Connect();
    EXPECT_EQ(firstText(client->CallTool("echo", textArgs("ping pong"))), "ping pong");
    EXPECT_EQ(firstText(client->CallTool("list_files", JSONValue{JSONValue::Object{}})), "a.txt\nb.txt");
    EXPECT_EQ(client->ReadResource("file:///readme.txt"), "hello from readme");
    // initialize, tools/list, resources/list, two calls, one read
    EXPECT_EQ(client->GetLastRequestId(), 6);
}

TEST(ClientProcess, MissingResourcesListIsTolerated) {
    auto client = makeClient("no-resources");
    client->Connect();
    EXPECT_TRUE(client->IsReady());
    EXPECT_EQ(client->GetTools().size(), 2u);
    EXPECT_TRUE(client->GetResources().empty());
}

TEST(ClientProcess, ServerExitDuringHandshakeFailsConnect) {
    auto client = makeClient("exit-on-init");
    EXPECT_THROW(client->Connect(), ConnectionError);
    EXPECT_EQ(client->GetState(), ConnectionState::Failed);
}

TEST(ClientProcess, GarbageReplyFailsCall) {
    auto client = makeClient("garbage-on-call");
    client->Connect();
    EXPECT_THROW(client->CallTool("echo", textArgs("x")), ConnectionError);
    EXPECT_EQ(client->GetState(), ConnectionState::Failed);
}

TEST(ClientProcess, WrongReplyIdFailsCall) {
    auto client = makeClient("wrong-id");
    client->Connect();
    try {
        client->CallTool("echo", textArgs("x"));
        FAIL() << "expected ConnectionError";
    } catch (const ConnectionError& e) {
        EXPECT_NE(std::string(e.what()).find("does not match"), std::string::npos);
    }
    EXPECT_EQ(client->GetState(), ConnectionState::Failed);
}

TEST(ClientProcess, HungCallHitsRequestDeadline) {
    auto client = makeClient("hang-on-call", 300);
    client->Connect();
    const auto begin = std::chrono::steady_clock::now();
    EXPECT_THROW(client->CallTool("echo", textArgs("x")), ConnectionError);
    EXPECT_LT(std::chrono::steady_clock::now() - begin, 5s);
    EXPECT_EQ(client->GetState(), ConnectionState::Failed);

    // The failed server was reaped; a new one can be started in its place.
    client->Connect();
    EXPECT_TRUE(client->IsReady());
}

TEST(ClientProcess, ChattyServerTrafficIsAbsorbed) {
    auto client = makeClient("chatty");
    client->Connect();
    EXPECT_EQ(firstText(client->CallTool("echo", textArgs("still here"))), "still here");
    EXPECT_EQ(client->GetLastRequestId(), 4);
}

TEST(ClientProcess, MissingExecutableFailsConnect) {
    ServerDescriptor d;
    d.command = {"/nonexistent/mcp-server"};
    Client client(d, std::make_unique<ProcessTransportFactory>());
    EXPECT_THROW(client.Connect(), ConnectionError);
    EXPECT_EQ(client.GetState(), ConnectionState::Failed);
}

TEST(ClientProcess, FactoryBuildsProcessClient) {
    ClientFactory factory;
    auto client = factory.CreateClient(fakeServer("normal"), Implementation("factory-test", "1.0"));
    client->Connect();
    EXPECT_TRUE(client->IsReady());
    EXPECT_TRUE(client->FindTool("echo").has_value());
    EXPECT_FALSE(client->FindTool("nope").has_value());
    client->Disconnect();
}
