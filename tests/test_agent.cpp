//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_agent.cpp
// Purpose: Orchestrator turn tests with a scripted provider and an in-memory server
//==========================================================================================================

#include <gtest/gtest.h>
#include "mcpagent/Agent.h"
#include "mcpagent/errors/Errors.h"
#include "ScriptedServer.h"
#include <atomic>
#include <chrono>
#include <mutex>
#include <sstream>
#include <thread>

using namespace mcpagent;
using namespace mcpagent::testing;
using namespace std::chrono_literals;

namespace {

class ScriptedProvider : public llm::ILLMProvider {
public:
    std::optional<llm::ToolCall> toolCall;
    std::string response = "final answer";
    std::chrono::milliseconds delay{0};
    bool failResponse{false};
    bool ignoreStop{false};

    std::atomic<int> toolCallRequests{0};
    std::atomic<int> responseRequests{0};
    std::atomic<int> inFlight{0};
    std::atomic<int> maxInFlight{0};

    std::string GetName() const override { return "scripted"; }

    std::string GenerateResponse(const std::vector<ConversationTurn>& history,
                                 const std::optional<std::vector<Tool>>& /*tools*/,
                                 std::stop_token stop) override {
        ++responseRequests;
        {
            std::lock_guard<std::mutex> lk(mutex);
            lastHistory = history;
        }
        waitOrStop(stop);
        if (failResponse) {
            throw ProviderError("model unavailable");
        }
        return response;
    }

    std::optional<llm::ToolCall> GenerateToolCall(const std::vector<ConversationTurn>& /*history*/,
                                                  const std::vector<Tool>& /*tools*/,
                                                  std::stop_token stop) override {
        ++toolCallRequests;
        waitOrStop(stop);
        return toolCall;
    }

    std::vector<ConversationTurn> LastHistory() {
        std::lock_guard<std::mutex> lk(mutex);
        return lastHistory;
    }

private:
    std::mutex mutex;
    std::vector<ConversationTurn> lastHistory;

    void waitOrStop(const std::stop_token& stop) {
        const int now = ++inFlight;
        int seen = maxInFlight.load();
        while (now > seen && !maxInFlight.compare_exchange_weak(seen, now)) {
        }
        const auto until = std::chrono::steady_clock::now() + delay;
        while (std::chrono::steady_clock::now() < until) {
            if (!ignoreStop && stop.stop_requested()) {
                --inFlight;
                throw ProviderError("stopped");
            }
            std::this_thread::sleep_for(5ms);
        }
        --inFlight;
    }
};

struct AgentFixture {
    ScriptedConnection conn;
    std::shared_ptr<ScriptedProvider> provider = std::make_shared<ScriptedProvider>();

    std::unique_ptr<Agent> Make() {
        auto client = std::make_unique<Client>(ScriptedConnection::Descriptor(), conn.Factory());
        client->SetRequestTimeoutMs(2000);
        return std::make_unique<Agent>(provider, std::move(client));
    }
};

JSONValue pathArgs(const std::string& path) {
    JSONValue args = MakeObject();
    SetMember(args, "path", JSONValue{path});
    return args;
}

} // namespace

TEST(Agent, ToolTurnAppendsFourTurns) {
    AgentFixture f;
    f.conn.server->tools = {Tool("list_files", "List files in a directory")};
    f.conn.server->toolContent["list_files"] = MakeStringArray({"a.txt", "b.txt"});
    f.provider->toolCall = llm::ToolCall{"list_files", pathArgs("/tmp")};
    f.provider->response = "There are two files.";
    auto agent = f.Make();
    agent->Start();
    ASSERT_EQ(agent->GetHistory().size(), 1u);

    EXPECT_EQ(agent->ProcessMessage("list the files in /tmp"), "There are two files.");

    const auto& h = agent->GetHistory();
    ASSERT_EQ(h.size(), 5u);
    EXPECT_EQ(h[1].role, Role::User);
    EXPECT_EQ(h[1].content, "list the files in /tmp");
    EXPECT_EQ(h[2].role, Role::Assistant);
    EXPECT_EQ(h[2].content, "I used the list_files tool with arguments: {\"path\":\"/tmp\"}");
    EXPECT_EQ(h[3].role, Role::User);
    EXPECT_EQ(h[3].content, "Tool result: [\"a.txt\",\"b.txt\"]");
    EXPECT_EQ(h[4].role, Role::Assistant);
    EXPECT_EQ(h[4].content, "There are two files.");

    EXPECT_EQ(f.provider->toolCallRequests.load(), 1);
    EXPECT_EQ(f.provider->responseRequests.load(), 1);
    EXPECT_EQ(f.conn.server->CountOf("tools/call"), 1u);
    EXPECT_EQ(agent->GetTurnState(), TurnState::Idle);

    // The final response saw the tool result.
    auto seen = f.provider->LastHistory();
    ASSERT_EQ(seen.size(), 4u);
    EXPECT_EQ(seen.back().content, "Tool result: [\"a.txt\",\"b.txt\"]");
}

TEST(Agent, DirectTurnAppendsTwoTurns) {
    AgentFixture f;
    f.provider->response = "Hi there";
    auto agent = f.Make();
    agent->Start();

    EXPECT_EQ(agent->ProcessMessage("hello"), "Hi there");
    const auto& h = agent->GetHistory();
    ASSERT_EQ(h.size(), 3u);
    EXPECT_EQ(h[1].content, "hello");
    EXPECT_EQ(h[2].role, Role::Assistant);
    EXPECT_EQ(f.provider->toolCallRequests.load(), 1);
    EXPECT_EQ(f.provider->responseRequests.load(), 1);
    EXPECT_EQ(f.conn.server->CountOf("tools/call"), 0u);
}

TEST(Agent, ToolFailureBecomesAssistantText) {
    AgentFixture f;
    f.conn.server->tools = {Tool("broken", "Always fails")};
    f.conn.server->toolErrors["broken"] = "disk on fire";
    f.provider->toolCall = llm::ToolCall{"broken", MakeObject()};
    auto agent = f.Make();
    agent->Start();

    const std::string reply = agent->ProcessMessage("use broken");
    EXPECT_EQ(reply.rfind("Error using tool broken: ", 0), 0u);
    EXPECT_NE(reply.find("disk on fire"), std::string::npos);

    const auto& h = agent->GetHistory();
    ASSERT_EQ(h.size(), 3u);
    EXPECT_EQ(h.back().content, reply);
    EXPECT_EQ(f.provider->responseRequests.load(), 0);
    // The server stays usable after a tool-level error.
    EXPECT_TRUE(agent->GetClient().IsReady());
}

TEST(Agent, UnknownToolDecisionIsReportedWithoutServerTraffic) {
    AgentFixture f;
    f.provider->toolCall = llm::ToolCall{"imaginary", MakeObject()};
    auto agent = f.Make();
    agent->Start();
    const auto before = f.conn.channel->BytesWritten();

    EXPECT_EQ(agent->ProcessMessage("do it"), "Error using tool imaginary: Tool 'imaginary' not found");
    EXPECT_EQ(f.conn.channel->BytesWritten(), before);
}

TEST(Agent, ProviderFailureBecomesErrorText) {
    AgentFixture f;
    f.provider->failResponse = true;
    auto agent = f.Make();
    agent->Start();

    EXPECT_EQ(agent->ProcessMessage("hello"), "Error: model unavailable");
    ASSERT_EQ(agent->GetHistory().size(), 3u);
    EXPECT_EQ(agent->GetHistory().back().role, Role::Assistant);
}

TEST(Agent, ProviderFailureAfterToolKeepsToolTurns) {
    AgentFixture f;
    f.conn.server->tools = {Tool("echo", "Echo text")};
    f.conn.server->toolContent["echo"] = MakeStringArray({"hi"});
    f.provider->toolCall = llm::ToolCall{"echo", MakeObject()};
    f.provider->failResponse = true;
    auto agent = f.Make();
    agent->Start();

    EXPECT_EQ(agent->ProcessMessage("say hi"), "Error: model unavailable");
    const auto& h = agent->GetHistory();
    ASSERT_EQ(h.size(), 5u);
    EXPECT_EQ(h[1].content, "say hi");
    EXPECT_EQ(h[2].content, "I used the echo tool with arguments: {}");
    EXPECT_EQ(h[3].content, "Tool result: [\"hi\"]");
    EXPECT_EQ(h[4].role, Role::Assistant);
    EXPECT_EQ(h[4].content, "Error: model unavailable");
    EXPECT_EQ(f.conn.server->CountOf("tools/call"), 1u);
}

TEST(Agent, ProviderTimeoutBecomesErrorText) {
    AgentFixture f;
    f.provider->delay = 5s;
    auto agent = f.Make();
    agent->SetProviderTimeoutMs(100);
    agent->Start();

    const auto begin = std::chrono::steady_clock::now();
    const std::string reply = agent->ProcessMessage("hello");
    EXPECT_LT(std::chrono::steady_clock::now() - begin, 3s);
    EXPECT_EQ(reply.rfind("Error: ", 0), 0u);
    EXPECT_NE(reply.find("timed out"), std::string::npos);
    EXPECT_EQ(agent->GetHistory().size(), 3u);
    EXPECT_EQ(agent->GetTurnState(), TurnState::Idle);
}

TEST(Agent, CancelStopsPendingProviderCall) {
    AgentFixture f;
    f.provider->delay = 5s;
    auto agent = f.Make();
    agent->SetProviderTimeoutMs(0);
    agent->Start();

    std::thread canceller([&agent]() {
        std::this_thread::sleep_for(100ms);
        agent->Cancel();
    });
    const auto begin = std::chrono::steady_clock::now();
    const std::string reply = agent->ProcessMessage("hello");
    canceller.join();
    EXPECT_LT(std::chrono::steady_clock::now() - begin, 3s);
    EXPECT_NE(reply.find("cancelled"), std::string::npos);
    EXPECT_EQ(agent->GetHistory().size(), 3u);
}

TEST(Agent, AbandonedProviderCallIsNeverOverlapped) {
    AgentFixture f;
    f.provider->delay = 400ms;
    f.provider->ignoreStop = true;
    auto agent = f.Make();
    agent->SetProviderTimeoutMs(50);
    agent->Start();

    EXPECT_NE(agent->ProcessMessage("one").find("timed out"), std::string::npos);
    // The first worker is still sleeping; the next call gives up rather than run beside it.
    const std::string blocked = agent->ProcessMessage("two");
    EXPECT_NE(blocked.find("previous provider call still running"), std::string::npos);
    EXPECT_EQ(f.provider->toolCallRequests.load(), 1);

    agent->SetProviderTimeoutMs(5000);
    EXPECT_EQ(agent->ProcessMessage("three"), "final answer");
    EXPECT_EQ(f.provider->toolCallRequests.load(), 2);
    EXPECT_EQ(f.provider->responseRequests.load(), 1);
    EXPECT_EQ(f.provider->maxInFlight.load(), 1);
    EXPECT_EQ(agent->GetHistory().size(), 7u);
}

TEST(Agent, CancelAfterToolTurnKeepsConnection) {
    AgentFixture f;
    f.conn.server->tools = {Tool("echo", "Echo text")};
    f.provider->toolCall = llm::ToolCall{"echo", MakeObject()};
    auto agent = f.Make();
    agent->Start();

    EXPECT_EQ(agent->ProcessMessage("first"), "final answer");
    agent->Cancel();
    EXPECT_TRUE(agent->GetClient().IsReady());
    EXPECT_EQ(f.conn.channel->TerminateCount(), 0u);
    EXPECT_EQ(agent->ProcessMessage("second"), "final answer");
    EXPECT_EQ(f.conn.server->CountOf("tools/call"), 2u);
}

TEST(Agent, CancelDuringToolCallFailsConnection) {
    AgentFixture f;
    f.conn.server->tools = {Tool("slow", "Never answers")};
    f.provider->toolCall = llm::ToolCall{"slow", MakeObject()};
    auto agent = f.Make();
    agent->Start();
    f.conn.server->hook = [](const JSONRPCRequest&) -> std::optional<std::vector<std::string>> {
        return std::vector<std::string>{};
    };

    std::thread canceller([&agent]() {
        while (agent->GetTurnState() != TurnState::ToolExecuting) {
            std::this_thread::sleep_for(5ms);
        }
        std::this_thread::sleep_for(50ms);
        agent->Cancel();
    });
    const std::string reply = agent->ProcessMessage("use slow");
    canceller.join();
    EXPECT_EQ(reply.rfind("Error using tool slow: ", 0), 0u);
    EXPECT_EQ(agent->GetClient().GetState(), ConnectionState::Failed);
}

TEST(Agent, StartTwiceAndEarlyMessageAreRejected) {
    AgentFixture f;
    auto agent = f.Make();
    EXPECT_FALSE(agent->IsStarted());
    EXPECT_THROW(agent->ProcessMessage("too early"), std::logic_error);
    agent->Start();
    EXPECT_TRUE(agent->IsStarted());
    EXPECT_THROW(agent->Start(), std::logic_error);
    EXPECT_EQ(f.conn.channel->StartCount(), 1u);
}

TEST(Agent, StartFailurePropagatesConnectionError) {
    AgentFixture f;
    f.conn.server->rejectInitialize = true;
    auto agent = f.Make();
    EXPECT_THROW(agent->Start(), ConnectionError);
    EXPECT_FALSE(agent->IsStarted());
    EXPECT_TRUE(agent->GetHistory().empty());
}

TEST(Agent, NullCollaboratorsAreRejected) {
    ScriptedConnection conn;
    auto client = std::make_unique<Client>(ScriptedConnection::Descriptor(), conn.Factory());
    EXPECT_THROW(Agent(nullptr, std::move(client)), std::invalid_argument);
    EXPECT_THROW(Agent(std::make_shared<ScriptedProvider>(), nullptr), std::invalid_argument);
}

TEST(Agent, SystemPromptListsTools) {
    const std::string empty = Agent::BuildSystemPrompt({});
    EXPECT_EQ(empty,
              "You are an AI assistant with access to the following tools via MCP:\n\n"
              "No tools available.\n\n"
              "You can use these tools to help the user accomplish their tasks. When you need to use a tool, "
              "I will call it for you and provide the results.\n");

    const std::string two = Agent::BuildSystemPrompt({Tool("echo", "Echo text"), Tool("list_files", "List files")});
    EXPECT_NE(two.find("- echo: Echo text\n- list_files: List files\n\n"), std::string::npos);
}

TEST(Agent, StartSeedsSystemTurnFromDiscoveredTools) {
    AgentFixture f;
    f.conn.server->tools = {Tool("echo", "Echo text")};
    auto agent = f.Make();
    agent->Start();
    ASSERT_EQ(agent->GetHistory().size(), 1u);
    EXPECT_EQ(agent->GetHistory()[0].role, Role::System);
    EXPECT_EQ(agent->GetHistory()[0].content, Agent::BuildSystemPrompt({Tool("echo", "Echo text")}));
}

TEST(Agent, InteractiveLoop) {
    AgentFixture f;
    f.conn.server->tools = {Tool("echo", "Echo text"), Tool("list_files", "List files")};
    f.provider->response = "ok";
    auto agent = f.Make();
    agent->Start();

    std::istringstream in("hello\n\n   \nQUIT\nnever read\n");
    std::ostringstream out;
    agent->RunInteractive(in, out);

    const std::string text = out.str();
    EXPECT_EQ(text.rfind("MCP Agent started! Type 'quit' to exit.\nAvailable tools: echo, list_files\n", 0), 0u);
    EXPECT_NE(text.find("Assistant: ok\n"), std::string::npos);
    EXPECT_NE(text.find("Goodbye!\n"), std::string::npos);
    EXPECT_EQ(f.provider->responseRequests.load(), 1);
    EXPECT_EQ(agent->GetHistory().size(), 3u);
}

TEST(Agent, CleanupIsIdempotent) {
    AgentFixture f;
    auto agent = f.Make();
    agent->Start();
    agent->Cleanup();
    agent->Cleanup();
    EXPECT_EQ(agent->GetClient().GetState(), ConnectionState::Disconnected);
    EXPECT_EQ(f.conn.channel->TerminateCount(), 1u);
}

TEST(TurnStateNames, AreReadable) {
    EXPECT_STREQ(ToString(TurnState::Idle), "Idle");
    EXPECT_STREQ(ToString(TurnState::ToolExecuting), "ToolExecuting");
}
