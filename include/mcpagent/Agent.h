//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Agent.h
// Purpose: Orchestrator that interleaves language-model calls with MCP tool invocations
//==========================================================================================================

#pragma once

#include <cstdint>
#include <iosfwd>
#include <memory>
#include <string>
#include <vector>

#include "mcpagent/Client.h"
#include "mcpagent/Conversation.h"
#include "mcpagent/llm/Provider.h"

namespace mcpagent {

//==========================================================================================================
// TurnState
// Purpose: Where ProcessMessage is within one user turn.
//   Idle -> AwaitingToolDecision -> (ToolExecuting -> AwaitingFinalResponse | DirectResponse) -> Idle
//==========================================================================================================
enum class TurnState {
    Idle,
    AwaitingToolDecision,
    ToolExecuting,
    AwaitingFinalResponse,
    DirectResponse
};

const char* ToString(TurnState state);

//==========================================================================================================
// Agent
// Purpose: Owns the conversation and drives each user turn through the provider and, at most once per
//          turn, through the client's CallTool.
// Notes:
//   - ProcessMessage calls must be sequential. Cancel() may be called from any thread.
//   - Every provider call runs on the Agent's single worker thread, bounded by the provider timeout.
//==========================================================================================================
class Agent {
public:
    Agent(std::shared_ptr<llm::ILLMProvider> provider, std::unique_ptr<IClient> client);
    ~Agent();

    Agent(const Agent&) = delete;
    Agent& operator=(const Agent&) = delete;

    //==========================================================================================================
    // Start
    // Purpose: Connects the client unless it is already Ready, then seeds the history with one system turn
    //          listing the available tools.
    // Throws:
    //   ConnectionError from Connect(); std::logic_error when called twice.
    //==========================================================================================================
    void Start();

    //==========================================================================================================
    // ProcessMessage
    // Purpose: Runs one user turn.
    // Returns:
    //   The assistant's final text. Tool failures yield "Error using tool <name>: <reason>"; provider
    //   failures and timeouts yield "Error: <reason>". Exactly one assistant turn is appended either way.
    // Throws:
    //   std::logic_error before Start().
    //==========================================================================================================
    std::string ProcessMessage(const std::string& text);

    //==========================================================================================================
    // RunInteractive
    // Purpose: Line-oriented chat loop. Blank lines are skipped; quit, exit and q end the loop.
    //==========================================================================================================
    void RunInteractive(std::istream& in, std::ostream& out);

    // Stops the in-flight provider call and any in-flight tool request.
    void Cancel();

    // Disconnects the client. Idempotent.
    void Cleanup();

    const std::vector<ConversationTurn>& GetHistory() const;
    TurnState GetTurnState() const;
    bool IsStarted() const;
    IClient& GetClient();

    //==========================================================================================================
    // SetProviderTimeoutMs
    // Purpose: Deadline for one provider call. 0 disables it.
    // Args:
    //   timeoutMs: Milliseconds (default 120000, or MCPAGENT_PROVIDER_TIMEOUT_MS).
    //==========================================================================================================
    void SetProviderTimeoutMs(uint64_t timeoutMs);

    // System turn text for the given tools.
    static std::string BuildSystemPrompt(const std::vector<Tool>& tools);

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace mcpagent
