//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Provider.h
// Purpose: Language-model provider contract used by the agent
//==========================================================================================================

#pragma once

#include <optional>
#include <stop_token>
#include <string>
#include <vector>

#include "mcpagent/Conversation.h"
#include "mcpagent/JSONRPCTypes.h"
#include "mcpagent/Protocol.h"

namespace mcpagent {
namespace llm {

// A provider's decision to invoke a tool.
struct ToolCall {
    std::string name;
    JSONValue arguments{JSONValue::Object{}};
};

// Settings handed to a provider factory. Vendor providers read what they need.
struct ProviderSettings {
    std::string model;
    std::string apiKey;
    std::string baseUrl;
    std::optional<double> temperature;
    std::optional<int> maxTokens;
};

//==========================================================================================================
// ILLMProvider
// Purpose: Abstract language-model integration. Implementations may block; the agent bounds every call
//          with a deadline and requests a stop through the token when it gives up.
// Notes:
//   - Calls are made from a worker thread, one at a time per provider instance.
//   - Failures are reported by throwing (ProviderError preferred).
//==========================================================================================================
class ILLMProvider {
public:
    virtual ~ILLMProvider() = default;

    virtual std::string GetName() const = 0;

    //==========================================================================================================
    // GenerateResponse
    // Purpose: Produces the assistant's reply text for the conversation so far.
    // Args:
    //   history: All turns, oldest first.
    //   tools: Tools to advertise, when the caller wants them advertised.
    //   stop: Signalled when the caller abandons the call.
    //==========================================================================================================
    virtual std::string GenerateResponse(const std::vector<ConversationTurn>& history,
                                         const std::optional<std::vector<Tool>>& tools,
                                         std::stop_token stop) = 0;

    //==========================================================================================================
    // GenerateToolCall
    // Purpose: Decides whether the latest user turn needs a tool.
    // Returns:
    //   The tool to call with its arguments, or std::nullopt to answer directly.
    //==========================================================================================================
    virtual std::optional<ToolCall> GenerateToolCall(const std::vector<ConversationTurn>& history,
                                                     const std::vector<Tool>& tools,
                                                     std::stop_token stop) = 0;
};

} // namespace llm
} // namespace mcpagent
