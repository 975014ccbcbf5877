//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: RuleBasedProvider.h
// Purpose: Offline provider that picks tools by name matching
//==========================================================================================================

#pragma once

#include "mcpagent/llm/Provider.h"

namespace mcpagent {
namespace llm {

//==========================================================================================================
// RuleBasedProvider
// Purpose: Deterministic stand-in for a language model.
//   - GenerateToolCall: the latest user turn mentioning a tool name (case-insensitive; '_' may be
//     written as a space) selects that tool with empty arguments. The longest matching name wins.
//   - GenerateResponse: reports the latest tool result, or acknowledges the latest user text.
//==========================================================================================================
class RuleBasedProvider : public ILLMProvider {
public:
    std::string GetName() const override { return "local"; }

    std::string GenerateResponse(const std::vector<ConversationTurn>& history,
                                 const std::optional<std::vector<Tool>>& tools,
                                 std::stop_token stop) override;

    std::optional<ToolCall> GenerateToolCall(const std::vector<ConversationTurn>& history,
                                             const std::vector<Tool>& tools,
                                             std::stop_token stop) override;
};

} // namespace llm
} // namespace mcpagent
