//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: RuleBasedProvider.cpp
// Purpose: Offline provider implementation
//==========================================================================================================

#include <algorithm>
#include <cctype>

#include "mcpagent/errors/Errors.h"
#include "mcpagent/llm/RuleBasedProvider.h"

namespace mcpagent {
namespace llm {

namespace {
constexpr const char* ToolResultPrefix = "Tool result: ";

std::string lower(const std::string& in) {
    std::string s;
    s.reserve(in.size());
    for (char c : in) s.push_back(static_cast<char>(::tolower(static_cast<unsigned char>(c))));
    return s;
}

const ConversationTurn* lastUserTurn(const std::vector<ConversationTurn>& history) {
    for (auto it = history.rbegin(); it != history.rend(); ++it) {
        if (it->role == Role::User) return &*it;
    }
    return nullptr;
}

void throwIfStopped(const std::stop_token& stop) {
    if (stop.stop_requested()) {
        throw ProviderError("local provider: stop requested");
    }
}
} // namespace

std::optional<ToolCall> RuleBasedProvider::GenerateToolCall(const std::vector<ConversationTurn>& history,
                                                            const std::vector<Tool>& tools,
                                                            std::stop_token stop) {
    throwIfStopped(stop);
    const ConversationTurn* user = lastUserTurn(history);
    if (!user) {
        return std::nullopt;
    }
    const std::string text = lower(user->content);
    const Tool* best = nullptr;
    for (const auto& tool : tools) {
        if (tool.name.empty()) continue;
        const std::string name = lower(tool.name);
        std::string spaced = name;
        std::replace(spaced.begin(), spaced.end(), '_', ' ');
        const bool mentioned = text.find(name) != std::string::npos || text.find(spaced) != std::string::npos;
        if (mentioned && (!best || tool.name.size() > best->name.size())) {
            best = &tool;
        }
    }
    if (!best) {
        return std::nullopt;
    }
    return ToolCall{best->name, JSONValue{JSONValue::Object{}}};
}

std::string RuleBasedProvider::GenerateResponse(const std::vector<ConversationTurn>& history,
                                                const std::optional<std::vector<Tool>>& /*tools*/,
                                                std::stop_token stop) {
    throwIfStopped(stop);
    const ConversationTurn* user = lastUserTurn(history);
    if (!user) {
        return "Hello! How can I help?";
    }
    const std::string prefix(ToolResultPrefix);
    if (user->content.rfind(prefix, 0) == 0) {
        return "Here is what the tool returned: " + user->content.substr(prefix.size());
    }
    return "You said: " + user->content;
}

} // namespace llm
} // namespace mcpagent
