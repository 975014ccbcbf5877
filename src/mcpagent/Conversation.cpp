//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Conversation.cpp
// Purpose: Conversation log
//==========================================================================================================

#include "mcpagent/Conversation.h"

namespace mcpagent {

const char* RoleToString(Role role) {
    switch (role) {
        case Role::System: return "system";
        case Role::User: return "user";
        case Role::Assistant: return "assistant";
    }
    return "user";
}

void Conversation::Append(Role role, std::string content) {
    turns.emplace_back(role, std::move(content));
}

const ConversationTurn* Conversation::LastOf(Role role) const {
    for (auto it = turns.rbegin(); it != turns.rend(); ++it) {
        if (it->role == role) {
            return &*it;
        }
    }
    return nullptr;
}

} // namespace mcpagent
