//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Conversation.h
// Purpose: Append-only conversation log shared between the orchestrator and providers
//==========================================================================================================

#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace mcpagent {

enum class Role {
    System,
    User,
    Assistant
};

// "system", "user" or "assistant", as language-model APIs spell them.
const char* RoleToString(Role role);

struct ConversationTurn {
    Role role{Role::User};
    std::string content;

    ConversationTurn() = default;
    ConversationTurn(Role role, std::string content) : role(role), content(std::move(content)) {}
};

//==========================================================================================================
// Conversation
// Purpose: Ordered turns. Turns are only appended; nothing is edited, removed, or reordered.
//==========================================================================================================
class Conversation {
public:
    void Append(Role role, std::string content);

    const std::vector<ConversationTurn>& Turns() const { return turns; }
    std::size_t Size() const { return turns.size(); }
    bool Empty() const { return turns.empty(); }

    // Latest turn with the given role, or nullptr.
    const ConversationTurn* LastOf(Role role) const;

private:
    std::vector<ConversationTurn> turns;
};

} // namespace mcpagent
