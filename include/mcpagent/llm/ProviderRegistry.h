//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ProviderRegistry.h
// Purpose: Provider selection by kind through registered factories
//==========================================================================================================

#pragma once

#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "mcpagent/llm/Provider.h"

namespace mcpagent {
namespace llm {

enum class ProviderKind {
    OpenAI,
    Anthropic,
    Local
};

const char* ToString(ProviderKind kind);

// Case-insensitive "openai", "anthropic", "local"; std::nullopt otherwise.
std::optional<ProviderKind> ParseProviderKind(const std::string& text);

//==========================================================================================================
// ProviderRegistry
// Purpose: Maps a ProviderKind to the factory that builds it. Local is registered on construction;
//          embedding applications register vendor providers.
//==========================================================================================================
class ProviderRegistry {
public:
    using Factory = std::function<std::shared_ptr<ILLMProvider>(const ProviderSettings&)>;

    ProviderRegistry();

    // Registers or replaces the factory for `kind`.
    void Register(ProviderKind kind, Factory factory);

    bool IsRegistered(ProviderKind kind) const;
    std::vector<ProviderKind> RegisteredKinds() const;
    // Registered kinds joined with '|', e.g. "openai|local", for usage text.
    std::string RegisteredKindNames() const;

    //==========================================================================================================
    // Create
    // Purpose: Builds a provider of the given kind.
    // Throws:
    //   ProviderError when no factory is registered for `kind` or the factory yields nothing.
    //==========================================================================================================
    std::shared_ptr<ILLMProvider> Create(ProviderKind kind, const ProviderSettings& settings = {}) const;

private:
    mutable std::mutex mutex;
    std::unordered_map<ProviderKind, Factory> factories;
};

} // namespace llm
} // namespace mcpagent
