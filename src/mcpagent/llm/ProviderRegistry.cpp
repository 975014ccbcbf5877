//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ProviderRegistry.cpp
// Purpose: Provider kind parsing and factory dispatch
//==========================================================================================================

#include <cctype>
#include <format>

#include "logging/Logger.h"
#include "mcpagent/errors/Errors.h"
#include "mcpagent/llm/ProviderRegistry.h"
#include "mcpagent/llm/RuleBasedProvider.h"

namespace mcpagent {
namespace llm {

const char* ToString(ProviderKind kind) {
    switch (kind) {
        case ProviderKind::OpenAI: return "openai";
        case ProviderKind::Anthropic: return "anthropic";
        case ProviderKind::Local: return "local";
    }
    return "unknown";
}

std::optional<ProviderKind> ParseProviderKind(const std::string& text) {
    std::string s;
    s.reserve(text.size());
    for (char c : text) s.push_back(static_cast<char>(::tolower(static_cast<unsigned char>(c))));
    if (s == "openai") return ProviderKind::OpenAI;
    if (s == "anthropic") return ProviderKind::Anthropic;
    if (s == "local") return ProviderKind::Local;
    return std::nullopt;
}

ProviderRegistry::ProviderRegistry() {
    factories[ProviderKind::Local] = [](const ProviderSettings&) {
        return std::make_shared<RuleBasedProvider>();
    };
}

void ProviderRegistry::Register(ProviderKind kind, Factory factory) {
    std::lock_guard<std::mutex> lk(mutex);
    if (!factory) {
        factories.erase(kind);
        return;
    }
    factories[kind] = std::move(factory);
    LOG_DEBUG("ProviderRegistry: registered {}", ToString(kind));
}

bool ProviderRegistry::IsRegistered(ProviderKind kind) const {
    std::lock_guard<std::mutex> lk(mutex);
    return factories.find(kind) != factories.end();
}

std::vector<ProviderKind> ProviderRegistry::RegisteredKinds() const {
    std::lock_guard<std::mutex> lk(mutex);
    std::vector<ProviderKind> out;
    for (ProviderKind k : {ProviderKind::OpenAI, ProviderKind::Anthropic, ProviderKind::Local}) {
        if (factories.find(k) != factories.end()) out.push_back(k);
    }
    return out;
}

std::string ProviderRegistry::RegisteredKindNames() const {
    std::string names;
    for (ProviderKind k : RegisteredKinds()) {
        if (!names.empty()) names += '|';
        names += ToString(k);
    }
    return names;
}

std::shared_ptr<ILLMProvider> ProviderRegistry::Create(ProviderKind kind, const ProviderSettings& settings) const {
    Factory factory;
    {
        std::lock_guard<std::mutex> lk(mutex);
        auto it = factories.find(kind);
        if (it == factories.end()) {
            throw ProviderError(std::format("No provider registered for '{}'", ToString(kind)));
        }
        factory = it->second;
    }
    auto provider = factory(settings);
    if (!provider) {
        throw ProviderError(std::format("Provider factory for '{}' returned nothing", ToString(kind)));
    }
    return provider;
}

} // namespace llm
} // namespace mcpagent
