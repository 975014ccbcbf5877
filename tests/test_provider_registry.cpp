//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_provider_registry.cpp
// Purpose: Provider selection and the built-in rule-based provider
//==========================================================================================================

#include <gtest/gtest.h>
#include "mcpagent/errors/Errors.h"
#include "mcpagent/llm/ProviderRegistry.h"
#include "mcpagent/llm/RuleBasedProvider.h"

using namespace mcpagent;
using namespace mcpagent::llm;

namespace {
class NamedProvider : public RuleBasedProvider {
public:
    explicit NamedProvider(std::string n) : name(std::move(n)) {}
    std::string GetName() const override { return name; }
private:
    std::string name;
};

std::vector<ConversationTurn> userSays(const std::string& text) {
    return {ConversationTurn(Role::System, "sys"), ConversationTurn(Role::User, text)};
}
}

TEST(ProviderRegistry, ParsesKindNames) {
    EXPECT_EQ(ParseProviderKind("openai"), ProviderKind::OpenAI);
    EXPECT_EQ(ParseProviderKind("Anthropic"), ProviderKind::Anthropic);
    EXPECT_EQ(ParseProviderKind("LOCAL"), ProviderKind::Local);
    EXPECT_FALSE(ParseProviderKind("gemini").has_value());
    EXPECT_STREQ(ToString(ProviderKind::Anthropic), "anthropic");
}

TEST(ProviderRegistry, LocalIsAvailableByDefault) {
    ProviderRegistry reg;
    EXPECT_TRUE(reg.IsRegistered(ProviderKind::Local));
    EXPECT_FALSE(reg.IsRegistered(ProviderKind::OpenAI));
    EXPECT_EQ(reg.RegisteredKinds(), std::vector<ProviderKind>{ProviderKind::Local});
    EXPECT_EQ(reg.RegisteredKindNames(), "local");
    auto p = reg.Create(ProviderKind::Local);
    ASSERT_TRUE(p);
    EXPECT_EQ(p->GetName(), "local");
}

TEST(ProviderRegistry, UnregisteredKindThrows) {
    ProviderRegistry reg;
    try {
        reg.Create(ProviderKind::OpenAI);
        FAIL() << "expected ProviderError";
    } catch (const ProviderError& e) {
        EXPECT_STREQ(e.what(), "No provider registered for 'openai'");
    }
}

TEST(ProviderRegistry, RegisterReplaceAndRemove) {
    ProviderRegistry reg;
    reg.Register(ProviderKind::OpenAI, [](const ProviderSettings& s) {
        return std::make_shared<NamedProvider>("openai:" + s.model);
    });
    ProviderSettings settings;
    settings.model = "gpt-4";
    EXPECT_EQ(reg.Create(ProviderKind::OpenAI, settings)->GetName(), "openai:gpt-4");
    EXPECT_EQ(reg.RegisteredKinds(), (std::vector<ProviderKind>{ProviderKind::OpenAI, ProviderKind::Local}));
    EXPECT_EQ(reg.RegisteredKindNames(), "openai|local");

    reg.Register(ProviderKind::OpenAI, [](const ProviderSettings&) { return std::shared_ptr<ILLMProvider>(); });
    EXPECT_THROW(reg.Create(ProviderKind::OpenAI), ProviderError);

    reg.Register(ProviderKind::OpenAI, nullptr);
    EXPECT_FALSE(reg.IsRegistered(ProviderKind::OpenAI));
}

TEST(RuleBasedProvider, PicksLongestMentionedTool) {
    RuleBasedProvider p;
    std::vector<Tool> tools = {Tool("list", "short"), Tool("list_files", "long"), Tool("echo", "echo")};
    auto call = p.GenerateToolCall(userSays("please list files in /tmp"), tools, std::stop_token());
    ASSERT_TRUE(call.has_value());
    EXPECT_EQ(call->name, "list_files");
    EXPECT_TRUE(call->arguments.isObject());

    auto none = p.GenerateToolCall(userSays("good morning"), tools, std::stop_token());
    EXPECT_FALSE(none.has_value());
}

TEST(RuleBasedProvider, RespondsToToolResultsAndPlainText) {
    RuleBasedProvider p;
    EXPECT_EQ(p.GenerateResponse(userSays("hi"), std::nullopt, std::stop_token()), "You said: hi");
    EXPECT_EQ(p.GenerateResponse(userSays("Tool result: [1]"), std::nullopt, std::stop_token()),
              "Here is what the tool returned: [1]");
    std::vector<ConversationTurn> onlySystem = {ConversationTurn(Role::System, "sys")};
    EXPECT_EQ(p.GenerateResponse(onlySystem, std::nullopt, std::stop_token()), "Hello! How can I help?");
}

TEST(RuleBasedProvider, HonorsStopRequest) {
    RuleBasedProvider p;
    std::stop_source source;
    source.request_stop();
    EXPECT_THROW(p.GenerateResponse(userSays("hi"), std::nullopt, source.get_token()), ProviderError);
    EXPECT_THROW(p.GenerateToolCall(userSays("hi"), {}, source.get_token()), ProviderError);
}
