//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Agent.cpp
// Purpose: Orchestrator implementation
//==========================================================================================================

#include <atomic>
#include <cctype>
#include <chrono>
#include <format>
#include <future>
#include <istream>
#include <mutex>
#include <memory>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <stop_token>
#include <string>
#include <thread>

#include "env/EnvVars.h"
#include "logging/Logger.h"
#include "mcpagent/Agent.h"
#include "mcpagent/errors/Errors.h"

namespace mcpagent {

namespace {
// Granularity at which a waiting provider call notices Cancel().
constexpr std::chrono::milliseconds CancelPollInterval{20};

std::string trim(const std::string& s) {
    std::size_t b = 0;
    std::size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return s.substr(b, e - b);
}

std::string lower(std::string s) {
    for (auto& c : s) c = static_cast<char>(::tolower(static_cast<unsigned char>(c)));
    return s;
}
} // namespace

const char* ToString(TurnState state) {
    switch (state) {
        case TurnState::Idle: return "Idle";
        case TurnState::AwaitingToolDecision: return "AwaitingToolDecision";
        case TurnState::ToolExecuting: return "ToolExecuting";
        case TurnState::AwaitingFinalResponse: return "AwaitingFinalResponse";
        case TurnState::DirectResponse: return "DirectResponse";
    }
    return "Unknown";
}

class Agent::Impl {
public:
    std::shared_ptr<llm::ILLMProvider> provider;
    std::unique_ptr<IClient> client;
    Conversation history;
    bool started{false};
    std::atomic<TurnState> turnState{TurnState::Idle};
    std::atomic<bool> cancelRequested{false};
    std::chrono::milliseconds providerTimeout{120000};

    // One provider worker at a time. A worker abandoned by a timeout or Cancel() stays here until it
    // returns; the next call waits for it and the destructor joins it.
    std::mutex workerMutex;
    std::jthread worker;
    std::shared_ptr<std::atomic<bool>> workerDone = std::make_shared<std::atomic<bool>>(true);

    Impl(std::shared_ptr<llm::ILLMProvider> p, std::unique_ptr<IClient> c)
        : provider(std::move(p)), client(std::move(c)) {
        providerTimeout = std::chrono::milliseconds(
            GetEnvUInt64OrDefault(EnvNames::ProviderTimeoutMs, 120000));
    }

    void setTurnState(TurnState s) {
        turnState.store(s);
        LOG_DEBUG("Agent: turn state {}", ToString(s));
    }

    std::optional<std::string> abandonReason(const char* what, std::chrono::steady_clock::time_point begin) const {
        if (cancelRequested.load()) {
            return std::format("{} cancelled", what);
        }
        if (providerTimeout.count() > 0 && std::chrono::steady_clock::now() - begin >= providerTimeout) {
            return std::format("{} timed out after {} ms", what, static_cast<long long>(providerTimeout.count()));
        }
        return std::nullopt;
    }

    void joinWorker() {
        std::lock_guard<std::mutex> lk(workerMutex);
        if (worker.joinable()) {
            worker.join();
        }
    }

    // Waits, within the same budget as the call itself, for a worker an earlier call gave up on.
    void awaitPreviousWorker(const char* what, std::chrono::steady_clock::time_point begin) {
        while (!workerDone->load()) {
            if (auto reason = abandonReason(what, begin)) {
                LOG_WARN("Agent: {} while the previous provider call is still running", reason.value());
                throw ProviderError(reason.value() + " (previous provider call still running)");
            }
            std::this_thread::sleep_for(CancelPollInterval);
        }
        joinWorker();
    }

    //==========================================================================================================
    // callProvider
    // Purpose: Runs `fn` on the provider worker and waits for it within the provider timeout. The worker owns
    //          copies of everything it touches, so an abandoned call may finish later without harm.
    // Throws:
    //   ProviderError on timeout or cancellation; whatever `fn` throws otherwise.
    //==========================================================================================================
    template <typename R, typename Fn>
    R callProvider(const char* what, Fn fn) {
        const auto begin = std::chrono::steady_clock::now();
        awaitPreviousWorker(what, begin);

        std::packaged_task<R(std::stop_token)> task(std::move(fn));
        std::future<R> result = task.get_future();
        auto done = std::make_shared<std::atomic<bool>>(false);
        {
            std::lock_guard<std::mutex> lk(workerMutex);
            workerDone = done;
            worker = std::jthread([task = std::move(task), done](std::stop_token stop) mutable {
                task(std::move(stop));
                done->store(true);
            });
        }

        std::optional<std::string> abandoned;
        while (result.wait_for(CancelPollInterval) != std::future_status::ready) {
            abandoned = abandonReason(what, begin);
            if (abandoned.has_value()) {
                break;
            }
        }
        if (abandoned.has_value()) {
            {
                std::lock_guard<std::mutex> lk(workerMutex);
                worker.request_stop();
            }
            LOG_WARN("Agent: {}", abandoned.value());
            throw ProviderError(abandoned.value());
        }
        joinWorker();
        return result.get();
    }

    std::optional<llm::ToolCall> decideTool() {
        auto p = provider;
        auto snapshot = history.Turns();
        auto tools = client->GetTools();
        return callProvider<std::optional<llm::ToolCall>>("tool decision",
            [p, snapshot = std::move(snapshot), tools = std::move(tools)](std::stop_token stop) {
                return p->GenerateToolCall(snapshot, tools, stop);
            });
    }

    std::string respond() {
        auto p = provider;
        auto snapshot = history.Turns();
        return callProvider<std::string>("response generation",
            [p, snapshot = std::move(snapshot)](std::stop_token stop) {
                return p->GenerateResponse(snapshot, std::nullopt, stop);
            });
    }

    std::string runTurn(const std::string& text) {
        history.Append(Role::User, text);
        setTurnState(TurnState::AwaitingToolDecision);

        try {
            std::optional<llm::ToolCall> call = decideTool();
            if (!call.has_value() || call->name.empty()) {
                setTurnState(TurnState::DirectResponse);
                return respond();
            }

            setTurnState(TurnState::ToolExecuting);
            JSONValue result;
            try {
                result = client->CallTool(call->name, call->arguments);
            } catch (const std::exception& e) {
                LOG_WARN("Agent: tool {} failed: {}", call->name, e.what());
                return std::format("Error using tool {}: {}", call->name, e.what());
            }

            history.Append(Role::Assistant, std::format("I used the {} tool with arguments: {}",
                                                        call->name, SerializeJSON(call->arguments)));
            history.Append(Role::User, "Tool result: " + SerializeJSON(result));
            setTurnState(TurnState::AwaitingFinalResponse);
            return respond();
        } catch (const std::exception& e) {
            LOG_ERROR("Agent: provider failed: {}", e.what());
            return std::string("Error: ") + e.what();
        }
    }
};

Agent::Agent(std::shared_ptr<llm::ILLMProvider> provider, std::unique_ptr<IClient> client)
    : pImpl(std::make_unique<Impl>(std::move(provider), std::move(client))) {
    if (!pImpl->provider) {
        throw std::invalid_argument("Agent requires a provider");
    }
    if (!pImpl->client) {
        throw std::invalid_argument("Agent requires a client");
    }
}

Agent::~Agent() {
    Cleanup();
}

std::string Agent::BuildSystemPrompt(const std::vector<Tool>& tools) {
    std::string toolsInfo;
    if (tools.empty()) {
        toolsInfo = "No tools available.";
    } else {
        for (std::size_t i = 0; i < tools.size(); ++i) {
            if (i > 0) toolsInfo += "\n";
            toolsInfo += std::format("- {}: {}", tools[i].name, tools[i].description);
        }
    }
    return std::format(
        "You are an AI assistant with access to the following tools via MCP:\n\n{}\n\n"
        "You can use these tools to help the user accomplish their tasks. When you need to use a tool, "
        "I will call it for you and provide the results.\n",
        toolsInfo);
}

void Agent::Start() {
    FUNC_SCOPE();
    if (pImpl->started) {
        throw std::logic_error("Agent::Start called twice");
    }
    if (!pImpl->client->IsReady()) {
        pImpl->client->Connect();
    }
    const auto tools = pImpl->client->GetTools();
    pImpl->history.Append(Role::System, BuildSystemPrompt(tools));
    pImpl->started = true;
    LOG_INFO("Agent started with provider '{}' and {} tools", pImpl->provider->GetName(), tools.size());
}

std::string Agent::ProcessMessage(const std::string& text) {
    FUNC_SCOPE();
    if (!pImpl->started) {
        throw std::logic_error("Agent::ProcessMessage called before Start");
    }
    pImpl->cancelRequested.store(false);
    std::string finalText = pImpl->runTurn(text);
    pImpl->history.Append(Role::Assistant, finalText);
    pImpl->setTurnState(TurnState::Idle);
    return finalText;
}

void Agent::RunInteractive(std::istream& in, std::ostream& out) {
    std::string names;
    for (const auto& tool : pImpl->client->GetTools()) {
        if (!names.empty()) names += ", ";
        names += tool.name;
    }
    out << "MCP Agent started! Type 'quit' to exit." << std::endl;
    out << "Available tools: " << (names.empty() ? std::string("(none)") : names) << std::endl << std::endl;

    std::string line;
    for (;;) {
        out << "You: " << std::flush;
        if (!std::getline(in, line)) {
            break;
        }
        const std::string input = trim(line);
        if (input.empty()) {
            continue;
        }
        const std::string command = lower(input);
        if (command == "quit" || command == "exit" || command == "q") {
            break;
        }
        try {
            const std::string reply = ProcessMessage(input);
            out << "Assistant: " << reply << std::endl << std::endl;
        } catch (const std::exception& e) {
            LOG_ERROR("Agent: {}", e.what());
            out << "Error: " << e.what() << std::endl << std::endl;
        }
    }
    out << "Goodbye!" << std::endl;
}

void Agent::Cancel() {
    pImpl->cancelRequested.store(true);
    {
        std::lock_guard<std::mutex> lk(pImpl->workerMutex);
        pImpl->worker.request_stop();
    }
    // The client ignores this unless a request is actually in flight.
    if (pImpl->turnState.load() == TurnState::ToolExecuting) {
        pImpl->client->Cancel();
    }
}

void Agent::Cleanup() {
    if (pImpl && pImpl->client) {
        pImpl->client->Disconnect();
    }
}

const std::vector<ConversationTurn>& Agent::GetHistory() const {
    return pImpl->history.Turns();
}

TurnState Agent::GetTurnState() const {
    return pImpl->turnState.load();
}

bool Agent::IsStarted() const {
    return pImpl->started;
}

IClient& Agent::GetClient() {
    return *pImpl->client;
}

void Agent::SetProviderTimeoutMs(uint64_t timeoutMs) {
    pImpl->providerTimeout = std::chrono::milliseconds(timeoutMs);
}

} // namespace mcpagent
