//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: main.cpp
// Purpose: Interactive MCP agent over a spawned stdio server
//==========================================================================================================

#include "logging/Logger.h"
#include "mcpagent/Agent.h"
#include "mcpagent/Client.h"
#include "mcpagent/errors/Errors.h"
#include "mcpagent/llm/ProviderRegistry.h"
#include <iostream>
#include <optional>
#include <string>
#include <vector>

using namespace mcpagent;

//==========================================================================================================
// printUsage
// Purpose: Writes the command-line synopsis to stderr. Only providers this binary registers are offered.
//==========================================================================================================
static void printUsage(const char* prog, const llm::ProviderRegistry& providers) {
    std::cerr << "Usage: " << prog << " [--provider=" << providers.RegisteredKindNames()
              << "] [--verbose] -- <command> [args...]\n"
              << "Environment: MCPAGENT_LOG_LEVEL, MCPAGENT_REQUEST_TIMEOUT_MS, MCPAGENT_PROVIDER_TIMEOUT_MS,\n"
              << "             MCPAGENT_TERMINATE_GRACE_MS, MCPAGENT_LOG_FILE\n";
}

int main(int argc, char** argv) {
    Logger::configureFromEnv();

    // Vendor providers are registered by applications that embed the library.
    llm::ProviderRegistry providers;
    std::string providerName = "local";
    ServerDescriptor server;
    bool sawSeparator = false;
    for (int i = 1; i < argc; ++i) {
        const std::string a = argv[i];
        if (sawSeparator) {
            if (server.command.empty()) {
                server.command.push_back(a);
            } else {
                server.args.push_back(a);
            }
        } else if (a == "--") {
            sawSeparator = true;
        } else if (a.rfind("--provider=", 0) == 0) {
            providerName = a.substr(11);
        } else if (a == "--verbose" || a == "-v") {
            Logger::setLogLevel(LogLevel::LOG_DEBUG_LEVEL);
        } else if (a == "--help" || a == "-h") {
            printUsage(argv[0], providers);
            return 0;
        } else {
            std::cerr << "Unknown option: " << a << "\n";
            printUsage(argv[0], providers);
            return 2;
        }
    }
    if (server.command.empty()) {
        printUsage(argv[0], providers);
        return 2;
    }

    const std::optional<llm::ProviderKind> kind = llm::ParseProviderKind(providerName);
    if (!kind.has_value()) {
        std::cerr << "Unknown provider: " << providerName << "\n";
        return 2;
    }
    if (!providers.IsRegistered(kind.value())) {
        std::cerr << "Provider '" << providerName << "' is not available in this build (available: "
                  << providers.RegisteredKindNames() << ")\n";
        return 2;
    }

    try {
        auto provider = providers.Create(kind.value());

        ClientFactory factory;
        Agent agent(provider, factory.CreateClient(server, Implementation(DEFAULT_CLIENT_NAME, DEFAULT_CLIENT_VERSION)));
        agent.Start();
        agent.RunInteractive(std::cin, std::cout);
        agent.Cleanup();
    } catch (const ProviderError& e) {
        LOG_ERROR("Provider setup failed: {}", e.what());
        std::cerr << "Provider error: " << e.what() << "\n";
        return 1;
    } catch (const ConnectionError& e) {
        LOG_ERROR("Connection failed: {}", e.what());
        std::cerr << "Failed to connect to MCP server: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
