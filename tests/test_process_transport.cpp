//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_process_transport.cpp
// Purpose: Child-process transport tests using system utilities and the fake MCP server
//==========================================================================================================

#include <gtest/gtest.h>
#include "mcpagent/ProcessTransport.hpp"
#include "mcpagent/errors/Errors.h"
#include <chrono>
#include <thread>

using namespace mcpagent;
using namespace std::chrono_literals;

namespace {
ServerDescriptor command(std::vector<std::string> cmd, std::vector<std::string> args = {}) {
    ServerDescriptor d;
    d.command = std::move(cmd);
    d.args = std::move(args);
    return d;
}
}

TEST(ProcessTransport, EchoesLinesThroughCat) {
    ProcessTransport t;
    t.Start(command({"cat"}));
    ASSERT_TRUE(t.IsRunning());
    EXPECT_GT(t.GetPid(), 0);
    EXPECT_EQ(t.GetSessionId(), "process-" + std::to_string(t.GetPid()));

    t.WriteLine(R"({"jsonrpc":"2.0","id":1,"method":"ping"})", 2000ms);
    t.WriteLine("second", 2000ms);
    EXPECT_EQ(t.ReadLine(2000ms), R"({"jsonrpc":"2.0","id":1,"method":"ping"})");
    EXPECT_EQ(t.ReadLine(2000ms), "second");

    t.Terminate();
    EXPECT_FALSE(t.IsRunning());
    EXPECT_EQ(t.GetPid(), -1);
    EXPECT_NO_THROW(t.Terminate());
}

TEST(ProcessTransport, CarriageReturnIsStripped) {
    ProcessTransport t;
    t.Start(command({"sh"}, {"-c", "printf 'line\\r\\n'; sleep 5"}));
    EXPECT_EQ(t.ReadLine(2000ms), "line");
    t.Terminate();
}

TEST(ProcessTransport, EndOfStreamIsConnectionError) {
    ProcessTransport t;
    t.Start(command({"sh"}, {"-c", "printf 'partial'"}));
    EXPECT_THROW(t.ReadLine(2000ms), ConnectionError);
    EXPECT_FALSE(t.IsRunning());
    t.Terminate();
    ASSERT_TRUE(t.GetExitCode().has_value());
    EXPECT_EQ(t.GetExitCode().value(), 0);
}

TEST(ProcessTransport, ReadDeadlineExpires) {
    ProcessTransport t;
    t.Start(command({"sleep"}, {"30"}));
    const auto begin = std::chrono::steady_clock::now();
    EXPECT_THROW(t.ReadLine(200ms), ConnectionError);
    EXPECT_LT(std::chrono::steady_clock::now() - begin, 5s);
    t.Terminate();
    EXPECT_EQ(t.GetPid(), -1);
}

TEST(ProcessTransport, MissingExecutableFailsToStart) {
    ProcessTransport t;
    EXPECT_THROW(t.Start(command({"/nonexistent/definitely-not-a-server"})), ConnectionError);
    EXPECT_FALSE(t.IsRunning());
    EXPECT_THROW(t.Start(command({})), ConnectionError);
}

TEST(ProcessTransport, InterruptUnblocksReader) {
    ProcessTransport t;
    t.Start(command({"sleep"}, {"30"}));
    std::thread canceller([&t]() {
        std::this_thread::sleep_for(100ms);
        t.Interrupt();
    });
    const auto begin = std::chrono::steady_clock::now();
    EXPECT_THROW(t.ReadLine(0ms), ConnectionError);
    EXPECT_LT(std::chrono::steady_clock::now() - begin, 5s);
    canceller.join();
    t.Terminate();
    ASSERT_TRUE(t.GetExitCode().has_value());
    EXPECT_EQ(t.GetExitCode().value(), 128 + 9);
}

TEST(ProcessTransport, StubbornChildIsKilledAfterGrace) {
    ProcessTransport t;
    t.SetTerminateGraceMs(200);
    t.Start(command({FAKE_MCP_SERVER_PATH}, {"ignore-sigterm"}));
    // Give the child time to install its SIGTERM handler.
    std::this_thread::sleep_for(200ms);
    const auto begin = std::chrono::steady_clock::now();
    t.Terminate();
    EXPECT_LT(std::chrono::steady_clock::now() - begin, 5s);
    EXPECT_EQ(t.GetPid(), -1);
    ASSERT_TRUE(t.GetExitCode().has_value());
    EXPECT_EQ(t.GetExitCode().value(), 128 + 9);
}

TEST(ProcessTransport, WriteAfterTerminateFails) {
    ProcessTransport t;
    t.Start(command({"cat"}));
    t.Terminate();
    EXPECT_THROW(t.WriteLine("x", 100ms), ConnectionError);
}

TEST(ProcessTransport, FactoryCreatesIndependentTransports) {
    ProcessTransportFactory factory;
    factory.SetTerminateGraceMs(100);
    auto a = factory.CreateTransport();
    auto b = factory.CreateTransport();
    a->Start(command({"cat"}));
    b->Start(command({"cat"}));
    EXPECT_NE(a->GetSessionId(), b->GetSessionId());
    a->Terminate();
    EXPECT_TRUE(b->IsRunning());
    b->Terminate();
}
