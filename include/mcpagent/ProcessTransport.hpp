//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ProcessTransport.hpp
// Purpose: Transport that spawns an MCP server process and talks to it over its stdin/stdout pipes
//==========================================================================================================
#pragma once

#include "mcpagent/Transport.h"
#include <cstdint>
#include <memory>
#include <optional>

namespace mcpagent {

//==========================================================================================================
// ProcessTransport
// Purpose: Owns one child process. Requests go to the child's stdin, responses are read line by line
//          from its stdout; the child's stderr is inherited. Pipe I/O runs on a private Boost.Asio
//          io_context so every read and write can be bounded by a deadline.
//==========================================================================================================
class ProcessTransport : public ITransport {
public:
    ProcessTransport();
    virtual ~ProcessTransport();

    ProcessTransport(const ProcessTransport&) = delete;
    ProcessTransport& operator=(const ProcessTransport&) = delete;

    ////////////////////////////////////////// ITransport //////////////////////////////////////////
    //==========================================================================================================
    // Spawns `command` followed by `args` (PATH lookup, environment inherited).
    // Throws:
    //   ConnectionError when the command is empty, the executable cannot be run, or pipes cannot be made.
    //==========================================================================================================
    void Start(const ServerDescriptor& server) override;

    //==========================================================================================================
    // Closes the child's stdin, sends SIGTERM, waits up to the grace period, then SIGKILL; reaps the
    // child and closes the pipes. Safe to call repeatedly.
    //==========================================================================================================
    void Terminate() override;

    //==========================================================================================================
    // Kills the child with SIGKILL and wakes any blocked read or write. Thread-safe.
    //==========================================================================================================
    void Interrupt() override;

    bool IsRunning() const override;
    std::string GetSessionId() const override;

    void WriteLine(const std::string& line, std::chrono::milliseconds timeout) override;
    std::string ReadLine(std::chrono::milliseconds timeout) override;

    //==========================================================================================================
    // SetTerminateGraceMs
    // Purpose: Time to wait for the child to exit after closing stdin/SIGTERM before escalating to SIGKILL.
    // Args:
    //   graceMs: Milliseconds (default 2000, or MCPAGENT_TERMINATE_GRACE_MS).
    //==========================================================================================================
    void SetTerminateGraceMs(uint64_t graceMs);

    // Child process id, or -1 when no child is alive.
    int GetPid() const;

    // Exit status of the reaped child (as decoded by WEXITSTATUS, or 128+signal), when known.
    std::optional<int> GetExitCode() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

//==========================================================================================================
// ProcessTransportFactory
// Purpose: Factory for creating process transports.
//==========================================================================================================
class ProcessTransportFactory : public ITransportFactory {
public:
    std::unique_ptr<ITransport> CreateTransport() override;

    void SetTerminateGraceMs(uint64_t graceMs) { terminateGraceMs = graceMs; }

private:
    std::optional<uint64_t> terminateGraceMs;
};

} // namespace mcpagent
