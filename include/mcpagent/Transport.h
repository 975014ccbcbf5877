//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Transport.h
// Purpose: Line-oriented transport abstraction for talking to one MCP server process
//==========================================================================================================

#pragma once

#include <chrono>
#include <memory>
#include <string>

#include "mcpagent/Protocol.h"

namespace mcpagent {

//==========================================================================================================
// ITransport
// Purpose: Owns one server connection and exchanges newline-delimited JSON lines with it.
// Notes:
//   - Strictly one outstanding request per connection; the transport never demultiplexes.
//   - All failures are reported as ConnectionError.
//   - Apart from Interrupt(), methods are called from the single thread that owns the connection.
//==========================================================================================================
class ITransport {
public:
    virtual ~ITransport() = default;

    /////////////////////////////////////////// Connection lifecycle ///////////////////////////////////////////
    //==========================================================================================================
    // Starts the server described by `server` and wires its standard streams.
    // Args:
    //   server: Command vector plus argument vector.
    // Throws:
    //   ConnectionError when the process cannot be spawned.
    //==========================================================================================================
    virtual void Start(const ServerDescriptor& server) = 0;

    //==========================================================================================================
    // Stops the server process and releases the pipes. Idempotent; never throws.
    //==========================================================================================================
    virtual void Terminate() = 0;

    //==========================================================================================================
    // Forcibly aborts the connection from any thread so that a blocked ReadLine/WriteLine fails promptly.
    // The owner thread still calls Terminate() afterwards to reap resources.
    //==========================================================================================================
    virtual void Interrupt() = 0;

    //==========================================================================================================
    // Indicates whether the connection is usable for further I/O.
    //==========================================================================================================
    virtual bool IsRunning() const = 0;

    //==========================================================================================================
    // Returns a transport session identifier for diagnostics.
    //==========================================================================================================
    virtual std::string GetSessionId() const = 0;

    /////////////////////////////////////////// Line I/O ///////////////////////////////////////////
    //==========================================================================================================
    // Writes one serialized JSON value followed by '\n' and flushes it.
    // Args:
    //   line: Payload without the terminator; must not contain '\n'.
    //   timeout: Deadline for the whole write; zero or negative waits indefinitely.
    //==========================================================================================================
    virtual void WriteLine(const std::string& line, std::chrono::milliseconds timeout) = 0;

    //==========================================================================================================
    // Blocks for exactly one complete line and returns it without the terminator ("\r\n" tolerated).
    // Args:
    //   timeout: Deadline for the line to arrive; zero or negative waits indefinitely.
    // Throws:
    //   ConnectionError on end of stream before a full line, deadline expiry, or interruption.
    //==========================================================================================================
    virtual std::string ReadLine(std::chrono::milliseconds timeout) = 0;
};

//==========================================================================================================
// Transport factory interface
// Purpose: Creates a fresh, unstarted transport for every connection attempt.
//==========================================================================================================
class ITransportFactory {
public:
    virtual ~ITransportFactory() = default;

    virtual std::unique_ptr<ITransport> CreateTransport() = 0;
};

} // namespace mcpagent
