//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: InMemoryTransport.hpp
// Purpose: In-memory transport for tests and embedding
//==========================================================================================================
#pragma once

#include "mcpagent/Transport.h"
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace mcpagent {

//==========================================================================================================
// InMemoryChannel
// Purpose: State shared between an InMemoryTransport and the code playing the server. Survives the
//          transport so that tests can inspect traffic after handing the transport to a client, and
//          can back several transports in turn (one per reconnect).
//==========================================================================================================
class InMemoryChannel {
public:
    // Called for every written line; returned lines become readable in order.
    using Responder = std::function<std::vector<std::string>(const std::string& line)>;

    InMemoryChannel() = default;
    explicit InMemoryChannel(Responder responder) : responder(std::move(responder)) {}

    void SetResponder(Responder r);

    // Queues a line for the next ReadLine.
    void PushLine(const std::string& line);

    // Ends the server output: once queued lines are consumed, reads fail with end of stream.
    void CloseOutput();

    // Makes the next Start() fail as a spawn failure would.
    void FailNextStart(bool fail = true);

    std::vector<std::string> WrittenLines() const;
    std::size_t BytesWritten() const;
    std::size_t StartCount() const;
    std::size_t TerminateCount() const;
    std::vector<ServerDescriptor> StartedWith() const;

private:
    friend class InMemoryTransport;

    mutable std::mutex mutex;
    std::condition_variable cv;
    Responder responder;
    std::deque<std::string> incoming;
    std::vector<std::string> written;
    std::vector<ServerDescriptor> starts;
    std::size_t bytesWritten{0};
    std::size_t terminateCount{0};
    bool outputClosed{false};
    bool failStart{false};
};

//==========================================================================================================
// InMemoryTransport
// Purpose: ITransport with no process behind it. Writes are recorded and handed to the channel's
//          responder; reads block on the channel's queue and honor the same deadlines and
//          interruption rules as the process transport.
//==========================================================================================================
class InMemoryTransport : public ITransport {
public:
    explicit InMemoryTransport(std::shared_ptr<InMemoryChannel> channel = std::make_shared<InMemoryChannel>());
    virtual ~InMemoryTransport();

    ////////////////////////////////////////// ITransport //////////////////////////////////////////
    void Start(const ServerDescriptor& server) override;
    void Terminate() override;
    void Interrupt() override;
    bool IsRunning() const override;
    std::string GetSessionId() const override;
    void WriteLine(const std::string& line, std::chrono::milliseconds timeout) override;
    std::string ReadLine(std::chrono::milliseconds timeout) override;

    std::shared_ptr<InMemoryChannel> GetChannel() const { return channel; }

private:
    std::shared_ptr<InMemoryChannel> channel;
    bool running{false};
    bool interrupted{false};
    std::string sessionId;
};

//==========================================================================================================
// InMemoryTransportFactory
// Purpose: Produces transports bound to one shared channel.
//==========================================================================================================
class InMemoryTransportFactory : public ITransportFactory {
public:
    explicit InMemoryTransportFactory(std::shared_ptr<InMemoryChannel> channel) : channel(std::move(channel)) {}

    std::unique_ptr<ITransport> CreateTransport() override;

private:
    std::shared_ptr<InMemoryChannel> channel;
};

} // namespace mcpagent
