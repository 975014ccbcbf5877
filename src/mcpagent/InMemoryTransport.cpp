//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: InMemoryTransport.cpp
// Purpose: In-memory transport implementation
//==========================================================================================================

#include <atomic>
#include <chrono>
#include <format>
#include <string>

#include "logging/Logger.h"
#include "mcpagent/InMemoryTransport.hpp"
#include "mcpagent/errors/Errors.h"

namespace mcpagent {

namespace {
std::atomic<unsigned int> sessionCounter{0u};
}

////////////////////////////////////////// InMemoryChannel //////////////////////////////////////////

void InMemoryChannel::SetResponder(Responder r) {
    std::lock_guard<std::mutex> lk(mutex);
    responder = std::move(r);
}

void InMemoryChannel::PushLine(const std::string& line) {
    {
        std::lock_guard<std::mutex> lk(mutex);
        incoming.push_back(line);
    }
    cv.notify_all();
}

void InMemoryChannel::CloseOutput() {
    {
        std::lock_guard<std::mutex> lk(mutex);
        outputClosed = true;
    }
    cv.notify_all();
}

void InMemoryChannel::FailNextStart(bool fail) {
    std::lock_guard<std::mutex> lk(mutex);
    failStart = fail;
}

std::vector<std::string> InMemoryChannel::WrittenLines() const {
    std::lock_guard<std::mutex> lk(mutex);
    return written;
}

std::size_t InMemoryChannel::BytesWritten() const {
    std::lock_guard<std::mutex> lk(mutex);
    return bytesWritten;
}

std::size_t InMemoryChannel::StartCount() const {
    std::lock_guard<std::mutex> lk(mutex);
    return starts.size();
}

std::size_t InMemoryChannel::TerminateCount() const {
    std::lock_guard<std::mutex> lk(mutex);
    return terminateCount;
}

std::vector<ServerDescriptor> InMemoryChannel::StartedWith() const {
    std::lock_guard<std::mutex> lk(mutex);
    return starts;
}

////////////////////////////////////////// InMemoryTransport //////////////////////////////////////////

InMemoryTransport::InMemoryTransport(std::shared_ptr<InMemoryChannel> ch)
    : channel(std::move(ch)) {
    sessionId = "memory-" + std::to_string(++sessionCounter);
}

InMemoryTransport::~InMemoryTransport() {
    Terminate();
}

void InMemoryTransport::Start(const ServerDescriptor& server) {
    std::lock_guard<std::mutex> lk(channel->mutex);
    if (server.command.empty()) {
        throw ConnectionError("InMemoryTransport: empty server command");
    }
    if (channel->failStart) {
        channel->failStart = false;
        throw ConnectionError(std::format("InMemoryTransport: failed to start '{}'", server.command.front()));
    }
    channel->starts.push_back(server);
    channel->outputClosed = false;
    channel->incoming.clear();
    running = true;
    interrupted = false;
    LOG_DEBUG("InMemoryTransport: started session {}", sessionId);
}

void InMemoryTransport::Terminate() {
    std::lock_guard<std::mutex> lk(channel->mutex);
    if (!running) {
        return;
    }
    running = false;
    ++channel->terminateCount;
    channel->cv.notify_all();
}

void InMemoryTransport::Interrupt() {
    {
        std::lock_guard<std::mutex> lk(channel->mutex);
        interrupted = true;
    }
    channel->cv.notify_all();
}

bool InMemoryTransport::IsRunning() const {
    std::lock_guard<std::mutex> lk(channel->mutex);
    // End of output is noticed by the read that drains the last queued line.
    return running && !interrupted;
}

std::string InMemoryTransport::GetSessionId() const {
    return sessionId;
}

void InMemoryTransport::WriteLine(const std::string& line, std::chrono::milliseconds /*timeout*/) {
    InMemoryChannel::Responder responder;
    {
        std::lock_guard<std::mutex> lk(channel->mutex);
        if (!running || interrupted) {
            throw ConnectionError("InMemoryTransport: write on a closed connection");
        }
        if (line.find('\n') != std::string::npos) {
            throw ConnectionError("InMemoryTransport: payload contains a line terminator");
        }
        channel->written.push_back(line);
        channel->bytesWritten += line.size() + 1;
        responder = channel->responder;
    }
    if (!responder) {
        return;
    }
    // Responder runs unlocked so that it may call PushLine/CloseOutput itself.
    auto replies = responder(line);
    {
        std::lock_guard<std::mutex> lk(channel->mutex);
        for (auto& r : replies) {
            channel->incoming.push_back(std::move(r));
        }
    }
    channel->cv.notify_all();
}

std::string InMemoryTransport::ReadLine(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lk(channel->mutex);
    auto ready = [this]() {
        return !channel->incoming.empty() || channel->outputClosed || interrupted || !running;
    };
    if (timeout.count() > 0) {
        if (!channel->cv.wait_for(lk, timeout, ready)) {
            running = false;
            throw ConnectionError(std::format("InMemoryTransport: no response within {} ms",
                                              static_cast<long long>(timeout.count())));
        }
    } else {
        channel->cv.wait(lk, ready);
    }
    if (interrupted) {
        throw ConnectionError("InMemoryTransport: read interrupted");
    }
    if (!running) {
        throw ConnectionError("InMemoryTransport: read on a closed connection");
    }
    if (channel->incoming.empty()) {
        running = false;
        throw ConnectionError("InMemoryTransport: server closed its output");
    }
    std::string line = std::move(channel->incoming.front());
    channel->incoming.pop_front();
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
    return line;
}

std::unique_ptr<ITransport> InMemoryTransportFactory::CreateTransport() {
    return std::make_unique<InMemoryTransport>(channel);
}

} // namespace mcpagent
