//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ProcessTransport.cpp
// Purpose: Child-process transport: fork/exec, pipe wiring, deadline-bounded line I/O, shutdown
//==========================================================================================================

#include <unistd.h>
#include <fcntl.h>
#include <errno.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <cstring>

#include <atomic>
#include <chrono>
#include <format>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <boost/asio/posix/stream_descriptor.hpp>
#include <boost/asio/read_until.hpp>
#include <boost/asio/write.hpp>
#include <boost/asio/buffer.hpp>
#include <boost/asio/error.hpp>

#include "env/EnvVars.h"
#include "logging/Logger.h"
#include "mcpagent/ProcessTransport.hpp"
#include "mcpagent/errors/Errors.h"

namespace mcpagent {

namespace {

// Longest line accepted from a server before the stream is considered corrupt.
constexpr std::size_t MaxLineBytes = 16 * 1024 * 1024;

std::once_flag sigpipeOnce;

void ignoreSigpipe() {
    std::call_once(sigpipeOnce, []() {
        ::signal(SIGPIPE, SIG_IGN);
    });
}

void closeFd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

// Completion record shared with the async handler so a late completion never touches a dead frame.
struct OpState {
    bool done{false};
    boost::system::error_code ec;
    std::size_t bytes{0};
};

} // namespace

class ProcessTransport::Impl {
public:
    boost::asio::io_context ioc;
    std::unique_ptr<boost::asio::posix::stream_descriptor> childStdin;
    std::unique_ptr<boost::asio::posix::stream_descriptor> childStdout;
    std::string readBuffer;

    std::atomic<bool> running{false};
    std::atomic<bool> interrupted{false};
    std::string sessionId;
    std::string program;
    std::chrono::milliseconds terminateGrace{2000};

    // Guards pid against reuse between reaping and Interrupt()'s kill().
    mutable std::mutex pidMutex;
    pid_t pid{-1};
    std::optional<int> exitCode;

    Impl() {
        terminateGrace = std::chrono::milliseconds(
            GetEnvUInt64OrDefault(EnvNames::TerminateGraceMs, 2000));
    }

    ~Impl() {
        terminate();
    }

    void spawn(const std::vector<std::string>& argv) {
        int inPipe[2] = {-1, -1};
        int outPipe[2] = {-1, -1};
        int statusPipe[2] = {-1, -1};
        if (::pipe2(inPipe, O_CLOEXEC) != 0 || ::pipe2(outPipe, O_CLOEXEC) != 0 ||
            ::pipe2(statusPipe, O_CLOEXEC) != 0) {
            const int err = errno;
            closeFd(inPipe[0]); closeFd(inPipe[1]);
            closeFd(outPipe[0]); closeFd(outPipe[1]);
            closeFd(statusPipe[0]); closeFd(statusPipe[1]);
            throw ConnectionError(std::format("ProcessTransport: pipe creation failed: {}", ::strerror(err)));
        }

        // argv is built before fork; the child must not allocate.
        std::vector<char*> cargv;
        cargv.reserve(argv.size() + 1);
        for (const auto& a : argv) {
            cargv.push_back(const_cast<char*>(a.c_str()));
        }
        cargv.push_back(nullptr);

        const pid_t child = ::fork();
        if (child < 0) {
            const int err = errno;
            closeFd(inPipe[0]); closeFd(inPipe[1]);
            closeFd(outPipe[0]); closeFd(outPipe[1]);
            closeFd(statusPipe[0]); closeFd(statusPipe[1]);
            throw ConnectionError(std::format("ProcessTransport: fork failed: {}", ::strerror(err)));
        }

        if (child == 0) {
            // dup2 onto the same descriptor keeps O_CLOEXEC, so clear it explicitly in that case.
            if (inPipe[0] == STDIN_FILENO) {
                ::fcntl(STDIN_FILENO, F_SETFD, 0);
            } else {
                ::dup2(inPipe[0], STDIN_FILENO);
            }
            if (outPipe[1] == STDOUT_FILENO) {
                ::fcntl(STDOUT_FILENO, F_SETFD, 0);
            } else {
                ::dup2(outPipe[1], STDOUT_FILENO);
            }
            ::signal(SIGPIPE, SIG_DFL);
            ::execvp(cargv[0], cargv.data());
            int err = errno;
            ssize_t ignored = ::write(statusPipe[1], &err, sizeof(err));
            (void)ignored;
            ::_exit(127);
        }

        closeFd(inPipe[0]);
        closeFd(outPipe[1]);
        closeFd(statusPipe[1]);

        // The status pipe closes on a successful exec; an errno arrives when exec failed.
        int execErr = 0;
        ssize_t n = 0;
        do {
            n = ::read(statusPipe[0], &execErr, sizeof(execErr));
        } while (n < 0 && errno == EINTR);
        closeFd(statusPipe[0]);

        if (n == static_cast<ssize_t>(sizeof(execErr))) {
            int status = 0;
            while (::waitpid(child, &status, 0) < 0 && errno == EINTR) {}
            closeFd(inPipe[1]);
            closeFd(outPipe[0]);
            throw ConnectionError(std::format("ProcessTransport: failed to start '{}': {}",
                                              argv.front(), ::strerror(execErr)));
        }

        {
            std::lock_guard<std::mutex> lk(pidMutex);
            pid = child;
            exitCode.reset();
        }
        childStdin = std::make_unique<boost::asio::posix::stream_descriptor>(ioc, inPipe[1]);
        childStdout = std::make_unique<boost::asio::posix::stream_descriptor>(ioc, outPipe[0]);
        readBuffer.clear();
        sessionId = "process-" + std::to_string(child);
        program = argv.front();
        interrupted.store(false);
        running.store(true);
        LOG_INFO("ProcessTransport: started '{}' (pid={})", program, static_cast<int>(child));
    }

    //==========================================================================================================
    // Drives the io_context until `st` completes or the deadline passes. On expiry or interruption the
    // outstanding operation is cancelled and its handler drained before returning false.
    //==========================================================================================================
    bool runUntil(const std::shared_ptr<OpState>& st, std::chrono::milliseconds timeout) {
        ioc.restart();
        if (timeout.count() > 0) {
            ioc.run_for(timeout);
        } else {
            ioc.run();
        }
        if (st->done) {
            return true;
        }
        boost::system::error_code ignored;
        if (childStdin) childStdin->cancel(ignored);
        if (childStdout) childStdout->cancel(ignored);
        ioc.restart();
        ioc.run();
        return false;
    }

    void reapRecord(int status) {
        if (WIFEXITED(status)) {
            exitCode = WEXITSTATUS(status);
        } else if (WIFSIGNALED(status)) {
            exitCode = 128 + WTERMSIG(status);
        }
    }

    // Polls for child exit until the grace period elapses. Returns true once reaped (or already gone).
    bool waitForExit(std::chrono::milliseconds grace) {
        const auto deadline = std::chrono::steady_clock::now() + grace;
        for (;;) {
            {
                std::lock_guard<std::mutex> lk(pidMutex);
                if (pid <= 0) {
                    return true;
                }
                int status = 0;
                const pid_t r = ::waitpid(pid, &status, WNOHANG);
                if (r == pid) {
                    reapRecord(status);
                    pid = -1;
                    return true;
                }
                if (r < 0 && errno != EINTR) {
                    pid = -1;
                    return true;
                }
            }
            if (std::chrono::steady_clock::now() >= deadline) {
                return false;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
    }

    void terminate() {
        running.store(false);
        boost::system::error_code ec;
        if (childStdin) {
            childStdin->close(ec);
            childStdin.reset();
        }

        pid_t target = -1;
        {
            std::lock_guard<std::mutex> lk(pidMutex);
            target = pid;
        }
        if (target > 0) {
            ::kill(target, SIGTERM);
            if (!waitForExit(terminateGrace)) {
                LOG_WARN("ProcessTransport: pid={} ignored SIGTERM for {} ms; sending SIGKILL",
                         static_cast<int>(target), static_cast<long long>(terminateGrace.count()));
                std::lock_guard<std::mutex> lk(pidMutex);
                if (pid > 0) {
                    ::kill(pid, SIGKILL);
                    int status = 0;
                    while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
                    reapRecord(status);
                    pid = -1;
                }
            }
            LOG_DEBUG("ProcessTransport: '{}' (pid={}) exited with {}", program, static_cast<int>(target),
                      exitCode.has_value() ? std::to_string(exitCode.value()) : std::string("unknown status"));
        }

        if (childStdout) {
            childStdout->close(ec);
            childStdout.reset();
        }
        readBuffer.clear();
    }

    void interrupt() {
        interrupted.store(true);
        {
            std::lock_guard<std::mutex> lk(pidMutex);
            if (pid > 0) {
                ::kill(pid, SIGKILL);
            }
        }
        // A grandchild may still hold the pipe open; stopping the io_context wakes the waiter regardless.
        ioc.stop();
    }

    void ensureUsable(const char* op) const {
        if (interrupted.load()) {
            throw ConnectionError(std::format("ProcessTransport: {} after interruption", op));
        }
        if (!running.load() || !childStdin || !childStdout) {
            throw ConnectionError(std::format("ProcessTransport: {} on a closed connection", op));
        }
    }

    void writeLine(const std::string& line, std::chrono::milliseconds timeout) {
        ensureUsable("write");
        if (line.find('\n') != std::string::npos) {
            throw ConnectionError("ProcessTransport: payload contains a line terminator");
        }
        std::string data;
        data.reserve(line.size() + 1);
        data.append(line);
        data.push_back('\n');

        auto st = std::make_shared<OpState>();
        boost::asio::async_write(*childStdin, boost::asio::buffer(data),
            [st](const boost::system::error_code& ec, std::size_t n) {
                st->done = true;
                st->ec = ec;
                st->bytes = n;
            });
        if (!runUntil(st, timeout)) {
            running.store(false);
            if (interrupted.load()) {
                throw ConnectionError("ProcessTransport: write interrupted");
            }
            throw ConnectionError(std::format("ProcessTransport: write timed out after {} ms",
                                              static_cast<long long>(timeout.count())));
        }
        if (st->ec) {
            running.store(false);
            throw ConnectionError(std::format("ProcessTransport: write failed: {}", st->ec.message()));
        }
        LOG_DEBUG("ProcessTransport: -> {}", line);
    }

    std::string readLine(std::chrono::milliseconds timeout) {
        ensureUsable("read");
        auto st = std::make_shared<OpState>();
        boost::asio::async_read_until(*childStdout, boost::asio::dynamic_buffer(readBuffer, MaxLineBytes), '\n',
            [st](const boost::system::error_code& ec, std::size_t n) {
                st->done = true;
                st->ec = ec;
                st->bytes = n;
            });
        if (!runUntil(st, timeout)) {
            running.store(false);
            if (interrupted.load()) {
                throw ConnectionError("ProcessTransport: read interrupted");
            }
            throw ConnectionError(std::format("ProcessTransport: no response within {} ms",
                                              static_cast<long long>(timeout.count())));
        }
        if (st->ec) {
            running.store(false);
            if (interrupted.load()) {
                throw ConnectionError("ProcessTransport: read interrupted");
            }
            if (st->ec == boost::asio::error::eof) {
                if (!readBuffer.empty()) {
                    throw ConnectionError("ProcessTransport: server closed its output mid-line");
                }
                throw ConnectionError("ProcessTransport: server closed its output");
            }
            if (st->ec == boost::asio::error::not_found) {
                throw ConnectionError(std::format("ProcessTransport: line exceeds {} bytes", MaxLineBytes));
            }
            throw ConnectionError(std::format("ProcessTransport: read failed: {}", st->ec.message()));
        }

        std::string line = readBuffer.substr(0, st->bytes - 1);
        readBuffer.erase(0, st->bytes);
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        LOG_DEBUG("ProcessTransport: <- {}", line);
        return line;
    }
};

ProcessTransport::ProcessTransport() : pImpl(std::make_unique<Impl>()) {
    ignoreSigpipe();
}

ProcessTransport::~ProcessTransport() = default;

void ProcessTransport::Start(const ServerDescriptor& server) {
    FUNC_SCOPE();
    const auto argv = server.Argv();
    if (server.command.empty() || argv.front().empty()) {
        throw ConnectionError("ProcessTransport: empty server command");
    }
    if (pImpl->running.load()) {
        throw ConnectionError("ProcessTransport: already started");
    }
    pImpl->spawn(argv);
}

void ProcessTransport::Terminate() {
    FUNC_SCOPE();
    pImpl->terminate();
}

void ProcessTransport::Interrupt() {
    pImpl->interrupt();
}

bool ProcessTransport::IsRunning() const {
    if (!pImpl->running.load() || pImpl->interrupted.load()) {
        return false;
    }
    std::lock_guard<std::mutex> lk(pImpl->pidMutex);
    return pImpl->pid > 0;
}

std::string ProcessTransport::GetSessionId() const {
    return pImpl->sessionId;
}

void ProcessTransport::WriteLine(const std::string& line, std::chrono::milliseconds timeout) {
    pImpl->writeLine(line, timeout);
}

std::string ProcessTransport::ReadLine(std::chrono::milliseconds timeout) {
    return pImpl->readLine(timeout);
}

void ProcessTransport::SetTerminateGraceMs(uint64_t graceMs) {
    pImpl->terminateGrace = std::chrono::milliseconds(graceMs);
}

int ProcessTransport::GetPid() const {
    std::lock_guard<std::mutex> lk(pImpl->pidMutex);
    return static_cast<int>(pImpl->pid);
}

std::optional<int> ProcessTransport::GetExitCode() const {
    std::lock_guard<std::mutex> lk(pImpl->pidMutex);
    return pImpl->exitCode;
}

std::unique_ptr<ITransport> ProcessTransportFactory::CreateTransport() {
    auto transport = std::make_unique<ProcessTransport>();
    if (terminateGraceMs.has_value()) {
        transport->SetTerminateGraceMs(terminateGraceMs.value());
    }
    return transport;
}

} // namespace mcpagent
