// SPDX-License-Identifier: LGPL-2.1-or-later OR LicenseRef-VCH-Commercial
// SPDX-FileCopyrightText: Copyright (c) 2025 newmassrael
//
// This file is part of VCH (Validator Conformance Harness).
//
// Dual Licensed:
// 1. LGPL-2.1: Free for unmodified use (see LICENSE-LGPL-2.1.md)
// 2. Commercial: For modifications (contact newmassrael@gmail.com)
//
// Commercial License:
//   Individual: $100 cumulative
//   Enterprise: $500 cumulative
//   Contact: https://github.com/newmassrael
//
// Full terms: https://github.com/newmassrael/validator-conformance-harness/blob/main/LICENSE

#include "process/SubprocessTransport.h"
#include "common/Logger.h"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>
#include <vector>

extern char **environ;

namespace VCH {

namespace {

constexpr auto REAP_POLL_INTERVAL = std::chrono::milliseconds(10);
constexpr int STDERR_POLL_TIMEOUT_MS = 50;
constexpr size_t READ_CHUNK_SIZE = 4096;
constexpr auto DESTRUCTOR_GRACE_PERIOD = std::chrono::milliseconds(500);

void closeFd(int &fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

struct PipePair {
    int read = -1;
    int write = -1;

    bool open() {
        int fds[2];
        if (::pipe2(fds, O_CLOEXEC) != 0) {
            return false;
        }
        read = fds[0];
        write = fds[1];
        return true;
    }

    void closeBoth() {
        closeFd(read);
        closeFd(write);
    }
};

std::vector<std::string> buildEnvironment(const std::vector<EnvVar> &overrides) {
    std::vector<std::string> env;
    for (char **entry = environ; entry && *entry; ++entry) {
        std::string current(*entry);
        std::string key = current.substr(0, current.find('='));
        bool overridden = false;
        for (const auto &var : overrides) {
            if (var.key == key) {
                overridden = true;
                break;
            }
        }
        if (!overridden) {
            env.push_back(std::move(current));
        }
    }
    for (const auto &var : overrides) {
        env.push_back(var.key + "=" + var.value);
    }
    return env;
}

}  // namespace

SubprocessTransport::SubprocessTransport(pid_t pid, int stdinFd, int stdoutFd, int stderrFd)
    : pid_(pid), stdinFd_(stdinFd), stdoutFd_(stdoutFd), stderrFd_(stderrFd) {
    stderrThread_ = std::thread(&SubprocessTransport::stderrReaderMain, this);
}

SubprocessTransport::~SubprocessTransport() {
    terminate(DESTRUCTOR_GRACE_PERIOD);
}

TransportResult SubprocessTransport::writeLine(const std::string &line) {
    if (stdinFd_ < 0) {
        return TransportResult::error("input channel is closed", TransportResult::ErrorType::BROKEN_PIPE);
    }

    std::string data = line + "\n";
    size_t written = 0;
    while (written < data.size()) {
        ssize_t n = ::write(stdinFd_, data.data() + written, data.size() - written);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            if (errno == EPIPE) {
                return TransportResult::error("broken pipe" + describeExit(), TransportResult::ErrorType::BROKEN_PIPE);
            }
            return TransportResult::error(std::string("write failed: ") + std::strerror(errno),
                                          TransportResult::ErrorType::IO_ERROR);
        }
        written += static_cast<size_t>(n);
    }
    return TransportResult::success();
}

TransportResult SubprocessTransport::readLine(std::chrono::milliseconds timeout) {
    const bool bounded = timeout.count() > 0;
    const auto deadline = std::chrono::steady_clock::now() + timeout;

    while (true) {
        size_t newline = readBuffer_.find('\n');
        if (newline != std::string::npos) {
            std::string line = readBuffer_.substr(0, newline);
            readBuffer_.erase(0, newline + 1);
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            return TransportResult::success(std::move(line));
        }

        if (stdoutClosed_) {
            if (!readBuffer_.empty()) {
                std::string line;
                line.swap(readBuffer_);
                return TransportResult::success(std::move(line));
            }
            reap(false);
            return TransportResult::error("output closed" + describeExit(), TransportResult::ErrorType::CLOSED);
        }

        int waitMs = -1;
        if (bounded) {
            auto remaining =
                std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
            if (remaining.count() <= 0) {
                return TransportResult::error(std::format("no response within {}ms", timeout.count()),
                                              TransportResult::ErrorType::TIMEOUT);
            }
            waitMs = static_cast<int>(remaining.count());
        }

        pollfd pfd{stdoutFd_, POLLIN, 0};
        int rc = ::poll(&pfd, 1, waitMs);
        if (rc < 0) {
            if (errno == EINTR) {
                continue;
            }
            return TransportResult::error(std::string("poll failed: ") + std::strerror(errno),
                                          TransportResult::ErrorType::IO_ERROR);
        }
        if (rc == 0) {
            continue;
        }

        char buffer[READ_CHUNK_SIZE];
        ssize_t n = ::read(stdoutFd_, buffer, sizeof(buffer));
        if (n > 0) {
            readBuffer_.append(buffer, static_cast<size_t>(n));
        } else if (n == 0) {
            stdoutClosed_ = true;
        } else if (errno != EINTR && errno != EAGAIN) {
            return TransportResult::error(std::string("read failed: ") + std::strerror(errno),
                                          TransportResult::ErrorType::IO_ERROR);
        }
    }
}

std::string SubprocessTransport::takeStderr() {
    std::lock_guard<std::mutex> lock(stderrMutex_);
    std::string taken;
    taken.swap(stderrBuffer_);
    return taken;
}

bool SubprocessTransport::isAlive() {
    if (exitStatus_) {
        return false;
    }
    return !reap(false);
}

void SubprocessTransport::terminate(std::chrono::milliseconds gracePeriod) {
    if (terminated_) {
        return;
    }
    terminated_ = true;

    // EOF on stdin is the polite request to exit
    closeFd(stdinFd_);

    if (!waitForExit(gracePeriod)) {
        LOG_DEBUG("SubprocessTransport: pid {} ignored EOF, sending SIGTERM", pid_);
        ::kill(pid_, SIGTERM);
        if (!waitForExit(gracePeriod)) {
            LOG_WARN("SubprocessTransport: pid {} ignored SIGTERM, sending SIGKILL", pid_);
            ::kill(pid_, SIGKILL);
            reap(true);
        }
    }

    stopStderrReader_ = true;
    if (stderrThread_.joinable()) {
        stderrThread_.join();
    }

    closeFd(stdoutFd_);
    closeFd(stderrFd_);
}

void SubprocessTransport::stderrReaderMain() {
    char buffer[READ_CHUNK_SIZE];
    while (true) {
        // Once asked to stop, only drain what is already buffered
        const bool stopping = stopStderrReader_;
        pollfd pfd{stderrFd_, POLLIN, 0};
        int rc = ::poll(&pfd, 1, stopping ? 0 : STDERR_POLL_TIMEOUT_MS);
        if (rc < 0) {
            if (errno == EINTR) {
                continue;
            }
            return;
        }
        if (rc == 0) {
            if (stopping) {
                return;
            }
            continue;
        }

        ssize_t n = ::read(stderrFd_, buffer, sizeof(buffer));
        if (n > 0) {
            std::lock_guard<std::mutex> lock(stderrMutex_);
            stderrBuffer_.append(buffer, static_cast<size_t>(n));
        } else if (n == 0) {
            return;
        } else if (errno != EINTR && errno != EAGAIN) {
            return;
        }
    }
}

bool SubprocessTransport::reap(bool block) {
    if (exitStatus_) {
        return true;
    }

    while (true) {
        int status = 0;
        pid_t result = ::waitpid(pid_, &status, block ? 0 : WNOHANG);
        if (result == pid_) {
            exitStatus_ = status;
            return true;
        }
        if (result == 0) {
            return false;
        }
        if (errno == EINTR) {
            continue;
        }
        // ECHILD: someone else reaped it; treat as exited
        exitStatus_ = 0;
        return true;
    }
}

bool SubprocessTransport::waitForExit(std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!reap(false)) {
        if (std::chrono::steady_clock::now() >= deadline) {
            return false;
        }
        std::this_thread::sleep_for(REAP_POLL_INTERVAL);
    }
    return true;
}

std::string SubprocessTransport::describeExit() const {
    if (!exitStatus_) {
        return "";
    }
    if (WIFEXITED(*exitStatus_)) {
        return std::format(" (exited with status {})", WEXITSTATUS(*exitStatus_));
    }
    if (WIFSIGNALED(*exitStatus_)) {
        return std::format(" (killed by signal {})", WTERMSIG(*exitStatus_));
    }
    return "";
}

SubprocessLauncher::SubprocessLauncher() {
    // A peer that stops reading must surface as EPIPE, not kill the harness
    static std::once_flag ignoreSigpipe;
    std::call_once(ignoreSigpipe, [] { ::signal(SIGPIPE, SIG_IGN); });
}

LaunchResult SubprocessLauncher::launch(const LaunchSpec &spec) {
    if (spec.argv.empty()) {
        return LaunchResult::error("empty command line");
    }

    PipePair stdinPipe, stdoutPipe, stderrPipe, execErrorPipe;
    if (!stdinPipe.open() || !stdoutPipe.open() || !stderrPipe.open() || !execErrorPipe.open()) {
        int savedErrno = errno;
        stdinPipe.closeBoth();
        stdoutPipe.closeBoth();
        stderrPipe.closeBoth();
        execErrorPipe.closeBoth();
        return LaunchResult::error(std::string("pipe failed: ") + std::strerror(savedErrno));
    }

    // Everything the child needs is prepared before fork()
    std::vector<std::string> envStrings = buildEnvironment(spec.env);
    std::vector<char *> envp;
    envp.reserve(envStrings.size() + 1);
    for (auto &entry : envStrings) {
        envp.push_back(entry.data());
    }
    envp.push_back(nullptr);

    std::vector<std::string> argvStrings = spec.argv;
    std::vector<char *> argv;
    argv.reserve(argvStrings.size() + 1);
    for (auto &arg : argvStrings) {
        argv.push_back(arg.data());
    }
    argv.push_back(nullptr);

    const char *workingDir = spec.workingDir ? spec.workingDir->c_str() : nullptr;

    pid_t pid = ::fork();
    if (pid < 0) {
        int savedErrno = errno;
        stdinPipe.closeBoth();
        stdoutPipe.closeBoth();
        stderrPipe.closeBoth();
        execErrorPipe.closeBoth();
        return LaunchResult::error(std::string("fork failed: ") + std::strerror(savedErrno));
    }

    if (pid == 0) {
        // Only async-signal-safe calls from here on
        ::dup2(stdinPipe.read, STDIN_FILENO);
        ::dup2(stdoutPipe.write, STDOUT_FILENO);
        ::dup2(stderrPipe.write, STDERR_FILENO);

        int childErrno = 0;
        if (workingDir && ::chdir(workingDir) != 0) {
            childErrno = errno;
        } else {
            ::execvpe(argv[0], argv.data(), envp.data());
            childErrno = errno;
        }
        ssize_t ignored = ::write(execErrorPipe.write, &childErrno, sizeof(childErrno));
        (void)ignored;
        ::_exit(127);
    }

    closeFd(stdinPipe.read);
    closeFd(stdoutPipe.write);
    closeFd(stderrPipe.write);
    closeFd(execErrorPipe.write);

    int childErrno = 0;
    ssize_t n;
    do {
        n = ::read(execErrorPipe.read, &childErrno, sizeof(childErrno));
    } while (n < 0 && errno == EINTR);
    closeFd(execErrorPipe.read);

    if (n == static_cast<ssize_t>(sizeof(childErrno))) {
        int status = 0;
        ::waitpid(pid, &status, 0);
        stdinPipe.closeBoth();
        stdoutPipe.closeBoth();
        stderrPipe.closeBoth();
        return LaunchResult::error(std::format("could not execute '{}': {}", spec.argv.front(),
                                               std::strerror(childErrno)));
    }

    LOG_DEBUG("SubprocessLauncher: started '{}' as pid {}", spec.id, pid);
    return LaunchResult::success(
        std::make_unique<SubprocessTransport>(pid, stdinPipe.write, stdoutPipe.read, stderrPipe.read));
}

}  // namespace VCH
