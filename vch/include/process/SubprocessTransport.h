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

#pragma once

#include "process/IProcessLauncher.h"
#include "process/ITransport.h"
#include <atomic>
#include <mutex>
#include <optional>
#include <string>
#include <sys/types.h>
#include <thread>

namespace VCH {

/**
 * @brief ITransport over the stdin/stdout/stderr pipes of a child process
 *
 * stdout is read on demand with poll() so reads honour their deadline.
 * stderr is drained continuously by a background thread so a chatty child
 * never blocks on a full pipe; the collected text is handed out by takeStderr().
 */
class SubprocessTransport : public ITransport {
public:
    SubprocessTransport(pid_t pid, int stdinFd, int stdoutFd, int stderrFd);
    ~SubprocessTransport() override;

    SubprocessTransport(const SubprocessTransport &) = delete;
    SubprocessTransport &operator=(const SubprocessTransport &) = delete;

    TransportResult writeLine(const std::string &line) override;
    TransportResult readLine(std::chrono::milliseconds timeout) override;
    std::string takeStderr() override;
    bool isAlive() override;
    void terminate(std::chrono::milliseconds gracePeriod) override;

    pid_t pid() const {
        return pid_;
    }

    /**
     * @brief Raw wait status once the child has been reaped
     */
    std::optional<int> exitStatus() const {
        return exitStatus_;
    }

private:
    void stderrReaderMain();
    bool reap(bool block);
    bool waitForExit(std::chrono::milliseconds timeout);
    std::string describeExit() const;

    pid_t pid_;
    int stdinFd_;
    int stdoutFd_;
    int stderrFd_;

    std::string readBuffer_;
    bool stdoutClosed_{false};

    std::mutex stderrMutex_;
    std::string stderrBuffer_;
    std::atomic<bool> stopStderrReader_{false};
    std::thread stderrThread_;

    std::optional<int> exitStatus_;
    bool terminated_{false};
};

/**
 * @brief Launches implementations as child processes (fork + exec)
 *
 * exec failures are reported back to the parent through a close-on-exec
 * pipe, so "binary not found" surfaces as a LaunchFailure instead of a
 * child that exits with status 127.
 */
class SubprocessLauncher : public IProcessLauncher {
public:
    SubprocessLauncher();

    LaunchResult launch(const LaunchSpec &spec) override;
};

}  // namespace VCH
