//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Process.hpp
// Purpose: Child process launch and lifecycle control for stdio MCP servers (POSIX)
//==========================================================================================================
#pragma once

#include <chrono>
#include <memory>
#include <optional>

#include "stdiomcp/Protocol.h"

namespace stdiomcp {

// Where the child's stderr goes
enum class StderrMode {
    Inherit,  // share the client's stderr (server diagnostics stay visible)
    Discard   // redirect to /dev/null
};

//==========================================================================================================
// ChildStdio
// Purpose: The parent's ends of the child's stdin (write) and stdout (read) pipes. -1 when absent.
//==========================================================================================================
struct ChildStdio {
    int stdinFd{-1};
    int stdoutFd{-1};
};

//==========================================================================================================
// Process
// Purpose: Handle to a running child. Reaps the child exactly once and remembers its exit status.
// Notes:
//   - Signal methods are no-ops once the child has been reaped.
//   - The destructor closes any descriptors still owned and kills + reaps a child that is still
//     running, so no zombie or orphan outlives the handle.
//==========================================================================================================
class Process {
public:
    ~Process();
    Process(const Process&) = delete;
    Process& operator=(const Process&) = delete;

    int Pid() const;

    //==========================================================================================================
    // Terminate / Kill
    // Purpose: Send SIGTERM (graceful) or SIGKILL (forced).
    // Returns:
    //   true when the signal was delivered; false when the child has already exited.
    //==========================================================================================================
    bool Terminate();
    bool Kill();

    // Non-blocking liveness check; reaps the child when it has exited.
    bool IsAlive();

    //==========================================================================================================
    // WaitForExit
    // Purpose: Wait until the child exits and is reaped.
    // Args:
    //   timeout: Upper bound on the wait; std::nullopt waits indefinitely.
    // Returns:
    //   true when the child has exited; false when the timeout elapsed first.
    //==========================================================================================================
    bool WaitForExit(std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    // Exit code once reaped; 128 + signal number when the child was killed by a signal.
    std::optional<int> ExitCode() const;

    // Transfers ownership of the pipe ends to the caller (typically a PipeTransport).
    ChildStdio TakeStdio();

private:
    friend class ProcessLauncher;
    Process(int pid, ChildStdio stdio);

    class Impl;
    std::unique_ptr<Impl> pImpl;
};

//==========================================================================================================
// ProcessLauncher
// Purpose: Starts ServerConfig commands with piped stdin/stdout and an overlaid environment.
//==========================================================================================================
class ProcessLauncher {
public:
    explicit ProcessLauncher(StderrMode stderrMode = StderrMode::Inherit);

    //==========================================================================================================
    // Start
    // Purpose: fork + execvp the configured command (resolved through PATH).
    // Args:
    //   config: Command, arguments and environment overlay (overlay entries win on collision).
    // Returns:
    //   A running Process owning the parent's pipe ends.
    // Throws:
    //   errors::LaunchError when the command is empty, pipes/fork fail, or exec fails; in that case no
    //   child is left running and no descriptors leak.
    //==========================================================================================================
    std::unique_ptr<Process> Start(const ServerConfig& config) const;

private:
    StderrMode stderrMode;
};

} // namespace stdiomcp
