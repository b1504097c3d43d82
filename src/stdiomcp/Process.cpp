//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Process.cpp
// Purpose: fork/execvp based child launch, signal escalation and reaping
//==========================================================================================================

#include <errno.h>
#include <fcntl.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cstring>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "logging/Logger.h"
#include "stdiomcp/Process.hpp"
#include "stdiomcp/errors/Errors.h"

extern char** environ;

namespace stdiomcp {

namespace {
void closeFd(int& fd) {
    if (fd >= 0) {
        if (::close(fd) != 0 && errno != EINTR) {
            LOG_WARN("Process: close({}) failed (errno={} msg={})", fd, errno, ::strerror(errno));
        }
        fd = -1;
    }
}

// Converts a waitpid status into the shell convention (exit code, or 128 + signal).
int exitCodeFromStatus(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

std::vector<std::string> buildEnvironment(const std::map<std::string, std::string>& overlay) {
    std::map<std::string, std::string> merged;
    for (char** e = environ; e && *e; ++e) {
        std::string entry(*e);
        auto eq = entry.find('=');
        if (eq == std::string::npos) {
            continue;
        }
        merged[entry.substr(0, eq)] = entry.substr(eq + 1);
    }
    for (const auto& [k, v] : overlay) {
        merged[k] = v;
    }
    std::vector<std::string> out;
    out.reserve(merged.size());
    for (const auto& [k, v] : merged) {
        out.push_back(k + "=" + v);
    }
    return out;
}

std::string describeCommand(const ServerConfig& config) {
    std::string s = config.command;
    for (const auto& a : config.args) {
        s += " " + a;
    }
    return s;
}
} // namespace

////////////////////////////////////////////// Process //////////////////////////////////////////////

class Process::Impl {
public:
    int pid{-1};
    ChildStdio stdio;
    mutable std::mutex mutex;  // serializes waitpid/kill so the child is reaped exactly once
    bool exited{false};
    std::optional<int> exitCode;

    // Records the result of a waitpid call. Returns true when the child is gone.
    bool recordWait(pid_t r, int status) {
        if (r == pid) {
            exited = true;
            exitCode = exitCodeFromStatus(status);
            LOG_INFO("Process {} exited (code={})", pid, exitCode.value());
            return true;
        }
        if (r < 0 && errno == ECHILD) {
            // Already reaped elsewhere (e.g. SIGCHLD set to SIG_IGN); status is unknown
            LOG_WARN("Process {}: waitpid reported ECHILD; treating as exited", pid);
            exited = true;
            return true;
        }
        if (r < 0 && errno != EINTR) {
            LOG_ERROR("Process {}: waitpid failed (errno={} msg={})", pid, errno, ::strerror(errno));
        }
        return false;
    }

    bool pollLocked() {
        if (exited) {
            return false;
        }
        int status = 0;
        pid_t r = ::waitpid(pid, &status, WNOHANG);
        if (r == 0) {
            return true;
        }
        return !recordWait(r, status);
    }

    bool signalLocked(int sig, const char* name) {
        if (exited) {
            return false;
        }
        if (::kill(pid, sig) != 0) {
            if (errno != ESRCH) {
                LOG_ERROR("Process {}: kill({}) failed (errno={} msg={})", pid, name, errno, ::strerror(errno));
            }
            return false;
        }
        LOG_DEBUG("Process {}: sent {}", pid, name);
        return true;
    }
};

Process::Process(int pid, ChildStdio stdio) : pImpl(std::make_unique<Impl>()) {
    pImpl->pid = pid;
    pImpl->stdio = stdio;
}

Process::~Process() {
    FUNC_SCOPE();
    closeFd(pImpl->stdio.stdinFd);
    closeFd(pImpl->stdio.stdoutFd);
    if (IsAlive()) {
        LOG_WARN("Process {} still running at handle destruction; killing", pImpl->pid);
        Kill();
        WaitForExit();
    }
}

int Process::Pid() const {
    return pImpl->pid;
}

bool Process::Terminate() {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    return pImpl->signalLocked(SIGTERM, "SIGTERM");
}

bool Process::Kill() {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    return pImpl->signalLocked(SIGKILL, "SIGKILL");
}

bool Process::IsAlive() {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    return pImpl->pollLocked();
}

bool Process::WaitForExit(std::optional<std::chrono::milliseconds> timeout) {
    FUNC_SCOPE();
    if (!timeout.has_value()) {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        while (!pImpl->exited) {
            int status = 0;
            pid_t r = ::waitpid(pImpl->pid, &status, 0);
            if (!pImpl->recordWait(r, status) && !(r < 0 && errno == EINTR)) {
                return false;
            }
        }
        return true;
    }
    const auto deadline = std::chrono::steady_clock::now() + timeout.value();
    while (true) {
        {
            std::lock_guard<std::mutex> lock(pImpl->mutex);
            if (!pImpl->pollLocked()) {
                return true;
            }
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
}

std::optional<int> Process::ExitCode() const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    return pImpl->exitCode;
}

ChildStdio Process::TakeStdio() {
    ChildStdio out = pImpl->stdio;
    pImpl->stdio = ChildStdio{};
    return out;
}

////////////////////////////////////////////// ProcessLauncher //////////////////////////////////////////////

ProcessLauncher::ProcessLauncher(StderrMode stderrMode) : stderrMode(stderrMode) {}

std::unique_ptr<Process> ProcessLauncher::Start(const ServerConfig& config) const {
    FUNC_SCOPE();
    if (config.command.empty()) {
        throw errors::LaunchError("Failed to launch server: command is empty");
    }
    const std::string display = describeCommand(config);

    // Everything the child needs is prepared before fork(); the child only calls async-signal-safe functions
    std::vector<std::string> argStorage;
    argStorage.reserve(config.args.size() + 1);
    argStorage.push_back(config.command);
    argStorage.insert(argStorage.end(), config.args.begin(), config.args.end());
    std::vector<char*> argv;
    for (auto& a : argStorage) {
        argv.push_back(a.data());
    }
    argv.push_back(nullptr);

    std::vector<std::string> envStorage = buildEnvironment(config.env);
    std::vector<char*> envp;
    for (auto& e : envStorage) {
        envp.push_back(e.data());
    }
    envp.push_back(nullptr);

    int toChild[2] = {-1, -1};
    int fromChild[2] = {-1, -1};
    int execErr[2] = {-1, -1};
    int devNull = -1;
    auto closeAll = [&]() {
        closeFd(toChild[0]); closeFd(toChild[1]);
        closeFd(fromChild[0]); closeFd(fromChild[1]);
        closeFd(execErr[0]); closeFd(execErr[1]);
        closeFd(devNull);
    };

    if (::pipe2(toChild, O_CLOEXEC) != 0 || ::pipe2(fromChild, O_CLOEXEC) != 0 || ::pipe2(execErr, O_CLOEXEC) != 0) {
        const int err = errno;
        closeAll();
        throw errors::LaunchError(std::format("Failed to launch '{}': pipe creation failed: {}", display, ::strerror(err)));
    }
    if (stderrMode == StderrMode::Discard) {
        devNull = ::open("/dev/null", O_WRONLY | O_CLOEXEC);
        if (devNull < 0) {
            LOG_WARN("Process: cannot open /dev/null (errno={} msg={}); server stderr stays inherited", errno, ::strerror(errno));
        }
    }

    const pid_t pid = ::fork();
    if (pid < 0) {
        const int err = errno;
        closeAll();
        throw errors::LaunchError(std::format("Failed to launch '{}': fork failed: {}", display, ::strerror(err)));
    }

    if (pid == 0) {
        // Child: wire the pipes onto fds 0/1 (dup2 clears O_CLOEXEC on the targets)
        if (::dup2(toChild[0], STDIN_FILENO) < 0 || ::dup2(fromChild[1], STDOUT_FILENO) < 0 ||
            (devNull >= 0 && ::dup2(devNull, STDERR_FILENO) < 0)) {
            int err = errno;
            ssize_t ignored = ::write(execErr[1], &err, sizeof(err));
            (void)ignored;
            ::_exit(127);
        }
        // The parent ignores SIGPIPE; ignored dispositions survive exec, so restore the default
        ::signal(SIGPIPE, SIG_DFL);
        environ = envp.data();
        ::execvp(argv[0], argv.data());
        int err = errno;
        ssize_t ignored = ::write(execErr[1], &err, sizeof(err));
        (void)ignored;
        ::_exit(127);
    }

    // Parent
    closeFd(toChild[0]);
    closeFd(fromChild[1]);
    closeFd(execErr[1]);
    closeFd(devNull);

    // The error pipe is close-on-exec: EOF means exec succeeded, an errno payload means it failed
    int childErrno = 0;
    ssize_t n = 0;
    do {
        n = ::read(execErr[0], &childErrno, sizeof(childErrno));
    } while (n < 0 && errno == EINTR);
    closeFd(execErr[0]);

    if (n > 0) {
        int status = 0;
        while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
        }
        closeFd(toChild[1]);
        closeFd(fromChild[0]);
        LOG_ERROR("Process: exec of '{}' failed (errno={} msg={})", config.command, childErrno, ::strerror(childErrno));
        throw errors::LaunchError(std::format("Failed to launch '{}': {}", display, ::strerror(childErrno)));
    }

    LOG_INFO("Process: started '{}' with pid {}", display, static_cast<int>(pid));
    return std::unique_ptr<Process>(new Process(static_cast<int>(pid), ChildStdio{toChild[1], fromChild[0]}));
}

} // namespace stdiomcp
