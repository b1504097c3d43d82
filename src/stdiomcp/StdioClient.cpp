//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: StdioClient.cpp
// Purpose: Session lifecycle manager implementation
//==========================================================================================================

#include <algorithm>
#include <cctype>
#include <mutex>
#include <string>

#include "env/EnvVars.h"
#include "logging/Logger.h"
#include "stdiomcp/PipeTransport.hpp"
#include "stdiomcp/Session.h"
#include "stdiomcp/StdioClient.h"
#include "stdiomcp/errors/Errors.h"
#include "stdiomcp/version.h"

namespace stdiomcp {

namespace {
void readMillis(const char* name, std::chrono::milliseconds& target) {
    const std::string raw = GetEnvOrDefault(name, "");
    if (raw.empty()) {
        return;
    }
    auto v = ParseUnsigned(raw);
    if (!v.has_value()) {
        LOG_WARN("Ignoring malformed {}={} (expected milliseconds)", name, raw);
        return;
    }
    target = std::chrono::milliseconds(static_cast<std::chrono::milliseconds::rep>(v.value()));
}

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}
} // namespace

ClientOptions::ClientOptions() : clientInfo(CLIENT_NAME, getVersionString()) {}

ClientOptions ClientOptions::FromEnvironment() {
    FUNC_SCOPE();
    ClientOptions o;
    readMillis("STDIOMCP_TERMINATE_TIMEOUT_MS", o.terminateTimeout);
    readMillis("STDIOMCP_KILL_TIMEOUT_MS", o.killTimeout);
    readMillis("STDIOMCP_INITIALIZE_TIMEOUT_MS", o.initializeTimeout);

    const std::string reqTimeout = GetEnvOrDefault("STDIOMCP_REQUEST_TIMEOUT_MS", "");
    if (!reqTimeout.empty()) {
        if (auto v = ParseUnsigned(reqTimeout)) {
            o.requestTimeoutMs = v.value();
        } else {
            LOG_WARN("Ignoring malformed STDIOMCP_REQUEST_TIMEOUT_MS={}", reqTimeout);
        }
    }

    const std::string framing = GetEnvOrDefault("STDIOMCP_FRAMING", "");
    if (!framing.empty()) {
        if (auto mode = FramingModeFromString(framing)) {
            o.framing = mode.value();
        } else {
            LOG_WARN("Ignoring unknown STDIOMCP_FRAMING={} (use ndjson or content-length)", framing);
        }
    }

    const std::string stderrMode = lower(GetEnvOrDefault("STDIOMCP_SERVER_STDERR", ""));
    if (stderrMode == "discard") {
        o.stderrMode = StderrMode::Discard;
    } else if (!stderrMode.empty() && stderrMode != "inherit") {
        LOG_WARN("Ignoring unknown STDIOMCP_SERVER_STDERR={} (use inherit or discard)", stderrMode);
    }
    return o;
}

class StdioClient::Impl {
public:
    ClientOptions options;
    mutable std::mutex mutex;
    std::unique_ptr<Process> process;   // replaced only by a later ConnectToServer; destroyed with the client
    std::shared_ptr<Session> session;
    std::optional<int> pid;
    bool connecting{false};
    bool connected{false};
    bool closed{false};

    explicit Impl(ClientOptions opts) : options(std::move(opts)) {}

    // Kill and reap the child of a failed connect; the error is rethrown by the caller afterwards.
    void abortConnection(Process* proc, Session* s) {
        if (s) {
            s->Close();
        }
        if (!proc) {
            return;
        }
        proc->Kill();
        if (!proc->WaitForExit(options.killTimeout)) {
            LOG_WARN("Server pid {} not reaped within {} ms after SIGKILL; waiting", proc->Pid(),
                     static_cast<long long>(options.killTimeout.count()));
            proc->WaitForExit();
        }
        LOG_INFO("Server pid {} stopped after failed connect", proc->Pid());
    }

    void shutdownProcess(Process* proc) {
        if (!proc) {
            return;
        }
        if (!proc->Terminate()) {
            // Already gone; make sure it is reaped
            (void)proc->WaitForExit(options.killTimeout);
            return;
        }
        if (proc->WaitForExit(options.terminateTimeout)) {
            LOG_INFO("Server pid {} exited after SIGTERM", proc->Pid());
            return;
        }
        LOG_WARN("Server pid {} ignored SIGTERM for {} ms; sending SIGKILL", proc->Pid(),
                 static_cast<long long>(options.terminateTimeout.count()));
        proc->Kill();
        if (!proc->WaitForExit(options.killTimeout)) {
            LOG_ERROR("Server pid {} still running {} ms after SIGKILL", proc->Pid(),
                      static_cast<long long>(options.killTimeout.count()));
        }
    }
};

StdioClient::StdioClient(ClientOptions options) : pImpl(std::make_unique<Impl>(std::move(options))) {
    FUNC_SCOPE();
}

StdioClient::~StdioClient() {
    FUNC_SCOPE();
    Close();
}

void StdioClient::ConnectToServer(const ServerConfig& config) {
    FUNC_SCOPE();
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        if (pImpl->closed) {
            throw errors::InvalidStateError("client is closed");
        }
        if (pImpl->connecting || pImpl->connected) {
            throw errors::InvalidStateError("client is already connected to a server");
        }
        pImpl->connecting = true;
    }

    std::unique_ptr<Process> proc;
    try {
        proc = ProcessLauncher(pImpl->options.stderrMode).Start(config);
    } catch (const errors::LaunchError&) {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        pImpl->connecting = false;
        throw;
    }

    Process* procPtr = proc.get();
    ChildStdio io = proc->TakeStdio();
    auto transport = std::make_unique<PipeTransport>(io.stdoutFd, io.stdinFd, MakeFramer(pImpl->options.framing));
    transport->SetRequestTimeoutMs(pImpl->options.requestTimeoutMs);
    auto session = std::make_shared<Session>(pImpl->options.clientInfo, SessionOptions{pImpl->options.initializeTimeout});
    bool closedMeanwhile = false;
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        pImpl->pid = proc->Pid();
        pImpl->process = std::move(proc);
        pImpl->session = session;
        closedMeanwhile = pImpl->closed;
    }
    // Close() ran before the process was published and had nothing to signal
    if (closedMeanwhile) {
        pImpl->abortConnection(procPtr, session.get());
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        pImpl->connecting = false;
        throw errors::SessionClosedError("client closed while connecting");
    }

    try {
        session->Connect(std::move(transport));
        session->ListTools();
    } catch (const std::exception& e) {
        LOG_ERROR("Connecting to server pid {} failed: {}", procPtr->Pid(), e.what());
        pImpl->abortConnection(procPtr, session.get());
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        pImpl->connecting = false;
        throw;
    }

    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        if (!pImpl->closed) {
            pImpl->connecting = false;
            pImpl->connected = true;
            return;
        }
    }
    pImpl->abortConnection(procPtr, session.get());
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    pImpl->connecting = false;
    throw errors::SessionClosedError("client closed while connecting");
}

std::shared_ptr<const ToolCatalog> StdioClient::Tools() const {
    std::shared_ptr<Session> s;
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        s = pImpl->session;
    }
    if (!s) {
        return std::make_shared<const ToolCatalog>();
    }
    return s->Tools();
}

std::optional<Tool> StdioClient::FindTool(const std::string& name) const {
    auto catalog = Tools();
    auto it = catalog->find(name);
    if (it == catalog->end()) {
        return std::nullopt;
    }
    return it->second;
}

CallToolResult StdioClient::CallTool(const std::string& name, const JSONValue& arguments) {
    FUNC_SCOPE();
    std::shared_ptr<Session> s;
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        if (pImpl->closed) {
            throw errors::SessionClosedError();
        }
        if (!pImpl->connected) {
            throw errors::InvalidStateError("CallTool requires a connected server");
        }
        s = pImpl->session;
    }
    auto catalog = s->Tools();
    if (catalog->find(name) == catalog->end()) {
        throw errors::UnknownToolError(name);
    }
    return s->CallTool(name, arguments);
}

std::shared_ptr<const ToolCatalog> StdioClient::RefreshTools() {
    FUNC_SCOPE();
    std::shared_ptr<Session> s;
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        if (pImpl->closed) {
            throw errors::SessionClosedError();
        }
        if (!pImpl->connected) {
            throw errors::InvalidStateError("RefreshTools requires a connected server");
        }
        s = pImpl->session;
    }
    return s->ListTools();
}

void StdioClient::Close() noexcept {
    FUNC_SCOPE();
    std::shared_ptr<Session> s;
    Process* proc = nullptr;
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        if (pImpl->closed) {
            return;
        }
        pImpl->closed = true;
        pImpl->connected = false;
        s = pImpl->session;
        proc = pImpl->process.get();
    }
    try {
        if (s) {
            s->Close();
        }
        pImpl->shutdownProcess(proc);
    } catch (const std::exception& e) {
        LOG_ERROR("StdioClient: error during close: {}", e.what());
    }
}

std::optional<int> StdioClient::ServerPid() const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    return pImpl->pid;
}

bool StdioClient::IsServerAlive() const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    return pImpl->process && pImpl->process->IsAlive();
}

bool StdioClient::IsConnected() const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    return pImpl->connected;
}

} // namespace stdiomcp
