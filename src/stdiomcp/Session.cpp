//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Session.cpp
// Purpose: MCP protocol session implementation
//==========================================================================================================

#include <atomic>
#include <format>
#include <future>
#include <mutex>
#include <optional>
#include <set>
#include <string>

#include "logging/Logger.h"
#include "stdiomcp/JSONRPCTypes.h"
#include "stdiomcp/Protocol.h"
#include "stdiomcp/Session.h"
#include "stdiomcp/errors/Errors.h"

namespace stdiomcp {

namespace {
using ResponseFuture = std::future<std::unique_ptr<JSONRPCResponse>>;

//==========================================================================================================
// awaitResult
// Purpose: Waits for a response and returns its result member.
// Args:
//   method: Method name, used in error messages.
//   fut: Future from ITransport::SendRequest.
//   closed: Set once the owning session has been closed; turns transport failures into
//           SessionClosedError.
//   timeout: Optional bound on the wait (RequestTimeoutError when exceeded).
//==========================================================================================================
JSONValue awaitResult(const std::string& method,
                      ResponseFuture fut,
                      const std::shared_ptr<std::atomic<bool>>& closed,
                      std::optional<std::chrono::milliseconds> timeout = std::nullopt) {
    std::unique_ptr<JSONRPCResponse> response;
    try {
        if (timeout.has_value() && fut.wait_for(timeout.value()) == std::future_status::timeout) {
            throw errors::RequestTimeoutError(std::format("{} timed out after {} ms", method, timeout->count()));
        }
        response = fut.get();
    } catch (const errors::SessionClosedError&) {
        throw;
    } catch (const errors::TransportError& e) {
        if (closed->load()) {
            throw errors::SessionClosedError();
        }
        LOG_WARN("{}: transport failure: {}", method, e.what());
        throw;
    }
    if (!response) {
        throw errors::ProtocolError(method + " returned no response");
    }
    if (response->IsError()) {
        throw errors::protocolErrorFromResponse(method, *response);
    }
    if (!response->result.has_value()) {
        throw errors::ProtocolError(method + " response carries no result");
    }
    return std::move(response->result.value());
}

void logServerMessage(const JSONValue& params) {
    std::string level = "info";
    if (const JSONValue* l = params.find("level"); l && l->isString()) {
        level = std::get<std::string>(l->value);
    }
    std::string logger;
    if (const JSONValue* n = params.find("logger"); n && n->isString()) {
        logger = std::get<std::string>(n->value);
    }
    std::string text;
    if (const JSONValue* d = params.find("data")) {
        text = d->isString() ? std::get<std::string>(d->value) : SerializeJSON(*d);
    }
    const std::string source = logger.empty() ? std::string("server") : "server/" + logger;
    if (level == "debug") {
        LOG_DEBUG("[{}] {}", source, text);
    } else if (level == "info" || level == "notice") {
        LOG_INFO("[{}] {}", source, text);
    } else if (level == "warning") {
        LOG_WARN("[{}] {}", source, text);
    } else {
        LOG_ERROR("[{}] {}", source, text);
    }
}
} // namespace

const char* SessionStateName(SessionState state) {
    switch (state) {
        case SessionState::Unconnected: return "Unconnected";
        case SessionState::Handshaking: return "Handshaking";
        case SessionState::Ready: return "Ready";
        case SessionState::Closed: return "Closed";
    }
    return "Unknown";
}

class Session::Impl {
public:
    Implementation clientInfo;
    SessionOptions options;

    mutable std::mutex stateMutex;
    SessionState state{SessionState::Unconnected};
    std::unique_ptr<ITransport> transport;  // kept until destruction so concurrent senders never see it vanish
    std::shared_ptr<std::atomic<bool>> closed = std::make_shared<std::atomic<bool>>(false);
    std::atomic<int64_t> nextId{1};

    mutable std::mutex catalogMutex;
    std::shared_ptr<const ToolCatalog> catalog = std::make_shared<const ToolCatalog>();

    Impl(const Implementation& info, const SessionOptions& opts) : clientInfo(info), options(opts) {}

    void ensureReady(const char* operation) const {
        std::lock_guard<std::mutex> lock(stateMutex);
        if (state == SessionState::Closed) {
            throw errors::SessionClosedError();
        }
        if (state != SessionState::Ready) {
            throw errors::InvalidStateError(std::format("{} requires a ready session (state: {})",
                                                        operation, SessionStateName(state)));
        }
    }

    ResponseFuture sendRequest(const char* method, std::optional<JSONValue> params) {
        const int64_t id = nextId.fetch_add(1);
        auto request = std::make_unique<JSONRPCRequest>(JSONRPCId{id}, method, std::move(params));
        LOG_DEBUG("Session: sending {} (id {})", method, id);
        return transport->SendRequest(std::move(request));
    }

    void onNotification(std::unique_ptr<JSONRPCNotification> n) {
        if (!n) { return; }
        try {
            if (n->method == Methods::Log) {
                logServerMessage(n->params.value_or(JSONValue{}));
            } else if (n->method == Methods::ToolListChanged) {
                LOG_INFO("Server reports its tool list changed; rediscover to refresh the catalog");
            } else {
                LOG_DEBUG("Session: ignoring notification {}", n->method);
            }
        } catch (const std::exception& e) {
            LOG_ERROR("Notification handler exception: {}", e.what());
        }
    }

    std::unique_ptr<JSONRPCResponse> onRequest(const JSONRPCRequest& req) {
        if (req.method == Methods::Ping) {
            return std::make_unique<JSONRPCResponse>(req.id, JSONValue{JSONValue::Object{}});
        }
        LOG_DEBUG("Session: rejecting server request {}", req.method);
        errors::McpError e;
        e.code = JSONRPCErrorCodes::MethodNotFound;
        e.message = "Method not found: " + req.method;
        return errors::makeErrorResponse(req.id, e);
    }

    InitializeResult handshake() {
        transport->Start().get();

        JSONValue::Object paramsObj;
        paramsObj["protocolVersion"] = std::make_shared<JSONValue>(std::string(PROTOCOL_VERSION));
        paramsObj["capabilities"] = std::make_shared<JSONValue>(JSONValue::Object{});
        JSONValue::Object ci;
        ci["name"] = std::make_shared<JSONValue>(clientInfo.name);
        ci["version"] = std::make_shared<JSONValue>(clientInfo.version);
        paramsObj["clientInfo"] = std::make_shared<JSONValue>(ci);

        LOG_INFO("Initializing MCP session as {} {}", clientInfo.name, clientInfo.version);
        std::optional<std::chrono::milliseconds> timeout;
        if (options.initializeTimeout.count() > 0) {
            timeout = options.initializeTimeout;
        }
        JSONValue result = awaitResult(Methods::Initialize, sendRequest(Methods::Initialize, JSONValue{paramsObj}), closed, timeout);
        InitializeResult init = ParseInitializeResult(result);
        if (!IsSupportedProtocolVersion(init.protocolVersion)) {
            throw errors::ProtocolError("server selected unsupported protocol version " + init.protocolVersion);
        }
        if (init.capabilities.tools.has_value()) {
            LOG_INFO("Server {} {} speaks {} (tools listChanged={})", init.serverInfo.name, init.serverInfo.version,
                     init.protocolVersion, init.capabilities.tools->listChanged);
        } else {
            LOG_WARN("Server {} did not advertise the tools capability; tools/list may be rejected", init.serverInfo.name);
        }
        transport->SendNotification(std::make_unique<JSONRPCNotification>(Methods::Initialized)).get();
        return init;
    }
};

Session::Session(const Implementation& clientInfo, const SessionOptions& options)
    : pImpl(std::make_unique<Impl>(clientInfo, options)) {
    FUNC_SCOPE();
}

Session::~Session() {
    FUNC_SCOPE();
    Close();
}

InitializeResult Session::Connect(std::unique_ptr<ITransport> transport) {
    FUNC_SCOPE();
    {
        std::lock_guard<std::mutex> lock(pImpl->stateMutex);
        if (pImpl->state == SessionState::Closed) {
            throw errors::SessionClosedError();
        }
        if (pImpl->state != SessionState::Unconnected) {
            throw errors::InvalidStateError("Connect called on an already connected session");
        }
        if (!transport) {
            throw errors::InvalidStateError("Connect requires a transport");
        }
        pImpl->transport = std::move(transport);
        pImpl->state = SessionState::Handshaking;
    }
    pImpl->transport->SetNotificationHandler([this](std::unique_ptr<JSONRPCNotification> n) {
        pImpl->onNotification(std::move(n));
    });
    pImpl->transport->SetRequestHandler([this](const JSONRPCRequest& req) -> std::unique_ptr<JSONRPCResponse> {
        return pImpl->onRequest(req);
    });
    pImpl->transport->SetErrorHandler([](const std::string& err) {
        LOG_WARN("Session: transport error: {}", err);
    });

    try {
        InitializeResult init = pImpl->handshake();
        {
            std::lock_guard<std::mutex> lock(pImpl->stateMutex);
            if (pImpl->state == SessionState::Closed) {
                throw errors::SessionClosedError("session closed during handshake");
            }
            pImpl->state = SessionState::Ready;
        }
        LOG_INFO("MCP session ready: server {} {} (protocol {})",
                 init.serverInfo.name, init.serverInfo.version, init.protocolVersion);
        return init;
    } catch (const std::exception& e) {
        LOG_ERROR("Initialize failed: {}", e.what());
        Close();
        throw errors::HandshakeError(std::format("MCP handshake failed: {}", e.what()));
    }
}

std::shared_ptr<const ToolCatalog> Session::ListTools() {
    FUNC_SCOPE();
    pImpl->ensureReady(Methods::ListTools);

    ToolCatalog fresh;
    std::set<std::string> seenCursors;
    std::optional<std::string> cursor;
    do {
        std::optional<JSONValue> params;
        if (cursor.has_value()) {
            JSONValue::Object p;
            p["cursor"] = std::make_shared<JSONValue>(cursor.value());
            params = JSONValue{p};
        }
        ToolsListResult page = ParseToolsListResult(
            awaitResult(Methods::ListTools, pImpl->sendRequest(Methods::ListTools, std::move(params)), pImpl->closed));
        for (auto& tool : page.tools) {
            if (fresh.count(tool.name) != 0) {
                LOG_WARN("tools/list returned '{}' more than once; keeping the last definition", tool.name);
            }
            std::string name = tool.name;
            fresh[name] = std::move(tool);
        }
        cursor = page.nextCursor;
        if (cursor.has_value() && cursor->empty()) {
            cursor.reset();
        }
        if (cursor.has_value() && !seenCursors.insert(cursor.value()).second) {
            throw errors::ProtocolError("tools/list pagination repeated cursor " + cursor.value());
        }
    } while (cursor.has_value());

    auto snapshot = std::make_shared<const ToolCatalog>(std::move(fresh));
    {
        std::lock_guard<std::mutex> lock(pImpl->catalogMutex);
        pImpl->catalog = snapshot;
    }
    LOG_INFO("Discovered {} tool(s)", snapshot->size());
    return snapshot;
}

std::shared_ptr<const ToolCatalog> Session::Tools() const {
    std::lock_guard<std::mutex> lock(pImpl->catalogMutex);
    return pImpl->catalog;
}

std::future<CallToolResult> Session::CallToolAsync(const std::string& name, const JSONValue& arguments) {
    FUNC_SCOPE();
    pImpl->ensureReady(Methods::CallTool);
    JSONValue::Object paramsObj;
    paramsObj["name"] = std::make_shared<JSONValue>(name);
    paramsObj["arguments"] = std::make_shared<JSONValue>(arguments);
    LOG_DEBUG("Calling tool: {}", name);
    ResponseFuture fut = pImpl->sendRequest(Methods::CallTool, JSONValue{paramsObj});
    // Deferred: the continuation only touches the response future and the shared closed flag
    return std::async(std::launch::deferred, [fut = std::move(fut), closed = pImpl->closed]() mutable {
        return ParseCallToolResult(awaitResult(Methods::CallTool, std::move(fut), closed));
    });
}

CallToolResult Session::CallTool(const std::string& name, const JSONValue& arguments) {
    return CallToolAsync(name, arguments).get();
}

void Session::Close() {
    FUNC_SCOPE();
    {
        std::lock_guard<std::mutex> lock(pImpl->stateMutex);
        if (pImpl->state == SessionState::Closed) {
            return;
        }
        LOG_INFO("Closing MCP session (state {})", SessionStateName(pImpl->state));
        pImpl->state = SessionState::Closed;
        pImpl->closed->store(true);
    }
    if (!pImpl->transport) {
        return;
    }
    try {
        pImpl->transport->Close().get();
    } catch (const std::exception& e) {
        LOG_ERROR("Session: transport close failed: {}", e.what());
    }
}

SessionState Session::State() const {
    std::lock_guard<std::mutex> lock(pImpl->stateMutex);
    return pImpl->state;
}

} // namespace stdiomcp
