//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: InMemoryTransport.cpp
// Purpose: In-process transport pair used as the scripted server peer in session tests
//==========================================================================================================

#include <atomic>
#include <condition_variable>
#include <deque>
#include <future>
#include <map>
#include <mutex>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

#include "logging/Logger.h"
#include "stdiomcp/InMemoryTransport.hpp"
#include "stdiomcp/JSONRPCTypes.h"
#include "stdiomcp/JsonRpcMessageRouter.h"
#include "stdiomcp/errors/Errors.h"

namespace stdiomcp {

namespace {
std::atomic<unsigned int> transportCounter{0u};

template <typename T>
std::future<T> failedFuture(const std::string& message) {
    std::promise<T> p;
    p.set_exception(std::make_exception_ptr(errors::TransportError(message)));
    return p.get_future();
}
} // namespace

class InMemoryTransport::Impl {
public:
    // Both ends of a pair; an end clears its slot when destroyed so the other stops delivering to it.
    struct Link {
        std::mutex mutex;
        Impl* ends[2] = {nullptr, nullptr};
    };

    std::shared_ptr<Link> link;
    int end = 0;
    std::string sessionId;
    std::atomic<bool> connected{false};
    std::atomic<unsigned int> nextRequestId{0u};
    std::unique_ptr<IJsonRpcMessageRouter> router = MakeDefaultJsonRpcMessageRouter();

    std::mutex handlerMutex;
    RouterHandlers handlers;

    std::mutex pendingMutex;
    std::map<std::string, std::promise<std::unique_ptr<JSONRPCResponse>>> pending;

    std::mutex inboxMutex;
    std::condition_variable_any inboxReady;
    std::deque<std::string> inbox;

    // Threads last: they are joined before the state above goes away
    std::mutex workerMutex;
    std::vector<std::jthread> workers;
    std::jthread inboxThread;

    Impl() : sessionId("memory-" + std::to_string(++transportCounter)) {}

    ~Impl() {
        detach();
        inboxThread = std::jthread();
        std::vector<std::jthread> done;
        {
            std::lock_guard<std::mutex> lock(workerMutex);
            done.swap(workers);
        }
    }

    void detach() {
        if (!link) return;
        std::lock_guard<std::mutex> lock(link->mutex);
        link->ends[end] = nullptr;
    }

    void post(std::string message) {
        {
            std::lock_guard<std::mutex> lock(inboxMutex);
            inbox.push_back(std::move(message));
        }
        inboxReady.notify_one();
    }

    bool deliver(const std::string& message) {
        if (!connected.load() || !link) {
            return false;
        }
        std::lock_guard<std::mutex> lock(link->mutex);
        Impl* other = link->ends[1 - end];
        if (link->ends[end] != this || !other || !other->connected.load()) {
            return false;
        }
        other->post(message);
        return true;
    }

    void runInbox(std::stop_token st) {
        while (!st.stop_requested()) {
            std::string message;
            {
                std::unique_lock<std::mutex> lock(inboxMutex);
                if (!inboxReady.wait(lock, st, [this] { return !inbox.empty(); })) {
                    return;
                }
                message = std::move(inbox.front());
                inbox.pop_front();
            }
            dispatch(message);
        }
    }

    void dispatch(const std::string& message) {
        LOG_DEBUG("{} received: {}", sessionId, message);
        RouterHandlers snapshot;
        {
            std::lock_guard<std::mutex> lock(handlerMutex);
            snapshot = handlers;
        }
        auto onResponse = [this](JSONRPCResponse&& r) { resolve(std::move(r)); };

        // A request handler may block; give it a thread so later messages keep flowing
        if (snapshot.requestHandler && router->classify(message) == IJsonRpcMessageRouter::MessageKind::Request) {
            std::lock_guard<std::mutex> lock(workerMutex);
            workers.emplace_back([this, message, snapshot, onResponse]() mutable {
                auto reply = router->route(message, snapshot, onResponse);
                if (reply.has_value() && !deliver(reply.value())) {
                    LOG_WARN("{}: reply dropped, peer gone", sessionId);
                }
            });
            return;
        }
        auto reply = router->route(message, snapshot, onResponse);
        if (reply.has_value() && !deliver(reply.value())) {
            LOG_WARN("{}: reply dropped, peer gone", sessionId);
        }
    }

    void resolve(JSONRPCResponse response) {
        const std::string key = IdToString(response.id);
        std::lock_guard<std::mutex> lock(pendingMutex);
        auto it = pending.find(key);
        if (it == pending.end()) {
            LOG_WARN("{}: response for unknown request id {}", sessionId, key);
            return;
        }
        it->second.set_value(std::make_unique<JSONRPCResponse>(std::move(response)));
        pending.erase(it);
    }

    void failAll(const std::string& reason) {
        std::map<std::string, std::promise<std::unique_ptr<JSONRPCResponse>>> failed;
        {
            std::lock_guard<std::mutex> lock(pendingMutex);
            failed.swap(pending);
        }
        for (auto& [key, p] : failed) {
            p.set_exception(std::make_exception_ptr(errors::TransportError(reason)));
        }
    }
};

InMemoryTransport::InMemoryTransport() : pImpl(std::make_unique<Impl>()) {}
InMemoryTransport::~InMemoryTransport() = default;

std::pair<std::unique_ptr<InMemoryTransport>, std::unique_ptr<InMemoryTransport>> InMemoryTransport::CreatePair() {
    FUNC_SCOPE();
    auto left = std::make_unique<InMemoryTransport>();
    auto right = std::make_unique<InMemoryTransport>();
    auto link = std::make_shared<Impl::Link>();
    link->ends[0] = left->pImpl.get();
    link->ends[1] = right->pImpl.get();
    left->pImpl->link = link;
    left->pImpl->end = 0;
    right->pImpl->link = link;
    right->pImpl->end = 1;
    return {std::move(left), std::move(right)};
}

std::future<void> InMemoryTransport::Start() {
    FUNC_SCOPE();
    if (!pImpl->connected.exchange(true)) {
        LOG_INFO("Starting InMemoryTransport {}", pImpl->sessionId);
        Impl* impl = pImpl.get();
        pImpl->inboxThread = std::jthread([impl](std::stop_token st) { impl->runInbox(st); });
    }
    std::promise<void> ready;
    ready.set_value();
    return ready.get_future();
}

std::future<void> InMemoryTransport::Close() {
    FUNC_SCOPE();
    if (pImpl->connected.exchange(false)) {
        LOG_INFO("Closing InMemoryTransport {}", pImpl->sessionId);
        pImpl->inboxThread.request_stop();
    }
    pImpl->failAll("Transport closed");
    std::promise<void> closed;
    closed.set_value();
    return closed.get_future();
}

bool InMemoryTransport::IsConnected() const { return pImpl->connected.load(); }
std::string InMemoryTransport::GetSessionId() const { return pImpl->sessionId; }

std::future<std::unique_ptr<JSONRPCResponse>> InMemoryTransport::SendRequest(std::unique_ptr<JSONRPCRequest> request) {
    FUNC_SCOPE();
    const bool hasId = std::holds_alternative<int64_t>(request->id) ||
                       (std::holds_alternative<std::string>(request->id) && !std::get<std::string>(request->id).empty());
    if (!hasId) {
        request->id = pImpl->sessionId + "-req-" + std::to_string(++pImpl->nextRequestId);
    }
    const std::string key = IdToString(request->id);

    std::future<std::unique_ptr<JSONRPCResponse>> result;
    {
        std::lock_guard<std::mutex> lock(pImpl->pendingMutex);
        result = pImpl->pending[key].get_future();
    }
    if (!pImpl->deliver(request->Serialize())) {
        std::lock_guard<std::mutex> lock(pImpl->pendingMutex);
        auto it = pImpl->pending.find(key);
        if (it != pImpl->pending.end()) {
            it->second.set_exception(std::make_exception_ptr(errors::TransportError("Peer not connected")));
            pImpl->pending.erase(it);
        }
    }
    return result;
}

std::future<void> InMemoryTransport::SendNotification(std::unique_ptr<JSONRPCNotification> notification) {
    FUNC_SCOPE();
    if (!pImpl->deliver(notification->Serialize())) {
        return failedFuture<void>("Peer not connected");
    }
    std::promise<void> sent;
    sent.set_value();
    return sent.get_future();
}

void InMemoryTransport::SetNotificationHandler(NotificationHandler handler) {
    std::lock_guard<std::mutex> lock(pImpl->handlerMutex);
    pImpl->handlers.notificationHandler = std::move(handler);
}

void InMemoryTransport::SetErrorHandler(ErrorHandler handler) {
    std::lock_guard<std::mutex> lock(pImpl->handlerMutex);
    pImpl->handlers.errorHandler = std::move(handler);
}

void InMemoryTransport::SetRequestHandler(RequestHandler handler) {
    std::lock_guard<std::mutex> lock(pImpl->handlerMutex);
    pImpl->handlers.requestHandler = std::move(handler);
}

} // namespace stdiomcp
