//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: PipeTransport.cpp
// Purpose: Pipe-descriptor transport implementation (epoll reader, synchronous framed writes)
//==========================================================================================================

#include <errno.h>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/epoll.h>
#include <sys/eventfd.h>
#include <unistd.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstring>
#include <format>
#include <future>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include "logging/Logger.h"
#include "stdiomcp/JSONRPCTypes.h"
#include "stdiomcp/JsonRpcMessageRouter.h"
#include "stdiomcp/PipeTransport.hpp"
#include "stdiomcp/errors/Errors.h"

namespace stdiomcp {

namespace {
std::once_flag sigpipeOnce;

void ignoreSigpipe() {
    std::call_once(sigpipeOnce, []() {
        if (::signal(SIGPIPE, SIG_IGN) == SIG_ERR) {
            LOG_WARN("PipeTransport: failed to ignore SIGPIPE (errno={} msg={})", errno, ::strerror(errno));
        }
    });
}

void setNonBlocking(int fd) {
    int flags = ::fcntl(fd, F_GETFL, 0);
    if (flags < 0 || ::fcntl(fd, F_SETFL, flags | O_NONBLOCK) < 0) {
        LOG_WARN("PipeTransport: cannot set O_NONBLOCK on fd {} (errno={} msg={})", fd, errno, ::strerror(errno));
    }
}

template <typename T>
std::future<T> failedFuture(std::exception_ptr error) {
    std::promise<T> promise;
    promise.set_exception(std::move(error));
    return promise.get_future();
}
} // namespace

class PipeTransport::Impl {
public:
    int readFd{-1};
    int writeFd{-1};
    int wakeEventFd{-1};
    std::unique_ptr<IContentFramer> framer;
    std::unique_ptr<IJsonRpcMessageRouter> router;

    std::atomic<bool> connected{false};
    std::atomic<bool> started{false};
    std::atomic<bool> closing{false};
    std::atomic<bool> errorReported{false};
    std::string sessionId;

    std::mutex handlerMutex;
    ITransport::NotificationHandler notificationHandler;
    ITransport::RequestHandler requestHandler;
    ITransport::ErrorHandler errorHandler;

    std::thread readerThread;
    std::thread timeoutThread;
    std::mutex timeoutMutex;
    std::condition_variable timeoutCv;
    std::mutex teardownMutex;

    // Serializes frames on the write descriptor and guards its closing
    std::mutex writeMutex;

    std::mutex requestMutex;
    std::unordered_map<std::string, std::promise<std::unique_ptr<JSONRPCResponse>>> pendingRequests;
    std::unordered_map<std::string, std::chrono::steady_clock::time_point> requestDeadlines;
    std::atomic<unsigned int> requestCounter{0u};
    std::atomic<uint64_t> requestTimeoutMs{0};  // 0 = disabled

    static constexpr int waitTimeoutMs = 100;
    static constexpr int writeRecheckMs = 50;

    Impl(int rfd, int wfd, std::unique_ptr<IContentFramer> f)
        : readFd(rfd), writeFd(wfd), framer(std::move(f)), router(MakeDefaultJsonRpcMessageRouter()) {
        std::random_device rd;
        std::mt19937 gen(rd());
        std::uniform_int_distribution<> dis(1000, 9999);
        sessionId = "pipe-" + std::to_string(dis(gen));
        if (!framer) {
            framer = MakeNewlineFramer();
        }
        wakeEventFd = ::eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
        if (wakeEventFd < 0) {
            LOG_ERROR("PipeTransport: failed to create eventfd (errno={} msg={})", errno, ::strerror(errno));
        }
    }

    ~Impl() {
        if (wakeEventFd >= 0) {
            ::close(wakeEventFd);
            wakeEventFd = -1;
        }
    }

    // The eventfd is never drained: once signaled it keeps every waiter (reader, blocked writer) awake
    void signalWake() {
        if (wakeEventFd < 0) {
            return;
        }
        uint64_t one = 1;
        for (;;) {
            ssize_t w = ::write(wakeEventFd, &one, sizeof(one));
            if (w >= 0 || errno == EAGAIN || errno == EWOULDBLOCK) {
                break;
            }
            if (errno == EINTR) {
                continue;
            }
            LOG_WARN("PipeTransport: eventfd write failed (errno={} msg={})", errno, ::strerror(errno));
            break;
        }
    }

    void failPending(const std::string& message) {
        std::lock_guard<std::mutex> lock(requestMutex);
        for (auto& [idStr, prom] : pendingRequests) {
            LOG_DEBUG("PipeTransport: failing pending request {} ({})", idStr, message);
            prom.set_exception(std::make_exception_ptr(errors::TransportError(message)));
        }
        pendingRequests.clear();
        requestDeadlines.clear();
    }

    //==========================================================================================================
    // failTransport
    // Purpose: Single path for EOF, broken pipe and read/write errors. Marks the transport disconnected,
    //          fails every pending request and reports the reason once (not when Close() initiated it).
    //==========================================================================================================
    void failTransport(const std::string& reason) {
        connected = false;
        signalWake();
        failPending("Transport closed");
        timeoutCv.notify_all();
        if (closing.load() || errorReported.exchange(true)) {
            return;
        }
        ITransport::ErrorHandler handler;
        {
            std::lock_guard<std::mutex> lock(handlerMutex);
            handler = errorHandler;
        }
        if (handler) {
            handler(reason);
        }
    }

    //==========================================================================================================
    // writeFrame
    // Purpose: Encodes and writes one message, looping over partial writes. While the pipe is full the
    //          write waits in slices of writeRecheckMs and re-checks the connection state.
    // Throws:
    //   errors::TransportError when the transport is closed or the write fails.
    //==========================================================================================================
    void writeFrame(const std::string& payload) {
        const std::string frame = framer->encode(payload);
        std::optional<std::string> failure;
        {
            std::lock_guard<std::mutex> lock(writeMutex);
            if (!connected.load() || writeFd < 0) {
                throw errors::TransportError("Transport closed");
            }
            std::size_t total = 0;
            while (total < frame.size()) {
                ssize_t w = ::write(writeFd, frame.data() + total, frame.size() - total);
                if (w > 0) {
                    total += static_cast<std::size_t>(w);
                    continue;
                }
                if (w < 0 && errno == EINTR) {
                    continue;
                }
                if (w < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
                    struct pollfd pfds[2];
                    pfds[0].fd = writeFd; pfds[0].events = POLLOUT; pfds[0].revents = 0;
                    pfds[1].fd = wakeEventFd; pfds[1].events = POLLIN; pfds[1].revents = 0;
                    int rc = ::poll(pfds, wakeEventFd >= 0 ? 2 : 1, writeRecheckMs);
                    if (rc < 0 && errno != EINTR) {
                        failure = std::format("poll failed: {}", ::strerror(errno));
                        break;
                    }
                    if (!connected.load()) {
                        throw errors::TransportError("Transport closed");
                    }
                    continue;
                }
                if (w < 0 && (errno == EPIPE || errno == EBADF)) {
                    LOG_INFO("PipeTransport: peer closed its input (errno={} msg={})", errno, ::strerror(errno));
                    failure = "broken pipe";
                } else {
                    LOG_ERROR("PipeTransport: write error (errno={} msg={})", errno, ::strerror(errno));
                    failure = std::format("write error: {}", ::strerror(errno));
                }
                break;
            }
        }
        if (failure.has_value()) {
            failTransport("PipeTransport: " + failure.value());
            throw errors::TransportError("Transport closed");
        }
        LOG_DEBUG("PipeTransport: wrote frame ({} bytes)", frame.size());
    }

    void handleResponse(JSONRPCResponse&& response) {
        const std::string idStr = IdToString(response.id);
        std::lock_guard<std::mutex> lock(requestMutex);
        auto it = pendingRequests.find(idStr);
        if (it == pendingRequests.end()) {
            LOG_WARN("PipeTransport: response for unknown or expired request id {}", idStr);
            return;
        }
        it->second.set_value(std::make_unique<JSONRPCResponse>(std::move(response)));
        pendingRequests.erase(it);
        requestDeadlines.erase(idStr);
    }

    void processMessage(const std::string& message) {
        LOG_DEBUG("Received message: {}", message);
        RouterHandlers handlers;
        {
            std::lock_guard<std::mutex> lock(handlerMutex);
            handlers.requestHandler = requestHandler;
            handlers.notificationHandler = notificationHandler;
        }
        // Unrecognized frames are logged by the router and dropped; they do not break the transport
        auto reply = router->route(message, handlers, [this](JSONRPCResponse&& r) { handleResponse(std::move(r)); });
        if (reply.has_value()) {
            try {
                writeFrame(reply.value());
            } catch (const errors::TransportError& e) {
                LOG_WARN("PipeTransport: could not answer server request: {}", e.what());
            }
        }
    }

    void drainFrames(std::string& buffer) {
        while (connected.load()) {
            IContentFramer::DecodeResult r = framer->tryDecodeEx(buffer);
            if (r.bytesConsumed > 0) {
                buffer.erase(0, std::min(r.bytesConsumed, buffer.size()));
            }
            if (r.status == IContentFramer::DecodeStatus::Ok) {
                processMessage(r.payload.value());
                continue;
            }
            if (r.status == IContentFramer::DecodeStatus::Incomplete || r.bytesConsumed == 0) {
                break;
            }
            LOG_WARN("PipeTransport: dropped malformed frame (status={})", static_cast<int>(r.status));
        }
    }

    void startReader() {
        readerThread = std::thread([this]() {
            int ep = ::epoll_create1(EPOLL_CLOEXEC);
            if (ep < 0) {
                LOG_ERROR("PipeTransport: epoll_create1 failed (errno={} msg={})", errno, ::strerror(errno));
                failTransport("PipeTransport: epoll_create1 failed");
                return;
            }
            epoll_event evIn{}; evIn.events = EPOLLIN; evIn.data.fd = readFd;
            if (::epoll_ctl(ep, EPOLL_CTL_ADD, readFd, &evIn) != 0) {
                LOG_ERROR("PipeTransport: epoll_ctl(read fd) failed (errno={} msg={})", errno, ::strerror(errno));
                ::close(ep);
                failTransport("PipeTransport: epoll_ctl failed");
                return;
            }
            if (wakeEventFd >= 0) {
                epoll_event evWake{}; evWake.events = EPOLLIN; evWake.data.fd = wakeEventFd;
                (void)::epoll_ctl(ep, EPOLL_CTL_ADD, wakeEventFd, &evWake);
            }

            std::string buffer;
            std::vector<char> tmp(64 * 1024);
            std::optional<std::string> failure;
            while (connected.load()) {
                epoll_event events[2];
                int rc = ::epoll_wait(ep, events, 2, waitTimeoutMs);
                if (rc < 0) {
                    if (errno == EINTR) {
                        continue;
                    }
                    LOG_ERROR("PipeTransport: epoll_wait failed (errno={} msg={})", errno, ::strerror(errno));
                    failure = "PipeTransport: epoll_wait failed";
                    break;
                }
                bool readable = false;
                for (int i = 0; i < rc; ++i) {
                    if (events[i].data.fd == readFd) {
                        readable = true;  // includes EPOLLHUP: buffered bytes are read before EOF is seen
                    }
                }
                if (!connected.load()) {
                    break;
                }
                if (!readable) {
                    continue;
                }
                ssize_t n;
                do {
                    n = ::read(readFd, tmp.data(), tmp.size());
                } while (n < 0 && errno == EINTR);
                if (n > 0) {
                    buffer.append(tmp.data(), static_cast<std::size_t>(n));
                    drainFrames(buffer);
                } else if (n == 0) {
                    LOG_INFO("PipeTransport: EOF from peer");
                    if (!buffer.empty()) {
                        LOG_WARN("PipeTransport: discarding {} trailing bytes without a frame terminator", buffer.size());
                    }
                    failure = "PipeTransport: EOF from peer";
                    break;
                } else if (errno != EAGAIN && errno != EWOULDBLOCK) {
                    LOG_ERROR("PipeTransport: read error (errno={} msg={})", errno, ::strerror(errno));
                    failure = "PipeTransport: read error";
                    break;
                }
            }
            ::close(ep);
            if (failure.has_value()) {
                failTransport(failure.value());
            }
        });
    }

    void startTimeouts() {
        timeoutThread = std::thread([this]() {
            using clock = std::chrono::steady_clock;
            while (connected.load()) {
                {
                    std::unique_lock<std::mutex> lk(timeoutMutex);
                    timeoutCv.wait_for(lk, std::chrono::milliseconds(50), [this]() { return !connected.load(); });
                }
                if (!connected.load()) {
                    break;
                }
                const auto now = clock::now();
                std::lock_guard<std::mutex> lock(requestMutex);
                for (auto it = requestDeadlines.begin(); it != requestDeadlines.end();) {
                    if (it->second > now) {
                        ++it;
                        continue;
                    }
                    auto pending = pendingRequests.find(it->first);
                    if (pending != pendingRequests.end()) {
                        LOG_WARN("PipeTransport: request {} timed out", it->first);
                        pending->second.set_exception(std::make_exception_ptr(errors::RequestTimeoutError(
                            std::format("Request {} timed out after {} ms", it->first, requestTimeoutMs.load()))));
                        pendingRequests.erase(pending);
                    }
                    it = requestDeadlines.erase(it);
                }
            }
        });
    }

    // Joins both loops and closes the descriptors; safe to repeat, never called on the reader thread
    void teardown() {
        std::lock_guard<std::mutex> teardownLock(teardownMutex);
        if (readerThread.joinable()) {
            readerThread.join();
        }
        if (timeoutThread.joinable()) {
            timeoutThread.join();
        }
        {
            std::lock_guard<std::mutex> lock(writeMutex);
            if (writeFd >= 0) {
                ::close(writeFd);
                writeFd = -1;
            }
        }
        if (readFd >= 0) {
            ::close(readFd);
            readFd = -1;
        }
    }

    std::string generateRequestId() { return "pipe-req-" + std::to_string(++requestCounter); }
};

PipeTransport::PipeTransport(int readFd, int writeFd, std::unique_ptr<IContentFramer> framer)
    : pImpl(std::make_unique<Impl>(readFd, writeFd, std::move(framer))) {
    FUNC_SCOPE();
}

PipeTransport::~PipeTransport() {
    FUNC_SCOPE();
    Close().get();
}

std::future<void> PipeTransport::Start() {
    FUNC_SCOPE();
    if (pImpl->closing.load()) {
        return failedFuture<void>(std::make_exception_ptr(errors::TransportError("Transport closed")));
    }
    if (pImpl->started.exchange(true)) {
        std::promise<void> promise; promise.set_value(); return promise.get_future();
    }
    LOG_INFO("Starting PipeTransport {} (read fd {}, write fd {})", pImpl->sessionId, pImpl->readFd, pImpl->writeFd);
    ignoreSigpipe();
    if (pImpl->readFd < 0 || pImpl->writeFd < 0) {
        return failedFuture<void>(std::make_exception_ptr(errors::TransportError("PipeTransport: invalid descriptor")));
    }
    setNonBlocking(pImpl->readFd);
    setNonBlocking(pImpl->writeFd);
    pImpl->connected = true;
    pImpl->startReader();
    pImpl->startTimeouts();
    std::promise<void> promise; promise.set_value(); return promise.get_future();
}

std::future<void> PipeTransport::Close() {
    FUNC_SCOPE();
    if (!pImpl->closing.exchange(true)) {
        LOG_INFO("Closing PipeTransport {}", pImpl->sessionId);
        pImpl->connected = false;
        pImpl->signalWake();
        pImpl->timeoutCv.notify_all();
    }

    if (pImpl->readerThread.joinable() && pImpl->readerThread.get_id() == std::this_thread::get_id()) {
        // Called from a handler on the reader: the loop still uses the descriptors, so the join and
        // the closing of both descriptors wait for the destructor (or a Close() from another thread)
        pImpl->failPending("Transport closed");
        std::promise<void> promise; promise.set_value(); return promise.get_future();
    }
    pImpl->teardown();
    pImpl->failPending("Transport closed");
    std::promise<void> promise; promise.set_value(); return promise.get_future();
}

bool PipeTransport::IsConnected() const { FUNC_SCOPE(); return pImpl->connected.load(); }
std::string PipeTransport::GetSessionId() const { FUNC_SCOPE(); return pImpl->sessionId; }

std::future<std::unique_ptr<JSONRPCResponse>> PipeTransport::SendRequest(
    std::unique_ptr<JSONRPCRequest> request) {
    FUNC_SCOPE();
    using ResponsePtr = std::unique_ptr<JSONRPCResponse>;
    if (!pImpl->connected.load()) {
        LOG_DEBUG("PipeTransport: SendRequest called while disconnected");
        return failedFuture<ResponsePtr>(std::make_exception_ptr(errors::TransportError("Transport closed")));
    }
    // Preserve caller-provided id if set (string non-empty or int64); otherwise generate a new id
    std::string requestId;
    bool callerSetId = false;
    std::visit([&](auto&& idVal) {
        using T = std::decay_t<decltype(idVal)>;
        if constexpr (std::is_same_v<T, std::string>) { if (!idVal.empty()) { requestId = idVal; callerSetId = true; } }
        else if constexpr (std::is_same_v<T, int64_t>) { requestId = std::to_string(idVal); callerSetId = true; }
    }, request->id);
    if (!callerSetId) {
        requestId = pImpl->generateRequestId();
        request->id = requestId;
    }

    std::promise<ResponsePtr> promise;
    auto future = promise.get_future();
    {
        std::lock_guard<std::mutex> lock(pImpl->requestMutex);
        if (pImpl->pendingRequests.count(requestId) != 0) {
            return failedFuture<ResponsePtr>(std::make_exception_ptr(
                errors::ProtocolError("Duplicate in-flight request id " + requestId)));
        }
        pImpl->pendingRequests.emplace(requestId, std::move(promise));
        const uint64_t timeoutMs = pImpl->requestTimeoutMs.load();
        if (timeoutMs > 0) {
            pImpl->requestDeadlines[requestId] = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeoutMs);
        }
    }

    const std::string serialized = request->Serialize();
    LOG_DEBUG("Sending request {} ({} bytes)", requestId, serialized.size());
    try {
        pImpl->writeFrame(serialized);
    } catch (const errors::TransportError& e) {
        std::lock_guard<std::mutex> lock(pImpl->requestMutex);
        auto it = pImpl->pendingRequests.find(requestId);
        if (it != pImpl->pendingRequests.end()) {
            it->second.set_exception(std::current_exception());
            pImpl->pendingRequests.erase(it);
        }
        pImpl->requestDeadlines.erase(requestId);
        LOG_DEBUG("PipeTransport: request {} not sent: {}", requestId, e.what());
    }
    return future;
}

std::future<void> PipeTransport::SendNotification(
    std::unique_ptr<JSONRPCNotification> notification) {
    FUNC_SCOPE();
    const std::string serialized = notification->Serialize();
    LOG_DEBUG("Sending notification {} ({} bytes)", notification->method, serialized.size());
    try {
        pImpl->writeFrame(serialized);
    } catch (const errors::TransportError&) {
        return failedFuture<void>(std::current_exception());
    }
    std::promise<void> promise; promise.set_value(); return promise.get_future();
}

void PipeTransport::SetNotificationHandler(NotificationHandler handler) {
    FUNC_SCOPE();
    std::lock_guard<std::mutex> lock(pImpl->handlerMutex);
    pImpl->notificationHandler = std::move(handler);
}

void PipeTransport::SetRequestHandler(RequestHandler handler) {
    FUNC_SCOPE();
    std::lock_guard<std::mutex> lock(pImpl->handlerMutex);
    pImpl->requestHandler = std::move(handler);
}

void PipeTransport::SetErrorHandler(ErrorHandler handler) {
    FUNC_SCOPE();
    std::lock_guard<std::mutex> lock(pImpl->handlerMutex);
    pImpl->errorHandler = std::move(handler);
}

void PipeTransport::SetRequestTimeoutMs(uint64_t timeoutMs) {
    FUNC_SCOPE();
    pImpl->requestTimeoutMs = timeoutMs;
}

} // namespace stdiomcp
