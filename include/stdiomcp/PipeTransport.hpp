//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: PipeTransport.hpp
// Purpose: JSON-RPC transport over a pair of pipe descriptors (a child server's stdout/stdin)
//==========================================================================================================
#pragma once

#include "stdiomcp/ContentFramer.h"
#include "stdiomcp/Transport.h"
#include <memory>
#include <cstdint>

namespace stdiomcp {

//==========================================================================================================
// PipeTransport
// Purpose: Frames JSON-RPC messages over two POSIX descriptors. A single reader thread drains the
//          inbound descriptor; writes happen synchronously on the caller's thread.
// Notes:
//   - Takes ownership of both descriptors; they are closed by Close() or the destructor.
//   - SIGPIPE is ignored process-wide on first Start() so a vanished peer surfaces as EPIPE.
//   - Handlers must be registered before Start().
//==========================================================================================================
class PipeTransport : public ITransport {
public:
    PipeTransport(int readFd, int writeFd, std::unique_ptr<IContentFramer> framer = MakeNewlineFramer());
    virtual ~PipeTransport();

    ////////////////////////////////////////// ITransport //////////////////////////////////////////
    //==========================================================================================================
    // Starts the reader and timeout loops.
    // Returns:
    //   Future that completes when the loops are running.
    //==========================================================================================================
    std::future<void> Start() override;

    //==========================================================================================================
    // Stops the loops, closes both descriptors and fails pending requests with TransportError.
    // Idempotent. Called from a handler (on the reader thread) it only stops the transport and fails
    // pending requests; joining the reader and closing the descriptors finish in the destructor.
    // Destroying the transport from one of its own handlers is not supported.
    //==========================================================================================================
    std::future<void> Close() override;

    bool IsConnected() const override;
    std::string GetSessionId() const override;

    //==========================================================================================================
    // Writes the request and returns a future for the response matched by id.
    // Notes:
    //   The frame is fully written (or the write failed) before this returns.
    //==========================================================================================================
    std::future<std::unique_ptr<JSONRPCResponse>> SendRequest(
        std::unique_ptr<JSONRPCRequest> request) override;

    std::future<void> SendNotification(
        std::unique_ptr<JSONRPCNotification> notification) override;

    void SetNotificationHandler(NotificationHandler handler) override;
    void SetRequestHandler(RequestHandler handler) override;
    void SetErrorHandler(ErrorHandler handler) override;

    //==========================================================================================================
    // SetRequestTimeoutMs
    // Purpose: Configure the maximum time to wait for a single request/response pair.
    // Args:
    //   timeoutMs: Timeout in milliseconds; 0 disables the timeout (default).
    //==========================================================================================================
    void SetRequestTimeoutMs(uint64_t timeoutMs);

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace stdiomcp
