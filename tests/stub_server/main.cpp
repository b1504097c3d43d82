//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: tests/stub_server/main.cpp
// Purpose: Scriptable MCP stdio server used by the process-level tests
//
// Usage: stdiomcp_stub_server [mode] [--content-length]
// Modes:
//   normal          greet / call_count / echo tools (default)
//   greet-only      tools/list advertises only greet
//   bad-handshake   initialize answered with a JSON-RPC error
//   bad-version     initialize acknowledged with an unsupported protocolVersion
//   silent          never answers initialize
//   slow-init       answers initialize after 500 ms
//   fail-list       tools/list answered with a JSON-RPC error
//   exit-after-init exits right after acknowledging initialize
//   paginated       tools/list split over two pages
//   noise           writes a non-JSON line before every reply
//   ping            pings the client after notifications/initialized and answers tools/list only
//                   once the ping was acknowledged (adds a ping_acked tool)
//   ignore-sigterm  ignores SIGTERM and keeps running after stdin closes
//==========================================================================================================

#include <errno.h>
#include <signal.h>
#include <unistd.h>

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <optional>
#include <string>
#include <vector>

#include "stdiomcp/ContentFramer.h"
#include "stdiomcp/JSONRPCTypes.h"
#include "stdiomcp/Protocol.h"
#include "stdiomcp/typed/Content.h"

namespace {
using namespace stdiomcp;

JSONValue str(const std::string& s) { return JSONValue{s}; }

JSONValue::Object stringProperty(const std::string& description) {
    JSONValue::Object p;
    p["type"] = std::make_shared<JSONValue>(str("string"));
    p["description"] = std::make_shared<JSONValue>(str(description));
    return p;
}

JSONValue toolJson(const std::string& name, const std::string& description,
                   const JSONValue::Object& properties, const std::vector<std::string>& required) {
    JSONValue::Object schema;
    schema["type"] = std::make_shared<JSONValue>(str("object"));
    schema["properties"] = std::make_shared<JSONValue>(properties);
    JSONValue::Array req;
    for (const auto& r : required) {
        req.push_back(std::make_shared<JSONValue>(str(r)));
    }
    schema["required"] = std::make_shared<JSONValue>(req);
    JSONValue::Object tool;
    tool["name"] = std::make_shared<JSONValue>(str(name));
    tool["description"] = std::make_shared<JSONValue>(str(description));
    tool["inputSchema"] = std::make_shared<JSONValue>(schema);
    return JSONValue{tool};
}

std::optional<std::string> stringArg(const JSONValue* args, const char* key) {
    if (!args) return std::nullopt;
    const JSONValue* v = args->find(key);
    if (!v || !v->isString()) return std::nullopt;
    return std::get<std::string>(v->value);
}

JSONValue resultToJson(const CallToolResult& r) {
    JSONValue::Object o;
    JSONValue::Array content;
    for (const auto& c : r.content) {
        content.push_back(std::make_shared<JSONValue>(c));
    }
    o["content"] = std::make_shared<JSONValue>(content);
    o["isError"] = std::make_shared<JSONValue>(r.isError);
    if (r.structuredContent.has_value()) {
        o["structuredContent"] = std::make_shared<JSONValue>(r.structuredContent.value());
    }
    return JSONValue{o};
}

class StubServer {
public:
    StubServer(std::string mode, FramingMode framing) : mode(std::move(mode)), framer(MakeFramer(framing)) {}

    int Run() {
        std::string buffer;
        char chunk[4096];
        while (!exitRequested) {
            ssize_t n = ::read(STDIN_FILENO, chunk, sizeof(chunk));
            if (n < 0 && errno == EINTR) {
                continue;
            }
            if (n <= 0) {
                break;
            }
            buffer.append(chunk, static_cast<std::size_t>(n));
            while (!exitRequested) {
                auto frame = framer->tryDecode(buffer);
                if (!frame.has_value()) {
                    break;
                }
                handle(frame.value());
            }
        }
        if (mode == "ignore-sigterm") {
            // Stay alive until SIGKILL
            for (;;) {
                ::pause();
            }
        }
        return 0;
    }

private:
    void write(const std::string& payload) {
        if (mode == "noise") {
            writeRaw("stub-server: this line is not JSON\n");
        }
        writeRaw(framer->encode(payload));
    }

    static void writeRaw(const std::string& bytes) {
        std::size_t total = 0;
        while (total < bytes.size()) {
            ssize_t w = ::write(STDOUT_FILENO, bytes.data() + total, bytes.size() - total);
            if (w < 0 && errno == EINTR) {
                continue;
            }
            if (w <= 0) {
                std::exit(3);
            }
            total += static_cast<std::size_t>(w);
        }
    }

    void reply(const JSONRPCId& id, JSONValue result) {
        write(JSONRPCResponse(id, std::move(result)).Serialize());
    }

    void replyError(const JSONRPCId& id, int code, const std::string& message) {
        write(CreateErrorResponse(id, code, message)->Serialize());
    }

    void handle(const std::string& frame) {
        JSONValue doc;
        try {
            doc = ParseJSON(frame);
        } catch (const std::exception& e) {
            std::fprintf(stderr, "stub-server: bad frame: %s\n", e.what());
            return;
        }
        const JSONValue* method = doc.find("method");
        const bool hasId = doc.find("id") != nullptr;
        if (!method) {
            JSONRPCResponse response;
            if (response.Deserialize(frame) && IdToString(response.id) == "srv-1" && response.result.has_value()) {
                pingAcked = true;
                if (deferredList.has_value()) {
                    JSONRPCId id = deferredList.value();
                    deferredList.reset();
                    answerList(id, nullptr);
                }
            }
            return;
        }
        if (!hasId) {
            JSONRPCNotification n;
            if (n.Deserialize(frame)) {
                onNotification(n);
            }
            return;
        }
        JSONRPCRequest request;
        if (!request.Deserialize(frame)) {
            return;
        }
        onRequest(request);
    }

    void onNotification(const JSONRPCNotification& n) {
        if (n.method != Methods::Initialized) {
            return;
        }
        JSONValue::Object params;
        params["level"] = std::make_shared<JSONValue>(str("info"));
        params["data"] = std::make_shared<JSONValue>(str("stub server ready"));
        write(JSONRPCNotification(Methods::Log, JSONValue{params}).Serialize());
        if (mode == "ping") {
            write(JSONRPCRequest(JSONRPCId{std::string("srv-1")}, Methods::Ping).Serialize());
        }
    }

    void onRequest(const JSONRPCRequest& req) {
        if (req.method == Methods::Initialize) {
            onInitialize(req);
        } else if (req.method == Methods::ListTools) {
            if (mode == "fail-list") {
                replyError(req.id, JSONRPCErrorCodes::InternalError, "tool listing is broken");
            } else if (mode == "ping" && !pingAcked) {
                deferredList = req.id;
            } else {
                const JSONValue* cursor = req.params.has_value() ? req.params->find("cursor") : nullptr;
                answerList(req.id, cursor);
            }
        } else if (req.method == Methods::CallTool) {
            onCallTool(req);
        } else if (req.method == Methods::Ping) {
            reply(req.id, JSONValue{JSONValue::Object{}});
        } else {
            replyError(req.id, JSONRPCErrorCodes::MethodNotFound, "Method not found: " + req.method);
        }
    }

    void onInitialize(const JSONRPCRequest& req) {
        if (mode == "silent") {
            return;
        }
        if (mode == "bad-handshake") {
            replyError(req.id, JSONRPCErrorCodes::InvalidRequest, "initialize rejected by stub");
            return;
        }
        if (mode == "slow-init") {
            ::usleep(500 * 1000);
        }
        JSONValue::Object result;
        result["protocolVersion"] = std::make_shared<JSONValue>(
            str(mode == "bad-version" ? "1999-01-01" : PROTOCOL_VERSION));
        JSONValue::Object tools;
        tools["listChanged"] = std::make_shared<JSONValue>(false);
        JSONValue::Object caps;
        caps["tools"] = std::make_shared<JSONValue>(tools);
        result["capabilities"] = std::make_shared<JSONValue>(caps);
        JSONValue::Object info;
        info["name"] = std::make_shared<JSONValue>(str("stub-server"));
        info["version"] = std::make_shared<JSONValue>(str("0.0.1"));
        result["serverInfo"] = std::make_shared<JSONValue>(info);
        reply(req.id, JSONValue{result});
        if (mode == "exit-after-init") {
            exitRequested = true;
            std::exit(0);
        }
    }

    void answerList(const JSONRPCId& id, const JSONValue* cursor) {
        JSONValue::Object greetProps;
        greetProps["name"] = std::make_shared<JSONValue>(stringProperty("Who to greet"));
        JSONValue::Object echoProps;
        echoProps["message"] = std::make_shared<JSONValue>(stringProperty("Text to echo back"));
        JSONValue::Object repeat;
        repeat["type"] = std::make_shared<JSONValue>(str("integer"));
        echoProps["repeat"] = std::make_shared<JSONValue>(repeat);

        JSONValue::Array page;
        JSONValue::Object result;
        const bool secondPage = cursor && cursor->isString() && std::get<std::string>(cursor->value) == "page-2";
        if (mode == "paginated" && !secondPage) {
            page.push_back(std::make_shared<JSONValue>(toolJson("greet", "Greets someone by name", greetProps, {"name"})));
            result["nextCursor"] = std::make_shared<JSONValue>(str("page-2"));
        } else if (mode == "paginated") {
            page.push_back(std::make_shared<JSONValue>(toolJson("echo", "Echoes a message", echoProps, {})));
        } else if (mode == "greet-only") {
            page.push_back(std::make_shared<JSONValue>(toolJson("greet", "Greets someone by name", greetProps, {"name"})));
        } else {
            page.push_back(std::make_shared<JSONValue>(toolJson("greet", "Greets someone by name", greetProps, {"name"})));
            page.push_back(std::make_shared<JSONValue>(toolJson("call_count", "Number of tools/call requests received", {}, {})));
            page.push_back(std::make_shared<JSONValue>(toolJson("echo", "Echoes a message", echoProps, {})));
            if (pingAcked) {
                page.push_back(std::make_shared<JSONValue>(toolJson("ping_acked", "Present once the client answered ping", {}, {})));
            }
        }
        result["tools"] = std::make_shared<JSONValue>(page);
        reply(id, JSONValue{result});
    }

    void onCallTool(const JSONRPCRequest& req) {
        ++callCount;
        const JSONValue* params = req.params.has_value() ? &req.params.value() : nullptr;
        auto name = stringArg(params, "name");
        const JSONValue* args = params ? params->find("arguments") : nullptr;
        if (!name.has_value()) {
            replyError(req.id, JSONRPCErrorCodes::InvalidParams, "tools/call without a name");
            return;
        }
        if (name.value() == "greet") {
            auto who = stringArg(args, "name");
            if (!who.has_value() || who->empty()) {
                CallToolResult r = typed::makeTextResult("Missing required argument 'name'", true);
                JSONValue::Object detail;
                detail["missing"] = std::make_shared<JSONValue>(str("name"));
                r.structuredContent = JSONValue{detail};
                reply(req.id, resultToJson(r));
                return;
            }
            reply(req.id, resultToJson(typed::makeTextResult("Hello, " + who.value() + "!")));
        } else if (name.value() == "call_count") {
            reply(req.id, resultToJson(typed::makeTextResult(std::to_string(callCount))));
        } else if (name.value() == "echo") {
            CallToolResult r = typed::makeTextResult(stringArg(args, "message").value_or(""));
            r.content.push_back(typed::makeText("(echo)"));
            reply(req.id, resultToJson(r));
        } else {
            replyError(req.id, JSONRPCErrorCodes::InvalidParams, "Unknown tool: " + name.value());
        }
    }

    std::string mode;
    std::unique_ptr<IContentFramer> framer;
    bool exitRequested{false};
    bool pingAcked{false};
    std::optional<JSONRPCId> deferredList;
    long callCount{0};
};
} // namespace

int main(int argc, char** argv) {
    std::string mode = "normal";
    FramingMode framing = FramingMode::NewlineDelimited;
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if (a == "--content-length") {
            framing = FramingMode::ContentLength;
        } else {
            mode = a;
        }
    }
    if (mode == "ignore-sigterm") {
        ::signal(SIGTERM, SIG_IGN);
    }
    StubServer server(mode, framing);
    return server.Run();
}
