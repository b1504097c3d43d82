//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ToolConsole.cpp
// Purpose: Interactive tool caller implementation
//==========================================================================================================

#include <algorithm>
#include <cctype>
#include <string>

#include "logging/Logger.h"
#include "stdiomcp/console/ToolConsole.h"
#include "stdiomcp/errors/Errors.h"
#include "stdiomcp/typed/Content.h"

namespace stdiomcp {
namespace console {

namespace {
bool isBlank(const std::string& s) {
    return std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c) != 0; });
}

std::string trim(const std::string& s) {
    auto b = std::find_if_not(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c) != 0; });
    auto e = std::find_if_not(s.rbegin(), s.rend(), [](unsigned char c) { return std::isspace(c) != 0; }).base();
    return (b < e) ? std::string(b, e) : std::string();
}

bool equalsIgnoreCase(const std::string& a, const std::string& b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](unsigned char x, unsigned char y) {
               return std::tolower(x) == std::tolower(y);
           });
}

std::string toolNames(const ToolCatalog& catalog) {
    std::string out;
    for (const auto& [name, tool] : catalog) {
        if (!out.empty()) out += ", ";
        out += name;
    }
    return out;
}
} // namespace

ToolConsole::ToolConsole(IToolClient& client, std::istream& in, std::ostream& out)
    : client(client), in(in), out(out) {}

int ToolConsole::Run() {
    FUNC_SCOPE();
    out << "\n--- Interactive Tool Caller ---\n";
    out << "Type a tool name to call it, or 'quit' to exit.\n";
    if (client.Tools()->empty()) {
        out << "No tools discovered from the server. Exiting interactive loop.\n";
        return 0;
    }

    while (true) {
        out << "\n> Enter tool name: " << std::flush;
        std::string line;
        if (!std::getline(in, line)) {
            break;
        }
        const std::string toolName = trim(line);
        if (equalsIgnoreCase(toolName, "quit")) {
            break;
        }

        auto catalog = client.Tools();
        auto it = catalog->find(toolName);
        if (it == catalog->end()) {
            out << "Unknown tool '" << toolName << "'. Available tools are: " << toolNames(*catalog) << "\n";
            continue;
        }

        JSONValue::Object args;
        if (!promptArguments(it->second, args)) {
            continue;
        }
        const JSONValue arguments{args};
        out << "Client: Calling tool '" << toolName << "' with arguments: " << SerializeJSON(arguments) << "\n";
        try {
            render(client.CallTool(toolName, arguments));
        } catch (const errors::TransportError& e) {
            LOG_ERROR("Connection to the server lost: {}", e.what());
            out << "Error: " << e.what() << "\n";
            return 1;
        } catch (const errors::ClientError& e) {
            out << "Error: " << e.what() << "\n";
        }
    }
    return 0;
}

bool ToolConsole::promptArguments(const Tool& tool, JSONValue::Object& args) {
    for (const auto& prop : DescribeInputSchema(tool.inputSchema)) {
        if (prop.type != "string") {
            out << "Warning: Argument '" << prop.name << "' has type '" << prop.type
                << "', which is not interactively supported by this client yet.\n";
            if (prop.required) {
                out << "Error: Required argument '" << prop.name << "' cannot be provided. Skipping tool call.\n";
                return false;
            }
            continue;
        }
        out << "> Enter value for '" << prop.name << "' (string, " << (prop.required ? "REQUIRED" : "OPTIONAL");
        if (prop.description.has_value()) {
            out << " - " << prop.description.value();
        }
        out << "): " << std::flush;
        std::string value;
        if (!std::getline(in, value)) {
            value.clear();
        }
        if (prop.required && isBlank(value)) {
            out << "Error: Required argument '" << prop.name << "' cannot be empty. Skipping tool call.\n";
            return false;
        }
        args[prop.name] = std::make_shared<JSONValue>(value);
    }
    return true;
}

void ToolConsole::render(const CallToolResult& result) {
    const std::string text = typed::joinText(result, "\n");
    if (result.isError) {
        out << "Server responded with an ERROR during tool execution:\n";
        out << "Error Content: " << text << "\n";
        if (result.structuredContent.has_value()) {
            out << "Structured Error: " << SerializeJSON(result.structuredContent.value()) << "\n";
        }
        return;
    }
    out << "Server Response: " << text << "\n";
}

} // namespace console
} // namespace stdiomcp
