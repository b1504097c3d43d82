//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: examples/stdio_client/main.cpp
// Purpose: stdio_mcp_client - launch an MCP server, list its tools and call them interactively
//==========================================================================================================

#include <iostream>
#include <string>
#include <vector>

#include "logging/Logger.h"
#include "stdiomcp/StdioClient.h"
#include "stdiomcp/console/ToolConsole.h"
#include "stdiomcp/errors/Errors.h"

namespace {
void printUsage() {
    std::cout << "Usage: stdio_mcp_client <command> [command_args...]\n";
    std::cout << "\nExamples:\n";
    std::cout << "  Local Node Server:     stdio_mcp_client node build/index.js\n";
    std::cout << "  Generic Docker Server: stdio_mcp_client docker run -i --rm -e MY_API_KEY my/mcp-server-image\n";
    std::cout << "                         (Note: Any necessary environment variables like MY_API_KEY must be set in your shell environment before running.)\n";
    std::cout << "  UV Server Example:     stdio_mcp_client uv run python -m my_uv_mcp_server_module\n";
    std::cout << "                         (Note: Any necessary environment variables for 'uv' or your Python module must be set in your shell environment.)\n";
    std::cout << "\nEnvironment: STDIOMCP_LOG_LEVEL, STDIOMCP_FRAMING, STDIOMCP_REQUEST_TIMEOUT_MS, STDIOMCP_SERVER_STDERR\n";
}

std::string joinCommand(const stdiomcp::ServerConfig& config) {
    std::string s = config.command;
    for (const auto& a : config.args) {
        s += " " + a;
    }
    return s;
}
} // namespace

int main(int argc, char** argv) {
    using namespace stdiomcp;
    if (argc < 2) {
        printUsage();
        return 0;
    }
    Logger::configureFromEnvironment(LogLevel::LOG_WARN_LEVEL);

    ServerConfig config;
    config.command = argv[1];
    config.args.assign(argv + 2, argv + argc);

    int exitCode = 0;
    {
        StdioClient client(ClientOptions::FromEnvironment());
        std::cout << "Client: Starting server process: " << joinCommand(config) << std::endl;
        bool connected = false;
        try {
            client.ConnectToServer(config);
            connected = true;
        } catch (const errors::ClientError& e) {
            if (auto pid = client.ServerPid()) {
                std::cout << "Client: Server process started with PID: " << pid.value() << std::endl;
            }
            std::cout << "Client: Failed to connect to MCP server: " << e.what() << std::endl;
            exitCode = 1;
        }

        if (connected) {
            std::cout << "Client: Server process started with PID: " << client.ServerPid().value_or(-1) << std::endl;
            std::cout << "Client: Successfully connected to MCP server." << std::endl;
            std::string names;
            for (const auto& [name, tool] : *client.Tools()) {
                names += names.empty() ? name : ", " + name;
            }
            std::cout << "Client: Discovered tools from server: " << names << std::endl;

            console::ToolConsole console(client, std::cin, std::cout);
            exitCode = console.Run();
        }

        client.Close();
        std::cout << "Client: MCP connection closed." << std::endl;
        std::cout << "Client: Server subprocess terminated." << std::endl;
    }
    return exitCode;
}
