//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ToolConsole.h
// Purpose: Line-oriented interactive loop that prompts for tool arguments and prints results
//==========================================================================================================

#pragma once

#include <istream>
#include <ostream>

#include "stdiomcp/JSONRPCTypes.h"
#include "stdiomcp/Protocol.h"
#include "stdiomcp/StdioClient.h"

namespace stdiomcp {
namespace console {

//==========================================================================================================
// ToolConsole
// Purpose: Reads a tool name per line, prompts for each "string" property of its inputSchema (name
//          order), invokes the tool through an IToolClient and prints the text content of the result.
// Notes:
//   - Non-string properties cannot be entered; a required one skips the call.
//   - A blank value for a required string property skips the call; the loop continues.
//==========================================================================================================
class ToolConsole {
public:
    ToolConsole(IToolClient& client, std::istream& in, std::ostream& out);

    //==========================================================================================================
    // Run
    // Purpose: Runs until "quit" (any case) or end of input.
    // Returns:
    //   0 on a normal exit; 1 when the connection to the server broke (TransportError).
    //==========================================================================================================
    int Run();

private:
    // Fills args from user input; false when the call must be skipped.
    bool promptArguments(const Tool& tool, JSONValue::Object& args);
    void render(const CallToolResult& result);

    IToolClient& client;
    std::istream& in;
    std::ostream& out;
};

} // namespace console
} // namespace stdiomcp
