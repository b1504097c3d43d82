//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: version.h
// Purpose: Version of the stdio MCP client, as advertised in clientInfo during initialize.
//==========================================================================================================
#pragma once

#include <string>

namespace stdiomcp {

// Name sent as clientInfo.name
constexpr const char* CLIENT_NAME = "stdio-mcp-client";

//==========================================================================================================
// VersionInfo
// Purpose: Semantic version components.
// Fields:
//   major, minor, patch: Version components.
//==========================================================================================================
struct VersionInfo {
    int major;
    int minor;
    int patch;
};

VersionInfo getVersion();

//==========================================================================================================
// getVersionString
// Purpose: Returns the semantic version string.
// Returns:
//   std::string formatted as "MAJOR.MINOR.PATCH" (sent as clientInfo.version)
//==========================================================================================================
std::string getVersionString();

} // namespace stdiomcp
