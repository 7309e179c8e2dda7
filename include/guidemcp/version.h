//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: version.h
// Purpose: Version and identity of the guideline MCP server.
//==========================================================================================================
#pragma once

#include <string>

namespace guidemcp {

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

// "MAJOR.MINOR.PATCH"
std::string getVersionString();

// Name advertised as serverInfo.name during initialize.
std::string getServerName();

} // namespace guidemcp
