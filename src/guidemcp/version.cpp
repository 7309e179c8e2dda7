//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: version.cpp
// Purpose: Version and identity of the guideline MCP server.
//==========================================================================================================
#include "guidemcp/version.h"

#include <sstream>

namespace guidemcp {

VersionInfo getVersion() {
    return VersionInfo{1, 0, 0};
}

std::string getVersionString() {
    const auto v = getVersion();
    std::ostringstream oss;
    oss << v.major << "." << v.minor << "." << v.patch;
    return oss.str();
}

std::string getServerName() {
    return "nccn-guidelines";
}

} // namespace guidemcp
