//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Logger.cpp
// Purpose: Definitions for Logger static members.
//==========================================================================================================

#include "logging/Logger.h"

// INFO unless MCP_LOG_LEVEL says otherwise; the server re-applies its configured level at startup.
LogLevel Logger::sLogLevel = Logger::toLogLevel(Logger::levelFromString(GetEnvOrDefault("MCP_LOG_LEVEL", "INFO")));
std::ofstream Logger::sLogFile;
std::mutex Logger::sLogMutex;
