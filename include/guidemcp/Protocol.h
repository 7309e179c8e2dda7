//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Protocol.h
// Purpose: MCP protocol data structures and constants
//==========================================================================================================

#pragma once

#include "JSONRPCTypes.h"
#include <string>
#include <vector>
#include <optional>
#include <unordered_map>

namespace guidemcp {

///////////////////////////////////////// Protocol constants ///////////////////////////////////////////
// Protocol revisions this server can speak, oldest first. Deployments narrow the set through
// configuration; this is only the default.
inline const std::vector<std::string>& DefaultProtocolVersions() {
    static const std::vector<std::string> kVersions{"2024-11-05", "2025-03-26", "2025-06-18"};
    return kVersions;
}

// HTTP binding header names
namespace Headers {
    constexpr const char* SessionId = "Mcp-Session-Id";
    constexpr const char* ProtocolVersion = "MCP-Protocol-Version";
}

// Media types used by the streamable HTTP binding
namespace MediaTypes {
    constexpr const char* Json = "application/json";
    constexpr const char* EventStream = "text/event-stream";
}

///////////////////////////////////////// Implementation ///////////////////////////////////////////
struct Implementation {
    std::string name;
    std::string version;

    Implementation() = default;
    Implementation(std::string name, std::string version)
        : name(std::move(name)), version(std::move(version)) {}
};

///////////////////////////////////////// Capabilities ///////////////////////////////////////////
// Capability name -> configuration object, frozen for a session once initialize completes.
using CapabilitySet = std::unordered_map<std::string, JSONValue>;

struct ToolsCapability {
    bool listChanged = false;
};

struct ResourcesCapability {
    bool subscribe = false;
    bool listChanged = false;
};

struct ServerCapabilities {
    std::optional<ToolsCapability> tools;
    std::optional<ResourcesCapability> resources;
    std::unordered_map<std::string, JSONValue> experimental;
};

///////////////////////////////////////// Tools ///////////////////////////////////////////
struct Tool {
    std::string name;
    std::string description;
    JSONValue inputSchema;  // JSON Schema for tool parameters

    Tool() = default;
    Tool(std::string name, std::string description, JSONValue inputSchema = JSONValue{})
        : name(std::move(name)), description(std::move(description)),
          inputSchema(std::move(inputSchema)) {}
};

struct CallToolResult {
    std::vector<JSONValue> content;  // Array of content items
    bool isError = false;
};

///////////////////////////////////////// Resources ///////////////////////////////////////////
struct Resource {
    std::string uri;
    std::string name;
    std::optional<std::string> description;
    std::optional<std::string> mimeType;

    Resource() = default;
    Resource(std::string uri, std::string name,
             std::optional<std::string> description = std::nullopt,
             std::optional<std::string> mimeType = std::nullopt)
        : uri(std::move(uri)), name(std::move(name)),
          description(std::move(description)), mimeType(std::move(mimeType)) {}
};

struct ReadResourceResult {
    std::vector<JSONValue> contents;  // Array of resource contents
};

///////////////////////////////////////// Content helpers ///////////////////////////////////////////
// { "type": "text", "text": <text> }
JSONValue MakeTextContent(const std::string& text);

// { "uri": <uri>, "mimeType": <mime>, "text": <text> }
JSONValue MakeTextResourceContents(const std::string& uri, const std::string& mimeType, const std::string& text);

///////////////////////////////////////// Method names ///////////////////////////////////////////
namespace Methods {
    // Client to server
    constexpr const char* Initialize = "initialize";
    constexpr const char* Ping = "ping";
    constexpr const char* ListTools = "tools/list";
    constexpr const char* CallTool = "tools/call";
    constexpr const char* ListResources = "resources/list";
    constexpr const char* ReadResource = "resources/read";

    // Notifications
    constexpr const char* Initialized = "notifications/initialized";
    constexpr const char* Progress = "notifications/progress";
    constexpr const char* Cancelled = "notifications/cancelled";
}

} // namespace guidemcp
