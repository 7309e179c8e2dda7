//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/guidemcp/Protocol.cpp
// Purpose: MCP content helpers
//==========================================================================================================

#include "guidemcp/Protocol.h"

namespace guidemcp {

JSONValue MakeTextContent(const std::string& text) {
    JSONValue::Object o;
    o["type"] = std::make_shared<JSONValue>("text");
    o["text"] = std::make_shared<JSONValue>(text);
    return JSONValue(std::move(o));
}

JSONValue MakeTextResourceContents(const std::string& uri, const std::string& mimeType, const std::string& text) {
    JSONValue::Object o;
    o["uri"] = std::make_shared<JSONValue>(uri);
    o["mimeType"] = std::make_shared<JSONValue>(mimeType);
    o["text"] = std::make_shared<JSONValue>(text);
    return JSONValue(std::move(o));
}

} // namespace guidemcp
