//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Errors.h
// Purpose: Typed error structures, exceptions, and JSON-RPC error mapping helpers
//==========================================================================================================

#pragma once

#include <optional>
#include <stdexcept>
#include <string>

#include "guidemcp/JSONRPCTypes.h"

namespace guidemcp {
namespace errors {

// Categorization of the JSON-RPC and server-defined error codes.
enum class ErrorCategory {
    JsonRpcParse,
    JsonRpcInvalidRequest,
    JsonRpcMethodNotFound,
    JsonRpcInvalidParams,
    JsonRpcInternal,
    SessionNotFound,
    UnsupportedProtocolVersion,
    ResourceNotFound,
    Unknown
};

// Typed error representation.
struct McpError {
    int code{0};
    std::string message;
    std::optional<JSONValue> data;
    ErrorCategory category{ErrorCategory::Unknown};
};

// Map a numeric error code to an ErrorCategory.
//
// Args:
//   code: The integer error code (JSON-RPC standard or server-defined).
//
// Returns:
//   ErrorCategory corresponding to the code, or Unknown when unmapped.
inline ErrorCategory errorCategoryFromCode(int code) {
    switch (code) {
        case JSONRPCErrorCodes::ParseError: return ErrorCategory::JsonRpcParse;
        case JSONRPCErrorCodes::InvalidRequest: return ErrorCategory::JsonRpcInvalidRequest;
        case JSONRPCErrorCodes::MethodNotFound: return ErrorCategory::JsonRpcMethodNotFound;
        case JSONRPCErrorCodes::InvalidParams: return ErrorCategory::JsonRpcInvalidParams;
        case JSONRPCErrorCodes::InternalError: return ErrorCategory::JsonRpcInternal;
        case JSONRPCErrorCodes::SessionNotFound: return ErrorCategory::SessionNotFound;
        case JSONRPCErrorCodes::UnsupportedProtocolVersion: return ErrorCategory::UnsupportedProtocolVersion;
        case JSONRPCErrorCodes::ResourceNotFound: return ErrorCategory::ResourceNotFound;
        default: return ErrorCategory::Unknown;
    }
}

// Build a typed error with its category filled in.
inline McpError makeError(int code, std::string message, std::optional<JSONValue> data = std::nullopt) {
    McpError e;
    e.code = code;
    e.message = std::move(message);
    e.data = std::move(data);
    e.category = errorCategoryFromCode(code);
    return e;
}

// Convert a JSON-RPC error object (shape: { code, message, data? }) to McpError.
// Returns std::nullopt when the input is not a valid error object.
inline std::optional<McpError> mcpErrorFromErrorValue(const JSONValue& errVal) {
    const JSONValue* code = errVal.Find("code");
    const JSONValue* message = errVal.Find("message");
    if (code == nullptr || message == nullptr) {
        return std::nullopt;
    }
    if (!std::holds_alternative<int64_t>(code->value) || !message->IsString()) {
        return std::nullopt;
    }
    std::optional<JSONValue> data;
    if (const JSONValue* d = errVal.Find("data")) {
        data = *d;
    }
    return makeError(static_cast<int>(std::get<int64_t>(code->value)),
                     std::get<std::string>(message->value), std::move(data));
}

// Extract McpError from a JSONRPCResponse if it carries an error.
inline std::optional<McpError> mcpErrorFromResponse(const JSONRPCResponse& response) {
    if (!response.error.has_value()) {
        return std::nullopt;
    }
    return mcpErrorFromErrorValue(response.error.value());
}

// Create a JSONRPCResponse error from McpError and id.
inline std::unique_ptr<JSONRPCResponse> makeErrorResponse(const JSONRPCId& id, const McpError& err) {
    return CreateErrorResponse(id, err.code, err.message, err.data);
}

//==========================================================================================================
// McpException
// Purpose: Carries an McpError out of handler code. The dispatcher converts it back into an error
//          envelope unchanged.
//==========================================================================================================
class McpException : public std::runtime_error {
public:
    explicit McpException(McpError err)
        : std::runtime_error(err.message), error_(std::move(err)) {}
    McpException(int code, const std::string& message, std::optional<JSONValue> data = std::nullopt)
        : McpException(makeError(code, message, std::move(data))) {}

    const McpError& error() const noexcept { return error_; }

private:
    McpError error_;
};

//==========================================================================================================
// GuidelineError
// Purpose: Domain failure raised by a guideline collaborator. Only the kind and the public message
//          cross the JSON-RPC boundary; anything else a collaborator throws becomes InternalError.
//==========================================================================================================
class GuidelineError : public std::runtime_error {
public:
    enum class Kind {
        UnknownTool,
        InvalidArguments,
        ResourceNotFound
    };

    GuidelineError(Kind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    Kind kind() const noexcept { return kind_; }

private:
    Kind kind_;
};

// Maps a collaborator domain error onto the JSON-RPC taxonomy.
inline McpError fromGuidelineError(const GuidelineError& e) {
    switch (e.kind()) {
        case GuidelineError::Kind::ResourceNotFound:
            return makeError(JSONRPCErrorCodes::ResourceNotFound, e.what());
        case GuidelineError::Kind::UnknownTool:
        case GuidelineError::Kind::InvalidArguments:
        default:
            return makeError(JSONRPCErrorCodes::InvalidParams, e.what());
    }
}

} // namespace errors
} // namespace guidemcp
