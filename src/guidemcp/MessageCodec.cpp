//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/guidemcp/MessageCodec.cpp
// Purpose: JSON-RPC 2.0 envelope validation and canonical encoding
//==========================================================================================================

#include <sstream>
#include <stdexcept>

#include "guidemcp/MessageCodec.h"
#include "logging/Logger.h"

namespace guidemcp {

namespace {

DecodeError invalid(const std::string& message, JSONRPCId id = nullptr) {
    DecodeError e;
    e.code = JSONRPCErrorCodes::InvalidRequest;
    e.message = message;
    e.id = std::move(id);
    return e;
}

// Reads a request/response id. Returns false when the member is present but not string/integer/null.
bool readId(const JSONValue& v, JSONRPCId& out) {
    if (std::holds_alternative<std::string>(v.value)) { out = std::get<std::string>(v.value); return true; }
    if (std::holds_alternative<int64_t>(v.value)) { out = std::get<int64_t>(v.value); return true; }
    if (v.IsNull()) { out = nullptr; return true; }
    return false;
}

bool isErrorObject(const JSONValue& v) {
    if (!v.IsObject()) return false;
    const JSONValue* code = v.Find("code");
    const JSONValue* message = v.Find("message");
    return code != nullptr && std::holds_alternative<int64_t>(code->value) &&
           message != nullptr && message->IsString();
}

void writeId(std::ostringstream& oss, const JSONRPCId& id) {
    std::visit([&oss](const auto& v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::string>) {
            oss << SerializeJSON(JSONValue(v));
        } else if constexpr (std::is_same_v<T, int64_t>) {
            oss << v;
        } else {
            oss << "null";
        }
    }, id);
}

} // namespace

EnvelopeKind KindOf(const Envelope& envelope) {
    if (std::holds_alternative<JSONRPCRequest>(envelope)) return EnvelopeKind::Request;
    if (std::holds_alternative<JSONRPCNotification>(envelope)) return EnvelopeKind::Notification;
    return std::get<JSONRPCResponse>(envelope).IsError() ? EnvelopeKind::Error : EnvelopeKind::Response;
}

const char* ToString(EnvelopeKind kind) {
    switch (kind) {
        case EnvelopeKind::Request: return "request";
        case EnvelopeKind::Notification: return "notification";
        case EnvelopeKind::Response: return "response";
        case EnvelopeKind::Error: return "error";
    }
    return "unknown";
}

DecodeResult DecodeEnvelope(const std::string& bytes) {
    JSONValue root;
    try {
        root = ParseJSON(bytes);
    } catch (const std::exception& e) {
        DecodeError err;
        err.code = JSONRPCErrorCodes::ParseError;
        err.message = std::string("Parse error: ") + e.what();
        return err;
    }

    if (root.IsArray()) {
        return invalid("Batch requests are not supported");
    }
    if (!root.IsObject()) {
        return invalid("Envelope must be a JSON object");
    }

    // Recover the id first so structural errors can still be correlated.
    JSONRPCId id{nullptr};
    const JSONValue* idVal = root.Find("id");
    const auto& members = std::get<JSONValue::Object>(root.value);
    const bool hasId = members.find("id") != members.end();
    if (idVal != nullptr && !readId(*idVal, id)) {
        return invalid("Invalid id type");
    }

    const JSONValue* version = root.Find("jsonrpc");
    if (version == nullptr || !version->IsString() || std::get<std::string>(version->value) != "2.0") {
        return invalid("Missing or invalid jsonrpc version marker", id);
    }

    const JSONValue* method = root.Find("method");
    if (method != nullptr) {
        if (!method->IsString() || std::get<std::string>(method->value).empty()) {
            return invalid("Method must be a non-empty string", id);
        }
        std::optional<JSONValue> params;
        if (const JSONValue* p = root.Find("params")) {
            if (!p->IsObject() && !p->IsArray()) {
                return invalid("Params must be an object or array", id);
            }
            params = *p;
        }
        if (members.count("result") != 0 || members.count("error") != 0) {
            return invalid("Request must not carry result or error", id);
        }
        const std::string& name = std::get<std::string>(method->value);
        if (!hasId) {
            return Envelope{JSONRPCNotification(name, std::move(params))};
        }
        if (std::holds_alternative<std::nullptr_t>(id)) {
            return invalid("Request id must be a string or integer");
        }
        return Envelope{JSONRPCRequest(id, name, std::move(params))};
    }

    // Response or error
    if (!hasId) {
        return invalid("Envelope has neither method nor id");
    }
    const bool hasResult = members.count("result") != 0;
    const bool hasError = members.count("error") != 0;
    if (hasResult == hasError) {
        return invalid("Response must carry exactly one of result or error", id);
    }
    JSONRPCResponse resp;
    resp.id = id;
    if (hasResult) {
        const JSONValue* r = root.Find("result");
        resp.result = r ? *r : JSONValue(nullptr);
    } else {
        const JSONValue* e = root.Find("error");
        if (e == nullptr || !isErrorObject(*e)) {
            return invalid("Error member must be an object with integer code and string message", id);
        }
        resp.error = *e;
    }
    if (!hasError && std::holds_alternative<std::nullptr_t>(id)) {
        return invalid("Successful response requires a non-null id");
    }
    return Envelope{std::move(resp)};
}

std::string EncodeEnvelope(const Envelope& envelope) {
    std::ostringstream oss;
    oss << "{\"jsonrpc\":\"2.0\"";
    std::visit([&oss](const auto& msg) {
        using T = std::decay_t<decltype(msg)>;
        if constexpr (std::is_same_v<T, JSONRPCRequest>) {
            oss << ",\"id\":";
            writeId(oss, msg.id);
            oss << ",\"method\":" << SerializeJSON(JSONValue(msg.method));
            if (msg.params.has_value()) {
                oss << ",\"params\":" << SerializeJSON(msg.params.value());
            }
        } else if constexpr (std::is_same_v<T, JSONRPCNotification>) {
            oss << ",\"method\":" << SerializeJSON(JSONValue(msg.method));
            if (msg.params.has_value()) {
                oss << ",\"params\":" << SerializeJSON(msg.params.value());
            }
        } else {
            oss << ",\"id\":";
            writeId(oss, msg.id);
            if (msg.error.has_value()) {
                oss << ",\"error\":" << SerializeJSON(msg.error.value());
            } else {
                oss << ",\"result\":" << SerializeJSON(msg.result.value_or(JSONValue(JSONValue::Object{})));
            }
        }
    }, envelope);
    oss << "}";
    return oss.str();
}

std::unique_ptr<JSONRPCResponse> MakeDecodeErrorResponse(const DecodeError& error) {
    return CreateErrorResponse(error.id, error.code, error.message);
}

} // namespace guidemcp
