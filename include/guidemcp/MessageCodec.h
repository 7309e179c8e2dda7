//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: MessageCodec.h
// Purpose: Strict JSON-RPC 2.0 envelope decoding and deterministic encoding
//==========================================================================================================

#pragma once

#include <string>
#include <variant>

#include "guidemcp/JSONRPCTypes.h"

namespace guidemcp {

//==========================================================================================================
// Envelope
// Purpose: Discriminated union of the JSON-RPC message shapes. An Error envelope is a
//          JSONRPCResponse whose error member is set.
//==========================================================================================================
using Envelope = std::variant<JSONRPCRequest, JSONRPCNotification, JSONRPCResponse>;

enum class EnvelopeKind {
    Request,
    Notification,
    Response,
    Error
};

EnvelopeKind KindOf(const Envelope& envelope);
const char* ToString(EnvelopeKind kind);

//==========================================================================================================
// DecodeError
// Purpose: Failure produced by DecodeEnvelope.
// Fields:
//   code: JSONRPCErrorCodes::ParseError or JSONRPCErrorCodes::InvalidRequest.
//   message: Human-readable reason.
//   id: Request id when it could be recovered from the malformed envelope, else null.
//==========================================================================================================
struct DecodeError {
    int code{JSONRPCErrorCodes::ParseError};
    std::string message;
    JSONRPCId id{nullptr};
};

using DecodeResult = std::variant<Envelope, DecodeError>;

//==========================================================================================================
// DecodeEnvelope
// Purpose: Parses a single JSON-RPC 2.0 envelope. Malformed JSON yields -32700; anything that is
//          valid JSON but not a well-formed envelope (batches included) yields -32600.
// Args:
//   bytes: Raw HTTP body.
// Returns:
//   Envelope on success, DecodeError otherwise. Never throws for malformed input.
//==========================================================================================================
DecodeResult DecodeEnvelope(const std::string& bytes);

//==========================================================================================================
// EncodeEnvelope
// Purpose: Serializes an envelope. Output is deterministic and DecodeEnvelope(EncodeEnvelope(e)) == e.
//==========================================================================================================
std::string EncodeEnvelope(const Envelope& envelope);

// Builds the error response that corresponds to a decode failure.
std::unique_ptr<JSONRPCResponse> MakeDecodeErrorResponse(const DecodeError& error);

} // namespace guidemcp
