//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: TransportNegotiator.h
// Purpose: Accept/Content-Type negotiation and per-exchange stream context for the HTTP binding
//==========================================================================================================

#pragma once

#include <atomic>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <variant>

namespace guidemcp {

enum class ResponseMode {
    Buffered,  // single application/json body
    Streamed   // text/event-stream sequence of events
};

const char* ToString(ResponseMode mode);

//==========================================================================================================
// AcceptPreferences
// Purpose: What an Accept header admits, after q-value filtering.
// Fields:
//   json: application/json (or application/*) acceptable.
//   eventStream: text/event-stream (or text/*) acceptable.
//   explicitJson/explicitEventStream: the exact media type was named (not just a wildcard).
//==========================================================================================================
struct AcceptPreferences {
    bool json{false};
    bool eventStream{false};
    bool explicitJson{false};
    bool explicitEventStream{false};
};

AcceptPreferences ParseAccept(std::string_view header);

//==========================================================================================================
// NegotiationFailure
// Purpose: Pre-envelope rejection reported as an HTTP status.
//==========================================================================================================
struct NegotiationFailure {
    unsigned int httpStatus{406};
    std::string reason;
};

using NegotiationResult = std::variant<ResponseMode, NegotiationFailure>;

//==========================================================================================================
// Negotiate
// Purpose: Chooses the response mode for one exchange.
// Args:
//   acceptHeader: Raw Accept header; empty when absent.
//   methodMayStream: Dispatcher signal that the method can emit incremental messages.
// Returns:
//   ResponseMode, or NegotiationFailure (406) when neither supported media type is acceptable.
// Notes:
//   Absent or wildcard-only headers are ambiguous and select Buffered. When both types are named the
//   stream is chosen only for methods that may stream.
//==========================================================================================================
NegotiationResult Negotiate(std::string_view acceptHeader, bool methodMayStream);

// True when the Content-Type names application/json (parameters such as charset are allowed).
bool IsJsonContentType(std::string_view contentType);

//==========================================================================================================
// StreamContext
// Purpose: Per-exchange output state owned by the HTTP layer for the duration of one request.
// Notes:
//   The mode may change until Commit() is called (first byte flushed); afterwards SetMode throws
//   std::logic_error. Cancel() requests stop on the token handed to the method body.
//==========================================================================================================
class StreamContext {
public:
    explicit StreamContext(ResponseMode mode) : mode_(mode) {}

    ResponseMode Mode() const { return mode_; }
    void SetMode(ResponseMode mode);

    void Commit() { committed_.store(true); }
    bool IsCommitted() const { return committed_.load(); }

    std::stop_token Token() const { return stop_.get_token(); }
    void Cancel() { stop_.request_stop(); }
    bool IsCancelled() const { return stop_.stop_requested(); }

    // Content-Type to send for the selected mode.
    const char* ContentType() const;

private:
    ResponseMode mode_;
    std::atomic<bool> committed_{false};
    std::stop_source stop_;
};

// Formats one server-sent event carrying a JSON-RPC message.
std::string FormatSseEvent(const std::string& data, const std::optional<std::string>& eventId = std::nullopt);

// SSE comment line used as a keepalive while a method body is silent.
std::string FormatSseKeepalive();

} // namespace guidemcp
