//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/guidemcp/TransportNegotiator.cpp
// Purpose: Accept header parsing, response mode selection, and SSE framing
//==========================================================================================================

#include <algorithm>
#include <cctype>
#include <sstream>
#include <stdexcept>

#include "guidemcp/Protocol.h"
#include "guidemcp/TransportNegotiator.h"

namespace guidemcp {

namespace {

std::string_view trim(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
    return s;
}

std::string lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

// Quality factor of a media range; malformed q values count as 1.
double qualityOf(std::string_view params) {
    std::size_t pos = 0;
    while (pos < params.size()) {
        std::size_t semi = params.find(';', pos);
        std::string_view p = trim(params.substr(pos, semi == std::string_view::npos ? std::string_view::npos : semi - pos));
        if (p.size() > 2 && (p[0] == 'q' || p[0] == 'Q') && p[1] == '=') {
            try {
                return std::stod(std::string(p.substr(2)));
            } catch (const std::exception&) {
                return 1.0;
            }
        }
        if (semi == std::string_view::npos) break;
        pos = semi + 1;
    }
    return 1.0;
}

} // namespace

const char* ToString(ResponseMode mode) {
    return mode == ResponseMode::Streamed ? "streamed" : "buffered";
}

AcceptPreferences ParseAccept(std::string_view header) {
    AcceptPreferences prefs;
    std::size_t pos = 0;
    while (pos <= header.size()) {
        std::size_t comma = header.find(',', pos);
        std::string_view range = header.substr(pos, comma == std::string_view::npos ? std::string_view::npos : comma - pos);
        std::string_view params;
        std::size_t semi = range.find(';');
        if (semi != std::string_view::npos) {
            params = range.substr(semi + 1);
            range = range.substr(0, semi);
        }
        const std::string media = lower(trim(range));
        if (!media.empty() && qualityOf(params) > 0.0) {
            if (media == MediaTypes::Json) {
                prefs.json = true;
                prefs.explicitJson = true;
            } else if (media == MediaTypes::EventStream) {
                prefs.eventStream = true;
                prefs.explicitEventStream = true;
            } else if (media == "*/*") {
                prefs.json = true;
                prefs.eventStream = true;
            } else if (media == "application/*") {
                prefs.json = true;
            } else if (media == "text/*") {
                prefs.eventStream = true;
            }
        }
        if (comma == std::string_view::npos) break;
        pos = comma + 1;
    }
    return prefs;
}

NegotiationResult Negotiate(std::string_view acceptHeader, bool methodMayStream) {
    if (trim(acceptHeader).empty()) {
        return ResponseMode::Buffered;
    }
    const AcceptPreferences prefs = ParseAccept(acceptHeader);
    if (!prefs.json && !prefs.eventStream) {
        NegotiationFailure f;
        f.httpStatus = 406;
        f.reason = std::string("Accept must allow ") + MediaTypes::Json + " or " + MediaTypes::EventStream;
        return f;
    }
    if (prefs.json && !prefs.eventStream) {
        return ResponseMode::Buffered;
    }
    if (prefs.eventStream && !prefs.json) {
        return ResponseMode::Streamed;
    }
    if (prefs.explicitEventStream && methodMayStream) {
        return ResponseMode::Streamed;
    }
    return ResponseMode::Buffered;
}

bool IsJsonContentType(std::string_view contentType) {
    std::size_t semi = contentType.find(';');
    std::string media = lower(trim(contentType.substr(0, semi)));
    return media == MediaTypes::Json;
}

void StreamContext::SetMode(ResponseMode mode) {
    if (committed_.load() && mode != mode_) {
        throw std::logic_error("Response mode is immutable once the first byte has been flushed");
    }
    mode_ = mode;
}

const char* StreamContext::ContentType() const {
    return mode_ == ResponseMode::Streamed ? MediaTypes::EventStream : MediaTypes::Json;
}

std::string FormatSseEvent(const std::string& data, const std::optional<std::string>& eventId) {
    std::ostringstream oss;
    if (eventId.has_value()) {
        oss << "id: " << eventId.value() << "\n";
    }
    oss << "event: message\n";
    // Each payload line becomes its own data field.
    std::size_t start = 0;
    while (true) {
        std::size_t nl = data.find('\n', start);
        oss << "data: " << data.substr(start, nl == std::string::npos ? std::string::npos : nl - start) << "\n";
        if (nl == std::string::npos) break;
        start = nl + 1;
    }
    oss << "\n";
    return oss.str();
}

std::string FormatSseKeepalive() {
    return ": keepalive\n\n";
}

} // namespace guidemcp
