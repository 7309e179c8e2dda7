//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: GuidelineProvider.h
// Purpose: Contract between the method dispatcher and the guideline collaborator
//==========================================================================================================

#pragma once

#include <functional>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>

#include "guidemcp/Protocol.h"

namespace guidemcp {

//==========================================================================================================
// ToolCallContext
// Purpose: Per-call services handed to a collaborator tool body.
// Fields:
//   stop: Cooperative cancellation; set when the client disconnects or cancels the request.
//   progress: Reports incremental progress; a no-op unless the client asked for progress and the
//             exchange is streamed.
//==========================================================================================================
struct ToolCallContext {
    std::stop_token stop;
    std::function<void(double progress, std::optional<double> total, const std::string& message)> progress;

    void ReportProgress(double value, std::optional<double> total = std::nullopt,
                        const std::string& message = std::string()) const {
        if (progress) {
            progress(value, total, message);
        }
    }
};

//==========================================================================================================
// IGuidelineProvider
// Purpose: Guideline business logic behind tools/* and resources/*.
// Notes:
//   Implementations signal domain failures with errors::GuidelineError. Any other exception is
//   reported to the client as InternalError without its message.
//==========================================================================================================
class IGuidelineProvider {
public:
    virtual ~IGuidelineProvider() = default;

    virtual std::vector<Tool> ListTools() = 0;

    // True when the tool can emit progress before its result.
    virtual bool ToolMayStream(const std::string& name) const = 0;

    virtual CallToolResult CallTool(const std::string& name, const JSONValue& arguments,
                                    const ToolCallContext& ctx) = 0;

    virtual std::vector<Resource> ListResources() = 0;

    virtual ReadResourceResult ReadResource(const std::string& uri, std::stop_token stop) = 0;
};

} // namespace guidemcp
