//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: MethodDispatcher.h
// Purpose: JSON-RPC method routing with session-state gating, progress frames, and cancellation
//==========================================================================================================

#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <thread>
#include <unordered_map>
#include <variant>

#include "guidemcp/GuidelineProvider.h"
#include "guidemcp/JSONRPCTypes.h"
#include "guidemcp/Protocol.h"
#include "guidemcp/SessionManager.h"

namespace guidemcp {

// A frame of method output: zero or more progress notifications, then one terminal response.
using OutputFrame = std::variant<JSONRPCNotification, JSONRPCResponse>;

//==========================================================================================================
// FrameSource
// Purpose: Lazy, finite, non-restartable sequence of output frames for one request.
// Methods:
//   Next(timeout, out): Waits up to timeout for the next frame. A zero timeout never blocks.
//   Cancel(): Stops the method body; no further frames are produced afterwards.
//   SetNotify(fn): fn runs on the producing thread after each new frame and at the end of the
//                  sequence. It must not block. Cancel() drops it.
// Notes:
//   Destroying a source cancels it without waiting for the method body to return.
//==========================================================================================================
class FrameSource {
public:
    enum class Poll {
        Frame,    // out holds the next frame
        Timeout,  // nothing yet; the body is still running
        End       // sequence exhausted
    };

    virtual ~FrameSource() = default;
    virtual Poll Next(std::chrono::milliseconds timeout, std::optional<OutputFrame>& out) = 0;
    virtual void Cancel() = 0;
    virtual void SetNotify(std::function<void()> notify) = 0;
};

// Runs a streamed method body somewhere other than the caller's thread.
using BodyLauncher = std::function<void(std::function<void()>)>;

//==========================================================================================================
// RequestContext
// Purpose: What a method handler sees besides its params.
// Fields:
//   session: Session the request runs in (Initializing for initialize, Ready otherwise).
//   request: The request being served.
//   stop: Cancellation for the request.
//   progressToken: params._meta.progressToken when the client asked for progress.
//   emit: Sink for intermediate notifications; drops them in buffered mode.
//==========================================================================================================
struct RequestContext {
    std::shared_ptr<Session> session;
    const JSONRPCRequest* request{nullptr};
    std::stop_token stop;
    std::optional<JSONValue> progressToken;
    std::function<void(JSONRPCNotification)> emit;

    // Emits notifications/progress when a progress token is present and the request is live.
    void ReportProgress(double progress, std::optional<double> total, const std::string& message) const;
};

// Handler: returns the result value or throws errors::McpException / errors::GuidelineError.
using MethodHandler = std::function<JSONValue(const JSONValue& params, RequestContext& ctx)>;

// Predicate telling the negotiator whether a given call may emit more than one message.
using StreamPredicate = std::function<bool(const JSONRPCRequest&)>;

//==========================================================================================================
// MethodDispatcher
// Purpose: Routes decoded requests to registered handlers.
// Notes:
//   - initialize (and ping) are the only methods allowed while a session is Initializing.
//   - Closed or missing sessions fail with SessionNotFound.
//   - Collaborator exceptions never cross the JSON-RPC boundary unmapped.
//==========================================================================================================
class MethodDispatcher {
public:
    MethodDispatcher(SessionManager& sessions, IGuidelineProvider& provider,
                     Implementation serverInfo, std::string instructions = std::string());

    MethodDispatcher(const MethodDispatcher&) = delete;
    MethodDispatcher& operator=(const MethodDispatcher&) = delete;

    //======================================================================================================
    // Register
    // Purpose: Adds or replaces a method handler.
    // Args:
    //   method: JSON-RPC method name.
    //   handler: Method body.
    //   mayStream: Optional predicate; absent means the method always answers with one message.
    //======================================================================================================
    void Register(const std::string& method, MethodHandler handler, StreamPredicate mayStream = {});

    bool HasMethod(const std::string& method) const;

    // Dispatcher signal for the transport negotiator.
    bool MayStream(const JSONRPCRequest& request) const;

    //======================================================================================================
    // OpenSession
    // Purpose: Validates initialize params and creates a session in Initializing.
    // Throws:
    //   errors::McpException (InvalidParams on bad params, InternalError on capacity).
    //======================================================================================================
    std::shared_ptr<Session> OpenSession(const JSONRPCRequest& initializeRequest);

    //======================================================================================================
    // Dispatch
    // Purpose: Buffered execution. Progress is discarded and only the terminal response is returned.
    // Returns:
    //   Terminal response, or nullptr when the request was cancelled (no output is owed).
    //======================================================================================================
    std::unique_ptr<JSONRPCResponse> Dispatch(const std::shared_ptr<Session>& session,
                                              const JSONRPCRequest& request,
                                              std::stop_token stop = {});

    //======================================================================================================
    // Start
    // Purpose: Streamed execution. The method body runs through launch (a detached thread when
    //          empty) and its frames are pulled through the returned source in production order.
    // Notes:
    //   The dispatcher must outlive every body it started; dropping the source only cancels the body.
    //======================================================================================================
    std::unique_ptr<FrameSource> Start(const std::shared_ptr<Session>& session,
                                       const JSONRPCRequest& request,
                                       std::stop_token stop = {},
                                       BodyLauncher launch = {});

    // Handles a client notification in the context of a session (initialized, cancelled).
    void HandleNotification(const std::shared_ptr<Session>& session, const JSONRPCNotification& notification);

private:
    struct Entry {
        MethodHandler handler;
        StreamPredicate mayStream;
    };

    std::unique_ptr<JSONRPCResponse> run(const std::shared_ptr<Session>& session,
                                         const JSONRPCRequest& request,
                                         std::stop_token stop,
                                         std::function<void(JSONRPCNotification)> emit);
    std::unique_ptr<JSONRPCResponse> gate(const std::shared_ptr<Session>& session,
                                          const JSONRPCRequest& request) const;
    void registerBuiltins();

    JSONValue handleInitialize(const JSONValue& params, RequestContext& ctx);
    JSONValue handleToolsList(const JSONValue& params, RequestContext& ctx);
    JSONValue handleToolsCall(const JSONValue& params, RequestContext& ctx);
    JSONValue handleResourcesList(const JSONValue& params, RequestContext& ctx);
    JSONValue handleResourcesRead(const JSONValue& params, RequestContext& ctx);
    JSONValue serializeServerCapabilities() const;

    SessionManager& sessions_;
    IGuidelineProvider& provider_;
    Implementation serverInfo_;
    std::string instructions_;
    ServerCapabilities capabilities_;

    mutable std::mutex registryMutex_;
    std::unordered_map<std::string, Entry> methods_;
};

} // namespace guidemcp
