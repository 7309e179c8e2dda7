//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/guidemcp/MethodDispatcher.cpp
// Purpose: JSON-RPC method routing with session-state gating, progress frames, and cancellation
//==========================================================================================================

#include <algorithm>
#include <charconv>

#include "guidemcp/MethodDispatcher.h"
#include "guidemcp/errors/Errors.h"
#include "logging/Logger.h"

namespace guidemcp {

namespace {

// In-flight key for a request id; string "1" and integer 1 are different requests.
std::string requestKey(const JSONRPCId& id) {
    if (std::holds_alternative<std::string>(id)) {
        return "s:" + std::get<std::string>(id);
    }
    if (std::holds_alternative<int64_t>(id)) {
        return "i:" + std::to_string(std::get<int64_t>(id));
    }
    return "null";
}

const JSONValue::Object& requireObjectParams(const JSONValue& params, const std::string& method) {
    if (!params.IsObject()) {
        throw errors::McpException(JSONRPCErrorCodes::InvalidParams, method + " params must be an object");
    }
    return std::get<JSONValue::Object>(params.value);
}

std::optional<std::string> optionalString(const JSONValue& params, const std::string& key, const std::string& method) {
    const JSONValue* v = params.Find(key);
    if (v == nullptr) {
        return std::nullopt;
    }
    if (!v->IsString()) {
        throw errors::McpException(JSONRPCErrorCodes::InvalidParams, method + ": '" + key + "' must be a string");
    }
    return std::get<std::string>(v->value);
}

std::string requireString(const JSONValue& params, const std::string& key, const std::string& method) {
    auto s = optionalString(params, key, method);
    if (!s.has_value()) {
        throw errors::McpException(JSONRPCErrorCodes::InvalidParams, method + ": missing '" + key + "'");
    }
    return s.value();
}

std::optional<JSONValue> extractProgressToken(const std::optional<JSONValue>& params) {
    if (!params.has_value()) {
        return std::nullopt;
    }
    const JSONValue* meta = params->Find("_meta");
    if (meta == nullptr) {
        return std::nullopt;
    }
    const JSONValue* token = meta->Find("progressToken");
    if (token == nullptr) {
        return std::nullopt;
    }
    if (!token->IsString() && !std::holds_alternative<int64_t>(token->value)) {
        return std::nullopt;
    }
    return *token;
}

// Cursor is the stringified start index of the next page, as produced in nextCursor.
void parsePagingParams(const JSONValue& params, const std::string& method,
                       std::size_t& start, std::optional<std::size_t>& limitOpt) {
    start = 0;
    limitOpt.reset();
    if (!params.IsObject()) {
        return;
    }
    if (auto cursor = optionalString(params, "cursor", method)) {
        const std::string& c = cursor.value();
        auto [ptr, ec] = std::from_chars(c.data(), c.data() + c.size(), start);
        if (ec != std::errc() || ptr != c.data() + c.size()) {
            throw errors::McpException(JSONRPCErrorCodes::InvalidParams, method + ": invalid cursor");
        }
    }
    if (const JSONValue* lim = params.Find("limit")) {
        if (!std::holds_alternative<int64_t>(lim->value) || std::get<int64_t>(lim->value) <= 0) {
            throw errors::McpException(JSONRPCErrorCodes::InvalidParams, method + ": 'limit' must be a positive integer");
        }
        limitOpt = static_cast<std::size_t>(std::get<int64_t>(lim->value));
    }
}

void attachNextCursor(JSONValue::Object& resultObj, std::size_t end, std::size_t total,
                      const std::optional<std::size_t>& limitOpt) {
    if (limitOpt.has_value() && end < total) {
        resultObj["nextCursor"] = std::make_shared<JSONValue>(std::to_string(end));
    }
}

JSONValue::Object makeToolObj(const Tool& t) {
    JSONValue::Object to;
    to["name"] = std::make_shared<JSONValue>(t.name);
    to["description"] = std::make_shared<JSONValue>(t.description);
    // An empty schema still advertises an object-typed input.
    if (t.inputSchema.IsObject()) {
        to["inputSchema"] = std::make_shared<JSONValue>(t.inputSchema);
    } else {
        JSONValue::Object schema;
        schema["type"] = std::make_shared<JSONValue>("object");
        to["inputSchema"] = std::make_shared<JSONValue>(std::move(schema));
    }
    return to;
}

JSONValue::Object makeResourceObj(const Resource& r) {
    JSONValue::Object ro;
    ro["uri"] = std::make_shared<JSONValue>(r.uri);
    ro["name"] = std::make_shared<JSONValue>(r.name);
    if (r.description.has_value()) ro["description"] = std::make_shared<JSONValue>(r.description.value());
    if (r.mimeType.has_value()) ro["mimeType"] = std::make_shared<JSONValue>(r.mimeType.value());
    return ro;
}

//==========================================================================================================
// FrameQueue
// Purpose: Frames shared between a method body and the reader of its output. Either side may go
//          away first.
//==========================================================================================================
class FrameQueue {
public:
    void Push(OutputFrame frame) {
        std::function<void()> notify;
        {
            std::lock_guard<std::mutex> lk(mutex_);
            if (cancelled_ || finished_) {
                return;
            }
            frames_.push_back(std::move(frame));
            notify = notify_;
        }
        cv_.notify_all();
        if (notify) {
            notify();
        }
    }

    void Finish() {
        std::function<void()> notify;
        {
            std::lock_guard<std::mutex> lk(mutex_);
            finished_ = true;
            notify = notify_;
        }
        cv_.notify_all();
        if (notify) {
            notify();
        }
    }

    FrameSource::Poll Next(std::chrono::milliseconds timeout, std::optional<OutputFrame>& out) {
        std::unique_lock<std::mutex> lk(mutex_);
        if (timeout.count() > 0) {
            cv_.wait_for(lk, timeout, [this]() { return !frames_.empty() || finished_; });
        }
        if (!frames_.empty()) {
            out.emplace(std::move(frames_.front()));
            frames_.pop_front();
            return FrameSource::Poll::Frame;
        }
        return finished_ ? FrameSource::Poll::End : FrameSource::Poll::Timeout;
    }

    void Cancel() {
        {
            std::lock_guard<std::mutex> lk(mutex_);
            cancelled_ = true;
            frames_.clear();
            notify_ = nullptr;
        }
        stop_.request_stop();
        cv_.notify_all();
    }

    void SetNotify(std::function<void()> notify) {
        std::lock_guard<std::mutex> lk(mutex_);
        if (!cancelled_) {
            notify_ = std::move(notify);
        }
    }

    std::stop_token Token() const { return stop_.get_token(); }

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<OutputFrame> frames_;
    std::function<void()> notify_;
    bool cancelled_{false};
    bool finished_{false};
    std::stop_source stop_;
};

//==========================================================================================================
// QueuedFrameSource
// Purpose: Reader handle on a FrameQueue. Dropping the handle cancels the body and leaves it to
//          finish on whatever thread runs it.
//==========================================================================================================
class QueuedFrameSource : public FrameSource {
public:
    explicit QueuedFrameSource(std::shared_ptr<FrameQueue> queue) : queue_(std::move(queue)) {}

    ~QueuedFrameSource() override { queue_->Cancel(); }

    Poll Next(std::chrono::milliseconds timeout, std::optional<OutputFrame>& out) override {
        return queue_->Next(timeout, out);
    }

    void Cancel() override { queue_->Cancel(); }

    void SetNotify(std::function<void()> notify) override { queue_->SetNotify(std::move(notify)); }

private:
    std::shared_ptr<FrameQueue> queue_;
};

} // namespace

void RequestContext::ReportProgress(double progress, std::optional<double> total, const std::string& message) const {
    if (!emit || !progressToken.has_value() || stop.stop_requested()) {
        return;
    }
    JSONValue::Object p;
    p["progressToken"] = std::make_shared<JSONValue>(progressToken.value());
    p["progress"] = std::make_shared<JSONValue>(progress);
    if (total.has_value()) {
        p["total"] = std::make_shared<JSONValue>(total.value());
    }
    if (!message.empty()) {
        p["message"] = std::make_shared<JSONValue>(message);
    }
    emit(JSONRPCNotification(Methods::Progress, JSONValue(std::move(p))));
}

MethodDispatcher::MethodDispatcher(SessionManager& sessions, IGuidelineProvider& provider,
                                   Implementation serverInfo, std::string instructions)
    : sessions_(sessions),
      provider_(provider),
      serverInfo_(std::move(serverInfo)),
      instructions_(std::move(instructions)) {
    capabilities_.tools = ToolsCapability{};
    capabilities_.resources = ResourcesCapability{};
    registerBuiltins();
}

void MethodDispatcher::Register(const std::string& method, MethodHandler handler, StreamPredicate mayStream) {
    std::lock_guard<std::mutex> lk(registryMutex_);
    methods_[method] = Entry{std::move(handler), std::move(mayStream)};
}

bool MethodDispatcher::HasMethod(const std::string& method) const {
    std::lock_guard<std::mutex> lk(registryMutex_);
    return methods_.find(method) != methods_.end();
}

bool MethodDispatcher::MayStream(const JSONRPCRequest& request) const {
    StreamPredicate pred;
    {
        std::lock_guard<std::mutex> lk(registryMutex_);
        auto it = methods_.find(request.method);
        if (it == methods_.end()) {
            return false;
        }
        pred = it->second.mayStream;
    }
    return pred ? pred(request) : false;
}

void MethodDispatcher::registerBuiltins() {
    Register(Methods::Initialize,
             [this](const JSONValue& params, RequestContext& ctx) { return handleInitialize(params, ctx); });
    Register(Methods::Ping,
             [](const JSONValue&, RequestContext&) { return JSONValue(JSONValue::Object{}); });
    Register(Methods::ListTools,
             [this](const JSONValue& params, RequestContext& ctx) { return handleToolsList(params, ctx); });
    Register(Methods::CallTool,
             [this](const JSONValue& params, RequestContext& ctx) { return handleToolsCall(params, ctx); },
             [this](const JSONRPCRequest& req) {
                 if (!req.params.has_value()) {
                     return false;
                 }
                 const JSONValue* name = req.params->Find("name");
                 return name != nullptr && name->IsString() && provider_.ToolMayStream(std::get<std::string>(name->value));
             });
    Register(Methods::ListResources,
             [this](const JSONValue& params, RequestContext& ctx) { return handleResourcesList(params, ctx); });
    Register(Methods::ReadResource,
             [this](const JSONValue& params, RequestContext& ctx) { return handleResourcesRead(params, ctx); });
}

std::shared_ptr<Session> MethodDispatcher::OpenSession(const JSONRPCRequest& initializeRequest) {
    const std::string method = Methods::Initialize;
    if (!initializeRequest.params.has_value()) {
        throw errors::McpException(JSONRPCErrorCodes::InvalidParams, "initialize requires params");
    }
    const JSONValue& params = initializeRequest.params.value();
    requireObjectParams(params, method);
    const std::string requestedVersion = requireString(params, "protocolVersion", method);

    Implementation clientInfo("unknown", "");
    if (const JSONValue* ci = params.Find("clientInfo")) {
        if (!ci->IsObject()) {
            throw errors::McpException(JSONRPCErrorCodes::InvalidParams, "initialize: 'clientInfo' must be an object");
        }
        clientInfo.name = requireString(*ci, "name", method);
        clientInfo.version = optionalString(*ci, "version", method).value_or("");
    }

    CapabilitySet caps;
    if (const JSONValue* c = params.Find("capabilities")) {
        if (!c->IsObject()) {
            throw errors::McpException(JSONRPCErrorCodes::InvalidParams, "initialize: 'capabilities' must be an object");
        }
        for (const auto& [name, value] : std::get<JSONValue::Object>(c->value)) {
            caps[name] = value ? *value : JSONValue();
        }
    }

    return sessions_.CreateSession(clientInfo, std::move(caps), requestedVersion);
}

std::unique_ptr<JSONRPCResponse> MethodDispatcher::gate(const std::shared_ptr<Session>& session,
                                                        const JSONRPCRequest& request) const {
    if (!session) {
        return CreateErrorResponse(request.id, JSONRPCErrorCodes::SessionNotFound, "Session not found");
    }
    switch (session->State()) {
        case SessionState::Closed:
        case SessionState::Uninitialized:
            return CreateErrorResponse(request.id, JSONRPCErrorCodes::SessionNotFound, "Session not found");
        case SessionState::Initializing:
            if (request.method != Methods::Initialize && request.method != Methods::Ping) {
                return CreateErrorResponse(request.id, JSONRPCErrorCodes::InvalidRequest, "Session is not initialized");
            }
            break;
        case SessionState::Ready:
            if (request.method == Methods::Initialize) {
                return CreateErrorResponse(request.id, JSONRPCErrorCodes::InvalidRequest, "Session is already initialized");
            }
            break;
    }
    return nullptr;
}

std::unique_ptr<JSONRPCResponse> MethodDispatcher::run(const std::shared_ptr<Session>& session,
                                                       const JSONRPCRequest& request,
                                                       std::stop_token stop,
                                                       std::function<void(JSONRPCNotification)> emit) {
    if (auto rejected = gate(session, request)) {
        LOG_DEBUG("Rejected {} (code {})", request.method, rejected->ErrorCode());
        return rejected;
    }

    Entry entry;
    {
        std::lock_guard<std::mutex> lk(registryMutex_);
        auto it = methods_.find(request.method);
        if (it == methods_.end()) {
            LOG_DEBUG("Method not found: {}", request.method);
            return CreateErrorResponse(request.id, JSONRPCErrorCodes::MethodNotFound,
                                       "Method not found: " + request.method);
        }
        entry = it->second;
    }

    const std::string key = requestKey(request.id);
    auto requestStop = session->BeginRequest(key);
    if (!requestStop) {
        if (session->State() == SessionState::Closed) {
            return CreateErrorResponse(request.id, JSONRPCErrorCodes::SessionNotFound, "Session not found");
        }
        return CreateErrorResponse(request.id, JSONRPCErrorCodes::InvalidRequest,
                                   "Request id " + IdToString(request.id) + " is already in flight");
    }
    struct ScopeGuard { std::function<void()> f; ~ScopeGuard() { if (f) f(); } } guard{
        [session, key]() { session->EndRequest(key); }};

    // Caller-side stop (client disconnect) cancels the request in its session.
    std::stop_callback onCallerStop(stop, [session, key]() { session->CancelRequest(key); });

    RequestContext ctx;
    ctx.session = session;
    ctx.request = &request;
    ctx.stop = requestStop->get_token();
    ctx.progressToken = extractProgressToken(request.params);
    ctx.emit = std::move(emit);

    std::unique_ptr<JSONRPCResponse> response;
    if (!ctx.stop.stop_requested()) {
        const JSONValue params = request.params.has_value() ? request.params.value() : JSONValue(JSONValue::Object{});
        try {
            JSONValue result = entry.handler(params, ctx);
            response = std::make_unique<JSONRPCResponse>(request.id, std::move(result));
        } catch (const errors::McpException& e) {
            response = errors::makeErrorResponse(request.id, e.error());
        } catch (const errors::GuidelineError& e) {
            LOG_WARN("Guideline error in {}: {}", request.method, e.what());
            response = errors::makeErrorResponse(request.id, errors::fromGuidelineError(e));
        } catch (const std::exception& e) {
            LOG_ERROR("Unhandled exception in {} (session {}): {}", request.method, session->Id(), e.what());
            response = CreateErrorResponse(request.id, JSONRPCErrorCodes::InternalError, "Internal error");
        }
    }

    // A closed session marks everything cancelled; its requests still get their answer.
    if (session->IsCancelled(key) && session->State() != SessionState::Closed) {
        LOG_INFO("Request {} in session {} cancelled; suppressing output", IdToString(request.id), session->Id());
        return nullptr;
    }
    if (!response) {
        LOG_INFO("Request {} in session {} stopped before dispatch", IdToString(request.id), session->Id());
    }
    return response;
}

std::unique_ptr<JSONRPCResponse> MethodDispatcher::Dispatch(const std::shared_ptr<Session>& session,
                                                            const JSONRPCRequest& request,
                                                            std::stop_token stop) {
    return run(session, request, std::move(stop), {});
}

std::unique_ptr<FrameSource> MethodDispatcher::Start(const std::shared_ptr<Session>& session,
                                                     const JSONRPCRequest& request,
                                                     std::stop_token stop,
                                                     BodyLauncher launch) {
    auto queue = std::make_shared<FrameQueue>();
    auto body = [this, queue, session, request, stop]() {
        std::stop_callback onCallerStop(stop, [queue]() { queue->Cancel(); });
        try {
            auto response = run(session, request, queue->Token(),
                                [queue](JSONRPCNotification note) { queue->Push(OutputFrame(std::move(note))); });
            if (response) {
                queue->Push(OutputFrame(std::move(*response)));
            }
        } catch (const std::exception& e) {
            LOG_ERROR("Streamed {} failed: {}", request.method, e.what());
            queue->Push(OutputFrame(std::move(*CreateErrorResponse(request.id, JSONRPCErrorCodes::InternalError, "Internal error"))));
        }
        queue->Finish();
    };
    if (launch) {
        launch(std::move(body));
    } else {
        std::thread(std::move(body)).detach();
    }
    return std::make_unique<QueuedFrameSource>(std::move(queue));
}

void MethodDispatcher::HandleNotification(const std::shared_ptr<Session>& session, const JSONRPCNotification& notification) {
    if (!session) {
        LOG_DEBUG("Dropping {} without a session", notification.method);
        return;
    }
    if (notification.method == Methods::Initialized) {
        LOG_DEBUG("Session {}: client acknowledged initialize", session->Id());
        return;
    }
    if (notification.method == Methods::Cancelled) {
        const JSONValue* requestId = notification.params.has_value() ? notification.params->Find("requestId") : nullptr;
        if (requestId == nullptr) {
            LOG_WARN("Session {}: {} without requestId", session->Id(), Methods::Cancelled);
            return;
        }
        JSONRPCId id;
        if (requestId->IsString()) {
            id = std::get<std::string>(requestId->value);
        } else if (std::holds_alternative<int64_t>(requestId->value)) {
            id = std::get<int64_t>(requestId->value);
        } else {
            LOG_WARN("Session {}: {} with a non string/integer requestId", session->Id(), Methods::Cancelled);
            return;
        }
        std::string reason;
        if (const JSONValue* r = notification.params->Find("reason"); r != nullptr && r->IsString()) {
            reason = std::get<std::string>(r->value);
        }
        if (session->CancelRequest(requestKey(id))) {
            LOG_INFO("Session {}: request {} cancelled by client{}{}", session->Id(), IdToString(id),
                     reason.empty() ? "" : ": ", reason);
        } else {
            LOG_DEBUG("Session {}: cancel for request {} that is not in flight", session->Id(), IdToString(id));
        }
        return;
    }
    LOG_DEBUG("Session {}: ignoring notification {}", session->Id(), notification.method);
}

///////////////////////////////////////// Built-in handlers ///////////////////////////////////////////

JSONValue MethodDispatcher::serializeServerCapabilities() const {
    JSONValue::Object caps;

    if (!capabilities_.experimental.empty()) {
        JSONValue::Object experimentalObj;
        for (const auto& [key, val] : capabilities_.experimental) {
            experimentalObj[key] = std::make_shared<JSONValue>(val);
        }
        caps["experimental"] = std::make_shared<JSONValue>(experimentalObj);
    }

    if (capabilities_.resources.has_value()) {
        JSONValue::Object resourcesObj;
        resourcesObj["subscribe"] = std::make_shared<JSONValue>(capabilities_.resources->subscribe);
        resourcesObj["listChanged"] = std::make_shared<JSONValue>(capabilities_.resources->listChanged);
        caps["resources"] = std::make_shared<JSONValue>(resourcesObj);
    }

    if (capabilities_.tools.has_value()) {
        JSONValue::Object toolsObj;
        toolsObj["listChanged"] = std::make_shared<JSONValue>(capabilities_.tools->listChanged);
        caps["tools"] = std::make_shared<JSONValue>(toolsObj);
    }

    return JSONValue(caps);
}

JSONValue MethodDispatcher::handleInitialize(const JSONValue&, RequestContext& ctx) {
    const std::string version = sessions_.CompleteInitialize(*ctx.session);

    JSONValue::Object resultObj;
    resultObj["protocolVersion"] = std::make_shared<JSONValue>(version);
    resultObj["capabilities"] = std::make_shared<JSONValue>(serializeServerCapabilities());
    JSONValue::Object serverInfoObj;
    serverInfoObj["name"] = std::make_shared<JSONValue>(serverInfo_.name);
    serverInfoObj["version"] = std::make_shared<JSONValue>(serverInfo_.version);
    resultObj["serverInfo"] = std::make_shared<JSONValue>(serverInfoObj);
    if (!instructions_.empty()) {
        resultObj["instructions"] = std::make_shared<JSONValue>(instructions_);
    }
    return JSONValue(resultObj);
}

JSONValue MethodDispatcher::handleToolsList(const JSONValue& params, RequestContext&) {
    LOG_DEBUG("Handling tools/list request");
    std::size_t start = 0;
    std::optional<std::size_t> limitOpt;
    parsePagingParams(params, Methods::ListTools, start, limitOpt);

    std::vector<Tool> tools = provider_.ListTools();
    std::sort(tools.begin(), tools.end(), [](const Tool& a, const Tool& b) { return a.name < b.name; });
    const std::size_t total = tools.size();
    if (start > total) start = total;
    const std::size_t end = limitOpt.has_value() ? std::min(total, start + limitOpt.value()) : total;

    JSONValue::Object resultObj;
    JSONValue::Array arr;
    for (std::size_t i = start; i < end; ++i) {
        arr.push_back(std::make_shared<JSONValue>(makeToolObj(tools[i])));
    }
    resultObj["tools"] = std::make_shared<JSONValue>(arr);
    attachNextCursor(resultObj, end, total, limitOpt);
    return JSONValue(resultObj);
}

JSONValue MethodDispatcher::handleToolsCall(const JSONValue& params, RequestContext& ctx) {
    requireObjectParams(params, Methods::CallTool);
    const std::string name = requireString(params, "name", Methods::CallTool);
    JSONValue arguments{JSONValue::Object{}};
    if (const JSONValue* a = params.Find("arguments")) {
        if (!a->IsObject()) {
            throw errors::McpException(JSONRPCErrorCodes::InvalidParams, "tools/call: 'arguments' must be an object");
        }
        arguments = *a;
    }
    LOG_DEBUG("Handling tools/call request: {}", name);

    ToolCallContext toolCtx;
    toolCtx.stop = ctx.stop;
    toolCtx.progress = [&ctx](double progress, std::optional<double> total, const std::string& message) {
        ctx.ReportProgress(progress, total, message);
    };
    CallToolResult result = provider_.CallTool(name, arguments, toolCtx);

    JSONValue::Object resultObj;
    JSONValue::Array contentArray;
    for (const auto& item : result.content) {
        contentArray.push_back(std::make_shared<JSONValue>(item));
    }
    resultObj["content"] = std::make_shared<JSONValue>(contentArray);
    resultObj["isError"] = std::make_shared<JSONValue>(result.isError);
    return JSONValue(resultObj);
}

JSONValue MethodDispatcher::handleResourcesList(const JSONValue& params, RequestContext&) {
    LOG_DEBUG("Handling resources/list request");
    std::size_t start = 0;
    std::optional<std::size_t> limitOpt;
    parsePagingParams(params, Methods::ListResources, start, limitOpt);

    std::vector<Resource> resources = provider_.ListResources();
    std::sort(resources.begin(), resources.end(), [](const Resource& a, const Resource& b) { return a.uri < b.uri; });
    const std::size_t total = resources.size();
    if (start > total) start = total;
    const std::size_t end = limitOpt.has_value() ? std::min(total, start + limitOpt.value()) : total;

    JSONValue::Object resultObj;
    JSONValue::Array arr;
    for (std::size_t i = start; i < end; ++i) {
        arr.push_back(std::make_shared<JSONValue>(makeResourceObj(resources[i])));
    }
    resultObj["resources"] = std::make_shared<JSONValue>(arr);
    attachNextCursor(resultObj, end, total, limitOpt);
    return JSONValue(resultObj);
}

JSONValue MethodDispatcher::handleResourcesRead(const JSONValue& params, RequestContext& ctx) {
    requireObjectParams(params, Methods::ReadResource);
    const std::string uri = requireString(params, "uri", Methods::ReadResource);
    LOG_DEBUG("Handling resources/read request: {}", uri);

    ReadResourceResult result = provider_.ReadResource(uri, ctx.stop);

    JSONValue::Object resultObj;
    JSONValue::Array contentsArray;
    for (const auto& item : result.contents) {
        contentsArray.push_back(std::make_shared<JSONValue>(item));
    }
    resultObj["contents"] = std::make_shared<JSONValue>(contentsArray);
    return JSONValue(resultObj);
}

} // namespace guidemcp
