//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_method_dispatcher.cpp
// Purpose: GoogleTests for lifecycle gating, built-in methods, error mapping, streaming and cancellation
//==========================================================================================================

#include <gtest/gtest.h>
#include <atomic>
#include <future>
#include <thread>

#include "guidemcp/MethodDispatcher.h"
#include "guidemcp/SessionManager.h"
#include "guidemcp/errors/Errors.h"

using namespace guidemcp;

namespace {

//==========================================================================================================
// Scripted provider:
//   echo          returns its "text" argument
//   slow          emits three progress reports, then waits for cancellation or release
//   broken        throws std::runtime_error
//   reject        throws GuidelineError(InvalidArguments)
//==========================================================================================================
class FakeProvider : public IGuidelineProvider {
public:
    std::atomic<bool> slowStarted{false};
    std::atomic<bool> slowSawStop{false};
    std::promise<void> release;
    std::shared_future<void> released{release.get_future().share()};

    std::vector<Tool> ListTools() override {
        return {Tool{"slow", "Reports progress"}, Tool{"echo", "Echoes text"}, Tool{"broken", "Always fails"}};
    }

    bool ToolMayStream(const std::string& name) const override { return name == "slow"; }

    CallToolResult CallTool(const std::string& name, const JSONValue& arguments, const ToolCallContext& ctx) override {
        if (name == "echo") {
            const JSONValue* text = arguments.Find("text");
            CallToolResult r;
            r.content.push_back(MakeTextContent(text && text->IsString() ? std::get<std::string>(text->value) : ""));
            return r;
        }
        if (name == "slow") {
            for (int i = 1; i <= 3; ++i) {
                ctx.ReportProgress(static_cast<double>(i), 3.0, "step " + std::to_string(i));
            }
            slowStarted.store(true);
            while (!ctx.stop.stop_requested()) {
                if (released.wait_for(std::chrono::milliseconds(5)) == std::future_status::ready) {
                    CallToolResult r;
                    r.content.push_back(MakeTextContent("done"));
                    return r;
                }
            }
            slowSawStop.store(true);
            CallToolResult r;
            r.isError = true;
            r.content.push_back(MakeTextContent("Cancelled"));
            return r;
        }
        if (name == "broken") {
            throw std::runtime_error("secret internal detail");
        }
        if (name == "reject") {
            throw errors::GuidelineError(errors::GuidelineError::Kind::InvalidArguments, "bad arguments");
        }
        throw errors::GuidelineError(errors::GuidelineError::Kind::UnknownTool, "Unknown tool: " + name);
    }

    std::vector<Resource> ListResources() override {
        return {Resource{"test://b", "b"}, Resource{"test://a", "a", std::string("first"), std::string("text/plain")}};
    }

    ReadResourceResult ReadResource(const std::string& uri, std::stop_token) override {
        if (uri != "test://a") {
            throw errors::GuidelineError(errors::GuidelineError::Kind::ResourceNotFound, "Unknown resource: " + uri);
        }
        ReadResourceResult r;
        r.contents.push_back(MakeTextResourceContents(uri, "text/plain", "alpha"));
        return r;
    }
};

JSONValue obj(std::initializer_list<std::pair<const char*, JSONValue>> members) {
    JSONValue::Object o;
    for (const auto& [k, v] : members) {
        o[k] = std::make_shared<JSONValue>(v);
    }
    return JSONValue(std::move(o));
}

JSONRPCRequest makeRequest(int64_t id, const std::string& method, std::optional<JSONValue> params = std::nullopt) {
    return JSONRPCRequest(JSONRPCId(id), method, std::move(params));
}

JSONValue initParams(const std::string& version = "2025-06-18") {
    return obj({{"protocolVersion", JSONValue(version)},
                {"capabilities", JSONValue(JSONValue::Object{})},
                {"clientInfo", obj({{"name", JSONValue("tester")}, {"version", JSONValue("1.0")}})}});
}

const JSONValue& resultMember(const JSONRPCResponse& resp, const std::string& key) {
    static const JSONValue kNull;
    if (!resp.result.has_value()) return kNull;
    const JSONValue* v = resp.result->Find(key);
    return v ? *v : kNull;
}

class MethodDispatcherTest : public ::testing::Test {
protected:
    MethodDispatcherTest()
        : sessions(SessionConfig{}),
          dispatcher(sessions, provider, Implementation{"nccn-guidelines", "1.0.0"}, "hello") {}

    std::shared_ptr<Session> readySession() {
        auto init = makeRequest(1, Methods::Initialize, initParams());
        auto s = dispatcher.OpenSession(init);
        auto resp = dispatcher.Dispatch(s, init);
        EXPECT_TRUE(resp != nullptr);
        EXPECT_FALSE(resp->IsError());
        return s;
    }

    FakeProvider provider;
    SessionManager sessions;
    MethodDispatcher dispatcher;
};

std::vector<OutputFrame> drain(FrameSource& source) {
    std::vector<OutputFrame> frames;
    std::optional<OutputFrame> f;
    for (int i = 0; i < 500; ++i) {
        f.reset();
        auto poll = source.Next(std::chrono::milliseconds(20), f);
        if (poll == FrameSource::Poll::End) break;
        if (poll == FrameSource::Poll::Frame) frames.push_back(std::move(f.value()));
    }
    return frames;
}

} // namespace

TEST_F(MethodDispatcherTest, InitializeNegotiatesVersionAndAdvertisesCapabilities) {
    auto init = makeRequest(1, Methods::Initialize, initParams("2025-03-26"));
    auto session = dispatcher.OpenSession(init);
    ASSERT_TRUE(session != nullptr);
    EXPECT_EQ(session->State(), SessionState::Initializing);

    auto resp = dispatcher.Dispatch(session, init);
    ASSERT_TRUE(resp != nullptr);
    ASSERT_FALSE(resp->IsError());
    EXPECT_EQ(std::get<std::string>(resultMember(*resp, "protocolVersion").value), "2025-03-26");
    const JSONValue& caps = resultMember(*resp, "capabilities");
    EXPECT_NE(caps.Find("tools"), nullptr);
    EXPECT_NE(caps.Find("resources"), nullptr);
    const JSONValue* name = resultMember(*resp, "serverInfo").Find("name");
    ASSERT_NE(name, nullptr);
    EXPECT_EQ(std::get<std::string>(name->value), "nccn-guidelines");
    EXPECT_EQ(std::get<std::string>(resultMember(*resp, "instructions").value), "hello");
    EXPECT_EQ(session->State(), SessionState::Ready);
    EXPECT_EQ(session->ClientInfo().name, "tester");
}

TEST_F(MethodDispatcherTest, InitializeWithUnsupportedVersionFails) {
    auto init = makeRequest(1, Methods::Initialize, initParams("1999-01-01"));
    auto session = dispatcher.OpenSession(init);
    auto resp = dispatcher.Dispatch(session, init);
    ASSERT_TRUE(resp != nullptr);
    EXPECT_EQ(resp->ErrorCode(), JSONRPCErrorCodes::UnsupportedProtocolVersion);
    EXPECT_EQ(session->State(), SessionState::Closed);
    EXPECT_EQ(sessions.Size(), 0u);
}

TEST_F(MethodDispatcherTest, OpenSessionValidatesParams) {
    auto expectInvalid = [this](std::optional<JSONValue> params) {
        try {
            dispatcher.OpenSession(makeRequest(1, Methods::Initialize, std::move(params)));
            ADD_FAILURE() << "expected InvalidParams";
        } catch (const errors::McpException& e) {
            EXPECT_EQ(e.error().code, JSONRPCErrorCodes::InvalidParams);
        }
    };
    expectInvalid(std::nullopt);
    expectInvalid(obj({{"capabilities", JSONValue(JSONValue::Object{})}}));
    expectInvalid(obj({{"protocolVersion", JSONValue(int64_t{5})}}));
    expectInvalid(obj({{"protocolVersion", JSONValue("2025-06-18")}, {"clientInfo", JSONValue("x")}}));
    EXPECT_EQ(sessions.Size(), 0u);
}

TEST_F(MethodDispatcherTest, InitializingSessionOnlyAllowsInitializeAndPing) {
    auto init = makeRequest(1, Methods::Initialize, initParams());
    auto session = dispatcher.OpenSession(init);

    auto ping = dispatcher.Dispatch(session, makeRequest(2, Methods::Ping));
    ASSERT_TRUE(ping != nullptr);
    EXPECT_FALSE(ping->IsError());

    auto list = dispatcher.Dispatch(session, makeRequest(3, Methods::ListTools));
    ASSERT_TRUE(list != nullptr);
    EXPECT_EQ(list->ErrorCode(), JSONRPCErrorCodes::InvalidRequest);
}

TEST_F(MethodDispatcherTest, ReadySessionRejectsSecondInitialize) {
    auto session = readySession();
    auto again = dispatcher.Dispatch(session, makeRequest(5, Methods::Initialize, initParams()));
    ASSERT_TRUE(again != nullptr);
    EXPECT_EQ(again->ErrorCode(), JSONRPCErrorCodes::InvalidRequest);
    EXPECT_EQ(session->State(), SessionState::Ready);
}

TEST_F(MethodDispatcherTest, MissingOrClosedSessionIsSessionNotFound) {
    auto none = dispatcher.Dispatch(nullptr, makeRequest(1, Methods::ListTools));
    ASSERT_TRUE(none != nullptr);
    EXPECT_EQ(none->ErrorCode(), JSONRPCErrorCodes::SessionNotFound);

    auto session = readySession();
    ASSERT_TRUE(sessions.Close(session->Id(), "test"));
    auto closed = dispatcher.Dispatch(session, makeRequest(2, Methods::ListTools));
    ASSERT_TRUE(closed != nullptr);
    EXPECT_EQ(closed->ErrorCode(), JSONRPCErrorCodes::SessionNotFound);
}

TEST_F(MethodDispatcherTest, UnknownMethodIsMethodNotFound) {
    auto session = readySession();
    auto resp = dispatcher.Dispatch(session, makeRequest(2, "prompts/list"));
    ASSERT_TRUE(resp != nullptr);
    EXPECT_EQ(resp->ErrorCode(), JSONRPCErrorCodes::MethodNotFound);
    EXPECT_EQ(std::get<int64_t>(resp->id), 2);
}

TEST_F(MethodDispatcherTest, ToolsListIsSortedAndPaged) {
    auto session = readySession();
    auto all = dispatcher.Dispatch(session, makeRequest(2, Methods::ListTools));
    ASSERT_TRUE(all != nullptr);
    const auto& tools = std::get<JSONValue::Array>(resultMember(*all, "tools").value);
    ASSERT_EQ(tools.size(), 3u);
    EXPECT_EQ(std::get<std::string>(tools[0]->Find("name")->value), "broken");
    EXPECT_EQ(std::get<std::string>(tools[2]->Find("name")->value), "slow");
    const JSONValue* schemaType = tools[0]->Find("inputSchema")->Find("type");
    ASSERT_NE(schemaType, nullptr);
    EXPECT_EQ(std::get<std::string>(schemaType->value), "object");
    EXPECT_EQ(all->result->Find("nextCursor"), nullptr);

    auto page = dispatcher.Dispatch(session, makeRequest(3, Methods::ListTools, obj({{"limit", JSONValue(int64_t{2})}})));
    ASSERT_TRUE(page != nullptr);
    EXPECT_EQ(std::get<JSONValue::Array>(resultMember(*page, "tools").value).size(), 2u);
    EXPECT_EQ(std::get<std::string>(resultMember(*page, "nextCursor").value), "2");

    auto rest = dispatcher.Dispatch(session, makeRequest(4, Methods::ListTools,
                                                         obj({{"cursor", JSONValue("2")}, {"limit", JSONValue(int64_t{2})}})));
    ASSERT_TRUE(rest != nullptr);
    EXPECT_EQ(std::get<JSONValue::Array>(resultMember(*rest, "tools").value).size(), 1u);
    EXPECT_EQ(rest->result->Find("nextCursor"), nullptr);

    auto bad = dispatcher.Dispatch(session, makeRequest(5, Methods::ListTools, obj({{"cursor", JSONValue("abc")}})));
    EXPECT_EQ(bad->ErrorCode(), JSONRPCErrorCodes::InvalidParams);
}

TEST_F(MethodDispatcherTest, ToolsCallReturnsContent) {
    auto session = readySession();
    auto resp = dispatcher.Dispatch(session, makeRequest(2, Methods::CallTool,
        obj({{"name", JSONValue("echo")}, {"arguments", obj({{"text", JSONValue("hi")}})}})));
    ASSERT_TRUE(resp != nullptr);
    ASSERT_FALSE(resp->IsError());
    EXPECT_FALSE(std::get<bool>(resultMember(*resp, "isError").value));
    const auto& content = std::get<JSONValue::Array>(resultMember(*resp, "content").value);
    ASSERT_EQ(content.size(), 1u);
    EXPECT_EQ(std::get<std::string>(content[0]->Find("text")->value), "hi");
}

TEST_F(MethodDispatcherTest, ToolsCallErrorMapping) {
    auto session = readySession();

    auto missingName = dispatcher.Dispatch(session, makeRequest(2, Methods::CallTool, obj({})));
    EXPECT_EQ(missingName->ErrorCode(), JSONRPCErrorCodes::InvalidParams);

    auto unknown = dispatcher.Dispatch(session, makeRequest(3, Methods::CallTool, obj({{"name", JSONValue("nope")}})));
    EXPECT_EQ(unknown->ErrorCode(), JSONRPCErrorCodes::InvalidParams);

    auto rejected = dispatcher.Dispatch(session, makeRequest(4, Methods::CallTool, obj({{"name", JSONValue("reject")}})));
    EXPECT_EQ(rejected->ErrorCode(), JSONRPCErrorCodes::InvalidParams);

    auto broken = dispatcher.Dispatch(session, makeRequest(5, Methods::CallTool, obj({{"name", JSONValue("broken")}})));
    ASSERT_TRUE(broken != nullptr);
    EXPECT_EQ(broken->ErrorCode(), JSONRPCErrorCodes::InternalError);
    const std::string wire = SerializeJSON(broken->error.value());
    EXPECT_EQ(wire.find("secret"), std::string::npos);

    auto badArgs = dispatcher.Dispatch(session, makeRequest(6, Methods::CallTool,
        obj({{"name", JSONValue("echo")}, {"arguments", JSONValue("x")}})));
    EXPECT_EQ(badArgs->ErrorCode(), JSONRPCErrorCodes::InvalidParams);
}

TEST_F(MethodDispatcherTest, ResourcesListAndRead) {
    auto session = readySession();
    auto list = dispatcher.Dispatch(session, makeRequest(2, Methods::ListResources));
    ASSERT_TRUE(list != nullptr);
    const auto& resources = std::get<JSONValue::Array>(resultMember(*list, "resources").value);
    ASSERT_EQ(resources.size(), 2u);
    EXPECT_EQ(std::get<std::string>(resources[0]->Find("uri")->value), "test://a");
    EXPECT_EQ(std::get<std::string>(resources[0]->Find("mimeType")->value), "text/plain");

    auto read = dispatcher.Dispatch(session, makeRequest(3, Methods::ReadResource, obj({{"uri", JSONValue("test://a")}})));
    ASSERT_TRUE(read != nullptr);
    const auto& contents = std::get<JSONValue::Array>(resultMember(*read, "contents").value);
    ASSERT_EQ(contents.size(), 1u);
    EXPECT_EQ(std::get<std::string>(contents[0]->Find("text")->value), "alpha");

    auto missing = dispatcher.Dispatch(session, makeRequest(4, Methods::ReadResource, obj({{"uri", JSONValue("test://zzz")}})));
    EXPECT_EQ(missing->ErrorCode(), JSONRPCErrorCodes::ResourceNotFound);
}

TEST_F(MethodDispatcherTest, MayStreamFollowsToolPredicate) {
    EXPECT_TRUE(dispatcher.MayStream(makeRequest(1, Methods::CallTool, obj({{"name", JSONValue("slow")}}))));
    EXPECT_FALSE(dispatcher.MayStream(makeRequest(1, Methods::CallTool, obj({{"name", JSONValue("echo")}}))));
    EXPECT_FALSE(dispatcher.MayStream(makeRequest(1, Methods::ListTools)));
    EXPECT_FALSE(dispatcher.MayStream(makeRequest(1, "unknown")));
}

TEST_F(MethodDispatcherTest, RegisteredMethodIsDispatched) {
    dispatcher.Register("custom/echo", [](const JSONValue& params, RequestContext& ctx) {
        EXPECT_TRUE(ctx.session != nullptr);
        return params;
    });
    EXPECT_TRUE(dispatcher.HasMethod("custom/echo"));
    auto session = readySession();
    auto resp = dispatcher.Dispatch(session, makeRequest(2, "custom/echo", obj({{"x", JSONValue(int64_t{1})}})));
    ASSERT_TRUE(resp != nullptr);
    EXPECT_EQ(std::get<int64_t>(resultMember(*resp, "x").value), 1);
}

TEST_F(MethodDispatcherTest, StreamedCallEmitsProgressThenTerminalResponse) {
    auto session = readySession();
    provider.release.set_value();
    auto params = obj({{"name", JSONValue("slow")},
                       {"_meta", obj({{"progressToken", JSONValue("tok")}})}});
    auto source = dispatcher.Start(session, makeRequest(7, Methods::CallTool, params));
    auto frames = drain(*source);

    ASSERT_EQ(frames.size(), 4u);
    for (int i = 0; i < 3; ++i) {
        const auto& note = std::get<JSONRPCNotification>(frames[static_cast<std::size_t>(i)]);
        EXPECT_EQ(note.method, Methods::Progress);
        EXPECT_EQ(std::get<std::string>(note.params->Find("progressToken")->value), "tok");
        EXPECT_DOUBLE_EQ(std::get<double>(note.params->Find("progress")->value), static_cast<double>(i + 1));
    }
    const auto& terminal = std::get<JSONRPCResponse>(frames[3]);
    EXPECT_EQ(std::get<int64_t>(terminal.id), 7);
    EXPECT_FALSE(terminal.IsError());
}

TEST_F(MethodDispatcherTest, StreamedCallWithoutTokenEmitsOnlyResponse) {
    auto session = readySession();
    auto source = dispatcher.Start(session, makeRequest(8, Methods::Ping));
    auto frames = drain(*source);
    ASSERT_EQ(frames.size(), 1u);
    EXPECT_TRUE(std::holds_alternative<JSONRPCResponse>(frames[0]));
}

TEST_F(MethodDispatcherTest, BufferedCallDropsProgress) {
    auto session = readySession();
    provider.release.set_value();
    auto params = obj({{"name", JSONValue("slow")}, {"_meta", obj({{"progressToken", JSONValue(int64_t{4})}})}});
    auto resp = dispatcher.Dispatch(session, makeRequest(9, Methods::CallTool, params));
    ASSERT_TRUE(resp != nullptr);
    EXPECT_FALSE(resp->IsError());
}

TEST_F(MethodDispatcherTest, CancelledNotificationStopsRequestAndSuppressesOutput) {
    auto session = readySession();
    auto fut = std::async(std::launch::async, [&]() {
        return dispatcher.Dispatch(session, makeRequest(11, Methods::CallTool, obj({{"name", JSONValue("slow")}})));
    });
    for (int i = 0; i < 400 && !provider.slowStarted.load(); ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    ASSERT_TRUE(provider.slowStarted.load());

    dispatcher.HandleNotification(session, JSONRPCNotification(Methods::Cancelled,
        obj({{"requestId", JSONValue(int64_t{11})}, {"reason", JSONValue("user")}})));

    ASSERT_EQ(fut.wait_for(std::chrono::seconds(2)), std::future_status::ready);
    EXPECT_TRUE(fut.get() == nullptr);
    EXPECT_TRUE(provider.slowSawStop.load());
    EXPECT_EQ(session->InFlightCount(), 0u);
}

TEST_F(MethodDispatcherTest, CancelNotificationIsKeyedByIdType) {
    auto session = readySession();
    auto fut = std::async(std::launch::async, [&]() {
        return dispatcher.Dispatch(session, makeRequest(12, Methods::CallTool, obj({{"name", JSONValue("slow")}})));
    });
    for (int i = 0; i < 400 && !provider.slowStarted.load(); ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    // String "12" names a different request than integer 12.
    dispatcher.HandleNotification(session, JSONRPCNotification(Methods::Cancelled, obj({{"requestId", JSONValue("12")}})));
    std::this_thread::sleep_for(std::chrono::milliseconds(30));
    EXPECT_FALSE(provider.slowSawStop.load());

    provider.release.set_value();
    ASSERT_EQ(fut.wait_for(std::chrono::seconds(2)), std::future_status::ready);
    auto resp = fut.get();
    ASSERT_TRUE(resp != nullptr);
    EXPECT_FALSE(resp->IsError());
}

TEST_F(MethodDispatcherTest, CallerStopCancelsBufferedRequest) {
    auto session = readySession();
    std::stop_source caller;
    auto fut = std::async(std::launch::async, [&]() {
        return dispatcher.Dispatch(session, makeRequest(13, Methods::CallTool, obj({{"name", JSONValue("slow")}})),
                                   caller.get_token());
    });
    for (int i = 0; i < 400 && !provider.slowStarted.load(); ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    caller.request_stop();
    ASSERT_EQ(fut.wait_for(std::chrono::seconds(2)), std::future_status::ready);
    EXPECT_TRUE(fut.get() == nullptr);
}

TEST_F(MethodDispatcherTest, CancellingStreamStopsMethodBody) {
    auto session = readySession();
    auto source = dispatcher.Start(session, makeRequest(14, Methods::CallTool, obj({{"name", JSONValue("slow")}})));
    for (int i = 0; i < 400 && !provider.slowStarted.load(); ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    source->Cancel();
    auto frames = drain(*source);
    EXPECT_TRUE(frames.empty());
    source.reset();
    EXPECT_TRUE(provider.slowSawStop.load());
    EXPECT_EQ(session->InFlightCount(), 0u);
}

TEST_F(MethodDispatcherTest, DroppingStreamHandleCancelsWithoutWaiting) {
    std::atomic<bool> started{false};
    dispatcher.Register("test/stubborn", [&started](const JSONValue&, RequestContext&) {
        started.store(true);
        std::this_thread::sleep_for(std::chrono::milliseconds(300));
        return JSONValue(JSONValue::Object{});
    });
    auto session = readySession();
    std::thread bodyThread;
    auto source = dispatcher.Start(session, makeRequest(16, "test/stubborn"), {},
                                   [&bodyThread](std::function<void()> body) { bodyThread = std::thread(std::move(body)); });
    for (int i = 0; i < 400 && !started.load(); ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    EXPECT_TRUE(started.load());

    const auto before = std::chrono::steady_clock::now();
    source.reset();
    EXPECT_LT(std::chrono::steady_clock::now() - before, std::chrono::milliseconds(100));

    bodyThread.join();
    EXPECT_EQ(session->InFlightCount(), 0u);
}

TEST_F(MethodDispatcherTest, LauncherRunsBodyAndNotifyFollowsFrames) {
    auto session = readySession();
    std::function<void()> pending;
    auto source = dispatcher.Start(session,
                                   makeRequest(17, Methods::CallTool, obj({{"name", JSONValue("echo")}, {"arguments", obj({{"text", JSONValue("hi")}})}})),
                                   {}, [&pending](std::function<void()> body) { pending = std::move(body); });
    std::optional<OutputFrame> f;
    EXPECT_EQ(source->Next(std::chrono::milliseconds(0), f), FrameSource::Poll::Timeout);

    int notified = 0;
    source->SetNotify([&notified]() { ++notified; });
    ASSERT_TRUE(static_cast<bool>(pending));
    pending();
    EXPECT_EQ(notified, 2);  // terminal response, then end of sequence

    ASSERT_EQ(source->Next(std::chrono::milliseconds(0), f), FrameSource::Poll::Frame);
    ASSERT_TRUE(std::holds_alternative<JSONRPCResponse>(f.value()));
    EXPECT_FALSE(std::get<JSONRPCResponse>(f.value()).IsError());
    EXPECT_EQ(source->Next(std::chrono::milliseconds(0), f), FrameSource::Poll::End);
}

TEST_F(MethodDispatcherTest, DuplicateInFlightIdIsRejected) {
    auto session = readySession();
    auto fut = std::async(std::launch::async, [&]() {
        return dispatcher.Dispatch(session, makeRequest(15, Methods::CallTool, obj({{"name", JSONValue("slow")}})));
    });
    for (int i = 0; i < 400 && !provider.slowStarted.load(); ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    auto dup = dispatcher.Dispatch(session, makeRequest(15, Methods::Ping));
    ASSERT_TRUE(dup != nullptr);
    EXPECT_EQ(dup->ErrorCode(), JSONRPCErrorCodes::InvalidRequest);

    provider.release.set_value();
    ASSERT_EQ(fut.wait_for(std::chrono::seconds(2)), std::future_status::ready);
    EXPECT_TRUE(fut.get() != nullptr);
}
