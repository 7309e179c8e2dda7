//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_session_manager.cpp
// Purpose: GoogleTests for session lifecycle, idle sweeping and per-session request tracking
//==========================================================================================================

#include <gtest/gtest.h>
#include <atomic>
#include <mutex>
#include <set>
#include <thread>
#include <vector>

#include "guidemcp/SessionManager.h"
#include "guidemcp/errors/Errors.h"

using namespace guidemcp;

namespace {

// Manually advanced steady clock shared with the manager under test.
struct FakeClock {
    std::shared_ptr<SteadyTimePoint> now = std::make_shared<SteadyTimePoint>(std::chrono::steady_clock::now());

    SteadyClock fn() const {
        auto p = now;
        return [p]() { return *p; };
    }
    void advance(std::chrono::milliseconds d) { *now += d; }
};

SessionConfig smallConfig() {
    SessionConfig cfg;
    cfg.idleTimeout = std::chrono::milliseconds(1000);
    cfg.sweepInterval = std::chrono::milliseconds(20);
    cfg.maxSessions = 8;
    cfg.supportedVersions = {"2025-03-26", "2025-06-18"};
    return cfg;
}

std::shared_ptr<Session> readySession(SessionManager& mgr, const std::string& version = "2025-06-18") {
    auto s = mgr.CreateSession(Implementation{"test-client", "0.1"}, CapabilitySet{}, version);
    mgr.CompleteInitialize(*s);
    return s;
}

} // namespace

TEST(SessionManager, CreateThenCompleteInitialize) {
    SessionManager mgr(smallConfig());
    auto s = mgr.CreateSession(Implementation{"c", "1"}, CapabilitySet{}, "2025-03-26");
    ASSERT_TRUE(s != nullptr);
    EXPECT_EQ(s->State(), SessionState::Initializing);
    EXPECT_EQ(s->Id().size(), 32u);
    EXPECT_EQ(mgr.Size(), 1u);

    EXPECT_EQ(mgr.CompleteInitialize(*s), "2025-03-26");
    EXPECT_EQ(s->State(), SessionState::Ready);
    EXPECT_EQ(s->ProtocolVersion(), "2025-03-26");
    EXPECT_EQ(s->ClientInfo().name, "c");
    EXPECT_EQ(mgr.Find(s->Id()), s);
}

TEST(SessionManager, UnsupportedVersionClosesNascentSession) {
    SessionManager mgr(smallConfig());
    auto s = mgr.CreateSession(Implementation{"c", "1"}, CapabilitySet{}, "1999-01-01");
    try {
        mgr.CompleteInitialize(*s);
        FAIL() << "expected McpException";
    } catch (const errors::McpException& e) {
        EXPECT_EQ(e.error().code, JSONRPCErrorCodes::UnsupportedProtocolVersion);
        ASSERT_TRUE(e.error().data.has_value());
        EXPECT_NE(e.error().data->Find("supported"), nullptr);
    }
    EXPECT_EQ(s->State(), SessionState::Closed);
    EXPECT_EQ(mgr.Find(s->Id()), nullptr);
    EXPECT_EQ(mgr.Size(), 0u);
}

TEST(SessionManager, CompleteInitializeTwiceIsInvalidRequest) {
    SessionManager mgr(smallConfig());
    auto s = readySession(mgr);
    try {
        mgr.CompleteInitialize(*s);
        FAIL() << "expected McpException";
    } catch (const errors::McpException& e) {
        EXPECT_EQ(e.error().code, JSONRPCErrorCodes::InvalidRequest);
    }
    EXPECT_EQ(s->State(), SessionState::Ready);
}

TEST(SessionManager, SessionIdsAreUnique) {
    SessionConfig cfg = smallConfig();
    cfg.maxSessions = 512;
    SessionManager mgr(cfg);
    std::set<std::string> ids;
    for (int i = 0; i < 256; ++i) {
        ids.insert(mgr.CreateSession(Implementation{"c", "1"}, CapabilitySet{}, "2025-06-18")->Id());
    }
    EXPECT_EQ(ids.size(), 256u);
}

TEST(SessionManager, ClosedSessionIsNeverResurrected) {
    SessionManager mgr(smallConfig());
    auto s = readySession(mgr);
    const std::string id = s->Id();
    EXPECT_TRUE(mgr.Close(id, "test"));
    EXPECT_EQ(s->State(), SessionState::Closed);
    for (int i = 0; i < 1000; ++i) {
        ASSERT_EQ(mgr.Find(id), nullptr);
    }
    EXPECT_FALSE(mgr.Close(id, "again"));
    EXPECT_EQ(s->BeginRequest("i:1"), nullptr);
}

TEST(SessionManager, CloseUnknownSessionReturnsFalse) {
    SessionManager mgr(smallConfig());
    EXPECT_FALSE(mgr.Close("does-not-exist", "test"));
    EXPECT_EQ(mgr.Find(""), nullptr);
}

TEST(SessionManager, SweepClosesOnlyIdleSessions) {
    FakeClock clock;
    SessionManager mgr(smallConfig(), clock.fn());
    auto idle = readySession(mgr);
    auto active = readySession(mgr);

    clock.advance(std::chrono::milliseconds(600));
    ASSERT_NE(mgr.Find(active->Id()), nullptr);  // records activity
    clock.advance(std::chrono::milliseconds(600));

    EXPECT_EQ(mgr.SweepIdle(), 1u);
    EXPECT_EQ(idle->State(), SessionState::Closed);
    EXPECT_EQ(mgr.Find(idle->Id()), nullptr);
    EXPECT_NE(mgr.Find(active->Id()), nullptr);
}

TEST(SessionManager, SweepSkipsSessionsWithRequestsInFlight) {
    FakeClock clock;
    SessionManager mgr(smallConfig(), clock.fn());
    auto s = readySession(mgr);
    auto stop = s->BeginRequest("i:1");
    ASSERT_TRUE(stop != nullptr);

    clock.advance(std::chrono::milliseconds(5000));
    EXPECT_EQ(mgr.SweepIdle(), 0u);
    s->EndRequest("i:1");
    EXPECT_EQ(mgr.SweepIdle(), 1u);
}

TEST(SessionManager, CapacityExhaustedAfterSweep) {
    SessionConfig cfg = smallConfig();
    cfg.maxSessions = 2;
    SessionManager mgr(cfg);
    readySession(mgr);
    readySession(mgr);
    try {
        mgr.CreateSession(Implementation{"c", "1"}, CapabilitySet{}, "2025-06-18");
        FAIL() << "expected McpException";
    } catch (const errors::McpException& e) {
        EXPECT_EQ(e.error().code, JSONRPCErrorCodes::InternalError);
    }
    EXPECT_EQ(mgr.Size(), 2u);
}

TEST(SessionManager, CapacityReclaimedFromIdleSessions) {
    FakeClock clock;
    SessionConfig cfg = smallConfig();
    cfg.maxSessions = 1;
    SessionManager mgr(cfg, clock.fn());
    auto old = readySession(mgr);
    clock.advance(std::chrono::milliseconds(2000));
    auto fresh = mgr.CreateSession(Implementation{"c", "1"}, CapabilitySet{}, "2025-06-18");
    EXPECT_NE(fresh, nullptr);
    EXPECT_EQ(old->State(), SessionState::Closed);
    EXPECT_EQ(mgr.Size(), 1u);
}

TEST(SessionManager, ConcurrentCreatesYieldDistinctSessions) {
    SessionConfig cfg = smallConfig();
    cfg.maxSessions = 1000;
    SessionManager mgr(cfg);
    std::mutex m;
    std::set<std::string> ids;
    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&]() {
            for (int i = 0; i < 25; ++i) {
                auto s = readySession(mgr);
                std::lock_guard<std::mutex> lk(m);
                ids.insert(s->Id());
            }
        });
    }
    for (auto& th : threads) th.join();
    EXPECT_EQ(ids.size(), 200u);
    EXPECT_EQ(mgr.Size(), 200u);
}

TEST(SessionManager, ShutdownClosesAllAndReportsUnhealthy) {
    SessionManager mgr(smallConfig());
    auto a = readySession(mgr);
    auto b = readySession(mgr);
    EXPECT_TRUE(mgr.IsHealthy());
    mgr.Shutdown();
    EXPECT_FALSE(mgr.IsHealthy());
    EXPECT_EQ(a->State(), SessionState::Closed);
    EXPECT_EQ(b->State(), SessionState::Closed);
    EXPECT_EQ(mgr.Size(), 0u);
    EXPECT_THROW(mgr.CreateSession(Implementation{"c", "1"}, CapabilitySet{}, "2025-06-18"), errors::McpException);
}

TEST(SessionManager, MarkDegradedReportsUnhealthy) {
    SessionManager mgr(smallConfig());
    mgr.MarkDegraded("test");
    EXPECT_FALSE(mgr.IsHealthy());
}

TEST(Session, RequestTrackingAndCancellation) {
    SessionManager mgr(smallConfig());
    auto s = readySession(mgr);
    auto stop = s->BeginRequest("i:5");
    ASSERT_TRUE(stop != nullptr);
    EXPECT_EQ(s->BeginRequest("i:5"), nullptr);  // duplicate id while outstanding
    EXPECT_EQ(s->InFlightCount(), 1u);

    EXPECT_TRUE(s->CancelRequest("i:5"));
    EXPECT_TRUE(stop->stop_requested());
    EXPECT_TRUE(s->IsCancelled("i:5"));
    EXPECT_FALSE(s->CancelRequest("i:6"));

    s->EndRequest("i:5");
    EXPECT_EQ(s->InFlightCount(), 0u);
    auto again = s->BeginRequest("i:5");
    ASSERT_TRUE(again != nullptr);
    EXPECT_FALSE(s->IsCancelled("i:5"));
}

TEST(Session, CloseCancelsInFlightRequests) {
    SessionManager mgr(smallConfig());
    auto s = readySession(mgr);
    auto stop = s->BeginRequest("s:abc");
    ASSERT_TRUE(mgr.Close(s->Id(), "test"));
    EXPECT_TRUE(stop->stop_requested());
    EXPECT_TRUE(s->IsCancelled("s:abc"));
}

TEST(IdleSessionSweeper, BackgroundSweepClosesIdleSessions) {
    SessionConfig cfg = smallConfig();
    cfg.idleTimeout = std::chrono::milliseconds(30);
    SessionManager mgr(cfg);
    auto s = readySession(mgr);

    IdleSessionSweeper sweeper(mgr);
    sweeper.Start();
    EXPECT_TRUE(sweeper.IsRunning());
    for (int i = 0; i < 100 && s->State() != SessionState::Closed; ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    sweeper.Stop();
    EXPECT_FALSE(sweeper.IsRunning());
    EXPECT_EQ(s->State(), SessionState::Closed);
    EXPECT_TRUE(mgr.IsHealthy());
}
