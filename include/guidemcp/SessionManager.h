//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: SessionManager.h
// Purpose: Per-client session state machine, session registry, and idle-session sweeping
//==========================================================================================================

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <stop_token>
#include <string>
#include <thread>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "guidemcp/Protocol.h"

namespace guidemcp {

enum class SessionState {
    Uninitialized,
    Initializing,
    Ready,
    Closed
};

const char* ToString(SessionState state);

using SteadyTimePoint = std::chrono::steady_clock::time_point;
using SteadyClock = std::function<SteadyTimePoint()>;

//==========================================================================================================
// SessionConfig
// Fields:
//   idleTimeout: Sessions idle longer than this are closed by the sweep.
//   sweepInterval: Period of the background idle sweep.
//   maxSessions: Session table capacity.
//   supportedVersions: Protocol revisions accepted at initialize.
//==========================================================================================================
struct SessionConfig {
    std::chrono::milliseconds idleTimeout{std::chrono::minutes(30)};
    std::chrono::milliseconds sweepInterval{std::chrono::seconds(30)};
    std::size_t maxSessions{1024};
    std::vector<std::string> supportedVersions{DefaultProtocolVersions()};
};

//==========================================================================================================
// Session
// Purpose: Handshake-scoped client context. All mutable fields are guarded by the session's own
//          mutex; only SessionManager changes the lifecycle state.
//==========================================================================================================
class Session {
public:
    Session(std::string id, Implementation clientInfo, CapabilitySet clientCapabilities,
            std::string protocolVersion, SteadyTimePoint now);

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    const std::string& Id() const { return id_; }
    SessionState State() const;
    std::string ProtocolVersion() const;
    Implementation ClientInfo() const;
    CapabilitySet ClientCapabilities() const;
    SteadyTimePoint CreatedAt() const { return createdAt_; }
    SteadyTimePoint LastActivityAt() const;

    //======================================================================================================
    // BeginRequest
    // Purpose: Registers an in-flight request so it can be cancelled.
    // Args:
    //   requestKey: Request id rendered as a string.
    // Returns:
    //   Stop source for the request; nullptr when the session is closed or the id is already
    //   outstanding in this session.
    //======================================================================================================
    std::shared_ptr<std::stop_source> BeginRequest(const std::string& requestKey);

    // Removes an in-flight request (completed or cancelled).
    void EndRequest(const std::string& requestKey);

    //======================================================================================================
    // CancelRequest
    // Purpose: Requests stop on an in-flight request and remembers it as cancelled.
    // Returns:
    //   true when a matching in-flight request existed.
    //======================================================================================================
    bool CancelRequest(const std::string& requestKey);

    bool IsCancelled(const std::string& requestKey) const;
    std::size_t InFlightCount() const;

private:
    friend class SessionManager;

    void touch(SteadyTimePoint now);
    void closeLocked();

    const std::string id_;
    const SteadyTimePoint createdAt_;

    mutable std::mutex mutex_;
    SessionState state_{SessionState::Uninitialized};
    std::string protocolVersion_;
    Implementation clientInfo_;
    CapabilitySet clientCapabilities_;
    SteadyTimePoint lastActivityAt_;
    std::unordered_map<std::string, std::shared_ptr<std::stop_source>> inFlight_;
    std::unordered_set<std::string> cancelled_;
};

//==========================================================================================================
// SessionManager
// Purpose: Explicit session registry constructed at startup and passed by reference to the
//          components that need it. Table operations hold a short-lived table mutex; per-session
//          mutation holds only that session's mutex.
//==========================================================================================================
class SessionManager {
public:
    explicit SessionManager(SessionConfig config, SteadyClock clock = {});
    ~SessionManager();

    SessionManager(const SessionManager&) = delete;
    SessionManager& operator=(const SessionManager&) = delete;

    //======================================================================================================
    // CreateSession
    // Purpose: Leaves Uninitialized: allocates a new session in Initializing.
    // Throws:
    //   errors::McpException(InternalError) when the table is full even after an idle sweep.
    //======================================================================================================
    std::shared_ptr<Session> CreateSession(const Implementation& clientInfo,
                                           CapabilitySet clientCapabilities,
                                           const std::string& requestedVersion);

    //======================================================================================================
    // CompleteInitialize
    // Purpose: Validates the requested protocol version and moves the session to Ready.
    // Returns:
    //   The negotiated protocol version.
    // Throws:
    //   errors::McpException(UnsupportedProtocolVersion) after closing the nascent session when the
    //   version is not supported; errors::McpException(InvalidRequest) when not Initializing.
    //======================================================================================================
    std::string CompleteInitialize(Session& session);

    //======================================================================================================
    // Find
    // Purpose: Resolves a session for a request and records activity on it.
    // Returns:
    //   The live session, or nullptr when unknown or closed.
    //======================================================================================================
    std::shared_ptr<Session> Find(const std::string& sessionId);

    // Explicit termination. Returns false when the session did not exist.
    bool Close(const std::string& sessionId, const std::string& reason);

    // Closes sessions idle longer than the configured timeout that have no request in flight.
    std::size_t SweepIdle();

    std::size_t Size() const;
    bool IsHealthy() const;
    void MarkDegraded(const std::string& reason);

    // Closes every session; the manager reports unhealthy afterwards.
    void Shutdown();

    bool IsVersionSupported(const std::string& version) const;
    const SessionConfig& Config() const { return config_; }

private:
    SteadyTimePoint now() const;
    std::string generateSessionId() const;

    const SessionConfig config_;
    SteadyClock clock_;

    mutable std::mutex tableMutex_;
    std::unordered_map<std::string, std::shared_ptr<Session>> sessions_;

    std::atomic<bool> healthy_{true};
    std::atomic<bool> shutdown_{false};
};

//==========================================================================================================
// IdleSessionSweeper
// Purpose: Background thread that periodically calls SessionManager::SweepIdle. A failing sweep marks
//          the manager degraded so the liveness endpoint reports it.
//==========================================================================================================
class IdleSessionSweeper {
public:
    explicit IdleSessionSweeper(SessionManager& manager);
    ~IdleSessionSweeper();

    IdleSessionSweeper(const IdleSessionSweeper&) = delete;
    IdleSessionSweeper& operator=(const IdleSessionSweeper&) = delete;

    void Start();
    void Stop();
    bool IsRunning() const { return running_.load(); }

private:
    void run();

    SessionManager& manager_;
    std::thread thread_;
    std::mutex mutex_;
    std::condition_variable cv_;
    bool stopRequested_{false};
    std::atomic<bool> running_{false};
};

} // namespace guidemcp
