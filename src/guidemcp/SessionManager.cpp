//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/guidemcp/SessionManager.cpp
// Purpose: Session lifecycle, registry, and idle sweeping
//==========================================================================================================

#include <algorithm>
#include <array>
#include <iomanip>
#include <sstream>

#include <openssl/rand.h>

#include "guidemcp/SessionManager.h"
#include "guidemcp/errors/Errors.h"
#include "logging/Logger.h"

namespace guidemcp {

const char* ToString(SessionState state) {
    switch (state) {
        case SessionState::Uninitialized: return "Uninitialized";
        case SessionState::Initializing: return "Initializing";
        case SessionState::Ready: return "Ready";
        case SessionState::Closed: return "Closed";
    }
    return "Unknown";
}

/////////////////////////////////////////////// Session ///////////////////////////////////////////////

Session::Session(std::string id, Implementation clientInfo, CapabilitySet clientCapabilities,
                 std::string protocolVersion, SteadyTimePoint now)
    : id_(std::move(id)),
      createdAt_(now),
      protocolVersion_(std::move(protocolVersion)),
      clientInfo_(std::move(clientInfo)),
      clientCapabilities_(std::move(clientCapabilities)),
      lastActivityAt_(now) {}

SessionState Session::State() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return state_;
}

std::string Session::ProtocolVersion() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return protocolVersion_;
}

Implementation Session::ClientInfo() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return clientInfo_;
}

CapabilitySet Session::ClientCapabilities() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return clientCapabilities_;
}

SteadyTimePoint Session::LastActivityAt() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return lastActivityAt_;
}

std::shared_ptr<std::stop_source> Session::BeginRequest(const std::string& requestKey) {
    std::lock_guard<std::mutex> lk(mutex_);
    if (state_ == SessionState::Closed) {
        return nullptr;
    }
    if (inFlight_.find(requestKey) != inFlight_.end()) {
        return nullptr;
    }
    auto src = std::make_shared<std::stop_source>();
    inFlight_[requestKey] = src;
    // A reused id starts fresh; earlier cancellation referred to the earlier request.
    cancelled_.erase(requestKey);
    return src;
}

void Session::EndRequest(const std::string& requestKey) {
    std::lock_guard<std::mutex> lk(mutex_);
    inFlight_.erase(requestKey);
}

bool Session::CancelRequest(const std::string& requestKey) {
    std::lock_guard<std::mutex> lk(mutex_);
    auto it = inFlight_.find(requestKey);
    if (it == inFlight_.end()) {
        return false;
    }
    cancelled_.insert(requestKey);
    if (it->second) {
        it->second->request_stop();
    }
    return true;
}

bool Session::IsCancelled(const std::string& requestKey) const {
    std::lock_guard<std::mutex> lk(mutex_);
    return cancelled_.find(requestKey) != cancelled_.end();
}

std::size_t Session::InFlightCount() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return inFlight_.size();
}

void Session::touch(SteadyTimePoint now) {
    std::lock_guard<std::mutex> lk(mutex_);
    if (now > lastActivityAt_) {
        lastActivityAt_ = now;
    }
}

// Caller holds mutex_.
void Session::closeLocked() {
    state_ = SessionState::Closed;
    for (auto& [key, src] : inFlight_) {
        cancelled_.insert(key);
        if (src) {
            src->request_stop();
        }
    }
}

//////////////////////////////////////////// SessionManager ////////////////////////////////////////////

SessionManager::SessionManager(SessionConfig config, SteadyClock clock)
    : config_(std::move(config)), clock_(std::move(clock)) {
    if (!clock_) {
        clock_ = []() { return std::chrono::steady_clock::now(); };
    }
}

SessionManager::~SessionManager() {
    Shutdown();
}

SteadyTimePoint SessionManager::now() const {
    return clock_();
}

std::string SessionManager::generateSessionId() const {
    std::array<unsigned char, 16> bytes{};
    if (::RAND_bytes(bytes.data(), static_cast<int>(bytes.size())) != 1) {
        throw std::runtime_error("RAND_bytes failed while generating a session id");
    }
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (unsigned char b : bytes) {
        oss << std::setw(2) << static_cast<int>(b);
    }
    return oss.str();
}

bool SessionManager::IsVersionSupported(const std::string& version) const {
    return std::find(config_.supportedVersions.begin(), config_.supportedVersions.end(), version)
           != config_.supportedVersions.end();
}

std::shared_ptr<Session> SessionManager::CreateSession(const Implementation& clientInfo,
                                                       CapabilitySet clientCapabilities,
                                                       const std::string& requestedVersion) {
    if (shutdown_.load()) {
        throw errors::McpException(JSONRPCErrorCodes::InternalError, "Server is shutting down");
    }
    if (Size() >= config_.maxSessions) {
        SweepIdle();
    }
    auto session = std::make_shared<Session>(generateSessionId(), clientInfo,
                                             std::move(clientCapabilities), requestedVersion, now());
    {
        std::lock_guard<std::mutex> lk(session->mutex_);
        session->state_ = SessionState::Initializing;
    }
    {
        std::lock_guard<std::mutex> lk(tableMutex_);
        if (sessions_.size() >= config_.maxSessions) {
            LOG_WARN("Session table full ({} sessions); rejecting initialize from {}", sessions_.size(), clientInfo.name);
            throw errors::McpException(JSONRPCErrorCodes::InternalError, "Session capacity exhausted");
        }
        sessions_.emplace(session->Id(), session);
    }
    LOG_DEBUG("Session {} created for client {} {}", session->Id(), clientInfo.name, clientInfo.version);
    return session;
}

std::string SessionManager::CompleteInitialize(Session& session) {
    std::string version;
    {
        std::lock_guard<std::mutex> lk(session.mutex_);
        if (session.state_ != SessionState::Initializing) {
            throw errors::McpException(JSONRPCErrorCodes::InvalidRequest,
                                       std::string("Session is ") + ToString(session.state_) + ", not Initializing");
        }
        version = session.protocolVersion_;
        if (IsVersionSupported(version)) {
            session.state_ = SessionState::Ready;
            LOG_INFO("Session {} ready (protocol {}, client {})", session.id_, version, session.clientInfo_.name);
            return version;
        }
        session.closeLocked();
    }
    {
        std::lock_guard<std::mutex> lk(tableMutex_);
        sessions_.erase(session.Id());
    }
    LOG_WARN("Session {} rejected: unsupported protocol version '{}'", session.Id(), version);

    JSONValue::Array supported;
    for (const auto& v : config_.supportedVersions) {
        supported.push_back(std::make_shared<JSONValue>(v));
    }
    JSONValue::Object data;
    data["requested"] = std::make_shared<JSONValue>(version);
    data["supported"] = std::make_shared<JSONValue>(std::move(supported));
    throw errors::McpException(JSONRPCErrorCodes::UnsupportedProtocolVersion,
                               "Unsupported protocol version", JSONValue(std::move(data)));
}

std::shared_ptr<Session> SessionManager::Find(const std::string& sessionId) {
    if (sessionId.empty()) {
        return nullptr;
    }
    std::shared_ptr<Session> session;
    {
        std::lock_guard<std::mutex> lk(tableMutex_);
        auto it = sessions_.find(sessionId);
        if (it == sessions_.end()) {
            return nullptr;
        }
        session = it->second;
    }
    if (session->State() == SessionState::Closed) {
        return nullptr;
    }
    session->touch(now());
    return session;
}

bool SessionManager::Close(const std::string& sessionId, const std::string& reason) {
    std::shared_ptr<Session> session;
    {
        std::lock_guard<std::mutex> lk(tableMutex_);
        auto it = sessions_.find(sessionId);
        if (it == sessions_.end()) {
            return false;
        }
        session = it->second;
        sessions_.erase(it);
    }
    {
        std::lock_guard<std::mutex> lk(session->mutex_);
        session->closeLocked();
    }
    LOG_INFO("Session {} closed: {}", sessionId, reason);
    return true;
}

std::size_t SessionManager::SweepIdle() {
    std::vector<std::shared_ptr<Session>> candidates;
    {
        std::lock_guard<std::mutex> lk(tableMutex_);
        candidates.reserve(sessions_.size());
        for (const auto& kv : sessions_) {
            candidates.push_back(kv.second);
        }
    }

    const auto current = now();
    std::vector<std::string> closed;
    for (const auto& session : candidates) {
        std::lock_guard<std::mutex> lk(session->mutex_);
        if (session->state_ == SessionState::Closed || !session->inFlight_.empty()) {
            continue;
        }
        if (current - session->lastActivityAt_ < config_.idleTimeout) {
            continue;
        }
        session->closeLocked();
        closed.push_back(session->id_);
    }

    if (!closed.empty()) {
        std::lock_guard<std::mutex> lk(tableMutex_);
        for (const auto& id : closed) {
            sessions_.erase(id);
        }
    }
    for (const auto& id : closed) {
        LOG_INFO("Session {} closed: idle timeout", id);
    }
    return closed.size();
}

std::size_t SessionManager::Size() const {
    std::lock_guard<std::mutex> lk(tableMutex_);
    return sessions_.size();
}

bool SessionManager::IsHealthy() const {
    return healthy_.load() && !shutdown_.load();
}

void SessionManager::MarkDegraded(const std::string& reason) {
    if (healthy_.exchange(false)) {
        LOG_ERROR("Session manager degraded: {}", reason);
    }
}

void SessionManager::Shutdown() {
    if (shutdown_.exchange(true)) {
        return;
    }
    std::unordered_map<std::string, std::shared_ptr<Session>> all;
    {
        std::lock_guard<std::mutex> lk(tableMutex_);
        all.swap(sessions_);
    }
    for (auto& [id, session] : all) {
        std::lock_guard<std::mutex> lk(session->mutex_);
        session->closeLocked();
    }
    if (!all.empty()) {
        LOG_INFO("Session manager shut down; closed {} session(s)", all.size());
    }
}

////////////////////////////////////////// IdleSessionSweeper //////////////////////////////////////////

IdleSessionSweeper::IdleSessionSweeper(SessionManager& manager) : manager_(manager) {}

IdleSessionSweeper::~IdleSessionSweeper() {
    Stop();
}

void IdleSessionSweeper::Start() {
    if (running_.exchange(true)) {
        return;
    }
    {
        std::lock_guard<std::mutex> lk(mutex_);
        stopRequested_ = false;
    }
    thread_ = std::thread([this]() { run(); });
}

void IdleSessionSweeper::Stop() {
    {
        std::lock_guard<std::mutex> lk(mutex_);
        stopRequested_ = true;
    }
    cv_.notify_all();
    if (thread_.joinable()) {
        thread_.join();
    }
    running_.store(false);
}

void IdleSessionSweeper::run() {
    const auto interval = manager_.Config().sweepInterval;
    LOG_DEBUG("Idle session sweeper started (interval {} ms)", interval.count());
    std::unique_lock<std::mutex> lk(mutex_);
    while (!stopRequested_) {
        if (cv_.wait_for(lk, interval, [this]() { return stopRequested_; })) {
            break;
        }
        lk.unlock();
        try {
            std::size_t n = manager_.SweepIdle();
            if (n > 0) {
                LOG_DEBUG("Idle sweep closed {} session(s)", n);
            }
        } catch (const std::exception& e) {
            manager_.MarkDegraded(std::string("idle sweep failed: ") + e.what());
            lk.lock();
            break;
        }
        lk.lock();
    }
    LOG_DEBUG("Idle session sweeper stopped");
}

} // namespace guidemcp
