//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/guidemcp/ServerConfig.cpp
// Purpose: Server configuration from environment variables overridden by --key=value options
//==========================================================================================================

#include <charconv>
#include <functional>
#include <limits>

#include "env/EnvVars.h"
#include "guidemcp/ServerConfig.h"
#include "logging/Logger.h"

namespace guidemcp {

namespace {

std::optional<unsigned long long> parseUnsigned(const std::string& text) {
    unsigned long long v = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), v);
    if (ec != std::errc() || ptr != text.data() + text.size() || text.empty()) {
        return std::nullopt;
    }
    return v;
}

// One configurable field: where it is read from and how a raw value is applied.
struct Setting {
    const char* env;
    const char* option;
    std::function<bool(ServerConfig&, const std::string&)> apply;
};

template <typename T>
std::function<bool(ServerConfig&, const std::string&)> unsignedField(T ServerConfig::*field,
                                                                     unsigned long long min,
                                                                     unsigned long long max) {
    return [field, min, max](ServerConfig& cfg, const std::string& raw) {
        auto v = parseUnsigned(raw);
        if (!v.has_value() || v.value() < min || v.value() > max) {
            return false;
        }
        cfg.*field = static_cast<T>(v.value());
        return true;
    };
}

template <typename Duration>
std::function<bool(ServerConfig&, const std::string&)> durationField(Duration ServerConfig::*field,
                                                                     unsigned long long min) {
    return [field, min](ServerConfig& cfg, const std::string& raw) {
        auto v = parseUnsigned(raw);
        if (!v.has_value() || v.value() < min) {
            return false;
        }
        cfg.*field = Duration(static_cast<typename Duration::rep>(v.value()));
        return true;
    };
}

std::function<bool(ServerConfig&, const std::string&)> stringField(std::string ServerConfig::*field) {
    return [field](ServerConfig& cfg, const std::string& raw) {
        cfg.*field = raw;
        return true;
    };
}

const std::vector<Setting>& settings() {
    static const std::vector<Setting> kSettings{
        {"MCP_TRANSPORT", "--transport", stringField(&ServerConfig::transport)},
        {"MCP_HOST", "--host", stringField(&ServerConfig::host)},
        {"MCP_PORT", "--port", unsignedField(&ServerConfig::port, 0, std::numeric_limits<unsigned short>::max())},
        {"MCP_PATH", "--path", stringField(&ServerConfig::mcpPath)},
        {"MCP_HEALTH_PATH", "--health-path", stringField(&ServerConfig::healthPath)},
        {"MCP_SESSION_IDLE_TIMEOUT_MS", "--session-idle-timeout-ms", durationField(&ServerConfig::sessionIdleTimeout, 1)},
        {"MCP_SESSION_SWEEP_INTERVAL_MS", "--session-sweep-interval-ms", durationField(&ServerConfig::sessionSweepInterval, 1)},
        {"MCP_MAX_SESSIONS", "--max-sessions", unsignedField(&ServerConfig::maxSessions, 1, 1000000)},
        {"MCP_PROTOCOL_VERSIONS", "--protocol-versions",
         [](ServerConfig& cfg, const std::string& raw) {
             auto versions = SplitList(raw);
             if (versions.empty()) {
                 return false;
             }
             cfg.protocolVersions = std::move(versions);
             return true;
         }},
        {"MCP_WORKER_THREADS", "--worker-threads", unsignedField(&ServerConfig::workerThreads, 1, 1024)},
        {"MCP_STREAM_WORKER_THREADS", "--stream-worker-threads", unsignedField(&ServerConfig::streamWorkerThreads, 1, 1024)},
        {"MCP_STREAM_KEEPALIVE_MS", "--stream-keepalive-ms", durationField(&ServerConfig::streamKeepalive, 10)},
        {"MCP_MAX_BODY_BYTES", "--max-body-bytes", unsignedField(&ServerConfig::maxBodyBytes, 64, 1ULL << 30)},
        {"MCP_TLS_CERT", "--tls-cert", stringField(&ServerConfig::tlsCert)},
        {"MCP_TLS_KEY", "--tls-key", stringField(&ServerConfig::tlsKey)},
        {"MCP_LOG_LEVEL", "--log-level", stringField(&ServerConfig::logLevel)},
        {"MCP_LOG_FILE", "--log-file", stringField(&ServerConfig::logFile)},
        {"MCP_GUIDELINES_INDEX", "--guidelines-index", stringField(&ServerConfig::guidelinesIndex)},
        {"MCP_GUIDELINES_MAX_AGE_DAYS", "--guidelines-max-age-days",
         [](ServerConfig& cfg, const std::string& raw) {
             auto v = parseUnsigned(raw);
             if (!v.has_value() || v.value() == 0 || v.value() > 3650) {
                 return false;
             }
             cfg.guidelinesMaxAge = std::chrono::hours(static_cast<long>(v.value()) * 24);
             return true;
         }},
        {"MCP_GUIDELINES_INDEX_URL", "--guidelines-index-url", stringField(&ServerConfig::guidelinesIndexUrl)},
        {"MCP_GUIDELINES_REFRESH_HOURS", "--guidelines-refresh-hours", durationField(&ServerConfig::guidelinesRefresh, 1)},
        {"MCP_DOWNLOAD_DIR", "--download-dir", stringField(&ServerConfig::downloadDir)},
        {"NCCN_LOGIN_URL", "--nccn-login-url", stringField(&ServerConfig::nccnLoginUrl)},
    };
    return kSettings;
}

} // namespace

std::optional<std::string> GetArgValue(int argc, char** argv, const std::string& key) {
    std::optional<std::string> found;
    for (std::size_t i = 1; i < static_cast<std::size_t>(argc); ++i) {
        const char* arg = argv[i];
        if (arg == nullptr) {
            continue;
        }
        std::string a = arg;
        std::size_t eq = a.find('=');
        if (eq != std::string::npos && a.substr(0, eq) == key) {
            found = a.substr(eq + 1);
        }
    }
    return found;
}

std::vector<std::string> SplitList(const std::string& text) {
    std::vector<std::string> out;
    std::size_t start = 0;
    while (start <= text.size()) {
        std::size_t comma = text.find(',', start);
        std::string item = (comma == std::string::npos) ? text.substr(start) : text.substr(start, comma - start);
        const auto first = item.find_first_not_of(" \t");
        const auto last = item.find_last_not_of(" \t");
        if (first != std::string::npos) {
            out.push_back(item.substr(first, last - first + 1));
        }
        if (comma == std::string::npos) {
            break;
        }
        start = comma + 1;
    }
    return out;
}

ServerConfig ServerConfig::Load(int argc, char** argv) {
    ServerConfig cfg;
    for (const auto& s : settings()) {
        if (auto v = GetEnv(s.env)) {
            if (!s.apply(cfg, v.value())) {
                LOG_WARN("Ignoring invalid {}='{}'; keeping default", s.env, v.value());
            }
        }
    }
    // Credentials are environment-only; no command-line option exists for them.
    cfg.nccnUsername = GetEnvOrDefault("NCCN_USERNAME", "");
    cfg.nccnPassword = GetEnvOrDefault("NCCN_PASSWORD", "");
    for (const auto& s : settings()) {
        if (auto v = GetArgValue(argc, argv, s.option)) {
            if (!s.apply(cfg, v.value())) {
                LOG_WARN("Ignoring invalid {}={}", s.option, v.value());
            }
        }
    }
    return cfg;
}

std::vector<std::string> ServerConfig::Validate() const {
    std::vector<std::string> problems;
    if (transport != "http") {
        problems.push_back("Unsupported transport '" + transport + "' (only 'http' is served)");
    }
    if (mcpPath.empty() || mcpPath.front() != '/') {
        problems.push_back("MCP endpoint path must start with '/': '" + mcpPath + "'");
    }
    if (healthPath.empty() || healthPath.front() != '/') {
        problems.push_back("Health path must start with '/': '" + healthPath + "'");
    }
    if (tlsCert.empty() != tlsKey.empty()) {
        problems.push_back("TLS needs both a certificate and a key");
    }
    if (protocolVersions.empty()) {
        problems.push_back("At least one protocol version must be supported");
    }
    if (downloadDir.empty()) {
        problems.push_back("Download directory must not be empty");
    }
    return problems;
}

SessionConfig ServerConfig::ToSessionConfig() const {
    SessionConfig sc;
    sc.idleTimeout = sessionIdleTimeout;
    sc.sweepInterval = sessionSweepInterval;
    sc.maxSessions = maxSessions;
    sc.supportedVersions = protocolVersions;
    return sc;
}

} // namespace guidemcp
