//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ServerConfig.h
// Purpose: Server configuration from environment variables overridden by --key=value options
//==========================================================================================================

#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "guidemcp/Protocol.h"
#include "guidemcp/SessionManager.h"

namespace guidemcp {

//==========================================================================================================
// ServerConfig
// Purpose: Every tunable of the guideline server. Each field has an environment variable and a
//          command-line option; the option wins when both are present.
//
//   Field                  Environment                      Option
//   transport              MCP_TRANSPORT                    --transport
//   host                   MCP_HOST                         --host
//   port                   MCP_PORT                         --port
//   mcpPath                MCP_PATH                         --path
//   healthPath             MCP_HEALTH_PATH                  --health-path
//   sessionIdleTimeout     MCP_SESSION_IDLE_TIMEOUT_MS      --session-idle-timeout-ms
//   sessionSweepInterval   MCP_SESSION_SWEEP_INTERVAL_MS    --session-sweep-interval-ms
//   maxSessions            MCP_MAX_SESSIONS                 --max-sessions
//   protocolVersions       MCP_PROTOCOL_VERSIONS            --protocol-versions (comma separated)
//   workerThreads          MCP_WORKER_THREADS               --worker-threads
//   streamWorkerThreads    MCP_STREAM_WORKER_THREADS        --stream-worker-threads
//   streamKeepalive        MCP_STREAM_KEEPALIVE_MS          --stream-keepalive-ms
//   maxBodyBytes           MCP_MAX_BODY_BYTES               --max-body-bytes
//   tlsCert / tlsKey       MCP_TLS_CERT / MCP_TLS_KEY       --tls-cert / --tls-key
//   logLevel               MCP_LOG_LEVEL                    --log-level
//   logFile                MCP_LOG_FILE                     --log-file
//   guidelinesIndex        MCP_GUIDELINES_INDEX             --guidelines-index
//   guidelinesMaxAge       MCP_GUIDELINES_MAX_AGE_DAYS      --guidelines-max-age-days
//   guidelinesIndexUrl     MCP_GUIDELINES_INDEX_URL         --guidelines-index-url
//   guidelinesRefresh      MCP_GUIDELINES_REFRESH_HOURS     --guidelines-refresh-hours
//   downloadDir            MCP_DOWNLOAD_DIR                 --download-dir
//   nccnLoginUrl           NCCN_LOGIN_URL                   --nccn-login-url
//   nccnUsername           NCCN_USERNAME                    (environment only)
//   nccnPassword           NCCN_PASSWORD                    (environment only)
//==========================================================================================================
struct ServerConfig {
    std::string transport{"http"};
    std::string host{"0.0.0.0"};
    unsigned short port{8000};
    std::string mcpPath{"/mcp/"};
    std::string healthPath{"/health"};
    std::chrono::milliseconds sessionIdleTimeout{1800000};
    std::chrono::milliseconds sessionSweepInterval{30000};
    std::size_t maxSessions{1024};
    std::vector<std::string> protocolVersions{DefaultProtocolVersions()};
    std::size_t workerThreads{4};
    std::size_t streamWorkerThreads{4};
    std::chrono::milliseconds streamKeepalive{15000};
    std::size_t maxBodyBytes{1048576};
    std::string tlsCert;
    std::string tlsKey;
    std::string logLevel{"INFO"};
    std::string logFile;
    std::string guidelinesIndex{"nccn_guidelines_index.json"};
    std::chrono::hours guidelinesMaxAge{std::chrono::hours(24 * 7)};
    std::string guidelinesIndexUrl;
    std::chrono::hours guidelinesRefresh{std::chrono::hours(24)};
    std::string downloadDir{"downloads"};
    std::string nccnLoginUrl{"https://www.nccn.org/login/Index/"};
    std::string nccnUsername;
    std::string nccnPassword;

    //======================================================================================================
    // Load
    // Purpose: Defaults, then environment, then command line. Malformed numbers are logged and the
    //          previous value is kept.
    //======================================================================================================
    static ServerConfig Load(int argc, char** argv);

    // Human-readable problems that make the configuration unusable; empty when valid.
    std::vector<std::string> Validate() const;

    bool UseTls() const { return !tlsCert.empty() || !tlsKey.empty(); }

    bool HasNccnCredentials() const { return !nccnUsername.empty() && !nccnPassword.empty(); }

    SessionConfig ToSessionConfig() const;
};

//==========================================================================================================
// GetArgValue
// Purpose: Parses simple key=value style command-line options.
// Args:
//   key: Option name including leading dashes (e.g., "--port").
// Returns:
//   Value of the last occurrence, or nullopt when absent.
//==========================================================================================================
std::optional<std::string> GetArgValue(int argc, char** argv, const std::string& key);

// Splits a comma separated list, trimming blanks and dropping empty items.
std::vector<std::string> SplitList(const std::string& text);

} // namespace guidemcp
