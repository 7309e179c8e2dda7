//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: main.cpp
// Purpose: NCCN guideline MCP server over streamable HTTP
//==========================================================================================================

#include <atomic>
#include <chrono>
#include <csignal>
#include <exception>
#include <thread>

#include "logging/Logger.h"
#include "guidemcp/GuidelineCatalog.h"
#include "guidemcp/HTTPServer.hpp"
#include "guidemcp/MethodDispatcher.h"
#include "guidemcp/ServerConfig.h"
#include "guidemcp/SessionManager.h"
#include "guidemcp/version.h"

using namespace guidemcp;

static std::atomic<bool> gRunning{true};

static void handleSig(int) {
    gRunning.store(false);
}

int main(int argc, char** argv) {
    FUNC_SCOPE();
    ::signal(SIGTERM, handleSig);
    ::signal(SIGINT, handleSig);

    ServerConfig config = ServerConfig::Load(argc, argv);
    Logger::setLogLevelFromString(config.logLevel);
    if (!config.logFile.empty()) {
        Logger::setLogFile(config.logFile);
    }

    auto problems = config.Validate();
    if (!problems.empty()) {
        for (const auto& p : problems) {
            LOG_ERROR("Configuration error: {}", p);
        }
        return 2;
    }

    LOG_INFO("{} {} starting (transport={}, host={}, port={}, path={})", getServerName(), getVersionString(),
             config.transport, config.host, config.port, config.mcpPath);

    SessionManager sessions(config.ToSessionConfig());
    IdleSessionSweeper sweeper(sessions);

    if (config.HasNccnCredentials()) {
        LOG_INFO("NCCN authentication configured for user: {}", config.nccnUsername);
    } else {
        LOG_WARN("NCCN authentication not configured; set NCCN_USERNAME and NCCN_PASSWORD for full access");
    }

    GuidelineCatalogOptions catalogOptions;
    catalogOptions.indexPath = config.guidelinesIndex;
    catalogOptions.maxAge = config.guidelinesMaxAge;
    catalogOptions.indexUrl = config.guidelinesIndexUrl;
    catalogOptions.downloadDir = config.downloadDir;
    catalogOptions.loginUrl = config.nccnLoginUrl;
    if (config.HasNccnCredentials()) {
        catalogOptions.username = config.nccnUsername;
        catalogOptions.password = config.nccnPassword;
    }
    if (!catalogOptions.pdfText) {
        LOG_WARN("Built without poppler-cpp; extract_content will report that extraction is unavailable");
    }
    GuidelineCatalog catalog(catalogOptions);
    // Startup does not wait for the index; the first tool call reloads it if needed.
    catalog.StartRefresher(config.guidelinesRefresh);

    MethodDispatcher dispatcher(sessions, catalog, Implementation{getServerName(), getVersionString()},
                                "Use list_guidelines to browse NCCN guidelines by category and get_index for the raw index. "
                                "download_pdf fetches a guideline PDF and extract_content reads pages from it.");

    HTTPServer::Options opts;
    opts.address = config.host;
    opts.port = std::to_string(config.port);
    opts.mcpPath = config.mcpPath;
    opts.healthPath = config.healthPath;
    opts.workerThreads = config.workerThreads;
    opts.streamWorkerThreads = config.streamWorkerThreads;
    opts.streamKeepalive = config.streamKeepalive;
    opts.maxBodyBytes = config.maxBodyBytes;
    if (config.UseTls()) {
        opts.scheme = "https";
        opts.certFile = config.tlsCert;
        opts.keyFile = config.tlsKey;
    }

    std::unique_ptr<HTTPServer> server;
    try {
        server = std::make_unique<HTTPServer>(opts, sessions, dispatcher);
        server->SetErrorHandler([](const std::string& err) {
            LOG_ERROR("Server error: {}", err);
        });
        server->Start().get();
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to start HTTP server: {}", e.what());
        sessions.Shutdown();
        return 1;
    }
    sweeper.Start();
    LOG_INFO("Serving MCP on {}://{}:{}{} (health {})", opts.scheme, opts.address, server->LocalPort(),
             opts.mcpPath, opts.healthPath);

    while (gRunning.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    LOG_INFO("Shutting down");
    sweeper.Stop();
    sessions.Shutdown();
    (void)server->Stop().wait();
    server.reset();
    catalog.StopRefresher();
    LOG_INFO("{} stopped", getServerName());
    return 0;
}
