//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: HTTPServer.hpp
// Purpose: Coroutine-based streamable HTTP MCP server using Boost.Beast (TLS 1.3 only for HTTPS)
//==========================================================================================================

#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <string>

#include "guidemcp/MethodDispatcher.h"
#include "guidemcp/SessionManager.h"

namespace guidemcp {

  //==========================================================================================================
  // HTTPServer
  // Purpose: Serves the MCP endpoint (POST for client messages, DELETE for session termination) and the
  //          liveness checks. Accept loop and connection coroutines run on one I/O thread; buffered
  //          method bodies run on a worker thread pool and streamed ones on a separate stream pool.
  // Notes:
  //   SessionManager and MethodDispatcher are not owned and must outlive the server.
  //==========================================================================================================
  class HTTPServer {
  public:
    //==========================================================================================================
    // Options
    // Purpose: Configuration for bind address/port, endpoint paths, TLS files, and execution limits.
    // Fields:
    //   address: Bind address (default: 0.0.0.0)
    //   port: Listen port (default: 8000; "0" picks an ephemeral port)
    //   mcpPath: MCP endpoint path; matched with and without its trailing slash
    //   healthPath: Liveness check path in addition to "/"
    //   scheme: "http" or "https" (TLS 1.3 only for https)
    //   certFile/keyFile: PEM files required when scheme == https
    //   workerThreads: Size of the pool running buffered method bodies
    //   streamWorkerThreads: Size of the pool running streamed method bodies
    //   streamKeepalive: Silence after which a streamed response emits an SSE comment
    //   maxBodyBytes: Larger POST bodies are answered with 413
    //==========================================================================================================
    struct Options {
        std::string address{"0.0.0.0"};
        std::string port{"8000"};
        std::string mcpPath{"/mcp/"};
        std::string healthPath{"/health"};
        std::string scheme{"http"}; // "http" or "https"
        std::string certFile; // PEM (required for https)
        std::string keyFile;  // PEM (required for https)
        std::size_t workerThreads{4};
        std::size_t streamWorkerThreads{4};
        std::chrono::milliseconds streamKeepalive{15000};
        std::size_t maxBodyBytes{1048576};
    };

    using ErrorHandler = std::function<void(const std::string&)>;

    HTTPServer(const Options& opts, SessionManager& sessions, MethodDispatcher& dispatcher);
    ~HTTPServer();

    HTTPServer(const HTTPServer&) = delete;
    HTTPServer& operator=(const HTTPServer&) = delete;

    //==========================================================================================================
    // Binds the listening socket and starts the accept loop on a background I/O thread.
    // Returns:
    //   Future that becomes ready once the socket is listening; it carries the exception when the
    //   address cannot be resolved or bound.
    //==========================================================================================================
    std::future<void> Start();

    //==========================================================================================================
    // Stops the server: closes the acceptor, stops the I/O context, joins the I/O thread and cancels
    // every in-flight request. The worker pools are joined when the server is destroyed.
    //==========================================================================================================
    std::future<void> Stop();

    // Sets the error handler for transport/server errors.
    void SetErrorHandler(ErrorHandler handler);

    // Port actually bound (useful with port "0"); 0 before Start().
    unsigned short LocalPort() const;

    // True between a successful Start() and Stop().
    bool IsAccepting() const;

    const Options& GetOptions() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
  };

  //==========================================================================================================
  // HTTPServerFactory
  // Purpose: Builds an HTTPServer from a configuration string in uri format:
  //            - "http://<address>:<port>[/<mcp path>]" (e.g., http://127.0.0.1:0/mcp/)
  //            - "https://<address>:<port>[/<mcp path>]?cert=<pem>&key=<pem>"
  //          Recognized query parameters: cert, key, health, workers, stream_workers. Unknown parameters are ignored.
  //          If scheme is omitted, defaults to http.
  //==========================================================================================================
  class HTTPServerFactory {
  public:
    static HTTPServer::Options ParseOptions(const std::string& config);

    std::unique_ptr<HTTPServer> CreateServer(const std::string& config,
                                             SessionManager& sessions,
                                             MethodDispatcher& dispatcher);
  };

} // namespace guidemcp
