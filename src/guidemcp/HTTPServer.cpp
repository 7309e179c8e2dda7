//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/guidemcp/HTTPServer.cpp
// Purpose: Streamable HTTP MCP server using Boost.Beast (TLS 1.3 only for HTTPS)
//==========================================================================================================

#include <utility>
#include <thread>
#include <atomic>
#include <sstream>
#include <algorithm>
#include <cctype>
#include <charconv>
#include <mutex>
#include <optional>
#include <unordered_set>

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/thread_pool.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/http.hpp>

#include "logging/Logger.h"
#include "guidemcp/HTTPServer.hpp"
#include "guidemcp/MessageCodec.h"
#include "guidemcp/Protocol.h"
#include "guidemcp/TransportNegotiator.h"
#include "guidemcp/errors/Errors.h"

#include <openssl/ssl.h>

namespace guidemcp {
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
namespace http = boost::beast::http;
using tcp = net::ip::tcp;

namespace {

using StringResponse = http::response<http::string_body>;

// Paths compare equal with or without a trailing slash.
std::string normalizePath(std::string path) {
    while (path.size() > 1 && path.back() == '/') {
        path.pop_back();
    }
    return path;
}

std::string jsonRpcErrorBody(int code, const std::string& message) {
    auto err = CreateErrorResponse(nullptr, code, message);
    return EncodeEnvelope(Envelope(std::move(*err)));
}

// HTTP status carrying a JSON-RPC error; everything else rides on 200.
http::status statusFor(const JSONRPCResponse& response) {
    switch (response.ErrorCode()) {
        case JSONRPCErrorCodes::SessionNotFound: return http::status::not_found;
        case JSONRPCErrorCodes::ParseError:
        case JSONRPCErrorCodes::InvalidRequest: return http::status::bad_request;
        default: return http::status::ok;
    }
}

} // namespace

class HTTPServer::Impl {
public:
    HTTPServer::Options opts;
    SessionManager& sessions;
    MethodDispatcher& dispatcher;
    std::atomic<bool> running{false};
    std::atomic<unsigned short> boundPort{0};

    // Exchanges whose method bodies may still be running; cancelled on shutdown.
    std::mutex inFlightMutex;
    std::unordered_set<StreamContext*> inFlight;

    net::io_context ioc;
    std::unique_ptr<tcp::acceptor> acceptor;
    std::unique_ptr<ssl::context> sslCtx; // present when scheme==https
    std::unique_ptr<net::thread_pool> workers;        // buffered method bodies
    std::unique_ptr<net::thread_pool> streamWorkers;  // streamed method bodies
    std::thread ioThread;

    HTTPServer::ErrorHandler errorHandler;

    Impl(const HTTPServer::Options& o, SessionManager& s, MethodDispatcher& d)
        : opts(o), sessions(s), dispatcher(d) {
        if (opts.scheme == "https") {
            sslCtx = std::make_unique<ssl::context>(ssl::context::tls_server);
            // TLS 1.3 only
            ::SSL_CTX_set_min_proto_version(sslCtx->native_handle(), TLS1_3_VERSION);
            ::SSL_CTX_set_max_proto_version(sslCtx->native_handle(), TLS1_3_VERSION);
            try {
                sslCtx->use_certificate_chain_file(opts.certFile);
                sslCtx->use_private_key_file(opts.keyFile, ssl::context::file_format::pem);
            } catch (const std::exception& e) {
                LOG_ERROR("HTTPServer: failed to load certificate/key: {}", e.what());
                throw;
            }
            sslCtx->set_options(
                ssl::context::default_workarounds | ssl::context::no_sslv2 | ssl::context::no_sslv3 |
                ssl::context::no_tlsv1 | ssl::context::no_tlsv1_1 | ssl::context::no_tlsv1_2);
        }
        workers = std::make_unique<net::thread_pool>(std::max<std::size_t>(1, opts.workerThreads));
        streamWorkers = std::make_unique<net::thread_pool>(std::max<std::size_t>(1, opts.streamWorkerThreads));
    }

    ~Impl() {
        running.store(false);
        if (ioThread.joinable()) {
            ioc.stop();
            ioThread.join();
        }
        cancelInFlight();
        for (auto* pool : {workers.get(), streamWorkers.get()}) {
            if (pool) {
                pool->stop();
                pool->join();
            }
        }
    }

    // Registers an exchange for shutdown cancellation while it is in scope.
    struct InFlightGuard {
        Impl& impl;
        StreamContext& ctx;
        InFlightGuard(Impl& i, StreamContext& c) : impl(i), ctx(c) {
            std::lock_guard<std::mutex> lk(impl.inFlightMutex);
            impl.inFlight.insert(&ctx);
        }
        ~InFlightGuard() {
            std::lock_guard<std::mutex> lk(impl.inFlightMutex);
            impl.inFlight.erase(&ctx);
        }
        InFlightGuard(const InFlightGuard&) = delete;
        InFlightGuard& operator=(const InFlightGuard&) = delete;
    };

    void cancelInFlight() {
        std::lock_guard<std::mutex> lk(inFlightMutex);
        if (!inFlight.empty()) {
            LOG_INFO("HTTPServer cancelling {} in-flight request(s)", inFlight.size());
        }
        for (StreamContext* ctx : inFlight) {
            ctx->Cancel();
        }
    }

    void setError(const std::string& msg) {
        LOG_ERROR("{}", msg);
        if (errorHandler) { errorHandler(msg); }
    }

    bool isMcpPath(const std::string& path) const {
        return normalizePath(path) == normalizePath(opts.mcpPath);
    }

    bool isHealthPath(const std::string& path) const {
        return path == "/" || normalizePath(path) == normalizePath(opts.healthPath);
    }

    //======================================================================================================
    // Connection coroutines
    //======================================================================================================
    net::awaitable<void> session_plain(tcp::socket socket) {
        try {
            boost::beast::tcp_stream stream(std::move(socket));
            co_await serve(stream);
            boost::system::error_code ec;
            stream.socket().shutdown(tcp::socket::shutdown_send, ec);
        } catch (const std::exception& e) {
            if (!running.load()) {
                LOG_DEBUG("HTTPServer plain session suppressed during shutdown: {}", e.what());
            } else {
                setError(std::string("HTTPServer plain session error: ") + e.what());
            }
        }
        co_return;
    }

    net::awaitable<void> session_tls(tcp::socket socket) {
        try {
            ssl::stream<tcp::socket> tls(std::move(socket), *sslCtx);
            co_await tls.async_handshake(ssl::stream_base::server, net::use_awaitable);
            co_await serve(tls);
            boost::system::error_code ec;
            tls.shutdown(ec);
        } catch (const std::exception& e) {
            if (!running.load()) {
                LOG_DEBUG("HTTPServer TLS session suppressed during shutdown: {}", e.what());
            } else {
                setError(std::string("HTTPServer TLS session error: ") + e.what());
            }
        }
        co_return;
    }

    // Reads requests until the client closes, a response forbids keep-alive, or a read fails.
    template <class Stream>
    net::awaitable<void> serve(Stream& stream) {
        boost::beast::flat_buffer buffer;
        for (;;) {
            http::request_parser<http::string_body> parser;
            parser.body_limit(opts.maxBodyBytes);
            boost::system::error_code ec;
            co_await http::async_read(stream, buffer, parser, net::redirect_error(net::use_awaitable, ec));
            if (ec == http::error::end_of_stream) {
                break;
            }
            if (ec == http::error::body_limit) {
                LOG_WARN("Rejecting request body larger than {} bytes", opts.maxBodyBytes);
                StringResponse res{http::status::payload_too_large, 11};
                res.set(http::field::content_type, MediaTypes::Json);
                res.body() = jsonRpcErrorBody(JSONRPCErrorCodes::InvalidRequest, "Request body too large");
                res.keep_alive(false);
                res.prepare_payload();
                co_await writeResponse(stream, res);
                break;
            }
            if (ec) {
                LOG_DEBUG("HTTPServer read ended: {}", ec.message());
                break;
            }
            const bool keepAlive = co_await handleRequest(stream, parser.get());
            if (!keepAlive) {
                break;
            }
        }
        co_return;
    }

    template <class Stream>
    net::awaitable<bool> writeResponse(Stream& stream, StringResponse& res) {
        boost::system::error_code ec;
        co_await http::async_write(stream, res, net::redirect_error(net::use_awaitable, ec));
        if (ec) {
            LOG_DEBUG("HTTPServer write failed: {}", ec.message());
            co_return false;
        }
        co_return res.keep_alive();
    }

    StringResponse makeResponse(const http::request<http::string_body>& req, http::status status,
                                std::string body, const char* contentType = MediaTypes::Json) {
        StringResponse res{status, req.version()};
        res.set(http::field::content_type, contentType);
        res.keep_alive(req.keep_alive());
        res.body() = std::move(body);
        res.prepare_payload();
        return res;
    }

    //======================================================================================================
    // Request routing
    //======================================================================================================
    template <class Stream>
    net::awaitable<bool> handleRequest(Stream& stream, http::request<http::string_body>& req) {
        std::string target(req.target());
        const std::string path = target.substr(0, target.find('?'));
        const http::verb verb = req.method();

        if (isMcpPath(path)) {
            if (verb == http::verb::post) {
                co_return co_await handlePost(stream, req);
            }
            if (verb == http::verb::delete_) {
                auto res = handleDelete(req);
                co_return co_await writeResponse(stream, res);
            }
            if (verb == http::verb::get || verb == http::verb::head) {
                if (!ParseAccept(std::string(req[http::field::accept])).explicitEventStream) {
                    auto res = liveness(req);
                    co_return co_await writeResponse(stream, res);
                }
                LOG_DEBUG("GET stream requested on {}; no standalone server stream is offered", path);
            }
            auto res = makeResponse(req, http::status::method_not_allowed, "{\"error\":\"Method not allowed\"}");
            res.set(http::field::allow, "GET, HEAD, POST, DELETE");
            co_return co_await writeResponse(stream, res);
        }

        if (isHealthPath(path)) {
            if (verb == http::verb::get || verb == http::verb::head) {
                auto res = liveness(req);
                co_return co_await writeResponse(stream, res);
            }
            auto res = makeResponse(req, http::status::method_not_allowed, "{\"error\":\"Method not allowed\"}");
            res.set(http::field::allow, "GET, HEAD");
            co_return co_await writeResponse(stream, res);
        }

        auto res = makeResponse(req, http::status::not_found, "{\"error\":\"Not found\"}");
        co_return co_await writeResponse(stream, res);
    }

    // Liveness never looks at sessions beyond the manager's health flag.
    StringResponse liveness(const http::request<http::string_body>& req) {
        const bool healthy = running.load() && sessions.IsHealthy();
        auto res = makeResponse(req, healthy ? http::status::ok : http::status::service_unavailable,
                                healthy ? "{\"status\":\"ok\"}" : "{\"status\":\"degraded\"}");
        res.set(http::field::cache_control, "no-store");
        if (req.method() == http::verb::head) {
            const auto length = res.body().size();
            res.body().clear();
            res.content_length(length);
        }
        return res;
    }

    StringResponse handleDelete(const http::request<http::string_body>& req) {
        const std::string sessionId(req[Headers::SessionId]);
        if (sessionId.empty()) {
            return makeResponse(req, http::status::bad_request,
                                jsonRpcErrorBody(JSONRPCErrorCodes::InvalidRequest,
                                                 std::string("Missing ") + Headers::SessionId + " header"));
        }
        if (!sessions.Close(sessionId, "terminated by client")) {
            return makeResponse(req, http::status::not_found,
                                jsonRpcErrorBody(JSONRPCErrorCodes::SessionNotFound, "Session not found"));
        }
        StringResponse res{http::status::no_content, req.version()};
        res.keep_alive(req.keep_alive());
        res.prepare_payload();
        return res;
    }

    template <class Stream>
    net::awaitable<bool> handlePost(Stream& stream, http::request<http::string_body>& req) {
        if (!IsJsonContentType(std::string(req[http::field::content_type]))) {
            auto res = makeResponse(req, http::status::unsupported_media_type,
                                    jsonRpcErrorBody(JSONRPCErrorCodes::InvalidRequest,
                                                     std::string("Content-Type must be ") + MediaTypes::Json));
            co_return co_await writeResponse(stream, res);
        }

        const std::string accept(req[http::field::accept]);
        NegotiationResult preflight = Negotiate(accept, false);
        if (const auto* failure = std::get_if<NegotiationFailure>(&preflight)) {
            LOG_DEBUG("Not acceptable: Accept='{}'", accept);
            auto res = makeResponse(req, static_cast<http::status>(failure->httpStatus),
                                    jsonRpcErrorBody(JSONRPCErrorCodes::InvalidRequest, "Not Acceptable: " + failure->reason));
            co_return co_await writeResponse(stream, res);
        }

        DecodeResult decoded = DecodeEnvelope(req.body());
        if (const auto* error = std::get_if<DecodeError>(&decoded)) {
            LOG_DEBUG("Rejecting undecodable body ({}): {}", error->code, error->message);
            auto response = MakeDecodeErrorResponse(*error);
            auto res = makeResponse(req, http::status::bad_request, EncodeEnvelope(Envelope(std::move(*response))));
            co_return co_await writeResponse(stream, res);
        }
        Envelope& envelope = std::get<Envelope>(decoded);
        const std::string sessionId(req[Headers::SessionId]);

        if (auto* request = std::get_if<JSONRPCRequest>(&envelope)) {
            co_return co_await handleJsonRpcRequest(stream, req, *request, sessionId, accept);
        }

        // Notifications and client responses are acknowledged without a body.
        auto session = sessions.Find(sessionId);
        if (!session) {
            auto res = makeResponse(req, sessionId.empty() ? http::status::bad_request : http::status::not_found,
                                    jsonRpcErrorBody(JSONRPCErrorCodes::SessionNotFound, "Session not found"));
            co_return co_await writeResponse(stream, res);
        }
        if (auto* note = std::get_if<JSONRPCNotification>(&envelope)) {
            dispatcher.HandleNotification(session, *note);
        } else {
            LOG_DEBUG("Session {}: client {} for id {} acknowledged", session->Id(),
                      ToString(KindOf(envelope)), IdToString(std::get<JSONRPCResponse>(envelope).id));
        }
        StringResponse res{http::status::accepted, req.version()};
        res.keep_alive(req.keep_alive());
        res.prepare_payload();
        co_return co_await writeResponse(stream, res);
    }

    template <class Stream>
    net::awaitable<bool> handleJsonRpcRequest(Stream& stream, http::request<http::string_body>& req,
                                              const JSONRPCRequest& rpc, const std::string& sessionId,
                                              const std::string& accept) {
        std::shared_ptr<Session> session;
        const bool isInitialize = rpc.method == Methods::Initialize;
        if (isInitialize) {
            std::optional<StringResponse> rejected;
            try {
                session = dispatcher.OpenSession(rpc);
            } catch (const errors::McpException& e) {
                LOG_WARN("initialize rejected: {}", e.what());
                auto response = errors::makeErrorResponse(rpc.id, e.error());
                rejected = makeResponse(req, statusFor(*response), EncodeEnvelope(Envelope(std::move(*response))));
            } catch (const std::exception& e) {
                LOG_ERROR("initialize failed to open a session: {}", e.what());
                auto response = CreateErrorResponse(rpc.id, JSONRPCErrorCodes::InternalError, "Internal error");
                rejected = makeResponse(req, statusFor(*response), EncodeEnvelope(Envelope(std::move(*response))));
            }
            if (rejected) {
                co_return co_await writeResponse(stream, *rejected);
            }
        } else {
            session = sessions.Find(sessionId);
            if (!session) {
                LOG_DEBUG("{} for unknown session '{}'", rpc.method, sessionId);
                auto response = CreateErrorResponse(rpc.id, JSONRPCErrorCodes::SessionNotFound,
                                                    sessionId.empty() ? std::string("Missing ") + Headers::SessionId + " header"
                                                                      : std::string("Session not found"));
                auto res = makeResponse(req, sessionId.empty() ? http::status::bad_request : http::status::not_found,
                                        EncodeEnvelope(Envelope(std::move(*response))));
                co_return co_await writeResponse(stream, res);
            }
            const std::string headerVersion(req[Headers::ProtocolVersion]);
            if (!headerVersion.empty() && !sessions.IsVersionSupported(headerVersion)) {
                auto response = CreateErrorResponse(rpc.id, JSONRPCErrorCodes::InvalidRequest,
                                                    "Unsupported " + std::string(Headers::ProtocolVersion) + ": " + headerVersion);
                auto res = makeResponse(req, http::status::bad_request, EncodeEnvelope(Envelope(std::move(*response))));
                co_return co_await writeResponse(stream, res);
            }
        }

        NegotiationResult negotiated = Negotiate(accept, dispatcher.MayStream(rpc));
        StreamContext ctx(std::get<ResponseMode>(negotiated));
        InFlightGuard guard(*this, ctx);
        LOG_DEBUG("{} in session {}: {} response", rpc.method, session->Id(), ToString(ctx.Mode()));

        // initialize is answered once its outcome is known, so a rejected handshake never
        // carries a session id.
        const bool streamed = ctx.Mode() == ResponseMode::Streamed;
        if (streamed && !isInitialize) {
            co_await streamResponse(stream, req, rpc, session, ctx);
            co_return false;
        }

        auto token = ctx.Token();
        auto dispatchBody = [this, session, &rpc, token]() -> net::awaitable<std::shared_ptr<JSONRPCResponse>> {
            co_return std::shared_ptr<JSONRPCResponse>(dispatcher.Dispatch(session, rpc, token));
        };
        std::shared_ptr<JSONRPCResponse> response =
            co_await net::co_spawn(workers->get_executor(), std::move(dispatchBody), net::use_awaitable);

        if (isInitialize && (!response || response->IsError())) {
            sessions.Close(session->Id(), "initialize failed");
        }
        if (!response) {
            // Cancelled: nothing is owed to the client.
            StringResponse res{http::status::no_content, req.version()};
            res.keep_alive(req.keep_alive());
            res.prepare_payload();
            co_return co_await writeResponse(stream, res);
        }

        const std::string json = EncodeEnvelope(Envelope(*response));
        auto res = makeResponse(req, streamed ? http::status::ok : statusFor(*response),
                                streamed ? FormatSseEvent(json) : json, ctx.ContentType());
        if (streamed) {
            res.set(http::field::cache_control, "no-cache");
            res.keep_alive(false);
        }
        if (isInitialize && !response->IsError()) {
            res.set(Headers::SessionId, session->Id());
        }
        ctx.Commit();
        co_return co_await writeResponse(stream, res);
    }

    //======================================================================================================
    // Streamed responses: chunked text/event-stream, one event per frame, keepalive comments while the
    // method body is silent. The connection is closed afterwards.
    // Notes:
    //   The body runs on the stream pool. The coroutine never blocks the I/O thread: it drains ready
    //   frames and otherwise sleeps on a timer that the producer cancels when a frame arrives.
    //======================================================================================================
    template <class Stream>
    net::awaitable<void> streamResponse(Stream& stream, const http::request<http::string_body>& req,
                                        const JSONRPCRequest& rpc, const std::shared_ptr<Session>& session,
                                        StreamContext& ctx) {
        auto executor = co_await net::this_coro::executor;
        auto wakeup = std::make_shared<net::steady_timer>(executor);
        std::weak_ptr<net::steady_timer> weakWakeup = wakeup;

        std::unique_ptr<FrameSource> source = dispatcher.Start(
            session, rpc, ctx.Token(),
            [this](std::function<void()> body) { net::post(*streamWorkers, std::move(body)); });
        source->SetNotify([executor, weakWakeup]() {
            net::post(executor, [weakWakeup]() {
                if (auto timer = weakWakeup.lock()) {
                    timer->cancel();
                }
            });
        });

        http::response<http::empty_body> head{http::status::ok, req.version()};
        head.set(http::field::content_type, ctx.ContentType());
        head.set(http::field::cache_control, "no-cache");
        head.set(Headers::SessionId, session->Id());
        head.chunked(true);
        head.keep_alive(false);
        http::response_serializer<http::empty_body> sr{head};

        boost::system::error_code ec;
        co_await http::async_write_header(stream, sr, net::redirect_error(net::use_awaitable, ec));
        ctx.Commit();
        if (ec) {
            onDisconnect(ctx, *source, rpc, session, ec);
            co_return;
        }

        auto keepaliveDue = std::chrono::steady_clock::now() + opts.streamKeepalive;
        for (;;) {
            std::optional<OutputFrame> frame;
            const FrameSource::Poll poll = source->Next(std::chrono::milliseconds(0), frame);
            if (poll == FrameSource::Poll::End) {
                co_await net::async_write(stream, http::make_chunk_last(), net::redirect_error(net::use_awaitable, ec));
                break;
            }

            std::string payload;
            if (poll == FrameSource::Poll::Timeout) {
                if (std::chrono::steady_clock::now() < keepaliveDue) {
                    wakeup->expires_at(keepaliveDue);
                    boost::system::error_code waitEc;
                    co_await wakeup->async_wait(net::redirect_error(net::use_awaitable, waitEc));
                    continue;
                }
                payload = FormatSseKeepalive();
            } else {
                const std::string json = std::visit(
                    [](const auto& f) { return EncodeEnvelope(Envelope(f)); }, frame.value());
                payload = FormatSseEvent(json);
            }
            co_await net::async_write(stream, http::make_chunk(net::buffer(payload)),
                                      net::redirect_error(net::use_awaitable, ec));
            if (ec) {
                onDisconnect(ctx, *source, rpc, session, ec);
                break;
            }
            keepaliveDue = std::chrono::steady_clock::now() + opts.streamKeepalive;
        }
        co_return;
    }

    void onDisconnect(StreamContext& ctx, FrameSource& source, const JSONRPCRequest& rpc,
                      const std::shared_ptr<Session>& session, const boost::system::error_code& ec) {
        LOG_WARN("client disconnected mid-stream (session {}, request {}): {}",
                 session->Id(), IdToString(rpc.id), ec.message());
        ctx.Cancel();
        source.Cancel();
    }

    //======================================================================================================
    // Listener
    //======================================================================================================
    void bind() {
        // Validate port strictly: numeric and within [0, 65535]
        unsigned long portNum = 0;
        auto [ptr, perr] = std::from_chars(opts.port.data(), opts.port.data() + opts.port.size(), portNum);
        if (opts.port.empty() || perr != std::errc() || ptr != opts.port.data() + opts.port.size() || portNum > 65535ul) {
            throw std::invalid_argument("HTTPServer invalid port: '" + opts.port + "'");
        }
        tcp::resolver resolver(ioc);
        auto r = resolver.resolve(opts.address, opts.port);
        tcp::endpoint ep = *r.begin();

        acceptor = std::make_unique<tcp::acceptor>(ioc);
        acceptor->open(ep.protocol());
        acceptor->set_option(tcp::acceptor::reuse_address(true));
        acceptor->bind(ep);
        acceptor->listen();
        boundPort.store(acceptor->local_endpoint().port());
    }

    net::awaitable<void> acceptLoop() {
        try {
            while (running.load()) {
                tcp::socket socket = co_await acceptor->async_accept(net::use_awaitable);
                if (opts.scheme == "https") {
                    net::co_spawn(ioc, session_tls(std::move(socket)), net::detached);
                } else {
                    net::co_spawn(ioc, session_plain(std::move(socket)), net::detached);
                }
            }
        } catch (const std::exception& e) {
            if (!running.load()) {
                // operation_aborted when the acceptor is closed
                LOG_DEBUG("HTTPServer accept suppressed during shutdown: {}", e.what());
            } else {
                setError(std::string("HTTPServer accept error: ") + e.what());
            }
        }
        co_return;
    }
};

HTTPServer::HTTPServer(const Options& opts, SessionManager& sessions, MethodDispatcher& dispatcher)
    : pImpl(std::make_unique<Impl>(opts, sessions, dispatcher)) {}

HTTPServer::~HTTPServer() = default;

std::future<void> HTTPServer::Start() {
    std::promise<void> ready; auto fut = ready.get_future();
    try {
        pImpl->bind();
    } catch (const std::exception& e) {
        pImpl->setError(std::string("HTTPServer failed to listen on ") + pImpl->opts.address + ":" +
                        pImpl->opts.port + ": " + e.what());
        ready.set_exception(std::current_exception());
        return fut;
    }
    pImpl->running.store(true);
    LOG_INFO("HTTPServer listening on {}://{}:{}{} (health {})", pImpl->opts.scheme, pImpl->opts.address,
             pImpl->boundPort.load(), pImpl->opts.mcpPath, pImpl->opts.healthPath);
    net::co_spawn(pImpl->ioc, pImpl->acceptLoop(), net::detached);
    pImpl->ioThread = std::thread([this]() {
        try {
            pImpl->ioc.run();
        } catch (const std::exception& e) {
            pImpl->setError(std::string("HTTPServer I/O loop error: ") + e.what());
        }
    });
    ready.set_value();
    return fut;
}

std::future<void> HTTPServer::Stop() {
    std::promise<void> done; auto fut = done.get_future();
    pImpl->running.store(false);
    if (pImpl->acceptor) {
        boost::system::error_code ec; pImpl->acceptor->close(ec);
    }
    pImpl->ioc.stop();
    if (pImpl->ioThread.joinable()) {
        pImpl->ioThread.join();
    }
    pImpl->cancelInFlight();
    LOG_INFO("HTTPServer stopped");
    done.set_value();
    return fut;
}

void HTTPServer::SetErrorHandler(ErrorHandler handler) {
    pImpl->errorHandler = std::move(handler);
}

unsigned short HTTPServer::LocalPort() const {
    return pImpl->boundPort.load();
}

bool HTTPServer::IsAccepting() const {
    return pImpl->running.load();
}

const HTTPServer::Options& HTTPServer::GetOptions() const {
    return pImpl->opts;
}

HTTPServer::Options HTTPServerFactory::ParseOptions(const std::string& config) {
    HTTPServer::Options opts;
    // Factory default: http if scheme omitted
    opts.scheme = "http";

    std::string cfg = config;
    // Trim leading/trailing spaces
    auto trim = [](std::string& s){
        auto notSpace = [](unsigned char c){ return !std::isspace(c); };
        s.erase(s.begin(), std::find_if(s.begin(), s.end(), notSpace));
        s.erase(std::find_if(s.rbegin(), s.rend(), notSpace).base(), s.end());
    };
    trim(cfg);

    // Detect scheme
    auto startsWith = [](const std::string& s, const char* pfx){ return s.rfind(pfx, 0) == 0; };
    if (startsWith(cfg, "http://")) {
        opts.scheme = "http";
        cfg = cfg.substr(7);
    } else if (startsWith(cfg, "https://")) {
        opts.scheme = "https";
        cfg = cfg.substr(8);
    }

    // Split query params
    std::string hostPortPath = cfg;
    std::string query;
    auto qpos = cfg.find('?');
    if (qpos != std::string::npos) {
        hostPortPath = cfg.substr(0, qpos);
        query = cfg.substr(qpos + 1);
    }

    // Path component names the MCP endpoint
    std::string hostPort = hostPortPath;
    auto slash = hostPortPath.find('/');
    if (slash != std::string::npos) {
        hostPort = hostPortPath.substr(0, slash);
        std::string path = hostPortPath.substr(slash);
        if (path.size() > 1) {
            opts.mcpPath = path;
        }
    }
    trim(hostPort);

    // Parse host[:port] including IPv4/IPv6 in [addr]:port form
    if (!hostPort.empty()) {
        if (hostPort.front() == '[') {
            auto rb = hostPort.find(']');
            if (rb != std::string::npos) {
                opts.address = hostPort.substr(1, rb - 1);
                if (rb + 1 < hostPort.size() && hostPort[rb + 1] == ':') {
                    opts.port = hostPort.substr(rb + 2);
                }
            }
        } else {
            auto colon = hostPort.rfind(':');
            if (colon != std::string::npos) {
                opts.address = hostPort.substr(0, colon);
                opts.port = hostPort.substr(colon + 1);
            } else {
                opts.address = hostPort;
            }
        }
        trim(opts.address);
        trim(opts.port);
        if (opts.port.empty()) opts.port = "8000"; // default
    }

    // Parse query parameters
    if (!query.empty()) {
        std::stringstream ss(query);
        std::string kv;
        while (std::getline(ss, kv, '&')) {
            auto eq = kv.find('=');
            std::string key = (eq == std::string::npos) ? kv : kv.substr(0, eq);
            std::string val = (eq == std::string::npos) ? std::string() : kv.substr(eq + 1);
            if (key == "cert") {
                opts.certFile = val;
            } else if (key == "key") {
                opts.keyFile = val;
            } else if (key == "health") {
                opts.healthPath = val;
            } else if (key == "workers") {
                std::size_t n = 0;
                auto [ptr, ec] = std::from_chars(val.data(), val.data() + val.size(), n);
                if (ec == std::errc() && ptr == val.data() + val.size() && n > 0) {
                    opts.workerThreads = n;
                } else {
                    LOG_WARN("HTTPServerFactory: ignoring invalid workers={}", val);
                }
            } else if (key == "stream_workers") {
                std::size_t n = 0;
                auto [ptr, ec] = std::from_chars(val.data(), val.data() + val.size(), n);
                if (ec == std::errc() && ptr == val.data() + val.size() && n > 0) {
                    opts.streamWorkerThreads = n;
                } else {
                    LOG_WARN("HTTPServerFactory: ignoring invalid stream_workers={}", val);
                }
            }
        }
    }
    return opts;
}

std::unique_ptr<HTTPServer> HTTPServerFactory::CreateServer(const std::string& config,
                                                            SessionManager& sessions,
                                                            MethodDispatcher& dispatcher) {
    return std::make_unique<HTTPServer>(ParseOptions(config), sessions, dispatcher);
}

} // namespace guidemcp
