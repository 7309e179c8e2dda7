//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/guidemcp/HttpFetcher.cpp
// Purpose: Blocking HTTP/HTTPS client (Boost.Beast, TLS 1.3 only) for guideline downloads
//==========================================================================================================

#include <cctype>
#include <exception>
#include <optional>
#include <sstream>
#include <stdexcept>

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/http.hpp>

#include "guidemcp/HttpFetcher.h"
#include "logging/Logger.h"

#include <openssl/ssl.h>

namespace guidemcp {
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
namespace http = boost::beast::http;
using tcp = net::ip::tcp;

namespace {

using StringResponse = http::response<http::string_body>;

bool isRedirect(unsigned status) {
    return status == 301 || status == 302 || status == 303 || status == 307 || status == 308;
}

std::string hostHeader(const UrlParts& u) {
    const bool defaultPort = (u.scheme == "https" && u.port == "443") || (u.scheme == "http" && u.port == "80");
    const std::string host = u.host.find(':') != std::string::npos ? "[" + u.host + "]" : u.host;
    return defaultPort ? host : host + ":" + u.port;
}

// One request/response on a fresh connection.
net::awaitable<StringResponse> coExchange(UrlParts u, http::request<http::string_body> req, HttpFetchOptions options) {
    auto executor = co_await net::this_coro::executor;
    tcp::resolver resolver(executor);
    auto results = co_await resolver.async_resolve(u.host, u.port, net::use_awaitable);

    boost::beast::flat_buffer buffer;
    http::response_parser<http::string_body> parser;
    parser.body_limit(options.maxBodyBytes);

    if (u.scheme == "https") {
        ssl::context ctx(ssl::context::tls_client);
        // TLS 1.3 only
        ::SSL_CTX_set_min_proto_version(ctx.native_handle(), TLS1_3_VERSION);
        ::SSL_CTX_set_max_proto_version(ctx.native_handle(), TLS1_3_VERSION);
        if (!options.caFile.empty()) {
            ctx.load_verify_file(options.caFile);
        } else {
            try {
                ctx.set_default_verify_paths();
            } catch (const std::exception& e) {
                LOG_DEBUG("HTTPS: set_default_verify_paths failed: {}", e.what());
            }
        }
        ctx.set_verify_mode(ssl::verify_peer);

        boost::beast::ssl_stream<boost::beast::tcp_stream> stream(executor, ctx);
        if (!::SSL_set_tlsext_host_name(stream.native_handle(), u.serverName.c_str())) {
            throw std::runtime_error("HTTPS: failed to set SNI hostname " + u.serverName);
        }
        (void)::SSL_set1_host(stream.native_handle(), u.serverName.c_str());

        stream.next_layer().expires_after(options.connectTimeout);
        co_await stream.next_layer().async_connect(results, net::use_awaitable);
        co_await stream.async_handshake(ssl::stream_base::client, net::use_awaitable);

        stream.next_layer().expires_after(options.readTimeout);
        co_await http::async_write(stream, req, net::use_awaitable);
        co_await http::async_read(stream, buffer, parser, net::use_awaitable);

        boost::system::error_code ec;
        co_await stream.async_shutdown(net::redirect_error(net::use_awaitable, ec));
    } else {
        boost::beast::tcp_stream stream(executor);
        stream.expires_after(options.connectTimeout);
        co_await stream.async_connect(results, net::use_awaitable);

        stream.expires_after(options.readTimeout);
        co_await http::async_write(stream, req, net::use_awaitable);
        co_await http::async_read(stream, buffer, parser, net::use_awaitable);

        boost::system::error_code ec;
        stream.socket().shutdown(tcp::socket::shutdown_both, ec);
    }
    co_return parser.release();
}

// Runs one exchange on the calling thread; a stop request abandons it.
StringResponse runExchange(const UrlParts& u, http::request<http::string_body> req, const HttpFetchOptions& options,
                           const std::stop_token& stop) {
    net::io_context ioc;
    std::optional<StringResponse> response;
    std::exception_ptr failure;
    net::co_spawn(ioc, coExchange(u, std::move(req), options),
                  [&response, &failure](std::exception_ptr e, StringResponse res) {
                      if (e) {
                          failure = e;
                      } else {
                          response = std::move(res);
                      }
                  });
    std::stop_callback onStop(stop, [&ioc]() { ioc.stop(); });
    ioc.run();
    if (failure) {
        std::rethrow_exception(failure);
    }
    if (!response) {
        throw std::runtime_error("request to " + u.host + " was cancelled");
    }
    return std::move(response.value());
}

} // namespace

struct HttpFetcher::Exchange {
    http::verb verb{http::verb::get};
    std::string url;
    std::string body;
    std::string contentType;
};

UrlParts ParseUrl(const std::string& url) {
    UrlParts parts;
    std::size_t pos = 0;

    std::size_t schemeEnd = url.find("://");
    if (schemeEnd != std::string::npos) {
        parts.scheme = url.substr(0, schemeEnd);
        for (auto& c : parts.scheme) {
            c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }
        pos = schemeEnd + 3;
    } else {
        parts.scheme = std::string("http");
    }
    if (parts.scheme != "http" && parts.scheme != "https") {
        throw std::invalid_argument("Unsupported URL scheme '" + parts.scheme + "' in " + url);
    }

    std::string rest = url.substr(pos);
    rest = rest.substr(0, rest.find('#'));
    std::size_t slash = rest.find_first_of("/?");
    std::string hostPort;
    if (slash == std::string::npos) {
        hostPort = rest;
        parts.path = std::string("/");
    } else {
        hostPort = rest.substr(0, slash);
        parts.path = rest.substr(slash);
        if (parts.path.front() == '?') {
            parts.path.insert(parts.path.begin(), '/');
        }
    }

    const std::string defaultPort = parts.scheme == "https" ? "443" : "80";
    if (!hostPort.empty() && hostPort.front() == '[') {
        std::size_t rb = hostPort.find(']');
        if (rb == std::string::npos) {
            throw std::invalid_argument("Malformed IPv6 host in " + url);
        }
        parts.host = hostPort.substr(1, rb - 1);
        parts.port = (rb + 1 < hostPort.size() && hostPort[rb + 1] == ':') ? hostPort.substr(rb + 2) : defaultPort;
    } else {
        std::size_t colon = hostPort.find(':');
        if (colon == std::string::npos) {
            parts.host = hostPort;
            parts.port = defaultPort;
        } else {
            parts.host = hostPort.substr(0, colon);
            parts.port = hostPort.substr(colon + 1);
        }
    }
    if (parts.host.empty()) {
        throw std::invalid_argument("URL has no host: " + url);
    }
    if (parts.port.empty()) {
        parts.port = defaultPort;
    }
    parts.serverName = parts.host;
    return parts;
}

HttpFetcher::HttpFetcher(HttpFetchOptions options) : options_(std::move(options)) {}

HttpFetchResult HttpFetcher::Get(const std::string& url, std::stop_token stop) {
    Exchange exchange;
    exchange.url = url;
    return perform(std::move(exchange), std::move(stop));
}

HttpFetchResult HttpFetcher::PostForm(const std::string& url, const FormFields& fields, std::stop_token stop) {
    Exchange exchange;
    exchange.verb = http::verb::post;
    exchange.url = url;
    exchange.contentType = "application/x-www-form-urlencoded";
    for (const auto& [name, value] : fields) {
        if (!exchange.body.empty()) {
            exchange.body += '&';
        }
        exchange.body += UrlEncodeForm(name) + "=" + UrlEncodeForm(value);
    }
    return perform(std::move(exchange), std::move(stop));
}

std::string HttpFetcher::CookieHeader() const {
    std::lock_guard<std::mutex> lk(cookieMutex_);
    std::string header;
    for (const auto& [name, value] : cookies_) {
        if (!header.empty()) {
            header += "; ";
        }
        header += name + "=" + value;
    }
    return header;
}

std::string HttpFetcher::UrlEncodeForm(const std::string& s) {
    std::ostringstream oss;
    for (std::size_t i = 0; i < s.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(s[i]);
        if ((c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '-' || c == '_' || c == '.' || c == '~') {
            oss << static_cast<char>(c);
        } else if (c == ' ') {
            oss << '+';
        } else {
            oss << '%';
            const char* hex = "0123456789ABCDEF";
            oss << hex[(c >> 4) & 0xFu] << hex[c & 0xFu];
        }
    }
    return oss.str();
}

std::string HttpFetcher::ResolveLocation(const std::string& base, const std::string& location) {
    if (location.find("://") != std::string::npos) {
        return location;
    }
    UrlParts b = ParseUrl(base);
    const std::string origin = b.scheme + "://" + hostHeader(b);
    if (location.rfind("//", 0) == 0) {
        return b.scheme + ":" + location;
    }
    if (!location.empty() && location.front() == '/') {
        return origin + location;
    }
    // Relative to the directory of the base path
    std::string dir = b.path.substr(0, b.path.find('?'));
    dir = dir.substr(0, dir.rfind('/') + 1);
    return origin + dir + location;
}

HttpFetchResult HttpFetcher::perform(Exchange exchange, std::stop_token stop) {
    for (unsigned hop = 0;; ++hop) {
        if (stop.stop_requested()) {
            throw std::runtime_error("request to " + exchange.url + " was cancelled");
        }
        UrlParts u = ParseUrl(exchange.url);
        http::request<http::string_body> req{exchange.verb, u.path, 11};
        req.set(http::field::host, hostHeader(u));
        req.set(http::field::user_agent, options_.userAgent);
        req.set(http::field::accept, "*/*");
        req.set(http::field::connection, "close");
        const std::string cookies = CookieHeader();
        if (!cookies.empty()) {
            req.set(http::field::cookie, cookies);
        }
        if (exchange.verb == http::verb::post) {
            req.set(http::field::content_type, exchange.contentType);
            req.body() = exchange.body;
        }
        req.prepare_payload();

        LOG_DEBUG("HTTP {} {}", std::string(http::to_string(exchange.verb)), exchange.url);
        StringResponse res = runExchange(u, std::move(req), options_, stop);

        {
            std::lock_guard<std::mutex> lk(cookieMutex_);
            for (const auto& field : res) {
                if (field.name() != http::field::set_cookie) {
                    continue;
                }
                const std::string cookie(field.value());
                const std::string pair = cookie.substr(0, cookie.find(';'));
                const std::size_t eq = pair.find('=');
                if (eq != std::string::npos && eq > 0) {
                    cookies_[pair.substr(0, eq)] = pair.substr(eq + 1);
                }
            }
        }

        const unsigned status = res.result_int();
        const std::string location(res[http::field::location]);
        if (isRedirect(status) && !location.empty()) {
            if (hop >= options_.maxRedirects) {
                throw std::runtime_error("too many redirects fetching " + exchange.url);
            }
            const std::string next = ResolveLocation(exchange.url, location);
            LOG_DEBUG("HTTP {} redirect {} -> {}", status, exchange.url, next);
            exchange.url = next;
            if (status == 303 || ((status == 301 || status == 302) && exchange.verb == http::verb::post)) {
                exchange.verb = http::verb::get;
                exchange.body.clear();
            }
            continue;
        }

        HttpFetchResult result;
        result.status = status;
        result.body = std::move(res.body());
        result.contentType = std::string(res[http::field::content_type]);
        result.finalUrl = exchange.url;
        return result;
    }
}

} // namespace guidemcp
