//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: HttpFetcher.h
// Purpose: Blocking HTTP/HTTPS client (Boost.Beast, TLS 1.3 only) for guideline downloads
//==========================================================================================================

#pragma once

#include <chrono>
#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <stop_token>
#include <string>
#include <utility>
#include <vector>

namespace guidemcp {

struct UrlParts {
    std::string scheme;
    std::string host;
    std::string port;
    std::string path;       // path and query, "/" when absent
    std::string serverName; // SNI and certificate host name
};

//==========================================================================================================
// ParseUrl
// Purpose: Splits http(s)://host[:port][/path] into its parts; the scheme defaults to http.
// Throws:
//   std::invalid_argument for other schemes or an empty host.
//==========================================================================================================
UrlParts ParseUrl(const std::string& url);

//==========================================================================================================
// HttpFetchOptions
// Fields:
//   connectTimeout: Resolve and connect (and TLS handshake) budget per hop
//   readTimeout: Request write and response read budget per hop
//   maxRedirects: 3xx hops followed before giving up
//   caFile: PEM bundle for peer verification; system defaults when empty
//   maxBodyBytes: Larger responses fail
//   userAgent: User-Agent header value
//==========================================================================================================
struct HttpFetchOptions {
    std::chrono::milliseconds connectTimeout{10000};
    std::chrono::milliseconds readTimeout{120000};
    unsigned maxRedirects{5};
    std::string caFile;
    std::size_t maxBodyBytes{200 * 1024 * 1024};
    std::string userAgent{"nccn-guidelines-mcp"};
};

struct HttpFetchResult {
    unsigned status{0};
    std::string body;
    std::string contentType;
    std::string finalUrl; // URL after redirects
};

using FormFields = std::vector<std::pair<std::string, std::string>>;

//==========================================================================================================
// HttpFetcher
// Purpose: Issues one request at a time on the calling thread, following redirects.
// Notes:
//   - Cookies set by any response are replayed on later requests of the same fetcher, so a form
//     login followed by a download shares one cookie jar.
//   - Transport failures and a stop request throw std::runtime_error; HTTP error statuses do not.
//==========================================================================================================
class HttpFetcher {
public:
    explicit HttpFetcher(HttpFetchOptions options = HttpFetchOptions());

    HttpFetchResult Get(const std::string& url, std::stop_token stop = {});

    // POSTs application/x-www-form-urlencoded fields.
    HttpFetchResult PostForm(const std::string& url, const FormFields& fields, std::stop_token stop = {});

    // "name=value; ..." for the cookies collected so far; empty when none.
    std::string CookieHeader() const;

    static std::string UrlEncodeForm(const std::string& s);

    // Resolves a Location header against the URL that produced it.
    static std::string ResolveLocation(const std::string& base, const std::string& location);

private:
    struct Exchange;
    HttpFetchResult perform(Exchange exchange, std::stop_token stop);

    const HttpFetchOptions options_;
    mutable std::mutex cookieMutex_;
    std::map<std::string, std::string> cookies_;
};

} // namespace guidemcp
