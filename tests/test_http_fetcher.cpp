//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_http_fetcher.cpp
// Purpose: GoogleTests for the download client (URL handling, redirects, cookies, forms, limits)
//==========================================================================================================

#include <gtest/gtest.h>
#include <stdexcept>
#include <stop_token>
#include <string>

#include "guidemcp/HttpFetcher.h"
#include "LocalHttpServer.h"

using namespace guidemcp;
using namespace guidemcp_test;

TEST(ParseUrl, SplitsComponents) {
    UrlParts u = ParseUrl("https://www.nccn.org/professionals/physician_gls/pdf/breast.pdf?x=1#top");
    EXPECT_EQ(u.scheme, "https");
    EXPECT_EQ(u.host, "www.nccn.org");
    EXPECT_EQ(u.port, "443");
    EXPECT_EQ(u.path, "/professionals/physician_gls/pdf/breast.pdf?x=1");
    EXPECT_EQ(u.serverName, "www.nccn.org");

    u = ParseUrl("HTTP://127.0.0.1:8080");
    EXPECT_EQ(u.scheme, "http");
    EXPECT_EQ(u.host, "127.0.0.1");
    EXPECT_EQ(u.port, "8080");
    EXPECT_EQ(u.path, "/");

    u = ParseUrl("example.org?q=2");
    EXPECT_EQ(u.scheme, "http");
    EXPECT_EQ(u.port, "80");
    EXPECT_EQ(u.path, "/?q=2");

    u = ParseUrl("http://[::1]:9000/a");
    EXPECT_EQ(u.host, "::1");
    EXPECT_EQ(u.port, "9000");
    EXPECT_EQ(u.path, "/a");
}

TEST(ParseUrl, RejectsUnsupportedInput) {
    EXPECT_THROW(ParseUrl("ftp://example.org/file.pdf"), std::invalid_argument);
    EXPECT_THROW(ParseUrl("https:///nohost"), std::invalid_argument);
    EXPECT_THROW(ParseUrl("http://[::1/a"), std::invalid_argument);
}

TEST(HttpFetcher, ResolvesRedirectLocations) {
    const std::string base = "https://www.nccn.org/login/Index/?ReturnURL=x";
    EXPECT_EQ(HttpFetcher::ResolveLocation(base, "https://other.org/a"), "https://other.org/a");
    EXPECT_EQ(HttpFetcher::ResolveLocation(base, "/home"), "https://www.nccn.org/home");
    EXPECT_EQ(HttpFetcher::ResolveLocation(base, "next"), "https://www.nccn.org/login/Index/next");
    EXPECT_EQ(HttpFetcher::ResolveLocation(base, "//cdn.nccn.org/f.pdf"), "https://cdn.nccn.org/f.pdf");
    EXPECT_EQ(HttpFetcher::ResolveLocation("http://127.0.0.1:8080/a/b", "/c"), "http://127.0.0.1:8080/c");
}

TEST(HttpFetcher, EncodesFormValues) {
    EXPECT_EQ(HttpFetcher::UrlEncodeForm("a b&c=d"), "a+b%26c%3Dd");
    EXPECT_EQ(HttpFetcher::UrlEncodeForm("user@example.org"), "user%40example.org");
    EXPECT_EQ(HttpFetcher::UrlEncodeForm("Az09-_.~"), "Az09-_.~");
}

TEST(HttpFetcher, GetReturnsBodyAndStatus) {
    LocalHttpServer server([](const TestRequest& req) {
        return MakeTestResponse(http::status::ok, "hello " + std::string(req.target()), "text/plain");
    });
    HttpFetcher fetcher;
    HttpFetchResult res = fetcher.Get(server.Url("/greeting"));
    EXPECT_EQ(res.status, 200u);
    EXPECT_EQ(res.body, "hello /greeting");
    EXPECT_EQ(res.contentType, "text/plain");
    EXPECT_EQ(res.finalUrl, server.Url("/greeting"));

    auto requests = server.Requests();
    ASSERT_EQ(requests.size(), 1u);
    EXPECT_EQ(std::string(requests[0][http::field::user_agent]), "nccn-guidelines-mcp");
    EXPECT_EQ(std::string(requests[0][http::field::host]), "127.0.0.1:" + std::to_string(server.Port()));
}

TEST(HttpFetcher, ErrorStatusesAreReturnedNotThrown) {
    LocalHttpServer server([](const TestRequest&) {
        return MakeTestResponse(http::status::not_found, "missing");
    });
    HttpFetcher fetcher;
    HttpFetchResult res = fetcher.Get(server.Url("/nothing.pdf"));
    EXPECT_EQ(res.status, 404u);
    EXPECT_EQ(res.body, "missing");
}

TEST(HttpFetcher, FollowsRedirectsAndReplaysCookies) {
    LocalHttpServer server([](const TestRequest& req) {
        if (req.target() == "/start") {
            TestResponse res = MakeTestResponse(http::status::found, "");
            res.set(http::field::location, "/final");
            res.insert(http::field::set_cookie, "session=abc; Path=/; HttpOnly");
            res.insert(http::field::set_cookie, "region=us");
            return res;
        }
        return MakeTestResponse(http::status::ok, "cookie:" + std::string(req[http::field::cookie]));
    });
    HttpFetcher fetcher;
    HttpFetchResult res = fetcher.Get(server.Url("/start"));
    EXPECT_EQ(res.status, 200u);
    EXPECT_EQ(res.finalUrl, server.Url("/final"));
    EXPECT_EQ(res.body, "cookie:region=us; session=abc");
    EXPECT_EQ(fetcher.CookieHeader(), "region=us; session=abc");
}

TEST(HttpFetcher, StopsAfterTooManyRedirects) {
    LocalHttpServer server([](const TestRequest&) {
        TestResponse res = MakeTestResponse(http::status::temporary_redirect, "");
        res.set(http::field::location, "/again");
        return res;
    });
    HttpFetchOptions options;
    options.maxRedirects = 2;
    HttpFetcher fetcher(options);
    EXPECT_THROW(fetcher.Get(server.Url("/again")), std::runtime_error);
    EXPECT_EQ(server.Requests().size(), 3u);
}

TEST(HttpFetcher, PostFormSendsEncodedFieldsAndSwitchesToGetOnSeeOther) {
    LocalHttpServer server([](const TestRequest& req) {
        if (req.method() == http::verb::post) {
            TestResponse res = MakeTestResponse(http::status::see_other, "");
            res.set(http::field::location, "/welcome");
            return res;
        }
        return MakeTestResponse(http::status::ok, "welcome");
    });
    HttpFetcher fetcher;
    HttpFetchResult res = fetcher.PostForm(server.Url("/login"), {{"Username", "a b"}, {"Password", "p&w"}});
    EXPECT_EQ(res.status, 200u);
    EXPECT_EQ(res.body, "welcome");

    auto requests = server.Requests();
    ASSERT_EQ(requests.size(), 2u);
    EXPECT_EQ(requests[0].method(), http::verb::post);
    EXPECT_EQ(std::string(requests[0][http::field::content_type]), "application/x-www-form-urlencoded");
    EXPECT_EQ(requests[0].body(), "Username=a+b&Password=p%26w");
    EXPECT_EQ(requests[1].method(), http::verb::get);
    EXPECT_EQ(std::string(requests[1].target()), "/welcome");
    EXPECT_TRUE(requests[1].body().empty());
}

TEST(HttpFetcher, OversizedBodyFails) {
    LocalHttpServer server([](const TestRequest&) {
        return MakeTestResponse(http::status::ok, std::string(4096, 'x'));
    });
    HttpFetchOptions options;
    options.maxBodyBytes = 1024;
    HttpFetcher fetcher(options);
    EXPECT_ANY_THROW(fetcher.Get(server.Url("/big")));
}

TEST(HttpFetcher, StoppedRequestIsNotSent) {
    LocalHttpServer server([](const TestRequest&) {
        return MakeTestResponse(http::status::ok, "unused");
    });
    std::stop_source src;
    src.request_stop();
    HttpFetcher fetcher;
    EXPECT_THROW(fetcher.Get(server.Url("/x"), src.get_token()), std::runtime_error);
    EXPECT_TRUE(server.Requests().empty());
}

TEST(HttpFetcher, ConnectionRefusedThrows) {
    unsigned short port = 0;
    {
        LocalHttpServer server([](const TestRequest&) { return MakeTestResponse(http::status::ok, ""); });
        port = server.Port();
    }
    HttpFetchOptions options;
    options.connectTimeout = std::chrono::milliseconds(2000);
    HttpFetcher fetcher(options);
    EXPECT_ANY_THROW(fetcher.Get("http://127.0.0.1:" + std::to_string(port) + "/"));
}
