/*
 * Part of the RedFox (RF) project.
 *
 * SPDX-FileCopyrightText: 2025 RedFox contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of RedFox (RF). See LICENSE for details.
 */

#include <gtest/gtest.h>
#include "rf/request_builder.hpp"

#include <string>
#include <vector>

using namespace rf;

namespace {

std::vector<std::string> head_lines(const std::string& req) {
    std::vector<std::string> out;
    std::size_t p = 0;
    for (;;) {
        std::size_t q = req.find("\r\n", p);
        if (q == std::string::npos || q == p) break;
        out.push_back(req.substr(p, q - p));
        p = q + 2;
    }
    return out;
}

std::string body_of(const std::string& req) {
    return req.substr(req.find("\r\n\r\n") + 4);
}

} // namespace

TEST(RequestBuilderTest, DefaultGetUsesAbsoluteUrl) {
    RequestContext ctx("rit.edu", "/study", 80, "RedFox/1.0");
    const std::string req = build_request(ctx);
    EXPECT_EQ(req,
              "GET http://rit.edu/study HTTP/1.1\r\n"
              "Host: rit.edu:80\r\n"
              "Accept: */*\r\n"
              "Accept-Language: en-US\r\n"
              "User-Agent: RedFox/1.0\r\n"
              "Connection: close\r\n"
              "Content-Type: application/x-www-form-urlencoded\r\n"
              "Content-Length: 0\r\n"
              "\r\n");
}

TEST(RequestBuilderTest, HeaderOrderIsFixed) {
    RequestContext ctx("example.com", "/", 8080, "ua");
    const auto lines = head_lines(build_request(ctx, "POST", "/login", "keep-alive", "a=b"));
    ASSERT_EQ(lines.size(), 8u);
    EXPECT_EQ(lines[0], "POST /login HTTP/1.1");
    EXPECT_EQ(lines[1], "Host: example.com:8080");
    EXPECT_EQ(lines[2], "Accept: */*");
    EXPECT_EQ(lines[3], "Accept-Language: en-US");
    EXPECT_EQ(lines[4], "User-Agent: ua");
    EXPECT_EQ(lines[5], "Connection: keep-alive");
    EXPECT_EQ(lines[6], "Content-Type: application/x-www-form-urlencoded");
    EXPECT_EQ(lines[7], "Content-Length: 5");
}

TEST(RequestBuilderTest, BodyIsFormEncodedAndLengthMatchesEncoding) {
    RequestContext ctx("example.com");
    const std::string req = build_request(ctx, "POST", "/", "close", "user=a b&x=1/2");
    EXPECT_EQ(body_of(req), "user%3Da+b%26x%3D1%2F2");
    EXPECT_NE(req.find("Content-Length: 22\r\n"), std::string::npos);
}

TEST(RequestBuilderTest, NonAsciiBodyLengthCountsEncodedBytes) {
    RequestContext ctx("example.com");
    // "é" is two UTF-8 bytes, each becomes %XX.
    const std::string req = build_request(ctx, "POST", "/", "close", "\xC3\xA9");
    EXPECT_EQ(body_of(req), "%C3%A9");
    EXPECT_NE(req.find("Content-Length: 6\r\n"), std::string::npos);
}

TEST(RequestBuilderTest, TlsContextUsesHttpsUrlAsTarget) {
    RequestContext ctx("rit.edu", "/", 443);
    const std::string req = build_request(ctx);
    EXPECT_EQ(req.rfind("GET https://rit.edu/ HTTP/1.1\r\n", 0), 0u);
    EXPECT_NE(req.find("Host: rit.edu:443\r\n"), std::string::npos);
}

TEST(RequestBuilderTest, ParametersAreSentVerbatim) {
    RequestContext ctx("h");
    const std::string req = build_request(ctx, "G E\r\nT", "/a b", "close\r\nX-Injected: 1");
    EXPECT_EQ(req.rfind("G E\r\nT /a b HTTP/1.1\r\n", 0), 0u);
    EXPECT_NE(req.find("Connection: close\r\nX-Injected: 1\r\n"), std::string::npos);
}

TEST(RequestBuilderTest, StoresLastRequestOnContext) {
    RequestContext ctx("h");
    const std::string first = build_request(ctx, "GET");
    EXPECT_EQ(ctx.last_request(), first);
    const std::string second = build_request(ctx, "HEAD", "/x");
    EXPECT_EQ(ctx.last_request(), second);
    EXPECT_NE(first, second);
}
