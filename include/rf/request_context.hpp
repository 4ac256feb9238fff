/*
 * Part of the RedFox (RF) project.
 *
 * SPDX-FileCopyrightText: 2025 RedFox contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of RedFox (RF). See LICENSE for details.
 */

#pragma once
#include <string>
#include <cstdint>
#include <utility>

namespace rf {

// Fixed body content type; there is no per-request override.
inline constexpr const char* kFormContentType = "application/x-www-form-urlencoded";

// Target of a hand-built request. Port 443 always turns TLS on; the
// override is applied once here and never re-evaluated.
class RequestContext {
public:
    explicit RequestContext(std::string host,
                            std::string path = "/",
                            std::uint16_t port = 80,
                            std::string agent = "Mozilla/5.0",
                            bool use_tls = false);

    const std::string& host() const { return _host; }
    const std::string& path() const { return _path; }
    std::uint16_t      port() const { return _port; }
    const std::string& agent() const { return _agent; }
    bool               use_tls() const { return _use_tls; }
    const char*        content_type() const { return kFormContentType; }

    // "http://" or "https://" + host + path (no port).
    const std::string& url() const { return _url; }

    // Last string produced by build_request() for this context; empty if none.
    const std::string& last_request() const { return _last_request; }
    void set_last_request(std::string req) { _last_request = std::move(req); }

private:
    std::string   _host;
    std::string   _path;
    std::uint16_t _port;
    std::string   _agent;
    bool          _use_tls;
    std::string   _url;
    std::string   _last_request;
};

} // namespace rf
