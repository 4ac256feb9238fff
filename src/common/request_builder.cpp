/*
 * Part of the RedFox (RF) project.
 *
 * SPDX-FileCopyrightText: 2025 RedFox contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of RedFox (RF). See LICENSE for details.
 */

#include "rf/request_builder.hpp"
#include "rf/internal/codec.hpp"
#include <sstream>

namespace rf {

std::string build_request(RequestContext& ctx,
                          const std::string& method,
                          const std::string& path,
                          const std::string& connection,
                          const std::string& body)
{
    // An empty target means the absolute URL, not "/".
    const std::string& target = path.empty() ? ctx.url() : path;
    const std::string wire_body = internal::quote_plus(body);

    std::ostringstream req;
    req << method << " " << target << " HTTP/1.1\r\n";
    req << "Host: " << ctx.host() << ":" << ctx.port() << "\r\n";
    req << "Accept: */*\r\n";
    req << "Accept-Language: en-US\r\n";
    req << "User-Agent: " << ctx.agent() << "\r\n";
    req << "Connection: " << connection << "\r\n";
    req << "Content-Type: " << ctx.content_type() << "\r\n";
    req << "Content-Length: " << wire_body.size() << "\r\n";
    req << "\r\n";
    req << wire_body;

    std::string out = req.str();
    ctx.set_last_request(out);
    return out;
}

} // namespace rf
