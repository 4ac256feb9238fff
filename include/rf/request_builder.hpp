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
#include "rf/request_context.hpp"

namespace rf {

// Build the literal HTTP/1.1 request bytes:
//  method:     sent verbatim (no validation)
//  path:       request target; empty means ctx.url(), the absolute URL
//  connection: value of the Connection header, sent verbatim
//  body:       form-encoded before use; Content-Length is the encoded size
//
// Header order is fixed: Host, Accept, Accept-Language, User-Agent,
// Connection, Content-Type, Content-Length. The result is also stored on
// ctx (see RequestContext::last_request) so execute(ctx) can send it.
std::string build_request(RequestContext& ctx,
                          const std::string& method = "GET",
                          const std::string& path = "",
                          const std::string& connection = "close",
                          const std::string& body = "");

} // namespace rf
