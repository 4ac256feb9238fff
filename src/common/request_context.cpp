/*
 * Part of the RedFox (RF) project.
 *
 * SPDX-FileCopyrightText: 2025 RedFox contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of RedFox (RF). See LICENSE for details.
 */

#include "rf/request_context.hpp"

namespace rf {

RequestContext::RequestContext(std::string host,
                               std::string path,
                               std::uint16_t port,
                               std::string agent,
                               bool use_tls)
    : _host(std::move(host)),
      _path(std::move(path)),
      _port(port),
      _agent(std::move(agent)),
      _use_tls(use_tls || port == 443)
{
    _url = (_use_tls ? "https://" : "http://") + _host + _path;
}

} // namespace rf
