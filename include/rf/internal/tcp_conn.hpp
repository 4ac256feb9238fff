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
#include <cstddef>
#include <cstdint>
#include "rf/exchange.hpp"

namespace rf::internal {

// RAII TCP connection with optional timeouts and send/recv helpers.
class TcpConn {
public:
    TcpConn() = default;
    ~TcpConn();

    TcpConn(const TcpConn&) = delete;
    TcpConn& operator=(const TcpConn&) = delete;

    // Resolve and connect. timeout_sec <= 0 leaves the socket fully blocking.
    // On failure err/detail describe why and no descriptor stays open.
    bool open(const std::string& host, std::uint16_t port, int timeout_sec,
              ExchangeError& err, std::string& detail);

    void close();
    int  fd() const { return _fd; }

    bool send_all(const char* d, std::size_t len);

    // Append fixed-size chunks to out until the peer closes (recv() == 0).
    bool recv_until_eof(std::string& out);

private:
    int _fd = -1;
};

} // namespace rf::internal
