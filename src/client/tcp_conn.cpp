/*
 * Part of the RedFox (RF) project.
 *
 * SPDX-FileCopyrightText: 2025 RedFox contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of RedFox (RF). See LICENSE for details.
 */

#include "rf/internal/tcp_conn.hpp"
#include "rf/log.hpp"
#include "rf/internal/utils.hpp"

#include <sys/types.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <netdb.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>

#include <fcntl.h>   // fcntl, O_NONBLOCK
#include <poll.h>    // poll

namespace rf::internal {
namespace {

// Connect s to addr. With timeout_ms > 0 the connect is bounded by poll();
// returns 0 or the errno of the failure.
int connect_one(int s, const struct addrinfo* p, int timeout_ms) {
    if (timeout_ms <= 0) {
        int ret;
        do {
            ret = ::connect(s, p->ai_addr, p->ai_addrlen);
        } while (ret < 0 && errno == EINTR);
        return ret == 0 ? 0 : errno;
    }

    // Switch to non-blocking for a bounded-time connect
    int flags = fcntl(s, F_GETFL, 0);
    if (flags < 0) return errno;
    if (fcntl(s, F_SETFL, flags | O_NONBLOCK) < 0) return errno;

    int ret = ::connect(s, p->ai_addr, p->ai_addrlen);
    if (ret < 0 && errno != EINPROGRESS) return errno;
    if (ret < 0) {
        struct pollfd pfd;
        pfd.fd      = s;
        pfd.events  = POLLOUT;
        pfd.revents = 0;

        int pr;
        do {
            pr = ::poll(&pfd, 1, timeout_ms);
        } while (pr < 0 && errno == EINTR);
        if (pr < 0) return errno;
        if (pr == 0) return ETIMEDOUT;

        int soerr = 0;
        socklen_t slen = sizeof(soerr);
        if (getsockopt(s, SOL_SOCKET, SO_ERROR, &soerr, &slen) < 0) return errno;
        if (soerr != 0) return soerr;
    }

    // Back to blocking mode for normal I/O (SO_*TIMEO will work)
    if (fcntl(s, F_SETFL, flags) < 0) return errno;
    return 0;
}

} // namespace

TcpConn::~TcpConn() { close(); }

bool TcpConn::open(const std::string& host, std::uint16_t port, int timeout_sec,
                   ExchangeError& err, std::string& detail) {
    close();

    struct addrinfo hints{};
    hints.ai_family   = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    struct addrinfo* res = nullptr;
    int rc = getaddrinfo(host.c_str(), std::to_string(port).c_str(), &hints, &res);
    if (rc != 0 || !res) {
        err = ExchangeError::NameResolutionFailure;
        detail = std::string("could not resolve ") + host + ": " + gai_strerror(rc);
        rf::log_line("[TCP] getaddrinfo failed: " + detail);
        if (res) freeaddrinfo(res);
        return false;
    }

    const int timeout_ms = timeout_sec > 0 ? clamp_to_int(std::uint64_t(timeout_sec) * 1000) : 0;

    int s_ok = -1;
    int last_err = 0;
    bool refused = false;
    for (auto* p = res; p; p = p->ai_next) {
        int s = ::socket(p->ai_family, p->ai_socktype, p->ai_protocol);
        if (s < 0) { last_err = errno; continue; }

        const int e = connect_one(s, p, timeout_ms);
        if (e != 0) {
            last_err = e;
            if (e == ECONNREFUSED) refused = true;
            ::close(s);
            continue;
        }

        if (timeout_sec > 0) {
            timeval tv{timeout_sec, 0};
            setsockopt(s, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
            setsockopt(s, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
        }

        s_ok = s;
        break;
    }
    freeaddrinfo(res);

    if (s_ok < 0) {
        err = refused ? ExchangeError::ConnectionRefused : ExchangeError::ConnectFailure;
        detail = "could not connect to " + host + ":" + std::to_string(port) + ": " +
                 std::strerror(refused ? ECONNREFUSED : last_err);
        rf::log_line("[TCP] connect failed: " + detail);
        return false;
    }

    _fd = s_ok;
    return true;
}

void TcpConn::close(){
    if (_fd>=0) { ::close(_fd); _fd=-1; }
}

bool TcpConn::send_all(const char* d, std::size_t len) {
    std::size_t off = 0;
    while (off < len) {
        ssize_t n = ::send(_fd, d + off, len - off, MSG_NOSIGNAL);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) return false;
        off += (std::size_t)n;
    }
    return true;
}

bool TcpConn::recv_until_eof(std::string& out) {
    char buf[1024];
    for (;;) {
        ssize_t n = ::recv(_fd, buf, sizeof(buf), 0);
        if (n == 0) return true;
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        out.append(buf, buf + n);
    }
}

} // namespace rf::internal
