/*
 * Part of the RedFox (RF) project.
 *
 * SPDX-FileCopyrightText: 2025 RedFox contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of RedFox (RF). See LICENSE for details.
 */

#pragma once
#include <sys/types.h>
#include <sys/socket.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <unistd.h>
#include <poll.h>
#include <dirent.h>
#include <fcntl.h>

#include <cstdint>
#include <cstdlib>
#include <functional>
#include <string>
#include <thread>
#include <vector>

namespace rf::test {

// One-shot TCP server on 127.0.0.1 with an ephemeral port. The handler runs
// on a background thread with the accepted descriptor; the server closes it.
class LoopbackServer {
public:
    using Handler = std::function<void(int fd)>;

    explicit LoopbackServer(Handler h) : _handler(std::move(h)) {
        _lfd = ::socket(AF_INET, SOCK_STREAM, 0);
        int one = 1;
        setsockopt(_lfd, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));
        sockaddr_in a{};
        a.sin_family = AF_INET;
        a.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        a.sin_port = 0;
        ::bind(_lfd, reinterpret_cast<sockaddr*>(&a), sizeof(a));
        ::listen(_lfd, 4);
        socklen_t len = sizeof(a);
        getsockname(_lfd, reinterpret_cast<sockaddr*>(&a), &len);
        _port = ntohs(a.sin_port);
        _th = std::thread([this]{ run(); });
    }

    ~LoopbackServer() {
        join();
        if (_lfd >= 0) ::close(_lfd);
    }

    std::uint16_t port() const { return _port; }

    void join() {
        if (_th.joinable()) _th.join();
    }

private:
    void run() {
        pollfd pfd{};
        pfd.fd = _lfd;
        pfd.events = POLLIN;
        if (::poll(&pfd, 1, 5000) <= 0) return;
        int c = ::accept(_lfd, nullptr, nullptr);
        if (c < 0) return;
        _handler(c);
        ::close(c);
    }

    Handler _handler;
    int _lfd = -1;
    std::uint16_t _port = 0;
    std::thread _th;
};

// Listener with a zero backlog that never accepts. Once the accept queue is
// full, further SYNs are dropped and connect() to it cannot complete.
class StalledListener {
public:
    StalledListener() {
        _lfd = ::socket(AF_INET, SOCK_STREAM, 0);
        sockaddr_in a{};
        a.sin_family = AF_INET;
        a.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        ::bind(_lfd, reinterpret_cast<sockaddr*>(&a), sizeof(a));
        ::listen(_lfd, 0);
        socklen_t len = sizeof(a);
        getsockname(_lfd, reinterpret_cast<sockaddr*>(&a), &len);
        _addr = a;
        _port = ntohs(a.sin_port);
        for (int i = 0; i < 8; ++i) {
            int s = start_connect();
            if (s >= 0) _fillers.push_back(s);
        }
    }

    ~StalledListener() {
        for (int s : _fillers) ::close(s);
        if (_lfd >= 0) ::close(_lfd);
    }

    std::uint16_t port() const { return _port; }

    // True if a fresh connect is still pending after 300 ms.
    bool saturated() const {
        int s = start_connect();
        if (s < 0) return false;
        pollfd pfd{};
        pfd.fd = s;
        pfd.events = POLLOUT;
        const int pr = ::poll(&pfd, 1, 300);
        ::close(s);
        return pr == 0;
    }

private:
    int start_connect() const {
        int s = ::socket(AF_INET, SOCK_STREAM, 0);
        if (s < 0) return -1;
        fcntl(s, F_SETFL, fcntl(s, F_GETFL, 0) | O_NONBLOCK);
        ::connect(s, reinterpret_cast<const sockaddr*>(&_addr), sizeof(_addr));
        return s;
    }

    int _lfd = -1;
    sockaddr_in _addr{};
    std::uint16_t _port = 0;
    std::vector<int> _fillers;
};

// Read one request: headers up to the blank line, then Content-Length bytes.
inline std::string read_request(int fd) {
    std::string in;
    char buf[512];
    std::size_t hdr_end;
    while ((hdr_end = in.find("\r\n\r\n")) == std::string::npos) {
        ssize_t n = ::recv(fd, buf, sizeof(buf), 0);
        if (n <= 0) return in;
        in.append(buf, buf + n);
    }
    std::size_t want = 0;
    const std::size_t cl = in.find("Content-Length: ");
    if (cl != std::string::npos && cl < hdr_end) {
        want = std::strtoul(in.c_str() + cl + 16, nullptr, 10);
    }
    while (in.size() < hdr_end + 4 + want) {
        ssize_t n = ::recv(fd, buf, sizeof(buf), 0);
        if (n <= 0) break;
        in.append(buf, buf + n);
    }
    return in;
}

inline void write_all(int fd, const std::string& s) {
    std::size_t off = 0;
    while (off < s.size()) {
        ssize_t n = ::send(fd, s.data() + off, s.size() - off, MSG_NOSIGNAL);
        if (n <= 0) return;
        off += static_cast<std::size_t>(n);
    }
}

// Block until the peer closes its side.
inline void wait_for_close(int fd) {
    char buf[256];
    while (::recv(fd, buf, sizeof(buf), 0) > 0) {}
}

inline int open_fd_count() {
    int n = 0;
    if (DIR* d = ::opendir("/proc/self/fd")) {
        while (::readdir(d)) ++n;
        ::closedir(d);
    }
    return n;
}

} // namespace rf::test
