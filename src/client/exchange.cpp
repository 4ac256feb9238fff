/*
 * Part of the RedFox (RF) project.
 *
 * SPDX-FileCopyrightText: 2025 RedFox contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of RedFox (RF). See LICENSE for details.
 */

#include "rf/exchange.hpp"
#include "rf/log.hpp"

#include "rf/internal/codec.hpp"
#include "rf/internal/tcp_conn.hpp"
#include "rf/internal/tls_cli_ctx.hpp"
#include "rf/internal/utils.hpp"

#include <openssl/ssl.h>
#include <openssl/err.h>
#include <openssl/x509v3.h>

#include <memory>
#include <cerrno>
#include <cstring>

#include <csignal>
#include <pthread.h>
#include <time.h>

namespace {

using SslPtr = std::unique_ptr<SSL, void(*)(SSL*)>;

// SSL_write() goes through write(2), which has no MSG_NOSIGNAL. Blocks SIGPIPE
// on this thread for the guard's lifetime and discards one raised meanwhile.
class SigpipeGuard {
public:
    SigpipeGuard() {
        sigemptyset(&_set);
        sigaddset(&_set, SIGPIPE);
        sigset_t pending;
        sigemptyset(&pending);
        if (sigpending(&pending) == 0 && sigismember(&pending, SIGPIPE) == 1) return;
        _blocked = (pthread_sigmask(SIG_BLOCK, &_set, &_old) == 0);
    }

    ~SigpipeGuard() {
        if (!_blocked) return;
        sigset_t pending;
        sigemptyset(&pending);
        if (sigpending(&pending) == 0 && sigismember(&pending, SIGPIPE) == 1) {
            const timespec zero{0, 0};
            int rc;
            do {
                rc = sigtimedwait(&_set, nullptr, &zero);
            } while (rc < 0 && errno == EINTR);
        }
        pthread_sigmask(SIG_SETMASK, &_old, nullptr);
    }

    SigpipeGuard(const SigpipeGuard&) = delete;
    SigpipeGuard& operator=(const SigpipeGuard&) = delete;

private:
    sigset_t _set;
    sigset_t _old;
    bool _blocked = false;
};

void fail(rf::ExchangeResult& r, rf::ExchangeError e, const std::string& detail) {
    r.error = e;
    r.detail = detail;
    rf::log_line(std::string("[RF] ") + rf::to_string(e) + ": " + detail);
}

std::string errno_text(int e) {
    if (e == EAGAIN || e == EWOULDBLOCK) return "timed out";
    return std::strerror(e);
}

// Exchange over a plain socket. Returns false with r filled in on error.
bool plain_exchange(rf::internal::TcpConn& conn, const std::string& wire,
                    std::string& raw, rf::ExchangeResult& r) {
    if (!conn.send_all(wire.data(), wire.size())) {
        fail(r, rf::ExchangeError::SendFailure, "send: " + errno_text(errno));
        return false;
    }
    if (!conn.recv_until_eof(raw)) {
        fail(r, rf::ExchangeError::ReceiveFailure, "recv: " + errno_text(errno));
        return false;
    }
    return true;
}

bool tls_handshake(SSL* s, const std::string& host, const rf::ExchangeOptions& opt,
                   rf::ExchangeResult& r) {
    const bool ip = rf::internal::is_ip_literal(host);
    if (!ip) {
        SSL_set_tlsext_host_name(s, host.c_str());
    }
    if (opt.tls_verify_peer) {
        const int ok = ip ? X509_VERIFY_PARAM_set1_ip_asc(SSL_get0_param(s), host.c_str())
                          : SSL_set1_host(s, host.c_str());
        if (ok != 1) {
            fail(r, rf::ExchangeError::TlsFailure, "cannot set expected peer name " + host);
            return false;
        }
    }

    for (;;) {
        ERR_clear_error();
        const int rc = SSL_connect(s);
        if (rc == 1) break;
        const int ssl_err = SSL_get_error(s, rc);
        const int e = errno;
        if (ssl_err == SSL_ERROR_SYSCALL && rc < 0 && e == EINTR) continue;

        std::string why = rf::internal::log_openssl_errors("SSL_connect");
        if (why.empty()) {
            why = (ssl_err == SSL_ERROR_SYSCALL && rc < 0) ? errno_text(e)
                                                           : "ssl_error=" + std::to_string(ssl_err);
        }
        fail(r, rf::ExchangeError::TlsFailure, "handshake with " + host + " failed: " + why);
        return false;
    }

    if (opt.tls_verify_peer) {
        const long vr = SSL_get_verify_result(s);
        if (vr != X509_V_OK) {
            fail(r, rf::ExchangeError::TlsFailure,
                 std::string("certificate verify failed: ") + X509_verify_cert_error_string(vr));
            return false;
        }
    }
    return true;
}

// Exchange inside a TLS session on an already connected socket.
bool tls_exchange(rf::internal::TcpConn& conn, SSL_CTX* ctx, const std::string& host,
                  const rf::ExchangeOptions& opt, const std::string& wire,
                  std::string& raw, rf::ExchangeResult& r) {
    SslPtr ssl(SSL_new(ctx), SSL_free);
    if (!ssl) {
        fail(r, rf::ExchangeError::TlsFailure,
             "SSL_new failed: " + rf::internal::log_openssl_errors("SSL_new"));
        return false;
    }
    SSL* s = ssl.get();
    if (SSL_set_fd(s, conn.fd()) != 1) {
        fail(r, rf::ExchangeError::TlsFailure, "SSL_set_fd failed");
        return false;
    }
    if (!tls_handshake(s, host, opt, r)) return false;

    std::size_t off = 0;
    while (off < wire.size()) {
        const int n = SSL_write(s, wire.data() + off, rf::internal::clamp_to_int(wire.size() - off));
        if (n <= 0) {
            const int e = errno;
            const int ssl_err = SSL_get_error(s, n);
            if (ssl_err == SSL_ERROR_SYSCALL && e == EINTR) continue;
            rf::internal::log_openssl_errors("SSL_write");
            fail(r, rf::ExchangeError::SendFailure, "SSL_write: " + errno_text(e));
            return false;
        }
        off += (std::size_t)n;
    }

    char buf[1024];
    for (;;) {
        const int n = SSL_read(s, buf, sizeof(buf));
        if (n > 0) {
            raw.append(buf, buf + n);
            continue;
        }
        const int e = errno;
        const int ssl_err = SSL_get_error(s, n);
        if (ssl_err == SSL_ERROR_ZERO_RETURN) break;
        if (ssl_err == SSL_ERROR_SYSCALL) {
            if (n < 0 && e == EINTR) continue;
            // Peer closed the TCP stream without close_notify.
            if (n == 0 && ERR_peek_error() == 0) break;
        }
        const std::string why = rf::internal::log_openssl_errors("SSL_read");
        fail(r, rf::ExchangeError::ReceiveFailure,
             "SSL_read: " + (why.empty() ? errno_text(e) : why));
        return false;
    }

    SSL_shutdown(s);
    return true;
}

} // namespace

namespace rf {

const char* to_string(ExchangeError e) {
    switch (e) {
    case ExchangeError::None:                  return "none";
    case ExchangeError::NameResolutionFailure: return "name resolution failure";
    case ExchangeError::ConnectionRefused:     return "connection refused";
    case ExchangeError::ConnectFailure:        return "connect failure";
    case ExchangeError::TlsFailure:            return "tls failure";
    case ExchangeError::SendFailure:           return "send failure";
    case ExchangeError::ReceiveFailure:        return "receive failure";
    case ExchangeError::EncodeFailure:         return "encode failure";
    case ExchangeError::NoRequest:             return "no request";
    }
    return "unknown";
}

ExchangeResult execute(const RequestContext& ctx, const ExchangeOptions& opt) {
    if (ctx.last_request().empty()) {
        ExchangeResult r;
        fail(r, ExchangeError::NoRequest, "build_request() was not called for " + ctx.url());
        return r;
    }
    return execute(ctx.host(), ctx.port(), ctx.use_tls(), ctx.last_request(), opt);
}

ExchangeResult execute(const std::string& host,
                       std::uint16_t port,
                       bool use_tls,
                       const std::string& request,
                       const ExchangeOptions& opt)
{
    ExchangeResult r;

    internal::Charset cs;
    if (!internal::parse_charset(opt.encoding, cs)) {
        fail(r, ExchangeError::EncodeFailure, "unknown encoding: " + opt.encoding);
        return r;
    }
    std::string wire, why;
    if (!internal::encode_text(request, cs, wire, why)) {
        fail(r, ExchangeError::EncodeFailure, why);
        return r;
    }

    std::unique_ptr<internal::TlsClientContext> tls;
    if (use_tls) {
        tls = std::make_unique<internal::TlsClientContext>(opt);
        if (!tls->ctx()) {
            fail(r, ExchangeError::TlsFailure, "TLS context not ready");
            return r;
        }
    }

    std::string raw;
    {
        internal::TcpConn conn;
        std::string detail;
        if (!conn.open(host, port, opt.timeout_sec, r.error, detail)) {
            r.detail = detail;
            return r;
        }

        bool ok = false;
        if (use_tls) {
            SigpipeGuard nosig;
            ok = tls_exchange(conn, tls->ctx(), host, opt, wire, raw, r);
        } else {
            ok = plain_exchange(conn, wire, raw, r);
        }
        conn.close();
        if (!ok) {
            r.response.kind = Payload::Bytes;
            r.response.data = std::move(raw);
            return r;
        }
    }

    if (!opt.decode) {
        r.response.kind = Payload::Bytes;
        r.response.data = std::move(raw);
        return r;
    }

    std::string text;
    if (!internal::decode_bytes(raw, cs, text, why)) {
        log_line("[RF] could not decode the response: " + why);
        r.response.kind = Payload::Bytes;
        r.response.data = std::move(raw);
        r.response.decode_error = why;
        return r;
    }
    r.response.kind = Payload::Text;
    r.response.data = std::move(text);
    return r;
}

} // namespace rf
