/*
 * Part of the RedFox (RF) project.
 *
 * SPDX-FileCopyrightText: 2025 RedFox contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of RedFox (RF). See LICENSE for details.
 */

#include "rf/internal/tls_cli_ctx.hpp"
#include "rf/log.hpp"
#include <openssl/ssl.h>
#include <openssl/err.h>

namespace rf::internal {

std::string log_openssl_errors(const char* where) {
    std::string last;
    unsigned long e;
    while ((e = ERR_get_error()) != 0) {
        char buf[256];
        ERR_error_string_n(e, buf, sizeof(buf));
        last = buf;
        rf::log_line(std::string("[TLS] error at ") + where + ": " + buf);
    }
    return last;
}

TlsClientContext::TlsClientContext(const rf::ExchangeOptions& opt) {
    const SSL_METHOD* method = TLS_client_method();
    _ctx = SSL_CTX_new(method);
    if (!_ctx) {
        log_openssl_errors("SSL_CTX_new");
        return;
    }

    // Trust store
    if (!opt.tls_ca_file.empty()) {
        if (SSL_CTX_load_verify_locations(_ctx, opt.tls_ca_file.c_str(), nullptr) != 1) {
            log_openssl_errors("load_verify_locations(CA)");
        }
    } else {
        if (SSL_CTX_set_default_verify_paths(_ctx) != 1) {
            log_openssl_errors("set_default_verify_paths");
        }
    }

    // Verification
    if (opt.tls_verify_peer) {
        SSL_CTX_set_verify(_ctx, SSL_VERIFY_PEER, nullptr);
    } else {
        SSL_CTX_set_verify(_ctx, SSL_VERIFY_NONE, nullptr);
    }

#ifdef SSL_OP_IGNORE_UNEXPECTED_EOF
    // Many servers close the TCP stream without close_notify; that is EOF here.
    SSL_CTX_set_options(_ctx, SSL_OP_IGNORE_UNEXPECTED_EOF);
#endif
}

TlsClientContext::~TlsClientContext() {
    if (_ctx) {
        SSL_CTX_free(_ctx);
        _ctx = nullptr;
    }
}

} // namespace rf::internal
