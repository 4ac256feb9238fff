/*
 * Part of the RedFox (RF) project.
 *
 * SPDX-FileCopyrightText: 2025 RedFox contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of RedFox (RF). See LICENSE for details.
 */

#pragma once
#include <openssl/ssl.h>
#include <string>
#include "rf/exchange.hpp"

namespace rf::internal {

// Minimal TLS client context. Loads the system CA store or a custom CA file.
// Peer verification follows ExchangeOptions::tls_verify_peer.
class TlsClientContext {
public:
    explicit TlsClientContext(const rf::ExchangeOptions& opt);
    ~TlsClientContext();

    SSL_CTX* ctx() const { return _ctx; }

    // non-copyable
    TlsClientContext(const TlsClientContext&) = delete;
    TlsClientContext& operator=(const TlsClientContext&) = delete;

private:
    SSL_CTX* _ctx = nullptr;
};

// Drain the OpenSSL error queue into the log; returns the last message.
std::string log_openssl_errors(const char* where);

} // namespace rf::internal
