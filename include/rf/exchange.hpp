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
#include "rf/request_context.hpp"

namespace rf {

// Per-call options for one request/response exchange.
struct ExchangeOptions {
    int  timeout_sec = 0;          // connect/read deadline; 0 blocks indefinitely
    std::string encoding = "utf-8"; // used to encode the request and decode the response
    bool decode = true;            // false returns the raw bytes untouched

    // TLS
    bool tls_verify_peer = false;  // verify server certificate and host name
    std::string tls_ca_file;       // optional CA file; system trust store otherwise
};

enum class ExchangeError {
    None,
    NameResolutionFailure,  // host could not be resolved
    ConnectionRefused,      // peer actively rejected the connection
    ConnectFailure,         // any other connect error, including timeout
    TlsFailure,             // TLS context or handshake failed
    SendFailure,
    ReceiveFailure,         // socket error or timeout before the peer closed
    EncodeFailure,          // request not representable in the encoding
    NoRequest               // execute(ctx) before build_request(ctx)
};

const char* to_string(ExchangeError e);

enum class Payload {
    Text,   // decoded, UTF-8
    Bytes   // raw wire bytes (decode declined or failed)
};

struct RawResponse {
    Payload kind = Payload::Text;
    std::string data;
    std::string decode_error;  // set when decoding was requested but failed

    bool is_text() const { return kind == Payload::Text; }
    const std::string& text() const { return data; }
};

struct ExchangeResult {
    ExchangeError error = ExchangeError::None;
    RawResponse response;  // on ReceiveFailure holds whatever arrived before the error
    std::string detail;    // human readable reason for a failure

    bool ok() const { return error == ExchangeError::None; }
};

// Open a fresh socket, send ctx.last_request(), read until the peer closes,
// close, then decode. Never throws for network errors. A peer reset never
// raises SIGPIPE, on plain or TLS connections, whatever the caller's handler.
ExchangeResult execute(const RequestContext& ctx, const ExchangeOptions& opt = {});

// Same exchange with an explicit target and request string.
ExchangeResult execute(const std::string& host,
                       std::uint16_t port,
                       bool use_tls,
                       const std::string& request,
                       const ExchangeOptions& opt = {});

} // namespace rf
