/*
 * Part of the RedFox (RF) project.
 *
 * SPDX-FileCopyrightText: 2025 RedFox contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of RedFox (RF). See LICENSE for details.
 */

#include "rf/request_context.hpp"
#include "rf/request_builder.hpp"
#include "rf/exchange.hpp"
#include "rf/inspector.hpp"
#include "rf/url_utils.hpp"
#include "rf/log.hpp"

#include <iostream>
#include <string>
#include <cstdint>
#include <algorithm>
#include <csignal>

static void usage(const char* argv0){
    std::cerr <<
      "Usage:\n"
      "  " << argv0 << " --host example.com [--path /] [--port 80] [--agent Mozilla/5.0] [--tls]\n"
      "      [--method GET] [--target URL-OR-PATH] [--connection close] [--data STRING]\n"
      "\n"
      "Exchange:\n"
      "  --timeout <sec>     connect/read deadline, 0 blocks (default 0)\n"
      "  --encoding <name>   utf-8 | ascii | latin-1 (default utf-8)\n"
      "  --raw               do not decode the response\n"
      "  --verify            verify the server certificate\n"
      "  --ca <file>         CA file used with --verify\n"
      "\n"
      "Output:\n"
      "  --show-request      print the request before sending it\n"
      "  --log <file>        also append diagnostics to file\n"
      "\n"
      "Redirects:\n"
      "  --follow <n>        follow up to n absolute http(s) Location redirects (default 0)\n"
      "  --domain <d>        stop following once the location leaves domain d\n";
}

// Split an absolute http(s) URL into host, port, path. Returns false for anything else.
static bool split_url(const std::string& url, std::string& host, std::uint16_t& port,
                      std::string& path, bool& tls) {
    std::string rest;
    if (url.rfind("http://", 0) == 0)       { tls = false; port = 80;  rest = url.substr(7); }
    else if (url.rfind("https://", 0) == 0) { tls = true;  port = 443; rest = url.substr(8); }
    else return false;

    const std::size_t slash = rest.find('/');
    std::string hostport = rest.substr(0, slash);
    path = (slash == std::string::npos) ? "/" : rest.substr(slash);

    const std::size_t colon = hostport.rfind(':');
    if (colon != std::string::npos && hostport.find(']') == std::string::npos) {
        try {
            port = (std::uint16_t)std::stoi(hostport.substr(colon + 1));
        } catch (const std::exception&) {
            return false;
        }
        hostport.resize(colon);
    }
    host = hostport;
    return !host.empty();
}

int main(int argc, char** argv){
    // SSL_write() has no MSG_NOSIGNAL; a peer reset must not kill the process.
    std::signal(SIGPIPE, SIG_IGN);

    std::string host, path = "/", agent = "Mozilla/5.0";
    std::uint16_t port = 80;
    bool tls = false;

    std::string method = "GET", target, connection = "close", data;
    rf::ExchangeOptions opt;
    bool show_request = false;
    int follow = 0;
    std::string domain;

    try {
        for(int i=1;i<argc;++i){
            std::string a=argv[i];
            if(a=="--host" && i+1<argc) host = argv[++i];
            else if(a=="--path" && i+1<argc) path = argv[++i];
            else if(a=="--port" && i+1<argc) port = (std::uint16_t)std::stoi(argv[++i]);
            else if(a=="--agent" && i+1<argc) agent = argv[++i];
            else if(a=="--tls") tls = true;
            else if(a=="--method" && i+1<argc) method = argv[++i];
            else if(a=="--target" && i+1<argc) target = argv[++i];
            else if(a=="--connection" && i+1<argc) connection = argv[++i];
            else if(a=="--data" && i+1<argc) data = argv[++i];
            else if(a=="--timeout" && i+1<argc) opt.timeout_sec = std::max(0, std::stoi(argv[++i]));
            else if(a=="--encoding" && i+1<argc) opt.encoding = argv[++i];
            else if(a=="--raw") opt.decode = false;
            else if(a=="--verify") opt.tls_verify_peer = true;
            else if(a=="--ca" && i+1<argc) opt.tls_ca_file = argv[++i];
            else if(a=="--show-request") show_request = true;
            else if(a=="--log" && i+1<argc) rf::set_log_file(argv[++i]);
            else if(a=="--follow" && i+1<argc) follow = std::max(0, std::stoi(argv[++i]));
            else if(a=="--domain" && i+1<argc) domain = argv[++i];
            else { usage(argv[0]); return 2; }
        }
    } catch (const std::exception&) {
        usage(argv[0]);
        return 2;
    }
    if (host.empty()) { usage(argv[0]); return 2; }

    for (int hop = 0; ; ++hop) {
        rf::RequestContext ctx(host, path, port, agent, tls);
        const std::string req = rf::build_request(ctx, method, target, connection, data);
        if (show_request) {
            std::cout << req << "\n";
        }

        const rf::ExchangeResult res = rf::execute(ctx, opt);
        if (!res.ok()) {
            std::cerr << "[!] RedFox could not complete the exchange with " << ctx.url()
                      << ": " << res.detail << "\n";
            return 1;
        }
        std::cout << res.response.data;
        if (!res.response.data.empty() && res.response.data.back() != '\n') std::cout << "\n";

        try {
            std::cerr << rf::describe(res.response.text()) << "\n";
        } catch (const rf::MalformedResponse& e) {
            std::cerr << "[!] not an HTTP response: " << e.what() << "\n";
            return 0;
        }

        if (hop >= follow) return 0;
        const rf::Redirect r = rf::redirect_location(res.response.text());
        if (r.kind != rf::RedirectKind::Found) return 0;
        if (!domain.empty() && !rf::in_domain(r.location, domain)) {
            std::cerr << "[!] not following " << r.location << ": outside " << domain << "\n";
            return 0;
        }
        if (!split_url(r.location, host, port, path, tls)) {
            std::cerr << "[!] not following relative location " << r.location << "\n";
            return 0;
        }
        std::cerr << "[*] following redirect to " << r.location
                  << " (depth " << rf::url_depth(r.location) << ")\n";
        target.clear();
    }
}
