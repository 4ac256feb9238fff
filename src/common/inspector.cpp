/*
 * Part of the RedFox (RF) project.
 *
 * SPDX-FileCopyrightText: 2025 RedFox contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of RedFox (RF). See LICENSE for details.
 */

#include "rf/inspector.hpp"
#include "rf/internal/utils.hpp"
#include <map>

namespace rf {
namespace {

// Not every status code, only the ones the tool reports by name.
const std::map<int, const char*>& status_table() {
    static const std::map<int, const char*> table = {
        {200, "OK"},
        {301, "Moved Permanently"},
        {302, "Found"},
        {400, "Bad Request"},
        {403, "Forbidden"},
        {404, "Not Found"},
    };
    return table;
}

// Second whitespace token and its integer value.
int parse_status_token(const std::string& response, std::string& token) {
    const std::vector<std::string> tok = internal::split_ws(response);
    if (tok.size() < 2) {
        throw MalformedResponse("response has no status token");
    }
    token = tok[1];
    std::size_t used = 0;
    int code = 0;
    try {
        code = std::stoi(token, &used);
    } catch (const std::invalid_argument&) {
        throw MalformedResponse("status token is not numeric: " + token);
    } catch (const std::out_of_range&) {
        throw MalformedResponse("status token out of range: " + token);
    }
    if (used != token.size()) {
        throw MalformedResponse("status token is not numeric: " + token);
    }
    return code;
}

} // namespace

std::string reason_phrase(int code) {
    auto it = status_table().find(code);
    return it == status_table().end() ? std::string() : std::string(it->second);
}

int status_code(const std::string& response) {
    std::string token;
    return parse_status_token(response, token);
}

std::string describe(const std::string& response) {
    std::string token;
    const int code = parse_status_token(response, token);
    const std::string reason = reason_phrase(code);
    if (reason.empty()) {
        return "<HTTP Response: " + token + ">";
    }
    return "<HTTP Response: " + token + " " + reason + ">";
}

bool has_status(const std::string& response, const std::string& code) {
    return response.find(code) != std::string::npos;
}

Redirect redirect_location(const std::string& response) {
    Redirect r;
    if (!has_status(response, "301 Moved Permanently") && !has_status(response, "302 Found")) {
        return r;
    }
    r.kind = RedirectKind::NotFound;

    const std::vector<std::string> tok = internal::split_ws(response);
    for (std::size_t i = 0; i < tok.size(); ++i) {
        if (tok[i].find("Location:") == std::string::npos) continue;
        if (i + 1 < tok.size()) {
            r.kind = RedirectKind::Found;
            r.location = tok[i + 1];
        }
        break;
    }
    return r;
}

} // namespace rf
