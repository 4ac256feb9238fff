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
#include <stdexcept>

namespace rf {

// Input that does not look like an HTTP response ("HTTP/1.1 200 ...").
class MalformedResponse : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Reason phrase from the (intentionally partial) status table, or "" if unknown.
std::string reason_phrase(int code);

// Second whitespace-separated token as an integer.
// Throws MalformedResponse when it is missing or not numeric.
int status_code(const std::string& response);

// "<HTTP Response: 200 OK>", or "<HTTP Response: 418>" for codes outside the table.
std::string describe(const std::string& response);

// Plain substring search; matches anywhere in the response, body included.
bool has_status(const std::string& response, const std::string& code = "200 OK");

enum class RedirectKind {
    NotRedirect,  // neither "301 Moved Permanently" nor "302 Found" present
    NotFound,     // redirect status present but no Location: token
    Found
};

struct Redirect {
    RedirectKind kind = RedirectKind::NotRedirect;
    std::string location;
};

// Token following the first token containing "Location:" in a 301/302 response.
Redirect redirect_location(const std::string& response);

} // namespace rf
