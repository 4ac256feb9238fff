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
#include <vector>
#include <cstddef>
#include <cstdint>

namespace rf::internal {

std::string lower_copy(std::string s);

// v saturated to INT_MAX, for APIs that take int lengths or milliseconds.
int clamp_to_int(std::uint64_t v);

// Whitespace tokenization (runs of spaces, tabs, CR, LF separate tokens).
std::vector<std::string> split_ws(const std::string& s);

// Split on a single character, keeping empty segments ("a//b" -> a, "", b).
std::vector<std::string> split_char(const std::string& s, char sep);

// True if s is a numeric IPv4 or IPv6 literal.
bool is_ip_literal(const std::string& s);

} // namespace rf::internal
