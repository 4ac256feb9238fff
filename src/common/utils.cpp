/*
 * Part of the RedFox (RF) project.
 *
 * SPDX-FileCopyrightText: 2025 RedFox contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of RedFox (RF). See LICENSE for details.
 */

#include "rf/internal/utils.hpp"
#include <cctype>
#include <limits>
#include <arpa/inet.h>

namespace rf::internal {

int clamp_to_int(std::uint64_t v){
    const auto max = static_cast<std::uint64_t>(std::numeric_limits<int>::max());
    return v > max ? std::numeric_limits<int>::max() : static_cast<int>(v);
}

std::string lower_copy(std::string s){
    for(char& c: s) c = (char)std::tolower((unsigned char)c);
    return s;
}

std::vector<std::string> split_ws(const std::string& s){
    std::vector<std::string> out;
    std::size_t i = 0;
    while (i < s.size()) {
        while (i < s.size() && std::isspace((unsigned char)s[i])) ++i;
        if (i >= s.size()) break;
        std::size_t j = i;
        while (j < s.size() && !std::isspace((unsigned char)s[j])) ++j;
        out.emplace_back(s, i, j - i);
        i = j;
    }
    return out;
}

std::vector<std::string> split_char(const std::string& s, char sep){
    std::vector<std::string> out;
    std::size_t p = 0;
    for (;;) {
        std::size_t q = s.find(sep, p);
        if (q == std::string::npos) {
            out.emplace_back(s, p);
            break;
        }
        out.emplace_back(s, p, q - p);
        p = q + 1;
    }
    return out;
}

bool is_ip_literal(const std::string& s){
    unsigned char tmp[16];
    return ::inet_pton(AF_INET, s.c_str(), tmp) == 1 ||
           ::inet_pton(AF_INET6, s.c_str(), tmp) == 1;
}

} // namespace rf::internal
