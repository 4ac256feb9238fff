/*
 * Part of the RedFox (RF) project.
 *
 * SPDX-FileCopyrightText: 2025 RedFox contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of RedFox (RF). See LICENSE for details.
 */

#include "rf/url_utils.hpp"
#include "rf/internal/utils.hpp"
#include <algorithm>

namespace rf {

int url_depth(const std::string& url) {
    std::vector<std::string> seg = internal::split_char(url, '/');
    if (seg.size() > 1 && seg.back().empty()) {
        seg.pop_back();
    }

    // "http:", "" and the host precede the path; a bare "host/a/b" has only the host.
    const bool absolute = url.find("http:") != std::string::npos ||
                          url.find("https:") != std::string::npos;
    const int skip = absolute ? 3 : 1;
    return std::max(0, (int)seg.size() - skip);
}

bool in_domain(const std::string& url, const std::string& domain) {
    return url.find(domain) != std::string::npos;
}

} // namespace rf
