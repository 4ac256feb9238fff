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

namespace rf {

// Number of path segments below the host:
//   "http://rit.edu/study/undergraduate" -> 2, "http://rit.edu/" -> 0.
// URLs without an "http:"/"https:" scheme are counted from the first segment.
int url_depth(const std::string& url);

// True if domain occurs anywhere in url (substring, not a host match).
bool in_domain(const std::string& url, const std::string& domain);

} // namespace rf
