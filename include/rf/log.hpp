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

// Thread-safe logging (to optional file + stderr).
void set_log_file(const std::string& path);
void set_log_stderr(bool enabled);
void log_line(const std::string& line);

} // namespace rf
