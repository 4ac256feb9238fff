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

namespace rf::internal {

enum class Charset {
    Utf8,
    Ascii,
    Latin1
};

// Accepts "utf-8", "utf8", "ascii", "us-ascii", "latin-1", "latin1",
// "iso-8859-1" (case-insensitive, '_' same as '-').
bool parse_charset(const std::string& name, Charset& out);

// UTF-8 text -> wire bytes in cs. On failure err names the byte offset.
bool encode_text(const std::string& text, Charset cs, std::string& out, std::string& err);

// Wire bytes in cs -> UTF-8 text. On failure err names the byte offset.
bool decode_bytes(const std::string& bytes, Charset cs, std::string& out, std::string& err);

// application/x-www-form-urlencoded: space -> '+', unreserved kept, rest %XX.
std::string quote_plus(const std::string& s);

} // namespace rf::internal
