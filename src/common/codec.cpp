/*
 * Part of the RedFox (RF) project.
 *
 * SPDX-FileCopyrightText: 2025 RedFox contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of RedFox (RF). See LICENSE for details.
 */

#include "rf/internal/codec.hpp"
#include "rf/internal/utils.hpp"
#include <cstdint>
#include <algorithm>

namespace rf::internal {
namespace {

std::string offset_msg(const char* what, std::size_t off) {
    return std::string(what) + " at byte offset " + std::to_string(off);
}

// Read one UTF-8 sequence starting at s[i]; advances i on success.
// Rejects overlong forms, surrogates and code points above U+10FFFF.
bool next_code_point(const std::string& s, std::size_t& i, std::uint32_t& cp) {
    const unsigned char c = (unsigned char)s[i];
    if (c < 0x80) { cp = c; ++i; return true; }

    std::size_t len = 0;
    std::uint32_t min = 0;
    if ((c >> 5) == 0x6)       { len = 2; cp = c & 0x1F; min = 0x80; }
    else if ((c >> 4) == 0xE)  { len = 3; cp = c & 0x0F; min = 0x800; }
    else if ((c >> 3) == 0x1E) { len = 4; cp = c & 0x07; min = 0x10000; }
    else return false;

    if (i + len > s.size()) return false;
    for (std::size_t k = 1; k < len; ++k) {
        const unsigned char cc = (unsigned char)s[i + k];
        if ((cc & 0xC0) != 0x80) return false;
        cp = (cp << 6) | (cc & 0x3F);
    }
    if (cp < min || cp > 0x10FFFF) return false;
    if (cp >= 0xD800 && cp <= 0xDFFF) return false;
    i += len;
    return true;
}

} // namespace

bool parse_charset(const std::string& name, Charset& out) {
    std::string n = lower_copy(name);
    std::replace(n.begin(), n.end(), '_', '-');
    if (n == "utf-8" || n == "utf8") { out = Charset::Utf8; return true; }
    if (n == "ascii" || n == "us-ascii") { out = Charset::Ascii; return true; }
    if (n == "latin-1" || n == "latin1" || n == "iso-8859-1") { out = Charset::Latin1; return true; }
    return false;
}

bool encode_text(const std::string& text, Charset cs, std::string& out, std::string& err) {
    out.clear();
    switch (cs) {
    case Charset::Utf8:
        out = text;
        return true;
    case Charset::Ascii:
        for (std::size_t i = 0; i < text.size(); ++i) {
            if ((unsigned char)text[i] >= 0x80) {
                err = offset_msg("'ascii' codec can't encode character", i);
                return false;
            }
        }
        out = text;
        return true;
    case Charset::Latin1: {
        out.reserve(text.size());
        std::size_t i = 0;
        while (i < text.size()) {
            const std::size_t at = i;
            std::uint32_t cp = 0;
            if (!next_code_point(text, i, cp)) {
                err = offset_msg("invalid UTF-8 in request", at);
                return false;
            }
            if (cp > 0xFF) {
                err = offset_msg("'latin-1' codec can't encode character", at);
                return false;
            }
            out.push_back((char)cp);
        }
        return true;
    }
    }
    err = "unknown charset";
    return false;
}

bool decode_bytes(const std::string& bytes, Charset cs, std::string& out, std::string& err) {
    out.clear();
    switch (cs) {
    case Charset::Utf8: {
        std::size_t i = 0;
        while (i < bytes.size()) {
            const std::size_t at = i;
            std::uint32_t cp = 0;
            if (!next_code_point(bytes, i, cp)) {
                err = offset_msg("'utf-8' codec can't decode byte", at);
                return false;
            }
        }
        out = bytes;
        return true;
    }
    case Charset::Ascii:
        for (std::size_t i = 0; i < bytes.size(); ++i) {
            if ((unsigned char)bytes[i] >= 0x80) {
                err = offset_msg("'ascii' codec can't decode byte", i);
                return false;
            }
        }
        out = bytes;
        return true;
    case Charset::Latin1:
        out.reserve(bytes.size());
        for (unsigned char c : bytes) {
            if (c < 0x80) {
                out.push_back((char)c);
            } else {
                out.push_back((char)(0xC0 | (c >> 6)));
                out.push_back((char)(0x80 | (c & 0x3F)));
            }
        }
        return true;
    }
    err = "unknown charset";
    return false;
}

std::string quote_plus(const std::string& s) {
    static const char* H = "0123456789ABCDEF";
    std::string out;
    out.reserve(s.size() * 3);
    for (unsigned char c : s) {
        const bool alnum = (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9');
        if (alnum || c == '_' || c == '.' || c == '-' || c == '~') {
            out.push_back((char)c);
        } else if (c == ' ') {
            out.push_back('+');
        } else {
            out.push_back('%');
            out.push_back(H[c >> 4]);
            out.push_back(H[c & 0xF]);
        }
    }
    return out;
}

} // namespace rf::internal
