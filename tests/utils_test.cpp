/*
 * Part of the RedFox (RF) project.
 *
 * SPDX-FileCopyrightText: 2025 RedFox contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of RedFox (RF). See LICENSE for details.
 */

#include <gtest/gtest.h>
#include "rf/internal/utils.hpp"

#include <cstdint>
#include <limits>

using namespace rf::internal;

TEST(ClampToInt, SmallValuesUnchanged) {
    EXPECT_EQ(clamp_to_int(0), 0);
    EXPECT_EQ(clamp_to_int(2000), 2000);
}

TEST(ClampToInt, SaturatesAtIntMax) {
    const int max = std::numeric_limits<int>::max();
    EXPECT_EQ(clamp_to_int(static_cast<std::uint64_t>(max)), max);
    EXPECT_EQ(clamp_to_int(std::uint64_t(3000000) * 1000), max);
    EXPECT_EQ(clamp_to_int(std::numeric_limits<std::uint64_t>::max()), max);
}

TEST(SplitWs, CollapsesWhitespaceRuns) {
    const auto t = split_ws("  HTTP/1.1\t200 \r\nOK\r\n");
    ASSERT_EQ(t.size(), 3u);
    EXPECT_EQ(t[1], "200");
}

TEST(SplitChar, KeepsEmptySegments) {
    const auto s = split_char("http://a/", '/');
    ASSERT_EQ(s.size(), 4u);
    EXPECT_TRUE(s[1].empty());
    EXPECT_TRUE(s[3].empty());
}

TEST(IsIpLiteral, V4V6AndNames) {
    EXPECT_TRUE(is_ip_literal("127.0.0.1"));
    EXPECT_TRUE(is_ip_literal("::1"));
    EXPECT_FALSE(is_ip_literal("rit.edu"));
}
