/*
 * Copyright (c) 2022, Shiv Nadar University, Delhi NCR, India. All Rights
 * Reserved. Permission to use, copy, modify and distribute this software for
 * educational, research, and not-for-profit purposes, without fee and without a
 * signed license agreement, is hereby granted, provided that this paragraph and
 * the following two paragraphs appear in all copies, modifications, and
 * distributions.
 *
 * IN NO EVENT SHALL SHIV NADAR UNIVERSITY BE LIABLE TO ANY PARTY FOR DIRECT,
 * INDIRECT, SPECIAL, INCIDENTAL, OR CONSEQUENTIAL DAMAGES, INCLUDING LOST
 * PROFITS, ARISING OUT OF THE USE OF THIS SOFTWARE.
 *
 * SHIV NADAR UNIVERSITY SPECIFICALLY DISCLAIMS ANY WARRANTIES, INCLUDING, BUT
 * NOT LIMITED TO, THE IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A
 * PARTICULAR PURPOSE. THE SOFTWARE PROVIDED HEREUNDER IS PROVIDED "AS IS". SHIV
 * NADAR UNIVERSITY HAS NO OBLIGATION TO PROVIDE MAINTENANCE, SUPPORT, UPDATES,
 * ENHANCEMENTS, OR MODIFICATIONS.
 */

#include <gtest/gtest.h>

#include <ModelCardParser.hpp>
#include <cmath>

TEST(ParseValue, EmptyInput)
{
    ModelCardParser p;
    bool ok = true;
    double v = p.parseValue("", /*lineNumber=*/1, ok);
    EXPECT_FALSE(ok);
    EXPECT_TRUE(std::isfinite(v));
}

TEST(ParseValue, PlainAndScientificLiterals)
{
    ModelCardParser p;
    bool ok = false;

    EXPECT_DOUBLE_EQ(p.parseValue("20", 1, ok), 20.0);
    EXPECT_TRUE(ok);

    EXPECT_DOUBLE_EQ(p.parseValue("0.25", 2, ok), 0.25);
    EXPECT_TRUE(ok);

    EXPECT_DOUBLE_EQ(p.parseValue("-2E6", 3, ok), -2e6);
    EXPECT_TRUE(ok);

    EXPECT_DOUBLE_EQ(p.parseValue("2e-8", 4, ok), 2e-8);
    EXPECT_TRUE(ok);
}

TEST(ParseValue, FerroelectricCardValues)
{
    ModelCardParser p;
    bool ok = false;

    // Film thickness in nanometres
    double tfe = p.parseValue("20N", 1, ok);
    EXPECT_TRUE(ok);
    EXPECT_DOUBLE_EQ(tfe, 20e-9);

    // Coercive field in MV/m
    double ec = p.parseValue("65MEG", 2, ok);
    EXPECT_TRUE(ok);
    EXPECT_DOUBLE_EQ(ec, 65e6);

    // 'M' is milli, not mega
    double period = p.parseValue("1M", 3, ok);
    EXPECT_TRUE(ok);
    EXPECT_DOUBLE_EQ(period, 1e-3);

    double tol = p.parseValue("100U", 4, ok);
    EXPECT_TRUE(ok);
    EXPECT_DOUBLE_EQ(tol, 100e-6);
}

TEST(ParseValue, RemainingSuffixes)
{
    ModelCardParser p;
    bool ok = false;

    EXPECT_DOUBLE_EQ(p.parseValue("1T", 1, ok), 1e12);
    EXPECT_TRUE(ok);
    EXPECT_DOUBLE_EQ(p.parseValue("2G", 2, ok), 2e9);
    EXPECT_TRUE(ok);
    EXPECT_DOUBLE_EQ(p.parseValue("3K", 3, ok), 3e3);
    EXPECT_TRUE(ok);
    EXPECT_DOUBLE_EQ(p.parseValue("7P", 4, ok), 7e-12);
    EXPECT_TRUE(ok);
    EXPECT_DOUBLE_EQ(p.parseValue("8F", 5, ok), 8e-15);
    EXPECT_TRUE(ok);
}

TEST(ParseValue, LowercaseSuffixNormalization)
{
    ModelCardParser p;
    bool ok = false;

    double v1 = p.parseValue("20n", 1, ok);
    EXPECT_TRUE(ok);
    EXPECT_DOUBLE_EQ(v1, 20e-9);

    double v2 = p.parseValue("65meg", 2, ok);
    EXPECT_TRUE(ok);
    EXPECT_DOUBLE_EQ(v2, 65e6);

    // scientific mantissa followed by a suffix
    double v3 = p.parseValue("6.5e1meg", 3, ok);
    EXPECT_TRUE(ok);
    EXPECT_DOUBLE_EQ(v3, 6.5e1 * 1e6);
}

TEST(ParseValue, UnknownSuffixRejected)
{
    ModelCardParser p;

    bool ok1 = true;
    p.parseValue("20NM", 1, ok1);
    EXPECT_FALSE(ok1);

    bool ok2 = true;
    p.parseValue("1V", 2, ok2);
    EXPECT_FALSE(ok2);
}

TEST(ParseValue, MalformedMantissaRejected)
{
    ModelCardParser p;

    bool ok1 = true;
    p.parseValue("0.2.5", 1, ok1);
    EXPECT_FALSE(ok1);

    bool ok2 = true;
    p.parseValue("MEG", 2, ok2);  // suffix only
    EXPECT_FALSE(ok2);

    bool ok3 = true;
    p.parseValue("TFE", 3, ok3);
    EXPECT_FALSE(ok3);
}

TEST(ParseValue, ErrorMessageNamesLine)
{
    ModelCardParser p;
    bool ok = true;
    testing::internal::CaptureStderr();
    p.parseValue("20Q", 17, ok);
    std::string err = testing::internal::GetCapturedStderr();

    EXPECT_FALSE(ok);
    EXPECT_NE(err.find("Line 17"), std::string::npos);
    EXPECT_NE(err.find("20Q"), std::string::npos);
}
