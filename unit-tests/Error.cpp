/*
 * SPDX-FileCopyrightText: <text>Copyright 2024 Arm Limited and/or its
 * affiliates <open-source-office@arm.com></text>
 * SPDX-License-Identifier: Apache-2.0
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 *
 * This file is part of V2W, the VCD to Wave converter.
 */

#include "V2W/Error.h"

#include "v2w-unit-testing.h"

#include <string>

#include "gtest/gtest.h"

using namespace testing;

using std::string;

using V2W::Error;
using V2W::ErrorKind;
using V2W::SourceLocation;

TEST(Error, concat) {
    EXPECT_EQ(V2W::concat("a"), "a");
    EXPECT_EQ(V2W::concat("width ", 8, " of '", string("clk"), "'"),
              "width 8 of 'clk'");
    EXPECT_EQ(V2W::concat('#', 10u), "#10");
}

TEST(Error, warn) {
    CoutCerrRedirect capture;
    warn("this is a warning");
    EXPECT_EQ(capture.out.str().size(), 0);
    const string err = capture.err.str().substr(0, 70);
    EXPECT_EQ(err, "Warning: this is a warning in virtual void "
                   "Error_warn_Test::TestBody()");
}

TEST(Error, error) {
    CoutCerrRedirect capture;
    error("this is an error");
    EXPECT_EQ(capture.out.str().size(), 0);
    const string err = capture.err.str().substr(0, 68);
    EXPECT_EQ(err, "Error: this is an error in virtual void "
                   "Error_error_Test::TestBody()");
}

TEST(Error, die) {
    EXPECT_DEATH(
        { die("this is a fatal error"); },
        "Fatal: this is a fatal error in virtual void "
        "Error_die_Test::TestBody().*");
}

TEST(Error, kindNames) {
    EXPECT_STREQ(V2W::getErrorKindName(ErrorKind::MALFORMED_SYNTAX),
                 "malformed syntax");
    EXPECT_STREQ(V2W::getErrorKindName(ErrorKind::UNBALANCED_SCOPE),
                 "unbalanced scope");
    EXPECT_STREQ(V2W::getErrorKindName(ErrorKind::INVALID_WIDTH),
                 "invalid width");
    EXPECT_STREQ(V2W::getErrorKindName(ErrorKind::INVALID_VALUE_SYMBOL),
                 "invalid value symbol");
    EXPECT_STREQ(V2W::getErrorKindName(ErrorKind::UNKNOWN_IDENTIFIER),
                 "unknown identifier");
    EXPECT_STREQ(V2W::getErrorKindName(ErrorKind::UNKNOWN_SIGNAL),
                 "unknown signal");
    EXPECT_STREQ(V2W::getErrorKindName(ErrorKind::INVALID_WINDOW),
                 "invalid window");
    EXPECT_STREQ(V2W::getErrorKindName(ErrorKind::NO_SIGNALS_REQUESTED),
                 "no signals requested");
}

TEST(Error, exception) {
    const Error E1(ErrorKind::INVALID_WINDOW, "chunk size must not be 0");
    EXPECT_EQ(E1.getKind(), ErrorKind::INVALID_WINDOW);
    EXPECT_FALSE(E1.hasLocation());
    EXPECT_EQ(E1.getMessage(), "chunk size must not be 0");
    EXPECT_STREQ(E1.what(), "invalid window: chunk size must not be 0");

    const Error E2(ErrorKind::MALFORMED_SYNTAX, "unexpected $end",
                   SourceLocation(12, 345));
    EXPECT_EQ(E2.getKind(), ErrorKind::MALFORMED_SYNTAX);
    EXPECT_TRUE(E2.hasLocation());
    EXPECT_EQ(E2.getLocation().line, 12);
    EXPECT_EQ(E2.getLocation().offset, 345);
    EXPECT_EQ(E2.getMessage(), "unexpected $end");
    EXPECT_STREQ(E2.what(),
                 "malformed syntax: unexpected $end (line 12, offset 345)");

    try {
        throw E2;
    } catch (const std::runtime_error &e) {
        EXPECT_STREQ(e.what(),
                     "malformed syntax: unexpected $end (line 12, offset 345)");
    }
}
