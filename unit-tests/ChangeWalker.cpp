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
#include "V2W/VCD/ChangeWalker.h"
#include "V2W/VCD/Declarations.h"
#include "V2W/VCD/Lexer.h"
#include "V2W/VCD/Value.h"

#include "v2w-unit-testing.h"

#include <sstream>
#include <string>
#include <vector>

#include "gtest/gtest.h"

using namespace testing;
using namespace V2W::VCD;

using std::istringstream;
using std::string;
using std::vector;
using V2W::ErrorKind;

namespace {
const char Header[] = "$scope module top $end\n"
                      "$var wire 1 ! clk $end\n"
                      "$var wire 4 # bus [3:0] $end\n"
                      "$var real 64 % temp $end\n"
                      "$scope module sub $end\n"
                      "$var wire 1 ! clk $end\n"
                      "$upscope $end\n"
                      "$upscope $end\n";

// Parse the header of vcd, and get ready to walk its body.
class Walker {
  public:
    Walker(const string &vcd)
        : is(vcd), L(is), D(DeclarationBuilder(L).build()), W(L, D) {}

    // Collect all the remaining events.
    vector<ValueChangeEvent> all() {
        vector<ValueChangeEvent> events;
        ValueChangeEvent E;
        while (W.next(E))
            events.push_back(E);
        return events;
    }

    istringstream is;
    Lexer L;
    Declarations D;
    ChangeWalker W;
};

// Walk body, expecting an error. Returns the error kind.
ErrorKind walkError(const string &body) {
    Walker WK(makeVCD(Header, body));
    try {
        WK.all();
    } catch (const V2W::Error &e) {
        return e.getKind();
    }
    ADD_FAILURE() << "no error reported";
    return ErrorKind::UNKNOWN_SIGNAL;
}
} // namespace

TEST(ChangeWalker, empty) {
    Walker WK(makeVCD(Header, ""));
    EXPECT_FALSE(WK.W.isDone());
    EXPECT_FALSE(WK.W.hasTime());

    ValueChangeEvent E;
    EXPECT_FALSE(WK.W.next(E));
    EXPECT_TRUE(WK.W.isDone());
    EXPECT_FALSE(WK.W.hasTime());
    EXPECT_EQ(WK.W.getCurrentTime(), 0);
    EXPECT_EQ(WK.W.getNumEvents(), 0);

    // Once done, the walker stays done.
    EXPECT_FALSE(WK.W.next(E));
}

TEST(ChangeWalker, events) {
    Walker WK(makeVCD(Header, "#0\n"
                              "$dumpvars\n"
                              "x!\n"
                              "bxxxx #\n"
                              "r0 %\n"
                              "$end\n"
                              "#10\n"
                              "1!\n"
                              "b101 #\n"
                              "#15\n"
                              "#20\n"
                              "0!\n"
                              "r2.5 %\n"
                              "bz #\n"));
    const vector<ValueChangeEvent> events = WK.all();
    ASSERT_EQ(events.size(), 8);

    const vector<TimeTy> times{0, 0, 0, 10, 10, 20, 20, 20};
    const vector<string> codes{"!", "#", "%", "!", "#", "!", "%", "#"};
    const vector<string> values{"x",   "xxxx", "0", "1",
                                "0101", "0",    "2.5", "zzzz"};
    for (size_t i = 0; i < events.size(); i++) {
        EXPECT_EQ(events[i].time, times[i]) << "event " << i;
        EXPECT_EQ(events[i].code, codes[i]) << "event " << i;
        EXPECT_EQ(events[i].value.str(), values[i]) << "event " << i;
    }

    EXPECT_TRUE(events[2].value.isReal());
    EXPECT_EQ(events[2].value.getReal(), 0.0);
    EXPECT_EQ(events[6].value.getReal(), 2.5);
    EXPECT_EQ(events[4].value.getBits(),
              BitVector::logic0(4)
                  .set(Logic::Ty::LOGIC_1, 0)
                  .set(Logic::Ty::LOGIC_1, 2));

    EXPECT_TRUE(WK.W.isDone());
    EXPECT_TRUE(WK.W.hasTime());
    EXPECT_EQ(WK.W.getCurrentTime(), 20);
    EXPECT_EQ(WK.W.getNumEvents(), 8);
}

TEST(ChangeWalker, locations) {
    Walker WK(makeVCD(Header, "#0\n1!\n b0 #\n"));
    ValueChangeEvent E;
    ASSERT_TRUE(WK.W.next(E));
    EXPECT_EQ(E.location.line, 14);
    ASSERT_TRUE(WK.W.next(E));
    EXPECT_EQ(E.location.line, 15);
    EXPECT_FALSE(WK.W.next(E));
}

TEST(ChangeWalker, currentValues) {
    Walker WK(makeVCD(Header, "#0\n1!\n#5\nb11 #\n#7\n0!\n"));
    ValueChangeEvent E;

    EXPECT_EQ(WK.W.getValue("!"), nullptr);
    EXPECT_EQ(WK.W.getValue("#"), nullptr);

    ASSERT_TRUE(WK.W.next(E));
    ASSERT_NE(WK.W.getValue("!"), nullptr);
    EXPECT_EQ(WK.W.getValue("!")->str(), "1");
    EXPECT_EQ(WK.W.getValue("#"), nullptr);

    ASSERT_TRUE(WK.W.next(E));
    EXPECT_EQ(E.time, 5);
    ASSERT_NE(WK.W.getValue("#"), nullptr);
    EXPECT_EQ(WK.W.getValue("#")->str(), "0011");

    ASSERT_TRUE(WK.W.next(E));
    EXPECT_EQ(E.time, 7);
    EXPECT_EQ(WK.W.getValue("!")->str(), "0");
    EXPECT_EQ(WK.W.getValue("#")->str(), "0011");
    EXPECT_EQ(WK.W.getValue("%"), nullptr);
    EXPECT_EQ(WK.W.getValue("?"), nullptr);
}

TEST(ChangeWalker, eventValuesAreSnapshots) {
    Walker WK(makeVCD(Header, "#0\nb1010 #\n#5\nb0110 #\n#7\nb11111 #\n"));
    ValueChangeEvent E;

    ASSERT_TRUE(WK.W.next(E));
    EXPECT_EQ(E.value, *WK.W.getValue("#"));
    const ValueChangeEvent first = E;

    // Reusing the event object does not alter earlier copies.
    ASSERT_TRUE(WK.W.next(E));
    EXPECT_EQ(E.value.str(), "0110");
    EXPECT_EQ(E.value, *WK.W.getValue("#"));
    EXPECT_EQ(first.value.str(), "1010");

    // A rejected change leaves the current value untouched.
    EXPECT_THROW(WK.W.next(E), V2W::Error);
    EXPECT_EQ(WK.W.getValue("#")->str(), "0110");
}

TEST(ChangeWalker, aliases) {
    // top/clk and top/sub/clk share code '!': a single event serves both.
    Walker WK(makeVCD(Header, "#0\n1!\n"));
    const vector<size_t> *aliases = WK.D.findCode("!");
    ASSERT_NE(aliases, nullptr);
    EXPECT_EQ(aliases->size(), 2);

    const vector<ValueChangeEvent> events = WK.all();
    ASSERT_EQ(events.size(), 1);
    EXPECT_EQ(events[0].code, "!");
}

TEST(ChangeWalker, sameTimeMarkers) {
    Walker WK(makeVCD(Header, "#10\n1!\n#10\n0!\n"));
    const vector<ValueChangeEvent> events = WK.all();
    ASSERT_EQ(events.size(), 2);
    EXPECT_EQ(events[0].time, 10);
    EXPECT_EQ(events[1].time, 10);
    EXPECT_EQ(events[1].value.str(), "0");
}

TEST(ChangeWalker, changesBeforeFirstTimeMarker) {
    Walker WK(makeVCD(Header, "1!\n#3\n0!\n"));
    const vector<ValueChangeEvent> events = WK.all();
    ASSERT_EQ(events.size(), 2);
    EXPECT_EQ(events[0].time, 0);
    EXPECT_EQ(events[1].time, 3);
}

TEST(ChangeWalker, comments) {
    CoutCerrRedirect capture;
    Walker WK(makeVCD(Header, "#0\n"
                              "$comment some #5 1! text $end\n"
                              "1!\n"
                              "$dumpoff\n"
                              "x!\n"
                              "$end\n"
                              "#2\n"
                              "$dumpon\n"
                              "1!\n"
                              "$end\n"));
    const vector<ValueChangeEvent> events = WK.all();
    ASSERT_EQ(events.size(), 3);
    EXPECT_EQ(events[0].time, 0);
    EXPECT_EQ(events[1].value.str(), "x");
    EXPECT_EQ(events[2].time, 2);
    EXPECT_TRUE(capture.err.str().empty());
}

TEST(ChangeWalker, unknownCommands) {
    CoutCerrRedirect capture;
    Walker WK(makeVCD(Header, "#0\n"
                              "$attrbegin misc 07 foo 1 $end\n"
                              "1!\n"));
    const vector<ValueChangeEvent> events = WK.all();
    ASSERT_EQ(events.size(), 1);
    EXPECT_NE(
        capture.err.str().find("Warning: skipping unknown command $attrbegin"),
        string::npos);
}

TEST(ChangeWalker, errors) {
    EXPECT_EQ(walkError("#0\n1?\n"), ErrorKind::UNKNOWN_IDENTIFIER);
    EXPECT_EQ(walkError("#0\nb0 ?\n"), ErrorKind::UNKNOWN_IDENTIFIER);
    EXPECT_EQ(walkError("#0\n2!\n"), ErrorKind::INVALID_VALUE_SYMBOL);
    EXPECT_EQ(walkError("#0\nb01u0 #\n"), ErrorKind::INVALID_VALUE_SYMBOL);
    EXPECT_EQ(walkError("#0\nb11111 #\n"), ErrorKind::INVALID_WIDTH);
    EXPECT_EQ(walkError("#10\n1!\n#5\n0!\n"), ErrorKind::MALFORMED_SYNTAX);
    EXPECT_EQ(walkError("#0\n1%\n"), ErrorKind::MALFORMED_SYNTAX);
    EXPECT_EQ(walkError("#0\nr1.5 !\n"), ErrorKind::MALFORMED_SYNTAX);
    EXPECT_EQ(walkError("#0\nrabc %\n"), ErrorKind::MALFORMED_SYNTAX);
    EXPECT_EQ(walkError("#0\nr1.5x %\n"), ErrorKind::MALFORMED_SYNTAX);
    EXPECT_EQ(walkError("#0\n$var wire 1 ( late $end\n"),
              ErrorKind::MALFORMED_SYNTAX);
    EXPECT_EQ(walkError("#0\n$scope module late $end\n"),
              ErrorKind::MALFORMED_SYNTAX);
}

TEST(ChangeWalker, leadingZeros) {
    // Excess leading zeros are accepted.
    Walker WK(makeVCD(Header, "#0\nb000011 #\n"));
    const vector<ValueChangeEvent> events = WK.all();
    ASSERT_EQ(events.size(), 1);
    EXPECT_EQ(events[0].value.str(), "0011");
}

TEST(ChangeWalker, abandon) {
    Walker WK(makeVCD(Header, "#0\n1!\n#10\n0!\n#20\n1?\n"));
    ValueChangeEvent E;
    ASSERT_TRUE(WK.W.next(E));
    ASSERT_TRUE(WK.W.next(E));
    EXPECT_EQ(E.time, 10);
    EXPECT_FALSE(WK.W.isDone());
    EXPECT_EQ(WK.W.getNumEvents(), 2);
}
