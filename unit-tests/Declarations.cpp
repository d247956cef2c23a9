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
#include "V2W/VCD/Declarations.h"
#include "V2W/VCD/Lexer.h"

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
                      "$var reg 1 \" rst_n $end\n"
                      "$scope module cpu $end\n"
                      "$var wire 8 # data [7:0] $end\n"
                      "$var logic 1 ! clk $end\n"
                      "$var integer 32 $ count $end\n"
                      "$var realtime 64 % temp $end\n"
                      "$upscope $end\n"
                      "$scope task init $end\n"
                      "$var tri 4 & bus[3:0] $end\n"
                      "$upscope $end\n"
                      "$upscope $end\n"
                      "$var int 32 ' top_count $end\n";

Declarations parse(const string &vcd, bool keepHierarchy = false) {
    istringstream is(vcd);
    Lexer L(is);
    DeclarationBuilder B(L, keepHierarchy);
    return B.build();
}

// Parse vcd, expecting an error. Returns the error kind.
ErrorKind parseError(const string &vcd) {
    istringstream is(vcd);
    Lexer L(is);
    DeclarationBuilder B(L);
    try {
        B.build();
    } catch (const V2W::Error &e) {
        return e.getKind();
    }
    ADD_FAILURE() << "no error reported";
    return ErrorKind::UNKNOWN_SIGNAL;
}

// Record the hierarchy traversal as a list of strings.
class RecordingVisitor : public Declarations::Visitor {
  public:
    vector<string> events;

    void enterScope(const Scope &scope) override {
        events.push_back(string("enter ") + Scope::getKindName(scope.getKind()) +
                         " " + scope.getName());
    }
    void leaveScope(const Scope &scope) override {
        events.push_back("leave " + scope.getName());
    }
    void visitSignal(const SignalDefinition &SD) override {
        events.push_back("signal " + SD.getFullName());
    }
};
} // namespace

TEST(SignalDefinition, basics) {
    const SignalDefinition SD({"top", "cpu", "data"}, "#", 8,
                              SignalDefinition::Kind::WIRE, "[7:0]");
    EXPECT_EQ(SD.getName(), "data");
    EXPECT_EQ(SD.getFullName(), "top/cpu/data");
    EXPECT_EQ(SD.getScopeName(), "top/cpu");
    EXPECT_EQ(SD.getIdCode(), "#");
    EXPECT_EQ(SD.getWidth(), 8);
    EXPECT_EQ(SD.getKind(), SignalDefinition::Kind::WIRE);
    EXPECT_TRUE(SD.hasRange());
    EXPECT_EQ(SD.getRange(), "[7:0]");
    EXPECT_FALSE(SD.isReal());
    EXPECT_FALSE(SD.isScalar());

    const SignalDefinition clk({"clk"}, "!", 1, SignalDefinition::Kind::REG);
    EXPECT_EQ(clk.getScopeName(), "");
    EXPECT_FALSE(clk.hasRange());
    EXPECT_TRUE(clk.isScalar());

    EXPECT_EQ(SD, SD);
    EXPECT_NE(SD, clk);

    std::ostringstream os;
    SD.dump(os);
    EXPECT_EQ(os.str(),
              "Name: top/cpu/data, Kind: wire, Width: 8, Range: [7:0], IdCode: "
              "#\n");
}

TEST(SignalDefinition, kinds) {
    SignalDefinition::Kind K;
    const vector<std::pair<const char *, SignalDefinition::Kind>> kinds{
        {"wire", SignalDefinition::Kind::WIRE},
        {"tri", SignalDefinition::Kind::WIRE},
        {"wand", SignalDefinition::Kind::WIRE},
        {"supply1", SignalDefinition::Kind::WIRE},
        {"reg", SignalDefinition::Kind::REG},
        {"logic", SignalDefinition::Kind::REG},
        {"bit", SignalDefinition::Kind::REG},
        {"parameter", SignalDefinition::Kind::PARAMETER},
        {"integer", SignalDefinition::Kind::INTEGER},
        {"int", SignalDefinition::Kind::INTEGER},
        {"longint", SignalDefinition::Kind::INTEGER},
        {"real", SignalDefinition::Kind::REAL},
        {"realtime", SignalDefinition::Kind::REAL},
        {"event", SignalDefinition::Kind::EVENT},
        {"time", SignalDefinition::Kind::TIME}};
    for (const auto &k : kinds) {
        EXPECT_TRUE(SignalDefinition::getKind(k.first, K)) << k.first;
        EXPECT_EQ(K, k.second) << k.first;
    }
    EXPECT_FALSE(SignalDefinition::getKind("wires", K));
    EXPECT_FALSE(SignalDefinition::getKind("", K));

    EXPECT_STREQ(SignalDefinition::getKindName(SignalDefinition::Kind::REG),
                 "reg");
    EXPECT_STREQ(
        SignalDefinition::getKindName(SignalDefinition::Kind::PARAMETER),
        "parameter");
}

TEST(Timescale, parse) {
    Timescale ts;
    EXPECT_EQ(ts.getMultiplier(), 1);
    EXPECT_EQ(ts.getUnit(), "s");

    EXPECT_TRUE(Timescale::parse("1ns", ts));
    EXPECT_EQ(ts, Timescale(1, "ns"));
    EXPECT_EQ(ts.getExponent(), -9);
    EXPECT_EQ(ts.str(), "1 ns");

    EXPECT_TRUE(Timescale::parse("10 ps", ts));
    EXPECT_EQ(ts, Timescale(10, "ps"));
    EXPECT_EQ(ts.getExponent(), -11);

    EXPECT_TRUE(Timescale::parse("100us", ts));
    EXPECT_EQ(ts.getExponent(), -4);
    EXPECT_TRUE(Timescale::parse("1s", ts));
    EXPECT_EQ(ts.getExponent(), 0);
    EXPECT_TRUE(Timescale::parse("100 fs", ts));
    EXPECT_EQ(ts.getExponent(), -13);
    EXPECT_TRUE(Timescale::parse("10ms", ts));
    EXPECT_EQ(ts.getExponent(), -2);

    EXPECT_FALSE(Timescale::parse("", ts));
    EXPECT_FALSE(Timescale::parse("ns", ts));
    EXPECT_FALSE(Timescale::parse("2ns", ts));
    EXPECT_FALSE(Timescale::parse("1000ns", ts));
    EXPECT_FALSE(Timescale::parse("1ks", ts));
    EXPECT_FALSE(Timescale::parse("1", ts));
    EXPECT_EQ(ts, Timescale(10, "ms"));
}

TEST(Scope, kinds) {
    Scope::Kind K;
    EXPECT_TRUE(Scope::getKind("module", K));
    EXPECT_EQ(K, Scope::Kind::MODULE);
    EXPECT_TRUE(Scope::getKind("begin", K));
    EXPECT_EQ(K, Scope::Kind::BEGIN);
    EXPECT_TRUE(Scope::getKind("fork", K));
    EXPECT_EQ(K, Scope::Kind::FORK);
    EXPECT_TRUE(Scope::getKind("interface", K));
    EXPECT_EQ(K, Scope::Kind::INTERFACE);
    EXPECT_FALSE(Scope::getKind("entity", K));
}

TEST(Scope, addScope) {
    Scope root;
    EXPECT_TRUE(root.isRoot());
    EXPECT_FALSE(root.hasSubScopes());

    Scope &top = root.addScope("top", Scope::Kind::MODULE);
    EXPECT_FALSE(top.isRoot());
    EXPECT_EQ(top.getName(), "top");
    EXPECT_EQ(root.getNumSubScopes(), 1);

    // Entering an existing scope again reuses it.
    EXPECT_EQ(&root.addScope("top", Scope::Kind::MODULE), &top);
    EXPECT_EQ(root.getNumSubScopes(), 1);
    EXPECT_EQ(root.findSubScope("top"), &top);
    EXPECT_EQ(root.findSubScope("bottom"), nullptr);

    top.addSignal(3);
    top.addSignal(1);
    EXPECT_EQ(top.getNumSignals(), 2);
    EXPECT_EQ(top.getSignal(0), 3);
    EXPECT_EQ(top.getSignal(1), 1);
}

TEST(DeclarationBuilder, build) {
    const Declarations D = parse(makeVCD(Header, "#0\n"));

    EXPECT_TRUE(D.hasDate());
    EXPECT_EQ(D.getDate(), "today");
    EXPECT_TRUE(D.hasVersion());
    EXPECT_EQ(D.getVersion(), "v2w-unit-tests");
    EXPECT_FALSE(D.hasComment());
    EXPECT_TRUE(D.hasTimescale());
    EXPECT_EQ(D.getTimescale(), Timescale(1, "ns"));
    EXPECT_FALSE(D.hasHierarchy());

    EXPECT_EQ(D.getNumSignals(), 8);
    EXPECT_EQ(D.getNumCodes(), 7);

    // Declaration order is preserved.
    const vector<string> names{"top/clk",       "top/rst_n",
                               "top/cpu/data",  "top/cpu/clk",
                               "top/cpu/count", "top/cpu/temp",
                               "top/init/bus[3:0]", "top_count"};
    for (size_t i = 0; i < names.size(); i++)
        EXPECT_EQ(D[i].getFullName(), names[i]);

    const SignalDefinition *data = D.findSignal("top/cpu/data");
    ASSERT_NE(data, nullptr);
    EXPECT_EQ(data->getWidth(), 8);
    EXPECT_EQ(data->getIdCode(), "#");
    EXPECT_EQ(data->getRange(), "[7:0]");
    EXPECT_EQ(data->getKind(), SignalDefinition::Kind::WIRE);

    EXPECT_EQ(D.findSignal("/top/cpu/data/"), data);
    EXPECT_EQ(D.findSignal("top//cpu/data"), data);
    EXPECT_EQ(D.findSignal("data"), nullptr);
    EXPECT_EQ(D.findSignal("top/cpu"), nullptr);

    const SignalDefinition *temp = D.findSignal("top/cpu/temp");
    ASSERT_NE(temp, nullptr);
    EXPECT_TRUE(temp->isReal());
    EXPECT_EQ(D.findSignal("top/init/bus[3:0]")->getKind(),
              SignalDefinition::Kind::WIRE);
    EXPECT_EQ(D.findSignal("top_count")->getKind(),
              SignalDefinition::Kind::INTEGER);
    EXPECT_EQ(D.findSignal("top/cpu/clk")->getKind(),
              SignalDefinition::Kind::REG);

    // Aliases.
    ASSERT_TRUE(D.hasCode("!"));
    const vector<size_t> *clks = D.findCode("!");
    ASSERT_NE(clks, nullptr);
    EXPECT_EQ(*clks, vector<size_t>({0, 3}));
    EXPECT_EQ(*D.findCode("#"), vector<size_t>({2}));
    EXPECT_EQ(D.findCode("?"), nullptr);
    EXPECT_FALSE(D.hasCode("?"));
}

TEST(DeclarationBuilder, headerMetadata) {
    const Declarations D =
        parse("$comment first $end\n"
              "$version Some simulator\n  2.0 $end\n"
              "$comment second\ncomment $end\n"
              "$timescale\n  10 ps\n$end\n"
              "$var wire 1 ! a $end\n"
              "$enddefinitions $end\n");
    EXPECT_FALSE(D.hasDate());
    EXPECT_EQ(D.getVersion(), "Some simulator 2.0");
    EXPECT_EQ(D.getComment(), "first\nsecond comment");
    EXPECT_EQ(D.getTimescale(), Timescale(10, "ps"));
    EXPECT_EQ(D.getNumSignals(), 1);
    EXPECT_EQ(D[0].getFullName(), "a");

    const Declarations D2 = parse("$enddefinitions $end");
    EXPECT_FALSE(D2.hasTimescale());
    EXPECT_EQ(D2.getNumSignals(), 0);
}

TEST(DeclarationBuilder, hierarchy) {
    const Declarations D =
        parse(makeVCD(string(Header) + "$scope module top $end\n"
                                       "$scope begin blk $end\n"
                                       "$var reg 1 ( late $end\n"
                                       "$upscope $end\n"
                                       "$upscope $end\n",
                      ""),
              /* keepHierarchy: */ true);
    ASSERT_TRUE(D.hasHierarchy());
    EXPECT_TRUE(D.getRootScope().isRoot());
    EXPECT_EQ(D.getRootScope().getNumSubScopes(), 1);
    EXPECT_EQ(D.getRootScope().getNumSignals(), 1);

    RecordingVisitor V;
    D.visit(V);
    EXPECT_EQ(V.events, vector<string>({"signal top_count",
                                        "enter module top",
                                        "signal top/clk",
                                        "signal top/rst_n",
                                        "enter module cpu",
                                        "signal top/cpu/data",
                                        "signal top/cpu/clk",
                                        "signal top/cpu/count",
                                        "signal top/cpu/temp",
                                        "leave cpu",
                                        "enter task init",
                                        "signal top/init/bus[3:0]",
                                        "leave init",
                                        "enter begin blk",
                                        "signal top/blk/late",
                                        "leave blk",
                                        "leave top"}));
}

TEST(DeclarationBuilder, noHierarchy) {
    const Declarations D = parse(makeVCD(Header, ""));
    RecordingVisitor V;
    EXPECT_DEATH(D.visit(V), "Fatal: the scope hierarchy was not retained.*");
}

TEST(DeclarationBuilder, oneShot) {
    istringstream is(makeVCD(Header, ""));
    Lexer L(is);
    DeclarationBuilder B(L);
    const Declarations D = B.build();
    EXPECT_EQ(D.getNumSignals(), 8);
    EXPECT_DEATH(B.build(),
                 "Fatal: the declarations have already been built.*");
}

TEST(DeclarationBuilder, stopsAtEndDefinitions) {
    istringstream is(makeVCD(Header, "#5\n1!\n"));
    Lexer L(is);
    DeclarationBuilder B(L);
    const Declarations D = B.build();

    Token T = L.next();
    EXPECT_TRUE(T.is(Token::Kind::TIME_MARKER));
    EXPECT_EQ(T.time, 5);
    T = L.next();
    EXPECT_TRUE(T.is(Token::Kind::SCALAR_VALUE_CHANGE));
    EXPECT_EQ(T.code, "!");
}

TEST(DeclarationBuilder, unknownCommands) {
    CoutCerrRedirect capture;
    const Declarations D = parse(makeVCD("$attrbegin misc 07 foo 1 $end\n"
                                         "$var wire 1 ! clk $end\n",
                                         ""));
    EXPECT_EQ(D.getNumSignals(), 1);
    EXPECT_NE(capture.err.str().find(
                  "Warning: skipping unknown header command $attrbegin"),
              string::npos);
}

TEST(DeclarationBuilder, duplicatePaths) {
    CoutCerrRedirect capture;
    const Declarations D = parse(makeVCD("$var wire 1 ! clk $end\n"
                                         "$var wire 4 \" clk $end\n",
                                         ""));
    EXPECT_EQ(D.getNumSignals(), 2);
    ASSERT_NE(D.findSignal("clk"), nullptr);
    EXPECT_EQ(D.findSignal("clk")->getIdCode(), "!");
    EXPECT_NE(capture.err.str().find(
                  "Warning: signal 'clk' is declared more than once"),
              string::npos);
}

TEST(DeclarationBuilder, unbalancedScopes) {
    EXPECT_EQ(parseError(makeVCD("$upscope $end\n", "")),
              ErrorKind::UNBALANCED_SCOPE);
    EXPECT_EQ(parseError(makeVCD("$scope module top $end\n"
                                 "$upscope $end\n"
                                 "$upscope $end\n",
                                 "")),
              ErrorKind::UNBALANCED_SCOPE);
    EXPECT_EQ(parseError(makeVCD("$scope module top $end\n"
                                 "$var wire 1 ! clk $end\n",
                                 "")),
              ErrorKind::UNBALANCED_SCOPE);
}

TEST(DeclarationBuilder, invalidWidths) {
    EXPECT_EQ(parseError(makeVCD("$var wire 0 ! clk $end\n", "")),
              ErrorKind::INVALID_WIDTH);
    EXPECT_EQ(parseError(makeVCD("$var wire -1 ! clk $end\n", "")),
              ErrorKind::INVALID_WIDTH);
    EXPECT_EQ(parseError(makeVCD("$var wire 99999999999999999999999 ! clk "
                                 "$end\n",
                                 "")),
              ErrorKind::INVALID_WIDTH);
    // Aliases must have the same width.
    EXPECT_EQ(parseError(makeVCD("$var wire 1 ! clk $end\n"
                                 "$var wire 2 ! clk2 $end\n",
                                 "")),
              ErrorKind::INVALID_WIDTH);
}

TEST(DeclarationBuilder, malformedDeclarations) {
    EXPECT_EQ(parseError(makeVCD("$var wire x ! clk $end\n", "")),
              ErrorKind::MALFORMED_SYNTAX);
    EXPECT_EQ(parseError(makeVCD("$var wyre 1 ! clk $end\n", "")),
              ErrorKind::MALFORMED_SYNTAX);
    EXPECT_EQ(parseError(makeVCD("$var wire 1 ! $end\n", "")),
              ErrorKind::MALFORMED_SYNTAX);
    EXPECT_EQ(parseError(makeVCD("$scope top $end\n$upscope $end\n", "")),
              ErrorKind::MALFORMED_SYNTAX);
    EXPECT_EQ(parseError(makeVCD("$scope entity top $end\n$upscope $end\n",
                                 "")),
              ErrorKind::MALFORMED_SYNTAX);
    EXPECT_EQ(parseError(makeVCD("$scope module top $end\n"
                                 "$upscope top $end\n",
                                 "")),
              ErrorKind::MALFORMED_SYNTAX);
    EXPECT_EQ(parseError("$timescale 3 ns $end\n$enddefinitions $end\n"),
              ErrorKind::MALFORMED_SYNTAX);
    EXPECT_EQ(parseError("$timescale 1 ks $end\n$enddefinitions $end\n"),
              ErrorKind::MALFORMED_SYNTAX);
    EXPECT_EQ(parseError("$enddefinitions now $end\n"),
              ErrorKind::MALFORMED_SYNTAX);
}

TEST(DeclarationBuilder, bodyBeforeEndDefinitions) {
    EXPECT_EQ(parseError("$var wire 1 ! clk $end\n1!\n$enddefinitions $end\n"),
              ErrorKind::MALFORMED_SYNTAX);
    EXPECT_EQ(parseError("$var wire 1 ! clk $end\n#0\n$enddefinitions $end\n"),
              ErrorKind::MALFORMED_SYNTAX);
    EXPECT_EQ(parseError("$var wire 4 ! clk $end\nb0 !\n"),
              ErrorKind::MALFORMED_SYNTAX);
    EXPECT_EQ(parseError("$var real 64 ! t $end\nr0.5 !\n"),
              ErrorKind::MALFORMED_SYNTAX);
    EXPECT_EQ(parseError("$var wire 1 ! clk $end\n$dumpvars 0! $end\n"
                         "$enddefinitions $end\n"),
              ErrorKind::MALFORMED_SYNTAX);
    // End of input before $enddefinitions.
    EXPECT_EQ(parseError("$var wire 1 ! clk $end\n"),
              ErrorKind::MALFORMED_SYNTAX);
    EXPECT_EQ(parseError(""), ErrorKind::MALFORMED_SYNTAX);
}
