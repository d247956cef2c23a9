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
#include "V2W/VCD/Lexer.h"

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

using Kind = Token::Kind;

namespace {
// Lex the whole of str, expecting a MALFORMED_SYNTAX error. Returns the
// error location line, or 0 if no error was reported.
size_t lexError(const string &str) {
    istringstream is(str);
    Lexer L(is);
    try {
        while (!L.next().is(Kind::END_OF_INPUT))
            ;
    } catch (const V2W::Error &e) {
        EXPECT_EQ(e.getKind(), ErrorKind::MALFORMED_SYNTAX) << e.what();
        return e.getLocation().line;
    }
    return 0;
}
} // namespace

TEST(Token, kindNames) {
    EXPECT_STREQ(Token::getKindName(Kind::COMMAND_START), "command start");
    EXPECT_STREQ(Token::getKindName(Kind::COMMAND_END), "$end");
    EXPECT_STREQ(Token::getKindName(Kind::IDENTIFIER), "identifier");
    EXPECT_STREQ(Token::getKindName(Kind::TIME_MARKER), "time marker");
    EXPECT_STREQ(Token::getKindName(Kind::SCALAR_VALUE_CHANGE),
                 "scalar value change");
    EXPECT_STREQ(Token::getKindName(Kind::VECTOR_VALUE_CHANGE),
                 "vector value change");
    EXPECT_STREQ(Token::getKindName(Kind::REAL_VALUE_CHANGE),
                 "real value change");
    EXPECT_STREQ(Token::getKindName(Kind::END_OF_INPUT), "end of input");
}

TEST(Lexer, isDumpKeyword) {
    EXPECT_TRUE(Lexer::isDumpKeyword("dumpvars"));
    EXPECT_TRUE(Lexer::isDumpKeyword("dumpall"));
    EXPECT_TRUE(Lexer::isDumpKeyword("dumpon"));
    EXPECT_TRUE(Lexer::isDumpKeyword("dumpoff"));
    EXPECT_FALSE(Lexer::isDumpKeyword("var"));
    EXPECT_FALSE(Lexer::isDumpKeyword("comment"));
}

TEST(Lexer, empty) {
    istringstream is(" \n\t \n");
    Lexer L(is);
    EXPECT_TRUE(L.next().is(Kind::END_OF_INPUT));
    // Once at the end, stay there.
    EXPECT_TRUE(L.next().is(Kind::END_OF_INPUT));
}

TEST(Lexer, tokens) {
    istringstream is("$date\n  today \n$end\n"
                     "$timescale 1 ns $end\n"
                     "$scope module top $end $var wire 1 ! clk $end\n"
                     "$upscope $end $enddefinitions $end\n"
                     "#0\n"
                     "$dumpvars\n0! b1010 \"\n$end\n"
                     "#10\n1!\nr1.5 %\nB11 \"\n");
    Lexer L(is);

    Token T = L.next();
    EXPECT_TRUE(T.isCommand("date"));
    EXPECT_TRUE(L.inCommand());
    T = L.next();
    EXPECT_TRUE(T.is(Kind::IDENTIFIER));
    EXPECT_EQ(T.text, "today");
    EXPECT_TRUE(L.next().is(Kind::COMMAND_END));
    EXPECT_FALSE(L.inCommand());

    EXPECT_TRUE(L.next().isCommand("timescale"));
    EXPECT_EQ(L.next().text, "1");
    EXPECT_EQ(L.next().text, "ns");
    EXPECT_TRUE(L.next().is(Kind::COMMAND_END));

    EXPECT_TRUE(L.next().isCommand("scope"));
    EXPECT_EQ(L.next().text, "module");
    EXPECT_EQ(L.next().text, "top");
    EXPECT_TRUE(L.next().is(Kind::COMMAND_END));
    EXPECT_TRUE(L.next().isCommand("var"));
    const vector<string> varWords{"wire", "1", "!", "clk"};
    for (const auto &w : varWords) {
        T = L.next();
        EXPECT_TRUE(T.is(Kind::IDENTIFIER));
        EXPECT_EQ(T.text, w);
    }
    EXPECT_TRUE(L.next().is(Kind::COMMAND_END));
    EXPECT_TRUE(L.next().isCommand("upscope"));
    EXPECT_TRUE(L.next().is(Kind::COMMAND_END));
    EXPECT_TRUE(L.next().isCommand("enddefinitions"));
    EXPECT_TRUE(L.next().is(Kind::COMMAND_END));

    T = L.next();
    EXPECT_TRUE(T.is(Kind::TIME_MARKER));
    EXPECT_EQ(T.time, 0);

    EXPECT_TRUE(L.next().isCommand("dumpvars"));
    EXPECT_TRUE(L.inDumpSection());
    EXPECT_FALSE(L.inCommand());
    T = L.next();
    EXPECT_TRUE(T.is(Kind::SCALAR_VALUE_CHANGE));
    EXPECT_TRUE(T.isValueChange());
    EXPECT_EQ(T.text, "0");
    EXPECT_EQ(T.code, "!");
    T = L.next();
    EXPECT_TRUE(T.is(Kind::VECTOR_VALUE_CHANGE));
    EXPECT_EQ(T.text, "1010");
    EXPECT_EQ(T.code, "\"");
    EXPECT_TRUE(L.next().is(Kind::COMMAND_END));
    EXPECT_FALSE(L.inDumpSection());

    T = L.next();
    EXPECT_TRUE(T.is(Kind::TIME_MARKER));
    EXPECT_EQ(T.time, 10);
    T = L.next();
    EXPECT_TRUE(T.is(Kind::SCALAR_VALUE_CHANGE));
    EXPECT_EQ(T.text, "1");
    EXPECT_EQ(T.code, "!");
    T = L.next();
    EXPECT_TRUE(T.is(Kind::REAL_VALUE_CHANGE));
    EXPECT_EQ(T.text, "1.5");
    EXPECT_EQ(T.code, "%");
    T = L.next();
    EXPECT_TRUE(T.is(Kind::VECTOR_VALUE_CHANGE));
    EXPECT_EQ(T.text, "11");
    EXPECT_EQ(T.code, "\"");

    EXPECT_TRUE(L.next().is(Kind::END_OF_INPUT));
}

TEST(Lexer, locations) {
    istringstream is("#0\n  1!\n\n b0 abc");
    Lexer L(is);

    Token T = L.next();
    EXPECT_EQ(T.location.line, 1);
    EXPECT_EQ(T.location.offset, 0);

    T = L.next();
    EXPECT_EQ(T.location.line, 2);
    EXPECT_EQ(T.location.offset, 5);

    T = L.next();
    EXPECT_TRUE(T.is(Kind::VECTOR_VALUE_CHANGE));
    EXPECT_EQ(T.code, "abc");
    EXPECT_EQ(T.location.line, 4);
    EXPECT_EQ(T.location.offset, 10);
}

TEST(Lexer, freeTextCommands) {
    // Keywords are allowed in free text commands.
    istringstream is("$comment see $var and $scope $end\n"
                     "$dumpvars 0! $comment $dumpall $end 1\" $end");
    Lexer L(is);

    EXPECT_TRUE(L.next().isCommand("comment"));
    EXPECT_EQ(L.next().text, "see");
    EXPECT_EQ(L.next().text, "$var");
    EXPECT_EQ(L.next().text, "and");
    EXPECT_EQ(L.next().text, "$scope");
    EXPECT_TRUE(L.next().is(Kind::COMMAND_END));

    // A comment is allowed in a dump section.
    EXPECT_TRUE(L.next().isCommand("dumpvars"));
    EXPECT_TRUE(L.next().is(Kind::SCALAR_VALUE_CHANGE));
    EXPECT_TRUE(L.next().isCommand("comment"));
    EXPECT_TRUE(L.inDumpSection());
    EXPECT_EQ(L.next().text, "$dumpall");
    EXPECT_TRUE(L.next().is(Kind::COMMAND_END));
    EXPECT_TRUE(L.inDumpSection());
    Token T = L.next();
    EXPECT_TRUE(T.is(Kind::SCALAR_VALUE_CHANGE));
    EXPECT_EQ(T.code, "\"");
    EXPECT_TRUE(L.next().is(Kind::COMMAND_END));
    EXPECT_FALSE(L.inDumpSection());
    EXPECT_TRUE(L.next().is(Kind::END_OF_INPUT));
}

TEST(Lexer, dollarIdentifierCodes) {
    // '$' is a valid identifier code character.
    istringstream is("$var reg 1 $ rst $end\n"
                     "$var wire 4 $a bus $end\n"
                     "$enddefinitions $end\n"
                     "#0\n1$\nb1010 $a\n");
    Lexer L(is);

    EXPECT_TRUE(L.next().isCommand("var"));
    EXPECT_EQ(L.next().text, "reg");
    EXPECT_EQ(L.next().text, "1");
    Token T = L.next();
    EXPECT_TRUE(T.is(Kind::IDENTIFIER));
    EXPECT_EQ(T.text, "$");
    EXPECT_EQ(L.next().text, "rst");
    EXPECT_TRUE(L.next().is(Kind::COMMAND_END));

    EXPECT_TRUE(L.next().isCommand("var"));
    EXPECT_EQ(L.next().text, "wire");
    EXPECT_EQ(L.next().text, "4");
    EXPECT_EQ(L.next().text, "$a");
    EXPECT_EQ(L.next().text, "bus");
    EXPECT_TRUE(L.next().is(Kind::COMMAND_END));

    EXPECT_TRUE(L.next().isCommand("enddefinitions"));
    EXPECT_TRUE(L.next().is(Kind::COMMAND_END));
    EXPECT_TRUE(L.next().is(Kind::TIME_MARKER));
    T = L.next();
    EXPECT_TRUE(T.is(Kind::SCALAR_VALUE_CHANGE));
    EXPECT_EQ(T.code, "$");
    T = L.next();
    EXPECT_TRUE(T.is(Kind::VECTOR_VALUE_CHANGE));
    EXPECT_EQ(T.code, "$a");
    EXPECT_TRUE(L.next().is(Kind::END_OF_INPUT));

    // A standard keyword still reveals a missing $end.
    EXPECT_EQ(lexError("$var reg 1 $ rst\n$var wire 1 ! clk $end"), 2);
    EXPECT_EQ(lexError("$var reg 1 $ rst\n\n$dumpvars 1$ $end"), 3);
}

TEST(Lexer, unterminatedCommands) {
    EXPECT_EQ(lexError("$var wire 1 ! clk\n$upscope $end"), 2);
    EXPECT_EQ(lexError("$scope module top\n\n$end $var wire 1 ! clk $scope"),
              3);
    EXPECT_EQ(lexError("$timescale 1ns $enddefinitions $end"), 1);
    EXPECT_EQ(lexError("$comment\nnever ending\n"), 3);
    EXPECT_EQ(lexError("$dumpvars 0!\n1!\n"), 3);
    EXPECT_EQ(lexError("$dumpvars 0!\n$var wire 1 ! clk $end\n"), 2);
}

TEST(Lexer, malformedTokens) {
    EXPECT_EQ(lexError("$end"), 1);
    EXPECT_EQ(lexError("#0\n$end"), 2);
    EXPECT_EQ(lexError("$ scope"), 1);
    EXPECT_EQ(lexError("#"), 1);
    EXPECT_EQ(lexError("#abc"), 1);
    EXPECT_EQ(lexError("#-10"), 1);
    EXPECT_EQ(lexError("#10ns"), 1);
    EXPECT_EQ(lexError("#99999999999999999999999999"), 1);
    EXPECT_EQ(lexError("#0\n1"), 2);
    EXPECT_EQ(lexError("#0\nb1010"), 2);
    EXPECT_EQ(lexError("#0\nr1.5\n"), 3);
    EXPECT_EQ(lexError("#0\nb !"), 2);
    EXPECT_EQ(lexError("$dumpvars 0! $dumpall 1! $end $end"), 1);
}
