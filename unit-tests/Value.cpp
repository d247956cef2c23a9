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

#include "V2W/VCD/Value.h"

#include <string>

#include "gtest/gtest.h"

using namespace testing;
using namespace V2W::VCD;

using std::string;

namespace {
BitVector bv(const string &str) {
    BitVector result;
    EXPECT_EQ(BitVector::parse(str, str.size(), result),
              BitVector::ParseStatus::OK);
    return result;
}
} // namespace

TEST(Logic, chars) {
    for (const char c : {'0', '1', 'x', 'X', 'z', 'Z'})
        EXPECT_TRUE(Logic::isValidChar(c));
    for (const char c : {'2', 'u', 'U', 'w', '-', ' ', 'b'})
        EXPECT_FALSE(Logic::isValidChar(c));

    EXPECT_EQ(Logic::fromChar('0'), Logic::Ty::LOGIC_0);
    EXPECT_EQ(Logic::fromChar('1'), Logic::Ty::LOGIC_1);
    EXPECT_EQ(Logic::fromChar('x'), Logic::Ty::UNKNOWN);
    EXPECT_EQ(Logic::fromChar('X'), Logic::Ty::UNKNOWN);
    EXPECT_EQ(Logic::fromChar('z'), Logic::Ty::HIGH_Z);
    EXPECT_EQ(Logic::fromChar('Z'), Logic::Ty::HIGH_Z);

    EXPECT_EQ(Logic::getAsChar(Logic::Ty::LOGIC_0), '0');
    EXPECT_EQ(Logic::getAsChar(Logic::Ty::LOGIC_1), '1');
    EXPECT_EQ(Logic::getAsChar(Logic::Ty::UNKNOWN), 'x');
    EXPECT_EQ(Logic::getAsChar(Logic::Ty::HIGH_Z), 'z');

    EXPECT_TRUE(Logic::isLogic(Logic::Ty::LOGIC_0));
    EXPECT_TRUE(Logic::isLogic(Logic::Ty::LOGIC_1));
    EXPECT_FALSE(Logic::isLogic(Logic::Ty::UNKNOWN));
    EXPECT_FALSE(Logic::isLogic(Logic::Ty::HIGH_Z));
}

TEST(Logic, fromInvalidChar) {
    EXPECT_DEATH(Logic::fromChar('u'),
                 "Fatal: unsupported char to get a Logic value from.*");
}

TEST(BitVector, parse) {
    BitVector b;

    // Exact width.
    EXPECT_EQ(BitVector::parse("1010", 4, b), BitVector::ParseStatus::OK);
    EXPECT_EQ(b.size(), 4);
    EXPECT_EQ(b.str(), "1010");
    EXPECT_EQ(b.get(0), Logic::Ty::LOGIC_0);
    EXPECT_EQ(b.get(1), Logic::Ty::LOGIC_1);
    EXPECT_EQ(b.get(3), Logic::Ty::LOGIC_1);

    // Short values are zero extended, unless they start with x or z.
    EXPECT_EQ(BitVector::parse("101", 4, b), BitVector::ParseStatus::OK);
    EXPECT_EQ(b.str(), "0101");
    EXPECT_EQ(BitVector::parse("1", 8, b), BitVector::ParseStatus::OK);
    EXPECT_EQ(b.str(), "00000001");
    EXPECT_EQ(BitVector::parse("10", 4, b), BitVector::ParseStatus::OK);
    EXPECT_EQ(b.str(), "0010");
    EXPECT_EQ(BitVector::parse("x", 4, b), BitVector::ParseStatus::OK);
    EXPECT_EQ(b.str(), "xxxx");
    EXPECT_EQ(BitVector::parse("z", 8, b), BitVector::ParseStatus::OK);
    EXPECT_EQ(b.str(), "zzzzzzzz");
    EXPECT_TRUE(b.isHighZ());
    EXPECT_EQ(BitVector::parse("x1", 4, b), BitVector::ParseStatus::OK);
    EXPECT_EQ(b.str(), "xxx1");
    EXPECT_EQ(BitVector::parse("Z0", 4, b), BitVector::ParseStatus::OK);
    EXPECT_EQ(b.str(), "zzz0");

    // Upper case symbols are accepted, and printed in lower case.
    EXPECT_EQ(BitVector::parse("XZ10", 4, b), BitVector::ParseStatus::OK);
    EXPECT_EQ(b.str(), "xz10");

    // Excess leading zeroes are accepted.
    EXPECT_EQ(BitVector::parse("0011", 2, b), BitVector::ParseStatus::OK);
    EXPECT_EQ(b.str(), "11");

    // Excess significant digits are not, and leave the result untouched.
    EXPECT_EQ(BitVector::parse("111", 2, b), BitVector::ParseStatus::TOO_WIDE);
    EXPECT_EQ(BitVector::parse("x11", 2, b), BitVector::ParseStatus::TOO_WIDE);
    EXPECT_EQ(b.str(), "11");

    // Invalid symbols.
    EXPECT_EQ(BitVector::parse("", 2, b),
              BitVector::ParseStatus::INVALID_SYMBOL);
    EXPECT_EQ(BitVector::parse("12", 2, b),
              BitVector::ParseStatus::INVALID_SYMBOL);
    EXPECT_EQ(BitVector::parse("1u", 2, b),
              BitVector::ParseStatus::INVALID_SYMBOL);
    EXPECT_EQ(BitVector::parse("21111", 2, b),
              BitVector::ParseStatus::INVALID_SYMBOL);
    EXPECT_EQ(b.str(), "11");
}

TEST(BitVector, construction) {
    EXPECT_TRUE(BitVector().empty());
    EXPECT_EQ(BitVector(3).str(), "xxx");
    EXPECT_EQ(BitVector::logic0(4).str(), "0000");
    EXPECT_EQ(BitVector::logic1(2).str(), "11");
    EXPECT_EQ(BitVector::highZ(3).str(), "zzz");
    EXPECT_EQ(BitVector::unknown().str(), "x");

    BitVector b = BitVector::logic0(4);
    b.set(Logic::Ty::LOGIC_1, 3).set(Logic::Ty::HIGH_Z, 0);
    EXPECT_EQ(b.str(), "100z");

    EXPECT_EQ(bv("0110"), bv("0110"));
    EXPECT_NE(bv("0110"), bv("0111"));
    EXPECT_NE(bv("0110"), bv("110"));
}

TEST(BitVector, states) {
    EXPECT_TRUE(bv("0101").isKnown());
    EXPECT_FALSE(bv("01x1").isKnown());
    EXPECT_FALSE(bv("0z01").isKnown());

    EXPECT_TRUE(bv("zzzz").isHighZ());
    EXPECT_FALSE(bv("zz0z").isHighZ());
    EXPECT_FALSE(bv("xxxx").isHighZ());
    EXPECT_FALSE(BitVector().isHighZ());
}

TEST(BitVector, toBinary) {
    EXPECT_EQ(bv("0").toBinary(), "0");
    EXPECT_EQ(bv("00101").toBinary(), "00101");
    EXPECT_EQ(bv("1x0z").toBinary(), "1x0z");
}

TEST(BitVector, toHex) {
    EXPECT_EQ(bv("1010").toHex(), "a");
    EXPECT_EQ(bv("1010").toHex(/* upperCase: */ true), "A");
    EXPECT_EQ(bv("00001010").toHex(), "0a");
    EXPECT_EQ(bv("00001010").toHex(true), "0A");
    EXPECT_EQ(bv("10101").toHex(), "15");
    EXPECT_EQ(bv("111111111").toHex(), "1ff");
    EXPECT_EQ(bv("1").toHex(), "1");
    EXPECT_EQ(bv("0").toHex(), "0");
    EXPECT_EQ(bv("1100101011111110").toHex(true), "CAFE");

    // Digits with unknown or high impedance bits.
    EXPECT_EQ(bv("1x10").toHex(), "x");
    EXPECT_EQ(bv("zzzz").toHex(), "z");
    EXPECT_EQ(bv("zz10").toHex(), "x");
    EXPECT_EQ(bv("zzzz0001").toHex(), "z1");
    EXPECT_EQ(bv("zzzz0001").toHex(true), "Z1");
    EXPECT_EQ(bv("x0001").toHex(), "x1");
}

TEST(BitVector, toUnsignedDecimal) {
    EXPECT_EQ(bv("0").toUnsignedDecimal(), "0");
    EXPECT_EQ(bv("1").toUnsignedDecimal(), "1");
    EXPECT_EQ(bv("1010").toUnsignedDecimal(), "10");
    EXPECT_EQ(bv("11111111").toUnsignedDecimal(), "255");
    EXPECT_EQ(bv("0000000100000000").toUnsignedDecimal(), "256");
    EXPECT_EQ(bv("10x0").toUnsignedDecimal(), "x");

    // Wider than 64 bits.
    EXPECT_EQ(bv(string(64, '1')).toUnsignedDecimal(),
              "18446744073709551615");
    EXPECT_EQ(bv("1" + string(64, '0')).toUnsignedDecimal(),
              "18446744073709551616");
    EXPECT_EQ(bv(string(70, '1')).toUnsignedDecimal(),
              "1180591620717411303423");
}

TEST(BitVector, toSignedDecimal) {
    EXPECT_EQ(bv("0").toSignedDecimal(), "0");
    EXPECT_EQ(bv("1").toSignedDecimal(), "-1");
    EXPECT_EQ(bv("0111").toSignedDecimal(), "7");
    EXPECT_EQ(bv("1010").toSignedDecimal(), "-6");
    EXPECT_EQ(bv("1000").toSignedDecimal(), "-8");
    EXPECT_EQ(bv("1111").toSignedDecimal(), "-1");
    EXPECT_EQ(bv("11111111").toSignedDecimal(), "-1");
    EXPECT_EQ(bv("10000000").toSignedDecimal(), "-128");
    EXPECT_EQ(bv("z010").toSignedDecimal(), "x");

    EXPECT_EQ(bv("1" + string(64, '0')).toSignedDecimal(),
              "-18446744073709551616");
}

TEST(SignalValue, basics) {
    const SignalValue dflt;
    EXPECT_FALSE(dflt.isReal());
    EXPECT_EQ(dflt.getBits(), BitVector::unknown(1));
    EXPECT_EQ(dflt.str(), "x");

    const SignalValue bits(bv("10z"));
    EXPECT_FALSE(bits.isReal());
    EXPECT_EQ(bits.str(), "10z");
    EXPECT_EQ(bits, SignalValue(bv("10z")));
    EXPECT_NE(bits, SignalValue(bv("100")));

    const SignalValue r(2.5);
    EXPECT_TRUE(r.isReal());
    EXPECT_EQ(r.getReal(), 2.5);
    EXPECT_EQ(r.str(), "2.5");
    EXPECT_EQ(r, SignalValue(2.5));
    EXPECT_NE(r, SignalValue(-2.5));
    EXPECT_NE(r, bits);

    EXPECT_EQ(SignalValue::formatReal(0.0), "0");
    EXPECT_EQ(SignalValue::formatReal(-1.25), "-1.25");
    EXPECT_EQ(SignalValue::formatReal(1e+20), "1e+20");
}
