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

#include <algorithm>
#include <cstdint>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

using std::ostringstream;
using std::string;
using std::string_view;
using std::vector;

namespace {
// Convert a vector of known bits, least significant bit first, to its
// decimal representation. The digits are accumulated in a little endian base
// 10 vector, so there is no limit on the width.
string toDecimal(const vector<bool> &bits) {
    vector<uint8_t> digits(1, 0);
    for (size_t i = bits.size(); i > 0; i--) {
        unsigned carry = bits[i - 1] ? 1 : 0;
        for (auto &d : digits) {
            unsigned v = d * 2 + carry;
            d = v % 10;
            carry = v / 10;
        }
        if (carry)
            digits.push_back(carry);
    }

    string res;
    res.reserve(digits.size());
    for (size_t i = digits.size(); i > 0; i--)
        res += char('0' + digits[i - 1]);
    return res;
}
} // namespace

namespace V2W::VCD {

BitVector::ParseStatus BitVector::parse(string_view str, size_t numBits,
                                        BitVector &result) {
    if (str.empty())
        return ParseStatus::INVALID_SYMBOL;

    for (const char c : str)
        if (!Logic::isValidChar(c))
            return ParseStatus::INVALID_SYMBOL;

    const size_t len = str.size();
    if (len > numBits)
        for (size_t i = 0; i < len - numBits; i++)
            if (str[i] != '0')
                return ParseStatus::TOO_WIDE;

    // A leading x or z extends to the full width, anything else is zero
    // extended.
    const Logic::Ty lead = Logic::fromChar(str[0]);
    const Logic::Ty pad = Logic::isHighZ(lead) || Logic::isUnknown(lead)
                              ? lead
                              : Logic::Ty::LOGIC_0;
    BitVector tmp(numBits, pad);
    for (size_t i = 0; i < numBits && i < len; i++)
        tmp.value[i] = Logic::fromChar(str[len - 1 - i]);

    result = std::move(tmp);
    return ParseStatus::OK;
}

bool BitVector::isKnown() const {
    return std::all_of(value.begin(), value.end(),
                       [](Logic::Ty v) { return Logic::isLogic(v); });
}

bool BitVector::isHighZ() const {
    return !value.empty() &&
           std::all_of(value.begin(), value.end(),
                       [](Logic::Ty v) { return Logic::isHighZ(v); });
}

string BitVector::str() const {
    string Str("");
    Str.reserve(size());
    for (size_t i = size(); i > 0; i--)
        Str += Logic::getAsChar(value[i - 1]);
    return Str;
}

string BitVector::toHex(bool upperCase) const {
    static const char lowerDigits[] = "0123456789abcdef";
    static const char upperDigits[] = "0123456789ABCDEF";
    const char *digits = upperCase ? upperDigits : lowerDigits;

    const size_t numDigits = (size() + 3) / 4;
    string res(numDigits, '0');
    for (size_t d = 0; d < numDigits; d++) {
        unsigned nibble = 0;
        unsigned numZ = 0;
        unsigned numBits = 0;
        bool unknown = false;
        for (size_t b = 0; b < 4 && d * 4 + b < size(); b++) {
            const Logic::Ty v = value[d * 4 + b];
            numBits += 1;
            if (Logic::isUnknown(v))
                unknown = true;
            else if (Logic::isHighZ(v))
                numZ += 1;
            else if (v == Logic::Ty::LOGIC_1)
                nibble |= 1 << b;
        }
        char c;
        if (numZ == numBits)
            c = upperCase ? 'Z' : 'z';
        else if (unknown || numZ != 0)
            c = upperCase ? 'X' : 'x';
        else
            c = digits[nibble];
        res[numDigits - 1 - d] = c;
    }

    return res;
}

string BitVector::toUnsignedDecimal() const {
    if (!isKnown())
        return "x";

    vector<bool> bits(size());
    for (size_t i = 0; i < size(); i++)
        bits[i] = value[i] == Logic::Ty::LOGIC_1;
    return toDecimal(bits);
}

string BitVector::toSignedDecimal() const {
    if (!isKnown())
        return "x";
    if (empty() || value.back() == Logic::Ty::LOGIC_0)
        return toUnsignedDecimal();

    // Negative number: get the magnitude by computing the two's complement.
    vector<bool> bits(size());
    bool carry = true;
    for (size_t i = 0; i < size(); i++) {
        const bool b = value[i] != Logic::Ty::LOGIC_1;
        bits[i] = b != carry;
        carry = b && carry;
    }
    return "-" + toDecimal(bits);
}

string SignalValue::formatReal(double r) {
    ostringstream oss;
    oss << r;
    return oss.str();
}

string SignalValue::str() const {
    if (isRealValue)
        return formatReal(real);
    return bits.str();
}

} // namespace V2W::VCD
