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

#pragma once

#include "V2W/Error.h"

#include <cassert>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace V2W::VCD {

using TimeTy = uint64_t;

/// The Logic class represents the type of logical values, as in hardware
/// description languages: 0 (low), 1 (high), Z (tri-state) and X (unknown). It
/// purposely does not contain storage, which is handled by BitVector.
class Logic {
  public:
    enum class Ty : uint8_t {
        LOGIC_0 = 0x00,
        LOGIC_1 = 0x01,
        HIGH_Z = 0x02,
        UNKNOWN = 0x03
    };

    static constexpr bool isLogic(Ty v) {
        return v == Ty::LOGIC_0 || v == Ty::LOGIC_1;
    }
    static constexpr bool isHighZ(Ty v) { return v == Ty::HIGH_Z; }
    static constexpr bool isUnknown(Ty v) { return v == Ty::UNKNOWN; }

    static constexpr Ty fromBool(bool b) {
        return b ? Ty::LOGIC_1 : Ty::LOGIC_0;
    }

    /// Is \p c one of the characters VCD uses to represent a logic value ?
    static constexpr bool isValidChar(char c) {
        switch (c) {
        case '0':
        case '1':
        case 'x':
        case 'X':
        case 'z':
        case 'Z':
            return true;
        default:
            return false;
        }
    }

    static constexpr Ty fromChar(char c) {
        switch (c) {
        case '1':
            return Ty::LOGIC_1;
        case '0':
            return Ty::LOGIC_0;
        case 'z':
        case 'Z':
            return Ty::HIGH_Z;
        case 'x':
        case 'X':
            return Ty::UNKNOWN;
        default:
            die("unsupported char to get a Logic value from");
        }
    }

    static constexpr char getAsChar(Ty v) {
        switch (v) {
        case Ty::LOGIC_1:
            return '1';
        case Ty::LOGIC_0:
            return '0';
        case Ty::HIGH_Z:
            return 'z';
        case Ty::UNKNOWN:
            return 'x';
        }
        return 'x';
    }
};

/// The BitVector class holds the value of a wire or a bus, as an arbitrary
/// length sequence of Logic values. Bit 0 is the least significant bit.
class BitVector {
  public:
    /// Outcome of parsing a VCD value string.
    enum class ParseStatus { OK, INVALID_SYMBOL, TOO_WIDE };

    BitVector() : value() {}
    explicit BitVector(size_t numBits, Logic::Ty v = Logic::Ty::UNKNOWN)
        : value(numBits, v) {}

    BitVector(const BitVector &) = default;
    BitVector(BitVector &&) = default;
    BitVector &operator=(const BitVector &) = default;
    BitVector &operator=(BitVector &&) = default;

    static BitVector logic0(size_t numBits = 1) {
        return BitVector(numBits, Logic::Ty::LOGIC_0);
    }
    static BitVector logic1(size_t numBits = 1) {
        return BitVector(numBits, Logic::Ty::LOGIC_1);
    }
    static BitVector highZ(size_t numBits = 1) {
        return BitVector(numBits, Logic::Ty::HIGH_Z);
    }
    static BitVector unknown(size_t numBits = 1) {
        return BitVector(numBits, Logic::Ty::UNKNOWN);
    }

    /// Parse \p str, a VCD value string written most significant bit first,
    /// into \p result, a BitVector of \p numBits bits. A string shorter than
    /// \p numBits is zero extended. A longer string is only accepted if the
    /// excess leading digits are all '0'. \p result is only modified on
    /// success.
    static ParseStatus parse(std::string_view str, size_t numBits,
                             BitVector &result);

    [[nodiscard]] size_t size() const { return value.size(); }
    [[nodiscard]] bool empty() const { return value.empty(); }

    [[nodiscard]] Logic::Ty get(size_t i) const {
        assert(i < size() && "Out of bound access in BitVector get.");
        return value[i];
    }

    BitVector &set(Logic::Ty v, size_t i) {
        assert(i < size() && "Out of bound access in BitVector set.");
        value[i] = v;
        return *this;
    }

    bool operator==(const BitVector &RHS) const { return value == RHS.value; }
    bool operator!=(const BitVector &RHS) const { return !(*this == RHS); }

    /// Are all bits either 0 or 1 ?
    [[nodiscard]] bool isKnown() const;
    /// Are all bits in the high impedance state ?
    [[nodiscard]] bool isHighZ() const;

    /// Get the value as a string of '0', '1', 'x' and 'z', most significant
    /// bit first.
    [[nodiscard]] std::string str() const;

    /// Get the binary representation, zero padded to the vector size.
    [[nodiscard]] std::string toBinary() const { return str(); }
    /// Get the hexadecimal representation, zero padded to (size() + 3) / 4
    /// digits. A digit with an unknown bit is printed as 'x', a digit with
    /// all bits in high impedance as 'z'.
    [[nodiscard]] std::string toHex(bool upperCase = false) const;
    /// Get the unsigned decimal representation, or "x" if some bits are not
    /// known.
    [[nodiscard]] std::string toUnsignedDecimal() const;
    /// Get the two's complement signed decimal representation, or "x" if some
    /// bits are not known.
    [[nodiscard]] std::string toSignedDecimal() const;

  private:
    std::vector<Logic::Ty> value;
};

/// The SignalValue class is the value carried by a value change: either a
/// BitVector, or a real number for real variables. A default constructed
/// SignalValue is the single bit unknown value 'x'.
class SignalValue {
  public:
    SignalValue() : bits(1, Logic::Ty::UNKNOWN), real(0.0), isRealValue(false) {}
    explicit SignalValue(const BitVector &b)
        : bits(b), real(0.0), isRealValue(false) {}
    explicit SignalValue(BitVector &&b)
        : bits(std::move(b)), real(0.0), isRealValue(false) {}
    explicit SignalValue(double r) : bits(), real(r), isRealValue(true) {}

    SignalValue(const SignalValue &) = default;
    SignalValue(SignalValue &&) = default;
    SignalValue &operator=(const SignalValue &) = default;
    SignalValue &operator=(SignalValue &&) = default;

    [[nodiscard]] bool isReal() const { return isRealValue; }
    [[nodiscard]] const BitVector &getBits() const {
        assert(!isRealValue && "A real value does not have bits.");
        return bits;
    }
    [[nodiscard]] double getReal() const {
        assert(isRealValue && "Not a real value.");
        return real;
    }

    bool operator==(const SignalValue &RHS) const {
        if (isRealValue != RHS.isRealValue)
            return false;
        if (isRealValue)
            return real == RHS.real;
        return bits == RHS.bits;
    }
    bool operator!=(const SignalValue &RHS) const { return !(*this == RHS); }

    [[nodiscard]] std::string str() const;

    /// Get the textual representation used for real values.
    static std::string formatReal(double r);

  private:
    BitVector bits;
    double real;
    bool isRealValue;
};

} // namespace V2W::VCD
