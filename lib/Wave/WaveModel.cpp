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

#include "V2W/Wave/WaveModel.h"
#include "V2W/Error.h"
#include "V2W/utils/Misc.h"

#include <ostream>
#include <string>
#include <utility>
#include <vector>

using std::ostream;
using std::string;
using std::vector;

using V2W::VCD::BitVector;
using V2W::VCD::Logic;
using V2W::VCD::SignalValue;

namespace V2W {
namespace Wave {

bool getDisplayFormat(char c, DisplayFormat &fmt) {
    switch (c) {
    case 'b':
        fmt = DisplayFormat::BINARY;
        return true;
    case 'd':
        fmt = DisplayFormat::SIGNED_DECIMAL;
        return true;
    case 'u':
        fmt = DisplayFormat::UNSIGNED_DECIMAL;
        return true;
    case 'x':
        fmt = DisplayFormat::HEX;
        return true;
    case 'X':
        fmt = DisplayFormat::HEX_UPPER;
        return true;
    default:
        return false;
    }
}

char getDisplayFormatChar(DisplayFormat fmt) {
    switch (fmt) {
    case DisplayFormat::BINARY:
        return 'b';
    case DisplayFormat::SIGNED_DECIMAL:
        return 'd';
    case DisplayFormat::UNSIGNED_DECIMAL:
        return 'u';
    case DisplayFormat::HEX:
        return 'x';
    case DisplayFormat::HEX_UPPER:
        return 'X';
    }
    return 'x';
}

string formatValue(const BitVector &value, DisplayFormat fmt) {
    switch (fmt) {
    case DisplayFormat::BINARY:
        return value.toBinary();
    case DisplayFormat::SIGNED_DECIMAL:
        return value.toSignedDecimal();
    case DisplayFormat::UNSIGNED_DECIMAL:
        return value.toUnsignedDecimal();
    case DisplayFormat::HEX:
        return value.toHex(/* upperCase: */ false);
    case DisplayFormat::HEX_UPPER:
        return value.toHex(/* upperCase: */ true);
    }
    die("unhandled display format");
}

char Sample::getWaveChar() const {
    switch (kind) {
    case Kind::LOGIC_0:
        return '0';
    case Kind::LOGIC_1:
        return '1';
    case Kind::UNKNOWN:
        return 'x';
    case Kind::HIGH_Z:
        return 'z';
    case Kind::DATA:
        return '=';
    case Kind::CONTINUATION:
        return '.';
    }
    return 'x';
}

Sample SampleEncoder::encode(const SignalValue &value) {
    if (!first && value == previous)
        return Sample::continuation();

    Sample::Edge edge = first ? Sample::Edge::NONE : Sample::Edge::CHANGE;
    const SignalValue prev = std::move(previous);
    const bool wasFirst = first;
    previous = value;
    first = false;

    if (real) {
        // A real signal that has not been assigned yet is unknown.
        if (!value.isReal())
            return Sample(Sample::Kind::UNKNOWN, edge);
        return Sample(Sample::Kind::DATA, edge, value.str());
    }

    const BitVector &bits = value.getBits();
    if (width == 1) {
        const Logic::Ty v = bits.get(0);
        if (!wasFirst && !prev.isReal() && prev.getBits().size() == 1) {
            const Logic::Ty p = prev.getBits().get(0);
            if (p == Logic::Ty::LOGIC_0 && v == Logic::Ty::LOGIC_1)
                edge = Sample::Edge::RISING;
            else if (p == Logic::Ty::LOGIC_1 && v == Logic::Ty::LOGIC_0)
                edge = Sample::Edge::FALLING;
        }
        switch (v) {
        case Logic::Ty::LOGIC_0:
            return Sample(Sample::Kind::LOGIC_0, edge);
        case Logic::Ty::LOGIC_1:
            return Sample(Sample::Kind::LOGIC_1, edge);
        case Logic::Ty::HIGH_Z:
            return Sample(Sample::Kind::HIGH_Z, edge);
        case Logic::Ty::UNKNOWN:
            return Sample(Sample::Kind::UNKNOWN, edge);
        }
    }

    if (bits.isKnown())
        return Sample(Sample::Kind::DATA, edge, formatValue(bits, fmt));
    if (bits.isHighZ())
        return Sample(Sample::Kind::HIGH_Z, edge);
    return Sample(Sample::Kind::UNKNOWN, edge);
}

string SampledSignal::getWave() const {
    string wave;
    wave.reserve(samples.size());
    for (const auto &s : samples)
        wave += s.getWaveChar();
    return wave;
}

vector<string> SampledSignal::getData() const {
    vector<string> data;
    for (const auto &s : samples)
        if (s.hasData())
            data.push_back(s.data);
    return data;
}

const SampledSignal *WaveModel::findSignal(const string &path) const {
    const string p = normalizePath(path);
    for (const auto &S : signals)
        if (normalizePath(S.getDefinition().getFullName()) == p)
            return &S;
    return nullptr;
}

void WaveModel::dump(ostream &os) const {
    os << "Window: [" << startTime << ", " << endTime << "], chunk size: "
       << chunkSize << ", samples: " << getNumSamples() << '\n';
    if (hasTimescale())
        os << "Timescale: " << timescale.str() << '\n';
    for (const auto &S : signals) {
        os << S.getDefinition().getFullName() << ": " << S.getWave();
        const vector<string> data = S.getData();
        if (!data.empty()) {
            os << " [";
            const char *sep = "";
            for (const auto &d : data) {
                os << sep << d;
                sep = ", ";
            }
            os << ']';
        }
        os << '\n';
    }
    for (const auto &p : unresolved)
        os << "Unresolved: " << p << '\n';
}

WaveModelBuilder &WaveModelBuilder::addSignal(SampledSignal &&S) {
    if (S.size() != model.getNumSamples())
        die("signal '", S.getDefinition().getFullName(), "' has ", S.size(),
            " samples where ", model.getNumSamples(), " were expected");
    model.signals.push_back(std::move(S));
    return *this;
}

} // namespace Wave
} // namespace V2W
