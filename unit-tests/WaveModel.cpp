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

#include "V2W/VCD/Declarations.h"
#include "V2W/VCD/Value.h"
#include "V2W/Wave/WaveModel.h"

#include <sstream>
#include <string>
#include <vector>

#include "gtest/gtest.h"

using namespace testing;
using namespace V2W::Wave;

using V2W::VCD::BitVector;
using V2W::VCD::SignalDefinition;
using V2W::VCD::SignalValue;
using V2W::VCD::Timescale;

using std::string;
using std::vector;

namespace {
SignalValue bits(const char *str, size_t width) {
    BitVector B;
    EXPECT_EQ(BitVector::parse(str, width, B), BitVector::ParseStatus::OK);
    return SignalValue(B);
}

const SignalDefinition Clk({"top", "clk"}, "!", 1,
                           SignalDefinition::Kind::WIRE);
const SignalDefinition Bus({"top", "bus"}, "#", 8, SignalDefinition::Kind::REG,
                           "[7:0]");
const SignalDefinition Temp({"top", "temp"}, "%", 64,
                            SignalDefinition::Kind::REAL);
} // namespace

TEST(DisplayFormat, names) {
    DisplayFormat fmt = DisplayFormat::HEX;
    for (const char c : {'b', 'd', 'u', 'x', 'X'}) {
        EXPECT_TRUE(getDisplayFormat(c, fmt)) << c;
        EXPECT_EQ(getDisplayFormatChar(fmt), c);
    }
    EXPECT_TRUE(getDisplayFormat('d', fmt));
    EXPECT_EQ(fmt, DisplayFormat::SIGNED_DECIMAL);
    EXPECT_FALSE(getDisplayFormat('o', fmt));
    EXPECT_FALSE(getDisplayFormat('h', fmt));
    EXPECT_EQ(fmt, DisplayFormat::SIGNED_DECIMAL);
}

TEST(DisplayFormat, formatValue) {
    const BitVector v = bits("11111010", 8).getBits();
    EXPECT_EQ(formatValue(v, DisplayFormat::BINARY), "11111010");
    EXPECT_EQ(formatValue(v, DisplayFormat::SIGNED_DECIMAL), "-6");
    EXPECT_EQ(formatValue(v, DisplayFormat::UNSIGNED_DECIMAL), "250");
    EXPECT_EQ(formatValue(v, DisplayFormat::HEX), "fa");
    EXPECT_EQ(formatValue(v, DisplayFormat::HEX_UPPER), "FA");

    const BitVector w = bits("101", 4).getBits();
    EXPECT_EQ(formatValue(w, DisplayFormat::BINARY), "0101");
    EXPECT_EQ(formatValue(w, DisplayFormat::SIGNED_DECIMAL), "5");
    EXPECT_EQ(formatValue(w, DisplayFormat::HEX), "5");
}

TEST(Sample, waveChars) {
    EXPECT_EQ(Sample(Sample::Kind::LOGIC_0, Sample::Edge::NONE).getWaveChar(),
              '0');
    EXPECT_EQ(
        Sample(Sample::Kind::LOGIC_1, Sample::Edge::RISING).getWaveChar(),
        '1');
    EXPECT_EQ(Sample().getWaveChar(), 'x');
    EXPECT_EQ(Sample(Sample::Kind::HIGH_Z, Sample::Edge::NONE).getWaveChar(),
              'z');
    EXPECT_EQ(
        Sample(Sample::Kind::DATA, Sample::Edge::NONE, "a").getWaveChar(),
        '=');
    EXPECT_EQ(Sample::continuation().getWaveChar(), '.');

    EXPECT_TRUE(Sample::continuation().isContinuation());
    EXPECT_FALSE(Sample::continuation().hasData());
    EXPECT_TRUE(Sample(Sample::Kind::DATA, Sample::Edge::NONE, "a").hasData());
    EXPECT_EQ(Sample(Sample::Kind::DATA, Sample::Edge::NONE, "a"),
              Sample(Sample::Kind::DATA, Sample::Edge::NONE, "a"));
    EXPECT_NE(Sample(Sample::Kind::DATA, Sample::Edge::NONE, "a"),
              Sample(Sample::Kind::DATA, Sample::Edge::NONE, "b"));
    EXPECT_NE(Sample(Sample::Kind::DATA, Sample::Edge::NONE, "a"),
              Sample(Sample::Kind::DATA, Sample::Edge::CHANGE, "a"));
}

TEST(SampleEncoder, scalar) {
    SampleEncoder E(1, false, DisplayFormat::HEX);
    const SignalValue x;
    const SignalValue v0 = bits("0", 1);
    const SignalValue v1 = bits("1", 1);
    const SignalValue z = bits("z", 1);

    EXPECT_EQ(E.encode(x), Sample(Sample::Kind::UNKNOWN, Sample::Edge::NONE));
    EXPECT_EQ(E.encode(x), Sample::continuation());
    EXPECT_EQ(E.encode(v0), Sample(Sample::Kind::LOGIC_0, Sample::Edge::CHANGE));
    EXPECT_EQ(E.encode(v1), Sample(Sample::Kind::LOGIC_1, Sample::Edge::RISING));
    EXPECT_EQ(E.encode(v1), Sample::continuation());
    EXPECT_EQ(E.encode(v0),
              Sample(Sample::Kind::LOGIC_0, Sample::Edge::FALLING));
    EXPECT_EQ(E.encode(z), Sample(Sample::Kind::HIGH_Z, Sample::Edge::CHANGE));
    EXPECT_EQ(E.encode(v1), Sample(Sample::Kind::LOGIC_1, Sample::Edge::CHANGE));

    E.reset();
    EXPECT_EQ(E.encode(v1), Sample(Sample::Kind::LOGIC_1, Sample::Edge::NONE));
}

TEST(SampleEncoder, vector) {
    SampleEncoder E(8, false, DisplayFormat::HEX);
    EXPECT_EQ(E.encode(SignalValue(BitVector::unknown(8))),
              Sample(Sample::Kind::UNKNOWN, Sample::Edge::NONE));
    EXPECT_EQ(E.encode(bits("1010", 8)),
              Sample(Sample::Kind::DATA, Sample::Edge::CHANGE, "0a"));
    EXPECT_EQ(E.encode(bits("00001010", 8)), Sample::continuation());
    EXPECT_EQ(E.encode(bits("11111111", 8)),
              Sample(Sample::Kind::DATA, Sample::Edge::CHANGE, "ff"));
    // Partially unknown values are unknown.
    EXPECT_EQ(E.encode(bits("1111x111", 8)),
              Sample(Sample::Kind::UNKNOWN, Sample::Edge::CHANGE));
    // A different partially unknown value is not a continuation.
    EXPECT_EQ(E.encode(bits("x1111111", 8)),
              Sample(Sample::Kind::UNKNOWN, Sample::Edge::CHANGE));
    EXPECT_EQ(E.encode(SignalValue(BitVector::highZ(8))),
              Sample(Sample::Kind::HIGH_Z, Sample::Edge::CHANGE));
    // Partially high impedance values are unknown.
    EXPECT_EQ(E.encode(bits("zzzz0000", 8)),
              Sample(Sample::Kind::UNKNOWN, Sample::Edge::CHANGE));
}

TEST(SampleEncoder, formats) {
    SampleEncoder D(8, false, DisplayFormat::SIGNED_DECIMAL);
    EXPECT_EQ(D.encode(bits("10000000", 8)).data, "-128");
    SampleEncoder U(8, false, DisplayFormat::UNSIGNED_DECIMAL);
    EXPECT_EQ(U.encode(bits("10000000", 8)).data, "128");
    SampleEncoder B(8, false, DisplayFormat::BINARY);
    EXPECT_EQ(B.encode(bits("101", 8)).data, "00000101");
    SampleEncoder X(8, false, DisplayFormat::HEX_UPPER);
    EXPECT_EQ(X.encode(bits("10101011", 8)).data, "AB");
}

TEST(SampleEncoder, real) {
    SampleEncoder E(64, true, DisplayFormat::HEX);
    // Not assigned yet.
    EXPECT_EQ(E.encode(SignalValue()),
              Sample(Sample::Kind::UNKNOWN, Sample::Edge::NONE));
    EXPECT_EQ(E.encode(SignalValue(2.5)),
              Sample(Sample::Kind::DATA, Sample::Edge::CHANGE, "2.5"));
    EXPECT_EQ(E.encode(SignalValue(2.5)), Sample::continuation());
    EXPECT_EQ(E.encode(SignalValue(-1.0)),
              Sample(Sample::Kind::DATA, Sample::Edge::CHANGE, "-1"));
}

TEST(SampledSignal, waveAndData) {
    SampledSignal S(Bus, DisplayFormat::HEX);
    EXPECT_EQ(S.getDefinition(), Bus);
    EXPECT_EQ(S.getFormat(), DisplayFormat::HEX);
    EXPECT_EQ(S.size(), 0);
    EXPECT_EQ(S.getWave(), "");
    EXPECT_TRUE(S.getData().empty());

    SampleEncoder E(8, false, DisplayFormat::HEX);
    for (const char *v : {"0", "0", "1010", "1010", "x", "1010", "1"})
        S.append(E.encode(bits(v, 8)));
    EXPECT_EQ(S.size(), 7);
    EXPECT_EQ(S.getWave(), "=.=.x==");
    EXPECT_EQ(S.getData(), vector<string>({"00", "0a", "0a", "01"}));
    EXPECT_EQ(S[2], Sample(Sample::Kind::DATA, Sample::Edge::CHANGE, "0a"));
    EXPECT_EQ(S.getSamples().size(), 7);
}

TEST(WaveModel, numSamples) {
    EXPECT_EQ(WaveModel::getNumSamples(0, 0, 1), 1);
    EXPECT_EQ(WaveModel::getNumSamples(0, 10, 1), 11);
    EXPECT_EQ(WaveModel::getNumSamples(0, 10, 5), 3);
    EXPECT_EQ(WaveModel::getNumSamples(0, 10, 3), 4);
    EXPECT_EQ(WaveModel::getNumSamples(5, 10, 10), 1);
    EXPECT_EQ(WaveModel::getNumSamples(100, 200, 10), 11);

    const WaveModel M(10, 40, 10);
    EXPECT_EQ(M.getStartTime(), 10);
    EXPECT_EQ(M.getEndTime(), 40);
    EXPECT_EQ(M.getChunkSize(), 10);
    EXPECT_EQ(M.getNumSamples(), 4);
    EXPECT_TRUE(M.empty());
    EXPECT_FALSE(M.hasTimescale());
    EXPECT_FALSE(M.hasUnresolved());
}

TEST(WaveModelBuilder, build) {
    SampledSignal clk(Clk, DisplayFormat::HEX);
    SampleEncoder CE(1, false, DisplayFormat::HEX);
    for (const char *v : {"0", "1", "0"})
        clk.append(CE.encode(bits(v, 1)));

    SampledSignal temp(Temp, DisplayFormat::HEX);
    SampleEncoder TE(64, true, DisplayFormat::HEX);
    temp.append(TE.encode(SignalValue()));
    temp.append(TE.encode(SignalValue(0.25)));
    temp.append(TE.encode(SignalValue(0.25)));

    const WaveModel M = WaveModelBuilder(0, 20, 10)
                            .setTimescale(Timescale(1, "ns"))
                            .addSignal(std::move(clk))
                            .addSignal(std::move(temp))
                            .addUnresolved("top/missing")
                            .build();

    EXPECT_FALSE(M.empty());
    EXPECT_EQ(M.getNumSignals(), 2);
    EXPECT_EQ(M.getNumSamples(), 3);
    EXPECT_TRUE(M.hasTimescale());
    EXPECT_EQ(M.getTimescale(), Timescale(1, "ns"));
    EXPECT_TRUE(M.hasUnresolved());
    EXPECT_EQ(M.getUnresolved(), vector<string>({"top/missing"}));

    // Signals are kept in the order they were added.
    EXPECT_EQ(M[0].getDefinition(), Clk);
    EXPECT_EQ(M[1].getDefinition(), Temp);
    EXPECT_EQ(M.getSignals().size(), 2);

    ASSERT_NE(M.findSignal("top/clk"), nullptr);
    EXPECT_EQ(M.findSignal("top/clk")->getWave(), "010");
    EXPECT_EQ(M.findSignal("/top/temp/"), &M[1]);
    EXPECT_EQ(M.findSignal("top/bus"), nullptr);
    EXPECT_EQ(M.findSignal("clk"), nullptr);

    std::ostringstream os;
    M.dump(os);
    EXPECT_EQ(os.str(), "Window: [0, 20], chunk size: 10, samples: 3\n"
                        "Timescale: 1 ns\n"
                        "top/clk: 010\n"
                        "top/temp: x=. [0.25]\n"
                        "Unresolved: top/missing\n");
}

TEST(WaveModelBuilder, sampleCountMismatch) {
    SampledSignal clk(Clk, DisplayFormat::HEX);
    clk.append(Sample(Sample::Kind::LOGIC_0, Sample::Edge::NONE));
    WaveModelBuilder B(0, 20, 10);
    EXPECT_DEATH(B.addSignal(std::move(clk)),
                 "Fatal: signal 'top/clk' has 1 samples where 3 were "
                 "expected.*");
}
