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
#include "V2W/VCDFile.h"
#include "V2W/Wave/Resampler.h"
#include "V2W/Wave/WaveModel.h"

#include "v2w-unit-testing.h"

#include <sstream>
#include <string>
#include <vector>

#include "gtest/gtest.h"

#ifndef SAMPLES_SRC_DIR
#error SAMPLES_SRC_DIR not defined
#endif

using namespace testing;
using namespace V2W;

using VCD::Declarations;
using VCD::Scope;
using VCD::SignalDefinition;
using VCD::Timescale;
using Wave::DisplayFormat;
using Wave::SampleWindow;
using Wave::WaveModel;

using std::istringstream;
using std::string;
using std::vector;

namespace {
class HierRecorder : public Declarations::Visitor {
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
        events.push_back(SD.getFullName());
    }
};
} // namespace

TEST(VCDFile, isVCDFileName) {
    EXPECT_TRUE(VCDFile::isVCDFileName("counter.vcd"));
    EXPECT_TRUE(VCDFile::isVCDFileName("/some/dir/counter.vcd"));
    EXPECT_FALSE(VCDFile::isVCDFileName("counter.fst"));
    EXPECT_FALSE(VCDFile::isVCDFileName("counter.vcd.gz"));
    EXPECT_FALSE(VCDFile::isVCDFileName("vcd"));
    EXPECT_FALSE(VCDFile::isVCDFileName("dir.vcd/counter"));
}

TEST(VCDFile, getFileName) {
    const VCDFile F(SAMPLES_SRC_DIR "counter.vcd");
    EXPECT_EQ(F.getFileName(), SAMPLES_SRC_DIR "counter.vcd");
}

TEST(VCDFile, readDeclarations) {
    const VCDFile F(SAMPLES_SRC_DIR "counter.vcd");
    const Declarations D = F.readDeclarations();
    EXPECT_EQ(D.getDate(), "Mon Oct 14 10:00:00 2024");
    EXPECT_EQ(D.getVersion(), "Icarus Verilog");
    EXPECT_EQ(D.getTimescale(), Timescale(1, "ns"));
    EXPECT_FALSE(D.hasHierarchy());
    EXPECT_EQ(D.getNumSignals(), 5);
    EXPECT_EQ(D.getNumCodes(), 3);

    const Declarations T =
        VCDFile(SAMPLES_SRC_DIR "timer.vcd").readDeclarations();
    EXPECT_FALSE(T.hasDate());
    EXPECT_EQ(T.getComment(), "A timer with a real valued period.");
    EXPECT_EQ(T.getTimescale(), Timescale(10, "ps"));
    EXPECT_EQ(T.getTimescale().getExponent(), -11);
}

TEST(VCDFile, listSignals) {
    const vector<SignalDefinition> signals =
        VCDFile(SAMPLES_SRC_DIR "counter.vcd").listSignals();
    ASSERT_EQ(signals.size(), 5);
    EXPECT_EQ(signals[0], SignalDefinition({"tb", "clk"}, "!", 1,
                                           SignalDefinition::Kind::WIRE));
    EXPECT_EQ(signals[1], SignalDefinition({"tb", "rst"}, "\"", 1,
                                           SignalDefinition::Kind::WIRE));
    EXPECT_EQ(signals[2], SignalDefinition({"tb", "dut", "clk"}, "!", 1,
                                           SignalDefinition::Kind::WIRE));
    EXPECT_EQ(signals[3], SignalDefinition({"tb", "dut", "rst"}, "\"", 1,
                                           SignalDefinition::Kind::WIRE));
    EXPECT_EQ(signals[4],
              SignalDefinition({"tb", "dut", "count"}, "#", 4,
                               SignalDefinition::Kind::REG, "[3:0]"));

    const vector<SignalDefinition> timer =
        VCDFile(SAMPLES_SRC_DIR "timer.vcd").listSignals();
    ASSERT_EQ(timer.size(), 3);
    EXPECT_EQ(timer[0].getFullName(), "timer/period");
    EXPECT_TRUE(timer[0].isReal());
    EXPECT_EQ(timer[1].getFullName(), "timer/ticks");
    EXPECT_EQ(timer[1].getKind(), SignalDefinition::Kind::INTEGER);
    EXPECT_EQ(timer[1].getWidth(), 32);
    EXPECT_EQ(timer[2].getFullName(), "timer/tick/fired");
    EXPECT_EQ(timer[2].getKind(), SignalDefinition::Kind::EVENT);
}

TEST(VCDFile, hierarchy) {
    const Declarations D = VCDFile(SAMPLES_SRC_DIR "timer.vcd")
                               .readDeclarations(/* keepHierarchy: */ true);
    ASSERT_TRUE(D.hasHierarchy());
    HierRecorder R;
    D.visit(R);
    EXPECT_EQ(R.events, vector<string>({"enter module timer", "timer/period",
                                        "timer/ticks", "enter task tick",
                                        "timer/tick/fired", "leave tick",
                                        "leave timer"}));
}

TEST(VCDFile, extract) {
    const VCDFile F(SAMPLES_SRC_DIR "counter.vcd");
    const WaveModel M =
        F.extract({"tb/clk", "tb/rst", "tb/dut/count", "tb/nope"},
                  SampleWindow(0, 40, 5));
    ASSERT_EQ(M.getNumSignals(), 3);
    EXPECT_EQ(M.getNumSamples(), 9);
    EXPECT_EQ(M[0].getWave(), "010101010");
    EXPECT_EQ(M[1].getWave(), "1.0......");
    EXPECT_EQ(M[2].getWave(), "x..=.=.=.");
    EXPECT_EQ(M[2].getData(), vector<string>({"0", "1", "2"}));
    EXPECT_EQ(M.getUnresolved(), vector<string>({"tb/nope"}));
    EXPECT_EQ(M.getTimescale(), Timescale(1, "ns"));
}

TEST(VCDFile, extractUntilEndOfDump) {
    const WaveModel M =
        VCDFile(SAMPLES_SRC_DIR "counter.vcd").extract({"tb/dut/clk"});
    EXPECT_EQ(M.getStartTime(), 0);
    EXPECT_EQ(M.getEndTime(), 40);
    EXPECT_EQ(M.getChunkSize(), 1);
    EXPECT_EQ(M.getNumSamples(), 41);
    EXPECT_EQ(M[0].size(), 41);
    EXPECT_EQ(M[0].getWave().substr(0, 11), "0....1....0");
}

TEST(VCDFile, extractWithFormats) {
    const WaveModel M =
        VCDFile(SAMPLES_SRC_DIR "timer.vcd")
            .extract({"timer/period", "timer/ticks", "timer/tick/fired"},
                     SampleWindow(0, 300, 100),
                     DisplayFormat::UNSIGNED_DECIMAL);
    ASSERT_EQ(M.getNumSignals(), 3);
    EXPECT_EQ(M[0].getWave(), "=.=.");
    EXPECT_EQ(M[0].getData(), vector<string>({"0.5", "0.25"}));
    EXPECT_EQ(M[1].getWave(), "====");
    EXPECT_EQ(M[1].getData(), vector<string>({"0", "1", "2", "3"}));
    EXPECT_EQ(M[2].getWave(), "0101");

    const WaveModel N =
        VCDFile(SAMPLES_SRC_DIR "counter.vcd")
            .extract({"tb/dut/count"}, SampleWindow(15, 35, 10),
                     DisplayFormat::HEX,
                     FormatOverrides({{"tb/dut/count", DisplayFormat::BINARY}}));
    EXPECT_EQ(N[0].getFormat(), DisplayFormat::BINARY);
    EXPECT_EQ(N[0].getData(), vector<string>({"0000", "0001", "0010"}));
}

TEST(VCDFile, extractFromStream) {
    istringstream is(
        makeVCD("$var wire 2 ! sel $end\n", "#0\nb1 !\n#3\nb10 !\n"));
    const WaveModel M = VCDFile::extract(is, {"sel"}, SampleWindow(0, 4, 2),
                                         DisplayFormat::BINARY);
    EXPECT_EQ(M[0].getWave(), "=.=");
    EXPECT_EQ(M[0].getData(), vector<string>({"01", "10"}));
}

TEST(VCDFile, dollarIdentifierCode) {
    istringstream is(makeVCD("$scope module top $end\n"
                             "$var wire 1 ! clk $end\n"
                             "$var wire 1 \" en $end\n"
                             "$var wire 1 # ack $end\n"
                             "$var reg 1 $ rst $end\n"
                             "$upscope $end\n",
                             "#0\n1$\n#5\n0$\n"));
    const WaveModel M =
        VCDFile::extract(is, {"top/rst"}, SampleWindow(0, 5, 5));
    ASSERT_EQ(M.getNumSignals(), 1);
    EXPECT_EQ(M[0].getDefinition().getIdCode(), "$");
    EXPECT_EQ(M[0].getWave(), "10");
}

TEST(VCDFile, errors) {
    istringstream is(makeVCD("$scope module top $end\n", ""));
    try {
        VCDFile::listSignals(is);
        FAIL() << "no error reported";
    } catch (const Error &e) {
        EXPECT_EQ(e.getKind(), ErrorKind::UNBALANCED_SCOPE);
    }

    istringstream is2(makeVCD("$var wire 1 ! clk $end\n", "#0\n1!\n"));
    try {
        VCDFile::extract(is2, {}, SampleWindow());
        FAIL() << "no error reported";
    } catch (const Error &e) {
        EXPECT_EQ(e.getKind(), ErrorKind::NO_SIGNALS_REQUESTED);
    }
}

TEST(VCDFile, missingFile) {
    const VCDFile F("no-such-file.vcd");
    EXPECT_DEATH(F.listSignals(),
                 "Fatal: can not open 'no-such-file.vcd' for reading.*");
}
