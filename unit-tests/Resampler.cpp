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
#include "V2W/Wave/Resampler.h"
#include "V2W/Wave/WaveModel.h"

#include "v2w-unit-testing.h"

#include <limits>
#include <sstream>
#include <string>
#include <vector>

#include "gtest/gtest.h"

using namespace testing;
using namespace V2W::Wave;

using V2W::ErrorKind;
using V2W::VCD::ChangeWalker;
using V2W::VCD::DeclarationBuilder;
using V2W::VCD::Declarations;
using V2W::VCD::Lexer;
using V2W::VCD::Timescale;

using std::istringstream;
using std::string;
using std::vector;

namespace {
const char Header[] = "$scope module top $end\n"
                      "$var wire 1 ! clk $end\n"
                      "$var wire 4 # bus [3:0] $end\n"
                      "$var real 64 % temp $end\n"
                      "$var reg 8 & data $end\n"
                      "$scope module sub $end\n"
                      "$var wire 1 ! clk $end\n"
                      "$upscope $end\n"
                      "$upscope $end\n";

// A clock toggling every 10 ticks.
const char Clock[] = "#0\n0!\n#10\n1!\n#20\n0!\n#30\n1!\n#40\n0!\n";

WaveModel extract(const string &body, const vector<string> &paths,
                  const SampleWindow &window,
                  DisplayFormat fmt = DisplayFormat::HEX) {
    istringstream is(makeVCD(Header, body));
    Lexer L(is);
    const Declarations D = DeclarationBuilder(L).build();
    ChangeWalker W(L, D);
    return Resampler(D, window).setDefaultFormat(fmt).extract(W, paths);
}

// Extract, expecting an error. Returns the error kind.
ErrorKind extractError(const string &body, const vector<string> &paths,
                       const SampleWindow &window) {
    try {
        extract(body, paths, window);
    } catch (const V2W::Error &e) {
        return e.getKind();
    }
    ADD_FAILURE() << "no error reported";
    return ErrorKind::MALFORMED_SYNTAX;
}

string waveOf(const WaveModel &M, const string &path) {
    const SampledSignal *S = M.findSignal(path);
    if (!S) {
        ADD_FAILURE() << "signal '" << path << "' not extracted";
        return "";
    }
    return S->getWave();
}
} // namespace

TEST(SampleWindow, basics) {
    const SampleWindow W;
    EXPECT_EQ(W.startTime, 0);
    EXPECT_EQ(W.chunkSize, 1);
    EXPECT_TRUE(W.untilEndOfDump());
    EXPECT_EQ(SampleWindow::END_OF_DUMP,
              std::numeric_limits<V2W::VCD::TimeTy>::max());
    EXPECT_FALSE(SampleWindow(0, 100, 10).untilEndOfDump());
}

TEST(Resampler, formats) {
    istringstream is(makeVCD(Header, ""));
    Lexer L(is);
    const Declarations D = DeclarationBuilder(L).build();
    Resampler R(D, SampleWindow(0, 10, 5));
    EXPECT_EQ(R.getWindow().endTime, 10);
    EXPECT_EQ(R.getFormat("top/bus"), DisplayFormat::HEX);

    R.setDefaultFormat(DisplayFormat::UNSIGNED_DECIMAL)
        .setFormat("/top/bus/", DisplayFormat::BINARY);
    EXPECT_EQ(R.getFormat("top/bus"), DisplayFormat::BINARY);
    EXPECT_EQ(R.getFormat("top//bus"), DisplayFormat::BINARY);
    EXPECT_EQ(R.getFormat("top/data"), DisplayFormat::UNSIGNED_DECIMAL);
}

TEST(Resampler, clockAtItsPeriod) {
    const WaveModel M = extract(Clock, {"top/clk"}, SampleWindow(0, 40, 10));
    ASSERT_EQ(M.getNumSignals(), 1);
    EXPECT_EQ(M.getNumSamples(), 5);
    EXPECT_EQ(waveOf(M, "top/clk"), "01010");

    // Each transition has the expected edge.
    const SampledSignal &S = M[0];
    EXPECT_EQ(S[0].edge, Sample::Edge::NONE);
    EXPECT_EQ(S[1].edge, Sample::Edge::RISING);
    EXPECT_EQ(S[2].edge, Sample::Edge::FALLING);
}

TEST(Resampler, clockAtHalfItsPeriod) {
    const WaveModel M = extract(Clock, {"top/clk"}, SampleWindow(0, 40, 5));
    EXPECT_EQ(M.getNumSamples(), 9);
    EXPECT_EQ(waveOf(M, "top/clk"), "0.1.0.1.0");
}

TEST(Resampler, bus) {
    const WaveModel M =
        extract("#0\nb0000 #\n#7\nb1010 #\n", {"top/bus"},
                SampleWindow(0, 10, 1));
    EXPECT_EQ(M.getNumSamples(), 11);
    EXPECT_EQ(waveOf(M, "top/bus"), "=......=...");
    EXPECT_EQ(M[0].getData(), vector<string>({"0", "a"}));
}

TEST(Resampler, shortVectorValues) {
    const WaveModel M = extract("#0\nb101 #\n", {"top/bus"},
                                SampleWindow(0, 0, 1), DisplayFormat::BINARY);
    EXPECT_EQ(waveOf(M, "top/bus"), "=");
    EXPECT_EQ(M[0].getData(), vector<string>({"0101"}));
}

TEST(Resampler, shortUndrivenVectors) {
    // Short x and z values extend to the full width.
    const WaveModel M = extract("#0\nbz &\nbz #\n#1\nbx &\nb1 #\n",
                                {"top/data", "top/bus"}, SampleWindow(0, 1, 1));
    EXPECT_EQ(waveOf(M, "top/data"), "zx");
    EXPECT_EQ(waveOf(M, "top/bus"), "z=");
    EXPECT_EQ(M[1].getData(), vector<string>({"1"}));
}

TEST(Resampler, leadingValueIsUnknown) {
    const WaveModel M =
        extract("#5\nb1 #\n1!\n#10\nr1.5 %\n",
                {"top/bus", "top/clk", "top/temp"}, SampleWindow(0, 10, 5));
    EXPECT_EQ(M.getNumSamples(), 3);
    EXPECT_EQ(waveOf(M, "top/bus"), "x=.");
    EXPECT_EQ(M[0].getData(), vector<string>({"1"}));
    EXPECT_EQ(waveOf(M, "top/clk"), "x1.");
    EXPECT_EQ(waveOf(M, "top/temp"), "x.=");
    EXPECT_EQ(M[2].getData(), vector<string>({"1.5"}));
}

TEST(Resampler, lastChangeWins) {
    // The glitch at 3 is not visible at chunk size 5.
    const WaveModel M = extract("#0\n0!\n#3\n1!\n#4\n0!\n#5\n#8\n1!\n0!\n",
                                {"top/clk"}, SampleWindow(0, 10, 5));
    EXPECT_EQ(waveOf(M, "top/clk"), "0..");
}

TEST(Resampler, changesBeforeStart) {
    const WaveModel M = extract("#0\n1!\n#5\n0!\n#12\n1!\n", {"top/clk"},
                                SampleWindow(10, 20, 5));
    EXPECT_EQ(M.getStartTime(), 10);
    EXPECT_EQ(M.getNumSamples(), 3);
    EXPECT_EQ(waveOf(M, "top/clk"), "01.");
}

TEST(Resampler, untilEndOfDump) {
    const WaveModel M = extract("#0\n0!\n#10\n1!\n#25\n", {"top/clk"},
                                SampleWindow(0, SampleWindow::END_OF_DUMP, 5));
    EXPECT_EQ(M.getEndTime(), 25);
    EXPECT_EQ(M.getNumSamples(), 6);
    EXPECT_EQ(waveOf(M, "top/clk"), "0.1...");
}

TEST(Resampler, startAfterEndOfDump) {
    const WaveModel M = extract("#0\n0!\n#10\n1!\n", {"top/clk"},
                                SampleWindow(100, SampleWindow::END_OF_DUMP, 5));
    EXPECT_EQ(M.getStartTime(), 100);
    EXPECT_EQ(M.getEndTime(), 100);
    EXPECT_EQ(M.getNumSamples(), 1);
    EXPECT_EQ(waveOf(M, "top/clk"), "1");
}

TEST(Resampler, endAfterEndOfDump) {
    // The last values are held until the end of the window.
    const WaveModel M =
        extract("#0\n0!\n#10\n1!\n", {"top/clk"}, SampleWindow(0, 30, 10));
    EXPECT_EQ(M.getEndTime(), 30);
    EXPECT_EQ(waveOf(M, "top/clk"), "01..");
}

TEST(Resampler, unalignedEnd) {
    const WaveModel M = extract(Clock, {"top/clk"}, SampleWindow(0, 37, 10));
    EXPECT_EQ(M.getNumSamples(), 4);
    EXPECT_EQ(waveOf(M, "top/clk"), "0101");
}

TEST(Resampler, windowAtTheEndOfTime) {
    const V2W::VCD::TimeTy max = std::numeric_limits<V2W::VCD::TimeTy>::max();
    const WaveModel M =
        extract("#0\n1!\n", {"top/clk"}, SampleWindow(max - 10, max - 1, 5));
    EXPECT_EQ(M.getNumSamples(), 2);
    EXPECT_EQ(waveOf(M, "top/clk"), "1.");
}

TEST(Resampler, unresolvedPaths) {
    const WaveModel M = extract(Clock, {"top/nope", "top/clk", "clk"},
                                SampleWindow(0, 40, 10));
    EXPECT_EQ(M.getNumSignals(), 1);
    EXPECT_TRUE(M.hasUnresolved());
    EXPECT_EQ(M.getUnresolved(), vector<string>({"top/nope", "clk"}));

    const WaveModel N =
        extract(Clock, {"top/nope"}, SampleWindow(0, 40, 10));
    EXPECT_TRUE(N.empty());
    EXPECT_EQ(N.getUnresolved(), vector<string>({"top/nope"}));
}

TEST(Resampler, requestOrder) {
    const WaveModel M =
        extract("#0\n0!\nb1 #\nb10 &\n", {"top/data", "top/clk", "top/bus"},
                SampleWindow(0, 0, 1));
    ASSERT_EQ(M.getNumSignals(), 3);
    EXPECT_EQ(M[0].getDefinition().getFullName(), "top/data");
    EXPECT_EQ(M[1].getDefinition().getFullName(), "top/clk");
    EXPECT_EQ(M[2].getDefinition().getFullName(), "top/bus");
    EXPECT_EQ(M[0].getData(), vector<string>({"02"}));
}

TEST(Resampler, aliases) {
    const WaveModel M = extract(Clock, {"top/clk", "top/sub/clk"},
                                SampleWindow(0, 40, 10));
    ASSERT_EQ(M.getNumSignals(), 2);
    EXPECT_EQ(waveOf(M, "top/clk"), "01010");
    EXPECT_EQ(waveOf(M, "top/sub/clk"), "01010");
}

TEST(Resampler, perSignalFormats) {
    istringstream is(
        makeVCD(Header, "#0\nb11111110 &\nb1110 #\n#1\nb11111111 &\n"));
    Lexer L(is);
    const Declarations D = DeclarationBuilder(L).build();
    ChangeWalker W(L, D);
    const WaveModel M = Resampler(D, SampleWindow(0, 1, 1))
                            .setDefaultFormat(DisplayFormat::SIGNED_DECIMAL)
                            .setFormat("top/bus", DisplayFormat::HEX_UPPER)
                            .extract(W, {"top/data", "top/bus"});
    EXPECT_EQ(M[0].getFormat(), DisplayFormat::SIGNED_DECIMAL);
    EXPECT_EQ(M[0].getData(), vector<string>({"-2", "-1"}));
    EXPECT_EQ(M[1].getFormat(), DisplayFormat::HEX_UPPER);
    EXPECT_EQ(M[1].getData(), vector<string>({"E"}));
    EXPECT_EQ(M[1].getWave(), "=.");
}

TEST(Resampler, sampleCountParity) {
    const string body = "#0\n0!\nb0 #\nr0 %\n#3\nb1 &\n#17\n1!\n#31\nr2 %\n";
    for (const V2W::VCD::TimeTy chunk : {1, 2, 3, 7, 10, 50}) {
        const WaveModel M =
            extract(body, {"top/clk", "top/bus", "top/temp", "top/data"},
                    SampleWindow(1, 33, chunk));
        EXPECT_EQ(M.getNumSamples(), WaveModel::getNumSamples(1, 33, chunk));
        for (const auto &S : M.getSignals())
            EXPECT_EQ(S.size(), M.getNumSamples())
                << S.getDefinition().getFullName() << " chunk " << chunk;
    }
}

TEST(Resampler, deterministic) {
    const SampleWindow window(0, 40, 3);
    const WaveModel M1 = extract(Clock, {"top/clk", "top/bus"}, window);
    const WaveModel M2 = extract(Clock, {"top/clk", "top/bus"}, window);
    ASSERT_EQ(M1.getNumSignals(), M2.getNumSignals());
    for (size_t i = 0; i < M1.getNumSignals(); i++) {
        EXPECT_EQ(M1[i].getSamples(), M2[i].getSamples());
        EXPECT_EQ(M1[i].getWave(), M2[i].getWave());
    }
}

TEST(Resampler, chunkSizeOneReproducesChanges) {
    // With a chunk size of 1, every change appears exactly where it
    // happened.
    const WaveModel M = extract(Clock, {"top/clk"}, SampleWindow(0, 40, 1));
    const string wave = waveOf(M, "top/clk");
    ASSERT_EQ(wave.size(), 41);
    for (size_t i = 0; i < wave.size(); i++) {
        if (i % 10 == 0) {
            EXPECT_NE(wave[i], '.') << "at " << i;
        } else {
            EXPECT_EQ(wave[i], '.') << "at " << i;
        }
    }
}

TEST(Resampler, timescale) {
    const WaveModel M = extract(Clock, {"top/clk"}, SampleWindow(0, 40, 10));
    EXPECT_TRUE(M.hasTimescale());
    EXPECT_EQ(M.getTimescale(), Timescale(1, "ns"));
}

TEST(Resampler, stopsAfterTheWindow) {
    // The invalid change after the window end is never reached.
    istringstream is(makeVCD(Header, "#0\n1!\n#20\n0!\n#30\n1?\n"));
    Lexer L(is);
    const Declarations D = DeclarationBuilder(L).build();
    ChangeWalker W(L, D);
    const WaveModel M =
        Resampler(D, SampleWindow(0, 10, 5)).extract(W, {"top/clk"});
    EXPECT_EQ(M.getNumSamples(), 3);
    EXPECT_EQ(M[0].getWave(), "1..");
    EXPECT_FALSE(W.isDone());
    EXPECT_EQ(W.getNumEvents(), 2);
}

TEST(Resampler, errors) {
    EXPECT_EQ(extractError(Clock, {}, SampleWindow(0, 10, 1)),
              ErrorKind::NO_SIGNALS_REQUESTED);
    EXPECT_EQ(extractError(Clock, {"top/clk"}, SampleWindow(0, 10, 0)),
              ErrorKind::INVALID_WINDOW);
    EXPECT_EQ(extractError(Clock, {"top/clk"}, SampleWindow(20, 10, 1)),
              ErrorKind::INVALID_WINDOW);
    // Errors from the value changes inside the window are reported.
    EXPECT_EQ(extractError("#0\n1!\n#5\n1?\n", {"top/clk"},
                           SampleWindow(0, 10, 1)),
              ErrorKind::UNKNOWN_IDENTIFIER);
    EXPECT_EQ(extractError("#0\nb2 #\n", {"top/bus"}, SampleWindow(0, 10, 1)),
              ErrorKind::INVALID_VALUE_SYMBOL);
}
