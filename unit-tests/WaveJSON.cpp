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

#include "V2W/VCDFile.h"
#include "V2W/Wave/Resampler.h"
#include "V2W/Wave/WaveJSON.h"
#include "V2W/Wave/WaveModel.h"

#include "v2w-unit-testing.h"

#include <sstream>
#include <string>
#include <vector>

#include "gtest/gtest.h"

using namespace testing;
using namespace V2W::Wave;

using V2W::VCDFile;

using std::istringstream;
using std::string;
using std::vector;

namespace {
const char Header[] = "$scope module top $end\n"
                      "$var wire 1 ! clk $end\n"
                      "$var wire 4 # bus [3:0] $end\n"
                      "$var wire 1 % a\"b $end\n"
                      "$upscope $end\n";

const char Body[] = "#0\n0!\n#7\nb1010 #\n#10\n1!\n#20\n0!\nb1111 #\n";

WaveModel extract(const vector<string> &paths, const SampleWindow &window) {
    istringstream is(makeVCD(Header, Body));
    return VCDFile::extract(is, paths, window);
}
} // namespace

TEST(WaveJSON, escape) {
    EXPECT_EQ(WaveJSONWriter::escape(""), "");
    EXPECT_EQ(WaveJSONWriter::escape("top/clk"), "top/clk");
    EXPECT_EQ(WaveJSONWriter::escape("a\"b"), "a\\\"b");
    EXPECT_EQ(WaveJSONWriter::escape("a\\b"), "a\\\\b");
    EXPECT_EQ(WaveJSONWriter::escape("\n\t\r\b\f"), "\\n\\t\\r\\b\\f");
    EXPECT_EQ(WaveJSONWriter::escape(string("\x01") + "\x1f"),
              "\\u0001\\u001f");
}

TEST(WaveJSON, title) {
    EXPECT_EQ(WaveJSONWriter::getTitle(WaveModel(0, 10, 5)),
              "from 0 to 10, chunk size 5");
    EXPECT_EQ(WaveJSONWriter::getTitle(
                  extract({"top/clk"}, SampleWindow(10, 20, 10))),
              "from 10 to 20, chunk size 10, timescale 1 ns");
}

TEST(WaveJSON, write) {
    const WaveModel M =
        extract({"top/clk", "top/bus"}, SampleWindow(0, 20, 10));
    const WaveJSONWriter W;
    EXPECT_EQ(W.str(M),
              "{ \"head\": { \"text\": \"from 0 to 20, chunk size 10, "
              "timescale 1 ns\", \"tick\": 0 },\n"
              "  \"signal\": [\n"
              "    { \"name\": \"clk\", \"wave\": \"010\" },\n"
              "    { \"name\": \"bus\", \"wave\": \"x==\", \"data\": [\"a\", "
              "\"f\"] }\n"
              "  ]\n"
              "}\n");

    std::ostringstream os;
    W.write(os, M);
    EXPECT_EQ(os.str(), W.str(M));
}

TEST(WaveJSON, fullPath) {
    const WaveModel M =
        extract({"top/bus", "top/a\"b"}, SampleWindow(20, 40, 10));
    EXPECT_EQ(WaveJSONWriter(/* fullPath: */ true).str(M),
              "{ \"head\": { \"text\": \"from 20 to 40, chunk size 10, "
              "timescale 1 ns\", \"tick\": 2 },\n"
              "  \"signal\": [\n"
              "    { \"name\": \"top/bus\", \"wave\": \"=..\", \"data\": "
              "[\"f\"] },\n"
              "    { \"name\": \"top/a\\\"b\", \"wave\": \"x..\" }\n"
              "  ]\n"
              "}\n");
}

TEST(WaveJSON, unknownVectorHasNoData) {
    const WaveModel M = extract({"top/bus"}, SampleWindow(0, 5, 5));
    EXPECT_EQ(WaveJSONWriter().str(M),
              "{ \"head\": { \"text\": \"from 0 to 5, chunk size 5, "
              "timescale 1 ns\", \"tick\": 0 },\n"
              "  \"signal\": [\n"
              "    { \"name\": \"bus\", \"wave\": \"x.\", \"data\": [] }\n"
              "  ]\n"
              "}\n");
}

TEST(WaveJSON, empty) {
    const WaveModel M = extract({"top/nope"}, SampleWindow(0, 20, 10));
    ASSERT_TRUE(M.empty());
    EXPECT_EQ(WaveJSONWriter().str(M),
              "{ \"head\": { \"text\": \"from 0 to 20, chunk size 10, "
              "timescale 1 ns\", \"tick\": 0 },\n"
              "  \"signal\": []\n"
              "}\n");
}

TEST_WITH_TEMP_FILE(WaveJSONF, "test-WaveJSON.json.XXXXXX");

TEST_F(WaveJSONF, writeFile) {
    const WaveModel M = extract({"top/clk"}, SampleWindow(0, 20, 5));
    EXPECT_TRUE(WaveJSONWriter().write(getTemporaryFilename(), M));
    EXPECT_TRUE(checkFileContent(
        {"{ \"head\": { \"text\": \"from 0 to 20, chunk size 5, timescale 1 "
         "ns\", \"tick\": 0 },",
         "  \"signal\": [",
         "    { \"name\": \"clk\", \"wave\": \"0.1.0\" }",
         "  ]",
         "}"}));
    EXPECT_EQ(readTemporaryFile(), WaveJSONWriter().str(M));
}

TEST(WaveJSON, writeFileError) {
    const WaveModel M = extract({"top/clk"}, SampleWindow(0, 20, 5));
    EXPECT_FALSE(WaveJSONWriter().write(
        string("/this/directory/does/not/exist/wave.json"), M));
}
