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

#include "V2W/utils/Misc.h"

#include <string>
#include <vector>

#include "gtest/gtest.h"

using namespace std;

TEST(Misc, split) {
    using V2W::split;

    EXPECT_TRUE(split('/', "").empty());
    EXPECT_TRUE(split('/', "/").empty());
    EXPECT_TRUE(split('/', "///").empty());
    EXPECT_EQ(split('/', "/top"), vector<string>{"top"});
    EXPECT_EQ(split('/', "top//"), vector<string>{"top"});
    EXPECT_EQ(split('/', "/top/clk/"), vector<string>({"top", "clk"}));
    EXPECT_EQ(split('/', "top/cpu/data[7:0]"),
              vector<string>({"top", "cpu", "data[7:0]"}));
    EXPECT_EQ(split('/', "top/a b/c"), vector<string>({"top", "a b", "c"}));
}

TEST(Misc, join) {
    using V2W::join;

    EXPECT_EQ(join('/', {}), "");
    EXPECT_EQ(join('/', {"top"}), "top");
    EXPECT_EQ(join('/', {"top", "cpu", "clk"}), "top/cpu/clk");
    EXPECT_EQ(join('.', {"a", "", "b"}), "a..b");
}

TEST(Misc, normalizePath) {
    using V2W::normalizePath;

    EXPECT_EQ(normalizePath(""), "");
    EXPECT_EQ(normalizePath("clk"), "clk");
    EXPECT_EQ(normalizePath("/top/clk"), "top/clk");
    EXPECT_EQ(normalizePath("top/clk/"), "top/clk");
    EXPECT_EQ(normalizePath("//top//cpu///clk//"), "top/cpu/clk");
}
