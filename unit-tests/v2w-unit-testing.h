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

#include "gtest/gtest.h"

#include <cstdio>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

/// Capture everything written to std::cout and std::cerr during the lifetime
/// of a CoutCerrRedirect object.
class CoutCerrRedirect {
  public:
    std::ostringstream out;
    std::ostringstream err;

    CoutCerrRedirect()
        : out(), err(), ostrbuf(std::cout.rdbuf()),
          estrbuf(std::cerr.rdbuf()) {
        std::cout.rdbuf(out.rdbuf());
        std::cerr.rdbuf(err.rdbuf());
    }

    ~CoutCerrRedirect() {
        std::cout.rdbuf(ostrbuf);
        std::cerr.rdbuf(estrbuf);
    }

  private:
    std::streambuf *ostrbuf;
    std::streambuf *estrbuf;
};

/// Build the text of a VCD file with a 1 ns timescale, with \p declarations
/// ($scope, $var, $upscope commands) as header and \p body as the value
/// changes section.
std::string makeVCD(const std::string &declarations, const std::string &body);

/// The TestWithTemporaryFiles fixture provides tests with temporary files,
/// removed at the end of the test unless asked otherwise.
class TestWithTemporaryFiles : public ::testing::Test {

  public:
    /// Construct an instance with \p num temporary filenames matching template
    /// \p tpl.
    TestWithTemporaryFiles(const char *tpl, unsigned num);

    /// Turn verbosity on / off.
    void verbosity(bool v) { verbose = v; }

    /// Keep or remove the temporary files at the end of the test.
    void cleanup(bool c) { remove = c; }

    /// Get the number of available files.
    unsigned getNumFiles() const { return tmpFileNames.size(); }

    /// Get temporary file \p i name, or an empty string if there is no such
    /// file.
    const std::string &getTemporaryFilename(unsigned i = 0) const {
        static const std::string none;
        return i < tmpFileNames.size() ? tmpFileNames[i] : none;
    }

    /// Overwrite temporary file \p i with \p content.
    bool writeTemporaryFile(const std::string &content, unsigned i = 0) const;

    /// Get the content of temporary file \p i.
    std::string readTemporaryFile(unsigned i = 0) const;

    /// Check that each line of temporary file \p i matches those in \p exp.
    bool checkFileContent(const std::vector<std::string> &exp,
                          unsigned i = 0) const;

    /// Force removal of the temporary files.
    void removeTemporaryFiles() {
        for (const auto &f : tmpFileNames)
            if (!f.empty())
                std::remove(f.c_str());
    }

  protected:
    void TearDown() override {
        if (remove)
            removeTemporaryFiles();
    }

  private:
    std::vector<std::string> tmpFileNames;
    bool verbose;
    bool remove;
};

#define TEST_WITH_TEMP_FILE(FIXTURENAME, TEMPLATE)                             \
    class FIXTURENAME : public TestWithTemporaryFiles {                        \
      public:                                                                  \
        FIXTURENAME() : TestWithTemporaryFiles(TEMPLATE, 1) {}                 \
    }

#define TEST_WITH_TEMP_FILES(FIXTURENAME, TEMPLATE, NUM)                       \
    class FIXTURENAME : public TestWithTemporaryFiles {                        \
      public:                                                                  \
        FIXTURENAME() : TestWithTemporaryFiles(TEMPLATE, NUM) {}               \
    }
