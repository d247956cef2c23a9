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

#include "v2w-unit-testing.h"

#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <string>
#include <vector>

#include <unistd.h>

using std::cerr;
using std::getline;
using std::ifstream;
using std::ofstream;
using std::string;
using std::unique_ptr;
using std::vector;

string makeVCD(const string &declarations, const string &body) {
    return "$date today $end\n"
           "$version v2w-unit-tests $end\n"
           "$timescale 1ns $end\n" +
           declarations + "$enddefinitions $end\n" + body;
}

TestWithTemporaryFiles::TestWithTemporaryFiles(const char *tpl, unsigned num)
    : tmpFileNames(), verbose(false), remove(true) {
    tmpFileNames.reserve(num);
    const string tmpTplStr = testing::TempDir() + tpl;
    unique_ptr<char[]> tmpTpl(new char[tmpTplStr.size() + 1]);
    for (unsigned i = 0; i < num; i++) {
        std::memcpy(tmpTpl.get(), tmpTplStr.c_str(), tmpTplStr.size() + 1);
        // mkstemp creates and opens the file. Only its name is needed: close
        // it right away, the tests will reopen it.
        const int fd = mkstemp(tmpTpl.get());
        if (fd != -1) {
            close(fd);
            tmpFileNames.push_back(tmpTpl.get());
        } else {
            tmpFileNames.push_back("");
        }
    }
}

bool TestWithTemporaryFiles::writeTemporaryFile(const string &content,
                                                unsigned i) const {
    const string &filename = getTemporaryFilename(i);
    if (filename.empty())
        return false;
    ofstream f(filename.c_str());
    if (!f.good())
        return false;
    f << content;
    f.close();
    return !f.fail();
}

string TestWithTemporaryFiles::readTemporaryFile(unsigned i) const {
    const string &filename = getTemporaryFilename(i);
    if (filename.empty())
        return "";
    ifstream f(filename.c_str());
    return string(std::istreambuf_iterator<char>(f),
                  std::istreambuf_iterator<char>());
}

bool TestWithTemporaryFiles::checkFileContent(const vector<string> &exp,
                                              unsigned n) const {
    const string &filename = getTemporaryFilename(n);
    if (filename.empty())
        return false;
    ifstream f(filename.c_str());

    if (!f.good()) {
        if (verbose)
            cerr << filename << " is not in a good state.\n";
        return false;
    }

    vector<string> lines;
    string line;
    while (getline(f, line))
        lines.emplace_back(line);

    if (lines.size() != exp.size()) {
        if (verbose)
            cerr << filename << " has " << lines.size()
                 << " lines where " << exp.size() << " were expected.\n";
        return false;
    }

    for (size_t i = 0; i < exp.size(); i++)
        if (lines[i] != exp[i]) {
            cerr << "Mismatch at line " << i << " in " << filename << " :\n";
            cerr << "+ " << lines[i] << '\n';
            cerr << "- " << exp[i] << '\n';
            return false;
        }

    return true;
}
