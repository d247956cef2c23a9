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
#include "V2W/Error.h"
#include "V2W/VCD/ChangeWalker.h"
#include "V2W/VCD/Declarations.h"
#include "V2W/VCD/Lexer.h"
#include "V2W/Wave/Resampler.h"

#include <fstream>
#include <istream>
#include <string>
#include <vector>

using std::ifstream;
using std::istream;
using std::string;
using std::vector;

using V2W::VCD::ChangeWalker;
using V2W::VCD::DeclarationBuilder;
using V2W::VCD::Declarations;
using V2W::VCD::Lexer;
using V2W::VCD::SignalDefinition;
using V2W::Wave::DisplayFormat;
using V2W::Wave::Resampler;
using V2W::Wave::SampleWindow;
using V2W::Wave::WaveModel;

namespace {
// A VCD input stream, opened on construction.
class VCDStream : public ifstream {
  public:
    VCDStream(const string &filename) : ifstream(filename.c_str()) {
        if (!good())
            die("can not open '", filename, "' for reading");
    }
};
} // namespace

namespace V2W {

bool VCDFile::isVCDFileName(const string &filename) {
    const size_t pos = filename.find_last_of('.');
    if (pos == string::npos)
        return false;
    return filename.substr(pos) == ".vcd";
}

Declarations VCDFile::readDeclarations(bool keepHierarchy) const {
    VCDStream is(fileName);
    return readDeclarations(is, keepHierarchy);
}

vector<SignalDefinition> VCDFile::listSignals() const {
    VCDStream is(fileName);
    return listSignals(is);
}

WaveModel VCDFile::extract(const vector<string> &paths,
                           const SampleWindow &window,
                           DisplayFormat defaultFormat,
                           const FormatOverrides &formats) const {
    VCDStream is(fileName);
    return extract(is, paths, window, defaultFormat, formats);
}

Declarations VCDFile::readDeclarations(istream &is, bool keepHierarchy) {
    Lexer lexer(is);
    DeclarationBuilder builder(lexer, keepHierarchy);
    return builder.build();
}

vector<SignalDefinition> VCDFile::listSignals(istream &is) {
    return readDeclarations(is).getSignals();
}

WaveModel VCDFile::extract(istream &is, const vector<string> &paths,
                           const SampleWindow &window,
                           DisplayFormat defaultFormat,
                           const FormatOverrides &formats) {
    Lexer lexer(is);
    DeclarationBuilder builder(lexer);
    const Declarations decls = builder.build();

    Resampler resampler(decls, window);
    resampler.setDefaultFormat(defaultFormat);
    for (const auto &f : formats)
        resampler.setFormat(f.first, f.second);

    ChangeWalker walker(lexer, decls);
    return resampler.extract(walker, paths);
}

} // namespace V2W
