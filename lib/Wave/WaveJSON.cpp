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

#include "V2W/Wave/WaveJSON.h"
#include "V2W/Error.h"

#include <cstdio>
#include <fstream>
#include <ostream>
#include <sstream>
#include <string>
#include <vector>

using std::ofstream;
using std::ostream;
using std::ostringstream;
using std::string;
using std::vector;

namespace V2W {
namespace Wave {

string WaveJSONWriter::escape(const string &str) {
    string res;
    res.reserve(str.size());
    for (const char c : str) {
        switch (c) {
        case '"':
            res += "\\\"";
            break;
        case '\\':
            res += "\\\\";
            break;
        case '\b':
            res += "\\b";
            break;
        case '\f':
            res += "\\f";
            break;
        case '\n':
            res += "\\n";
            break;
        case '\r':
            res += "\\r";
            break;
        case '\t':
            res += "\\t";
            break;
        default:
            if (static_cast<unsigned char>(c) < 0x20) {
                char buf[8];
                snprintf(buf, sizeof(buf), "\\u%04x",
                         static_cast<unsigned>(static_cast<unsigned char>(c)));
                res += buf;
            } else
                res += c;
        }
    }
    return res;
}

string WaveJSONWriter::getTitle(const WaveModel &model) {
    string title = concat("from ", model.getStartTime(), " to ",
                          model.getEndTime(), ", chunk size ",
                          model.getChunkSize());
    if (model.hasTimescale())
        title += ", timescale " + model.getTimescale().str();
    return title;
}

void WaveJSONWriter::write(ostream &os, const WaveModel &model) const {
    os << "{ \"head\": { \"text\": \"" << escape(getTitle(model))
       << "\", \"tick\": " << model.getStartTime() / model.getChunkSize()
       << " },\n";
    os << "  \"signal\": [";

    const char *sep = "\n";
    for (const auto &S : model.getSignals()) {
        const VCD::SignalDefinition &SD = S.getDefinition();
        os << sep << "    { \"name\": \""
           << escape(fullPath ? SD.getFullName() : SD.getName())
           << "\", \"wave\": \"" << S.getWave() << '"';
        if (!SD.isScalar()) {
            os << ", \"data\": [";
            const vector<string> data = S.getData();
            for (size_t i = 0; i < data.size(); i++)
                os << (i == 0 ? "" : ", ") << '"' << escape(data[i]) << '"';
            os << ']';
        }
        os << " }";
        sep = ",\n";
    }

    os << (model.empty() ? "]\n" : "\n  ]\n");
    os << "}\n";
}

bool WaveJSONWriter::write(const string &filename,
                           const WaveModel &model) const {
    ofstream ofs(filename.c_str());
    if (!ofs.good())
        return false;
    write(ofs, model);
    ofs.close();
    return !ofs.fail();
}

string WaveJSONWriter::str(const WaveModel &model) const {
    ostringstream oss;
    write(oss, model);
    return oss.str();
}

} // namespace Wave
} // namespace V2W
