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

#include "libtarmac/argparse.hh"
#include "libtarmac/reporter.hh"

#include "V2W/Error.h"
#include "V2W/VCD/Declarations.h"
#include "V2W/VCDFile.h"
#include "V2W/Wave/Resampler.h"
#include "V2W/Wave/WaveJSON.h"
#include "V2W/Wave/WaveModel.h"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace std;
using namespace V2W;
using V2W::VCD::Declarations;
using V2W::VCD::Scope;
using V2W::VCD::SignalDefinition;
using V2W::Wave::DisplayFormat;
using V2W::Wave::SampleWindow;
using V2W::Wave::WaveJSONWriter;
using V2W::Wave::WaveModel;

namespace {
class MyHierVisitor : public Declarations::Visitor {
    static const constexpr unsigned TAB = 2;

  public:
    MyHierVisitor(ostream &os) : os(os), depth(0) {}

    void enterScope(const Scope &scope) override {
        os << string(TAB * depth, ' ') << "o " << scope.getName() << " ("
           << Scope::getKindName(scope.getKind()) << ")\n";
        depth += 1;
    }
    void leaveScope(const Scope &scope) override { depth -= 1; }
    void visitSignal(const SignalDefinition &SD) override {
        os << string(TAB * depth, ' ') << "- " << SD.getName();
        if (SD.hasRange())
            os << ' ' << SD.getRange();
        os << " (" << SignalDefinition::getKindName(SD.getKind());
        if (!SD.isReal())
            os << ", " << SD.getWidth() << " bit"
               << (SD.getWidth() > 1 ? "s" : "");
        os << ")\n";
    }

  private:
    ostream &os;
    unsigned depth;
};

VCD::TimeTy parseTime(const string &str, const char *what) {
    size_t pos = 0;
    VCD::TimeTy t = 0;
    try {
        t = stoull(str, &pos, 0);
    } catch (const invalid_argument &) {
        pos = 0;
    } catch (const out_of_range &) {
        reporter->errx(EXIT_FAILURE, "Out of range %s '%s'", what,
                       str.c_str());
    }
    if (pos == 0 || pos != str.size() || str[0] == '-')
        reporter->errx(EXIT_FAILURE, "Invalid %s '%s'", what, str.c_str());
    return t;
}

DisplayFormat parseFormat(const string &str) {
    DisplayFormat fmt = DisplayFormat::HEX;
    if (str.size() != 1 || !Wave::getDisplayFormat(str[0], fmt))
        reporter->errx(EXIT_FAILURE,
                       "Unknown display format '%s' (expecting one of b, d, "
                       "u, x or X)",
                       str.c_str());
    return fmt;
}
} // namespace

std::unique_ptr<Reporter> reporter = make_cli_reporter();

int main(int argc, char *argv[]) {
    string inputFile;
    vector<string> signals;
    string outputFile; // Use cout by default.
    VCD::TimeTy startTime = 0;
    VCD::TimeTy endTime = 0; // Until the end of the dump.
    VCD::TimeTy chunkSize = 1;
    DisplayFormat defaultFormat = DisplayFormat::HEX;
    FormatOverrides formats;
    bool fullPath = false;
    bool verbose = false;
    enum { EXTRACT, LIST_SIGNALS, DUMP_HIER } action = EXTRACT;

    // Environment defaults, overridden by the command line.
    if (const char *s = getenv("VCD2WAVE_START_TIME"))
        startTime = parseTime(s, "VCD2WAVE_START_TIME");
    if (const char *s = getenv("VCD2WAVE_END_TIME"))
        endTime = parseTime(s, "VCD2WAVE_END_TIME");
    if (const char *s = getenv("VCD2WAVE_CHUNK_SIZE"))
        chunkSize = parseTime(s, "VCD2WAVE_CHUNK_SIZE");

    Argparse ap("vcd2wave", argc, argv);
    ap.optval({"-o", "--output"}, "OUTPUTFILE",
              "WaveJSON output file name (default: standard output)",
              [&](const string &s) { outputFile = s; });
    ap.optval({"--start-time"}, "TIME", "Sample from TIME (default: 0)",
              [&](const string &s) { startTime = parseTime(s, "start time"); });
    ap.optval({"--end-time"}, "TIME",
              "Sample up to TIME, 0 meaning up to the end of the dump "
              "(default: 0)",
              [&](const string &s) { endTime = parseTime(s, "end time"); });
    ap.optval({"--chunk-size"}, "TICKS",
              "Number of simulation ticks per sample (default: 1)",
              [&](const string &s) { chunkSize = parseTime(s, "chunk size"); });
    ap.optval({"--format"}, "FMT",
              "Display format for multi-bit signals: b (binary), d (signed "
              "decimal), u (unsigned decimal), x or X (hexadecimal, the "
              "default)",
              [&](const string &s) { defaultFormat = parseFormat(s); });
    ap.optval({"--signal-format"}, "PATH=FMT",
              "Display format for signal PATH (can be specified multiple "
              "times)",
              [&](const string &s) {
                  const size_t pos = s.rfind('=');
                  if (pos == string::npos || pos == 0)
                      reporter->errx(EXIT_FAILURE,
                                     "Expecting PATH=FMT, got '%s'",
                                     s.c_str());
                  formats.emplace_back(s.substr(0, pos),
                                       parseFormat(s.substr(pos + 1)));
              });
    ap.optnoval({"--full-path"}, "Name signals with their full path",
                [&]() { fullPath = true; });
    ap.optnoval({"--list-signals"}, "List the signals in FILE and exit",
                [&]() { action = LIST_SIGNALS; });
    ap.optnoval({"--hier"}, "Dump the scope hierarchy of FILE and exit",
                [&]() { action = DUMP_HIER; });
    ap.optnoval({"-v", "--verbose"}, "Be more verbose",
                [&]() { verbose = true; });
    ap.optval({"--via-file"}, "FILE", "Read command line arguments from FILE",
              [&](const string &filename) {
                  ifstream viafile(filename.c_str());
                  if (!viafile)
                      reporter->errx(EXIT_FAILURE,
                                     "Error opening via-file '%s'",
                                     filename.c_str());
                  vector<string> words;
                  while (!viafile.eof()) {
                      string word;
                      viafile >> word;
                      if (!word.empty())
                          words.push_back(word);
                  }
                  while (!words.empty()) {
                      ap.prepend_cmdline_word(words.back());
                      words.pop_back();
                  }
              });
    ap.positional(
        "FILE", "VCD file to read", [&](const string &s) { inputFile = s; },
        /* Required: */ true);
    ap.positional_multiple("SIGNALS", "Paths of the signals to extract",
                           [&](const string &s) { signals.push_back(s); });

    ap.parse();

    if (!VCDFile::isVCDFileName(inputFile))
        reporter->warnx("'%s' does not have a .vcd suffix", inputFile.c_str());

    const VCDFile vcd(inputFile);

    try {
        switch (action) {
        case LIST_SIGNALS:
            for (const auto &SD : vcd.listSignals()) {
                cout << SD.getFullName() << ' '
                     << SignalDefinition::getKindName(SD.getKind()) << ' '
                     << SD.getWidth() << '\n';
            }
            return EXIT_SUCCESS;

        case DUMP_HIER: {
            const Declarations decls =
                vcd.readDeclarations(/* keepHierarchy: */ true);
            MyHierVisitor dumper(cout);
            cout << "File " << inputFile << ":\n";
            decls.visit(dumper);
            return EXIT_SUCCESS;
        }

        case EXTRACT:
            break;
        }

        if (signals.empty())
            reporter->errx(EXIT_FAILURE, "No signal to extract");

        const SampleWindow window(
            startTime, endTime == 0 ? SampleWindow::END_OF_DUMP : endTime,
            chunkSize);

        if (verbose) {
            cerr << "Extracting " << signals.size() << " signal(s) from "
                 << inputFile << " starting at " << startTime;
            if (window.untilEndOfDump())
                cerr << " up to the end of the dump";
            else
                cerr << " up to " << endTime;
            cerr << ", with a chunk size of " << chunkSize << '\n';
        }

        const WaveModel model =
            vcd.extract(signals, window, defaultFormat, formats);

        for (const auto &path : model.getUnresolved())
            reporter->warnx("Signal '%s' not found in '%s'", path.c_str(),
                            inputFile.c_str());
        reporter->warnx("%zu of %zu signals extracted", model.getNumSignals(),
                        signals.size());

        if (verbose)
            model.dump(cerr);

        const WaveJSONWriter writer(fullPath);
        if (outputFile.empty())
            writer.write(cout, model);
        else if (!writer.write(outputFile, model))
            reporter->errx(EXIT_FAILURE, "Error writing '%s'",
                           outputFile.c_str());
    } catch (const V2W::Error &e) {
        reporter->errx(EXIT_FAILURE, "Error reading '%s': %s",
                       inputFile.c_str(), e.what());
    }

    return EXIT_SUCCESS;
}
