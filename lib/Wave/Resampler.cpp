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

#include "V2W/Wave/Resampler.h"
#include "V2W/Error.h"
#include "V2W/utils/Misc.h"

#include <algorithm>
#include <cstddef>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

using std::string;
using std::unordered_map;
using std::vector;

using V2W::VCD::BitVector;
using V2W::VCD::ChangeWalker;
using V2W::VCD::SignalDefinition;
using V2W::VCD::SignalValue;
using V2W::VCD::ValueChangeEvent;

namespace {
// The sampling state of one requested signal.
struct Tracked {
    SignalValue current;
    V2W::Wave::SampleEncoder encoder;
    V2W::Wave::SampledSignal output;

    Tracked(const SignalDefinition &SD, V2W::Wave::DisplayFormat fmt)
        : current(), encoder(SD.getWidth(), SD.isReal(), fmt),
          output(SD, fmt) {
        // Until a change is seen, the value is unknown.
        if (!SD.isReal())
            current = SignalValue(BitVector::unknown(SD.getWidth()));
    }

    void sample() { output.append(encoder.encode(current)); }
};
} // namespace

namespace V2W {
namespace Wave {

Resampler &Resampler::setFormat(const string &path, DisplayFormat fmt) {
    formats[normalizePath(path)] = fmt;
    return *this;
}

DisplayFormat Resampler::getFormat(const string &path) const {
    const auto it = formats.find(normalizePath(path));
    if (it == formats.end())
        return defaultFormat;
    return it->second;
}

WaveModel Resampler::extract(ChangeWalker &walker,
                             const vector<string> &paths) const {
    if (paths.empty())
        throw Error(ErrorKind::NO_SIGNALS_REQUESTED,
                    "no signal paths were given");
    if (window.chunkSize == 0)
        throw Error(ErrorKind::INVALID_WINDOW, "chunk size must not be 0");
    if (window.startTime > window.endTime)
        throw Error(ErrorKind::INVALID_WINDOW,
                    concat("start time ", window.startTime,
                           " is after end time ", window.endTime));

    // Resolve the requested paths. The signals sharing an identifier code
    // are all updated by a change to that code.
    vector<Tracked> tracked;
    vector<string> unresolved;
    unordered_map<string, vector<size_t>> codeToTracked;
    for (const auto &path : paths) {
        const SignalDefinition *SD = decls.findSignal(path);
        if (!SD) {
            unresolved.push_back(path);
            continue;
        }
        if (SD->getWidth() == 0)
            throw Error(ErrorKind::INVALID_WIDTH,
                        "signal '" + SD->getFullName() + "' has a zero width");
        codeToTracked[SD->getIdCode()].push_back(tracked.size());
        tracked.emplace_back(*SD, getFormat(path));
    }

    const TimeTy start = window.startTime;
    const TimeTy end = window.endTime;
    const TimeTy chunk = window.chunkSize;

    // The next sampling instant, and whether there is one.
    TimeTy t = start;
    bool sampling = true;
    auto emitGroup = [&]() {
        for (auto &tr : tracked)
            tr.sample();
        if (end - t < chunk)
            sampling = false;
        else
            t += chunk;
    };

    ValueChangeEvent E;
    while (walker.next(E)) {
        if (E.time > end)
            break;
        // All the value changes before the sampling instant have been
        // applied: emit the groups up to this change.
        while (sampling && t < E.time)
            emitGroup();
        const auto it = codeToTracked.find(E.code);
        if (it != codeToTracked.end())
            for (const size_t i : it->second)
                tracked[i].current = E.value;
    }

    const TimeTy resolvedEnd = window.untilEndOfDump()
                                   ? std::max(start, walker.getCurrentTime())
                                   : end;
    while (sampling && t <= resolvedEnd)
        emitGroup();

    WaveModelBuilder builder(start, resolvedEnd, chunk);
    if (decls.hasTimescale())
        builder.setTimescale(decls.getTimescale());
    for (auto &tr : tracked)
        builder.addSignal(std::move(tr.output));
    for (const auto &path : unresolved)
        builder.addUnresolved(path);

    return builder.build();
}

} // namespace Wave
} // namespace V2W
