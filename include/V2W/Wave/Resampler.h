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

#include "V2W/VCD/ChangeWalker.h"
#include "V2W/VCD/Declarations.h"
#include "V2W/Wave/WaveModel.h"

#include <limits>
#include <string>
#include <unordered_map>
#include <vector>

namespace V2W {
namespace Wave {

/// The SampleWindow describes which part of the dump is sampled, and how
/// often: signals are sampled at startTime + k * chunkSize, for all k such
/// that the sampling instant is not after endTime.
struct SampleWindow {
    /// Use END_OF_DUMP as endTime to sample until the last time marker.
    static constexpr TimeTy END_OF_DUMP = std::numeric_limits<TimeTy>::max();

    TimeTy startTime = 0;
    TimeTy endTime = END_OF_DUMP;
    TimeTy chunkSize = 1;

    SampleWindow() = default;
    SampleWindow(TimeTy startTime, TimeTy endTime, TimeTy chunkSize = 1)
        : startTime(startTime), endTime(endTime), chunkSize(chunkSize) {}

    bool untilEndOfDump() const { return endTime == END_OF_DUMP; }
};

/// The Resampler converts the irregular value changes of the requested
/// signals into regular sequences of samples, in a single forward pass over
/// the value changes.
class Resampler {
  public:
    Resampler(const VCD::Declarations &decls,
              const SampleWindow &window = SampleWindow())
        : decls(decls), window(window) {}

    /// Set the display format used for the signals without a specific
    /// format. Hexadecimal is used by default.
    Resampler &setDefaultFormat(DisplayFormat fmt) {
        defaultFormat = fmt;
        return *this;
    }

    /// Set the display format to use for signal \p path.
    Resampler &setFormat(const std::string &path, DisplayFormat fmt);

    /// Get the display format that will be used for signal \p path.
    DisplayFormat getFormat(const std::string &path) const;

    const SampleWindow &getWindow() const { return window; }

    /// Sample the signals in \p paths, pulling their value changes from
    /// \p walker. Paths which do not match a declared signal are reported in
    /// the model's unresolved list. The walker is not consumed past the first
    /// value change after the window end.
    ///
    /// Throws an Error if \p paths is empty, if the window is invalid, or on
    /// any error reported by the walker.
    WaveModel extract(VCD::ChangeWalker &walker,
                      const std::vector<std::string> &paths) const;

  private:
    const VCD::Declarations &decls;
    SampleWindow window;
    DisplayFormat defaultFormat = DisplayFormat::HEX;
    std::unordered_map<std::string, DisplayFormat> formats;
};

} // namespace Wave
} // namespace V2W
