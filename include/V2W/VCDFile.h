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

#include "V2W/VCD/Declarations.h"
#include "V2W/Wave/Resampler.h"
#include "V2W/Wave/WaveModel.h"

#include <istream>
#include <string>
#include <utility>
#include <vector>

namespace V2W {

/// Display format overrides, as (signal path, format) pairs.
using FormatOverrides = std::vector<std::pair<std::string, Wave::DisplayFormat>>;

// The VCDFile class is the entry point to read a VCD file. Each operation
// opens its own stream on the file, so several operations can be performed on
// the same VCDFile independently.
class VCDFile {
  public:
    VCDFile() = delete;
    VCDFile(const VCDFile &) = delete;
    VCDFile(const std::string &filename) : fileName(filename) {}

    // Does filename look like a VCD file, judging from its suffix ?
    static bool isVCDFileName(const std::string &filename);

    // Get this VCDFile filename.
    const std::string &getFileName() const { return fileName; }

    // Read the file header. The scope hierarchy is retained if keepHierarchy
    // is set.
    VCD::Declarations readDeclarations(bool keepHierarchy = false) const;

    // Get all signals declared in the file, in declaration order, without
    // reading the value changes.
    std::vector<VCD::SignalDefinition> listSignals() const;

    // Extract the waves for the signals in paths.
    Wave::WaveModel
    extract(const std::vector<std::string> &paths,
            const Wave::SampleWindow &window = Wave::SampleWindow(),
            Wave::DisplayFormat defaultFormat = Wave::DisplayFormat::HEX,
            const FormatOverrides &formats = FormatOverrides()) const;

    // Same as the above, but reading the VCD content from is.
    static VCD::Declarations readDeclarations(std::istream &is,
                                              bool keepHierarchy = false);
    static std::vector<VCD::SignalDefinition> listSignals(std::istream &is);
    static Wave::WaveModel
    extract(std::istream &is, const std::vector<std::string> &paths,
            const Wave::SampleWindow &window = Wave::SampleWindow(),
            Wave::DisplayFormat defaultFormat = Wave::DisplayFormat::HEX,
            const FormatOverrides &formats = FormatOverrides());

  private:
    // The file name the waves are coming from.
    std::string fileName;
};

} // namespace V2W
