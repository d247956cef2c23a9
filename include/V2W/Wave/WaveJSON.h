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

#include "V2W/Wave/WaveModel.h"

#include <ostream>
#include <string>

namespace V2W {
namespace Wave {

/// The WaveJSONWriter serializes a WaveModel to WaveJSON, the format consumed
/// by WaveDrom.
class WaveJSONWriter {
  public:
    /// Construct a writer. Signals are named with their full path if
    /// \p fullPath is set, with their leaf name otherwise.
    WaveJSONWriter(bool fullPath = false) : fullPath(fullPath) {}

    /// Write \p model to \p os.
    void write(std::ostream &os, const WaveModel &model) const;

    /// Write \p model to file \p filename. Returns false if the file could
    /// not be written.
    bool write(const std::string &filename, const WaveModel &model) const;

    /// Get \p model as a WaveJSON string.
    std::string str(const WaveModel &model) const;

    /// Get the description of the model window used as the diagram title.
    static std::string getTitle(const WaveModel &model);

    /// Escape \p str so it can be used in a JSON string.
    static std::string escape(const std::string &str);

  private:
    bool fullPath;
};

} // namespace Wave
} // namespace V2W
