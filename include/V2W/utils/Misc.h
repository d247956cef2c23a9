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

#include <string>
#include <vector>

namespace V2W {

/// Split string \p str in substrings at each occurence of \p delim. Empty
/// substrings are dropped.
std::vector<std::string> split(char delim, const std::string &str);

/// Join \p strs with \p delim inserted between consecutive elements.
std::string join(char delim, const std::vector<std::string> &strs);

/// Get the canonical form of a signal path: leading and trailing '/' are
/// removed, as well as empty path components.
std::string normalizePath(const std::string &path);

} // namespace V2W
