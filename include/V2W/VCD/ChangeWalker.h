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

#include "V2W/Error.h"
#include "V2W/VCD/Declarations.h"
#include "V2W/VCD/Lexer.h"
#include "V2W/VCD/Value.h"

#include <cstddef>
#include <string>
#include <unordered_map>

namespace V2W::VCD {

/// A ValueChangeEvent is a single value change from the VCD body, with the
/// time it occurred at.
struct ValueChangeEvent {
    TimeTy time = 0;
    std::string code;
    SignalValue value;
    SourceLocation location;
};

/// The ChangeWalker pulls the value changes out of the VCD body, one at a
/// time, in file order. It keeps track of the current time, and of the
/// current value of each identifier code that has changed so far.
///
/// The Lexer must have been positioned after $enddefinitions, usually by a
/// DeclarationBuilder. The walker can be abandoned at any point.
class ChangeWalker {
  public:
    ChangeWalker() = delete;
    ChangeWalker(const ChangeWalker &) = delete;
    ChangeWalker &operator=(const ChangeWalker &) = delete;

    ChangeWalker(Lexer &lexer, const Declarations &decls)
        : lexer(lexer), decls(decls) {}

    /// Get the next value change into \p E. Returns false once the end of
    /// the input has been reached.
    ///
    /// Throws an Error on unknown identifier codes, invalid value symbols,
    /// values too wide for their signal, malformed real numbers and
    /// decreasing time markers.
    bool next(ValueChangeEvent &E);

    /// Get the time of the last time marker seen, or 0 if none has been seen.
    TimeTy getCurrentTime() const { return currentTime; }
    /// Has a time marker been seen ?
    bool hasTime() const { return timeSeen; }
    /// Has the end of the input been reached ?
    bool isDone() const { return done; }

    /// Get the current value of identifier code \p code, or nullptr if it has
    /// not changed yet.
    const SignalValue *getValue(const std::string &code) const;

    /// Get the number of value changes returned so far.
    size_t getNumEvents() const { return numEvents; }

  private:
    Lexer &lexer;
    const Declarations &decls;
    TimeTy currentTime = 0;
    bool timeSeen = false;
    bool done = false;
    size_t numEvents = 0;
    std::unordered_map<std::string, SignalValue> state;

    void skipCommand();
    SignalValue decode(const Token &T, const SignalDefinition &SD) const;
};

} // namespace V2W::VCD
