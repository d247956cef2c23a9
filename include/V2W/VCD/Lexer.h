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
#include "V2W/VCD/Value.h"

#include <cstddef>
#include <istream>
#include <string>

namespace V2W::VCD {

/// A Token is the unit produced by the Lexer.
struct Token {
    enum class Kind {
        /// A '$' keyword: $scope, $var, $dumpvars, ... The keyword name,
        /// without the '$', is in text.
        COMMAND_START,
        /// The $end keyword closing a command or a dump section.
        COMMAND_END,
        /// A word inside a command, in text.
        IDENTIFIER,
        /// A '#' time marker, with its value in time.
        TIME_MARKER,
        /// A 1-bit value change: the value symbol is in text, the identifier
        /// code in code.
        SCALAR_VALUE_CHANGE,
        /// A 'b' value change: the bits (without the 'b') are in text, the
        /// identifier code in code.
        VECTOR_VALUE_CHANGE,
        /// An 'r' value change: the number (without the 'r') is in text, the
        /// identifier code in code.
        REAL_VALUE_CHANGE,
        END_OF_INPUT
    };

    Kind kind = Kind::END_OF_INPUT;
    std::string text;
    std::string code;
    TimeTy time = 0;
    SourceLocation location;

    bool is(Kind k) const { return kind == k; }
    bool isValueChange() const {
        return kind == Kind::SCALAR_VALUE_CHANGE ||
               kind == Kind::VECTOR_VALUE_CHANGE ||
               kind == Kind::REAL_VALUE_CHANGE;
    }
    bool isCommand(const char *keyword) const {
        return kind == Kind::COMMAND_START && text == keyword;
    }

    static const char *getKindName(Kind k);
};

/// The Lexer splits a VCD stream into Tokens. It reads its input
/// incrementally, with a single forward cursor: it can not seek, and can only
/// be restarted by constructing a new Lexer on a new stream.
///
/// Words inside the $dumpvars, $dumpall, $dumpon and $dumpoff sections, as
/// well as words outside of any command, are value changes or time markers.
/// Words inside any other command are identifiers.
class Lexer {
  public:
    Lexer() = delete;
    Lexer(const Lexer &) = delete;
    Lexer &operator=(const Lexer &) = delete;

    /// Construct a Lexer reading from \p is. \p is must outlive the Lexer.
    explicit Lexer(std::istream &is) : is(is) {}

    /// Get the next token from the input stream. Once END_OF_INPUT has been
    /// returned, all subsequent calls return END_OF_INPUT.
    ///
    /// Throws an Error of kind MALFORMED_SYNTAX on malformed input.
    Token next();

    /// Get the location of the cursor in the input stream.
    SourceLocation getLocation() const {
        return SourceLocation(lineNumber, byteOffset);
    }

    /// Are we inside a command ?
    bool inCommand() const { return !command.empty(); }
    /// Are we inside a dump section ?
    bool inDumpSection() const { return !dumpSection.empty(); }

    /// Is \p keyword one of the dump section keywords ?
    static bool isDumpKeyword(const std::string &keyword);

  private:
    std::istream &is;
    size_t lineNumber = 1;
    size_t byteOffset = 0;
    bool atEnd = false;
    // The keyword of the command being lexed, if any.
    std::string command;
    // The keyword of the dump section being lexed, if any.
    std::string dumpSection;

    int getChar();
    int peekChar();

    /// Read the next whitespace separated word, recording where it started in
    /// \p loc. Returns false at the end of the input.
    bool getWord(std::string &word, SourceLocation &loc);

    Token lexCommandWord(std::string &&word, const SourceLocation &loc);
    Token lexKeyword(std::string &&word, const SourceLocation &loc);
    Token lexValueChange(std::string &&word, const SourceLocation &loc);

    [[noreturn]] void reportError(const std::string &msg,
                                  const SourceLocation &loc) const;
};

} // namespace V2W::VCD
