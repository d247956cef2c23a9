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

#include "V2W/VCD/Lexer.h"
#include "V2W/Error.h"

#include <cctype>
#include <istream>
#include <stdexcept>
#include <string>
#include <utility>

using std::string;

namespace {
bool isStructuralCommand(const string &keyword) {
    return keyword == "scope" || keyword == "upscope" || keyword == "var" ||
           keyword == "timescale" || keyword == "enddefinitions";
}

// '$' is a valid identifier code character: only the standard keywords can
// be recognized as such inside a command.
bool isStandardKeyword(const string &keyword) {
    return isStructuralCommand(keyword) ||
           V2W::VCD::Lexer::isDumpKeyword(keyword) || keyword == "comment" ||
           keyword == "date" || keyword == "version";
}

bool isDigits(const string &str, size_t from) {
    if (from >= str.size())
        return false;
    for (size_t i = from; i < str.size(); i++)
        if (!std::isdigit(static_cast<unsigned char>(str[i])))
            return false;
    return true;
}
} // namespace

namespace V2W::VCD {

const char *Token::getKindName(Kind k) {
    switch (k) {
    case Kind::COMMAND_START:
        return "command start";
    case Kind::COMMAND_END:
        return "$end";
    case Kind::IDENTIFIER:
        return "identifier";
    case Kind::TIME_MARKER:
        return "time marker";
    case Kind::SCALAR_VALUE_CHANGE:
        return "scalar value change";
    case Kind::VECTOR_VALUE_CHANGE:
        return "vector value change";
    case Kind::REAL_VALUE_CHANGE:
        return "real value change";
    case Kind::END_OF_INPUT:
        return "end of input";
    }
    return "unknown token";
}

bool Lexer::isDumpKeyword(const string &keyword) {
    return keyword == "dumpvars" || keyword == "dumpall" ||
           keyword == "dumpon" || keyword == "dumpoff";
}

void Lexer::reportError(const string &msg, const SourceLocation &loc) const {
    throw Error(ErrorKind::MALFORMED_SYNTAX, msg, loc);
}

int Lexer::getChar() {
    const int c = is.get();
    if (c == std::istream::traits_type::eof())
        return c;
    byteOffset += 1;
    if (c == '\n')
        lineNumber += 1;
    return c;
}

int Lexer::peekChar() { return is.peek(); }

bool Lexer::getWord(string &word, SourceLocation &loc) {
    const int eof = std::istream::traits_type::eof();

    int c = getChar();
    while (c != eof && std::isspace(c))
        c = getChar();
    if (c == eof)
        return false;

    loc = SourceLocation(lineNumber, byteOffset - 1);
    word.clear();
    word += char(c);
    while (peekChar() != eof && !std::isspace(peekChar()))
        word += char(getChar());

    return true;
}

Token Lexer::next() {
    Token T;
    if (atEnd) {
        T.location = getLocation();
        return T;
    }

    string word;
    SourceLocation loc;
    if (!getWord(word, loc)) {
        atEnd = true;
        if (inCommand())
            reportError("unterminated $" + command + " command",
                        getLocation());
        if (inDumpSection())
            reportError("unterminated $" + dumpSection + " section",
                        getLocation());
        T.kind = Token::Kind::END_OF_INPUT;
        T.location = getLocation();
        return T;
    }

    if (inCommand())
        return lexCommandWord(std::move(word), loc);
    if (word[0] == '$')
        return lexKeyword(std::move(word), loc);
    return lexValueChange(std::move(word), loc);
}

Token Lexer::lexCommandWord(string &&word, const SourceLocation &loc) {
    Token T;
    T.location = loc;

    if (word == "$end") {
        command.clear();
        T.kind = Token::Kind::COMMAND_END;
        return T;
    }

    // Free text commands ($comment, $date, ...) may contain anything, but
    // a keyword in a structural command means its $end is missing.
    if (word[0] == '$' && isStructuralCommand(command) &&
        isStandardKeyword(word.substr(1)))
        reportError("unterminated $" + command + " command (found '" + word +
                        "')",
                    loc);

    T.kind = Token::Kind::IDENTIFIER;
    T.text = std::move(word);
    return T;
}

Token Lexer::lexKeyword(string &&word, const SourceLocation &loc) {
    Token T;
    T.location = loc;

    if (word == "$end") {
        if (!inDumpSection())
            reportError("unexpected $end", loc);
        dumpSection.clear();
        T.kind = Token::Kind::COMMAND_END;
        return T;
    }

    string keyword = word.substr(1);
    if (keyword.empty())
        reportError("empty keyword", loc);

    if (isDumpKeyword(keyword)) {
        if (inDumpSection())
            reportError("$" + keyword + " section inside a $" + dumpSection +
                            " section",
                        loc);
        dumpSection = keyword;
    } else {
        if (inDumpSection() && keyword != "comment")
            reportError("unterminated $" + dumpSection + " section (found '" +
                            word + "')",
                        loc);
        command = keyword;
    }

    T.kind = Token::Kind::COMMAND_START;
    T.text = std::move(keyword);
    return T;
}

Token Lexer::lexValueChange(string &&word, const SourceLocation &loc) {
    Token T;
    T.location = loc;

    switch (word[0]) {
    case '#': {
        if (!isDigits(word, 1))
            reportError("invalid time marker '" + word + "'", loc);
        try {
            T.time = std::stoull(word.substr(1), nullptr, 10);
        } catch (const std::out_of_range &) {
            reportError("out of range time marker '" + word + "'", loc);
        }
        T.kind = Token::Kind::TIME_MARKER;
        return T;
    }
    case 'b':
    case 'B':
    case 'r':
    case 'R': {
        const bool isReal = word[0] == 'r' || word[0] == 'R';
        if (word.size() < 2)
            reportError(string("missing value in ") +
                            (isReal ? "real" : "vector") + " value change",
                        loc);
        SourceLocation codeLoc;
        if (!getWord(T.code, codeLoc)) {
            atEnd = true;
            reportError("missing identifier code after value '" + word + "'",
                        getLocation());
        }
        T.kind = isReal ? Token::Kind::REAL_VALUE_CHANGE
                        : Token::Kind::VECTOR_VALUE_CHANGE;
        T.text = word.substr(1);
        return T;
    }
    default:
        if (word.size() < 2)
            reportError("missing identifier code in value change '" + word +
                            "'",
                        loc);
        T.kind = Token::Kind::SCALAR_VALUE_CHANGE;
        T.text = word.substr(0, 1);
        T.code = word.substr(1);
        return T;
    }
}

} // namespace V2W::VCD
