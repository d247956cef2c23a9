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

#include "V2W/Error.h"

#include <cstdlib>
#include <iostream>

using std::cerr;
using std::string;

namespace V2W {

string concat(std::initializer_list<string> strings) {
    string str = "";
    for (const auto &s : strings)
        str += s;
    return str;
}

void errorImpl(string &&msg, const char *function, const char *sourcefile,
               unsigned sourceline) {
    cerr << msg << " in " << function << " (" << sourcefile << ':' << sourceline
         << ")\n";
}

void fatalImpl(string &&msg, const char *function, const char *sourcefile,
               unsigned sourceline) {
    cerr << msg << " in " << function << " (" << sourcefile << ':' << sourceline
         << ")\n";
    exit(EXIT_FAILURE);
}

const char *getErrorKindName(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::MALFORMED_SYNTAX:
        return "malformed syntax";
    case ErrorKind::UNBALANCED_SCOPE:
        return "unbalanced scope";
    case ErrorKind::INVALID_WIDTH:
        return "invalid width";
    case ErrorKind::INVALID_VALUE_SYMBOL:
        return "invalid value symbol";
    case ErrorKind::UNKNOWN_IDENTIFIER:
        return "unknown identifier";
    case ErrorKind::UNKNOWN_SIGNAL:
        return "unknown signal";
    case ErrorKind::INVALID_WINDOW:
        return "invalid window";
    case ErrorKind::NO_SIGNALS_REQUESTED:
        return "no signals requested";
    }
    return "unknown error";
}

string Error::format(ErrorKind kind, const string &msg,
                     const SourceLocation &loc) {
    string str = concat(getErrorKindName(kind), ": ", msg);
    if (loc.valid())
        str += concat(" (line ", loc.line, ", offset ", loc.offset, ")");
    return str;
}

} // namespace V2W
