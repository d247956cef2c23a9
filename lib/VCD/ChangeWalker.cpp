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

#include "V2W/VCD/ChangeWalker.h"
#include "V2W/Error.h"

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

using std::string;
using std::vector;

namespace {
bool isDeclarationCommand(const string &keyword) {
    return keyword == "scope" || keyword == "upscope" || keyword == "var" ||
           keyword == "timescale" || keyword == "enddefinitions";
}
} // namespace

namespace V2W::VCD {

const SignalValue *ChangeWalker::getValue(const string &code) const {
    const auto it = state.find(code);
    if (it == state.end())
        return nullptr;
    return &it->second;
}

void ChangeWalker::skipCommand() {
    while (true) {
        const Token T = lexer.next();
        if (T.is(Token::Kind::COMMAND_END))
            return;
        if (!T.is(Token::Kind::IDENTIFIER))
            die("unexpected ", Token::getKindName(T.kind),
                " inside a command");
    }
}

SignalValue ChangeWalker::decode(const Token &T,
                                 const SignalDefinition &SD) const {
    switch (T.kind) {
    case Token::Kind::SCALAR_VALUE_CHANGE:
    case Token::Kind::VECTOR_VALUE_CHANGE: {
        if (SD.isReal())
            throw Error(ErrorKind::MALFORMED_SYNTAX,
                        "bit value change for real signal '" +
                            SD.getFullName() + "'",
                        T.location);
        BitVector bits;
        switch (BitVector::parse(T.text, SD.getWidth(), bits)) {
        case BitVector::ParseStatus::OK:
            break;
        case BitVector::ParseStatus::INVALID_SYMBOL:
            throw Error(ErrorKind::INVALID_VALUE_SYMBOL,
                        "invalid value '" + T.text + "' for signal '" +
                            SD.getFullName() + "'",
                        T.location);
        case BitVector::ParseStatus::TOO_WIDE:
            throw Error(ErrorKind::INVALID_WIDTH,
                        concat("value '", T.text, "' does not fit in the ",
                               SD.getWidth(), " bit(s) of signal '",
                               SD.getFullName(), "'"),
                        T.location);
        }
        return SignalValue(std::move(bits));
    }
    case Token::Kind::REAL_VALUE_CHANGE: {
        if (!SD.isReal())
            throw Error(ErrorKind::MALFORMED_SYNTAX,
                        "real value change for non real signal '" +
                            SD.getFullName() + "'",
                        T.location);
        double r = 0.0;
        size_t pos = 0;
        try {
            r = std::stod(T.text, &pos);
        } catch (const std::invalid_argument &) {
            pos = 0;
        } catch (const std::out_of_range &) {
            pos = 0;
        }
        if (pos == 0 || pos != T.text.size())
            throw Error(ErrorKind::MALFORMED_SYNTAX,
                        "invalid real value '" + T.text + "'", T.location);
        return SignalValue(r);
    }
    default:
        die("not a value change token");
    }
}

bool ChangeWalker::next(ValueChangeEvent &E) {
    while (!done) {
        Token T = lexer.next();
        switch (T.kind) {
        case Token::Kind::END_OF_INPUT:
            done = true;
            return false;

        case Token::Kind::TIME_MARKER:
            if (timeSeen && T.time < currentTime)
                throw Error(ErrorKind::MALFORMED_SYNTAX,
                            concat("time marker #", T.time,
                                   " is before current time #", currentTime),
                            T.location);
            currentTime = T.time;
            timeSeen = true;
            break;

        case Token::Kind::COMMAND_START:
            // The content of dump sections comes as value changes.
            if (Lexer::isDumpKeyword(T.text))
                break;
            if (isDeclarationCommand(T.text))
                throw Error(ErrorKind::MALFORMED_SYNTAX,
                            "$" + T.text + " after $enddefinitions",
                            T.location);
            if (T.text != "comment")
                warn("skipping unknown command $", T.text);
            skipCommand();
            break;

        case Token::Kind::COMMAND_END:
            // End of a dump section.
            break;

        case Token::Kind::IDENTIFIER:
            die("unexpected identifier outside of a command");

        case Token::Kind::SCALAR_VALUE_CHANGE:
        case Token::Kind::VECTOR_VALUE_CHANGE:
        case Token::Kind::REAL_VALUE_CHANGE: {
            const vector<size_t> *aliases = decls.findCode(T.code);
            if (!aliases)
                throw Error(ErrorKind::UNKNOWN_IDENTIFIER,
                            "unknown identifier code '" + T.code + "'",
                            T.location);
            SignalValue value = decode(T, decls[aliases->front()]);
            // The state owns the value, the event gets a copy of it.
            SignalValue &slot = state[T.code];
            slot = std::move(value);
            E.time = currentTime;
            E.value = slot;
            E.code = std::move(T.code);
            E.location = T.location;
            numEvents += 1;
            return true;
        }
        }
    }
    return false;
}

} // namespace V2W::VCD
