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

#include "V2W/VCD/Declarations.h"
#include "V2W/Error.h"
#include "V2W/utils/Misc.h"

#include <cctype>
#include <cmath>
#include <memory>
#include <ostream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

using std::log10;
using std::ostream;
using std::string;
using std::vector;

namespace {
bool isNumber(const string &str) {
    if (str.empty())
        return false;
    for (const char c : str)
        if (!std::isdigit(static_cast<unsigned char>(c)))
            return false;
    return true;
}
} // namespace

namespace V2W::VCD {

// ===================================================================
// SignalDefinition
// -------------------------------------------------------------------
string SignalDefinition::getFullName() const { return join('/', path); }

string SignalDefinition::getScopeName() const {
    return join('/', vector<string>(path.begin(), path.end() - 1));
}

const char *SignalDefinition::getKindName(Kind kind) {
    switch (kind) {
    case Kind::WIRE:
        return "wire";
    case Kind::REG:
        return "reg";
    case Kind::PARAMETER:
        return "parameter";
    case Kind::INTEGER:
        return "integer";
    case Kind::REAL:
        return "real";
    case Kind::EVENT:
        return "event";
    case Kind::TIME:
        return "time";
    }
    return "unknown";
}

bool SignalDefinition::getKind(const string &type, Kind &kind) {
    if (type == "wire" || type == "tri" || type == "tri0" || type == "tri1" ||
        type == "triand" || type == "trior" || type == "trireg" ||
        type == "wand" || type == "wor" || type == "supply0" ||
        type == "supply1" || type == "uwire")
        kind = Kind::WIRE;
    else if (type == "reg" || type == "logic" || type == "bit")
        kind = Kind::REG;
    else if (type == "parameter")
        kind = Kind::PARAMETER;
    else if (type == "integer" || type == "int" || type == "shortint" ||
             type == "longint" || type == "byte")
        kind = Kind::INTEGER;
    else if (type == "real" || type == "realtime" || type == "shortreal")
        kind = Kind::REAL;
    else if (type == "event")
        kind = Kind::EVENT;
    else if (type == "time")
        kind = Kind::TIME;
    else
        return false;
    return true;
}

void SignalDefinition::dump(ostream &os) const {
    os << "Name: " << getFullName() << ", Kind: " << getKindName(kind);
    os << ", Width: " << width;
    if (hasRange())
        os << ", Range: " << range;
    os << ", IdCode: " << code << '\n';
}

// ===================================================================
// Timescale
// -------------------------------------------------------------------
int Timescale::getExponent() const {
    int ts = log10(multiplier);
    if (unit == "ms")
        ts -= 3;
    else if (unit == "us")
        ts -= 6;
    else if (unit == "ns")
        ts -= 9;
    else if (unit == "ps")
        ts -= 12;
    else if (unit == "fs")
        ts -= 15;
    return ts;
}

string Timescale::str() const { return concat(multiplier, ' ', unit); }

bool Timescale::parse(const string &str, Timescale &ts) {
    size_t i = 0;
    while (i < str.size() && std::isdigit(static_cast<unsigned char>(str[i])))
        i++;
    const string mult = str.substr(0, i);
    while (i < str.size() && std::isspace(static_cast<unsigned char>(str[i])))
        i++;
    const string unit = str.substr(i);

    unsigned m;
    if (mult == "1")
        m = 1;
    else if (mult == "10")
        m = 10;
    else if (mult == "100")
        m = 100;
    else
        return false;

    if (unit != "s" && unit != "ms" && unit != "us" && unit != "ns" &&
        unit != "ps" && unit != "fs")
        return false;

    ts = Timescale(m, unit);
    return true;
}

// ===================================================================
// Scope
// -------------------------------------------------------------------
Scope *Scope::findSubScope(const string &subScopeName) {
    for (auto &s : subScopes)
        if (s->getName() == subScopeName)
            return s.get();
    return nullptr;
}

Scope &Scope::addScope(const string &scopeName, Kind scopeKind) {
    if (Scope *s = findSubScope(scopeName))
        return *s;
    subScopes.emplace_back(new Scope(scopeName, scopeKind));
    return *subScopes.back();
}

const char *Scope::getKindName(Kind kind) {
    switch (kind) {
    case Kind::MODULE:
        return "module";
    case Kind::TASK:
        return "task";
    case Kind::FUNCTION:
        return "function";
    case Kind::BEGIN:
        return "begin";
    case Kind::FORK:
        return "fork";
    case Kind::BLOCK:
        return "block";
    case Kind::GENERATE:
        return "generate";
    case Kind::STRUCT:
        return "struct";
    case Kind::UNION:
        return "union";
    case Kind::CLASS:
        return "class";
    case Kind::INTERFACE:
        return "interface";
    case Kind::PACKAGE:
        return "package";
    case Kind::PROGRAM:
        return "program";
    }
    return "unknown";
}

bool Scope::getKind(const string &type, Kind &kind) {
    static const Kind kinds[] = {
        Kind::MODULE,   Kind::TASK,   Kind::FUNCTION,  Kind::BEGIN,
        Kind::FORK,     Kind::BLOCK,  Kind::GENERATE,  Kind::STRUCT,
        Kind::UNION,    Kind::CLASS,  Kind::INTERFACE, Kind::PACKAGE,
        Kind::PROGRAM};
    for (const Kind k : kinds)
        if (type == getKindName(k)) {
            kind = k;
            return true;
        }
    return false;
}

// ===================================================================
// Declarations
// -------------------------------------------------------------------
Declarations::Visitor::~Visitor() {}

const vector<size_t> *Declarations::findCode(const string &code) const {
    const auto it = codes.find(code);
    if (it == codes.end())
        return nullptr;
    return &it->second;
}

const SignalDefinition *Declarations::findSignal(const string &path) const {
    const auto it = paths.find(normalizePath(path));
    if (it == paths.end())
        return nullptr;
    return &signals[it->second];
}

void Declarations::visit(Visitor &V) const {
    if (!hasHierarchy())
        die("the scope hierarchy was not retained");
    visit(V, *root);
}

void Declarations::visit(Visitor &V, const Scope &S) const {
    if (!S.isRoot())
        V.enterScope(S);
    for (size_t i = 0; i < S.getNumSignals(); i++)
        V.visitSignal(signals[S.getSignal(i)]);
    for (size_t i = 0; i < S.getNumSubScopes(); i++)
        visit(V, S.getSubScope(i));
    if (!S.isRoot())
        V.leaveScope(S);
}

void Declarations::dump(ostream &os) const {
    if (hasDate())
        os << "Date: " << date << '\n';
    if (hasVersion())
        os << "Version: " << version << '\n';
    if (hasTimescale())
        os << "Timescale: " << timescale.str() << '\n';
    os << "Signals: " << signals.size() << " (" << codes.size()
       << " identifier codes)\n";
    for (const auto &SD : signals)
        SD.dump(os);
}

// ===================================================================
// DeclarationBuilder
// -------------------------------------------------------------------
vector<Token> DeclarationBuilder::getCommandWords() {
    vector<Token> words;
    while (true) {
        Token T = lexer.next();
        switch (T.kind) {
        case Token::Kind::IDENTIFIER:
            words.push_back(std::move(T));
            break;
        case Token::Kind::COMMAND_END:
            return words;
        default:
            die("unexpected ", Token::getKindName(T.kind), " inside a command");
        }
    }
}

string DeclarationBuilder::getCommandText() {
    vector<string> words;
    for (auto &T : getCommandWords())
        words.push_back(std::move(T.text));
    return join(' ', words);
}

void DeclarationBuilder::parseTimescale(const Token &start) {
    string str;
    for (const auto &T : getCommandWords())
        str += T.text;
    Timescale ts;
    if (!Timescale::parse(str, ts))
        throw Error(ErrorKind::MALFORMED_SYNTAX,
                    "invalid timescale '" + str + "'", start.location);
    decls.timescale = ts;
    decls.timescaleSet = true;
}

void DeclarationBuilder::parseScope(const Token &start) {
    const vector<Token> words = getCommandWords();
    if (words.size() != 2)
        throw Error(ErrorKind::MALFORMED_SYNTAX,
                    "$scope expects a kind and a name", start.location);

    Scope::Kind kind;
    if (!Scope::getKind(words[0].text, kind))
        throw Error(ErrorKind::MALFORMED_SYNTAX,
                    "unknown scope kind '" + words[0].text + "'",
                    words[0].location);

    scopeNames.push_back(words[1].text);
    if (keepHierarchy)
        scopeStack.push_back(&scopeStack.back()->addScope(words[1].text, kind));
}

void DeclarationBuilder::parseUpscope(const Token &start) {
    if (!getCommandWords().empty())
        throw Error(ErrorKind::MALFORMED_SYNTAX,
                    "unexpected content in $upscope", start.location);
    if (scopeNames.empty())
        throw Error(ErrorKind::UNBALANCED_SCOPE, "$upscope without a $scope",
                    start.location);
    scopeNames.pop_back();
    if (keepHierarchy)
        scopeStack.pop_back();
}

void DeclarationBuilder::parseVar(const Token &start) {
    const vector<Token> words = getCommandWords();
    if (words.size() < 4)
        throw Error(ErrorKind::MALFORMED_SYNTAX,
                    "$var expects a type, a width, an identifier code and a "
                    "name",
                    start.location);

    SignalDefinition::Kind kind;
    if (!SignalDefinition::getKind(words[0].text, kind))
        throw Error(ErrorKind::MALFORMED_SYNTAX,
                    "unknown variable type '" + words[0].text + "'",
                    words[0].location);

    const Token &W = words[1];
    if (W.text.size() > 1 && W.text[0] == '-' && isNumber(W.text.substr(1)))
        throw Error(ErrorKind::INVALID_WIDTH,
                    "negative width '" + W.text + "'", W.location);
    if (!isNumber(W.text))
        throw Error(ErrorKind::MALFORMED_SYNTAX,
                    "invalid width '" + W.text + "'", W.location);
    size_t width;
    try {
        width = std::stoull(W.text, nullptr, 10);
    } catch (const std::out_of_range &) {
        throw Error(ErrorKind::INVALID_WIDTH,
                    "out of range width '" + W.text + "'", W.location);
    }
    if (width == 0)
        throw Error(ErrorKind::INVALID_WIDTH, "zero width", W.location);

    const string &code = words[2].text;

    // The bit range may be glued to the name or be split in several words.
    string range;
    for (size_t i = 4; i < words.size(); i++)
        range += words[i].text;

    vector<string> path(scopeNames);
    path.push_back(words[3].text);

    const size_t idx = decls.signals.size();
    auto &aliases = decls.codes[code];
    if (!aliases.empty() && decls.signals[aliases[0]].getWidth() != width)
        throw Error(ErrorKind::INVALID_WIDTH,
                    concat("width ", width, " of '", join('/', path),
                           "' does not match the width ",
                           decls.signals[aliases[0]].getWidth(),
                           " of its alias '",
                           decls.signals[aliases[0]].getFullName(), "'"),
                    start.location);
    aliases.push_back(idx);

    const string fullName = normalizePath(join('/', path));
    if (!decls.paths.emplace(fullName, idx).second)
        warn("signal '", fullName,
             "' is declared more than once, only the first declaration will "
             "be used for lookups");

    if (keepHierarchy)
        scopeStack.back()->addSignal(idx);

    decls.signals.emplace_back(path, code, width, kind, range);
}

Declarations DeclarationBuilder::build() {
    if (built)
        die("the declarations have already been built");
    built = true;

    if (keepHierarchy) {
        decls.root.reset(new Scope());
        scopeStack.push_back(decls.root.get());
    }

    while (true) {
        const Token T = lexer.next();
        switch (T.kind) {
        case Token::Kind::END_OF_INPUT:
            throw Error(ErrorKind::MALFORMED_SYNTAX,
                        "end of input before $enddefinitions", T.location);
        case Token::Kind::TIME_MARKER:
        case Token::Kind::SCALAR_VALUE_CHANGE:
        case Token::Kind::VECTOR_VALUE_CHANGE:
        case Token::Kind::REAL_VALUE_CHANGE:
            throw Error(ErrorKind::MALFORMED_SYNTAX,
                        concat(Token::getKindName(T.kind),
                               " before $enddefinitions"),
                        T.location);
        case Token::Kind::IDENTIFIER:
        case Token::Kind::COMMAND_END:
            throw Error(ErrorKind::MALFORMED_SYNTAX,
                        concat("unexpected ", Token::getKindName(T.kind)),
                        T.location);
        case Token::Kind::COMMAND_START:
            break;
        }

        if (Lexer::isDumpKeyword(T.text))
            throw Error(ErrorKind::MALFORMED_SYNTAX,
                        "$" + T.text + " section before $enddefinitions",
                        T.location);

        if (T.text == "scope")
            parseScope(T);
        else if (T.text == "upscope")
            parseUpscope(T);
        else if (T.text == "var")
            parseVar(T);
        else if (T.text == "timescale")
            parseTimescale(T);
        else if (T.text == "date")
            decls.date = getCommandText();
        else if (T.text == "version")
            decls.version = getCommandText();
        else if (T.text == "comment") {
            const string text = getCommandText();
            if (!decls.comment.empty() && !text.empty())
                decls.comment += '\n';
            decls.comment += text;
        } else if (T.text == "enddefinitions") {
            if (!getCommandWords().empty())
                throw Error(ErrorKind::MALFORMED_SYNTAX,
                            "unexpected content in $enddefinitions",
                            T.location);
            if (!scopeNames.empty())
                throw Error(ErrorKind::UNBALANCED_SCOPE,
                            concat(scopeNames.size(),
                                   " scope(s) still open at $enddefinitions"),
                            T.location);
            return std::move(decls);
        } else {
            warn("skipping unknown header command $", T.text);
            getCommandWords();
        }
    }
}

} // namespace V2W::VCD
