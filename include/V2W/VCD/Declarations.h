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

#include "V2W/VCD/Lexer.h"

#include <cstddef>
#include <memory>
#include <ostream>
#include <string>
#include <unordered_map>
#include <vector>

namespace V2W::VCD {

/// The SignalDefinition class describes a signal declared with $var in the
/// VCD header.
class SignalDefinition {
  public:
    enum class Kind { WIRE, REG, PARAMETER, INTEGER, REAL, EVENT, TIME };

    SignalDefinition(const std::vector<std::string> &path,
                     const std::string &code, size_t width, Kind kind,
                     const std::string &range = "")
        : path(path), code(code), range(range), width(width), kind(kind) {}

    SignalDefinition() = delete;
    SignalDefinition(const SignalDefinition &) = default;
    SignalDefinition(SignalDefinition &&) = default;
    SignalDefinition &operator=(const SignalDefinition &) = default;
    SignalDefinition &operator=(SignalDefinition &&) = default;

    /// Get the scope names followed by the signal name.
    const std::vector<std::string> &getPath() const { return path; }
    /// Get the signal name, i.e. the last component of its path.
    const std::string &getName() const { return path.back(); }
    /// Get the full path name, with '/' separated components.
    std::string getFullName() const;
    /// Get the full name of the enclosing scope, or an empty string for
    /// signals declared at the top level.
    std::string getScopeName() const;

    const std::string &getIdCode() const { return code; }
    size_t getWidth() const { return width; }
    Kind getKind() const { return kind; }

    /// Get the bit range (e.g. "[7:0]") if one was declared.
    const std::string &getRange() const { return range; }
    bool hasRange() const { return !range.empty(); }

    bool isReal() const { return kind == Kind::REAL; }
    bool isScalar() const { return width == 1 && !isReal(); }

    static const char *getKindName(Kind kind);

    /// Map VCD variable type \p type to a Kind. Returns false if \p type is
    /// not a known variable type.
    static bool getKind(const std::string &type, Kind &kind);

    bool operator==(const SignalDefinition &RHS) const {
        return path == RHS.path && code == RHS.code && width == RHS.width &&
               kind == RHS.kind && range == RHS.range;
    }
    bool operator!=(const SignalDefinition &RHS) const {
        return !(*this == RHS);
    }

    void dump(std::ostream &os) const;

  private:
    std::vector<std::string> path;
    std::string code;
    std::string range;
    size_t width;
    Kind kind;
};

/// The Timescale class records the $timescale declaration: a multiplier (1,
/// 10 or 100) and a unit (s, ms, us, ns, ps or fs).
class Timescale {
  public:
    Timescale() : multiplier(1), unit("s") {}
    Timescale(unsigned multiplier, const std::string &unit)
        : multiplier(multiplier), unit(unit) {}

    unsigned getMultiplier() const { return multiplier; }
    const std::string &getUnit() const { return unit; }

    /// Get the timescale as a power of 10 exponent, e.g. -9 for "1 ns" or -11
    /// for "10 ps".
    int getExponent() const;

    std::string str() const;

    /// Parse a timescale in \p str ("1ns", "10 ps", ...) into \p ts. Returns
    /// false if \p str is not a valid timescale.
    static bool parse(const std::string &str, Timescale &ts);

    bool operator==(const Timescale &RHS) const {
        return multiplier == RHS.multiplier && unit == RHS.unit;
    }

  private:
    unsigned multiplier;
    std::string unit;
};

/// The Scope class is a node in the VCD hierarchy, only used for hierarchy
/// aware listings. It owns its sub-scopes, and refers to its signals by their
/// index in the Declarations.
class Scope {
  public:
    enum class Kind {
        MODULE,
        TASK,
        FUNCTION,
        BEGIN,
        FORK,
        BLOCK,
        GENERATE,
        STRUCT,
        UNION,
        CLASS,
        INTERFACE,
        PACKAGE,
        PROGRAM
    };

    /// Construct the root scope.
    Scope() : name("(root)"), subScopes(), signals(), kind(Kind::MODULE), root(true) {}
    Scope(const std::string &name, Kind kind)
        : name(name), subScopes(), signals(), kind(kind), root(false) {}

    Scope(const Scope &) = delete;
    Scope &operator=(const Scope &) = delete;

    bool isRoot() const { return root; }
    const std::string &getName() const { return name; }
    Kind getKind() const { return kind; }

    size_t getNumSubScopes() const { return subScopes.size(); }
    size_t getNumSignals() const { return signals.size(); }
    bool hasSubScopes() const { return !subScopes.empty(); }
    bool hasSignals() const { return !signals.empty(); }

    const Scope &getSubScope(size_t i) const { return *subScopes[i]; }
    /// Get the index, in the Declarations, of the i-th signal of this scope.
    size_t getSignal(size_t i) const { return signals[i]; }

    /// Find sub-scope \p subScopeName, or nullptr if there is none.
    Scope *findSubScope(const std::string &subScopeName);

    /// Add a sub-scope to this scope. VCD allows a scope to be entered more
    /// than once: if a sub-scope with the same name already exists, it is
    /// returned instead.
    Scope &addScope(const std::string &scopeName, Kind scopeKind);

    void addSignal(size_t idx) { signals.push_back(idx); }

    static const char *getKindName(Kind kind);

    /// Map VCD scope type \p type to a Kind. Returns false if \p type is not
    /// a known scope type.
    static bool getKind(const std::string &type, Kind &kind);

  private:
    std::string name;
    std::vector<std::unique_ptr<Scope>> subScopes;
    std::vector<size_t> signals;
    Kind kind;
    bool root;
};

/// The Declarations class is the outcome of parsing a VCD header: the table of
/// all signal definitions, with lookups by identifier code and by path, the
/// header metadata and optionally the scope hierarchy.
class Declarations {
  public:
    /// The Visitor class is used to traverse the scope hierarchy.
    class Visitor {
      public:
        Visitor() = default;
        virtual ~Visitor();

        virtual void enterScope(const Scope &scope) = 0;
        virtual void leaveScope(const Scope &scope) = 0;
        virtual void visitSignal(const SignalDefinition &SD) = 0;
    };

    Declarations() = default;
    Declarations(const Declarations &) = delete;
    Declarations(Declarations &&) = default;
    Declarations &operator=(const Declarations &) = delete;
    Declarations &operator=(Declarations &&) = default;

    size_t getNumSignals() const { return signals.size(); }
    const std::vector<SignalDefinition> &getSignals() const { return signals; }
    const SignalDefinition &operator[](size_t i) const { return signals[i]; }

    /// Get the number of distinct identifier codes.
    size_t getNumCodes() const { return codes.size(); }
    bool hasCode(const std::string &code) const { return codes.count(code); }

    /// Get the indexes of all the signals sharing identifier \p code, or
    /// nullptr if \p code was not declared.
    const std::vector<size_t> *findCode(const std::string &code) const;

    /// Find the signal with path \p path. Leading and trailing '/' in path are
    /// ignored. Returns nullptr if no such signal exists.
    const SignalDefinition *findSignal(const std::string &path) const;

    bool hasTimescale() const { return timescaleSet; }
    const Timescale &getTimescale() const { return timescale; }

    bool hasDate() const { return !date.empty(); }
    const std::string &getDate() const { return date; }
    bool hasVersion() const { return !version.empty(); }
    const std::string &getVersion() const { return version; }
    bool hasComment() const { return !comment.empty(); }
    const std::string &getComment() const { return comment; }

    /// Was the scope hierarchy retained ?
    bool hasHierarchy() const { return static_cast<bool>(root); }
    const Scope &getRootScope() const { return *root; }

    /// Traverse the scope hierarchy. The hierarchy must have been retained.
    void visit(Visitor &V) const;

    void dump(std::ostream &os) const;

  private:
    friend class DeclarationBuilder;

    std::vector<SignalDefinition> signals;
    std::unordered_map<std::string, std::vector<size_t>> codes;
    std::unordered_map<std::string, size_t> paths;
    std::unique_ptr<Scope> root;
    Timescale timescale;
    bool timescaleSet = false;
    std::string date;
    std::string version;
    std::string comment;

    void visit(Visitor &V, const Scope &S) const;
};

/// The DeclarationBuilder consumes the tokens of the VCD header, up to and
/// including "$enddefinitions $end", to build the Declarations. It is a one
/// shot object: build can only be called once.
class DeclarationBuilder {
  public:
    DeclarationBuilder() = delete;
    DeclarationBuilder(const DeclarationBuilder &) = delete;
    DeclarationBuilder &operator=(const DeclarationBuilder &) = delete;

    /// Construct a builder pulling tokens from \p lexer. If \p keepHierarchy
    /// is set, the scope tree is retained in the Declarations.
    DeclarationBuilder(Lexer &lexer, bool keepHierarchy = false)
        : lexer(lexer), keepHierarchy(keepHierarchy) {}

    /// Parse the header and return the Declarations. Throws an Error on
    /// malformed headers.
    Declarations build();

  private:
    Lexer &lexer;
    bool keepHierarchy;
    bool built = false;

    Declarations decls;
    // The names of the currently open scopes.
    std::vector<std::string> scopeNames;
    // The currently open scopes, when the hierarchy is kept.
    std::vector<Scope *> scopeStack;

    /// Collect all identifiers up to the command's $end.
    std::vector<Token> getCommandWords();
    std::string getCommandText();

    void parseTimescale(const Token &start);
    void parseScope(const Token &start);
    void parseUpscope(const Token &start);
    void parseVar(const Token &start);
};

} // namespace V2W::VCD
