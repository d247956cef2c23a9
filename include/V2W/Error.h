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

#include <cstddef>
#include <initializer_list>
#include <sstream>
#include <stdexcept>
#include <string>

namespace V2W {

std::string concat(std::initializer_list<std::string> strings);

template <typename Ty> std::string getAsString(Ty v) {
    std::ostringstream oss;
    oss << v;
    return oss.str();
}

template <typename... Args> std::string concat(const Args &...args) {
    return concat({getAsString(args)...});
}

void errorImpl(std::string &&msg, const char *function, const char *sourcefile,
               unsigned sourceline);
void fatalImpl(std::string &&msg, const char *function, const char *sourcefile,
               unsigned sourceline) __attribute__((noreturn));

/// The different kinds of errors that can be reported when reading a VCD file
/// or when extracting waves from it.
enum class ErrorKind {
    MALFORMED_SYNTAX,
    UNBALANCED_SCOPE,
    INVALID_WIDTH,
    INVALID_VALUE_SYMBOL,
    UNKNOWN_IDENTIFIER,
    UNKNOWN_SIGNAL,
    INVALID_WINDOW,
    NO_SIGNALS_REQUESTED
};

/// Get a printable name for error kind \p kind.
const char *getErrorKindName(ErrorKind kind);

/// Where, in the input stream, an error was detected. Line numbers start at 1,
/// a line number of 0 means no location is available.
struct SourceLocation {
    size_t line = 0;
    size_t offset = 0;

    SourceLocation() = default;
    SourceLocation(size_t line, size_t offset) : line(line), offset(offset) {}

    bool valid() const { return line != 0; }
};

/// The Error exception is thrown by the VCD reading and wave extraction
/// routines for all fatal errors.
class Error : public std::runtime_error {
  public:
    Error(ErrorKind kind, const std::string &msg,
          const SourceLocation &loc = SourceLocation())
        : std::runtime_error(format(kind, msg, loc)), kind(kind),
          location(loc), message(msg) {}

    ErrorKind getKind() const { return kind; }
    bool hasLocation() const { return location.valid(); }
    const SourceLocation &getLocation() const { return location; }

    /// Get the error message, without the kind and location decorations.
    const std::string &getMessage() const { return message; }

    static std::string format(ErrorKind kind, const std::string &msg,
                              const SourceLocation &loc);

  private:
    ErrorKind kind;
    SourceLocation location;
    std::string message;
};

} // namespace V2W

#define die(...)                                                               \
    V2W::fatalImpl(V2W::concat("Fatal: ", __VA_ARGS__), __PRETTY_FUNCTION__,   \
                   __FILE__, __LINE__)

#define error(...)                                                             \
    V2W::errorImpl(V2W::concat("Error: ", __VA_ARGS__), __PRETTY_FUNCTION__,   \
                   __FILE__, __LINE__)

#define warn(...)                                                              \
    V2W::errorImpl(V2W::concat("Warning: ", __VA_ARGS__), __PRETTY_FUNCTION__, \
                   __FILE__, __LINE__)
