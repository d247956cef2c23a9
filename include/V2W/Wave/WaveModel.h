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

#include "V2W/VCD/Declarations.h"
#include "V2W/VCD/Value.h"

#include <cstddef>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

namespace V2W {
namespace Wave {

using VCD::TimeTy;

/// How the value of a multi-bit signal is displayed.
enum class DisplayFormat {
    BINARY,
    SIGNED_DECIMAL,
    UNSIGNED_DECIMAL,
    HEX,
    HEX_UPPER
};

/// Get the DisplayFormat for its one character name \p c (one of 'b', 'd',
/// 'u', 'x' or 'X'). Returns false if \p c is not a format name.
bool getDisplayFormat(char c, DisplayFormat &fmt);
/// Get the one character name of \p fmt.
char getDisplayFormatChar(DisplayFormat fmt);

/// Format a fully known \p value according to \p fmt.
std::string formatValue(const VCD::BitVector &value, DisplayFormat fmt);

/// A Sample is the displayed state of a signal for one time group.
struct Sample {
    enum class Kind {
        LOGIC_0,
        LOGIC_1,
        UNKNOWN,
        HIGH_Z,
        /// A multi-bit or real value, with its formatted text in data.
        DATA,
        /// Same as the previous sample.
        CONTINUATION
    };
    enum class Edge { NONE, RISING, FALLING, CHANGE };

    Kind kind = Kind::UNKNOWN;
    Edge edge = Edge::NONE;
    std::string data;

    Sample() = default;
    Sample(Kind kind, Edge edge, const std::string &data = "")
        : kind(kind), edge(edge), data(data) {}

    static Sample continuation() {
        return Sample(Kind::CONTINUATION, Edge::NONE);
    }

    bool isContinuation() const { return kind == Kind::CONTINUATION; }
    bool hasData() const { return kind == Kind::DATA; }

    /// Get the WaveJSON character for this sample.
    char getWaveChar() const;

    bool operator==(const Sample &RHS) const {
        return kind == RHS.kind && edge == RHS.edge && data == RHS.data;
    }
    bool operator!=(const Sample &RHS) const { return !(*this == RHS); }
};

/// The SampleEncoder turns the sequence of values a signal takes at each
/// sampling instant into Samples: a value identical to the previous one
/// becomes a continuation. It is the only place where this collapsing rule
/// is implemented.
class SampleEncoder {
  public:
    SampleEncoder(size_t width, bool isReal, DisplayFormat fmt)
        : width(width), fmt(fmt), real(isReal) {}

    /// Encode \p value, the signal value for the next sampling instant.
    Sample encode(const VCD::SignalValue &value);

    /// Forget the previous value: the next sample will not be a
    /// continuation.
    void reset() { first = true; }

  private:
    size_t width;
    DisplayFormat fmt;
    bool real;
    bool first = true;
    VCD::SignalValue previous;
};

/// The SampledSignal class holds the samples of one signal.
class SampledSignal {
  public:
    SampledSignal(const VCD::SignalDefinition &definition, DisplayFormat fmt)
        : definition(definition), samples(), fmt(fmt) {}

    const VCD::SignalDefinition &getDefinition() const { return definition; }
    DisplayFormat getFormat() const { return fmt; }

    size_t size() const { return samples.size(); }
    const Sample &operator[](size_t i) const { return samples[i]; }
    const std::vector<Sample> &getSamples() const { return samples; }

    void append(const Sample &s) { samples.push_back(s); }
    void append(Sample &&s) { samples.push_back(std::move(s)); }

    /// Get the wave string, one character per sample.
    std::string getWave() const;
    /// Get the data annotations, one per DATA sample, in order.
    std::vector<std::string> getData() const;

  private:
    VCD::SignalDefinition definition;
    std::vector<Sample> samples;
    DisplayFormat fmt;
};

/// The WaveModel class is the result of an extraction: the sampled signals,
/// in the order they were requested, and the time window they cover.
class WaveModel {
  public:
    WaveModel(TimeTy startTime, TimeTy endTime, TimeTy chunkSize)
        : startTime(startTime), endTime(endTime), chunkSize(chunkSize) {}

    TimeTy getStartTime() const { return startTime; }
    TimeTy getEndTime() const { return endTime; }
    TimeTy getChunkSize() const { return chunkSize; }

    /// Get the number of samples each signal has.
    size_t getNumSamples() const {
        return getNumSamples(startTime, endTime, chunkSize);
    }

    /// Get the number of sampling instants in window [\p start, \p end] with
    /// \p chunk ticks between consecutive instants.
    static size_t getNumSamples(TimeTy start, TimeTy end, TimeTy chunk) {
        return (end - start) / chunk + 1;
    }

    size_t getNumSignals() const { return signals.size(); }
    bool empty() const { return signals.empty(); }
    const SampledSignal &operator[](size_t i) const { return signals[i]; }
    const std::vector<SampledSignal> &getSignals() const { return signals; }

    /// Find the sampled signal for path \p path, or nullptr if it was not
    /// extracted.
    const SampledSignal *findSignal(const std::string &path) const;

    /// Get the requested paths that did not match any signal.
    const std::vector<std::string> &getUnresolved() const { return unresolved; }
    bool hasUnresolved() const { return !unresolved.empty(); }

    bool hasTimescale() const { return timescaleSet; }
    const VCD::Timescale &getTimescale() const { return timescale; }

    void dump(std::ostream &os) const;

  private:
    friend class WaveModelBuilder;

    TimeTy startTime;
    TimeTy endTime;
    TimeTy chunkSize;
    std::vector<SampledSignal> signals;
    std::vector<std::string> unresolved;
    VCD::Timescale timescale;
    bool timescaleSet = false;
};

/// The WaveModelBuilder assembles a WaveModel, and checks all signals have
/// the number of samples the window requires.
class WaveModelBuilder {
  public:
    WaveModelBuilder(TimeTy startTime, TimeTy endTime, TimeTy chunkSize)
        : model(startTime, endTime, chunkSize) {}

    WaveModelBuilder &setTimescale(const VCD::Timescale &ts) {
        model.timescale = ts;
        model.timescaleSet = true;
        return *this;
    }

    WaveModelBuilder &addSignal(SampledSignal &&S);
    WaveModelBuilder &addUnresolved(const std::string &path) {
        model.unresolved.push_back(path);
        return *this;
    }

    WaveModel build() { return std::move(model); }

  private:
    WaveModel model;
};

} // namespace Wave
} // namespace V2W
