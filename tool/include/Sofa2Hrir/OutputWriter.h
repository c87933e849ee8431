#pragma once

#include <juce_core/juce_core.h>
#include "CoefficientSet.h"

namespace sofa2hrir {

// Writes the .hrir text layout the binaural renderer parses:
//
//   <sampling rate>
//   <blank>
//   <group rows...>
//   <blank>          (after every group)
//
// Values are joined with ", " and printed with round-trip precision.
class OutputWriter {
public:
    // Two groups (left, right), one "W, X, Y, Z" row per tap.
    static void writeAmbisonic(const AmbisonicCoefficientSet& coefficients,
                               juce::OutputStream& stream);

    // One group per feed: decode weights, left taps, right taps.
    static void writeVirtualFeeds(const VirtualFeedSet& feeds,
                                  juce::OutputStream& stream);

    static juce::String formatValue(double value);
    static juce::String joinValues(const double* values, size_t numValues);

    // Replaces the file contents atomically with "\n" line endings.
    static juce::Result writeTextFile(const juce::File& file, const juce::String& text);

private:
    static void writeHeader(double samplingRate, juce::OutputStream& stream);
    static void writeLine(const juce::String& line, juce::OutputStream& stream);
};

}  // namespace sofa2hrir
