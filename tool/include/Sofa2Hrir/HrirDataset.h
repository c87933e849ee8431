#pragma once

#include <array>
#include <vector>
#include <juce_core/juce_core.h>
#include "Constants.h"

namespace sofa2hrir {

// One row of SourcePosition (spherical, degrees / metres).
struct SourcePosition {
    double azimuth = 0.0;
    double elevation = 0.0;
    double distance = 1.0;
};

// Left/right impulse response of one measurement.
struct StereoResponse {
    std::array<std::vector<double>, kNumEarSides> ears;

    const std::vector<double>& left() const noexcept { return ears[EarSide::Left]; }
    const std::vector<double>& right() const noexcept { return ears[EarSide::Right]; }
};

// Everything the converter needs from a SOFA file. positions[i] and
// responses[i] describe the same measurement.
struct HrirDataset {
    double samplingRate = 0.0;
    std::vector<SourcePosition> positions;
    std::vector<StereoResponse> responses;

    size_t getNumMeasurements() const noexcept { return positions.size(); }

    // Sample count shared by every response (0 when empty).
    size_t getNumSamples() const noexcept;

    // Checks index alignment and that all responses share one length.
    juce::Result validate() const;
};

}  // namespace sofa2hrir
