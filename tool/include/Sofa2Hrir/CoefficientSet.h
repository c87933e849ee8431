#pragma once

#include <array>
#include <vector>
#include <juce_core/juce_core.h>
#include "Constants.h"
#include "HrirDataset.h"

namespace sofa2hrir {

// {W, X, Y, Z} weights for one tap of one ear.
using ChannelWeights = std::array<double, kNumAmbiChannels>;

// General mode output: per ear, one weight row per HRIR tap.
struct AmbisonicCoefficientSet {
    double samplingRate = 0.0;
    std::array<std::vector<ChannelWeights>, kNumEarSides> ears;

    size_t getNumSamples() const noexcept { return ears[EarSide::Left].size(); }
};

// Tetrahedral mode output: the renderer decodes each feed itself.
struct VirtualFeedOutput {
    juce::String name;
    ChannelWeights decodeWeights{};  // column of the decode matrix for this feed
    StereoResponse response;
};

struct VirtualFeedSet {
    double samplingRate = 0.0;
    std::vector<VirtualFeedOutput> feeds;
};

}  // namespace sofa2hrir
