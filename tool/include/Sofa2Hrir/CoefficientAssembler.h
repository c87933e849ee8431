#pragma once

#include <vector>
#include <juce_core/juce_core.h>
#include "AmbisonicDecoder.h"
#include "CoefficientSet.h"
#include "HrirDataset.h"
#include "VirtualFeedLookup.h"

namespace sofa2hrir {

class CoefficientAssembler {
public:
    // gain: loudness calibration applied to every raw HRIR sample before
    // anything is combined.
    explicit CoefficientAssembler(double gain = kDefaultGainCompensation);

    // coefficient[j][s][t] = sum_i decode(j, i) * gain * ir[matched[i]][s][t]
    juce::Result assembleAmbisonic(const DecodeMatrix& decodeMatrix,
                                   const std::vector<size_t>& matchedIndices,
                                   const HrirDataset& dataset,
                                   AmbisonicCoefficientSet& output) const;

    // Feed i gets column i of the decode matrix and its (averaged) HRIR.
    juce::Result assembleVirtualFeeds(const DecodeMatrix& decodeMatrix,
                                      const std::vector<ResolvedFeed>& feeds,
                                      const HrirDataset& dataset,
                                      VirtualFeedSet& output) const;

    // Gain-scaled mean of the given measurements.
    StereoResponse combineResponses(const HrirDataset& dataset,
                                    const std::vector<size_t>& indices) const;

    double getGain() const noexcept { return gain_; }

private:
    double gain_;
};

}  // namespace sofa2hrir
