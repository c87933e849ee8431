#pragma once

#include <vector>
#include <juce_core/juce_core.h>
#include "CoefficientSet.h"

namespace sofa2hrir {

// Parses .hrir text the way the binaural renderer loads it. Every failure
// names the offending (1-based) line.
class CoefficientReader {
public:
    static juce::Result readAmbisonic(const juce::String& text, AmbisonicCoefficientSet& output);
    static juce::Result readVirtualFeeds(const juce::String& text, VirtualFeedSet& output);

    // Whole token must be a finite number.
    static bool parseValue(const juce::String& token, double& value);

private:
    using Group = std::vector<std::vector<double>>;

    static juce::Result readGroups(const juce::String& text, double& samplingRate,
                                   std::vector<Group>& groups);
};

}  // namespace sofa2hrir
