#include <Sofa2Hrir/HrirDataset.h>
#include <cmath>

namespace sofa2hrir {

size_t HrirDataset::getNumSamples() const noexcept {
    return responses.empty() ? 0 : responses.front().left().size();
}

juce::Result HrirDataset::validate() const {
    if (positions.empty())
        return juce::Result::fail("dataset has no measurements");

    if (positions.size() != responses.size())
        return juce::Result::fail("dataset has " + juce::String(positions.size())
                                  + " source positions but " + juce::String(responses.size())
                                  + " impulse responses");

    if (!(samplingRate > 0.0) || !std::isfinite(samplingRate))
        return juce::Result::fail("invalid sampling rate " + juce::String(samplingRate));

    const size_t numSamples = getNumSamples();
    if (numSamples == 0)
        return juce::Result::fail("impulse responses are empty");

    for (size_t i = 0; i < responses.size(); ++i) {
        for (const auto& ear : responses[i].ears) {
            if (ear.size() != numSamples)
                return juce::Result::fail("impulse response " + juce::String(i) + " has "
                                          + juce::String(ear.size()) + " samples, expected "
                                          + juce::String(numSamples));
        }
    }

    return juce::Result::ok();
}

}  // namespace sofa2hrir
