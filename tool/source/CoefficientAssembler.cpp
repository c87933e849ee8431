#include <Sofa2Hrir/CoefficientAssembler.h>
#include <utility>

namespace sofa2hrir {

namespace {

juce::Result checkIndices(const std::vector<size_t>& indices, const HrirDataset& dataset) {
    for (auto index : indices) {
        if (index >= dataset.getNumMeasurements())
            return juce::Result::fail("measurement index " + juce::String(index)
                                      + " out of range, dataset has "
                                      + juce::String(dataset.getNumMeasurements())
                                      + " measurements");
    }
    return juce::Result::ok();
}

}  // namespace

CoefficientAssembler::CoefficientAssembler(double gain) : gain_(gain) {}

juce::Result CoefficientAssembler::assembleAmbisonic(const DecodeMatrix& decodeMatrix,
                                                     const std::vector<size_t>& matchedIndices,
                                                     const HrirDataset& dataset,
                                                     AmbisonicCoefficientSet& output) const {
    if (decodeMatrix.getNumRows() != static_cast<size_t>(kNumAmbiChannels))
        return juce::Result::fail("decode matrix must have " + juce::String(kNumAmbiChannels)
                                  + " rows, got " + juce::String(decodeMatrix.getNumRows()));

    if (decodeMatrix.getNumColumns() != matchedIndices.size())
        return juce::Result::fail("decode matrix has " + juce::String(decodeMatrix.getNumColumns())
                                  + " columns for " + juce::String(matchedIndices.size())
                                  + " matched directions");

    auto result = checkIndices(matchedIndices, dataset);
    if (result.failed())
        return result;

    const size_t numSamples = dataset.getNumSamples();
    output.samplingRate = dataset.samplingRate;

    for (int side = 0; side < kNumEarSides; ++side) {
        auto& rows = output.ears[static_cast<size_t>(side)];
        rows.assign(numSamples, ChannelWeights{});

        for (size_t t = 0; t < numSamples; ++t) {
            for (int ch = 0; ch < kNumAmbiChannels; ++ch) {
                double sum = 0.0;
                for (size_t i = 0; i < matchedIndices.size(); ++i) {
                    const auto& ir = dataset.responses[matchedIndices[i]].ears[static_cast<size_t>(side)];
                    sum += decodeMatrix(static_cast<size_t>(ch), i) * (gain_ * ir[t]);
                }
                rows[t][static_cast<size_t>(ch)] = sum;
            }
        }
    }

    return juce::Result::ok();
}

juce::Result CoefficientAssembler::assembleVirtualFeeds(const DecodeMatrix& decodeMatrix,
                                                        const std::vector<ResolvedFeed>& feeds,
                                                        const HrirDataset& dataset,
                                                        VirtualFeedSet& output) const {
    if (decodeMatrix.getNumRows() != static_cast<size_t>(kNumAmbiChannels))
        return juce::Result::fail("decode matrix must have " + juce::String(kNumAmbiChannels)
                                  + " rows, got " + juce::String(decodeMatrix.getNumRows()));

    if (decodeMatrix.getNumColumns() != feeds.size())
        return juce::Result::fail("decode matrix has " + juce::String(decodeMatrix.getNumColumns())
                                  + " columns for " + juce::String(feeds.size()) + " feeds");

    output.samplingRate = dataset.samplingRate;
    output.feeds.clear();
    output.feeds.reserve(feeds.size());

    for (size_t i = 0; i < feeds.size(); ++i) {
        if (feeds[i].indices.empty())
            return juce::Result::fail("feed '" + feeds[i].name + "' has no measurements");

        auto result = checkIndices(feeds[i].indices, dataset);
        if (result.failed())
            return result;

        VirtualFeedOutput feed;
        feed.name = feeds[i].name;
        for (int ch = 0; ch < kNumAmbiChannels; ++ch)
            feed.decodeWeights[static_cast<size_t>(ch)] = decodeMatrix(static_cast<size_t>(ch), i);
        feed.response = combineResponses(dataset, feeds[i].indices);

        output.feeds.push_back(std::move(feed));
    }

    return juce::Result::ok();
}

StereoResponse CoefficientAssembler::combineResponses(const HrirDataset& dataset,
                                                      const std::vector<size_t>& indices) const {
    jassert(!indices.empty());

    const size_t numSamples = dataset.getNumSamples();
    const double count = static_cast<double>(indices.size());
    StereoResponse combined;

    for (int side = 0; side < kNumEarSides; ++side) {
        auto& out = combined.ears[static_cast<size_t>(side)];
        out.assign(numSamples, 0.0);

        for (size_t t = 0; t < numSamples; ++t) {
            double sum = 0.0;
            for (auto index : indices)
                sum += gain_ * dataset.responses[index].ears[static_cast<size_t>(side)][t];
            out[t] = sum / count;
        }
    }

    return combined;
}

}  // namespace sofa2hrir
