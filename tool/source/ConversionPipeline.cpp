#include <Sofa2Hrir/ConversionPipeline.h>
#include <Sofa2Hrir/CoefficientReader.h>
#include <Sofa2Hrir/ConsoleLogger.h>
#include <Sofa2Hrir/NearestMatchSelector.h>
#include <Sofa2Hrir/OutputWriter.h>
#include <Sofa2Hrir/SofaReader.h>
#include <Sofa2Hrir/VirtualFeedLookup.h>
#include <utility>

namespace sofa2hrir {

ConversionPipeline::ConversionPipeline(ConversionConfig config)
    : config_(std::move(config)),
      directions_(makeGrid(config_.layout, config_.cubeGrid)),
      encodeMatrix_(AmbisonicEncoder::buildEncodeMatrix(directions_)),
      solver_(createDecodeMatrixSolver(config_.getEffectiveDecoder(), config_.pinvTolerance)),
      decodeMatrix_(solver_->solve(encodeMatrix_)),
      assembler_(config_.gainCompensation) {}

juce::Result ConversionPipeline::process(const HrirDataset& dataset, juce::OutputStream& stream) const {
    auto result = dataset.validate();
    if (result.failed())
        return result;

    logDebug("layout " + juce::String(getGridInfo(config_.layout).name) + ", "
             + juce::String(directions_.size()) + " directions, decoder " + solver_->getName()
             + ", gain " + juce::String(assembler_.getGain()));

    if (config_.layout == GridLayout::Cube)
        return processAmbisonic(dataset, stream);

    return processVirtualFeeds(dataset, stream);
}

juce::Result ConversionPipeline::processAmbisonic(const HrirDataset& dataset,
                                                  juce::OutputStream& stream) const {
    std::vector<size_t> matched;
    auto result = NearestMatchSelector(dataset.positions).select(directions_, matched);
    if (result.failed())
        return result;

    for (size_t i = 0; i < matched.size(); ++i) {
        const auto& position = dataset.positions[matched[i]];
        logDebug("direction " + juce::String(directions_[i].azimuth) + "/"
                 + juce::String(directions_[i].elevation) + " <- measurement "
                 + juce::String(matched[i]) + " (" + juce::String(position.azimuth) + "/"
                 + juce::String(position.elevation) + ")");
    }

    AmbisonicCoefficientSet coefficients;
    result = assembler_.assembleAmbisonic(decodeMatrix_, matched, dataset, coefficients);
    if (result.failed())
        return result;

    OutputWriter::writeAmbisonic(coefficients, stream);
    return juce::Result::ok();
}

juce::Result ConversionPipeline::processVirtualFeeds(const HrirDataset& dataset,
                                                     juce::OutputStream& stream) const {
    if (config_.tetrahedronFeeds.size() != directions_.size())
        return juce::Result::fail("feed table has " + juce::String(config_.tetrahedronFeeds.size())
                                  + " feeds for " + juce::String(directions_.size())
                                  + " grid directions");

    VirtualFeedLookup lookup(config_.tetrahedronFeeds, config_.feedResolution,
                             config_.feedToleranceDeg);

    std::vector<ResolvedFeed> resolved;
    auto result = lookup.resolve(dataset.positions, resolved);
    if (result.failed())
        return result;

    VirtualFeedSet feeds;
    result = assembler_.assembleVirtualFeeds(decodeMatrix_, resolved, dataset, feeds);
    if (result.failed())
        return result;

    OutputWriter::writeVirtualFeeds(feeds, stream);
    return juce::Result::ok();
}

juce::Result ConversionPipeline::convertFile(const juce::File& input, const juce::File& output) const {
    HrirDataset dataset;
    auto result = SofaReader::read(input, dataset);
    if (result.failed())
        return result;

    logInfo("read " + input.getFileName() + ": " + juce::String(dataset.getNumMeasurements())
            + " measurements, " + juce::String(dataset.getNumSamples()) + " samples, "
            + juce::String(dataset.samplingRate) + " Hz");

    juce::MemoryOutputStream stream;
    result = process(dataset, stream);
    if (result.failed())
        return result;

    const auto text = stream.toString();
    result = OutputWriter::writeTextFile(output, text);
    if (result.failed())
        return result;

    logInfo("wrote " + output.getFullPathName() + " (" + juce::File::descriptionOfSizeInBytes(output.getSize()) + ")");

    if (!config_.verifyOutput)
        return juce::Result::ok();

    return verifyOutput(output.loadFileAsString(), dataset);
}

juce::Result ConversionPipeline::verifyOutput(const juce::String& text, const HrirDataset& dataset) const {
    const auto mismatch = [](const juce::String& what, size_t expected, size_t found) {
        return juce::Result::fail("verification failed: expected " + juce::String(expected) + " "
                                  + what + ", found " + juce::String(found));
    };

    double samplingRate = 0.0;

    if (config_.layout == GridLayout::Cube) {
        AmbisonicCoefficientSet coefficients;
        auto result = CoefficientReader::readAmbisonic(text, coefficients);
        if (result.failed())
            return juce::Result::fail("verification failed: " + result.getErrorMessage());

        if (coefficients.getNumSamples() != dataset.getNumSamples())
            return mismatch("rows per ear", dataset.getNumSamples(), coefficients.getNumSamples());
        samplingRate = coefficients.samplingRate;
    } else {
        VirtualFeedSet feeds;
        auto result = CoefficientReader::readVirtualFeeds(text, feeds);
        if (result.failed())
            return juce::Result::fail("verification failed: " + result.getErrorMessage());

        if (feeds.feeds.size() != directions_.size())
            return mismatch("feeds", directions_.size(), feeds.feeds.size());

        const size_t numSamples = feeds.feeds.front().response.left().size();
        if (numSamples != dataset.getNumSamples())
            return mismatch("samples per feed", dataset.getNumSamples(), numSamples);
        samplingRate = feeds.samplingRate;
    }

    if (samplingRate != dataset.samplingRate)
        return juce::Result::fail("verification failed: sampling rate " + juce::String(samplingRate)
                                  + " does not match " + juce::String(dataset.samplingRate));

    logDebug("verified " + juce::String(text.length()) + " characters of output");
    return juce::Result::ok();
}

}  // namespace sofa2hrir
