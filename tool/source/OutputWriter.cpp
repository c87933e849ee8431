#include <Sofa2Hrir/OutputWriter.h>
#include <cstdio>

namespace sofa2hrir {

juce::String OutputWriter::formatValue(double value) {
    char buffer[40];
    std::snprintf(buffer, sizeof(buffer), "%.*g", kValuePrecision, value);
    return juce::String(buffer);
}

juce::String OutputWriter::joinValues(const double* values, size_t numValues) {
    juce::String line;
    line.preallocateBytes(numValues * 24);

    for (size_t i = 0; i < numValues; ++i) {
        if (i > 0)
            line << kValueSeparator;
        line << formatValue(values[i]);
    }
    return line;
}

void OutputWriter::writeLine(const juce::String& line, juce::OutputStream& stream) {
    stream << line << "\n";
}

void OutputWriter::writeHeader(double samplingRate, juce::OutputStream& stream) {
    writeLine(formatValue(samplingRate), stream);
    writeLine({}, stream);
}

void OutputWriter::writeAmbisonic(const AmbisonicCoefficientSet& coefficients,
                                  juce::OutputStream& stream) {
    writeHeader(coefficients.samplingRate, stream);

    for (const auto& rows : coefficients.ears) {
        for (const auto& weights : rows)
            writeLine(joinValues(weights.data(), weights.size()), stream);
        writeLine({}, stream);
    }
}

void OutputWriter::writeVirtualFeeds(const VirtualFeedSet& feeds, juce::OutputStream& stream) {
    writeHeader(feeds.samplingRate, stream);

    for (const auto& feed : feeds.feeds) {
        writeLine(joinValues(feed.decodeWeights.data(), feed.decodeWeights.size()), stream);
        writeLine(joinValues(feed.response.left().data(), feed.response.left().size()), stream);
        writeLine(joinValues(feed.response.right().data(), feed.response.right().size()), stream);
        writeLine({}, stream);
    }
}

juce::Result OutputWriter::writeTextFile(const juce::File& file, const juce::String& text) {
    if (!file.getParentDirectory().isDirectory())
        return juce::Result::fail("output directory does not exist: "
                                  + file.getParentDirectory().getFullPathName());

    if (!file.replaceWithText(text, false, false, "\n"))
        return juce::Result::fail("could not write " + file.getFullPathName());

    return juce::Result::ok();
}

}  // namespace sofa2hrir
