#include <Sofa2Hrir/ConversionConfig.h>
#include <Sofa2Hrir/CoefficientReader.h>
#include <juce_audio_basics/juce_audio_basics.h>
#include <cmath>
#include <limits>

namespace sofa2hrir {

namespace {

const char* const kKnownOptions[] = {
    OptionID::kLayout, OptionID::kDecoder, OptionID::kGain,    OptionID::kGainDb,
    OptionID::kFeeds,  OptionID::kTolerance, OptionID::kVerify, OptionID::kVerbose,
};

bool isKnownOption(const juce::ArgumentList::Argument& arg) {
    const auto name = arg.text.upToFirstOccurrenceOf("=", false, false);
    for (auto* option : kKnownOptions)
        if (name == option)
            return true;
    return false;
}

juce::Result getOptionValue(const juce::ArgumentList& args, const char* option, juce::String& value) {
    value = args.getValueForOption(option).trim();
    if (value.isEmpty())
        return juce::Result::fail(juce::String(option) + " requires a value, e.g. " + option + "=...");
    return juce::Result::ok();
}

juce::Result getPositiveNumber(const juce::ArgumentList& args, const char* option, double& value) {
    juce::String text;
    auto result = getOptionValue(args, option, text);
    if (result.failed())
        return result;

    double parsed = 0.0;
    if (!CoefficientReader::parseValue(text, parsed))
        return juce::Result::fail(juce::String(option) + ": '" + text + "' is not a number");

    if (!(parsed > 0.0))
        return juce::Result::fail(juce::String(option) + " must be a positive number, got '" + text + "'");

    value = parsed;
    return juce::Result::ok();
}

juce::Result parseLayout(const juce::String& text, GridLayout& layout) {
    for (int i = 0; i < static_cast<int>(GridLayout::kNumLayouts); ++i) {
        const auto candidate = static_cast<GridLayout>(i);
        if (text == getGridInfo(candidate).name) {
            layout = candidate;
            return juce::Result::ok();
        }
    }
    return juce::Result::fail("unknown layout '" + text + "' (expected tetrahedron or cube)");
}

juce::Result parseDecoder(const juce::String& text, DecoderStrategy& decoder) {
    for (auto candidate : {DecoderStrategy::Transpose, DecoderStrategy::PseudoInverse}) {
        if (text == getDecoderName(candidate)) {
            decoder = candidate;
            return juce::Result::ok();
        }
    }
    return juce::Result::fail("unknown decoder '" + text + "' (expected transpose or pinv)");
}

juce::Result parseFeedResolution(const juce::String& text, FeedResolution& resolution) {
    if (text == "hinted")
        resolution = FeedResolution::Hinted;
    else if (text == "nearest")
        resolution = FeedResolution::Nearest;
    else
        return juce::Result::fail("unknown feed resolution '" + text + "' (expected hinted or nearest)");
    return juce::Result::ok();
}

}  // namespace

DecoderStrategy ConversionConfig::getEffectiveDecoder() const noexcept {
    if (decoder != DecoderStrategy::LayoutDefault)
        return decoder;
    return getGridInfo(layout).defaultDecoder;
}

const char* getDecoderName(DecoderStrategy strategy) noexcept {
    switch (strategy) {
        case DecoderStrategy::Transpose: return "transpose";
        case DecoderStrategy::PseudoInverse: return "pinv";
        case DecoderStrategy::LayoutDefault: break;
    }
    return "default";
}

juce::Result parseConversionOptions(const juce::ArgumentList& args, ConversionConfig& config) {
    for (const auto& arg : args.arguments)
        if (arg.isOption() && !isKnownOption(arg))
            return juce::Result::fail("unknown option '" + arg.text + "'");

    juce::String text;

    if (args.containsOption(OptionID::kLayout)) {
        auto result = getOptionValue(args, OptionID::kLayout, text);
        if (result.wasOk())
            result = parseLayout(text, config.layout);
        if (result.failed())
            return result;
    }

    if (args.containsOption(OptionID::kDecoder)) {
        auto result = getOptionValue(args, OptionID::kDecoder, text);
        if (result.wasOk())
            result = parseDecoder(text, config.decoder);
        if (result.failed())
            return result;
    }

    if (args.containsOption(OptionID::kFeeds)) {
        auto result = getOptionValue(args, OptionID::kFeeds, text);
        if (result.wasOk())
            result = parseFeedResolution(text, config.feedResolution);
        if (result.failed())
            return result;
    }

    const bool hasGain = args.containsOption(OptionID::kGain);
    const bool hasGainDb = args.containsOption(OptionID::kGainDb);

    if (hasGain && hasGainDb)
        return juce::Result::fail(juce::String(OptionID::kGain) + " and " + OptionID::kGainDb
                                  + " cannot be combined");

    if (hasGain) {
        auto result = getPositiveNumber(args, OptionID::kGain, config.gainCompensation);
        if (result.failed())
            return result;
    }

    if (hasGainDb) {
        auto result = getOptionValue(args, OptionID::kGainDb, text);
        if (result.failed())
            return result;

        double decibels = 0.0;
        if (!CoefficientReader::parseValue(text, decibels))
            return juce::Result::fail(juce::String(OptionID::kGainDb) + ": '" + text + "' is not a number");

        // no -100 dB floor: any finite level maps to a positive gain
        config.gainCompensation = juce::Decibels::decibelsToGain(decibels, -std::numeric_limits<double>::infinity());
        if (!(config.gainCompensation > 0.0) || !std::isfinite(config.gainCompensation))
            return juce::Result::fail(juce::String(OptionID::kGainDb) + ": '" + text + "' is out of range");
    }

    if (args.containsOption(OptionID::kTolerance)) {
        auto result = getPositiveNumber(args, OptionID::kTolerance, config.feedToleranceDeg);
        if (result.failed())
            return result;
    }

    config.verifyOutput = args.containsOption(OptionID::kVerify);
    config.verbose = args.containsOption(OptionID::kVerbose);
    return juce::Result::ok();
}

juce::Result getInputOutputPaths(const juce::ArgumentList& args, juce::StringArray& paths) {
    paths.clear();
    for (const auto& arg : args.arguments)
        if (!arg.isOption())
            paths.add(arg.text);

    if (paths.size() != 2)
        return juce::Result::fail(kUsageMessage);

    return juce::Result::ok();
}

juce::File resolveUserPath(const juce::String& path) {
    if (path == "~")
        return juce::File::getSpecialLocation(juce::File::userHomeDirectory);

    if (path.startsWith("~/"))
        return juce::File::getSpecialLocation(juce::File::userHomeDirectory).getChildFile(path.substring(2));

    return juce::File::getCurrentWorkingDirectory().getChildFile(path);
}

}  // namespace sofa2hrir
