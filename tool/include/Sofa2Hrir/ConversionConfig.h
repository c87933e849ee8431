#pragma once

#include <vector>
#include <juce_core/juce_core.h>
#include "Constants.h"
#include "SphericalGrid.h"
#include "VirtualFeedLookup.h"

namespace sofa2hrir {

// Every tunable of one conversion run. Defaults reproduce the reference
// tetrahedral conversion.
struct ConversionConfig {
    GridLayout layout = GridLayout::Tetrahedron;
    DecoderStrategy decoder = DecoderStrategy::LayoutDefault;
    double gainCompensation = kDefaultGainCompensation;

    FeedResolution feedResolution = FeedResolution::Hinted;
    double feedToleranceDeg = kDefaultFeedToleranceDeg;
    double pinvTolerance = kPinvRelativeTolerance;

    CubeGridSettings cubeGrid;
    std::vector<VirtualFeed> tetrahedronFeeds = makeDefaultTetrahedronFeeds();

    bool verifyOutput = false;
    bool verbose = false;

    // Resolves LayoutDefault against the layout table.
    DecoderStrategy getEffectiveDecoder() const noexcept;
};

// Fills `config` from --layout, --decoder, --gain, --gain-db, --feeds,
// --tolerance, --verify and --verbose. Positional arguments are ignored;
// any other option is an error.
juce::Result parseConversionOptions(const juce::ArgumentList& args, ConversionConfig& config);

// Collects the non-option arguments; anything other than exactly
// <input> <output> fails with the usage line.
juce::Result getInputOutputPaths(const juce::ArgumentList& args, juce::StringArray& paths);

// "~" and "~/..." expand to the home directory; relative paths resolve
// against the working directory.
juce::File resolveUserPath(const juce::String& path);

const char* getDecoderName(DecoderStrategy strategy) noexcept;

}  // namespace sofa2hrir
