#include <Sofa2Hrir/VirtualFeedLookup.h>
#include <Sofa2Hrir/NearestMatchSelector.h>
#include <Sofa2Hrir/ConsoleLogger.h>
#include <utility>

namespace sofa2hrir {

std::vector<VirtualFeed> makeDefaultTetrahedronFeeds() {
    return {
        { "front-left",  { { 60.0, -20.0, kHintFrontLeft } } },
        { "front-right", { { 300.0, -20.0, kHintFrontRight } } },
        { "back",        { { 180.0, -20.0, kHintBack } } },
        { "top",         { { 0.0, 80.0, kHintTopA }, { 180.0, 80.0, kHintTopB } } },
    };
}

VirtualFeedLookup::VirtualFeedLookup(std::vector<VirtualFeed> feeds,
                                     FeedResolution resolution,
                                     double toleranceDeg)
    : feeds_(std::move(feeds)), resolution_(resolution), toleranceDeg_(toleranceDeg) {}

juce::Result VirtualFeedLookup::resolve(const std::vector<SourcePosition>& positions,
                                        std::vector<ResolvedFeed>& resolved) const {
    if (positions.empty())
        return juce::Result::fail("no measured positions to resolve feeds against");

    resolved.clear();
    resolved.reserve(feeds_.size());

    for (const auto& feed : feeds_) {
        if (feed.sources.empty())
            return juce::Result::fail("feed '" + feed.name + "' has no sources");

        ResolvedFeed entry{feed.name, {}};
        for (const auto& source : feed.sources) {
            size_t index = 0;
            auto result = resolveSource(feed, source, positions, index);
            if (result.failed())
                return result;
            entry.indices.push_back(index);
        }
        resolved.push_back(std::move(entry));
    }

    return juce::Result::ok();
}

juce::Result VirtualFeedLookup::resolveSource(const VirtualFeed& feed, const FeedSource& source,
                                              const std::vector<SourcePosition>& positions,
                                              size_t& index) const {
    const juce::String expected = juce::String(source.azimuth) + "/" + juce::String(source.elevation);

    if (resolution_ == FeedResolution::Hinted && source.indexHint >= 0) {
        if (static_cast<size_t>(source.indexHint) >= positions.size())
            return juce::Result::fail("feed '" + feed.name + "': index " + juce::String(source.indexHint)
                                      + " out of range, dataset has " + juce::String(positions.size())
                                      + " measurements");
        index = static_cast<size_t>(source.indexHint);
    } else {
        index = NearestMatchSelector(positions).findNearest(source.azimuth, source.elevation);
    }

    const auto& measured = positions[index];
    const double deviation = angularDistanceDeg(source.azimuth, source.elevation,
                                                measured.azimuth, measured.elevation);

    if (deviation > toleranceDeg_)
        return juce::Result::fail("feed '" + feed.name + "': measurement " + juce::String(index)
                                  + " at " + juce::String(measured.azimuth) + "/"
                                  + juce::String(measured.elevation) + " is "
                                  + juce::String(deviation, 2) + " deg from expected " + expected
                                  + " (tolerance " + juce::String(toleranceDeg_) + " deg)");

    logDebug("feed " + feed.name + " <- measurement " + juce::String(index) + " ("
             + juce::String(measured.azimuth) + "/" + juce::String(measured.elevation) + ")");
    return juce::Result::ok();
}

}  // namespace sofa2hrir
