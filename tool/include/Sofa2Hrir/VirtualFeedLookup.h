#pragma once

#include <vector>
#include <juce_core/juce_core.h>
#include "Constants.h"
#include "HrirDataset.h"

namespace sofa2hrir {

// A measurement a feed is built from: where it should have been measured and,
// optionally, which dataset row holds it (-1 = no hint).
struct FeedSource {
    double azimuth = 0.0;
    double elevation = 0.0;
    int indexHint = -1;
};

// A virtual speaker feed. With two sources the feed is their mean, i.e. the
// midpoint of a linear interpolation between them.
struct VirtualFeed {
    juce::String name;
    std::vector<FeedSource> sources;
};

struct ResolvedFeed {
    juce::String name;
    std::vector<size_t> indices;  // one per source
};

// Feeds for the tetrahedron grid, in grid order. The top vertex was never
// measured, so it is interpolated from 0/80 and 180/80.
std::vector<VirtualFeed> makeDefaultTetrahedronFeeds();

class VirtualFeedLookup {
public:
    VirtualFeedLookup(std::vector<VirtualFeed> feeds,
                      FeedResolution resolution = FeedResolution::Hinted,
                      double toleranceDeg = kDefaultFeedToleranceDeg);

    // Fails on an out-of-range hint or when the chosen measurement is further
    // than the tolerance from the direction the feed expects.
    juce::Result resolve(const std::vector<SourcePosition>& positions,
                         std::vector<ResolvedFeed>& resolved) const;

private:
    juce::Result resolveSource(const VirtualFeed& feed, const FeedSource& source,
                               const std::vector<SourcePosition>& positions,
                               size_t& index) const;

    std::vector<VirtualFeed> feeds_;
    FeedResolution resolution_;
    double toleranceDeg_;
};

}  // namespace sofa2hrir
