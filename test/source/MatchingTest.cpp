#include <gtest/gtest.h>
#include <Sofa2Hrir/NearestMatchSelector.h>
#include <Sofa2Hrir/VirtualFeedLookup.h>
#include <Sofa2Hrir/SphericalGrid.h>
#include "TestDatasets.h"
#include <type_traits>

using namespace sofa2hrir;

// ===== Nearest match tests =====

TEST(NearestMatchSelectorTest, ExactPositionsMapToTheirIndex) {
    const auto dataset = test_data::makeCubeDataset();
    const auto grid = makeCubeGrid();

    std::vector<size_t> indices;
    const auto result = NearestMatchSelector(dataset.positions).select(grid, indices);
    ASSERT_TRUE(result.wasOk()) << result.getErrorMessage();
    ASSERT_EQ(indices.size(), grid.size());

    for (size_t i = 0; i < grid.size(); ++i)
        EXPECT_EQ(indices[i], static_cast<size_t>(test_data::cubeIndex(i)));
}

TEST(NearestMatchSelectorTest, FirstIndexWinsTies) {
    const std::vector<SourcePosition> positions = {
        {50.0, 0.0}, {0.0, 0.0}, {20.0, 0.0}, {0.0, 0.0},
    };
    NearestMatchSelector selector(positions);

    // (0, 0) and (20, 0) are both 10 away
    EXPECT_EQ(selector.findNearest(10.0, 0.0), 1u);
    // duplicates
    EXPECT_EQ(selector.findNearest(0.0, 0.0), 1u);
}

TEST(NearestMatchSelectorTest, AzimuthDoesNotWrap) {
    const std::vector<SourcePosition> positions = {{5.0, 0.0}, {340.0, 0.0}};

    // 359 is closer to 5 on the circle, but not in plain degrees
    EXPECT_EQ(NearestMatchSelector(positions).findNearest(359.0, 0.0), 1u);
}

TEST(NearestMatchSelectorTest, EmptyPositionSetFails) {
    const std::vector<SourcePosition> positions;
    std::vector<size_t> indices;
    EXPECT_TRUE(NearestMatchSelector(positions).select(makeCubeGrid(), indices).failed());
}

TEST(NearestMatchSelectorTest, OnlyBindsToLivePositionSets) {
    static_assert(std::is_constructible<NearestMatchSelector, const std::vector<SourcePosition>&>::value,
                  "lvalue position sets are accepted");
    static_assert(!std::is_constructible<NearestMatchSelector, std::vector<SourcePosition>&&>::value,
                  "a temporary position set would dangle");

    std::vector<SourcePosition> positions = {{10.0, 0.0}};
    NearestMatchSelector selector(positions);
    positions.push_back({90.0, 0.0});

    // sees the caller's current set
    EXPECT_EQ(selector.findNearest(85.0, 0.0), 1u);
}

TEST(NearestMatchSelectorTest, AngularDistanceIsGreatCircle) {
    EXPECT_NEAR(angularDistanceDeg(0.0, 0.0, 90.0, 0.0), 90.0, 1e-9);
    EXPECT_NEAR(angularDistanceDeg(359.0, 0.0, 1.0, 0.0), 2.0, 1e-9);
    EXPECT_NEAR(angularDistanceDeg(0.0, 90.0, 180.0, 90.0), 0.0, 1e-6);
    EXPECT_NEAR(angularDistanceDeg(0.0, 80.0, 180.0, 80.0), 20.0, 1e-9);
}

// ===== Virtual feed lookup tests =====

TEST(VirtualFeedLookupTest, DefaultTableMatchesReferenceIndices) {
    const auto feeds = makeDefaultTetrahedronFeeds();
    ASSERT_EQ(feeds.size(), 4u);

    EXPECT_EQ(feeds[0].sources[0].indexHint, 289);
    EXPECT_EQ(feeds[1].sources[0].indexHint, 1276);
    EXPECT_EQ(feeds[2].sources[0].indexHint, 777);
    ASSERT_EQ(feeds[3].sources.size(), 2u);
    EXPECT_EQ(feeds[3].sources[0].indexHint, 21);
    EXPECT_EQ(feeds[3].sources[1].indexHint, 796);
}

TEST(VirtualFeedLookupTest, HintedResolutionUsesHints) {
    const auto dataset = test_data::makeTetrahedronDataset();
    VirtualFeedLookup lookup(makeDefaultTetrahedronFeeds());

    std::vector<ResolvedFeed> resolved;
    const auto result = lookup.resolve(dataset.positions, resolved);
    ASSERT_TRUE(result.wasOk()) << result.getErrorMessage();
    ASSERT_EQ(resolved.size(), 4u);

    EXPECT_EQ(resolved[0].indices, std::vector<size_t>{289});
    EXPECT_EQ(resolved[1].indices, std::vector<size_t>{1276});
    EXPECT_EQ(resolved[2].indices, std::vector<size_t>{777});
    EXPECT_EQ(resolved[3].indices, (std::vector<size_t>{21, 796}));
    EXPECT_EQ(resolved[3].name, "top");
}

TEST(VirtualFeedLookupTest, HintOutOfRangeIsExplicit) {
    // only 500 measurements: 777, 796, 1276 do not exist
    const auto dataset = test_data::makeDataset({{21, {0.0, 80.0}}, {289, {60.0, -20.0}}}, 2, 500);
    VirtualFeedLookup lookup(makeDefaultTetrahedronFeeds());

    std::vector<ResolvedFeed> resolved;
    const auto result = lookup.resolve(dataset.positions, resolved);
    ASSERT_TRUE(result.failed());
    EXPECT_TRUE(result.getErrorMessage().contains("out of range")) << result.getErrorMessage();
    EXPECT_TRUE(result.getErrorMessage().contains("1276")) << result.getErrorMessage();
}

TEST(VirtualFeedLookupTest, DirectionMismatchIsExplicit) {
    auto dataset = test_data::makeTetrahedronDataset();
    dataset.positions[777] = {170.0, -20.0, 1.2};

    VirtualFeedLookup lookup(makeDefaultTetrahedronFeeds());
    std::vector<ResolvedFeed> resolved;
    const auto result = lookup.resolve(dataset.positions, resolved);

    ASSERT_TRUE(result.failed());
    EXPECT_TRUE(result.getErrorMessage().contains("back")) << result.getErrorMessage();
    EXPECT_TRUE(result.getErrorMessage().contains("from expected")) << result.getErrorMessage();
}

TEST(VirtualFeedLookupTest, ToleranceIsConfigurable) {
    auto dataset = test_data::makeTetrahedronDataset();
    dataset.positions[777] = {179.5, -20.0, 1.2};

    std::vector<ResolvedFeed> resolved;
    EXPECT_TRUE(VirtualFeedLookup(makeDefaultTetrahedronFeeds(), FeedResolution::Hinted, 1.0)
                    .resolve(dataset.positions, resolved).wasOk());
    EXPECT_TRUE(VirtualFeedLookup(makeDefaultTetrahedronFeeds(), FeedResolution::Hinted, 0.1)
                    .resolve(dataset.positions, resolved).failed());
}

TEST(VirtualFeedLookupTest, NearestResolutionIgnoresHints) {
    // the same five directions, moved to other indices
    const auto dataset = test_data::makeDataset({
        {3, {0.0, 80.0}},
        {4, {60.0, -20.0}},
        {5, {180.0, 80.0}},
        {6, {180.0, -20.0}},
        {7, {300.0, -20.0}},
    });

    std::vector<ResolvedFeed> resolved;
    EXPECT_TRUE(VirtualFeedLookup(makeDefaultTetrahedronFeeds()).resolve(dataset.positions, resolved).failed());

    const auto result = VirtualFeedLookup(makeDefaultTetrahedronFeeds(), FeedResolution::Nearest)
                            .resolve(dataset.positions, resolved);
    ASSERT_TRUE(result.wasOk()) << result.getErrorMessage();
    EXPECT_EQ(resolved[0].indices, std::vector<size_t>{4});
    EXPECT_EQ(resolved[1].indices, std::vector<size_t>{7});
    EXPECT_EQ(resolved[2].indices, std::vector<size_t>{6});
    EXPECT_EQ(resolved[3].indices, (std::vector<size_t>{3, 5}));
}

TEST(VirtualFeedLookupTest, FeedWithoutSourcesFails) {
    const auto dataset = test_data::makeTetrahedronDataset();
    std::vector<VirtualFeed> feeds{VirtualFeed{"empty", {}}};
    VirtualFeedLookup lookup(feeds);

    std::vector<ResolvedFeed> resolved;
    EXPECT_TRUE(lookup.resolve(dataset.positions, resolved).failed());
}
