#pragma once

#include <Sofa2Hrir/HrirDataset.h>
#include <utility>
#include <vector>

namespace test_data {

constexpr int kNumPositions = 1300;
constexpr double kSamplingRate = 48000.0;

// Positions that never coincide with a grid direction or a feed direction:
// azimuths sit on x.5 degrees.
inline sofa2hrir::SourcePosition fillerPosition(int index) {
    return {(index % 72) * 5.0 + 2.5, -60.0 + (index / 72) * 7.0, 1.2};
}

// Distinct, index-derived taps so every measurement is recognisable.
inline sofa2hrir::StereoResponse makeResponse(int index, size_t numSamples) {
    sofa2hrir::StereoResponse response;
    for (size_t t = 0; t < numSamples; ++t) {
        response.ears[sofa2hrir::EarSide::Left].push_back(0.001 * index - 0.25 * static_cast<double>(t));
        response.ears[sofa2hrir::EarSide::Right].push_back(-0.0005 * index + 0.125 * static_cast<double>(t + 1));
    }
    return response;
}

// kNumPositions measurements of filler positions with `placed` overriding
// the listed indices.
inline sofa2hrir::HrirDataset makeDataset(
    const std::vector<std::pair<int, sofa2hrir::SourcePosition>>& placed, size_t numSamples = 2,
    int numPositions = kNumPositions) {
    sofa2hrir::HrirDataset dataset;
    dataset.samplingRate = kSamplingRate;

    for (int i = 0; i < numPositions; ++i) {
        dataset.positions.push_back(fillerPosition(i));
        dataset.responses.push_back(makeResponse(i, numSamples));
    }

    for (const auto& entry : placed)
        dataset.positions[static_cast<size_t>(entry.first)] = entry.second;

    return dataset;
}

// The eight cube directions placed at 100, 250, 400, ... in grid order.
inline int cubeIndex(size_t gridIndex) {
    return 100 + 150 * static_cast<int>(gridIndex);
}

inline sofa2hrir::HrirDataset makeCubeDataset() {
    const double azimuths[] = {45.0, 135.0, 225.0, 315.0};
    std::vector<std::pair<int, sofa2hrir::SourcePosition>> placed;

    size_t gridIndex = 0;
    for (double az : azimuths) {
        placed.push_back({cubeIndex(gridIndex++), {az, -30.0, 1.2}});
        placed.push_back({cubeIndex(gridIndex++), {az, 30.0, 1.2}});
    }
    return makeDataset(placed);
}

// The five measurements the tetrahedral feeds are built from, at the
// indices of the reference dataset.
inline sofa2hrir::HrirDataset makeTetrahedronDataset() {
    return makeDataset({
        {21, {0.0, 80.0, 1.2}},
        {289, {60.0, -20.0, 1.2}},
        {796, {180.0, 80.0, 1.2}},
        {777, {180.0, -20.0, 1.2}},
        {1276, {300.0, -20.0, 1.2}},
    });
}

}  // namespace test_data
