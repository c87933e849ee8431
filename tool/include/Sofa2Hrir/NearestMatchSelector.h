#pragma once

#include <vector>
#include <juce_core/juce_core.h>
#include "HrirDataset.h"
#include "SphericalGrid.h"

namespace sofa2hrir {

// Refers to the caller's position set, which must outlive the selector.
class NearestMatchSelector {
public:
    explicit NearestMatchSelector(const std::vector<SourcePosition>& positions);
    explicit NearestMatchSelector(std::vector<SourcePosition>&&) = delete;

    // Index of the measured position closest to (azimuthDeg, elevationDeg).
    // Distance is plain squared Euclidean over (azimuth, elevation); azimuth
    // wrap-around is not considered. The first index at the minimum wins.
    // Requires a non-empty position set.
    size_t findNearest(double azimuthDeg, double elevationDeg) const noexcept;
    size_t findNearest(const Direction& target) const noexcept;

    // One index per target, in target order.
    juce::Result select(const std::vector<Direction>& targets,
                        std::vector<size_t>& indices) const;

private:
    const std::vector<SourcePosition>& positions_;
};

// Great-circle distance in degrees between two (azimuth, elevation) pairs.
double angularDistanceDeg(double azimuthA, double elevationA,
                          double azimuthB, double elevationB) noexcept;

}  // namespace sofa2hrir
