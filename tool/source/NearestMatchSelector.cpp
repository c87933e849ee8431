#include <Sofa2Hrir/NearestMatchSelector.h>
#include <algorithm>
#include <cmath>
#include <limits>

namespace sofa2hrir {

NearestMatchSelector::NearestMatchSelector(const std::vector<SourcePosition>& positions)
    : positions_(positions) {}

size_t NearestMatchSelector::findNearest(double azimuthDeg, double elevationDeg) const noexcept {
    jassert(!positions_.empty());

    size_t best = 0;
    double bestDistance = std::numeric_limits<double>::infinity();

    for (size_t i = 0; i < positions_.size(); ++i) {
        const double dAz = positions_[i].azimuth - azimuthDeg;
        const double dEl = positions_[i].elevation - elevationDeg;
        const double distance = dAz * dAz + dEl * dEl;

        // Strict comparison keeps the first index on ties.
        if (distance < bestDistance) {
            bestDistance = distance;
            best = i;
        }
    }

    return best;
}

size_t NearestMatchSelector::findNearest(const Direction& target) const noexcept {
    return findNearest(target.azimuth, target.elevation);
}

juce::Result NearestMatchSelector::select(const std::vector<Direction>& targets,
                                          std::vector<size_t>& indices) const {
    if (positions_.empty())
        return juce::Result::fail("no measured positions to match against");

    indices.clear();
    indices.reserve(targets.size());

    for (const auto& target : targets)
        indices.push_back(findNearest(target));

    return juce::Result::ok();
}

double angularDistanceDeg(double azimuthA, double elevationA,
                          double azimuthB, double elevationB) noexcept {
    const double azA = juce::degreesToRadians(azimuthA);
    const double elA = juce::degreesToRadians(elevationA);
    const double azB = juce::degreesToRadians(azimuthB);
    const double elB = juce::degreesToRadians(elevationB);

    const double cosAngle = std::sin(elA) * std::sin(elB)
                          + std::cos(elA) * std::cos(elB) * std::cos(azA - azB);

    return juce::radiansToDegrees(std::acos(std::clamp(cosAngle, -1.0, 1.0)));
}

}  // namespace sofa2hrir
