#pragma once

#include <vector>
#include <juce_dsp/juce_dsp.h>
#include "Constants.h"
#include "SphericalGrid.h"

namespace sofa2hrir {

// N x 4, one row per direction: {W, X, Y, Z}
using EncodeMatrix = juce::dsp::Matrix<double>;

class AmbisonicEncoder {
public:
    // Project a unit-amplitude plane wave from `direction` onto first-order
    // B-format. bFormat[4] = {W, X, Y, Z}
    static void encode(const Direction& direction, double* bFormat) noexcept;

    // Row i is encode(directions[i]); row order follows the grid order.
    static EncodeMatrix buildEncodeMatrix(const std::vector<Direction>& directions);
};

}  // namespace sofa2hrir
