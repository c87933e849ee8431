#include <Sofa2Hrir/AmbisonicEncoder.h>

namespace sofa2hrir {

void AmbisonicEncoder::encode(const Direction& direction, double* bFormat) noexcept {
    // W carries the FuMa -3 dB weight; X/Y/Z are the direction cosines.
    bFormat[BFormat::W] = kInvSqrt2;
    bFormat[BFormat::X] = direction.x;
    bFormat[BFormat::Y] = direction.y;
    bFormat[BFormat::Z] = direction.z;
}

EncodeMatrix AmbisonicEncoder::buildEncodeMatrix(const std::vector<Direction>& directions) {
    EncodeMatrix matrix(directions.size(), static_cast<size_t>(kNumAmbiChannels));

    for (size_t i = 0; i < directions.size(); ++i) {
        double row[kNumAmbiChannels];
        encode(directions[i], row);
        for (int ch = 0; ch < kNumAmbiChannels; ++ch)
            matrix(i, static_cast<size_t>(ch)) = row[ch];
    }

    return matrix;
}

}  // namespace sofa2hrir
