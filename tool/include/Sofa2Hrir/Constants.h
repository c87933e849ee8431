#pragma once

#include <cstddef>

namespace sofa2hrir {

// ===== B-Format channel indices =====
enum BFormat : int { W = 0, X = 1, Y = 2, Z = 3, kNumAmbiChannels = 4 };

// ===== Ear sides (SOFA receiver order) =====
enum EarSide : int { Left = 0, Right = 1, kNumEarSides = 2 };

// ===== Virtual direction grids =====
enum class GridLayout : int {
    Tetrahedron = 0,
    Cube = 1,
    kNumLayouts
};

// ===== Decode matrix strategies =====
enum class DecoderStrategy : int {
    LayoutDefault = -1,  // whatever the grid layout prefers
    Transpose = 0,
    PseudoInverse = 1,
};

// ===== How the tetrahedral feeds find their measurements =====
enum class FeedResolution : int {
    Hinted = 0,   // use the index hints, validate their directions
    Nearest = 1,  // ignore hints, nearest measured position per source
};

// ===== Command-line option names (stable contract) =====
namespace OptionID {
    inline constexpr const char* kLayout = "--layout";
    inline constexpr const char* kDecoder = "--decoder";
    inline constexpr const char* kGain = "--gain";
    inline constexpr const char* kGainDb = "--gain-db";
    inline constexpr const char* kFeeds = "--feeds";
    inline constexpr const char* kTolerance = "--tolerance";
    inline constexpr const char* kVerify = "--verify";
    inline constexpr const char* kVerbose = "--verbose";
}

inline constexpr const char* kUsageMessage = "Usage: sofa2hrir <input.sofa> <output.hrir>";

// ===== SOFA variable names =====
namespace SofaVar {
    inline constexpr const char* kSourcePosition = "SourcePosition";
    inline constexpr const char* kDataIR = "Data.IR";
    inline constexpr const char* kSamplingRate = "Data.SamplingRate";
}

// ===== Defaults =====

// Loudness calibration applied to every raw HRIR sample. Found by ear on one
// dataset; not derived, so it stays overridable.
constexpr double kDefaultGainCompensation = 10.0;

// Max great-circle distance between a feed's expected direction and the
// measurement it resolves to.
constexpr double kDefaultFeedToleranceDeg = 1.0;

// Singular values below this fraction of the largest count as zero.
constexpr double kPinvRelativeTolerance = 1e-12;

// Cube-derived grid
constexpr std::size_t kNumCubeAzimuths = 4;
constexpr double kCubeAzimuthsDeg[kNumCubeAzimuths] = {45.0, 135.0, 225.0, 315.0};
constexpr double kCubeElevationDeg = 30.0;

// Index hints for the tetrahedral feeds, picked by inspecting the
// measurement layout of the reference dataset.
constexpr int kHintFrontLeft = 289;   // 60 / -20
constexpr int kHintFrontRight = 1276; // 300 / -20
constexpr int kHintBack = 777;        // 180 / -20
constexpr int kHintTopA = 21;         // 0 / 80
constexpr int kHintTopB = 796;        // 180 / 80

// Output text format
inline constexpr const char* kValueSeparator = ", ";
constexpr int kValuePrecision = 17;

constexpr double kPi = 3.14159265358979323846;
constexpr double kInvSqrt2 = 0.70710678118654752440;

}  // namespace sofa2hrir
