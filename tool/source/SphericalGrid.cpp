#include <Sofa2Hrir/SphericalGrid.h>
#include <juce_core/juce_core.h>
#include <cmath>

namespace sofa2hrir {

Direction Direction::fromAngles(double azimuthDeg, double elevationDeg) {
    const double az = juce::degreesToRadians(azimuthDeg);
    const double el = juce::degreesToRadians(elevationDeg);

    Direction d;
    d.azimuth = azimuthDeg;
    d.elevation = elevationDeg;
    d.x = std::cos(az) * std::cos(el);
    d.y = std::sin(az) * std::cos(el);
    d.z = std::sin(el);
    return d;
}

Direction Direction::fromVector(double x, double y, double z) {
    jassert(std::abs(x * x + y * y + z * z - 1.0) < 1e-9);

    Direction d;
    d.x = x;
    d.y = y;
    d.z = z;
    d.elevation = juce::radiansToDegrees(std::asin(z));

    double az = -std::atan2(x, y);
    if (az < 0.0)
        az += 2.0 * kPi;
    d.azimuth = juce::radiansToDegrees(az);
    return d;
}

std::vector<Direction> makeTetrahedronGrid() {
    const double a = std::sqrt(2.0 / 3.0);
    const double b = std::sqrt(2.0 / 9.0);
    const double c = 1.0 / 3.0;

    return {
        Direction::fromVector(-a, b, -c),
        Direction::fromVector(a, b, -c),
        Direction::fromVector(0.0, -std::sqrt(8.0 / 9.0), -c),
        Direction::fromVector(0.0, 0.0, 1.0),
    };
}

std::vector<Direction> makeCubeGrid(const CubeGridSettings& settings) {
    std::vector<Direction> directions;
    directions.reserve(settings.azimuthsDeg.size() * 2);

    for (double az : settings.azimuthsDeg) {
        directions.push_back(Direction::fromAngles(az, -settings.elevationDeg));
        directions.push_back(Direction::fromAngles(az, settings.elevationDeg));
    }
    return directions;
}

std::vector<Direction> makeGrid(GridLayout layout, const CubeGridSettings& cube) {
    switch (layout) {
        case GridLayout::Cube:
            return makeCubeGrid(cube);
        case GridLayout::Tetrahedron:
        case GridLayout::kNumLayouts:
            break;
    }
    return makeTetrahedronGrid();
}

// ===== Layout info lookup =====

const GridInfo& getGridInfo(GridLayout layout) {
    static const GridInfo layouts[] = {
        { GridLayout::Tetrahedron, "tetrahedron", 4, DecoderStrategy::Transpose },
        { GridLayout::Cube, "cube", 8, DecoderStrategy::PseudoInverse },
    };

    int idx = static_cast<int>(layout);
    if (idx < 0 || idx >= static_cast<int>(GridLayout::kNumLayouts))
        idx = 0;
    return layouts[idx];
}

}  // namespace sofa2hrir
