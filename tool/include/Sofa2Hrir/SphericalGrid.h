#pragma once

#include <iterator>
#include <vector>
#include "Constants.h"

namespace sofa2hrir {

// A virtual speaker direction. Angles are in degrees in the measurement
// convention (azimuth counter-clockwise from the front, [0, 360)); the unit
// vector is what the encoder projects onto W, X, Y, Z.
struct Direction {
    double azimuth = 0.0;
    double elevation = 0.0;
    double x = 1.0;
    double y = 0.0;
    double z = 0.0;

    // x = cos(az) cos(el), y = sin(az) cos(el), z = sin(el)
    static Direction fromAngles(double azimuthDeg, double elevationDeg);

    // Keeps the vector as given. Angles follow the measurement layout:
    // el = asin(z), az = -atan2(x, y) wrapped to [0, 360). This is not the
    // inverse of fromAngles(): the angles name the measured position the
    // vertex stands for (tetrahedron vertex 0 reads 60 / -19.5, matching the
    // front-left feed), while the vector stays in the encoder's frame. Never
    // rebuild one form from the other.
    static Direction fromVector(double x, double y, double z);
};

struct CubeGridSettings {
    std::vector<double> azimuthsDeg{std::begin(kCubeAzimuthsDeg), std::end(kCubeAzimuthsDeg)};
    double elevationDeg = kCubeElevationDeg;
};

struct GridInfo {
    GridLayout layout;
    const char* name;
    int numDirections;  // with default settings
    DecoderStrategy defaultDecoder;
};

const GridInfo& getGridInfo(GridLayout layout);

// Regular tetrahedron, one vertex straight up.
std::vector<Direction> makeTetrahedronGrid();

// Every azimuth at -elevation then +elevation, azimuth-major.
std::vector<Direction> makeCubeGrid(const CubeGridSettings& settings = {});

std::vector<Direction> makeGrid(GridLayout layout, const CubeGridSettings& cube = {});

}  // namespace sofa2hrir
