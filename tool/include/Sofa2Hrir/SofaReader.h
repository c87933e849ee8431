#pragma once

#include <juce_core/juce_core.h>
#include "HrirDataset.h"

namespace sofa2hrir {

// Reads the three variables the converter needs from a SOFA (netCDF-4) file:
//   SourcePosition     [M x C]      azimuth, elevation (deg)[, distance (m)]
//   Data.IR            [M x 2 x N]
//   Data.SamplingRate  scalar (Hz)
// Nothing else of the SOFA conventions is interpreted.
class SofaReader {
public:
    static juce::Result read(const juce::File& file, HrirDataset& dataset);
};

}  // namespace sofa2hrir
