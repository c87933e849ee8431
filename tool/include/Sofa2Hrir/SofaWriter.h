#pragma once

#include <juce_core/juce_core.h>
#include "HrirDataset.h"

namespace sofa2hrir {

// Writes a minimal SimpleFreeFieldHRIR-shaped file holding exactly the
// variables SofaReader reads. Replaces an existing file.
class SofaWriter {
public:
    static juce::Result write(const juce::File& file, const HrirDataset& dataset);
};

}  // namespace sofa2hrir
