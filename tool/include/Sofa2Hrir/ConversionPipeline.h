#pragma once

#include <memory>
#include <vector>
#include <juce_core/juce_core.h>
#include "AmbisonicDecoder.h"
#include "AmbisonicEncoder.h"
#include "CoefficientAssembler.h"
#include "ConversionConfig.h"
#include "HrirDataset.h"
#include "SphericalGrid.h"

namespace sofa2hrir {

// One synchronous SOFA -> .hrir conversion. The grid and the decode matrix
// are fixed at construction; process() can then run on any dataset.
class ConversionPipeline {
public:
    explicit ConversionPipeline(ConversionConfig config);

    // Cube layout: nearest-match each grid direction and decode through the
    // decode matrix (2 ear groups). Tetrahedron layout: resolve the feed
    // table and emit one group per feed.
    juce::Result process(const HrirDataset& dataset, juce::OutputStream& stream) const;

    // SofaReader -> process() -> output file, then the optional read-back check.
    juce::Result convertFile(const juce::File& input, const juce::File& output) const;

    const std::vector<Direction>& getDirections() const noexcept { return directions_; }
    const EncodeMatrix& getEncodeMatrix() const noexcept { return encodeMatrix_; }
    const DecodeMatrix& getDecodeMatrix() const noexcept { return decodeMatrix_; }

private:
    juce::Result processAmbisonic(const HrirDataset& dataset, juce::OutputStream& stream) const;
    juce::Result processVirtualFeeds(const HrirDataset& dataset, juce::OutputStream& stream) const;
    juce::Result verifyOutput(const juce::String& text, const HrirDataset& dataset) const;

    ConversionConfig config_;
    std::vector<Direction> directions_;
    EncodeMatrix encodeMatrix_;
    std::unique_ptr<DecodeMatrixSolver> solver_;
    DecodeMatrix decodeMatrix_;
    CoefficientAssembler assembler_;

    JUCE_DECLARE_NON_COPYABLE(ConversionPipeline)
};

}  // namespace sofa2hrir
