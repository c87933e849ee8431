#pragma once

#include <memory>
#include <juce_dsp/juce_dsp.h>
#include "Constants.h"
#include "AmbisonicEncoder.h"

namespace sofa2hrir {

// 4 x N, column i weights the HRIR of direction i into {W, X, Y, Z}
using DecodeMatrix = juce::dsp::Matrix<double>;

class DecodeMatrixSolver {
public:
    virtual ~DecodeMatrixSolver() = default;

    virtual DecodeMatrix solve(const EncodeMatrix& encodeMatrix) const = 0;
    virtual const char* getName() const noexcept = 0;
};

// CI = C^T. Only an (unnormalised) inverse when the grid directions are
// mutually equidistant, as for the tetrahedron.
class TransposeDecodeSolver : public DecodeMatrixSolver {
public:
    DecodeMatrix solve(const EncodeMatrix& encodeMatrix) const override;
    const char* getName() const noexcept override { return "transpose"; }
};

// CI = pinv(C), least squares over all grid directions. Singular values
// below relativeTolerance * max(singular value) are dropped; a rank
// deficient C therefore degrades silently instead of failing.
class PseudoInverseDecodeSolver : public DecodeMatrixSolver {
public:
    explicit PseudoInverseDecodeSolver(double relativeTolerance = kPinvRelativeTolerance);

    DecodeMatrix solve(const EncodeMatrix& encodeMatrix) const override;
    const char* getName() const noexcept override { return "pinv"; }

private:
    double relativeTolerance_;
};

std::unique_ptr<DecodeMatrixSolver> createDecodeMatrixSolver(
    DecoderStrategy strategy, double pinvTolerance = kPinvRelativeTolerance);

juce::dsp::Matrix<double> transposed(const juce::dsp::Matrix<double>& matrix);

}  // namespace sofa2hrir
