#include <Sofa2Hrir/AmbisonicDecoder.h>
#include <Eigen/SVD>

namespace sofa2hrir {

juce::dsp::Matrix<double> transposed(const juce::dsp::Matrix<double>& matrix) {
    const size_t rows = matrix.getNumRows();
    const size_t cols = matrix.getNumColumns();
    juce::dsp::Matrix<double> result(cols, rows);

    for (size_t r = 0; r < rows; ++r)
        for (size_t c = 0; c < cols; ++c)
            result(c, r) = matrix(r, c);

    return result;
}

DecodeMatrix TransposeDecodeSolver::solve(const EncodeMatrix& encodeMatrix) const {
    return transposed(encodeMatrix);
}

PseudoInverseDecodeSolver::PseudoInverseDecodeSolver(double relativeTolerance)
    : relativeTolerance_(relativeTolerance) {}

DecodeMatrix PseudoInverseDecodeSolver::solve(const EncodeMatrix& encodeMatrix) const {
    const size_t rows = encodeMatrix.getNumRows();
    const size_t cols = encodeMatrix.getNumColumns();

    Eigen::MatrixXd c(static_cast<Eigen::Index>(rows), static_cast<Eigen::Index>(cols));
    for (size_t r = 0; r < rows; ++r)
        for (size_t k = 0; k < cols; ++k)
            c(static_cast<Eigen::Index>(r), static_cast<Eigen::Index>(k)) = encodeMatrix(r, k);

    Eigen::JacobiSVD<Eigen::MatrixXd> svd(c, Eigen::ComputeThinU | Eigen::ComputeThinV);
    const Eigen::VectorXd& singularValues = svd.singularValues();

    // Singular values come sorted in decreasing order.
    const double cutoff = singularValues.size() > 0
        ? relativeTolerance_ * singularValues(0)
        : 0.0;

    Eigen::VectorXd singularValuesInv = Eigen::VectorXd::Zero(singularValues.size());
    for (Eigen::Index i = 0; i < singularValues.size(); ++i) {
        if (singularValues(i) > cutoff)
            singularValuesInv(i) = 1.0 / singularValues(i);
    }

    const Eigen::MatrixXd pinv =
        svd.matrixV() * singularValuesInv.asDiagonal() * svd.matrixU().transpose();

    DecodeMatrix result(cols, rows);
    for (size_t k = 0; k < cols; ++k)
        for (size_t r = 0; r < rows; ++r)
            result(k, r) = pinv(static_cast<Eigen::Index>(k), static_cast<Eigen::Index>(r));

    return result;
}

std::unique_ptr<DecodeMatrixSolver> createDecodeMatrixSolver(DecoderStrategy strategy,
                                                             double pinvTolerance) {
    if (strategy == DecoderStrategy::PseudoInverse)
        return std::make_unique<PseudoInverseDecodeSolver>(pinvTolerance);

    jassert(strategy == DecoderStrategy::Transpose);
    return std::make_unique<TransposeDecodeSolver>();
}

}  // namespace sofa2hrir
