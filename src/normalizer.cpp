#include "eigupdate/normalizer.hpp"
#include <algorithm>
#include <numeric>

namespace eigupdate {

Eigen::VectorXd eigenvalue_vector(const Eigen::MatrixXd& E) {
    if (E.rows() == E.cols() && E.cols() > 1) {
        return E.diagonal();
    }
    if (E.cols() == 1) {
        return E.col(0);
    }
    if (E.rows() == 1) {
        return E.row(0).transpose();
    }
    throw UpdateError(UpdateError::Stage::PRECONDITION,
                      "E must be a vector or a square diagonal matrix, got " +
                      std::to_string(E.rows()) + "x" + std::to_string(E.cols()));
}

SortedSpectrum normalize_spectrum(const Eigen::MatrixXd& V, const Eigen::VectorXd& E,
                                  const Eigen::VectorXd& t, double acc) {
    const int r = static_cast<int>(V.cols());
    if (E.size() != r) {
        throw UpdateError(UpdateError::Stage::PRECONDITION,
                          "E has " + std::to_string(E.size()) +
                          " eigenvalues but V has " + std::to_string(r) + " columns");
    }
    if (t.size() != r) {
        throw UpdateError(UpdateError::Stage::PRECONDITION,
                          "t has length " + std::to_string(t.size()) +
                          " but V has " + std::to_string(r) + " columns");
    }

    SortedSpectrum out;
    out.permutation.resize(r);
    std::iota(out.permutation.begin(), out.permutation.end(), 0);
    std::stable_sort(out.permutation.begin(), out.permutation.end(),
                     [&](int a, int b) { return E(a) < E(b); });

    out.lambda.resize(r);
    out.t.resize(r);
    out.V.resize(V.rows(), r);
    for (int i = 0; i < r; i++) {
        int src = out.permutation[i];
        out.lambda(i) = E(src);
        out.t(i) = t(src);
        out.V.col(i) = V.col(src);
    }

    out.t_norm = out.t.norm();
    out.max_abs_lambda = (r > 0) ? out.lambda.cwiseAbs().maxCoeff() : 0.0;

    // Snap tiny eigenvalues to zero so repeated values compare exactly equal
    out.cleanup_tolerance = r * acc * std::sqrt(out.max_abs_lambda);
    for (int i = 0; i < r; i++) {
        if (std::abs(out.lambda(i)) < out.cleanup_tolerance) out.lambda(i) = 0.0;
    }
    return out;
}

}  // namespace eigupdate
