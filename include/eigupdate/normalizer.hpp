#pragma once

#include "eigupdate/common.hpp"

namespace eigupdate {

// Eigen-triple sorted by ascending eigenvalue, with tiny eigenvalues snapped
// to zero. Column i of V and entry i of t belong to lambda(i).
struct SortedSpectrum {
    Eigen::VectorXd lambda;
    Eigen::MatrixXd V;
    Eigen::VectorXd t;
    std::vector<int> permutation;    // permutation[i] = input position of sorted entry i

    double max_abs_lambda = 0.0;     // max |lambda| before cleanup
    double t_norm = 0.0;             // ||t||
    double cleanup_tolerance = 0.0;  // r * acc * sqrt(max |lambda|)
};

// Eigenvalues given either as a vector (r x 1 or 1 x r) or as an r x r
// diagonal matrix.
Eigen::VectorXd eigenvalue_vector(const Eigen::MatrixXd& E);

// Sort (E, V, t) by ascending eigenvalue and clean up the eigenvalues.
// Throws UpdateError(PRECONDITION) on shape mismatch.
SortedSpectrum normalize_spectrum(const Eigen::MatrixXd& V, const Eigen::VectorXd& E,
                                  const Eigen::VectorXd& t, double acc);

}  // namespace eigupdate
