#pragma once

#include "eigupdate/normalizer.hpp"

namespace eigupdate {

struct DeflationResult {
    Eigen::MatrixXd V;              // basis with repeated-eigenvalue blocks reflected
    Eigen::VectorXd t;              // weights after both deflation passes
    std::vector<int> surviving;     // indices with t(i) != 0, ascending
    Eigen::VectorXd lambda_bar;     // lambda restricted to surviving
    Eigen::VectorXd t_bar;          // t restricted to surviving

    int reflected_groups = 0;       // repeated groups whose block of V was reflected
    int skipped_reflections = 0;    // repeated groups left unreflected by the stability guard
    int negligible_weights = 0;     // nonzero weights dropped as negligible
};

// Deflate the sorted rank-one problem diag(lambda) + rho * t * t'.
//
// For each run of equal eigenvalues a Householder reflection moves all of the
// weight of t into a single slot of the run (the last slot for rho >= 0, the
// first for rho < 0), leaving the remaining eigenvectors untouched by the
// update. The reflection is applied to V only when the reflector norm exceeds
// stability_factor * (max|lambda| + ||t||^2) * acc. Weights at or below
// stability_factor * (max|lambda| / ||t|| + ||t||) * acc are then zeroed.
// Throws UpdateError(DEFLATION) if a group's weights or reflected block overflow.
DeflationResult deflate(const SortedSpectrum& spectrum, double rho, double acc,
                        double stability_factor, bool verbose = false);

}  // namespace eigupdate
