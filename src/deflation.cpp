#include "eigupdate/deflation.hpp"
#include <iomanip>
#include <iostream>

namespace eigupdate {

DeflationResult deflate(const SortedSpectrum& spectrum, double rho, double acc,
                        double stability_factor, bool verbose) {
    DeflationResult out;
    out.V = spectrum.V;
    out.t = spectrum.t;

    const int n = static_cast<int>(spectrum.lambda.size());
    const double max_lambda = spectrum.max_abs_lambda;
    const double t_norm = spectrum.t_norm;
    const double reflect_guard =
        stability_factor * (max_lambda + t_norm * t_norm) * acc;

    // Runs of equal eigenvalues are contiguous after sorting
    int start = 0;
    while (start < n) {
        int end = start;
        while (end + 1 < n && spectrum.lambda(end + 1) == spectrum.lambda(start)) end++;
        int multiplicity = end - start + 1;

        if (multiplicity > 1) {
            Eigen::VectorXd v = out.t.segment(start, multiplicity);
            double v_norm = v.norm();
            if (!std::isfinite(v_norm)) {
                throw UpdateError(UpdateError::Stage::DEFLATION,
                                  "weight norm of repeated eigenvalue " +
                                  std::to_string(spectrum.lambda(start)) + " overflows");
            }

            out.t.segment(start, multiplicity).setZero();
            if (rho < 0.0) {
                out.t(start) = -v_norm;
                v(0) += v_norm;
            } else {
                out.t(end) = -v_norm;
                v(multiplicity - 1) += v_norm;
            }

            double h_norm = v.norm();
            if (h_norm > reflect_guard) {
                // V_block <- V_block (I - 2 v v' / ||v||^2)
                Eigen::VectorXd Vv = out.V.middleCols(start, multiplicity) * v;
                out.V.middleCols(start, multiplicity) -=
                    (2.0 / (h_norm * h_norm)) * Vv * v.transpose();
                if (!out.V.middleCols(start, multiplicity).allFinite()) {
                    throw UpdateError(UpdateError::Stage::DEFLATION,
                                      "reflected basis block at [" + std::to_string(start) +
                                      ", " + std::to_string(end) + "] is not finite");
                }
                out.reflected_groups++;
            } else if (v_norm > 0.0) {
                out.skipped_reflections++;
                if (verbose) {
                    std::cerr << "[Deflation] eigenvalue " << spectrum.lambda(start)
                              << " x" << multiplicity << " at [" << start << ", " << end
                              << "]: reflection skipped (|v|=" << std::scientific
                              << h_norm << " <= guard " << reflect_guard << ")"
                              << std::defaultfloat << std::endl;
                }
            }
        }
        start = end + 1;
    }

    // Numerical deflation of negligible weights
    if (t_norm > 0.0) {
        const double weight_tol =
            stability_factor * (max_lambda / t_norm + t_norm) * acc;
        for (int i = 0; i < n; i++) {
            if (std::abs(out.t(i)) <= weight_tol) {
                if (out.t(i) != 0.0) out.negligible_weights++;
                out.t(i) = 0.0;
            }
        }
    }

    for (int i = 0; i < n; i++) {
        if (out.t(i) != 0.0) out.surviving.push_back(i);
    }

    const int nt = static_cast<int>(out.surviving.size());
    out.lambda_bar.resize(nt);
    out.t_bar.resize(nt);
    for (int k = 0; k < nt; k++) {
        out.lambda_bar(k) = spectrum.lambda(out.surviving[k]);
        out.t_bar(k) = out.t(out.surviving[k]);
    }

    if (verbose && out.negligible_weights > 0) {
        std::cerr << "[Deflation] " << out.negligible_weights
                  << " negligible weight(s) zeroed, " << nt << "/" << n
                  << " poles remain" << std::endl;
    }
    return out;
}

}  // namespace eigupdate
