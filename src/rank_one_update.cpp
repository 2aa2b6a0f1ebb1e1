#include "eigupdate/rank_one_update.hpp"
#include <chrono>
#include <exception>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <utility>

namespace eigupdate {

RankOneUpdater::RankOneUpdater()
    : RankOneUpdater(RankOneConfig()) {}

RankOneUpdater::RankOneUpdater(const RankOneConfig& config)
    : config_(config), solver_(RationalSecularSolver()) {}

RankOneUpdater::RankOneUpdater(const RankOneConfig& config, SecularRootSolver solver)
    : config_(config), solver_(std::move(solver)) {
    if (!solver_)
        throw std::invalid_argument("RankOneUpdater: secular root solver is empty");
}

void RankOneUpdater::validate_inputs(const Eigen::MatrixXd& V, const Eigen::VectorXd& E,
                                     const Eigen::VectorXd& t, double rho) const {
    using Stage = UpdateError::Stage;

    if (!(config_.accuracy > 0.0) || !std::isfinite(config_.accuracy))
        throw UpdateError(Stage::PRECONDITION, "accuracy must be positive and finite");
    if (!(config_.stability_factor > 0.0))
        throw UpdateError(Stage::PRECONDITION, "stability_factor must be positive");
    if (rho == 0.0 || !std::isfinite(rho))
        throw UpdateError(Stage::PRECONDITION, "rho must be nonzero and finite");
    if (V.cols() == 0)
        throw UpdateError(Stage::PRECONDITION, "V must have at least one column");
    if (V.rows() < V.cols())
        throw UpdateError(Stage::PRECONDITION,
                          "V is " + std::to_string(V.rows()) + "x" +
                          std::to_string(V.cols()) + "; columns cannot be orthonormal");
    if (!V.allFinite())
        throw UpdateError(Stage::PRECONDITION, "V contains non-finite entries");
    if (!E.allFinite())
        throw UpdateError(Stage::PRECONDITION, "E contains non-finite entries");
    if (!t.allFinite())
        throw UpdateError(Stage::PRECONDITION, "t contains non-finite entries");

    if (config_.check_orthonormality) {
        const Eigen::Index r = V.cols();
        double err = (V.transpose() * V - Eigen::MatrixXd::Identity(r, r))
                         .cwiseAbs().maxCoeff();
        if (err > config_.orthonormality_tolerance) {
            std::ostringstream msg;
            msg << "V columns are not orthonormal (max |V'V - I| = "
                << std::scientific << err << ")";
            throw UpdateError(Stage::PRECONDITION, msg.str());
        }
    }
}

RankOneUpdater::SolveOutput RankOneUpdater::solve_secular(
    const Eigen::VectorXd& lambda_bar, const Eigen::VectorXd& t_bar, double rho) const {

    const int nt = static_cast<int>(lambda_bar.size());

    // For rho < 0 solve diag(-reverse(lambda)) + |rho| t t' instead; root i
    // of the original problem is root nt-1-i of the reversed one.
    const bool descending = rho < 0.0;
    const double scale = std::abs(rho);
    Eigen::VectorXd poles = lambda_bar;
    Eigen::VectorXd weights = t_bar;
    if (descending) {
        poles = -lambda_bar.reverse();
        weights = t_bar.reverse();
    }

    std::vector<SecularRoot> roots(nt);
    std::exception_ptr failure;
    int failed_index = -1;

    #pragma omp parallel for schedule(dynamic) if (config_.parallel && nt > 1)
    for (int i = 0; i < nt; i++) {
        try {
            int k = descending ? nt - 1 - i : i;
            roots[i] = solver_(k, poles, weights, scale, config_.accuracy);
        } catch (...) {
            #pragma omp critical(eigupdate_secular_failure)
            {
                if (!failure || i < failed_index) {
                    failure = std::current_exception();
                    failed_index = i;
                }
            }
        }
    }

    if (failure) {
        try {
            std::rethrow_exception(failure);
        } catch (const std::exception& e) {
            throw UpdateError(UpdateError::Stage::SECULAR_SOLVE,
                              "root " + std::to_string(failed_index) + ": " + e.what());
        }
    }

    SolveOutput out;
    out.mu.resize(nt);
    out.offset.resize(nt);
    out.origin.resize(nt);
    for (int i = 0; i < nt; i++) {
        if (!std::isfinite(roots[i].root))
            throw UpdateError(UpdateError::Stage::SECULAR_SOLVE,
                              "root " + std::to_string(i) + " is not finite");
        out.mu(i) = roots[i].root;

        int origin = roots[i].origin;
        if (origin < 0) {
            out.origin[i] = i;
            out.offset(i) = roots[i].root;
        } else {
            if (origin >= nt || !std::isfinite(roots[i].offset))
                throw UpdateError(UpdateError::Stage::SECULAR_SOLVE,
                                  "root " + std::to_string(i) + " has an invalid origin pole");
            out.origin[i] = descending ? nt - 1 - origin : origin;
            out.offset(i) = roots[i].offset;
        }
        out.total_iterations += roots[i].iterations;
        out.total_time += roots[i].elapsed;
    }
    return out;
}

void RankOneUpdater::reconstruct_eigenvectors(const DeflationResult& deflated,
                                              const SolveOutput& solved, double rho,
                                              Eigen::MatrixXd& W) const {
    const int nt = static_cast<int>(deflated.surviving.size());

    Eigen::MatrixXd Vs(deflated.V.rows(), nt);
    for (int k = 0; k < nt; k++) {
        Vs.col(k) = deflated.V.col(deflated.surviving[k]);
    }

    for (int i = 0; i < nt; i++) {
        // F_i - lambda_j measured from the pole the root was solved against;
        // F_i itself may have rounded onto a pole
        const int origin = solved.origin[i];
        Eigen::ArrayXd gaps = (deflated.lambda_bar(origin) - deflated.lambda_bar.array()) +
                              rho * solved.offset(i);
        if (!gaps.allFinite()) {
            throw UpdateError(UpdateError::Stage::EIGENVECTOR_UPDATE,
                              "eigenvalue gaps for root " + std::to_string(i) +
                              " are not finite");
        }
        if ((gaps == 0.0).any()) {
            throw UpdateError(UpdateError::Stage::EIGENVECTOR_UPDATE,
                              "updated eigenvalue " + std::to_string(i) +
                              " coincides with an original eigenvalue");
        }
        Eigen::VectorXd w = Vs * (deflated.t_bar.array() / gaps).matrix();
        double w_norm = w.stableNorm();
        if (!w.allFinite() || !std::isfinite(w_norm) || w_norm == 0.0) {
            throw UpdateError(UpdateError::Stage::EIGENVECTOR_UPDATE,
                              "eigenvector " + std::to_string(i) +
                              " is numerically unstable (norm " +
                              std::to_string(w_norm) + ")");
        }
        W.col(deflated.surviving[i]) = w / w_norm;
    }
}

RankOneResult RankOneUpdater::compute(const Eigen::MatrixXd& V, const Eigen::VectorXd& E,
                                      const Eigen::VectorXd& t, double rho) const {
    auto start = std::chrono::steady_clock::now();

    validate_inputs(V, E, t, rho);
    const double acc = config_.accuracy;

    SortedSpectrum spectrum = normalize_spectrum(V, E, t, acc);
    DeflationResult deflated = deflate(spectrum, rho, acc, config_.stability_factor,
                                       config_.verbose);
    const int n = static_cast<int>(spectrum.lambda.size());
    const int nt = static_cast<int>(deflated.surviving.size());

    RankOneResult result;
    result.F = spectrum.lambda;
    result.W = deflated.V;
    result.stats.num_evals = nt;
    result.stats.reflected_groups = deflated.reflected_groups;
    result.stats.skipped_reflections = deflated.skipped_reflections;
    result.stats.negligible_weights = deflated.negligible_weights;

    if (nt > 0) {
        SolveOutput solved = solve_secular(deflated.lambda_bar, deflated.t_bar, rho);

        Eigen::VectorXd F_bar(nt);
        for (int k = 0; k < nt; k++) {
            F_bar(k) = deflated.lambda_bar(solved.origin[k]) + rho * solved.offset(k);
            if (!std::isfinite(F_bar(k)))
                throw UpdateError(UpdateError::Stage::SECULAR_SOLVE,
                                  "updated eigenvalue " + std::to_string(k) +
                                  " is not finite");
            if (std::abs(F_bar(k)) < acc) F_bar(k) = 0.0;
            result.F(deflated.surviving[k]) = F_bar(k);
        }

        reconstruct_eigenvectors(deflated, solved, rho, result.W);

        result.stats.avg_eigval_time = solved.total_time / nt;
        result.stats.avg_iters = static_cast<double>(solved.total_iterations) / nt;
    }

    result.stats.total_time = std::chrono::duration<double>(
        std::chrono::steady_clock::now() - start).count();

    if (config_.verbose) {
        std::cerr << "[RankOneUpdate] r=" << n << " solved=" << nt
                  << " deflated=" << (n - nt)
                  << " reflected=" << deflated.reflected_groups
                  << " avg_iters=" << std::fixed << std::setprecision(2)
                  << result.stats.avg_iters << std::defaultfloat
                  << " time=" << std::scientific << result.stats.total_time << "s"
                  << std::defaultfloat << std::endl;
    }
    return result;
}

RankOneResult RankOneUpdater::compute(const Eigen::MatrixXd& V, const Eigen::MatrixXd& E,
                                      const Eigen::VectorXd& t, double rho) const {
    return compute(V, eigenvalue_vector(E), t, rho);
}

RankOneResult rank_one_update(const Eigen::MatrixXd& V, const Eigen::VectorXd& E,
                              const Eigen::VectorXd& t, double rho, double acc) {
    RankOneConfig config;
    config.accuracy = acc;
    return RankOneUpdater(config).compute(V, E, t, rho);
}

RankOneResult rank_one_update(const Eigen::MatrixXd& V, const Eigen::MatrixXd& E,
                              const Eigen::VectorXd& t, double rho, double acc) {
    return rank_one_update(V, eigenvalue_vector(E), t, rho, acc);
}

double orthogonality_error(const Eigen::MatrixXd& W) {
    const Eigen::Index r = W.cols();
    if (r == 0) return 0.0;
    return (W.transpose() * W - Eigen::MatrixXd::Identity(r, r)).cwiseAbs().maxCoeff();
}

double reconstruction_error(const Eigen::MatrixXd& V, const Eigen::VectorXd& E,
                            const Eigen::VectorXd& t, double rho,
                            const Eigen::MatrixXd& W, const Eigen::VectorXd& F) {
    if (V.rows() == 0) return 0.0;
    Eigen::VectorXd u = V * t;
    Eigen::MatrixXd Ap = V * E.asDiagonal() * V.transpose() + rho * u * u.transpose();
    Eigen::MatrixXd Wp = W * F.asDiagonal() * W.transpose();
    return (Wp - Ap).cwiseAbs().maxCoeff();
}

}  // namespace eigupdate
