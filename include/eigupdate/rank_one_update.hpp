#pragma once

#include "eigupdate/common.hpp"
#include "eigupdate/deflation.hpp"
#include "eigupdate/secular_solver.hpp"

namespace eigupdate {

struct RankOneConfig {
    double accuracy = DEFAULT_ACCURACY;                  // acc; use <= 1e-10 when W matters
    double stability_factor = DEFAULT_STABILITY_FACTOR;  // Gt in the deflation guards
    bool check_orthonormality = true;                    // verify V'V = I before updating
    double orthonormality_tolerance = 1e-8;
    bool parallel = false;   // OpenMP across secular solves (needs an OpenMP build)
    bool verbose = false;    // deflation/solve diagnostics on stderr
};

struct RankOneStats {
    double total_time = 0.0;        // whole update (s)
    double avg_eigval_time = 0.0;   // mean secular solve time (s)
    double avg_iters = 0.0;         // mean secular solve iterations
    int num_evals = 0;              // number of secular equations solved

    int reflected_groups = 0;
    int skipped_reflections = 0;
    int negligible_weights = 0;
};

// Updated eigendecomposition A + rho*u*u' = W * diag(F) * W'.
// Columns of W and entries of F follow the ascending order of the input
// eigenvalues, not the input order.
struct RankOneResult {
    Eigen::MatrixXd W;
    Eigen::VectorXd F;
    RankOneStats stats;
};

// Rank-one modification of a symmetric eigendecomposition.
//
// Given A = V * diag(E) * V' and t = V' * u, computes the eigendecomposition
// of V * (diag(E) + rho * t * t') * V' by deflation and one secular equation
// per surviving pole, with eigenvectors from the Bunch-Nielsen-Sorensen
// closed form
//   w_i = V_s * diag(1 / (F_i - E_s)) * t_s,   normalized.
// The closed form needs the updated eigenvalues to much higher relative
// precision than acc ~ 1e-6 gives; eigenvector accuracy for acc looser than
// 1e-10 is best-effort only.
//
// Tight clusters of distinct eigenvalues rely on the solver reporting each
// root relative to its nearest pole (SecularRoot::origin / offset), as
// RationalSecularSolver does. A solver that reports only mu keeps the updated
// eigenvalues accurate, but orthogonality of the clustered columns degrades to
// roughly eps / delta for poles a relative distance delta apart (about 1e-6
// for poles 1e-9 apart).
//
// V may be a reduced basis (N x r, r < N); the update is then rank-preserving.
class RankOneUpdater {
public:
    RankOneUpdater();
    explicit RankOneUpdater(const RankOneConfig& config);
    RankOneUpdater(const RankOneConfig& config, SecularRootSolver solver);

    // Throws UpdateError on bad input or numerical failure; no partial results.
    RankOneResult compute(const Eigen::MatrixXd& V, const Eigen::VectorXd& E,
                          const Eigen::VectorXd& t, double rho) const;

    // E as a vector (r x 1 or 1 x r) or an r x r diagonal matrix.
    RankOneResult compute(const Eigen::MatrixXd& V, const Eigen::MatrixXd& E,
                          const Eigen::VectorXd& t, double rho) const;

    const RankOneConfig& config() const { return config_; }

private:
    struct SolveOutput {
        Eigen::VectorXd mu;
        std::vector<int> origin;    // pole each root was solved against, lambda_bar indexing
        Eigen::VectorXd offset;     // F_i = lambda_bar(origin[i]) + rho * offset(i)
        long total_iterations = 0;
        double total_time = 0.0;
    };

    void validate_inputs(const Eigen::MatrixXd& V, const Eigen::VectorXd& E,
                         const Eigen::VectorXd& t, double rho) const;

    // One secular solve per surviving pole. rho < 0 is mapped onto rho > 0 by
    // negating and reversing the poles.
    SolveOutput solve_secular(const Eigen::VectorXd& lambda_bar,
                              const Eigen::VectorXd& t_bar, double rho) const;

    void reconstruct_eigenvectors(const DeflationResult& deflated,
                                  const SolveOutput& solved, double rho,
                                  Eigen::MatrixXd& W) const;

    RankOneConfig config_;
    SecularRootSolver solver_;
};

// Convenience wrapper with the default solver and configuration.
RankOneResult rank_one_update(const Eigen::MatrixXd& V, const Eigen::VectorXd& E,
                              const Eigen::VectorXd& t, double rho,
                              double acc = DEFAULT_ACCURACY);
RankOneResult rank_one_update(const Eigen::MatrixXd& V, const Eigen::MatrixXd& E,
                              const Eigen::VectorXd& t, double rho,
                              double acc = DEFAULT_ACCURACY);

// max |W'W - I|
double orthogonality_error(const Eigen::MatrixXd& W);

// max |W diag(F) W' - (V diag(E) V' + rho (V t)(V t)')|
double reconstruction_error(const Eigen::MatrixXd& V, const Eigen::VectorXd& E,
                            const Eigen::VectorXd& t, double rho,
                            const Eigen::MatrixXd& W, const Eigen::VectorXd& F);

}  // namespace eigupdate
