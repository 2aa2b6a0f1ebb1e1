#pragma once

#include "eigupdate/common.hpp"
#include <functional>

namespace eigupdate {

struct SecularRoot {
    double root = 0.0;      // mu: the updated eigenvalue is d(index) + scale * mu
    int iterations = 0;
    double elapsed = 0.0;   // wall time (s)

    // Optional: the same root measured from pole d(origin), i.e.
    //   d(index) + scale * mu == d(origin) + scale * offset.
    // Lets callers form distances to a nearby pole without cancellation.
    // origin < 0 means not provided.
    int origin = -1;
    double offset = 0.0;
};

// Solves one secular equation
//   1 + scale * sum_j w_j^2 / (d_j - x) = 0,   x = d(index) + scale * mu
// for the root bracketed by d(index) and d(index+1) (or beyond the last pole
// for the topmost index). d must be ascending with distinct entries,
// w(index) != 0 and scale > 0. Non-convergence must be reported by throwing.
using SecularRootSolver = std::function<SecularRoot(
    int index, const Eigen::VectorXd& eigenvalues, const Eigen::VectorXd& weights,
    double scale, double tolerance)>;

class SecularConvergenceError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Safeguarded rational-interpolation root finder for the secular equation.
//
// Works in scaled coordinates delta_j = (d_j - d_origin) / scale where the
// origin is the pole nearest to the root, which keeps the distance to that
// pole free of cancellation. Each step fits
//   g(x) = C + b / (delta_left - x) + s / (delta_right - x)
// to the value and derivative of the left and right partial sums at the
// current iterate and takes the root of g inside the bracket. Steps leaving
// the bracket fall back to bisection.
class RationalSecularSolver {
public:
    struct Config {
        int max_iterations = 100;
    };

    RationalSecularSolver() = default;
    explicit RationalSecularSolver(const Config& cfg) : cfg_(cfg) {}

    SecularRoot operator()(int index, const Eigen::VectorXd& eigenvalues,
                           const Eigen::VectorXd& weights, double scale,
                           double tolerance) const;

    const Config& config() const { return cfg_; }

    // f(mu) = 1 + sum_j w_j^2 / ((d_j - d(index)) / scale - mu)
    static double secular_function(int index, const Eigen::VectorXd& eigenvalues,
                                   const Eigen::VectorXd& weights, double scale,
                                   double mu);

private:
    Config cfg_;
};

}  // namespace eigupdate
