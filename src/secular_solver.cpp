#include "eigupdate/secular_solver.hpp"
#include <algorithm>
#include <chrono>

namespace eigupdate {

namespace {

struct PartialSums {
    double psi = 0.0;    // poles j <= split
    double dpsi = 0.0;
    double phi = 0.0;    // poles j > split
    double dphi = 0.0;
};

PartialSums partial_sums(const Eigen::VectorXd& delta, const Eigen::VectorXd& w2,
                         int split, double x) {
    PartialSums s;
    const int n = static_cast<int>(delta.size());
    for (int j = 0; j < n; j++) {
        double inv = 1.0 / (delta(j) - x);
        double term = w2(j) * inv;
        if (j <= split) {
            s.psi += term;
            s.dpsi += term * inv;
        } else {
            s.phi += term;
            s.dphi += term * inv;
        }
    }
    return s;
}

// Root of the interpolating model inside the bracket, NaN if there is none.
// hi_closed: hi is not a pole and may itself be returned.
double model_root(const PartialSums& s, double x, double left, double right,
                  bool has_right, double lo, double hi, bool hi_closed) {
    auto inside = [&](double y) {
        return y > lo && (y < hi || (hi_closed && y <= hi));
    };
    const double NaN = std::numeric_limits<double>::quiet_NaN();

    double b = s.dpsi * (left - x) * (left - x);
    double C = 1.0 + s.psi - s.dpsi * (left - x);

    if (!has_right) {
        // C + b / (left - y) = 0
        if (C <= 0.0) return NaN;
        double y = left + b / C;
        return inside(y) ? y : NaN;
    }

    double r = s.dphi * (right - x) * (right - x);
    C += s.phi - s.dphi * (right - x);

    // C (left - y)(right - y) + b (right - y) + r (left - y) = 0
    double qa = C;
    double qb = -(C * (left + right) + b + r);
    double qc = C * left * right + b * right + r * left;
    double disc = std::max(qb * qb - 4.0 * qa * qc, 0.0);
    double q = -0.5 * (qb + std::copysign(std::sqrt(disc), qb));

    if (q != 0.0) {
        double y = qc / q;
        if (inside(y)) return y;
    }
    if (qa != 0.0) {
        double y = q / qa;
        if (inside(y)) return y;
    }
    return NaN;
}

}  // namespace

SecularRoot RationalSecularSolver::operator()(
    int index, const Eigen::VectorXd& eigenvalues, const Eigen::VectorXd& weights,
    double scale, double tolerance) const {

    auto start = std::chrono::steady_clock::now();
    auto elapsed = [&start]() {
        return std::chrono::duration<double>(
            std::chrono::steady_clock::now() - start).count();
    };

    const int n = static_cast<int>(eigenvalues.size());
    if (n == 0)
        throw std::invalid_argument("RationalSecularSolver: no poles given");
    if (weights.size() != n)
        throw std::invalid_argument(
            "RationalSecularSolver: weights must have the same length as eigenvalues");
    if (index < 0 || index >= n)
        throw std::invalid_argument(
            "RationalSecularSolver: index " + std::to_string(index) + " out of range");
    if (!(scale > 0.0) || !std::isfinite(scale))
        throw std::invalid_argument("RationalSecularSolver: scale must be positive and finite");
    if (weights(index) == 0.0)
        throw std::invalid_argument(
            "RationalSecularSolver: zero weight at index " + std::to_string(index));

    Eigen::VectorXd w2 = weights.array().square();
    const bool has_right = index < n - 1;
    const double ftol = std::max(tolerance, 8.0 * n * EPS);

    // Bracket in coordinates relative to the origin pole
    int origin = index;
    double lo = 0.0;
    double hi = 0.0;
    if (has_right) {
        if (!(eigenvalues(index + 1) > eigenvalues(index)))
            throw std::invalid_argument(
                "RationalSecularSolver: eigenvalues must be strictly ascending");

        double gap = (eigenvalues(index + 1) - eigenvalues(index)) / scale;
        Eigen::VectorXd delta = (eigenvalues.array() - eigenvalues(index)) / scale;
        PartialSums mid = partial_sums(delta, w2, index, 0.5 * gap);
        double fmid = 1.0 + mid.psi + mid.phi;
        if (fmid == 0.0)
            return {0.5 * gap, 1, elapsed(), index, 0.5 * gap};
        if (fmid > 0.0) {
            hi = 0.5 * gap;
        } else {
            origin = index + 1;
        }
    } else {
        // f(||w||^2) >= 0 since every delta_j <= 0
        hi = w2.sum();
    }

    Eigen::VectorXd delta = (eigenvalues.array() - eigenvalues(origin)) / scale;
    const double left = delta(index);
    const double right = has_right ? delta(index + 1)
                                   : std::numeric_limits<double>::infinity();
    if (origin != index) {
        lo = left;
        hi = 0.0;
    }
    bool hi_closed = !has_right;

    double x = 0.5 * (lo + hi);
    for (int iter = 1; iter <= cfg_.max_iterations; iter++) {
        PartialSums s = partial_sums(delta, w2, index, x);
        double f = 1.0 + s.psi + s.phi;
        if (!std::isfinite(f))
            throw SecularConvergenceError(
                "RationalSecularSolver: non-finite secular function at index " +
                std::to_string(index));

        if (std::abs(f) <= ftol * (1.0 + std::abs(s.psi) + std::abs(s.phi)))
            return {x - left, iter, elapsed(), origin, x};

        if (f < 0.0) {
            lo = x;
        } else {
            hi = x;
            hi_closed = false;
        }
        if (hi - lo <= 2.0 * EPS * std::max(std::abs(lo), std::abs(hi))) {
            double xm = 0.5 * (lo + hi);
            return {xm - left, iter, elapsed(), origin, xm};
        }

        double y = model_root(s, x, left, right, has_right, lo, hi, hi_closed);
        x = std::isnan(y) ? 0.5 * (lo + hi) : y;
    }

    throw SecularConvergenceError(
        "RationalSecularSolver: no convergence for index " + std::to_string(index) +
        " after " + std::to_string(cfg_.max_iterations) + " iterations");
}

double RationalSecularSolver::secular_function(
    int index, const Eigen::VectorXd& eigenvalues, const Eigen::VectorXd& weights,
    double scale, double mu) {
    double f = 1.0;
    for (int j = 0; j < eigenvalues.size(); j++) {
        double delta = (eigenvalues(j) - eigenvalues(index)) / scale;
        f += weights(j) * weights(j) / (delta - mu);
    }
    return f;
}

}  // namespace eigupdate
