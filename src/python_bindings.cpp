#include <pybind11/pybind11.h>
#include <pybind11/eigen.h>
#include <pybind11/stl.h>
#include <pybind11/functional.h>

#include "eigupdate/common.hpp"
#include "eigupdate/normalizer.hpp"
#include "eigupdate/secular_solver.hpp"
#include "eigupdate/rank_one_update.hpp"

namespace py = pybind11;
using namespace eigupdate;

PYBIND11_MODULE(_core, m) {
    m.doc() = "Rank-one update of a symmetric eigendecomposition via the secular equation";

    m.attr("DEFAULT_ACCURACY") = DEFAULT_ACCURACY;
    m.attr("DEFAULT_STABILITY_FACTOR") = DEFAULT_STABILITY_FACTOR;

    // --- Errors ---
    py::register_exception<UpdateError>(m, "UpdateError", PyExc_RuntimeError);
    py::register_exception<SecularConvergenceError>(m, "SecularConvergenceError",
                                                    PyExc_RuntimeError);

    // --- Secular solver ---
    py::class_<SecularRoot>(m, "SecularRoot")
        .def(py::init<>())
        .def(py::init([](double root, int iterations, double elapsed, int origin,
                         double offset) {
                 return SecularRoot{root, iterations, elapsed, origin, offset};
             }),
             py::arg("root"), py::arg("iterations") = 0, py::arg("elapsed") = 0.0,
             py::arg("origin") = -1, py::arg("offset") = 0.0)
        .def_readwrite("root", &SecularRoot::root,
                       "mu such that the eigenvalue is d[index] + scale * mu")
        .def_readwrite("iterations", &SecularRoot::iterations)
        .def_readwrite("elapsed", &SecularRoot::elapsed, "Solve time (s)")
        .def_readwrite("origin", &SecularRoot::origin,
                       "Pole the root is measured from (-1: index)")
        .def_readwrite("offset", &SecularRoot::offset,
                       "Root relative to eigenvalues[origin], in units of scale")
        .def("__repr__", [](const SecularRoot& r) {
            return "<SecularRoot root=" + std::to_string(r.root) +
                   " iterations=" + std::to_string(r.iterations) + ">";
        });

    py::class_<RationalSecularSolver::Config>(m, "SecularSolverConfig")
        .def(py::init<>())
        .def_readwrite("max_iterations", &RationalSecularSolver::Config::max_iterations);

    py::class_<RationalSecularSolver>(m, "RationalSecularSolver")
        .def(py::init<>())
        .def(py::init<const RationalSecularSolver::Config&>(), py::arg("config"))
        .def("__call__", &RationalSecularSolver::operator(),
             py::arg("index"), py::arg("eigenvalues"), py::arg("weights"),
             py::arg("scale"), py::arg("tolerance") = DEFAULT_ACCURACY,
             "Solve the secular equation for the root above eigenvalues[index]")
        .def_property_readonly("config", &RationalSecularSolver::config)
        .def_static("secular_function", &RationalSecularSolver::secular_function,
                    py::arg("index"), py::arg("eigenvalues"), py::arg("weights"),
                    py::arg("scale"), py::arg("mu"));

    // --- Configuration / results ---
    py::class_<RankOneConfig>(m, "RankOneConfig")
        .def(py::init<>())
        .def_readwrite("accuracy", &RankOneConfig::accuracy,
                       "Relative precision floor; <= 1e-10 for accurate eigenvectors")
        .def_readwrite("stability_factor", &RankOneConfig::stability_factor)
        .def_readwrite("check_orthonormality", &RankOneConfig::check_orthonormality)
        .def_readwrite("orthonormality_tolerance", &RankOneConfig::orthonormality_tolerance)
        .def_readwrite("parallel", &RankOneConfig::parallel)
        .def_readwrite("verbose", &RankOneConfig::verbose);

    py::class_<RankOneStats>(m, "RankOneStats")
        .def(py::init<>())
        .def_readonly("total_time", &RankOneStats::total_time)
        .def_readonly("avg_eigval_time", &RankOneStats::avg_eigval_time)
        .def_readonly("avg_iters", &RankOneStats::avg_iters)
        .def_readonly("num_evals", &RankOneStats::num_evals)
        .def_readonly("reflected_groups", &RankOneStats::reflected_groups)
        .def_readonly("skipped_reflections", &RankOneStats::skipped_reflections)
        .def_readonly("negligible_weights", &RankOneStats::negligible_weights)
        .def("__repr__", [](const RankOneStats& s) {
            return "<RankOneStats num_evals=" + std::to_string(s.num_evals) +
                   " avg_iters=" + std::to_string(s.avg_iters) +
                   " total_time=" + std::to_string(s.total_time) + ">";
        });

    py::class_<RankOneResult>(m, "RankOneResult")
        .def_readonly("W", &RankOneResult::W, "Updated eigenvectors (N x r)")
        .def_readonly("F", &RankOneResult::F, "Updated eigenvalues (r)")
        .def_readonly("stats", &RankOneResult::stats)
        .def("__iter__", [](const RankOneResult& r) {
            return py::iter(py::make_tuple(r.W, r.F, r.stats));
        });

    // --- Updater ---
    py::class_<RankOneUpdater>(m, "RankOneUpdater")
        .def(py::init<>())
        .def(py::init<const RankOneConfig&>(), py::arg("config"))
        .def(py::init<const RankOneConfig&, SecularRootSolver>(),
             py::arg("config"), py::arg("solver"),
             "Use a custom secular root solver: solver(index, eigenvalues, weights, "
             "scale, tolerance) -> SecularRoot")
        .def("compute",
             [](const RankOneUpdater& self, const Eigen::MatrixXd& V,
                const Eigen::MatrixXd& E, const Eigen::VectorXd& t, double rho) {
                 return self.compute(V, E, t, rho);
             },
             py::arg("V"), py::arg("E"), py::arg("t"), py::arg("rho"),
             // A Python solver reacquires the GIL per call, from OpenMP workers too
             py::call_guard<py::gil_scoped_release>(),
             "Eigendecomposition of V*(diag(E) + rho*t*t')*V'")
        .def_property_readonly("config", &RankOneUpdater::config);

    m.def("rank_one_update",
          [](const Eigen::MatrixXd& V, const Eigen::MatrixXd& E,
             const Eigen::VectorXd& t, double rho, double acc) {
              return rank_one_update(V, E, t, rho, acc);
          },
          py::arg("V"), py::arg("E"), py::arg("t"), py::arg("rho"),
          py::arg("acc") = DEFAULT_ACCURACY,
          py::call_guard<py::gil_scoped_release>(),
          "Returns (W, F, stats) with V*(diag(E) + rho*t*t')*V' = W*diag(F)*W'. "
          "E may be a vector or a diagonal matrix.");

    m.def("eigenvalue_vector", &eigenvalue_vector, py::arg("E"));
    m.def("orthogonality_error", &orthogonality_error, py::arg("W"));
    m.def("reconstruction_error", &reconstruction_error,
          py::arg("V"), py::arg("E"), py::arg("t"), py::arg("rho"),
          py::arg("W"), py::arg("F"));
}
