#include <pybind11/pybind11.h>
#include <pybind11/eigen.h>
#include <pybind11/stl.h>

#include <cstdint>
#include <string>
#include <vector>

#include "qtraj/ensemble.hpp"
#include "qtraj/version.hpp"

namespace py = pybind11;

namespace {

py::dict simulate_py(const Eigen::MatrixXcd& H,
                     const std::vector<Eigen::MatrixXcd>& c_ops,
                     const Eigen::VectorXcd& psi0,
                     const std::vector<double>& times,
                     const std::vector<Eigen::MatrixXcd>& observables,
                     std::size_t n_trajectories,
                     const std::vector<double>& rates,
                     std::uint64_t seed,
                     double atol,
                     double rtol,
                     int n_workers,
                     double min_success_fraction) {
    if (!rates.empty() && rates.size() != c_ops.size()) {
        throw qtraj::ConfigError("simulate: rates must be empty or match c_ops");
    }
    std::vector<qtraj::CollapseOperator> collapse;
    for (std::size_t k = 0; k < c_ops.size(); ++k) {
        collapse.push_back(qtraj::make_collapse("c" + std::to_string(k), rates.empty() ? 1.0 : rates[k], c_ops[k]));
    }
    qtraj::Options opts;
    opts.atol = atol;
    opts.rtol = rtol;
    opts.n_workers = n_workers;
    opts.min_success_fraction = min_success_fraction;

    qtraj::EnsembleResult res;
    {
        py::gil_scoped_release release;
        res = qtraj::simulate(H, collapse, psi0, times, observables, n_trajectories, seed, opts);
    }

    py::dict out;
    out["times"] = res.times;
    out["expect"] = res.expect;
    out["std_error"] = res.std_error;
    out["n_success"] = res.n_success;
    out["n_trajectories"] = res.n_trajectories;
    py::list failures;
    for (const auto& f : res.failures) {
        failures.append(py::make_tuple(f.index, qtraj::to_string(f.kind), f.time, f.message));
    }
    out["failures"] = failures;
    return out;
}

} // namespace

PYBIND11_MODULE(_qtraj_native, m) {
    m.doc() = "qtraj native bindings";
    m.def("version", &qtraj::version);
    m.def("simulate", &simulate_py,
          py::arg("H"), py::arg("c_ops"), py::arg("psi0"), py::arg("times"), py::arg("observables"),
          py::arg("n_trajectories"), py::arg("rates") = std::vector<double>{}, py::arg("seed") = 0,
          py::arg("atol") = 1.0e-8, py::arg("rtol") = 1.0e-6,
          py::arg("n_workers") = 0, py::arg("min_success_fraction") = 0.5);
}
