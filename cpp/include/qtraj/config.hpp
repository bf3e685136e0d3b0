// config.hpp — YAML description of a trajectory run (system, collapse channels, observables, solver settings)

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include <Eigen/Dense>
#include <yaml-cpp/yaml.h>

#include "qtraj/generator.hpp"
#include "qtraj/lindblad.hpp"
#include "qtraj/options.hpp"

namespace qtraj::config {

struct OutputPaths {
    std::string expect_csv;   // ensemble means and standard errors
    std::string jumps_csv;    // jump events of retained trajectories
    std::string rho_csv;      // averaged density matrix at the last output time
    std::string reference_csv;  // master-equation expectation series
};

struct ReferenceSettings {
    bool enabled = false;
    MasterEquationMethod method = MasterEquationMethod::Expm;
    double rk4_dt = 1.0e-3;
};

struct Problem {
    std::size_t dim = 0;
    Eigen::MatrixXcd H;
    std::vector<CollapseOperator> c_ops;
    std::vector<std::string> observable_labels;
    std::vector<Eigen::MatrixXcd> observables;
    Eigen::VectorXcd psi0;
    std::vector<double> times;

    std::size_t n_trajectories = 100;
    std::uint64_t seed = 0;
    Options options;

    ReferenceSettings reference;
    OutputPaths output;
    bool show_progress = false;
};

// Operator node forms:
//   sigma_x                            named operator (Pauli names imply dim 2)
//   {op: destroy, dim: 4, scale: 0.5}  named operator with explicit dim and factor
//   {re: [[...]], im: [[...]]}         explicit matrix, im optional
//   [term, term, ...]                  sum of the above
// dim = 0 means "infer"; ladder operators then need an explicit dim.
Eigen::MatrixXcd parse_operator(const YAML::Node& n, std::size_t dim, const std::string& name);

// Either an explicit list or {t0, tf, steps} with steps >= 2 output points.
std::vector<double> parse_times(const YAML::Node& n, const std::string& name);

// Basis index, a list of real amplitudes, or {re: [...], im: [...]}.
Eigen::VectorXcd parse_state(const YAML::Node& n, std::size_t dim, const std::string& name);

// Fields missing from the node keep their defaults.
Options parse_options(const YAML::Node& n);

// Throws std::runtime_error naming the offending key on malformed input.
Problem load_problem(const YAML::Node& root);
Problem load_problem_file(const std::string& path);

} // namespace qtraj::config
