// ensemble.hpp — Monte Carlo wavefunction ensemble driver

#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include <Eigen/Dense>

#include "qtraj/aggregator.hpp"
#include "qtraj/errors.hpp"
#include "qtraj/generator.hpp"
#include "qtraj/options.hpp"

namespace qtraj {

// Run n_trajectories independent quantum trajectories and reduce them into
// ensemble means of the given observables at the output times.
//
//   H            : D x D Hermitian Hamiltonian
//   c_ops        : collapse operators, sqrt(rate) already folded in
//   psi0         : initial state (normalised on entry)
//   times        : strictly increasing output times, times[0] = t0
//   seed         : trajectory i draws from RandomStream(seed, i)
//
// Setup problems throw ConfigError or DimensionMismatch before any trajectory
// runs. Per-trajectory failures are collected into the result; EnsembleFailure
// is thrown when fewer than ceil(min_success_fraction * n_trajectories)
// trajectories (or none at all) succeed.
EnsembleResult simulate(const Eigen::MatrixXcd& H,
                        const std::vector<CollapseOperator>& c_ops,
                        const Eigen::VectorXcd& psi0,
                        const std::vector<double>& times,
                        const std::vector<Eigen::MatrixXcd>& observables,
                        std::size_t n_trajectories,
                        std::uint64_t seed,
                        const Options& options = Options{});

// Same as above for a prebuilt generator.
EnsembleResult simulate(const EffectiveGenerator& generator,
                        const Eigen::VectorXcd& psi0,
                        const std::vector<double>& times,
                        const std::vector<Eigen::MatrixXcd>& observables,
                        std::size_t n_trajectories,
                        std::uint64_t seed,
                        const Options& options = Options{});

// Minimum number of successes accepted for M trajectories (never below 1).
std::size_t required_successes(std::size_t n_trajectories, double min_success_fraction);

} // namespace qtraj
