#pragma once

#include <cstddef>
#include <vector>

#include <Eigen/Dense>

#include "qtraj/generator.hpp"

// Deterministic Lindblad master-equation tools on dense Liouvillians (small D).
// The vec convention is column-major: vec(A X B) = (Bᵀ ⊗ A) vec(X).

namespace qtraj {

// L = -i(I⊗G - Ḡ⊗I) + Σ_k C̄_k⊗C_k, with G the effective generator.
// Equal to -i(I⊗H - Hᵀ⊗I) + Σ_k [C̄_k⊗C_k - ½ I⊗C_k†C_k - ½ (C_k†C_k)ᵀ⊗I].
Eigen::MatrixXcd liouvillian(const Eigen::MatrixXcd& H, const std::vector<CollapseOperator>& c_ops);

enum class MasterEquationMethod { Expm, Rk4 };

struct MasterEquationResult {
    std::vector<double> times;
    std::vector<Eigen::VectorXcd> expect;   // [observable](time index)
    std::vector<Eigen::MatrixXcd> states;   // rho at each output time
};

// Evolve rho0 over the output times (times[0] is the initial time).
//   Expm: rho <- exp(L dt_i) rho per output interval (exponentials reused for equal intervals)
//   Rk4 : fixed-step RK4, each interval cut into equal steps no longer than rk4_dt
MasterEquationResult mesolve(const Eigen::MatrixXcd& H,
                             const std::vector<CollapseOperator>& c_ops,
                             const Eigen::MatrixXcd& rho0,
                             const std::vector<double>& times,
                             const std::vector<Eigen::MatrixXcd>& observables,
                             MasterEquationMethod method = MasterEquationMethod::Expm,
                             double rk4_dt = 1.0e-3);

// Unique steady state of L vec(rho) = 0 with Tr rho = 1. Throws ConfigError when
// the kernel is not one-dimensional (for example without dissipation).
Eigen::MatrixXcd steady_state(const Eigen::MatrixXcd& H, const std::vector<CollapseOperator>& c_ops);

// Eigenvalues of L sorted by descending real part.
Eigen::VectorXcd liouvillian_spectrum(const Eigen::MatrixXcd& L);

// Slowest non-zero relaxation rate, -Re of the leading eigenvalue with |λ| > zero_tol.
double spectral_gap(const Eigen::VectorXcd& spectrum, double zero_tol = 1.0e-9);

} // namespace qtraj
