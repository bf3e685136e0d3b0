// generator.hpp — Collapse operators and the non-Hermitian effective generator

#pragma once

#include <cstddef>
#include <complex>
#include <string>
#include <vector>

#include <Eigen/Dense>

namespace qtraj {

using complex = std::complex<double>;

struct CollapseOperator {
    std::string label;
    // sqrt(rate) * A in the lab basis
    Eigen::MatrixXcd matrix;
};

// Scale A by sqrt(rate). Throws ConfigError for a negative or non-finite rate.
CollapseOperator make_collapse(std::string label, double rate, const Eigen::MatrixXcd& A);

// G = H - (i/2) Σ_k C_k† C_k. Throws DimensionMismatch on inconsistent shapes.
Eigen::MatrixXcd build_effective_hamiltonian(const Eigen::MatrixXcd& H,
                                             const std::vector<CollapseOperator>& c_ops);

// Immutable bundle shared read-only by every trajectory of a run.
class EffectiveGenerator {
public:
    EffectiveGenerator(const Eigen::MatrixXcd& hamiltonian,
                       std::vector<CollapseOperator> c_ops);

    std::size_t dimension() const noexcept { return dim_; }
    std::size_t num_collapse_operators() const noexcept { return c_ops_.size(); }
    bool has_dissipation() const noexcept { return !c_ops_.empty(); }

    const Eigen::MatrixXcd& hamiltonian() const noexcept { return H_; }
    const Eigen::MatrixXcd& matrix() const noexcept { return G_; }
    // -i G, the right-hand side operator of dpsi/dt = -i G psi
    const Eigen::MatrixXcd& rhs_operator() const noexcept { return minus_i_G_; }

    const std::vector<CollapseOperator>& collapse_operators() const noexcept { return c_ops_; }
    const Eigen::MatrixXcd& collapse_matrix(std::size_t k) const { return c_ops_.at(k).matrix; }
    // C_k† C_k
    const Eigen::MatrixXcd& rate_operator(std::size_t k) const { return CdagC_.at(k); }

private:
    std::size_t dim_ = 0;
    Eigen::MatrixXcd H_;
    Eigen::MatrixXcd G_;
    Eigen::MatrixXcd minus_i_G_;
    std::vector<CollapseOperator> c_ops_;
    std::vector<Eigen::MatrixXcd> CdagC_;
};

} // namespace qtraj
