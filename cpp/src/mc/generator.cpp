// generator.cpp — Effective generator assembly

#include "qtraj/generator.hpp"

#include <algorithm>
#include <cmath>
#include <string>
#include <utility>

#include "qtraj/errors.hpp"
#include "qtraj/ops.hpp"

namespace qtraj {

using Matrix = Eigen::MatrixXcd;

namespace {

inline void validate_shapes(const Matrix& H, const std::vector<CollapseOperator>& c_ops) {
    if (H.rows() != H.cols()) {
        throw DimensionMismatch("build_effective_hamiltonian: Hamiltonian must be square");
    }
    for (std::size_t k = 0; k < c_ops.size(); ++k) {
        const Matrix& C = c_ops[k].matrix;
        if (C.rows() != H.rows() || C.cols() != H.cols()) {
            throw DimensionMismatch("build_effective_hamiltonian: collapse operator " + std::to_string(k) +
                                    " (" + c_ops[k].label + ") is " + std::to_string(C.rows()) + "x" +
                                    std::to_string(C.cols()) + ", expected " + std::to_string(H.rows()) +
                                    "x" + std::to_string(H.cols()));
        }
    }
}

} // namespace

CollapseOperator make_collapse(std::string label, double rate, const Matrix& A) {
    if (!std::isfinite(rate) || rate < 0.0) {
        throw ConfigError("make_collapse: rate for '" + label + "' must be finite and >= 0");
    }
    CollapseOperator c;
    c.label = std::move(label);
    c.matrix = std::sqrt(rate) * A;
    return c;
}

Matrix build_effective_hamiltonian(const Matrix& H, const std::vector<CollapseOperator>& c_ops) {
    validate_shapes(H, c_ops);
    Matrix G = H;
    const complex half_i(0.0, 0.5);
    for (const auto& c : c_ops) {
        G.noalias() -= half_i * (c.matrix.adjoint() * c.matrix);
    }
    return G;
}

EffectiveGenerator::EffectiveGenerator(const Matrix& hamiltonian, std::vector<CollapseOperator> c_ops)
    : H_(hamiltonian), c_ops_(std::move(c_ops)) {
    if (H_.rows() == 0) {
        throw ConfigError("EffectiveGenerator: Hamiltonian dimension must be > 0");
    }
    G_ = build_effective_hamiltonian(H_, c_ops_);
    if (!ops::is_hermitian(H_, 1e-10 * std::max(1.0, H_.cwiseAbs().maxCoeff()))) {
        throw ConfigError("EffectiveGenerator: Hamiltonian must be Hermitian");
    }
    dim_ = static_cast<std::size_t>(H_.rows());
    minus_i_G_ = complex(0.0, -1.0) * G_;
    CdagC_.reserve(c_ops_.size());
    for (const auto& c : c_ops_) {
        CdagC_.push_back(c.matrix.adjoint() * c.matrix);
    }
}

} // namespace qtraj
