// ops.hpp — Small operators and state helpers: Pauli, ladder, kets, Kronecker, expectation values

#pragma once

#include <Eigen/Dense>
#include <Eigen/Eigenvalues>
#include <unsupported/Eigen/KroneckerProduct>

#include <cmath>
#include <complex>
#include <cstddef>
#include <stdexcept>
#include <vector>

namespace qtraj::ops {

using Matrix = Eigen::MatrixXcd;
using Vector = Eigen::VectorXcd;

// --------------------------- 2×2 Pauli and ladder ---------------------------

inline Matrix identity(std::size_t N) {
    if (N == 0) throw std::invalid_argument("identity: N must be > 0");
    const auto n = static_cast<Eigen::Index>(N);
    return Matrix::Identity(n, n);
}

inline Matrix sigma_x() {
    Matrix M(2,2);
    M << 0.0, 1.0,
         1.0, 0.0;
    return M;
}

inline Matrix sigma_y() {
    Matrix M(2,2);
    M << 0.0, std::complex<double>(0.0, -1.0),
         std::complex<double>(0.0, +1.0), 0.0;
    return M;
}

inline Matrix sigma_z() {
    Matrix M(2,2);
    M << 1.0,  0.0,
         0.0, -1.0;
    return M;
}

inline Matrix sigma_plus() { // |1><0|
    Matrix M = Matrix::Zero(2,2);
    M(1,0) = 1.0;
    return M;
}

inline Matrix sigma_minus() { // |0><1|
    Matrix M = Matrix::Zero(2,2);
    M(0,1) = 1.0;
    return M;
}

// a |n> = sqrt(n) |n-1>
inline Matrix destroy(std::size_t N) {
    if (N == 0) throw std::invalid_argument("destroy: N must be > 0");
    Matrix M = Matrix::Zero(static_cast<Eigen::Index>(N), static_cast<Eigen::Index>(N));
    for (std::size_t n = 1; n < N; ++n) {
        M(static_cast<Eigen::Index>(n-1), static_cast<Eigen::Index>(n)) = std::sqrt(static_cast<double>(n));
    }
    return M;
}

inline Matrix create(std::size_t N) { return destroy(N).adjoint(); }

inline Matrix num(std::size_t N) {
    if (N == 0) throw std::invalid_argument("num: N must be > 0");
    Matrix M = Matrix::Zero(static_cast<Eigen::Index>(N), static_cast<Eigen::Index>(N));
    for (std::size_t n = 0; n < N; ++n) {
        M(static_cast<Eigen::Index>(n), static_cast<Eigen::Index>(n)) = static_cast<double>(n);
    }
    return M;
}

// |i><j| in N-dimensional Hilbert space
inline Matrix basis_op(std::size_t N, std::size_t i, std::size_t j) {
    if (N == 0) throw std::invalid_argument("basis_op: N must be > 0");
    if (i >= N || j >= N) throw std::out_of_range("basis_op: index out of range");
    Matrix M = Matrix::Zero(static_cast<Eigen::Index>(N), static_cast<Eigen::Index>(N));
    M(static_cast<Eigen::Index>(i), static_cast<Eigen::Index>(j)) = 1.0;
    return M;
}

inline Matrix projector(std::size_t N, std::size_t i) { return basis_op(N, i, i); }

// --------------------------- Kets and tensor products -----------------------

inline Vector ket(std::size_t N, std::size_t i) {
    if (N == 0) throw std::invalid_argument("ket: N must be > 0");
    if (i >= N) throw std::out_of_range("ket: index out of range");
    Vector v = Vector::Zero(static_cast<Eigen::Index>(N));
    v(static_cast<Eigen::Index>(i)) = 1.0;
    return v;
}

inline Matrix kron(const Matrix& A, const Matrix& B) {
    const auto expr = Eigen::kroneckerProduct(A, B);
    Matrix K(expr.rows(), expr.cols());
    K = expr;
    return K;
}

inline Vector kron_ket(const Vector& a, const Vector& b) {
    Vector k(a.size() * b.size());
    for (Eigen::Index i = 0; i < a.size(); ++i) {
        k.segment(i * b.size(), b.size()) = a(i) * b;
    }
    return k;
}

// A_0 ⊗ A_1 ⊗ ... (left to right)
inline Matrix tensor(const std::vector<Matrix>& factors) {
    if (factors.empty()) throw std::invalid_argument("tensor: empty factor list");
    Matrix out = factors.front();
    for (std::size_t k = 1; k < factors.size(); ++k) out = kron(out, factors[k]);
    return out;
}

inline Matrix rho_pure(const Vector& psi_raw) {
    Vector psi = psi_raw;
    const double nrm = psi.norm();
    if (nrm > 0.0) psi /= nrm;
    return psi * psi.adjoint();
}

// --------------------------- Expectation values -----------------------------

// <psi|O|psi> / <psi|psi>; the division keeps sub-normalised states unbiased.
inline std::complex<double> expect(const Matrix& O, const Vector& psi) {
    const double n2 = psi.squaredNorm();
    if (!(n2 > 0.0)) throw std::invalid_argument("expect: state has zero norm");
    return psi.dot(O * psi) / n2;
}

// Tr(O rho)
inline std::complex<double> expect_rho(const Matrix& O, const Matrix& rho) {
    if (O.rows() != rho.rows() || O.cols() != rho.cols()) {
        throw std::invalid_argument("expect_rho: dimension mismatch");
    }
    return (O * rho).trace();
}

// --------------------------- Algebra and checks -----------------------------

inline Matrix hermitize(const Matrix& A) { return 0.5 * (A + A.adjoint()); }

inline Matrix hermitize_and_normalize(const Matrix& rho) {
    Matrix out = hermitize(rho);
    const std::complex<double> tr = out.trace();
    if (std::abs(tr) > 0.0) out /= tr;
    return out;
}

inline bool is_hermitian(const Matrix& A, double tol = 1e-12) {
    if (A.rows() != A.cols()) return false;
    if (A.size() == 0) return true;
    return (A - A.adjoint()).cwiseAbs().maxCoeff() <= tol;
}

// Trace distance D(ρ,σ) = 1/2 ||ρ-σ||_1 (for Hermitian difference)
inline double trace_distance(const Matrix& rho, const Matrix& sigma) {
    Matrix H = hermitize(rho - sigma);
    Eigen::SelfAdjointEigenSolver<Matrix> es(H);
    if (es.info() != Eigen::Success) throw std::runtime_error("trace_distance: eigensolve failed");
    return 0.5 * es.eigenvalues().cwiseAbs().sum();
}

// --------------------------- Vec/unvec and superops -------------------------

inline Vector vec(const Matrix& A) {
    // Column-major flattening (Eigen default)
    return Eigen::Map<const Vector>(A.data(), A.size());
}

inline Matrix unvec(const Vector& v, std::size_t N) {
    if (v.size() != static_cast<Eigen::Index>(N*N)) throw std::invalid_argument("unvec: size mismatch");
    return Eigen::Map<const Matrix>(v.data(), static_cast<Eigen::Index>(N), static_cast<Eigen::Index>(N));
}

// vec(A X) = (I ⊗ A) vec(X)
inline Matrix super_left(const Matrix& A) {
    const Eigen::Index N = A.rows();
    return kron(Matrix(Matrix::Identity(N, N)), A);
}

// vec(X B) = (Bᵀ ⊗ I) vec(X)
inline Matrix super_right(const Matrix& B) {
    const Eigen::Index N = B.rows();
    return kron(Matrix(B.transpose()), Matrix(Matrix::Identity(N, N)));
}

} // namespace qtraj::ops
