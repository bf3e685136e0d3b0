#include "qtraj/lindblad.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <stdexcept>
#include <string>

#include <Eigen/Eigenvalues>
#include <unsupported/Eigen/MatrixFunctions>

#include "qtraj/errors.hpp"
#include "qtraj/ops.hpp"
#include "qtraj/rk4_dense.hpp"

namespace qtraj {

namespace {

using Matrix = Eigen::MatrixXcd;
using Vector = Eigen::VectorXcd;

void check_times(const std::vector<double>& times, const char* where) {
    if (times.empty()) throw ConfigError(std::string(where) + ": output time list is empty");
    for (std::size_t i = 0; i < times.size(); ++i) {
        if (!std::isfinite(times[i])) throw ConfigError(std::string(where) + ": output times must be finite");
        if (i > 0 && !(times[i] > times[i - 1])) {
            throw ConfigError(std::string(where) + ": output times must be strictly increasing");
        }
    }
}

void record(MasterEquationResult& out,
            const std::vector<Matrix>& observables,
            std::size_t i,
            const Matrix& rho) {
    for (std::size_t k = 0; k < observables.size(); ++k) {
        out.expect[k](static_cast<Eigen::Index>(i)) = ops::expect_rho(observables[k], rho);
    }
    out.states.push_back(rho);
}

} // namespace

Matrix liouvillian(const Matrix& H, const std::vector<CollapseOperator>& c_ops) {
    const Matrix G = build_effective_hamiltonian(H, c_ops);
    const Eigen::Index N = G.rows();
    const Matrix I = Matrix::Identity(N, N);
    const complex i1(0.0, 1.0);

    Matrix L = -i1 * ops::kron(I, G) + i1 * ops::kron(Matrix(G.conjugate()), I);
    for (const auto& c : c_ops) {
        L += ops::kron(Matrix(c.matrix.conjugate()), c.matrix);
    }
    return L;
}

MasterEquationResult mesolve(const Matrix& H,
                             const std::vector<CollapseOperator>& c_ops,
                             const Matrix& rho0,
                             const std::vector<double>& times,
                             const std::vector<Matrix>& observables,
                             MasterEquationMethod method,
                             double rk4_dt) {
    check_times(times, "mesolve");
    const Eigen::Index N = H.rows();
    if (rho0.rows() != N || rho0.cols() != N) {
        throw DimensionMismatch("mesolve: rho0 does not match the Hamiltonian dimension");
    }
    for (const auto& O : observables) {
        if (O.rows() != N || O.cols() != N) {
            throw DimensionMismatch("mesolve: observable does not match the Hamiltonian dimension");
        }
    }
    if (method == MasterEquationMethod::Rk4 && !(rk4_dt > 0.0)) {
        throw ConfigError("mesolve: rk4_dt must be > 0");
    }

    const Matrix L = liouvillian(H, c_ops);
    const auto N_sz = static_cast<std::size_t>(N);

    MasterEquationResult out;
    out.times = times;
    out.expect.assign(observables.size(), Vector::Zero(static_cast<Eigen::Index>(times.size())));
    out.states.reserve(times.size());

    Matrix rho = rho0;
    record(out, observables, 0, rho);

    Vector r = ops::vec(rho);
    Matrix M;
    double M_dt = -1.0;
    for (std::size_t i = 1; i < times.size(); ++i) {
        const double dt = times[i] - times[i - 1];
        if (method == MasterEquationMethod::Expm) {
            if (std::abs(dt - M_dt) > 1e-12 * dt) {
                M = (dt * L).exp();
                M_dt = dt;
            }
            r = M * r;
        } else {
            propagate_rk4_dense(L, r, times[i - 1], times[i], rk4_dt);
        }
        rho = ops::hermitize(ops::unvec(r, N_sz));
        record(out, observables, i, rho);
    }
    return out;
}

Matrix steady_state(const Matrix& H, const std::vector<CollapseOperator>& c_ops) {
    const Matrix L = liouvillian(H, c_ops);
    const Eigen::Index N = H.rows();
    const Eigen::Index NN = N * N;

    // Trace preservation makes the (0,0) row a combination of the other
    // diagonal rows, so it can carry Tr rho = 1 instead.
    Matrix A = L;
    A.row(0).setZero();
    for (Eigen::Index j = 0; j < N; ++j) A(0, j * N + j) = 1.0;
    Vector b = Vector::Zero(NN);
    b(0) = 1.0;

    Eigen::FullPivLU<Matrix> lu(A);
    if (!lu.isInvertible()) {
        throw ConfigError("steady_state: Liouvillian kernel is not one-dimensional (no unique steady state)");
    }
    const Vector v = lu.solve(b);
    return ops::hermitize_and_normalize(ops::unvec(v, static_cast<std::size_t>(N)));
}

Vector liouvillian_spectrum(const Matrix& L) {
    if (L.rows() != L.cols()) throw DimensionMismatch("liouvillian_spectrum: L must be square");
    Eigen::ComplexEigenSolver<Matrix> es(L, /*computeEigenvectors=*/false);
    if (es.info() != Eigen::Success) throw std::runtime_error("liouvillian_spectrum: eigensolve failed");
    const Vector& ev = es.eigenvalues();

    std::vector<Eigen::Index> order(static_cast<std::size_t>(ev.size()));
    std::iota(order.begin(), order.end(), Eigen::Index(0));
    std::stable_sort(order.begin(), order.end(), [&](Eigen::Index a, Eigen::Index b) {
        if (ev(a).real() != ev(b).real()) return ev(a).real() > ev(b).real();
        return ev(a).imag() > ev(b).imag();
    });
    Vector out(ev.size());
    for (Eigen::Index i = 0; i < ev.size(); ++i) out(i) = ev(order[static_cast<std::size_t>(i)]);
    return out;
}

double spectral_gap(const Vector& spectrum, double zero_tol) {
    for (Eigen::Index i = 0; i < spectrum.size(); ++i) {
        if (std::abs(spectrum(i)) > zero_tol) return -spectrum(i).real();
    }
    return 0.0;
}

} // namespace qtraj
