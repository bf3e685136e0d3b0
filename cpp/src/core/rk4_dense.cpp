#include "qtraj/rk4_dense.hpp"

#include <cmath>
#include <string>

#ifdef _OPENMP
#include <omp.h>
#endif

namespace {

using Matrix = Eigen::MatrixXcd;
using Vector = Eigen::VectorXcd;

// Below this dimension the thread fork costs more than the product.
constexpr Eigen::Index kParallelMatvecMinRows = 256;

void ensure_dims(const Matrix& L, const Vector& r, const char* where) {
    if (L.rows() != L.cols()) {
        throw std::invalid_argument(std::string(where) + ": L must be square");
    }
    if (L.rows() != r.size()) {
        throw std::invalid_argument(std::string(where) + ": L and r dimension mismatch");
    }
}

} // namespace

namespace qtraj {

void Rk4Workspace::resize(Eigen::Index n) {
    if (k1.size() == n) return;
    k1.resize(n);
    k2.resize(n);
    k3.resize(n);
    k4.resize(n);
    tmp.resize(n);
}

void matvec(const Matrix& L, const Vector& x, Vector& y) {
    ensure_dims(L, x, "matvec");
    const Eigen::Index D = L.rows();
    y.resize(D);
#ifdef _OPENMP
    if (D >= kParallelMatvecMinRows && !omp_in_parallel()) {
        #pragma omp parallel for schedule(static)
        for (Eigen::Index i = 0; i < D; ++i) {
            y(i) = (L.row(i).transpose().array() * x.array()).sum();
        }
        return;
    }
#endif
    y.noalias() = L * x;
}

void rk4_step(const Matrix& L, Vector& r, Rk4Workspace& ws, double dt) {
    if (!(dt > 0.0)) throw std::invalid_argument("rk4_step: dt must be > 0");
    ensure_dims(L, r, "rk4_step");
    ws.resize(r.size());

    matvec(L, r, ws.k1);

    ws.tmp = r;
    ws.tmp.noalias() += 0.5 * dt * ws.k1;
    matvec(L, ws.tmp, ws.k2);

    ws.tmp = r;
    ws.tmp.noalias() += 0.5 * dt * ws.k2;
    matvec(L, ws.tmp, ws.k3);

    ws.tmp = r;
    ws.tmp.noalias() += dt * ws.k3;
    matvec(L, ws.tmp, ws.k4);

    r.noalias() += (dt / 6.0) * (ws.k1 + 2.0 * ws.k2 + 2.0 * ws.k3 + ws.k4);
}

void propagate_rk4_dense(const Matrix& L,
                         Vector& r,
                         double t0,
                         double tf,
                         double dt,
                         const std::function<void(double, const Vector&)>& on_sample,
                         std::size_t sample_every) {
    if (!(dt > 0.0)) throw std::invalid_argument("propagate_rk4_dense: dt must be > 0");
    if (sample_every == 0) throw std::invalid_argument("propagate_rk4_dense: sample_every must be > 0");
    if (!(tf >= t0)) throw std::invalid_argument("propagate_rk4_dense: tf must be >= t0");
    ensure_dims(L, r, "propagate_rk4_dense");

    const double span = tf - t0;
    const auto steps = static_cast<std::size_t>(std::ceil(span / dt - 1e-9));
    if (steps == 0) {
        if (on_sample) on_sample(tf, r);
        return;
    }
    const double h = span / static_cast<double>(steps);

    Rk4Workspace ws;
    ws.resize(r.size());
    for (std::size_t step = 0; step < steps; ++step) {
        if (on_sample && (step % sample_every == 0)) on_sample(t0 + static_cast<double>(step) * h, r);
        rk4_step(L, r, ws, h);
    }
    if (on_sample) on_sample(tf, r);
}

std::vector<Vector> evolve_rk4_dense(const Matrix& L,
                                     const Vector& r0,
                                     const std::vector<double>& times,
                                     double dt) {
    if (times.empty()) throw std::invalid_argument("evolve_rk4_dense: times must be non-empty");
    std::vector<Vector> out;
    out.reserve(times.size());
    Vector r = r0;
    out.push_back(r);
    for (std::size_t i = 1; i < times.size(); ++i) {
        if (!(times[i] > times[i - 1])) {
            throw std::invalid_argument("evolve_rk4_dense: times must be strictly increasing");
        }
        propagate_rk4_dense(L, r, times[i - 1], times[i], dt);
        out.push_back(r);
    }
    return out;
}

} // namespace qtraj
