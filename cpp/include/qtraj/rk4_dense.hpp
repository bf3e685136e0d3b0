#pragma once

#include <cstddef>
#include <functional>
#include <stdexcept>
#include <vector>

#include <Eigen/Dense>

namespace qtraj {

// Workspace buffers for dense RK4 integration.
struct Rk4Workspace {
    Eigen::VectorXcd k1;
    Eigen::VectorXcd k2;
    Eigen::VectorXcd k3;
    Eigen::VectorXcd k4;
    Eigen::VectorXcd tmp;

    void resize(Eigen::Index n);
};

// Dense y = L * x, rows split across OpenMP threads when enabled and not already
// inside a parallel region.
void matvec(const Eigen::MatrixXcd& L, const Eigen::VectorXcd& x, Eigen::VectorXcd& y);

// One classical RK4 step for r' = L r with constant L.
void rk4_step(const Eigen::MatrixXcd& L, Eigen::VectorXcd& r, Rk4Workspace& ws, double dt);

// Propagate r' = L r from t0 to tf. The interval is cut into
// ceil((tf - t0) / dt) equal steps so that the last sample lands on tf.
// on_sample is called at t0, every sample_every steps and at tf.
void propagate_rk4_dense(const Eigen::MatrixXcd& L,
                         Eigen::VectorXcd& r,
                         double t0,
                         double tf,
                         double dt,
                         const std::function<void(double, const Eigen::VectorXcd&)>& on_sample = {},
                         std::size_t sample_every = 1);

// r(t) at every entry of a strictly increasing time list, r(times[0]) = r0.
std::vector<Eigen::VectorXcd> evolve_rk4_dense(const Eigen::MatrixXcd& L,
                                               const Eigen::VectorXcd& r0,
                                               const std::vector<double>& times,
                                               double dt);

} // namespace qtraj
