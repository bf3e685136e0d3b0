#include "qtraj/propagate.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <string>

#include "qtraj/errors.hpp"

namespace qtraj {

namespace {

namespace odeint = boost::numeric::odeint;

// Smallest step the controller may propose at time t before we give up.
inline double min_step(double t) {
    return 16.0 * std::numeric_limits<double>::epsilon() * std::max(1.0, std::abs(t));
}

inline bool all_finite(const std::vector<std::complex<double>>& x) {
    for (const auto& v : x) {
        if (!std::isfinite(v.real()) || !std::isfinite(v.imag())) return false;
    }
    return true;
}

std::string at_time(const char* what, double t) {
    std::ostringstream os;
    os.precision(12);
    os << "NoJumpPropagator: " << what << " at t=" << t;
    return os.str();
}

} // namespace

void NoJumpPropagator::Rhs::operator()(const state_type& x, state_type& dxdt, double) const {
    const Eigen::Index n = static_cast<Eigen::Index>(x.size());
    dxdt.resize(x.size());
    Eigen::Map<const Eigen::VectorXcd> in(x.data(), n);
    Eigen::Map<Eigen::VectorXcd> out(dxdt.data(), n);
    out.noalias() = (*A) * in;
}

NoJumpPropagator::NoJumpPropagator(const EffectiveGenerator& generator, const Options& options)
    : gen_(&generator),
      stepper_(controlled_stepper::error_checker_type(options.atol, options.rtol)),
      max_step_(options.max_step),
      max_rejected_(options.max_rejected_steps) {
    rhs_.A = &gen_->rhs_operator();
    // Initial guess: a tenth of the fastest time scale of G
    const double rate = gen_->matrix().cwiseAbs().rowwise().sum().maxCoeff();
    dt_ = (rate > 0.0) ? 0.1 / rate : 0.1;
    if (max_step_ > 0.0) dt_ = std::min(dt_, max_step_);
    buf_.resize(gen_->dimension());
}

void NoJumpPropagator::load(const Eigen::VectorXcd& psi, state_type& x) {
    x.resize(static_cast<std::size_t>(psi.size()));
    Eigen::Map<Eigen::VectorXcd>(x.data(), psi.size()) = psi;
}

void NoJumpPropagator::store(const state_type& x, Eigen::VectorXcd& psi) {
    psi = Eigen::Map<const Eigen::VectorXcd>(x.data(), static_cast<Eigen::Index>(x.size()));
}

void NoJumpPropagator::accept_one(state_type& x, double& t, double t_stop, double& dt) {
    std::size_t rejected_in_row = 0;
    for (;;) {
        const double remaining = t_stop - t;
        if (remaining <= min_step(t_stop)) {
            t = t_stop;
            return;
        }
        double h = std::min(dt, remaining);
        if (max_step_ > 0.0) h = std::min(h, max_step_);
        const bool lands_on_stop = (h == remaining);
        if (!(h > min_step(t))) {
            throw IntegrationFailure(at_time("step size underflow", t));
        }

        const double h_taken = h;
        const odeint::controlled_step_result res = stepper_.try_step(rhs_, x, t, h);
        if (res == odeint::success) {
            ++accepted_;
            if (!all_finite(x)) {
                throw IntegrationFailure(at_time("non-finite state", t));
            }
            if (lands_on_stop || t_stop - t <= min_step(t_stop)) t = t_stop;
            // h now holds the controller's proposal for the next step. A step
            // shortened to land on t_stop says nothing against the old dt.
            dt = (h_taken < dt) ? std::max(dt, h) : h;
            if (max_step_ > 0.0) dt = std::min(dt, max_step_);
            return;
        }

        ++rejected_;
        ++rejected_in_row;
        if (rejected_in_row > max_rejected_) {
            throw IntegrationFailure(at_time("tolerance not met after repeated step rejections", t));
        }
        if (!std::isfinite(h)) {
            throw IntegrationFailure(at_time("non-finite step size", t));
        }
        dt = h;
    }
}

double NoJumpPropagator::step(Eigen::VectorXcd& psi, double t, double t_stop) {
    if (!(t_stop > t)) throw std::invalid_argument("NoJumpPropagator::step: t_stop must be > t");
    load(psi, buf_);
    accept_one(buf_, t, t_stop, dt_);
    store(buf_, psi);
    return t;
}

void NoJumpPropagator::advance(Eigen::VectorXcd& psi, double t0, double t1) {
    if (t1 < t0) throw std::invalid_argument("NoJumpPropagator::advance: t1 must be >= t0");
    if (t1 == t0) return;
    load(psi, buf_);
    double t = t0;
    while (t < t1) accept_one(buf_, t, t1, dt_);
    store(buf_, psi);
}

Eigen::VectorXcd NoJumpPropagator::propagate(const Eigen::VectorXcd& psi, double t0, double t1) {
    if (t1 < t0) throw std::invalid_argument("NoJumpPropagator::propagate: t1 must be >= t0");
    Eigen::VectorXcd out = psi;
    if (t1 == t0) return out;
    state_type x;
    load(psi, x);
    double t = t0;
    double dt = dt_;
    while (t < t1) accept_one(x, t, t1, dt);
    store(x, out);
    return out;
}

} // namespace qtraj
