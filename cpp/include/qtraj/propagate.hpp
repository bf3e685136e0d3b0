#pragma once

#include <complex>
#include <cstddef>
#include <vector>

#include <Eigen/Dense>
#include <boost/numeric/odeint.hpp>

#include "qtraj/generator.hpp"
#include "qtraj/options.hpp"

// No-jump propagation dpsi/dt = -i G psi with an adaptive embedded Runge-Kutta
// stepper (Cash-Karp 5(4), Boost.Odeint). The propagator keeps a step-size
// suggestion between calls, so one instance belongs to one trajectory.

namespace qtraj {

class NoJumpPropagator {
public:
    NoJumpPropagator(const EffectiveGenerator& generator, const Options& options);

    // One accepted adaptive step from t towards t_stop (never past it, never
    // longer than max_step). Updates psi in place and returns the new time.
    double step(Eigen::VectorXcd& psi, double t, double t_stop);

    // Advance psi in place from t0 to t1 (t1 >= t0).
    void advance(Eigen::VectorXcd& psi, double t0, double t1);

    // State at t1 starting from (t0, psi). Leaves psi and the step suggestion untouched.
    Eigen::VectorXcd propagate(const Eigen::VectorXcd& psi, double t0, double t1);

    double suggested_step() const noexcept { return dt_; }
    std::size_t accepted_steps() const noexcept { return accepted_; }
    std::size_t rejected_steps() const noexcept { return rejected_; }

private:
    using state_type = std::vector<std::complex<double>>;
    using base_stepper = boost::numeric::odeint::runge_kutta_cash_karp54<state_type>;
    using controlled_stepper = boost::numeric::odeint::controlled_runge_kutta<base_stepper>;

    struct Rhs {
        const Eigen::MatrixXcd* A = nullptr;
        void operator()(const state_type& x, state_type& dxdt, double /*t*/) const;
    };

    // One accepted step on the raw buffer; t and dt are updated in place.
    void accept_one(state_type& x, double& t, double t_stop, double& dt);

    static void load(const Eigen::VectorXcd& psi, state_type& x);
    static void store(const state_type& x, Eigen::VectorXcd& psi);

    const EffectiveGenerator* gen_ = nullptr;
    Rhs rhs_;
    controlled_stepper stepper_;
    double max_step_ = 0.0;
    std::size_t max_rejected_ = 0;
    double dt_ = 0.0;
    std::size_t accepted_ = 0;
    std::size_t rejected_ = 0;
    state_type buf_;
};

} // namespace qtraj
