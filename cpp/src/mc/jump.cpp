#include "qtraj/jump.hpp"

#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "qtraj/errors.hpp"

namespace qtraj {

namespace {

std::string degenerate_message(double total, double n2) {
    std::ostringstream os;
    os << "sample_channel: total jump rate " << total << " is zero for state norm^2 " << n2;
    return os.str();
}

} // namespace

std::size_t sample_channel(const EffectiveGenerator& generator, const Eigen::VectorXcd& psi, double u) {
    const std::size_t K = generator.num_collapse_operators();
    if (K == 0) throw DegenerateJump("sample_channel: no collapse operators");

    std::vector<double> weights(K, 0.0);
    double total = 0.0;
    for (std::size_t k = 0; k < K; ++k) {
        weights[k] = (generator.collapse_matrix(k) * psi).squaredNorm();
        total += weights[k];
    }
    const double n2 = psi.squaredNorm();
    if (!(total > kZeroJumpRate * n2)) {
        throw DegenerateJump(degenerate_message(total, n2));
    }

    const double target = u * total;
    double cumulative = 0.0;
    std::size_t last_nonzero = 0;
    for (std::size_t k = 0; k < K; ++k) {
        if (weights[k] <= 0.0) continue;
        last_nonzero = k;
        cumulative += weights[k];
        if (cumulative > target) return k;
    }
    // Rounding left target at the very top of the cumulative sum
    return last_nonzero;
}

Eigen::VectorXcd apply_jump(const EffectiveGenerator& generator, std::size_t k, const Eigen::VectorXcd& psi) {
    if (k >= generator.num_collapse_operators()) {
        throw std::out_of_range("apply_jump: channel index out of range");
    }
    Eigen::VectorXcd out = generator.collapse_matrix(k) * psi;
    const double nrm = out.norm();
    if (!(nrm > 0.0)) {
        throw DegenerateJump("apply_jump: collapse operator '" + generator.collapse_operators()[k].label +
                             "' annihilates the state");
    }
    out /= nrm;
    return out;
}

JumpDetector::JumpDetector(const EffectiveGenerator& generator, const Options& options, RandomStream& stream)
    : gen_(&generator),
      stream_(&stream),
      tol_(options.jump_time_tol),
      max_iter_(options.max_bisection_iterations),
      enabled_(generator.has_dissipation()) {
    renew_threshold();
}

double JumpDetector::locate(NoJumpPropagator& propagator,
                            double t_lo,
                            const Eigen::VectorXcd& psi_lo,
                            double t_hi,
                            Eigen::VectorXcd& psi_hi,
                            const StopSignal& stop) const {
    Eigen::VectorXcd lo_state = psi_lo;
    for (std::size_t it = 0; it < max_iter_ && (t_hi - t_lo) > tol_; ++it) {
        const double t_mid = 0.5 * (t_lo + t_hi);
        if (!(t_mid > t_lo && t_mid < t_hi)) break;
        stop.check(t_lo);
        Eigen::VectorXcd mid = propagator.propagate(lo_state, t_lo, t_mid);
        if (mid.squaredNorm() > r_) {
            t_lo = t_mid;
            lo_state = std::move(mid);
        } else {
            t_hi = t_mid;
            psi_hi = std::move(mid);
        }
    }
    return t_hi;
}

std::size_t JumpDetector::jump(Eigen::VectorXcd& psi) {
    const std::size_t k = sample_channel(*gen_, psi, stream_->uniform());
    psi = apply_jump(*gen_, k, psi);
    renew_threshold();
    return k;
}

} // namespace qtraj
