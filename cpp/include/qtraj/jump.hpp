// jump.hpp — Norm-threshold jump detection, jump-time location and channel sampling

#pragma once

#include <cstddef>

#include <Eigen/Dense>

#include "qtraj/generator.hpp"
#include "qtraj/options.hpp"
#include "qtraj/propagate.hpp"
#include "qtraj/random.hpp"

namespace qtraj {

// Relative jump-rate floor: Σ_k |C_k psi|^2 <= kZeroJumpRate * |psi|^2 counts as zero.
inline constexpr double kZeroJumpRate = 1.0e-20;

// Channel k with cumulative weight Σ_{j<=k} |C_j psi|^2 > u * Σ_j |C_j psi|^2, u in [0,1).
// Throws DegenerateJump when the total weight is numerically zero.
std::size_t sample_channel(const EffectiveGenerator& generator, const Eigen::VectorXcd& psi, double u);

// C_k psi / |C_k psi|. Throws DegenerateJump if C_k annihilates psi.
Eigen::VectorXcd apply_jump(const EffectiveGenerator& generator, std::size_t k, const Eigen::VectorXcd& psi);

class JumpDetector {
public:
    JumpDetector(const EffectiveGenerator& generator, const Options& options, RandomStream& stream);

    // No collapse operators: the detector never fires.
    bool enabled() const noexcept { return enabled_; }
    double threshold() const noexcept { return r_; }

    void renew_threshold() { r_ = stream_->uniform_open(); }

    bool crossed(const Eigen::VectorXcd& psi) const {
        return enabled_ && psi.squaredNorm() <= r_;
    }

    // Bisection on |psi(t)|^2 - r over (t_lo, t_hi], where psi_lo lies above the
    // threshold and psi_hi at or below it. On return psi_hi holds the state at
    // the returned jump time. stop is checked before every re-integration.
    double locate(NoJumpPropagator& propagator,
                  double t_lo,
                  const Eigen::VectorXcd& psi_lo,
                  double t_hi,
                  Eigen::VectorXcd& psi_hi,
                  const StopSignal& stop) const;

    // Sample a channel, collapse psi onto it (unit norm) and draw a fresh threshold.
    std::size_t jump(Eigen::VectorXcd& psi);

private:
    const EffectiveGenerator* gen_ = nullptr;
    RandomStream* stream_ = nullptr;
    double tol_ = 0.0;
    std::size_t max_iter_ = 0;
    bool enabled_ = false;
    double r_ = 0.0;
};

} // namespace qtraj
