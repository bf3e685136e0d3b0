// trajectory.hpp — One Monte Carlo wavefunction realisation from t0 to the last output time

#pragma once

#include <cstddef>
#include <functional>
#include <vector>

#include <Eigen/Dense>

#include "qtraj/errors.hpp"
#include "qtraj/generator.hpp"
#include "qtraj/options.hpp"
#include "qtraj/random.hpp"

namespace qtraj {

struct JumpEvent {
    double time{0.0};
    std::size_t channel{0};
};

struct TrajectoryRecord {
    std::size_t index{0};
    std::vector<double> times;
    Eigen::MatrixXcd expect;               // rows: output times, cols: observables
    std::vector<Eigen::VectorXcd> states;  // unit-norm states at the output times (when recorded)
    std::vector<JumpEvent> jumps;
};

struct TrajectoryOutcome {
    bool ok{false};
    TrajectoryRecord record;      // valid when ok
    TrajectoryFailure failure;    // valid when !ok
};

// Observation hooks for diagnostics: on_step sees the un-normalised no-jump
// state after every accepted sub-step (and at a located jump time), on_jump the
// renormalised state right after a collapse.
struct TrajectoryHooks {
    std::function<void(double, const Eigen::VectorXcd&)> on_step;
    std::function<void(double, std::size_t, const Eigen::VectorXcd&)> on_jump;
};

class TrajectorySimulator {
public:
    // psi0 must have non-zero norm; it is normalised here. times[0] is the initial time.
    // The generator must outlive the simulator; everything else is copied.
    TrajectorySimulator(const EffectiveGenerator& generator,
                        const std::vector<Eigen::MatrixXcd>& observables,
                        const Eigen::VectorXcd& psi0,
                        const std::vector<double>& times,
                        const Options& options,
                        bool record_states);

    // Never throws for per-trajectory errors: they come back as a failed outcome
    // tagged with the trajectory index.
    TrajectoryOutcome run(std::size_t index,
                          RandomStream& stream,
                          const StopSignal& stop,
                          const TrajectoryHooks& hooks = TrajectoryHooks{}) const;

private:
    void simulate(TrajectoryRecord& record,
                  RandomStream& stream,
                  const StopSignal& stop,
                  const TrajectoryHooks& hooks,
                  double& t) const;

    void record_point(TrajectoryRecord& record, std::size_t i, const Eigen::VectorXcd& psi) const;

    const EffectiveGenerator* gen_ = nullptr;
    std::vector<Eigen::MatrixXcd> observables_;
    std::vector<double> times_;
    Options options_;
    Eigen::VectorXcd psi0_;
    bool record_states_ = false;
};

} // namespace qtraj
