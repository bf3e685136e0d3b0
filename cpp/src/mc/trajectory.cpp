#include "qtraj/trajectory.hpp"

#include <cmath>
#include <string>

#include "qtraj/jump.hpp"
#include "qtraj/ops.hpp"
#include "qtraj/propagate.hpp"

namespace qtraj {

TrajectorySimulator::TrajectorySimulator(const EffectiveGenerator& generator,
                                         const std::vector<Eigen::MatrixXcd>& observables,
                                         const Eigen::VectorXcd& psi0,
                                         const std::vector<double>& times,
                                         const Options& options,
                                         bool record_states)
    : gen_(&generator),
      observables_(observables),
      times_(times),
      options_(options),
      psi0_(psi0),
      record_states_(record_states) {
    if (psi0_.size() != static_cast<Eigen::Index>(gen_->dimension())) {
        throw DimensionMismatch("TrajectorySimulator: initial state dimension does not match the generator");
    }
    const double nrm = psi0_.norm();
    if (!(nrm > 0.0)) throw ConfigError("TrajectorySimulator: initial state has zero norm");
    psi0_ /= nrm;
    if (times_.empty()) throw ConfigError("TrajectorySimulator: output time list is empty");
    for (std::size_t i = 0; i < times_.size(); ++i) {
        const double ti = times_[i];
        if (!std::isfinite(ti)) throw ConfigError("TrajectorySimulator: output times must be finite");
        if (i > 0 && !(ti > times_[i - 1])) {
            throw ConfigError("TrajectorySimulator: output times must be strictly increasing");
        }
    }
    const auto D = static_cast<Eigen::Index>(gen_->dimension());
    for (std::size_t k = 0; k < observables_.size(); ++k) {
        const Eigen::MatrixXcd& O = observables_[k];
        if (O.rows() != D || O.cols() != D) {
            throw DimensionMismatch("TrajectorySimulator: observable " + std::to_string(k) +
                                    " does not match the Hilbert space dimension");
        }
    }
}

void TrajectorySimulator::record_point(TrajectoryRecord& record, std::size_t i, const Eigen::VectorXcd& psi) const {
    const auto row = static_cast<Eigen::Index>(i);
    for (std::size_t k = 0; k < observables_.size(); ++k) {
        record.expect(row, static_cast<Eigen::Index>(k)) = ops::expect(observables_[k], psi);
    }
    if (record_states_) record.states.push_back(psi.normalized());
}

void TrajectorySimulator::simulate(TrajectoryRecord& record,
                                   RandomStream& stream,
                                   const StopSignal& stop,
                                   const TrajectoryHooks& hooks,
                                   double& t) const {
    const std::vector<double>& times = times_;
    record.times = times;
    record.expect.resize(static_cast<Eigen::Index>(times.size()),
                         static_cast<Eigen::Index>(observables_.size()));
    if (record_states_) record.states.reserve(times.size());

    NoJumpPropagator propagator(*gen_, options_);
    JumpDetector detector(*gen_, options_, stream);

    Eigen::VectorXcd psi = psi0_;
    Eigen::VectorXcd psi_prev(psi.size());
    t = times.front();
    record_point(record, 0, psi);

    for (std::size_t i = 1; i < times.size(); ++i) {
        const double target = times[i];
        while (t < target) {
            stop.check(t);
            const double t_prev = t;
            psi_prev = psi;
            t = propagator.step(psi, t, target);

            if (!detector.crossed(psi)) {
                if (hooks.on_step) hooks.on_step(t, psi);
                continue;
            }

            t = detector.locate(propagator, t_prev, psi_prev, t, psi, stop);
            if (hooks.on_step) hooks.on_step(t, psi);
            const std::size_t k = detector.jump(psi);
            record.jumps.push_back(JumpEvent{t, k});
            if (hooks.on_jump) hooks.on_jump(t, k, psi);
        }
        record_point(record, i, psi);
    }
}

TrajectoryOutcome TrajectorySimulator::run(std::size_t index,
                                           RandomStream& stream,
                                           const StopSignal& stop,
                                           const TrajectoryHooks& hooks) const {
    TrajectoryOutcome out;
    out.record.index = index;
    double t = times_.front();

    auto fail = [&](FailureKind kind, const std::exception& ex) {
        out.ok = false;
        out.record = TrajectoryRecord{};
        out.record.index = index;
        out.failure.index = index;
        out.failure.kind = kind;
        out.failure.time = t;
        out.failure.message = ex.what();
    };

    try {
        stop.check(t);
        simulate(out.record, stream, stop, hooks, t);
        out.ok = true;
    } catch (const IntegrationFailure& ex) {
        fail(FailureKind::IntegrationFailure, ex);
    } catch (const DegenerateJump& ex) {
        fail(FailureKind::DegenerateJump, ex);
    } catch (const Cancelled& ex) {
        fail(FailureKind::Cancelled, ex);
    } catch (const std::exception& ex) {
        fail(FailureKind::Other, ex);
    }
    return out;
}

} // namespace qtraj
