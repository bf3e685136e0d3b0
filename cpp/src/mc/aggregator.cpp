#include "qtraj/aggregator.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <utility>

namespace qtraj {

EnsembleAccumulator::EnsembleAccumulator(std::vector<double> times,
                                         std::size_t n_observables,
                                         std::size_t dimension,
                                         const AccumulatorSettings& settings)
    : times_(std::move(times)), n_obs_(n_observables), dim_(dimension), settings_(settings) {
    const auto nt = static_cast<Eigen::Index>(times_.size());
    const auto no = static_cast<Eigen::Index>(n_obs_);
    mean_ = Eigen::MatrixXcd::Zero(nt, no);
    m2_ = Eigen::MatrixXd::Zero(nt, no);
    if (settings_.average_states) {
        const auto D = static_cast<Eigen::Index>(dim_);
        rho_sum_.assign(times_.size(), Eigen::MatrixXcd::Zero(D, D));
    }
}

void EnsembleAccumulator::add_record_locked(const TrajectoryRecord& record) {
    if (record.expect.rows() != mean_.rows() || record.expect.cols() != mean_.cols()) {
        throw std::invalid_argument("EnsembleAccumulator::add: record shape does not match the accumulator");
    }
    ++n_;
    const double inv_n = 1.0 / static_cast<double>(n_);
    for (Eigen::Index i = 0; i < mean_.rows(); ++i) {
        for (Eigen::Index k = 0; k < mean_.cols(); ++k) {
            const complex x = record.expect(i, k);
            const complex delta = x - mean_(i, k);
            mean_(i, k) += delta * inv_n;
            m2_(i, k) += std::real(std::conj(delta) * (x - mean_(i, k)));
        }
    }
    if (settings_.average_states) {
        if (record.states.size() != rho_sum_.size()) {
            throw std::invalid_argument("EnsembleAccumulator::add: record carries no states to average");
        }
        for (std::size_t i = 0; i < rho_sum_.size(); ++i) {
            rho_sum_[i].noalias() += record.states[i] * record.states[i].adjoint();
        }
    }
}

std::size_t EnsembleAccumulator::add(TrajectoryOutcome&& outcome) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (outcome.ok) {
        add_record_locked(outcome.record);
        if (settings_.keep_records) records_.push_back(std::move(outcome.record));
    } else {
        failures_.push_back(std::move(outcome.failure));
    }
    return n_ + failures_.size();
}

std::size_t EnsembleAccumulator::completed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return n_ + failures_.size();
}

std::size_t EnsembleAccumulator::failed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return failures_.size();
}

EnsembleResult EnsembleAccumulator::finalize(std::size_t n_trajectories) const {
    std::lock_guard<std::mutex> lock(mutex_);
    EnsembleResult out;
    out.times = times_;
    out.n_trajectories = n_trajectories;
    out.n_success = n_;

    out.expect.reserve(n_obs_);
    for (std::size_t k = 0; k < n_obs_; ++k) {
        out.expect.push_back(mean_.col(static_cast<Eigen::Index>(k)));
    }

    if (settings_.std_error) {
        out.std_error.reserve(n_obs_);
        for (std::size_t k = 0; k < n_obs_; ++k) {
            Eigen::VectorXd se = Eigen::VectorXd::Zero(mean_.rows());
            if (n_ > 1) {
                const double n = static_cast<double>(n_);
                for (Eigen::Index i = 0; i < mean_.rows(); ++i) {
                    const double var = std::max(0.0, m2_(i, static_cast<Eigen::Index>(k))) / (n - 1.0);
                    se(i) = std::sqrt(var / n);
                }
            }
            out.std_error.push_back(std::move(se));
        }
    }

    if (settings_.average_states && n_ > 0) {
        out.states.reserve(rho_sum_.size());
        const double inv_n = 1.0 / static_cast<double>(n_);
        for (const auto& S : rho_sum_) out.states.push_back(S * inv_n);
    }

    out.trajectories = records_;
    std::sort(out.trajectories.begin(), out.trajectories.end(),
              [](const TrajectoryRecord& a, const TrajectoryRecord& b) { return a.index < b.index; });
    out.failures = failures_;
    std::sort(out.failures.begin(), out.failures.end(),
              [](const TrajectoryFailure& a, const TrajectoryFailure& b) { return a.index < b.index; });
    return out;
}

} // namespace qtraj
