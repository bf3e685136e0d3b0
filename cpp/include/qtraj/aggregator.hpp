// aggregator.hpp — Thread-safe streaming reduction of trajectory records into ensemble statistics

#pragma once

#include <cstddef>
#include <mutex>
#include <vector>

#include <Eigen/Dense>

#include "qtraj/errors.hpp"
#include "qtraj/trajectory.hpp"

namespace qtraj {

struct EnsembleResult {
    std::vector<double> times;
    std::size_t n_trajectories{0};   // requested
    std::size_t n_success{0};

    std::vector<Eigen::VectorXcd> expect;     // [observable](time index), mean over successes
    std::vector<Eigen::VectorXd> std_error;   // empty unless requested
    std::vector<Eigen::MatrixXcd> states;     // averaged |psi><psi| per time, empty unless requested

    std::vector<TrajectoryRecord> trajectories;  // retained records, ordered by index
    std::vector<TrajectoryFailure> failures;     // ordered by index

    bool degraded() const noexcept { return !failures.empty(); }
    double success_fraction() const noexcept {
        return n_trajectories ? static_cast<double>(n_success) / static_cast<double>(n_trajectories) : 0.0;
    }
    // Real part of the mean series of observable k
    Eigen::VectorXd expect_real(std::size_t k) const { return expect.at(k).real(); }
};

struct AccumulatorSettings {
    bool std_error = true;
    bool average_states = false;
    bool keep_records = false;
};

// Welford running mean/variance per (observable, time). All public members lock
// an internal mutex, so worker threads may call add() concurrently.
class EnsembleAccumulator {
public:
    EnsembleAccumulator(std::vector<double> times,
                        std::size_t n_observables,
                        std::size_t dimension,
                        const AccumulatorSettings& settings);

    // Returns the number of outcomes seen so far (including this one).
    std::size_t add(TrajectoryOutcome&& outcome);

    std::size_t completed() const;
    std::size_t failed() const;

    // Snapshot of the statistics for n_trajectories requested trajectories.
    EnsembleResult finalize(std::size_t n_trajectories) const;

private:
    void add_record_locked(const TrajectoryRecord& record);

    mutable std::mutex mutex_;
    std::vector<double> times_;
    std::size_t n_obs_{0};
    std::size_t dim_{0};
    AccumulatorSettings settings_;

    std::size_t n_{0};
    Eigen::MatrixXcd mean_;   // rows: times, cols: observables
    Eigen::MatrixXd m2_;      // Σ |x - mean|^2 (Welford)
    std::vector<Eigen::MatrixXcd> rho_sum_;

    std::vector<TrajectoryRecord> records_;
    std::vector<TrajectoryFailure> failures_;
};

} // namespace qtraj
