// errors.hpp — Exception types raised by the trajectory solver

#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace qtraj {

// Invalid configuration detected at setup (before any trajectory runs).
class ConfigError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

// Operator shapes disagree with each other or with the state.
class DimensionMismatch : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

// Adaptive stepper could not meet tolerance within its rejection budget.
class IntegrationFailure : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Total jump rate is zero at a located jump time.
class DegenerateJump : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Trajectory stopped by the cancellation signal or the wall-clock budget.
class Cancelled : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

enum class FailureKind { IntegrationFailure, DegenerateJump, Cancelled, Other };

inline const char* to_string(FailureKind kind) noexcept {
    switch (kind) {
        case FailureKind::IntegrationFailure: return "IntegrationFailure";
        case FailureKind::DegenerateJump:     return "DegenerateJump";
        case FailureKind::Cancelled:          return "Cancelled";
        case FailureKind::Other:              return "Other";
    }
    return "Other";
}

struct TrajectoryFailure {
    std::size_t index{0};
    FailureKind kind{FailureKind::Other};
    double time{0.0};        // simulation time reached when the failure happened
    std::string message;
};

// Too few trajectories succeeded for the ensemble to be usable.
class EnsembleFailure : public std::runtime_error {
public:
    EnsembleFailure(const std::string& what,
                    std::size_t n_success,
                    std::size_t n_trajectories,
                    std::vector<TrajectoryFailure> failures)
        : std::runtime_error(what),
          n_success_(n_success),
          n_trajectories_(n_trajectories),
          failures_(std::move(failures)) {}

    std::size_t n_success() const noexcept { return n_success_; }
    std::size_t n_trajectories() const noexcept { return n_trajectories_; }
    const std::vector<TrajectoryFailure>& failures() const noexcept { return failures_; }

private:
    std::size_t n_success_{0};
    std::size_t n_trajectories_{0};
    std::vector<TrajectoryFailure> failures_;
};

} // namespace qtraj
