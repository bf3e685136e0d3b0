// options.hpp — Solver configuration, cancellation signal and progress reporting hook

#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>

namespace qtraj {

// Shared cancellation flag. Copies refer to the same flag, so a caller can keep
// one copy and hand another to the solver through Options.
class CancelToken {
public:
    CancelToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

    void cancel() noexcept { flag_->store(true, std::memory_order_relaxed); }
    void reset() noexcept { flag_->store(false, std::memory_order_relaxed); }
    bool cancelled() const noexcept { return flag_->load(std::memory_order_relaxed); }

private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

struct Progress {
    std::size_t completed{0};   // trajectories finished (successfully or not)
    std::size_t failed{0};
    std::size_t total{0};
    double elapsed{0.0};        // seconds since dispatch
};

// Cancellation token combined with an optional wall-clock deadline.
class StopSignal {
public:
    using clock = std::chrono::steady_clock;

    StopSignal() = default;
    StopSignal(CancelToken token, double timeout_seconds);

    bool stop_requested() const;
    // Throws Cancelled when a stop was requested.
    void check(double t) const;

private:
    CancelToken token_;
    bool has_deadline_{false};
    clock::time_point deadline_{};
};

using ProgressCallback = std::function<void(const Progress&)>;

struct Options {
    // Adaptive stepper error bounds
    double atol = 1.0e-8;
    double rtol = 1.0e-6;
    // Step-size ceiling; 0 disables the ceiling
    double max_step = 0.0;
    // Consecutive rejected step attempts allowed before IntegrationFailure
    std::size_t max_rejected_steps = 64;

    // Jump-time location by bisection on |psi|^2 - r
    double jump_time_tol = 1.0e-8;
    std::size_t max_bisection_iterations = 64;

    // Retain per-trajectory records (expectation series, states, jump events)
    bool keep_states = false;
    // Accumulate the ensemble-averaged density matrix at every output time
    bool average_states = false;
    // Report the standard error of every mean
    bool std_error = true;

    int n_workers = 0;                  // 0 => OpenMP runtime default
    double timeout = 0.0;               // wall-clock seconds, 0 => none
    double min_success_fraction = 0.5;  // in [0, 1]

    CancelToken cancel;
    ProgressCallback progress;

    // Throws ConfigError on out-of-range values.
    void validate() const;
};

} // namespace qtraj
