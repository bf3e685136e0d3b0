#include "qtraj/ensemble.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <exception>
#include <mutex>
#include <sstream>
#include <string>
#include <utility>

#ifdef _OPENMP
#include <omp.h>
#endif

#include "qtraj/random.hpp"
#include "qtraj/trajectory.hpp"

namespace qtraj {

namespace {

std::string ensemble_failure_message(std::size_t n_success, std::size_t required, std::size_t total) {
    std::ostringstream os;
    os << "simulate: only " << n_success << " of " << total
       << " trajectories succeeded (at least " << required << " required)";
    return os.str();
}

} // namespace

std::size_t required_successes(std::size_t n_trajectories, double min_success_fraction) {
    const double need = std::ceil(min_success_fraction * static_cast<double>(n_trajectories) - 1e-12);
    const std::size_t required = need > 0.0 ? static_cast<std::size_t>(need) : 0;
    return std::max<std::size_t>(1, std::min(required, n_trajectories));
}

EnsembleResult simulate(const Eigen::MatrixXcd& H,
                        const std::vector<CollapseOperator>& c_ops,
                        const Eigen::VectorXcd& psi0,
                        const std::vector<double>& times,
                        const std::vector<Eigen::MatrixXcd>& observables,
                        std::size_t n_trajectories,
                        std::uint64_t seed,
                        const Options& options) {
    if (n_trajectories == 0) throw ConfigError("simulate: n_trajectories must be >= 1");
    options.validate();
    const EffectiveGenerator generator(H, c_ops);
    return simulate(generator, psi0, times, observables, n_trajectories, seed, options);
}

EnsembleResult simulate(const EffectiveGenerator& generator,
                        const Eigen::VectorXcd& psi0,
                        const std::vector<double>& times,
                        const std::vector<Eigen::MatrixXcd>& observables,
                        std::size_t n_trajectories,
                        std::uint64_t seed,
                        const Options& options) {
    if (n_trajectories == 0) throw ConfigError("simulate: n_trajectories must be >= 1");
    options.validate();

    const bool record_states = options.keep_states || options.average_states;
    const TrajectorySimulator simulator(generator, observables, psi0, times, options, record_states);

    AccumulatorSettings settings;
    settings.std_error = options.std_error;
    settings.average_states = options.average_states;
    settings.keep_records = options.keep_states;
    EnsembleAccumulator accumulator(times, observables.size(), generator.dimension(), settings);

    const StopSignal stop(options.cancel, options.timeout);
    const auto started = std::chrono::steady_clock::now();

    std::mutex progress_mutex;
    std::exception_ptr first_error;

    auto finish_one = [&](TrajectoryOutcome&& outcome) {
        accumulator.add(std::move(outcome));
        if (!options.progress) return;
        // Counts are read under the lock so successive reports never go backwards.
        std::lock_guard<std::mutex> lock(progress_mutex);
        Progress p;
        p.completed = accumulator.completed();
        p.failed = accumulator.failed();
        p.total = n_trajectories;
        p.elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count();
        options.progress(p);
    };

    const long long M = static_cast<long long>(n_trajectories);
#ifdef _OPENMP
    const int n_threads = options.n_workers > 0 ? options.n_workers : omp_get_max_threads();
    #pragma omp parallel for schedule(dynamic) num_threads(n_threads)
#endif
    for (long long i = 0; i < M; ++i) {
        const auto index = static_cast<std::size_t>(i);
        // Exceptions must not leave the parallel region; the first one is rethrown below.
        try {
            RandomStream stream(seed, static_cast<std::uint64_t>(index));
            finish_one(simulator.run(index, stream, stop));
        } catch (...) {
            std::lock_guard<std::mutex> lock(progress_mutex);
            if (!first_error) first_error = std::current_exception();
        }
    }
    if (first_error) std::rethrow_exception(first_error);

    EnsembleResult result = accumulator.finalize(n_trajectories);
    const std::size_t required = required_successes(n_trajectories, options.min_success_fraction);
    if (result.n_success < required) {
        throw EnsembleFailure(ensemble_failure_message(result.n_success, required, n_trajectories),
                              result.n_success, n_trajectories, std::move(result.failures));
    }
    return result;
}

} // namespace qtraj
