#include "qtraj/options.hpp"

#include <cmath>
#include <sstream>
#include <string>
#include <utility>

#include "qtraj/errors.hpp"

namespace qtraj {

namespace {

void require(bool ok, const std::string& what) {
    if (!ok) throw ConfigError("Options: " + what);
}

} // namespace

void Options::validate() const {
    require(std::isfinite(atol) && atol > 0.0, "atol must be finite and > 0");
    require(std::isfinite(rtol) && rtol >= 0.0, "rtol must be finite and >= 0");
    require(std::isfinite(max_step) && max_step >= 0.0, "max_step must be finite and >= 0");
    require(max_rejected_steps >= 1, "max_rejected_steps must be >= 1");
    require(std::isfinite(jump_time_tol) && jump_time_tol > 0.0, "jump_time_tol must be finite and > 0");
    require(max_bisection_iterations >= 1, "max_bisection_iterations must be >= 1");
    require(n_workers >= 0, "n_workers must be >= 0");
    require(std::isfinite(timeout) && timeout >= 0.0, "timeout must be finite and >= 0");
    require(min_success_fraction >= 0.0 && min_success_fraction <= 1.0,
            "min_success_fraction must lie in [0, 1]");
}

StopSignal::StopSignal(CancelToken token, double timeout_seconds)
    : token_(std::move(token)) {
    if (timeout_seconds > 0.0) {
        has_deadline_ = true;
        deadline_ = clock::now() + std::chrono::duration_cast<clock::duration>(
                                       std::chrono::duration<double>(timeout_seconds));
    }
}

bool StopSignal::stop_requested() const {
    if (token_.cancelled()) return true;
    return has_deadline_ && clock::now() >= deadline_;
}

void StopSignal::check(double t) const {
    if (token_.cancelled()) {
        std::ostringstream os;
        os << "trajectory cancelled at t=" << t;
        throw Cancelled(os.str());
    }
    if (has_deadline_ && clock::now() >= deadline_) {
        std::ostringstream os;
        os << "wall-clock timeout reached at t=" << t;
        throw Cancelled(os.str());
    }
}

} // namespace qtraj
