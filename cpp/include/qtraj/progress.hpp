#pragma once

#include <cstddef>
#include <iomanip>
#include <ostream>

#include "qtraj/options.hpp"

namespace qtraj::progress {

// Console progress line printed each time another `percent_step` percent of the
// trajectories has completed, and once at the end. Usable directly as an
// Options::progress callback; the driver serialises the calls.
class Reporter {
  public:
    explicit Reporter(std::ostream& os, unsigned percent_step = 10)
        : os_(&os), step_(percent_step == 0 ? 1 : percent_step) {}

    void operator()(const Progress& p) {
        if (p.total == 0) return;
        const std::size_t bucket = (p.completed * 100 / p.total) / step_;
        if (bucket <= last_bucket_ && p.completed != p.total) return;
        last_bucket_ = bucket;
        const auto flags = os_->flags();
        const auto precision = os_->precision();
        *os_ << "[qtraj] " << p.completed << "/" << p.total << " trajectories";
        if (p.failed) *os_ << " (" << p.failed << " failed)";
        *os_ << ", " << std::fixed << std::setprecision(2) << p.elapsed << " s\n";
        os_->flags(flags);
        os_->precision(precision);
    }

  private:
    std::ostream* os_;
    std::size_t step_;
    std::size_t last_bucket_{0};
};

} // namespace qtraj::progress
