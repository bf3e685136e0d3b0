#pragma once

#include <Eigen/Dense>

#include <complex>
#include <cstddef>
#include <fstream>
#include <iomanip>
#include <ostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "qtraj/aggregator.hpp"
#include "qtraj/lindblad.hpp"

namespace qtraj::io {

inline std::ofstream open_output(const std::string& path) {
    std::ofstream ofs(path, std::ios::out | std::ios::trunc);
    if (!ofs) {
        throw std::runtime_error("Failed to open output file: " + path);
    }
    return ofs;
}

inline void write_csv_matrix(std::ostream& os,
                             const Eigen::MatrixXcd& M,
                             int precision = 17)
{
    os.setf(std::ios::fixed);
    os << std::setprecision(precision);
    os << "row,col,re,im\n";
    for (Eigen::Index r = 0; r < M.rows(); ++r) {
        for (Eigen::Index c = 0; c < M.cols(); ++c) {
            const std::complex<double> v = M(r, c);
            os << r << "," << c << "," << v.real() << "," << v.imag() << "\n";
        }
    }
}

inline void write_csv_matrix(const std::string& path,
                             const Eigen::MatrixXcd& M,
                             int precision = 17)
{
    std::ofstream ofs = open_output(path);
    write_csv_matrix(ofs, M, precision);
}

// t,<label>_re,<label>_im[,<label>_se],... one row per output time.
// Labels default to O0, O1, ... when fewer labels than observables are given.
inline void write_expect_csv(std::ostream& os,
                             const EnsembleResult& result,
                             const std::vector<std::string>& labels = {},
                             int precision = 12)
{
    const std::size_t K = result.expect.size();
    const bool with_se = result.std_error.size() == K && K > 0;
    auto label = [&](std::size_t k) { return k < labels.size() ? labels[k] : "O" + std::to_string(k); };

    os.setf(std::ios::fixed);
    os << std::setprecision(precision);
    os << "t";
    for (std::size_t k = 0; k < K; ++k) {
        os << "," << label(k) << "_re," << label(k) << "_im";
        if (with_se) os << "," << label(k) << "_se";
    }
    os << "\n";
    for (std::size_t i = 0; i < result.times.size(); ++i) {
        const auto row = static_cast<Eigen::Index>(i);
        os << result.times[i];
        for (std::size_t k = 0; k < K; ++k) {
            const std::complex<double> v = result.expect[k](row);
            os << "," << v.real() << "," << v.imag();
            if (with_se) os << "," << result.std_error[k](row);
        }
        os << "\n";
    }
}

inline void write_expect_csv(std::ostream& os,
                             const MasterEquationResult& result,
                             const std::vector<std::string>& labels = {},
                             int precision = 12)
{
    auto label = [&](std::size_t k) { return k < labels.size() ? labels[k] : "O" + std::to_string(k); };
    os.setf(std::ios::fixed);
    os << std::setprecision(precision);
    os << "t";
    for (std::size_t k = 0; k < result.expect.size(); ++k) os << "," << label(k) << "_re," << label(k) << "_im";
    os << "\n";
    for (std::size_t i = 0; i < result.times.size(); ++i) {
        os << result.times[i];
        for (const auto& e : result.expect) {
            const std::complex<double> v = e(static_cast<Eigen::Index>(i));
            os << "," << v.real() << "," << v.imag();
        }
        os << "\n";
    }
}

// trajectory,time,channel,label for every jump of the retained trajectories
inline void write_jumps_csv(std::ostream& os,
                            const std::vector<TrajectoryRecord>& trajectories,
                            const std::vector<std::string>& channel_labels = {},
                            int precision = 12)
{
    os.setf(std::ios::fixed);
    os << std::setprecision(precision);
    os << "trajectory,time,channel,label\n";
    for (const auto& rec : trajectories) {
        for (const auto& j : rec.jumps) {
            os << rec.index << "," << j.time << "," << j.channel << ",";
            if (j.channel < channel_labels.size()) os << channel_labels[j.channel];
            os << "\n";
        }
    }
}

// trajectory,kind,time,message
inline void write_failures_csv(std::ostream& os, const std::vector<TrajectoryFailure>& failures) {
    os << "trajectory,kind,time,message\n";
    for (const auto& f : failures) {
        std::string msg = f.message;
        for (char& c : msg) {
            if (c == ',' || c == '\n') c = ' ';
        }
        os << f.index << "," << to_string(f.kind) << "," << f.time << "," << msg << "\n";
    }
}

} // namespace qtraj::io
