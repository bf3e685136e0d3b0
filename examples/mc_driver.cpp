#include <Eigen/Dense>

#include <yaml-cpp/yaml.h>

#include <cmath>
#include <complex>
#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#ifdef _OPENMP
#include <omp.h>
#endif

#include "qtraj/config.hpp"
#include "qtraj/ensemble.hpp"
#include "qtraj/io.hpp"
#include "qtraj/lindblad.hpp"
#include "qtraj/ops.hpp"
#include "qtraj/progress.hpp"
#include "qtraj/version.hpp"

namespace {

void print_usage(std::ostream& os) {
    os << "Usage: mc_driver [--config=PATH]\n"
          "Defaults: config=configs/mc_driver.yaml\n";
}

void print_summary(const qtraj::EnsembleResult& res,
                   const std::vector<std::string>& labels,
                   const qtraj::MasterEquationResult* reference) {
    const std::size_t last = res.times.size() - 1;
    std::cout << "trajectories: " << res.n_success << "/" << res.n_trajectories << " succeeded";
    if (res.degraded()) std::cout << " (degraded)";
    std::cout << "\n";
    for (std::size_t k = 0; k < res.expect.size(); ++k) {
        const auto i = static_cast<Eigen::Index>(last);
        std::cout << "<" << labels[k] << ">(t=" << res.times[last] << ") = " << res.expect[k](i).real();
        if (!res.std_error.empty()) std::cout << " +/- " << res.std_error[k](i);
        if (reference) std::cout << "   (master equation: " << reference->expect[k](i).real() << ")";
        std::cout << "\n";
    }
}

} // namespace

int main(int argc, char** argv) {
    try {
        std::string config_path = "configs/mc_driver.yaml";
        for (int i = 1; i < argc; ++i) {
            std::string arg(argv[i]);
            if (arg == "--help" || arg == "-h") {
                print_usage(std::cout);
                return 0;
            }
            if (arg.rfind("--config=", 0) == 0) {
                config_path = arg.substr(std::string("--config=").size());
            }
        }

        qtraj::config::Problem problem = qtraj::config::load_problem_file(config_path);

        std::cout.setf(std::ios::fixed);
        std::cout << std::setprecision(9);
        std::cout << "mc_driver " << qtraj::version() << " config: " << config_path << "\n";
#ifdef _OPENMP
        std::cout << "OpenMP threads: "
                  << (problem.options.n_workers > 0 ? problem.options.n_workers : omp_get_max_threads()) << "\n";
#endif
        std::cout << "dim=" << problem.dim << ", collapse=" << problem.c_ops.size()
                  << ", observables=" << problem.observables.size()
                  << ", times=" << problem.times.size()
                  << ", M=" << problem.n_trajectories << ", seed=" << problem.seed << "\n";

        if (problem.show_progress) problem.options.progress = qtraj::progress::Reporter(std::cerr);
        if (!problem.output.rho_csv.empty()) problem.options.average_states = true;
        if (!problem.output.jumps_csv.empty()) problem.options.keep_states = true;

        const qtraj::EnsembleResult res = qtraj::simulate(problem.H, problem.c_ops, problem.psi0, problem.times,
                                                          problem.observables, problem.n_trajectories,
                                                          problem.seed, problem.options);

        qtraj::MasterEquationResult reference;
        if (problem.reference.enabled) {
            reference = qtraj::mesolve(problem.H, problem.c_ops, qtraj::ops::rho_pure(problem.psi0), problem.times,
                                       problem.observables, problem.reference.method, problem.reference.rk4_dt);
        }
        print_summary(res, problem.observable_labels, problem.reference.enabled ? &reference : nullptr);

        for (const auto& f : res.failures) {
            std::cerr << "trajectory " << f.index << " failed (" << qtraj::to_string(f.kind)
                      << ") at t=" << f.time << ": " << f.message << "\n";
        }

        if (!problem.output.expect_csv.empty()) {
            std::ofstream ofs = qtraj::io::open_output(problem.output.expect_csv);
            qtraj::io::write_expect_csv(ofs, res, problem.observable_labels);
            std::cout << "Wrote expectation series to " << problem.output.expect_csv << "\n";
        }
        if (!problem.output.jumps_csv.empty()) {
            std::vector<std::string> channel_labels;
            for (const auto& c : problem.c_ops) channel_labels.push_back(c.label);
            std::ofstream ofs = qtraj::io::open_output(problem.output.jumps_csv);
            qtraj::io::write_jumps_csv(ofs, res.trajectories, channel_labels);
            std::cout << "Wrote jump events to " << problem.output.jumps_csv << "\n";
        }
        if (!problem.output.rho_csv.empty() && !res.states.empty()) {
            qtraj::io::write_csv_matrix(problem.output.rho_csv, res.states.back());
            std::cout << "Wrote rho(tf) to " << problem.output.rho_csv << "\n";
        }
        if (!problem.output.reference_csv.empty() && problem.reference.enabled) {
            std::ofstream ofs = qtraj::io::open_output(problem.output.reference_csv);
            qtraj::io::write_expect_csv(ofs, reference, problem.observable_labels);
            std::cout << "Wrote master-equation series to " << problem.output.reference_csv << "\n";
        }
        return 0;
    } catch (const qtraj::EnsembleFailure& ex) {
        std::cerr << "Error: " << ex.what() << "\n";
        for (const auto& f : ex.failures()) {
            std::cerr << "  trajectory " << f.index << " (" << qtraj::to_string(f.kind) << "): " << f.message << "\n";
        }
        return 1;
    } catch (const std::exception& ex) {
        std::cerr << "Error: " << ex.what() << "\n";
        return 1;
    }
}
