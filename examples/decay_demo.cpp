// Two-level spontaneous decay: ensemble <sigma_z>(t) against 2 exp(-gamma t) - 1, printed as CSV.

#include <Eigen/Dense>

#include <cmath>
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

#include "qtraj/ensemble.hpp"
#include "qtraj/ops.hpp"

int main(int argc, char** argv) {
    try {
        std::size_t n_traj = 500;
        std::uint64_t seed = 7;
        double gamma = 0.3;
        for (int i = 1; i < argc; ++i) {
            const std::string arg(argv[i]);
            if (arg.rfind("--trajectories=", 0) == 0) n_traj = std::stoul(arg.substr(15));
            else if (arg.rfind("--seed=", 0) == 0) seed = std::stoull(arg.substr(7));
            else if (arg.rfind("--gamma=", 0) == 0) gamma = std::stod(arg.substr(8));
        }

        Eigen::MatrixXcd H = Eigen::MatrixXcd::Zero(2, 2);
        H(1, 1) = 1.0;
        const std::vector<qtraj::CollapseOperator> c_ops{qtraj::make_collapse("decay", gamma, qtraj::ops::sigma_minus())};
        const Eigen::MatrixXcd sz = qtraj::ops::projector(2, 1) - qtraj::ops::projector(2, 0);

        std::vector<double> times(51);
        for (std::size_t i = 0; i < times.size(); ++i) times[i] = 0.2 * static_cast<double>(i);

        const qtraj::EnsembleResult res =
            qtraj::simulate(H, c_ops, qtraj::ops::ket(2, 1), times, {sz}, n_traj, seed);

        std::cout.setf(std::ios::fixed);
        std::cout << std::setprecision(6);
        std::cout << "t,sz_mc,sz_se,sz_exact\n";
        for (std::size_t i = 0; i < times.size(); ++i) {
            const auto row = static_cast<Eigen::Index>(i);
            std::cout << times[i] << "," << res.expect[0](row).real() << "," << res.std_error[0](row) << ","
                      << 2.0 * std::exp(-gamma * times[i]) - 1.0 << "\n";
        }
        return 0;
    } catch (const std::exception& ex) {
        std::cerr << "Error: " << ex.what() << "\n";
        return 1;
    }
}
