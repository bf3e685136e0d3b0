#include <Eigen/Dense>

#include <algorithm>
#include <cmath>
#include <complex>
#include <cstdlib>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include "qtraj/errors.hpp"
#include "qtraj/lindblad.hpp"
#include "qtraj/ops.hpp"

using Matrix = Eigen::MatrixXcd;
using Vector = Eigen::VectorXcd;
using cd = std::complex<double>;

static int fails = 0;

static void check_close(const char* name, double got, double expect, double tol) {
    const double e = std::abs(got - expect);
    std::ostringstream line;
    line.setf(std::ios::scientific);
    line.precision(6);
    if (!(e <= tol)) {
        line << "FAIL " << name << ": got=" << got << " expect=" << expect << " err=" << e;
        std::cerr << line.str() << "\n";
        ++fails;
    } else {
        line << "ok   " << name << " (err=" << e << ")";
        std::cout << line.str() << "\n";
    }
}

static void check_true(const char* name, bool cond) {
    if (!cond) {
        std::cerr << "FAIL " << name << "\n";
        ++fails;
    } else {
        std::cout << "ok   " << name << "\n";
    }
}

static Matrix random_hermitian(Eigen::Index n, unsigned seed) {
    std::srand(seed);
    const Matrix A = Matrix::Random(n, n);
    return 0.5 * (A + A.adjoint());
}

static Matrix decaying_qubit_h(double omega) {
    Matrix H = Matrix::Zero(2, 2);
    H(1, 1) = omega;
    return H;
}

static void test_liouvillian_structure() {
    const Matrix H = random_hermitian(3, 7);
    std::srand(11);
    const std::vector<qtraj::CollapseOperator> c_ops{
        qtraj::make_collapse("a", 0.3, Matrix::Random(3, 3)),
        qtraj::make_collapse("b", 1.1, qtraj::ops::destroy(3))};

    const Matrix L = qtraj::liouvillian(H, c_ops);
    const cd i1(0.0, 1.0);
    Matrix expect = -i1 * (qtraj::ops::super_left(H) - qtraj::ops::super_right(H));
    for (const auto& c : c_ops) {
        const Matrix& C = c.matrix;
        const Matrix CdC = C.adjoint() * C;
        expect += qtraj::ops::super_left(C) * qtraj::ops::super_right(C.adjoint()) -
                  0.5 * qtraj::ops::super_left(CdC) - 0.5 * qtraj::ops::super_right(CdC);
    }
    check_close("L = commutator + dissipator superoperators", (L - expect).norm(), 0.0, 1e-12);

    // Tr(L vec X) = 0 for any X
    const Eigen::Index N = 3;
    double worst = 0.0;
    for (Eigen::Index col = 0; col < L.cols(); ++col) {
        cd s(0.0, 0.0);
        for (Eigen::Index j = 0; j < N; ++j) s += L(j * N + j, col);
        worst = std::max(worst, std::abs(s));
    }
    check_close("Liouvillian preserves the trace", worst, 0.0, 1e-12);
}

static void test_mesolve_decay() {
    const double gamma = 0.7;
    const std::vector<qtraj::CollapseOperator> c_ops{qtraj::make_collapse("decay", gamma, qtraj::ops::sigma_minus())};
    const Matrix rho0 = qtraj::ops::rho_pure(qtraj::ops::ket(2, 1));
    std::vector<double> times;
    for (int i = 0; i <= 20; ++i) times.push_back(0.25 * i);
    const std::vector<Matrix> obs{qtraj::ops::projector(2, 1)};

    const auto expm = qtraj::mesolve(decaying_qubit_h(1.0), c_ops, rho0, times, obs);
    const auto rk4 = qtraj::mesolve(decaying_qubit_h(1.0), c_ops, rho0, times, obs,
                                    qtraj::MasterEquationMethod::Rk4, 1e-3);
    double err_expm = 0.0;
    double err_rk4 = 0.0;
    double trace_dev = 0.0;
    for (std::size_t i = 0; i < times.size(); ++i) {
        const double exact = std::exp(-gamma * times[i]);
        err_expm = std::max(err_expm, std::abs(expm.expect[0](static_cast<Eigen::Index>(i)) - exact));
        err_rk4 = std::max(err_rk4, std::abs(rk4.expect[0](static_cast<Eigen::Index>(i)) - exact));
        trace_dev = std::max(trace_dev, std::abs(expm.states[i].trace() - 1.0));
    }
    check_close("expm excited population = exp(-gamma t)", err_expm, 0.0, 1e-10);
    check_close("rk4 excited population = exp(-gamma t)", err_rk4, 0.0, 1e-8);
    check_close("trace stays one", trace_dev, 0.0, 1e-12);
    check_true("one state per output time", expm.states.size() == times.size() && rk4.states.size() == times.size());
    check_true("states are Hermitian", qtraj::ops::is_hermitian(expm.states.back()));
}

static void test_mesolve_uneven_times() {
    // Unequal spacing exercises the exponential cache refresh
    Matrix H(2, 2);
    H << cd(0.0, 0.0), cd(0.6, 0.0),
         cd(0.6, 0.0), cd(1.0, 0.0);
    const std::vector<qtraj::CollapseOperator> c_ops{qtraj::make_collapse("decay", 0.2, qtraj::ops::sigma_minus())};
    const Matrix rho0 = qtraj::ops::rho_pure(qtraj::ops::ket(2, 0));
    const std::vector<double> times{0.0, 0.1, 0.2, 0.7, 1.2, 3.0};
    const std::vector<Matrix> obs{qtraj::ops::sigma_x(), qtraj::ops::sigma_y()};
    const auto a = qtraj::mesolve(H, c_ops, rho0, times, obs);
    const auto b = qtraj::mesolve(H, c_ops, rho0, times, obs, qtraj::MasterEquationMethod::Rk4, 5e-4);
    double diff = 0.0;
    for (std::size_t k = 0; k < obs.size(); ++k) diff = std::max(diff, (a.expect[k] - b.expect[k]).cwiseAbs().maxCoeff());
    check_close("expm and rk4 agree on uneven output times", diff, 0.0, 1e-9);
}

static void test_steady_state_driven_qubit() {
    const double Omega = 0.8;
    const double gamma = 0.5;
    const Matrix H = 0.5 * Omega * qtraj::ops::sigma_x();
    const std::vector<qtraj::CollapseOperator> c_ops{qtraj::make_collapse("decay", gamma, qtraj::ops::sigma_minus())};

    const Matrix rho = qtraj::steady_state(H, c_ops);
    const double expect_ee = Omega * Omega / (gamma * gamma + 2.0 * Omega * Omega);
    check_close("steady excited population", rho(1, 1).real(), expect_ee, 1e-12);
    check_close("steady state has unit trace", std::abs(rho.trace() - 1.0), 0.0, 1e-12);

    const Matrix L = qtraj::liouvillian(H, c_ops);
    check_close("L vec(rho_ss) = 0", (L * qtraj::ops::vec(rho)).norm(), 0.0, 1e-10);

    // Long-time mesolve relaxes onto it
    const auto me = qtraj::mesolve(H, c_ops, qtraj::ops::rho_pure(qtraj::ops::ket(2, 0)), {0.0, 200.0}, {});
    check_close("mesolve relaxes to steady state", qtraj::ops::trace_distance(me.states.back(), rho), 0.0, 1e-9);
}

static void test_steady_state_not_unique() {
    bool threw = false;
    try {
        (void)qtraj::steady_state(decaying_qubit_h(1.0), {});
    } catch (const qtraj::ConfigError&) {
        threw = true;
    }
    check_true("closed system has no unique steady state", threw);
}

static void test_spectrum_and_gap() {
    const double omega = 1.3;
    const double gamma = 0.4;
    const std::vector<qtraj::CollapseOperator> c_ops{qtraj::make_collapse("decay", gamma, qtraj::ops::sigma_minus())};
    const Vector ev = qtraj::liouvillian_spectrum(qtraj::liouvillian(decaying_qubit_h(omega), c_ops));

    check_true("four eigenvalues", ev.size() == 4);
    if (ev.size() == 4) {
        check_close("stationary eigenvalue", std::abs(ev(0)), 0.0, 1e-10);
        // The coherence pair shares its real part up to round-off, so either order is fine
        const cd up(-0.5 * gamma, omega);
        const cd down(-0.5 * gamma, -omega);
        const double pair_err = std::min(std::max(std::abs(ev(1) - up), std::abs(ev(2) - down)),
                                         std::max(std::abs(ev(1) - down), std::abs(ev(2) - up)));
        check_close("coherences -gamma/2 +- i omega", pair_err, 0.0, 1e-10);
        check_close("population decay", std::abs(ev(3) - cd(-gamma, 0.0)), 0.0, 1e-10);
    }
    check_close("spectral gap is gamma / 2", qtraj::spectral_gap(ev), 0.5 * gamma, 1e-10);

    bool threw = false;
    try {
        (void)qtraj::liouvillian_spectrum(Matrix::Zero(2, 3));
    } catch (const qtraj::DimensionMismatch&) {
        threw = true;
    }
    check_true("non-square Liouvillian rejected", threw);
}

static void test_mesolve_validation() {
    const std::vector<qtraj::CollapseOperator> c_ops{qtraj::make_collapse("decay", 0.5, qtraj::ops::sigma_minus())};
    const Matrix H = decaying_qubit_h(1.0);
    const Matrix rho0 = qtraj::ops::rho_pure(qtraj::ops::ket(2, 1));

    bool threw = false;
    try {
        (void)qtraj::mesolve(H, c_ops, rho0, {}, {});
    } catch (const qtraj::ConfigError&) {
        threw = true;
    }
    check_true("empty time list rejected", threw);

    threw = false;
    try {
        (void)qtraj::mesolve(H, c_ops, rho0, {0.0, 1.0, 0.5}, {});
    } catch (const qtraj::ConfigError&) {
        threw = true;
    }
    check_true("non-increasing times rejected", threw);

    threw = false;
    try {
        (void)qtraj::mesolve(H, c_ops, Matrix::Identity(3, 3), {0.0, 1.0}, {});
    } catch (const qtraj::DimensionMismatch&) {
        threw = true;
    }
    check_true("rho0 dimension mismatch rejected", threw);

    threw = false;
    try {
        (void)qtraj::mesolve(H, c_ops, rho0, {0.0, 1.0}, {qtraj::ops::num(3)});
    } catch (const qtraj::DimensionMismatch&) {
        threw = true;
    }
    check_true("observable dimension mismatch rejected", threw);

    threw = false;
    try {
        (void)qtraj::mesolve(H, c_ops, rho0, {0.0, 1.0}, {}, qtraj::MasterEquationMethod::Rk4, 0.0);
    } catch (const qtraj::ConfigError&) {
        threw = true;
    }
    check_true("rk4 step must be positive", threw);
}

int main() {
    test_liouvillian_structure();
    test_mesolve_decay();
    test_mesolve_uneven_times();
    test_steady_state_driven_qubit();
    test_steady_state_not_unique();
    test_spectrum_and_gap();
    test_mesolve_validation();

    if (fails) {
        std::cerr << "\nFAILED: " << fails << " test(s)\n";
        return 1;
    }
    std::cout << "\nAll lindblad tests passed.\n";
    return 0;
}
