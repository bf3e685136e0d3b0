#include <Eigen/Dense>

#include <cmath>
#include <complex>
#include <iostream>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "qtraj/errors.hpp"
#include "qtraj/generator.hpp"
#include "qtraj/ops.hpp"

using Matrix = Eigen::MatrixXcd;
using cd = std::complex<double>;

static int fails = 0;

static void check_close(const char* name, double got, double expect, double tol) {
    const double e = std::abs(got - expect);
    std::ostringstream line;
    line.setf(std::ios::fixed);
    line.precision(12);
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

template <class Ex, class F>
static void check_throws(const char* name, F&& f) {
    try {
        f();
    } catch (const Ex&) {
        std::cout << "ok   " << name << " (threw)\n";
        return;
    } catch (const std::exception& ex) {
        std::cerr << "FAIL " << name << ": wrong exception: " << ex.what() << "\n";
        ++fails;
        return;
    }
    std::cerr << "FAIL " << name << ": no exception\n";
    ++fails;
}

static Matrix sample_hamiltonian() {
    Matrix H(3, 3);
    H << cd(1.0, 0.0),  cd(0.2, -0.1), cd(0.0, 0.3),
         cd(0.2, 0.1),  cd(-0.5, 0.0), cd(0.4, 0.0),
         cd(0.0, -0.3), cd(0.4, 0.0),  cd(0.25, 0.0);
    return H;
}

static void test_closed_form() {
    const Matrix H = sample_hamiltonian();
    const Matrix A1 = qtraj::ops::basis_op(3, 0, 1);
    const Matrix A2 = qtraj::ops::basis_op(3, 1, 2) + cd(0.0, 0.5) * qtraj::ops::basis_op(3, 0, 2);
    const std::vector<qtraj::CollapseOperator> c_ops{
        qtraj::make_collapse("a", 0.3, A1),
        qtraj::make_collapse("b", 1.7, A2)};

    const Matrix G = qtraj::build_effective_hamiltonian(H, c_ops);
    const Matrix expect = H - cd(0.0, 0.5) * (0.3 * A1.adjoint() * A1 + 1.7 * A2.adjoint() * A2);
    check_close("G closed form", (G - expect).norm(), 0.0, 1e-14);

    // Hermitian part is H, anti-Hermitian part is -(1/2) Σ C†C
    const Matrix herm = 0.5 * (G + G.adjoint());
    const Matrix anti = (G - G.adjoint()) / cd(0.0, 2.0);
    check_close("G Hermitian part", (herm - H).norm(), 0.0, 1e-14);
    const Matrix decay = 0.3 * A1.adjoint() * A1 + 1.7 * A2.adjoint() * A2;
    check_close("G anti-Hermitian part", (anti + 0.5 * decay).norm(), 0.0, 1e-14);

    const std::vector<qtraj::CollapseOperator> none;
    check_close("empty collapse list gives G = H", (qtraj::build_effective_hamiltonian(H, none) - H).norm(), 0.0, 0.0);
}

static void test_make_collapse() {
    const qtraj::CollapseOperator c = qtraj::make_collapse("decay", 0.25, qtraj::ops::sigma_minus());
    check_true("label kept", c.label == "decay");
    check_close("sqrt(rate) folded in", std::abs(c.matrix(0, 1) - cd(0.5, 0.0)), 0.0, 1e-15);
    const qtraj::CollapseOperator z = qtraj::make_collapse("off", 0.0, qtraj::ops::sigma_minus());
    check_close("zero rate allowed", z.matrix.norm(), 0.0, 0.0);

    check_throws<qtraj::ConfigError>("negative rate", [] {
        (void)qtraj::make_collapse("bad", -1.0, qtraj::ops::sigma_minus());
    });
    check_throws<qtraj::ConfigError>("NaN rate", [] {
        (void)qtraj::make_collapse("bad", std::numeric_limits<double>::quiet_NaN(), qtraj::ops::sigma_minus());
    });
}

static void test_effective_generator() {
    const Matrix H = sample_hamiltonian();
    const std::vector<qtraj::CollapseOperator> c_ops{qtraj::make_collapse("a", 2.0, qtraj::ops::basis_op(3, 0, 2))};
    const qtraj::EffectiveGenerator gen(H, c_ops);

    check_true("dimension", gen.dimension() == 3);
    check_true("has_dissipation", gen.has_dissipation());
    check_true("num_collapse_operators", gen.num_collapse_operators() == 1);
    check_close("rhs_operator = -iG", (gen.rhs_operator() - cd(0.0, -1.0) * gen.matrix()).norm(), 0.0, 1e-15);
    const Matrix& C = gen.collapse_matrix(0);
    check_close("rate_operator = C†C", (gen.rate_operator(0) - C.adjoint() * C).norm(), 0.0, 1e-15);
    check_close("rate_operator(0)(2,2) = rate", gen.rate_operator(0)(2, 2).real(), 2.0, 1e-14);

    const qtraj::EffectiveGenerator closed(H, {});
    check_true("no collapse operators", !closed.has_dissipation());
    check_close("closed system G = H", (closed.matrix() - H).norm(), 0.0, 0.0);
}

static void test_composite_system() {
    // Decay of the first qubit of a pair, built from local factors
    const Matrix I2 = Matrix::Identity(2, 2);
    const Matrix H = qtraj::ops::tensor({qtraj::ops::projector(2, 1), I2}) + qtraj::ops::tensor({I2, qtraj::ops::projector(2, 1)});
    const Matrix C_local = qtraj::ops::tensor({qtraj::ops::sigma_minus(), I2});
    const qtraj::EffectiveGenerator gen(H, {qtraj::make_collapse("decay_a", 0.5, C_local)});
    check_true("pair dimension", gen.dimension() == 4);

    const Eigen::VectorXcd eg = qtraj::ops::kron_ket(qtraj::ops::ket(2, 1), qtraj::ops::ket(2, 0));
    check_true("|e>|g> is basis state 2", eg == qtraj::ops::ket(4, 2));
    const Eigen::VectorXcd jumped = gen.collapse_matrix(0) * eg;
    check_close("C|e,g> = sqrt(rate)|g,g>", (jumped - std::sqrt(0.5) * qtraj::ops::ket(4, 0)).norm(), 0.0, 1e-15);
    check_close("C|g,e> = 0", (gen.collapse_matrix(0) * qtraj::ops::ket(4, 1)).norm(), 0.0, 0.0);
    check_close("G on |e,g> decays at rate/2",
                (gen.matrix() * eg - cd(1.0, -0.25) * eg).norm(), 0.0, 1e-15);

    const Matrix sxsz = qtraj::ops::tensor({qtraj::ops::sigma_x(), qtraj::ops::sigma_z()});
    check_true("sx (x) sz places sz off-diagonal", sxsz(0, 2) == cd(1.0, 0.0) && sxsz(1, 3) == cd(-1.0, 0.0) &&
                                                  sxsz(0, 0) == cd(0.0, 0.0));
    check_true("single factor is returned as is", qtraj::ops::tensor({qtraj::ops::sigma_y()}) == qtraj::ops::sigma_y());
    check_throws<std::invalid_argument>("tensor of no factors", [] { (void)qtraj::ops::tensor({}); });
}

static void test_rejects_bad_input() {
    const Matrix H = sample_hamiltonian();
    check_throws<qtraj::DimensionMismatch>("collapse shape mismatch", [&] {
        const std::vector<qtraj::CollapseOperator> c_ops{qtraj::make_collapse("x", 1.0, qtraj::ops::sigma_minus())};
        (void)qtraj::build_effective_hamiltonian(H, c_ops);
    });
    check_throws<qtraj::DimensionMismatch>("non-square Hamiltonian", [] {
        const Matrix R = Matrix::Zero(2, 3);
        (void)qtraj::build_effective_hamiltonian(R, {});
    });
    check_throws<qtraj::ConfigError>("non-Hermitian Hamiltonian", [] {
        Matrix bad = Matrix::Zero(2, 2);
        bad(0, 1) = 1.0;
        const qtraj::EffectiveGenerator gen(bad, {});
    });
    check_throws<qtraj::ConfigError>("empty Hamiltonian", [] {
        const qtraj::EffectiveGenerator gen(Matrix(), {});
    });
}

int main() {
    std::cout.setf(std::ios::fixed);
    std::cout.precision(12);

    test_closed_form();
    test_make_collapse();
    test_effective_generator();
    test_composite_system();
    test_rejects_bad_input();

    if (fails) {
        std::cerr << "\nFAILED: " << fails << " test(s)\n";
        return 1;
    }
    std::cout << "\nAll generator tests passed.\n";
    return 0;
}
