#include <Eigen/Dense>

#include <complex>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "qtraj/io.hpp"
#include "qtraj/progress.hpp"

using cd = std::complex<double>;

static int fails = 0;

static void check_true(const char* name, bool cond) {
    if (!cond) {
        std::cerr << "FAIL " << name << "\n";
        ++fails;
    } else {
        std::cout << "ok   " << name << "\n";
    }
}

static std::vector<std::string> lines_of(const std::string& text) {
    std::vector<std::string> out;
    std::istringstream is(text);
    for (std::string line; std::getline(is, line);) out.push_back(line);
    return out;
}

static void test_expect_csv() {
    qtraj::EnsembleResult res;
    res.times = {0.0, 0.5};
    res.n_trajectories = 4;
    res.n_success = 4;
    Eigen::VectorXcd sz(2);
    sz << cd(1.0, 0.0), cd(0.25, -0.5);
    res.expect.push_back(sz);
    Eigen::VectorXd se(2);
    se << 0.0, 0.125;
    res.std_error.push_back(se);

    std::ostringstream os;
    qtraj::io::write_expect_csv(os, res, {"sz"}, 3);
    const auto lines = lines_of(os.str());
    check_true("expect csv has header plus one row per time", lines.size() == 3);
    if (lines.size() == 3) {
        check_true("expect csv header", lines[0] == "t,sz_re,sz_im,sz_se");
        check_true("expect csv row", lines[2] == "0.500,0.250,-0.500,0.125");
    }

    res.std_error.clear();
    std::ostringstream bare;
    qtraj::io::write_expect_csv(bare, res);
    check_true("default labels, no error columns", lines_of(bare.str()).front() == "t,O0_re,O0_im");
}

static void test_reference_csv() {
    qtraj::MasterEquationResult me;
    me.times = {0.0, 1.0};
    Eigen::VectorXcd p(2);
    p << cd(1.0, 0.0), cd(0.5, 0.0);
    me.expect.push_back(p);
    std::ostringstream os;
    qtraj::io::write_expect_csv(os, me, {"pe"}, 2);
    const auto lines = lines_of(os.str());
    check_true("reference csv rows", lines.size() == 3 && lines[0] == "t,pe_re,pe_im" && lines[2] == "1.00,0.50,0.00");
}

static void test_jumps_and_failures_csv() {
    std::vector<qtraj::TrajectoryRecord> recs(2);
    recs[0].index = 0;
    recs[1].index = 3;
    recs[1].jumps.push_back(qtraj::JumpEvent{1.5, 1});
    recs[1].jumps.push_back(qtraj::JumpEvent{2.0, 0});
    std::ostringstream os;
    qtraj::io::write_jumps_csv(os, recs, {"decay", "dephasing"}, 1);
    const auto lines = lines_of(os.str());
    check_true("one row per jump", lines.size() == 3);
    if (lines.size() == 3) check_true("jump row carries the channel label", lines[1] == "3,1.5,1,dephasing");

    qtraj::TrajectoryFailure f;
    f.index = 7;
    f.kind = qtraj::FailureKind::IntegrationFailure;
    f.time = 0.0;
    f.message = "step size underflow, at t=0\nretry";
    std::ostringstream fs;
    qtraj::io::write_failures_csv(fs, {f});
    const auto flines = lines_of(fs.str());
    check_true("failure row stays on one line", flines.size() == 2);
    if (flines.size() == 2) {
        check_true("failure row fields", flines[1].rfind("7,IntegrationFailure,", 0) == 0 &&
                                          flines[1].find("step size underflow  at t=0 retry") != std::string::npos);
    }
}

static void test_matrix_csv() {
    Eigen::MatrixXcd M(2, 2);
    M << cd(0.75, 0.0), cd(0.0, 0.25),
         cd(0.0, -0.25), cd(0.25, 0.0);
    std::ostringstream os;
    qtraj::io::write_csv_matrix(os, M, 2);
    const auto lines = lines_of(os.str());
    check_true("matrix csv lists every element", lines.size() == 5 && lines[0] == "row,col,re,im");
    if (lines.size() == 5) check_true("row-major element order", lines[2] == "0,1,0.00,0.25");

    bool threw = false;
    try {
        (void)qtraj::io::open_output("/nonexistent-dir/qtraj/out.csv");
    } catch (const std::runtime_error&) {
        threw = true;
    }
    check_true("unwritable path reported", threw);
}

static void test_progress_reporter() {
    std::ostringstream os;
    qtraj::progress::Reporter report(os, 25);
    for (std::size_t done = 1; done <= 8; ++done) {
        qtraj::Progress p;
        p.completed = done;
        p.failed = done >= 7 ? 1 : 0;
        p.total = 8;
        p.elapsed = 0.5 * static_cast<double>(done);
        report(p);
    }
    const auto lines = lines_of(os.str());
    // 2/8, 4/8, 6/8 and 8/8 cross a 25% boundary
    check_true("one line per 25% milestone", lines.size() == 4);
    if (lines.size() == 4) {
        check_true("milestone line", lines[0] == "[qtraj] 2/8 trajectories, 1.00 s");
        check_true("final line reports failures", lines[3] == "[qtraj] 8/8 trajectories (1 failed), 4.00 s");
    }
}

int main() {
    test_expect_csv();
    test_reference_csv();
    test_jumps_and_failures_csv();
    test_matrix_csv();
    test_progress_reporter();

    if (fails) {
        std::cerr << "\nFAILED: " << fails << " test(s)\n";
        return 1;
    }
    std::cout << "\nAll io tests passed.\n";
    return 0;
}
