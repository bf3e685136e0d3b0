#include "qtraj/config.hpp"

#include <algorithm>
#include <cctype>
#include <complex>
#include <stdexcept>
#include <string>

#include "qtraj/ops.hpp"

namespace qtraj::config {

namespace {

using Matrix = Eigen::MatrixXcd;
using Vector = Eigen::VectorXcd;

std::string lower_copy(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

template <class T>
T get_or(const YAML::Node& n, const char* key, T fallback) {
    return n && n[key] ? n[key].as<T>() : fallback;
}

Eigen::MatrixXd parse_real_matrix(const YAML::Node& n, const std::string& name) {
    if (!n || !n.IsSequence()) {
        throw std::runtime_error(name + " must be a sequence of rows");
    }
    const std::size_t rows = n.size();
    if (rows == 0) return Eigen::MatrixXd();
    if (!n[0].IsSequence()) throw std::runtime_error(name + " must be a 2D sequence");
    const std::size_t cols = n[0].size();

    Eigen::MatrixXd out(static_cast<Eigen::Index>(rows), static_cast<Eigen::Index>(cols));
    for (std::size_t r = 0; r < rows; ++r) {
        const YAML::Node row = n[r];
        if (!row.IsSequence()) throw std::runtime_error(name + " row is not a sequence");
        if (row.size() != cols) throw std::runtime_error(name + " has inconsistent row sizes");
        for (std::size_t c = 0; c < cols; ++c) {
            out(static_cast<Eigen::Index>(r), static_cast<Eigen::Index>(c)) = row[c].as<double>();
        }
    }
    return out;
}

Matrix parse_complex_matrix(const YAML::Node& n, const std::string& name) {
    const Eigen::MatrixXd re = parse_real_matrix(n["re"], name + ".re");
    Eigen::MatrixXd im = Eigen::MatrixXd::Zero(re.rows(), re.cols());
    if (n["im"]) {
        im = parse_real_matrix(n["im"], name + ".im");
        if (im.rows() != re.rows() || im.cols() != re.cols()) {
            throw std::runtime_error(name + ": re/im dims mismatch");
        }
    }
    Matrix out(re.rows(), re.cols());
    out.real() = re;
    out.imag() = im;
    return out;
}

Vector parse_real_vector(const YAML::Node& n, const std::string& name) {
    if (!n || !n.IsSequence()) throw std::runtime_error(name + " must be a sequence");
    Vector v(static_cast<Eigen::Index>(n.size()));
    for (std::size_t i = 0; i < n.size(); ++i) v(static_cast<Eigen::Index>(i)) = n[i].as<double>();
    return v;
}

Matrix named_operator(const std::string& raw, std::size_t dim, const std::string& name) {
    const std::string op = lower_copy(raw);
    if (op == "sigma_x" || op == "sigmax") return ops::sigma_x();
    if (op == "sigma_y" || op == "sigmay") return ops::sigma_y();
    if (op == "sigma_z" || op == "sigmaz") return ops::sigma_z();
    if (op == "sigma_plus" || op == "sigmap") return ops::sigma_plus();
    if (op == "sigma_minus" || op == "sigmam") return ops::sigma_minus();

    if (dim == 0) throw std::runtime_error(name + ": operator '" + raw + "' needs a dimension (dim)");
    if (op == "destroy" || op == "a") return ops::destroy(dim);
    if (op == "create" || op == "adag") return ops::create(dim);
    if (op == "num" || op == "n") return ops::num(dim);
    if (op == "identity" || op == "eye") return ops::identity(dim);
    throw std::runtime_error(name + ": unknown operator '" + raw + "'");
}

} // namespace

Matrix parse_operator(const YAML::Node& n, std::size_t dim, const std::string& name) {
    if (!n) throw std::runtime_error("Missing key: " + name);

    if (n.IsScalar()) return named_operator(n.as<std::string>(), dim, name);

    if (n.IsSequence()) {
        if (n.size() == 0) throw std::runtime_error(name + " must not be an empty sum");
        Matrix sum = parse_operator(n[0], dim, name + "[0]");
        for (std::size_t i = 1; i < n.size(); ++i) {
            const Matrix term = parse_operator(n[i], dim, name + "[" + std::to_string(i) + "]");
            if (term.rows() != sum.rows() || term.cols() != sum.cols()) {
                throw std::runtime_error(name + ": terms have different dimensions");
            }
            sum += term;
        }
        return sum;
    }

    if (!n.IsMap()) throw std::runtime_error(name + " must be a name, a map or a sequence of terms");

    Matrix out;
    if (n["re"]) {
        out = parse_complex_matrix(n, name);
    } else if (n["op"]) {
        const std::size_t op_dim = n["dim"] ? n["dim"].as<std::size_t>() : dim;
        out = named_operator(n["op"].as<std::string>(), op_dim, name);
    } else {
        throw std::runtime_error(name + " must carry either 'op' or 're'");
    }
    if (n["scale"]) {
        if (n["scale"].IsSequence()) {
            out *= std::complex<double>(n["scale"][0].as<double>(), n["scale"][1].as<double>());
        } else {
            out *= n["scale"].as<double>();
        }
    }
    return out;
}

std::vector<double> parse_times(const YAML::Node& n, const std::string& name) {
    if (!n) throw std::runtime_error("Missing key: " + name);
    std::vector<double> times;
    if (n.IsSequence()) {
        times.reserve(n.size());
        for (const auto& v : n) times.push_back(v.as<double>());
        return times;
    }
    if (!n.IsMap()) throw std::runtime_error(name + " must be a list or {t0, tf, steps}");
    if (!n["tf"] || !n["steps"]) throw std::runtime_error(name + " needs keys tf and steps");
    const double t0 = get_or(n, "t0", 0.0);
    const double tf = n["tf"].as<double>();
    const auto steps = n["steps"].as<std::size_t>();
    if (steps < 2) throw std::runtime_error(name + ".steps must be >= 2");
    times.resize(steps);
    const double h = (tf - t0) / static_cast<double>(steps - 1);
    for (std::size_t i = 0; i < steps; ++i) times[i] = t0 + h * static_cast<double>(i);
    times.back() = tf;
    return times;
}

Vector parse_state(const YAML::Node& n, std::size_t dim, const std::string& name) {
    if (!n) return ops::ket(dim, 0);
    if (n.IsScalar()) {
        const std::string s = lower_copy(n.as<std::string>());
        if (dim == 2 && (s == "g" || s == "ground")) return ops::ket(2, 0);
        if (dim == 2 && (s == "e" || s == "excited")) return ops::ket(2, 1);
        long long idx = -1;
        std::size_t pos = 0;
        try {
            idx = std::stoll(s, &pos);
        } catch (const std::exception&) {
            pos = 0;
        }
        if (pos == 0 || pos != s.size()) {
            throw std::runtime_error(name + ": unknown state '" + n.as<std::string>() + "'");
        }
        if (idx < 0 || static_cast<std::size_t>(idx) >= dim) {
            throw std::runtime_error(name + ": basis index out of range");
        }
        return ops::ket(dim, static_cast<std::size_t>(idx));
    }
    Vector psi;
    if (n.IsSequence()) {
        psi = parse_real_vector(n, name);
    } else if (n.IsMap() && n["re"]) {
        psi = parse_real_vector(n["re"], name + ".re");
        if (n["im"]) {
            const Vector im = parse_real_vector(n["im"], name + ".im");
            if (im.size() != psi.size()) throw std::runtime_error(name + ": re/im size mismatch");
            psi += std::complex<double>(0.0, 1.0) * im;
        }
    } else {
        throw std::runtime_error(name + " must be an index, a list of amplitudes or {re, im}");
    }
    if (psi.size() != static_cast<Eigen::Index>(dim)) {
        throw std::runtime_error(name + ": dimension mismatch");
    }
    return psi;
}

Options parse_options(const YAML::Node& n) {
    Options o;
    if (!n) return o;
    if (!n.IsMap()) throw std::runtime_error("solver must be a map");
    o.atol = get_or(n, "atol", o.atol);
    o.rtol = get_or(n, "rtol", o.rtol);
    o.max_step = get_or(n, "max_step", o.max_step);
    o.max_rejected_steps = get_or(n, "max_rejected_steps", o.max_rejected_steps);
    o.jump_time_tol = get_or(n, "jump_time_tol", o.jump_time_tol);
    o.max_bisection_iterations = get_or(n, "max_bisection_iterations", o.max_bisection_iterations);
    o.keep_states = get_or(n, "keep_states", o.keep_states);
    o.average_states = get_or(n, "average_states", o.average_states);
    o.std_error = get_or(n, "std_error", o.std_error);
    o.n_workers = get_or(n, "n_workers", o.n_workers);
    o.timeout = get_or(n, "timeout", o.timeout);
    o.min_success_fraction = get_or(n, "min_success_fraction", o.min_success_fraction);
    return o;
}

Problem load_problem(const YAML::Node& root) {
    Problem p;

    const YAML::Node sysn = root["system"];
    if (!sysn) throw std::runtime_error("Missing key: system");
    const std::size_t dim_hint = get_or<std::size_t>(sysn, "dim", 0);
    p.H = parse_operator(sysn["H"], dim_hint, "system.H");
    if (p.H.rows() != p.H.cols()) throw std::runtime_error("system.H must be square");
    p.dim = static_cast<std::size_t>(p.H.rows());
    if (dim_hint != 0 && dim_hint != p.dim) throw std::runtime_error("system.dim does not match system.H");

    if (const YAML::Node cn = root["collapse"]) {
        if (!cn.IsSequence()) throw std::runtime_error("collapse must be a sequence");
        for (std::size_t i = 0; i < cn.size(); ++i) {
            const std::string key = "collapse[" + std::to_string(i) + "]";
            const YAML::Node c = cn[i];
            if (!c["rate"]) throw std::runtime_error("Missing key: " + key + ".rate");
            const std::string label = get_or<std::string>(c, "label", "c" + std::to_string(i));
            p.c_ops.push_back(make_collapse(label, c["rate"].as<double>(),
                                            parse_operator(c["op"], p.dim, key + ".op")));
        }
    }

    if (const YAML::Node on = root["observables"]) {
        if (!on.IsSequence()) throw std::runtime_error("observables must be a sequence");
        for (std::size_t i = 0; i < on.size(); ++i) {
            const std::string key = "observables[" + std::to_string(i) + "]";
            p.observable_labels.push_back(get_or<std::string>(on[i], "label", "O" + std::to_string(i)));
            p.observables.push_back(parse_operator(on[i]["op"], p.dim, key + ".op"));
        }
    }

    p.psi0 = parse_state(root["initial_state"], p.dim, "initial_state");
    p.times = parse_times(root["times"], "times");

    p.n_trajectories = get_or<std::size_t>(root, "trajectories", p.n_trajectories);
    p.seed = get_or<std::uint64_t>(root, "seed", p.seed);
    p.options = parse_options(root["solver"]);

    if (const YAML::Node ref = root["reference"]) {
        p.reference.enabled = get_or(ref, "enabled", true);
        const std::string m = lower_copy(get_or<std::string>(ref, "method", "expm"));
        if (m == "expm") p.reference.method = MasterEquationMethod::Expm;
        else if (m == "rk4") p.reference.method = MasterEquationMethod::Rk4;
        else throw std::runtime_error("reference.method must be expm or rk4");
        p.reference.rk4_dt = get_or(ref, "rk4_dt", p.reference.rk4_dt);
    }

    if (const YAML::Node out = root["output"]) {
        p.output.expect_csv = get_or<std::string>(out, "expect_csv", "");
        p.output.jumps_csv = get_or<std::string>(out, "jumps_csv", "");
        p.output.rho_csv = get_or<std::string>(out, "rho_csv", "");
        p.output.reference_csv = get_or<std::string>(out, "reference_csv", "");
        p.show_progress = get_or(out, "progress", false);
    }
    return p;
}

Problem load_problem_file(const std::string& path) {
    return load_problem(YAML::LoadFile(path));
}

} // namespace qtraj::config
