#include "difference_interpolation/hermite_spline.h"
#include "difference_interpolation/errors.h"
#include <Eigen/Dense>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <sstream>
#include <stdexcept>

namespace diff_interp {

HermiteSpline::HermiteSpline(const SamplePoints& points, BoundaryCondition boundary,
                             const std::vector<double>& boundary_values)
    : xs_(points.x_values())
    , ys_(points.y_values())
    , boundary_(boundary) {
    int n = size();
    for (int i = 0; i + 1 < n; ++i) {
        if (!(xs_[i] < xs_[i + 1])) {
            throw std::invalid_argument("Spline nodes must be strictly increasing");
        }
    }

    switch (boundary_) {
        case BoundaryCondition::NOT_A_KNOT:
            if (n < 4) {
                throw InsufficientPointsError("Not-a-knot spline requires at least 4 points");
            }
            break;
        case BoundaryCondition::PERIODIC:
            if (n < 3) {
                throw InsufficientPointsError("Periodic spline requires at least 3 points");
            }
            if (ys_.front() != ys_.back()) {
                throw std::invalid_argument("Periodic spline requires y_0 == y_{n-1}");
            }
            break;
        case BoundaryCondition::CLAMPED:
        case BoundaryCondition::SECOND:
            if (boundary_values.size() != 2) {
                throw std::invalid_argument(std::string("Boundary condition '") +
                                            boundary_condition_name(boundary_) +
                                            "' requires two boundary values");
            }
            break;
    }

    solve_slopes(boundary_values);
    build_segments();
}

void HermiteSpline::solve_slopes(const std::vector<double>& boundary_values) {
    int n = size();
    std::vector<double> h(n - 1), delta(n - 1);
    for (int i = 0; i < n - 1; ++i) {
        h[i] = xs_[i + 1] - xs_[i];
        delta[i] = (ys_[i + 1] - ys_[i]) / h[i];
    }

    Eigen::MatrixXd A = Eigen::MatrixXd::Zero(n, n);
    Eigen::VectorXd rhs = Eigen::VectorXd::Zero(n);

    // Непрерывность второй производной во внутренних узлах
    for (int i = 1; i < n - 1; ++i) {
        double sum = h[i - 1] + h[i];
        double lambda = h[i] / sum;
        double mu = h[i - 1] / sum;
        A(i, i - 1) = lambda;
        A(i, i) = 2.0;
        A(i, i + 1) = mu;
        rhs(i) = 3.0 * (mu * delta[i] + lambda * delta[i - 1]);
    }

    int last = n - 1;
    switch (boundary_) {
        case BoundaryCondition::CLAMPED:
            A(0, 0) = 1.0;
            rhs(0) = boundary_values[0];
            A(last, last) = 1.0;
            rhs(last) = boundary_values[1];
            break;

        case BoundaryCondition::SECOND: {
            // S''(x_0) = (6Δ_0 - 4m_0 - 2m_1)/h_0
            A(0, 0) = 2.0;
            A(0, 1) = 1.0;
            rhs(0) = 3.0 * delta[0] - h[0] * boundary_values[0] / 2.0;
            // S''(x_{n-1}) = (2m_{n-2} + 4m_{n-1} - 6Δ)/h
            double hl = h[last - 1];
            A(last, last - 1) = 1.0;
            A(last, last) = 2.0;
            rhs(last) = 3.0 * delta[last - 1] + hl * boundary_values[1] / 2.0;
            break;
        }

        case BoundaryCondition::PERIODIC: {
            A(0, 0) = 1.0;
            A(0, last) = -1.0;
            rhs(0) = 0.0;
            // S''(x_0) = S''(x_{n-1})
            double h0 = h[0];
            double hl = h[last - 1];
            A(last, 0) += 4.0 / h0;
            A(last, 1) += 2.0 / h0;
            A(last, last - 1) += 2.0 / hl;
            A(last, last) += 4.0 / hl;
            rhs(last) = 6.0 * delta[0] / h0 + 6.0 * delta[last - 1] / hl;
            break;
        }

        case BoundaryCondition::NOT_A_KNOT: {
            // d_0 = d_1: h_1² m_0 + (h_1² - h_0²) m_1 - h_0² m_2 = 2(h_1² Δ_0 - h_0² Δ_1)
            double a2 = h[0] * h[0];
            double b2 = h[1] * h[1];
            A(0, 0) = b2;
            A(0, 1) = b2 - a2;
            A(0, 2) = -a2;
            rhs(0) = 2.0 * (b2 * delta[0] - a2 * delta[1]);

            double c2 = h[last - 2] * h[last - 2];
            double e2 = h[last - 1] * h[last - 1];
            A(last, last - 2) = e2;
            A(last, last - 1) = e2 - c2;
            A(last, last) = -c2;
            rhs(last) = 2.0 * (e2 * delta[last - 2] - c2 * delta[last - 1]);
            break;
        }
    }

    Eigen::PartialPivLU<Eigen::MatrixXd> lu(A);
    Eigen::VectorXd m = lu.solve(rhs);

    slopes_.resize(n);
    for (int i = 0; i < n; ++i) {
        if (!std::isfinite(m(i))) {
            throw DomainError("Spline slope system is singular");
        }
        slopes_[i] = m(i);
    }
}

void HermiteSpline::build_segments() {
    int n = size();
    segments_.clear();
    segments_.reserve(n - 1);
    for (int i = 0; i < n - 1; ++i) {
        double hi = xs_[i + 1] - xs_[i];
        double dy = ys_[i + 1] - ys_[i];
        Segment seg;
        seg.a = ys_[i];
        seg.b = slopes_[i];
        seg.c = 3.0 * dy / (hi * hi) - (2.0 * slopes_[i] + slopes_[i + 1]) / hi;
        seg.d = -2.0 * dy / (hi * hi * hi) + (slopes_[i] + slopes_[i + 1]) / (hi * hi);
        seg.x0 = xs_[i];
        segments_.push_back(seg);
    }
}

int HermiteSpline::segment_index(double x) const {
    int i = static_cast<int>(std::upper_bound(xs_.begin(), xs_.end(), x) - xs_.begin()) - 1;
    return std::max(0, std::min(i, size() - 2));
}

double HermiteSpline::evaluate(double x) const {
    const Segment& seg = segments_[segment_index(x)];
    double dx = x - seg.x0;
    return seg.a + dx * (seg.b + dx * (seg.c + dx * seg.d));
}

double HermiteSpline::derivative(double x, int k) const {
    if (k < 0) {
        throw std::invalid_argument("Derivative order must be non-negative");
    }
    const Segment& seg = segments_[segment_index(x)];
    double dx = x - seg.x0;
    switch (k) {
        case 0:
            return seg.a + dx * (seg.b + dx * (seg.c + dx * seg.d));
        case 1:
            return seg.b + dx * (2.0 * seg.c + 3.0 * seg.d * dx);
        case 2:
            return 2.0 * seg.c + 6.0 * seg.d * dx;
        case 3:
            return 6.0 * seg.d;
        default:
            return 0.0;
    }
}

double HermiteSpline::segment_antiderivative(int i, double x) const {
    const Segment& seg = segments_[i];
    double dx = x - seg.x0;
    return dx * (seg.a + dx * (seg.b / 2.0 + dx * (seg.c / 3.0 + dx * seg.d / 4.0)));
}

double HermiteSpline::integrate(double a, double b) const {
    double sign = 1.0;
    if (a > b) {
        std::swap(a, b);
        sign = -1.0;
    }

    int left = segment_index(a);
    int right = segment_index(b);

    double total = 0.0;
    for (int i = left; i <= right; ++i) {
        double x0 = (i == left) ? a : xs_[i];
        double x1 = (i == right) ? b : xs_[i + 1];
        total += segment_antiderivative(i, x1) - segment_antiderivative(i, x0);
    }
    return sign * total;
}

std::string HermiteSpline::get_info() const {
    std::ostringstream oss;
    oss << "HermiteSpline(points=" << size()
        << ", boundary=" << boundary_condition_name(boundary_)
        << ", range=[" << xs_.front() << ", " << xs_.back() << "])";
    return oss.str();
}

const char* boundary_condition_name(BoundaryCondition boundary) {
    switch (boundary) {
        case BoundaryCondition::NOT_A_KNOT: return "not-a-knot";
        case BoundaryCondition::CLAMPED:    return "clamped";
        case BoundaryCondition::SECOND:     return "second";
        case BoundaryCondition::PERIODIC:   return "periodic";
    }
    return "unknown";
}

BoundaryCondition parse_boundary_condition(const std::string& name) {
    std::string key;
    key.reserve(name.size());
    for (char c : name) {
        if (c == '_' || c == ' ') {
            key.push_back('-');
        } else {
            key.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
        }
    }

    static const BoundaryCondition all[] = {
        BoundaryCondition::NOT_A_KNOT, BoundaryCondition::CLAMPED,
        BoundaryCondition::SECOND, BoundaryCondition::PERIODIC
    };
    for (BoundaryCondition bc : all) {
        if (key == boundary_condition_name(bc)) return bc;
    }

    throw std::invalid_argument("Unknown boundary condition: '" + name + "'");
}

} // namespace diff_interp
