#include "difference_interpolation/error_estimator.h"
#include "difference_interpolation/interpolation.h"
#include "difference_interpolation/errors.h"
#include <Eigen/Dense>
#include <cmath>
#include <limits>
#include <stdexcept>

namespace diff_interp {

namespace {

double central_difference(const std::function<double(double)>& f, double x, double step) {
    if (step == 0.0 || !std::isfinite(step)) {
        throw std::invalid_argument("Derivative step must be finite and non-zero");
    }
    return (f(x + step) - f(x - step)) / (2.0 * step);
}

ConditionNumbers make_condition_numbers(double x, double fx, double dfx) {
    if (fx == 0.0) {
        throw DomainError("Relative condition number is undefined: f(x) == 0");
    }
    ConditionNumbers result;
    result.absolute = std::abs(x * dfx);
    result.relative = std::abs(x * dfx / fx);
    return result;
}

} // namespace

ConditionNumbers cond_nums(const std::function<double(double)>& f, double x, double step) {
    if (!f) {
        throw std::invalid_argument("Function must be provided");
    }
    double dfx = central_difference(f, x, step);
    return make_condition_numbers(x, f(x), dfx);
}

ConditionNumbers cond_nums(const std::function<double(double)>& f,
                           const std::function<double(double)>& df, double x) {
    if (!f || !df) {
        throw std::invalid_argument("Function and its derivative must be provided");
    }
    return make_condition_numbers(x, f(x), df(x));
}

double absolute_condition_number(const std::function<double(double)>& f, double x, double step) {
    if (!f) {
        throw std::invalid_argument("Function must be provided");
    }
    return std::abs(x * central_difference(f, x, step));
}

ConditionNumbers interpolation_cond_nums(const DifferenceTable& table, double x, Scheme scheme,
                                         int order) {
    double fx = evaluate(table, x, scheme, order).value;
    double dfx = derivative(table, x, 1, scheme, order);
    return make_condition_numbers(x, fx, dfx);
}

double lebesgue_function(const SamplePoints& points, double x) {
    std::vector<double> basis = lagrange_basis(points.x_values(), 0, points.size() - 1, x);
    double sum = 0.0;
    for (double l : basis) {
        sum += std::abs(l);
    }
    return sum;
}

double vandermonde_condition_number(const SamplePoints& points) {
    int n = points.size();
    Eigen::MatrixXd V(n, n);
    for (int i = 0; i < n; ++i) {
        double power = 1.0;
        for (int j = 0; j < n; ++j) {
            V(i, j) = power;
            power *= points.x(i);
        }
    }

    Eigen::JacobiSVD<Eigen::MatrixXd> svd(V);
    const Eigen::VectorXd& sv = svd.singularValues();
    double sigma_min = sv(n - 1);
    if (sigma_min == 0.0) {
        return std::numeric_limits<double>::infinity();
    }
    return sv(0) / sigma_min;
}

} // namespace diff_interp
