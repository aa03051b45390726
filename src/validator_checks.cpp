#include "difference_interpolation/validator.h"
#include "difference_interpolation/interpolation.h"
#include "difference_interpolation/node_selector.h"
#include "difference_interpolation/sample_points.h"
#include <algorithm>
#include <cmath>

namespace diff_interp {

// ==================== Вспомогательные функции ====================

/**
 * @brief Вычисление адаптивного порога для сравнения координат
 */
static double compute_overlap_epsilon(double x, double y) {
    double max_abs = std::max(std::abs(x), std::max(std::abs(y), 1.0));
    return std::max(1e-12, 1e-9 * max_abs);
}

static bool all_finite(const std::vector<double>& values) {
    for (double v : values) {
        if (!std::isfinite(v)) return false;
    }
    return true;
}

bool Validator::has_consistent_points(const InterpolationTask& task) {
    return task.x_values.size() == task.y_values.size() &&
           task.x_values.size() >= 2 &&
           all_finite(task.x_values) && all_finite(task.y_values);
}

int Validator::effective_order(const InterpolationTask& task) {
    int max_order = static_cast<int>(task.x_values.size()) - 1;
    return task.order < 0 ? max_order : task.order;
}

// ==================== Индивидуальные проверки ====================

std::string Validator::check_point_counts(const InterpolationTask& task) {
    if (task.x_values.size() != task.y_values.size()) {
        return "Size mismatch: " + std::to_string(task.x_values.size()) + " nodes but " +
               std::to_string(task.y_values.size()) + " values";
    }
    if (task.x_values.size() < 2) {
        return "At least 2 points are required (found: " +
               std::to_string(task.x_values.size()) + ")";
    }
    return "";
}

std::string Validator::check_finite_values(const InterpolationTask& task) {
    for (size_t i = 0; i < task.x_values.size(); ++i) {
        if (!std::isfinite(task.x_values[i])) {
            return "Node x[" + std::to_string(i) + "] is not a finite number";
        }
    }
    for (size_t i = 0; i < task.y_values.size(); ++i) {
        if (!std::isfinite(task.y_values[i])) {
            return "Value y[" + std::to_string(i) + "] is not a finite number";
        }
    }
    for (size_t i = 0; i < task.query_points.size(); ++i) {
        if (!std::isfinite(task.query_points[i])) {
            return "Query point " + std::to_string(i) + " is not a finite number";
        }
    }
    return "";
}

std::string Validator::check_duplicate_nodes(const InterpolationTask& task) {
    const std::vector<double>& x = task.x_values;
    for (size_t i = 0; i < x.size(); ++i) {
        for (size_t j = i + 1; j < x.size(); ++j) {
            if (std::abs(x[i] - x[j]) <= compute_overlap_epsilon(x[i], x[j])) {
                return "Duplicate nodes: x[" + std::to_string(i) + "] and x[" +
                       std::to_string(j) + "] = " + std::to_string(x[i]);
            }
        }
    }
    return "";
}

std::string Validator::check_monotonic_nodes(const InterpolationTask& task) {
    if (!is_fixed_step_scheme(task.scheme) || !has_consistent_points(task)) {
        return "";
    }
    SamplePoints points(task.x_values, task.y_values);
    if (!points.is_strictly_monotonic()) {
        return std::string("Nodes are not strictly monotonic, required by scheme '") +
               scheme_name(task.scheme) + "'";
    }
    return "";
}

std::string Validator::check_uniform_spacing(const InterpolationTask& task) {
    if (!is_fixed_step_scheme(task.scheme) || !has_consistent_points(task)) {
        return "";
    }
    SamplePoints points(task.x_values, task.y_values);
    if (!points.is_strictly_monotonic()) {
        return "";  // сообщается check_monotonic_nodes
    }
    if (!points.is_equally_spaced(task.spacing_tolerance)) {
        return std::string("Nodes are not equally spaced (tolerance ") +
               std::to_string(task.spacing_tolerance) + "), required by scheme '" +
               scheme_name(task.scheme) + "'";
    }
    return "";
}

std::string Validator::check_order(const InterpolationTask& task) {
    if (task.order < -1) {
        return "Interpolation order must be non-negative or -1 (found: " +
               std::to_string(task.order) + ")";
    }
    if (task.derivative_order < 0) {
        return "Derivative order must be non-negative (found: " +
               std::to_string(task.derivative_order) + ")";
    }
    int max_order = static_cast<int>(task.x_values.size()) - 1;
    if (task.order > max_order) {
        return "Requested order " + std::to_string(task.order) + " exceeds N-1 = " +
               std::to_string(max_order);
    }
    return "";
}

std::string Validator::check_extrapolation(const InterpolationTask& task) {
    if (task.x_values.empty() || !all_finite(task.x_values)) {
        return "";
    }
    double lo = *std::min_element(task.x_values.begin(), task.x_values.end());
    double hi = *std::max_element(task.x_values.begin(), task.x_values.end());

    size_t outside = 0;
    for (double q : task.query_points) {
        if (q < lo || q > hi) {
            outside++;
        }
    }
    if (outside > 0) {
        return std::to_string(outside) + " query point(s) outside the node range [" +
               std::to_string(lo) + ", " + std::to_string(hi) + "] will be extrapolated";
    }
    return "";
}

std::string Validator::check_parity_truncation(const InterpolationTask& task) {
    if (task.scheme != Scheme::STIRLING && task.scheme != Scheme::BESSEL) {
        return "";
    }
    int n = static_cast<int>(task.x_values.size());
    int order = effective_order(task);
    if (n < 2 || order < 0 || order > n - 1) {
        return "";
    }
    if (NodeSelector::stencil(task.scheme, order).width() > n) {
        return std::string("Scheme '") + scheme_name(task.scheme) + "' cannot use order " +
               std::to_string(order) + " on " + std::to_string(n) +
               " points; the order will be reduced to " + std::to_string(order - 1);
    }
    return "";
}

std::string Validator::check_high_order(const InterpolationTask& task) {
    int order = effective_order(task);
    if (order > kHighOrderThreshold) {
        return "Interpolation order " + std::to_string(order) + " is high (> " +
               std::to_string(kHighOrderThreshold) + "), results may be unstable";
    }
    return "";
}

} // namespace diff_interp
