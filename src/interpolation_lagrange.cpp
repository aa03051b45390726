#include "difference_interpolation/interpolation.h"
#include "difference_interpolation/polynomial.h"
#include "difference_interpolation/errors.h"
#include <vector>
#include <cmath>
#include <stdexcept>

namespace diff_interp {

namespace {

double lagrange_value(const std::vector<double>& nodes, const std::vector<double>& values,
                      int first, int last, double x) {
    std::vector<double> basis = lagrange_basis(nodes, first, last, x);
    double result = 0.0;
    for (int e = first; e <= last; ++e) {
        result += values[e] * basis[e - first];
    }
    return result;
}

// l_e'(x) = Σ_{m≠e} 1/(x_e - x_m) * Π_{j≠e,m} (x - x_j)/(x_e - x_j)
double lagrange_first_derivative(const std::vector<double>& nodes, const std::vector<double>& values,
                                 int first, int last, double x) {
    double result = 0.0;
    for (int e = first; e <= last; ++e) {
        double dl = 0.0;
        for (int m = first; m <= last; ++m) {
            if (m == e) continue;
            double term = 1.0 / (nodes[e] - nodes[m]);
            for (int j = first; j <= last; ++j) {
                if (j == e || j == m) continue;
                term *= (x - nodes[j]) / (nodes[e] - nodes[j]);
            }
            dl += term;
        }
        result += values[e] * dl;
    }
    return result;
}

// Базисные полиномы раскрываются по t = x - x_first, чтобы не терять точность при больших x
double lagrange_higher_derivative(const std::vector<double>& nodes, const std::vector<double>& values,
                                  int first, int last, double x, int k) {
    double center = nodes[first];
    Polynomial sum(0);

    for (int e = first; e <= last; ++e) {
        std::vector<double> roots;
        double denom = 1.0;
        for (int j = first; j <= last; ++j) {
            if (j == e) continue;
            roots.push_back(nodes[j] - center);
            denom *= (nodes[e] - nodes[j]);
        }
        sum += Polynomial::from_roots(roots, values[e] / denom);
    }

    return sum.derivative(x - center, k);
}

double lagrange_derivative_range(const std::vector<double>& nodes, const std::vector<double>& values,
                                 int first, int last, double x, int k) {
    if (k < 0) {
        throw std::invalid_argument("Derivative order must be non-negative");
    }
    if (k == 0) {
        return lagrange_value(nodes, values, first, last, x);
    }
    if (k > last - first) {
        return 0.0;
    }

    for (int e = first; e < last; ++e) {
        for (int j = e + 1; j <= last; ++j) {
            if (nodes[e] == nodes[j]) {
                throw DomainError("Lagrange interpolation requires distinct nodes");
            }
        }
    }

    if (k == 1) {
        return lagrange_first_derivative(nodes, values, first, last, x);
    }
    return lagrange_higher_derivative(nodes, values, first, last, x, k);
}

} // namespace

std::vector<double> lagrange_basis(const std::vector<double>& nodes, int first, int last, double x) {
    if (first < 0 || last >= static_cast<int>(nodes.size()) || first > last) {
        throw std::out_of_range("Invalid Lagrange node range");
    }

    std::vector<double> basis(last - first + 1);
    for (int e = first; e <= last; ++e) {
        double Le = 1.0;
        for (int j = first; j <= last; ++j) {
            if (j == e) continue;
            double denom = nodes[e] - nodes[j];
            if (denom == 0.0) {
                throw DomainError("Lagrange interpolation requires distinct nodes");
            }
            Le *= (x - nodes[j]) / denom;
        }
        basis[e - first] = Le;
    }
    return basis;
}

InterpolationResult evaluate_lagrange(const SamplePoints& points, double x, int order) {
    NodeSelection sel = NodeSelector::select_base(points, x, Scheme::LAGRANGE, order);

    InterpolationResult result;
    result.scheme = Scheme::LAGRANGE;
    result.order = sel.order;
    result.base_index = sel.base_index;
    result.value = lagrange_value(points.x_values(), points.y_values(),
                                  sel.first_node, sel.last_node, x);
    return result;
}

InterpolationResult evaluate_lagrange(const DifferenceTable& table, double x, int order) {
    NodeSelection sel = NodeSelector::select_base(table, x, Scheme::LAGRANGE, order);

    InterpolationResult result;
    result.scheme = Scheme::LAGRANGE;
    result.order = sel.order;
    result.base_index = sel.base_index;
    result.value = lagrange_value(table.nodes(), table.row(0), sel.first_node, sel.last_node, x);
    return result;
}

double lagrange_derivative(const SamplePoints& points, double x, int k, int order) {
    NodeSelection sel = NodeSelector::select_base(points, x, Scheme::LAGRANGE, order);
    return lagrange_derivative_range(points.x_values(), points.y_values(),
                                     sel.first_node, sel.last_node, x, k);
}

double lagrange_derivative(const DifferenceTable& table, double x, int k, int order) {
    NodeSelection sel = NodeSelector::select_base(table, x, Scheme::LAGRANGE, order);
    return lagrange_derivative_range(table.nodes(), table.row(0),
                                     sel.first_node, sel.last_node, x, k);
}

} // namespace diff_interp
