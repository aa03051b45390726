#include "difference_interpolation/error_estimator.h"
#include "difference_interpolation/interpolation.h"
#include "difference_interpolation/difference_series.h"
#include "difference_interpolation/node_selector.h"
#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>

namespace diff_interp {

namespace {

// f[x_first..x_last ∪ extra] * Π_{шаблон} (x - x_j), extra - соседний узел со стороны x
double adjacent_node_term(const DifferenceTable& table, const NodeSelection& sel, double x) {
    int n = table.size();
    int left = sel.first_node - 1;
    int right = sel.last_node + 1;

    int extra;
    if (left < 0) {
        extra = right;
    } else if (right > n - 1) {
        extra = left;
    } else {
        extra = std::abs(x - table.node(left)) <= std::abs(x - table.node(right)) ? left : right;
    }

    int first = std::min(sel.first_node, extra);
    int width = sel.last_node - sel.first_node + 1;

    double product = table.divided_difference(width, first);
    for (int j = sel.first_node; j <= sel.last_node; ++j) {
        product *= (x - table.node(j));
    }
    return product;
}

} // namespace

ErrorEstimate estimate_error(Scheme scheme, const DifferenceTable& table, int order, double x) {
    NodeSelection sel = NodeSelector::select_base(table, x, scheme, order);

    ErrorEstimate estimate;
    estimate.order = sel.order;
    estimate.value = evaluate_at_selection(table, sel).value;

    int n = table.size();
    int next = sel.order + 1;

    if (scheme != Scheme::LAGRANGE && NodeSelector::fits(scheme, next, sel.base_index, n)) {
        SeriesTerm term = DifferenceSeries::term(table, scheme, sel.base_index, next);
        estimate.absolute_error = std::abs(term.evaluate(sel.s));
        estimate.next_term_available = true;
    } else if (sel.last_node - sel.first_node + 1 < n) {
        estimate.absolute_error = std::abs(adjacent_node_term(table, sel, x));
        estimate.next_term_available = true;
    } else {
        estimate.absolute_error = 0.0;
        estimate.next_term_available = false;
    }

    if (estimate.value != 0.0) {
        estimate.relative_error = estimate.absolute_error / std::abs(estimate.value);
    } else if (estimate.absolute_error > 0.0) {
        estimate.relative_error = std::numeric_limits<double>::infinity();
    } else {
        estimate.relative_error = 0.0;
    }

    return estimate;
}

double truncation_error(Scheme scheme, const DifferenceTable& table, int order, double x) {
    return estimate_error(scheme, table, order, x).absolute_error;
}

double lagrange_remainder(const SamplePoints& points, double x, double derivative_at_xi) {
    int n = points.size() - 1;

    double omega = 1.0;
    for (double xi : points.x_values()) {
        omega *= (x - xi);
    }

    double factorial = 1.0;
    for (int i = 2; i <= n + 1; ++i) {
        factorial *= static_cast<double>(i);
    }

    return derivative_at_xi * omega / factorial;
}

double lagrange_remainder(const SamplePoints& points, double x,
                          const std::function<double(double)>& higher_derivative, double xi) {
    if (!higher_derivative) {
        throw std::invalid_argument("Higher derivative function must be provided");
    }
    if (std::isnan(xi)) {
        double sum = 0.0;
        for (double node : points.x_values()) {
            sum += node;
        }
        xi = sum / static_cast<double>(points.size());
    }
    return lagrange_remainder(points, x, higher_derivative(xi));
}

} // namespace diff_interp
