#include "difference_interpolation/interpolation.h"
#include "difference_interpolation/difference_series.h"
#include <stdexcept>

namespace diff_interp {

double derivative(const DifferenceTable& table, double x, int k, Scheme scheme, int order) {
    if (k < 0) {
        throw std::invalid_argument("Derivative order must be non-negative");
    }
    if (scheme == Scheme::LAGRANGE) {
        return lagrange_derivative(table, x, k, order);
    }

    NodeSelection sel = NodeSelector::select_base(table, x, scheme, order);
    if (k == 0) {
        return evaluate_at_selection(table, sel).value;
    }
    // Полином степени sel.order: производные старших порядков тождественно равны нулю
    if (k > sel.order) {
        return 0.0;
    }

    DifferenceSeries series = DifferenceSeries::build(table, sel);

    // d/dx = (1/h) d/ds
    double chain = 1.0;
    for (int i = 0; i < k; ++i) {
        chain /= sel.step;
    }
    return series.derivative(sel.s, k) * chain;
}

double derivative(const SamplePoints& points, double x, int k, Scheme scheme, int order,
                  double tolerance) {
    switch (scheme) {
        case Scheme::LAGRANGE:
            return lagrange_derivative(points, x, k, order);
        case Scheme::NEWTON_DIVIDED:
            return derivative(DifferenceTable::build_divided(points), x, k, scheme, order);
        case Scheme::NEWTON_FORWARD:
            return derivative(DifferenceTable::build_forward(points, tolerance), x, k, scheme, order);
        case Scheme::NEWTON_BACKWARD:
            return derivative(DifferenceTable::build_backward(points, tolerance), x, k, scheme, order);
        default:
            return derivative(DifferenceTable::build_central(points, tolerance), x, k, scheme, order);
    }
}

} // namespace diff_interp
