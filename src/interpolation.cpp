#include "difference_interpolation/interpolation.h"
#include "difference_interpolation/difference_series.h"
#include "difference_interpolation/errors.h"
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace diff_interp {

const char* scheme_name(Scheme scheme) {
    switch (scheme) {
        case Scheme::LAGRANGE:        return "lagrange";
        case Scheme::NEWTON_DIVIDED:  return "newton_divided";
        case Scheme::NEWTON_FORWARD:  return "newton_forward";
        case Scheme::NEWTON_BACKWARD: return "newton_backward";
        case Scheme::GAUSS_FORWARD:   return "gauss_forward";
        case Scheme::GAUSS_BACKWARD:  return "gauss_backward";
        case Scheme::STIRLING:        return "stirling";
        case Scheme::BESSEL:          return "bessel";
    }
    return "unknown";
}

Scheme parse_scheme(const std::string& name) {
    std::string key;
    key.reserve(name.size());
    for (char c : name) {
        if (c == '-' || c == ' ') {
            key.push_back('_');
        } else {
            key.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
        }
    }

    static const Scheme all[] = {
        Scheme::LAGRANGE, Scheme::NEWTON_DIVIDED, Scheme::NEWTON_FORWARD,
        Scheme::NEWTON_BACKWARD, Scheme::GAUSS_FORWARD, Scheme::GAUSS_BACKWARD,
        Scheme::STIRLING, Scheme::BESSEL
    };
    for (Scheme s : all) {
        if (key == scheme_name(s)) return s;
    }
    if (key == "newton") return Scheme::NEWTON_DIVIDED;

    throw std::invalid_argument("Unknown interpolation scheme: '" + name + "'");
}

InterpolationResult evaluate_at_selection(const DifferenceTable& table, const NodeSelection& selection) {
    InterpolationResult result;
    result.scheme = selection.scheme;
    result.order = selection.order;
    result.base_index = selection.base_index;

    if (selection.scheme == Scheme::LAGRANGE) {
        std::vector<double> basis = lagrange_basis(table.nodes(), selection.first_node,
                                                   selection.last_node,
                                                   table.node(selection.base_index) + selection.s);
        double value = 0.0;
        for (int i = selection.first_node; i <= selection.last_node; ++i) {
            value += table.value(i) * basis[i - selection.first_node];
        }
        result.value = value;
        return result;
    }

    DifferenceSeries series = DifferenceSeries::build(table, selection);
    result.value = series.evaluate(selection.s);
    return result;
}

InterpolationResult evaluate(const DifferenceTable& table, double x, Scheme scheme, int order) {
    if (scheme == Scheme::LAGRANGE) {
        return evaluate_lagrange(table, x, order);
    }
    NodeSelection selection = NodeSelector::select_base(table, x, scheme, order);
    return evaluate_at_selection(table, selection);
}

InterpolationResult interpolate(const SamplePoints& points, double x, Scheme scheme,
                                int order, double tolerance) {
    switch (scheme) {
        case Scheme::LAGRANGE:
            return evaluate_lagrange(points, x, order);
        case Scheme::NEWTON_DIVIDED:
            return evaluate(DifferenceTable::build_divided(points), x, scheme, order);
        case Scheme::NEWTON_FORWARD:
            return evaluate(DifferenceTable::build_forward(points, tolerance), x, scheme, order);
        case Scheme::NEWTON_BACKWARD:
            return evaluate(DifferenceTable::build_backward(points, tolerance), x, scheme, order);
        case Scheme::GAUSS_FORWARD:
        case Scheme::GAUSS_BACKWARD:
        case Scheme::STIRLING:
        case Scheme::BESSEL:
            return evaluate(DifferenceTable::build_central(points, tolerance), x, scheme, order);
    }
    throw std::invalid_argument("Unknown interpolation scheme");
}

InterpolationResult evaluate_newton_divided(const DifferenceTable& table, double x, int order) {
    return evaluate(table, x, Scheme::NEWTON_DIVIDED, order);
}

InterpolationResult evaluate_newton_forward(const DifferenceTable& table, double x, int order) {
    return evaluate(table, x, Scheme::NEWTON_FORWARD, order);
}

InterpolationResult evaluate_newton_backward(const DifferenceTable& table, double x, int order) {
    return evaluate(table, x, Scheme::NEWTON_BACKWARD, order);
}

InterpolationResult evaluate_gauss_forward(const DifferenceTable& table, double x, int order) {
    return evaluate(table, x, Scheme::GAUSS_FORWARD, order);
}

InterpolationResult evaluate_gauss_backward(const DifferenceTable& table, double x, int order) {
    return evaluate(table, x, Scheme::GAUSS_BACKWARD, order);
}

InterpolationResult evaluate_stirling(const DifferenceTable& table, double x, int order) {
    return evaluate(table, x, Scheme::STIRLING, order);
}

InterpolationResult evaluate_bessel(const DifferenceTable& table, double x, int order) {
    return evaluate(table, x, Scheme::BESSEL, order);
}

} // namespace diff_interp
