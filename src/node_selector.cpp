#include "difference_interpolation/node_selector.h"
#include "difference_interpolation/errors.h"
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

namespace diff_interp {

bool is_fixed_step_scheme(Scheme scheme) {
    return scheme != Scheme::LAGRANGE && scheme != Scheme::NEWTON_DIVIDED;
}

Stencil NodeSelector::stencil(Scheme scheme, int order) {
    int r = order;
    switch (scheme) {
        case Scheme::LAGRANGE:
        case Scheme::NEWTON_DIVIDED:
        case Scheme::NEWTON_FORWARD:
            return Stencil(0, r);
        case Scheme::NEWTON_BACKWARD:
            return Stencil(r, 0);
        case Scheme::GAUSS_FORWARD:
            return Stencil(r / 2, (r + 1) / 2);
        case Scheme::GAUSS_BACKWARD:
            return Stencil((r + 1) / 2, r / 2);
        case Scheme::STIRLING:
            // Нечётный член - полусумма двух разностей, нужен ещё один узел с каждой стороны
            if (r % 2 == 0) return Stencil(r / 2, r / 2);
            return Stencil((r + 1) / 2, (r + 1) / 2);
        case Scheme::BESSEL:
            // Чётный член - полусумма разностей, опирающихся на p и p+1
            if (r % 2 == 1) return Stencil((r - 1) / 2, (r + 1) / 2);
            return Stencil(r / 2, r / 2 + 1);
    }
    throw std::invalid_argument("Unknown interpolation scheme");
}

bool NodeSelector::fits(Scheme scheme, int order, int base, int n_points) {
    Stencil st = stencil(scheme, order);
    return base - st.left >= 0 && base + st.right <= n_points - 1;
}

int NodeSelector::max_supported_order(Scheme scheme, int n_points) {
    int r = n_points - 1;
    while (r > 0 && stencil(scheme, r).width() > n_points) {
        --r;
    }
    return r;
}

int NodeSelector::initial_base(const std::vector<double>& nodes, double step,
                               double x, Scheme scheme) {
    int n = static_cast<int>(nodes.size());

    switch (scheme) {
        case Scheme::LAGRANGE:
        case Scheme::NEWTON_DIVIDED:
        case Scheme::NEWTON_FORWARD:
            return 0;
        case Scheme::NEWTON_BACKWARD:
            return n - 1;
        default:
            break;
    }

    // Дробный индекс x на равномерной сетке; ограничиваем до перевода в int
    double u = (x - nodes.front()) / step;
    u = std::max(-1.0, std::min(u, static_cast<double>(n)));

    if (scheme == Scheme::BESSEL) {
        return static_cast<int>(std::floor(u));
    }
    return static_cast<int>(std::floor(u + 0.5));
}

NodeSelection NodeSelector::select(const std::vector<double>& nodes, double step,
                                   double x, Scheme scheme, int order) {
    int n = static_cast<int>(nodes.size());
    int max_order = n - 1;

    if (!std::isfinite(x)) {
        throw std::invalid_argument("Query point must be finite");
    }
    if (order < -1) {
        throw std::invalid_argument("Interpolation order must be non-negative or -1 for maximum");
    }
    if (order > max_order) {
        throw InsufficientPointsError("Requested order " + std::to_string(order) +
                                      " exceeds available differences (max " +
                                      std::to_string(max_order) + " for " +
                                      std::to_string(n) + " points)");
    }

    NodeSelection sel;
    sel.scheme = scheme;
    sel.step = is_fixed_step_scheme(scheme) ? step : 1.0;

    int usable = order < 0 ? max_order : order;
    while (usable > 0 && stencil(scheme, usable).width() > n) {
        --usable;
        sel.order_truncated = true;
    }

    Stencil st = stencil(scheme, usable);
    int p = initial_base(nodes, step, x, scheme);
    p = std::max(st.left, std::min(p, n - 1 - st.right));

    sel.base_index = p;
    sel.order = usable;
    sel.first_node = p - st.left;
    sel.last_node = p + st.right;
    sel.s = (x - nodes[p]) / sel.step;

    double lo = *std::min_element(nodes.begin(), nodes.end());
    double hi = *std::max_element(nodes.begin(), nodes.end());
    sel.extrapolating = x < lo || x > hi;

    return sel;
}

NodeSelection NodeSelector::select_base(const SamplePoints& points, double x, Scheme scheme,
                                        int order, double tolerance) {
    double step = 1.0;
    if (is_fixed_step_scheme(scheme)) {
        step = points.uniform_step(tolerance);
    }
    return select(points.x_values(), step, x, scheme, order);
}

NodeSelection NodeSelector::select_base(const DifferenceTable& table, double x, Scheme scheme,
                                        int order) {
    if (is_fixed_step_scheme(scheme) && !table.is_fixed_step()) {
        throw std::invalid_argument("Equal-step scheme requires a finite-difference table");
    }
    double step = table.is_fixed_step() ? table.step() : 1.0;
    return select(table.nodes(), step, x, scheme, order);
}

} // namespace diff_interp
