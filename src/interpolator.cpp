#include "difference_interpolation/interpolator.h"
#include "difference_interpolation/node_selector.h"
#include "difference_interpolation/errors.h"
#include <sstream>

namespace diff_interp {

Interpolator::Interpolator(const SamplePoints& points, double spacing_tolerance)
    : points_(points)
    , spacing_tolerance_(spacing_tolerance)
    , divided_(std::make_shared<const DifferenceTable>(DifferenceTable::build_divided(points))) {
    if (points_.is_equally_spaced(spacing_tolerance_)) {
        finite_ = std::make_shared<const DifferenceTable>(
            DifferenceTable::build_forward(points_, spacing_tolerance_));
    }
}

const DifferenceTable& Interpolator::finite_table() const {
    if (!finite_) {
        throw InvalidSpacingError("Finite differences require equally spaced nodes");
    }
    return *finite_;
}

const DifferenceTable& Interpolator::table_for(Scheme scheme) const {
    if (is_fixed_step_scheme(scheme)) {
        return finite_table();
    }
    return *divided_;
}

InterpolationResult Interpolator::evaluate(double x, Scheme scheme, int order) const {
    return diff_interp::evaluate(table_for(scheme), x, scheme, order);
}

std::vector<InterpolationResult> Interpolator::evaluate(const std::vector<double>& xs, Scheme scheme,
                                                        int order) const {
    const DifferenceTable& table = table_for(scheme);
    std::vector<InterpolationResult> results;
    results.reserve(xs.size());
    for (double x : xs) {
        results.push_back(diff_interp::evaluate(table, x, scheme, order));
    }
    return results;
}

double Interpolator::derivative(double x, int k, Scheme scheme, int order) const {
    return diff_interp::derivative(table_for(scheme), x, k, scheme, order);
}

double Interpolator::truncation_error(double x, Scheme scheme, int order) const {
    return diff_interp::truncation_error(scheme, table_for(scheme), order, x);
}

ErrorEstimate Interpolator::estimate_error(double x, Scheme scheme, int order) const {
    return diff_interp::estimate_error(scheme, table_for(scheme), order, x);
}

ConditionNumbers Interpolator::condition_numbers(double x, Scheme scheme, int order) const {
    return interpolation_cond_nums(table_for(scheme), x, scheme, order);
}

std::string Interpolator::get_info() const {
    std::ostringstream oss;
    oss << "Interpolator(points=" << points_.size()
        << ", range=[" << points_.min_x() << ", " << points_.max_x() << "]"
        << ", equally_spaced=" << (finite_ ? "yes" : "no");
    if (finite_) {
        oss << ", h=" << finite_->step();
    }
    oss << ")";
    return oss.str();
}

} // namespace diff_interp
