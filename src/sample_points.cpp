#include "difference_interpolation/sample_points.h"
#include "difference_interpolation/errors.h"
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

namespace diff_interp {

SamplePoints::SamplePoints(const std::vector<double>& x, const std::vector<double>& y)
    : xs_(x)
    , ys_(y) {
    validate();
}

SamplePoints::SamplePoints(const std::vector<std::pair<double, double>>& points) {
    xs_.reserve(points.size());
    ys_.reserve(points.size());
    for (const auto& p : points) {
        xs_.push_back(p.first);
        ys_.push_back(p.second);
    }
    validate();
}

SamplePoints::SamplePoints(double x0, double step, const std::vector<double>& y)
    : ys_(y) {
    if (!std::isfinite(x0) || !std::isfinite(step) || step == 0.0) {
        throw std::invalid_argument("Uniform grid requires finite x0 and non-zero finite step");
    }
    xs_.resize(y.size());
    for (size_t i = 0; i < y.size(); ++i) {
        xs_[i] = x0 + static_cast<double>(i) * step;
    }
    validate();
}

void SamplePoints::validate() const {
    if (xs_.size() != ys_.size()) {
        throw std::invalid_argument("x and y must have the same length (got " +
                                    std::to_string(xs_.size()) + " and " +
                                    std::to_string(ys_.size()) + ")");
    }
    if (xs_.size() < 2) {
        throw InsufficientPointsError("At least two sample points are required, got " +
                                      std::to_string(xs_.size()));
    }
    for (size_t i = 0; i < xs_.size(); ++i) {
        if (!std::isfinite(xs_[i]) || !std::isfinite(ys_[i])) {
            throw std::invalid_argument("Non-finite sample value at index " + std::to_string(i));
        }
    }
}

double SamplePoints::min_x() const {
    return *std::min_element(xs_.begin(), xs_.end());
}

double SamplePoints::max_x() const {
    return *std::max_element(xs_.begin(), xs_.end());
}

bool SamplePoints::is_strictly_monotonic() const {
    bool increasing = true;
    bool decreasing = true;
    for (size_t i = 1; i < xs_.size(); ++i) {
        if (!(xs_[i] > xs_[i - 1])) increasing = false;
        if (!(xs_[i] < xs_[i - 1])) decreasing = false;
    }
    return increasing || decreasing;
}

bool SamplePoints::has_duplicate_nodes(double tolerance) const {
    std::vector<double> sorted = xs_;
    std::sort(sorted.begin(), sorted.end());

    for (size_t i = 1; i < sorted.size(); ++i) {
        if (std::abs(sorted[i] - sorted[i - 1]) <= tolerance) {
            return true;
        }
    }
    return false;
}

bool SamplePoints::is_equally_spaced(double tolerance) const {
    double h = xs_[1] - xs_[0];
    if (h == 0.0) return false;

    double abs_tol = tolerance * std::abs(h);
    for (size_t i = 1; i < xs_.size(); ++i) {
        if (std::abs((xs_[i] - xs_[i - 1]) - h) > abs_tol) {
            return false;
        }
    }
    return true;
}

double SamplePoints::uniform_step(double tolerance) const {
    if (!is_equally_spaced(tolerance)) {
        throw InvalidSpacingError("Sample points are not equally spaced (tolerance " +
                                  std::to_string(tolerance) + ")");
    }
    // Средний шаг точнее первого при накопленных ошибках округления
    return (xs_.back() - xs_.front()) / static_cast<double>(xs_.size() - 1);
}

SamplePoints SamplePoints::subset(int first, int count) const {
    if (first < 0 || count < 0 || first + count > size()) {
        throw std::out_of_range("Subset [" + std::to_string(first) + ", " +
                                std::to_string(first + count) + ") is outside of " +
                                std::to_string(size()) + " points");
    }
    std::vector<double> x(xs_.begin() + first, xs_.begin() + first + count);
    std::vector<double> y(ys_.begin() + first, ys_.begin() + first + count);
    return SamplePoints(x, y);
}

} // namespace diff_interp
