#include "difference_interpolation/difference_table.h"
#include "difference_interpolation/errors.h"
#include <cmath>
#include <sstream>
#include <stdexcept>

namespace diff_interp {

DifferenceTable::DifferenceTable(DifferenceKind kind, const std::vector<double>& nodes, double step)
    : kind_(kind)
    , nodes_(nodes)
    , step_(step) {}

DifferenceTable DifferenceTable::build_divided(const SamplePoints& points) {
    if (points.has_duplicate_nodes(0.0)) {
        throw DomainError("Divided differences require distinct nodes");
    }

    int n = points.size();
    const std::vector<double>& x = points.x_values();

    DifferenceTable table(DifferenceKind::DIVIDED, x, 0.0);
    table.rows_.reserve(n);
    table.rows_.push_back(points.y_values());

    // f[x_i..x_{i+k}] = (f[x_{i+1}..x_{i+k}] - f[x_i..x_{i+k-1}]) / (x_{i+k} - x_i)
    for (int k = 1; k < n; ++k) {
        const std::vector<double>& prev = table.rows_[k - 1];
        std::vector<double> next(n - k);
        for (int i = 0; i < n - k; ++i) {
            next[i] = (prev[i + 1] - prev[i]) / (x[i + k] - x[i]);
        }
        table.rows_.push_back(next);
    }

    return table;
}

DifferenceTable DifferenceTable::build_fixed_step(const SamplePoints& points, DifferenceKind kind,
                                                  double tolerance) {
    double h = points.uniform_step(tolerance);
    int n = points.size();

    DifferenceTable table(kind, points.x_values(), h);
    table.rows_.reserve(n);
    table.rows_.push_back(points.y_values());

    for (int k = 1; k < n; ++k) {
        const std::vector<double>& prev = table.rows_[k - 1];
        std::vector<double> next(n - k);
        for (int i = 0; i < n - k; ++i) {
            next[i] = prev[i + 1] - prev[i];
        }
        table.rows_.push_back(next);
    }

    return table;
}

DifferenceTable DifferenceTable::build_forward(const SamplePoints& points, double tolerance) {
    return build_fixed_step(points, DifferenceKind::FORWARD, tolerance);
}

DifferenceTable DifferenceTable::build_backward(const SamplePoints& points, double tolerance) {
    return build_fixed_step(points, DifferenceKind::BACKWARD, tolerance);
}

DifferenceTable DifferenceTable::build_central(const SamplePoints& points, double tolerance) {
    return build_fixed_step(points, DifferenceKind::CENTRAL, tolerance);
}

DifferenceTable DifferenceTable::build(const SamplePoints& points, DifferenceKind kind,
                                       double tolerance) {
    switch (kind) {
        case DifferenceKind::DIVIDED:
            return build_divided(points);
        case DifferenceKind::FORWARD:
        case DifferenceKind::BACKWARD:
        case DifferenceKind::CENTRAL:
            return build_fixed_step(points, kind, tolerance);
    }
    throw std::invalid_argument("Unknown difference table kind");
}

const std::vector<double>& DifferenceTable::row(int k) const {
    if (k < 0 || k >= static_cast<int>(rows_.size())) {
        throw std::out_of_range("Difference order " + std::to_string(k) +
                                " is outside of [0, " + std::to_string(max_order()) + "]");
    }
    return rows_[k];
}

double DifferenceTable::at(int k, int i) const {
    const std::vector<double>& r = row(k);
    if (i < 0 || i >= static_cast<int>(r.size())) {
        throw std::out_of_range("Position " + std::to_string(i) + " is outside of difference row " +
                                std::to_string(k) + " (length " + std::to_string(r.size()) + ")");
    }
    return r[i];
}

double DifferenceTable::difference(int k, int node) const {
    switch (kind_) {
        case DifferenceKind::DIVIDED:
        case DifferenceKind::FORWARD:
            return at(k, node);
        case DifferenceKind::BACKWARD:
            return at(k, node - k);
        case DifferenceKind::CENTRAL:
            return at(k, node - k / 2);
    }
    throw std::invalid_argument("Unknown difference table kind");
}

double DifferenceTable::divided_difference(int k, int first) const {
    double d = at(k, first);
    if (kind_ == DifferenceKind::DIVIDED) {
        return d;
    }
    // f[x_i..x_{i+k}] = Δ^k y_i / (k! h^k)
    double scale = 1.0;
    for (int j = 1; j <= k; ++j) {
        scale *= static_cast<double>(j) * step_;
    }
    return d / scale;
}

std::string DifferenceTable::get_info() const {
    std::ostringstream oss;
    oss << "DifferenceTable(kind=" << difference_kind_name(kind_)
        << ", points=" << size()
        << ", max_order=" << max_order();
    if (is_fixed_step()) {
        oss << ", h=" << step_;
    }
    oss << ")";
    return oss.str();
}

const char* difference_kind_name(DifferenceKind kind) {
    switch (kind) {
        case DifferenceKind::DIVIDED:  return "divided";
        case DifferenceKind::FORWARD:  return "forward";
        case DifferenceKind::BACKWARD: return "backward";
        case DifferenceKind::CENTRAL:  return "central";
    }
    return "unknown";
}

} // namespace diff_interp
