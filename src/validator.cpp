#include "difference_interpolation/validator.h"
#include "difference_interpolation/interpolation.h"
#include "difference_interpolation/node_selector.h"
#include "difference_interpolation/sample_points.h"

namespace diff_interp {

// ==================== Основные методы валидации ====================

std::string Validator::validate(const InterpolationTask& task, bool strict_mode) {
    ValidationReport report = validate_full(task, strict_mode);

    if (report.has_errors()) {
        return report.format(false);  // без рекомендаций для краткости
    }

    return "";
}

ValidationReport Validator::validate_full(const InterpolationTask& task, bool strict_mode) {
    ValidationReport report;

    report.points_count = task.x_values.size();
    report.queries_count = task.query_points.size();
    report.scheme = scheme_name(task.scheme);
    report.requested_order = task.order;
    if (has_consistent_points(task)) {
        SamplePoints points(task.x_values, task.y_values);
        report.equally_spaced = points.is_strictly_monotonic() &&
                                points.is_equally_spaced(task.spacing_tolerance);
    }

    std::string counts_check = check_point_counts(task);
    if (!counts_check.empty()) {
        report.errors.emplace_back(ValidationLevel::Error, counts_check,
            "Provide the same number of x and y values, at least two points.");
    }

    std::string finite_check = check_finite_values(task);
    if (!finite_check.empty()) {
        report.errors.emplace_back(ValidationLevel::Error, finite_check,
            "Remove NaN or infinite values from nodes, values and queries.");
    }

    std::string duplicate_check = check_duplicate_nodes(task);
    if (!duplicate_check.empty()) {
        report.errors.emplace_back(ValidationLevel::Error, duplicate_check,
            "Each node must have a unique x-coordinate. Remove duplicate nodes.");
    }

    std::string monotonic_check = check_monotonic_nodes(task);
    if (!monotonic_check.empty()) {
        report.errors.emplace_back(ValidationLevel::Error, monotonic_check,
            "Sort the nodes or use 'lagrange' / 'newton_divided' for unordered data.");
    }

    std::string spacing_check = check_uniform_spacing(task);
    if (!spacing_check.empty()) {
        report.errors.emplace_back(ValidationLevel::Error, spacing_check,
            "Use 'newton_divided' or 'lagrange' for non-uniform grids, or increase spacing_tolerance.");
    }

    std::string order_check = check_order(task);
    if (!order_check.empty()) {
        report.errors.emplace_back(ValidationLevel::Error, order_check,
            "Reduce the order or add more points (order must not exceed N-1).");
    }

    std::string extrapolation_check = check_extrapolation(task);
    if (!extrapolation_check.empty()) {
        report.warnings.emplace_back(ValidationLevel::Warning, extrapolation_check,
            "Extrapolation error grows quickly outside the node range.");
    }

    std::string parity_check = check_parity_truncation(task);
    if (!parity_check.empty()) {
        report.warnings.emplace_back(ValidationLevel::Warning, parity_check,
            "Use an odd number of points for Stirling and an even number for Bessel.");
    }

    std::string high_order_check = check_high_order(task);
    if (!high_order_check.empty()) {
        report.warnings.emplace_back(ValidationLevel::Warning, high_order_check,
            "High-degree polynomials oscillate between nodes; consider a lower order or a spline.");
    }

    // В strict_mode предупреждения становятся ошибками
    if (strict_mode && report.has_warnings()) {
        for (const auto& w : report.warnings) {
            report.errors.emplace_back(ValidationLevel::Error, w.message, w.recommendation);
        }
        report.warnings.clear();
    }

    return report;
}

} // namespace diff_interp
