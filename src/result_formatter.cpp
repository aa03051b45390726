#include "difference_interpolation/result_formatter.h"
#include "difference_interpolation/interpolator.h"
#include "difference_interpolation/validator.h"
#include <sstream>
#include <iomanip>
#include <stdexcept>

namespace diff_interp {

namespace {

constexpr int kColumnWidth = 16;

std::string column_title(DifferenceKind kind, int k) {
    if (k == 0) return "y";
    std::string order = std::to_string(k);
    switch (kind) {
        case DifferenceKind::DIVIDED:  return "f[" + order + "]";
        case DifferenceKind::FORWARD:  return "D^" + order;
        case DifferenceKind::BACKWARD: return "B^" + order;
        case DifferenceKind::CENTRAL:  return "d^" + order;
    }
    return order;
}

} // namespace

std::string format_significant(double value, int digits) {
    std::ostringstream oss;
    oss << std::setprecision(digits) << value;
    return oss.str();
}

std::string format_difference_table(const DifferenceTable& table, int digits) {
    std::ostringstream oss;
    int n = table.size();

    oss << "Difference table (" << difference_kind_name(table.kind()) << ", "
        << n << " points";
    if (table.is_fixed_step()) {
        oss << ", h = " << format_significant(table.step(), digits);
    }
    oss << ")\n";

    oss << std::setw(4) << "i" << std::setw(kColumnWidth) << "x";
    for (int k = 0; k < n; ++k) {
        oss << std::setw(kColumnWidth) << column_title(table.kind(), k);
    }
    oss << "\n";

    for (int i = 0; i < n; ++i) {
        oss << std::setw(4) << i
            << std::setw(kColumnWidth) << format_significant(table.node(i), digits);
        // Строка k содержит N-k элементов
        for (int k = 0; k < n - i; ++k) {
            oss << std::setw(kColumnWidth) << format_significant(table.at(k, i), digits);
        }
        oss << "\n";
    }

    return oss.str();
}

std::string format_interpolation_result(double x, const InterpolationResult& result, int digits) {
    std::ostringstream oss;
    oss << scheme_name(result.scheme) << "(" << format_significant(x, digits) << ") = "
        << format_significant(result.value, digits)
        << "  [order " << result.order << ", base " << result.base_index << "]";
    return oss.str();
}

std::string format_error_estimate(const ErrorEstimate& estimate, int digits) {
    std::ostringstream oss;
    if (!estimate.next_term_available) {
        oss << "error: n/a (all nodes used)";
        return oss.str();
    }
    oss << "abs error ~ " << format_significant(estimate.absolute_error, digits)
        << ", rel error ~ " << format_significant(estimate.relative_error, digits);
    return oss.str();
}

std::string format_task_report(const InterpolationTask& task, int digits) {
    std::ostringstream oss;

    oss << "=================================================\n";
    oss << "Interpolation Report";
    if (!task.name.empty()) {
        oss << ": " << task.name;
    }
    oss << "\n";
    oss << "=================================================\n\n";

    ValidationReport validation = Validator::validate_full(task);
    if (validation.has_errors()) {
        oss << validation.format();
        oss << "=================================================\n";
        return oss.str();
    }
    if (validation.has_warnings()) {
        oss << validation.format(false);
    }

    SamplePoints points(task.x_values, task.y_values);
    Interpolator interpolator(points, task.spacing_tolerance);
    const DifferenceTable& table = interpolator.table_for(task.scheme);

    oss << "Scheme: " << scheme_name(task.scheme) << "\n";
    oss << format_difference_table(table, digits) << "\n";

    oss << "Results:\n";
    for (double x : task.query_points) {
        oss << "  ";
        try {
            InterpolationResult result = interpolator.evaluate(x, task.scheme, task.order);
            oss << format_interpolation_result(x, result, digits);
            if (task.derivative_order > 0) {
                double d = interpolator.derivative(x, task.derivative_order, task.scheme, task.order);
                oss << "\n    d^" << task.derivative_order << "/dx^" << task.derivative_order
                    << " = " << format_significant(d, digits);
            }
            if (task.estimate_error) {
                ErrorEstimate estimate = interpolator.estimate_error(x, task.scheme, task.order);
                oss << "\n    " << format_error_estimate(estimate, digits);
            }
        } catch (const std::invalid_argument& e) {
            oss << "x = " << format_significant(x, digits) << ": " << e.what();
        } catch (const std::domain_error& e) {
            oss << "x = " << format_significant(x, digits) << ": " << e.what();
        }
        oss << "\n";
    }

    oss << "=================================================\n";
    return oss.str();
}

} // namespace diff_interp
