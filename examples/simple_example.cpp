#include <iostream>
#include <cmath>
#include "difference_interpolation/difference_interpolation.h"

using namespace diff_interp;

int main() {
    try {
        std::cout << "=== Difference Interpolation Example ===\n\n";

        // Таблица f(x) = sin(x) на равномерной сетке с шагом 0.1
        std::vector<double> ys;
        for (int i = 0; i < 7; ++i) {
            ys.push_back(std::sin(0.1 * i));
        }
        SamplePoints points(0.0, 0.1, ys);

        Interpolator interpolator(points);
        std::cout << interpolator.get_info() << "\n\n";
        std::cout << format_difference_table(interpolator.finite_table()) << "\n";

        const Scheme schemes[] = {
            Scheme::LAGRANGE, Scheme::NEWTON_DIVIDED, Scheme::NEWTON_FORWARD,
            Scheme::NEWTON_BACKWARD, Scheme::GAUSS_FORWARD, Scheme::GAUSS_BACKWARD,
            Scheme::STIRLING, Scheme::BESSEL
        };

        double x = 0.33;
        std::cout << "Exact sin(" << x << ") = " << format_significant(std::sin(x), 12) << "\n\n";

        for (Scheme scheme : schemes) {
            InterpolationResult result = interpolator.evaluate(x, scheme, 4);
            ErrorEstimate estimate = interpolator.estimate_error(x, scheme, 4);
            std::cout << format_interpolation_result(x, result, 12) << "\n";
            std::cout << "    " << format_error_estimate(estimate, 4) << "\n";
        }

        // Производные формулы Стирлинга против cos(x) и -sin(x)
        std::cout << "\nDerivatives (Stirling):\n";
        std::cout << "  f'(x)  = " << format_significant(interpolator.derivative(x, 1, Scheme::STIRLING), 10)
                  << "  (cos x = " << format_significant(std::cos(x), 10) << ")\n";
        std::cout << "  f''(x) = " << format_significant(interpolator.derivative(x, 2, Scheme::STIRLING), 10)
                  << "  (-sin x = " << format_significant(-std::sin(x), 10) << ")\n";

        // Обусловленность
        ConditionNumbers cn = interpolator.condition_numbers(x, Scheme::NEWTON_DIVIDED);
        std::cout << "\nCondition numbers at x = " << x << ": abs = "
                  << format_significant(cn.absolute, 6) << ", rel = "
                  << format_significant(cn.relative, 6) << "\n";
        std::cout << "Lebesgue function: " << format_significant(lebesgue_function(points, x), 6) << "\n";
        std::cout << "Vandermonde condition number: "
                  << format_significant(vandermonde_condition_number(points), 6) << "\n";

        // Сплайн Эрмита по тем же точкам
        HermiteSpline spline(points, BoundaryCondition::CLAMPED, {std::cos(0.0), std::cos(0.6)});
        std::cout << "\n" << spline.get_info() << "\n";
        std::cout << "  S(x) = " << format_significant(spline.evaluate(x), 10) << "\n";
        std::cout << "  integral [0, 0.6] = " << format_significant(spline.integrate(0.0, 0.6), 10)
                  << "  (exact " << format_significant(1.0 - std::cos(0.6), 10) << ")\n";

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
