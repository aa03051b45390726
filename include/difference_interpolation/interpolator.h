#ifndef DIFFERENCE_INTERPOLATION_INTERPOLATOR_H
#define DIFFERENCE_INTERPOLATION_INTERPOLATOR_H

#include "types.h"
#include "sample_points.h"
#include "difference_table.h"
#include "interpolation.h"
#include "error_estimator.h"
#include <memory>
#include <string>
#include <vector>

namespace diff_interp {

/**
 * @brief Интерполятор над фиксированным набором точек
 *
 * Таблицы разностей строятся один раз при создании: таблица разделённых
 * разностей всегда, таблица конечных разностей только на равномерной сетке.
 * Все формулы с постоянным шагом используют одну и ту же таблицу конечных
 * разностей (тип адресации выбирается по схеме внутри ряда).
 */
class Interpolator {
public:
    /**
     * @brief Создание интерполятора
     * @param points табличные данные
     * @param spacing_tolerance допуск равномерности сетки
     * @throws DomainError при совпадающих узлах
     */
    explicit Interpolator(const SamplePoints& points,
                          double spacing_tolerance = kDefaultSpacingTolerance);

    /**
     * @brief Значение интерполянта в точке x
     * @throws InvalidSpacingError для равномерных схем на неравномерной сетке
     * @throws InsufficientPointsError если order > N-1
     */
    InterpolationResult evaluate(double x, Scheme scheme, int order = -1) const;

    /**
     * @brief Значения в нескольких точках
     */
    std::vector<InterpolationResult> evaluate(const std::vector<double>& xs, Scheme scheme,
                                              int order = -1) const;

    /**
     * @brief Производная порядка k
     */
    double derivative(double x, int k, Scheme scheme, int order = -1) const;

    double truncation_error(double x, Scheme scheme, int order = -1) const;
    ErrorEstimate estimate_error(double x, Scheme scheme, int order = -1) const;

    /**
     * @brief Числа обусловленности интерполянта в точке x
     * @throws DomainError если значение в точке равно нулю
     */
    ConditionNumbers condition_numbers(double x, Scheme scheme, int order = -1) const;

    const SamplePoints& points() const { return points_; }
    double spacing_tolerance() const { return spacing_tolerance_; }
    bool is_equally_spaced() const { return static_cast<bool>(finite_); }

    const DifferenceTable& divided_table() const { return *divided_; }

    /**
     * @brief Таблица конечных разностей
     * @throws InvalidSpacingError если сетка неравномерна
     */
    const DifferenceTable& finite_table() const;

    /**
     * @brief Таблица, с которой работает схема
     */
    const DifferenceTable& table_for(Scheme scheme) const;

    std::string get_info() const;

private:
    SamplePoints points_;
    double spacing_tolerance_;
    std::shared_ptr<const DifferenceTable> divided_;
    std::shared_ptr<const DifferenceTable> finite_;
};

} // namespace diff_interp

#endif // DIFFERENCE_INTERPOLATION_INTERPOLATOR_H
