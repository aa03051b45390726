#ifndef DIFFERENCE_INTERPOLATION_DIFFERENCE_SERIES_H
#define DIFFERENCE_INTERPOLATION_DIFFERENCE_SERIES_H

#include "types.h"
#include "difference_table.h"
#include "polynomial.h"
#include <vector>

namespace diff_interp {

/**
 * @brief Член интерполяционного ряда: coefficient * Π (t - roots[j])
 *
 * Для равномерных схем t = s = (x - x_p)/h, coefficient = разность / k!.
 * Для формулы Ньютона с разделёнными разностями t = x - x_p.
 */
struct SeriesTerm {
    double coefficient;
    std::vector<double> roots;

    SeriesTerm(double coefficient, const std::vector<double>& roots)
        : coefficient(coefficient), roots(roots) {}

    double evaluate(double t) const;

    /// Раскрытие члена в полином по t
    Polynomial to_polynomial() const;
};

/**
 * @brief Интерполяционный ряд схемы при выбранной базе: члены порядков 0..order
 *
 * Один и тот же набор членов используется для значения, производных
 * (почленным дифференцированием полинома по t) и оценки погрешности
 * (следующий, отброшенный член).
 */
class DifferenceSeries {
public:
    /**
     * @brief Построение ряда по таблице и результату выбора узлов
     */
    static DifferenceSeries build(const DifferenceTable& table, const NodeSelection& selection);

    /**
     * @brief Член порядка k схемы scheme с базой base
     * @throws std::out_of_range если шаблон члена не помещается в таблицу
     * @throws std::invalid_argument для формулы Лагранжа (не является рядом по разностям)
     */
    static SeriesTerm term(const DifferenceTable& table, Scheme scheme, int base, int k);

    double evaluate(double t) const;

    /**
     * @brief Производная порядка k по t (без множителя 1/h^k)
     */
    double derivative(double t, int k) const;

    Polynomial to_polynomial() const;

    const std::vector<SeriesTerm>& terms() const { return terms_; }
    int order() const { return static_cast<int>(terms_.size()) - 1; }

private:
    std::vector<SeriesTerm> terms_;
};

} // namespace diff_interp

#endif // DIFFERENCE_INTERPOLATION_DIFFERENCE_SERIES_H
