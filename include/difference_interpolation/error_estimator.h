#ifndef DIFFERENCE_INTERPOLATION_ERROR_ESTIMATOR_H
#define DIFFERENCE_INTERPOLATION_ERROR_ESTIMATOR_H

#include "types.h"
#include "sample_points.h"
#include "difference_table.h"
#include <functional>
#include <limits>

namespace diff_interp {

// ============== Погрешность усечения ==============

/**
 * @brief Оценка погрешности усечения первым отброшенным членом
 *
 * Возвращает |член порядка order+1| того же ряда при той же базе. Если его
 * шаблон не помещается в таблицу, используется следующая разделённая
 * разность по шаблону и одному соседнему узлу (со стороны, ближайшей к x),
 * умноженная на Π (x - x_j) по узлам шаблона. Если шаблон уже занимает все
 * узлы, отброшенный член построить не из чего и возвращается 0.
 *
 * @param scheme формула
 * @param table таблица разностей
 * @param order порядок (-1 = максимальный)
 * @param x точка вычисления
 */
double truncation_error(Scheme scheme, const DifferenceTable& table, int order, double x);

/**
 * @brief Полная оценка: абсолютная и относительная погрешность
 */
ErrorEstimate estimate_error(Scheme scheme, const DifferenceTable& table, int order, double x);

/**
 * @brief Остаточный член формулы Лагранжа
 *
 * R_n(x) = f^{(n+1)}(ξ) / (n+1)! * Π (x - x_i), n = N-1
 *
 * @param points узлы интерполяции
 * @param x точка
 * @param derivative_at_xi значение (n+1)-й производной f в точке ξ
 */
double lagrange_remainder(const SamplePoints& points, double x, double derivative_at_xi);

/**
 * @brief Остаточный член с вычислением (n+1)-й производной в точке ξ
 * @param higher_derivative функция f^{(n+1)}
 * @param xi точка ξ (NaN = среднее арифметическое узлов)
 */
double lagrange_remainder(const SamplePoints& points, double x,
                          const std::function<double(double)>& higher_derivative,
                          double xi = std::numeric_limits<double>::quiet_NaN());

// ============== Обусловленность ==============

/**
 * @brief Числа обусловленности функции в точке x
 *
 * abs = |x * f'(x)|, rel = |x * f'(x) / f(x)|; f'(x) - центральная разность с шагом step.
 *
 * @throws DomainError если f(x) == 0
 * @throws std::invalid_argument если step равен нулю или не конечен
 */
ConditionNumbers cond_nums(const std::function<double(double)>& f, double x,
                           double step = kDefaultDerivativeStep);

/**
 * @brief Числа обусловленности при известной производной f'
 * @throws DomainError если f(x) == 0
 */
ConditionNumbers cond_nums(const std::function<double(double)>& f,
                           const std::function<double(double)>& df, double x);

/**
 * @brief Только абсолютное число обусловленности |x * f'(x)| (определено и при f(x) = 0)
 */
double absolute_condition_number(const std::function<double(double)>& f, double x,
                                 double step = kDefaultDerivativeStep);

/**
 * @brief Обусловленность интерполянта выбранной формулы в точке x
 *
 * Производная берётся аналитически из той же формулы.
 * @throws DomainError если интерполированное значение равно нулю
 */
ConditionNumbers interpolation_cond_nums(const DifferenceTable& table, double x, Scheme scheme,
                                         int order = -1);

/**
 * @brief Функция Лебега Σ |l_i(x)|: коэффициент усиления возмущений данных в точке x
 */
double lebesgue_function(const SamplePoints& points, double x);

/**
 * @brief Число обусловленности матрицы Вандермонда σ_max / σ_min (SVD)
 *
 * Для вырожденной матрицы возвращается +inf.
 */
double vandermonde_condition_number(const SamplePoints& points);

} // namespace diff_interp

#endif // DIFFERENCE_INTERPOLATION_ERROR_ESTIMATOR_H
