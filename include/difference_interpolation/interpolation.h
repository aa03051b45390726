#ifndef DIFFERENCE_INTERPOLATION_INTERPOLATION_H
#define DIFFERENCE_INTERPOLATION_INTERPOLATION_H

#include "types.h"
#include "sample_points.h"
#include "difference_table.h"
#include "node_selector.h"
#include <string>
#include <vector>

namespace diff_interp {

/**
 * @brief Строковое имя схемы ("lagrange", "newton_divided", ..., "bessel")
 */
const char* scheme_name(Scheme scheme);

/**
 * @brief Разбор имени схемы (регистр и разделители '-', '_', ' ' не важны)
 * @throws std::invalid_argument для неизвестного имени
 */
Scheme parse_scheme(const std::string& name);

// ============== Единая точка вычисления ==============

/**
 * @brief Интерполяция по набору точек выбранной формулой
 *
 * Таблица нужного типа строится на каждый вызов; для многократных
 * запросов используйте Interpolator.
 *
 * @param points табличные данные
 * @param x точка вычисления
 * @param scheme формула
 * @param order порядок (-1 = максимальный, который допускает таблица)
 * @param tolerance допуск равномерности сетки
 */
InterpolationResult interpolate(const SamplePoints& points, double x, Scheme scheme,
                                int order = -1,
                                double tolerance = kDefaultSpacingTolerance);

/**
 * @brief Интерполяция по готовой таблице разностей
 *
 * Равномерные схемы требуют таблицу конечных разностей (любого из типов
 * FORWARD, BACKWARD, CENTRAL); Лагранж и Ньютон с разделёнными разностями
 * принимают любую таблицу.
 */
InterpolationResult evaluate(const DifferenceTable& table, double x, Scheme scheme, int order = -1);

/**
 * @brief Вычисление ряда при уже выбранной базе
 */
InterpolationResult evaluate_at_selection(const DifferenceTable& table, const NodeSelection& selection);

// ============== Отдельные формулы ==============

InterpolationResult evaluate_lagrange(const SamplePoints& points, double x, int order = -1);
InterpolationResult evaluate_lagrange(const DifferenceTable& table, double x, int order = -1);
InterpolationResult evaluate_newton_divided(const DifferenceTable& table, double x, int order = -1);
InterpolationResult evaluate_newton_forward(const DifferenceTable& table, double x, int order = -1);
InterpolationResult evaluate_newton_backward(const DifferenceTable& table, double x, int order = -1);
InterpolationResult evaluate_gauss_forward(const DifferenceTable& table, double x, int order = -1);
InterpolationResult evaluate_gauss_backward(const DifferenceTable& table, double x, int order = -1);
InterpolationResult evaluate_stirling(const DifferenceTable& table, double x, int order = -1);
InterpolationResult evaluate_bessel(const DifferenceTable& table, double x, int order = -1);

// ============== Производные ==============

/**
 * @brief Производная порядка k интерполяционного полинома выбранной формулы
 *
 * Полином формулы по s раскрывается почленно в коэффициенты, дифференцируется
 * k раз и умножается на (1/h)^k. При k = 0 возвращается значение, при k,
 * превышающем использованный порядок, ровно 0.
 *
 * @throws std::invalid_argument при k < 0
 */
double derivative(const DifferenceTable& table, double x, int k, Scheme scheme, int order = -1);

/**
 * @brief Производная по набору точек (таблица строится на каждый вызов)
 */
double derivative(const SamplePoints& points, double x, int k, Scheme scheme, int order = -1,
                  double tolerance = kDefaultSpacingTolerance);

/**
 * @brief Производная порядка k полинома Лагранжа
 *
 * k = 1 - правило произведения по N-1 множителям каждого базисного полинома,
 * k >= 2 - дифференцирование разложенных в коэффициенты базисных полиномов.
 */
double lagrange_derivative(const SamplePoints& points, double x, int k, int order = -1);
double lagrange_derivative(const DifferenceTable& table, double x, int k, int order = -1);

/**
 * @brief Значения базисных полиномов Лагранжа l_i(x) на узлах [first, last]
 * @throws DomainError при совпадающих узлах
 */
std::vector<double> lagrange_basis(const std::vector<double>& nodes, int first, int last, double x);

} // namespace diff_interp

#endif // DIFFERENCE_INTERPOLATION_INTERPOLATION_H
