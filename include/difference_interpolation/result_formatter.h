#ifndef DIFFERENCE_INTERPOLATION_RESULT_FORMATTER_H
#define DIFFERENCE_INTERPOLATION_RESULT_FORMATTER_H

#include "types.h"
#include "difference_table.h"
#include <string>

namespace diff_interp {

/// Число значащих цифр в отчётах по умолчанию
constexpr int kDefaultReportDigits = 8;

/**
 * @brief Число с заданным количеством значащих цифр
 */
std::string format_significant(double value, int digits = kDefaultReportDigits);

/**
 * @brief Таблица разностей в виде текстовой таблицы (строка на узел, столбец на порядок)
 */
std::string format_difference_table(const DifferenceTable& table, int digits = kDefaultReportDigits);

/**
 * @brief Форматирование результата интерполяции в точке x
 */
std::string format_interpolation_result(double x, const InterpolationResult& result,
                                        int digits = kDefaultReportDigits);

/**
 * @brief Форматирование оценки погрешности
 */
std::string format_error_estimate(const ErrorEstimate& estimate, int digits = kDefaultReportDigits);

/**
 * @brief Полный отчёт по задаче: валидация, таблица разностей, значения в точках запроса
 *
 * Если валидация находит ошибки, отчёт содержит только их.
 */
std::string format_task_report(const InterpolationTask& task, int digits = kDefaultReportDigits);

} // namespace diff_interp

#endif // DIFFERENCE_INTERPOLATION_RESULT_FORMATTER_H
