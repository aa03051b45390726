#ifndef DIFFERENCE_INTERPOLATION_VALIDATOR_H
#define DIFFERENCE_INTERPOLATION_VALIDATOR_H

#include "types.h"
#include <string>
#include <vector>
#include <sstream>

namespace diff_interp {

/**
 * @brief Уровень серьёзности проблемы валидации
 */
enum class ValidationLevel {
    Error,     ///< Критическая ошибка, блокирующая вычисления
    Warning    ///< Предупреждение, не блокирующее, но требующее внимания
};

/**
 * @brief Структура для описания проблемы валидации
 */
struct ValidationIssue {
    ValidationLevel level;      ///< Уровень серьёзности
    std::string message;        ///< Описание проблемы
    std::string recommendation; ///< Рекомендация по исправлению

    ValidationIssue(ValidationLevel lvl, const std::string& msg, const std::string& rec = "")
        : level(lvl), message(msg), recommendation(rec) {}
};

/**
 * @brief Структура с результатами валидации задачи интерполяции
 */
struct ValidationReport {
    std::vector<ValidationIssue> errors;     ///< Критические ошибки
    std::vector<ValidationIssue> warnings;   ///< Предупреждения

    // Сводка
    size_t points_count = 0;
    size_t queries_count = 0;
    std::string scheme;
    int requested_order = -1;
    bool equally_spaced = false;

    bool has_errors() const { return !errors.empty(); }
    bool has_warnings() const { return !warnings.empty(); }

    std::string format(bool include_recommendations = true) const {
        std::ostringstream oss;

        if (errors.empty() && warnings.empty()) {
            return "Validation passed successfully.\n";
        }

        oss << "Validation Report:\n";
        oss << "=================\n\n";

        oss << "Summary:\n";
        oss << "  - Points: " << points_count << "\n";
        oss << "  - Queries: " << queries_count << "\n";
        oss << "  - Scheme: " << scheme << "\n";
        oss << "  - Requested order: ";
        if (requested_order < 0) {
            oss << "max";
        } else {
            oss << requested_order;
        }
        oss << "\n";
        oss << "  - Equally spaced: " << (equally_spaced ? "yes" : "no") << "\n";
        oss << "\n";

        if (!errors.empty()) {
            oss << "Errors (" << errors.size() << "):\n";
            for (size_t i = 0; i < errors.size(); ++i) {
                oss << "  " << (i + 1) << ". " << errors[i].message;
                if (include_recommendations && !errors[i].recommendation.empty()) {
                    oss << "\n      Recommendation: " << errors[i].recommendation;
                }
                oss << "\n";
            }
            oss << "\n";
        }

        if (!warnings.empty()) {
            oss << "Warnings (" << warnings.size() << "):\n";
            for (size_t i = 0; i < warnings.size(); ++i) {
                oss << "  " << (i + 1) << ". " << warnings[i].message;
                if (include_recommendations && !warnings[i].recommendation.empty()) {
                    oss << "\n      Recommendation: " << warnings[i].recommendation;
                }
                oss << "\n";
            }
            oss << "\n";
        }

        return oss.str();
    }
};

/**
 * @brief Класс для валидации задач интерполяции до вычислений
 *
 * Каждая проверка возвращает пустую строку, если проблем нет, иначе сообщение.
 */
class Validator {
public:
    /// Порядок, начиная с которого выдаётся предупреждение о неустойчивости
    static constexpr int kHighOrderThreshold = 10;

    /**
     * @brief Проверка корректности задачи (упрощённый интерфейс)
     * @param task задача
     * @param strict_mode если true, то любые предупреждения считаются ошибками
     * @return пустая строка, если валидация прошла успешно, иначе сообщение
     */
    static std::string validate(const InterpolationTask& task, bool strict_mode = false);

    /**
     * @brief Полная проверка с получением детального отчёта
     * @param task задача
     * @param strict_mode если true, то предупреждения переносятся в errors
     */
    static ValidationReport validate_full(const InterpolationTask& task, bool strict_mode = false);

    /**
     * @brief Совпадение размеров x и y, не менее 2 точек
     */
    static std::string check_point_counts(const InterpolationTask& task);

    /**
     * @brief Конечность всех узлов, значений и точек запроса
     */
    static std::string check_finite_values(const InterpolationTask& task);

    /**
     * @brief Отсутствие совпадающих узлов
     */
    static std::string check_duplicate_nodes(const InterpolationTask& task);

    /**
     * @brief Строгая монотонность узлов (только для схем с постоянным шагом)
     */
    static std::string check_monotonic_nodes(const InterpolationTask& task);

    /**
     * @brief Постоянство шага в пределах spacing_tolerance (только для схем с постоянным шагом)
     */
    static std::string check_uniform_spacing(const InterpolationTask& task);

    /**
     * @brief Порядок интерполяции и производной в допустимых пределах
     */
    static std::string check_order(const InterpolationTask& task);

    /**
     * @brief Точки запроса вне [min x, max x]
     */
    static std::string check_extrapolation(const InterpolationTask& task);

    /**
     * @brief Понижение порядка Стирлинга/Бесселя из-за чётности
     */
    static std::string check_parity_truncation(const InterpolationTask& task);

    /**
     * @brief Слишком высокий порядок (> kHighOrderThreshold)
     */
    static std::string check_high_order(const InterpolationTask& task);

private:
    static bool has_consistent_points(const InterpolationTask& task);
    static int effective_order(const InterpolationTask& task);
};

} // namespace diff_interp

#endif // DIFFERENCE_INTERPOLATION_VALIDATOR_H
