#ifndef DIFFERENCE_INTERPOLATION_TYPES_H
#define DIFFERENCE_INTERPOLATION_TYPES_H

#include <vector>
#include <string>

namespace diff_interp {

/// Допуск по умолчанию при проверке постоянства шага (относительно |h|)
constexpr double kDefaultSpacingTolerance = 1e-9;

/// Шаг по умолчанию для численной производной в оценке обусловленности
constexpr double kDefaultDerivativeStep = 1e-5;

/**
 * @brief Перечисление интерполяционных формул
 */
enum class Scheme {
    LAGRANGE,           ///< Формула Лагранжа
    NEWTON_DIVIDED,     ///< Формула Ньютона с разделёнными разностями
    NEWTON_FORWARD,     ///< Первая формула Ньютона (вперёд)
    NEWTON_BACKWARD,    ///< Вторая формула Ньютона (назад)
    GAUSS_FORWARD,      ///< Первая формула Гаусса
    GAUSS_BACKWARD,     ///< Вторая формула Гаусса
    STIRLING,           ///< Формула Стирлинга
    BESSEL              ///< Формула Бесселя
};

/**
 * @brief Тип таблицы разностей
 */
enum class DifferenceKind {
    DIVIDED,    ///< разделённые разности (произвольная сетка)
    FORWARD,    ///< конечные разности вперёд Δ
    BACKWARD,   ///< конечные разности назад ∇
    CENTRAL     ///< центральные разности δ
};

/**
 * @brief Граничное условие кубического сплайна Эрмита
 */
enum class BoundaryCondition {
    NOT_A_KNOT,     ///< непрерывность третьей производной в x_1 и x_{n-2}
    CLAMPED,        ///< заданы первые производные на концах
    SECOND,         ///< заданы вторые производные на концах
    PERIODIC        ///< периодический сплайн (y_0 = y_{n-1})
};

/**
 * @brief Результат выбора базового узла для запроса x
 *
 * Шаблон (stencil) формулы - непрерывный диапазон узлов
 * [first_node, last_node], используемый при данном порядке.
 */
struct NodeSelection {
    Scheme scheme;          // схема, для которой выполнен выбор
    int base_index;         // базовый узел p (с нуля)
    double s;               // (x - x_p)/h для равномерных схем, x - x_p иначе
    double step;            // шаг h (1.0 для неравномерных схем)
    int order;              // фактически используемый порядок
    int first_node;         // первый узел шаблона
    int last_node;          // последний узел шаблона
    bool order_truncated;   // порядок понижен из-за нехватки узлов
    bool extrapolating;     // x вне [min x_i, max x_i]

    NodeSelection()
        : scheme(Scheme::LAGRANGE)
        , base_index(0)
        , s(0.0)
        , step(1.0)
        , order(0)
        , first_node(0)
        , last_node(0)
        , order_truncated(false)
        , extrapolating(false) {}
};

/**
 * @brief Результат интерполяции в одной точке
 */
struct InterpolationResult {
    double value;       // интерполированное значение
    int order;          // порядок (степень) использованного полинома
    int base_index;     // базовый узел
    Scheme scheme;      // использованная формула

    InterpolationResult()
        : value(0.0)
        , order(0)
        , base_index(0)
        , scheme(Scheme::LAGRANGE) {}
};

/**
 * @brief Оценка погрешности интерполяции
 */
struct ErrorEstimate {
    double absolute_error;      // оценка абсолютной погрешности (первый отброшенный член)
    double relative_error;      // |absolute_error / value|
    double value;               // интерполированное значение
    int order;                  // порядок, для которого дана оценка
    bool next_term_available;   // false, если шаблон уже занимает все узлы

    ErrorEstimate()
        : absolute_error(0.0)
        , relative_error(0.0)
        , value(0.0)
        , order(0)
        , next_term_available(false) {}
};

/**
 * @brief Абсолютное и относительное числа обусловленности
 */
struct ConditionNumbers {
    double absolute;    // |x * f'(x)|
    double relative;    // |x * f'(x) / f(x)|

    ConditionNumbers()
        : absolute(0.0)
        , relative(0.0) {}
};

/**
 * @brief Описание задачи интерполяции (читается из конфигурации)
 */
struct InterpolationTask {
    std::string name;                   // имя задачи
    std::vector<double> x_values;       // узлы x_i
    std::vector<double> y_values;       // значения y_i
    Scheme scheme;                      // формула
    int order;                          // порядок (-1 = максимальный)
    int derivative_order;               // порядок производной (0 = только значение)
    double spacing_tolerance;           // допуск проверки равномерности
    std::vector<double> query_points;   // точки вычисления
    bool estimate_error;                // вычислять оценку погрешности

    InterpolationTask()
        : scheme(Scheme::NEWTON_DIVIDED)
        , order(-1)
        , derivative_order(0)
        , spacing_tolerance(kDefaultSpacingTolerance)
        , estimate_error(false) {}
};

} // namespace diff_interp

#endif // DIFFERENCE_INTERPOLATION_TYPES_H
