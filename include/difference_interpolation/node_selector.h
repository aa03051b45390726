#ifndef DIFFERENCE_INTERPOLATION_NODE_SELECTOR_H
#define DIFFERENCE_INTERPOLATION_NODE_SELECTOR_H

#include "types.h"
#include "sample_points.h"
#include "difference_table.h"
#include <vector>

namespace diff_interp {

/**
 * @brief Протяжённость шаблона формулы относительно базового узла p:
 *        используются узлы [p - left, p + right]
 */
struct Stencil {
    int left;
    int right;

    Stencil(int left, int right)
        : left(left), right(right) {}

    int width() const { return left + right + 1; }
};

/**
 * @brief Выбор базового узла и порядка для интерполяционных формул
 *
 * Формулы Лагранжа и Ньютона (разделённые разности, вперёд) строятся от
 * первого узла, формула Ньютона назад - от последнего. Для формул Гаусса и
 * Стирлинга база - ближайший к x узел, для формулы Бесселя - левый узел
 * интервала, содержащего x. База сдвигается внутрь таблицы так, чтобы
 * шаблон поместился.
 *
 * Стирлингу при нечётном порядке и Бесселю при чётном нужны r+2 узла;
 * если таблица уже, порядок понижается на единицу (order_truncated).
 * Это не ошибка. Экстраполяция допускается.
 */
class NodeSelector {
public:
    /**
     * @brief Выбор базы по набору точек
     * @param points табличные данные
     * @param x точка вычисления
     * @param scheme формула
     * @param order запрошенный порядок (-1 = максимальный N-1)
     * @param tolerance допуск равномерности для схем с постоянным шагом
     * @throws InsufficientPointsError если order > N-1
     * @throws InvalidSpacingError для равномерных схем на неравномерной сетке
     */
    static NodeSelection select_base(const SamplePoints& points, double x, Scheme scheme,
                                     int order = -1,
                                     double tolerance = kDefaultSpacingTolerance);

    /**
     * @brief Выбор базы по таблице разностей (узлы и шаг берутся из таблицы)
     */
    static NodeSelection select_base(const DifferenceTable& table, double x, Scheme scheme,
                                     int order = -1);

    /**
     * @brief Шаблон формулы при порядке order
     */
    static Stencil stencil(Scheme scheme, int order);

    /**
     * @brief Помещается ли шаблон порядка order с базой base в таблицу из n узлов
     */
    static bool fits(Scheme scheme, int order, int base, int n_points);

    /**
     * @brief Наибольший порядок, который схема может использовать на n узлах
     */
    static int max_supported_order(Scheme scheme, int n_points);

private:
    static NodeSelection select(const std::vector<double>& nodes, double step,
                                double x, Scheme scheme, int order);

    static int initial_base(const std::vector<double>& nodes, double step,
                            double x, Scheme scheme);
};

/**
 * @brief Схема требует равномерной сетки (таблицы конечных разностей)
 */
bool is_fixed_step_scheme(Scheme scheme);

} // namespace diff_interp

#endif // DIFFERENCE_INTERPOLATION_NODE_SELECTOR_H
