#ifndef DIFFERENCE_INTERPOLATION_DIFFERENCE_TABLE_H
#define DIFFERENCE_INTERPOLATION_DIFFERENCE_TABLE_H

#include "types.h"
#include "sample_points.h"
#include <vector>
#include <string>

namespace diff_interp {

/**
 * @brief Треугольная таблица разностей [порядок][позиция]
 *
 * Строка 0 содержит y_i, строка k содержит ровно N-k элементов.
 *
 * Разделённые разности: row[k][i] = f[x_i, ..., x_{i+k}].
 * Конечные разности (FORWARD, BACKWARD, CENTRAL) хранят одни и те же
 * числа row[k][i] = Δ^k y_i и различаются адресацией в difference():
 * - FORWARD:  Δ^k y_m = row[k][m]
 * - BACKWARD: ∇^k y_m = row[k][m - k]
 * - CENTRAL:  δ^k y_m (k чётное) и δ^k y_{m+1/2} (k нечётное) = row[k][m - k/2]
 *
 * Таблица неизменяема после построения.
 */
class DifferenceTable {
public:
    /**
     * @brief Таблица разделённых разностей (произвольная сетка)
     * @throws DomainError при совпадающих узлах
     */
    static DifferenceTable build_divided(const SamplePoints& points);

    /**
     * @brief Таблица конечных разностей вперёд
     * @throws InvalidSpacingError если шаг не постоянен
     */
    static DifferenceTable build_forward(const SamplePoints& points,
                                         double tolerance = kDefaultSpacingTolerance);

    /**
     * @brief Таблица конечных разностей назад
     * @throws InvalidSpacingError если шаг не постоянен
     */
    static DifferenceTable build_backward(const SamplePoints& points,
                                          double tolerance = kDefaultSpacingTolerance);

    /**
     * @brief Таблица центральных разностей (формулы Гаусса, Стирлинга, Бесселя)
     * @throws InvalidSpacingError если шаг не постоянен
     */
    static DifferenceTable build_central(const SamplePoints& points,
                                         double tolerance = kDefaultSpacingTolerance);

    /**
     * @brief Построение таблицы заданного типа
     */
    static DifferenceTable build(const SamplePoints& points, DifferenceKind kind,
                                 double tolerance = kDefaultSpacingTolerance);

    DifferenceKind kind() const { return kind_; }
    bool is_fixed_step() const { return kind_ != DifferenceKind::DIVIDED; }

    /// Число узлов N (и число строк таблицы)
    int size() const { return static_cast<int>(nodes_.size()); }

    /// Максимальный порядок разностей N-1
    int max_order() const { return size() - 1; }

    /**
     * @brief Строка разностей порядка k (N-k элементов)
     * @throws std::out_of_range если k вне [0, N-1]
     */
    const std::vector<double>& row(int k) const;

    /**
     * @brief Элемент хранилища row[k][i]
     * @throws std::out_of_range при выходе за границы
     */
    double at(int k, int i) const;

    /**
     * @brief Разность порядка k, адресуемая узлом в соответствии с типом таблицы
     * @throws std::out_of_range если разность для этого узла не существует
     */
    double difference(int k, int node) const;

    /**
     * @brief Разделённая разность f[x_first, ..., x_{first+k}] по непрерывному диапазону узлов
     *
     * Для таблиц конечных разностей: Δ^k y_first / (k! h^k).
     */
    double divided_difference(int k, int first) const;

    const std::vector<double>& nodes() const { return nodes_; }
    double node(int i) const { return nodes_.at(static_cast<size_t>(i)); }
    double value(int i) const { return at(0, i); }

    /// Шаг h (0 для таблицы разделённых разностей)
    double step() const { return step_; }

    /**
     * @brief Краткая диагностическая информация
     */
    std::string get_info() const;

private:
    DifferenceKind kind_;
    std::vector<double> nodes_;
    std::vector<std::vector<double>> rows_;
    double step_;

    DifferenceTable(DifferenceKind kind, const std::vector<double>& nodes, double step);

    static DifferenceTable build_fixed_step(const SamplePoints& points, DifferenceKind kind,
                                            double tolerance);
};

/**
 * @brief Строковое имя типа таблицы ("divided", "forward", "backward", "central")
 */
const char* difference_kind_name(DifferenceKind kind);

} // namespace diff_interp

#endif // DIFFERENCE_INTERPOLATION_DIFFERENCE_TABLE_H
