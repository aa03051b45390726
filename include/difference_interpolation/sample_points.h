#ifndef DIFFERENCE_INTERPOLATION_SAMPLE_POINTS_H
#define DIFFERENCE_INTERPOLATION_SAMPLE_POINTS_H

#include "types.h"
#include <vector>
#include <utility>

namespace diff_interp {

/**
 * @brief Табличные данные (x_i, y_i) для интерполяции
 *
 * Набор неизменяем после построения. Проверки на границе:
 * - размеры x и y совпадают (иначе std::invalid_argument)
 * - не менее двух точек (иначе InsufficientPointsError)
 * - все значения конечны (иначе std::invalid_argument)
 *
 * Совпадающие узлы допускаются в самом наборе, но отвергаются
 * построителем таблицы разделённых разностей.
 */
class SamplePoints {
public:
    /**
     * @brief Построение по двум параллельным последовательностям
     * @param x узлы
     * @param y значения в узлах
     */
    SamplePoints(const std::vector<double>& x, const std::vector<double>& y);

    /**
     * @brief Построение по последовательности пар (x, y)
     */
    explicit SamplePoints(const std::vector<std::pair<double, double>>& points);

    /**
     * @brief Построение равномерной сетки x_i = x0 + i*h
     * @param x0 первый узел
     * @param step шаг h (ненулевой)
     * @param y значения в узлах
     */
    SamplePoints(double x0, double step, const std::vector<double>& y);

    int size() const { return static_cast<int>(xs_.size()); }
    double x(int i) const { return xs_.at(static_cast<size_t>(i)); }
    double y(int i) const { return ys_.at(static_cast<size_t>(i)); }

    const std::vector<double>& x_values() const { return xs_; }
    const std::vector<double>& y_values() const { return ys_; }

    double min_x() const;
    double max_x() const;

    /**
     * @brief Строго монотонная (возрастающая или убывающая) последовательность узлов
     */
    bool is_strictly_monotonic() const;

    /**
     * @brief Есть ли узлы, отличающиеся не более чем на tolerance
     */
    bool has_duplicate_nodes(double tolerance = 0.0) const;

    /**
     * @brief Проверка постоянства шага: |(x_{i+1} - x_i) - h| <= tolerance * |h|
     */
    bool is_equally_spaced(double tolerance = kDefaultSpacingTolerance) const;

    /**
     * @brief Шаг равномерной сетки
     * @throws InvalidSpacingError если шаг не постоянен
     */
    double uniform_step(double tolerance = kDefaultSpacingTolerance) const;

    /**
     * @brief Подмножество из count последовательных точек, начиная с first
     * @throws std::out_of_range при выходе за границы
     */
    SamplePoints subset(int first, int count) const;

private:
    std::vector<double> xs_;
    std::vector<double> ys_;

    void validate() const;
};

} // namespace diff_interp

#endif // DIFFERENCE_INTERPOLATION_SAMPLE_POINTS_H
