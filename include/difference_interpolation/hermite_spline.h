#ifndef DIFFERENCE_INTERPOLATION_HERMITE_SPLINE_H
#define DIFFERENCE_INTERPOLATION_HERMITE_SPLINE_H

#include "types.h"
#include "sample_points.h"
#include <vector>
#include <string>

namespace diff_interp {

/**
 * @brief Кубический сплайн Эрмита класса C²
 *
 * На отрезке [x_i, x_{i+1}]:
 *   S_i(x) = a_i + b_i dx + c_i dx² + d_i dx³, dx = x - x_i
 *
 * Наклоны m_i = S'(x_i) находятся из условий непрерывности второй производной
 *   λ_i m_{i-1} + 2 m_i + μ_i m_{i+1} = 3(μ_i Δ_i + λ_i Δ_{i-1}),
 *   λ_i = h_i/(h_{i-1}+h_i), μ_i = h_{i-1}/(h_{i-1}+h_i), Δ_i = (y_{i+1}-y_i)/h_i
 * и двух граничных строк. Вне [x_0, x_{n-1}] продолжается крайними кусками.
 */
class HermiteSpline {
public:
    /**
     * @brief Построение сплайна
     * @param points узлы (строго возрастающие)
     * @param boundary граничное условие
     * @param boundary_values {левое, правое}: первые производные для CLAMPED,
     *        вторые производные для SECOND; для остальных условий не используются
     * @throws std::invalid_argument при неупорядоченных узлах или отсутствии граничных значений
     * @throws InsufficientPointsError если узлов недостаточно для граничного условия
     * @throws DomainError если система для наклонов вырождена
     */
    HermiteSpline(const SamplePoints& points,
                  BoundaryCondition boundary = BoundaryCondition::NOT_A_KNOT,
                  const std::vector<double>& boundary_values = {});

    double evaluate(double x) const;

    /**
     * @brief Производная порядка k (0..3; при k > 3 ровно 0)
     * @throws std::invalid_argument при k < 0
     */
    double derivative(double x, int k = 1) const;

    /**
     * @brief Определённый интеграл ∫_a^b S(x) dx (при a > b меняет знак)
     */
    double integrate(double a, double b) const;

    /// Наклоны m_i в узлах
    const std::vector<double>& slopes() const { return slopes_; }

    BoundaryCondition boundary() const { return boundary_; }
    int size() const { return static_cast<int>(xs_.size()); }

    std::string get_info() const;

private:
    struct Segment {
        double a, b, c, d;
        double x0;
    };

    std::vector<double> xs_;
    std::vector<double> ys_;
    BoundaryCondition boundary_;
    std::vector<double> slopes_;
    std::vector<Segment> segments_;

    void solve_slopes(const std::vector<double>& boundary_values);
    void build_segments();
    int segment_index(double x) const;
    double segment_antiderivative(int i, double x) const;
};

/**
 * @brief Строковое имя граничного условия ("not-a-knot", "clamped", "second", "periodic")
 */
const char* boundary_condition_name(BoundaryCondition boundary);

/**
 * @brief Разбор имени граничного условия (регистр и разделители '-', '_' не важны)
 * @throws std::invalid_argument для неизвестного имени
 */
BoundaryCondition parse_boundary_condition(const std::string& name);

} // namespace diff_interp

#endif // DIFFERENCE_INTERPOLATION_HERMITE_SPLINE_H
