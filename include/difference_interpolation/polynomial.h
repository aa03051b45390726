#ifndef DIFFERENCE_INTERPOLATION_POLYNOMIAL_H
#define DIFFERENCE_INTERPOLATION_POLYNOMIAL_H

#include <vector>

namespace diff_interp {

/**
 * @brief Класс для работы с алгебраическим полиномом
 *
 * Полином представляется в виде: P(t) = a_n * t^n + a_{n-1} * t^{n-1} + ... + a_1 * t + a_0
 * Коэффициенты хранятся в порядке убывания степеней: [a_n, a_{n-1}, ..., a_0]
 *
 * Используется для почленного дифференцирования интерполяционных формул:
 * каждый член формулы раскрывается в коэффициенты, после чего производная
 * любого порядка вычисляется точно (для k > n результат тождественно ноль).
 */
class Polynomial {
private:
    std::vector<double> coeffs_;  // коэффициенты [a_n, a_{n-1}, ..., a_0]
    int degree_;                  // степень полинома

    void strip_leading_zeros();

public:
    /**
     * @brief Конструктор по коэффициентам
     * @param coeffs вектор коэффициентов в порядке убывания степеней
     */
    Polynomial(const std::vector<double>& coeffs);

    /**
     * @brief Конструктор нулевого полинома заданной степени
     * @param degree степень полинома
     */
    explicit Polynomial(int degree = 0);

    /**
     * @brief Полином leading * Π (t - r_j) по корням
     */
    static Polynomial from_roots(const std::vector<double>& roots, double leading = 1.0);

    /**
     * @brief Вычисление значения полинома в точке t (схема Горнера)
     */
    double evaluate(double t) const;

    /**
     * @brief Производная порядка order как новый полином
     *
     * Для order > degree() возвращается нулевой полином.
     */
    Polynomial differentiate(int order = 1) const;

    /**
     * @brief Значение производной порядка order в точке t
     */
    double derivative(double t, int order = 1) const;

    /**
     * @brief Умножение на линейный множитель (t - root)
     */
    Polynomial multiply_linear(double root) const;

    const std::vector<double>& coefficients() const { return coeffs_; }
    int degree() const { return degree_; }

    /**
     * @brief Все коэффициенты равны нулю
     */
    bool is_zero() const;

    Polynomial operator+(const Polynomial& other) const;
    Polynomial operator-(const Polynomial& other) const;
    Polynomial operator*(double scalar) const;
    Polynomial& operator+=(const Polynomial& other);
};

} // namespace diff_interp

#endif // DIFFERENCE_INTERPOLATION_POLYNOMIAL_H
