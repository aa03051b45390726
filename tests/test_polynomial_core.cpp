#include <gtest/gtest.h>
#include <cmath>
#include <iostream>
#include "difference_interpolation/polynomial.h"

using namespace diff_interp;

TEST(PolynomialTest, BasicOperations) {
    std::cout << "Testing Polynomial basic operations...\n";

    // Тест создания полинома
    Polynomial p(std::vector<double>{1.0, 0.0, -1.0});  // t^2 - 1
    EXPECT_EQ(p.degree(), 2);

    // Тест evaluate
    EXPECT_NEAR(p.evaluate(0.0), -1.0, 1e-10);
    EXPECT_NEAR(p.evaluate(1.0), 0.0, 1e-10);
    EXPECT_NEAR(p.evaluate(2.0), 3.0, 1e-10);

    // Первая и вторая производные
    EXPECT_NEAR(p.derivative(0.0), 0.0, 1e-10);
    EXPECT_NEAR(p.derivative(1.0), 2.0, 1e-10);
    EXPECT_NEAR(p.derivative(0.0, 2), 2.0, 1e-10);
    EXPECT_NEAR(p.derivative(3.0, 2), 2.0, 1e-10);
}

TEST(PolynomialTest, ArithmeticOperations) {
    std::cout << "Testing Polynomial arithmetic...\n";

    Polynomial p1(std::vector<double>{1.0, 2.0, 3.0});  // t^2 + 2t + 3
    Polynomial p2(std::vector<double>{3.0, 2.0, 1.0});  // 3t^2 + 2t + 1

    // Сложение: 4t^2 + 4t + 4
    Polynomial sum = p1 + p2;
    EXPECT_EQ(sum.degree(), 2);
    EXPECT_NEAR(sum.evaluate(0.0), 4.0, 1e-10);
    EXPECT_NEAR(sum.evaluate(1.0), 12.0, 1e-10);

    // Вычитание: -2t^2 + 2
    Polynomial diff = p1 - p2;
    EXPECT_EQ(diff.degree(), 2);
    EXPECT_NEAR(diff.evaluate(0.0), 2.0, 1e-10);
    EXPECT_NEAR(diff.evaluate(1.0), 0.0, 1e-10);

    // Умножение на скаляр
    Polynomial scaled = p1 * 2.0;
    EXPECT_NEAR(scaled.evaluate(0.0), 6.0, 1e-10);
    EXPECT_NEAR(scaled.evaluate(1.0), 12.0, 1e-10);
}

TEST(PolynomialTest, AdditionOfDifferentDegrees) {
    std::cout << "Testing addition aligned on low powers...\n";

    Polynomial cubic(std::vector<double>{1.0, 0.0, 0.0, 0.0});  // t^3
    Polynomial linear(std::vector<double>{2.0, 5.0});            // 2t + 5

    Polynomial sum = cubic + linear;  // t^3 + 2t + 5
    EXPECT_EQ(sum.degree(), 3);
    EXPECT_NEAR(sum.evaluate(0.0), 5.0, 1e-12);
    EXPECT_NEAR(sum.evaluate(2.0), 17.0, 1e-12);

    Polynomial sum2 = linear + cubic;
    EXPECT_NEAR(sum2.evaluate(2.0), 17.0, 1e-12);

    // Сокращение старшего члена понижает степень
    Polynomial cancel = sum - cubic;
    EXPECT_EQ(cancel.degree(), 1);
    EXPECT_NEAR(cancel.evaluate(1.0), 7.0, 1e-12);
}

TEST(PolynomialTest, FromRoots) {
    std::cout << "Testing construction from roots...\n";

    // 2 (t - 1)(t + 2) = 2t^2 + 2t - 4
    Polynomial p = Polynomial::from_roots({1.0, -2.0}, 2.0);
    ASSERT_EQ(p.degree(), 2);
    EXPECT_NEAR(p.coefficients()[0], 2.0, 1e-12);
    EXPECT_NEAR(p.coefficients()[1], 2.0, 1e-12);
    EXPECT_NEAR(p.coefficients()[2], -4.0, 1e-12);
    EXPECT_NEAR(p.evaluate(1.0), 0.0, 1e-12);
    EXPECT_NEAR(p.evaluate(-2.0), 0.0, 1e-12);

    // Пустой список корней - константа
    Polynomial c = Polynomial::from_roots({}, 3.5);
    EXPECT_EQ(c.degree(), 0);
    EXPECT_NEAR(c.evaluate(10.0), 3.5, 1e-12);
}

TEST(PolynomialTest, MultiplyLinear) {
    std::cout << "Testing multiplication by a linear factor...\n";

    Polynomial p(std::vector<double>{1.0, 2.0});  // t + 2
    Polynomial product = p.multiply_linear(1.0);  // (t + 2)(t - 1) = t^2 + t - 2
    EXPECT_EQ(product.degree(), 2);
    EXPECT_NEAR(product.evaluate(0.0), -2.0, 1e-10);
    EXPECT_NEAR(product.evaluate(1.0), 0.0, 1e-10);
    EXPECT_NEAR(product.evaluate(2.0), 4.0, 1e-10);
}

TEST(PolynomialTest, HigherDerivatives) {
    std::cout << "Testing k-th derivatives...\n";

    // t^4 - 3t^2 + t
    Polynomial p(std::vector<double>{1.0, 0.0, -3.0, 1.0, 0.0});

    Polynomial d3 = p.differentiate(3);  // 24t
    EXPECT_EQ(d3.degree(), 1);
    EXPECT_NEAR(d3.evaluate(2.0), 48.0, 1e-10);

    Polynomial d4 = p.differentiate(4);
    EXPECT_EQ(d4.degree(), 0);
    EXPECT_NEAR(d4.evaluate(7.0), 24.0, 1e-10);

    // Порядок выше степени - нулевой полином
    Polynomial d5 = p.differentiate(5);
    EXPECT_TRUE(d5.is_zero());
    EXPECT_EQ(p.derivative(1.5, 6), 0.0);

    EXPECT_THROW(p.differentiate(-1), std::invalid_argument);
}

TEST(PolynomialTest, EdgeCases) {
    std::cout << "Testing edge cases...\n";

    // Нулевой полином
    Polynomial zero(0);
    EXPECT_EQ(zero.degree(), 0);
    EXPECT_TRUE(zero.is_zero());
    EXPECT_NEAR(zero.evaluate(5.0), 0.0, 1e-10);

    // Пустой вектор коэффициентов - нулевой полином
    Polynomial empty(std::vector<double>{});
    EXPECT_TRUE(empty.is_zero());

    // Константа
    Polynomial constant(std::vector<double>{5.0});
    EXPECT_EQ(constant.degree(), 0);
    EXPECT_NEAR(constant.evaluate(100.0), 5.0, 1e-10);

    // Ведущие нули отбрасываются, малые коэффициенты сохраняются
    Polynomial leading(std::vector<double>{0.0, 0.0, 1e-20, 1.0});
    EXPECT_EQ(leading.degree(), 1);

    // Очень высокая степень
    std::vector<double> high_degree_coeffs(100, 0.0);
    high_degree_coeffs[0] = 1.0;
    high_degree_coeffs[99] = 1.0;
    Polynomial high(high_degree_coeffs);
    EXPECT_EQ(high.degree(), 99);

    EXPECT_THROW(Polynomial(-1), std::invalid_argument);
}
