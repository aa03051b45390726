#include <gtest/gtest.h>
#include <cmath>
#include <iostream>
#include "difference_interpolation/interpolation.h"
#include "difference_interpolation/interpolator.h"

using namespace diff_interp;

static const Scheme kAllSchemes[] = {
    Scheme::LAGRANGE, Scheme::NEWTON_DIVIDED, Scheme::NEWTON_FORWARD,
    Scheme::NEWTON_BACKWARD, Scheme::GAUSS_FORWARD, Scheme::GAUSS_BACKWARD,
    Scheme::STIRLING, Scheme::BESSEL
};

// f(x) = 2x^3 - x + 1 на сетке -1, -0.5, ..., 2.5
static SamplePoints make_cubic_points() {
    std::vector<double> y;
    for (int i = 0; i < 8; ++i) {
        double x = -1.0 + 0.5 * i;
        y.push_back(2.0 * x * x * x - x + 1.0);
    }
    return SamplePoints(-1.0, 0.5, y);
}

TEST(DerivativeTest, NewtonForwardSlope) {
    std::cout << "Testing Newton forward order-1 derivative...\n";

    SamplePoints points({0.0, 1.0, 2.0, 3.0}, {1.0, 2.0, 0.0, 5.0});

    // Линейный член: (y_1 - y_0)/h
    double d = derivative(points, 1.0, 1, Scheme::NEWTON_FORWARD, 1);
    EXPECT_NEAR(d, 1.0, 1e-12);
}

TEST(DerivativeTest, LinearDataWithStepScaling) {
    std::cout << "Testing chain factor 1/h^k...\n";

    // y = 3x + 2 при h = 0.25
    std::vector<double> y;
    for (int i = 0; i < 6; ++i) {
        y.push_back(3.0 * (0.25 * i) + 2.0);
    }
    SamplePoints points(0.0, 0.25, y);

    for (Scheme scheme : kAllSchemes) {
        EXPECT_NEAR(derivative(points, 0.6, 1, scheme), 3.0, 1e-9) << scheme_name(scheme);
        EXPECT_NEAR(derivative(points, 0.6, 2, scheme), 0.0, 1e-8) << scheme_name(scheme);
    }
}

TEST(DerivativeTest, CubicDerivatives) {
    std::cout << "Testing derivatives of cubic data...\n";

    SamplePoints points = make_cubic_points();
    Interpolator interpolator(points);

    for (Scheme scheme : kAllSchemes) {
        for (double x : {-0.3, 0.4, 1.1, 2.2}) {
            EXPECT_NEAR(interpolator.derivative(x, 1, scheme, 3), 6.0 * x * x - 1.0, 1e-8)
                << "f', scheme " << scheme_name(scheme) << ", x = " << x;
            EXPECT_NEAR(interpolator.derivative(x, 2, scheme, 3), 12.0 * x, 1e-8)
                << "f'', scheme " << scheme_name(scheme) << ", x = " << x;
            EXPECT_NEAR(interpolator.derivative(x, 3, scheme, 3), 12.0, 1e-8)
                << "f''', scheme " << scheme_name(scheme) << ", x = " << x;
        }
    }
}

TEST(DerivativeTest, BeyondOrderIsExactlyZero) {
    std::cout << "Testing derivative orders above the polynomial degree...\n";

    SamplePoints points({0.0, 1.0, 2.0, 3.0}, {1.0, 2.0, 0.0, 5.0});

    for (Scheme scheme : kAllSchemes) {
        EXPECT_EQ(derivative(points, 1.3, 4, scheme), 0.0) << scheme_name(scheme);
        EXPECT_EQ(derivative(points, 1.3, 7, scheme), 0.0) << scheme_name(scheme);
        EXPECT_EQ(derivative(points, 1.3, 2, scheme, 1), 0.0) << scheme_name(scheme);
    }
}

TEST(DerivativeTest, ZeroOrderIsValue) {
    SamplePoints points({0.0, 1.0, 2.0, 3.0}, {1.0, 2.0, 0.0, 5.0});

    for (Scheme scheme : kAllSchemes) {
        EXPECT_NEAR(derivative(points, 1.5, 0, scheme), interpolate(points, 1.5, scheme).value, 1e-12)
            << scheme_name(scheme);
    }
}

TEST(DerivativeTest, NegativeOrderThrows) {
    SamplePoints points({0.0, 1.0, 2.0}, {1.0, 2.0, 0.0});

    for (Scheme scheme : kAllSchemes) {
        EXPECT_THROW(derivative(points, 0.5, -1, scheme), std::invalid_argument) << scheme_name(scheme);
    }
}

TEST(DerivativeTest, SmoothFunction) {
    std::cout << "Testing derivatives of sin(x) on a fine grid...\n";

    std::vector<double> y;
    for (int i = 0; i < 9; ++i) {
        y.push_back(std::sin(0.1 * i));
    }
    SamplePoints points(0.0, 0.1, y);
    Interpolator interpolator(points);

    double x = 0.43;
    for (Scheme scheme : {Scheme::STIRLING, Scheme::GAUSS_FORWARD, Scheme::NEWTON_DIVIDED}) {
        EXPECT_NEAR(interpolator.derivative(x, 1, scheme), std::cos(x), 1e-6) << scheme_name(scheme);
        EXPECT_NEAR(interpolator.derivative(x, 2, scheme), -std::sin(x), 1e-5) << scheme_name(scheme);
    }

    // Стирлинг порядка 4 на узлах 0.2..0.6: погрешность производной порядка h^4
    EXPECT_NEAR(interpolator.derivative(x, 1, Scheme::STIRLING, 4), std::cos(x), 1e-5);
}

TEST(DerivativeTest, IrregularGrid) {
    std::cout << "Testing Newton divided and Lagrange derivatives on a non-uniform grid...\n";

    // f(x) = x^3
    std::vector<double> x = {0.0, 0.4, 1.0, 1.9, 3.0};
    std::vector<double> y;
    for (double xi : x) {
        y.push_back(xi * xi * xi);
    }
    SamplePoints points(x, y);

    for (double q : {0.7, 1.5, 2.6}) {
        EXPECT_NEAR(derivative(points, q, 1, Scheme::NEWTON_DIVIDED), 3.0 * q * q, 1e-9);
        EXPECT_NEAR(derivative(points, q, 1, Scheme::LAGRANGE), 3.0 * q * q, 1e-9);
        EXPECT_NEAR(derivative(points, q, 2, Scheme::NEWTON_DIVIDED), 6.0 * q, 1e-9);
        EXPECT_NEAR(derivative(points, q, 2, Scheme::LAGRANGE), 6.0 * q, 1e-9);
        EXPECT_NEAR(lagrange_derivative(points, q, 3), 6.0, 1e-9);
    }
}
