#include <gtest/gtest.h>
#include <cmath>
#include <iostream>
#include "difference_interpolation/interpolation.h"
#include "difference_interpolation/interpolator.h"
#include "difference_interpolation/errors.h"

using namespace diff_interp;

static const Scheme kAllSchemes[] = {
    Scheme::LAGRANGE, Scheme::NEWTON_DIVIDED, Scheme::NEWTON_FORWARD,
    Scheme::NEWTON_BACKWARD, Scheme::GAUSS_FORWARD, Scheme::GAUSS_BACKWARD,
    Scheme::STIRLING, Scheme::BESSEL
};

// Равномерная сетка x_i = x0 + i*h с произвольными значениями
static SamplePoints make_uniform(double x0, double h, const std::vector<double>& y) {
    return SamplePoints(x0, h, y);
}

// ===== Примеры из постановки =====

TEST(InterpolationTest, LagrangeMatchesNewtonDivided) {
    std::cout << "Testing Lagrange vs Newton divided on (0,1),(1,2),(2,0),(3,5)...\n";

    SamplePoints points({0.0, 1.0, 2.0, 3.0}, {1.0, 2.0, 0.0, 5.0});

    InterpolationResult lagrange = interpolate(points, 1.5, Scheme::LAGRANGE);
    InterpolationResult newton = interpolate(points, 1.5, Scheme::NEWTON_DIVIDED);

    EXPECT_NEAR(lagrange.value, newton.value, 1e-6);
    // 1 + 1.5 - 1.5*1.5*0.5 + (5/3)*1.5*0.5*(-0.5)
    EXPECT_NEAR(newton.value, 0.75, 1e-12);
    EXPECT_EQ(lagrange.order, 3);
    EXPECT_EQ(newton.order, 3);
}

// ===== Точность в узлах =====

TEST(InterpolationTest, ExactAtNodes) {
    std::cout << "Testing exactness at sample nodes for all schemes...\n";

    std::vector<double> y = {1.3, -0.7, 2.1, 0.4, 3.3, -1.2};
    SamplePoints points = make_uniform(1.0, 0.2, y);

    for (Scheme scheme : kAllSchemes) {
        for (int i = 0; i < points.size(); ++i) {
            InterpolationResult r = interpolate(points, points.x(i), scheme);
            EXPECT_NEAR(r.value, y[i], 1e-9)
                << "scheme " << scheme_name(scheme) << ", node " << i;
        }
    }
}

TEST(InterpolationTest, ExactAtNodesOddCount) {
    std::vector<double> y = {0.5, 2.5, -1.0, 4.0, 1.5, 0.0, 2.0};
    SamplePoints points = make_uniform(-3.0, 0.5, y);

    for (Scheme scheme : kAllSchemes) {
        for (int i = 0; i < points.size(); ++i) {
            InterpolationResult r = interpolate(points, points.x(i), scheme);
            EXPECT_NEAR(r.value, y[i], 1e-9)
                << "scheme " << scheme_name(scheme) << ", node " << i;
        }
    }
}

// ===== Согласие формул =====

TEST(InterpolationTest, SchemesAgreeOddPointCount) {
    std::cout << "Testing agreement of schemes on 7 points...\n";

    std::vector<double> y;
    for (int i = 0; i < 7; ++i) {
        double x = 1.0 + 0.15 * i;
        y.push_back(std::exp(x) * std::cos(x));
    }
    SamplePoints points = make_uniform(1.0, 0.15, y);

    const Scheme schemes[] = {
        Scheme::NEWTON_DIVIDED, Scheme::NEWTON_FORWARD, Scheme::NEWTON_BACKWARD,
        Scheme::GAUSS_FORWARD, Scheme::GAUSS_BACKWARD, Scheme::STIRLING
    };

    for (double x : {1.07, 1.33, 1.5, 1.61, 1.88}) {
        double reference = interpolate(points, x, Scheme::LAGRANGE).value;
        for (Scheme scheme : schemes) {
            InterpolationResult r = interpolate(points, x, scheme);
            EXPECT_EQ(r.order, 6) << scheme_name(scheme);
            EXPECT_NEAR(r.value, reference, 1e-6)
                << "scheme " << scheme_name(scheme) << ", x = " << x;
        }
    }
}

TEST(InterpolationTest, SchemesAgreeEvenPointCount) {
    std::cout << "Testing agreement of schemes on 6 points (Bessel)...\n";

    std::vector<double> y = {2.0, 1.0, 3.5, -0.5, 0.25, 4.0};
    SamplePoints points = make_uniform(0.0, 1.0, y);

    const Scheme schemes[] = {
        Scheme::NEWTON_DIVIDED, Scheme::NEWTON_FORWARD, Scheme::NEWTON_BACKWARD,
        Scheme::GAUSS_FORWARD, Scheme::GAUSS_BACKWARD, Scheme::BESSEL
    };

    for (double x : {0.4, 1.5, 2.5, 3.2, 4.7}) {
        double reference = interpolate(points, x, Scheme::LAGRANGE).value;
        for (Scheme scheme : schemes) {
            InterpolationResult r = interpolate(points, x, scheme);
            EXPECT_EQ(r.order, 5) << scheme_name(scheme);
            EXPECT_NEAR(r.value, reference, 1e-6)
                << "scheme " << scheme_name(scheme) << ", x = " << x;
        }
    }
}

TEST(InterpolationTest, LowerOrderReproducesCubic) {
    std::cout << "Testing order-3 formulas on cubic data...\n";

    // f(x) = 2x^3 - x + 1: любая формула порядка 3 воспроизводит f точно
    std::vector<double> y;
    for (int i = 0; i < 8; ++i) {
        double x = -1.0 + 0.5 * i;
        y.push_back(2.0 * x * x * x - x + 1.0);
    }
    SamplePoints points = make_uniform(-1.0, 0.5, y);

    for (Scheme scheme : kAllSchemes) {
        for (double x : {-0.8, 0.1, 0.37, 1.26, 2.4}) {
            double exact = 2.0 * x * x * x - x + 1.0;
            InterpolationResult r = interpolate(points, x, scheme, 3);
            EXPECT_EQ(r.order, 3);
            EXPECT_NEAR(r.value, exact, 1e-9)
                << "scheme " << scheme_name(scheme) << ", x = " << x;
        }
    }
}

TEST(InterpolationTest, DecreasingUniformGrid) {
    std::cout << "Testing equal-step schemes on a decreasing grid...\n";

    SamplePoints points({3.0, 2.0, 1.0, 0.0}, {5.0, 0.0, 2.0, 1.0});

    for (Scheme scheme : {Scheme::NEWTON_FORWARD, Scheme::NEWTON_BACKWARD,
                          Scheme::GAUSS_FORWARD, Scheme::BESSEL}) {
        InterpolationResult r = interpolate(points, 1.5, scheme);
        EXPECT_NEAR(r.value, 0.75, 1e-12) << scheme_name(scheme);
    }
}

TEST(InterpolationTest, NonUniformGrid) {
    std::cout << "Testing Lagrange and Newton divided on a non-uniform grid...\n";

    // f(x) = x^2 + 1 на неравномерной сетке
    SamplePoints points({0.0, 0.3, 1.1, 2.0, 3.7}, {1.0, 1.09, 2.21, 5.0, 14.69});

    for (double x : {0.5, 1.7, 3.0}) {
        EXPECT_NEAR(interpolate(points, x, Scheme::LAGRANGE).value, x * x + 1.0, 1e-9);
        EXPECT_NEAR(interpolate(points, x, Scheme::NEWTON_DIVIDED).value, x * x + 1.0, 1e-9);
    }

    for (Scheme scheme : {Scheme::NEWTON_FORWARD, Scheme::NEWTON_BACKWARD, Scheme::GAUSS_FORWARD,
                          Scheme::GAUSS_BACKWARD, Scheme::STIRLING, Scheme::BESSEL}) {
        EXPECT_THROW(interpolate(points, 1.0, scheme), InvalidSpacingError) << scheme_name(scheme);
    }
}

// ===== Ошибки и разбор имён =====

TEST(InterpolationTest, InvalidOrder) {
    std::cout << "Testing invalid interpolation orders...\n";

    SamplePoints points({0.0, 1.0, 2.0}, {1.0, 2.0, 0.0});
    for (Scheme scheme : kAllSchemes) {
        EXPECT_THROW(interpolate(points, 0.5, scheme, 3), InsufficientPointsError)
            << scheme_name(scheme);
        EXPECT_THROW(interpolate(points, 0.5, scheme, -5), std::invalid_argument)
            << scheme_name(scheme);
    }
}

TEST(InterpolationTest, DuplicateNodes) {
    SamplePoints points({0.0, 1.0, 1.0}, {1.0, 2.0, 3.0});
    EXPECT_THROW(interpolate(points, 0.5, Scheme::LAGRANGE), DomainError);
    EXPECT_THROW(interpolate(points, 0.5, Scheme::NEWTON_DIVIDED), DomainError);
}

TEST(InterpolationTest, SchemeNames) {
    std::cout << "Testing scheme name parsing...\n";

    for (Scheme scheme : kAllSchemes) {
        EXPECT_EQ(parse_scheme(scheme_name(scheme)), scheme);
    }
    EXPECT_EQ(parse_scheme("Gauss-Forward"), Scheme::GAUSS_FORWARD);
    EXPECT_EQ(parse_scheme("NEWTON BACKWARD"), Scheme::NEWTON_BACKWARD);
    EXPECT_EQ(parse_scheme("newton"), Scheme::NEWTON_DIVIDED);
    EXPECT_THROW(parse_scheme("hermite"), std::invalid_argument);
}

// ===== Вычисление по готовой таблице =====

TEST(InterpolationTest, TableEvaluators) {
    std::cout << "Testing per-scheme table evaluators...\n";

    SamplePoints points = make_uniform(0.0, 1.0, {1.0, 2.0, 0.0, 5.0, 3.0});
    DifferenceTable finite = DifferenceTable::build_forward(points);
    DifferenceTable divided = DifferenceTable::build_divided(points);

    double reference = evaluate_lagrange(points, 2.3).value;
    EXPECT_NEAR(evaluate_lagrange(divided, 2.3).value, reference, 1e-9);
    EXPECT_NEAR(evaluate_newton_divided(divided, 2.3).value, reference, 1e-9);
    EXPECT_NEAR(evaluate_newton_forward(finite, 2.3).value, reference, 1e-9);
    EXPECT_NEAR(evaluate_newton_backward(finite, 2.3).value, reference, 1e-9);
    EXPECT_NEAR(evaluate_gauss_forward(finite, 2.3).value, reference, 1e-9);
    EXPECT_NEAR(evaluate_gauss_backward(finite, 2.3).value, reference, 1e-9);
    EXPECT_NEAR(evaluate_stirling(finite, 2.3).value, reference, 1e-9);

    // Бессель на 5 узлах понижает порядок до 3
    InterpolationResult bessel = evaluate_bessel(finite, 2.3);
    EXPECT_EQ(bessel.order, 3);
    EXPECT_EQ(bessel.base_index, 2);
    EXPECT_EQ(bessel.scheme, Scheme::BESSEL);

    // Равномерная схема по таблице разделённых разностей недопустима
    EXPECT_THROW(evaluate_stirling(divided, 2.3), std::invalid_argument);

    // Ньютон с разделёнными разностями допускает таблицу конечных разностей
    EXPECT_NEAR(evaluate_newton_divided(finite, 2.3).value, reference, 1e-9);
    EXPECT_NEAR(evaluate_newton_divided(finite, 2.3, 2).value,
                evaluate_newton_divided(divided, 2.3, 2).value, 1e-12);
    EXPECT_NEAR(evaluate(finite, 2.3, Scheme::LAGRANGE).value, reference, 1e-9);

    // Порядок 1 Ньютона вперёд - линейная интерполяция по x_0, x_1
    EXPECT_NEAR(evaluate_newton_forward(finite, 0.5, 1).value, 1.5, 1e-12);
}

// ===== Интерполятор =====

TEST(InterpolatorTest, CachedTables) {
    std::cout << "Testing Interpolator facade...\n";

    SamplePoints points = make_uniform(0.0, 0.5, {1.0, 1.5, 0.5, 2.0, 2.5});
    Interpolator interpolator(points);

    EXPECT_TRUE(interpolator.is_equally_spaced());
    EXPECT_EQ(interpolator.divided_table().kind(), DifferenceKind::DIVIDED);
    EXPECT_TRUE(interpolator.finite_table().is_fixed_step());
    EXPECT_EQ(&interpolator.table_for(Scheme::STIRLING), &interpolator.finite_table());
    EXPECT_EQ(&interpolator.table_for(Scheme::LAGRANGE), &interpolator.divided_table());

    std::vector<InterpolationResult> results =
        interpolator.evaluate(std::vector<double>{0.1, 0.7, 1.9}, Scheme::GAUSS_BACKWARD);
    ASSERT_EQ(results.size(), 3u);
    for (size_t i = 0; i < results.size(); ++i) {
        double x = std::vector<double>{0.1, 0.7, 1.9}[i];
        EXPECT_NEAR(results[i].value, interpolate(points, x, Scheme::LAGRANGE).value, 1e-9);
    }

    EXPECT_NE(interpolator.get_info().find("equally_spaced=yes"), std::string::npos);
}

TEST(InterpolatorTest, IrregularGrid) {
    SamplePoints points({0.0, 1.0, 3.0}, {1.0, 2.0, 4.0});
    Interpolator interpolator(points);

    EXPECT_FALSE(interpolator.is_equally_spaced());
    EXPECT_THROW(interpolator.finite_table(), InvalidSpacingError);
    EXPECT_THROW(interpolator.evaluate(1.5, Scheme::BESSEL), InvalidSpacingError);
    EXPECT_NO_THROW(interpolator.evaluate(1.5, Scheme::NEWTON_DIVIDED));

    SamplePoints duplicates({0.0, 1.0, 1.0}, {1.0, 2.0, 4.0});
    EXPECT_THROW(Interpolator bad(duplicates), DomainError);
}
