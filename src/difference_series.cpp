#include "difference_interpolation/difference_series.h"
#include <stdexcept>
#include <string>

namespace diff_interp {

namespace {

double factorial(int k) {
    double result = 1.0;
    for (int i = 2; i <= k; ++i) {
        result *= static_cast<double>(i);
    }
    return result;
}

// Корни множителя G_{2j}(s) = (s + j - 1)...(s)(s - 1)...(s - j) формулы Бесселя
void append_bessel_roots(std::vector<double>& roots, int j) {
    for (int i = -(j - 1); i <= j; ++i) {
        roots.push_back(static_cast<double>(i));
    }
}

// Корни ±1, ..., ±m (множители s^2 - i^2)
void append_symmetric_roots(std::vector<double>& roots, int m) {
    for (int i = 1; i <= m; ++i) {
        roots.push_back(static_cast<double>(i));
        roots.push_back(static_cast<double>(-i));
    }
}

SeriesTerm newton_divided_term(const DifferenceTable& table, int p, int k) {
    std::vector<double> roots;
    roots.reserve(k);
    for (int j = 0; j < k; ++j) {
        roots.push_back(table.node(p + j) - table.node(p));
    }
    return SeriesTerm(table.divided_difference(k, p), roots);
}

// s(s-1)...(s-k+1)/k! * Δ^k y_p
SeriesTerm newton_forward_term(const DifferenceTable& table, int p, int k) {
    std::vector<double> roots;
    for (int j = 0; j < k; ++j) {
        roots.push_back(static_cast<double>(j));
    }
    return SeriesTerm(table.at(k, p) / factorial(k), roots);
}

// s(s+1)...(s+k-1)/k! * ∇^k y_p
SeriesTerm newton_backward_term(const DifferenceTable& table, int p, int k) {
    std::vector<double> roots;
    for (int j = 0; j < k; ++j) {
        roots.push_back(-static_cast<double>(j));
    }
    return SeriesTerm(table.at(k, p - k) / factorial(k), roots);
}

// Множители s, (s-1), (s+1), (s-2), (s+2), ...; разность Δ^k y_{p - floor(k/2)}
SeriesTerm gauss_forward_term(const DifferenceTable& table, int p, int k) {
    std::vector<double> roots;
    for (int i = 1; i <= k; ++i) {
        roots.push_back(i % 2 == 0 ? static_cast<double>(i / 2) : -static_cast<double>(i / 2));
    }
    return SeriesTerm(table.at(k, p - k / 2) / factorial(k), roots);
}

// Множители s, (s+1), (s-1), (s+2), (s-2), ...; разность Δ^k y_{p - ceil(k/2)}
SeriesTerm gauss_backward_term(const DifferenceTable& table, int p, int k) {
    std::vector<double> roots;
    for (int i = 1; i <= k; ++i) {
        roots.push_back(i % 2 == 0 ? -static_cast<double>(i / 2) : static_cast<double>(i / 2));
    }
    return SeriesTerm(table.at(k, p - (k + 1) / 2) / factorial(k), roots);
}

SeriesTerm stirling_term(const DifferenceTable& table, int p, int k) {
    int j = k / 2;
    std::vector<double> roots;
    if (k % 2 == 1) {
        // s(s^2-1)...(s^2-j^2)/k! * (Δ^k y_{p-j-1} + Δ^k y_{p-j})/2
        roots.push_back(0.0);
        append_symmetric_roots(roots, j);
        double mean = 0.5 * (table.at(k, p - j - 1) + table.at(k, p - j));
        return SeriesTerm(mean / factorial(k), roots);
    }
    // s^2(s^2-1)...(s^2-(j-1)^2)/k! * Δ^k y_{p-j}
    roots.push_back(0.0);
    roots.push_back(0.0);
    append_symmetric_roots(roots, j - 1);
    return SeriesTerm(table.at(k, p - j) / factorial(k), roots);
}

SeriesTerm bessel_term(const DifferenceTable& table, int p, int k) {
    int j = k / 2;
    std::vector<double> roots;
    if (k % 2 == 1) {
        // (s - 1/2) G_{2j}(s)/k! * Δ^k y_{p-j}
        roots.push_back(0.5);
        append_bessel_roots(roots, j);
        return SeriesTerm(table.at(k, p - j) / factorial(k), roots);
    }
    // G_{2j}(s)/k! * (Δ^k y_{p-j} + Δ^k y_{p-j+1})/2
    append_bessel_roots(roots, j);
    double mean = 0.5 * (table.at(k, p - j) + table.at(k, p - j + 1));
    return SeriesTerm(mean / factorial(k), roots);
}

} // namespace

double SeriesTerm::evaluate(double t) const {
    double product = coefficient;
    for (double r : roots) {
        product *= (t - r);
    }
    return product;
}

Polynomial SeriesTerm::to_polynomial() const {
    return Polynomial::from_roots(roots, coefficient);
}

SeriesTerm DifferenceSeries::term(const DifferenceTable& table, Scheme scheme, int base, int k) {
    if (k < 0) {
        throw std::invalid_argument("Series term order must be non-negative");
    }

    if (k == 0) {
        if (scheme == Scheme::BESSEL) {
            return SeriesTerm(0.5 * (table.value(base) + table.value(base + 1)), {});
        }
        return SeriesTerm(table.value(base), {});
    }

    switch (scheme) {
        case Scheme::NEWTON_DIVIDED:  return newton_divided_term(table, base, k);
        case Scheme::NEWTON_FORWARD:  return newton_forward_term(table, base, k);
        case Scheme::NEWTON_BACKWARD: return newton_backward_term(table, base, k);
        case Scheme::GAUSS_FORWARD:   return gauss_forward_term(table, base, k);
        case Scheme::GAUSS_BACKWARD:  return gauss_backward_term(table, base, k);
        case Scheme::STIRLING:        return stirling_term(table, base, k);
        case Scheme::BESSEL:          return bessel_term(table, base, k);
        case Scheme::LAGRANGE:
            break;
    }
    throw std::invalid_argument("Lagrange formula is not a difference series");
}

DifferenceSeries DifferenceSeries::build(const DifferenceTable& table, const NodeSelection& selection) {
    DifferenceSeries series;
    series.terms_.reserve(selection.order + 1);
    for (int k = 0; k <= selection.order; ++k) {
        series.terms_.push_back(term(table, selection.scheme, selection.base_index, k));
    }
    return series;
}

double DifferenceSeries::evaluate(double t) const {
    double result = 0.0;
    for (const auto& term : terms_) {
        result += term.evaluate(t);
    }
    return result;
}

Polynomial DifferenceSeries::to_polynomial() const {
    Polynomial result(0);
    for (const auto& term : terms_) {
        result += term.to_polynomial();
    }
    return result;
}

double DifferenceSeries::derivative(double t, int k) const {
    if (k == 0) return evaluate(t);
    if (k > order()) return 0.0;
    return to_polynomial().derivative(t, k);
}

} // namespace diff_interp
