#include "difference_interpolation/polynomial.h"
#include <stdexcept>
#include <algorithm>

namespace diff_interp {

Polynomial::Polynomial(const std::vector<double>& coeffs)
    : coeffs_(coeffs) {
    if (coeffs_.empty()) {
        coeffs_.push_back(0.0);
    }
    strip_leading_zeros();
}

Polynomial::Polynomial(int degree)
    : degree_(degree) {
    if (degree < 0) {
        throw std::invalid_argument("Polynomial degree must be non-negative");
    }
    coeffs_.assign(degree + 1, 0.0);
}

void Polynomial::strip_leading_zeros() {
    // Удаляем ведущие нули (только точные: малые коэффициенты значимы после масштабирования)
    while (coeffs_.size() > 1 && coeffs_.front() == 0.0) {
        coeffs_.erase(coeffs_.begin());
    }
    degree_ = static_cast<int>(coeffs_.size()) - 1;
}

Polynomial Polynomial::from_roots(const std::vector<double>& roots, double leading) {
    Polynomial result(std::vector<double>{leading});
    for (double r : roots) {
        result = result.multiply_linear(r);
    }
    return result;
}

double Polynomial::evaluate(double t) const {
    // Схема Горнера для численной устойчивости
    double result = 0.0;
    for (double coeff : coeffs_) {
        result = result * t + coeff;
    }
    return result;
}

Polynomial Polynomial::differentiate(int order) const {
    if (order < 0) {
        throw std::invalid_argument("Derivative order must be non-negative");
    }
    if (order == 0) return *this;
    if (order > degree_) return Polynomial(0);

    // coeffs_[i] соответствует степени n - i; после order дифференцирований
    // остаются коэффициенты при степенях n..order с множителем p!/(p-order)!
    int n = degree_;
    std::vector<double> result(n - order + 1, 0.0);
    for (int i = 0; i <= n - order; ++i) {
        int power = n - i;
        double factor = 1.0;
        for (int j = 0; j < order; ++j) {
            factor *= static_cast<double>(power - j);
        }
        result[i] = coeffs_[i] * factor;
    }
    return Polynomial(result);
}

double Polynomial::derivative(double t, int order) const {
    return differentiate(order).evaluate(t);
}

Polynomial Polynomial::multiply_linear(double root) const {
    // P(t)*(t - r): сдвиг коэффициентов влево и вычитание r*P(t)
    std::vector<double> result(coeffs_.size() + 1, 0.0);
    for (size_t k = 0; k < coeffs_.size(); ++k) {
        result[k] += coeffs_[k];
        result[k + 1] -= root * coeffs_[k];
    }
    return Polynomial(result);
}

bool Polynomial::is_zero() const {
    return std::all_of(coeffs_.begin(), coeffs_.end(), [](double c) { return c == 0.0; });
}

Polynomial Polynomial::operator+(const Polynomial& other) const {
    Polynomial result(*this);
    result += other;
    return result;
}

Polynomial Polynomial::operator-(const Polynomial& other) const {
    return *this + other * -1.0;
}

Polynomial Polynomial::operator*(double scalar) const {
    std::vector<double> result_coeffs = coeffs_;
    for (double& coeff : result_coeffs) {
        coeff *= scalar;
    }
    return Polynomial(result_coeffs);
}

Polynomial& Polynomial::operator+=(const Polynomial& other) {
    // Выравнивание по младшим степеням: коэффициент при t^k находится на позиции (degree - k)
    const std::vector<double>& rhs = other.coeffs_;
    if (rhs.size() > coeffs_.size()) {
        coeffs_.insert(coeffs_.begin(), rhs.size() - coeffs_.size(), 0.0);
    }
    size_t offset = coeffs_.size() - rhs.size();
    for (size_t i = 0; i < rhs.size(); ++i) {
        coeffs_[offset + i] += rhs[i];
    }
    strip_leading_zeros();
    return *this;
}

} // namespace diff_interp
