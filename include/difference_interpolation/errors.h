#ifndef DIFFERENCE_INTERPOLATION_ERRORS_H
#define DIFFERENCE_INTERPOLATION_ERRORS_H

#include <stdexcept>
#include <string>

namespace diff_interp {

/**
 * @brief Узлы не образуют равномерную сетку, а схема требует постоянного шага h
 */
class InvalidSpacingError : public std::invalid_argument {
public:
    explicit InvalidSpacingError(const std::string& message)
        : std::invalid_argument(message) {}
};

/**
 * @brief Точек меньше, чем требует запрошенный порядок интерполяции
 */
class InsufficientPointsError : public std::invalid_argument {
public:
    explicit InsufficientPointsError(const std::string& message)
        : std::invalid_argument(message) {}
};

/**
 * @brief Деление на ноль в относительной оценке или совпадающие узлы
 *        в таблице разделённых разностей
 */
class DomainError : public std::domain_error {
public:
    explicit DomainError(const std::string& message)
        : std::domain_error(message) {}
};

} // namespace diff_interp

#endif // DIFFERENCE_INTERPOLATION_ERRORS_H
