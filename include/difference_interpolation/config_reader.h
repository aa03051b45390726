#ifndef DIFFERENCE_INTERPOLATION_CONFIG_READER_H
#define DIFFERENCE_INTERPOLATION_CONFIG_READER_H

#include "types.h"
#include "sample_points.h"
#include <string>
#include <vector>

namespace diff_interp {

/**
 * @brief Класс для чтения и записи задач интерполяции
 *
 * Поддерживаемые форматы:
 * 1. YAML конфигурация (данные в самом файле или в CSV)
 * 2. Простой текстовый формат "ключ = значение"
 */
class ConfigReader {
public:
    /**
     * @brief Чтение задачи из YAML файла
     *
     * Формат YAML:
     * - task: name
     * - interpolation: scheme, order, derivative_order, spacing_tolerance, estimate_error
     * - data: {x, y} | {x0, step, y} | {csv} (относительный путь - от каталога YAML файла)
     * - queries: список точек вычисления
     *
     * @param yaml_filename путь к YAML файлу
     * @return структура InterpolationTask
     * @throws std::runtime_error при ошибке чтения или парсинга
     */
    static InterpolationTask read_from_yaml(const std::string& yaml_filename);

    /**
     * @brief Чтение задачи из простого текстового файла
     * @param filename путь к файлу
     * @throws std::runtime_error при ошибке чтения или парсинга
     */
    static InterpolationTask read_from_file(const std::string& filename);

    /**
     * @brief Запись задачи в простой текстовый файл
     * @throws std::runtime_error при ошибке записи
     */
    static void write_to_file(const InterpolationTask& task, const std::string& filename);

    /**
     * @brief Чтение точек из CSV файла (колонки x,y)
     *
     * Разделитель (',', ';', табуляция) определяется по первой значимой строке,
     * заголовок необязателен, строки с '#' пропускаются.
     */
    static SamplePoints read_points_csv(const std::string& filename);

private:
    static bool parse_key_value(const std::string& line, std::string& key, std::string& value);
    static bool is_comment_or_empty(const std::string& line);
    static std::string trim(const std::string& str);
    static char detect_csv_delimiter(const std::string& sample_line);
    static bool has_csv_header(const std::string& line, char delimiter);
    static bool parse_bool(const std::string& value);
};

} // namespace diff_interp

#endif // DIFFERENCE_INTERPOLATION_CONFIG_READER_H
