#include <iostream>
#include <string>
#include "difference_interpolation/difference_interpolation.h"

using namespace diff_interp;

int main(int argc, char** argv) {
    try {
        std::cout << "=== Difference Interpolation: Reading from Files Example ===\n\n";

        // Путь к конфигурационному файлу YAML
        std::string config_path = argc > 1 ? argv[1] : "data/task.yaml";

        std::cout << "Reading task from: " << config_path << "\n\n";

        InterpolationTask task = ConfigReader::read_from_yaml(config_path);

        std::cout << "Task loaded successfully!\n";
        std::cout << "  Name: " << task.name << "\n";
        std::cout << "  Scheme: " << scheme_name(task.scheme) << "\n";
        std::cout << "  Points: " << task.x_values.size() << "\n";
        std::cout << "  Queries: " << task.query_points.size() << "\n\n";

        // Валидация задачи
        std::cout << "Validating task...\n";
        std::string validation_error = Validator::validate(task);
        if (!validation_error.empty()) {
            std::cerr << "Task validation failed:\n" << validation_error << std::endl;
            return 1;
        }
        std::cout << "Task is valid!\n\n";

        std::cout << format_task_report(task);

        // Сохранение задачи в простом текстовом формате
        std::string output_path = "task_copy.txt";
        ConfigReader::write_to_file(task, output_path);
        std::cout << "\nTask written to: " << output_path << "\n";

        InterpolationTask reloaded = ConfigReader::read_from_file(output_path);
        std::cout << "Reloaded points: " << reloaded.x_values.size() << "\n";

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
