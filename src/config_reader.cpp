#include "difference_interpolation/config_reader.h"
#include "difference_interpolation/interpolation.h"
#include <yaml-cpp/yaml.h>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace diff_interp {

std::string ConfigReader::trim(const std::string& str) {
    size_t start = str.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = str.find_last_not_of(" \t\r\n");
    return str.substr(start, end - start + 1);
}

bool ConfigReader::is_comment_or_empty(const std::string& line) {
    std::string trimmed = trim(line);
    return trimmed.empty() || trimmed[0] == '#';
}

bool ConfigReader::parse_key_value(const std::string& line, std::string& key, std::string& value) {
    std::string trimmed = trim(line);
    size_t equals_pos = trimmed.find('=');
    if (equals_pos == std::string::npos) {
        return false;
    }

    key = trim(trimmed.substr(0, equals_pos));
    value = trim(trimmed.substr(equals_pos + 1));
    return !key.empty();
}

bool ConfigReader::parse_bool(const std::string& value) {
    std::string v;
    for (char c : value) {
        v.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    if (v == "true" || v == "yes" || v == "1") return true;
    if (v == "false" || v == "no" || v == "0") return false;
    throw std::runtime_error("Invalid boolean value: '" + value + "'");
}

char ConfigReader::detect_csv_delimiter(const std::string& sample_line) {
    // Подсчитываем возможные разделители
    int comma_count = 0, semicolon_count = 0, tab_count = 0;
    for (char c : sample_line) {
        if (c == ',') comma_count++;
        else if (c == ';') semicolon_count++;
        else if (c == '\t') tab_count++;
    }

    // Выбираем самый частый
    if (comma_count >= semicolon_count && comma_count >= tab_count) return ',';
    if (semicolon_count >= comma_count && semicolon_count >= tab_count) return ';';
    return '\t';
}

bool ConfigReader::has_csv_header(const std::string& line, char delimiter) {
    std::istringstream iss(trim(line));
    std::string token;
    std::getline(iss, token, delimiter);
    token = trim(token);

    // Первый токен не число - это заголовок
    const char* begin = token.c_str();
    char* end = nullptr;
    std::strtod(begin, &end);
    return token.empty() || end == begin || *end != '\0';
}

SamplePoints ConfigReader::read_points_csv(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open points CSV file: " + filename);
    }

    std::vector<double> xs, ys;
    std::string line;
    int line_number = 0;
    bool header_processed = false;
    char delimiter = ',';

    while (std::getline(file, line)) {
        line_number++;
        line = trim(line);

        if (line.empty() || line[0] == '#') {
            continue;
        }

        // Обработка первой значимой строки (заголовка или данных)
        if (!header_processed) {
            delimiter = detect_csv_delimiter(line);
            header_processed = true;
            if (has_csv_header(line, delimiter)) {
                continue;
            }
        }

        std::istringstream iss(line);
        std::string x_str, y_str;

        if (!std::getline(iss, x_str, delimiter) ||
            !std::getline(iss, y_str, delimiter)) {
            throw std::runtime_error("Missing required columns at line " + std::to_string(line_number));
        }

        try {
            xs.push_back(std::stod(trim(x_str)));
            ys.push_back(std::stod(trim(y_str)));
        } catch (const std::exception& e) {
            throw std::runtime_error("Invalid numeric value at line " + std::to_string(line_number) + ": " + e.what());
        }
    }

    try {
        return SamplePoints(xs, ys);
    } catch (const std::invalid_argument& e) {
        throw std::runtime_error("Invalid point data in " + filename + ": " + e.what());
    }
}

InterpolationTask ConfigReader::read_from_yaml(const std::string& yaml_filename) {
    InterpolationTask task;

    try {
        YAML::Node yaml_config = YAML::LoadFile(yaml_filename);

        if (!yaml_config["interpolation"]) {
            throw std::runtime_error("Missing 'interpolation' section in YAML config");
        }
        if (!yaml_config["data"]) {
            throw std::runtime_error("Missing 'data' section in YAML config");
        }

        if (yaml_config["task"]) {
            task.name = yaml_config["task"]["name"].as<std::string>(task.name);
        }

        const YAML::Node& interp = yaml_config["interpolation"];
        if (interp["scheme"]) {
            task.scheme = parse_scheme(interp["scheme"].as<std::string>());
        }
        task.order = interp["order"].as<int>(task.order);
        task.derivative_order = interp["derivative_order"].as<int>(task.derivative_order);
        task.spacing_tolerance = interp["spacing_tolerance"].as<double>(task.spacing_tolerance);
        task.estimate_error = interp["estimate_error"].as<bool>(task.estimate_error);

        // Загрузка данных: CSV, равномерная сетка или явные списки
        const YAML::Node& data = yaml_config["data"];
        if (data["csv"]) {
            std::filesystem::path csv_path(data["csv"].as<std::string>());
            if (csv_path.is_relative()) {
                csv_path = std::filesystem::path(yaml_filename).parent_path() / csv_path;
            }
            SamplePoints points = read_points_csv(csv_path.string());
            task.x_values = points.x_values();
            task.y_values = points.y_values();
        } else if (data["x0"]) {
            if (!data["step"] || !data["y"]) {
                throw std::runtime_error("Equally spaced data requires 'x0', 'step' and 'y'");
            }
            double x0 = data["x0"].as<double>();
            double step = data["step"].as<double>();
            task.y_values = data["y"].as<std::vector<double>>();
            task.x_values.reserve(task.y_values.size());
            for (size_t i = 0; i < task.y_values.size(); ++i) {
                task.x_values.push_back(x0 + static_cast<double>(i) * step);
            }
        } else {
            if (!data["x"] || !data["y"]) {
                throw std::runtime_error("Data section requires 'x' and 'y' lists");
            }
            task.x_values = data["x"].as<std::vector<double>>();
            task.y_values = data["y"].as<std::vector<double>>();
        }

        if (yaml_config["queries"]) {
            task.query_points = yaml_config["queries"].as<std::vector<double>>();
        }

    } catch (const YAML::Exception& e) {
        throw std::runtime_error("YAML parsing error: " + std::string(e.what()));
    } catch (const std::invalid_argument& e) {
        throw std::runtime_error("Invalid value in " + yaml_filename + ": " + e.what());
    }

    return task;
}

InterpolationTask ConfigReader::read_from_file(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open file: " + filename);
    }

    InterpolationTask task;
    std::string line;
    int line_number = 0;

    // Ожидание строк данных после счётчиков
    bool expecting_points = false;
    bool expecting_queries = false;
    int remaining = 0;

    while (std::getline(file, line)) {
        line_number++;
        line = trim(line);

        if (is_comment_or_empty(line)) {
            continue;
        }

        if (expecting_points) {
            if (remaining > 0) {
                std::istringstream iss(line);
                double x, y;
                if (iss >> x >> y) {
                    task.x_values.push_back(x);
                    task.y_values.push_back(y);
                    remaining--;
                } else {
                    throw std::runtime_error("Invalid point format at line " + std::to_string(line_number));
                }
                continue;
            }
            expecting_points = false;
        }

        if (expecting_queries) {
            if (remaining > 0) {
                std::istringstream iss(line);
                double x;
                if (iss >> x) {
                    task.query_points.push_back(x);
                    remaining--;
                } else {
                    throw std::runtime_error("Invalid query format at line " + std::to_string(line_number));
                }
                continue;
            }
            expecting_queries = false;
        }

        std::string key, value;
        if (!parse_key_value(line, key, value)) {
            throw std::runtime_error("Invalid key-value format at line " + std::to_string(line_number));
        }

        try {
            if (key == "name") {
                task.name = value;
            } else if (key == "scheme") {
                task.scheme = parse_scheme(value);
            } else if (key == "order") {
                task.order = std::stoi(value);
            } else if (key == "derivative_order") {
                task.derivative_order = std::stoi(value);
            } else if (key == "spacing_tolerance") {
                task.spacing_tolerance = std::stod(value);
            } else if (key == "estimate_error") {
                task.estimate_error = parse_bool(value);
            } else if (key == "points_count") {
                remaining = std::stoi(value);
                task.x_values.reserve(remaining);
                task.y_values.reserve(remaining);
                expecting_points = true;
            } else if (key == "queries_count") {
                remaining = std::stoi(value);
                task.query_points.reserve(remaining);
                expecting_queries = true;
            } else {
                throw std::runtime_error("Unknown key '" + key + "'");
            }
        } catch (const std::logic_error& e) {
            throw std::runtime_error("Invalid value at line " + std::to_string(line_number) + ": " + e.what());
        }
    }

    if (expecting_points && remaining > 0) {
        throw std::runtime_error("Not enough point data");
    }
    if (expecting_queries && remaining > 0) {
        throw std::runtime_error("Not enough query data");
    }

    return task;
}

void ConfigReader::write_to_file(const InterpolationTask& task, const std::string& filename) {
    std::ofstream file(filename);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot create file: " + filename);
    }

    file << std::setprecision(std::numeric_limits<double>::max_digits10);

    file << "# Interpolation task\n";
    file << "# Generated by ConfigReader\n\n";

    if (!task.name.empty()) {
        file << "name = " << task.name << "\n";
    }
    file << "scheme = " << scheme_name(task.scheme) << "\n";
    file << "order = " << task.order << "\n";
    file << "derivative_order = " << task.derivative_order << "\n";
    file << "spacing_tolerance = " << task.spacing_tolerance << "\n";
    file << "estimate_error = " << (task.estimate_error ? "true" : "false") << "\n\n";

    size_t count = std::min(task.x_values.size(), task.y_values.size());
    file << "# Points: x y\n";
    file << "points_count = " << count << "\n";
    for (size_t i = 0; i < count; ++i) {
        file << task.x_values[i] << " " << task.y_values[i] << "\n";
    }
    file << "\n";

    file << "# Query points\n";
    file << "queries_count = " << task.query_points.size() << "\n";
    for (double q : task.query_points) {
        file << q << "\n";
    }

    if (!file) {
        throw std::runtime_error("Error writing file: " + filename);
    }
}

} // namespace diff_interp
