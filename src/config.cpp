#include "config.h"
#include "config_paths.h"
#include "logger.h"
#include <fstream>
#include <algorithm>
#include <cstdlib>
#include <stdexcept>

namespace rollcall {

Config& Config::getInstance() {
    static Config instance;
    return instance;
}

std::string Config::defaultPath() {
    const char* env_path = std::getenv("ROLLCALL_CONFIG");
    if (env_path != nullptr && *env_path != '\0') {
        return env_path;
    }
    return std::string(CONFIG_DIR) + "/rollcall.conf";
}

std::string Config::trim(const std::string& str) const {
    size_t first = str.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return "";
    size_t last = str.find_last_not_of(" \t\r\n");
    return str.substr(first, last - first + 1);
}

void Config::clear() {
    data_.clear();
    validation_errors_.clear();
}

bool Config::load(const std::string& path) {
    validation_errors_.clear();

    std::ifstream file(path);
    if (!file.is_open()) {
        return false;
    }

    std::string line;
    std::string current_section;

    while (std::getline(file, line)) {
        line = trim(line);

        // Skip empty lines and comments
        if (line.empty() || line[0] == '#' || line[0] == ';') {
            continue;
        }

        if (line[0] == '[' && line.back() == ']') {
            current_section = trim(line.substr(1, line.length() - 2));
            continue;
        }

        size_t pos = line.find('=');
        if (pos != std::string::npos) {
            std::string key = trim(line.substr(0, pos));
            std::string value = trim(line.substr(pos + 1));
            data_[current_section][key] = value;
        }
    }

    bool valid = validate();

    if (!validation_errors_.empty()) {
        Logger::getInstance().warning("Configuration validation found " +
            std::to_string(validation_errors_.size()) + " issue(s):");
        for (const auto& error : validation_errors_) {
            Logger::getInstance().warning("  - " + error);
        }
    }

    return valid;
}

std::optional<std::string> Config::getString(const std::string& section, const std::string& key) const {
    auto section_it = data_.find(section);
    if (section_it == data_.end()) {
        return std::nullopt;
    }

    auto key_it = section_it->second.find(key);
    if (key_it == section_it->second.end()) {
        return std::nullopt;
    }

    return key_it->second;
}

std::optional<int> Config::getInt(const std::string& section, const std::string& key) const {
    auto value = getString(section, key);
    if (!value) return std::nullopt;

    try {
        size_t consumed = 0;
        int parsed = std::stoi(*value, &consumed);
        if (consumed != value->size()) {
            return std::nullopt;
        }
        return parsed;
    } catch (const std::logic_error&) {
        // invalid_argument or out_of_range
        return std::nullopt;
    }
}

std::optional<double> Config::getDouble(const std::string& section, const std::string& key) const {
    auto value = getString(section, key);
    if (!value) return std::nullopt;

    try {
        size_t consumed = 0;
        double parsed = std::stod(*value, &consumed);
        if (consumed != value->size()) {
            return std::nullopt;
        }
        return parsed;
    } catch (const std::logic_error&) {
        return std::nullopt;
    }
}

std::optional<bool> Config::getBool(const std::string& section, const std::string& key) const {
    auto value = getString(section, key);
    if (!value) return std::nullopt;

    std::string lower = *value;
    std::transform(lower.begin(), lower.end(), lower.begin(), ::tolower);

    if (lower == "true" || lower == "yes" || lower == "1" || lower == "on") {
        return true;
    } else if (lower == "false" || lower == "no" || lower == "0" || lower == "off") {
        return false;
    }

    return std::nullopt;
}

void Config::set(const std::string& section, const std::string& key, const std::string& value) {
    data_[section][key] = value;
}

bool Config::save(const std::string& path) {
    std::ofstream file(path);
    if (!file.is_open()) {
        return false;
    }

    for (const auto& [section, keys] : data_) {
        file << "[" << section << "]\n";
        for (const auto& [key, value] : keys) {
            file << key << " = " << value << "\n";
        }
        file << "\n";
    }

    return file.good();
}

bool Config::validateInt(const std::string& section, const std::string& key, int min_val, int max_val) {
    auto raw = getString(section, key);
    if (!raw.has_value()) {
        return true;  // Optional value, not set
    }

    auto value = getInt(section, key);
    if (!value.has_value()) {
        validation_errors_.push_back("[" + section + "]." + key + " = " + *raw + " is not an integer");
        return false;
    }

    if (*value < min_val || *value > max_val) {
        validation_errors_.push_back(
            "[" + section + "]." + key + " = " + std::to_string(*value) +
            " is out of range [" + std::to_string(min_val) + ", " + std::to_string(max_val) + "]"
        );
        return false;
    }

    return true;
}

bool Config::validateDouble(const std::string& section, const std::string& key, double min_val, double max_val) {
    auto raw = getString(section, key);
    if (!raw.has_value()) {
        return true;
    }

    auto value = getDouble(section, key);
    if (!value.has_value()) {
        validation_errors_.push_back("[" + section + "]." + key + " = " + *raw + " is not a number");
        return false;
    }

    if (*value < min_val || *value > max_val) {
        validation_errors_.push_back(
            "[" + section + "]." + key + " = " + std::to_string(*value) +
            " is out of range [" + std::to_string(min_val) + ", " + std::to_string(max_val) + "]"
        );
        return false;
    }

    return true;
}

bool Config::validate() {
    bool all_valid = true;

    all_valid &= validateInt("storage", "busy_timeout_ms", 0, 60000);
    all_valid &= validateDouble("matching", "threshold", -1.0, 1.0);
    all_valid &= validateInt("enrollment", "workers", 1, 32);
    all_valid &= validateInt("extraction", "timeout_ms", 0, 600000);
    all_valid &= validateDouble("extraction", "confidence", 0.0, 1.0);
    all_valid &= validateInt("extraction", "num_threads", 1, 64);
    all_valid &= validateInt("logging", "max_lines", 10, 1000000);

    auto level = getString("logging", "level");
    if (level.has_value() && !Logger::parseLevel(*level).has_value()) {
        validation_errors_.push_back("[logging].level = " + *level +
                                     " must be one of debug, info, warning, error");
        all_valid = false;
    }

    auto database = getString("storage", "database");
    if (database.has_value() && database->empty()) {
        validation_errors_.push_back("[storage].database must not be empty");
        all_valid = false;
    }

    return all_valid;
}

namespace {

template <typename T>
T inRangeOr(const std::optional<T>& value, T min_val, T max_val, T fallback) {
    if (!value.has_value() || *value < min_val || *value > max_val) {
        return fallback;
    }
    return *value;
}

} // namespace

Settings Settings::fromConfig(const Config& config) {
    Settings s;
    s.database_path = std::string(DATA_DIR) + "/rollcall.db";
    s.crops_dir = std::string(DATA_DIR) + "/attendance_crops";
    s.models_dir = MODELS_DIR;
    s.log_file = LOG_FILE;

    auto database = config.getString("storage", "database");
    if (database && !database->empty()) s.database_path = *database;
    auto crops = config.getString("storage", "crops_dir");
    if (crops && !crops->empty()) s.crops_dir = *crops;
    s.busy_timeout_ms = inRangeOr(config.getInt("storage", "busy_timeout_ms"), 0, 60000, s.busy_timeout_ms);

    s.threshold = inRangeOr(config.getDouble("matching", "threshold"), -1.0, 1.0, s.threshold);
    s.workers = inRangeOr(config.getInt("enrollment", "workers"), 1, 32, s.workers);

    auto models = config.getString("extraction", "models_dir");
    if (models && !models->empty()) s.models_dir = *models;
    s.extraction_timeout_ms = inRangeOr(config.getInt("extraction", "timeout_ms"), 0, 600000, s.extraction_timeout_ms);
    s.detection_confidence = inRangeOr(config.getDouble("extraction", "confidence"), 0.0, 1.0, s.detection_confidence);
    s.num_threads = inRangeOr(config.getInt("extraction", "num_threads"), 1, 64, s.num_threads);

    auto log_file = config.getString("logging", "file");
    if (log_file) s.log_file = *log_file;  // empty means console
    auto level = config.getString("logging", "level");
    if (level && Logger::parseLevel(*level).has_value()) s.log_level = *level;
    s.log_max_lines = inRangeOr(config.getInt("logging", "max_lines"), 10, 1000000, s.log_max_lines);

    return s;
}

} // namespace rollcall
