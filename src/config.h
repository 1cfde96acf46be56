#ifndef ROLLCALL_CONFIG_H
#define ROLLCALL_CONFIG_H

#include <string>
#include <map>
#include <optional>
#include <vector>

namespace rollcall {

class Config {
public:
    static Config& getInstance();

    bool load(const std::string& path);
    void clear();

    std::optional<std::string> getString(const std::string& section, const std::string& key) const;
    std::optional<int> getInt(const std::string& section, const std::string& key) const;
    std::optional<double> getDouble(const std::string& section, const std::string& key) const;
    std::optional<bool> getBool(const std::string& section, const std::string& key) const;

    void set(const std::string& section, const std::string& key, const std::string& value);
    bool save(const std::string& path);

    // Get validation errors from last load
    std::vector<std::string> getValidationErrors() const { return validation_errors_; }

    // ${ROLLCALL_CONFIG} if set, otherwise ${CONFIG_DIR}/rollcall.conf
    static std::string defaultPath();

private:
    Config() = default;
    std::map<std::string, std::map<std::string, std::string>> data_;
    std::vector<std::string> validation_errors_;

    std::string trim(const std::string& str) const;
    bool validate();
    bool validateInt(const std::string& section, const std::string& key, int min_val, int max_val);
    bool validateDouble(const std::string& section, const std::string& key, double min_val, double max_val);
};

// Effective runtime settings: config values with built-in defaults applied.
// Out-of-range values were already reported by Config::load and fall back to the default.
struct Settings {
    std::string database_path;
    std::string crops_dir;
    int busy_timeout_ms = 5000;

    double threshold = 0.3;
    int workers = 4;

    std::string models_dir;
    int extraction_timeout_ms = 30000;  // 0 = no timeout
    double detection_confidence = 0.8;
    int num_threads = 4;

    std::string log_file;
    std::string log_level = "info";
    int log_max_lines = 5000;

    static Settings fromConfig(const Config& config);
};

} // namespace rollcall

#endif // ROLLCALL_CONFIG_H
