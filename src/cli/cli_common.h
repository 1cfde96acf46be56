#ifndef ROLLCALL_CLI_COMMON_H
#define ROLLCALL_CLI_COMMON_H

/**
 * CLI Common Utilities and Includes
 *
 * Shared argument parsing, configuration loading and dataset scanning for
 * the rollcall commands
 */

// ========== Standard Library Includes ==========
#include <iostream>
#include <string>
#include <vector>
#include <map>
#include <set>
#include <optional>
#include <algorithm>
#include <csignal>
#include <atomic>
#include <memory>

// ========== rollcall Library Includes ==========
#include "../config.h"
#include "../enrollment.h"
#include "../errors.h"
#include "../face_detector.h"
#include "../fs_util.h"
#include "../identity.h"
#include "../image_io.h"
#include "../logger.h"
#include "config_paths.h"

#include <nlohmann/json.hpp>

namespace rollcall {
namespace cli {

/**
 * Parsed command line of one command
 *
 * "--key value" options, bare "--flag" switches and positional arguments,
 * in the order they were given
 */
struct CommandArgs {
    std::map<std::string, std::string> options;
    std::set<std::string> flags;
    std::vector<std::string> positional;

    std::optional<std::string> get(const std::string& key) const {
        auto it = options.find(key);
        if (it == options.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    bool has(const std::string& flag) const { return flags.count(flag) > 0; }
};

/**
 * Split raw arguments into options, flags and positionals
 *
 * Every command accepts --config PATH and --json in addition to its own options.
 *
 * @param value_options Option names (without "--") that take a value
 * @param flag_options  Option names that take no value
 * @return false with `error` set for an unknown option or a missing value
 */
inline bool parseCommandArgs(const std::vector<std::string>& args,
                             std::set<std::string> value_options,
                             std::set<std::string> flag_options,
                             CommandArgs& out, std::string& error) {
    value_options.insert("config");
    flag_options.insert("json");

    for (size_t i = 0; i < args.size(); i++) {
        const std::string& arg = args[i];
        if (arg.size() <= 2 || arg.compare(0, 2, "--") != 0) {
            out.positional.push_back(arg);
            continue;
        }

        std::string name = arg.substr(2);
        std::optional<std::string> inline_value;
        size_t eq = name.find('=');
        if (eq != std::string::npos) {
            inline_value = name.substr(eq + 1);
            name = name.substr(0, eq);
        }

        if (flag_options.count(name)) {
            if (inline_value) {
                error = "option --" + name + " takes no value";
                return false;
            }
            out.flags.insert(name);
        } else if (value_options.count(name)) {
            if (inline_value) {
                out.options[name] = *inline_value;
            } else if (i + 1 < args.size()) {
                out.options[name] = args[++i];
            } else {
                error = "option --" + name + " requires a value";
                return false;
            }
        } else {
            error = "unknown option --" + name;
            return false;
        }
    }
    return true;
}

/**
 * Load configuration (--config, ROLLCALL_CONFIG or CONFIG_DIR/rollcall.conf)
 * and apply the [logging] section to the Logger
 *
 * A missing default file means built-in defaults. An explicit --config that
 * cannot be read is an error.
 */
inline bool loadSettings(const CommandArgs& args, Settings& settings) {
    Config& config = Config::getInstance();
    auto explicit_path = args.get("config");
    std::string path = explicit_path ? *explicit_path : Config::defaultPath();

    if (!fileExists(path)) {
        if (explicit_path) {
            std::cerr << "Error: cannot read config file " << path << std::endl;
            return false;
        }
    } else {
        config.load(path);  // validation problems are logged, bad values fall back to defaults
    }

    settings = Settings::fromConfig(config);

    Logger& logger = Logger::getInstance();
    if (!settings.log_file.empty()) {
        logger.setLogFile(settings.log_file);
    } else {
        logger.setConsoleOutput();
    }
    logger.setMaxLines(static_cast<size_t>(settings.log_max_lines));
    if (auto level = Logger::parseLevel(settings.log_level)) {
        logger.setLogLevel(*level);
    }
    return true;
}

// Load the ncnn models named by [extraction]; prints the reason on failure
inline bool loadDetector(const Settings& settings, std::unique_ptr<FaceDetector>& detector) {
    FaceDetectorOptions options;
    options.models_dir = settings.models_dir;
    options.confidence = static_cast<float>(settings.detection_confidence);
    options.num_threads = settings.num_threads;

    detector = std::make_unique<FaceDetector>(options);
    if (!detector->loadModels()) {
        std::cerr << "Error: failed to load face models from " << settings.models_dir << std::endl;
        return false;
    }
    return true;
}

// Scope from --class / --section / --subject
inline bool scopeFromArgs(const CommandArgs& args, Scope& scope, std::string& error) {
    auto class_name = args.get("class");
    auto section = args.get("section");
    if (!class_name || !section) {
        error = "--class and --section are required";
        return false;
    }
    scope.class_name = *class_name;
    scope.section = *section;
    scope.subject = args.get("subject");
    return true;
}

/**
 * One PersonFolder per sub-directory of `dataset_dir`, holding the paths of
 * its .jpg/.jpeg/.png files. Labels are the sub-directory names.
 */
inline std::vector<PersonFolder> collectPersonFolders(const std::string& dataset_dir) {
    std::vector<PersonFolder> folders;
    for (const auto& entry : listDirectory(dataset_dir)) {
        std::string person_dir = joinPath(dataset_dir, entry);
        if (!isDirectory(person_dir)) {
            continue;
        }

        PersonFolder folder;
        folder.label = entry;
        for (const auto& file : listDirectory(person_dir)) {
            if (isSupportedImageFile(file)) {
                folder.image_paths.push_back(joinPath(person_dir, file));
            }
        }
        folders.push_back(std::move(folder));
    }
    return folders;
}

/**
 * Expand photo arguments: files are taken as given, directories contribute
 * their supported image files in name order
 */
inline std::vector<std::string> collectPhotoPaths(const std::vector<std::string>& inputs) {
    std::vector<std::string> paths;
    for (const auto& input : inputs) {
        if (isDirectory(input)) {
            for (const auto& file : listDirectory(input)) {
                std::string path = joinPath(input, file);
                if (isSupportedImageFile(file) && !isDirectory(path)) {
                    paths.push_back(path);
                }
            }
        } else {
            paths.push_back(input);
        }
    }
    return paths;
}

// Set by SIGINT/SIGTERM while a long-running command is active
inline std::atomic<bool>& cancelFlag() {
    static std::atomic<bool> flag{false};
    return flag;
}

inline void onInterrupt(int) {
    cancelFlag().store(true);
}

// Long-running commands stop between images once interrupted
inline void installCancelHandler() {
    cancelFlag().store(false);
    std::signal(SIGINT, onInterrupt);
    std::signal(SIGTERM, onInterrupt);
}

// Error boundary shared by every command: log, print, exit status 1
inline int reportFailure(const std::string& command, const std::exception& e) {
    Logger::getInstance().error(command + " failed: " + e.what());
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
}

inline void printJson(const nlohmann::json& doc) {
    std::cout << doc.dump(2) << std::endl;
}

} // namespace cli
} // namespace rollcall

#endif // ROLLCALL_CLI_COMMON_H
