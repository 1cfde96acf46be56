#include "logger.h"
#include <iostream>
#include <unistd.h>
#include <cstdlib>
#include <syslog.h>
#include <sstream>
#include <iomanip>
#include <chrono>
#include <ctime>
#include <algorithm>
#include <vector>

namespace rollcall {

Logger& Logger::getInstance() {
    static Logger instance;
    return instance;
}

Logger::Logger() {
    // Until the CLI applies [logging] file, write to ROLLCALL_LOG_FILE or stderr
    const char* env_path = std::getenv("ROLLCALL_LOG_FILE");
    if (env_path != nullptr && *env_path != '\0') {
        setLogFile(env_path);
    } else {
        console_output_ = true;
    }
}

Logger::~Logger() {
    if (log_file_.is_open()) {
        log_file_.close();
    }
}

void Logger::setLogFile(const std::string& path) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (log_file_.is_open()) {
        log_file_.close();
    }

    log_file_path_ = path;
    log_file_.open(path, std::ios::app);
    if (log_file_.is_open()) {
        console_output_ = false;
    } else {
        // Fallback to stderr
        console_output_ = true;
        std::cerr << "Warning: Could not open log file " << path
                  << ", falling back to console output" << std::endl;
    }
}

void Logger::setConsoleOutput() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (log_file_.is_open()) {
        log_file_.close();
    }
    log_file_path_.clear();
    console_output_ = true;
}

void Logger::setLogLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    min_level_ = level;
}

void Logger::setMaxLines(size_t max_lines) {
    std::lock_guard<std::mutex> lock(mutex_);
    max_log_lines_ = max_lines;
}

std::optional<LogLevel> Logger::parseLevel(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(), ::tolower);

    if (lower == "debug") return LogLevel::DEBUG;
    if (lower == "info") return LogLevel::INFO;
    if (lower == "warning" || lower == "warn") return LogLevel::WARNING;
    if (lower == "error") return LogLevel::ERROR;
    return std::nullopt;
}

std::string Logger::getCurrentTimestamp() {
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm tm_buf{};
    localtime_r(&time, &tm_buf);

    std::stringstream ss;
    ss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
    ss << '.' << std::setfill('0') << std::setw(3) << ms.count();

    return ss.str();
}

std::string Logger::levelToString(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG:   return "DEBUG";
        case LogLevel::INFO:    return "INFO";
        case LogLevel::WARNING: return "WARNING";
        case LogLevel::ERROR:   return "ERROR";
        default:                return "UNKNOWN";
    }
}

void Logger::rotateLogIfNeeded() {
    // Only perform rotation check periodically (every 10 writes)
    if (log_counter_ < 10) {
        log_counter_++;
        return;
    }
    log_counter_ = 0;

    if (log_file_path_.empty() || console_output_) {
        return;
    }

    std::ifstream infile(log_file_path_);
    if (!infile.is_open()) {
        return;
    }

    std::vector<std::string> lines;
    std::string line;
    while (std::getline(infile, line)) {
        lines.push_back(line);
    }
    infile.close();

    if (lines.size() <= max_log_lines_) {
        return;
    }

    // Keep the newest max_log_lines_ lines
    size_t start_index = lines.size() - max_log_lines_;
    log_file_.close();

    std::ofstream outfile(log_file_path_, std::ios::trunc);
    if (outfile.is_open()) {
        for (size_t i = start_index; i < lines.size(); ++i) {
            outfile << lines[i] << '\n';
        }
    }
    outfile.close();

    log_file_.open(log_file_path_, std::ios::app);
}

void Logger::log(LogLevel level, const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (level < min_level_) {
        return;
    }

    std::stringstream ss;
    ss << "[" << getCurrentTimestamp() << "] "
       << "[" << levelToString(level) << "] "
       << "[PID:" << getpid() << "] "
       << message << '\n';

    if (console_output_) {
        std::cerr << ss.str();
    } else if (log_file_.is_open()) {
        log_file_ << ss.str();
        log_file_.flush();
    } else {
        int syslog_level = LOG_INFO;
        switch (level) {
            case LogLevel::DEBUG:   syslog_level = LOG_DEBUG; break;
            case LogLevel::INFO:    syslog_level = LOG_INFO; break;
            case LogLevel::WARNING: syslog_level = LOG_WARNING; break;
            case LogLevel::ERROR:   syslog_level = LOG_ERR; break;
        }
        syslog(syslog_level, "%s", message.c_str());
    }

    rotateLogIfNeeded();
}

void Logger::debug(const std::string& message) {
    log(LogLevel::DEBUG, message);
}

void Logger::info(const std::string& message) {
    log(LogLevel::INFO, message);
}

void Logger::warning(const std::string& message) {
    log(LogLevel::WARNING, message);
}

void Logger::error(const std::string& message) {
    log(LogLevel::ERROR, message);
}

void Logger::auditEnrollment(const std::string& scope, const std::string& roll_no,
                             const std::string& name, size_t images_processed) {
    std::stringstream ss;
    ss << "ENROLLED scope=" << scope
       << " roll_no=" << roll_no
       << " name=" << name
       << " images=" << images_processed;
    info(ss.str());
}

void Logger::auditSkip(const std::string& scope, const std::string& folder,
                       const std::string& reason, const std::string& detail) {
    std::stringstream ss;
    ss << "ENROLL_SKIPPED scope=" << scope
       << " folder=" << folder
       << " reason=" << reason;
    if (!detail.empty()) {
        ss << " detail=\"" << detail << "\"";
    }
    warning(ss.str());
}

void Logger::auditAttendance(const std::string& scope, const std::string& roll_no,
                             float similarity, const std::string& crop_path) {
    std::stringstream ss;
    ss << "ATTENDANCE scope=" << scope
       << " roll_no=" << roll_no
       << " similarity=" << std::fixed << std::setprecision(4) << similarity
       << " crop=" << crop_path;
    info(ss.str());
}

void Logger::auditDeletion(const std::string& target, size_t identities, size_t records) {
    std::stringstream ss;
    ss << "DELETED target=" << target
       << " identities=" << identities
       << " attendance_records=" << records;
    info(ss.str());
}

} // namespace rollcall
