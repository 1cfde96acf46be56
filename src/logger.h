#ifndef ROLLCALL_LOGGER_H
#define ROLLCALL_LOGGER_H

#include <string>
#include <fstream>
#include <mutex>
#include <optional>
#include <cstddef>

namespace rollcall {

enum class LogLevel {
    DEBUG,
    INFO,
    WARNING,
    ERROR
};

class Logger {
public:
    static Logger& getInstance();

    void setLogFile(const std::string& path);
    void setConsoleOutput();
    void setLogLevel(LogLevel level);
    void setMaxLines(size_t max_lines);

    // "debug" | "info" | "warning" | "error", case-insensitive
    static std::optional<LogLevel> parseLevel(const std::string& name);

    void debug(const std::string& message);
    void info(const std::string& message);
    void warning(const std::string& message);
    void error(const std::string& message);

    // Audit trail specific methods
    void auditEnrollment(const std::string& scope, const std::string& roll_no,
                         const std::string& name, size_t images_processed);
    void auditSkip(const std::string& scope, const std::string& folder,
                   const std::string& reason, const std::string& detail);
    void auditAttendance(const std::string& scope, const std::string& roll_no,
                         float similarity, const std::string& crop_path);
    void auditDeletion(const std::string& target, size_t identities, size_t records);

private:
    Logger();
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void log(LogLevel level, const std::string& message);
    std::string getCurrentTimestamp();
    std::string levelToString(LogLevel level);
    void rotateLogIfNeeded();

    std::ofstream log_file_;
    std::mutex mutex_;
    LogLevel min_level_ = LogLevel::INFO;
    bool console_output_ = false;
    std::string log_file_path_;
    size_t max_log_lines_ = 5000;
    size_t log_counter_ = 0;
};

} // namespace rollcall

#endif // ROLLCALL_LOGGER_H
