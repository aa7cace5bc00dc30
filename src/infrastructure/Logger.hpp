/**
 * @file Logger.hpp
 * @brief Process-wide, thread-safe log sink writing to the console and a per-run file.
 */

#pragma once
#include <filesystem>
#include <fstream>
#include <mutex>
#include <sstream>
#include <string>

namespace foldermapper::infrastructure {

enum class LogLevel { Debug = 0, Info, Warn, Error };

/**
 * @class Logger
 * @brief Timestamped log lines of the form
 *        "2026-01-07 10:00:00.123 [INF] [Component] message".
 *
 * Info and Debug go to stdout, Warn and Error to stderr. When a log file has
 * been opened every line is also appended to it. Failing to open the file is
 * reported once on stderr and otherwise ignored.
 */
class Logger {
public:
    static Logger& Instance();

    /**
     * @brief Opens "folder_mapper_YYYYMMDD_HHMMSS.log" inside @p directory.
     * @return Path of the opened file, or empty when it could not be opened.
     */
    std::filesystem::path openRunLog(const std::filesystem::path& directory);

    void closeFile();
    void setMinLevel(LogLevel level);
    LogLevel minLevel() const;

    /** @brief Silences console output; the file sink keeps receiving lines. */
    void setConsoleEnabled(bool enabled);

    void log(LogLevel level, const std::string& component, const std::string& message);

    /** @brief Number of Warn lines emitted since start-up. */
    std::size_t warningCount() const;

    static const char* LevelTag(LogLevel level);

private:
    Logger() = default;
    ~Logger();
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    static std::string NowString();

    mutable std::mutex m_mutex;
    std::ofstream m_file;
    LogLevel m_minLevel = LogLevel::Info;
    bool m_consoleEnabled = true;
    std::size_t m_warnings = 0;
};

} // namespace foldermapper::infrastructure

#define FM_LOG(level, component, expr)                                                            \
    do {                                                                                          \
        if (::foldermapper::infrastructure::LogLevel::level >=                                    \
            ::foldermapper::infrastructure::Logger::Instance().minLevel()) {                      \
            std::ostringstream fm_log_stream_;                                                    \
            fm_log_stream_ << expr;                                                               \
            ::foldermapper::infrastructure::Logger::Instance().log(                               \
                ::foldermapper::infrastructure::LogLevel::level, component, fm_log_stream_.str()); \
        }                                                                                         \
    } while (0)
