/**
 * @file Logger.cpp
 * @brief Implementation of Logger.
 */

#include "infrastructure/Logger.hpp"
#include <chrono>
#include <cstdio>
#include <ctime>
#include <iostream>

namespace foldermapper::infrastructure {

Logger& Logger::Instance() {
    static Logger instance;
    return instance;
}

Logger::~Logger() {
    if (m_file.is_open()) m_file.close();
}

std::filesystem::path Logger::openRunLog(const std::filesystem::path& directory) {
    std::time_t now = std::time(nullptr);
    std::tm tmBuf{};
    localtime_r(&now, &tmBuf);
    char name[64];
    std::strftime(name, sizeof(name), "folder_mapper_%Y%m%d_%H%M%S.log", &tmBuf);

    std::filesystem::path logPath = directory / name;
    std::error_code ec;
    if (!directory.empty() && !std::filesystem::exists(directory, ec)) {
        std::filesystem::create_directories(directory, ec);
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_file.is_open()) m_file.close();
    m_file.open(logPath, std::ios::out | std::ios::app);
    if (!m_file.is_open()) {
        std::cerr << "[Logger] Could not open log file " << logPath << ", logging to console only." << std::endl;
        return {};
    }
    return logPath;
}

void Logger::closeFile() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_file.is_open()) m_file.close();
}

void Logger::setMinLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_minLevel = level;
}

LogLevel Logger::minLevel() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_minLevel;
}

void Logger::setConsoleEnabled(bool enabled) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_consoleEnabled = enabled;
}

void Logger::log(LogLevel level, const std::string& component, const std::string& message) {
    std::string line = NowString() + " [" + LevelTag(level) + "] [" + component + "] " + message + "\n";

    std::lock_guard<std::mutex> lock(m_mutex);
    if (level < m_minLevel) return;
    if (level == LogLevel::Warn) ++m_warnings;

    if (m_consoleEnabled) {
        std::FILE* out = level >= LogLevel::Warn ? stderr : stdout;
        std::fwrite(line.data(), 1, line.size(), out);
        std::fflush(out);
    }
    if (m_file.is_open()) {
        m_file << line;
        m_file.flush();
    }
}

std::size_t Logger::warningCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_warnings;
}

const char* Logger::LevelTag(LogLevel level) {
    switch (level) {
    case LogLevel::Debug: return "DBG";
    case LogLevel::Info:  return "INF";
    case LogLevel::Warn:  return "WRN";
    case LogLevel::Error: return "ERR";
    }
    return "UNK";
}

std::string Logger::NowString() {
    using namespace std::chrono;
    auto now = system_clock::now();
    auto tt = system_clock::to_time_t(now);
    auto ms = duration_cast<milliseconds>(now.time_since_epoch()) % 1000;

    std::tm tmBuf{};
    localtime_r(&tt, &tmBuf);
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d %02d:%02d:%02d.%03d",
                  tmBuf.tm_year + 1900, tmBuf.tm_mon + 1, tmBuf.tm_mday,
                  tmBuf.tm_hour, tmBuf.tm_min, tmBuf.tm_sec, static_cast<int>(ms.count()));
    return buf;
}

} // namespace foldermapper::infrastructure
