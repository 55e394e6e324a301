#include "Logger.h"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <sstream>

namespace CodeDrop {

    std::optional<LogLevel> parseLogLevel(const std::string& name) {
        std::string lower = name;
        std::transform(lower.begin(), lower.end(), lower.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

        if (lower == "debug") return LogLevel::DEBUG;
        if (lower == "info") return LogLevel::INFO;
        if (lower == "warn" || lower == "warning") return LogLevel::WARN;
        if (lower == "error") return LogLevel::ERROR;
        if (lower == "critical") return LogLevel::CRITICAL;
        return std::nullopt;
    }

    Logger& Logger::instance() {
        static Logger instance;
        return instance;
    }

    Logger::~Logger() {
        if (logFile_.is_open()) {
            logFile_.close();
        }
    }

    void Logger::setLogFile(const std::string& path) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (logFile_.is_open()) {
            logFile_.close();
        }
        logFilePath_ = path;
        logFile_.open(path, std::ios::app);

        std::error_code ec;
        const auto size = std::filesystem::file_size(path, ec);
        currentFileSize_ = ec ? 0 : static_cast<size_t>(size);
    }

    void Logger::setMaxFileSize(size_t maxSizeMB) {
        std::lock_guard<std::mutex> lock(mutex_);
        maxFileBytes_ = std::max<size_t>(maxSizeMB, 1) * 1024 * 1024;
    }

    void Logger::setComponent(const std::string& component) {
        std::lock_guard<std::mutex> lock(mutex_);
        defaultComponent_ = component;
    }

    void Logger::setConsoleOutput(bool enabled) {
        std::lock_guard<std::mutex> lock(mutex_);
        consoleOutput_ = enabled;
    }

    void Logger::setLevel(LogLevel level) {
        currentLevel_.store(level);
    }

    void Logger::redactSecret(const std::string& secret) {
        if (secret.empty()) return;
        std::lock_guard<std::mutex> lock(mutex_);
        secrets_[secret]++;
    }

    void Logger::forgetSecret(const std::string& secret) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = secrets_.find(secret);
        if (it != secrets_.end() && --it->second <= 0) {
            secrets_.erase(it);
        }
    }

    // Caller holds mutex_
    std::string Logger::redact(std::string line) const {
        for (const auto& entry : secrets_) {
            const std::string& secret = entry.first;
            for (size_t pos = line.find(secret); pos != std::string::npos;
                 pos = line.find(secret, pos + std::char_traits<char>::length(REDACTED))) {
                line.replace(pos, secret.size(), REDACTED);
            }
        }
        return line;
    }

    void Logger::log(LogLevel level, const std::string& message, const std::string& component) {
        if (level < currentLevel_.load()) {
            return;
        }

        std::lock_guard<std::mutex> lock(mutex_);
        const std::string& comp = component.empty() ? defaultComponent_ : component;
        const std::string line = redact("[" + timestamp("%Y-%m-%d %H:%M:%S", true) + "] [" +
                                        levelName(level) + "] [" + comp + "] " + message);

        if (consoleOutput_) {
            switch (level) {
                case LogLevel::ERROR:
                case LogLevel::CRITICAL:
                    std::cerr << "\033[1;31m" << line << "\033[0m" << std::endl;
                    break;
                case LogLevel::WARN:
                    std::cerr << "\033[1;33m" << line << "\033[0m" << std::endl;
                    break;
                default:
                    std::cerr << line << std::endl;
                    break;
            }
        }

        if (logFile_.is_open()) {
            writeToFile(line);
        }
    }

    void Logger::debug(const std::string& message, const std::string& component) {
        log(LogLevel::DEBUG, message, component);
    }

    void Logger::info(const std::string& message, const std::string& component) {
        log(LogLevel::INFO, message, component);
    }

    void Logger::warn(const std::string& message, const std::string& component) {
        log(LogLevel::WARN, message, component);
    }

    void Logger::error(const std::string& message, const std::string& component) {
        log(LogLevel::ERROR, message, component);
    }

    const char* Logger::levelName(LogLevel level) {
        switch (level) {
            case LogLevel::DEBUG: return "DEBUG";
            case LogLevel::INFO: return "INFO";
            case LogLevel::WARN: return "WARN";
            case LogLevel::ERROR: return "ERROR";
            case LogLevel::CRITICAL: return "CRITICAL";
        }
        return "UNKNOWN";
    }

    std::string Logger::timestamp(const char* format, bool withMillis) {
        const auto now = std::chrono::system_clock::now();
        const std::time_t seconds = std::chrono::system_clock::to_time_t(now);
        struct tm tm_buf;
        localtime_r(&seconds, &tm_buf);

        std::ostringstream ss;
        ss << std::put_time(&tm_buf, format);
        if (withMillis) {
            const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                now.time_since_epoch()).count() % 1000;
            ss << '.' << std::setw(3) << std::setfill('0') << millis;
        }
        return ss.str();
    }

    // Caller holds mutex_
    void Logger::writeToFile(const std::string& line) {
        logFile_ << line << '\n';
        logFile_.flush();
        currentFileSize_ += line.size() + 1;
        if (currentFileSize_ > maxFileBytes_) {
            rotate();
        }
    }

    // Caller holds mutex_
    void Logger::rotate() {
        if (logFilePath_.empty()) {
            return;
        }
        logFile_.close();

        const std::string rotatedPath = logFilePath_ + "." + timestamp("%Y%m%d_%H%M%S", false);
        std::error_code ec;
        std::filesystem::rename(logFilePath_, rotatedPath, ec);
        if (ec) {
            std::cerr << "Failed to rotate log file: " << ec.message() << std::endl;
        }

        logFile_.open(logFilePath_, std::ios::app);
        currentFileSize_ = 0;
    }

}
