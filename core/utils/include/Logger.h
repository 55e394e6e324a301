#pragma once

#include <atomic>
#include <fstream>
#include <iostream>
#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace CodeDrop {

    enum class LogLevel {
        DEBUG,
        INFO,
        WARN,
        ERROR,
        CRITICAL
    };

    /**
     * @brief Parse a level name ("debug", "INFO", "warn", ...).
     * @return std::nullopt for unknown names
     */
    std::optional<LogLevel> parseLogLevel(const std::string& name);

    /**
     * @brief Process-wide logger shared by every orchestration context.
     *
     * Lines look like "[time] [LEVEL] [Component] message". Console output
     * goes to stderr, colored by severity; the optional log file is rotated
     * once it passes the configured size. Registered secrets are masked in
     * every line before it is written anywhere.
     */
    class Logger {
    public:
        static Logger& instance();

        void setLogFile(const std::string& path);
        void setLevel(LogLevel level);
        void setMaxFileSize(size_t maxSizeMB);
        void setComponent(const std::string& component);
        void setConsoleOutput(bool enabled);

        /**
         * @brief Mask a secret until the matching forgetSecret()
         *
         * Registrations are counted, so two sessions sharing a code can
         * register it independently.
         */
        void redactSecret(const std::string& secret);
        void forgetSecret(const std::string& secret);

        bool isDebugEnabled() const { return currentLevel_.load() <= LogLevel::DEBUG; }
        bool isInfoEnabled() const { return currentLevel_.load() <= LogLevel::INFO; }
        LogLevel getLevel() const { return currentLevel_.load(); }

        void log(LogLevel level, const std::string& message, const std::string& component = "");

        void debug(const std::string& message, const std::string& component = "");
        void info(const std::string& message, const std::string& component = "");
        void warn(const std::string& message, const std::string& component = "");
        void error(const std::string& message, const std::string& component = "");

        static constexpr const char* REDACTED = "<redacted>";

    private:
        Logger() = default;
        ~Logger();

        std::string redact(std::string line) const;
        static const char* levelName(LogLevel level);
        static std::string timestamp(const char* format, bool withMillis);
        void writeToFile(const std::string& line);
        void rotate();

        std::mutex mutex_;
        std::ofstream logFile_;
        std::string logFilePath_;
        std::atomic<LogLevel> currentLevel_{LogLevel::INFO};
        std::string defaultComponent_ = "CodeDrop";
        size_t maxFileBytes_ = 50u * 1024 * 1024;
        size_t currentFileSize_ = 0;
        bool consoleOutput_ = true;
        std::map<std::string, int> secrets_;
    };

}
