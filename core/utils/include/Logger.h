#pragma once

#include <string>
#include <mutex>
#include <fstream>
#include <iostream>
#include <memory>

namespace ChunkVault {

    enum class LogLevel {
        DEBUG,
        INFO,
        WARN,
        ERROR,
        CRITICAL
    };

    /**
     * @brief Parse a level name ("debug", "INFO", "warn", ...). Unknown names map to INFO.
     */
    LogLevel logLevelFromString(const std::string& name);

    class Logger {
    public:
        static Logger& instance();

        void setLogFile(const std::string& path);
        void setLevel(LogLevel level);
        void setMaxFileSize(size_t maxSizeMB); // Rotate once the file grows past this
        void setComponent(const std::string& component); // Used when a message carries no component
        void setConsoleOutput(bool enabled);

        bool isDebugEnabled() const { return currentLevel_ <= LogLevel::DEBUG; }
        bool isInfoEnabled() const { return currentLevel_ <= LogLevel::INFO; }
        LogLevel getLevel() const { return currentLevel_; }

        void log(LogLevel level, const std::string& message, const std::string& component = "");

        void debug(const std::string& message, const std::string& component = "");
        void info(const std::string& message, const std::string& component = "");
        void warn(const std::string& message, const std::string& component = "");
        void error(const std::string& message, const std::string& component = "");
        void critical(const std::string& message, const std::string& component = "");

    private:
        Logger() = default;
        ~Logger();

        std::mutex mutex_;
        std::ofstream logFile_;
        std::string logFilePath_;
        LogLevel currentLevel_ = LogLevel::INFO;
        std::string defaultComponent_ = "ChunkVault";
        bool consoleOutput_ = true;
        size_t maxFileSizeMB_ = 100;
        size_t currentFileSize_ = 0;

        std::string levelToString(LogLevel level);
        std::string getCurrentTime();
        void rotateLogFile();
        void checkAndRotate();
        size_t getFileSize();
    };

}
