/**
 * @file LoggerMacros.h
 * @brief Level-checked logging macros
 *
 * The _IF variants skip building the message string when the level is disabled,
 * which matters on per-chunk paths:
 *   LOG_DEBUG_COMP_IF("pushed chunk " + std::to_string(i), "UploadOrchestrator");
 */

#pragma once

#include "Logger.h"
#include <chrono>
#include <string>

namespace ChunkVault {

#define LOG_DEBUG_IF(msg) \
    do { \
        auto& logger__ = ::ChunkVault::Logger::instance(); \
        if (logger__.isDebugEnabled()) { \
            logger__.debug(msg); \
        } \
    } while(0)

#define LOG_DEBUG_COMP_IF(msg, component) \
    do { \
        auto& logger__ = ::ChunkVault::Logger::instance(); \
        if (logger__.isDebugEnabled()) { \
            logger__.debug(msg, component); \
        } \
    } while(0)

#define LOG_INFO_IF(msg) \
    do { \
        auto& logger__ = ::ChunkVault::Logger::instance(); \
        if (logger__.isInfoEnabled()) { \
            logger__.info(msg); \
        } \
    } while(0)

#define LOG_INFO_COMP_IF(msg, component) \
    do { \
        auto& logger__ = ::ChunkVault::Logger::instance(); \
        if (logger__.isInfoEnabled()) { \
            logger__.info(msg, component); \
        } \
    } while(0)

#define LOG_WARN(msg) ::ChunkVault::Logger::instance().warn(msg)
#define LOG_ERROR(msg) ::ChunkVault::Logger::instance().error(msg)
#define LOG_CRITICAL(msg) ::ChunkVault::Logger::instance().critical(msg)

#define LOG_WARN_COMP(msg, component) ::ChunkVault::Logger::instance().warn(msg, component)
#define LOG_ERROR_COMP(msg, component) ::ChunkVault::Logger::instance().error(msg, component)
#define LOG_CRITICAL_COMP(msg, component) ::ChunkVault::Logger::instance().critical(msg, component)

/**
 * @brief Logs the elapsed time of a scope at DEBUG level on destruction.
 */
class ScopedTimer {
public:
    explicit ScopedTimer(const std::string& name, const std::string& component = "Performance")
        : name_(name), component_(component), start_(std::chrono::steady_clock::now()) {}

    ~ScopedTimer() {
        auto end = std::chrono::steady_clock::now();
        auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(end - start_).count();

        auto& logger = Logger::instance();
        if (logger.isDebugEnabled()) {
            logger.debug(name_ + " took " + std::to_string(duration) + "ms", component_);
        }
    }

    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;

private:
    std::string name_;
    std::string component_;
    std::chrono::steady_clock::time_point start_;
};

#define SCOPED_TIMER(name) ::ChunkVault::ScopedTimer timer__(name)
#define SCOPED_TIMER_COMP(name, component) ::ChunkVault::ScopedTimer timer__(name, component)

} // namespace ChunkVault
