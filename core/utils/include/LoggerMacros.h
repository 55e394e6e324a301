/**
 * @file LoggerMacros.h
 * @brief Level-gated logging macros and a scope timer
 *
 * Example:
 *   LOG_DEBUG_COMP_IF("Probe " + host + " reachable", "NetworkProfiler");
 */

#pragma once

#include "Logger.h"
#include <chrono>
#include <string>
#include <utility>

namespace CodeDrop {

// The message expression is only evaluated when DEBUG is enabled
#define LOG_DEBUG_COMP_IF(msg, component) \
    do { \
        auto& logger__ = ::CodeDrop::Logger::instance(); \
        if (logger__.isDebugEnabled()) { \
            logger__.debug(msg, component); \
        } \
    } while(0)

#define LOG_INFO_COMP_IF(msg, component) \
    do { \
        auto& logger__ = ::CodeDrop::Logger::instance(); \
        if (logger__.isInfoEnabled()) { \
            logger__.info(msg, component); \
        } \
    } while(0)

#define LOG_WARN_COMP(msg, component) ::CodeDrop::Logger::instance().warn(msg, component)

/**
 * @brief Logs the scope's duration on destruction
 *
 * DEBUG normally; WARN once the duration passes warnAfter, so slow key
 * derivations and network classifications show up at default verbosity.
 */
class ScopedTimer {
public:
    ScopedTimer(std::string name, std::string component,
                std::chrono::milliseconds warnAfter = std::chrono::milliseconds::max())
        : name_(std::move(name)), component_(std::move(component)), warnAfter_(warnAfter),
          start_(std::chrono::steady_clock::now()) {}

    ~ScopedTimer() {
        const auto elapsed = elapsedMs();
        auto& logger = Logger::instance();
        if (elapsed >= warnAfter_) {
            logger.warn(name_ + " slow: " + std::to_string(elapsed.count()) + "ms", component_);
        } else if (logger.isDebugEnabled()) {
            logger.debug(name_ + " took " + std::to_string(elapsed.count()) + "ms", component_);
        }
    }

    std::chrono::milliseconds elapsedMs() const {
        return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start_);
    }

private:
    std::string name_;
    std::string component_;
    std::chrono::milliseconds warnAfter_;
    std::chrono::steady_clock::time_point start_;
};

#define SCOPED_TIMER_COMP(name, component) ::CodeDrop::ScopedTimer timer__(name, component)
#define SCOPED_TIMER_WARN(name, component, warnAfter) ::CodeDrop::ScopedTimer timer__(name, component, warnAfter)

} // namespace CodeDrop
