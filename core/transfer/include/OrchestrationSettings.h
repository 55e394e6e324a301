#pragma once

#include "Config.h"
#include "Logger.h"
#include "NetworkProfiler.h"
#include "Result.h"
#include "SecurityEngine.h"
#include "TransportManager.h"

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>

namespace CodeDrop {

    struct SpoolSettings {
        std::string dir;                 // empty: spool backend not registered
        int priority{50};
        std::string name{"local-spool"};
        std::chrono::milliseconds pollInterval{100};
    };

    /**
     * @brief Typed view of the configuration keys the orchestration layer reads
     */
    struct OrchestrationSettings {
        ProfilerOptions profiler;
        TransportManagerOptions transport;
        std::optional<EncryptionMode> forcedMode;
        std::string securityContext{"encryption"};
        size_t eventQueueCapacity{256};
        size_t poolThreads{4};
        SpoolSettings spool;
        std::string logFile;
        std::optional<LogLevel> logLevel;
        size_t logMaxSizeMB{50};

        /**
         * @brief Read and validate every known key, falling back to defaults
         * @return InvalidConfig naming the first offending key
         */
        static Result<OrchestrationSettings> fromConfig(const Config& config);

        // Apply log.file, log.level and log.max_size_mb to the process-wide Logger
        void applyLogging() const;
    };

}
