#include "OrchestrationSettings.h"

#include <exception>
#include <limits>
#include <unordered_map>

namespace CodeDrop {

    namespace {

        const char* kComponent = "OrchestrationSettings";

        bool parseLong(const std::string& value, long long& out) {
            try {
                size_t pos = 0;
                out = std::stoll(value, &pos);
                return pos == value.size();
            } catch (const std::exception&) {
                return false;
            }
        }

        Config::Validator positiveInt() {
            return [](const std::string&, const std::string& value) {
                long long n = 0;
                return parseLong(value, n) && n > 0 && n <= std::numeric_limits<int>::max();
            };
        }

        Config::Validator intInRange(long long lo, long long hi) {
            return [lo, hi](const std::string&, const std::string& value) {
                long long n = 0;
                return parseLong(value, n) && n >= lo && n <= hi;
            };
        }

        bool validPortList(const std::string& value) {
            size_t start = 0;
            bool any = false;
            while (start <= value.size()) {
                size_t end = value.find(',', start);
                if (end == std::string::npos) {
                    end = value.size();
                }
                std::string item = value.substr(start, end - start);
                const auto first = item.find_first_not_of(" \t");
                const auto last = item.find_last_not_of(" \t");
                if (first != std::string::npos) {
                    item = item.substr(first, last - first + 1);
                    long long port = 0;
                    if (!parseLong(item, port) || port < 1 || port > 65535) {
                        return false;
                    }
                    any = true;
                }
                start = end + 1;
            }
            return any;
        }

        std::vector<int> portList(const Config& config, const std::string& key, const std::vector<int>& fallback) {
            if (!config.hasKey(key)) {
                return fallback;
            }
            std::vector<int> ports;
            for (const auto& item : config.getList(key)) {
                ports.push_back(std::stoi(item));
            }
            return ports;
        }

    } // namespace

    Result<OrchestrationSettings> OrchestrationSettings::fromConfig(const Config& config) {
        const std::unordered_map<std::string, Config::Validator> schema = {
            {"profiler.timeout_ms", positiveInt()},
            {"profiler.per_probe_timeout_ms", positiveInt()},
            {"profiler.web_ports", [](const std::string&, const std::string& v) { return validPortList(v); }},
            {"profiler.native_ports", [](const std::string&, const std::string& v) { return validPortList(v); }},
            {"transport.attempt_timeout_ms", positiveInt()},
            {"transport.availability_timeout_ms", positiveInt()},
            {"transport.max_total_timeout_ms", positiveInt()},
            {"security.force_mode", [](const std::string&, const std::string& v) {
                return v.empty() || parseEncryptionMode(v).has_value();
            }},
            {"security.context", [](const std::string&, const std::string& v) { return !v.empty(); }},
            {"events.queue_capacity", intInRange(1, 1000000)},
            {"pool.threads", intInRange(1, 64)},
            {"spool.priority", intInRange(-1000000, 1000000)},
            {"spool.poll_interval_ms", positiveInt()},
            {"spool.name", [](const std::string&, const std::string& v) { return !v.empty(); }},
            {"log.level", [](const std::string&, const std::string& v) { return parseLogLevel(v).has_value(); }},
            {"log.max_size_mb", intInRange(1, 4096)},
        };

        std::string failedKey;
        if (!config.validate(schema, &failedKey)) {
            return Error(ErrorCode::InvalidConfig,
                         "Invalid value for '" + failedKey + "': " + config.get(failedKey), kComponent);
        }

        OrchestrationSettings s;

        s.profiler.timeout = config.getMillis("profiler.timeout_ms", s.profiler.timeout);
        s.profiler.perProbeTimeout = config.getMillis("profiler.per_probe_timeout_ms", s.profiler.perProbeTimeout);
        s.profiler.hosts = config.getList("profiler.hosts", s.profiler.hosts);
        if (s.profiler.hosts.empty()) {
            return Error(ErrorCode::InvalidConfig, "profiler.hosts must name at least one host", kComponent);
        }
        s.profiler.webPorts = portList(config, "profiler.web_ports", s.profiler.webPorts);
        s.profiler.nativePorts = portList(config, "profiler.native_ports", s.profiler.nativePorts);

        s.transport.attemptTimeout = config.getMillis("transport.attempt_timeout_ms", s.transport.attemptTimeout);
        s.transport.availabilityTimeout =
            config.getMillis("transport.availability_timeout_ms", s.transport.availabilityTimeout);
        s.transport.maxTotalTimeout = config.getMillis("transport.max_total_timeout_ms", s.transport.maxTotalTimeout);

        const std::string forced = config.get("security.force_mode");
        if (!forced.empty()) {
            s.forcedMode = parseEncryptionMode(forced);
        }
        s.securityContext = config.get("security.context", s.securityContext);

        s.eventQueueCapacity = config.getSize("events.queue_capacity", s.eventQueueCapacity);
        s.poolThreads = config.getSize("pool.threads", s.poolThreads);

        s.spool.dir = config.get("spool.dir");
        s.spool.priority = config.getInt("spool.priority", s.spool.priority);
        s.spool.name = config.get("spool.name", s.spool.name);
        s.spool.pollInterval = config.getMillis("spool.poll_interval_ms", s.spool.pollInterval);

        s.logFile = config.get("log.file");
        s.logMaxSizeMB = config.getSize("log.max_size_mb", s.logMaxSizeMB);
        if (config.hasKey("log.level")) {
            s.logLevel = parseLogLevel(config.get("log.level"));
        }

        return s;
    }

    void OrchestrationSettings::applyLogging() const {
        auto& logger = Logger::instance();
        if (logLevel) {
            logger.setLevel(*logLevel);
        }
        if (!logFile.empty()) {
            logger.setMaxFileSize(logMaxSizeMB);
            logger.setLogFile(logFile);
        }
    }

}
