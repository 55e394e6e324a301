#pragma once

#include <chrono>
#include <string>
#include <vector>
#include <unordered_map>
#include <functional>
#include <mutex>

namespace CodeDrop {

    /**
     * @brief key=value configuration store
     *
     * Lines starting with '#' are comments. Later layers override earlier ones
     * unless overrideExisting is false. One instance per OrchestrationContext.
     */
    class Config {
    public:
        using Validator = std::function<bool(const std::string& key, const std::string& value)>;

        Config() = default;
        Config(const Config& other);
        Config& operator=(const Config& other);

        bool loadFromFile(const std::string& path, bool overrideExisting = true);
        bool loadLayered(const std::vector<std::string>& paths, bool overrideExisting = true);
        bool loadFromString(const std::string& text, bool overrideExisting = true);

        bool hasKey(const std::string& key) const;

        std::string get(const std::string& key, const std::string& defaultValue = "") const;
        void set(const std::string& key, const std::string& value);

        // Malformed or missing values yield the default
        int getInt(const std::string& key, int defaultValue = 0) const;
        size_t getSize(const std::string& key, size_t defaultValue = 0) const;
        std::chrono::milliseconds getMillis(const std::string& key, std::chrono::milliseconds defaultValue) const;

        // Comma separated list, entries trimmed, empty entries dropped
        std::vector<std::string> getList(const std::string& key,
                                         const std::vector<std::string>& defaultValue = {}) const;

        /**
         * @brief Run validators against present keys
         * @param failedKey Receives the first key that failed, if any
         */
        bool validate(const std::unordered_map<std::string, Validator>& schema,
                      std::string* failedKey = nullptr) const;

    private:
        std::unordered_map<std::string, std::string> settings_;
        mutable std::mutex mutex_;

        static std::string trim(const std::string& value);
        void parseLines(std::istream& in, bool overrideExisting);
        bool storeKV(const std::string& key, const std::string& value, bool overrideExisting);
    };

}
