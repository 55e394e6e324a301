#include "Config.h"
#include <fstream>
#include <sstream>
#include <exception>
#include <optional>

namespace CodeDrop {

    namespace {
        constexpr const char* kBlank = " \t\r\n";

        // "key = value" with optional surrounding blanks; comments and junk yield nullopt
        std::optional<std::pair<std::string, std::string>> splitEntry(const std::string& raw) {
            const auto first = raw.find_first_not_of(kBlank);
            if (first == std::string::npos || raw[first] == '#') return std::nullopt;

            const auto eq = raw.find('=', first);
            if (eq == std::string::npos) return std::nullopt;

            auto clip = [](const std::string& s, size_t from, size_t to) -> std::string {
                const auto b = s.find_first_not_of(kBlank, from);
                if (b == std::string::npos || b >= to) return {};
                const auto e = s.find_last_not_of(kBlank, to - 1);
                return s.substr(b, e - b + 1);
            };

            std::string key = clip(raw, first, eq);
            if (key.empty()) return std::nullopt;
            return std::make_pair(std::move(key), clip(raw, eq + 1, raw.size()));
        }
    }

    Config::Config(const Config& other) {
        std::lock_guard<std::mutex> lock(other.mutex_);
        settings_ = other.settings_;
    }

    Config& Config::operator=(const Config& other) {
        if (this == &other) return *this;
        std::unordered_map<std::string, std::string> snapshot;
        {
            std::lock_guard<std::mutex> lock(other.mutex_);
            snapshot = other.settings_;
        }
        std::lock_guard<std::mutex> lock(mutex_);
        settings_.swap(snapshot);
        return *this;
    }

    bool Config::loadFromFile(const std::string& path, bool overrideExisting) {
        std::ifstream in(path);
        if (!in) return false;
        parseLines(in, overrideExisting);
        return true;
    }

    bool Config::loadLayered(const std::vector<std::string>& paths, bool overrideExisting) {
        size_t layers = 0;
        for (const auto& layer : paths) {
            layers += loadFromFile(layer, overrideExisting) ? 1 : 0;
        }
        return layers > 0;
    }

    bool Config::loadFromString(const std::string& text, bool overrideExisting) {
        std::istringstream in(text);
        parseLines(in, overrideExisting);
        return true;
    }

    void Config::parseLines(std::istream& in, bool overrideExisting) {
        std::unordered_map<std::string, std::string> layer;
        for (std::string raw; std::getline(in, raw);) {
            if (auto entry = splitEntry(raw)) {
                // Within one layer the last assignment wins
                layer[entry->first] = std::move(entry->second);
            }
        }

        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& kv : layer) {
            storeKV(kv.first, kv.second, overrideExisting);
        }
    }

    bool Config::hasKey(const std::string& key) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return settings_.count(key) != 0;
    }

    std::string Config::get(const std::string& key, const std::string& defaultValue) const {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto found = settings_.find(key);
        return found == settings_.end() ? defaultValue : found->second;
    }

    void Config::set(const std::string& key, const std::string& value) {
        std::lock_guard<std::mutex> lock(mutex_);
        settings_[key] = value;
    }

    int Config::getInt(const std::string& key, int defaultValue) const {
        const std::string raw = get(key);
        if (raw.empty()) return defaultValue;
        try {
            size_t used = 0;
            const int parsed = std::stoi(raw, &used);
            return used == raw.size() ? parsed : defaultValue;
        } catch (const std::exception&) {
            return defaultValue;
        }
    }

    size_t Config::getSize(const std::string& key, size_t defaultValue) const {
        const std::string raw = get(key);
        // stoull accepts a leading '-' and wraps it
        if (raw.empty() || raw.front() == '-') return defaultValue;
        try {
            size_t used = 0;
            const auto parsed = std::stoull(raw, &used);
            return used == raw.size() ? static_cast<size_t>(parsed) : defaultValue;
        } catch (const std::exception&) {
            return defaultValue;
        }
    }

    std::chrono::milliseconds Config::getMillis(const std::string& key,
                                                std::chrono::milliseconds defaultValue) const {
        const std::string raw = get(key);
        if (raw.empty()) return defaultValue;
        try {
            size_t used = 0;
            const long long ms = std::stoll(raw, &used);
            if (used != raw.size() || ms < 0) return defaultValue;
            return std::chrono::milliseconds(ms);
        } catch (const std::exception&) {
            return defaultValue;
        }
    }

    std::vector<std::string> Config::getList(const std::string& key,
                                             const std::vector<std::string>& defaultValue) const {
        if (!hasKey(key)) return defaultValue;

        std::vector<std::string> items;
        std::istringstream in(get(key));
        for (std::string piece; std::getline(in, piece, ',');) {
            piece = trim(piece);
            if (!piece.empty()) items.push_back(std::move(piece));
        }
        return items;
    }

    bool Config::validate(const std::unordered_map<std::string, Validator>& schema,
                          std::string* failedKey) const {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& rule : schema) {
            const auto found = settings_.find(rule.first);
            if (found == settings_.end() || !rule.second) continue;
            if (!rule.second(found->first, found->second)) {
                if (failedKey) *failedKey = rule.first;
                return false;
            }
        }
        return true;
    }

    std::string Config::trim(const std::string& value) {
        const auto b = value.find_first_not_of(kBlank);
        if (b == std::string::npos) return {};
        return value.substr(b, value.find_last_not_of(kBlank) - b + 1);
    }

    bool Config::storeKV(const std::string& key, const std::string& value, bool overrideExisting) {
        if (!overrideExisting && settings_.count(key) != 0) return false;
        settings_[key] = value;
        return true;
    }

}
