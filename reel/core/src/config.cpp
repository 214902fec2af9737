#include <reel/core/config.hpp>
#include <reel/core/logger.hpp>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace reel {

namespace {

std::vector<std::string> splitKey(const std::string& key) {
    std::vector<std::string> segments;
    std::stringstream ss(key);
    std::string segment;

    while (std::getline(ss, segment, '.')) {
        if (!segment.empty()) {
            segments.push_back(segment);
        }
    }
    return segments;
}

} // anonymous namespace

Config& Config::getInstance() {
    static Config instance;
    return instance;
}

Config::Config() : config_(nlohmann::json::object()) {}

void Config::loadFromFile(const std::string& configFile, bool merge) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::ifstream file(configFile);
    if (!file.is_open()) {
        REEL_LOG_ERROR("Failed to open config file: {}", configFile);
        throw std::runtime_error("Failed to open config file: " + configFile);
    }

    try {
        nlohmann::json newConfig;
        file >> newConfig;

        if (merge && config_.is_object()) {
            config_.merge_patch(newConfig);
        } else {
            config_ = newConfig;
        }

        REEL_LOG_INFO("Configuration loaded from file: {}", configFile);
    } catch (const nlohmann::json::exception& e) {
        REEL_LOG_ERROR("Failed to parse config file: {} - {}", configFile, e.what());
        throw std::runtime_error("Failed to parse config file: " + std::string(e.what()));
    }
}

void Config::loadFromJson(const nlohmann::json& json, bool merge) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (merge && config_.is_object()) {
        config_.merge_patch(json);
    } else {
        config_ = json;
    }
}

template<typename T>
T Config::get(const std::string& key, const T& defaultValue) const {
    std::lock_guard<std::mutex> lock(mutex_);

    const nlohmann::json* value = find(key);
    if (!value) {
        return defaultValue;
    }

    try {
        return value->get<T>();
    } catch (const nlohmann::json::exception& e) {
        REEL_LOG_WARN("Failed to get config key '{}', using default value: {}", key, e.what());
        return defaultValue;
    }
}

template<typename T>
bool Config::set(const std::string& key, const T& value, bool validate) {
    std::lock_guard<std::mutex> lock(mutex_);

    nlohmann::json jsonValue = value;

    if (validate && validator_) {
        if (!validator_(key, jsonValue)) {
            REEL_LOG_WARN("Config validation failed for key: {}", key);
            return false;
        }
    }

    getOrCreate(key) = std::move(jsonValue);
    return true;
}

bool Config::has(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return find(key) != nullptr;
}

bool Config::remove(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto segments = splitKey(key);
    if (segments.empty()) {
        return false;
    }

    nlohmann::json* current = &config_;
    for (size_t i = 0; i + 1 < segments.size(); ++i) {
        if (current->is_object() && current->contains(segments[i])) {
            current = &(*current)[segments[i]];
        } else {
            return false;
        }
    }

    if (current->is_object() && current->contains(segments.back())) {
        current->erase(segments.back());
        REEL_LOG_DEBUG("Config key removed: {}", key);
        return true;
    }

    return false;
}

void Config::saveToFile(const std::string& configFile, bool pretty) const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::ofstream file(configFile);
    if (!file.is_open()) {
        REEL_LOG_ERROR("Failed to open config file for writing: {}", configFile);
        throw std::runtime_error("Failed to open config file for writing: " + configFile);
    }

    file << (pretty ? config_.dump(4) : config_.dump());
    REEL_LOG_INFO("Configuration saved to file: {}", configFile);
}

nlohmann::json Config::toJson() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return config_;
}

void Config::setValidator(ConfigValidator validator) {
    std::lock_guard<std::mutex> lock(mutex_);
    validator_ = std::move(validator);
}

std::vector<std::string> Config::getKeys(const std::string& prefix) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> keys;

    const nlohmann::json* current = prefix.empty() ? &config_ : find(prefix);
    if (!current || !current->is_object()) {
        return keys;
    }

    for (auto it = current->begin(); it != current->end(); ++it) {
        keys.push_back(prefix.empty() ? it.key() : prefix + "." + it.key());
    }
    return keys;
}

void Config::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    config_ = nlohmann::json::object();
}

void Config::loadDefaults() {
    std::lock_guard<std::mutex> lock(mutex_);

    config_ = {
        {"stream", {
            {"cacheCapacity", DefaultConfig::kCacheCapacity}
        }},
        {"sequence", {
            {"frameRate", DefaultConfig::kSequenceFrameRate}
        }},
        {"image", {
            {"background", DefaultConfig::kBackground},
            {"normalize", DefaultConfig::kNormalizeImages}
        }},
        {"video", {
            {"threads", DefaultConfig::kDecoderThreads}
        }},
        {"logging", {
            {"level", DefaultConfig::kLogLevel}
        }}
    };

    REEL_LOG_DEBUG("Default configuration loaded");
}

const nlohmann::json* Config::find(const std::string& key) const {
    const nlohmann::json* current = &config_;
    for (const auto& seg : splitKey(key)) {
        if (!current->is_object() || !current->contains(seg)) {
            return nullptr;
        }
        current = &(*current)[seg];
    }
    return current;
}

nlohmann::json& Config::getOrCreate(const std::string& key) {
    nlohmann::json* current = &config_;
    for (const auto& seg : splitKey(key)) {
        if (!current->is_object()) {
            *current = nlohmann::json::object();
        }
        current = &(*current)[seg];
    }
    return *current;
}

template int Config::get<int>(const std::string&, const int&) const;
template double Config::get<double>(const std::string&, const double&) const;
template bool Config::get<bool>(const std::string&, const bool&) const;
template std::string Config::get<std::string>(const std::string&, const std::string&) const;

template bool Config::set<int>(const std::string&, const int&, bool);
template bool Config::set<double>(const std::string&, const double&, bool);
template bool Config::set<bool>(const std::string&, const bool&, bool);
template bool Config::set<std::string>(const std::string&, const std::string&, bool);

} // namespace reel
