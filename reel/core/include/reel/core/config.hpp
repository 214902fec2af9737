/**
 * @file config.hpp
 * @brief JSON backed runtime configuration
 *
 * Keys are dot separated paths into a nested JSON document, e.g.
 * "stream.cacheCapacity".
 */

#pragma once

#include <string>
#include <vector>
#include <mutex>
#include <functional>
#include <nlohmann/json.hpp>

namespace reel {

/**
 * @brief Validation callback for Config::set
 * @return true if the value may be stored under key
 */
using ConfigValidator = std::function<bool(const std::string& key, const nlohmann::json& value)>;

class Config {
public:
    static Config& getInstance();

    /**
     * @brief Load configuration from a JSON file
     * @param configFile Path to the file
     * @param merge Merge into the current document (true) or replace it (false)
     * @throw std::runtime_error if the file cannot be read or parsed
     */
    void loadFromFile(const std::string& configFile, bool merge = true);

    /**
     * @brief Load configuration from a JSON object
     */
    void loadFromJson(const nlohmann::json& json, bool merge = true);

    /**
     * @brief Get a configuration value
     * @param key Dot separated key
     * @param defaultValue Returned when the key is missing or has the wrong type
     */
    template<typename T>
    T get(const std::string& key, const T& defaultValue = T{}) const;

    /**
     * @brief Set a configuration value
     * @param validate Run the installed validator first
     * @return false if validation failed
     */
    template<typename T>
    bool set(const std::string& key, const T& value, bool validate = true);

    bool has(const std::string& key) const;

    bool remove(const std::string& key);

    void saveToFile(const std::string& configFile, bool pretty = true) const;

    nlohmann::json toJson() const;

    void setValidator(ConfigValidator validator);

    /// Keys directly below prefix (top level keys if prefix is empty)
    std::vector<std::string> getKeys(const std::string& prefix = "") const;

    void clear();

    /// Replace the document with the library defaults
    void loadDefaults();

private:
    Config();
    ~Config() = default;
    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;

    const nlohmann::json* find(const std::string& key) const;
    nlohmann::json& getOrCreate(const std::string& key);

    nlohmann::json config_;
    mutable std::mutex mutex_;
    ConfigValidator validator_;
};

/// Default values of the keys read by the library
struct DefaultConfig {
    static constexpr int kCacheCapacity = 1;
    static constexpr int kSequenceFrameRate = 30;
    static constexpr const char* kBackground = "checkerboard";
    static constexpr bool kNormalizeImages = false;
    static constexpr int kDecoderThreads = 0;
    static constexpr const char* kLogLevel = "info";
};

} // namespace reel
