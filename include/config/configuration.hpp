// File: config/configuration.hpp

#ifndef CONFIG_CONFIGURATION_HPP
#define CONFIG_CONFIGURATION_HPP

#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <yaml-cpp/yaml.h>

#include "common/logging/logger.hpp"

namespace config {

    /*
     * YAML document flattened into dotted keys, e.g. "partition.row_block_size".
     */
    class Configuration {
    public:
        Configuration(const Configuration &) = delete;

        Configuration &operator=(const Configuration &) = delete;

        ~Configuration() = default;

        // Loads a YAML file; throws std::runtime_error if it cannot be read or parsed.
        explicit Configuration(std::string filename);

        // Parses YAML text; throws std::runtime_error if it is malformed.
        [[nodiscard]] static Configuration fromString(const std::string &yaml);

        [[nodiscard]] bool contains(const std::string &key) const;

        // Logs every key with its value.
        void show() const;

        // Empty if the key is missing or not convertible to T.
        template<typename T>
        [[nodiscard]] std::optional<T> get(const std::string &key) const;

        template<typename T>
        [[nodiscard]] T get(const std::string &key, T default_value) const;

        [[nodiscard]] std::string get(const std::string &key, const char *default_value) const;

        [[nodiscard]] const std::string &source() const noexcept { return source_; }

    private:
        Configuration(const YAML::Node &root, std::string source);

        std::unordered_map<std::string, YAML::Node> config_map_;
        std::string source_;
        mutable std::shared_mutex mutex_;

        void load(const YAML::Node &node, const std::string &prefix = "");
    };

    template<typename T>
    std::optional<T> Configuration::get(const std::string &key) const {
        std::shared_lock lock(mutex_);
        const auto it = config_map_.find(key);
        if (it == config_map_.end()) {
            LOG_DEBUG("Key '{}' not found in configuration '{}'", key, source_);
            return std::nullopt;
        }
        try {
            return it->second.as<T>();
        } catch (const YAML::Exception &e) {
            LOG_ERROR("YAML conversion failed for key '{}': {}", key, e.what());
            return std::nullopt;
        }
    }

    template<typename T>
    T Configuration::get(const std::string &key, T default_value) const {
        auto value = get<T>(key);
        return value ? *value : default_value;
    }

    // yaml-cpp misbehaves with const char*, route it through std::string
    inline std::string Configuration::get(const std::string &key, const char *default_value) const {
        return get<std::string>(key, std::string(default_value));
    }

    inline bool Configuration::contains(const std::string &key) const {
        std::shared_lock lock(mutex_);
        return config_map_.contains(key);
    }

} // namespace config

#endif // CONFIG_CONFIGURATION_HPP
