// File: config/configuration.cpp

#include "config/configuration.hpp"

#include <stdexcept>
#include <utility>

namespace config {

    namespace {
        YAML::Node loadFile(const std::string &filename) {
            LOG_INFO("Loading configuration from file: {}", filename);
            try {
                return YAML::LoadFile(filename);
            } catch (const YAML::BadFile &e) {
                LOG_CRITICAL("Configuration file '{}' could not be opened: {}", filename, e.what());
                throw std::runtime_error("Configuration file could not be opened: " + filename);
            } catch (const YAML::Exception &e) {
                LOG_CRITICAL("YAML exception while loading configuration '{}': {}", filename, e.what());
                throw std::runtime_error("Malformed configuration file: " + filename);
            }
        }
    } // namespace

    Configuration::Configuration(std::string filename) : Configuration(loadFile(filename), filename) {}

    Configuration::Configuration(const YAML::Node &root, std::string source) : source_(std::move(source)) {
        if (root.IsDefined() && !root.IsNull() && !root.IsMap()) {
            LOG_CRITICAL("Configuration '{}' must be a YAML mapping at the top level", source_);
            throw std::runtime_error("Configuration root must be a mapping: " + source_);
        }
        load(root);
        LOG_DEBUG("Configuration '{}' loaded with {} keys", source_, config_map_.size());
    }

    Configuration Configuration::fromString(const std::string &yaml) {
        YAML::Node root;
        try {
            root = YAML::Load(yaml);
        } catch (const YAML::Exception &e) {
            LOG_CRITICAL("YAML exception while parsing configuration text: {}", e.what());
            throw std::runtime_error("Malformed configuration text");
        }
        return Configuration(root, "<string>");
    }

    void Configuration::load(const YAML::Node &node, const std::string &prefix) {
        if (!node.IsMap()) {
            return;
        }
        for (const auto &it: node) {
            const std::string key =
                    prefix.empty() ? it.first.as<std::string>() : prefix + "." + it.first.as<std::string>();
            if (it.second.IsMap()) {
                load(it.second, key);
            } else {
                config_map_[key] = it.second;
                LOG_TRACE("Loaded key: '{}', value: '{}'", key,
                          it.second.IsScalar() ? it.second.as<std::string>() : "[non-scalar]");
            }
        }
    }

    void Configuration::show() const {
        std::shared_lock lock(mutex_);
        LOG_INFO("Configuration details ({}):", source_);
        for (const auto &[key, value]: config_map_) {
            LOG_INFO("{}: {}", key, value.IsScalar() ? value.as<std::string>() : "[non-scalar]");
        }
    }

} // namespace config
