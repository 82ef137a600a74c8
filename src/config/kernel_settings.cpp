// File: config/kernel_settings.cpp

#include "config/kernel_settings.hpp"

#include <stdexcept>

#include "common/logging/logger.hpp"

namespace config {

    KernelSettings KernelSettings::load(const std::string &filename) {
        const Configuration configuration(filename);
        return fromConfiguration(configuration);
    }

    KernelSettings KernelSettings::fromConfiguration(const Configuration &configuration) {
        KernelSettings settings;
        settings.log_level = configuration.get("logging.level", settings.log_level.c_str());
        settings.log_file = configuration.get("logging.file", settings.log_file.c_str());
        settings.row_block_size = configuration.get<std::int64_t>("partition.row_block_size", settings.row_block_size);
        settings.col_block_size = configuration.get<std::int64_t>("partition.col_block_size", settings.col_block_size);
        settings.threads = configuration.get<int>("partition.threads", settings.threads);
        settings.eigenvalue_tolerance =
                configuration.get<double>("nystrom.eigenvalue_tolerance", settings.eigenvalue_tolerance);
        settings.validate();

        LOG_DEBUG("Kernel settings: blocks {} x {}, {} thread(s), eigenvalue tolerance {}", settings.row_block_size,
                  settings.col_block_size, settings.threads, settings.eigenvalue_tolerance);
        return settings;
    }

    void KernelSettings::validate() const {
        if (row_block_size <= 0) {
            LOG_ERROR("partition.row_block_size must be positive, got {}", row_block_size);
            throw std::invalid_argument("partition.row_block_size must be positive");
        }
        if (col_block_size <= 0) {
            LOG_ERROR("partition.col_block_size must be positive, got {}", col_block_size);
            throw std::invalid_argument("partition.col_block_size must be positive");
        }
        if (threads < 1) {
            LOG_ERROR("partition.threads must be at least 1, got {}", threads);
            throw std::invalid_argument("partition.threads must be at least 1");
        }
        if (!(eigenvalue_tolerance >= 0.0)) {
            LOG_ERROR("nystrom.eigenvalue_tolerance must be non-negative, got {}", eigenvalue_tolerance);
            throw std::invalid_argument("nystrom.eigenvalue_tolerance must be non-negative");
        }
    }

    void KernelSettings::apply() const {
        if (!common::logging::Logger::configure(log_level, log_file)) {
            LOG_WARN("Could not open log file '{}', logging at level '{}' to stdout only", log_file, log_level);
            return;
        }
        LOG_INFO("Logging at level '{}'{}", log_level, log_file.empty() ? "" : " to " + log_file);
    }

} // namespace config
