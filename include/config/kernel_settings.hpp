// File: config/kernel_settings.hpp

#ifndef CONFIG_KERNEL_SETTINGS_HPP
#define CONFIG_KERNEL_SETTINGS_HPP

#include <cstdint>
#include <string>

#include "config/configuration.hpp"
#include "matrix/block_scheduler.hpp"

namespace config {

    /*
     * Settings read by the orchestration layer before building kernel matrices. Missing keys keep
     * the defaults below.
     *
     *   logging.level                  trace|debug|info|warn|error|critical|off
     *   logging.file                   empty for stdout only
     *   partition.row_block_size       > 0
     *   partition.col_block_size       > 0
     *   partition.threads              >= 1
     *   nystrom.eigenvalue_tolerance   >= 0
     */
    struct KernelSettings {
        std::string log_level = "info";
        std::string log_file;
        std::int64_t row_block_size = 1000;
        std::int64_t col_block_size = 1000;
        int threads = 1;
        double eigenvalue_tolerance = 1e-10;

        // Throws std::runtime_error if the file cannot be loaded, std::invalid_argument on bad values.
        [[nodiscard]] static KernelSettings load(const std::string &filename);

        [[nodiscard]] static KernelSettings fromConfiguration(const Configuration &configuration);

        // Throws std::invalid_argument naming the first offending key.
        void validate() const;

        // Pushes the logging section into the logger. A log file that cannot be opened leaves stdout only.
        void apply() const;

        [[nodiscard]] matrix::BlockScheduler scheduler() const { return matrix::BlockScheduler(threads); }
    };

} // namespace config

#endif // CONFIG_KERNEL_SETTINGS_HPP
