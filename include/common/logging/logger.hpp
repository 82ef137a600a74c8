// File: common/logging/logger.hpp

#ifndef COMMON_LOGGING_LOGGER_HPP
#define COMMON_LOGGING_LOGGER_HPP

#include <atomic>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>

#include <spdlog/fmt/ostr.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "common/formatting/fmt_block_index.hpp"
#include "common/formatting/fmt_eigen.hpp"

// NOTE: Logger MUST NOT depend on config::Configuration, as it will cause a circular dependency
namespace common::logging {

    class Logger {
    public:
        Logger(const Logger &) = delete;

        Logger &operator=(const Logger &) = delete;

        ~Logger() = default;

        template<typename... Args>
        static void log(spdlog::level::level_enum level, const char *file, int line, const char *func,
                        fmt::format_string<Args...> format, Args &&...args);

        // Rebuild the sinks. An empty log_file keeps output on stdout only.
        // Returns false if the file sink could not be created; logging then continues on stdout only.
        [[nodiscard]] static bool configure(const std::string &level, const std::string &log_file = {});

        static void setLogLevel(const std::string &level);

        static void setPattern(const std::string &pattern);

        // Unknown names fall back to info.
        static spdlog::level::level_enum getLogLevel(std::string_view level);

        static std::shared_ptr<spdlog::logger> getLogger();

    private:
        // Readers load without locking; sink_mutex_ only serialises reconfiguration.
        static std::atomic<std::shared_ptr<spdlog::logger>> logger_;
        static std::string pattern_;
        static spdlog::level::level_enum level_;
        static std::once_flag init_flag_;
        static std::mutex sink_mutex_;

        static void init();

        static bool initialize(const std::string &log_file);
    };

#define LOG_(level, fmt, ...)                                                                                          \
    common::logging::Logger::log(level, __FILE__, __LINE__, __FUNCTION__, fmt, ##__VA_ARGS__)
#define LOG_TRACE(fmt, ...) LOG_(spdlog::level::trace, fmt, ##__VA_ARGS__)
#define LOG_DEBUG(fmt, ...) LOG_(spdlog::level::debug, fmt, ##__VA_ARGS__)
#define LOG_INFO(fmt, ...) LOG_(spdlog::level::info, fmt, ##__VA_ARGS__)
#define LOG_WARN(fmt, ...) LOG_(spdlog::level::warn, fmt, ##__VA_ARGS__)
#define LOG_ERROR(fmt, ...) LOG_(spdlog::level::err, fmt, ##__VA_ARGS__)
#define LOG_CRITICAL(fmt, ...) LOG_(spdlog::level::critical, fmt, ##__VA_ARGS__)

    template<typename... Args>
    void Logger::log(spdlog::level::level_enum level, const char *file, int line, const char *func,
                     fmt::format_string<Args...> format, Args &&...args) {
        const auto logger = getLogger();
        if (logger) {
            spdlog::source_loc source{file, line, func};
            logger->log(source, level, format, std::forward<Args>(args)...);
        } else {
            std::cerr << "Logger not initialized!" << std::endl;
        }
    }

} // namespace common::logging

#endif // COMMON_LOGGING_LOGGER_HPP
