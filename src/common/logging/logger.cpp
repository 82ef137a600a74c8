// File: common/logging/logger.cpp

#include "common/logging/logger.hpp"

#include <filesystem>
#include <unordered_map>
#include <utility>
#include <vector>

namespace common::logging {

    std::atomic<std::shared_ptr<spdlog::logger>> Logger::logger_;
    spdlog::level::level_enum Logger::level_ = spdlog::level::info;
    std::string Logger::pattern_ = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] [%s:%# %!] %v";
    std::once_flag Logger::init_flag_;
    std::mutex Logger::sink_mutex_;

    void Logger::init() {
        std::lock_guard lock(sink_mutex_);
        static_cast<void>(initialize({}));
    }

    bool Logger::initialize(const std::string &log_file) {
        try {
            std::vector<spdlog::sink_ptr> sinks;
            sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
            if (!log_file.empty()) {
                const std::filesystem::path path(log_file);
                if (path.has_parent_path() && !std::filesystem::exists(path.parent_path())) {
                    std::filesystem::create_directories(path.parent_path());
                }
                sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file, true));
            }

            auto logger = std::make_shared<spdlog::logger>("gramian", sinks.begin(), sinks.end());
            logger->set_level(level_);
            logger->set_pattern(pattern_);

            spdlog::drop("gramian");
            spdlog::register_logger(logger);
            logger_.store(std::move(logger));
            return true;
        } catch (const spdlog::spdlog_ex &ex) {
            std::cerr << "Log initialization failed: " << ex.what() << std::endl;
        } catch (const std::filesystem::filesystem_error &ex) {
            std::cerr << "Log directory could not be created: " << ex.what() << std::endl;
        }

        // Fall back to stdout so the requested level still takes effect.
        if (!log_file.empty()) {
            static_cast<void>(initialize({}));
        }
        return false;
    }

    bool Logger::configure(const std::string &level, const std::string &log_file) {
        std::call_once(init_flag_, []() { init(); });
        std::lock_guard lock(sink_mutex_);
        level_ = getLogLevel(level);
        return initialize(log_file);
    }

    void Logger::setLogLevel(const std::string &level) {
        std::call_once(init_flag_, []() { init(); });
        std::lock_guard lock(sink_mutex_);
        level_ = getLogLevel(level);
        if (const auto logger = logger_.load()) {
            logger->set_level(level_);
        }
    }

    void Logger::setPattern(const std::string &pattern) {
        std::call_once(init_flag_, []() { init(); });
        std::lock_guard lock(sink_mutex_);
        pattern_ = pattern;
        if (const auto logger = logger_.load()) {
            logger->set_pattern(pattern_);
        }
    }

    spdlog::level::level_enum Logger::getLogLevel(const std::string_view level) {
        static const std::unordered_map<std::string_view, spdlog::level::level_enum> level_map = {
                {"trace", spdlog::level::trace}, {"debug", spdlog::level::debug},
                {"info", spdlog::level::info},   {"warn", spdlog::level::warn},
                {"error", spdlog::level::err},   {"critical", spdlog::level::critical},
                {"off", spdlog::level::off}};
        const auto iterator = level_map.find(level);
        return iterator != level_map.end() ? iterator->second : spdlog::level::info;
    }

    std::shared_ptr<spdlog::logger> Logger::getLogger() {
        std::call_once(init_flag_, []() { init(); });
        return logger_.load();
    }

} // namespace common::logging
