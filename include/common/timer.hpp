// File: common/timer.hpp

#ifndef COMMON_TIMER_HPP
#define COMMON_TIMER_HPP

#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>
#include <utility>

#include <fmt/format.h>

#include "common/logging/logger.hpp"

namespace common {

    /* Logs the elapsed wall time of a scope when destroyed or when stop() is called, whichever comes first. */
    class Timer {
    public:
        explicit Timer(std::string name) :
            name_(std::move(name)), start_time_(std::chrono::steady_clock::now()), stopped_(false) {
            LOG_DEBUG("Started timer for [{}]", name_);
        }

        ~Timer() {
            if (!stopped_) {
                stop();
            }
        }

        Timer(const Timer &) = delete;
        Timer &operator=(const Timer &) = delete;
        Timer(Timer &&) = delete;
        Timer &operator=(Timer &&) = delete;

        // Returns the elapsed time in microseconds.
        std::int64_t stop() noexcept {
            const auto elapsed = elapsedMicroseconds();
            if (!stopped_.exchange(true)) {
                try {
                    LOG_INFO("Execution time of {}: {} ({} µs).", name_, toHumanReadable(elapsed), elapsed);
                } catch (const std::exception &) {
                    // logging must not escape a destructor
                }
            }
            return elapsed;
        }

        [[nodiscard]] std::int64_t elapsedMicroseconds() const noexcept {
            return std::chrono::duration_cast<std::chrono::microseconds>(std::chrono::steady_clock::now() -
                                                                         start_time_)
                    .count();
        }

    private:
        std::string name_;
        std::chrono::steady_clock::time_point start_time_;
        std::atomic<bool> stopped_;

        static std::string toHumanReadable(const std::int64_t micros) {
            using namespace std::chrono;

            auto duration = microseconds(micros);
            const auto h = duration_cast<hours>(duration);
            duration -= h;
            const auto m = duration_cast<minutes>(duration);
            duration -= m;
            const auto s = duration_cast<seconds>(duration);
            duration -= s;
            const auto ms = duration_cast<milliseconds>(duration);
            duration -= ms;

            std::string result;
            if (h.count() > 0) {
                result += fmt::format("{}h ", h.count());
            }
            if (h.count() > 0 || m.count() > 0) {
                result += fmt::format("{}m ", m.count());
            }
            if (h.count() > 0 || m.count() > 0 || s.count() > 0) {
                result += fmt::format("{}s ", s.count());
            }
            if (h.count() > 0 || m.count() > 0 || s.count() > 0 || ms.count() > 0) {
                result += fmt::format("{}ms ", ms.count());
            }
            return result + fmt::format("{}µs", duration.count());
        }
    };

} // namespace common

#endif // COMMON_TIMER_HPP
