#include "resilient_rest/logging.hpp"

#include <mutex>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace resilient_rest::log {

    namespace {
        constexpr const char* kLoggerName = "resilient_rest";

        std::mutex& logger_mutex() {
            static std::mutex mu;
            return mu;
        }

        std::shared_ptr<spdlog::logger>& current() {
            static std::shared_ptr<spdlog::logger> instance;
            return instance;
        }
    }  // namespace

    std::shared_ptr<spdlog::logger> logger() {
        std::lock_guard<std::mutex> lk(logger_mutex());
        auto& instance = current();
        if (!instance) {
            instance = spdlog::get(kLoggerName);
            if (!instance) {
                instance = spdlog::stderr_color_mt(kLoggerName);
                instance->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%l] %v");
            }
        }
        return instance;
    }

    void set_logger(std::shared_ptr<spdlog::logger> replacement) {
        std::lock_guard<std::mutex> lk(logger_mutex());
        current() = std::move(replacement);
    }

}  // namespace resilient_rest::log
