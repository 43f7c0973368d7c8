#pragma once

#include <memory>
#include <spdlog/spdlog.h>

namespace resilient_rest::log {

    /// @brief The library's named spdlog logger ("resilient_rest").
    /// Created on first use as a colored stderr sink unless a logger of that
    /// name is already registered or one was installed with set_logger().
    std::shared_ptr<spdlog::logger> logger();

    /// @brief Route all library logging through `replacement`.
    /// Passing nullptr restores the default logger on next use.
    void set_logger(std::shared_ptr<spdlog::logger> replacement);

}  // namespace resilient_rest::log
