#pragma once

#include <nlohmann/json.hpp>
#include <string>

#include "config.hpp"

namespace resilient_rest {

    /**
     * @brief Build an EngineConfiguration from a settings document.
     *
     * Reads the `script-behavior` section:
     * `api-timeouts`, `retry-strategy`, `jitter`, `rate-limiting`,
     * `circuit-breaker` and `session-pool`. Required keys have no defaults;
     * a missing or mistyped one is a hard failure.
     *
     * @throws ConfigurationError naming the offending key path.
     */
    EngineConfiguration load_engine_configuration(const nlohmann::json& document);

    /// @brief Parse the JSON file at `path`, then load_engine_configuration().
    /// @throws ConfigurationError when the file is unreadable or malformed.
    EngineConfiguration load_engine_configuration_file(const std::string& path);

}  // namespace resilient_rest
