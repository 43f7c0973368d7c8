#pragma once

#include <nlohmann/json.hpp>
#include <string>

#include "operation_result.hpp"

namespace resilient_rest {

    // Overload for types adaptable to nlohmann::json
    /// @throws OperationError when the payload is not JSON,
    /// nlohmann::json::exception when it does not fit T.
    template <typename T>
    void deserialize(const OperationResult& result, T& out) {
        result.json().get_to(out);
    }

    template <typename T>
    T deserialize(const OperationResult& result) {
        T out{};
        deserialize(result, out);
        return out;
    }

    /// @brief Request body for any type nlohmann::json can serialize.
    template <typename T>
    std::string to_json_body(const T& value) {
        return nlohmann::json(value).dump();
    }

}  // namespace resilient_rest
