#pragma once

#include <nlohmann/json.hpp>

namespace regionbridge {

/// @brief Remove null-valued members from a JSON object, in place
/// @param json Object to sanitize; non-object values are left untouched
/// @note Recurses into member objects, not into array elements
/// @note Idempotent
inline void strip_nulls(nlohmann::json& json) {
    if (!json.is_object()) {
        return;
    }
    for (auto it = json.begin(); it != json.end();) {
        if (it->is_null()) {
            it = json.erase(it);
            continue;
        }
        if (it->is_object()) {
            strip_nulls(*it);
        }
        ++it;
    }
}

} // namespace regionbridge
