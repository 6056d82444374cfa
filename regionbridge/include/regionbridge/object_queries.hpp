#pragma once

#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>
#include "types/region_object.hpp"

namespace regionbridge {

/// @brief Identifiers of the objects, in input order
[[nodiscard]] inline std::vector<std::string> object_ids(std::span<const RegionObject> objects) {
    std::vector<std::string> ids;
    ids.reserve(objects.size());
    for (const auto& object : objects) {
        ids.push_back(object.id());
    }
    return ids;
}

/// @brief Distinct measurement names, in order of first appearance
/// @note Within one object names appear in map order
[[nodiscard]] inline std::vector<std::string> measurement_names(std::span<const RegionObject> objects) {
    std::vector<std::string> names;
    std::unordered_set<std::string> seen;
    for (const auto& object : objects) {
        for (const auto& [name, value] : object.measurements()) {
            if (seen.insert(name).second) {
                names.push_back(name);
            }
        }
    }
    return names;
}

/// @brief One measurement of every object; empty where an object lacks it
[[nodiscard]] inline std::vector<std::optional<double>> measurement_values(
    std::span<const RegionObject> objects,
    std::string_view name) {

    std::vector<std::optional<double>> values;
    values.reserve(objects.size());
    const std::string key(name);
    for (const auto& object : objects) {
        auto it = object.measurements().find(key);
        values.push_back(it != object.measurements().end() ? std::optional<double>{it->second} : std::nullopt);
    }
    return values;
}

} // namespace regionbridge
