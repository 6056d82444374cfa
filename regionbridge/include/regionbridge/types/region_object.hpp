#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <random>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include "geometry.hpp"

namespace regionbridge {

enum class ObjectType : uint8_t {
    Annotation,
    Detection,
    Tile,
    Cell
};

[[nodiscard]] constexpr std::string_view to_string(ObjectType type) noexcept {
    switch (type) {
        case ObjectType::Annotation: return "annotation";
        case ObjectType::Detection: return "detection";
        case ObjectType::Tile: return "tile";
        case ObjectType::Cell: return "cell";
    }
    return "annotation";
}

/// @brief Parse an objectType property, unknown names map to Annotation
[[nodiscard]] constexpr ObjectType object_type_from_string(std::string_view name) noexcept {
    if (name == "detection") return ObjectType::Detection;
    if (name == "tile") return ObjectType::Tile;
    if (name == "cell") return ObjectType::Cell;
    return ObjectType::Annotation;
}

struct Color {
    uint8_t r = 0;
    uint8_t g = 0;
    uint8_t b = 0;

    bool operator==(const Color&) const noexcept = default;
};

/// @brief Classification label, possibly derived from several class names
class Classification {
public:
    explicit Classification(std::string name, std::optional<Color> color = std::nullopt)
        : names_{std::move(name)}, color_(color) {}

    explicit Classification(std::vector<std::string> names, std::optional<Color> color = std::nullopt)
        : names_(std::move(names)), color_(color) {}

    [[nodiscard]] const std::vector<std::string>& names() const noexcept { return names_; }
    [[nodiscard]] const std::optional<Color>& color() const noexcept { return color_; }

    /// Names joined with ": " ("Tumor: Positive")
    [[nodiscard]] std::string to_string() const {
        std::string joined;
        for (std::size_t i = 0; i < names_.size(); ++i) {
            if (i > 0) joined += ": ";
            joined += names_[i];
        }
        return joined;
    }

    bool operator==(const Classification&) const = default;

private:
    std::vector<std::string> names_;
    std::optional<Color> color_;
};

using MeasurementMap = std::map<std::string, double>;

/// @brief Generate a random (version 4) UUID string
[[nodiscard]] inline std::string generate_object_id() {
    thread_local std::mt19937_64 rng{std::random_device{}()};
    std::uniform_int_distribution<uint64_t> dist;
    uint64_t hi = dist(rng);
    uint64_t lo = dist(rng);
    hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

    static constexpr char hex[] = "0123456789abcdef";
    std::string id;
    id.reserve(36);
    for (int i = 15; i >= 0; --i) {
        id += hex[(hi >> (i * 4)) & 0xF];
        if (i == 8 || i == 4) id += '-';
    }
    id += '-';
    for (int i = 15; i >= 0; --i) {
        id += hex[(lo >> (i * 4)) & 0xF];
        if (i == 12) id += '-';
    }
    return id;
}

/// @brief Classified, measured region with a stable identifier
/// @note Serialized as one flat Feature; parent/child links are not part of it
class RegionObject {
public:
    RegionObject() = default;

    RegionObject(std::string id, Region region, ObjectType type = ObjectType::Annotation)
        : id_(std::move(id)), region_(std::move(region)), type_(type) {}

    /// @brief Create an object with a freshly generated identifier
    [[nodiscard]] static RegionObject create(Region region, ObjectType type = ObjectType::Annotation) {
        return RegionObject{generate_object_id(), std::move(region), type};
    }

    [[nodiscard]] const std::string& id() const noexcept { return id_; }
    [[nodiscard]] const Region& region() const noexcept { return region_; }
    [[nodiscard]] ObjectType object_type() const noexcept { return type_; }
    [[nodiscard]] const std::optional<Classification>& classification() const noexcept { return classification_; }
    [[nodiscard]] const std::optional<std::string>& name() const noexcept { return name_; }
    [[nodiscard]] const std::optional<Color>& color() const noexcept { return color_; }
    [[nodiscard]] bool locked() const noexcept { return locked_; }
    [[nodiscard]] const MeasurementMap& measurements() const noexcept { return measurements_; }
    [[nodiscard]] MeasurementMap& measurements() noexcept { return measurements_; }

    void set_classification(std::optional<Classification> classification) { classification_ = std::move(classification); }
    void set_name(std::optional<std::string> name) { name_ = std::move(name); }
    void set_color(std::optional<Color> color) noexcept { color_ = color; }
    void set_locked(bool locked) noexcept { locked_ = locked; }

    bool operator==(const RegionObject&) const = default;

private:
    std::string id_;
    Region region_;
    ObjectType type_ = ObjectType::Annotation;
    std::optional<Classification> classification_;
    std::optional<std::string> name_;
    std::optional<Color> color_;
    bool locked_ = false;
    MeasurementMap measurements_;
};

} // namespace regionbridge
