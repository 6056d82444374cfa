#include "benchmark_helpers.hpp"
#include <cmath>
#include <numbers>
#include <sstream>
#include <stdexcept>
#include <string>
#include <type_traits>

namespace regionbridge_bench {

using namespace regionbridge;

// ============================================================================
// ImageConfig
// ============================================================================

std::string ImageConfig::name() const {
    std::ostringstream oss;
    oss << width << "x" << height << "_c" << channels;
    if (size_z > 1) {
        oss << "_z" << size_z;
    }
    if (size_time > 1) {
        oss << "_t" << size_time;
    }
    if (rgb) {
        oss << "_rgb";
    }
    return oss.str();
}

// ============================================================================
// ImageGenerator
// ============================================================================

template <typename T>
std::vector<T> ImageGenerator<T>::generate_random(const ImageConfig& config) {
    std::vector<T> data(config.num_samples());

    if constexpr (std::is_floating_point_v<T>) {
        std::uniform_real_distribution<T> dist(0.0, 1.0);
        for (auto& val : data) {
            val = dist(rng_);
        }
    } else if constexpr (std::is_same_v<T, uint8_t>) {
        std::uniform_int_distribution<int> dist(0, 255);
        for (auto& val : data) {
            val = static_cast<T>(dist(rng_));
        }
    } else {
        std::uniform_int_distribution<int> dist(0, 65535);
        for (auto& val : data) {
            val = static_cast<T>(dist(rng_));
        }
    }

    return data;
}

template <typename T>
std::vector<T> ImageGenerator<T>::generate_gradient(const ImageConfig& config, uint32_t offset) {
    std::vector<T> data(config.num_samples());

    for (uint32_t y = 0; y < config.height; ++y) {
        for (uint32_t x = 0; x < config.width; ++x) {
            T value;
            if constexpr (std::is_floating_point_v<T>) {
                value = static_cast<T>((x + y + offset) % 256) / T(255);
            } else {
                value = static_cast<T>((x + y + offset) % 256);
            }

            for (uint16_t c = 0; c < config.channels; ++c) {
                std::size_t idx = (static_cast<std::size_t>(y) * config.width + x) * config.channels + c;
                data[idx] = value;
            }
        }
    }

    return data;
}

template <typename T>
std::vector<T> ImageGenerator<T>::generate_constant(const ImageConfig& config, T value) {
    return std::vector<T>(config.num_samples(), value);
}

template <typename T>
InMemoryImageSource ImageGenerator<T>::make_source(const ImageConfig& config, ImagePattern pattern) {
    ImageMetadata metadata;
    metadata.id = "bench_" + config.name();
    metadata.width = config.width;
    metadata.height = config.height;
    metadata.channels = config.channels;
    metadata.size_z = config.size_z;
    metadata.size_time = config.size_time;
    metadata.pixel_type = pixel_type_of_v<T>;
    metadata.rgb = config.rgb;

    std::vector<Raster> planes;
    for (uint32_t i = 0; i < config.size_z * config.size_time; ++i) {
        std::vector<T> samples;
        switch (pattern) {
            case Gradient: samples = generate_gradient(config, i); break;
            case Random: samples = generate_random(config); break;
            case Constant: samples = generate_constant(config, T(1)); break;
        }
        auto raster = Raster::from_samples<T>(config.width, config.height, config.channels, samples);
        if (!raster) {
            throw std::runtime_error("Failed to build raster: " + raster.error().message);
        }
        planes.push_back(std::move(raster).value());
    }

    auto source = InMemoryImageSource::create(std::move(metadata), std::move(planes));
    if (!source) {
        throw std::runtime_error("Failed to build image source: " + source.error().message);
    }
    return std::move(source).value();
}

template class ImageGenerator<uint8_t>;
template class ImageGenerator<uint16_t>;
template class ImageGenerator<float>;

// ============================================================================
// ObjectGenerator
// ============================================================================

std::vector<RegionObject> ObjectGenerator::generate(std::size_t count, int vertices, int measurements) {
    static const char* const kClasses[] = {"Tumor", "Stroma", "Immune cells", "Necrosis"};

    std::uniform_real_distribution<double> position(0.0, 50000.0);
    std::uniform_real_distribution<double> radius(4.0, 20.0);
    std::uniform_real_distribution<double> value(0.0, 1000.0);
    std::uniform_int_distribution<int> class_index(0, 3);

    std::vector<RegionObject> objects;
    objects.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        const double cx = position(rng_);
        const double cy = position(rng_);
        Polygon outline;
        outline.exterior.reserve(static_cast<std::size_t>(vertices));
        for (int v = 0; v < vertices; ++v) {
            const double angle = 2.0 * std::numbers::pi * v / vertices;
            const double r = radius(rng_);
            outline.exterior.push_back({cx + r * std::cos(angle), cy + r * std::sin(angle)});
        }

        RegionObject object{generate_object_id(), Region{std::move(outline)}, ObjectType::Detection};
        object.set_classification(Classification{kClasses[class_index(rng_)]});
        for (int m = 0; m < measurements; ++m) {
            object.measurements()["Measurement " + std::to_string(m)] = value(rng_);
        }
        objects.push_back(std::move(object));
    }
    return objects;
}

} // namespace regionbridge_bench
