#pragma once

#include <cstdint>
#include <random>
#include <string>
#include <vector>

#include <benchmark/benchmark.h>

#include "../regionbridge/include/regionbridge/image_source.hpp"
#include "../regionbridge/include/regionbridge/types/region_object.hpp"

namespace regionbridge_bench {

/// Test image configuration
struct ImageConfig {
    uint32_t width;
    uint32_t height;
    uint16_t channels;
    uint32_t size_z = 1;
    uint32_t size_time = 1;
    bool rgb = false;

    std::string name() const;
    std::size_t num_samples() const {
        return static_cast<std::size_t>(width) * height * channels;
    }
};

/// Predefined image configurations for benchmarking
namespace configs {
    constexpr ImageConfig large_rgb{2048, 2048, 3, 1, 1, true};

    // Fluorescence-style hyperstacks
    constexpr ImageConfig stack_small{256, 256, 3, 4, 1};
    constexpr ImageConfig stack_medium{512, 512, 4, 8, 2};
}

enum ImagePattern {
    Gradient,
    Random,
    Constant
};

/// Image data generator
template <typename T>
class ImageGenerator {
public:
    explicit ImageGenerator(uint64_t seed = 42) : rng_(seed) {}

    /// Generate random plane data
    std::vector<T> generate_random(const ImageConfig& config);

    /// Generate gradient pattern (compressible)
    std::vector<T> generate_gradient(const ImageConfig& config, uint32_t offset = 0);

    /// Generate constant value (highly compressible)
    std::vector<T> generate_constant(const ImageConfig& config, T value);

    /// Build an in-memory image with one generated raster per (z, t)
    regionbridge::InMemoryImageSource make_source(const ImageConfig& config, ImagePattern pattern);

private:
    std::mt19937_64 rng_;
};

/// Region object generator
class ObjectGenerator {
public:
    explicit ObjectGenerator(uint64_t seed = 42) : rng_(seed) {}

    /// Detections with random polygon outlines, classifications and measurements
    /// @param count Number of objects
    /// @param vertices Vertices per outline
    /// @param measurements Measurements per object
    std::vector<regionbridge::RegionObject> generate(std::size_t count, int vertices, int measurements);

private:
    std::mt19937_64 rng_;
};

} // namespace regionbridge_bench
