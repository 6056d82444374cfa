#include <benchmark/benchmark.h>
#include <cstdint>
#include <numeric>
#include <string>
#include <vector>

#include "benchmark_helpers.hpp"

#include "../regionbridge/include/regionbridge/geometry_codec.hpp"
#include "../regionbridge/include/regionbridge/parallel_dispatch.hpp"
#include "../regionbridge/include/regionbridge/region_exporter.hpp"
#include "../regionbridge/include/regionbridge/tiff_stack_writer.hpp"

using namespace regionbridge;
using namespace regionbridge_bench;

namespace {

CodecConfig config_for_mode(ExecutionMode mode) {
    CodecConfig config;
    if (mode == ExecutionMode::Sequential) {
        config.thresholds = {.decode_array = SIZE_MAX, .chunk_encode = SIZE_MAX, .feature_list = SIZE_MAX};
    } else {
        config.thresholds = {.decode_array = 0, .chunk_encode = 0, .feature_list = 0};
    }
    return config;
}

} // namespace

// ============================================================================
// GeoJSON Encoding
// ============================================================================

static void BM_Encode_Collection(benchmark::State& state) {
    // Parameters: object count, vertices per outline
    const auto count = static_cast<std::size_t>(state.range(0));
    const auto vertices = static_cast<int>(state.range(1));

    ObjectGenerator generator;
    auto objects = generator.generate(count, vertices, 8);
    CodecConfig config;

    std::size_t bytes_processed = 0;
    for (auto _ : state) {
        auto text = collection_to_geojson(objects, config);
        if (!text) {
            state.SkipWithError(("Encoding failed: " + text.error().message).c_str());
            return;
        }
        bytes_processed += text.value().size();
        benchmark::DoNotOptimize(text);
    }

    state.SetBytesProcessed(static_cast<int64_t>(bytes_processed));
    state.SetItemsProcessed(state.iterations() * static_cast<int64_t>(count));
}

static void BM_Encode_Chunks(benchmark::State& state) {
    // Parameters: object count, chunk size, execution mode
    const auto count = static_cast<std::size_t>(state.range(0));
    const auto chunk_size = static_cast<int>(state.range(1));
    const auto mode = static_cast<ExecutionMode>(state.range(2));

    ObjectGenerator generator;
    auto objects = generator.generate(count, 32, 8);
    const CodecConfig config = config_for_mode(mode);

    for (auto _ : state) {
        auto chunks = collection_to_geojson_chunks(objects, chunk_size, config);
        if (!chunks) {
            state.SkipWithError(("Chunk encoding failed: " + chunks.error().message).c_str());
            return;
        }
        benchmark::DoNotOptimize(chunks);
    }

    state.SetItemsProcessed(state.iterations() * static_cast<int64_t>(count));
}

static void BM_Encode_FeatureList(benchmark::State& state) {
    // Parameters: object count, execution mode
    const auto count = static_cast<std::size_t>(state.range(0));
    const auto mode = static_cast<ExecutionMode>(state.range(1));

    ObjectGenerator generator;
    auto objects = generator.generate(count, 32, 8);
    const CodecConfig config = config_for_mode(mode);

    for (auto _ : state) {
        auto list = objects_to_geojson_list(objects, config);
        if (!list) {
            state.SkipWithError(("Feature list encoding failed: " + list.error().message).c_str());
            return;
        }
        benchmark::DoNotOptimize(list);
    }

    state.SetItemsProcessed(state.iterations() * static_cast<int64_t>(count));
}

// ============================================================================
// GeoJSON Decoding
// ============================================================================

static void BM_Decode_Array(benchmark::State& state) {
    // Parameters: object count, execution mode
    const auto count = static_cast<std::size_t>(state.range(0));
    const auto mode = static_cast<ExecutionMode>(state.range(1));

    ObjectGenerator generator;
    auto objects = generator.generate(count, 32, 8);
    const CodecConfig config = config_for_mode(mode);

    // A bare array of features exercises the dispatched decode path
    auto list = objects_to_geojson_list(objects, config);
    if (!list) {
        state.SkipWithError(("Setup failed: " + list.error().message).c_str());
        return;
    }
    std::string text = "[";
    for (std::size_t i = 0; i < list.value().size(); ++i) {
        if (i > 0) text += ",";
        text += list.value()[i];
    }
    text += "]";

    for (auto _ : state) {
        auto decoded = geojson_to_objects(text, config);
        if (!decoded) {
            state.SkipWithError(("Decoding failed: " + decoded.error().message).c_str());
            return;
        }
        benchmark::DoNotOptimize(decoded);
    }

    state.SetBytesProcessed(state.iterations() * static_cast<int64_t>(text.size()));
    state.SetItemsProcessed(state.iterations() * static_cast<int64_t>(count));
}

static void BM_Decode_NullTolerance(benchmark::State& state) {
    // Parameters: null tolerant
    const bool tolerant = state.range(0) != 0;

    ObjectGenerator generator;
    auto objects = generator.generate(2000, 16, 4);
    CodecConfig config;
    config.null_tolerant = tolerant;

    auto text = collection_to_geojson(objects, config);
    if (!text) {
        state.SkipWithError(("Setup failed: " + text.error().message).c_str());
        return;
    }

    for (auto _ : state) {
        auto decoded = geojson_to_objects(text.value(), config);
        benchmark::DoNotOptimize(decoded);
    }

    state.SetItemsProcessed(state.iterations() * 2000);
}

// ============================================================================
// Dispatcher
// ============================================================================

static void BM_Dispatch_Map(benchmark::State& state) {
    // Parameters: element count, execution mode
    const auto count = static_cast<std::size_t>(state.range(0));
    const auto mode = static_cast<ExecutionMode>(state.range(1));

    std::vector<int> input(count);
    std::iota(input.begin(), input.end(), 0);

    for (auto _ : state) {
        auto result = default_dispatcher().map(std::span<const int>(input), mode, [](const int& value) -> Result<double> {
            double acc = value;
            for (int i = 0; i < 200; ++i) acc = acc * 1.0000001 + 0.5;
            return Ok(acc);
        });
        benchmark::DoNotOptimize(result);
    }

    state.SetItemsProcessed(state.iterations() * static_cast<int64_t>(count));
}

// ============================================================================
// TIFF Writing
// ============================================================================

template <typename T>
static void BM_Tiff_WriteStack(benchmark::State& state) {
    // Parameters: width, pages, compression (0 none, 1 packbits, 2 zstd)
    const auto width = static_cast<uint32_t>(state.range(0));
    const auto pages = static_cast<int>(state.range(1));
    const TiffCompression compressions[] = {TiffCompression::None, TiffCompression::PackBits, TiffCompression::Zstd};
    const TiffCompression compression = compressions[state.range(2)];

    ImageConfig config{width, width, 1};
    ImageGenerator<T> generator;
    auto samples = generator.generate_gradient(config);
    auto page = Raster::from_samples<T>(width, width, 1, samples);
    if (!page) {
        state.SkipWithError(("Setup failed: " + page.error().message).c_str());
        return;
    }

    std::size_t bytes_processed = 0;
    for (auto _ : state) {
        TiffStackWriter writer({.compression = compression});
        for (int i = 0; i < pages; ++i) {
            auto added = writer.add_page(page.value());
            if (!added) {
                state.SkipWithError(("Write failed: " + added.error().message).c_str());
                return;
            }
        }
        auto file = writer.finish();
        benchmark::DoNotOptimize(file);
        bytes_processed += page.value().bytes().size() * static_cast<std::size_t>(pages);
    }

    state.SetBytesProcessed(static_cast<int64_t>(bytes_processed));
}

// ============================================================================
// Region Export
// ============================================================================

static void BM_Export_SinglePlane(benchmark::State& state) {
    // Parameters: format (0 png, 1 jpeg, 2 tiff), downsample
    const char* formats[] = {"png", "jpeg", "tiff"};
    const char* format = formats[state.range(0)];
    const auto downsample = static_cast<double>(state.range(1));

    ImageGenerator<uint8_t> generator;
    auto source = generator.make_source(configs::large_rgb, ImagePattern::Gradient);

    std::size_t bytes_out = 0;
    for (auto _ : state) {
        auto image = export_region(source, downsample, format);
        if (!image) {
            state.SkipWithError(("Export failed: " + image.error().message).c_str());
            return;
        }
        bytes_out += image.value().bytes.size();
        benchmark::DoNotOptimize(image);
    }

    state.counters["output_bytes"] = benchmark::Counter(
        static_cast<double>(bytes_out), benchmark::Counter::kAvgIterations);
}

static void BM_Export_Hyperstack(benchmark::State& state) {
    // Parameters: config index, compression (0 none, 2 zstd)
    const ImageConfig stacks[] = {configs::stack_small, configs::stack_medium};
    const ImageConfig& config = stacks[state.range(0)];
    ExportOptions options;
    options.tiff_compression = state.range(1) == 2 ? TiffCompression::Zstd : TiffCompression::None;

    ImageGenerator<uint16_t> generator;
    auto source = generator.make_source(config, ImagePattern::Gradient);

    for (auto _ : state) {
        auto image = export_tiff_stack(source, 1.0, options);
        if (!image) {
            state.SkipWithError(("Export failed: " + image.error().message).c_str());
            return;
        }
        benchmark::DoNotOptimize(image);
    }

    const std::size_t raw = config.num_samples() * sizeof(uint16_t) * config.size_z * config.size_time;
    state.SetBytesProcessed(state.iterations() * static_cast<int64_t>(raw));
    state.SetLabel(config.name());
}

static void BM_Export_Base64(benchmark::State& state) {
    // Parameters: width
    const auto width = static_cast<uint32_t>(state.range(0));
    ImageGenerator<uint8_t> generator;
    auto source = generator.make_source(ImageConfig{width, width, 1}, ImagePattern::Random);

    for (auto _ : state) {
        auto text = export_region_base64(source, 1.0, "tif");
        benchmark::DoNotOptimize(text);
    }

    state.SetBytesProcessed(state.iterations() * static_cast<int64_t>(width) * width);
}

// ============================================================================
// Registration
// ============================================================================

// Encode - Collection
// Params: objects, vertices
BENCHMARK(BM_Encode_Collection)
    ->Args({1000, 16})
    ->Args({10000, 16})
    ->Args({10000, 64})
    ->Name("GeoJSON/Encode/Collection")
    ->Unit(benchmark::kMillisecond);

// Encode - Chunks
// Params: objects, chunk size, mode (0 sequential, 1 concurrent)
BENCHMARK(BM_Encode_Chunks)
    ->Args({20000, 1000, 0})
    ->Args({20000, 1000, 1})
    ->Args({20000, 5000, 0})
    ->Args({20000, 5000, 1})
    ->Name("GeoJSON/Encode/Chunks")
    ->Unit(benchmark::kMillisecond);

// Encode - Feature list
// Params: objects, mode
BENCHMARK(BM_Encode_FeatureList)
    ->Args({10000, 0})
    ->Args({10000, 1})
    ->Name("GeoJSON/Encode/FeatureList")
    ->Unit(benchmark::kMillisecond);

// Decode - Array
// Params: objects, mode
BENCHMARK(BM_Decode_Array)
    ->Args({1000, 0})
    ->Args({1000, 1})
    ->Args({10000, 0})
    ->Args({10000, 1})
    ->Name("GeoJSON/Decode/Array")
    ->Unit(benchmark::kMillisecond);

// Decode - Null handling
// Params: tolerant
BENCHMARK(BM_Decode_NullTolerance)
    ->Arg(0)
    ->Arg(1)
    ->Name("GeoJSON/Decode/NullTolerance")
    ->Unit(benchmark::kMillisecond);

// Dispatch
// Params: elements, mode
BENCHMARK(BM_Dispatch_Map)
    ->Args({100, 0})
    ->Args({100, 1})
    ->Args({100000, 0})
    ->Args({100000, 1})
    ->Name("Dispatch/Map")
    ->Unit(benchmark::kMicrosecond);

// TIFF - Stack writing
// Params: width, pages, compression
BENCHMARK(BM_Tiff_WriteStack<uint8_t>)
    ->Args({512, 10, 0})
    ->Args({512, 10, 1})
    ->Args({512, 10, 2})
    ->Name("Tiff/WriteStack/uint8")
    ->Unit(benchmark::kMillisecond);

BENCHMARK(BM_Tiff_WriteStack<uint16_t>)
    ->Args({1024, 4, 0})
    ->Args({1024, 4, 2})
    ->Name("Tiff/WriteStack/uint16")
    ->Unit(benchmark::kMillisecond);

// Export - Single plane
// Params: format, downsample
BENCHMARK(BM_Export_SinglePlane)
    ->Args({0, 1})
    ->Args({0, 4})
    ->Args({1, 1})
    ->Args({1, 4})
    ->Args({2, 1})
    ->Name("Export/SinglePlane")
    ->Unit(benchmark::kMillisecond);

// Export - Hyperstack
// Params: config, compression
BENCHMARK(BM_Export_Hyperstack)
    ->Args({0, 0})
    ->Args({0, 2})
    ->Args({1, 0})
    ->Args({1, 2})
    ->Name("Export/Hyperstack/uint16")
    ->Unit(benchmark::kMillisecond);

// Export - Base64
// Params: width
BENCHMARK(BM_Export_Base64)
    ->Arg(512)
    ->Arg(2048)
    ->Name("Export/Base64")
    ->Unit(benchmark::kMillisecond);

BENCHMARK_MAIN();
