#pragma once

/// Main header for the regionbridge library
///
/// regionbridge moves region objects and pixel data of large multi-dimensional
/// images across a process boundary:
/// - region objects to and from GeoJSON text (geometry_codec.hpp), with
///   chunked collections for size-limited transports
/// - rectangles of an image source to PNG, JPEG, TIFF or ImageJ hyperstack
///   bytes (region_exporter.hpp), optionally Base64 wrapped
///
/// Key features:
/// - No exceptions: uses Result<T> for error handling
/// - Explicit, immutable codec configuration (CodecConfig)
/// - Bulk conversions on a persistent worker pool with input-ordered results
/// - Image sources plug in through the PixelSource concept
///
/// Example usage:
/// ```cpp
/// #include <regionbridge/regionbridge.hpp>
///
/// using namespace regionbridge;
///
/// CodecConfig config;
/// auto objects = geojson_to_objects(text, config);
/// if (objects) {
///     auto chunks = collection_to_geojson_chunks(objects.value(), 500, config);
/// }
///
/// auto request = PixelRegionRequest::create("slide", 4.0, 0, 0, 2048, 2048);
/// auto png = export_region_base64(source, request.value(), "png");
/// ```

#include "types/result.hpp"
#include "types/plane.hpp"
#include "types/geometry.hpp"
#include "types/region_object.hpp"
#include "logging.hpp"
#include "codec_config.hpp"
#include "plane_codec.hpp"
#include "null_sanitizer.hpp"
#include "chunker.hpp"
#include "parallel_dispatch.hpp"
#include "geometry_codec.hpp"
#include "object_queries.hpp"
#include "raster.hpp"
#include "image_source.hpp"
#include "region_request.hpp"
#include "export_format.hpp"
#include "base64.hpp"
#include "compressors/compressor_standard.hpp"
#include "compressors/compressor_zstd.hpp"
#include "tiff_stack_writer.hpp"
#include "encoders/png_encoder.hpp"
#include "encoders/jpeg_encoder.hpp"
#include "region_exporter.hpp"
