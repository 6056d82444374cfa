#pragma once

#include <bit>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>
#include "compressors/compressor_base.hpp"
#include "io/output_buffer.hpp"
#include "raster.hpp"
#include "types/result.hpp"

namespace regionbridge {

/// TIFF tag codes written by TiffStackWriter
enum class TiffTag : uint16_t {
    NewSubfileType            = 254,
    ImageWidth                = 256,
    ImageLength               = 257,
    BitsPerSample             = 258,
    Compression               = 259,
    PhotometricInterpretation = 262,
    ImageDescription          = 270,
    StripOffsets              = 273,
    SamplesPerPixel           = 277,
    RowsPerStrip              = 278,
    StripByteCounts           = 279,
    PlanarConfiguration       = 284,
    ExtraSamples              = 338,
    SampleFormat              = 339
};

/// TIFF field types used by TiffStackWriter
enum class TiffFieldType : uint16_t {
    Ascii = 2,
    Short = 3,
    Long  = 4
};

/// @brief Header text ImageJ reads back as hyperstack dimensions
///
/// Rendered as newline separated key=value pairs:
/// @code
/// ImageJ=1.54f
/// images=6
/// channels=3
/// slices=2
/// frames=1
/// hyperstack=true
/// mode=composite
/// min=0
/// max=255
/// @endcode
struct ImageJDescription {
    uint32_t channels = 1;
    uint32_t slices = 1;
    uint32_t frames = 1;
    bool rgb = false;      ///< Pages are packed RGB; channels must be 1
    double min = 0.0;
    double max = 0.0;

    [[nodiscard]] uint32_t images() const noexcept {
        return channels * slices * frames;
    }

    /// "composite" for several channels, otherwise "grayscale"; absent for RGB
    [[nodiscard]] std::string mode() const {
        if (rgb) return {};
        return channels > 1 ? "composite" : "grayscale";
    }

    [[nodiscard]] std::string to_string() const;
};

/// @brief Writer of classic little-endian multi-page TIFF files in memory
///
/// Each page is one interleaved raster stored in strips. Pages are written in
/// the order they are added: strip data first, then the page's IFD, whose
/// offset is patched into the previous IFD (or the header for the first page).
///
/// @note Classic TIFF addresses 32-bit offsets; a file that would grow past
///       4 GiB fails with OutOfBounds
/// @note NOT thread-safe - use one writer per payload
class TiffStackWriter {
public:
    struct Config {
        TiffCompression compression = TiffCompression::None;
        int zstd_level = 3;
        std::size_t strip_bytes = 64 * 1024;   ///< Target uncompressed strip size
    };

    explicit TiffStackWriter(Config config);

    /// @brief Append one page
    /// @param page Raster to store
    /// @param description ImageDescription text; omitted when empty
    /// @param rgb Store three-channel 8-bit data as an RGB page
    /// @return Result<void>
    /// @retval OutOfBounds The file would exceed the classic TIFF 4 GiB limit
    /// @retval EncodeError Strip compression failed, or rgb requested for a
    ///         raster that is not 8-bit with at least three channels
    /// @retval MemoryError Allocation failed
    [[nodiscard]] Result<void> add_page(
        const Raster& page,
        std::string_view description = {},
        bool rgb = false) noexcept;

    [[nodiscard]] std::size_t page_count() const noexcept {
        return pages_;
    }

    /// @brief Bytes written so far
    [[nodiscard]] std::size_t size() const noexcept {
        return out_.size();
    }

    /// @brief Hand out the complete file and reset the writer
    /// @retval InvalidArgument No page was added
    [[nodiscard]] Result<std::vector<std::byte>> finish() noexcept;

private:
    struct StripLayout {
        std::vector<uint32_t> offsets;
        std::vector<uint32_t> byte_counts;
        uint32_t rows_per_strip = 0;
    };

    struct Entry {
        TiffTag tag;
        TiffFieldType type;
        uint32_t count;
        std::vector<std::byte> value;   // Little-endian payload
    };

    [[nodiscard]] Result<void> write_header() noexcept;

    template <StripCompressor Compressor>
    [[nodiscard]] Result<StripLayout> write_strips(const Compressor& compressor, const Raster& page) noexcept;

    [[nodiscard]] Result<StripLayout> write_page_data(const Raster& page) noexcept;

    [[nodiscard]] Result<void> write_ifd(std::vector<Entry>& entries) noexcept;

    Config config_;
    OutputBuffer out_;
    std::size_t next_ifd_field_ = 4;   // Offset of the field receiving the next IFD offset
    std::size_t pages_ = 0;
};

} // namespace regionbridge

#define REGIONBRIDGE_TIFF_STACK_WRITER_HEADER
#include "impl/tiff_stack_writer_impl.hpp"
