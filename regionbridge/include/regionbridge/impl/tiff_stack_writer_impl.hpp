// Do not include this file directly. Include "tiff_stack_writer.hpp" instead.

#pragma once

#include <algorithm>
#include <limits>
#include <new>
#include <spdlog/fmt/fmt.h>
#include "../compressors/compressor_standard.hpp"
#include "../compressors/compressor_zstd.hpp"

#ifndef REGIONBRIDGE_TIFF_STACK_WRITER_HEADER
#include "../tiff_stack_writer.hpp" // for linters
#endif

namespace regionbridge {

// Samples are copied in native order into a file declared little-endian
static_assert(std::endian::native == std::endian::little,
              "TiffStackWriter requires a little-endian host");

namespace tiff_detail {

    inline constexpr uint64_t kClassicLimit = std::numeric_limits<uint32_t>::max();

    inline std::vector<std::byte> shorts(std::span<const uint16_t> values) {
        std::vector<std::byte> bytes;
        bytes.reserve(values.size() * 2);
        for (uint16_t v : values) {
            bytes.push_back(static_cast<std::byte>(v & 0xFF));
            bytes.push_back(static_cast<std::byte>(v >> 8));
        }
        return bytes;
    }

    inline std::vector<std::byte> longs(std::span<const uint32_t> values) {
        std::vector<std::byte> bytes;
        bytes.reserve(values.size() * 4);
        for (uint32_t v : values) {
            for (int i = 0; i < 4; ++i) {
                bytes.push_back(static_cast<std::byte>((v >> (8 * i)) & 0xFF));
            }
        }
        return bytes;
    }

    inline uint16_t sample_format(PixelType type) noexcept {
        return type == PixelType::Float32 ? 3 : 1;   // IEEE float : unsigned int
    }

} // namespace tiff_detail

// ============================================================================
// ImageJDescription
// ============================================================================

inline std::string ImageJDescription::to_string() const {
    std::string text = "ImageJ=1.54f\n";
    text += fmt::format("images={}\n", images());
    text += fmt::format("channels={}\n", channels);
    text += fmt::format("slices={}\n", slices);
    text += fmt::format("frames={}\n", frames);
    text += "hyperstack=true\n";
    if (auto m = mode(); !m.empty()) {
        text += fmt::format("mode={}\n", m);
    }
    text += fmt::format("min={}\n", min);
    text += fmt::format("max={}\n", max);
    return text;
}

// ============================================================================
// TiffStackWriter
// ============================================================================

inline TiffStackWriter::TiffStackWriter(Config config = {})
    : config_(config) {
    if (config_.strip_bytes == 0) config_.strip_bytes = 1;
}

inline Result<void> TiffStackWriter::write_header() noexcept {
    // "II", 42, offset of the first IFD (patched by the first page)
    auto written = out_.write_u8('I');
    if (written) written = out_.write_u8('I');
    if (written) written = out_.write_u16(42);
    if (written) written = out_.write_u32(0);
    next_ifd_field_ = 4;
    return written;
}

template <StripCompressor Compressor>
inline Result<TiffStackWriter::StripLayout> TiffStackWriter::write_strips(
    const Compressor& compressor,
    const Raster& page) noexcept {

    try {
        StripLayout layout;
        const std::size_t row_bytes = page.row_stride();
        layout.rows_per_strip = static_cast<uint32_t>(
            std::clamp<std::size_t>(config_.strip_bytes / row_bytes, 1, page.height()));

        const std::size_t strip_count = (page.height() + layout.rows_per_strip - 1) / layout.rows_per_strip;
        layout.offsets.reserve(strip_count);
        layout.byte_counts.reserve(strip_count);

        auto& buffer = out_.data();
        for (std::size_t strip = 0; strip < strip_count; ++strip) {
            const std::size_t first_row = strip * layout.rows_per_strip;
            const std::size_t rows = std::min<std::size_t>(layout.rows_per_strip, page.height() - first_row);
            auto input = page.bytes().subspan(first_row * row_bytes, rows * row_bytes);

            const std::size_t offset = buffer.size();
            auto written = compressor.compress(buffer, offset, input);
            if (!written) return written.error();
            buffer.resize(offset + written.value());

            if (buffer.size() > tiff_detail::kClassicLimit) {
                return Err(Error::Code::OutOfBounds, "TIFF payload exceeds the 4 GiB classic TIFF limit");
            }
            layout.offsets.push_back(static_cast<uint32_t>(offset));
            layout.byte_counts.push_back(static_cast<uint32_t>(written.value()));
        }
        return Ok(std::move(layout));
    } catch (const std::bad_alloc&) {
        return Err(Error::Code::MemoryError, "Out of memory while writing strips");
    }
}

inline Result<TiffStackWriter::StripLayout> TiffStackWriter::write_page_data(const Raster& page) noexcept {
    switch (config_.compression) {
        case TiffCompression::None:
            return write_strips(NoneCompressor{}, page);
        case TiffCompression::PackBits:
            return write_strips(PackBitsCompressor{page.row_stride()}, page);
        case TiffCompression::Zstd:
            return write_strips(ZstdCompressor{config_.zstd_level}, page);
    }
    return Err(Error::Code::UnsupportedFormat, "Unknown TIFF compression");
}

inline Result<void> TiffStackWriter::write_ifd(std::vector<Entry>& entries) noexcept {
    std::sort(entries.begin(), entries.end(), [](const Entry& a, const Entry& b) {
        return static_cast<uint16_t>(a.tag) < static_cast<uint16_t>(b.tag);
    });

    auto aligned = out_.align(2);
    if (!aligned) return aligned;

    const uint64_t ifd_offset = out_.size();
    const uint64_t next_field = ifd_offset + 2 + 12 * entries.size();
    uint64_t extra_offset = next_field + 4;

    // Values wider than four bytes live after the IFD, word aligned
    std::vector<uint64_t> value_offsets(entries.size(), 0);
    for (std::size_t i = 0; i < entries.size(); ++i) {
        if (entries[i].value.size() > 4) {
            value_offsets[i] = extra_offset;
            extra_offset += entries[i].value.size() + (entries[i].value.size() & 1);
        }
    }
    if (extra_offset > tiff_detail::kClassicLimit) {
        return Err(Error::Code::OutOfBounds, "TIFF payload exceeds the 4 GiB classic TIFF limit");
    }

    auto written = out_.write_u16(static_cast<uint16_t>(entries.size()));
    for (std::size_t i = 0; written && i < entries.size(); ++i) {
        const auto& entry = entries[i];
        written = out_.write_u16(static_cast<uint16_t>(entry.tag));
        if (written) written = out_.write_u16(static_cast<uint16_t>(entry.type));
        if (written) written = out_.write_u32(entry.count);
        if (!written) break;
        if (entry.value.size() > 4) {
            written = out_.write_u32(static_cast<uint32_t>(value_offsets[i]));
        } else {
            std::byte inline_value[4]{};
            std::copy(entry.value.begin(), entry.value.end(), inline_value);
            written = out_.write_bytes(inline_value);
        }
    }
    if (written) written = out_.write_u32(0);
    for (std::size_t i = 0; written && i < entries.size(); ++i) {
        if (entries[i].value.size() > 4) {
            written = out_.write_bytes(entries[i].value);
            if (written) written = out_.align(2);
        }
    }
    if (!written) return written;

    auto patched = out_.patch_u32(next_ifd_field_, static_cast<uint32_t>(ifd_offset));
    if (!patched) return patched;
    next_ifd_field_ = static_cast<std::size_t>(next_field);
    return Ok();
}

inline Result<void> TiffStackWriter::add_page(
    const Raster& page,
    std::string_view description,
    bool rgb) noexcept {

    if (page.sample_count() == 0) {
        return Err(Error::Code::EncodeError, "Cannot write an empty page");
    }
    if (rgb && (page.pixel_type() != PixelType::UInt8 || page.channels() < 3)) {
        return Err(Error::Code::EncodeError, "RGB pages need at least three 8-bit channels");
    }

    if (out_.size() == 0) {
        auto header = write_header();
        if (!header) return header;
    }

    auto aligned = out_.align(2);
    if (!aligned) return aligned;

    auto layout = write_page_data(page);
    if (!layout) return layout.error();
    const auto& strips = layout.value();

    try {
        const uint16_t spp = page.channels();
        const auto bits = static_cast<uint16_t>(8 * bytes_per_sample(page.pixel_type()));
        const uint16_t photometric = rgb ? 2 : 1;   // RGB : MinIsBlack
        const uint16_t color_channels = rgb ? 3 : 1;

        std::vector<Entry> entries;
        auto add_short = [&entries](TiffTag tag, uint16_t value) {
            const uint16_t values[] = {value};
            entries.push_back({tag, TiffFieldType::Short, 1, tiff_detail::shorts(values)});
        };
        auto add_long = [&entries](TiffTag tag, uint32_t value) {
            const uint32_t values[] = {value};
            entries.push_back({tag, TiffFieldType::Long, 1, tiff_detail::longs(values)});
        };

        add_long(TiffTag::NewSubfileType, 0);
        add_long(TiffTag::ImageWidth, page.width());
        add_long(TiffTag::ImageLength, page.height());
        add_short(TiffTag::Compression, static_cast<uint16_t>(config_.compression));
        add_short(TiffTag::PhotometricInterpretation, photometric);
        add_short(TiffTag::SamplesPerPixel, spp);
        add_long(TiffTag::RowsPerStrip, strips.rows_per_strip);
        add_short(TiffTag::PlanarConfiguration, 1);

        const std::vector<uint16_t> bits_per_sample(spp, bits);
        entries.push_back({TiffTag::BitsPerSample, TiffFieldType::Short, spp,
                           tiff_detail::shorts(bits_per_sample)});
        const std::vector<uint16_t> formats(spp, tiff_detail::sample_format(page.pixel_type()));
        entries.push_back({TiffTag::SampleFormat, TiffFieldType::Short, spp,
                           tiff_detail::shorts(formats)});

        if (spp > color_channels) {
            // Unspecified extra samples
            const std::vector<uint16_t> extra(spp - color_channels, 0);
            entries.push_back({TiffTag::ExtraSamples, TiffFieldType::Short,
                               static_cast<uint32_t>(extra.size()), tiff_detail::shorts(extra)});
        }

        const auto strip_count = static_cast<uint32_t>(strips.offsets.size());
        entries.push_back({TiffTag::StripOffsets, TiffFieldType::Long, strip_count,
                           tiff_detail::longs(strips.offsets)});
        entries.push_back({TiffTag::StripByteCounts, TiffFieldType::Long, strip_count,
                           tiff_detail::longs(strips.byte_counts)});

        if (!description.empty()) {
            std::vector<std::byte> text(description.size() + 1, std::byte{0});
            std::copy_n(reinterpret_cast<const std::byte*>(description.data()), description.size(), text.begin());
            entries.push_back({TiffTag::ImageDescription, TiffFieldType::Ascii,
                               static_cast<uint32_t>(text.size()), std::move(text)});
        }

        auto ifd = write_ifd(entries);
        if (!ifd) return ifd;
    } catch (const std::bad_alloc&) {
        return Err(Error::Code::MemoryError, "Out of memory while building IFD");
    }

    ++pages_;
    return Ok();
}

inline Result<std::vector<std::byte>> TiffStackWriter::finish() noexcept {
    if (pages_ == 0) {
        return Err(Error::Code::InvalidArgument, "A TIFF file needs at least one page");
    }
    pages_ = 0;
    next_ifd_field_ = 4;
    return Ok(out_.release());
}

} // namespace regionbridge
