#pragma once

#include <cstddef>
#include <memory>
#include <span>
#include <string>
#include <vector>
#include <zstd.h>
#include "compressor_base.hpp"

namespace regionbridge {

/// @brief Zstandard strip compressor (TIFF compression 50000)
/// @note The context is created lazily and reused across strips; use one
///       instance per thread
class ZstdCompressor {
private:
    struct ContextDeleter {
        void operator()(ZSTD_CCtx* ctx) const noexcept {
            ZSTD_freeCCtx(ctx);
        }
    };

    mutable std::unique_ptr<ZSTD_CCtx, ContextDeleter> context_;
    int level_;

    [[nodiscard]] Result<ZSTD_CCtx*> ensure_context() const noexcept {
        if (!context_) {
            context_.reset(ZSTD_createCCtx());
            if (!context_) {
                return Err(Error::Code::MemoryError, "Failed to create ZSTD compression context");
            }
        }
        return Ok(context_.get());
    }

public:
    /// @param level Compression level (1-22)
    explicit ZstdCompressor(int level = 3) noexcept
        : level_(level) {}

    ZstdCompressor(ZstdCompressor&&) noexcept = default;
    ZstdCompressor& operator=(ZstdCompressor&&) noexcept = default;

    [[nodiscard]] static constexpr TiffCompression scheme() noexcept {
        return TiffCompression::Zstd;
    }

    [[nodiscard]] int level() const noexcept { return level_; }

    [[nodiscard]] Result<std::size_t> compress(
        std::vector<std::byte>& output,
        std::size_t offset,
        std::span<const std::byte> input) const noexcept {

        auto ctx = ensure_context();
        if (!ctx) return ctx.error();

        auto grown = reserve_output(output, offset + ZSTD_compressBound(input.size()));
        if (!grown) return grown.error();

        std::size_t written = ZSTD_compressCCtx(
            ctx.value(),
            output.data() + offset,
            output.size() - offset,
            input.data(),
            input.size(),
            level_);

        if (ZSTD_isError(written)) {
            return Err(Error::Code::EncodeError,
                       std::string("ZSTD compression failed: ") + ZSTD_getErrorName(written));
        }
        return Ok(written);
    }
};

static_assert(StripCompressor<ZstdCompressor>);

} // namespace regionbridge
