#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <vector>
#include <zstd.h>
#include "../compressor_base.hpp"
#include "../types/result.hpp"
#include "compressor_standard.hpp"

namespace tiffkit {

/// RAII wrapper for ZSTD compression context
/// Context is allocated lazily on first use
class ZstdCompressor {
private:
    struct ZstdContextDeleter {
        void operator()(ZSTD_CCtx* ctx) const noexcept {
            if (ctx) {
                ZSTD_freeCCtx(ctx);
            }
        }
    };

    mutable std::unique_ptr<ZSTD_CCtx, ZstdContextDeleter> context_;
    int compression_level_;

    [[nodiscard]] Result<ZSTD_CCtx*> ensure_context() const noexcept {
        if (!context_) {
            context_.reset(ZSTD_createCCtx());
            if (!context_) {
                return Err(Error::Code::MemoryError,
                           "Failed to create ZSTD compression context");
            }
        }
        return Ok(context_.get());
    }

public:
    /// @param level Compression level (1-22)
    explicit ZstdCompressor(int level = 3) noexcept
        : compression_level_(level) {}

    ~ZstdCompressor() = default;

    // Non-copyable
    ZstdCompressor(const ZstdCompressor&) = delete;
    ZstdCompressor& operator=(const ZstdCompressor&) = delete;

    // Movable
    ZstdCompressor(ZstdCompressor&&) noexcept = default;
    ZstdCompressor& operator=(ZstdCompressor&&) noexcept = default;

    /// Compress data into one ZSTD frame
    /// @return Number of bytes written
    /// @retval Error::Code::CodecError libzstd reported a failure
    [[nodiscard]] Result<std::size_t> compress(
        std::vector<std::byte>& output,
        std::size_t offset,
        std::span<const std::byte> input) const noexcept {

        auto ctx_result = ensure_context();
        if (!ctx_result) {
            return ctx_result.error();
        }

        const std::size_t bound = ZSTD_compressBound(input.size());
        auto grown = compressor_impl::ensure_size(output, offset + bound);
        if (!grown) {
            return grown.error();
        }

        const std::size_t result = ZSTD_compressCCtx(
            ctx_result.value(),
            output.data() + offset,
            output.size() - offset,
            input.data(),
            input.size(),
            compression_level_
        );

        if (ZSTD_isError(result)) {
            return Err(Error::Code::CodecError,
                       std::string("ZSTD compression failed: ") + ZSTD_getErrorName(result));
        }

        return Ok(result);
    }

    [[nodiscard]] int level() const noexcept {
        return compression_level_;
    }
};

using ZstdCompressorDesc = CompressorDescriptor<
    ZstdCompressor,
    CompressionScheme::ZSTD,
    CompressionScheme::ZSTD_Alt
>;

} // namespace tiffkit
