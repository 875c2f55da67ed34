#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <zstd.h>
#include "../decompressor_base.hpp"
#include "../types/result.hpp"

namespace tiffkit {

/// RAII wrapper for ZSTD decompression context
/// Context is allocated lazily on first use
class ZstdDecompressor {
private:
    struct ZstdContextDeleter {
        void operator()(ZSTD_DCtx* ctx) const noexcept {
            if (ctx) {
                ZSTD_freeDCtx(ctx);
            }
        }
    };

    mutable std::unique_ptr<ZSTD_DCtx, ZstdContextDeleter> context_;

    [[nodiscard]] Result<ZSTD_DCtx*> ensure_context() const noexcept {
        if (!context_) {
            context_.reset(ZSTD_createDCtx());
            if (!context_) {
                return Err(Error::Code::MemoryError,
                           "Failed to create ZSTD decompression context");
            }
        }
        return Ok(context_.get());
    }

public:
    ZstdDecompressor() noexcept = default;

    ~ZstdDecompressor() = default;

    // Non-copyable
    ZstdDecompressor(const ZstdDecompressor&) = delete;
    ZstdDecompressor& operator=(const ZstdDecompressor&) = delete;

    // Movable
    ZstdDecompressor(ZstdDecompressor&&) noexcept = default;
    ZstdDecompressor& operator=(ZstdDecompressor&&) noexcept = default;

    /// Decompress one ZSTD frame
    /// @retval Error::Code::CodecError Corrupt frame, or a frame that does not
    ///         decode to exactly output.size() bytes
    [[nodiscard]] Result<std::size_t> decompress(
        std::span<std::byte> output,
        std::span<const std::byte> input) const noexcept {

        auto ctx_result = ensure_context();
        if (!ctx_result) {
            return ctx_result.error();
        }

        const std::size_t result = ZSTD_decompressDCtx(
            ctx_result.value(),
            output.data(),
            output.size(),
            input.data(),
            input.size()
        );

        if (ZSTD_isError(result)) {
            return Err(Error::Code::CodecError,
                       std::string("ZSTD decompression failed: ") + ZSTD_getErrorName(result))
                .at_offset(0);
        }
        if (result != output.size()) {
            return Err(Error::Code::CodecError,
                       "ZSTD frame decoded to " + std::to_string(result) + " bytes, expected " +
                       std::to_string(output.size()))
                .at_offset(input.size());
        }

        return Ok(result);
    }
};

/// ZSTD decompressor descriptor, for both compression ids in use
using ZstdDecompressorDesc = DecompressorDescriptor<
    ZstdDecompressor,
    CompressionScheme::ZSTD,
    CompressionScheme::ZSTD_Alt
>;

} // namespace tiffkit
