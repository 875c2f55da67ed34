#pragma once

/**
 * @file encoder.hpp
 * @brief Chunk encoder: predictor encoding and compression of one strip or tile
 *
 * The encoder runs the decoding pipeline of decoder.hpp backwards:
 * 1. Apply predictor encoding on native-order samples
 * 2. Bring 16-bit samples to the byte order of the file
 * 3. Compress
 * 4. Reverse the bits of the compressed bytes if FillOrder is 2
 */

#include <cstddef>
#include <cstdint>
#include <span>
#include <utility>
#include <vector>
#include "chunk_coding.hpp"
#include "compressor_base.hpp"
#include "compressors/compressor_lzw.hpp"
#include "compressors/compressor_standard.hpp"
#ifdef TIFFKIT_HAVE_ZSTD
#include "compressors/compressor_zstd.hpp"
#endif
#include "types.hpp"
#include "types/result.hpp"

namespace tiffkit {

#ifdef TIFFKIT_HAVE_ZSTD
/// Compressors compiled into this build
using StandardCompressors = CompressorSpec<
    NoneCompressorDesc,
    PackBitsCompressorDesc,
    LzwCompressorDesc,
    ZstdCompressorDesc
>;
#else
/// Compressors compiled into this build
using StandardCompressors = CompressorSpec<
    NoneCompressorDesc,
    PackBitsCompressorDesc,
    LzwCompressorDesc
>;
#endif

/// @brief Compressed bytes of one chunk, ready to be written
struct EncodedChunk {
    std::size_t index{0};           ///< Index into the offsets/byte-counts arrays
    std::size_t uncompressed_size{0};
    std::vector<std::byte> data;
};

/// @brief Chunk encoder for tiles and strips
/// @tparam CompSpec Compressor specification defining compression algorithm
///
/// @note NOT thread-safe - only one thread should use an instance at a time
/// @note Contains scratch buffers to avoid reallocations across multiple encode operations
template <typename CompSpec = StandardCompressors>
    requires ValidCompressorSpec<CompSpec>
class ChunkEncoder {
private:
    CompressorStorage<CompSpec> compressors_;
    std::vector<std::byte> coding_buffer_;     // Predictor and byte order work on a copy
    std::vector<std::byte> compressed_buffer_;

public:
    ChunkEncoder() = default;

    /// @brief Encode one chunk
    /// @param input Packed chunk bytes, 16-bit samples in native byte order
    /// @param chunk_index Index of the chunk in the image
    /// @param params Coding of the chunk; byte_order is the order of the file being written
    /// @return EncodedChunk owning the compressed bytes
    /// @retval Error::Code::InvalidFormat Empty chunk
    /// @retval Error::Code::UnsupportedCompression No compressor for the compression id
    /// @retval Error::Code::UnsupportedFeature Predictor not applicable to the samples
    /// @retval Error::Code::MemoryError Scratch buffers could not grow
    [[nodiscard]] Result<EncodedChunk> encode(
        std::span<const std::byte> input,
        std::size_t chunk_index,
        const ChunkCodingParams& params) noexcept;

    /// Release the scratch buffers
    void clear() noexcept;
};

} // namespace tiffkit

#define TIFFKIT_ENCODER_HEADER
#include "impl/encoder_impl.hpp"
