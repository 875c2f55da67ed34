#pragma once

/**
 * @file decoder.hpp
 * @brief Chunk decoder: decompression and predictor decoding of one strip or tile
 *
 * ## Decoding Pipeline
 *
 * For each chunk:
 * 1. Reverse the bits of the stored bytes if FillOrder is 2
 * 2. Decompress using the compression scheme of the image
 * 3. Bring 16-bit samples to native byte order
 * 4. Apply predictor decoding if needed (in-place)
 *
 * Codec errors carry offsets relative to the chunk data; the decoder turns
 * them into file offsets.
 *
 * ## Thread Safety
 *
 * ChunkDecoder is NOT thread-safe. Use one decoder instance per thread, or
 * synchronize access externally.
 *
 * ## Example Usage
 *
 * @code{.cpp}
 * using namespace tiffkit;
 *
 * ChunkDecoder<> decoder;
 * auto params = ChunkCodingParams::for_chunk(shape, chunk, std::endian::little);
 * auto result = decoder.decode(compressed_data, chunk.decoded_size, params, chunk.offset);
 * if (result) {
 *     std::span<const std::byte> decoded = result.value();
 * }
 * @endcode
 */

#include <bit>
#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>
#include "chunk_coding.hpp"
#include "decompressor_base.hpp"
#include "decompressors/decompressor_lzw.hpp"
#include "decompressors/decompressor_standard.hpp"
#ifdef TIFFKIT_HAVE_ZSTD
#include "decompressors/decompressor_zstd.hpp"
#endif
#include "types.hpp"
#include "types/result.hpp"

namespace tiffkit {

#ifdef TIFFKIT_HAVE_ZSTD
/// Decompressors compiled into this build
using StandardDecompressors = DecompressorSpec<
    NoneDecompressorDesc,
    PackBitsDecompressorDesc,
    LzwDecompressorDesc,
    ZstdDecompressorDesc
>;
#else
/// Decompressors compiled into this build
using StandardDecompressors = DecompressorSpec<
    NoneDecompressorDesc,
    PackBitsDecompressorDesc,
    LzwDecompressorDesc
>;
#endif

/**
 * @brief Chunk decoder for tiles and strips
 *
 * Holds the decompressor states and two reusable buffers (fill order
 * scratch and decoded output). The buffers grow as needed but never shrink.
 *
 * @tparam DecompSpec Decompressor specification defining supported compression schemes
 */
template <typename DecompSpec = StandardDecompressors>
    requires ValidDecompressorSpec<DecompSpec>
class ChunkDecoder {
private:
    DecompressorStorage<DecompSpec> decompressors_;
    mutable std::vector<std::byte> reversed_input_;
    std::vector<std::byte> output_buffer_;

public:
    ChunkDecoder() = default;

    /**
     * @brief Decode chunk into caller-provided buffer
     *
     * @param compressed_input Stored bytes of the chunk
     * @param decoded_output Output buffer, exactly the decoded chunk size
     * @param params Coding of the chunk
     * @param file_offset File offset of the stored bytes, added to codec error offsets
     * @return Ok() on success, or Error on failure
     *
     * @retval Error::Code::UnsupportedCompression No decompressor for the compression id
     * @retval Error::Code::UnsupportedFeature Unsupported predictor configuration
     * @retval Error::Code::CodecError Malformed compressed data
     */
    [[nodiscard]] Result<void> decode_into(
        std::span<const std::byte> compressed_input,
        std::span<std::byte> decoded_output,
        const ChunkCodingParams& params,
        uint64_t file_offset = 0) const noexcept;

    /**
     * @brief Decode chunk using the internal output buffer
     *
     * The returned span is valid until the next call to decode() on this
     * decoder, or its destruction.
     *
     * @retval Error::Code::MemoryError Failed to grow the output buffer
     * @see decode_into()
     */
    [[nodiscard]] Result<std::span<const std::byte>> decode(
        std::span<const std::byte> compressed_input,
        std::size_t decoded_size,
        const ChunkCodingParams& params,
        uint64_t file_offset = 0) noexcept;
};

} // namespace tiffkit

#define TIFFKIT_DECODER_HEADER
#include "impl/decoder_impl.hpp"
