#pragma once

/**
 * @file chunk_coding.hpp
 * @brief Parameters and byte-level helpers shared by the chunk decoder and encoder
 *
 * A chunk (strip or tile) goes through the following stages on decode:
 * 1. bit reversal of the stored bytes when FillOrder is 2
 * 2. decompression into a buffer of exactly the decoded chunk size
 * 3. conversion of 16-bit samples to native byte order
 * 4. horizontal predictor decoding
 * The encoder runs the inverse stages in reverse order (it always writes FillOrder 1).
 */

#include <array>
#include <bit>
#include <cstddef>
#include <cstdint>
#include <span>
#include "image_shape.hpp"
#include "tiling.hpp"
#include "types.hpp"
#include "types/result.hpp"

namespace tiffkit {

/// @brief How the stored bytes of one chunk are coded
struct ChunkCodingParams {
    CompressionScheme compression{CompressionScheme::None};
    Predictor predictor{Predictor::None};
    FillOrder fill_order{FillOrder::MsbToLsb};
    std::endian byte_order{std::endian::native}; ///< Byte order of the file
    uint16_t bits_per_sample{8};   ///< Common bit depth, 0 when samples differ
    uint16_t samples_per_pixel{1}; ///< Samples of one pixel inside the chunk
    uint32_t width{0};             ///< Stored columns
    uint32_t height{0};            ///< Stored rows
    bool subsampled{false};        ///< Chunky YCbCr stored in subsampling blocks

    /// @brief Parameters of one chunk of an image
    [[nodiscard]] static ChunkCodingParams for_chunk(
        const ImageShape& shape, const ChunkDescriptor& chunk, std::endian byte_order) noexcept;

    /// @brief Whether 16-bit samples must be byte swapped between file and memory
    [[nodiscard]] bool needs_swap() const noexcept {
        return bits_per_sample == 16 && !subsampled && byte_order != std::endian::native;
    }

    /// @brief Check that the predictor can be applied to this chunk
    /// @retval Error::Code::UnsupportedFeature Floating point predictor, or horizontal
    ///         differencing on samples that are not uniformly 8 or 16 bits
    [[nodiscard]] Result<void> validate_predictor() const noexcept;
};

namespace chunk_coding {

/// Reverse the bit order of every byte in place (FillOrder 2)
void reverse_bits(std::span<std::byte> data) noexcept;

/// Swap the bytes of every 16-bit sample in place
void swap_16(std::span<std::byte> data) noexcept;

/// Apply the horizontal predictor decoding on native-order samples
void undo_predictor(std::span<std::byte> data, const ChunkCodingParams& params) noexcept;

/// Apply the horizontal predictor encoding on native-order samples
void apply_predictor(std::span<std::byte> data, const ChunkCodingParams& params) noexcept;

} // namespace chunk_coding

} // namespace tiffkit

#define TIFFKIT_CHUNK_CODING_HEADER
#include "impl/chunk_coding_impl.hpp"
