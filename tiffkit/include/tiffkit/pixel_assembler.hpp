#pragma once

/**
 * @file pixel_assembler.hpp
 * @brief Reassembly of decoded chunks into an interleaved pixel buffer
 *
 * ## Placement
 *
 * - Chunky chunks carry every sample of a pixel; they are spread into the
 *   interleaved buffer as is.
 * - Planar chunks carry one sample; only that sample index is written.
 * - Rows are byte aligned. Samples narrower than 8 bits, or of differing
 *   widths, are read as an MSB-first bit stream and stored one per unit.
 * - Subsampled YCbCr blocks are expanded to full resolution Y, Cb, Cr.
 *
 * Each chunk writes a disjoint region of the buffer, so chunks may be
 * placed concurrently from several threads.
 *
 * ## Photometric pass
 *
 * finish() turns the assembled samples into an Image. Palette images are
 * always expanded to 8-bit RGB. WhiteIsZero, CMYK and YCbCr are kept raw
 * unless ColorConversion::ToRgb is requested.
 */

#include <bit>
#include <cstddef>
#include <cstdint>
#include <span>
#include <utility>
#include "chunk_coding.hpp"
#include "image.hpp"
#include "image_shape.hpp"
#include "tiling.hpp"
#include "types.hpp"
#include "types/result.hpp"

namespace tiffkit {

class PixelAssembler {
private:
    ImageShape shape_;
    DecodeOptions options_;

    PixelAssembler(ImageShape shape, const DecodeOptions& options) noexcept
        : shape_(std::move(shape)), options_(options) {}

    template <typename T>
    void place_chunky(std::span<T> samples, const ChunkDescriptor& chunk,
                      std::span<const std::byte> decoded, std::endian order) const noexcept;

    template <typename T>
    void place_planar(std::span<T> samples, const ChunkDescriptor& chunk,
                      std::span<const std::byte> decoded, std::endian order) const noexcept;

    template <typename T>
    void place_subsampled(std::span<T> samples, const ChunkDescriptor& chunk,
                          std::span<const std::byte> decoded) const noexcept;

    [[nodiscard]] Result<void> check_chunk(const ChunkDescriptor& chunk, std::size_t decoded_bytes,
                                           std::size_t output_samples) const noexcept;

    [[nodiscard]] Result<Image> expand_palette(Image&& image) const noexcept;
    [[nodiscard]] Image invert_white_is_zero(Image&& image) const noexcept;
    [[nodiscard]] Result<Image> cmyk_to_rgb(Image&& image) const noexcept;
    [[nodiscard]] Result<Image> ycbcr_to_rgb(Image&& image) const noexcept;

public:
    /// @brief Check that the pixel format can be assembled
    /// @retval Error::Code::UnsupportedFeature Samples wider than 16 bits, non unsigned samples,
    ///         or subsampled YCbCr that is not 3 x 8 bits
    [[nodiscard]] static Result<PixelAssembler> create(const ImageShape& shape, const DecodeOptions& options) noexcept;

    [[nodiscard]] const ImageShape& shape() const noexcept { return shape_; }

    /// @brief Allocate the zero-filled interleaved sample buffer
    /// @retval Error::Code::MemoryError Larger than DecodeOptions::max_decoded_bytes, or allocation failure
    [[nodiscard]] Result<ImageData> allocate() const noexcept;

    /// @brief Copy the samples of one decoded chunk to their place in the image
    /// @param samples Buffer returned by allocate()
    /// @param chunk Placement of the chunk
    /// @param decoded Decoded chunk, exactly chunk.decoded_size bytes
    /// @param params Coding of the chunk (gives the byte order of 16-bit samples)
    /// @retval Error::Code::CodecError `decoded` is too short for the chunk
    /// @retval Error::Code::InconsistentLayout The chunk falls outside the image or the buffer
    [[nodiscard]] Result<void> place_chunk(ImageData& samples, const ChunkDescriptor& chunk,
                                           std::span<const std::byte> decoded,
                                           const ChunkCodingParams& params) const noexcept;

    /// @brief Apply the photometric policy and build the Image
    /// @retval Error::Code::InconsistentLayout ColorMap size does not match the bit depth
    /// @retval Error::Code::CodecError Palette index outside the ColorMap
    /// @retval Error::Code::UnsupportedFeature Conversion not available for the sample layout
    [[nodiscard]] Result<Image> finish(ImageData&& samples) const noexcept;
};

namespace assembler {

/// @brief Read `bits` bits (at most 16) starting at `bit_pos`, MSB first
[[nodiscard]] uint32_t read_bits(const std::byte* data, uint64_t bit_pos, uint16_t bits) noexcept;

} // namespace assembler

} // namespace tiffkit

#define TIFFKIT_PIXEL_ASSEMBLER_HEADER
#include "impl/pixel_assembler_impl.hpp"
