#pragma once

/**
 * @file tiff_writer.hpp
 * @brief Encoder: serializes an Image into a single-directory TIFF file
 *
 * The file is laid out as:
 *
 *   header (8 bytes) | chunk data | IFD | external tag values
 *
 * Samples are packed into strips or tiles exactly the way the decoder
 * unpacks them (rows byte-aligned, sub-byte samples MSB first, planar data
 * one plane per chunk), then every chunk goes through the ChunkEncoder.
 * Decoding the result with TiffDecoder gives back an equal Image for the
 * lossless codecs.
 *
 * Tags derived from the image and the options (dimensions, layout,
 * compression, chunk locations) are managed by the writer. Other tags come
 * from an optional IFDBuilder and must not collide with the managed ones.
 */

#include <bit>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>
#include "encoder.hpp"
#include "ifd_builder.hpp"
#include "image.hpp"
#include "image_shape.hpp"
#include "tiling.hpp"
#include "types.hpp"
#include "types/result.hpp"

namespace tiffkit {

/// @brief Options of TiffWriter
struct WriteOptions {
    std::endian byte_order{std::endian::little};
    CompressionScheme compression{CompressionScheme::None};
    Predictor predictor{Predictor::None};
    PlanarConfiguration planar{PlanarConfiguration::Chunky};
    /// Rows of each strip, 0 picks strips of about 8 KiB
    uint32_t rows_per_strip{0};
    /// Tile size, tiles are written when both are non-zero (multiples of 16)
    uint32_t tile_width{0};
    uint32_t tile_length{0};
    /// Software tag, not written when empty
    std::string software{"tiffkit"};

    [[nodiscard]] bool tiled() const noexcept { return tile_width != 0 || tile_length != 0; }
};

/// @brief Complete TIFF file writer
/// @tparam CompSpec Compressor specification defining the available compressions
///
/// @note NOT thread-safe - use separate instances per thread
/// @note Supports both tiled and stripped image layouts
template <typename CompSpec = StandardCompressors>
    requires ValidCompressorSpec<CompSpec>
class TiffWriter {
private:
    ChunkEncoder<CompSpec> encoder_;
    std::vector<std::byte> chunk_buffer_;

    [[nodiscard]] static Result<ImageShape> shape_for(const Image& image, const WriteOptions& options) noexcept;

    [[nodiscard]] static Result<void> validate_extra_tags(
        const Image& image, const WriteOptions& options, const IFDBuilder* extra_tags) noexcept;

    [[nodiscard]] Result<void> pack_chunk(
        const Image& image, const ImageShape& shape, const ChunkDescriptor& chunk,
        const ChunkCodingParams& params) noexcept;

public:
    TiffWriter() = default;

    /// @brief Encode an image into the bytes of a TIFF file
    /// @param image Image to write; data must hold width * height * samples_per_pixel samples
    /// @param options Layout and compression of the file
    /// @param extra_tags Additional tags (ColorMap, resolution, descriptions...), may be null
    /// @return Bytes of the complete file
    /// @retval Error::Code::InvalidFormat Image dimensions, sample count or sample values are inconsistent
    /// @retval Error::Code::InvalidTag An extra tag collides with a tag the writer manages
    /// @retval Error::Code::MissingRequiredTag Palette image without a ColorMap
    /// @retval Error::Code::UnsupportedCompression No compressor for options.compression
    /// @retval Error::Code::UnsupportedFeature Predictor not applicable to the samples
    /// @retval Error::Code::WriteError The file would exceed 4 GiB
    [[nodiscard]] Result<std::vector<std::byte>> write(
        const Image& image, const WriteOptions& options = {}, const IFDBuilder* extra_tags = nullptr) noexcept;

    /// @brief Encode an image and store it in a file
    /// @retval Error::Code::FileNotFound The file cannot be created
    /// @retval Error::Code::WriteError Writing the file failed
    [[nodiscard]] Result<void> write_file(
        std::string_view path, const Image& image, const WriteOptions& options = {},
        const IFDBuilder* extra_tags = nullptr) noexcept;
};

} // namespace tiffkit

#define TIFFKIT_TIFF_WRITER_HEADER
#include "impl/tiff_writer_impl.hpp"
