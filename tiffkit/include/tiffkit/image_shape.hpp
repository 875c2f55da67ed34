#pragma once

/**
 * @file image_shape.hpp
 * @brief Layout and pixel format of one image, resolved from its IFD
 *
 * ImageShape gathers every tag the pixel pipeline depends on, with the
 * TIFF defaults applied for absent optional tags. Width and height are the
 * only tags without a default; their absence is Error::Code::MissingRequiredTag.
 */

#include <array>
#include <cstdint>
#include <optional>
#include <vector>
#include "byte_cursor.hpp"
#include "ifd.hpp"
#include "reader_base.hpp"
#include "types.hpp"
#include "types/result.hpp"

namespace tiffkit {

struct ImageShape {
    uint32_t width{0};
    uint32_t height{0};
    uint16_t samples_per_pixel{1};
    std::vector<uint16_t> bits_per_sample{1};
    uint16_t compression{static_cast<uint16_t>(CompressionScheme::None)}; ///< Raw Compression tag value
    PhotometricInterpretation photometric{PhotometricInterpretation::BlackIsZero};
    PlanarConfiguration planar{PlanarConfiguration::Chunky};
    Predictor predictor{Predictor::None};
    FillOrder fill_order{FillOrder::MsbToLsb};
    SampleFormat sample_format{SampleFormat::UnsignedInt};
    std::vector<uint16_t> extra_samples;
    std::vector<uint16_t> color_map;                      ///< 3 * 2^bits entries (R..., G..., B...)
    std::array<uint16_t, 2> ycbcr_subsampling{2, 2};
    std::array<double, 3> ycbcr_coefficients{0.299, 0.587, 0.114};
    std::array<double, 6> reference_black_white{0.0, 255.0, 128.0, 255.0, 128.0, 255.0};
    uint32_t rows_per_strip{0xFFFFFFFFu};
    std::optional<uint32_t> tile_width;
    std::optional<uint32_t> tile_length;

    /// @brief Resolve the shape of the image described by an IFD
    /// @retval Error::Code::MissingRequiredTag ImageWidth or ImageLength is absent
    /// @retval Error::Code::TypeMismatch A layout tag has a non-integer type
    /// @retval Error::Code::InvalidFormat Zero dimensions, zero samples or zero bits
    /// @retval Error::Code::InvalidTag BitsPerSample count does not match SamplesPerPixel
    /// @retval Error::Code::UnsupportedFeature Unknown photometric or planar configuration
    template <RawReader Reader>
    [[nodiscard]] static Result<ImageShape> from_ifd(const ByteCursor<Reader>& cursor, const IFD& ifd) noexcept;

    [[nodiscard]] bool is_tiled() const noexcept {
        return tile_width.has_value() && tile_length.has_value();
    }

    /// Number of separately stored sample planes
    [[nodiscard]] uint16_t planes() const noexcept {
        return planar == PlanarConfiguration::Planar ? samples_per_pixel : uint16_t{1};
    }

    [[nodiscard]] uint16_t max_bits_per_sample() const noexcept;

    [[nodiscard]] bool uniform_bits_per_sample() const noexcept;

    /// Bits occupied by one pixel of the given plane in a decoded chunk
    [[nodiscard]] uint32_t bits_per_chunk_pixel(uint16_t plane) const noexcept;

    /// Number of samples of one pixel inside a chunk of the given plane
    [[nodiscard]] uint16_t samples_per_chunk_pixel() const noexcept {
        return planar == PlanarConfiguration::Planar ? uint16_t{1} : samples_per_pixel;
    }

    /// Chunky YCbCr data stored with chroma subsampling blocks
    [[nodiscard]] bool is_subsampled_ycbcr() const noexcept;

    /// @brief Total number of samples in the image
    /// @retval Error::Code::MemoryError The count does not fit in 64 bits
    [[nodiscard]] Result<uint64_t> sample_count() const noexcept;
};

} // namespace tiffkit

#define TIFFKIT_IMAGE_SHAPE_HEADER
#include "impl/image_shape_impl.hpp"
