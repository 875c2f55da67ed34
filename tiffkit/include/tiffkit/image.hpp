#pragma once

/**
 * @file image.hpp
 * @brief Decoded image and decode options
 *
 * Pixel data is always chunky (interleaved) and row-major, whatever the
 * planar configuration of the source. Samples are stored in the smallest
 * supported unit holding the widest sample: uint8_t up to 8 bits, uint16_t
 * up to 16 bits. Values are raw and right-justified: a 4-bit sample holds
 * 0..15 and is never rescaled.
 */

#include <cstddef>
#include <cstdint>
#include <variant>
#include <vector>
#include "types.hpp"

namespace tiffkit {

/// Interleaved pixel samples, 8-bit or 16-bit storage
using ImageData = std::variant<std::vector<uint8_t>, std::vector<uint16_t>>;

/// @brief Color transform applied after pixel assembly
enum class ColorConversion : uint8_t {
    None,  ///< Keep the stored components (palette images are still expanded)
    ToRgb, ///< Convert WhiteIsZero, CMYK and YCbCr to BlackIsZero/RGB
};

/// @brief Options of TiffDecoder
struct DecodeOptions {
    /// Threads decoding chunks: 1 decodes on the calling thread, 0 uses the hardware concurrency
    unsigned worker_threads{1};
    ColorConversion color_conversion{ColorConversion::None};
    /// Largest pixel buffer image() may allocate
    std::size_t max_decoded_bytes{std::size_t{1} << 30};
};

struct Image {
    uint32_t width{0};
    uint32_t height{0};
    uint16_t samples_per_pixel{1};
    std::vector<uint16_t> bits_per_sample;   ///< One entry per sample, as stored in the data
    PhotometricInterpretation photometric{PhotometricInterpretation::BlackIsZero};
    PlanarConfiguration planar_configuration{PlanarConfiguration::Chunky}; ///< Layout of the source
    CompressionScheme compression{CompressionScheme::None};                ///< Compression of the source
    std::vector<uint16_t> extra_samples;
    ImageData data;

    /// Number of samples the data holds (width * height * samples_per_pixel)
    [[nodiscard]] std::size_t sample_count() const noexcept {
        return std::visit([](const auto& samples) { return samples.size(); }, data);
    }

    /// Bytes per stored sample (1 or 2)
    [[nodiscard]] std::size_t bytes_per_sample() const noexcept {
        return std::holds_alternative<std::vector<uint16_t>>(data) ? 2 : 1;
    }

    [[nodiscard]] const std::vector<uint8_t>* as_u8() const noexcept {
        return std::get_if<std::vector<uint8_t>>(&data);
    }

    [[nodiscard]] const std::vector<uint16_t>* as_u16() const noexcept {
        return std::get_if<std::vector<uint16_t>>(&data);
    }

    /// Sample of channel `c` at pixel (x, y), widened to 32 bits
    [[nodiscard]] uint32_t sample(uint32_t x, uint32_t y, uint16_t c) const noexcept {
        const std::size_t i = (static_cast<std::size_t>(y) * width + x) * samples_per_pixel + c;
        return std::visit([i](const auto& samples) { return static_cast<uint32_t>(samples[i]); }, data);
    }

    friend bool operator==(const Image&, const Image&) = default;
};

} // namespace tiffkit
