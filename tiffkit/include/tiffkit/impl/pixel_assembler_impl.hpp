#pragma once

#include <algorithm>
#include <cmath>
#include <limits>
#include <new>
#include <string>
#include <vector>
#include "../logging.hpp"

#ifndef TIFFKIT_PIXEL_ASSEMBLER_HEADER
#include "../pixel_assembler.hpp" // for linters
#endif

namespace tiffkit {

namespace assembler {

inline uint32_t read_bits(const std::byte* data, uint64_t bit_pos, uint16_t bits) noexcept {
    uint32_t value = 0;
    uint16_t remaining = bits;
    while (remaining > 0) {
        const uint32_t byte = std::to_integer<uint32_t>(data[bit_pos >> 3]);
        const uint32_t used = static_cast<uint32_t>(bit_pos & 7);
        const uint32_t take = std::min<uint32_t>(8 - used, remaining);
        const uint32_t chunk = (byte >> (8 - used - take)) & ((1u << take) - 1u);
        value = (value << take) | chunk;
        bit_pos += take;
        remaining = static_cast<uint16_t>(remaining - take);
    }
    return value;
}

/// One sample at an arbitrary bit position, with fast paths for aligned bytes and words
inline uint32_t read_sample(const std::byte* data, uint64_t bit_pos, uint16_t bits, std::endian order) noexcept {
    if ((bit_pos & 7) == 0) {
        if (bits == 8) {
            return std::to_integer<uint32_t>(data[bit_pos >> 3]);
        }
        if (bits == 16) {
            return load_value<uint16_t>(data + (bit_pos >> 3), order);
        }
    }
    return read_bits(data, bit_pos, bits);
}

constexpr uint64_t row_bytes(uint64_t columns, uint64_t bits_per_pixel) noexcept {
    return (columns * bits_per_pixel + 7) / 8;
}

constexpr uint32_t max_value(uint16_t bits) noexcept {
    return bits >= 32 ? 0xFFFFFFFFu : (1u << bits) - 1u;
}

} // namespace assembler

inline Result<PixelAssembler> PixelAssembler::create(const ImageShape& shape, const DecodeOptions& options) noexcept {
    if (shape.sample_format != SampleFormat::UnsignedInt) {
        return Err(Error::Code::UnsupportedFeature,
                   "Sample format " + std::to_string(static_cast<uint16_t>(shape.sample_format)) +
                   " is not supported, only unsigned integers are")
            .for_tag(static_cast<uint16_t>(TagCode::SampleFormat));
    }
    if (shape.max_bits_per_sample() > 16) {
        return Err(Error::Code::UnsupportedFeature,
                   std::to_string(shape.max_bits_per_sample()) + "-bit samples are not supported")
            .for_tag(static_cast<uint16_t>(TagCode::BitsPerSample));
    }
    if (shape.is_subsampled_ycbcr() &&
        (shape.samples_per_pixel != 3 || shape.max_bits_per_sample() != 8 || !shape.uniform_bits_per_sample())) {
        return Err(Error::Code::UnsupportedFeature, "Subsampled YCbCr needs three 8-bit samples")
            .for_tag(static_cast<uint16_t>(TagCode::YCbCrSubSampling));
    }
    try {
        return Ok(PixelAssembler(shape, options));
    } catch (const std::bad_alloc&) {
        return Err(Error::Code::MemoryError, "Failed to copy image shape");
    }
}

inline Result<ImageData> PixelAssembler::allocate() const noexcept {
    auto samples = shape_.sample_count();
    if (samples.is_error()) {
        return samples.error();
    }
    const uint64_t count = samples.value();
    const uint64_t unit = shape_.max_bits_per_sample() <= 8 ? 1 : 2;
    uint64_t bytes = 0;
    if (!checked_mul(count, unit, bytes) || bytes > options_.max_decoded_bytes ||
        count > std::numeric_limits<std::size_t>::max()) {
        return Err(Error::Code::MemoryError,
                   "Image needs " + std::to_string(count) + " samples of " + std::to_string(unit) +
                   " bytes, limit is " + std::to_string(options_.max_decoded_bytes) + " bytes");
    }
    try {
        if (unit == 1) {
            return Ok(ImageData(std::vector<uint8_t>(static_cast<std::size_t>(count))));
        }
        return Ok(ImageData(std::vector<uint16_t>(static_cast<std::size_t>(count))));
    } catch (const std::bad_alloc&) {
        return Err(Error::Code::MemoryError,
                   "Failed to allocate " + std::to_string(bytes) + " bytes of pixel data");
    }
}

template <typename T>
void PixelAssembler::place_chunky(std::span<T> samples, const ChunkDescriptor& chunk,
                                  std::span<const std::byte> decoded, std::endian order) const noexcept {
    const uint16_t spp = shape_.samples_per_pixel;
    const uint32_t pixel_bits = shape_.bits_per_chunk_pixel(0);
    const uint64_t stride = assembler::row_bytes(chunk.stored_width, pixel_bits);
    const std::size_t out_row = static_cast<std::size_t>(shape_.width) * spp;

    if (shape_.uniform_bits_per_sample() && shape_.bits_per_sample.front() == 8) {
        for (uint32_t row = 0; row < chunk.height; ++row) {
            const std::byte* src = decoded.data() + row * stride;
            T* dst = samples.data() + (chunk.y + row) * out_row + static_cast<std::size_t>(chunk.x) * spp;
            for (std::size_t i = 0; i < static_cast<std::size_t>(chunk.width) * spp; ++i) {
                dst[i] = static_cast<T>(std::to_integer<uint8_t>(src[i]));
            }
        }
        return;
    }

    for (uint32_t row = 0; row < chunk.height; ++row) {
        uint64_t bit_pos = row * stride * 8;
        T* dst = samples.data() + (chunk.y + row) * out_row + static_cast<std::size_t>(chunk.x) * spp;
        for (uint32_t col = 0; col < chunk.width; ++col) {
            for (uint16_t s = 0; s < spp; ++s) {
                const uint16_t bits = shape_.bits_per_sample[s];
                *dst++ = static_cast<T>(assembler::read_sample(decoded.data(), bit_pos, bits, order));
                bit_pos += bits;
            }
        }
    }
}

template <typename T>
void PixelAssembler::place_planar(std::span<T> samples, const ChunkDescriptor& chunk,
                                  std::span<const std::byte> decoded, std::endian order) const noexcept {
    const uint16_t spp = shape_.samples_per_pixel;
    const uint16_t bits = shape_.bits_per_sample[chunk.plane];
    const uint64_t stride = assembler::row_bytes(chunk.stored_width, bits);
    const std::size_t out_row = static_cast<std::size_t>(shape_.width) * spp;

    for (uint32_t row = 0; row < chunk.height; ++row) {
        uint64_t bit_pos = row * stride * 8;
        T* dst = samples.data() + (chunk.y + row) * out_row + static_cast<std::size_t>(chunk.x) * spp + chunk.plane;
        for (uint32_t col = 0; col < chunk.width; ++col) {
            *dst = static_cast<T>(assembler::read_sample(decoded.data(), bit_pos, bits, order));
            dst += spp;
            bit_pos += bits;
        }
    }
}

template <typename T>
void PixelAssembler::place_subsampled(std::span<T> samples, const ChunkDescriptor& chunk,
                                      std::span<const std::byte> decoded) const noexcept {
    const uint32_t h = shape_.ycbcr_subsampling[0];
    const uint32_t v = shape_.ycbcr_subsampling[1];
    const uint32_t blocks_across = (chunk.stored_width + h - 1) / h;
    const uint32_t blocks_down = (chunk.height + v - 1) / v;
    const std::size_t block_size = static_cast<std::size_t>(h) * v + 2;
    const std::size_t out_row = static_cast<std::size_t>(shape_.width) * 3;

    for (uint32_t by = 0; by < blocks_down; ++by) {
        for (uint32_t bx = 0; bx < blocks_across; ++bx) {
            const std::byte* block = decoded.data() + (static_cast<std::size_t>(by) * blocks_across + bx) * block_size;
            const T cb = static_cast<T>(std::to_integer<uint8_t>(block[h * v]));
            const T cr = static_cast<T>(std::to_integer<uint8_t>(block[h * v + 1]));
            for (uint32_t j = 0; j < v; ++j) {
                const uint32_t row = by * v + j;
                if (row >= chunk.height) {
                    break;
                }
                for (uint32_t i = 0; i < h; ++i) {
                    const uint32_t col = bx * h + i;
                    if (col >= chunk.width) {
                        break;
                    }
                    T* dst = samples.data() + (chunk.y + row) * out_row + static_cast<std::size_t>(chunk.x + col) * 3;
                    dst[0] = static_cast<T>(std::to_integer<uint8_t>(block[j * h + i]));
                    dst[1] = cb;
                    dst[2] = cr;
                }
            }
        }
    }
}

inline Result<void> PixelAssembler::check_chunk(const ChunkDescriptor& chunk, std::size_t decoded_bytes,
                                                std::size_t output_samples) const noexcept {
    const uint16_t spp = shape_.samples_per_pixel;
    if (chunk.width > chunk.stored_width || chunk.height > chunk.stored_height ||
        chunk.x > shape_.width || chunk.width > shape_.width - chunk.x ||
        chunk.y > shape_.height || chunk.height > shape_.height - chunk.y ||
        (shape_.planar == PlanarConfiguration::Planar && chunk.plane >= spp)) {
        return Err(Error::Code::InconsistentLayout,
                   "Chunk " + std::to_string(chunk.index) + " lies outside the image");
    }

    uint64_t needed = 0;
    bool fits = true;
    if (shape_.is_subsampled_ycbcr()) {
        const uint64_t h = shape_.ycbcr_subsampling[0];
        const uint64_t v = shape_.ycbcr_subsampling[1];
        const uint64_t blocks = (chunk.stored_width + h - 1) / h;
        fits = checked_mul(blocks, (chunk.height + v - 1) / v, needed) &&
               checked_mul(needed, h * v + 2, needed);
    } else {
        const uint16_t plane = shape_.planar == PlanarConfiguration::Planar ? chunk.plane : uint16_t{0};
        const uint64_t stride = assembler::row_bytes(chunk.stored_width, shape_.bits_per_chunk_pixel(plane));
        fits = checked_mul(stride, chunk.height, needed);
    }
    if (!fits || needed > decoded_bytes) {
        return Err(Error::Code::CodecError,
                   "Chunk " + std::to_string(chunk.index) + " decoded to " + std::to_string(decoded_bytes) +
                   " bytes, placing it needs more")
            .at_offset(static_cast<std::size_t>(chunk.offset));
    }

    uint64_t last_row_end = 0;
    if (!checked_mul(static_cast<uint64_t>(chunk.y) + chunk.height, static_cast<uint64_t>(shape_.width) * spp,
                     last_row_end) ||
        last_row_end > output_samples) {
        return Err(Error::Code::InconsistentLayout,
                   "Chunk " + std::to_string(chunk.index) + " does not fit the sample buffer");
    }
    return Ok();
}

inline Result<void> PixelAssembler::place_chunk(ImageData& samples, const ChunkDescriptor& chunk,
                                                std::span<const std::byte> decoded,
                                                const ChunkCodingParams& params) const noexcept {
    const std::size_t output_samples = std::visit([](const auto& buffer) { return buffer.size(); }, samples);
    auto valid = check_chunk(chunk, decoded.size(), output_samples);
    if (valid.is_error()) {
        return valid.error();
    }

    // The chunk decoder already brought uniform 16-bit samples to native order
    const std::endian order = params.bits_per_sample == 16 ? std::endian::native : params.byte_order;

    std::visit([&](auto& buffer) {
        using T = typename std::decay_t<decltype(buffer)>::value_type;
        std::span<T> out(buffer);
        if (shape_.planar == PlanarConfiguration::Planar) {
            place_planar<T>(out, chunk, decoded, order);
        } else if (shape_.is_subsampled_ycbcr()) {
            place_subsampled<T>(out, chunk, decoded);
        } else {
            place_chunky<T>(out, chunk, decoded, order);
        }
    }, samples);
    return Ok();
}

inline Result<Image> PixelAssembler::finish(ImageData&& samples) const noexcept {
    Image image;
    try {
        image.width = shape_.width;
        image.height = shape_.height;
        image.samples_per_pixel = shape_.samples_per_pixel;
        image.bits_per_sample = shape_.bits_per_sample;
        image.photometric = shape_.photometric;
        image.planar_configuration = shape_.planar;
        image.compression = static_cast<CompressionScheme>(shape_.compression);
        image.extra_samples = shape_.extra_samples;
    } catch (const std::bad_alloc&) {
        return Err(Error::Code::MemoryError, "Failed to allocate image description");
    }
    image.data = std::move(samples);

    switch (shape_.photometric) {
        case PhotometricInterpretation::Palette:
            return expand_palette(std::move(image));
        case PhotometricInterpretation::WhiteIsZero:
            if (options_.color_conversion == ColorConversion::ToRgb) {
                return Ok(invert_white_is_zero(std::move(image)));
            }
            break;
        case PhotometricInterpretation::CMYK:
            if (options_.color_conversion == ColorConversion::ToRgb) {
                return cmyk_to_rgb(std::move(image));
            }
            break;
        case PhotometricInterpretation::YCbCr:
            if (options_.color_conversion == ColorConversion::ToRgb) {
                return ycbcr_to_rgb(std::move(image));
            }
            break;
        default:
            break;
    }
    return Ok(std::move(image));
}

inline Result<Image> PixelAssembler::expand_palette(Image&& image) const noexcept {
    const uint16_t color_map_tag = static_cast<uint16_t>(TagCode::ColorMap);
    if (image.samples_per_pixel != 1) {
        return Err(Error::Code::UnsupportedFeature,
                   "Palette image with " + std::to_string(image.samples_per_pixel) + " samples per pixel")
            .for_tag(static_cast<uint16_t>(TagCode::SamplesPerPixel));
    }
    const uint16_t bits = image.bits_per_sample.front();
    const std::size_t entries = std::size_t{1} << bits;
    const auto& map = shape_.color_map;
    if (map.size() != 3 * entries) {
        return Err(Error::Code::InconsistentLayout,
                   "ColorMap has " + std::to_string(map.size()) + " values, " +
                   std::to_string(bits) + "-bit palette needs " + std::to_string(3 * entries))
            .for_tag(color_map_tag);
    }

    // Some writers store 8-bit colors instead of scaling them to 16 bits
    const bool eight_bit_map = std::all_of(map.begin(), map.end(), [](uint16_t v) { return v <= 255; });
    auto to_8bit = [eight_bit_map](uint16_t v) {
        return static_cast<uint8_t>(eight_bit_map ? v : v / 257);
    };

    std::vector<uint8_t> rgb;
    try {
        rgb.resize(image.sample_count() * 3);
    } catch (const std::bad_alloc&) {
        return Err(Error::Code::MemoryError, "Failed to allocate palette expansion");
    }

    bool out_of_range = false;
    std::visit([&](const auto& indices) {
        for (std::size_t p = 0; p < indices.size(); ++p) {
            const std::size_t index = indices[p];
            if (index >= entries) {
                out_of_range = true;
                return;
            }
            rgb[p * 3 + 0] = to_8bit(map[index]);
            rgb[p * 3 + 1] = to_8bit(map[entries + index]);
            rgb[p * 3 + 2] = to_8bit(map[2 * entries + index]);
        }
    }, image.data);
    if (out_of_range) {
        return Err(Error::Code::CodecError, "Palette index outside the ColorMap").for_tag(color_map_tag);
    }

    image.samples_per_pixel = 3;
    image.bits_per_sample.assign(3, 8);
    image.photometric = PhotometricInterpretation::RGB;
    image.extra_samples.clear();
    image.data = std::move(rgb);
    return Ok(std::move(image));
}

inline Image PixelAssembler::invert_white_is_zero(Image&& image) const noexcept {
    const uint16_t spp = image.samples_per_pixel;
    const uint32_t max = assembler::max_value(image.bits_per_sample.front());
    std::visit([&](auto& samples) {
        using T = typename std::decay_t<decltype(samples)>::value_type;
        for (std::size_t i = 0; i < samples.size(); i += spp) {
            samples[i] = static_cast<T>(max - samples[i]);
        }
    }, image.data);
    image.photometric = PhotometricInterpretation::BlackIsZero;
    return std::move(image);
}

inline Result<Image> PixelAssembler::cmyk_to_rgb(Image&& image) const noexcept {
    const uint16_t spp = image.samples_per_pixel;
    const auto& bits = image.bits_per_sample;
    if (spp < 4 || !std::all_of(bits.begin(), bits.begin() + 4, [&](uint16_t b) { return b == bits.front(); })) {
        return Err(Error::Code::UnsupportedFeature, "CMYK conversion needs four samples of equal depth")
            .for_tag(static_cast<uint16_t>(TagCode::BitsPerSample));
    }
    const uint32_t max = assembler::max_value(bits.front());
    const uint16_t out_spp = static_cast<uint16_t>(spp - 1);

    bool allocated = std::visit([&](auto& samples) {
        using T = typename std::decay_t<decltype(samples)>::value_type;
        const std::size_t pixels = samples.size() / spp;
        std::vector<T> rgb;
        try {
            rgb.resize(pixels * out_spp);
        } catch (const std::bad_alloc&) {
            return false;
        }
        for (std::size_t p = 0; p < pixels; ++p) {
            const T* src = samples.data() + p * spp;
            T* dst = rgb.data() + p * out_spp;
            const uint32_t k = src[3];
            dst[0] = static_cast<T>((max - src[0]) * (max - k) / max);
            dst[1] = static_cast<T>((max - src[1]) * (max - k) / max);
            dst[2] = static_cast<T>((max - src[2]) * (max - k) / max);
            std::copy(src + 4, src + spp, dst + 3);
        }
        samples = std::move(rgb);
        return true;
    }, image.data);
    if (!allocated) {
        return Err(Error::Code::MemoryError, "Failed to allocate CMYK conversion");
    }

    image.samples_per_pixel = out_spp;
    image.bits_per_sample.erase(image.bits_per_sample.begin());
    image.photometric = PhotometricInterpretation::RGB;
    return Ok(std::move(image));
}

inline Result<Image> PixelAssembler::ycbcr_to_rgb(Image&& image) const noexcept {
    const uint16_t spp = image.samples_per_pixel;
    auto* samples = std::get_if<std::vector<uint8_t>>(&image.data);
    if (spp < 3 || samples == nullptr ||
        !std::all_of(image.bits_per_sample.begin(), image.bits_per_sample.begin() + 3,
                     [](uint16_t b) { return b == 8; })) {
        return Err(Error::Code::UnsupportedFeature, "YCbCr conversion needs 8-bit samples")
            .for_tag(static_cast<uint16_t>(TagCode::BitsPerSample));
    }

    const auto& ref = shape_.reference_black_white;
    const double luma_red = shape_.ycbcr_coefficients[0];
    const double luma_green = shape_.ycbcr_coefficients[1];
    const double luma_blue = shape_.ycbcr_coefficients[2];
    if (luma_green == 0.0) {
        return Err(Error::Code::InvalidTag, "YCbCrCoefficients has a zero green coefficient")
            .for_tag(static_cast<uint16_t>(TagCode::YCbCrCoefficients));
    }

    // Code value to signed component, scaled by the ReferenceBlackWhite range
    auto component = [](double code, double black, double white, double range) {
        const double span = white - black;
        return (code - black) * range / (span != 0.0 ? span : 1.0);
    };
    auto clamp8 = [](double value) {
        return static_cast<uint8_t>(std::clamp(std::lround(value), 0L, 255L));
    };

    for (std::size_t i = 0; i + 2 < samples->size(); i += spp) {
        uint8_t* pixel = samples->data() + i;
        const double y = component(pixel[0], ref[0], ref[1], 255.0);
        const double cb = component(pixel[1], ref[2], ref[3], 127.0);
        const double cr = component(pixel[2], ref[4], ref[5], 127.0);
        const double r = y + cr * (2.0 - 2.0 * luma_red);
        const double b = y + cb * (2.0 - 2.0 * luma_blue);
        const double g = (y - luma_blue * b - luma_red * r) / luma_green;
        pixel[0] = clamp8(r);
        pixel[1] = clamp8(g);
        pixel[2] = clamp8(b);
    }

    image.photometric = PhotometricInterpretation::RGB;
    return Ok(std::move(image));
}

} // namespace tiffkit
