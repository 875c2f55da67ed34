// This file contains the implementation of TiffWriter.
// Do not include this file directly - it is included by tiff_writer.hpp

#pragma once

#include <algorithm>
#include <array>
#include <fstream>
#include <limits>
#include <new>
#include <span>
#include <string>
#include <variant>
#include "../logging.hpp"

#ifndef TIFFKIT_TIFF_WRITER_HEADER
#include "../tiff_writer.hpp" // for linters
#endif

namespace tiffkit {

namespace writer_impl {

/// Strips are sized to about this many bytes when rows_per_strip is 0
inline constexpr std::size_t default_strip_bytes = 8192;

/// Tags the writer derives from the image and the options
inline constexpr std::array<TagCode, 18> managed_tags = {
    TagCode::ImageWidth,
    TagCode::ImageLength,
    TagCode::BitsPerSample,
    TagCode::Compression,
    TagCode::PhotometricInterpretation,
    TagCode::FillOrder,
    TagCode::StripOffsets,
    TagCode::SamplesPerPixel,
    TagCode::RowsPerStrip,
    TagCode::StripByteCounts,
    TagCode::PlanarConfiguration,
    TagCode::Predictor,
    TagCode::TileWidth,
    TagCode::TileLength,
    TagCode::TileOffsets,
    TagCode::TileByteCounts,
    TagCode::ExtraSamples,
    TagCode::SampleFormat,
};

/// @brief Write `bits` bits (at most 16) of `value` starting at `bit_pos`, MSB first
/// @note The destination must be zeroed, bits are OR-ed in
inline void write_bits(std::byte* data, uint64_t bit_pos, uint16_t bits, uint32_t value) noexcept {
    uint16_t remaining = bits;
    while (remaining > 0) {
        const uint32_t used = static_cast<uint32_t>(bit_pos & 7);
        const uint32_t take = std::min<uint32_t>(8 - used, remaining);
        const uint32_t part = (value >> (remaining - take)) & ((1u << take) - 1u);
        data[bit_pos >> 3] |= static_cast<std::byte>(part << (8 - used - take));
        bit_pos += take;
        remaining = static_cast<uint16_t>(remaining - take);
    }
}

/// Inverse of assembler::read_sample
inline void write_sample(std::byte* data, uint64_t bit_pos, uint16_t bits, uint32_t value, std::endian order) noexcept {
    if ((bit_pos & 7) == 0) {
        if (bits == 8) {
            data[bit_pos >> 3] = static_cast<std::byte>(value);
            return;
        }
        if (bits == 16) {
            store_value<uint16_t>(data + (bit_pos >> 3), static_cast<uint16_t>(value), order);
            return;
        }
    }
    write_bits(data, bit_pos, bits, value);
}

constexpr uint64_t row_bytes(uint64_t columns, uint64_t bits_per_pixel) noexcept {
    return (columns * bits_per_pixel + 7) / 8;
}

template <typename T>
void pack_chunky(std::span<const T> samples, const ImageShape& shape, const ChunkDescriptor& chunk,
                 std::span<std::byte> out, std::endian order) noexcept {
    const uint16_t spp = shape.samples_per_pixel;
    const uint64_t stride = row_bytes(chunk.stored_width, shape.bits_per_chunk_pixel(0));
    const std::size_t in_row = static_cast<std::size_t>(shape.width) * spp;

    for (uint32_t row = 0; row < chunk.height; ++row) {
        const T* src = samples.data() + (chunk.y + row) * in_row + static_cast<std::size_t>(chunk.x) * spp;
        if (shape.uniform_bits_per_sample() && shape.bits_per_sample.front() == 8) {
            std::byte* dst = out.data() + row * stride;
            for (std::size_t i = 0; i < static_cast<std::size_t>(chunk.width) * spp; ++i) {
                dst[i] = static_cast<std::byte>(src[i]);
            }
            continue;
        }
        uint64_t bit_pos = row * stride * 8;
        for (uint32_t col = 0; col < chunk.width; ++col) {
            for (uint16_t s = 0; s < spp; ++s) {
                const uint16_t bits = shape.bits_per_sample[s];
                write_sample(out.data(), bit_pos, bits, *src++, order);
                bit_pos += bits;
            }
        }
    }
}

template <typename T>
void pack_planar(std::span<const T> samples, const ImageShape& shape, const ChunkDescriptor& chunk,
                 std::span<std::byte> out, std::endian order) noexcept {
    const uint16_t spp = shape.samples_per_pixel;
    const uint16_t bits = shape.bits_per_sample[chunk.plane];
    const uint64_t stride = row_bytes(chunk.stored_width, bits);
    const std::size_t in_row = static_cast<std::size_t>(shape.width) * spp;

    for (uint32_t row = 0; row < chunk.height; ++row) {
        const T* src = samples.data() + (chunk.y + row) * in_row +
                       static_cast<std::size_t>(chunk.x) * spp + chunk.plane;
        uint64_t bit_pos = row * stride * 8;
        for (uint32_t col = 0; col < chunk.width; ++col) {
            write_sample(out.data(), bit_pos, bits, src[static_cast<std::size_t>(col) * spp], order);
            bit_pos += bits;
        }
    }
}

/// @brief Check that every sample fits the bit depth of its channel
template <typename T>
Result<void> check_sample_range(std::span<const T> samples, const std::vector<uint16_t>& bits_per_sample) noexcept {
    const std::size_t spp = bits_per_sample.size();
    for (std::size_t c = 0; c < spp; ++c) {
        const uint16_t bits = bits_per_sample[c];
        if (bits >= sizeof(T) * 8) {
            continue;
        }
        const uint32_t max = (1u << bits) - 1u;
        for (std::size_t i = c; i < samples.size(); i += spp) {
            if (samples[i] > max) {
                return Err(Error::Code::InvalidFormat,
                           "Sample " + std::to_string(i) + " value " + std::to_string(samples[i]) +
                           " does not fit in " + std::to_string(bits) + " bits");
            }
        }
    }
    return Ok();
}

} // namespace writer_impl

// ============================================================================
// TiffWriter Private Member Function Implementations
// ============================================================================

template <typename CompSpec>
    requires ValidCompressorSpec<CompSpec>
Result<ImageShape> TiffWriter<CompSpec>::shape_for(const Image& image, const WriteOptions& options) noexcept {
    if (image.width == 0 || image.height == 0) {
        return Err(Error::Code::InvalidFormat, "Image dimensions must be non-zero");
    }
    if (image.samples_per_pixel == 0 || image.bits_per_sample.size() != image.samples_per_pixel) {
        return Err(Error::Code::InvalidFormat,
                   std::to_string(image.bits_per_sample.size()) + " bit depths for " +
                   std::to_string(image.samples_per_pixel) + " samples per pixel");
    }
    if (image.extra_samples.size() > image.samples_per_pixel) {
        return Err(Error::Code::InvalidFormat, "More extra samples than samples per pixel");
    }

    uint16_t max_bits = 0;
    for (uint16_t bits : image.bits_per_sample) {
        if (bits == 0 || bits > 16) {
            return Err(Error::Code::InvalidFormat, std::to_string(bits) + "-bit samples cannot be written");
        }
        max_bits = std::max(max_bits, bits);
    }
    if ((max_bits <= 8) != (image.as_u8() != nullptr)) {
        return Err(Error::Code::InvalidFormat,
                   "Samples of up to 8 bits are stored as uint8_t, wider samples as uint16_t");
    }

    uint64_t expected = 0;
    if (!checked_mul(image.width, image.height, expected) ||
        !checked_mul(expected, image.samples_per_pixel, expected)) {
        return Err(Error::Code::InvalidFormat, "Image dimensions overflow the sample count");
    }
    if (image.sample_count() != expected) {
        return Err(Error::Code::InvalidFormat,
                   "Image holds " + std::to_string(image.sample_count()) + " samples, " +
                   std::to_string(expected) + " expected");
    }

    auto in_range = std::visit([&](const auto& samples) {
        using T = typename std::decay_t<decltype(samples)>::value_type;
        return writer_impl::check_sample_range<T>(samples, image.bits_per_sample);
    }, image.data);
    if (!in_range) {
        return in_range.error();
    }

    if (image.photometric == PhotometricInterpretation::Palette && image.samples_per_pixel != 1) {
        return Err(Error::Code::InvalidFormat, "Palette images have one sample per pixel");
    }

    if (!CompSpec::supports(options.compression)) {
        return Err(Error::Code::UnsupportedCompression,
                   "Compression " + std::to_string(static_cast<uint16_t>(options.compression)) +
                   " has no encoder in this build")
            .for_tag(static_cast<uint16_t>(TagCode::Compression));
    }

    ImageShape shape;
    shape.width = image.width;
    shape.height = image.height;
    shape.samples_per_pixel = image.samples_per_pixel;
    shape.bits_per_sample = image.bits_per_sample;
    shape.compression = static_cast<uint16_t>(options.compression);
    shape.photometric = image.photometric;
    shape.planar = options.planar;
    shape.predictor = options.predictor;
    shape.extra_samples = image.extra_samples;
    // Written at full resolution
    shape.ycbcr_subsampling = {1, 1};

    if (options.tiled()) {
        if (options.tile_width == 0 || options.tile_length == 0 ||
            options.tile_width % 16 != 0 || options.tile_length % 16 != 0) {
            return Err(Error::Code::InvalidFormat,
                       "Tile size " + std::to_string(options.tile_width) + "x" +
                       std::to_string(options.tile_length) + " is not a non-zero multiple of 16");
        }
        shape.tile_width = options.tile_width;
        shape.tile_length = options.tile_length;
    } else if (options.rows_per_strip != 0) {
        shape.rows_per_strip = std::min(options.rows_per_strip, image.height);
    } else {
        uint32_t pixel_bits = 0;
        for (uint16_t plane = 0; plane < shape.planes(); ++plane) {
            pixel_bits = std::max(pixel_bits, shape.bits_per_chunk_pixel(plane));
        }
        const uint64_t row = writer_impl::row_bytes(image.width, pixel_bits);
        const uint64_t rows = std::max<uint64_t>(1, writer_impl::default_strip_bytes / row);
        shape.rows_per_strip = static_cast<uint32_t>(std::min<uint64_t>(rows, image.height));
    }

    return Ok(std::move(shape));
}

template <typename CompSpec>
    requires ValidCompressorSpec<CompSpec>
Result<void> TiffWriter<CompSpec>::validate_extra_tags(
    const Image& image, const WriteOptions& options, const IFDBuilder* extra_tags) noexcept {
    const bool has_color_map = extra_tags != nullptr && extra_tags->contains(TagCode::ColorMap);
    if (image.photometric == PhotometricInterpretation::Palette && !has_color_map) {
        return Err(Error::Code::MissingRequiredTag, "Palette images need a ColorMap tag")
            .for_tag(static_cast<uint16_t>(TagCode::ColorMap));
    }
    if (extra_tags == nullptr) {
        return Ok();
    }

    for (TagCode managed : writer_impl::managed_tags) {
        if (extra_tags->contains(managed)) {
            return Err(Error::Code::InvalidTag,
                       "Tag " + std::to_string(static_cast<uint16_t>(managed)) + " is set by the writer")
                .for_tag(static_cast<uint16_t>(managed));
        }
    }
    if (!options.software.empty() && extra_tags->contains(TagCode::Software)) {
        return Err(Error::Code::InvalidTag, "Software is set by WriteOptions::software")
            .for_tag(static_cast<uint16_t>(TagCode::Software));
    }
    if (image.photometric == PhotometricInterpretation::YCbCr && extra_tags->contains(TagCode::YCbCrSubSampling)) {
        return Err(Error::Code::InvalidTag, "YCbCr images are written without subsampling")
            .for_tag(static_cast<uint16_t>(TagCode::YCbCrSubSampling));
    }
    return Ok();
}

template <typename CompSpec>
    requires ValidCompressorSpec<CompSpec>
Result<void> TiffWriter<CompSpec>::pack_chunk(
    const Image& image, const ImageShape& shape, const ChunkDescriptor& chunk,
    const ChunkCodingParams& params) noexcept {
    try {
        chunk_buffer_.assign(chunk.decoded_size, std::byte{0});
    } catch (const std::bad_alloc&) {
        return Err(Error::Code::MemoryError,
                   "Failed to allocate " + std::to_string(chunk.decoded_size) + " bytes for chunk " +
                   std::to_string(chunk.index));
    }

    // Uniform 16-bit samples are packed in native order, the encoder swaps them
    const std::endian order = params.bits_per_sample == 16 ? std::endian::native : params.byte_order;

    std::visit([&](const auto& samples) {
        using T = typename std::decay_t<decltype(samples)>::value_type;
        if (shape.planar == PlanarConfiguration::Planar) {
            writer_impl::pack_planar<T>(samples, shape, chunk, chunk_buffer_, order);
        } else {
            writer_impl::pack_chunky<T>(samples, shape, chunk, chunk_buffer_, order);
        }
    }, image.data);
    return Ok();
}

// ============================================================================
// TiffWriter Public Member Function Implementations
// ============================================================================

template <typename CompSpec>
    requires ValidCompressorSpec<CompSpec>
Result<std::vector<std::byte>> TiffWriter<CompSpec>::write(
    const Image& image, const WriteOptions& options, const IFDBuilder* extra_tags) noexcept {

    auto shape = shape_for(image, options);
    if (shape.is_error()) {
        return shape.error();
    }
    auto extra_check = validate_extra_tags(image, options, extra_tags);
    if (extra_check.is_error()) {
        return extra_check.error();
    }

    const ChunkKind kind = shape.value().is_tiled() ? ChunkKind::Tile : ChunkKind::Strip;

    // Offsets are filled in as chunks are written; the layout only needs the chunk count
    std::vector<uint32_t> offsets;
    std::vector<uint32_t> byte_counts;
    std::vector<std::byte> file;
    try {
        uint64_t per_plane;
        if (kind == ChunkKind::Tile) {
            per_plane = static_cast<uint64_t>((image.width + options.tile_width - 1) / options.tile_width) *
                        ((image.height + options.tile_length - 1) / options.tile_length);
        } else {
            per_plane = (image.height + shape.value().rows_per_strip - 1) / shape.value().rows_per_strip;
        }
        offsets.assign(static_cast<std::size_t>(per_plane * shape.value().planes()), 0);
        byte_counts.assign(offsets.size(), 0);
        file.assign(tiff_header_size, std::byte{0});
    } catch (const std::bad_alloc&) {
        return Err(Error::Code::MemoryError, "Failed to allocate chunk tables");
    }

    auto layout = build_chunk_layout(shape.value(), kind, offsets, byte_counts);
    if (layout.is_error()) {
        return layout.error();
    }

    logger()->debug("Writing {}x{} image as {} {}, compression {}",
                    image.width, image.height, layout.value().chunks.size(),
                    kind == ChunkKind::Tile ? "tiles" : "strips",
                    static_cast<uint16_t>(options.compression));

    for (const ChunkDescriptor& chunk : layout.value().chunks) {
        const auto params = ChunkCodingParams::for_chunk(shape.value(), chunk, options.byte_order);

        auto packed = pack_chunk(image, shape.value(), chunk, params);
        if (packed.is_error()) {
            return packed.error();
        }

        auto encoded = encoder_.encode(chunk_buffer_, chunk.index, params);
        if (encoded.is_error()) {
            return encoded.error();
        }

        const std::vector<std::byte>& data = encoded.value().data;
        if (file.size() + data.size() > std::numeric_limits<uint32_t>::max()) {
            return Err(Error::Code::WriteError, "Chunk data does not fit 32-bit offsets");
        }
        offsets[chunk.index] = static_cast<uint32_t>(file.size());
        byte_counts[chunk.index] = static_cast<uint32_t>(data.size());
        try {
            file.insert(file.end(), data.begin(), data.end());
        } catch (const std::bad_alloc&) {
            return Err(Error::Code::MemoryError, "Failed to grow file buffer");
        }
    }

    IFDBuilder tags;
    Result<void> status = Ok();
    auto add = [&status](Result<void>&& added) {
        if (status && !added) {
            status = std::move(added);
        }
    };

    const ImageShape& s = shape.value();
    add(tags.add_long(TagCode::ImageWidth, image.width));
    add(tags.add_long(TagCode::ImageLength, image.height));
    add(tags.add_shorts(TagCode::BitsPerSample, image.bits_per_sample));
    add(tags.add_short(TagCode::Compression, static_cast<uint16_t>(options.compression)));
    add(tags.add_short(TagCode::PhotometricInterpretation, static_cast<uint16_t>(image.photometric)));
    add(tags.add_short(TagCode::SamplesPerPixel, image.samples_per_pixel));
    add(tags.add_short(TagCode::PlanarConfiguration, static_cast<uint16_t>(options.planar)));
    if (kind == ChunkKind::Tile) {
        add(tags.add_long(TagCode::TileWidth, options.tile_width));
        add(tags.add_long(TagCode::TileLength, options.tile_length));
        add(tags.add_longs(TagCode::TileOffsets, offsets));
        add(tags.add_longs(TagCode::TileByteCounts, byte_counts));
    } else {
        add(tags.add_longs(TagCode::StripOffsets, offsets));
        add(tags.add_long(TagCode::RowsPerStrip, s.rows_per_strip));
        add(tags.add_longs(TagCode::StripByteCounts, byte_counts));
    }
    if (options.predictor != Predictor::None) {
        add(tags.add_short(TagCode::Predictor, static_cast<uint16_t>(options.predictor)));
    }
    if (!image.extra_samples.empty()) {
        add(tags.add_shorts(TagCode::ExtraSamples, image.extra_samples));
    }
    if (image.photometric == PhotometricInterpretation::YCbCr) {
        add(tags.add_shorts(TagCode::YCbCrSubSampling, s.ycbcr_subsampling));
    }
    if (!options.software.empty()) {
        add(tags.add_ascii(TagCode::Software, options.software));
    }
    if (extra_tags != nullptr) {
        add(tags.merge(*extra_tags));
    }
    if (status.is_error()) {
        return status.error();
    }

    auto ifd_offset = tags.write_to(file, options.byte_order);
    if (ifd_offset.is_error()) {
        return ifd_offset.error();
    }

    const bool little = options.byte_order == std::endian::little;
    file[0] = file[1] = static_cast<std::byte>(little ? 'I' : 'M');
    store_value<uint16_t>(file.data() + 2, tiff_magic, options.byte_order);
    store_value<uint32_t>(file.data() + 4, ifd_offset.value(), options.byte_order);

    logger()->debug("IFD with {} entries at offset {}, file is {} bytes",
                    tags.size(), ifd_offset.value(), file.size());
    return Ok(std::move(file));
}

template <typename CompSpec>
    requires ValidCompressorSpec<CompSpec>
Result<void> TiffWriter<CompSpec>::write_file(
    std::string_view path, const Image& image, const WriteOptions& options, const IFDBuilder* extra_tags) noexcept {
    auto bytes = write(image, options, extra_tags);
    if (bytes.is_error()) {
        return bytes.error();
    }

    std::ofstream stream(std::string(path), std::ios::binary | std::ios::out | std::ios::trunc);
    if (!stream) {
        return Err(Error::Code::FileNotFound, "Failed to create file: " + std::string(path));
    }
    stream.write(reinterpret_cast<const char*>(bytes.value().data()),
                 static_cast<std::streamsize>(bytes.value().size()));
    stream.flush();
    if (!stream) {
        return Err(Error::Code::WriteError, "Failed to write file: " + std::string(path));
    }
    return Ok();
}

} // namespace tiffkit
