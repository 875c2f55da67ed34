#pragma once

#include <algorithm>
#include <numeric>
#include <string>
#include "../logging.hpp"
#include "../parsing.hpp"

#ifndef TIFFKIT_IMAGE_SHAPE_HEADER
#include "../image_shape.hpp" // for linters
#endif

namespace tiffkit {

namespace shape_impl {

template <RawReader Reader>
Result<std::optional<ResolvedValue>> optional_value(
    const ByteCursor<Reader>& cursor, const IFD& ifd, TagCode code) noexcept {
    const TagEntry* entry = ifd.find(code);
    if (entry == nullptr) {
        return Ok(std::optional<ResolvedValue>{});
    }
    auto value = parsing::resolve(cursor, *entry);
    if (value.is_error()) {
        return value.error();
    }
    return Ok(std::optional<ResolvedValue>(std::move(value.value())));
}

template <RawReader Reader>
Result<std::optional<uint32_t>> optional_unsigned(
    const ByteCursor<Reader>& cursor, const IFD& ifd, TagCode code) noexcept {
    auto value = optional_value(cursor, ifd, code);
    if (value.is_error()) {
        return value.error();
    }
    if (!value.value().has_value()) {
        return Ok(std::optional<uint32_t>{});
    }
    auto number = value.value()->as_unsigned();
    if (number.is_error()) {
        return Err(number.error().code, number.error().message).for_tag(static_cast<uint16_t>(code));
    }
    return Ok(std::optional<uint32_t>(number.value()));
}

template <RawReader Reader>
Result<uint32_t> unsigned_or(
    const ByteCursor<Reader>& cursor, const IFD& ifd, TagCode code, uint32_t default_value) noexcept {
    auto value = optional_unsigned(cursor, ifd, code);
    if (value.is_error()) {
        return value.error();
    }
    return Ok(value.value().value_or(default_value));
}

template <RawReader Reader>
Result<std::optional<std::vector<uint16_t>>> optional_shorts(
    const ByteCursor<Reader>& cursor, const IFD& ifd, TagCode code) noexcept {
    auto value = optional_value(cursor, ifd, code);
    if (value.is_error()) {
        return value.error();
    }
    if (!value.value().has_value()) {
        return Ok(std::optional<std::vector<uint16_t>>{});
    }
    auto shorts = value.value()->as_short_array();
    if (shorts.is_error()) {
        return Err(shorts.error().code, shorts.error().message).for_tag(static_cast<uint16_t>(code));
    }
    return Ok(std::optional<std::vector<uint16_t>>(std::move(shorts.value())));
}

template <RawReader Reader>
Result<std::optional<std::vector<double>>> optional_doubles(
    const ByteCursor<Reader>& cursor, const IFD& ifd, TagCode code) noexcept {
    auto value = optional_value(cursor, ifd, code);
    if (value.is_error()) {
        return value.error();
    }
    if (!value.value().has_value()) {
        return Ok(std::optional<std::vector<double>>{});
    }
    auto numbers = value.value()->as_double_array();
    if (numbers.is_error()) {
        return Err(numbers.error().code, numbers.error().message).for_tag(static_cast<uint16_t>(code));
    }
    return Ok(std::optional<std::vector<double>>(std::move(numbers.value())));
}

inline bool is_known_photometric(uint32_t value) noexcept {
    return value <= 6 || value == 8;
}

} // namespace shape_impl

template <RawReader Reader>
Result<ImageShape> ImageShape::from_ifd(const ByteCursor<Reader>& cursor, const IFD& ifd) noexcept {
    using namespace shape_impl;
    ImageShape shape;

    // Dimensions
    auto width = optional_unsigned(cursor, ifd, TagCode::ImageWidth);
    if (width.is_error()) {
        return width.error();
    }
    if (!width.value()) {
        return Err(Error::Code::MissingRequiredTag, "ImageWidth tag is missing")
            .for_tag(static_cast<uint16_t>(TagCode::ImageWidth));
    }
    auto height = optional_unsigned(cursor, ifd, TagCode::ImageLength);
    if (height.is_error()) {
        return height.error();
    }
    if (!height.value()) {
        return Err(Error::Code::MissingRequiredTag, "ImageLength tag is missing")
            .for_tag(static_cast<uint16_t>(TagCode::ImageLength));
    }
    shape.width = *width.value();
    shape.height = *height.value();
    if (shape.width == 0 || shape.height == 0) {
        return Err(Error::Code::InvalidFormat,
                   "Image has zero size (" + std::to_string(shape.width) + "x" + std::to_string(shape.height) + ")");
    }

    // Samples
    auto spp = unsigned_or(cursor, ifd, TagCode::SamplesPerPixel, 1);
    if (spp.is_error()) {
        return spp.error();
    }
    if (spp.value() == 0 || spp.value() > 0xFFFF) {
        return Err(Error::Code::InvalidFormat, "Invalid SamplesPerPixel " + std::to_string(spp.value()))
            .for_tag(static_cast<uint16_t>(TagCode::SamplesPerPixel));
    }
    shape.samples_per_pixel = static_cast<uint16_t>(spp.value());

    auto bits = optional_shorts(cursor, ifd, TagCode::BitsPerSample);
    if (bits.is_error()) {
        return bits.error();
    }
    if (bits.value().has_value()) {
        auto& values = *bits.value();
        if (values.size() == 1) {
            shape.bits_per_sample.assign(shape.samples_per_pixel, values[0]);
        } else if (values.size() == shape.samples_per_pixel) {
            shape.bits_per_sample = values;
        } else {
            return Err(Error::Code::InvalidTag,
                       "BitsPerSample has " + std::to_string(values.size()) + " values for " +
                       std::to_string(shape.samples_per_pixel) + " samples")
                .for_tag(static_cast<uint16_t>(TagCode::BitsPerSample));
        }
    } else {
        shape.bits_per_sample.assign(shape.samples_per_pixel, 1);
    }
    if (std::find(shape.bits_per_sample.begin(), shape.bits_per_sample.end(), 0) != shape.bits_per_sample.end()) {
        return Err(Error::Code::InvalidFormat, "BitsPerSample of 0")
            .for_tag(static_cast<uint16_t>(TagCode::BitsPerSample));
    }

    auto sample_format = optional_shorts(cursor, ifd, TagCode::SampleFormat);
    if (sample_format.is_error()) {
        return sample_format.error();
    }
    if (sample_format.value().has_value() && !sample_format.value()->empty()) {
        const auto& formats = *sample_format.value();
        if (!std::all_of(formats.begin(), formats.end(), [&](uint16_t f) { return f == formats.front(); })) {
            return Err(Error::Code::UnsupportedFeature, "Mixed sample formats are not supported")
                .for_tag(static_cast<uint16_t>(TagCode::SampleFormat));
        }
        shape.sample_format = static_cast<SampleFormat>(formats.front());
    }

    // Compression and predictor
    auto compression = unsigned_or(cursor, ifd, TagCode::Compression, 1);
    if (compression.is_error()) {
        return compression.error();
    }
    shape.compression = static_cast<uint16_t>(compression.value());

    auto predictor = unsigned_or(cursor, ifd, TagCode::Predictor, 1);
    if (predictor.is_error()) {
        return predictor.error();
    }
    if (predictor.value() < 1 || predictor.value() > 3) {
        return Err(Error::Code::UnsupportedFeature, "Unknown predictor " + std::to_string(predictor.value()))
            .for_tag(static_cast<uint16_t>(TagCode::Predictor));
    }
    shape.predictor = static_cast<Predictor>(predictor.value());

    auto fill_order = unsigned_or(cursor, ifd, TagCode::FillOrder, 1);
    if (fill_order.is_error()) {
        return fill_order.error();
    }
    if (fill_order.value() == 2) {
        shape.fill_order = FillOrder::LsbToMsb;
    } else if (fill_order.value() != 1) {
        logger()->warn("Ignoring invalid FillOrder {}", fill_order.value());
    }

    // Pixels are returned in stored order
    auto orientation = unsigned_or(cursor, ifd, TagCode::Orientation, 1);
    if (orientation.is_ok() && orientation.value() != 1) {
        logger()->warn("Orientation {} is not applied to the decoded pixels", orientation.value());
    }

    // Color interpretation
    auto photometric = optional_unsigned(cursor, ifd, TagCode::PhotometricInterpretation);
    if (photometric.is_error()) {
        return photometric.error();
    }
    if (photometric.value().has_value()) {
        if (!is_known_photometric(*photometric.value()) || *photometric.value() == 7) {
            return Err(Error::Code::UnsupportedFeature,
                       "Unsupported photometric interpretation " + std::to_string(*photometric.value()))
                .for_tag(static_cast<uint16_t>(TagCode::PhotometricInterpretation));
        }
        shape.photometric = static_cast<PhotometricInterpretation>(*photometric.value());
    } else {
        shape.photometric = shape.samples_per_pixel >= 3 ? PhotometricInterpretation::RGB
                                                         : PhotometricInterpretation::BlackIsZero;
        logger()->warn("PhotometricInterpretation missing in IFD at offset {}, assuming {}",
                       ifd.offset(), static_cast<int>(shape.photometric));
    }

    auto planar = unsigned_or(cursor, ifd, TagCode::PlanarConfiguration, 1);
    if (planar.is_error()) {
        return planar.error();
    }
    if (planar.value() != 1 && planar.value() != 2) {
        return Err(Error::Code::UnsupportedFeature,
                   "Unknown planar configuration " + std::to_string(planar.value()))
            .for_tag(static_cast<uint16_t>(TagCode::PlanarConfiguration));
    }
    shape.planar = static_cast<PlanarConfiguration>(planar.value());

    auto extra = optional_shorts(cursor, ifd, TagCode::ExtraSamples);
    if (extra.is_error()) {
        return extra.error();
    }
    if (extra.value().has_value()) {
        shape.extra_samples = std::move(*extra.value());
    }

    auto color_map = optional_shorts(cursor, ifd, TagCode::ColorMap);
    if (color_map.is_error()) {
        return color_map.error();
    }
    if (color_map.value().has_value()) {
        shape.color_map = std::move(*color_map.value());
    }

    auto subsampling = optional_shorts(cursor, ifd, TagCode::YCbCrSubSampling);
    if (subsampling.is_error()) {
        return subsampling.error();
    }
    if (subsampling.value().has_value()) {
        const auto& factors = *subsampling.value();
        auto valid = [](uint16_t f) { return f == 1 || f == 2 || f == 4; };
        if (factors.size() != 2 || !valid(factors[0]) || !valid(factors[1])) {
            return Err(Error::Code::InvalidTag, "Invalid YCbCrSubSampling")
                .for_tag(static_cast<uint16_t>(TagCode::YCbCrSubSampling));
        }
        shape.ycbcr_subsampling = {factors[0], factors[1]};
    }

    auto coefficients = optional_doubles(cursor, ifd, TagCode::YCbCrCoefficients);
    if (coefficients.is_error()) {
        return coefficients.error();
    }
    if (coefficients.value().has_value() && coefficients.value()->size() == 3) {
        std::copy_n(coefficients.value()->begin(), 3, shape.ycbcr_coefficients.begin());
    }

    auto reference = optional_doubles(cursor, ifd, TagCode::ReferenceBlackWhite);
    if (reference.is_error()) {
        return reference.error();
    }
    if (reference.value().has_value() && reference.value()->size() == 6) {
        std::copy_n(reference.value()->begin(), 6, shape.reference_black_white.begin());
    }

    // Chunk layout
    auto rows_per_strip = unsigned_or(cursor, ifd, TagCode::RowsPerStrip, 0xFFFFFFFFu);
    if (rows_per_strip.is_error()) {
        return rows_per_strip.error();
    }
    shape.rows_per_strip = rows_per_strip.value();

    auto tile_width = optional_unsigned(cursor, ifd, TagCode::TileWidth);
    if (tile_width.is_error()) {
        return tile_width.error();
    }
    auto tile_length = optional_unsigned(cursor, ifd, TagCode::TileLength);
    if (tile_length.is_error()) {
        return tile_length.error();
    }
    shape.tile_width = tile_width.value();
    shape.tile_length = tile_length.value();

    return Ok(std::move(shape));
}

inline uint16_t ImageShape::max_bits_per_sample() const noexcept {
    if (bits_per_sample.empty()) {
        return 0;
    }
    return *std::max_element(bits_per_sample.begin(), bits_per_sample.end());
}

inline bool ImageShape::uniform_bits_per_sample() const noexcept {
    return std::all_of(bits_per_sample.begin(), bits_per_sample.end(),
                       [this](uint16_t b) { return b == bits_per_sample.front(); });
}

inline uint32_t ImageShape::bits_per_chunk_pixel(uint16_t plane) const noexcept {
    if (planar == PlanarConfiguration::Planar) {
        return plane < bits_per_sample.size() ? bits_per_sample[plane] : 0;
    }
    return std::accumulate(bits_per_sample.begin(), bits_per_sample.end(), uint32_t{0});
}

inline Result<uint64_t> ImageShape::sample_count() const noexcept {
    uint64_t count = 0;
    if (!checked_mul(width, height, count) || !checked_mul(count, samples_per_pixel, count)) {
        return Err(Error::Code::MemoryError,
                   std::to_string(width) + "x" + std::to_string(height) + "x" +
                   std::to_string(samples_per_pixel) + " samples overflow the addressable size");
    }
    return Ok(count);
}

inline bool ImageShape::is_subsampled_ycbcr() const noexcept {
    return photometric == PhotometricInterpretation::YCbCr &&
           planar == PlanarConfiguration::Chunky &&
           samples_per_pixel >= 3 &&
           (ycbcr_subsampling[0] != 1 || ycbcr_subsampling[1] != 1);
}

} // namespace tiffkit
