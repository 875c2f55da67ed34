#pragma once

#include <string>
#include <utility>
#include "../predictor.hpp"

#ifndef TIFFKIT_CHUNK_CODING_HEADER
#include "../chunk_coding.hpp" // for linters
#endif

namespace tiffkit {

namespace chunk_coding_impl {

consteval std::array<std::byte, 256> make_bit_reversal_table() {
    std::array<std::byte, 256> table{};
    for (unsigned i = 0; i < 256; ++i) {
        unsigned reversed = 0;
        for (unsigned bit = 0; bit < 8; ++bit) {
            if (i & (1u << bit)) {
                reversed |= 0x80u >> bit;
            }
        }
        table[i] = static_cast<std::byte>(reversed);
    }
    return table;
}

inline constexpr std::array<std::byte, 256> bit_reversal_table = make_bit_reversal_table();

} // namespace chunk_coding_impl

inline ChunkCodingParams ChunkCodingParams::for_chunk(
    const ImageShape& shape, const ChunkDescriptor& chunk, std::endian byte_order) noexcept {
    ChunkCodingParams params;
    params.compression = static_cast<CompressionScheme>(shape.compression);
    params.predictor = shape.predictor;
    params.fill_order = shape.fill_order;
    params.byte_order = byte_order;
    if (shape.planar == PlanarConfiguration::Planar) {
        params.bits_per_sample = shape.bits_per_sample[chunk.plane];
    } else {
        params.bits_per_sample = shape.uniform_bits_per_sample() ? shape.bits_per_sample.front() : uint16_t{0};
    }
    params.samples_per_pixel = shape.samples_per_chunk_pixel();
    params.width = chunk.stored_width;
    params.height = chunk.stored_height;
    params.subsampled = shape.is_subsampled_ycbcr();
    return params;
}

inline Result<void> ChunkCodingParams::validate_predictor() const noexcept {
    switch (predictor) {
        case Predictor::None:
            return Ok();
        case Predictor::Horizontal:
            if (subsampled) {
                return Err(Error::Code::UnsupportedFeature,
                           "Horizontal predictor on subsampled YCbCr data is not supported")
                    .for_tag(static_cast<uint16_t>(TagCode::Predictor));
            }
            if (bits_per_sample != 8 && bits_per_sample != 16) {
                return Err(Error::Code::UnsupportedFeature,
                           "Horizontal predictor needs 8 or 16 bit samples, got " +
                           (bits_per_sample == 0 ? std::string("mixed depths") : std::to_string(bits_per_sample)))
                    .for_tag(static_cast<uint16_t>(TagCode::Predictor));
            }
            return Ok();
        case Predictor::FloatingPoint:
            break;
    }
    return Err(Error::Code::UnsupportedFeature, "Floating point predictor is not supported")
        .for_tag(static_cast<uint16_t>(TagCode::Predictor));
}

namespace chunk_coding {

inline void reverse_bits(std::span<std::byte> data) noexcept {
    for (auto& b : data) {
        b = chunk_coding_impl::bit_reversal_table[std::to_integer<uint8_t>(b)];
    }
}

inline void swap_16(std::span<std::byte> data) noexcept {
    for (std::size_t i = 0; i + 1 < data.size(); i += 2) {
        std::swap(data[i], data[i + 1]);
    }
}

inline void undo_predictor(std::span<std::byte> data, const ChunkCodingParams& params) noexcept {
    if (params.predictor != Predictor::Horizontal) {
        return;
    }
    const std::size_t stride = static_cast<std::size_t>(params.width) * params.samples_per_pixel;
    if (params.bits_per_sample == 8) {
        std::span<uint8_t> samples(reinterpret_cast<uint8_t*>(data.data()), data.size());
        predictor::delta_decode_horizontal(samples, params.width, params.height, stride, params.samples_per_pixel);
    } else if (params.bits_per_sample == 16) {
        std::span<uint16_t> samples(reinterpret_cast<uint16_t*>(data.data()), data.size() / 2);
        predictor::delta_decode_horizontal(samples, params.width, params.height, stride, params.samples_per_pixel);
    }
}

inline void apply_predictor(std::span<std::byte> data, const ChunkCodingParams& params) noexcept {
    if (params.predictor != Predictor::Horizontal) {
        return;
    }
    const std::size_t stride = static_cast<std::size_t>(params.width) * params.samples_per_pixel;
    if (params.bits_per_sample == 8) {
        std::span<uint8_t> samples(reinterpret_cast<uint8_t*>(data.data()), data.size());
        predictor::delta_encode_horizontal(samples, params.width, params.height, stride, params.samples_per_pixel);
    } else if (params.bits_per_sample == 16) {
        std::span<uint16_t> samples(reinterpret_cast<uint16_t*>(data.data()), data.size() / 2);
        predictor::delta_encode_horizontal(samples, params.width, params.height, stride, params.samples_per_pixel);
    }
}

} // namespace chunk_coding

} // namespace tiffkit
