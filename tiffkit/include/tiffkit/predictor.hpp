#pragma once

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <span>

namespace tiffkit {

namespace predictor {

/// Sample types the horizontal predictor operates on
template <typename T>
concept DeltaDecodableInteger = std::is_same_v<T, uint8_t> ||
                                std::is_same_v<T, uint16_t> ||
                                std::is_same_v<T, uint32_t>;

/// Apply horizontal differencing (TIFF predictor=2) decoding in place
///
/// Each sample stores the difference from the same sample of the previous
/// pixel in the row. Arithmetic wraps at the width of T, and the first pixel
/// of every row is stored as is: the delta chain never crosses a row.
///
/// @tparam T Sample type (uint8_t, uint16_t, uint32_t)
/// @param buffer Buffer containing the encoded data (modified in place)
/// @param width Number of pixels per row
/// @param height Number of rows
/// @param stride Number of elements (samples) between row starts (>= width * samples_per_pixel)
/// @param samples_per_pixel Number of samples (channels) per pixel (default 1)
template <DeltaDecodableInteger T>
void delta_decode_horizontal(
    std::span<T> buffer,
    std::size_t width,
    std::size_t height,
    std::size_t stride,
    std::size_t samples_per_pixel = 1) noexcept;

/// Apply horizontal differencing (TIFF predictor=2) encoding in place
///
/// Inverse of delta_decode_horizontal().
template <DeltaDecodableInteger T>
void delta_encode_horizontal(
    std::span<T> buffer,
    std::size_t width,
    std::size_t height,
    std::size_t stride,
    std::size_t samples_per_pixel = 1) noexcept;

} // namespace predictor

} // namespace tiffkit

#define TIFFKIT_PREDICTOR_HEADER
#include "impl/predictor_impl.hpp"
