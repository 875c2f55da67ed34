#pragma once

#include <cstddef>
#include <span>

#ifndef TIFFKIT_PREDICTOR_HEADER
#include "../predictor.hpp" // for linters
#endif

namespace tiffkit {

namespace predictor {

namespace detail {

/// Horizontal differencing decode with a compile-time sample count
template <DeltaDecodableInteger T, std::size_t SamplesPerPixel>
inline void delta_decode_horizontal_impl(
    std::span<T> buffer,
    std::size_t width,
    std::size_t height,
    std::size_t stride) noexcept {

    for (std::size_t y = 0; y < height; ++y) {
        T* row = buffer.data() + y * stride;
        for (std::size_t x = 1; x < width; ++x) {
            for (std::size_t s = 0; s < SamplesPerPixel; ++s) {
                row[x * SamplesPerPixel + s] =
                    static_cast<T>(row[x * SamplesPerPixel + s] + row[(x - 1) * SamplesPerPixel + s]);
            }
        }
    }
}

/// Horizontal differencing encode with a compile-time sample count
template <DeltaDecodableInteger T, std::size_t SamplesPerPixel>
inline void delta_encode_horizontal_impl(
    std::span<T> buffer,
    std::size_t width,
    std::size_t height,
    std::size_t stride) noexcept {

    for (std::size_t y = 0; y < height; ++y) {
        T* row = buffer.data() + y * stride;
        // Right to left, so that every difference uses the original left neighbour
        for (std::size_t x = width - 1; x > 0; --x) {
            for (std::size_t s = 0; s < SamplesPerPixel; ++s) {
                row[x * SamplesPerPixel + s] =
                    static_cast<T>(row[x * SamplesPerPixel + s] - row[(x - 1) * SamplesPerPixel + s]);
            }
        }
    }
}

} // namespace detail

template <DeltaDecodableInteger T>
inline void delta_decode_horizontal(
    std::span<T> buffer,
    std::size_t width,
    std::size_t height,
    std::size_t stride,
    std::size_t samples_per_pixel) noexcept {

    if (width < 2) {
        return;
    }

    switch (samples_per_pixel) {
        case 1:
            detail::delta_decode_horizontal_impl<T, 1>(buffer, width, height, stride);
            break;
        case 2:
            detail::delta_decode_horizontal_impl<T, 2>(buffer, width, height, stride);
            break;
        case 3:
            detail::delta_decode_horizontal_impl<T, 3>(buffer, width, height, stride);
            break;
        case 4:
            detail::delta_decode_horizontal_impl<T, 4>(buffer, width, height, stride);
            break;
        default:
            for (std::size_t y = 0; y < height; ++y) {
                T* row = buffer.data() + y * stride;
                for (std::size_t i = samples_per_pixel; i < width * samples_per_pixel; ++i) {
                    row[i] = static_cast<T>(row[i] + row[i - samples_per_pixel]);
                }
            }
            break;
    }
}

template <DeltaDecodableInteger T>
inline void delta_encode_horizontal(
    std::span<T> buffer,
    std::size_t width,
    std::size_t height,
    std::size_t stride,
    std::size_t samples_per_pixel) noexcept {

    if (width < 2) {
        return;
    }

    switch (samples_per_pixel) {
        case 1:
            detail::delta_encode_horizontal_impl<T, 1>(buffer, width, height, stride);
            break;
        case 2:
            detail::delta_encode_horizontal_impl<T, 2>(buffer, width, height, stride);
            break;
        case 3:
            detail::delta_encode_horizontal_impl<T, 3>(buffer, width, height, stride);
            break;
        case 4:
            detail::delta_encode_horizontal_impl<T, 4>(buffer, width, height, stride);
            break;
        default:
            for (std::size_t y = 0; y < height; ++y) {
                T* row = buffer.data() + y * stride;
                for (std::size_t i = width * samples_per_pixel; i-- > samples_per_pixel;) {
                    row[i] = static_cast<T>(row[i] - row[i - samples_per_pixel]);
                }
            }
            break;
    }
}

} // namespace predictor

} // namespace tiffkit
