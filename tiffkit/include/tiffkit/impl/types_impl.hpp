#pragma once

#ifndef TIFFKIT_TYPES_HEADER
#include "../types.hpp" // for linters
#endif

namespace tiffkit {

// byteswap template

template <typename T>
constexpr T byteswap(T value) noexcept requires std::is_integral_v<T> {
    using U = std::make_unsigned_t<T>;
    U v = static_cast<U>(value);
    if constexpr (sizeof(T) == 1) {
        return value;
    } else if constexpr (sizeof(T) == 2) {
        return static_cast<T>(static_cast<U>((v >> 8) | (v << 8)));
    } else if constexpr (sizeof(T) == 4) {
        return static_cast<T>(
            ((v & 0xFF000000u) >> 24) |
            ((v & 0x00FF0000u) >> 8)  |
            ((v & 0x0000FF00u) << 8)  |
            ((v & 0x000000FFu) << 24)
        );
    } else if constexpr (sizeof(T) == 8) {
        return static_cast<T>(
            ((v & 0xFF00000000000000ull) >> 56) |
            ((v & 0x00FF000000000000ull) >> 40) |
            ((v & 0x0000FF0000000000ull) >> 24) |
            ((v & 0x000000FF00000000ull) >> 8)  |
            ((v & 0x00000000FF000000ull) << 8)  |
            ((v & 0x0000000000FF0000ull) << 24) |
            ((v & 0x000000000000FF00ull) << 40) |
            ((v & 0x00000000000000FFull) << 56)
        );
    } else {
        static_assert(sizeof(T) == 0, "Unsupported integer size for byteswap");
    }
}

// load_value / store_value

template <typename T>
T load_value(const std::byte* data, std::endian order) noexcept requires std::is_arithmetic_v<T> {
    if constexpr (sizeof(T) == 1) {
        T value;
        std::memcpy(&value, data, 1);
        return value;
    } else {
        using Bits = std::conditional_t<sizeof(T) == 2, uint16_t,
                     std::conditional_t<sizeof(T) == 4, uint32_t, uint64_t>>;
        Bits bits;
        std::memcpy(&bits, data, sizeof(T));
        if (order != std::endian::native) {
            bits = byteswap(bits);
        }
        T value;
        std::memcpy(&value, &bits, sizeof(T));
        return value;
    }
}

template <typename T>
void store_value(std::byte* data, T value, std::endian order) noexcept requires std::is_arithmetic_v<T> {
    if constexpr (sizeof(T) == 1) {
        std::memcpy(data, &value, 1);
    } else {
        using Bits = std::conditional_t<sizeof(T) == 2, uint16_t,
                     std::conditional_t<sizeof(T) == 4, uint32_t, uint64_t>>;
        Bits bits;
        std::memcpy(&bits, &value, sizeof(T));
        if (order != std::endian::native) {
            bits = byteswap(bits);
        }
        std::memcpy(data, &bits, sizeof(T));
    }
}

// tiff_type_size

constexpr std::size_t tiff_type_size(TiffDataType type) noexcept {
    switch (type) {
        case TiffDataType::Byte:
        case TiffDataType::Ascii:
        case TiffDataType::SByte:
        case TiffDataType::Undefined:
            return 1;
        case TiffDataType::Short:
        case TiffDataType::SShort:
            return 2;
        case TiffDataType::Long:
        case TiffDataType::SLong:
        case TiffDataType::Float:
        case TiffDataType::IFD:
            return 4;
        case TiffDataType::Rational:
        case TiffDataType::SRational:
        case TiffDataType::Double:
            return 8;
    }
    return 0;
}

constexpr bool is_known_type(uint16_t raw_type) noexcept {
    return raw_type >= static_cast<uint16_t>(TiffDataType::Byte) &&
           raw_type <= static_cast<uint16_t>(TiffDataType::IFD);
}

constexpr uint16_t color_channels(PhotometricInterpretation photometric) noexcept {
    switch (photometric) {
        case PhotometricInterpretation::RGB:
        case PhotometricInterpretation::YCbCr:
        case PhotometricInterpretation::CIELab:
            return 3;
        case PhotometricInterpretation::CMYK:
            return 4;
        case PhotometricInterpretation::WhiteIsZero:
        case PhotometricInterpretation::BlackIsZero:
        case PhotometricInterpretation::Palette:
        case PhotometricInterpretation::Mask:
            return 1;
    }
    return 1;
}

} // namespace tiffkit
