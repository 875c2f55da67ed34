#pragma once

#include <bit>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <type_traits>

namespace tiffkit {

// MSVC ignores the packed attribute
#pragma pack(push, 1)

/// @brief Rational number representation (unsigned)
/// @details Represents a fraction with unsigned 32-bit numerator and denominator.
/// Used in TIFF for values like resolution, YCbCr coefficients, etc.
struct Rational {
    uint32_t numerator;   ///< Numerator of the fraction
    uint32_t denominator; ///< Denominator of the fraction

    [[nodiscard]] constexpr double to_double() const noexcept {
        return denominator == 0 ? 0.0 : static_cast<double>(numerator) / static_cast<double>(denominator);
    }

    friend constexpr bool operator==(const Rational&, const Rational&) noexcept = default;
};

/// @brief Rational number representation (signed)
struct SRational {
    int32_t numerator;   ///< Numerator of the fraction
    int32_t denominator; ///< Denominator of the fraction

    [[nodiscard]] constexpr double to_double() const noexcept {
        return denominator == 0 ? 0.0 : static_cast<double>(numerator) / static_cast<double>(denominator);
    }

    friend constexpr bool operator==(const SRational&, const SRational&) noexcept = default;
};

#pragma pack(pop)

static_assert(sizeof(Rational) == 8, "Rational must be 8 bytes");
static_assert(sizeof(SRational) == 8, "SRational must be 8 bytes");

/// Magic number of classic TIFF files
inline constexpr uint16_t tiff_magic = 42;
/// Size of the classic TIFF header (byte order, magic, first IFD offset)
inline constexpr std::size_t tiff_header_size = 8;
/// Size of one IFD entry on disk
inline constexpr std::size_t tiff_entry_size = 12;
/// Values whose total size is at most this many bytes are stored inside the entry
inline constexpr std::size_t tiff_inline_limit = 4;

/// @brief Byte swap for integral types
/// @tparam T Integral type (8, 16, 32 or 64 bits)
template <typename T>
[[nodiscard]] constexpr T byteswap(T value) noexcept requires std::is_integral_v<T>;

/// @brief Decode a value stored with the given byte order
/// @tparam T Arithmetic type to decode
/// @param data Pointer to at least sizeof(T) bytes
/// @param order Byte order of the stored value
template <typename T>
[[nodiscard]] T load_value(const std::byte* data, std::endian order) noexcept requires std::is_arithmetic_v<T>;

/// @brief Encode a value with the given byte order
/// @tparam T Arithmetic type to encode
/// @param data Pointer to at least sizeof(T) writable bytes
/// @param value Value to store
/// @param order Byte order to produce
template <typename T>
void store_value(std::byte* data, T value, std::endian order) noexcept requires std::is_arithmetic_v<T>;

/// @brief Multiply sizes, detecting wraparound
/// @return false if a * b does not fit in 64 bits (`out` is then unspecified)
[[nodiscard]] constexpr bool checked_mul(uint64_t a, uint64_t b, uint64_t& out) noexcept {
    if (a != 0 && b > UINT64_MAX / a) {
        return false;
    }
    out = a * b;
    return true;
}

/// @brief TIFF data type enumeration
/// @details Defines the data types that can be stored in classic TIFF tags.
enum class TiffDataType : uint16_t {
    Byte      = 1,  ///< 8-bit unsigned integer
    Ascii     = 2,  ///< 8-bit byte containing a 7-bit ASCII code
    Short     = 3,  ///< 16-bit unsigned integer
    Long      = 4,  ///< 32-bit unsigned integer
    Rational  = 5,  ///< Two LONGs: numerator, denominator
    SByte     = 6,  ///< 8-bit signed integer
    Undefined = 7,  ///< 8-bit byte (uninterpreted)
    SShort    = 8,  ///< 16-bit signed integer
    SLong     = 9,  ///< 32-bit signed integer
    SRational = 10, ///< Two SLONGs: numerator, denominator
    Float     = 11, ///< Single precision (4-byte) IEEE format
    Double    = 12, ///< Double precision (8-byte) IEEE format
    IFD       = 13, ///< 32-bit IFD offset, equivalent to Long
};

/// @brief Get size in bytes of a TIFF data type
/// @param type The TIFF data type
/// @return Size in bytes, or 0 for unknown types
[[nodiscard]] constexpr std::size_t tiff_type_size(TiffDataType type) noexcept;

/// @brief Check whether a raw type code read from a file is a known data type
[[nodiscard]] constexpr bool is_known_type(uint16_t raw_type) noexcept;

/// @brief Bit mask of a data type, used to express sets of allowed types
[[nodiscard]] constexpr uint32_t type_bit(TiffDataType type) noexcept {
    return 1u << static_cast<uint16_t>(type);
}

/// @brief TIFF tag codes
/// @details Baseline tags plus the extension tags the codec reads or writes.
enum class TagCode : uint16_t {
    NewSubfileType            = 254,
    SubfileType               = 255,
    ImageWidth                = 256,
    ImageLength               = 257,
    BitsPerSample             = 258,
    Compression               = 259,
    PhotometricInterpretation = 262,
    Threshholding             = 263,
    CellWidth                 = 264,
    CellLength                = 265,
    FillOrder                 = 266,
    DocumentName              = 269,
    ImageDescription          = 270,
    Make                      = 271,
    Model                     = 272,
    StripOffsets              = 273,
    Orientation               = 274,
    SamplesPerPixel           = 277,
    RowsPerStrip              = 278,
    StripByteCounts           = 279,
    MinSampleValue            = 280,
    MaxSampleValue            = 281,
    XResolution               = 282,
    YResolution               = 283,
    PlanarConfiguration       = 284,
    PageName                  = 285,
    XPosition                 = 286,
    YPosition                 = 287,
    FreeOffsets               = 288,
    FreeByteCounts            = 289,
    GrayResponseUnit          = 290,
    GrayResponseCurve         = 291,
    T4Options                 = 292,
    T6Options                 = 293,
    ResolutionUnit            = 296,
    PageNumber                = 297,
    TransferFunction          = 301,
    Software                  = 305,
    DateTime                  = 306,
    Artist                    = 315,
    HostComputer              = 316,
    Predictor                 = 317,
    WhitePoint                = 318,
    PrimaryChromaticities     = 319,
    ColorMap                  = 320,
    HalftoneHints             = 321,
    TileWidth                 = 322,
    TileLength                = 323,
    TileOffsets               = 324,
    TileByteCounts            = 325,
    SubIFDs                   = 330,
    InkSet                    = 332,
    InkNames                  = 333,
    NumberOfInks              = 334,
    DotRange                  = 336,
    TargetPrinter             = 337,
    ExtraSamples              = 338,
    SampleFormat              = 339,
    SMinSampleValue           = 340,
    SMaxSampleValue           = 341,
    TransferRange             = 342,
    JPEGTables                = 347,
    JPEGProc                  = 512,
    JPEGInterchangeFormat     = 513,
    JPEGInterchangeFormatLength = 514,
    YCbCrCoefficients         = 529,
    YCbCrSubSampling          = 530,
    YCbCrPositioning          = 531,
    ReferenceBlackWhite       = 532,
    XMLPacket                 = 700,
    Copyright                 = 33432,
    IPTC                      = 33723,
    Photoshop                 = 34377,
    ExifIFD                   = 34665,
    InterColorProfile         = 34675,
    GPSIFD                    = 34853,
};

/// @brief Compression schemes known to TIFF
/// @details Only a subset has codecs, see decompressors/.
enum class CompressionScheme : uint16_t {
    None           = 1,     ///< No compression
    CCITT_RLE      = 2,     ///< CCITT modified Huffman RLE
    CCITT_Fax3     = 3,     ///< CCITT Group 3 fax
    CCITT_Fax4     = 4,     ///< CCITT Group 4 fax
    LZW            = 5,     ///< Lempel-Ziv-Welch
    JPEG_Old       = 6,     ///< Old-style JPEG (deprecated)
    JPEG           = 7,     ///< JPEG compression
    Deflate_Adobe  = 8,     ///< Adobe-style Deflate
    Deflate        = 32946, ///< PKZIP-style Deflate
    PackBits       = 32773, ///< PackBits compression
    ZSTD           = 50000, ///< Zstandard (non-standard but commonly used)
    ZSTD_Alt       = 34926, ///< Alternative Zstandard code
};

/// @brief Sample format specification
enum class SampleFormat : uint16_t {
    UnsignedInt   = 1, ///< Unsigned integer
    SignedInt     = 2, ///< Signed integer
    IEEEFloat     = 3, ///< IEEE floating point
    Undefined     = 4, ///< Undefined/uninterpreted
};

/// @brief Photometric interpretation (color space)
enum class PhotometricInterpretation : uint16_t {
    WhiteIsZero   = 0, ///< Grayscale, minimum value is white
    BlackIsZero   = 1, ///< Grayscale, minimum value is black
    RGB           = 2, ///< RGB color space
    Palette       = 3, ///< Palette/indexed color
    Mask          = 4, ///< Transparency mask
    CMYK          = 5, ///< CMYK color space (separated)
    YCbCr         = 6, ///< YCbCr color space
    CIELab        = 8, ///< CIE L*a*b* color space
};

/// @brief Predictor for compression
enum class Predictor : uint16_t {
    None          = 1, ///< No predictor
    Horizontal    = 2, ///< Horizontal differencing
    FloatingPoint = 3, ///< Floating point horizontal differencing
};

/// @brief Planar configuration for multi-channel images
enum class PlanarConfiguration : uint16_t {
    Chunky = 1,  ///< RGBRGBRGB... (interleaved channels)
    Planar = 2,  ///< RRR...GGG...BBB... (separate planes per channel)
};

/// @brief Bit order inside bytes of the compressed data
enum class FillOrder : uint16_t {
    MsbToLsb = 1, ///< Most significant bit first (default)
    LsbToMsb = 2, ///< Least significant bit first
};

/// @brief Meaning of extra samples beyond the color channels
enum class ExtraSamples : uint16_t {
    Unspecified     = 0,
    AssociatedAlpha = 1,
    UnassociatedAlpha = 2,
};

/// @brief Number of color channels implied by a photometric interpretation
/// @return Channel count, samples beyond it are extra samples
[[nodiscard]] constexpr uint16_t color_channels(PhotometricInterpretation photometric) noexcept;

} // namespace tiffkit

#define TIFFKIT_TYPES_HEADER
#include "impl/types_impl.hpp"
