#pragma once

/**
 * @file tag_registry.hpp
 * @brief Static description of the TIFF tags known to the codec
 *
 * The registry maps a numeric tag id to its name, the data types a
 * conforming writer may use for it, its cardinality and its default value.
 * It is advisory: the directory parser keeps every entry, known or not,
 * and only typed accessors consult the registry.
 *
 * Private and vendor tags are legal in TIFF, so looking up an unknown id
 * never fails; it returns a TagInfo whose `known` flag is false.
 */

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>
#include "types.hpp"

namespace tiffkit {

/// @brief Number of values a tag is expected to carry
enum class Cardinality : uint8_t {
    Any,        ///< Any count (arrays, strings)
    One,        ///< Exactly one value
    PerSample,  ///< One value per sample (SamplesPerPixel)
    PerChunk,   ///< One value per strip or tile
    Fixed,      ///< A fixed count given by TagInfo::fixed_count
};

/// @brief Registry entry describing one tag
struct TagInfo {
    uint16_t code;
    std::string_view name;
    uint32_t allowed_types;          ///< Bit set of type_bit(TiffDataType)
    Cardinality cardinality;
    uint32_t fixed_count;            ///< Only meaningful for Cardinality::Fixed
    bool required;                   ///< Needed to decode baseline images
    std::optional<uint32_t> default_value;
    bool known;

    /// @brief Check whether a data type is among the types allowed for this tag
    /// @note Unknown tags allow any type
    [[nodiscard]] constexpr bool allows(TiffDataType type) const noexcept {
        return !known || (allowed_types & type_bit(type)) != 0;
    }
};

namespace tag_registry {

/// Allowed type sets used by the table
inline constexpr uint32_t unsigned_types =
    type_bit(TiffDataType::Byte) | type_bit(TiffDataType::Short) | type_bit(TiffDataType::Long);
inline constexpr uint32_t short_or_long = type_bit(TiffDataType::Short) | type_bit(TiffDataType::Long);
inline constexpr uint32_t short_only = type_bit(TiffDataType::Short);
inline constexpr uint32_t long_only = type_bit(TiffDataType::Long) | type_bit(TiffDataType::IFD);
inline constexpr uint32_t ascii_only = type_bit(TiffDataType::Ascii);
inline constexpr uint32_t rational_only = type_bit(TiffDataType::Rational);
inline constexpr uint32_t bytes_only = type_bit(TiffDataType::Byte) | type_bit(TiffDataType::Undefined);
inline constexpr uint32_t any_type = 0xFFFFFFFFu;

/// @brief Get the registry entry of a tag
/// @param code Numeric tag id
/// @return Entry of a known tag, or an "Unknown" entry with known == false
[[nodiscard]] constexpr TagInfo lookup(uint16_t code) noexcept;

[[nodiscard]] constexpr TagInfo lookup(TagCode code) noexcept {
    return lookup(static_cast<uint16_t>(code));
}

/// @brief Get the name of a tag, "Unknown" for unregistered ids
[[nodiscard]] constexpr std::string_view tag_name(uint16_t code) noexcept {
    return lookup(code).name;
}

/// @brief Number of tags in the registry
[[nodiscard]] constexpr std::size_t size() noexcept;

} // namespace tag_registry

} // namespace tiffkit

#define TIFFKIT_TAG_REGISTRY_HEADER
#include "impl/tag_registry_impl.hpp"
