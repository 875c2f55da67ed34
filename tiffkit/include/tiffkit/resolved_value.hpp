#pragma once

/**
 * @file resolved_value.hpp
 * @brief Decoded values of one tag entry
 *
 * A ResolvedValue holds the values of a tag entry, converted to native byte
 * order, in a variant whose alternative matches the declared TIFF type.
 * Accessors never coerce silently: asking for an incompatible type returns
 * Error::Code::TypeMismatch. The only implicit conversions are the
 * widenings documented on each accessor (BYTE/SHORT/LONG to unsigned).
 */

#include <bit>
#include <cstdint>
#include <span>
#include <string>
#include <variant>
#include <vector>
#include "types.hpp"
#include "types/result.hpp"

namespace tiffkit {

class ResolvedValue {
public:
    using Storage = std::variant<
        std::vector<uint8_t>,    // Byte, Undefined
        std::string,             // Ascii
        std::vector<uint16_t>,   // Short
        std::vector<uint32_t>,   // Long, IFD
        std::vector<Rational>,   // Rational
        std::vector<int8_t>,     // SByte
        std::vector<int16_t>,    // SShort
        std::vector<int32_t>,    // SLong
        std::vector<SRational>,  // SRational
        std::vector<float>,      // Float
        std::vector<double>      // Double
    >;

private:
    TiffDataType type_{TiffDataType::Undefined};
    uint32_t count_{0};
    Storage values_;

public:
    ResolvedValue() = default;
    ResolvedValue(TiffDataType type, uint32_t count, Storage values) noexcept
        : type_(type), count_(count), values_(std::move(values)) {}

    [[nodiscard]] TiffDataType type() const noexcept { return type_; }
    [[nodiscard]] uint32_t count() const noexcept { return count_; }
    [[nodiscard]] const Storage& storage() const noexcept { return values_; }

    /// @brief Direct access to one storage alternative
    /// @return Pointer to the values, or nullptr if another alternative is held
    template <typename T>
    [[nodiscard]] const T* get_if() const noexcept {
        return std::get_if<T>(&values_);
    }

    /// @brief First value as an unsigned integer
    /// @details BYTE, SHORT, LONG and IFD are widened to uint32_t.
    /// @retval Error::Code::TypeMismatch The stored type is not an unsigned integer
    /// @retval Error::Code::InvalidTag The entry holds no value
    [[nodiscard]] Result<uint32_t> as_unsigned() const noexcept;

    /// @brief All values as unsigned integers (BYTE, SHORT, LONG and IFD widened)
    /// @retval Error::Code::TypeMismatch The stored type is not an unsigned integer
    [[nodiscard]] Result<std::vector<uint32_t>> as_unsigned_array() const noexcept;

    /// @brief All values as 16-bit unsigned integers (BYTE widened, SHORT exact)
    /// @retval Error::Code::TypeMismatch The stored type is neither BYTE nor SHORT
    [[nodiscard]] Result<std::vector<uint16_t>> as_short_array() const noexcept;

    /// @brief ASCII value, trailing NULs removed
    /// @retval Error::Code::TypeMismatch The stored type is not ASCII
    [[nodiscard]] Result<std::string> as_string() const noexcept;

    /// @brief First value as an unsigned rational
    /// @retval Error::Code::TypeMismatch The stored type is not RATIONAL
    [[nodiscard]] Result<Rational> as_rational() const noexcept;

    /// @retval Error::Code::TypeMismatch The stored type is not RATIONAL
    [[nodiscard]] Result<std::vector<Rational>> as_rational_array() const noexcept;

    /// @brief Raw bytes of BYTE or UNDEFINED values
    /// @retval Error::Code::TypeMismatch The stored type is neither BYTE nor UNDEFINED
    [[nodiscard]] Result<std::vector<uint8_t>> as_bytes() const noexcept;

    /// @brief Any numeric value converted to double (rationals are divided out)
    /// @retval Error::Code::TypeMismatch The stored type is ASCII
    [[nodiscard]] Result<std::vector<double>> as_double_array() const noexcept;
};

/// @brief Decode raw value bytes into a ResolvedValue
/// @details Pure function of (type, count, bytes). `raw` must hold exactly
/// count * tiff_type_size(type) bytes in `byte_order`.
/// @retval Error::Code::UnexpectedEof raw is shorter than the declared values
[[nodiscard]] Result<ResolvedValue> decode_values(
    TiffDataType type,
    uint32_t count,
    std::span<const std::byte> raw,
    std::endian byte_order) noexcept;

} // namespace tiffkit

#define TIFFKIT_RESOLVED_VALUE_HEADER
#include "impl/resolved_value_impl.hpp"
