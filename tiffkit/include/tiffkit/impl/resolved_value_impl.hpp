#pragma once

#include <string>

#ifndef TIFFKIT_RESOLVED_VALUE_HEADER
#include "../resolved_value.hpp" // for linters
#endif

namespace tiffkit {

namespace resolved_impl {

inline Error type_mismatch(TiffDataType stored, const char* requested) {
    return Err(Error::Code::TypeMismatch,
               std::string("Value of type ") + std::to_string(static_cast<uint16_t>(stored)) +
               " cannot be read as " + requested);
}

template <typename T>
std::vector<T> load_array(std::span<const std::byte> raw, uint32_t count, std::endian byte_order) {
    std::vector<T> values(count);
    for (uint32_t i = 0; i < count; ++i) {
        values[i] = load_value<T>(raw.data() + static_cast<std::size_t>(i) * sizeof(T), byte_order);
    }
    return values;
}

template <typename R, typename Part>
std::vector<R> load_rationals(std::span<const std::byte> raw, uint32_t count, std::endian byte_order) {
    std::vector<R> values(count);
    for (uint32_t i = 0; i < count; ++i) {
        const std::byte* p = raw.data() + static_cast<std::size_t>(i) * 8;
        values[i] = R{load_value<Part>(p, byte_order), load_value<Part>(p + 4, byte_order)};
    }
    return values;
}

} // namespace resolved_impl

inline Result<ResolvedValue> decode_values(
    TiffDataType type,
    uint32_t count,
    std::span<const std::byte> raw,
    std::endian byte_order) noexcept {

    const uint64_t expected = static_cast<uint64_t>(count) * tiff_type_size(type);
    if (raw.size() < expected) {
        return Err(Error::Code::UnexpectedEof,
                   "Tag value needs " + std::to_string(expected) + " bytes, got " + std::to_string(raw.size()));
    }

    using namespace resolved_impl;
    switch (type) {
        case TiffDataType::Byte:
        case TiffDataType::Undefined:
            return Ok(ResolvedValue(type, count, load_array<uint8_t>(raw, count, byte_order)));
        case TiffDataType::Ascii: {
            std::string text(reinterpret_cast<const char*>(raw.data()), count);
            while (!text.empty() && text.back() == '\0') {
                text.pop_back();
            }
            return Ok(ResolvedValue(type, count, std::move(text)));
        }
        case TiffDataType::Short:
            return Ok(ResolvedValue(type, count, load_array<uint16_t>(raw, count, byte_order)));
        case TiffDataType::Long:
        case TiffDataType::IFD:
            return Ok(ResolvedValue(type, count, load_array<uint32_t>(raw, count, byte_order)));
        case TiffDataType::Rational:
            return Ok(ResolvedValue(type, count, load_rationals<Rational, uint32_t>(raw, count, byte_order)));
        case TiffDataType::SByte:
            return Ok(ResolvedValue(type, count, load_array<int8_t>(raw, count, byte_order)));
        case TiffDataType::SShort:
            return Ok(ResolvedValue(type, count, load_array<int16_t>(raw, count, byte_order)));
        case TiffDataType::SLong:
            return Ok(ResolvedValue(type, count, load_array<int32_t>(raw, count, byte_order)));
        case TiffDataType::SRational:
            return Ok(ResolvedValue(type, count, load_rationals<SRational, int32_t>(raw, count, byte_order)));
        case TiffDataType::Float:
            return Ok(ResolvedValue(type, count, load_array<float>(raw, count, byte_order)));
        case TiffDataType::Double:
            return Ok(ResolvedValue(type, count, load_array<double>(raw, count, byte_order)));
    }
    return Err(Error::Code::TypeMismatch, "Unknown data type");
}

inline Result<std::vector<uint32_t>> ResolvedValue::as_unsigned_array() const noexcept {
    return std::visit([this](const auto& values) -> Result<std::vector<uint32_t>> {
        using V = std::decay_t<decltype(values)>;
        if constexpr (std::is_same_v<V, std::vector<uint8_t>> ||
                      std::is_same_v<V, std::vector<uint16_t>> ||
                      std::is_same_v<V, std::vector<uint32_t>>) {
            if (type_ == TiffDataType::Undefined) {
                return resolved_impl::type_mismatch(type_, "unsigned integer");
            }
            return Ok(std::vector<uint32_t>(values.begin(), values.end()));
        } else {
            return resolved_impl::type_mismatch(type_, "unsigned integer");
        }
    }, values_);
}

inline Result<uint32_t> ResolvedValue::as_unsigned() const noexcept {
    auto values = as_unsigned_array();
    if (values.is_error()) {
        return values.error();
    }
    if (values.value().empty()) {
        return Err(Error::Code::InvalidTag, "Tag holds no value");
    }
    return Ok(values.value().front());
}

inline Result<std::vector<uint16_t>> ResolvedValue::as_short_array() const noexcept {
    if (type_ == TiffDataType::Short) {
        return Ok(std::get<std::vector<uint16_t>>(values_));
    }
    if (type_ == TiffDataType::Byte) {
        const auto& bytes = std::get<std::vector<uint8_t>>(values_);
        return Ok(std::vector<uint16_t>(bytes.begin(), bytes.end()));
    }
    return resolved_impl::type_mismatch(type_, "SHORT");
}

inline Result<std::string> ResolvedValue::as_string() const noexcept {
    if (const auto* text = std::get_if<std::string>(&values_)) {
        return Ok(*text);
    }
    return resolved_impl::type_mismatch(type_, "ASCII");
}

inline Result<std::vector<Rational>> ResolvedValue::as_rational_array() const noexcept {
    if (const auto* values = std::get_if<std::vector<Rational>>(&values_)) {
        return Ok(*values);
    }
    return resolved_impl::type_mismatch(type_, "RATIONAL");
}

inline Result<Rational> ResolvedValue::as_rational() const noexcept {
    const auto* values = std::get_if<std::vector<Rational>>(&values_);
    if (values == nullptr) {
        return resolved_impl::type_mismatch(type_, "RATIONAL");
    }
    if (values->empty()) {
        return Err(Error::Code::InvalidTag, "Tag holds no value");
    }
    return Ok(values->front());
}

inline Result<std::vector<uint8_t>> ResolvedValue::as_bytes() const noexcept {
    if (const auto* values = std::get_if<std::vector<uint8_t>>(&values_)) {
        return Ok(*values);
    }
    return resolved_impl::type_mismatch(type_, "BYTE");
}

inline Result<std::vector<double>> ResolvedValue::as_double_array() const noexcept {
    return std::visit([this](const auto& values) -> Result<std::vector<double>> {
        using V = std::decay_t<decltype(values)>;
        if constexpr (std::is_same_v<V, std::string>) {
            return resolved_impl::type_mismatch(type_, "number");
        } else {
            std::vector<double> result;
            result.reserve(values.size());
            for (const auto& v : values) {
                if constexpr (std::is_same_v<std::decay_t<decltype(v)>, Rational> ||
                              std::is_same_v<std::decay_t<decltype(v)>, SRational>) {
                    result.push_back(v.to_double());
                } else {
                    result.push_back(static_cast<double>(v));
                }
            }
            return Ok(std::move(result));
        }
    }, values_);
}

} // namespace tiffkit
