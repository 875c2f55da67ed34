// This file contains the implementation of IFDBuilder.
// Do not include this file directly - it is included by ifd_builder.hpp

#pragma once

#include <algorithm>
#include <cstring>
#include <limits>
#include <new>
#include <string>

#ifndef TIFFKIT_IFD_BUILDER_HEADER
#include "../ifd_builder.hpp" // for linters
#endif

namespace tiffkit {

namespace ifd_builder_impl {

/// Width of the units byte-swapped as a whole (rationals swap each half)
constexpr std::size_t swap_unit(TiffDataType type) noexcept {
    switch (type) {
        case TiffDataType::Rational:
        case TiffDataType::SRational:
            return 4;
        default:
            return tiff_type_size(type);
    }
}

inline void write_values(std::byte* dst, const PendingTag& tag, std::endian byte_order) noexcept {
    std::memcpy(dst, tag.data.data(), tag.data.size());
    if (byte_order == std::endian::native) {
        return;
    }
    const std::size_t unit = swap_unit(tag.type);
    for (std::size_t i = 0; i + unit <= tag.data.size(); i += unit) {
        std::reverse(dst + i, dst + i + unit);
    }
}

constexpr std::size_t word_aligned(std::size_t size) noexcept {
    return (size + 1) & ~std::size_t{1};
}

} // namespace ifd_builder_impl

// ============================================================================
// IFDBuilder Private Member Function Implementations
// ============================================================================

inline Result<void> IFDBuilder::insert(PendingTag&& tag) noexcept {
    auto pos = std::lower_bound(tags_.begin(), tags_.end(), tag.code,
                                [](const PendingTag& t, uint16_t code) { return t.code < code; });
    if (pos != tags_.end() && pos->code == tag.code) {
        return Err(Error::Code::InvalidTag, "Tag " + std::to_string(tag.code) + " is already set")
            .for_tag(tag.code);
    }
    try {
        tags_.insert(pos, std::move(tag));
    } catch (const std::bad_alloc&) {
        return Err(Error::Code::MemoryError, "Failed to store tag " + std::to_string(tag.code));
    }
    return Ok();
}

template <typename T>
Result<void> IFDBuilder::add_values(uint16_t code, TiffDataType type, std::span<const T> values) noexcept {
    if (values.empty()) {
        return Err(Error::Code::InvalidTag, "Tag " + std::to_string(code) + " needs at least one value")
            .for_tag(code);
    }
    return add_raw(code, type, static_cast<uint32_t>(values.size()), std::as_bytes(values));
}

// ============================================================================
// IFDBuilder Public Member Function Implementations
// ============================================================================

inline Result<void> IFDBuilder::add_short(uint16_t code, uint16_t value) noexcept {
    return add_values(code, TiffDataType::Short, std::span<const uint16_t>(&value, 1));
}

inline Result<void> IFDBuilder::add_shorts(uint16_t code, std::span<const uint16_t> values) noexcept {
    return add_values(code, TiffDataType::Short, values);
}

inline Result<void> IFDBuilder::add_long(uint16_t code, uint32_t value) noexcept {
    return add_values(code, TiffDataType::Long, std::span<const uint32_t>(&value, 1));
}

inline Result<void> IFDBuilder::add_longs(uint16_t code, std::span<const uint32_t> values) noexcept {
    return add_values(code, TiffDataType::Long, values);
}

inline Result<void> IFDBuilder::add_ascii(uint16_t code, std::string_view text) noexcept {
    if (text.find('\0') != std::string_view::npos) {
        return Err(Error::Code::InvalidTag, "ASCII value of tag " + std::to_string(code) + " holds a NUL")
            .for_tag(code);
    }
    PendingTag tag;
    tag.code = code;
    tag.type = TiffDataType::Ascii;
    tag.count = static_cast<uint32_t>(text.size() + 1);
    try {
        tag.data.resize(text.size() + 1);
    } catch (const std::bad_alloc&) {
        return Err(Error::Code::MemoryError, "Failed to store tag " + std::to_string(code));
    }
    std::memcpy(tag.data.data(), text.data(), text.size());
    return insert(std::move(tag));
}

inline Result<void> IFDBuilder::add_rational(uint16_t code, Rational value) noexcept {
    return add_values(code, TiffDataType::Rational, std::span<const Rational>(&value, 1));
}

inline Result<void> IFDBuilder::add_rationals(uint16_t code, std::span<const Rational> values) noexcept {
    return add_values(code, TiffDataType::Rational, values);
}

inline Result<void> IFDBuilder::add_bytes(uint16_t code, TiffDataType type, std::span<const uint8_t> values) noexcept {
    if (type != TiffDataType::Byte && type != TiffDataType::Undefined) {
        return Err(Error::Code::TypeMismatch, "add_bytes() takes BYTE or UNDEFINED values").for_tag(code);
    }
    return add_values(code, type, values);
}

inline Result<void> IFDBuilder::add_raw(
    uint16_t code, TiffDataType type, uint32_t count, std::span<const std::byte> native_data) noexcept {
    if (!is_known_type(static_cast<uint16_t>(type))) {
        return Err(Error::Code::InvalidTag, "Unknown type " + std::to_string(static_cast<uint16_t>(type)))
            .for_tag(code);
    }
    if (count == 0 || native_data.size() != static_cast<std::size_t>(count) * tiff_type_size(type)) {
        return Err(Error::Code::InvalidTag,
                   "Tag " + std::to_string(code) + ": " + std::to_string(native_data.size()) +
                   " bytes do not hold " + std::to_string(count) + " values").for_tag(code);
    }

    PendingTag tag;
    tag.code = code;
    tag.type = type;
    tag.count = count;
    try {
        tag.data.assign(native_data.begin(), native_data.end());
    } catch (const std::bad_alloc&) {
        return Err(Error::Code::MemoryError, "Failed to store tag " + std::to_string(code));
    }
    return insert(std::move(tag));
}

inline Result<void> IFDBuilder::merge(const IFDBuilder& other) noexcept {
    for (const auto& tag : other.tags_) {
        auto added = add_raw(tag.code, tag.type, tag.count, tag.data);
        if (!added) {
            return added.error();
        }
    }
    return Ok();
}

inline bool IFDBuilder::contains(uint16_t code) const noexcept {
    return find(code) != nullptr;
}

inline const PendingTag* IFDBuilder::find(uint16_t code) const noexcept {
    auto pos = std::lower_bound(tags_.begin(), tags_.end(), code,
                                [](const PendingTag& t, uint16_t c) { return t.code < c; });
    if (pos != tags_.end() && pos->code == code) {
        return &*pos;
    }
    return nullptr;
}

inline std::size_t IFDBuilder::calculate_ifd_size() const noexcept {
    return 2 + tags_.size() * tiff_entry_size + 4;
}

inline std::size_t IFDBuilder::calculate_external_data_size() const noexcept {
    std::size_t size = 0;
    for (const auto& tag : tags_) {
        if (tag.data.size() > tiff_inline_limit) {
            size += ifd_builder_impl::word_aligned(tag.data.size());
        }
    }
    return size;
}

inline Result<uint32_t> IFDBuilder::write_to(std::vector<std::byte>& file, std::endian byte_order) const noexcept {
    if (tags_.empty()) {
        return Err(Error::Code::InvalidFormat, "An IFD needs at least one entry");
    }
    if (tags_.size() > std::numeric_limits<uint16_t>::max()) {
        return Err(Error::Code::InvalidTag,
                   std::to_string(tags_.size()) + " entries exceed the 16-bit IFD entry count");
    }

    const std::size_t ifd_offset = ifd_builder_impl::word_aligned(file.size());
    const std::size_t ifd_size = calculate_ifd_size();
    const std::size_t external_offset = ifd_offset + ifd_size;
    const std::size_t end = external_offset + calculate_external_data_size();
    if (end > std::numeric_limits<uint32_t>::max()) {
        return Err(Error::Code::WriteError,
                   "File of " + std::to_string(end) + " bytes does not fit 32-bit offsets");
    }

    try {
        file.resize(end, std::byte{0});
    } catch (const std::bad_alloc&) {
        return Err(Error::Code::MemoryError, "Failed to grow file buffer to " + std::to_string(end) + " bytes");
    }

    std::byte* out = file.data() + ifd_offset;
    store_value<uint16_t>(out, static_cast<uint16_t>(tags_.size()), byte_order);
    out += 2;

    std::size_t value_offset = external_offset;
    for (const auto& tag : tags_) {
        store_value<uint16_t>(out, tag.code, byte_order);
        store_value<uint16_t>(out + 2, static_cast<uint16_t>(tag.type), byte_order);
        store_value<uint32_t>(out + 4, tag.count, byte_order);
        if (tag.data.size() <= tiff_inline_limit) {
            // Inline values are left-justified in the value field
            ifd_builder_impl::write_values(out + 8, tag, byte_order);
        } else {
            store_value<uint32_t>(out + 8, static_cast<uint32_t>(value_offset), byte_order);
            ifd_builder_impl::write_values(file.data() + value_offset, tag, byte_order);
            value_offset += ifd_builder_impl::word_aligned(tag.data.size());
        }
        out += tiff_entry_size;
    }
    store_value<uint32_t>(out, next_ifd_offset_, byte_order);

    return Ok(static_cast<uint32_t>(ifd_offset));
}

inline void IFDBuilder::clear() noexcept {
    tags_.clear();
    next_ifd_offset_ = 0;
}

} // namespace tiffkit
