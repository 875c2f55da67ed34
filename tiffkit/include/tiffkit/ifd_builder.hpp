#pragma once

/**
 * @file ifd_builder.hpp
 * @brief Builder for serializing an Image File Directory
 *
 * The IFDBuilder collects tag values in native byte order and serializes
 * them, together with the values that do not fit in the 4-byte value field,
 * in the byte order of the file being written.
 *
 * ## Key Concepts
 *
 * - **Tag entries**: each entry keeps its type, count and values
 * - **Inline values**: values of at most 4 bytes live in the entry itself
 * - **External values**: larger values are written after the IFD, each on a
 *   word boundary, and the entry holds their offset
 *
 * ## Example Usage
 *
 * @code{.cpp}
 * tiffkit::IFDBuilder extra;
 * extra.add_ascii(tiffkit::TagCode::ImageDescription, "Survey tile 12");
 * extra.add_rational(tiffkit::TagCode::XResolution, {300, 1});
 *
 * tiffkit::TiffWriter<> writer;
 * auto bytes = writer.write(image, tiffkit::WriteOptions{}, &extra);
 * @endcode
 *
 * @note All operations are noexcept and use Result<T>
 * @note The builder maintains sorted tag order automatically
 */

#include <bit>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>
#include <vector>
#include "types.hpp"
#include "types/result.hpp"

namespace tiffkit {

/// @brief Tag value waiting to be serialized
struct PendingTag {
    uint16_t code{0};
    TiffDataType type{TiffDataType::Undefined};
    uint32_t count{0};
    std::vector<std::byte> data; ///< count * tiff_type_size(type) bytes, native byte order
};

class IFDBuilder {
private:
    std::vector<PendingTag> tags_; // Sorted by code
    uint32_t next_ifd_offset_{0};

    [[nodiscard]] Result<void> insert(PendingTag&& tag) noexcept;

    template <typename T>
    [[nodiscard]] Result<void> add_values(uint16_t code, TiffDataType type, std::span<const T> values) noexcept;

public:
    IFDBuilder() = default;

    /// @brief Add a SHORT tag
    /// @retval Error::Code::InvalidTag The tag is already present
    [[nodiscard]] Result<void> add_short(uint16_t code, uint16_t value) noexcept;
    [[nodiscard]] Result<void> add_short(TagCode code, uint16_t value) noexcept {
        return add_short(static_cast<uint16_t>(code), value);
    }

    /// @brief Add a SHORT array tag
    /// @retval Error::Code::InvalidTag The tag is already present or the array is empty
    [[nodiscard]] Result<void> add_shorts(uint16_t code, std::span<const uint16_t> values) noexcept;
    [[nodiscard]] Result<void> add_shorts(TagCode code, std::span<const uint16_t> values) noexcept {
        return add_shorts(static_cast<uint16_t>(code), values);
    }

    [[nodiscard]] Result<void> add_long(uint16_t code, uint32_t value) noexcept;
    [[nodiscard]] Result<void> add_long(TagCode code, uint32_t value) noexcept {
        return add_long(static_cast<uint16_t>(code), value);
    }

    [[nodiscard]] Result<void> add_longs(uint16_t code, std::span<const uint32_t> values) noexcept;
    [[nodiscard]] Result<void> add_longs(TagCode code, std::span<const uint32_t> values) noexcept {
        return add_longs(static_cast<uint16_t>(code), values);
    }

    /// @brief Add an ASCII tag, the terminating NUL is appended
    /// @retval Error::Code::InvalidTag The tag is already present or the text holds a NUL
    [[nodiscard]] Result<void> add_ascii(uint16_t code, std::string_view text) noexcept;
    [[nodiscard]] Result<void> add_ascii(TagCode code, std::string_view text) noexcept {
        return add_ascii(static_cast<uint16_t>(code), text);
    }

    [[nodiscard]] Result<void> add_rational(uint16_t code, Rational value) noexcept;
    [[nodiscard]] Result<void> add_rational(TagCode code, Rational value) noexcept {
        return add_rational(static_cast<uint16_t>(code), value);
    }

    [[nodiscard]] Result<void> add_rationals(uint16_t code, std::span<const Rational> values) noexcept;
    [[nodiscard]] Result<void> add_rationals(TagCode code, std::span<const Rational> values) noexcept {
        return add_rationals(static_cast<uint16_t>(code), values);
    }

    /// @brief Add a BYTE or UNDEFINED tag
    /// @retval Error::Code::TypeMismatch `type` is neither BYTE nor UNDEFINED
    [[nodiscard]] Result<void> add_bytes(uint16_t code, TiffDataType type, std::span<const uint8_t> values) noexcept;
    [[nodiscard]] Result<void> add_bytes(TagCode code, TiffDataType type, std::span<const uint8_t> values) noexcept {
        return add_bytes(static_cast<uint16_t>(code), type, values);
    }

    /// @brief Add a tag of any type from values already laid out in native byte order
    /// @retval Error::Code::InvalidTag Unknown type, or data size differs from count * type size
    [[nodiscard]] Result<void> add_raw(
        uint16_t code, TiffDataType type, uint32_t count, std::span<const std::byte> native_data) noexcept;

    /// @brief Copy every tag of another builder
    /// @retval Error::Code::InvalidTag A tag is present in both builders
    [[nodiscard]] Result<void> merge(const IFDBuilder& other) noexcept;

    [[nodiscard]] bool contains(uint16_t code) const noexcept;
    [[nodiscard]] bool contains(TagCode code) const noexcept {
        return contains(static_cast<uint16_t>(code));
    }

    [[nodiscard]] const PendingTag* find(uint16_t code) const noexcept;

    [[nodiscard]] std::span<const PendingTag> tags() const noexcept { return tags_; }
    [[nodiscard]] std::size_t size() const noexcept { return tags_.size(); }
    [[nodiscard]] bool empty() const noexcept { return tags_.empty(); }

    /// @brief Set the "next IFD" pointer written after the entries (0 ends the chain)
    void set_next_ifd_offset(uint32_t offset) noexcept { next_ifd_offset_ = offset; }

    /// @brief Size of the IFD structure: entry count, entries and next offset
    [[nodiscard]] std::size_t calculate_ifd_size() const noexcept;

    /// @brief Size of the values stored after the IFD, word padding included
    [[nodiscard]] std::size_t calculate_external_data_size() const noexcept;

    /// @brief Append the IFD and its external values to a file image
    ///
    /// The IFD starts at the first word boundary at or after `file.size()`.
    /// External values follow it in tag order.
    ///
    /// @param file Bytes of the file written so far
    /// @param byte_order Byte order of the file
    /// @return File offset of the IFD
    /// @retval Error::Code::InvalidFormat The builder holds no tag
    /// @retval Error::Code::InvalidTag More than 65535 tags
    /// @retval Error::Code::WriteError The file would exceed 4 GiB
    /// @retval Error::Code::MemoryError The file buffer could not grow
    [[nodiscard]] Result<uint32_t> write_to(std::vector<std::byte>& file, std::endian byte_order) const noexcept;

    void clear() noexcept;
};

} // namespace tiffkit

#define TIFFKIT_IFD_BUILDER_HEADER
#include "impl/ifd_builder_impl.hpp"
