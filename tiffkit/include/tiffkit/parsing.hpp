#pragma once

/**
 * @file parsing.hpp
 * @brief Header and directory parsing, and tag value resolution
 *
 * ## Failure model
 *
 * - A malformed header or an unreadable entry table is fatal.
 * - A malformed single entry (unknown type, value outside the file,
 *   duplicate tag id) is degraded: it is either kept as UNDEFINED or
 *   skipped, and a Diagnostic is recorded on the IFD and logged.
 *
 * ## Value resolution
 *
 * resolve() follows the size rule only: when count * type width fits the
 * 4-byte value field the values are read from the field, otherwise the
 * field is an offset. The full value range is bounds-checked before any
 * byte is read.
 */

#include <bit>
#include <cstddef>
#include <cstdint>
#include <vector>
#include "byte_cursor.hpp"
#include "ifd.hpp"
#include "reader_base.hpp"
#include "resolved_value.hpp"
#include "types.hpp"
#include "types/result.hpp"

namespace tiffkit {

/// @brief Decoded classic TIFF header
struct TiffHeader {
    std::endian byte_order{std::endian::little};
    uint16_t version{tiff_magic};
    uint32_t first_ifd_offset{0};
};

namespace parsing {

/// Upper bound on the number of directories followed in one chain
inline constexpr std::size_t max_ifd_chain_length = 65536;

/// @brief Parse and validate the 8-byte file header
/// @param reader Byte source positioned at the start of the file
/// @retval Error::Code::InvalidHeader Missing/unknown byte order marker, bad magic, or file too short
template <RawReader Reader>
[[nodiscard]] Result<TiffHeader> parse_header(const Reader& reader) noexcept;

/// @brief Parse one directory
/// @param cursor Byte cursor over the file
/// @param offset File offset of the directory
/// @retval Error::Code::OutOfRange The directory offset is outside the file
/// @retval Error::Code::UnexpectedEof The entry count or entry table is truncated
template <RawReader Reader>
[[nodiscard]] Result<IFD> parse_ifd(const ByteCursor<Reader>& cursor, std::size_t offset) noexcept;

/// @brief Parse every directory of the chain starting at first_offset
/// @retval Error::Code::InvalidFormat The chain loops back on itself
template <RawReader Reader>
[[nodiscard]] Result<std::vector<IFD>> parse_ifd_chain(
    const ByteCursor<Reader>& cursor, std::size_t first_offset) noexcept;

/// @brief Resolve the values of an entry
/// @retval Error::Code::OutOfRange The values lie (partly) outside the file
template <RawReader Reader>
[[nodiscard]] Result<ResolvedValue> resolve(const ByteCursor<Reader>& cursor, const TagEntry& entry) noexcept;

} // namespace parsing
} // namespace tiffkit

#define TIFFKIT_PARSING_HEADER
#include "impl/parsing_impl.hpp"
