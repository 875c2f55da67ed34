#pragma once

/**
 * @file ifd.hpp
 * @brief In-memory model of one Image File Directory
 *
 * An IFD is the ordered list of tag entries of one directory together with
 * the offset of the next directory in the chain. Entries keep their raw
 * 4-byte value field; values are resolved on demand (see parsing.hpp).
 *
 * Tag ids are unique within an IFD. When a file repeats a tag, the parser
 * keeps the first occurrence and records a Diagnostic for the others.
 */

#include <algorithm>
#include <array>
#include <bit>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>
#include "types.hpp"
#include "types/result.hpp"

namespace tiffkit {

/// @brief One 12-byte IFD entry as read from the file
struct TagEntry {
    uint16_t code{0};                       ///< Tag id
    uint16_t raw_type{0};                   ///< Type code as stored in the file
    TiffDataType type{TiffDataType::Undefined}; ///< Undefined when raw_type is not a known type
    uint32_t count{0};                      ///< Number of values of `type`
    std::array<std::byte, 4> value_field{}; ///< Inline values or offset, in file byte order
    std::size_t entry_offset{0};            ///< File offset of the entry itself

    /// @brief Whether the stored type code is one of the known data types
    [[nodiscard]] bool has_known_type() const noexcept;

    /// @brief Total size of the values in bytes (count * type width)
    [[nodiscard]] uint64_t value_size() const noexcept;

    /// @brief Whether the values are stored in the value field itself
    /// @note Decided by the value size only, never by the tag id
    [[nodiscard]] bool is_inline() const noexcept;

    /// @brief Offset of the values in the file
    /// @param byte_order Byte order of the file
    /// @note Only meaningful when !is_inline()
    [[nodiscard]] uint32_t value_offset(std::endian byte_order) const noexcept;
};

/// @brief Non-fatal problem found while parsing a directory
struct Diagnostic {
    uint16_t tag;          ///< Tag id of the offending entry
    Error::Code code;      ///< Kind of problem
    std::size_t offset;    ///< File offset of the offending entry
    std::string message;
};

/// @brief Parsed Image File Directory
class IFD {
private:
    std::size_t offset_{0};
    std::vector<TagEntry> entries_;
    uint32_t next_ifd_offset_{0};
    std::vector<Diagnostic> diagnostics_;

public:
    IFD() = default;

    IFD(std::size_t offset,
        std::vector<TagEntry> entries,
        uint32_t next_ifd_offset,
        std::vector<Diagnostic> diagnostics = {}) noexcept;

    /// File offset of this directory
    [[nodiscard]] std::size_t offset() const noexcept { return offset_; }

    /// Offset of the next directory, 0 when this is the last one
    [[nodiscard]] uint32_t next_ifd_offset() const noexcept { return next_ifd_offset_; }

    [[nodiscard]] bool is_last() const noexcept { return next_ifd_offset_ == 0; }

    /// Entries in file order
    [[nodiscard]] const std::vector<TagEntry>& entries() const noexcept { return entries_; }

    /// Problems recorded while parsing (skipped or degraded entries)
    [[nodiscard]] const std::vector<Diagnostic>& diagnostics() const noexcept { return diagnostics_; }

    [[nodiscard]] std::size_t size() const noexcept { return entries_.size(); }
    [[nodiscard]] bool empty() const noexcept { return entries_.empty(); }

    [[nodiscard]] auto begin() const noexcept { return entries_.begin(); }
    [[nodiscard]] auto end() const noexcept { return entries_.end(); }

    /// @brief Find an entry by tag id
    /// @return Pointer to the entry, or nullptr if the tag is absent
    [[nodiscard]] const TagEntry* find(uint16_t code) const noexcept;

    [[nodiscard]] const TagEntry* find(TagCode code) const noexcept {
        return find(static_cast<uint16_t>(code));
    }

    [[nodiscard]] bool contains(uint16_t code) const noexcept { return find(code) != nullptr; }
    [[nodiscard]] bool contains(TagCode code) const noexcept { return find(code) != nullptr; }
};

} // namespace tiffkit

#define TIFFKIT_IFD_HEADER
#include "impl/ifd_impl.hpp"
