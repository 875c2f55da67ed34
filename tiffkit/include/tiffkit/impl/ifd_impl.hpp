#pragma once

#ifndef TIFFKIT_IFD_HEADER
#include "../ifd.hpp" // for linters
#endif

namespace tiffkit {

// TagEntry

inline bool TagEntry::has_known_type() const noexcept {
    return is_known_type(raw_type);
}

inline uint64_t TagEntry::value_size() const noexcept {
    // Unknown types are carried as Undefined, one byte per value
    return static_cast<uint64_t>(count) * tiff_type_size(type);
}

inline bool TagEntry::is_inline() const noexcept {
    return value_size() <= tiff_inline_limit;
}

inline uint32_t TagEntry::value_offset(std::endian byte_order) const noexcept {
    return load_value<uint32_t>(value_field.data(), byte_order);
}

// IFD

inline IFD::IFD(std::size_t offset,
                std::vector<TagEntry> entries,
                uint32_t next_ifd_offset,
                std::vector<Diagnostic> diagnostics) noexcept
    : offset_(offset)
    , entries_(std::move(entries))
    , next_ifd_offset_(next_ifd_offset)
    , diagnostics_(std::move(diagnostics)) {}

inline const TagEntry* IFD::find(uint16_t code) const noexcept {
    auto it = std::find_if(entries_.begin(), entries_.end(),
                           [code](const TagEntry& entry) { return entry.code == code; });
    return it == entries_.end() ? nullptr : &*it;
}

} // namespace tiffkit
