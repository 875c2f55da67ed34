#pragma once

#include <array>
#include <bitset>
#include <cstring>
#include <set>
#include <string>
#include "../logging.hpp"
#include "../tag_registry.hpp"

#ifndef TIFFKIT_PARSING_HEADER
#include "../parsing.hpp" // for linters
#endif

namespace tiffkit {
namespace parsing {

namespace detail {

inline void record(std::vector<Diagnostic>& diagnostics, std::size_t ifd_offset,
                   uint16_t tag, Error::Code code, std::size_t offset, std::string message) {
    logger()->warn("IFD at offset {}: tag {} ({}): {}", ifd_offset, tag,
                   tag_registry::tag_name(tag), message);
    diagnostics.push_back(Diagnostic{tag, code, offset, std::move(message)});
}

} // namespace detail

template <RawReader Reader>
Result<TiffHeader> parse_header(const Reader& reader) noexcept {
    auto size_result = reader.size();
    if (size_result.is_error()) {
        return size_result.error();
    }
    if (size_result.value() < tiff_header_size) {
        return Err(Error::Code::InvalidHeader,
                   "File is too short to hold a TIFF header (" + std::to_string(size_result.value()) + " bytes)");
    }

    std::array<std::byte, tiff_header_size> raw;
    auto read_result = reader.read_into(raw.data(), 0, raw.size());
    if (read_result.is_error()) {
        return read_result.error();
    }

    TiffHeader header;
    const auto b0 = static_cast<char>(raw[0]);
    const auto b1 = static_cast<char>(raw[1]);
    if (b0 == 'I' && b1 == 'I') {
        header.byte_order = std::endian::little;
    } else if (b0 == 'M' && b1 == 'M') {
        header.byte_order = std::endian::big;
    } else {
        return Err(Error::Code::InvalidHeader, "Invalid byte order marker").at_offset(0);
    }

    header.version = load_value<uint16_t>(raw.data() + 2, header.byte_order);
    if (header.version != tiff_magic) {
        return Err(Error::Code::InvalidHeader,
                   "Unsupported TIFF version " + std::to_string(header.version)).at_offset(2);
    }

    header.first_ifd_offset = load_value<uint32_t>(raw.data() + 4, header.byte_order);
    return Ok(header);
}

template <RawReader Reader>
Result<IFD> parse_ifd(const ByteCursor<Reader>& cursor, std::size_t offset) noexcept {
    auto count_result = cursor.read_u16(offset);
    if (count_result.is_error()) {
        return Err(count_result.error().code,
                   "Cannot read IFD entry count: " + count_result.error().message).at_offset(offset);
    }
    const uint16_t entry_count = count_result.value();
    const std::size_t table_offset = offset + 2;
    const std::size_t table_size = static_cast<std::size_t>(entry_count) * tiff_entry_size;

    auto table_view = cursor.slice(table_offset, table_size);
    if (table_view.is_error()) {
        return Err(table_view.error().code,
                   "IFD entry table truncated: " + table_view.error().message).at_offset(table_offset);
    }
    const auto table = table_view.value().data();

    std::vector<TagEntry> entries;
    std::vector<Diagnostic> diagnostics;
    entries.reserve(entry_count);
    std::bitset<65536> seen_codes;

    const std::endian order = cursor.byte_order();
    for (uint16_t i = 0; i < entry_count; ++i) {
        const std::byte* raw = table.data() + static_cast<std::size_t>(i) * tiff_entry_size;
        TagEntry entry;
        entry.entry_offset = table_offset + static_cast<std::size_t>(i) * tiff_entry_size;
        entry.code = load_value<uint16_t>(raw, order);
        entry.raw_type = load_value<uint16_t>(raw + 2, order);
        entry.count = load_value<uint32_t>(raw + 4, order);
        std::memcpy(entry.value_field.data(), raw + 8, 4);

        if (entry.has_known_type()) {
            entry.type = static_cast<TiffDataType>(entry.raw_type);
        } else {
            entry.type = TiffDataType::Undefined;
            detail::record(diagnostics, offset, entry.code, Error::Code::TypeMismatch, entry.entry_offset,
                           "unknown type code " + std::to_string(entry.raw_type) + ", kept as UNDEFINED");
        }

        if (!entry.is_inline()) {
            const uint64_t value_offset = entry.value_offset(order);
            if (value_offset + entry.value_size() > cursor.size()) {
                detail::record(diagnostics, offset, entry.code, Error::Code::OutOfRange, entry.entry_offset,
                               "values at offset " + std::to_string(value_offset) + " (" +
                               std::to_string(entry.value_size()) + " bytes) lie outside the file, entry skipped");
                continue;
            }
        }

        if (seen_codes.test(entry.code)) {
            detail::record(diagnostics, offset, entry.code, Error::Code::InvalidTag, entry.entry_offset,
                           "duplicate tag, first occurrence kept");
            continue;
        }

        seen_codes.set(entry.code);
        entries.push_back(entry);
    }

    uint32_t next_offset = 0;
    auto next_result = cursor.read_u32(table_offset + table_size);
    if (next_result.is_error()) {
        detail::record(diagnostics, offset, 0, next_result.error().code, table_offset + table_size,
                       "next IFD offset unreadable, directory treated as last");
    } else {
        next_offset = next_result.value();
    }

    return Ok(IFD(offset, std::move(entries), next_offset, std::move(diagnostics)));
}

template <RawReader Reader>
Result<std::vector<IFD>> parse_ifd_chain(const ByteCursor<Reader>& cursor, std::size_t first_offset) noexcept {
    std::vector<IFD> ifds;
    std::set<std::size_t> visited;
    std::size_t offset = first_offset;

    while (offset != 0) {
        if (!visited.insert(offset).second) {
            return Err(Error::Code::InvalidFormat,
                       "IFD chain loops back to offset " + std::to_string(offset)).at_offset(offset);
        }
        if (ifds.size() >= max_ifd_chain_length) {
            return Err(Error::Code::InvalidFormat, "IFD chain is too long");
        }
        auto ifd_result = parse_ifd(cursor, offset);
        if (ifd_result.is_error()) {
            return ifd_result.error();
        }
        offset = ifd_result.value().next_ifd_offset();
        ifds.push_back(std::move(ifd_result.value()));
    }

    return Ok(std::move(ifds));
}

template <RawReader Reader>
Result<ResolvedValue> resolve(const ByteCursor<Reader>& cursor, const TagEntry& entry) noexcept {
    const uint64_t size = entry.value_size();

    if (entry.is_inline()) {
        return decode_values(entry.type, entry.count,
                             std::span<const std::byte>(entry.value_field.data(), static_cast<std::size_t>(size)),
                             cursor.byte_order());
    }

    const uint64_t value_offset = entry.value_offset(cursor.byte_order());
    if (value_offset + size > cursor.size()) {
        return Err(Error::Code::OutOfRange,
                   "Tag " + std::to_string(entry.code) + " values at offset " + std::to_string(value_offset) +
                   " (" + std::to_string(size) + " bytes) exceed the file size " + std::to_string(cursor.size()))
            .at_offset(static_cast<std::size_t>(value_offset)).for_tag(entry.code);
    }

    auto view = cursor.slice(static_cast<std::size_t>(value_offset), static_cast<std::size_t>(size));
    if (view.is_error()) {
        return Err(view.error().code, view.error().message).at_offset(static_cast<std::size_t>(value_offset)).for_tag(entry.code);
    }
    return decode_values(entry.type, entry.count, view.value().data(), cursor.byte_order());
}

} // namespace parsing
} // namespace tiffkit
