#pragma once

#include <algorithm>
#include <limits>
#include <string>
#include "../logging.hpp"
#include "../parsing.hpp"

#ifndef TIFFKIT_TILING_HEADER
#include "../tiling.hpp" // for linters
#endif

namespace tiffkit {

namespace tiling_impl {

constexpr uint64_t div_ceil(uint64_t a, uint64_t b) noexcept {
    return (a + b - 1) / b;
}

} // namespace tiling_impl

inline std::size_t ChunkLayout::max_decoded_size() const noexcept {
    std::size_t largest = 0;
    for (const auto& chunk : chunks) {
        largest = std::max(largest, chunk.decoded_size);
    }
    return largest;
}

inline Result<uint64_t> decoded_chunk_size(
    const ImageShape& shape, uint16_t plane, uint32_t stored_width, uint32_t stored_height) noexcept {
    using tiling_impl::div_ceil;

    uint64_t size = 0;
    bool fits = true;
    if (shape.is_subsampled_ycbcr()) {
        const uint64_t h = shape.ycbcr_subsampling[0];
        const uint64_t v = shape.ycbcr_subsampling[1];
        const uint64_t blocks_across = div_ceil(stored_width, h);
        const uint64_t blocks_down = div_ceil(stored_height, v);
        const uint64_t block_bits = (h * v + 2) * shape.bits_per_sample[0];
        uint64_t row_bits = 0;
        fits = checked_mul(blocks_across, block_bits, row_bits) &&
               checked_mul(div_ceil(row_bits, 8), blocks_down, size);
    } else {
        uint64_t row_bits = 0;
        fits = checked_mul(stored_width, shape.bits_per_chunk_pixel(plane), row_bits) &&
               checked_mul(div_ceil(row_bits, 8), stored_height, size);
    }
    if (!fits) {
        return Err(Error::Code::InconsistentLayout,
                   "Chunk of " + std::to_string(stored_width) + "x" + std::to_string(stored_height) +
                   " pixels overflows the addressable size");
    }
    return Ok(size);
}

inline Result<ChunkLayout> build_chunk_layout(
    const ImageShape& shape,
    ChunkKind kind,
    std::span<const uint32_t> offsets,
    std::span<const uint32_t> byte_counts) noexcept {
    using tiling_impl::div_ceil;

    ChunkLayout layout;
    layout.kind = kind;
    layout.planes = shape.planes();

    if (kind == ChunkKind::Strip) {
        if (shape.rows_per_strip == 0) {
            return Err(Error::Code::InconsistentLayout, "RowsPerStrip is zero")
                .for_tag(static_cast<uint16_t>(TagCode::RowsPerStrip));
        }
        layout.chunk_width = shape.width;
        layout.chunk_height = std::min(shape.rows_per_strip, shape.height);
        layout.chunks_across = 1;
        layout.chunks_down = static_cast<uint32_t>(div_ceil(shape.height, layout.chunk_height));
    } else {
        const uint32_t tile_width = shape.tile_width.value_or(0);
        const uint32_t tile_length = shape.tile_length.value_or(0);
        if (tile_width == 0 || tile_length == 0) {
            return Err(Error::Code::InconsistentLayout, "Tile dimensions must be non-zero")
                .for_tag(static_cast<uint16_t>(TagCode::TileWidth));
        }
        layout.chunk_width = tile_width;
        layout.chunk_height = tile_length;
        layout.chunks_across = static_cast<uint32_t>(div_ceil(shape.width, tile_width));
        layout.chunks_down = static_cast<uint32_t>(div_ceil(shape.height, tile_length));
    }

    const uint16_t offsets_tag = static_cast<uint16_t>(
        kind == ChunkKind::Strip ? TagCode::StripOffsets : TagCode::TileOffsets);

    if (offsets.size() != byte_counts.size()) {
        return Err(Error::Code::InconsistentLayout,
                   std::to_string(offsets.size()) + " chunk offsets but " +
                   std::to_string(byte_counts.size()) + " byte counts").for_tag(offsets_tag);
    }

    const uint64_t expected = static_cast<uint64_t>(layout.chunks_per_plane()) * layout.planes;
    if (offsets.size() != expected) {
        return Err(Error::Code::InconsistentLayout,
                   "Image needs " + std::to_string(expected) + " chunks, file declares " +
                   std::to_string(offsets.size())).for_tag(offsets_tag);
    }

    layout.chunks.reserve(offsets.size());
    for (uint16_t plane = 0; plane < layout.planes; ++plane) {
        for (uint32_t row = 0; row < layout.chunks_down; ++row) {
            for (uint32_t col = 0; col < layout.chunks_across; ++col) {
                ChunkDescriptor chunk;
                chunk.index = static_cast<std::size_t>(plane) * layout.chunks_per_plane() +
                              static_cast<std::size_t>(row) * layout.chunks_across + col;
                chunk.plane = plane;
                chunk.x = col * layout.chunk_width;
                chunk.y = row * layout.chunk_height;
                chunk.width = std::min(layout.chunk_width, shape.width - chunk.x);
                chunk.height = std::min(layout.chunk_height, shape.height - chunk.y);
                if (kind == ChunkKind::Tile) {
                    chunk.stored_width = layout.chunk_width;
                    chunk.stored_height = layout.chunk_height;
                } else {
                    chunk.stored_width = shape.width;
                    chunk.stored_height = chunk.height;
                }
                chunk.offset = offsets[chunk.index];
                chunk.byte_count = byte_counts[chunk.index];
                auto decoded_size = decoded_chunk_size(shape, plane, chunk.stored_width, chunk.stored_height);
                if (decoded_size.is_error()) {
                    return decoded_size.error();
                }
                if (decoded_size.value() > std::numeric_limits<std::size_t>::max()) {
                    return Err(Error::Code::InconsistentLayout,
                               "Chunk of " + std::to_string(decoded_size.value()) + " bytes cannot be addressed");
                }
                chunk.decoded_size = static_cast<std::size_t>(decoded_size.value());
                layout.chunks.push_back(chunk);
            }
        }
    }

    return Ok(std::move(layout));
}

template <RawReader Reader>
Result<ChunkLayout> locate_chunks(const ByteCursor<Reader>& cursor, const IFD& ifd, const ImageShape& shape) noexcept {
    const ChunkKind kind = shape.is_tiled() ? ChunkKind::Tile : ChunkKind::Strip;
    const TagCode offsets_code = kind == ChunkKind::Tile ? TagCode::TileOffsets : TagCode::StripOffsets;
    const TagCode counts_code = kind == ChunkKind::Tile ? TagCode::TileByteCounts : TagCode::StripByteCounts;

    const TagEntry* offsets_entry = ifd.find(offsets_code);
    if (offsets_entry == nullptr) {
        return Err(Error::Code::NoImageData,
                   kind == ChunkKind::Tile ? "TileOffsets tag is missing" : "StripOffsets tag is missing")
            .for_tag(static_cast<uint16_t>(offsets_code));
    }
    const TagEntry* counts_entry = ifd.find(counts_code);
    if (counts_entry == nullptr) {
        return Err(Error::Code::MissingRequiredTag,
                   kind == ChunkKind::Tile ? "TileByteCounts tag is missing" : "StripByteCounts tag is missing")
            .for_tag(static_cast<uint16_t>(counts_code));
    }

    auto offsets_value = parsing::resolve(cursor, *offsets_entry);
    if (offsets_value.is_error()) {
        return offsets_value.error();
    }
    auto offsets = offsets_value.value().as_unsigned_array();
    if (offsets.is_error()) {
        return Err(offsets.error().code, offsets.error().message).for_tag(static_cast<uint16_t>(offsets_code));
    }

    auto counts_value = parsing::resolve(cursor, *counts_entry);
    if (counts_value.is_error()) {
        return counts_value.error();
    }
    auto counts = counts_value.value().as_unsigned_array();
    if (counts.is_error()) {
        return Err(counts.error().code, counts.error().message).for_tag(static_cast<uint16_t>(counts_code));
    }

    auto layout = build_chunk_layout(shape, kind, offsets.value(), counts.value());
    if (layout.is_ok()) {
        const auto& l = layout.value();
        logger()->debug("IFD at offset {}: {} {}s of {}x{} ({} across, {} down, {} planes)",
                        ifd.offset(), l.chunks.size(), kind == ChunkKind::Tile ? "tile" : "strip",
                        l.chunk_width, l.chunk_height, l.chunks_across, l.chunks_down, l.planes);
    }
    return layout;
}

} // namespace tiffkit
