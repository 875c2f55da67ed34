#pragma once

/**
 * @file tiling.hpp
 * @brief Strip and tile location for TIFF images
 *
 * ## Key Concepts
 *
 * - **Strip**: A horizontal band spanning the whole width and RowsPerStrip
 *   rows. The last strip of each plane is not padded: it holds only the
 *   remaining rows.
 *
 * - **Tile**: A TileWidth x TileLength block. Tiles on the right and bottom
 *   edges are stored at full size; only the part inside the image is used.
 *
 * - **Planes**: With PlanarConfiguration::Planar, every sample has its own
 *   set of chunks, stored plane after plane.
 *
 * The locator produces one ChunkDescriptor per stored chunk, in file
 * order. For every plane the descriptors tile the image grid exactly,
 * which lets chunks be decoded independently into disjoint output regions.
 */

#include <cstdint>
#include <span>
#include <vector>
#include "byte_cursor.hpp"
#include "ifd.hpp"
#include "image_shape.hpp"
#include "reader_base.hpp"
#include "types/result.hpp"

namespace tiffkit {

enum class ChunkKind : uint8_t {
    Strip,
    Tile,
};

/// @brief Location and placement of one stored strip or tile
struct ChunkDescriptor {
    std::size_t index{0};        ///< Index into the offsets/byte-counts arrays
    uint16_t plane{0};           ///< Sample plane (always 0 for chunky data)
    uint32_t x{0};               ///< Left column of the chunk in the image
    uint32_t y{0};               ///< Top row of the chunk in the image
    uint32_t width{0};           ///< Columns of the chunk inside the image
    uint32_t height{0};          ///< Rows of the chunk inside the image
    uint32_t stored_width{0};    ///< Columns stored in the chunk (tile padding included)
    uint32_t stored_height{0};   ///< Rows stored in the chunk (tile padding included)
    uint64_t offset{0};          ///< File offset of the compressed bytes
    uint64_t byte_count{0};      ///< Length of the compressed bytes
    std::size_t decoded_size{0}; ///< Size of the chunk once decompressed
};

/// @brief All chunks of one image
struct ChunkLayout {
    ChunkKind kind{ChunkKind::Strip};
    uint32_t chunk_width{0};     ///< Image width for strips, TileWidth for tiles
    uint32_t chunk_height{0};    ///< RowsPerStrip (clamped to the height) or TileLength
    uint32_t chunks_across{0};
    uint32_t chunks_down{0};
    uint16_t planes{1};
    std::vector<ChunkDescriptor> chunks;

    [[nodiscard]] std::size_t chunks_per_plane() const noexcept {
        return static_cast<std::size_t>(chunks_across) * chunks_down;
    }

    /// Largest decoded chunk, sizes the scratch buffers of chunk decoders
    [[nodiscard]] std::size_t max_decoded_size() const noexcept;
};

/// @brief Size in bytes of a decoded chunk
/// @param shape Image shape
/// @param plane Sample plane of the chunk
/// @param stored_width Columns stored in the chunk
/// @param stored_height Rows stored in the chunk
/// @note Rows are padded to a byte boundary. Subsampled YCbCr data is counted
/// in blocks of (h*v luma + 2 chroma) samples.
/// @retval Error::Code::InconsistentLayout The size does not fit in 64 bits
[[nodiscard]] Result<uint64_t> decoded_chunk_size(
    const ImageShape& shape, uint16_t plane, uint32_t stored_width, uint32_t stored_height) noexcept;

/// @brief Build the chunk layout from already resolved offsets and byte counts
/// @retval Error::Code::InconsistentLayout Array lengths differ, or do not match the chunk grid,
///         or RowsPerStrip/tile size is zero, or a chunk is too large to address
[[nodiscard]] Result<ChunkLayout> build_chunk_layout(
    const ImageShape& shape,
    ChunkKind kind,
    std::span<const uint32_t> offsets,
    std::span<const uint32_t> byte_counts) noexcept;

/// @brief Resolve the location tags of an IFD and build its chunk layout
/// @retval Error::Code::NoImageData Neither strip nor tile offsets are present
/// @retval Error::Code::MissingRequiredTag Offsets are present without byte counts
/// @retval Error::Code::InconsistentLayout See build_chunk_layout()
template <RawReader Reader>
[[nodiscard]] Result<ChunkLayout> locate_chunks(
    const ByteCursor<Reader>& cursor, const IFD& ifd, const ImageShape& shape) noexcept;

} // namespace tiffkit

#define TIFFKIT_TILING_HEADER
#include "impl/tiling_impl.hpp"
