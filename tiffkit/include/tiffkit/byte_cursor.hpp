#pragma once

/**
 * @file byte_cursor.hpp
 * @brief Byte-order aware positioned reads over a RawReader
 *
 * A ByteCursor combines a reader with the byte order declared by the TIFF
 * header. Every read names its absolute offset: there is no implicit
 * position, so one cursor can be shared by threads resolving tags or
 * decoding chunks concurrently.
 *
 * Bounds are checked against the reader size before anything is read:
 * - an offset at or past the end of the source yields Error::Code::OutOfRange
 * - a range that starts inside the source but crosses its end yields
 *   Error::Code::UnexpectedEof
 */

#include <bit>
#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>
#include "reader_base.hpp"
#include "types.hpp"
#include "types/result.hpp"

namespace tiffkit {

template <RawReader Reader>
class ByteCursor {
private:
    const Reader* reader_;
    std::endian byte_order_;
    std::size_t size_;

    ByteCursor(const Reader& reader, std::endian byte_order, std::size_t size) noexcept
        : reader_(&reader), byte_order_(byte_order), size_(size) {}

    template <typename T>
    [[nodiscard]] Result<T> read_scalar(std::size_t offset) const noexcept;

public:
    /// @brief Create a cursor over a reader
    /// @param reader Byte source, must outlive the cursor
    /// @param byte_order Byte order declared by the file header
    /// @retval Error::Code::ReadError The reader is not usable
    [[nodiscard]] static Result<ByteCursor> create(const Reader& reader, std::endian byte_order) noexcept;

    [[nodiscard]] std::endian byte_order() const noexcept { return byte_order_; }
    [[nodiscard]] std::size_t size() const noexcept { return size_; }
    [[nodiscard]] const Reader& reader() const noexcept { return *reader_; }

    /// @brief Check that [offset, offset + length) lies inside the source
    /// @retval Error::Code::OutOfRange offset is past the end of the source
    /// @retval Error::Code::UnexpectedEof the range crosses the end of the source
    [[nodiscard]] Result<void> check_range(std::size_t offset, std::size_t length) const noexcept;

    [[nodiscard]] Result<uint8_t> read_u8(std::size_t offset) const noexcept { return read_scalar<uint8_t>(offset); }
    [[nodiscard]] Result<uint16_t> read_u16(std::size_t offset) const noexcept { return read_scalar<uint16_t>(offset); }
    [[nodiscard]] Result<uint32_t> read_u32(std::size_t offset) const noexcept { return read_scalar<uint32_t>(offset); }
    [[nodiscard]] Result<int8_t> read_i8(std::size_t offset) const noexcept { return read_scalar<int8_t>(offset); }
    [[nodiscard]] Result<int16_t> read_i16(std::size_t offset) const noexcept { return read_scalar<int16_t>(offset); }
    [[nodiscard]] Result<int32_t> read_i32(std::size_t offset) const noexcept { return read_scalar<int32_t>(offset); }
    [[nodiscard]] Result<float> read_f32(std::size_t offset) const noexcept { return read_scalar<float>(offset); }
    [[nodiscard]] Result<double> read_f64(std::size_t offset) const noexcept { return read_scalar<double>(offset); }

    /// @brief Read an unsigned rational (two LONGs)
    [[nodiscard]] Result<Rational> read_rational(std::size_t offset) const noexcept;

    /// @brief Read a signed rational (two SLONGs)
    [[nodiscard]] Result<SRational> read_srational(std::size_t offset) const noexcept;

    /// @brief Raw view of [offset, offset + length), without byte order conversion
    /// @note The view is zero-copy for in-memory readers
    [[nodiscard]] Result<typename Reader::ReadViewType> slice(std::size_t offset, std::size_t length) const noexcept;

    /// @brief Copy [offset, offset + length) into a caller provided buffer
    [[nodiscard]] Result<void> copy_into(std::span<std::byte> output, std::size_t offset) const noexcept;

    /// @brief Copy [offset, offset + length) into a new vector
    [[nodiscard]] Result<std::vector<std::byte>> copy(std::size_t offset, std::size_t length) const noexcept;
};

} // namespace tiffkit

#define TIFFKIT_BYTE_CURSOR_HEADER
#include "impl/byte_cursor_impl.hpp"
