#pragma once

#include <array>
#include <cstring>
#include <new>
#include <string>

#ifndef TIFFKIT_BYTE_CURSOR_HEADER
#include "../byte_cursor.hpp" // for linters
#endif

namespace tiffkit {

template <RawReader Reader>
Result<ByteCursor<Reader>> ByteCursor<Reader>::create(const Reader& reader, std::endian byte_order) noexcept {
    if (!reader.is_valid()) {
        return Err(Error::Code::ReadError, "Reader is not open");
    }
    auto size_result = reader.size();
    if (size_result.is_error()) {
        return size_result.error();
    }
    return Ok(ByteCursor(reader, byte_order, size_result.value()));
}

template <RawReader Reader>
Result<void> ByteCursor<Reader>::check_range(std::size_t offset, std::size_t length) const noexcept {
    if (length == 0) {
        return Ok();
    }
    if (offset >= size_) {
        return Err(Error::Code::OutOfRange,
                   "Offset " + std::to_string(offset) + " is beyond the end of the data (" +
                   std::to_string(size_) + " bytes)").at_offset(offset);
    }
    if (length > size_ - offset) {
        return Err(Error::Code::UnexpectedEof,
                   "Reading " + std::to_string(length) + " bytes at offset " + std::to_string(offset) +
                   " runs past the end of the data").at_offset(offset);
    }
    return Ok();
}

template <RawReader Reader>
template <typename T>
Result<T> ByteCursor<Reader>::read_scalar(std::size_t offset) const noexcept {
    auto range = check_range(offset, sizeof(T));
    if (range.is_error()) {
        return range.error();
    }
    std::array<std::byte, sizeof(T)> raw;
    auto result = reader_->read_into(raw.data(), offset, sizeof(T));
    if (result.is_error()) {
        return result.error();
    }
    return Ok(load_value<T>(raw.data(), byte_order_));
}

template <RawReader Reader>
Result<Rational> ByteCursor<Reader>::read_rational(std::size_t offset) const noexcept {
    auto range = check_range(offset, sizeof(Rational));
    if (range.is_error()) {
        return range.error();
    }
    std::array<std::byte, 8> raw;
    auto result = reader_->read_into(raw.data(), offset, raw.size());
    if (result.is_error()) {
        return result.error();
    }
    return Ok(Rational{load_value<uint32_t>(raw.data(), byte_order_),
                       load_value<uint32_t>(raw.data() + 4, byte_order_)});
}

template <RawReader Reader>
Result<SRational> ByteCursor<Reader>::read_srational(std::size_t offset) const noexcept {
    auto range = check_range(offset, sizeof(SRational));
    if (range.is_error()) {
        return range.error();
    }
    std::array<std::byte, 8> raw;
    auto result = reader_->read_into(raw.data(), offset, raw.size());
    if (result.is_error()) {
        return result.error();
    }
    return Ok(SRational{load_value<int32_t>(raw.data(), byte_order_),
                        load_value<int32_t>(raw.data() + 4, byte_order_)});
}

template <RawReader Reader>
Result<typename Reader::ReadViewType> ByteCursor<Reader>::slice(std::size_t offset, std::size_t length) const noexcept {
    if (length == 0) {
        return Ok(typename Reader::ReadViewType{});
    }
    auto range = check_range(offset, length);
    if (range.is_error()) {
        return range.error();
    }
    auto view = reader_->read(offset, length);
    if (view.is_error()) {
        return view.error();
    }
    if (view.value().size() < length) {
        return Err(Error::Code::UnexpectedEof,
                   "Incomplete read at offset " + std::to_string(offset)).at_offset(offset);
    }
    return view;
}

template <RawReader Reader>
Result<void> ByteCursor<Reader>::copy_into(std::span<std::byte> output, std::size_t offset) const noexcept {
    auto range = check_range(offset, output.size());
    if (range.is_error()) {
        return range.error();
    }
    if (output.empty()) {
        return Ok();
    }
    return reader_->read_into(output.data(), offset, output.size());
}

template <RawReader Reader>
Result<std::vector<std::byte>> ByteCursor<Reader>::copy(std::size_t offset, std::size_t length) const noexcept {
    auto range = check_range(offset, length);
    if (range.is_error()) {
        return range.error();
    }
    std::vector<std::byte> bytes;
    try {
        bytes.resize(length);
    } catch (const std::bad_alloc&) {
        return Err(Error::Code::MemoryError, "Failed to allocate " + std::to_string(length) + " bytes");
    }
    auto result = copy_into(std::span<std::byte>(bytes), offset);
    if (result.is_error()) {
        return result.error();
    }
    return Ok(std::move(bytes));
}

} // namespace tiffkit
