#pragma once

#include <algorithm>
#include <cstddef>
#include <cstring>
#include <span>
#include <vector>
#include "../reader_base.hpp"

namespace tiffkit {
namespace buffer_impl {

/// Read-only view over borrowed memory (zero-copy)
class BorrowedBufferReadView {
private:
    std::span<const std::byte> data_;

public:
    BorrowedBufferReadView() noexcept = default;

    explicit BorrowedBufferReadView(std::span<const std::byte> data) noexcept
        : data_(data) {}

    [[nodiscard]] std::span<const std::byte> data() const noexcept { return data_; }
    [[nodiscard]] std::size_t size() const noexcept { return data_.size(); }
    [[nodiscard]] bool empty() const noexcept { return data_.empty(); }

    BorrowedBufferReadView(BorrowedBufferReadView&&) noexcept = default;
    BorrowedBufferReadView& operator=(BorrowedBufferReadView&&) noexcept = default;
    BorrowedBufferReadView(const BorrowedBufferReadView&) = delete;
    BorrowedBufferReadView& operator=(const BorrowedBufferReadView&) = delete;
};

static_assert(DataReadOnlyView<BorrowedBufferReadView>, "BorrowedBufferReadView must satisfy DataReadOnlyView concept");

[[nodiscard]] inline Result<BorrowedBufferReadView> read_span(
    std::span<const std::byte> buffer, std::size_t offset, std::size_t size) noexcept {
    if (offset >= buffer.size()) [[unlikely]] {
        return Err(Error::Code::OutOfRange, "Read offset beyond buffer size").at_offset(offset);
    }
    std::size_t bytes_to_read = std::min(size, buffer.size() - offset);
    return Ok(BorrowedBufferReadView(buffer.subspan(offset, bytes_to_read)));
}

[[nodiscard]] inline Result<void> read_span_into(
    std::span<const std::byte> buffer, void* dest, std::size_t offset, std::size_t size) noexcept {
    if (offset > buffer.size() || size > buffer.size() - offset) [[unlikely]] {
        return Err(Error::Code::UnexpectedEof, "Read range beyond buffer size").at_offset(offset);
    }
    if (size > 0) {
        std::memcpy(dest, buffer.data() + offset, size);
    }
    return Ok();
}

} // namespace buffer_impl

/// In-memory buffer view reader (borrowed, zero-copy, thread-safe for immutable buffers)
/// The caller keeps the buffer alive for the lifetime of the reader.
class BufferViewReader {
private:
    std::span<const std::byte> buffer_;

public:
    using ReadViewType = buffer_impl::BorrowedBufferReadView;

    static constexpr bool read_must_allocate = false;

    BufferViewReader() noexcept = default;

    explicit BufferViewReader(std::span<const std::byte> buffer) noexcept
        : buffer_(buffer) {}

    [[nodiscard]] Result<ReadViewType> read(std::size_t offset, std::size_t size) const noexcept {
        return buffer_impl::read_span(buffer_, offset, size);
    }

    [[nodiscard]] Result<void> read_into(void* dest, std::size_t offset, std::size_t size) const noexcept {
        return buffer_impl::read_span_into(buffer_, dest, offset, size);
    }

    [[nodiscard]] Result<std::size_t> size() const noexcept {
        return Ok(buffer_.size());
    }

    [[nodiscard]] bool is_valid() const noexcept {
        return buffer_.data() != nullptr || buffer_.empty();
    }

    [[nodiscard]] std::span<const std::byte> buffer() const noexcept {
        return buffer_;
    }
};

static_assert(RawReader<BufferViewReader>, "BufferViewReader must satisfy RawReader concept");

/// In-memory owned buffer reader (backed by vector, thread-safe since never mutated)
class BufferReader {
private:
    std::vector<std::byte> buffer_;

public:
    using ReadViewType = buffer_impl::BorrowedBufferReadView;

    static constexpr bool read_must_allocate = false;

    BufferReader() noexcept = default;

    explicit BufferReader(std::vector<std::byte> data) noexcept
        : buffer_(std::move(data)) {}

    // Constructor from existing data (copy)
    explicit BufferReader(std::span<const std::byte> data)
        : buffer_(data.begin(), data.end()) {}

    [[nodiscard]] Result<ReadViewType> read(std::size_t offset, std::size_t size) const noexcept {
        return buffer_impl::read_span(buffer_, offset, size);
    }

    [[nodiscard]] Result<void> read_into(void* dest, std::size_t offset, std::size_t size) const noexcept {
        return buffer_impl::read_span_into(buffer_, dest, offset, size);
    }

    [[nodiscard]] Result<std::size_t> size() const noexcept {
        return Ok(buffer_.size());
    }

    [[nodiscard]] bool is_valid() const noexcept {
        return true;  // Owned buffers are always valid (even if empty)
    }

    [[nodiscard]] std::span<const std::byte> buffer() const noexcept {
        return buffer_;
    }
};

static_assert(RawReader<BufferReader>, "BufferReader must satisfy RawReader concept");

} // namespace tiffkit
