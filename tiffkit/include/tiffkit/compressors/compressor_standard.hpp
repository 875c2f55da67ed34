#pragma once

#include <algorithm>
#include <cstddef>
#include <cstring>
#include <new>
#include <span>
#include <vector>
#include "../compressor_base.hpp"
#include "../types/result.hpp"

namespace tiffkit {

namespace compressor_impl {

/// Grow output so that it holds at least required_size bytes
[[nodiscard]] inline Result<void> ensure_size(std::vector<std::byte>& output, std::size_t required_size) noexcept {
    if (output.size() < required_size) {
        try {
            output.resize(required_size);
        } catch (const std::bad_alloc&) {
            return Err(Error::Code::MemoryError, "Failed to resize output buffer");
        }
    }
    return Ok();
}

} // namespace compressor_impl

/// No compression - simple copy
class NoneCompressor {
public:
    constexpr NoneCompressor() noexcept = default;

    ~NoneCompressor() = default;

    // Non-copyable
    NoneCompressor(const NoneCompressor&) = delete;
    NoneCompressor& operator=(const NoneCompressor&) = delete;

    // Movable
    constexpr NoneCompressor(NoneCompressor&&) noexcept = default;
    constexpr NoneCompressor& operator=(NoneCompressor&&) noexcept = default;

    /// Copy uncompressed data
    /// @return Number of bytes written
    [[nodiscard]] Result<std::size_t> compress(
        std::vector<std::byte>& output,
        std::size_t offset,
        std::span<const std::byte> input) const noexcept {

        auto grown = compressor_impl::ensure_size(output, offset + input.size());
        if (!grown) {
            return grown.error();
        }
        if (!input.empty()) {
            std::memcpy(output.data() + offset, input.data(), input.size());
        }
        return Ok(input.size());
    }
};

using NoneCompressorDesc = CompressorDescriptor<
    NoneCompressor,
    CompressionScheme::None
>;

/// PackBits compression (byte-oriented run-length encoding)
///
/// Runs of 3 or more identical bytes become replicate runs (control byte
/// 1-n), everything else is grouped in literal runs of at most 128 bytes.
/// Two identical bytes are only coded as a run when they do not interrupt
/// a literal run.
class PackBitsCompressor {
public:
    constexpr PackBitsCompressor() noexcept = default;

    ~PackBitsCompressor() = default;

    // Non-copyable
    PackBitsCompressor(const PackBitsCompressor&) = delete;
    PackBitsCompressor& operator=(const PackBitsCompressor&) = delete;

    // Movable
    constexpr PackBitsCompressor(PackBitsCompressor&&) noexcept = default;
    constexpr PackBitsCompressor& operator=(PackBitsCompressor&&) noexcept = default;

    /// Compress data using PackBits encoding
    /// @return Number of bytes written
    [[nodiscard]] Result<std::size_t> compress(
        std::vector<std::byte>& output,
        std::size_t offset,
        std::span<const std::byte> input) const noexcept {

        // Worst case: one control byte per 128 literal bytes
        const std::size_t worst_case = input.size() + (input.size() + 127) / 128;
        auto grown = compressor_impl::ensure_size(output, offset + worst_case);
        if (!grown) {
            return grown.error();
        }

        auto run_at = [&](std::size_t pos) {
            std::size_t length = 1;
            while (pos + length < input.size() && length < 128 && input[pos + length] == input[pos]) {
                ++length;
            }
            return length;
        };

        std::size_t in_pos = 0;
        std::size_t out_pos = offset;
        while (in_pos < input.size()) {
            const std::size_t run = run_at(in_pos);
            if (run >= 2) {
                output[out_pos++] = static_cast<std::byte>(static_cast<int8_t>(1 - static_cast<int>(run)));
                output[out_pos++] = input[in_pos];
                in_pos += run;
                continue;
            }

            // Literal run, ended by a run of 3 identical bytes or the 128 byte limit
            const std::size_t start = in_pos;
            std::size_t length = 1;
            while (start + length < input.size() && length < 128 && run_at(start + length) < 3) {
                ++length;
            }
            output[out_pos++] = static_cast<std::byte>(length - 1);
            std::memcpy(output.data() + out_pos, input.data() + start, length);
            out_pos += length;
            in_pos = start + length;
        }

        return Ok(out_pos - offset);
    }
};

using PackBitsCompressorDesc = CompressorDescriptor<
    PackBitsCompressor,
    CompressionScheme::PackBits
>;

} // namespace tiffkit
