#pragma once

#include <algorithm>
#include <cstddef>
#include <cstring>
#include <span>
#include <string>
#include "../decompressor_base.hpp"
#include "../types/result.hpp"

namespace tiffkit {

/// No compression - simple copy
class NoneDecompressor {
public:
    constexpr NoneDecompressor() noexcept = default;

    ~NoneDecompressor() = default;

    // Non-copyable
    NoneDecompressor(const NoneDecompressor&) = delete;
    NoneDecompressor& operator=(const NoneDecompressor&) = delete;

    // Movable
    constexpr NoneDecompressor(NoneDecompressor&&) noexcept = default;
    constexpr NoneDecompressor& operator=(NoneDecompressor&&) noexcept = default;

    /// Copy uncompressed data
    /// @retval Error::Code::CodecError The stored length differs from the decoded length
    [[nodiscard]] Result<std::size_t> decompress(
        std::span<std::byte> output,
        std::span<const std::byte> input) const noexcept {

        if (input.size() != output.size()) {
            return Err(Error::Code::CodecError,
                       "Uncompressed chunk holds " + std::to_string(input.size()) +
                       " bytes, expected " + std::to_string(output.size()))
                .at_offset(std::min(input.size(), output.size()));
        }

        if (!input.empty()) {
            std::memcpy(output.data(), input.data(), input.size());
        }
        return Ok(input.size());
    }
};

/// None/uncompressed decompressor descriptor
using NoneDecompressorDesc = DecompressorDescriptor<
    NoneDecompressor,
    CompressionScheme::None
>;

/// PackBits decompression (byte-oriented run-length encoding)
class PackBitsDecompressor {
public:
    constexpr PackBitsDecompressor() noexcept = default;

    ~PackBitsDecompressor() = default;

    // Non-copyable
    PackBitsDecompressor(const PackBitsDecompressor&) = delete;
    PackBitsDecompressor& operator=(const PackBitsDecompressor&) = delete;

    // Movable
    constexpr PackBitsDecompressor(PackBitsDecompressor&&) noexcept = default;
    constexpr PackBitsDecompressor& operator=(PackBitsDecompressor&&) noexcept = default;

    /// Decompress PackBits encoded data
    /// Algorithm:
    /// - Read a signed byte n
    /// - If n >= 0: copy next (n+1) bytes literally
    /// - If n < 0 and n != -128: copy next byte (-n+1) times
    /// - If n == -128: no operation (skip)
    /// Decoding stops as soon as the output is full; runs crossing the end
    /// of the output are clipped.
    /// @retval Error::Code::CodecError Input ends before the output is full
    [[nodiscard]] Result<std::size_t> decompress(
        std::span<std::byte> output,
        std::span<const std::byte> input) const noexcept {

        std::size_t in_pos = 0;
        std::size_t out_pos = 0;

        while (out_pos < output.size()) {
            if (in_pos >= input.size()) {
                return Err(Error::Code::CodecError,
                           "PackBits: input exhausted after " + std::to_string(out_pos) + " of " +
                           std::to_string(output.size()) + " bytes")
                    .at_offset(in_pos);
            }

            const std::size_t control_pos = in_pos;
            const int8_t n = static_cast<int8_t>(input[in_pos++]);

            if (n == -128) {
                continue;
            }

            if (n >= 0) {
                // Literal run
                const std::size_t count = static_cast<std::size_t>(n) + 1;
                if (in_pos + count > input.size()) {
                    return Err(Error::Code::CodecError, "PackBits: literal run crosses the end of input")
                        .at_offset(control_pos);
                }
                const std::size_t copied = std::min(count, output.size() - out_pos);
                std::memcpy(output.data() + out_pos, input.data() + in_pos, copied);
                in_pos += count;
                out_pos += copied;
            } else {
                // Replicated run
                const std::size_t count = static_cast<std::size_t>(1 - static_cast<int>(n));
                if (in_pos >= input.size()) {
                    return Err(Error::Code::CodecError, "PackBits: replicated run without a value byte")
                        .at_offset(control_pos);
                }
                const std::byte value = input[in_pos++];
                const std::size_t copied = std::min(count, output.size() - out_pos);
                std::fill_n(output.data() + out_pos, copied, value);
                out_pos += copied;
            }
        }

        return Ok(out_pos);
    }
};

/// PackBits decompressor descriptor
using PackBitsDecompressorDesc = DecompressorDescriptor<
    PackBitsDecompressor,
    CompressionScheme::PackBits
>;

} // namespace tiffkit
