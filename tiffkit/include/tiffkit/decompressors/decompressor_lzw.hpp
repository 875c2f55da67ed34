#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <new>
#include <span>
#include <string>
#include <vector>
#include "../decompressor_base.hpp"
#include "../types/result.hpp"

namespace tiffkit {

namespace lzw {

inline constexpr uint16_t clear_code = 256;
inline constexpr uint16_t eoi_code = 257;
inline constexpr uint16_t first_free_code = 258;
inline constexpr uint16_t table_size = 4096;
inline constexpr unsigned min_code_width = 9;
inline constexpr unsigned max_code_width = 12;

} // namespace lzw

/// LZW decompression, TIFF flavour
///
/// Codes are 9 to 12 bits wide, packed MSB-first. The code width grows one
/// code earlier than in GIF ("early change"): as soon as the next free code
/// reaches 2^width - 1.
/// Decoding stops when the output is full; trailing codes (usually EOI) are
/// not read.
class LzwDecompressor {
private:
    static constexpr uint16_t no_prefix = 0xFFFF;

    struct Entry {
        uint16_t prefix;  ///< Code of the string without its last byte
        uint16_t length;  ///< Length of the decoded string
        std::byte first;  ///< First byte of the string
        std::byte last;   ///< Last byte of the string
    };

    mutable std::vector<Entry> table_;

    /// MSB-first reader of variable width codes
    class CodeReader {
    private:
        std::span<const std::byte> input_;
        std::size_t bit_pos_{0};

    public:
        explicit CodeReader(std::span<const std::byte> input) noexcept : input_(input) {}

        [[nodiscard]] std::size_t byte_offset() const noexcept { return bit_pos_ / 8; }

        /// @return false when fewer than `width` bits remain
        [[nodiscard]] bool read(unsigned width, uint16_t& code) noexcept {
            if (bit_pos_ + width > input_.size() * 8) {
                return false;
            }
            uint32_t value = 0;
            std::size_t byte_index = bit_pos_ / 8;
            const unsigned skip = static_cast<unsigned>(bit_pos_ % 8);
            // A 12-bit code starting mid-byte spans at most 3 bytes
            for (unsigned i = 0; i < 3; ++i) {
                value <<= 8;
                if (byte_index + i < input_.size()) {
                    value |= std::to_integer<uint32_t>(input_[byte_index + i]);
                }
            }
            code = static_cast<uint16_t>((value >> (24 - skip - width)) & ((1u << width) - 1));
            bit_pos_ += width;
            return true;
        }
    };

    void reset_table() const {
        if (table_.empty()) {
            table_.resize(lzw::table_size);
            for (uint16_t i = 0; i < 256; ++i) {
                table_[i] = Entry{no_prefix, 1, static_cast<std::byte>(i), static_cast<std::byte>(i)};
            }
        }
    }

    /// Write the string of `code` at output[out_pos], clipped to the output size
    /// @return Number of bytes written
    [[nodiscard]] std::size_t emit(std::span<std::byte> output, std::size_t out_pos, uint16_t code) const noexcept {
        const std::size_t length = table_[code].length;
        const std::size_t available = output.size() - out_pos;
        std::size_t pos = length;
        uint16_t current = code;
        while (pos > 0) {
            --pos;
            if (pos < available) {
                output[out_pos + pos] = table_[current].last;
            }
            current = table_[current].prefix;
        }
        return length < available ? length : available;
    }

public:
    LzwDecompressor() noexcept = default;

    ~LzwDecompressor() = default;

    // Non-copyable
    LzwDecompressor(const LzwDecompressor&) = delete;
    LzwDecompressor& operator=(const LzwDecompressor&) = delete;

    // Movable
    LzwDecompressor(LzwDecompressor&&) noexcept = default;
    LzwDecompressor& operator=(LzwDecompressor&&) noexcept = default;

    /// Decompress LZW encoded data
    /// @retval Error::Code::CodecError Input or EOI reached before the output is full,
    ///         a code beyond the next free code, or a non-literal first code after Clear
    /// @retval Error::Code::MemoryError The string table could not be allocated
    [[nodiscard]] Result<std::size_t> decompress(
        std::span<std::byte> output,
        std::span<const std::byte> input) const noexcept {

        try {
            reset_table();
        } catch (const std::bad_alloc&) {
            return Err(Error::Code::MemoryError, "LZW: cannot allocate the string table");
        }

        CodeReader reader(input);
        std::size_t out_pos = 0;
        unsigned width = lzw::min_code_width;
        uint16_t next = lzw::first_free_code;
        uint16_t previous = no_prefix;

        while (out_pos < output.size()) {
            const std::size_t code_offset = reader.byte_offset();
            uint16_t code = 0;
            if (!reader.read(width, code)) {
                return Err(Error::Code::CodecError,
                           "LZW: input exhausted after " + std::to_string(out_pos) + " of " +
                           std::to_string(output.size()) + " bytes")
                    .at_offset(code_offset);
            }

            if (code == lzw::clear_code) {
                width = lzw::min_code_width;
                next = lzw::first_free_code;
                previous = no_prefix;
                continue;
            }
            if (code == lzw::eoi_code) {
                return Err(Error::Code::CodecError,
                           "LZW: end of information after " + std::to_string(out_pos) + " of " +
                           std::to_string(output.size()) + " bytes")
                    .at_offset(code_offset);
            }

            if (previous == no_prefix) {
                if (code > 255) {
                    return Err(Error::Code::CodecError,
                               "LZW: code " + std::to_string(code) + " follows a Clear code")
                        .at_offset(code_offset);
                }
                out_pos += emit(output, out_pos, code);
                previous = code;
                continue;
            }

            if (code > next || (code == next && next >= lzw::table_size)) {
                return Err(Error::Code::CodecError,
                           "LZW: invalid code " + std::to_string(code) + " (next free code " +
                           std::to_string(next) + ")")
                    .at_offset(code_offset);
            }

            if (code == next) {
                // The string being defined: previous string plus its own first byte
                const Entry& prev = table_[previous];
                table_[next] = Entry{previous, static_cast<uint16_t>(prev.length + 1), prev.first, prev.first};
                out_pos += emit(output, out_pos, code);
                ++next;
            } else {
                out_pos += emit(output, out_pos, code);
                if (next < lzw::table_size) {
                    const Entry& prev = table_[previous];
                    table_[next] = Entry{previous, static_cast<uint16_t>(prev.length + 1),
                                         prev.first, table_[code].first};
                    ++next;
                }
            }

            if (next >= (1u << width) - 1 && width < lzw::max_code_width) {
                ++width;
            }
            previous = code;
        }

        return Ok(out_pos);
    }
};

/// LZW decompressor descriptor
using LzwDecompressorDesc = DecompressorDescriptor<
    LzwDecompressor,
    CompressionScheme::LZW
>;

} // namespace tiffkit
