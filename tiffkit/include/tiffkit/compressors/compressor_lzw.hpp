#pragma once

#include <cstddef>
#include <cstdint>
#include <new>
#include <span>
#include <unordered_map>
#include <vector>
#include "../compressor_base.hpp"
#include "../decompressors/decompressor_lzw.hpp"
#include "../types/result.hpp"
#include "compressor_standard.hpp"

namespace tiffkit {

/// LZW compression, TIFF flavour
///
/// Produces the code stream libtiff writes: a leading Clear code, early
/// change of the code width, a Clear code whenever the table reaches 4094
/// entries, and a final EOI code. Bits are packed MSB-first and the last
/// byte is zero padded.
class LzwCompressor {
private:
    /// Maps (prefix code << 8 | next byte) to the code of the extended string
    mutable std::unordered_map<uint32_t, uint16_t> dictionary_;

    /// MSB-first writer of variable width codes into a growing vector
    class CodeWriter {
    private:
        std::vector<std::byte>& output_;
        std::size_t pos_;
        uint32_t pending_{0};
        unsigned pending_bits_{0};

    public:
        CodeWriter(std::vector<std::byte>& output, std::size_t pos) noexcept
            : output_(output), pos_(pos) {}

        [[nodiscard]] std::size_t position() const noexcept { return pos_; }

        void put(uint16_t code, unsigned width) {
            pending_ = (pending_ << width) | code;
            pending_bits_ += width;
            while (pending_bits_ >= 8) {
                pending_bits_ -= 8;
                push(static_cast<std::byte>((pending_ >> pending_bits_) & 0xFF));
            }
        }

        void flush() {
            if (pending_bits_ > 0) {
                push(static_cast<std::byte>((pending_ << (8 - pending_bits_)) & 0xFF));
                pending_bits_ = 0;
            }
        }

    private:
        void push(std::byte value) {
            if (pos_ >= output_.size()) {
                output_.resize(pos_ + 1 + output_.size() / 2);
            }
            output_[pos_++] = value;
        }
    };

    [[nodiscard]] Result<std::size_t> compress_impl(
        std::vector<std::byte>& output,
        std::size_t offset,
        std::span<const std::byte> input) const {

        dictionary_.clear();
        dictionary_.reserve(lzw::table_size);

        CodeWriter writer(output, offset);
        unsigned width = lzw::min_code_width;
        uint16_t next = lzw::first_free_code;

        auto add_entry = [&]() {
            ++next;
            if (next == lzw::table_size - 2) {
                writer.put(lzw::clear_code, width);
                dictionary_.clear();
                next = lzw::first_free_code;
                width = lzw::min_code_width;
            } else if (next >= (1u << width) && width < lzw::max_code_width) {
                ++width;
            }
        };

        writer.put(lzw::clear_code, width);

        if (!input.empty()) {
            uint16_t current = std::to_integer<uint16_t>(input[0]);
            for (std::size_t i = 1; i < input.size(); ++i) {
                const uint16_t byte = std::to_integer<uint16_t>(input[i]);
                const uint32_t key = (static_cast<uint32_t>(current) << 8) | byte;
                auto found = dictionary_.find(key);
                if (found != dictionary_.end()) {
                    current = found->second;
                    continue;
                }
                writer.put(current, width);
                dictionary_.emplace(key, next);
                add_entry();
                current = byte;
            }
            writer.put(current, width);
            add_entry();
        }

        writer.put(lzw::eoi_code, width);
        writer.flush();
        return Ok(writer.position() - offset);
    }

public:
    LzwCompressor() noexcept = default;

    ~LzwCompressor() = default;

    // Non-copyable
    LzwCompressor(const LzwCompressor&) = delete;
    LzwCompressor& operator=(const LzwCompressor&) = delete;

    // Movable
    LzwCompressor(LzwCompressor&&) noexcept = default;
    LzwCompressor& operator=(LzwCompressor&&) noexcept = default;

    /// Compress data using LZW encoding
    /// @return Number of bytes written
    /// @retval Error::Code::MemoryError Output or dictionary allocation failed
    [[nodiscard]] Result<std::size_t> compress(
        std::vector<std::byte>& output,
        std::size_t offset,
        std::span<const std::byte> input) const noexcept {

        // Codes of 9 bits or more never expand the input by more than 50%
        auto grown = compressor_impl::ensure_size(output, offset + input.size() + input.size() / 2 + 8);
        if (!grown) {
            return grown.error();
        }
        try {
            return compress_impl(output, offset, input);
        } catch (const std::bad_alloc&) {
            return Err(Error::Code::MemoryError, "LZW: allocation failed while compressing");
        }
    }
};

using LzwCompressorDesc = CompressorDescriptor<
    LzwCompressor,
    CompressionScheme::LZW
>;

} // namespace tiffkit
