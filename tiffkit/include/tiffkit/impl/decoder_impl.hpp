// This file contains the implementation of ChunkDecoder.
// Do not include this file directly - it is included by decoder.hpp

#pragma once

#include <cstring>
#include <string>
#include <new>
#include <stdexcept>
#include "../logging.hpp"

#ifndef TIFFKIT_DECODER_HEADER
#include "../decoder.hpp" // for linters
#endif

namespace tiffkit {

template <typename DecompSpec>
    requires ValidDecompressorSpec<DecompSpec>
Result<void> ChunkDecoder<DecompSpec>::decode_into(
    std::span<const std::byte> compressed_input,
    std::span<std::byte> decoded_output,
    const ChunkCodingParams& params,
    uint64_t file_offset) const noexcept {

    auto predictor_check = params.validate_predictor();
    if (!predictor_check) {
        return predictor_check.error();
    }

    std::span<const std::byte> input = compressed_input;
    if (params.fill_order == FillOrder::LsbToMsb) {
        try {
            reversed_input_.assign(compressed_input.begin(), compressed_input.end());
        } catch (const std::bad_alloc&) {
            return Err(Error::Code::MemoryError, "Failed to allocate fill order buffer");
        }
        chunk_coding::reverse_bits(reversed_input_);
        input = reversed_input_;
    }

    auto decompressed = decompressors_.decompress(decoded_output, input, params.compression);
    if (decompressed.is_error()) {
        Error error = decompressed.error();
        error.offset = static_cast<std::size_t>(file_offset + error.offset.value_or(0));
        logger()->debug("Chunk at offset {} failed to decode: {}", file_offset, error.message);
        return error;
    }

    if (params.needs_swap()) {
        chunk_coding::swap_16(decoded_output);
    }

    chunk_coding::undo_predictor(decoded_output, params);
    return Ok();
}

template <typename DecompSpec>
    requires ValidDecompressorSpec<DecompSpec>
Result<std::span<const std::byte>> ChunkDecoder<DecompSpec>::decode(
    std::span<const std::byte> compressed_input,
    std::size_t decoded_size,
    const ChunkCodingParams& params,
    uint64_t file_offset) noexcept {

    if (output_buffer_.size() < decoded_size) {
        try {
            output_buffer_.resize(decoded_size);
        } catch (const std::bad_alloc&) {
            return Err(Error::Code::MemoryError,
                       "Failed to allocate " + std::to_string(decoded_size) + " bytes for a decoded chunk");
        } catch (const std::length_error&) {
            return Err(Error::Code::MemoryError,
                       "Decoded chunk of " + std::to_string(decoded_size) + " bytes exceeds the buffer limit");
        }
    }

    std::span<std::byte> output(output_buffer_.data(), decoded_size);
    auto result = decode_into(compressed_input, output, params, file_offset);
    if (!result) {
        return result.error();
    }

    return Ok(std::span<const std::byte>(output));
}

} // namespace tiffkit
