// This file contains the implementation of ChunkEncoder.
// Do not include this file directly - it is included by encoder.hpp

#pragma once

#include <algorithm>
#include <new>
#include <string>

#ifndef TIFFKIT_ENCODER_HEADER
#include "../encoder.hpp" // for linters
#endif

namespace tiffkit {

template <typename CompSpec>
    requires ValidCompressorSpec<CompSpec>
Result<EncodedChunk> ChunkEncoder<CompSpec>::encode(
    std::span<const std::byte> input,
    std::size_t chunk_index,
    const ChunkCodingParams& params) noexcept {

    if (input.empty() || params.width == 0 || params.height == 0) {
        return Err(Error::Code::InvalidFormat, "Empty chunk " + std::to_string(chunk_index));
    }

    auto predictor_check = params.validate_predictor();
    if (!predictor_check) {
        return predictor_check.error();
    }

    std::span<const std::byte> coded = input;
    if (params.predictor != Predictor::None || params.needs_swap()) {
        // Predictor encoding is destructive, work on a copy
        try {
            coding_buffer_.assign(input.begin(), input.end());
        } catch (const std::bad_alloc&) {
            return Err(Error::Code::MemoryError, "Failed to allocate predictor buffer");
        }
        chunk_coding::apply_predictor(coding_buffer_, params);
        if (params.needs_swap()) {
            chunk_coding::swap_16(coding_buffer_);
        }
        coded = coding_buffer_;
    }

    compressed_buffer_.clear();
    auto compressed = compressors_.compress(compressed_buffer_, 0, coded, params.compression);
    if (!compressed) {
        return compressed.error();
    }

    EncodedChunk chunk;
    chunk.index = chunk_index;
    chunk.uncompressed_size = input.size();
    try {
        chunk.data.assign(compressed_buffer_.begin(),
                          compressed_buffer_.begin() + static_cast<std::ptrdiff_t>(compressed.value()));
    } catch (const std::bad_alloc&) {
        return Err(Error::Code::MemoryError, "Failed to allocate encoded chunk");
    }

    if (params.fill_order == FillOrder::LsbToMsb) {
        chunk_coding::reverse_bits(chunk.data);
    }

    return Ok(std::move(chunk));
}

template <typename CompSpec>
    requires ValidCompressorSpec<CompSpec>
void ChunkEncoder<CompSpec>::clear() noexcept {
    coding_buffer_.clear();
    coding_buffer_.shrink_to_fit();
    compressed_buffer_.clear();
    compressed_buffer_.shrink_to_fit();
}

} // namespace tiffkit
