#pragma once

#include <atomic>
#include <new>
#include <string>
#include <system_error>
#include "../logging.hpp"
#include "../tag_registry.hpp"

#ifndef TIFFKIT_TIFF_DECODER_HEADER
#include "../tiff_decoder.hpp" // for linters
#endif

namespace tiffkit {

template <RawReader Reader>
Result<TiffDecoder<Reader>> TiffDecoder<Reader>::open(Reader reader, const DecodeOptions& options) noexcept {
    TiffDecoder decoder;
    try {
        decoder.reader_ = std::make_unique<Reader>(std::move(reader));
    } catch (const std::bad_alloc&) {
        return Err(Error::Code::MemoryError, "Failed to allocate reader");
    }
    decoder.options_ = options;

    auto header = parsing::parse_header(*decoder.reader_);
    if (header.is_error()) {
        return header.error();
    }
    decoder.header_ = header.value();

    auto cursor = ByteCursor<Reader>::create(*decoder.reader_, decoder.header_.byte_order);
    if (cursor.is_error()) {
        return cursor.error();
    }
    decoder.cursor_.emplace(cursor.value());
    decoder.state_ = DecoderState::HeaderValidated;

    const uint32_t first = decoder.header_.first_ifd_offset;
    if (first != 0 && first < decoder.cursor_->size()) {
        decoder.state_ = DecoderState::FirstIfdLocated;
    } else {
        logger()->warn("First IFD offset {} is unusable ({} bytes of data)", first, decoder.cursor_->size());
    }

    if (options.worker_threads != 1) {
        try {
            decoder.pool_ = std::make_unique<WorkerPool>(options.worker_threads);
        } catch (const std::bad_alloc&) {
            return Err(Error::Code::MemoryError, "Failed to allocate worker pool");
        } catch (const std::system_error& e) {
            logger()->warn("Failed to start worker threads ({}), decoding serially", e.what());
        }
    }

    return Ok(std::move(decoder));
}

template <RawReader Reader>
Result<void> TiffDecoder<Reader>::load_chain() noexcept {
    auto chain = parsing::parse_ifd_chain(*cursor_, header_.first_ifd_offset);
    if (chain.is_error()) {
        return chain.error();
    }
    try {
        for (std::size_t i = ifds_.size(); i < chain.value().size(); ++i) {
            ifds_.push_back(std::move(chain.value()[i]));
        }
    } catch (const std::bad_alloc&) {
        return Err(Error::Code::MemoryError, "Failed to store IFD chain");
    }
    chain_complete_ = true;
    logger()->debug("IFD chain has {} directories", ifds_.size());
    return Ok();
}

template <RawReader Reader>
Result<const IFD*> TiffDecoder<Reader>::ifd_at(std::size_t index) noexcept {
    if (state_ == DecoderState::Unopened) {
        return Err(Error::Code::ReadError, "Decoder is not open");
    }
    if (state_ == DecoderState::HeaderValidated) {
        return Err(Error::Code::NoImageData,
                   "No image directory: first IFD offset is " + std::to_string(header_.first_ifd_offset))
            .at_offset(header_.first_ifd_offset);
    }

    if (index >= ifds_.size()) {
        if (index == 0) {
            // The first directory alone, the rest of the chain may never be needed
            auto first = parsing::parse_ifd(*cursor_, header_.first_ifd_offset);
            if (first.is_error()) {
                return first.error();
            }
            try {
                ifds_.push_back(std::move(first.value()));
            } catch (const std::bad_alloc&) {
                return Err(Error::Code::MemoryError, "Failed to store IFD");
            }
            chain_complete_ = ifds_.front().is_last();
        } else if (!chain_complete_) {
            auto loaded = load_chain();
            if (loaded.is_error()) {
                return loaded.error();
            }
        }
    }

    if (index >= ifds_.size()) {
        return Err(Error::Code::OutOfRange,
                   "IFD " + std::to_string(index) + " requested, file has " + std::to_string(ifds_.size()));
    }

    if (state_ == DecoderState::FirstIfdLocated) {
        state_ = DecoderState::IfdParsed;
    }
    return Ok(static_cast<const IFD*>(&ifds_[index]));
}

template <RawReader Reader>
Result<std::size_t> TiffDecoder<Reader>::ifd_count() noexcept {
    if (state_ == DecoderState::Unopened || state_ == DecoderState::HeaderValidated) {
        return Ok(std::size_t{0});
    }
    if (!chain_complete_) {
        auto loaded = load_chain();
        if (loaded.is_error()) {
            return loaded.error();
        }
    }
    return Ok(ifds_.size());
}

template <RawReader Reader>
Result<ImageShape> TiffDecoder<Reader>::shape(const IFD& ifd) const noexcept {
    return ImageShape::from_ifd(*cursor_, ifd);
}

template <RawReader Reader>
template <typename DecompSpec>
Result<void> TiffDecoder<Reader>::decode_chunks(
    const PixelAssembler& assembler, const ChunkLayout& layout, ImageData& samples) noexcept {

    const ByteCursor<Reader>& cursor = *cursor_;
    const std::endian byte_order = header_.byte_order;

    // Each range gets its own decoder; chunks write disjoint parts of `samples`
    auto decode_range = [&](std::size_t begin, std::size_t end, const std::atomic<bool>& stop) -> Result<void> {
        ChunkDecoder<DecompSpec> decoder;
        for (std::size_t i = begin; i < end; ++i) {
            if (stop.load(std::memory_order_relaxed)) {
                return Ok();
            }
            const ChunkDescriptor& chunk = layout.chunks[i];
            const auto params = ChunkCodingParams::for_chunk(assembler.shape(), chunk, byte_order);

            auto stored = cursor.slice(static_cast<std::size_t>(chunk.offset), static_cast<std::size_t>(chunk.byte_count));
            if (stored.is_error()) {
                return stored.error();
            }
            auto decoded = decoder.decode(stored.value().data(), chunk.decoded_size, params, chunk.offset);
            if (decoded.is_error()) {
                return decoded.error();
            }
            auto placed = assembler.place_chunk(samples, chunk, decoded.value(), params);
            if (placed.is_error()) {
                return placed.error();
            }
        }
        return Ok();
    };

    if (pool_ && layout.chunks.size() > 1) {
        try {
            return pool_->run(layout.chunks.size(), decode_range);
        } catch (const std::bad_alloc&) {
            return Err(Error::Code::MemoryError, "Failed to dispatch chunk decoding");
        }
    }
    std::atomic<bool> never_stop{false};
    return decode_range(0, layout.chunks.size(), never_stop);
}

template <RawReader Reader>
Result<Image> TiffDecoder<Reader>::image_at(std::size_t index) noexcept {
    auto ifd = ifd_at(index);
    if (ifd.is_error()) {
        return ifd.error();
    }

    auto shape = ImageShape::from_ifd(*cursor_, *ifd.value());
    if (shape.is_error()) {
        return shape.error();
    }

    const auto compression = static_cast<CompressionScheme>(shape.value().compression);
    if (!StandardDecompressors::supports(compression)) {
        return Err(Error::Code::UnsupportedCompression,
                   "Compression " + std::to_string(shape.value().compression) + " is not supported")
            .for_tag(static_cast<uint16_t>(TagCode::Compression));
    }

    auto assembler = PixelAssembler::create(shape.value(), options_);
    if (assembler.is_error()) {
        return assembler.error();
    }

    auto layout = locate_chunks(*cursor_, *ifd.value(), shape.value());
    if (layout.is_error()) {
        return layout.error();
    }

    // Chunks can be far larger than the image they hold (huge edge tiles)
    const std::size_t largest_chunk = layout.value().max_decoded_size();
    if (largest_chunk > options_.max_decoded_bytes) {
        return Err(Error::Code::MemoryError,
                   "A chunk decodes to " + std::to_string(largest_chunk) + " bytes, limit is " +
                   std::to_string(options_.max_decoded_bytes));
    }

    auto samples = assembler.value().allocate();
    if (samples.is_error()) {
        return samples.error();
    }

    logger()->debug("Decoding {}x{} image {} ({} chunks, compression {})",
                    shape.value().width, shape.value().height, index,
                    layout.value().chunks.size(), shape.value().compression);

    auto decoded = decode_chunks<StandardDecompressors>(assembler.value(), layout.value(), samples.value());
    if (decoded.is_error()) {
        return decoded.error();
    }

    auto image = assembler.value().finish(std::move(samples.value()));
    if (image.is_error()) {
        return image.error();
    }
    state_ = DecoderState::ImageMaterialized;
    return image;
}

template <RawReader Reader>
Result<ResolvedValue> TiffDecoder<Reader>::get_value(const IFD& ifd, uint16_t tag) const noexcept {
    const TagEntry* entry = ifd.find(tag);
    if (entry == nullptr) {
        return Err(Error::Code::TagNotFound,
                   std::string("Tag ") + std::string(tag_registry::tag_name(tag)) + " (" +
                   std::to_string(tag) + ") is not present").for_tag(tag);
    }
    const TagInfo info = tag_registry::lookup(tag);
    if (!info.allows(entry->type)) {
        logger()->debug("Tag {} stored with type {}, not one of its registered types",
                        info.name, static_cast<uint16_t>(entry->type));
    }
    return parsing::resolve(*cursor_, *entry);
}

template <RawReader Reader>
Result<uint32_t> TiffDecoder<Reader>::get_unsigned(const IFD& ifd, TagCode tag) const noexcept {
    auto value = get_value(ifd, tag);
    if (value.is_error()) {
        return value.error();
    }
    auto number = value.value().as_unsigned();
    if (number.is_error()) {
        return Err(number.error().code, number.error().message).for_tag(static_cast<uint16_t>(tag));
    }
    return number;
}

template <RawReader Reader>
Result<std::string> TiffDecoder<Reader>::get_string(const IFD& ifd, TagCode tag) const noexcept {
    auto value = get_value(ifd, tag);
    if (value.is_error()) {
        return value.error();
    }
    auto text = value.value().as_string();
    if (text.is_error()) {
        return Err(text.error().code, text.error().message).for_tag(static_cast<uint16_t>(tag));
    }
    return text;
}

template <RawReader Reader>
Result<std::vector<uint8_t>> TiffDecoder<Reader>::icc_profile(const IFD& ifd) const noexcept {
    auto value = get_value(ifd, TagCode::InterColorProfile);
    if (value.is_error()) {
        return value.error();
    }
    return value.value().as_bytes();
}

template <RawReader Reader>
Result<Predictor> TiffDecoder<Reader>::predictor(const IFD& ifd) const noexcept {
    if (!ifd.contains(TagCode::Predictor)) {
        return Ok(Predictor::None);
    }
    auto value = get_unsigned(ifd, TagCode::Predictor);
    if (value.is_error()) {
        return value.error();
    }
    if (value.value() < 1 || value.value() > 3) {
        return Err(Error::Code::InvalidTag, "Unknown predictor " + std::to_string(value.value()))
            .for_tag(static_cast<uint16_t>(TagCode::Predictor));
    }
    return Ok(static_cast<Predictor>(value.value()));
}

} // namespace tiffkit
