#pragma once

/**
 * @file tiff_decoder.hpp
 * @brief Decoder facade: header, directory chain, tag values and images
 *
 * ## State machine
 *
 *   Unopened -> HeaderValidated -> FirstIfdLocated -> IfdParsed -> ImageMaterialized
 *
 * open() validates the header and checks that the first IFD offset points
 * inside the file. Directories are parsed on first use and cached; images
 * are decoded again on every call to image() and always give the same
 * result. Errors of the inner stages are returned unchanged.
 *
 * ## Example Usage
 *
 * @code{.cpp}
 * auto reader = tiffkit::open_file("scan.tif");
 * auto decoder = tiffkit::TiffDecoder<tiffkit::StreamFileReader>::open(std::move(reader.value()));
 * auto image = decoder.value().image();
 * if (!image) {
 *     std::cerr << image.error().message << "\n";
 * }
 * @endcode
 */

#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "byte_cursor.hpp"
#include "decoder.hpp"
#include "ifd.hpp"
#include "image.hpp"
#include "image_shape.hpp"
#include "parsing.hpp"
#include "pixel_assembler.hpp"
#include "reader_base.hpp"
#include "resolved_value.hpp"
#include "tiling.hpp"
#include "types.hpp"
#include "types/result.hpp"
#include "worker_pool.hpp"

namespace tiffkit {

enum class DecoderState : uint8_t {
    Unopened,
    HeaderValidated,   ///< Header accepted, first IFD offset unusable
    FirstIfdLocated,   ///< First IFD offset points inside the file
    IfdParsed,         ///< At least one directory parsed
    ImageMaterialized, ///< At least one image decoded
};

template <RawReader Reader>
class TiffDecoder {
private:
    // Held through a pointer so the cursor stays valid when the decoder moves
    std::unique_ptr<Reader> reader_;
    std::optional<ByteCursor<Reader>> cursor_;
    TiffHeader header_;
    DecodeOptions options_;
    DecoderState state_{DecoderState::Unopened};
    std::deque<IFD> ifds_;        // Prefix of the chain parsed so far, never reallocated
    bool chain_complete_{false};
    std::unique_ptr<WorkerPool> pool_;

    TiffDecoder() = default;

    [[nodiscard]] Result<void> load_chain() noexcept;

    template <typename DecompSpec>
    [[nodiscard]] Result<void> decode_chunks(
        const PixelAssembler& assembler, const ChunkLayout& layout, ImageData& samples) noexcept;

public:
    TiffDecoder(TiffDecoder&&) noexcept = default;
    TiffDecoder& operator=(TiffDecoder&&) noexcept = default;

    /// @brief Validate the header and locate the first IFD
    /// @param reader Byte source, owned by the decoder
    /// @param options Decode options
    /// @retval Error::Code::InvalidHeader Bad byte order marker or magic, or fewer than 8 bytes
    /// @retval Error::Code::ReadError The reader is not usable
    [[nodiscard]] static Result<TiffDecoder> open(Reader reader, const DecodeOptions& options = {}) noexcept;

    [[nodiscard]] const TiffHeader& header() const noexcept { return header_; }
    [[nodiscard]] DecoderState state() const noexcept { return state_; }
    [[nodiscard]] const DecodeOptions& options() const noexcept { return options_; }
    [[nodiscard]] const ByteCursor<Reader>& cursor() const noexcept { return *cursor_; }

    /// @brief First directory of the file
    /// @retval Error::Code::NoImageData The first IFD offset is 0 or outside the file
    /// @retval Error::Code::UnexpectedEof The entry table is truncated
    [[nodiscard]] Result<const IFD*> ifd() noexcept { return ifd_at(0); }

    /// @brief Directory at a position of the chain
    /// @note The returned pointer stays valid for the lifetime of the decoder
    /// @retval Error::Code::OutOfRange The chain has fewer directories
    /// @retval Error::Code::InvalidFormat The chain loops
    [[nodiscard]] Result<const IFD*> ifd_at(std::size_t index) noexcept;

    /// @brief Number of directories in the chain
    /// @retval Error::Code::InvalidFormat The chain loops
    [[nodiscard]] Result<std::size_t> ifd_count() noexcept;

    /// @brief Decode the image of the first directory
    [[nodiscard]] Result<Image> image() noexcept { return image_at(0); }

    /// @brief Decode the image of a directory
    /// @retval Error::Code::MissingRequiredTag Width, height or byte counts missing
    /// @retval Error::Code::NoImageData No strip or tile offsets
    /// @retval Error::Code::InconsistentLayout Chunk arrays do not tile the image
    /// @retval Error::Code::UnsupportedCompression No codec for the compression id
    /// @retval Error::Code::CodecError Malformed compressed data
    /// @retval Error::Code::UnsupportedFeature Sample format or layout not handled
    /// @retval Error::Code::MemoryError Image or one of its chunks larger than DecodeOptions::max_decoded_bytes
    [[nodiscard]] Result<Image> image_at(std::size_t index) noexcept;

    /// @brief Image shape of a directory, without decoding pixels
    [[nodiscard]] Result<ImageShape> shape(const IFD& ifd) const noexcept;

    /// @brief Resolved values of a tag
    /// @retval Error::Code::TagNotFound The tag is not in the directory
    /// @retval Error::Code::OutOfRange The values lie outside the file
    [[nodiscard]] Result<ResolvedValue> get_value(const IFD& ifd, uint16_t tag) const noexcept;

    [[nodiscard]] Result<ResolvedValue> get_value(const IFD& ifd, TagCode tag) const noexcept {
        return get_value(ifd, static_cast<uint16_t>(tag));
    }

    /// @brief First value of an unsigned integer tag
    /// @retval Error::Code::TypeMismatch The tag is not BYTE, SHORT or LONG
    [[nodiscard]] Result<uint32_t> get_unsigned(const IFD& ifd, TagCode tag) const noexcept;

    /// @brief ASCII tag value
    /// @retval Error::Code::TypeMismatch The tag is not ASCII
    [[nodiscard]] Result<std::string> get_string(const IFD& ifd, TagCode tag) const noexcept;

    /// @brief Stored ICC profile bytes (InterColorProfile), uninterpreted
    [[nodiscard]] Result<std::vector<uint8_t>> icc_profile(const IFD& ifd) const noexcept;

    /// @brief Predictor of a directory, Predictor::None when absent
    [[nodiscard]] Result<Predictor> predictor(const IFD& ifd) const noexcept;
};

} // namespace tiffkit

#define TIFFKIT_TIFF_DECODER_HEADER
#include "impl/tiff_decoder_impl.hpp"
