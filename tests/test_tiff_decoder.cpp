#include <gtest/gtest.h>
#include <bit>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include "../tiffkit/include/tiffkit/tiffkit.hpp"

using namespace tiffkit;

// ============================================================================
// Helper Functions
// ============================================================================

/// Start a little-endian file: header with a first IFD offset to patch later
std::vector<std::byte> start_file() {
    std::vector<std::byte> file(8);
    file[0] = std::byte{'I'};
    file[1] = std::byte{'I'};
    store_value<uint16_t>(file.data() + 2, 42, std::endian::little);
    return file;
}

void patch_u32(std::vector<std::byte>& file, std::size_t offset, uint32_t value) {
    store_value<uint32_t>(file.data() + offset, value, std::endian::little);
}

/// Append an uncompressed 8-bit gray image and its directory
/// @return Offset of the directory
uint32_t append_gray_image(std::vector<std::byte>& file, uint32_t width, uint32_t height, uint8_t seed,
                           const IFDBuilder* extra = nullptr) {
    const auto data_offset = static_cast<uint32_t>(file.size());
    for (uint32_t i = 0; i < width * height; ++i) {
        file.push_back(static_cast<std::byte>(seed + i));
    }

    IFDBuilder ifd;
    EXPECT_TRUE(ifd.add_long(TagCode::ImageWidth, width).is_ok());
    EXPECT_TRUE(ifd.add_long(TagCode::ImageLength, height).is_ok());
    EXPECT_TRUE(ifd.add_short(TagCode::BitsPerSample, 8).is_ok());
    EXPECT_TRUE(ifd.add_short(TagCode::Compression, 1).is_ok());
    EXPECT_TRUE(ifd.add_short(TagCode::PhotometricInterpretation, 1).is_ok());
    EXPECT_TRUE(ifd.add_long(TagCode::StripOffsets, data_offset).is_ok());
    EXPECT_TRUE(ifd.add_long(TagCode::RowsPerStrip, height).is_ok());
    EXPECT_TRUE(ifd.add_long(TagCode::StripByteCounts, width * height).is_ok());
    if (extra != nullptr) {
        EXPECT_TRUE(ifd.merge(*extra).is_ok());
    }
    auto offset = ifd.write_to(file, std::endian::little);
    EXPECT_TRUE(offset.is_ok());
    return offset.value_or(0);
}

/// Offset of the next-IFD field of the directory at ifd_offset
std::size_t next_field(const std::vector<std::byte>& file, uint32_t ifd_offset) {
    const uint16_t count = load_value<uint16_t>(file.data() + ifd_offset, std::endian::little);
    return ifd_offset + 2 + static_cast<std::size_t>(count) * 12;
}

std::vector<std::byte> two_page_file() {
    auto file = start_file();
    const uint32_t first = append_gray_image(file, 4, 2, 0);
    patch_u32(file, 4, first);
    const uint32_t second = append_gray_image(file, 3, 3, 100);
    patch_u32(file, next_field(file, first), second);
    return file;
}

Image gray_image(uint32_t width, uint32_t height) {
    Image image;
    image.width = width;
    image.height = height;
    image.samples_per_pixel = 1;
    image.bits_per_sample = {8};
    image.photometric = PhotometricInterpretation::BlackIsZero;
    std::vector<uint8_t> samples(static_cast<std::size_t>(width) * height);
    for (std::size_t i = 0; i < samples.size(); ++i) {
        samples[i] = static_cast<uint8_t>(i * 7);
    }
    image.data = std::move(samples);
    return image;
}

std::vector<std::byte> written(const Image& image, const WriteOptions& options = {},
                               const IFDBuilder* extra = nullptr) {
    TiffWriter<> writer;
    auto bytes = writer.write(image, options, extra);
    EXPECT_TRUE(bytes.is_ok());
    if (!bytes) {
        return {};
    }
    return std::move(bytes.value());
}

// ============================================================================
// Opening
// ============================================================================

TEST(TiffDecoder, StateProgression) {
    auto decoder = TiffDecoder<BufferReader>::open(BufferReader(written(gray_image(8, 8))));
    ASSERT_TRUE(decoder.is_ok());
    auto& d = decoder.value();
    EXPECT_EQ(d.state(), DecoderState::FirstIfdLocated);
    EXPECT_EQ(d.header().byte_order, std::endian::little);

    ASSERT_TRUE(d.ifd().is_ok());
    EXPECT_EQ(d.state(), DecoderState::IfdParsed);

    ASSERT_TRUE(d.image().is_ok());
    EXPECT_EQ(d.state(), DecoderState::ImageMaterialized);
}

TEST(TiffDecoder, InvalidHeader) {
    std::vector<std::byte> junk(64, std::byte{0x42});
    auto decoder = TiffDecoder<BufferReader>::open(BufferReader(junk));
    ASSERT_TRUE(decoder.is_error());
    EXPECT_EQ(decoder.error().code, Error::Code::InvalidHeader);
}

TEST(TiffDecoder, EmptyFile) {
    auto decoder = TiffDecoder<BufferReader>::open(BufferReader(std::vector<std::byte>{}));
    ASSERT_TRUE(decoder.is_error());
    EXPECT_EQ(decoder.error().code, Error::Code::InvalidHeader);
}

TEST(TiffDecoder, ZeroFirstOffsetHasNoImage) {
    auto file = start_file();
    auto decoder = TiffDecoder<BufferReader>::open(BufferReader(file));
    ASSERT_TRUE(decoder.is_ok());
    EXPECT_EQ(decoder.value().state(), DecoderState::HeaderValidated);

    auto ifd = decoder.value().ifd();
    ASSERT_TRUE(ifd.is_error());
    EXPECT_EQ(ifd.error().code, Error::Code::NoImageData);
    EXPECT_EQ(decoder.value().ifd_count().value(), 0u);

    auto image = decoder.value().image();
    ASSERT_TRUE(image.is_error());
    EXPECT_EQ(image.error().code, Error::Code::NoImageData);
}

TEST(TiffDecoder, FirstOffsetBeyondFile) {
    auto file = start_file();
    patch_u32(file, 4, 4096);
    auto decoder = TiffDecoder<BufferReader>::open(BufferReader(file));
    ASSERT_TRUE(decoder.is_ok());
    EXPECT_EQ(decoder.value().state(), DecoderState::HeaderValidated);
    auto ifd = decoder.value().ifd();
    ASSERT_TRUE(ifd.is_error());
    EXPECT_EQ(ifd.error().code, Error::Code::NoImageData);
}

// ============================================================================
// Tag access
// ============================================================================

TEST(TiffDecoder, TagValues) {
    IFDBuilder extra;
    ASSERT_TRUE(extra.add_ascii(TagCode::ImageDescription, "calibration target").is_ok());
    ASSERT_TRUE(extra.add_rational(TagCode::XResolution, Rational{300, 1}).is_ok());

    auto decoder = TiffDecoder<BufferReader>::open(BufferReader(written(gray_image(10, 4), {}, &extra)));
    ASSERT_TRUE(decoder.is_ok());
    auto& d = decoder.value();
    auto ifd = d.ifd();
    ASSERT_TRUE(ifd.is_ok());
    const IFD& dir = *ifd.value();

    EXPECT_EQ(d.get_unsigned(dir, TagCode::ImageWidth).value(), 10u);
    EXPECT_EQ(d.get_unsigned(dir, TagCode::ImageLength).value(), 4u);
    EXPECT_EQ(d.get_string(dir, TagCode::ImageDescription).value(), "calibration target");
    EXPECT_EQ(d.get_string(dir, TagCode::Software).value(), "tiffkit");

    auto resolution = d.get_value(dir, TagCode::XResolution);
    ASSERT_TRUE(resolution.is_ok());
    EXPECT_EQ(resolution.value().as_rational().value().numerator, 300u);

    auto missing = d.get_value(dir, TagCode::Artist);
    ASSERT_TRUE(missing.is_error());
    EXPECT_EQ(missing.error().code, Error::Code::TagNotFound);
    EXPECT_EQ(missing.error().tag.value_or(0), static_cast<uint16_t>(TagCode::Artist));

    auto mismatch = d.get_string(dir, TagCode::ImageWidth);
    ASSERT_TRUE(mismatch.is_error());
    EXPECT_EQ(mismatch.error().code, Error::Code::TypeMismatch);
}

TEST(TiffDecoder, IccProfile) {
    std::vector<uint8_t> profile(200);
    for (std::size_t i = 0; i < profile.size(); ++i) {
        profile[i] = static_cast<uint8_t>(i ^ 0x5A);
    }
    IFDBuilder extra;
    ASSERT_TRUE(extra.add_bytes(TagCode::InterColorProfile, TiffDataType::Undefined, profile).is_ok());

    auto decoder = TiffDecoder<BufferReader>::open(BufferReader(written(gray_image(4, 4), {}, &extra)));
    ASSERT_TRUE(decoder.is_ok());
    auto ifd = decoder.value().ifd();
    ASSERT_TRUE(ifd.is_ok());
    auto icc = decoder.value().icc_profile(*ifd.value());
    ASSERT_TRUE(icc.is_ok());
    EXPECT_EQ(icc.value(), profile);
}

TEST(TiffDecoder, PredictorQuery) {
    WriteOptions options;
    options.compression = CompressionScheme::LZW;
    options.predictor = Predictor::Horizontal;
    auto decoder = TiffDecoder<BufferReader>::open(BufferReader(written(gray_image(16, 16), options)));
    ASSERT_TRUE(decoder.is_ok());
    auto ifd = decoder.value().ifd();
    ASSERT_TRUE(ifd.is_ok());
    EXPECT_EQ(decoder.value().predictor(*ifd.value()).value(), Predictor::Horizontal);

    auto plain = TiffDecoder<BufferReader>::open(BufferReader(written(gray_image(4, 4))));
    ASSERT_TRUE(plain.is_ok());
    auto plain_ifd = plain.value().ifd();
    ASSERT_TRUE(plain_ifd.is_ok());
    EXPECT_EQ(plain.value().predictor(*plain_ifd.value()).value(), Predictor::None);
}

// ============================================================================
// Directory chain
// ============================================================================

TEST(TiffDecoder, MultiPage) {
    auto decoder = TiffDecoder<BufferReader>::open(BufferReader(two_page_file()));
    ASSERT_TRUE(decoder.is_ok());
    auto& d = decoder.value();

    auto count = d.ifd_count();
    ASSERT_TRUE(count.is_ok());
    EXPECT_EQ(count.value(), 2u);

    auto first = d.image_at(0);
    ASSERT_TRUE(first.is_ok());
    EXPECT_EQ(first.value().width, 4u);
    EXPECT_EQ(first.value().sample(3, 1, 0), 7u);

    auto second = d.image_at(1);
    ASSERT_TRUE(second.is_ok());
    EXPECT_EQ(second.value().width, 3u);
    EXPECT_EQ(second.value().sample(0, 0, 0), 100u);
    EXPECT_EQ(second.value().sample(2, 2, 0), 108u);

    auto beyond = d.ifd_at(2);
    ASSERT_TRUE(beyond.is_error());
    EXPECT_EQ(beyond.error().code, Error::Code::OutOfRange);
}

TEST(TiffDecoder, SecondPageWithoutCountingFirst) {
    auto decoder = TiffDecoder<BufferReader>::open(BufferReader(two_page_file()));
    ASSERT_TRUE(decoder.is_ok());
    auto second = decoder.value().ifd_at(1);
    ASSERT_TRUE(second.is_ok());
    auto first = decoder.value().ifd_at(0);
    ASSERT_TRUE(first.is_ok());
    EXPECT_NE(first.value(), second.value());
    EXPECT_EQ(first.value()->next_ifd_offset(), second.value()->offset());
}

TEST(TiffDecoder, ChainLoop) {
    auto file = start_file();
    const uint32_t first = append_gray_image(file, 2, 2, 0);
    patch_u32(file, 4, first);
    const uint32_t second = append_gray_image(file, 2, 2, 50);
    patch_u32(file, next_field(file, first), second);
    patch_u32(file, next_field(file, second), first);

    auto decoder = TiffDecoder<BufferReader>::open(BufferReader(file));
    ASSERT_TRUE(decoder.is_ok());

    // The first image stays reachable, walking the chain fails
    EXPECT_TRUE(decoder.value().image().is_ok());
    auto count = decoder.value().ifd_count();
    ASSERT_TRUE(count.is_error());
    EXPECT_EQ(count.error().code, Error::Code::InvalidFormat);
}

// ============================================================================
// Image errors
// ============================================================================

TEST(TiffDecoder, MissingStripOffsets) {
    auto file = start_file();
    IFDBuilder ifd;
    ASSERT_TRUE(ifd.add_long(TagCode::ImageWidth, 4).is_ok());
    ASSERT_TRUE(ifd.add_long(TagCode::ImageLength, 4).is_ok());
    ASSERT_TRUE(ifd.add_short(TagCode::PhotometricInterpretation, 1).is_ok());
    auto offset = ifd.write_to(file, std::endian::little);
    ASSERT_TRUE(offset.is_ok());
    patch_u32(file, 4, offset.value());

    auto decoder = TiffDecoder<BufferReader>::open(BufferReader(file));
    ASSERT_TRUE(decoder.is_ok());
    auto image = decoder.value().image();
    ASSERT_TRUE(image.is_error());
    EXPECT_EQ(image.error().code, Error::Code::NoImageData);
}

TEST(TiffDecoder, MissingWidth) {
    auto file = start_file();
    IFDBuilder ifd;
    ASSERT_TRUE(ifd.add_long(TagCode::ImageLength, 4).is_ok());
    ASSERT_TRUE(ifd.add_long(TagCode::StripOffsets, 8).is_ok());
    ASSERT_TRUE(ifd.add_long(TagCode::StripByteCounts, 16).is_ok());
    auto offset = ifd.write_to(file, std::endian::little);
    ASSERT_TRUE(offset.is_ok());
    patch_u32(file, 4, offset.value());

    auto decoder = TiffDecoder<BufferReader>::open(BufferReader(file));
    ASSERT_TRUE(decoder.is_ok());
    auto image = decoder.value().image();
    ASSERT_TRUE(image.is_error());
    EXPECT_EQ(image.error().code, Error::Code::MissingRequiredTag);
}

TEST(TiffDecoder, UnsupportedCompression) {
    auto file = start_file();
    const uint32_t first = append_gray_image(file, 2, 2, 0);
    patch_u32(file, 4, first);

    // Rewrite the Compression value of the directory to JPEG
    const uint16_t count = load_value<uint16_t>(file.data() + first, std::endian::little);
    for (uint16_t i = 0; i < count; ++i) {
        const std::size_t entry = first + 2 + static_cast<std::size_t>(i) * 12;
        if (load_value<uint16_t>(file.data() + entry, std::endian::little) == 259) {
            store_value<uint16_t>(file.data() + entry + 8, 7, std::endian::little);
        }
    }

    auto decoder = TiffDecoder<BufferReader>::open(BufferReader(file));
    ASSERT_TRUE(decoder.is_ok());
    auto image = decoder.value().image();
    ASSERT_TRUE(image.is_error());
    EXPECT_EQ(image.error().code, Error::Code::UnsupportedCompression);
}

TEST(TiffDecoder, StripOutsideFile) {
    auto file = start_file();
    IFDBuilder ifd;
    ASSERT_TRUE(ifd.add_long(TagCode::ImageWidth, 4).is_ok());
    ASSERT_TRUE(ifd.add_long(TagCode::ImageLength, 4).is_ok());
    ASSERT_TRUE(ifd.add_short(TagCode::PhotometricInterpretation, 1).is_ok());
    ASSERT_TRUE(ifd.add_short(TagCode::BitsPerSample, 8).is_ok());
    ASSERT_TRUE(ifd.add_long(TagCode::StripOffsets, 100000).is_ok());
    ASSERT_TRUE(ifd.add_long(TagCode::StripByteCounts, 16).is_ok());
    auto offset = ifd.write_to(file, std::endian::little);
    ASSERT_TRUE(offset.is_ok());
    patch_u32(file, 4, offset.value());

    auto decoder = TiffDecoder<BufferReader>::open(BufferReader(file));
    ASSERT_TRUE(decoder.is_ok());
    auto image = decoder.value().image();
    ASSERT_TRUE(image.is_error());
    EXPECT_EQ(image.error().code, Error::Code::OutOfRange);
}

TEST(TiffDecoder, DimensionsOverflowingChunkSize) {
    // 2^31 x 2^31 RGBA in one strip: the strip size wraps 64 bits
    auto file = start_file();
    IFDBuilder ifd;
    const std::vector<uint16_t> bits{8, 8, 8, 8};
    ASSERT_TRUE(ifd.add_long(TagCode::ImageWidth, 2147483648u).is_ok());
    ASSERT_TRUE(ifd.add_long(TagCode::ImageLength, 2147483648u).is_ok());
    ASSERT_TRUE(ifd.add_short(TagCode::SamplesPerPixel, 4).is_ok());
    ASSERT_TRUE(ifd.add_shorts(TagCode::BitsPerSample, bits).is_ok());
    ASSERT_TRUE(ifd.add_short(TagCode::Compression, 1).is_ok());
    ASSERT_TRUE(ifd.add_long(TagCode::StripOffsets, 8).is_ok());
    ASSERT_TRUE(ifd.add_long(TagCode::StripByteCounts, 0).is_ok());
    auto offset = ifd.write_to(file, std::endian::little);
    ASSERT_TRUE(offset.is_ok());
    patch_u32(file, 4, offset.value());

    auto decoder = TiffDecoder<BufferReader>::open(BufferReader(file));
    ASSERT_TRUE(decoder.is_ok());
    auto image = decoder.value().image();
    ASSERT_TRUE(image.is_error());
    EXPECT_EQ(image.error().code, Error::Code::InconsistentLayout);
}

TEST(TiffDecoder, ImageAboveDecodeLimit) {
    auto file = start_file();
    IFDBuilder ifd;
    ASSERT_TRUE(ifd.add_long(TagCode::ImageWidth, 65536).is_ok());
    ASSERT_TRUE(ifd.add_long(TagCode::ImageLength, 65536).is_ok());
    ASSERT_TRUE(ifd.add_short(TagCode::BitsPerSample, 8).is_ok());
    ASSERT_TRUE(ifd.add_short(TagCode::PhotometricInterpretation, 1).is_ok());
    ASSERT_TRUE(ifd.add_long(TagCode::RowsPerStrip, 1).is_ok());
    const std::vector<uint32_t> strip_offsets(65536, 8);
    const std::vector<uint32_t> strip_counts(65536, 0);
    ASSERT_TRUE(ifd.add_longs(TagCode::StripOffsets, strip_offsets).is_ok());
    ASSERT_TRUE(ifd.add_longs(TagCode::StripByteCounts, strip_counts).is_ok());
    auto offset = ifd.write_to(file, std::endian::little);
    ASSERT_TRUE(offset.is_ok());
    patch_u32(file, 4, offset.value());

    DecodeOptions options;
    options.max_decoded_bytes = 1 << 20;
    auto decoder = TiffDecoder<BufferReader>::open(BufferReader(file), options);
    ASSERT_TRUE(decoder.is_ok());
    auto image = decoder.value().image();
    ASSERT_TRUE(image.is_error());
    EXPECT_EQ(image.error().code, Error::Code::MemoryError);
}

TEST(TiffDecoder, TileAboveDecodeLimit) {
    // One pixel stored in a tile far larger than the image
    auto file = start_file();
    IFDBuilder ifd;
    ASSERT_TRUE(ifd.add_long(TagCode::ImageWidth, 1).is_ok());
    ASSERT_TRUE(ifd.add_long(TagCode::ImageLength, 1).is_ok());
    ASSERT_TRUE(ifd.add_short(TagCode::BitsPerSample, 8).is_ok());
    ASSERT_TRUE(ifd.add_short(TagCode::PhotometricInterpretation, 1).is_ok());
    ASSERT_TRUE(ifd.add_long(TagCode::TileWidth, 65536).is_ok());
    ASSERT_TRUE(ifd.add_long(TagCode::TileLength, 65536).is_ok());
    ASSERT_TRUE(ifd.add_long(TagCode::TileOffsets, 8).is_ok());
    ASSERT_TRUE(ifd.add_long(TagCode::TileByteCounts, 0).is_ok());
    auto offset = ifd.write_to(file, std::endian::little);
    ASSERT_TRUE(offset.is_ok());
    patch_u32(file, 4, offset.value());

    DecodeOptions options;
    options.max_decoded_bytes = 1 << 20;
    auto decoder = TiffDecoder<BufferReader>::open(BufferReader(file), options);
    ASSERT_TRUE(decoder.is_ok());
    auto image = decoder.value().image();
    ASSERT_TRUE(image.is_error());
    EXPECT_EQ(image.error().code, Error::Code::MemoryError);
}

// ============================================================================
// Pixel decoding
// ============================================================================

TEST(TiffDecoder, FillOrderTwo) {
    auto file = start_file();
    // 8x2 bilevel image, bits stored LSB first
    const auto data_offset = static_cast<uint32_t>(file.size());
    file.push_back(std::byte{0x01}); // 0x80 once reversed
    file.push_back(std::byte{0x0F}); // 0xF0 once reversed

    IFDBuilder ifd;
    ASSERT_TRUE(ifd.add_long(TagCode::ImageWidth, 8).is_ok());
    ASSERT_TRUE(ifd.add_long(TagCode::ImageLength, 2).is_ok());
    ASSERT_TRUE(ifd.add_short(TagCode::BitsPerSample, 1).is_ok());
    ASSERT_TRUE(ifd.add_short(TagCode::PhotometricInterpretation, 1).is_ok());
    ASSERT_TRUE(ifd.add_short(TagCode::FillOrder, 2).is_ok());
    ASSERT_TRUE(ifd.add_long(TagCode::StripOffsets, data_offset).is_ok());
    ASSERT_TRUE(ifd.add_long(TagCode::StripByteCounts, 2).is_ok());
    auto offset = ifd.write_to(file, std::endian::little);
    ASSERT_TRUE(offset.is_ok());
    patch_u32(file, 4, offset.value());

    auto decoder = TiffDecoder<BufferReader>::open(BufferReader(file));
    ASSERT_TRUE(decoder.is_ok());
    auto image = decoder.value().image();
    ASSERT_TRUE(image.is_ok());
    EXPECT_EQ(*image.value().as_u8(), (std::vector<uint8_t>{1, 0, 0, 0, 0, 0, 0, 0,
                                                            1, 1, 1, 1, 0, 0, 0, 0}));
}

TEST(TiffDecoder, RepeatedDecodeIsStable) {
    WriteOptions options;
    options.compression = CompressionScheme::PackBits;
    auto decoder = TiffDecoder<BufferReader>::open(BufferReader(written(gray_image(33, 17), options)));
    ASSERT_TRUE(decoder.is_ok());
    auto first = decoder.value().image();
    auto second = decoder.value().image();
    ASSERT_TRUE(first.is_ok());
    ASSERT_TRUE(second.is_ok());
    EXPECT_EQ(first.value(), second.value());
}

TEST(TiffDecoder, DecodeFromFile) {
    const auto path = std::filesystem::temp_directory_path() / "tiffkit_decoder_test.tif";
    Image original = gray_image(20, 10);
    original.compression = CompressionScheme::LZW;
    WriteOptions options;
    options.compression = CompressionScheme::LZW;

    TiffWriter<> writer;
    ASSERT_TRUE(writer.write_file(path.string(), original, options).is_ok());

    auto reader = open_file(path.string());
    ASSERT_TRUE(reader.is_ok());
    auto decoder = TiffDecoder<StreamFileReader>::open(std::move(reader.value()));
    ASSERT_TRUE(decoder.is_ok());
    auto image = decoder.value().image();
    ASSERT_TRUE(image.is_ok());
    EXPECT_EQ(image.value(), original);

    std::filesystem::remove(path);
}

TEST(TiffDecoder, MissingFile) {
    auto reader = open_file("/nonexistent/tiffkit/missing.tif");
    ASSERT_TRUE(reader.is_error());
    EXPECT_EQ(reader.error().code, Error::Code::FileNotFound);
}
