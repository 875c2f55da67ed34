#include <gtest/gtest.h>
#include <bit>
#include <cstdint>
#include <cstring>
#include <initializer_list>
#include <vector>

#include "../tiffkit/include/tiffkit/pixel_assembler.hpp"

using namespace tiffkit;

// ============================================================================
// Helper Functions
// ============================================================================

std::vector<std::byte> bytes_of(std::initializer_list<int> values) {
    std::vector<std::byte> out;
    out.reserve(values.size());
    for (int v : values) {
        out.push_back(static_cast<std::byte>(v));
    }
    return out;
}

ImageShape make_shape(uint32_t width, uint32_t height, std::vector<uint16_t> bits,
                      PhotometricInterpretation photometric) {
    ImageShape shape;
    shape.width = width;
    shape.height = height;
    shape.samples_per_pixel = static_cast<uint16_t>(bits.size());
    shape.bits_per_sample = std::move(bits);
    shape.photometric = photometric;
    return shape;
}

/// Place already decoded chunks (in layout order) and finish the image
Result<Image> assemble(const ImageShape& shape, const std::vector<std::vector<std::byte>>& chunks,
                       DecodeOptions options = {}) {
    auto assembler = PixelAssembler::create(shape, options);
    if (!assembler) {
        return assembler.error();
    }
    std::vector<uint32_t> offsets(chunks.size(), 0);
    std::vector<uint32_t> counts(chunks.size(), 0);
    auto layout = build_chunk_layout(shape, shape.is_tiled() ? ChunkKind::Tile : ChunkKind::Strip, offsets, counts);
    if (!layout) {
        return layout.error();
    }
    auto samples = assembler.value().allocate();
    if (!samples) {
        return samples.error();
    }
    for (const auto& chunk : layout.value().chunks) {
        EXPECT_EQ(chunks[chunk.index].size(), chunk.decoded_size);
        auto params = ChunkCodingParams::for_chunk(shape, chunk, std::endian::little);
        auto placed = assembler.value().place_chunk(samples.value(), chunk, chunks[chunk.index], params);
        if (!placed) {
            return placed.error();
        }
    }
    return assembler.value().finish(std::move(samples.value()));
}

// ============================================================================
// Placement
// ============================================================================

TEST(PixelAssembler, GrayStrips) {
    auto shape = make_shape(3, 3, {8}, PhotometricInterpretation::BlackIsZero);
    shape.rows_per_strip = 2;
    auto image = assemble(shape, {bytes_of({1, 2, 3, 4, 5, 6}), bytes_of({7, 8, 9})});
    ASSERT_TRUE(image.is_ok());
    ASSERT_NE(image.value().as_u8(), nullptr);
    EXPECT_EQ(*image.value().as_u8(), (std::vector<uint8_t>{1, 2, 3, 4, 5, 6, 7, 8, 9}));
    EXPECT_EQ(image.value().photometric, PhotometricInterpretation::BlackIsZero);
}

TEST(PixelAssembler, EdgeTilesCropped) {
    auto shape = make_shape(20, 1, {8}, PhotometricInterpretation::BlackIsZero);
    shape.tile_width = 16;
    shape.tile_length = 16;
    std::vector<std::byte> first(256), second(256);
    for (int i = 0; i < 16; ++i) {
        first[i] = static_cast<std::byte>(i);
    }
    for (int i = 0; i < 16; ++i) {
        second[i] = static_cast<std::byte>(100 + i);
    }
    auto image = assemble(shape, {first, second});
    ASSERT_TRUE(image.is_ok());
    EXPECT_EQ(image.value().sample(15, 0, 0), 15u);
    EXPECT_EQ(image.value().sample(16, 0, 0), 100u);
    EXPECT_EQ(image.value().sample(19, 0, 0), 103u);
}

TEST(PixelAssembler, FourBitSamplesAreNotScaled) {
    auto shape = make_shape(3, 1, {4}, PhotometricInterpretation::BlackIsZero);
    auto image = assemble(shape, {bytes_of({0xAB, 0xC0})});
    ASSERT_TRUE(image.is_ok());
    EXPECT_EQ(*image.value().as_u8(), (std::vector<uint8_t>{0xA, 0xB, 0xC}));
}

TEST(PixelAssembler, SubByteRowsStartOnByteBoundary) {
    auto shape = make_shape(3, 2, {1}, PhotometricInterpretation::BlackIsZero);
    auto image = assemble(shape, {bytes_of({0xA0, 0x60})});
    ASSERT_TRUE(image.is_ok());
    EXPECT_EQ(*image.value().as_u8(), (std::vector<uint8_t>{1, 0, 1, 0, 1, 1}));
}

TEST(PixelAssembler, MixedDepthBitstream) {
    // RGB 5-6-5: R = 31, G = 0, B = 31
    auto shape = make_shape(1, 1, {5, 6, 5}, PhotometricInterpretation::RGB);
    auto image = assemble(shape, {bytes_of({0xF8, 0x1F})});
    ASSERT_TRUE(image.is_ok());
    EXPECT_EQ(*image.value().as_u8(), (std::vector<uint8_t>{31, 0, 31}));
}

TEST(PixelAssembler, PlanarSixteenBit) {
    auto shape = make_shape(2, 1, {16, 16, 16}, PhotometricInterpretation::RGB);
    shape.planar = PlanarConfiguration::Planar;

    // Decoded 16-bit chunks are in native order
    auto plane = [](uint16_t a, uint16_t b) {
        std::vector<std::byte> out(4);
        std::memcpy(out.data(), &a, 2);
        std::memcpy(out.data() + 2, &b, 2);
        return out;
    };
    auto image = assemble(shape, {plane(1, 2), plane(300, 400), plane(65535, 0)});
    ASSERT_TRUE(image.is_ok());
    ASSERT_NE(image.value().as_u16(), nullptr);
    EXPECT_EQ(*image.value().as_u16(), (std::vector<uint16_t>{1, 300, 65535, 2, 400, 0}));
    EXPECT_EQ(image.value().planar_configuration, PlanarConfiguration::Planar);
}

TEST(PixelAssembler, SubsampledYCbCrExpanded) {
    auto shape = make_shape(4, 2, {8, 8, 8}, PhotometricInterpretation::YCbCr);
    shape.ycbcr_subsampling = {2, 2};
    auto image = assemble(shape, {bytes_of({10, 11, 12, 13, 50, 60,
                                            20, 21, 22, 23, 70, 80})});
    ASSERT_TRUE(image.is_ok());
    const Image& img = image.value();
    EXPECT_EQ(img.photometric, PhotometricInterpretation::YCbCr);
    EXPECT_EQ(img.sample(0, 0, 0), 10u);
    EXPECT_EQ(img.sample(1, 0, 0), 11u);
    EXPECT_EQ(img.sample(0, 1, 0), 12u);
    EXPECT_EQ(img.sample(1, 1, 0), 13u);
    EXPECT_EQ(img.sample(1, 1, 1), 50u);
    EXPECT_EQ(img.sample(1, 1, 2), 60u);
    EXPECT_EQ(img.sample(2, 0, 0), 20u);
    EXPECT_EQ(img.sample(3, 1, 0), 23u);
    EXPECT_EQ(img.sample(3, 1, 1), 70u);
    EXPECT_EQ(img.sample(3, 1, 2), 80u);
}

// ============================================================================
// Palette
// ============================================================================

TEST(PixelAssembler, OneBitPaletteExpanded) {
    auto shape = make_shape(5, 1, {1}, PhotometricInterpretation::Palette);
    shape.color_map = {0, 65535,   // red
                       0, 0,       // green
                       0, 2570};   // blue
    auto image = assemble(shape, {bytes_of({0xB0})});
    ASSERT_TRUE(image.is_ok());
    const Image& img = image.value();
    EXPECT_EQ(img.photometric, PhotometricInterpretation::RGB);
    EXPECT_EQ(img.samples_per_pixel, 3);
    EXPECT_EQ(img.bits_per_sample, (std::vector<uint16_t>{8, 8, 8}));
    EXPECT_EQ(*img.as_u8(), (std::vector<uint8_t>{255, 0, 10,
                                                  0, 0, 0,
                                                  255, 0, 10,
                                                  255, 0, 10,
                                                  0, 0, 0}));
}

TEST(PixelAssembler, EightBitColorMapTakenAsIs) {
    auto shape = make_shape(2, 1, {1}, PhotometricInterpretation::Palette);
    shape.color_map = {10, 200, 20, 210, 30, 220};
    auto image = assemble(shape, {bytes_of({0x40})});
    ASSERT_TRUE(image.is_ok());
    EXPECT_EQ(*image.value().as_u8(), (std::vector<uint8_t>{10, 20, 30, 200, 210, 220}));
}

TEST(PixelAssembler, ColorMapSizeMismatch) {
    auto shape = make_shape(2, 1, {2}, PhotometricInterpretation::Palette);
    shape.color_map = {1, 2, 3, 4, 5, 6};
    auto image = assemble(shape, {bytes_of({0x10})});
    ASSERT_TRUE(image.is_error());
    EXPECT_EQ(image.error().code, Error::Code::InconsistentLayout);
}

TEST(PixelAssembler, PaletteWithSeveralSamples) {
    auto shape = make_shape(1, 1, {8, 8}, PhotometricInterpretation::Palette);
    shape.color_map.assign(3 * 256, 0);
    auto image = assemble(shape, {bytes_of({1, 2})});
    ASSERT_TRUE(image.is_error());
    EXPECT_EQ(image.error().code, Error::Code::UnsupportedFeature);
}

// ============================================================================
// Photometric conversions
// ============================================================================

TEST(PixelAssembler, WhiteIsZeroRawByDefault) {
    auto shape = make_shape(2, 1, {8}, PhotometricInterpretation::WhiteIsZero);
    auto image = assemble(shape, {bytes_of({0, 200})});
    ASSERT_TRUE(image.is_ok());
    EXPECT_EQ(image.value().photometric, PhotometricInterpretation::WhiteIsZero);
    EXPECT_EQ(*image.value().as_u8(), (std::vector<uint8_t>{0, 200}));
}

TEST(PixelAssembler, WhiteIsZeroInverted) {
    auto shape = make_shape(2, 1, {4}, PhotometricInterpretation::WhiteIsZero);
    DecodeOptions options;
    options.color_conversion = ColorConversion::ToRgb;
    auto image = assemble(shape, {bytes_of({0x0C})}, options);
    ASSERT_TRUE(image.is_ok());
    EXPECT_EQ(image.value().photometric, PhotometricInterpretation::BlackIsZero);
    EXPECT_EQ(*image.value().as_u8(), (std::vector<uint8_t>{15, 3}));
}

TEST(PixelAssembler, CmykToRgb) {
    auto shape = make_shape(2, 1, {8, 8, 8, 8}, PhotometricInterpretation::CMYK);
    DecodeOptions options;
    options.color_conversion = ColorConversion::ToRgb;
    auto image = assemble(shape, {bytes_of({255, 0, 0, 0,
                                            0, 0, 0, 255})}, options);
    ASSERT_TRUE(image.is_ok());
    const Image& img = image.value();
    EXPECT_EQ(img.photometric, PhotometricInterpretation::RGB);
    EXPECT_EQ(img.samples_per_pixel, 3);
    EXPECT_EQ(img.bits_per_sample.size(), 3u);
    EXPECT_EQ(*img.as_u8(), (std::vector<uint8_t>{0, 255, 255, 0, 0, 0}));
}

TEST(PixelAssembler, CmykRawByDefault) {
    auto shape = make_shape(1, 1, {8, 8, 8, 8}, PhotometricInterpretation::CMYK);
    auto image = assemble(shape, {bytes_of({1, 2, 3, 4})});
    ASSERT_TRUE(image.is_ok());
    EXPECT_EQ(image.value().photometric, PhotometricInterpretation::CMYK);
    EXPECT_EQ(image.value().samples_per_pixel, 4);
}

TEST(PixelAssembler, YCbCrNeutralGray) {
    auto shape = make_shape(1, 1, {8, 8, 8}, PhotometricInterpretation::YCbCr);
    shape.ycbcr_subsampling = {1, 1};
    DecodeOptions options;
    options.color_conversion = ColorConversion::ToRgb;
    auto image = assemble(shape, {bytes_of({128, 128, 128})}, options);
    ASSERT_TRUE(image.is_ok());
    EXPECT_EQ(image.value().photometric, PhotometricInterpretation::RGB);
    EXPECT_EQ(*image.value().as_u8(), (std::vector<uint8_t>{128, 128, 128}));
}

TEST(PixelAssembler, YCbCrConversionNeedsEightBits) {
    auto shape = make_shape(1, 1, {16, 16, 16}, PhotometricInterpretation::YCbCr);
    shape.ycbcr_subsampling = {1, 1};
    DecodeOptions options;
    options.color_conversion = ColorConversion::ToRgb;
    std::vector<std::byte> chunk(6);
    auto image = assemble(shape, {chunk}, options);
    ASSERT_TRUE(image.is_error());
    EXPECT_EQ(image.error().code, Error::Code::UnsupportedFeature);
}

// ============================================================================
// Creation checks
// ============================================================================

TEST(PixelAssembler, WideSamplesUnsupported) {
    auto shape = make_shape(1, 1, {32}, PhotometricInterpretation::BlackIsZero);
    auto assembler = PixelAssembler::create(shape, {});
    ASSERT_TRUE(assembler.is_error());
    EXPECT_EQ(assembler.error().code, Error::Code::UnsupportedFeature);
}

TEST(PixelAssembler, FloatSamplesUnsupported) {
    auto shape = make_shape(1, 1, {16}, PhotometricInterpretation::BlackIsZero);
    shape.sample_format = SampleFormat::IEEEFloat;
    auto assembler = PixelAssembler::create(shape, {});
    ASSERT_TRUE(assembler.is_error());
    EXPECT_EQ(assembler.error().code, Error::Code::UnsupportedFeature);
}

TEST(PixelAssembler, SubsampledNeedsEightBits) {
    auto shape = make_shape(2, 2, {16, 16, 16}, PhotometricInterpretation::YCbCr);
    auto assembler = PixelAssembler::create(shape, {});
    ASSERT_TRUE(assembler.is_error());
    EXPECT_EQ(assembler.error().code, Error::Code::UnsupportedFeature);
}

TEST(PixelAssembler, AllocationLimit) {
    auto shape = make_shape(100, 100, {16}, PhotometricInterpretation::BlackIsZero);
    DecodeOptions options;
    options.max_decoded_bytes = 10000;
    auto assembler = PixelAssembler::create(shape, options);
    ASSERT_TRUE(assembler.is_ok());
    auto samples = assembler.value().allocate();
    ASSERT_TRUE(samples.is_error());
    EXPECT_EQ(samples.error().code, Error::Code::MemoryError);
}

TEST(PixelAssembler, OverflowingSampleCount) {
    auto shape = make_shape(2147483648u, 2147483648u, {8, 8, 8, 8}, PhotometricInterpretation::RGB);
    auto assembler = PixelAssembler::create(shape, {});
    ASSERT_TRUE(assembler.is_ok());
    auto samples = assembler.value().allocate();
    ASSERT_TRUE(samples.is_error());
    EXPECT_EQ(samples.error().code, Error::Code::MemoryError);
}

TEST(PixelAssembler, ShortDecodedChunkRejected) {
    auto shape = make_shape(4, 2, {8}, PhotometricInterpretation::BlackIsZero);
    auto assembler = PixelAssembler::create(shape, {});
    ASSERT_TRUE(assembler.is_ok());
    std::vector<uint32_t> offsets{0};
    std::vector<uint32_t> counts{8};
    auto layout = build_chunk_layout(shape, ChunkKind::Strip, offsets, counts);
    ASSERT_TRUE(layout.is_ok());
    auto samples = assembler.value().allocate();
    ASSERT_TRUE(samples.is_ok());

    const auto& chunk = layout.value().chunks.front();
    auto params = ChunkCodingParams::for_chunk(shape, chunk, std::endian::little);
    auto decoded = bytes_of({1, 2, 3, 4, 5});
    auto placed = assembler.value().place_chunk(samples.value(), chunk, decoded, params);
    ASSERT_TRUE(placed.is_error());
    EXPECT_EQ(placed.error().code, Error::Code::CodecError);
}

TEST(PixelAssembler, ChunkOutsideImageRejected) {
    auto shape = make_shape(4, 2, {8}, PhotometricInterpretation::BlackIsZero);
    auto assembler = PixelAssembler::create(shape, {});
    ASSERT_TRUE(assembler.is_ok());
    auto samples = assembler.value().allocate();
    ASSERT_TRUE(samples.is_ok());

    ChunkDescriptor chunk;
    chunk.y = 1;
    chunk.width = 4;
    chunk.height = 2;
    chunk.stored_width = 4;
    chunk.stored_height = 2;
    chunk.decoded_size = 8;
    auto params = ChunkCodingParams::for_chunk(shape, chunk, std::endian::little);
    std::vector<std::byte> decoded(8, std::byte{0});
    auto placed = assembler.value().place_chunk(samples.value(), chunk, decoded, params);
    ASSERT_TRUE(placed.is_error());
    EXPECT_EQ(placed.error().code, Error::Code::InconsistentLayout);
}

TEST(AssemblerBits, ReadBitsAcrossBytes) {
    auto data = bytes_of({0b10110011, 0b01011100});
    EXPECT_EQ(assembler::read_bits(data.data(), 0, 3), 0b101u);
    EXPECT_EQ(assembler::read_bits(data.data(), 3, 7), 0b1001101u);
    EXPECT_EQ(assembler::read_bits(data.data(), 0, 16), 0b1011001101011100u);
}
