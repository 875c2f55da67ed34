#include <gtest/gtest.h>
#include <algorithm>
#include <cstdint>
#include <initializer_list>
#include <random>
#include <vector>

#include "../tiffkit/include/tiffkit/decoder.hpp"
#include "../tiffkit/include/tiffkit/encoder.hpp"

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

std::vector<std::byte> random_bytes(std::size_t size, uint64_t seed) {
    std::mt19937_64 rng(seed);
    std::uniform_int_distribution<int> dist(0, 255);
    std::vector<std::byte> out(size);
    for (auto& b : out) {
        b = static_cast<std::byte>(dist(rng));
    }
    return out;
}

/// Data with long runs and repeated patterns, the usual case for scanned images
std::vector<std::byte> repetitive_bytes(std::size_t size, uint64_t seed) {
    std::mt19937_64 rng(seed);
    std::uniform_int_distribution<int> value(0, 7);
    std::uniform_int_distribution<int> run(1, 40);
    std::vector<std::byte> out;
    out.reserve(size);
    while (out.size() < size) {
        const auto v = static_cast<std::byte>(value(rng) * 30);
        const int length = run(rng);
        for (int i = 0; i < length && out.size() < size; ++i) {
            out.push_back(v);
        }
    }
    return out;
}

std::vector<std::byte> compress_with(CompressionScheme scheme, std::span<const std::byte> input) {
    CompressorStorage<StandardCompressors> compressors;
    std::vector<std::byte> output;
    auto written = compressors.compress(output, 0, input, scheme);
    EXPECT_TRUE(written.is_ok());
    if (!written) {
        return {};
    }
    output.resize(written.value());
    return output;
}

Result<std::vector<std::byte>> decompress_with(CompressionScheme scheme, std::span<const std::byte> input,
                                               std::size_t decoded_size) {
    DecompressorStorage<StandardDecompressors> decompressors;
    std::vector<std::byte> output(decoded_size);
    auto written = decompressors.decompress(output, input, scheme);
    if (!written) {
        return written.error();
    }
    EXPECT_EQ(written.value(), decoded_size);
    return Ok(std::move(output));
}

// ============================================================================
// None
// ============================================================================

TEST(NoneCodec, CopiesExactSize) {
    auto input = bytes_of({1, 2, 3, 4});
    auto decoded = decompress_with(CompressionScheme::None, input, 4);
    ASSERT_TRUE(decoded.is_ok());
    EXPECT_EQ(decoded.value(), input);
}

TEST(NoneCodec, SizeMismatchIsCodecError) {
    auto input = bytes_of({1, 2, 3});
    auto decoded = decompress_with(CompressionScheme::None, input, 4);
    ASSERT_TRUE(decoded.is_error());
    EXPECT_EQ(decoded.error().code, Error::Code::CodecError);
}

// ============================================================================
// PackBits
// ============================================================================

TEST(PackBits, LiteralRun) {
    auto decoded = decompress_with(CompressionScheme::PackBits, bytes_of({0x02, 0xAA, 0xBB, 0xCC}), 3);
    ASSERT_TRUE(decoded.is_ok());
    EXPECT_EQ(decoded.value(), bytes_of({0xAA, 0xBB, 0xCC}));
}

TEST(PackBits, ReplicatedRun) {
    auto decoded = decompress_with(CompressionScheme::PackBits, bytes_of({0xFE, 0x41}), 3);
    ASSERT_TRUE(decoded.is_ok());
    EXPECT_EQ(decoded.value(), bytes_of({0x41, 0x41, 0x41}));
}

TEST(PackBits, NoOpControlByte) {
    auto decoded = decompress_with(CompressionScheme::PackBits, bytes_of({0x80, 0x00, 0x07, 0x80, 0xFF, 0x09}), 3);
    ASSERT_TRUE(decoded.is_ok());
    EXPECT_EQ(decoded.value(), bytes_of({0x07, 0x09, 0x09}));
}

TEST(PackBits, RunClippedAtOutputEnd) {
    auto decoded = decompress_with(CompressionScheme::PackBits, bytes_of({0xF9, 0x11}), 4);
    ASSERT_TRUE(decoded.is_ok());
    EXPECT_EQ(decoded.value(), bytes_of({0x11, 0x11, 0x11, 0x11}));
}

TEST(PackBits, TruncatedInput) {
    auto missing_output = decompress_with(CompressionScheme::PackBits, bytes_of({0x01, 0x10, 0x20}), 5);
    ASSERT_TRUE(missing_output.is_error());
    EXPECT_EQ(missing_output.error().code, Error::Code::CodecError);

    auto short_literal = decompress_with(CompressionScheme::PackBits, bytes_of({0x04, 0x10, 0x20}), 5);
    ASSERT_TRUE(short_literal.is_error());
    EXPECT_EQ(short_literal.error().code, Error::Code::CodecError);
    EXPECT_EQ(short_literal.error().offset.value_or(99), 0u);
}

TEST(PackBits, RoundTrip) {
    for (uint64_t seed : {1u, 2u, 3u}) {
        auto input = repetitive_bytes(5000, seed);
        auto compressed = compress_with(CompressionScheme::PackBits, input);
        EXPECT_LT(compressed.size(), input.size());
        auto decoded = decompress_with(CompressionScheme::PackBits, compressed, input.size());
        ASSERT_TRUE(decoded.is_ok());
        EXPECT_EQ(decoded.value(), input);
    }

    auto noise = random_bytes(1000, 4);
    auto compressed = compress_with(CompressionScheme::PackBits, noise);
    auto decoded = decompress_with(CompressionScheme::PackBits, compressed, noise.size());
    ASSERT_TRUE(decoded.is_ok());
    EXPECT_EQ(decoded.value(), noise);
}

// ============================================================================
// LZW
// ============================================================================

TEST(Lzw, ClearLiteralsEoi) {
    // Clear, 'A', 'B', EOI in 9-bit codes
    auto input = bytes_of({0x80, 0x10, 0x48, 0x50, 0x10});
    auto decoded = decompress_with(CompressionScheme::LZW, input, 2);
    ASSERT_TRUE(decoded.is_ok());
    EXPECT_EQ(decoded.value(), bytes_of({'A', 'B'}));
}

TEST(Lzw, EarlyEoiIsCodecError) {
    auto input = bytes_of({0x80, 0x10, 0x48, 0x50, 0x10});
    auto decoded = decompress_with(CompressionScheme::LZW, input, 5);
    ASSERT_TRUE(decoded.is_error());
    EXPECT_EQ(decoded.error().code, Error::Code::CodecError);
}

TEST(Lzw, CodeBeyondTableIsCodecError) {
    // Clear, 'A', then code 300 while the next free code is 258
    auto input = bytes_of({0x80, 0x10, 0x65, 0x80});
    auto decoded = decompress_with(CompressionScheme::LZW, input, 4);
    ASSERT_TRUE(decoded.is_error());
    EXPECT_EQ(decoded.error().code, Error::Code::CodecError);
}

TEST(Lzw, EmptyInputIsCodecError) {
    std::vector<std::byte> input;
    auto decoded = decompress_with(CompressionScheme::LZW, input, 1);
    ASSERT_TRUE(decoded.is_error());
    EXPECT_EQ(decoded.error().code, Error::Code::CodecError);
}

TEST(Lzw, StreamStartsWithClear) {
    auto compressed = compress_with(CompressionScheme::LZW, bytes_of({'A', 'B'}));
    ASSERT_EQ(compressed, bytes_of({0x80, 0x10, 0x48, 0x50, 0x10}));
}

TEST(Lzw, RoundTripAcrossCodeWidths) {
    // Large enough to grow the codes to 12 bits and fill the table several times
    for (uint64_t seed : {11u, 12u}) {
        auto input = repetitive_bytes(200000, seed);
        auto compressed = compress_with(CompressionScheme::LZW, input);
        EXPECT_LT(compressed.size(), input.size());
        auto decoded = decompress_with(CompressionScheme::LZW, compressed, input.size());
        ASSERT_TRUE(decoded.is_ok());
        EXPECT_EQ(decoded.value(), input);
    }

    auto noise = random_bytes(50000, 13);
    auto compressed = compress_with(CompressionScheme::LZW, noise);
    auto decoded = decompress_with(CompressionScheme::LZW, compressed, noise.size());
    ASSERT_TRUE(decoded.is_ok());
    EXPECT_EQ(decoded.value(), noise);
}

TEST(Lzw, SingleRepeatedByte) {
    std::vector<std::byte> input(10000, std::byte{0x5A});
    auto compressed = compress_with(CompressionScheme::LZW, input);
    auto decoded = decompress_with(CompressionScheme::LZW, compressed, input.size());
    ASSERT_TRUE(decoded.is_ok());
    EXPECT_EQ(decoded.value(), input);
}

#ifdef TIFFKIT_HAVE_ZSTD
TEST(Zstd, RoundTrip) {
    auto input = repetitive_bytes(20000, 21);
    auto compressed = compress_with(CompressionScheme::ZSTD, input);
    EXPECT_LT(compressed.size(), input.size());
    auto decoded = decompress_with(CompressionScheme::ZSTD, compressed, input.size());
    ASSERT_TRUE(decoded.is_ok());
    EXPECT_EQ(decoded.value(), input);
}

TEST(Zstd, GarbageIsCodecError) {
    auto decoded = decompress_with(CompressionScheme::ZSTD, bytes_of({1, 2, 3, 4, 5}), 10);
    ASSERT_TRUE(decoded.is_error());
    EXPECT_EQ(decoded.error().code, Error::Code::CodecError);
}
#endif

// ============================================================================
// Dispatch
// ============================================================================

TEST(CodecDispatch, UnsupportedCompression) {
    auto decoded = decompress_with(CompressionScheme::JPEG, bytes_of({1, 2}), 2);
    ASSERT_TRUE(decoded.is_error());
    EXPECT_EQ(decoded.error().code, Error::Code::UnsupportedCompression);

    CompressorStorage<StandardCompressors> compressors;
    std::vector<std::byte> output;
    auto input = bytes_of({1, 2});
    auto written = compressors.compress(output, 0, input, CompressionScheme::JPEG);
    ASSERT_TRUE(written.is_error());
    EXPECT_EQ(written.error().code, Error::Code::UnsupportedCompression);

    EXPECT_TRUE(StandardDecompressors::supports(CompressionScheme::LZW));
    EXPECT_FALSE(StandardDecompressors::supports(CompressionScheme::JPEG));
}

TEST(CodecDispatch, RoutesEachBoundScheme) {
    static_assert(StandardCompressors::supports(CompressionScheme::PackBits));
    static_assert(!StandardCompressors::supports(CompressionScheme::Deflate));

    auto input = bytes_of({7, 7, 7, 7, 1, 2, 3});
    // PackBits output differs from the raw bytes, None output does not
    EXPECT_EQ(compress_with(CompressionScheme::None, input), input);
    EXPECT_NE(compress_with(CompressionScheme::PackBits, input), input);

    // Codec failures reach the caller unchanged
    auto truncated = decompress_with(CompressionScheme::PackBits, bytes_of({5, 1}), 6);
    ASSERT_TRUE(truncated.is_error());
    EXPECT_EQ(truncated.error().code, Error::Code::CodecError);
}

// ============================================================================
// Chunk pipeline
// ============================================================================

TEST(ChunkDecoder, FillOrderReversedBeforeDecompression) {
    auto stored = bytes_of({0x01, 0x80, 0xF0});
    ChunkCodingParams params;
    params.compression = CompressionScheme::None;
    params.fill_order = FillOrder::LsbToMsb;
    params.bits_per_sample = 1;
    params.width = 24;
    params.height = 1;

    ChunkDecoder<> decoder;
    auto decoded = decoder.decode(stored, 3, params);
    ASSERT_TRUE(decoded.is_ok());
    EXPECT_EQ(decoded.value()[0], std::byte{0x80});
    EXPECT_EQ(decoded.value()[1], std::byte{0x01});
    EXPECT_EQ(decoded.value()[2], std::byte{0x0F});
}

TEST(ChunkDecoder, ErrorOffsetIsFileRelative) {
    ChunkCodingParams params;
    params.compression = CompressionScheme::PackBits;
    params.width = 8;
    params.height = 1;

    ChunkDecoder<> decoder;
    auto stored = bytes_of({0x01, 0x10});
    auto decoded = decoder.decode(stored, 8, params, 1000);
    ASSERT_TRUE(decoded.is_error());
    EXPECT_EQ(decoded.error().code, Error::Code::CodecError);
    EXPECT_GE(decoded.error().offset.value_or(0), 1000u);
}

TEST(ChunkEncoder, EncodeDecodeWithPredictorBigEndian) {
    const uint32_t width = 16;
    const uint32_t height = 4;
    std::vector<uint16_t> samples(width * height * 3);
    std::mt19937_64 rng(31);
    for (auto& s : samples) {
        s = static_cast<uint16_t>(rng());
    }
    std::span<const std::byte> input(reinterpret_cast<const std::byte*>(samples.data()), samples.size() * 2);

    ChunkCodingParams params;
    params.compression = CompressionScheme::LZW;
    params.predictor = Predictor::Horizontal;
    params.byte_order = std::endian::big;
    params.bits_per_sample = 16;
    params.samples_per_pixel = 3;
    params.width = width;
    params.height = height;

    ChunkEncoder<> encoder;
    auto encoded = encoder.encode(input, 7, params);
    ASSERT_TRUE(encoded.is_ok());
    EXPECT_EQ(encoded.value().index, 7u);
    EXPECT_EQ(encoded.value().uncompressed_size, input.size());

    ChunkDecoder<> decoder;
    auto decoded = decoder.decode(encoded.value().data, input.size(), params);
    ASSERT_TRUE(decoded.is_ok());
    ASSERT_EQ(decoded.value().size(), input.size());
    EXPECT_TRUE(std::equal(decoded.value().begin(), decoded.value().end(), input.begin()));
}

TEST(ChunkEncoder, EmptyChunkIsInvalid) {
    ChunkCodingParams params;
    ChunkEncoder<> encoder;
    std::vector<std::byte> empty;
    auto encoded = encoder.encode(empty, 0, params);
    ASSERT_TRUE(encoded.is_error());
    EXPECT_EQ(encoded.error().code, Error::Code::InvalidFormat);
}
