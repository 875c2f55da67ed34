#include <gtest/gtest.h>
#include <atomic>
#include <cstdint>
#include <random>
#include <vector>

#include "../tiffkit/include/tiffkit/tiffkit.hpp"

using namespace tiffkit;

// ============================================================================
// Helper Functions
// ============================================================================

Image rgb_image(uint32_t width, uint32_t height, uint64_t seed) {
    Image image;
    image.width = width;
    image.height = height;
    image.samples_per_pixel = 3;
    image.bits_per_sample = {8, 8, 8};
    image.photometric = PhotometricInterpretation::RGB;

    std::mt19937_64 rng(seed);
    std::vector<uint8_t> samples(static_cast<std::size_t>(width) * height * 3);
    for (std::size_t i = 0; i < samples.size(); ++i) {
        // Smooth gradient with noise so LZW has something to work on
        samples[i] = static_cast<uint8_t>((i / 3) % 251 + (rng() & 0x7));
    }
    image.data = std::move(samples);
    return image;
}

std::vector<std::byte> encode(const Image& image, const WriteOptions& options) {
    TiffWriter<> writer;
    auto bytes = writer.write(image, options);
    EXPECT_TRUE(bytes.is_ok());
    return bytes.is_ok() ? std::move(bytes.value()) : std::vector<std::byte>{};
}

Result<Image> decode(const std::vector<std::byte>& file, unsigned threads) {
    DecodeOptions options;
    options.worker_threads = threads;
    auto decoder = TiffDecoder<BufferViewReader>::open(BufferViewReader(file), options);
    if (!decoder) {
        return decoder.error();
    }
    return decoder.value().image();
}

// ============================================================================
// Parallel decoding
// ============================================================================

TEST(ParallelDecode, StripsMatchSerial) {
    WriteOptions options;
    options.compression = CompressionScheme::LZW;
    options.predictor = Predictor::Horizontal;
    options.rows_per_strip = 7;
    auto file = encode(rgb_image(150, 200, 1), options);

    auto serial = decode(file, 1);
    ASSERT_TRUE(serial.is_ok());
    for (unsigned threads : {2u, 4u, 0u}) {
        auto parallel = decode(file, threads);
        ASSERT_TRUE(parallel.is_ok()) << threads;
        EXPECT_EQ(parallel.value(), serial.value()) << threads;
    }
}

TEST(ParallelDecode, PlanarTilesMatchSerial) {
    WriteOptions options;
    options.compression = CompressionScheme::PackBits;
    options.planar = PlanarConfiguration::Planar;
    options.tile_width = 32;
    options.tile_length = 16;
    auto file = encode(rgb_image(100, 90, 2), options);

    auto serial = decode(file, 1);
    ASSERT_TRUE(serial.is_ok());
    auto parallel = decode(file, 4);
    ASSERT_TRUE(parallel.is_ok());
    EXPECT_EQ(parallel.value(), serial.value());
}

TEST(ParallelDecode, CorruptChunkFailsWholeImage) {
    WriteOptions options;
    options.compression = CompressionScheme::LZW;
    options.rows_per_strip = 4;
    auto file = encode(rgb_image(64, 64, 3), options);

    // Strip data starts right after the header; a code beyond the table
    // breaks the first strip
    ASSERT_GT(file.size(), 16u);
    file[8] = std::byte{0x80};
    file[9] = std::byte{0x7F};
    file[10] = std::byte{0xC0};

    auto serial = decode(file, 1);
    ASSERT_TRUE(serial.is_error());
    auto parallel = decode(file, 4);
    ASSERT_TRUE(parallel.is_error());
    EXPECT_EQ(parallel.error().code, serial.error().code);
}

// ============================================================================
// WorkerPool
// ============================================================================

TEST(WorkerPool, CoversEveryIndexOnce) {
    WorkerPool pool(4);
    EXPECT_EQ(pool.concurrency(), 4u);

    std::vector<std::atomic<int>> visits(1000);
    auto result = pool.run(visits.size(), [&](std::size_t begin, std::size_t end,
                                              const std::atomic<bool>&) -> Result<void> {
        for (std::size_t i = begin; i < end; ++i) {
            visits[i].fetch_add(1, std::memory_order_relaxed);
        }
        return Ok();
    });
    ASSERT_TRUE(result.is_ok());
    for (const auto& v : visits) {
        EXPECT_EQ(v.load(), 1);
    }
}

TEST(WorkerPool, FewerIndicesThanThreads) {
    WorkerPool pool(8);
    std::atomic<int> total{0};
    auto result = pool.run(3, [&](std::size_t begin, std::size_t end, const std::atomic<bool>&) -> Result<void> {
        total.fetch_add(static_cast<int>(end - begin));
        return Ok();
    });
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(total.load(), 3);
}

TEST(WorkerPool, EmptyJob) {
    WorkerPool pool(2);
    bool called = false;
    auto result = pool.run(0, [&](std::size_t, std::size_t, const std::atomic<bool>&) -> Result<void> {
        called = true;
        return Ok();
    });
    EXPECT_TRUE(result.is_ok());
    EXPECT_FALSE(called);
}

TEST(WorkerPool, ErrorIsReturned) {
    WorkerPool pool(4);
    auto result = pool.run(400, [](std::size_t begin, std::size_t end, const std::atomic<bool>& stop) -> Result<void> {
        for (std::size_t i = begin; i < end; ++i) {
            if (stop.load()) {
                return Ok();
            }
            if (i == 250) {
                return Err(Error::Code::CodecError, "chunk 250 is corrupt");
            }
        }
        return Ok();
    });
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code, Error::Code::CodecError);
    EXPECT_EQ(result.error().message, "chunk 250 is corrupt");
}

TEST(WorkerPool, ReusableAfterError) {
    WorkerPool pool(3);
    auto failed = pool.run(10, [](std::size_t, std::size_t, const std::atomic<bool>&) -> Result<void> {
        return Err(Error::Code::ReadError, "read failed");
    });
    ASSERT_TRUE(failed.is_error());
    EXPECT_EQ(failed.error().code, Error::Code::ReadError);

    std::atomic<int> total{0};
    auto ok = pool.run(10, [&](std::size_t begin, std::size_t end, const std::atomic<bool>&) -> Result<void> {
        total.fetch_add(static_cast<int>(end - begin));
        return Ok();
    });
    ASSERT_TRUE(ok.is_ok());
    EXPECT_EQ(total.load(), 10);
}

TEST(WorkerPool, SingleThreadRunsInline) {
    WorkerPool pool(1);
    EXPECT_EQ(pool.concurrency(), 1u);
    std::size_t calls = 0;
    auto result = pool.run(50, [&](std::size_t begin, std::size_t end, const std::atomic<bool>&) -> Result<void> {
        ++calls;
        EXPECT_EQ(begin, 0u);
        EXPECT_EQ(end, 50u);
        return Ok();
    });
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(calls, 1u);
}
