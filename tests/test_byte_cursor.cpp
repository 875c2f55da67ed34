#include <gtest/gtest.h>
#include <array>
#include <bit>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <initializer_list>
#include <limits>
#include <thread>
#include <vector>

#include "../tiffkit/include/tiffkit/byte_cursor.hpp"
#include "../tiffkit/include/tiffkit/readers/reader_buffer.hpp"
#include "../tiffkit/include/tiffkit/readers/reader_stream.hpp"

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

// ============================================================================
// Scalar reads
// ============================================================================

TEST(ByteCursor, LittleEndianScalars) {
    auto data = bytes_of({0x34, 0x12, 0x78, 0x56, 0x34, 0x12, 0xFF, 0xFE});
    BufferViewReader reader(data);
    auto cursor = ByteCursor<BufferViewReader>::create(reader, std::endian::little);
    ASSERT_TRUE(cursor.is_ok());

    EXPECT_EQ(cursor.value().read_u8(0).value(), 0x34);
    EXPECT_EQ(cursor.value().read_u16(0).value(), 0x1234);
    EXPECT_EQ(cursor.value().read_u32(2).value(), 0x12345678u);
    EXPECT_EQ(cursor.value().read_i8(6).value(), -1);
    EXPECT_EQ(cursor.value().read_i16(6).value(), static_cast<int16_t>(0xFEFF));
}

TEST(ByteCursor, BigEndianScalars) {
    auto data = bytes_of({0x12, 0x34, 0x12, 0x34, 0x56, 0x78});
    BufferViewReader reader(data);
    auto cursor = ByteCursor<BufferViewReader>::create(reader, std::endian::big);
    ASSERT_TRUE(cursor.is_ok());

    EXPECT_EQ(cursor.value().byte_order(), std::endian::big);
    EXPECT_EQ(cursor.value().read_u16(0).value(), 0x1234);
    EXPECT_EQ(cursor.value().read_u32(2).value(), 0x12345678u);
    EXPECT_EQ(cursor.value().read_i32(2).value(), 0x12345678);
}

TEST(ByteCursor, FloatingPoint) {
    std::vector<std::byte> data(12);
    const float f = 1.5f;
    const double d = -2.25;
    std::memcpy(data.data(), &f, 4);
    std::memcpy(data.data() + 4, &d, 8);

    BufferViewReader reader(data);
    auto cursor = ByteCursor<BufferViewReader>::create(reader, std::endian::native);
    ASSERT_TRUE(cursor.is_ok());
    EXPECT_FLOAT_EQ(cursor.value().read_f32(0).value(), 1.5f);
    EXPECT_DOUBLE_EQ(cursor.value().read_f64(4).value(), -2.25);
}

TEST(ByteCursor, Rationals) {
    auto data = bytes_of({0x2C, 0x01, 0x00, 0x00, 0x01, 0x00, 0x00, 0x00,
                          0xFF, 0xFF, 0xFF, 0xFF, 0x02, 0x00, 0x00, 0x00});
    BufferViewReader reader(data);
    auto cursor = ByteCursor<BufferViewReader>::create(reader, std::endian::little);
    ASSERT_TRUE(cursor.is_ok());

    auto rational = cursor.value().read_rational(0);
    ASSERT_TRUE(rational.is_ok());
    EXPECT_EQ(rational.value().numerator, 300u);
    EXPECT_EQ(rational.value().denominator, 1u);

    auto srational = cursor.value().read_srational(8);
    ASSERT_TRUE(srational.is_ok());
    EXPECT_EQ(srational.value().numerator, -1);
    EXPECT_EQ(srational.value().denominator, 2);
    EXPECT_DOUBLE_EQ(srational.value().to_double(), -0.5);
}

// ============================================================================
// Bounds
// ============================================================================

TEST(ByteCursor, OffsetAtEndIsOutOfRange) {
    auto data = bytes_of({1, 2, 3, 4});
    BufferViewReader reader(data);
    auto cursor = ByteCursor<BufferViewReader>::create(reader, std::endian::little);
    ASSERT_TRUE(cursor.is_ok());

    auto at_end = cursor.value().read_u8(4);
    ASSERT_TRUE(at_end.is_error());
    EXPECT_EQ(at_end.error().code, Error::Code::OutOfRange);
    EXPECT_EQ(at_end.error().offset.value_or(0), 4u);

    auto far = cursor.value().read_u32(1000);
    ASSERT_TRUE(far.is_error());
    EXPECT_EQ(far.error().code, Error::Code::OutOfRange);
}

TEST(ByteCursor, SpanPastEndIsUnexpectedEof) {
    auto data = bytes_of({1, 2, 3, 4});
    BufferViewReader reader(data);
    auto cursor = ByteCursor<BufferViewReader>::create(reader, std::endian::little);
    ASSERT_TRUE(cursor.is_ok());

    auto partial = cursor.value().read_u32(2);
    ASSERT_TRUE(partial.is_error());
    EXPECT_EQ(partial.error().code, Error::Code::UnexpectedEof);

    auto slice = cursor.value().slice(1, 8);
    ASSERT_TRUE(slice.is_error());
    EXPECT_EQ(slice.error().code, Error::Code::UnexpectedEof);

    auto copy = cursor.value().copy(3, 2);
    ASSERT_TRUE(copy.is_error());
    EXPECT_EQ(copy.error().code, Error::Code::UnexpectedEof);
}

TEST(ByteCursor, HugeLengthDoesNotOverflow) {
    auto data = bytes_of({1, 2, 3, 4});
    BufferViewReader reader(data);
    auto cursor = ByteCursor<BufferViewReader>::create(reader, std::endian::little);
    ASSERT_TRUE(cursor.is_ok());

    auto slice = cursor.value().slice(2, std::numeric_limits<std::size_t>::max());
    ASSERT_TRUE(slice.is_error());
    EXPECT_EQ(slice.error().code, Error::Code::UnexpectedEof);
}

// ============================================================================
// Slices and copies
// ============================================================================

TEST(ByteCursor, SliceAndCopy) {
    auto data = bytes_of({10, 20, 30, 40, 50});
    BufferViewReader reader(data);
    auto cursor = ByteCursor<BufferViewReader>::create(reader, std::endian::little);
    ASSERT_TRUE(cursor.is_ok());

    auto slice = cursor.value().slice(1, 3);
    ASSERT_TRUE(slice.is_ok());
    ASSERT_EQ(slice.value().size(), 3u);
    EXPECT_EQ(slice.value().data()[0], std::byte{20});
    EXPECT_EQ(slice.value().data()[2], std::byte{40});

    auto copy = cursor.value().copy(3, 2);
    ASSERT_TRUE(copy.is_ok());
    EXPECT_EQ(copy.value(), bytes_of({40, 50}));

    auto empty = cursor.value().slice(5, 0);
    ASSERT_TRUE(empty.is_ok());
    EXPECT_TRUE(empty.value().empty());
}

TEST(ByteCursor, InvalidReaderIsRejected) {
    StreamFileReader reader;
    auto cursor = ByteCursor<StreamFileReader>::create(reader, std::endian::little);
    ASSERT_TRUE(cursor.is_error());
    EXPECT_EQ(cursor.error().code, Error::Code::ReadError);
}

TEST(StreamFileReader, RangesNearEndOfFile) {
    const auto path = std::filesystem::temp_directory_path() / "tiffkit_stream_reader_test.bin";
    {
        std::ofstream out(path, std::ios::binary);
        out.write("abcdefgh", 8);
    }

    auto reader = open_file(path.string());
    ASSERT_TRUE(reader.is_ok());
    EXPECT_EQ(reader.value().size().value(), 8u);

    auto tail = reader.value().read(6, 10);
    ASSERT_TRUE(tail.is_ok());
    ASSERT_EQ(tail.value().size(), 2u);
    EXPECT_EQ(tail.value().data()[0], std::byte{'g'});

    std::array<std::byte, 4> exact{};
    ASSERT_TRUE(reader.value().read_into(exact.data(), 4, 4).is_ok());
    EXPECT_EQ(exact[3], std::byte{'h'});

    auto past = reader.value().read_into(exact.data(), 6, 4);
    ASSERT_TRUE(past.is_error());
    EXPECT_EQ(past.error().code, Error::Code::UnexpectedEof);

    auto beyond = reader.value().read(8, 1);
    ASSERT_TRUE(beyond.is_error());
    EXPECT_EQ(beyond.error().code, Error::Code::OutOfRange);

    reader.value().close();
    std::filesystem::remove(path);
}

TEST(ByteCursor, ConcurrentReads) {
    std::vector<std::byte> data(4096);
    for (std::size_t i = 0; i < data.size(); ++i) {
        data[i] = static_cast<std::byte>(i & 0xFF);
    }
    BufferViewReader reader(data);
    auto cursor = ByteCursor<BufferViewReader>::create(reader, std::endian::little);
    ASSERT_TRUE(cursor.is_ok());
    const auto& shared = cursor.value();

    std::vector<std::thread> threads;
    std::vector<int> failures(4, 0);
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&shared, &failures, t]() {
            for (std::size_t i = static_cast<std::size_t>(t); i < 4096; i += 4) {
                auto value = shared.read_u8(i);
                if (!value || value.value() != (i & 0xFF)) {
                    ++failures[t];
                }
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    for (int f : failures) {
        EXPECT_EQ(f, 0);
    }
}
