#include <benchmark/benchmark.h>
#include <algorithm>
#include <cstdint>
#include <filesystem>
#include <random>
#include <string>
#include <vector>

#include "../tiffkit/include/tiffkit/tiffkit.hpp"
#ifdef HAVE_LIBTIFF
#include <tiffio.h>
#endif

namespace fs = std::filesystem;

using namespace tiffkit;

namespace {

// ============================================================================
// Helpers
// ============================================================================

/// Compression index used in benchmark arguments
CompressionScheme compression_arg(int64_t index) {
    switch (index) {
        case 1: return CompressionScheme::PackBits;
        case 2: return CompressionScheme::LZW;
#ifdef TIFFKIT_HAVE_ZSTD
        case 3: return CompressionScheme::ZSTD;
#endif
        default: return CompressionScheme::None;
    }
}

/// Gradient with some noise, compresses like a natural image
Image make_image(uint32_t width, uint32_t height, uint16_t channels) {
    Image image;
    image.width = width;
    image.height = height;
    image.samples_per_pixel = channels;
    image.bits_per_sample.assign(channels, 8);
    image.photometric = channels >= 3 ? PhotometricInterpretation::RGB : PhotometricInterpretation::BlackIsZero;
    if (channels > 3) {
        image.extra_samples.assign(channels - 3, static_cast<uint16_t>(ExtraSamples::Unspecified));
    }

    std::mt19937 rng(42);
    std::vector<uint8_t> samples(static_cast<std::size_t>(width) * height * channels);
    std::size_t i = 0;
    for (uint32_t y = 0; y < height; ++y) {
        for (uint32_t x = 0; x < width; ++x) {
            for (uint16_t c = 0; c < channels; ++c) {
                samples[i++] = static_cast<uint8_t>((x + y + c * 40) / 4 + (rng() & 0x3));
            }
        }
    }
    image.data = std::move(samples);
    return image;
}

/// Temporary file removed with the object
class TempFile {
public:
    explicit TempFile(const std::string& name)
        : path_(fs::temp_directory_path() / ("tiffkit_bench_" + name + ".tif")) {}
    ~TempFile() {
        std::error_code ec;
        fs::remove(path_, ec);
    }
    TempFile(const TempFile&) = delete;
    TempFile& operator=(const TempFile&) = delete;

    [[nodiscard]] const fs::path& path() const noexcept { return path_; }

private:
    fs::path path_;
};

std::vector<std::byte> encode(const Image& image, const WriteOptions& options) {
    TiffWriter<> writer;
    auto bytes = writer.write(image, options);
    if (!bytes) {
        return {};
    }
    return std::move(bytes.value());
}

WriteOptions options_for(int64_t compression, bool tiled) {
    WriteOptions options;
    options.compression = compression_arg(compression);
    if (options.compression != CompressionScheme::None) {
        options.predictor = Predictor::Horizontal;
    }
    if (tiled) {
        options.tile_width = 256;
        options.tile_length = 256;
    }
    return options;
}

} // namespace

// ============================================================================
// Codec Benchmarks
// ============================================================================

// Params: compression
static void BM_Codec_Compress(benchmark::State& state) {
    Image image = make_image(1024, 1024, 1);
    const auto& samples = *image.as_u8();
    std::span<const std::byte> input(reinterpret_cast<const std::byte*>(samples.data()), samples.size());
    CompressorStorage<StandardCompressors> compressor;
    const CompressionScheme scheme = compression_arg(state.range(0));

    for (auto _ : state) {
        std::vector<std::byte> output;
        auto written = compressor.compress(output, 0, input, scheme);
        if (!written) {
            state.SkipWithError(("Compression failed: " + written.error().message).c_str());
            return;
        }
        benchmark::DoNotOptimize(output.data());
    }
    state.SetBytesProcessed(state.iterations() * static_cast<int64_t>(input.size()));
}

// Params: compression
static void BM_Codec_Decompress(benchmark::State& state) {
    Image image = make_image(1024, 1024, 1);
    const auto& samples = *image.as_u8();
    std::span<const std::byte> input(reinterpret_cast<const std::byte*>(samples.data()), samples.size());
    CompressorStorage<StandardCompressors> compressor;
    DecompressorStorage<StandardDecompressors> decompressor;
    const CompressionScheme scheme = compression_arg(state.range(0));

    std::vector<std::byte> compressed;
    auto written = compressor.compress(compressed, 0, input, scheme);
    if (!written) {
        state.SkipWithError(("Compression failed: " + written.error().message).c_str());
        return;
    }
    compressed.resize(written.value());

    std::vector<std::byte> output(input.size());
    for (auto _ : state) {
        auto size = decompressor.decompress(output, compressed, scheme);
        if (!size) {
            state.SkipWithError(("Decompression failed: " + size.error().message).c_str());
            return;
        }
        benchmark::DoNotOptimize(output.data());
    }
    state.SetBytesProcessed(state.iterations() * static_cast<int64_t>(input.size()));
}

// ============================================================================
// Metadata Benchmarks
// ============================================================================

static void BM_Metadata_ParseIFD(benchmark::State& state) {
    IFDBuilder extra;
    if (!extra.add_ascii(TagCode::ImageDescription, "benchmark image") ||
        !extra.add_rational(TagCode::XResolution, Rational{300, 1}) ||
        !extra.add_rational(TagCode::YResolution, Rational{300, 1}) ||
        !extra.add_short(TagCode::ResolutionUnit, 2)) {
        state.SkipWithError("Failed to build extra tags");
        return;
    }
    TiffWriter<> writer;
    WriteOptions options;
    options.rows_per_strip = 1;
    auto file = writer.write(make_image(256, static_cast<uint32_t>(state.range(0)), 1), options, &extra);
    if (!file) {
        state.SkipWithError(("Write failed: " + file.error().message).c_str());
        return;
    }

    for (auto _ : state) {
        auto decoder = TiffDecoder<BufferViewReader>::open(BufferViewReader(file.value()));
        if (!decoder) {
            state.SkipWithError(("Open failed: " + decoder.error().message).c_str());
            return;
        }
        auto ifd = decoder.value().ifd();
        if (!ifd) {
            state.SkipWithError(("IFD parsing failed: " + ifd.error().message).c_str());
            return;
        }
        benchmark::DoNotOptimize(ifd.value());
    }
    state.SetItemsProcessed(state.iterations());
}

// ============================================================================
// Read Benchmarks
// ============================================================================

// Params: size, channels, compression, tiled, threads
static void BM_Read_Image(benchmark::State& state) {
    const uint32_t size = static_cast<uint32_t>(state.range(0));
    const auto channels = static_cast<uint16_t>(state.range(1));
    auto file = encode(make_image(size, size, channels), options_for(state.range(2), state.range(3) != 0));
    if (file.empty()) {
        state.SkipWithError("Failed to create the test image");
        return;
    }

    DecodeOptions options;
    options.worker_threads = static_cast<unsigned>(state.range(4));
    for (auto _ : state) {
        auto decoder = TiffDecoder<BufferViewReader>::open(BufferViewReader(file), options);
        if (!decoder) {
            state.SkipWithError(("Open failed: " + decoder.error().message).c_str());
            return;
        }
        auto image = decoder.value().image();
        if (!image) {
            state.SkipWithError(("Decode failed: " + image.error().message).c_str());
            return;
        }
        benchmark::DoNotOptimize(image.value().data);
    }
    state.SetBytesProcessed(state.iterations() * static_cast<int64_t>(size) * size * channels);
}

// Params: size, compression
static void BM_Read_File(benchmark::State& state) {
    const uint32_t size = static_cast<uint32_t>(state.range(0));
    TempFile temp("read_" + std::to_string(size) + "_" + std::to_string(state.range(1)));
    TiffWriter<> writer;
    auto written = writer.write_file(temp.path().string(), make_image(size, size, 3),
                                     options_for(state.range(1), false));
    if (!written) {
        state.SkipWithError(("Write failed: " + written.error().message).c_str());
        return;
    }

    for (auto _ : state) {
        auto reader = open_file(temp.path().string());
        if (!reader) {
            state.SkipWithError(("Open failed: " + reader.error().message).c_str());
            return;
        }
        auto decoder = TiffDecoder<StreamFileReader>::open(std::move(reader.value()));
        if (!decoder) {
            state.SkipWithError(("Open failed: " + decoder.error().message).c_str());
            return;
        }
        auto image = decoder.value().image();
        if (!image) {
            state.SkipWithError(("Decode failed: " + image.error().message).c_str());
            return;
        }
        benchmark::DoNotOptimize(image.value().data);
    }
    state.SetBytesProcessed(state.iterations() * static_cast<int64_t>(size) * size * 3);
}

#ifdef HAVE_LIBTIFF
// Params: size, compression
static void BM_LibTIFF_Read_File(benchmark::State& state) {
    const uint32_t size = static_cast<uint32_t>(state.range(0));
    TempFile temp("libtiff_read_" + std::to_string(size) + "_" + std::to_string(state.range(1)));
    TiffWriter<> writer;
    auto written = writer.write_file(temp.path().string(), make_image(size, size, 3),
                                     options_for(state.range(1), false));
    if (!written) {
        state.SkipWithError(("Write failed: " + written.error().message).c_str());
        return;
    }

    std::vector<uint8_t> buffer(static_cast<std::size_t>(size) * size * 3);
    for (auto _ : state) {
        TIFF* tif = TIFFOpen(temp.path().string().c_str(), "r");
        if (!tif) {
            state.SkipWithError("Failed to open TIFF file");
            return;
        }
        const tmsize_t strip_size = TIFFStripSize(tif);
        const tstrip_t strips = TIFFNumberOfStrips(tif);
        uint8_t* out = buffer.data();
        for (tstrip_t s = 0; s < strips; ++s) {
            const tmsize_t read = TIFFReadEncodedStrip(tif, s, out, strip_size);
            if (read < 0) {
                TIFFClose(tif);
                state.SkipWithError("Failed to read strip");
                return;
            }
            out += read;
        }
        benchmark::DoNotOptimize(buffer.data());
        TIFFClose(tif);
    }
    state.SetBytesProcessed(state.iterations() * static_cast<int64_t>(buffer.size()));
}
#endif // HAVE_LIBTIFF

// ============================================================================
// Write Benchmarks
// ============================================================================

// Params: size, channels, compression, tiled
static void BM_Write_Image(benchmark::State& state) {
    const uint32_t size = static_cast<uint32_t>(state.range(0));
    const auto channels = static_cast<uint16_t>(state.range(1));
    Image image = make_image(size, size, channels);
    const WriteOptions options = options_for(state.range(2), state.range(3) != 0);
    TiffWriter<> writer;

    for (auto _ : state) {
        auto bytes = writer.write(image, options);
        if (!bytes) {
            state.SkipWithError(("Write failed: " + bytes.error().message).c_str());
            return;
        }
        benchmark::DoNotOptimize(bytes.value().data());
    }
    state.SetBytesProcessed(state.iterations() * static_cast<int64_t>(size) * size * channels);
}

#ifdef HAVE_LIBTIFF
// Params: size, compression
static void BM_LibTIFF_Write_File(benchmark::State& state) {
    const uint32_t size = static_cast<uint32_t>(state.range(0));
    Image image = make_image(size, size, 3);
    const auto& samples = *image.as_u8();
    TempFile temp("libtiff_write_" + std::to_string(size));
    const uint16_t compression = static_cast<uint16_t>(compression_arg(state.range(1)));

    for (auto _ : state) {
        TIFF* tif = TIFFOpen(temp.path().string().c_str(), "w");
        if (!tif) {
            state.SkipWithError("Failed to create TIFF file");
            return;
        }
        TIFFSetField(tif, TIFFTAG_IMAGEWIDTH, size);
        TIFFSetField(tif, TIFFTAG_IMAGELENGTH, size);
        TIFFSetField(tif, TIFFTAG_SAMPLESPERPIXEL, 3);
        TIFFSetField(tif, TIFFTAG_BITSPERSAMPLE, 8);
        TIFFSetField(tif, TIFFTAG_PHOTOMETRIC, PHOTOMETRIC_RGB);
        TIFFSetField(tif, TIFFTAG_PLANARCONFIG, PLANARCONFIG_CONTIG);
        TIFFSetField(tif, TIFFTAG_COMPRESSION, compression);
        if (compression != COMPRESSION_NONE) {
            TIFFSetField(tif, TIFFTAG_PREDICTOR, PREDICTOR_HORIZONTAL);
        }
        const uint32_t rows = std::max<uint32_t>(1, 8192 / (size * 3));
        TIFFSetField(tif, TIFFTAG_ROWSPERSTRIP, rows);
        for (uint32_t y = 0; y < size; ++y) {
            auto* row = const_cast<uint8_t*>(samples.data()) + static_cast<std::size_t>(y) * size * 3;
            if (TIFFWriteScanline(tif, row, y, 0) < 0) {
                TIFFClose(tif);
                state.SkipWithError("Failed to write scanline");
                return;
            }
        }
        TIFFClose(tif);
    }
    state.SetBytesProcessed(state.iterations() * static_cast<int64_t>(samples.size()));
}
#endif // HAVE_LIBTIFF

// ============================================================================
// Registration
// ============================================================================

// Params: compression (0 None, 1 PackBits, 2 LZW, 3 ZSTD)
BENCHMARK(BM_Codec_Compress)
    ->Arg(1)
    ->Arg(2)
#ifdef TIFFKIT_HAVE_ZSTD
    ->Arg(3)
#endif
    ->Name("TiffKit/Codec/Compress")
    ->Unit(benchmark::kMillisecond);

BENCHMARK(BM_Codec_Decompress)
    ->Arg(1)
    ->Arg(2)
#ifdef TIFFKIT_HAVE_ZSTD
    ->Arg(3)
#endif
    ->Name("TiffKit/Codec/Decompress")
    ->Unit(benchmark::kMillisecond);

// Params: rows, one strip per row
BENCHMARK(BM_Metadata_ParseIFD)
    ->Arg(16)
    ->Arg(1024)
    ->Name("TiffKit/Metadata/ParseIFD")
    ->Unit(benchmark::kMicrosecond);

// Params: size, channels, compression, tiled, threads
BENCHMARK(BM_Read_Image)
    ->Args({512, 1, 0, 0, 1})
    ->Args({512, 3, 0, 0, 1})
    ->Args({512, 3, 2, 0, 1})
    ->Args({2048, 3, 2, 0, 1})
    ->Args({2048, 3, 2, 0, 4})
    ->Args({2048, 3, 2, 1, 1})
    ->Args({2048, 3, 2, 1, 4})
    ->Args({2048, 4, 1, 1, 4})
    ->Name("TiffKit/Read/Image")
    ->Unit(benchmark::kMillisecond);

// Params: size, compression
BENCHMARK(BM_Read_File)
    ->Args({1024, 0})
    ->Args({1024, 2})
    ->Name("TiffKit/Read/File")
    ->Unit(benchmark::kMillisecond);

#ifdef HAVE_LIBTIFF
BENCHMARK(BM_LibTIFF_Read_File)
    ->Args({1024, 0})
    ->Args({1024, 2})
    ->Name("LibTIFF/Read/File")
    ->Unit(benchmark::kMillisecond);
#endif // HAVE_LIBTIFF

// Params: size, channels, compression, tiled
BENCHMARK(BM_Write_Image)
    ->Args({512, 3, 0, 0})
    ->Args({512, 3, 1, 0})
    ->Args({512, 3, 2, 0})
    ->Args({2048, 3, 2, 0})
    ->Args({2048, 3, 2, 1})
    ->Name("TiffKit/Write/Image")
    ->Unit(benchmark::kMillisecond);

#ifdef HAVE_LIBTIFF
BENCHMARK(BM_LibTIFF_Write_File)
    ->Args({512, 0})
    ->Args({512, 2})
    ->Args({2048, 2})
    ->Name("LibTIFF/Write/File")
    ->Unit(benchmark::kMillisecond);
#endif // HAVE_LIBTIFF

BENCHMARK_MAIN();
