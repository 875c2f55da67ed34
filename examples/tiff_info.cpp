// Print the directories of a TIFF file and optionally re-encode its first image.
//
// Usage: tiff_info <file.tif> [--decode] [--copy <out.tif>] [--threads N] [--verbose]

#include <cstdint>
#include <cstdlib>
#include <string>
#include <string_view>

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include "../tiffkit/include/tiffkit/tiffkit.hpp"

using namespace tiffkit;

namespace {

struct Arguments {
    std::string input;
    std::string copy;
    bool decode = false;
    unsigned threads = 1;
    bool verbose = false;
};

bool parse_arguments(int argc, char** argv, Arguments& args) {
    for (int i = 1; i < argc; ++i) {
        const std::string_view arg = argv[i];
        if (arg == "--decode") {
            args.decode = true;
        } else if (arg == "--copy" && i + 1 < argc) {
            args.copy = argv[++i];
        } else if (arg == "--threads" && i + 1 < argc) {
            args.threads = static_cast<unsigned>(std::strtoul(argv[++i], nullptr, 10));
        } else if (arg == "--verbose") {
            args.verbose = true;
        } else if (args.input.empty() && !arg.starts_with("--")) {
            args.input = arg;
        } else {
            return false;
        }
    }
    return !args.input.empty();
}

/// Short rendering of a tag value, long arrays are elided
std::string describe(const ResolvedValue& value) {
    if (auto text = value.as_string()) {
        return fmt::format("\"{}\"", text.value());
    }
    auto numbers = value.as_double_array();
    if (!numbers) {
        return fmt::format("<{}>", numbers.error().message);
    }
    constexpr std::size_t shown = 8;
    std::string out;
    for (std::size_t i = 0; i < numbers.value().size() && i < shown; ++i) {
        if (i != 0) {
            out += ", ";
        }
        out += fmt::format("{}", numbers.value()[i]);
    }
    if (numbers.value().size() > shown) {
        out += fmt::format(", ... ({} values)", numbers.value().size());
    }
    return out;
}

void print_directory(TiffDecoder<StreamFileReader>& decoder, std::size_t index, const IFD& ifd) {
    fmt::print("IFD #{} at offset {} ({} entries)\n", index, ifd.offset(), ifd.size());
    for (const TagEntry& entry : ifd.entries()) {
        auto value = decoder.get_value(ifd, entry.code);
        fmt::print("  {:5} {:<28} type {:2} count {:6}  {}\n",
                   entry.code, tag_registry::tag_name(entry.code), entry.raw_type, entry.count,
                   value ? describe(value.value()) : fmt::format("<{}>", value.error().message));
    }
    for (const Diagnostic& diagnostic : ifd.diagnostics()) {
        fmt::print("  warning: tag {}: {}\n", diagnostic.tag, diagnostic.message);
    }
}

} // namespace

int main(int argc, char** argv) {
    Arguments args;
    if (!parse_arguments(argc, argv, args)) {
        fmt::print(stderr, "Usage: {} <file.tif> [--decode] [--copy <out.tif>] [--threads N] [--verbose]\n",
                   argc > 0 ? argv[0] : "tiff_info");
        return 2;
    }
    if (args.verbose) {
        logger()->set_level(spdlog::level::debug);
    }

    auto reader = open_file(args.input);
    if (!reader) {
        spdlog::error("Cannot open {}: {}", args.input, reader.error().message);
        return 1;
    }

    DecodeOptions options;
    options.worker_threads = args.threads;
    auto decoder = TiffDecoder<StreamFileReader>::open(std::move(reader.value()), options);
    if (!decoder) {
        spdlog::error("{}: {} ({})", args.input, decoder.error().message, to_string(decoder.error().code));
        return 1;
    }

    const TiffHeader& header = decoder.value().header();
    fmt::print("{}: {} endian, first IFD at {}\n", args.input,
               header.byte_order == std::endian::little ? "little" : "big", header.first_ifd_offset);

    auto count = decoder.value().ifd_count();
    if (!count) {
        spdlog::error("{}: {}", args.input, count.error().message);
        return 1;
    }
    for (std::size_t i = 0; i < count.value(); ++i) {
        auto ifd = decoder.value().ifd_at(i);
        if (!ifd) {
            spdlog::error("IFD #{}: {}", i, ifd.error().message);
            return 1;
        }
        print_directory(decoder.value(), i, *ifd.value());
    }

    if (!args.decode && args.copy.empty()) {
        return 0;
    }

    auto image = decoder.value().image();
    if (!image) {
        spdlog::error("Decoding failed: {} ({})", image.error().message, to_string(image.error().code));
        return 1;
    }
    fmt::print("Decoded {}x{}, {} samples per pixel, {} bytes per sample\n",
               image.value().width, image.value().height, image.value().samples_per_pixel,
               image.value().bytes_per_sample());

    if (!args.copy.empty()) {
        WriteOptions write_options;
        write_options.compression = CompressionScheme::LZW;
        TiffWriter<> writer;
        auto written = writer.write_file(args.copy, image.value(), write_options);
        if (!written) {
            spdlog::error("Cannot write {}: {}", args.copy, written.error().message);
            return 1;
        }
        fmt::print("Wrote {}\n", args.copy);
    }
    return 0;
}
