#pragma once

/// Main header for the tiffkit codec
///
/// tiffkit decodes classic TIFF files into interleaved 8 or 16-bit sample
/// buffers and encodes such buffers back into TIFF files.
///
/// Key features:
/// - No exceptions: uses Result<T> for error handling
/// - Strips and tiles, chunky and planar layouts, 1 to 16 bits per sample
/// - None, PackBits, LZW and (when built with zstd) ZSTD compression
/// - Horizontal predictor and FillOrder 2
/// - Palette expansion, optional CMYK/YCbCr/WhiteIsZero conversion
/// - Multi-threaded chunk decoding
///
/// Example usage:
/// ```cpp
/// #include <tiffkit/tiffkit.hpp>
///
/// auto reader = tiffkit::open_file("scan.tif");
/// if (!reader) {
///     // Handle error
/// }
/// auto decoder = tiffkit::TiffDecoder<tiffkit::StreamFileReader>::open(std::move(reader.value()));
/// auto image = decoder.value().image();
///
/// tiffkit::WriteOptions options;
/// options.compression = tiffkit::CompressionScheme::LZW;
/// tiffkit::TiffWriter<> writer;
/// auto written = writer.write_file("copy.tif", image.value(), options);
/// ```

#include "types/result.hpp"
#include "logging.hpp"
#include "types.hpp"
#include "reader_base.hpp"
#include "readers/reader_buffer.hpp"
#include "readers/reader_stream.hpp"
#include "byte_cursor.hpp"
#include "tag_registry.hpp"
#include "ifd.hpp"
#include "resolved_value.hpp"
#include "parsing.hpp"
#include "image_shape.hpp"
#include "tiling.hpp"
#include "decoder.hpp"
#include "encoder.hpp"
#include "image.hpp"
#include "pixel_assembler.hpp"
#include "worker_pool.hpp"
#include "tiff_decoder.hpp"
#include "ifd_builder.hpp"
#include "tiff_writer.hpp"
