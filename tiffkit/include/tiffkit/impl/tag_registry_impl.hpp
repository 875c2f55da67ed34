#pragma once

#ifndef TIFFKIT_TAG_REGISTRY_HEADER
#include "../tag_registry.hpp" // for linters
#endif

namespace tiffkit {
namespace tag_registry {
namespace detail {

constexpr TagInfo entry(TagCode code, std::string_view name, uint32_t types,
                        Cardinality cardinality, bool required = false,
                        std::optional<uint32_t> default_value = std::nullopt,
                        uint32_t fixed_count = 0) noexcept {
    return TagInfo{static_cast<uint16_t>(code), name, types, cardinality,
                   fixed_count, required, default_value, true};
}

inline constexpr std::array tag_table = {
    entry(TagCode::NewSubfileType, "NewSubfileType", long_only, Cardinality::One, false, 0u),
    entry(TagCode::SubfileType, "SubfileType", short_only, Cardinality::One),
    entry(TagCode::ImageWidth, "ImageWidth", short_or_long, Cardinality::One, true),
    entry(TagCode::ImageLength, "ImageLength", short_or_long, Cardinality::One, true),
    entry(TagCode::BitsPerSample, "BitsPerSample", short_only, Cardinality::PerSample, false, 1u),
    entry(TagCode::Compression, "Compression", short_only, Cardinality::One, false, 1u),
    entry(TagCode::PhotometricInterpretation, "PhotometricInterpretation", short_only, Cardinality::One, true),
    entry(TagCode::Threshholding, "Threshholding", short_only, Cardinality::One, false, 1u),
    entry(TagCode::CellWidth, "CellWidth", short_only, Cardinality::One),
    entry(TagCode::CellLength, "CellLength", short_only, Cardinality::One),
    entry(TagCode::FillOrder, "FillOrder", short_only, Cardinality::One, false, 1u),
    entry(TagCode::DocumentName, "DocumentName", ascii_only, Cardinality::Any),
    entry(TagCode::ImageDescription, "ImageDescription", ascii_only, Cardinality::Any),
    entry(TagCode::Make, "Make", ascii_only, Cardinality::Any),
    entry(TagCode::Model, "Model", ascii_only, Cardinality::Any),
    entry(TagCode::StripOffsets, "StripOffsets", short_or_long, Cardinality::PerChunk),
    entry(TagCode::Orientation, "Orientation", short_only, Cardinality::One, false, 1u),
    entry(TagCode::SamplesPerPixel, "SamplesPerPixel", short_only, Cardinality::One, false, 1u),
    entry(TagCode::RowsPerStrip, "RowsPerStrip", short_or_long, Cardinality::One, false, 0xFFFFFFFFu),
    entry(TagCode::StripByteCounts, "StripByteCounts", short_or_long, Cardinality::PerChunk),
    entry(TagCode::MinSampleValue, "MinSampleValue", short_only, Cardinality::PerSample, false, 0u),
    entry(TagCode::MaxSampleValue, "MaxSampleValue", short_only, Cardinality::PerSample),
    entry(TagCode::XResolution, "XResolution", rational_only, Cardinality::One),
    entry(TagCode::YResolution, "YResolution", rational_only, Cardinality::One),
    entry(TagCode::PlanarConfiguration, "PlanarConfiguration", short_only, Cardinality::One, false, 1u),
    entry(TagCode::PageName, "PageName", ascii_only, Cardinality::Any),
    entry(TagCode::XPosition, "XPosition", rational_only, Cardinality::One),
    entry(TagCode::YPosition, "YPosition", rational_only, Cardinality::One),
    entry(TagCode::FreeOffsets, "FreeOffsets", long_only, Cardinality::Any),
    entry(TagCode::FreeByteCounts, "FreeByteCounts", long_only, Cardinality::Any),
    entry(TagCode::GrayResponseUnit, "GrayResponseUnit", short_only, Cardinality::One, false, 2u),
    entry(TagCode::GrayResponseCurve, "GrayResponseCurve", short_only, Cardinality::Any),
    entry(TagCode::T4Options, "T4Options", long_only, Cardinality::One, false, 0u),
    entry(TagCode::T6Options, "T6Options", long_only, Cardinality::One, false, 0u),
    entry(TagCode::ResolutionUnit, "ResolutionUnit", short_only, Cardinality::One, false, 2u),
    entry(TagCode::PageNumber, "PageNumber", short_only, Cardinality::Fixed, false, std::nullopt, 2),
    entry(TagCode::TransferFunction, "TransferFunction", short_only, Cardinality::Any),
    entry(TagCode::Software, "Software", ascii_only, Cardinality::Any),
    entry(TagCode::DateTime, "DateTime", ascii_only, Cardinality::Fixed, false, std::nullopt, 20),
    entry(TagCode::Artist, "Artist", ascii_only, Cardinality::Any),
    entry(TagCode::HostComputer, "HostComputer", ascii_only, Cardinality::Any),
    entry(TagCode::Predictor, "Predictor", short_only, Cardinality::One, false, 1u),
    entry(TagCode::WhitePoint, "WhitePoint", rational_only, Cardinality::Fixed, false, std::nullopt, 2),
    entry(TagCode::PrimaryChromaticities, "PrimaryChromaticities", rational_only, Cardinality::Fixed, false, std::nullopt, 6),
    entry(TagCode::ColorMap, "ColorMap", short_only, Cardinality::Any),
    entry(TagCode::HalftoneHints, "HalftoneHints", short_only, Cardinality::Fixed, false, std::nullopt, 2),
    entry(TagCode::TileWidth, "TileWidth", short_or_long, Cardinality::One),
    entry(TagCode::TileLength, "TileLength", short_or_long, Cardinality::One),
    entry(TagCode::TileOffsets, "TileOffsets", long_only, Cardinality::PerChunk),
    entry(TagCode::TileByteCounts, "TileByteCounts", short_or_long, Cardinality::PerChunk),
    entry(TagCode::SubIFDs, "SubIFDs", long_only, Cardinality::Any),
    entry(TagCode::InkSet, "InkSet", short_only, Cardinality::One, false, 1u),
    entry(TagCode::InkNames, "InkNames", ascii_only, Cardinality::Any),
    entry(TagCode::NumberOfInks, "NumberOfInks", short_only, Cardinality::One, false, 4u),
    entry(TagCode::DotRange, "DotRange", unsigned_types, Cardinality::Any),
    entry(TagCode::TargetPrinter, "TargetPrinter", ascii_only, Cardinality::Any),
    entry(TagCode::ExtraSamples, "ExtraSamples", short_only, Cardinality::Any),
    entry(TagCode::SampleFormat, "SampleFormat", short_only, Cardinality::PerSample, false, 1u),
    entry(TagCode::SMinSampleValue, "SMinSampleValue", any_type, Cardinality::PerSample),
    entry(TagCode::SMaxSampleValue, "SMaxSampleValue", any_type, Cardinality::PerSample),
    entry(TagCode::TransferRange, "TransferRange", short_only, Cardinality::Fixed, false, std::nullopt, 6),
    entry(TagCode::JPEGTables, "JPEGTables", bytes_only, Cardinality::Any),
    entry(TagCode::JPEGProc, "JPEGProc", short_only, Cardinality::One),
    entry(TagCode::JPEGInterchangeFormat, "JPEGInterchangeFormat", long_only, Cardinality::One),
    entry(TagCode::JPEGInterchangeFormatLength, "JPEGInterchangeFormatLength", long_only, Cardinality::One),
    entry(TagCode::YCbCrCoefficients, "YCbCrCoefficients", rational_only, Cardinality::Fixed, false, std::nullopt, 3),
    entry(TagCode::YCbCrSubSampling, "YCbCrSubSampling", short_only, Cardinality::Fixed, false, 2u, 2),
    entry(TagCode::YCbCrPositioning, "YCbCrPositioning", short_only, Cardinality::One, false, 1u),
    entry(TagCode::ReferenceBlackWhite, "ReferenceBlackWhite", rational_only, Cardinality::Fixed, false, std::nullopt, 6),
    entry(TagCode::XMLPacket, "XMLPacket", bytes_only, Cardinality::Any),
    entry(TagCode::Copyright, "Copyright", ascii_only, Cardinality::Any),
    entry(TagCode::IPTC, "IPTC", bytes_only | long_only, Cardinality::Any),
    entry(TagCode::Photoshop, "Photoshop", bytes_only, Cardinality::Any),
    entry(TagCode::ExifIFD, "ExifIFD", long_only, Cardinality::One),
    entry(TagCode::InterColorProfile, "InterColorProfile", bytes_only, Cardinality::Any),
    entry(TagCode::GPSIFD, "GPSIFD", long_only, Cardinality::One),
};

consteval bool table_is_sorted() {
    for (std::size_t i = 1; i < tag_table.size(); ++i) {
        if (tag_table[i - 1].code >= tag_table[i].code) {
            return false;
        }
    }
    return true;
}

static_assert(table_is_sorted(), "Tag table must be sorted by code without duplicates");

} // namespace detail

constexpr TagInfo lookup(uint16_t code) noexcept {
    // Binary search over the sorted table
    std::size_t lo = 0;
    std::size_t hi = detail::tag_table.size();
    while (lo < hi) {
        std::size_t mid = lo + (hi - lo) / 2;
        const auto& info = detail::tag_table[mid];
        if (info.code == code) {
            return info;
        }
        if (info.code < code) {
            lo = mid + 1;
        } else {
            hi = mid;
        }
    }
    return TagInfo{code, "Unknown", any_type, Cardinality::Any, 0, false, std::nullopt, false};
}

constexpr std::size_t size() noexcept {
    return detail::tag_table.size();
}

} // namespace tag_registry
} // namespace tiffkit
