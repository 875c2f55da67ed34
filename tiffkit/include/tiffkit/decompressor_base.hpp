#pragma once

/**
 * @file decompressor_base.hpp
 * @brief Decompressor set of ChunkDecoder, selected by the Compression tag
 *
 * Each codec is bound to the Compression values it expands with a
 * DecompressorDescriptor. A DecompressorSpec lists the bindings compiled
 * into a build, and DecompressorStorage owns one instance of every codec
 * and routes a chunk to the one bound to the image's Compression value.
 *
 * A codec fills `output` completely or fails:
 * - it never writes past output.size()
 * - malformed input yields Error::Code::CodecError, at_offset() relative
 *   to the start of the chunk (ChunkDecoder rebases it onto the file)
 */

#include <array>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <tuple>
#include <type_traits>
#include <utility>
#include "types.hpp"
#include "types/result.hpp"

namespace tiffkit {

/// A codec expanding one chunk
template <typename T>
concept ChunkDecompressor = requires(const T& codec, std::span<std::byte> output, std::span<const std::byte> input) {
    { codec.decompress(output, input) } -> std::same_as<Result<std::size_t>>;
};

/// Binds a codec to the Compression values it expands
template <ChunkDecompressor Codec, CompressionScheme... Schemes>
    requires(sizeof...(Schemes) > 0)
struct DecompressorDescriptor {
    using codec_type = Codec;
    static constexpr std::array<CompressionScheme, sizeof...(Schemes)> schemes{Schemes...};

    static constexpr bool handles(CompressionScheme scheme) noexcept {
        return ((scheme == Schemes) || ...);
    }
};

namespace codec_binding {

/// No Compression value may be bound twice
template <typename First, typename... Rest>
consteval bool disjoint() {
    if constexpr (sizeof...(Rest) == 0) {
        return true;
    } else {
        for (CompressionScheme scheme : First::schemes) {
            if ((Rest::handles(scheme) || ...)) {
                return false;
            }
        }
        return disjoint<Rest...>();
    }
}

/// Position of the binding claiming scheme, sizeof...(Bindings) if none does
template <typename... Bindings>
constexpr std::size_t slot_of(CompressionScheme scheme) noexcept {
    constexpr std::array<bool (*)(CompressionScheme) noexcept, sizeof...(Bindings)> claims{&Bindings::handles...};
    std::size_t slot = 0;
    while (slot < claims.size() && !claims[slot](scheme)) {
        ++slot;
    }
    return slot;
}

[[nodiscard]] inline Error unsupported(CompressionScheme scheme, const char* direction) {
    return Err(Error::Code::UnsupportedCompression,
               "No " + std::string(direction) + " for Compression " +
               std::to_string(static_cast<uint16_t>(scheme)) + " in this build")
        .for_tag(static_cast<uint16_t>(TagCode::Compression));
}

} // namespace codec_binding

/// Decompressors compiled into a ChunkDecoder
template <typename... Bindings>
    requires(sizeof...(Bindings) > 0)
struct DecompressorSpec {
    static_assert(codec_binding::disjoint<Bindings...>(), "Compression value bound to two decompressors");

    static constexpr bool supports(CompressionScheme scheme) noexcept {
        return (Bindings::handles(scheme) || ...);
    }
};

template <typename T>
struct is_decompressor_spec : std::false_type {};

template <typename... Bindings>
struct is_decompressor_spec<DecompressorSpec<Bindings...>> : std::true_type {};

template <typename T>
concept ValidDecompressorSpec = is_decompressor_spec<std::remove_cvref_t<T>>::value;

template <typename Spec>
class DecompressorStorage;

/// @brief One instance of each codec of a DecompressorSpec
/// @note Codecs keep state between chunks (dictionaries, contexts): one storage per thread
template <typename... Bindings>
class DecompressorStorage<DecompressorSpec<Bindings...>> {
private:
    using Codecs = std::tuple<typename Bindings::codec_type...>;
    using Entry = Result<std::size_t> (*)(const Codecs&, std::span<std::byte>, std::span<const std::byte>) noexcept;

    static constexpr std::size_t codec_count = sizeof...(Bindings);

    template <std::size_t I>
    static Result<std::size_t> run(const Codecs& codecs, std::span<std::byte> output,
                                   std::span<const std::byte> input) noexcept {
        return std::get<I>(codecs).decompress(output, input);
    }

    template <std::size_t... I>
    static constexpr std::array<Entry, codec_count> entry_table(std::index_sequence<I...>) noexcept {
        return {&run<I>...};
    }

    Codecs codecs_;

public:
    DecompressorStorage() = default;

    DecompressorStorage(const DecompressorStorage&) = delete;
    DecompressorStorage& operator=(const DecompressorStorage&) = delete;
    DecompressorStorage(DecompressorStorage&&) noexcept = default;
    DecompressorStorage& operator=(DecompressorStorage&&) noexcept = default;

    /// @brief Expand one chunk
    /// @param output Buffer of exactly the decoded chunk size
    /// @param input Stored bytes of the chunk
    /// @param scheme Compression value of the image
    /// @return Number of bytes written to output
    /// @retval Error::Code::UnsupportedCompression No codec bound to scheme
    /// @retval Error::Code::CodecError Malformed compressed data
    [[nodiscard]] Result<std::size_t> decompress(std::span<std::byte> output, std::span<const std::byte> input,
                                                 CompressionScheme scheme) const noexcept {
        const std::size_t slot = codec_binding::slot_of<Bindings...>(scheme);
        if (slot == codec_count) {
            return codec_binding::unsupported(scheme, "decompressor");
        }
        constexpr auto entries = entry_table(std::index_sequence_for<Bindings...>{});
        return entries[slot](codecs_, output, input);
    }

    static constexpr bool supports(CompressionScheme scheme) noexcept {
        return codec_binding::slot_of<Bindings...>(scheme) != codec_count;
    }
};

} // namespace tiffkit
