#pragma once

/**
 * @file compressor_base.hpp
 * @brief Compressor set of ChunkEncoder, selected by the requested Compression
 *
 * Same binding scheme as decompressor_base.hpp. A compressor writes the
 * compressed form of one chunk into a vector starting at a given offset,
 * growing the vector when needed, and returns the number of bytes written.
 */

#include <array>
#include <concepts>
#include <cstddef>
#include <span>
#include <tuple>
#include <type_traits>
#include <utility>
#include <vector>
#include "decompressor_base.hpp"
#include "types.hpp"
#include "types/result.hpp"

namespace tiffkit {

/// A codec compressing one chunk
template <typename T>
concept ChunkCompressor = requires(const T& codec, std::vector<std::byte>& output, std::size_t offset,
                                   std::span<const std::byte> input) {
    { codec.compress(output, offset, input) } -> std::same_as<Result<std::size_t>>;
};

/// Binds a codec to the Compression values it produces
template <ChunkCompressor Codec, CompressionScheme... Schemes>
    requires(sizeof...(Schemes) > 0)
struct CompressorDescriptor {
    using codec_type = Codec;
    static constexpr std::array<CompressionScheme, sizeof...(Schemes)> schemes{Schemes...};

    static constexpr bool handles(CompressionScheme scheme) noexcept {
        return ((scheme == Schemes) || ...);
    }
};

/// Compressors compiled into a ChunkEncoder
template <typename... Bindings>
    requires(sizeof...(Bindings) > 0)
struct CompressorSpec {
    static_assert(codec_binding::disjoint<Bindings...>(), "Compression value bound to two compressors");

    static constexpr bool supports(CompressionScheme scheme) noexcept {
        return (Bindings::handles(scheme) || ...);
    }
};

template <typename T>
struct is_compressor_spec : std::false_type {};

template <typename... Bindings>
struct is_compressor_spec<CompressorSpec<Bindings...>> : std::true_type {};

template <typename T>
concept ValidCompressorSpec = is_compressor_spec<std::remove_cvref_t<T>>::value;

template <typename Spec>
class CompressorStorage;

/// @brief One instance of each codec of a CompressorSpec
/// @note Not thread-safe, the writer gives each worker its own ChunkEncoder
template <typename... Bindings>
class CompressorStorage<CompressorSpec<Bindings...>> {
private:
    using Codecs = std::tuple<typename Bindings::codec_type...>;
    using Entry = Result<std::size_t> (*)(const Codecs&, std::vector<std::byte>&, std::size_t,
                                          std::span<const std::byte>) noexcept;

    static constexpr std::size_t codec_count = sizeof...(Bindings);

    template <std::size_t I>
    static Result<std::size_t> run(const Codecs& codecs, std::vector<std::byte>& output, std::size_t offset,
                                   std::span<const std::byte> input) noexcept {
        return std::get<I>(codecs).compress(output, offset, input);
    }

    template <std::size_t... I>
    static constexpr std::array<Entry, codec_count> entry_table(std::index_sequence<I...>) noexcept {
        return {&run<I>...};
    }

    Codecs codecs_;

public:
    CompressorStorage() = default;

    CompressorStorage(const CompressorStorage&) = delete;
    CompressorStorage& operator=(const CompressorStorage&) = delete;
    CompressorStorage(CompressorStorage&&) noexcept = default;
    CompressorStorage& operator=(CompressorStorage&&) noexcept = default;

    /// @brief Compress one chunk
    /// @param output Destination, grown when needed
    /// @param offset Position in output of the first compressed byte
    /// @param input Bytes of the chunk after predictor and byte order
    /// @param scheme Compression value to produce
    /// @return Number of bytes written from offset
    /// @retval Error::Code::UnsupportedCompression No codec bound to scheme
    /// @retval Error::Code::MemoryError output could not grow
    [[nodiscard]] Result<std::size_t> compress(std::vector<std::byte>& output, std::size_t offset,
                                               std::span<const std::byte> input,
                                               CompressionScheme scheme) const noexcept {
        const std::size_t slot = codec_binding::slot_of<Bindings...>(scheme);
        if (slot == codec_count) {
            return codec_binding::unsupported(scheme, "compressor");
        }
        constexpr auto entries = entry_table(std::index_sequence_for<Bindings...>{});
        return entries[slot](codecs_, output, offset, input);
    }

    static constexpr bool supports(CompressionScheme scheme) noexcept {
        return (Bindings::handles(scheme) || ...);
    }
};

} // namespace tiffkit
