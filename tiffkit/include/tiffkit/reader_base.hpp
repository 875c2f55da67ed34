#pragma once

#include <concepts>
#include <cstddef>
#include <span>
#include "types/result.hpp"

namespace tiffkit {

/// Concept for a read-only view into data with RAII lifetime management
/// Only one thread at a time should access the view
template <typename T>
concept DataReadOnlyView = requires(T view) {
    // Access to the underlying data
    { view.data() } -> std::same_as<std::span<const std::byte>>;

    // Size of the data
    { view.size() } -> std::same_as<std::size_t>;

    // Check if view is empty
    { view.empty() } -> std::same_as<bool>;

    // Must be movable for Result<T> and transferring ownership
    requires std::move_constructible<T>;
    requires std::is_nothrow_move_constructible_v<T>;
};

/// Concept for a raw reader that provides thread-safe positioned reads
///
/// The decoder treats a reader as one shared immutable byte source:
/// it never writes through it, and it may call read() from several
/// worker threads at once.
template <typename T>
concept RawReader = requires(const T reader, void* buffer, std::size_t offset, std::size_t size) {
    // Read operation returning a view (implementation may use zero-copy or allocate).
    // The view may be shorter than requested when the range crosses the end of the data.
    { reader.read(offset, size) } -> std::same_as<Result<typename T::ReadViewType>>;
    requires DataReadOnlyView<typename T::ReadViewType>;

    // Alternative read_into() method that reads directly into provided buffer
    { reader.read_into(buffer, offset, size) } -> std::same_as<Result<void>>;

    // Get total size of the readable content
    { reader.size() } -> std::same_as<Result<std::size_t>>;

    // Check if reader is valid/open
    { reader.is_valid() } -> std::same_as<bool>;

    // Hint whether read() must allocate new buffer or can return zero-copy views
    // If true, read_into() should be preferred for performance
    { T::read_must_allocate } -> std::convertible_to<bool>;
};

} // namespace tiffkit
