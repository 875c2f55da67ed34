#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>

namespace tiffkit {

/// Error type for TIFF operations
struct Error {
    enum class Code {
        Success,
        InvalidHeader,          ///< Byte-order marker or magic number rejected
        UnexpectedEof,          ///< A read ran past the end of the byte source
        OutOfRange,             ///< An offset or offset+length lies outside the byte source
        MissingRequiredTag,     ///< A tag needed to compute the image layout is absent
        TypeMismatch,           ///< A tag value was requested as an incompatible type
        TagNotFound,            ///< The requested tag is not present in the IFD
        UnsupportedCompression, ///< The compression scheme has no codec in this build
        CodecError,             ///< A compressed payload is malformed
        InconsistentLayout,     ///< Strip/tile arrays do not tile the image grid
        NoImageData,            ///< No strip or tile location tags (or no IFD at all)
        UnsupportedFeature,
        InvalidFormat,
        InvalidTag,
        FileNotFound,
        ReadError,
        WriteError,
        MemoryError,
    };

    Code code;
    std::string message;
    std::optional<std::size_t> offset; ///< Offending byte offset, when known
    std::optional<uint16_t> tag;       ///< Offending tag id, when known

    constexpr Error(Code c, std::string msg = "") noexcept
        : code(c), message(std::move(msg)) {}

    [[nodiscard]] constexpr bool is_success() const noexcept { return code == Code::Success; }
    [[nodiscard]] constexpr bool is_error() const noexcept { return !is_success(); }

    /// Attach the byte offset at which the error was detected
    [[nodiscard]] constexpr Error&& at_offset(std::size_t byte_offset) && noexcept {
        offset = byte_offset;
        return std::move(*this);
    }

    /// Attach the tag id the error refers to
    [[nodiscard]] constexpr Error&& for_tag(uint16_t tag_id) && noexcept {
        tag = tag_id;
        return std::move(*this);
    }
};

namespace result_detail {

inline constexpr std::array<std::string_view, 18> code_names{
    "Success", "InvalidHeader", "UnexpectedEof", "OutOfRange",
    "MissingRequiredTag", "TypeMismatch", "TagNotFound", "UnsupportedCompression",
    "CodecError", "InconsistentLayout", "NoImageData", "UnsupportedFeature",
    "InvalidFormat", "InvalidTag", "FileNotFound", "ReadError",
    "WriteError", "MemoryError",
};

static_assert(code_names.size() == static_cast<std::size_t>(Error::Code::MemoryError) + 1,
              "every error code needs a name");

} // namespace result_detail

/// Name of an error code, as spelled in Error::Code
[[nodiscard]] constexpr std::string_view to_string(Error::Code code) noexcept {
    const auto index = static_cast<std::size_t>(code);
    return index < result_detail::code_names.size() ? result_detail::code_names[index] : "Unknown";
}

/**
 * @brief Value of type T, or the Error that prevented computing it
 *
 * Every fallible operation of the library returns a Result; nothing throws.
 * value() and error() must only be called on the matching alternative.
 * Result<void> carries no value.
 */
template <typename T>
class [[nodiscard]] Result {
private:
    using Value = std::conditional_t<std::is_void_v<T>, std::monostate, T>;

    std::variant<Value, Error> data_;

public:
    template <typename U = T>
        requires std::is_void_v<U>
    constexpr Result() noexcept : data_(std::monostate{}) {}

    template <typename U = T>
        requires(!std::is_void_v<U>)
    constexpr Result(Value&& value) noexcept(std::is_nothrow_move_constructible_v<Value>)
        : data_(std::in_place_index<0>, std::move(value)) {}

    template <typename U = T>
        requires(!std::is_void_v<U>)
    constexpr Result(const Value& value) noexcept(std::is_nothrow_copy_constructible_v<Value>)
        : data_(std::in_place_index<0>, value) {}

    constexpr Result(Error&& error) noexcept : data_(std::in_place_index<1>, std::move(error)) {}
    constexpr Result(const Error& error) noexcept : data_(std::in_place_index<1>, error) {}

    [[nodiscard]] constexpr bool is_ok() const noexcept { return data_.index() == 0; }
    [[nodiscard]] constexpr bool is_error() const noexcept { return data_.index() == 1; }
    [[nodiscard]] constexpr explicit operator bool() const noexcept { return is_ok(); }

    [[nodiscard]] constexpr const Error& error() const noexcept { return *std::get_if<1>(&data_); }

    template <typename U = T>
        requires(!std::is_void_v<U>)
    [[nodiscard]] constexpr Value& value() & noexcept {
        return *std::get_if<0>(&data_);
    }

    template <typename U = T>
        requires(!std::is_void_v<U>)
    [[nodiscard]] constexpr const Value& value() const& noexcept {
        return *std::get_if<0>(&data_);
    }

    template <typename U = T>
        requires(!std::is_void_v<U>)
    [[nodiscard]] constexpr Value&& value() && noexcept {
        return std::move(*std::get_if<0>(&data_));
    }

    /// The value, or `fallback` converted to T on error
    template <typename U>
        requires(!std::is_void_v<T>)
    [[nodiscard]] constexpr Value value_or(U&& fallback) const& {
        return is_ok() ? value() : static_cast<Value>(std::forward<U>(fallback));
    }

    template <typename U>
        requires(!std::is_void_v<T>)
    [[nodiscard]] constexpr Value value_or(U&& fallback) && {
        return is_ok() ? std::move(*this).value() : static_cast<Value>(std::forward<U>(fallback));
    }

    /// Feed the value to `next`, which returns a Result; errors pass through
    template <typename F>
        requires(!std::is_void_v<T>)
    [[nodiscard]] constexpr auto and_then(F&& next) const& -> decltype(next(std::declval<const Value&>())) {
        if (is_error()) {
            return error();
        }
        return next(value());
    }

    /// Map the value with `fn`; errors pass through
    template <typename F>
        requires(!std::is_void_v<T>)
    [[nodiscard]] constexpr auto transform(F&& fn) const& -> Result<decltype(fn(std::declval<const Value&>()))> {
        if (is_error()) {
            return error();
        }
        return fn(value());
    }
};

template <typename T>
[[nodiscard]] constexpr Result<std::decay_t<T>> Ok(T&& value) {
    return Result<std::decay_t<T>>{std::forward<T>(value)};
}

[[nodiscard]] constexpr Result<void> Ok() {
    return Result<void>{};
}

[[nodiscard]] constexpr Error Err(Error::Code code, std::string message = "") {
    return Error{code, std::move(message)};
}

} // namespace tiffkit
