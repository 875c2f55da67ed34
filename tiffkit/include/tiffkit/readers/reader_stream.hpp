#pragma once

#include <algorithm>
#include <cstddef>
#include <fstream>
#include <memory>
#include <mutex>
#include <new>
#include <span>
#include <string>
#include <string_view>
#include <vector>
#include "../reader_base.hpp"

namespace tiffkit {
namespace stream_impl {

/// Bytes copied out of the file, shared so that moving a view is cheap
class FileBytesView {
private:
    std::shared_ptr<const std::vector<std::byte>> bytes_;

public:
    FileBytesView() noexcept = default;

    explicit FileBytesView(std::shared_ptr<const std::vector<std::byte>> bytes) noexcept
        : bytes_(std::move(bytes)) {}

    FileBytesView(FileBytesView&&) noexcept = default;
    FileBytesView& operator=(FileBytesView&&) noexcept = default;
    FileBytesView(const FileBytesView&) = delete;
    FileBytesView& operator=(const FileBytesView&) = delete;

    [[nodiscard]] std::span<const std::byte> data() const noexcept {
        return bytes_ ? std::span<const std::byte>(*bytes_) : std::span<const std::byte>();
    }
    [[nodiscard]] std::size_t size() const noexcept { return bytes_ ? bytes_->size() : 0; }
    [[nodiscard]] bool empty() const noexcept { return size() == 0; }
};

static_assert(DataReadOnlyView<FileBytesView>, "FileBytesView must satisfy DataReadOnlyView concept");

/// An open file and the lock that keeps each seek+read pair atomic
struct OpenFile {
    std::ifstream stream;
    std::mutex lock;
    std::size_t size{0};
};

/// Read up to `count` bytes at `offset`
/// @return Number of bytes read, short only at the end of the file
[[nodiscard]] inline Result<std::size_t> fetch(OpenFile& file, std::byte* dest, std::size_t offset,
                                               std::size_t count) noexcept {
    std::lock_guard<std::mutex> guard(file.lock);
    file.stream.clear();
    if (!file.stream.seekg(static_cast<std::streamoff>(offset), std::ios::beg)) {
        return Err(Error::Code::ReadError, "Cannot seek in file").at_offset(offset);
    }
    file.stream.read(reinterpret_cast<char*>(dest), static_cast<std::streamsize>(count));
    if (file.stream.bad()) {
        return Err(Error::Code::ReadError, "I/O error while reading file").at_offset(offset);
    }
    return Ok(static_cast<std::size_t>(file.stream.gcount()));
}

} // namespace stream_impl

/// Read-only file access through std::ifstream
/// Reads are serialized on the file, so decoding workers can share one reader.
class StreamFileReader {
private:
    std::unique_ptr<stream_impl::OpenFile> file_;
    std::string path_;

public:
    using ReadViewType = stream_impl::FileBytesView;

    static constexpr bool read_must_allocate = true;

    StreamFileReader() noexcept = default;

    StreamFileReader(const StreamFileReader&) = delete;
    StreamFileReader& operator=(const StreamFileReader&) = delete;
    StreamFileReader(StreamFileReader&&) noexcept = default;
    StreamFileReader& operator=(StreamFileReader&&) noexcept = default;

    /// @retval Error::Code::FileNotFound The file cannot be opened
    /// @retval Error::Code::ReadError The file size cannot be determined
    [[nodiscard]] Result<void> open(std::string_view path) noexcept {
        close();
        try {
            auto file = std::make_unique<stream_impl::OpenFile>();
            file->stream.open(std::string(path), std::ios::binary);
            if (!file->stream) {
                return Err(Error::Code::FileNotFound, "Failed to open file: " + std::string(path));
            }
            file->stream.seekg(0, std::ios::end);
            const std::streamoff end = file->stream.tellg();
            if (end < 0) {
                return Err(Error::Code::ReadError, "Cannot determine the size of " + std::string(path));
            }
            file->size = static_cast<std::size_t>(end);
            path_ = path;
            file_ = std::move(file);
        } catch (const std::bad_alloc&) {
            return Err(Error::Code::MemoryError, "Failed to open file: " + std::string(path));
        }
        return Ok();
    }

    void close() noexcept {
        file_.reset();
        path_.clear();
    }

    /// Copy a range out of the file; the view is short when the range crosses the end
    [[nodiscard]] Result<ReadViewType> read(std::size_t offset, std::size_t size) const noexcept {
        if (!file_) {
            return Err(Error::Code::ReadError, "File not open");
        }
        if (offset >= file_->size) {
            return Err(Error::Code::OutOfRange, "Read offset beyond file size").at_offset(offset);
        }

        std::shared_ptr<std::vector<std::byte>> bytes;
        try {
            bytes = std::make_shared<std::vector<std::byte>>(std::min(size, file_->size - offset));
        } catch (const std::bad_alloc&) {
            return Err(Error::Code::MemoryError, "Failed to allocate a read buffer").at_offset(offset);
        }

        auto got = stream_impl::fetch(*file_, bytes->data(), offset, bytes->size());
        if (got.is_error()) {
            return got.error();
        }
        bytes->resize(got.value());
        return Ok(ReadViewType(std::move(bytes)));
    }

    [[nodiscard]] Result<void> read_into(void* dest, std::size_t offset, std::size_t size) const noexcept {
        if (!file_) {
            return Err(Error::Code::ReadError, "File not open");
        }
        if (offset > file_->size || size > file_->size - offset) {
            return Err(Error::Code::UnexpectedEof, "Read range beyond file size").at_offset(offset);
        }

        auto got = stream_impl::fetch(*file_, static_cast<std::byte*>(dest), offset, size);
        if (got.is_error()) {
            return got.error();
        }
        if (got.value() != size) {
            return Err(Error::Code::ReadError,
                       "Short read: " + std::to_string(got.value()) + " of " + std::to_string(size) + " bytes")
                .at_offset(offset);
        }
        return Ok();
    }

    [[nodiscard]] Result<std::size_t> size() const noexcept {
        if (!file_) {
            return Err(Error::Code::ReadError, "File not open");
        }
        return Ok(file_->size);
    }

    [[nodiscard]] bool is_valid() const noexcept { return file_ != nullptr; }

    [[nodiscard]] const std::string& path() const noexcept { return path_; }
};

static_assert(RawReader<StreamFileReader>, "StreamFileReader must satisfy RawReader concept");

/// @brief Open a file for decoding
/// @param path Path of the TIFF file
/// @retval Error::Code::FileNotFound The file cannot be opened
[[nodiscard]] inline Result<StreamFileReader> open_file(std::string_view path) noexcept {
    StreamFileReader reader;
    auto result = reader.open(path);
    if (result.is_error()) {
        return result.error();
    }
    return Ok(std::move(reader));
}

} // namespace tiffkit
