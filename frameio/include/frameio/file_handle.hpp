#pragma once

#include <algorithm>
#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <memory>
#include <span>
#include <string>
#include <vector>
#include <fcntl.h>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>
#include "types/element_type.hpp"
#include "types/result.hpp"
#include "types/tile.hpp"

namespace frameio {

/// @brief On-disk layout of one file of a frame-oriented dataset
/// @details A file is `file_header` bytes followed by `num_frames` frame records.
/// Each record is `frame_header` bytes, the signal elements, then `frame_footer` bytes.
struct FileLayout {
    std::string path;
    ElementType native_type;
    std::size_t file_header{0};
    std::size_t frame_header{0};
    std::size_t frame_footer{0};
    std::vector<std::size_t> sig_shape;
    std::size_t num_frames{0};

    [[nodiscard]] std::size_t sig_size() const noexcept { return shape_size(sig_shape); }
    [[nodiscard]] std::size_t sig_bytes() const noexcept { return sig_size() * native_type.size(); }

    /// Distance in bytes between the starts of two consecutive frame records
    [[nodiscard]] std::size_t frame_stride() const noexcept {
        return frame_header + sig_bytes() + frame_footer;
    }

    [[nodiscard]] std::size_t expected_file_size() const noexcept {
        return file_header + num_frames * frame_stride();
    }

    /// Headers and footers must be whole elements, or the decoded view cannot be sliced element-wise
    [[nodiscard]] bool is_element_aligned() const noexcept {
        const std::size_t itemsize = native_type.size();
        return frame_header % itemsize == 0 && frame_footer % itemsize == 0;
    }
};

namespace detail {
    struct MmapDeleter {
        std::size_t size;

        void operator()(void* ptr) const noexcept {
            if (ptr && ptr != MAP_FAILED) {
                munmap(ptr, size);
            }
        }
    };
}

/// @brief One physical file of a multi-file dataset
///
/// open() acquires the descriptor and a read-only mapping of the whole file and
/// derives two views over it:
/// - raw_view(): the mapping with the file header sliced off, for decode/copy paths
/// - decoded_view(): (num_frames, sig_size) elements with frame headers/footers removed
///
/// Both views, and the buffered seek/tell/read_into interface, report
/// Error::Code::FileClosed once close() has been called.
/// Not safe for concurrent close() and view access.
class FileHandle {
private:
    FileLayout layout_;
    int fd_{-1};
    std::size_t file_size_{0};
    std::shared_ptr<void> mmap_handle_;

    [[nodiscard]] const std::byte* mapped_base() const noexcept {
        return static_cast<const std::byte*>(mmap_handle_.get());
    }

public:
    FileHandle() noexcept = default;

    explicit FileHandle(FileLayout layout) noexcept
        : layout_(std::move(layout)) {}

    ~FileHandle() noexcept {
        close();
    }

    FileHandle(const FileHandle&) = delete;
    FileHandle& operator=(const FileHandle&) = delete;

    FileHandle(FileHandle&& other) noexcept
        : layout_(std::move(other.layout_))
        , fd_(other.fd_)
        , file_size_(other.file_size_)
        , mmap_handle_(std::move(other.mmap_handle_)) {
        other.fd_ = -1;
        other.file_size_ = 0;
    }

    FileHandle& operator=(FileHandle&& other) noexcept {
        if (this != &other) {
            close();
            layout_ = std::move(other.layout_);
            fd_ = other.fd_;
            file_size_ = other.file_size_;
            mmap_handle_ = std::move(other.mmap_handle_);
            other.fd_ = -1;
            other.file_size_ = 0;
        }
        return *this;
    }

    [[nodiscard]] Result<void> open() noexcept {
        close();

        if (!layout_.is_element_aligned()) {
            return Err(Error::Code::MisalignedLayout,
                       "frame header (" + std::to_string(layout_.frame_header) +
                       ") and footer (" + std::to_string(layout_.frame_footer) +
                       ") must be multiples of the element size " +
                       std::to_string(layout_.native_type.size()) + ": " + layout_.path);
        }

        fd_ = ::open(layout_.path.c_str(), O_RDONLY);
        if (fd_ < 0) {
            return Err(Error::Code::FileNotFound,
                       "Failed to open file: " + layout_.path + " (" + std::strerror(errno) + ")");
        }

        struct stat st;
        if (fstat(fd_, &st) != 0) {
            int err = errno;
            close();
            return Err(Error::Code::ReadError,
                       "Failed to get file size: " + layout_.path + " (" + std::strerror(err) + ")");
        }
        file_size_ = static_cast<std::size_t>(st.st_size);

        if (file_size_ != layout_.expected_file_size()) {
            std::size_t actual = file_size_;
            close();
            return Err(Error::Code::InvalidLayout,
                       layout_.path + ": size " + std::to_string(actual) +
                       " does not match layout (expected " +
                       std::to_string(layout_.expected_file_size()) + ")");
        }

        if (file_size_ > 0) {
            void* addr = mmap(nullptr, file_size_, PROT_READ, MAP_SHARED, fd_, 0);
            if (addr == MAP_FAILED) {
                int err = errno;
                close();
                return Err(Error::Code::MmapError,
                           "Failed to mmap file: " + layout_.path + " (" + std::strerror(err) + ")");
            }
            mmap_handle_ = std::shared_ptr<void>(addr, detail::MmapDeleter{file_size_});
        }

        return Ok();
    }

    void close() noexcept {
        mmap_handle_.reset();
        if (fd_ >= 0) {
            ::close(fd_);
            fd_ = -1;
        }
        file_size_ = 0;
    }

    [[nodiscard]] bool is_open() const noexcept {
        return fd_ >= 0;
    }

    [[nodiscard]] const FileLayout& layout() const noexcept {
        return layout_;
    }

    [[nodiscard]] std::size_t num_frames() const noexcept {
        return layout_.num_frames;
    }

    /// Mapping with only the file header removed; frames are addressed by byte offsets
    [[nodiscard]] Result<std::span<const std::byte>> raw_view() const noexcept {
        if (!is_open()) {
            return Err(Error::Code::FileClosed, "raw_view() on closed file: " + layout_.path);
        }
        if (!mmap_handle_) {
            return Ok(std::span<const std::byte>{});
        }
        return Ok(std::span<const std::byte>(mapped_base() + layout_.file_header,
                                             file_size_ - layout_.file_header));
    }

    /// Zero-copy (num_frames, sig_size) view in the native element type
    [[nodiscard]] Result<FrameView> decoded_view() const noexcept {
        auto raw = raw_view();
        if (!raw) {
            return raw.error();
        }
        // header skip, in elements: frame_header / itemsize
        const std::byte* first = raw.value().empty() ? nullptr : raw.value().data() + layout_.frame_header;
        return Ok(FrameView{first, layout_.num_frames, layout_.sig_size(),
                            layout_.frame_stride(), layout_.native_type});
    }

    /// Hint the kernel to fault in [offset, offset + size) of the raw view ahead of use
    /// The range is clipped to the end of the file; an offset at or past the end is OutOfBounds.
    [[nodiscard]] Result<void> advise_willneed(std::size_t offset, std::size_t size) const noexcept {
        if (!is_open()) {
            return Err(Error::Code::FileClosed, "advise_willneed() on closed file: " + layout_.path);
        }
        if (!mmap_handle_ || size == 0) {
            return Ok();
        }
        std::size_t begin = layout_.file_header + offset;
        if (begin >= file_size_) {
            return Err(Error::Code::OutOfBounds,
                       "advise_willneed() at offset " + std::to_string(begin) + " beyond the end of " +
                       layout_.path);
        }
        const std::size_t page = static_cast<std::size_t>(sysconf(_SC_PAGESIZE));
        std::size_t aligned = begin - (begin % page);
        std::size_t length = std::min(begin + size, file_size_) - aligned;
        auto* addr = const_cast<std::byte*>(mapped_base()) + aligned;
        if (madvise(addr, length, MADV_WILLNEED) != 0) {
            return Err(Error::Code::ReadError, std::string("madvise failed: ") + std::strerror(errno));
        }
        return Ok();
    }

    /// Move the buffered read position to an absolute file offset (file header included)
    [[nodiscard]] Result<void> seek(uint64_t pos) noexcept {
        if (!is_open()) {
            return Err(Error::Code::FileClosed, "seek() on closed file: " + layout_.path);
        }
        if (::lseek(fd_, static_cast<off_t>(pos), SEEK_SET) < 0) {
            return Err(Error::Code::ReadError, std::string("lseek failed: ") + std::strerror(errno));
        }
        return Ok();
    }

    [[nodiscard]] Result<uint64_t> tell() const noexcept {
        if (!is_open()) {
            return Err(Error::Code::FileClosed, "tell() on closed file: " + layout_.path);
        }
        off_t pos = ::lseek(fd_, 0, SEEK_CUR);
        if (pos < 0) {
            return Err(Error::Code::ReadError, std::string("lseek failed: ") + std::strerror(errno));
        }
        return Ok(static_cast<uint64_t>(pos));
    }

    /// Fill `out` completely from the current position, retrying short reads
    [[nodiscard]] Result<void> read_into(std::span<std::byte> out) noexcept {
        if (!is_open()) {
            return Err(Error::Code::FileClosed, "read_into() on closed file: " + layout_.path);
        }
        std::size_t done = 0;
        while (done < out.size()) {
            ssize_t n = ::read(fd_, out.data() + done, out.size() - done);
            if (n < 0) {
                if (errno == EINTR) {
                    continue;
                }
                return Err(Error::Code::ReadError, std::string("read failed: ") + std::strerror(errno));
            }
            if (n == 0) {
                return Err(Error::Code::UnexpectedEndOfFile,
                           "read_into() hit end of file: " + layout_.path);
            }
            done += static_cast<std::size_t>(n);
        }
        return Ok();
    }

    /// Underlying descriptor, for backends doing their own descriptor-level I/O
    [[nodiscard]] Result<int> fileno() const noexcept {
        if (!is_open()) {
            return Err(Error::Code::FileClosed, "fileno() on closed file: " + layout_.path);
        }
        return Ok(fd_);
    }
};

} // namespace frameio
