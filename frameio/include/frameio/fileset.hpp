#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <iterator>
#include <limits>
#include <string>
#include <utility>
#include <vector>
#include "file_handle.hpp"
#include "types/result.hpp"

namespace frameio {

class OpenFileSet;

/// @brief Ordered files composing one dataset
/// @note The order is significant: ReadRange::file_index refers to it.
/// File i holds the frames [start_frame(i), end_frame(i)) of the dataset.
class FileSet {
private:
    std::vector<FileLayout> files_;
    std::vector<uint64_t> starts_;  // starts_[i] = first frame of file i, starts_.back() = total

public:
    FileSet() = default;

    explicit FileSet(std::vector<FileLayout> files)
        : files_(std::move(files)) {
        starts_.reserve(files_.size() + 1);
        uint64_t frame = 0;
        starts_.push_back(frame);
        for (const auto& file : files_) {
            frame += file.num_frames;
            starts_.push_back(frame);
        }
    }

    [[nodiscard]] std::size_t size() const noexcept { return files_.size(); }
    [[nodiscard]] bool empty() const noexcept { return files_.empty(); }
    [[nodiscard]] const FileLayout& operator[](std::size_t i) const noexcept { return files_[i]; }
    [[nodiscard]] const std::vector<FileLayout>& files() const noexcept { return files_; }

    [[nodiscard]] uint64_t start_frame(std::size_t i) const noexcept { return starts_[i]; }
    [[nodiscard]] uint64_t end_frame(std::size_t i) const noexcept { return starts_[i + 1]; }

    [[nodiscard]] uint64_t total_frames() const noexcept {
        return starts_.empty() ? 0 : starts_.back();
    }

    /// (start_frame, end_frame) of every file, in fileset order
    [[nodiscard]] std::vector<std::pair<uint64_t, uint64_t>> get_as_arr() const {
        std::vector<std::pair<uint64_t, uint64_t>> out;
        out.reserve(files_.size());
        for (std::size_t i = 0; i < files_.size(); ++i) {
            out.emplace_back(start_frame(i), end_frame(i));
        }
        return out;
    }

    /// Smallest number of frames held by a single file (0 for an empty set)
    [[nodiscard]] uint64_t min_frames_per_file() const {
        if (files_.empty()) {
            return 0;
        }
        uint64_t smallest = std::numeric_limits<uint64_t>::max();
        for (const auto& [start, end] : get_as_arr()) {
            smallest = std::min(smallest, end - start);
        }
        return smallest;
    }

    /// Index of the file holding physical frame `frame`
    [[nodiscard]] Result<std::size_t> file_for_frame(uint64_t frame) const noexcept {
        if (frame >= total_frames()) {
            return Err(Error::Code::OutOfBounds,
                       "frame " + std::to_string(frame) + " beyond dataset of " +
                       std::to_string(total_frames()) + " frames");
        }
        auto it = std::upper_bound(starts_.begin(), starts_.end(), frame);
        return Ok(static_cast<std::size_t>(std::distance(starts_.begin(), it) - 1));
    }

    /// All files must share the native element type and the signal shape
    [[nodiscard]] Result<void> validate() const {
        if (files_.empty()) {
            return Err(Error::Code::InvalidArgument, "empty fileset");
        }
        for (const auto& file : files_) {
            if (!(file.native_type == files_.front().native_type) ||
                file.sig_shape != files_.front().sig_shape) {
                return Err(Error::Code::InvalidArgument,
                           "fileset members disagree on element type or signal shape: " + file.path);
            }
        }
        return Ok();
    }

    /// Open every file; on failure the files opened so far are closed again
    [[nodiscard]] Result<OpenFileSet> open() const noexcept;
};

/// @brief Scoped set of open FileHandles for one read operation
/// Every handle is closed on close() or destruction, whichever comes first.
class OpenFileSet {
private:
    std::vector<FileHandle> handles_;

public:
    OpenFileSet() noexcept = default;

    explicit OpenFileSet(std::vector<FileHandle> handles) noexcept
        : handles_(std::move(handles)) {}

    ~OpenFileSet() noexcept {
        close();
    }

    OpenFileSet(const OpenFileSet&) = delete;
    OpenFileSet& operator=(const OpenFileSet&) = delete;
    OpenFileSet(OpenFileSet&&) noexcept = default;

    OpenFileSet& operator=(OpenFileSet&& other) noexcept {
        if (this != &other) {
            close();
            handles_ = std::move(other.handles_);
        }
        return *this;
    }

    [[nodiscard]] std::size_t size() const noexcept { return handles_.size(); }
    [[nodiscard]] FileHandle& operator[](std::size_t i) noexcept { return handles_[i]; }
    [[nodiscard]] const FileHandle& operator[](std::size_t i) const noexcept { return handles_[i]; }

    [[nodiscard]] bool is_open() const noexcept {
        return !handles_.empty() && handles_.front().is_open();
    }

    void close() noexcept {
        for (auto& handle : handles_) {
            handle.close();
        }
    }
};

inline Result<OpenFileSet> FileSet::open() const noexcept {
    std::vector<FileHandle> handles;
    handles.reserve(files_.size());
    for (const auto& layout : files_) {
        FileHandle handle(layout);
        auto result = handle.open();
        if (!result) {
            return result.error();
        }
        handles.push_back(std::move(handle));
    }
    return Ok(OpenFileSet(std::move(handles)));
}

} // namespace frameio
