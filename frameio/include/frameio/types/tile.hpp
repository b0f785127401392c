#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <functional>
#include <numeric>
#include <span>
#include <vector>
#include "element_type.hpp"
#include "result.hpp"

namespace frameio {

/// @brief Number of elements of a signal (frame) shape
[[nodiscard]] inline std::size_t shape_size(std::span<const std::size_t> shape) noexcept {
    return std::accumulate(shape.begin(), shape.end(), std::size_t{1}, std::multiplies<>{});
}

/// @brief Shape of one unit of delivered data
/// @note A tile covers `depth` frames and the flat signal element range
/// [sig_start, sig_start + sig_count). sig_count == 0 means "to the end of the frame".
struct TilingScheme {
    std::size_t depth{1};                ///< Frames per tile
    std::vector<std::size_t> sig_shape;  ///< Full signal (frame) shape
    std::size_t sig_start{0};            ///< First signal element of every tile
    std::size_t sig_count{0};            ///< Signal elements per tile (0 = rest of frame)

    [[nodiscard]] std::size_t sig_size() const noexcept { return shape_size(sig_shape); }

    [[nodiscard]] std::size_t tile_sig_count() const noexcept {
        return sig_count == 0 ? sig_size() - std::min(sig_start, sig_size()) : sig_count;
    }

    [[nodiscard]] Result<void> validate() const {
        if (depth == 0) {
            return Err(Error::Code::InvalidArgument, "tiling scheme depth must be > 0");
        }
        if (sig_shape.empty() || sig_size() == 0) {
            return Err(Error::Code::InvalidArgument, "tiling scheme needs a non-empty signal shape");
        }
        if (sig_start >= sig_size() || sig_start + tile_sig_count() > sig_size()) {
            return Err(Error::Code::InvalidArgument, "tile signal range exceeds the frame");
        }
        return Ok();
    }
};

/// @brief Coordinates of one delivered tile
struct TileSlice {
    uint64_t frame_origin{0};            ///< First (logical or ROI-compacted) frame index
    std::size_t num_frames{0};           ///< Frames in this tile
    std::size_t sig_start{0};            ///< First flat signal element
    std::size_t sig_count{0};            ///< Signal elements per frame row
    std::vector<std::size_t> sig_shape;  ///< Full signal shape, for consumers that reshape

    [[nodiscard]] std::size_t num_elements() const noexcept { return num_frames * sig_count; }
};

/// @brief Byte range to read for one tile
/// @note start/stop address the raw view of the file (file header removed).
/// The decoded elements land in the tile buffer starting at tile_offset (in elements).
struct ReadRange {
    uint32_t file_index{0};
    uint64_t start{0};
    uint64_t stop{0};
    uint64_t tile_offset{0};

    [[nodiscard]] uint64_t length() const noexcept { return stop - start; }
};

/// @brief Everything needed to produce one tile on the copy path
/// Tile elements not covered by any range are zero.
struct TileReadPlan {
    TileSlice slice;
    std::vector<ReadRange> ranges;
};

/// @brief Boolean frame selection over the whole dataset
class RoiMask {
private:
    std::vector<bool> mask_;

public:
    RoiMask() = default;
    explicit RoiMask(std::vector<bool> mask) : mask_(std::move(mask)) {}

    [[nodiscard]] std::size_t size() const noexcept { return mask_.size(); }
    [[nodiscard]] bool operator[](std::size_t frame) const noexcept { return mask_[frame]; }

    [[nodiscard]] std::size_t count() const noexcept {
        return static_cast<std::size_t>(std::count(mask_.begin(), mask_.end(), true));
    }
};

/// @brief Strided 2-D array view: (num_frames, frame_elements)
/// @note Rows are frame_stride bytes apart; elements within a row are packed.
/// The view never owns the memory it points to.
template <typename ByteT>
struct BasicFrameView {
    ByteT* data{nullptr};
    std::size_t num_frames{0};
    std::size_t frame_elements{0};
    std::size_t frame_stride{0};
    ElementType dtype;

    [[nodiscard]] std::size_t row_bytes() const noexcept { return frame_elements * dtype.size(); }
    [[nodiscard]] std::size_t num_elements() const noexcept { return num_frames * frame_elements; }
    [[nodiscard]] bool empty() const noexcept { return num_elements() == 0; }

    [[nodiscard]] bool is_contiguous() const noexcept {
        return num_frames <= 1 || frame_stride == row_bytes();
    }

    [[nodiscard]] std::span<ByteT> row(std::size_t frame) const noexcept {
        return std::span<ByteT>(data + frame * frame_stride, row_bytes());
    }

    /// Read one element as T (T must match dtype.kind; byte order is not converted)
    template <typename T>
    [[nodiscard]] T at(std::size_t frame, std::size_t element) const noexcept {
        T value;
        std::memcpy(&value, data + frame * frame_stride + element * sizeof(T), sizeof(T));
        return value;
    }

    /// Sub-block of frames [frame_begin, frame_begin + frames) and elements [elem_begin, elem_begin + elems)
    [[nodiscard]] BasicFrameView subview(std::size_t frame_begin, std::size_t frames,
                                         std::size_t elem_begin, std::size_t elems) const noexcept {
        return BasicFrameView{
            data + frame_begin * frame_stride + elem_begin * dtype.size(),
            frames, elems, frame_stride, dtype};
    }
};

using FrameView = BasicFrameView<const std::byte>;
using MutableFrameView = BasicFrameView<std::byte>;

[[nodiscard]] inline FrameView as_const(const MutableFrameView& view) noexcept {
    return FrameView{view.data, view.num_frames, view.frame_elements, view.frame_stride, view.dtype};
}

/// @brief One delivered tile
/// @note data is valid until the next tile is pulled or the stream is closed.
/// When zero_copy is true it points into the OS page cache of a mapped file.
struct Tile {
    TileSlice slice;
    FrameView data;
    bool zero_copy{false};
};

} // namespace frameio
