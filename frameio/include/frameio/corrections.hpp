#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <vector>
#include "types/result.hpp"
#include "types/tile.hpp"

namespace frameio {

/// @brief Post-read, in-place value corrections applied to tile data
///
/// The backend only asks whether a set is active (which forces the copy path)
/// and, per produced tile, calls apply() on the tile buffer before yielding it.
/// Implementations must not touch memory outside the given buffer view.
class CorrectionSet {
public:
    virtual ~CorrectionSet() = default;

    [[nodiscard]] virtual bool has_corrections() const noexcept = 0;

    /// @param buffer Tile data, one row per frame, region.sig_count elements per row
    /// @param region Coordinates of the tile, used to pick the matching correction data
    [[nodiscard]] virtual Result<void> apply(MutableFrameView buffer, const TileSlice& region) const noexcept = 0;
};

/// @brief Dark frame subtraction, gain map multiplication and excluded-pixel patching
///
/// For every frame row: v = (v - dark[i]) * gain[i] for signal index i; then each
/// excluded pixel inside the tile is replaced by the mean of its nearest
/// non-excluded neighbours along the flat signal axis within the tile (0 if none).
/// Only f32/f64 buffers can be corrected.
class PixelCorrections final : public CorrectionSet {
private:
    std::vector<float> dark_;
    std::vector<float> gain_;
    std::vector<std::size_t> excluded_;  // sorted, unique flat signal indices

    [[nodiscard]] bool is_excluded(std::size_t sig_index) const noexcept {
        return std::binary_search(excluded_.begin(), excluded_.end(), sig_index);
    }

    template <typename T>
    void apply_typed(MutableFrameView buffer, const TileSlice& region) const noexcept {
        const std::size_t count = region.sig_count;
        for (std::size_t f = 0; f < buffer.num_frames; ++f) {
            auto* row = reinterpret_cast<T*>(buffer.row(f).data());
            if (!dark_.empty() || !gain_.empty()) {
                for (std::size_t j = 0; j < count; ++j) {
                    const std::size_t i = region.sig_start + j;
                    T v = row[j];
                    if (!dark_.empty()) {
                        v -= static_cast<T>(dark_[i]);
                    }
                    if (!gain_.empty()) {
                        v *= static_cast<T>(gain_[i]);
                    }
                    row[j] = v;
                }
            }
            auto first = std::lower_bound(excluded_.begin(), excluded_.end(), region.sig_start);
            for (auto it = first; it != excluded_.end() && *it < region.sig_start + count; ++it) {
                const std::size_t j = *it - region.sig_start;
                T sum = 0;
                int n = 0;
                for (std::size_t k = j; k-- > 0;) {
                    if (!is_excluded(region.sig_start + k)) {
                        sum += row[k];
                        ++n;
                        break;
                    }
                }
                for (std::size_t k = j + 1; k < count; ++k) {
                    if (!is_excluded(region.sig_start + k)) {
                        sum += row[k];
                        ++n;
                        break;
                    }
                }
                row[j] = n > 0 ? sum / static_cast<T>(n) : T{0};
            }
        }
    }

public:
    PixelCorrections() = default;

    PixelCorrections(std::vector<float> dark, std::vector<float> gain,
                     std::vector<std::size_t> excluded_pixels = {})
        : dark_(std::move(dark))
        , gain_(std::move(gain))
        , excluded_(std::move(excluded_pixels)) {
        std::sort(excluded_.begin(), excluded_.end());
        excluded_.erase(std::unique(excluded_.begin(), excluded_.end()), excluded_.end());
    }

    [[nodiscard]] const std::vector<float>& dark() const noexcept { return dark_; }
    [[nodiscard]] const std::vector<float>& gain() const noexcept { return gain_; }
    [[nodiscard]] const std::vector<std::size_t>& excluded_pixels() const noexcept { return excluded_; }

    [[nodiscard]] bool has_corrections() const noexcept override {
        return !dark_.empty() || !gain_.empty() || !excluded_.empty();
    }

    [[nodiscard]] Result<void> apply(MutableFrameView buffer, const TileSlice& region) const noexcept override {
        if (!has_corrections() || buffer.empty()) {
            return Ok();
        }
        if (buffer.frame_elements != region.sig_count) {
            return Err(Error::Code::InvalidArgument,
                       "buffer rows hold " + std::to_string(buffer.frame_elements) +
                       " elements, region expects " + std::to_string(region.sig_count));
        }
        const std::size_t sig_end = region.sig_start + region.sig_count;
        if ((!dark_.empty() && dark_.size() < sig_end) || (!gain_.empty() && gain_.size() < sig_end)) {
            return Err(Error::Code::OutOfBounds, "correction data smaller than the tile signal range");
        }
        if (buffer.dtype.needs_byteswap()) {
            return Err(Error::Code::UnsupportedType, "cannot correct foreign byte order in place");
        }
        switch (buffer.dtype.kind) {
            case DType::F32:
                apply_typed<float>(buffer, region);
                return Ok();
            case DType::F64:
                apply_typed<double>(buffer, region);
                return Ok();
            default:
                return Err(Error::Code::UnsupportedType,
                           std::string("corrections need a floating point read type, got ") +
                           dtype_name(buffer.dtype.kind));
        }
    }
};

} // namespace frameio
