#pragma once

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <memory>
#include <span>
#include <string>
#include <utility>
#include <vector>
#include "../backend.hpp"
#include "../corrections.hpp"
#include "../decoder.hpp"
#include "../fileset.hpp"
#include "../tile_stream.hpp"
#include "../types/result.hpp"
#include "../types/tile.hpp"

namespace frameio {

/// @brief Shared machinery of the copy path
///
/// For each plan: zero a tile buffer in the read type, let the backend load
/// every read range (load_ranges() calls decode_into_tile() with the raw bytes),
/// apply the corrections, then yield the buffer. The buffer is reused, so a
/// tile is only valid until the next pull.
///
/// Derived classes decide how the raw bytes are obtained.
class CopyTileGenerator : public TileGenerator {
protected:
    OpenFileSet files_;
    std::vector<TileReadPlan> plans_;
    ElementType native_type_;
    ElementType read_type_;
    std::shared_ptr<const Decoder> decoder_;
    std::shared_ptr<const CorrectionSet> corrections_;

    std::size_t next_plan_{0};
    std::vector<std::byte> tile_buffer_;
    Tile tile_;

    /// Fill the current tile buffer with every range of plan
    [[nodiscard]] virtual Result<void> load_ranges(const TileReadPlan& plan) noexcept = 0;

    /// @brief Decode raw bytes of one range into the tile buffer
    /// @param input Raw bytes; may be a leading part of the range (see element_offset)
    /// @param range Range the bytes belong to
    /// @param element_offset Elements of the range already decoded before input
    [[nodiscard]] Result<void> decode_into_tile(std::span<const std::byte> input,
                                                const ReadRange& range,
                                                uint64_t element_offset = 0) noexcept {
        const std::size_t in_size = native_type_.size();
        const std::size_t out_size = read_type_.size();
        if (input.size() % in_size != 0) {
            return Err(Error::Code::InvalidArgument,
                       "read of " + std::to_string(input.size()) + " bytes splits a " +
                       native_type_.name() + " element");
        }
        const uint64_t count = input.size() / in_size;
        const uint64_t first = range.tile_offset + element_offset;
        if ((first + count) * out_size > tile_buffer_.size()) {
            return Err(Error::Code::OutOfBounds,
                       "read range at tile offset " + std::to_string(range.tile_offset) +
                       " overflows the tile");
        }
        std::span<std::byte> output(tile_buffer_.data() + first * out_size, count * out_size);
        return decode_range(decoder_.get(), input, native_type_, output, read_type_);
    }

    /// Whether a range can be decoded in independent element-aligned pieces
    [[nodiscard]] bool can_split_ranges() const noexcept {
        return decoder_ == nullptr;
    }

public:
    CopyTileGenerator(OpenFileSet files, const TileRequest& request)
        : files_(std::move(files))
        , plans_(request.read_plans.begin(), request.read_plans.end())
        , native_type_(request.native_type)
        , read_type_(request.read_type)
        , decoder_(request.decoder)
        , corrections_(request.corrections) {}

    [[nodiscard]] Result<const Tile*> next() noexcept override {
        if (next_plan_ >= plans_.size()) {
            return Ok(static_cast<const Tile*>(nullptr));
        }
        const TileReadPlan& plan = plans_[next_plan_++];
        const TileSlice& slice = plan.slice;

        tile_buffer_.assign(slice.num_elements() * read_type_.size(), std::byte{0});
        auto loaded = load_ranges(plan);
        if (!loaded) {
            return loaded.error();
        }

        MutableFrameView view{tile_buffer_.data(), slice.num_frames, slice.sig_count,
                              slice.sig_count * read_type_.size(), read_type_};
        if (corrections_ && corrections_->has_corrections()) {
            auto corrected = BackendStrategy::apply_corrections(view, slice, corrections_.get());
            if (!corrected) {
                return corrected.error();
            }
        }

        tile_.slice = slice;
        tile_.data = frameio::as_const(view);
        tile_.zero_copy = false;
        return Ok(static_cast<const Tile*>(&tile_));
    }

    void close() noexcept override {
        files_.close();
        tile_buffer_.clear();
        tile_buffer_.shrink_to_fit();
        tile_.data = FrameView{};
    }
};

} // namespace frameio
