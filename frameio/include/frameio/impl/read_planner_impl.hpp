#pragma once

#include <algorithm>
#include <cstdint>
#include <string>
#include <vector>
#include "../fileset.hpp"
#include "../types/result.hpp"
#include "../types/tile.hpp"

#ifndef FRAMEIO_READ_PLANNER_HEADER
#include "../read_planner.hpp"
#endif

namespace frameio {

namespace detail {

    /// Append the read range of one frame, merging it into the previous range
    /// when both the file bytes and the tile positions are contiguous
    inline void append_frame_range(
        std::vector<ReadRange>& ranges,
        const FileSet& fileset,
        const TilingScheme& scheme,
        uint64_t physical_frame,
        std::size_t file_index,
        uint64_t tile_offset) noexcept {

        const FileLayout& layout = fileset[file_index];
        const std::size_t itemsize = layout.native_type.size();
        const std::size_t count = scheme.tile_sig_count();
        const uint64_t local = physical_frame - fileset.start_frame(file_index);

        ReadRange range;
        range.file_index = static_cast<uint32_t>(file_index);
        range.start = local * layout.frame_stride() + layout.frame_header + scheme.sig_start * itemsize;
        range.stop = range.start + count * itemsize;
        range.tile_offset = tile_offset;

        if (!ranges.empty()) {
            ReadRange& prev = ranges.back();
            const uint64_t prev_elements = prev.length() / itemsize;
            if (prev.file_index == range.file_index && prev.stop == range.start &&
                prev.tile_offset + prev_elements == range.tile_offset) {
                prev.stop = range.stop;
                return;
            }
        }
        ranges.push_back(range);
    }

} // namespace detail

inline Result<std::vector<TileReadPlan>> make_read_plans(
    const TilingScheme& scheme,
    const FileSet& fileset,
    uint64_t partition_start,
    uint64_t partition_end,
    int64_t sync_offset,
    const RoiMask* roi) {

    if (auto valid = scheme.validate(); !valid) {
        return valid.error();
    }
    if (auto valid = fileset.validate(); !valid) {
        return valid.error();
    }
    if (scheme.sig_size() != fileset[0].sig_size()) {
        return Err(Error::Code::InvalidArgument, "tiling scheme and fileset disagree on signal size");
    }
    const uint64_t total = fileset.total_frames();
    if (partition_start > partition_end || partition_end > total) {
        return Err(Error::Code::InvalidArgument,
                   "partition [" + std::to_string(partition_start) + ", " +
                   std::to_string(partition_end) + ") outside dataset of " +
                   std::to_string(total) + " frames");
    }
    if (roi != nullptr && roi->size() != total) {
        return Err(Error::Code::InvalidArgument,
                   "roi covers " + std::to_string(roi->size()) + " frames, dataset has " +
                   std::to_string(total));
    }

    // Logical frames to deliver, and the compacted index of the first one
    std::vector<uint64_t> frames;
    uint64_t origin = partition_start;
    if (roi == nullptr) {
        frames.reserve(partition_end - partition_start);
        for (uint64_t n = partition_start; n < partition_end; ++n) {
            frames.push_back(n);
        }
    } else {
        origin = 0;
        for (uint64_t n = 0; n < partition_start; ++n) {
            origin += (*roi)[n] ? 1 : 0;
        }
        for (uint64_t n = partition_start; n < partition_end; ++n) {
            if ((*roi)[n]) {
                frames.push_back(n);
            }
        }
    }

    const std::size_t sig_count = scheme.tile_sig_count();
    std::vector<TileReadPlan> plans;
    plans.reserve((frames.size() + scheme.depth - 1) / scheme.depth);

    for (std::size_t first = 0; first < frames.size(); first += scheme.depth) {
        const std::size_t depth = std::min(scheme.depth, frames.size() - first);

        TileReadPlan plan;
        plan.slice.frame_origin = origin + first;
        plan.slice.num_frames = depth;
        plan.slice.sig_start = scheme.sig_start;
        plan.slice.sig_count = sig_count;
        plan.slice.sig_shape = scheme.sig_shape;

        for (std::size_t row = 0; row < depth; ++row) {
            const int64_t physical = static_cast<int64_t>(frames[first + row]) + sync_offset;
            if (physical < 0 || static_cast<uint64_t>(physical) >= total) {
                continue;
            }
            auto file_index = fileset.file_for_frame(static_cast<uint64_t>(physical));
            if (!file_index) {
                return file_index.error();
            }
            detail::append_frame_range(plan.ranges, fileset, scheme,
                                       static_cast<uint64_t>(physical), file_index.value(),
                                       row * sig_count);
        }
        plans.push_back(std::move(plan));
    }

    return Ok(std::move(plans));
}

} // namespace frameio
