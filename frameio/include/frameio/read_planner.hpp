#pragma once

#include <cstdint>
#include <vector>
#include "fileset.hpp"
#include "types/result.hpp"
#include "types/tile.hpp"

namespace frameio {

/// @brief Compute the ordered tile read plans of one partition
///
/// Tiles hold `scheme.depth` consecutive logical frames of the partition
/// [partition_start, partition_end) (the last tile may be shorter) and the
/// signal range of the scheme. With an ROI only selected frames are read and
/// tiles are packed from the selection; TileSlice::frame_origin is then the
/// position of the first frame in the compacted selection.
///
/// Logical frame n is stored at physical frame n + sync_offset. Frames whose
/// physical index falls outside the dataset get no read range, so they read as zeros.
///
/// @param scheme Tile shape
/// @param fileset Files of the dataset, in ReadRange::file_index order
/// @param partition_start First logical frame of the partition
/// @param partition_end One past the last logical frame of the partition
/// @param sync_offset Physical minus logical frame index
/// @param roi Optional frame selection over the whole dataset
/// @return Plans in delivery order
/// @retval InvalidArgument Bad scheme, partition or ROI size
[[nodiscard]] Result<std::vector<TileReadPlan>> make_read_plans(
    const TilingScheme& scheme,
    const FileSet& fileset,
    uint64_t partition_start,
    uint64_t partition_end,
    int64_t sync_offset = 0,
    const RoiMask* roi = nullptr);

/// @brief Plans for the whole dataset, as one partition
[[nodiscard]] inline Result<std::vector<TileReadPlan>> make_read_plans(
    const TilingScheme& scheme,
    const FileSet& fileset) {
    return make_read_plans(scheme, fileset, 0, fileset.total_frames());
}

} // namespace frameio

#define FRAMEIO_READ_PLANNER_HEADER
#include "impl/read_planner_impl.hpp"
