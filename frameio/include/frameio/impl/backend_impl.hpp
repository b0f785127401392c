#pragma once

#include <iostream>
#include <string>
#include "../corrections.hpp"
#include "../fileset.hpp"
#include "../types/result.hpp"
#include "../types/tile.hpp"

#ifndef FRAMEIO_BACKEND_HEADER
#include "../backend.hpp"
#endif

namespace frameio {

inline CopyReason BackendStrategy::copy_reason(
    const RoiMask* roi,
    ElementType native_type,
    ElementType read_type,
    bool decoder_present,
    const TilingScheme* tiling_scheme,
    const FileSet* fileset,
    int64_t sync_offset,
    const CorrectionSet* corrections) noexcept {

    if (roi != nullptr) {
        return CopyReason::Roi;
    }
    if (needs_decode(decoder_present, native_type, read_type)) {
        return CopyReason::Decode;
    }
    // A tile may straddle a file boundary only if some file is shorter than a tile
    if (tiling_scheme != nullptr && fileset != nullptr &&
        fileset->min_frames_per_file() < tiling_scheme->depth) {
        return CopyReason::FileTooSmallForTile;
    }
    if (corrections != nullptr && corrections->has_corrections()) {
        return CopyReason::Corrections;
    }
    if (sync_offset < 0) {
        return CopyReason::NegativeSyncOffset;
    }
    return CopyReason::None;
}

inline CopyReason BackendStrategy::copy_reason(const TileRequest& request) noexcept {
    return copy_reason(request.roi, request.native_type, request.read_type,
                       request.decoder != nullptr, request.tiling_scheme, request.fileset,
                       request.sync_offset, request.corrections.get());
}

inline bool BackendStrategy::requires_copy(
    const RoiMask* roi,
    ElementType native_type,
    ElementType read_type,
    bool decoder_present,
    const TilingScheme* tiling_scheme,
    const FileSet* fileset,
    int64_t sync_offset,
    const CorrectionSet* corrections) const noexcept {

    CopyReason reason = copy_reason(roi, native_type, read_type, decoder_present,
                                    tiling_scheme, fileset, sync_offset, corrections);
    if (verbose_ && reason != CopyReason::None) {
        std::cerr << name() << ": need copy (" << to_string(reason) << ")\n";
    }
    return reason != CopyReason::None;
}

inline bool BackendStrategy::requires_copy(const TileRequest& request) const noexcept {
    return requires_copy(request.roi, request.native_type, request.read_type,
                         request.decoder != nullptr, request.tiling_scheme, request.fileset,
                         request.sync_offset, request.corrections.get());
}

inline Result<void> BackendStrategy::validate_request(const TileRequest& request) noexcept {
    if (request.tiling_scheme == nullptr || request.fileset == nullptr) {
        return Err(Error::Code::InvalidArgument, "tile production needs a tiling scheme and a fileset");
    }
    if (auto valid = request.tiling_scheme->validate(); !valid) {
        return valid.error();
    }
    if (auto valid = request.fileset->validate(); !valid) {
        return valid.error();
    }
    const FileSet& fileset = *request.fileset;
    if (!(fileset[0].native_type == request.native_type)) {
        return Err(Error::Code::InvalidArgument,
                   "request native type " + request.native_type.name() +
                   " differs from the fileset's " + fileset[0].native_type.name());
    }
    if (request.tiling_scheme->sig_size() != fileset[0].sig_size()) {
        return Err(Error::Code::InvalidArgument, "tiling scheme and fileset disagree on signal size");
    }
    if (request.roi != nullptr && request.roi->size() != fileset.total_frames()) {
        return Err(Error::Code::InvalidArgument,
                   "roi covers " + std::to_string(request.roi->size()) + " frames, dataset has " +
                   std::to_string(fileset.total_frames()));
    }
    for (const auto& plan : request.read_plans) {
        for (const auto& range : plan.ranges) {
            if (range.file_index >= fileset.size() || range.stop < range.start) {
                return Err(Error::Code::OutOfBounds,
                           "read range of tile at frame " + std::to_string(plan.slice.frame_origin) +
                           " references no valid file range");
            }
        }
    }
    return Ok();
}

} // namespace frameio
