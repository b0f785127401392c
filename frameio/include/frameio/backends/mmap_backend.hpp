#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>
#include "copy_tile_generator.hpp"
#include "../backend.hpp"
#include "../config.hpp"
#include "../fileset.hpp"
#include "../tile_stream.hpp"
#include "../types/result.hpp"
#include "../types/tile.hpp"

namespace frameio {

namespace mmap_impl {

    /// Contiguous frames of one tile that live in one file
    struct FileRun {
        std::size_t file_index;
        std::size_t local_frame;  ///< First frame, relative to the file
        std::size_t num_frames;
        std::size_t row;          ///< First row in the tile
    };

    /// @brief Zero-copy path: tiles are strided views into the mapped files
    /// A tile crossing a file boundary is delivered as one tile per file. A tile
    /// reaching past the end of the dataset is shortened to the frames that exist.
    class ViewTileGenerator final : public TileGenerator {
    private:
        OpenFileSet files_;
        std::vector<TileReadPlan> plans_;
        bool readahead_hints_;
        std::size_t next_plan_{0};
        const TileReadPlan* plan_{nullptr};
        std::deque<FileRun> runs_;
        Tile tile_;

        [[nodiscard]] Result<FileRun> run_of_range(const ReadRange& range, const TileSlice& slice) const noexcept {
            const FileLayout& layout = files_[range.file_index].layout();
            const std::size_t itemsize = layout.native_type.size();
            const std::size_t stride = layout.frame_stride();
            const std::size_t row_offset = layout.frame_header + slice.sig_start * itemsize;
            const std::size_t row_bytes = slice.sig_count * itemsize;

            if (slice.sig_count == 0 || range.start < row_offset || (range.start - row_offset) % stride != 0 ||
                range.length() < row_bytes || (range.length() - row_bytes) % stride != 0 ||
                range.tile_offset % slice.sig_count != 0) {
                return Err(Error::Code::InvalidArgument,
                           "read range of tile at frame " + std::to_string(slice.frame_origin) +
                           " is not a run of whole tile rows");
            }
            FileRun run{range.file_index,
                        static_cast<std::size_t>((range.start - row_offset) / stride),
                        static_cast<std::size_t>((range.length() - row_bytes) / stride + 1),
                        static_cast<std::size_t>(range.tile_offset / slice.sig_count)};
            if (run.local_frame + run.num_frames > layout.num_frames) {
                return Err(Error::Code::OutOfBounds, "read range beyond the end of " + layout.path);
            }
            return Ok(run);
        }

        /// @brief Group the ranges of plan into per-file runs of leading rows
        /// Rows after the first one without a range (frames past the end of the
        /// dataset under a positive sync offset) are not delivered; a plan with
        /// no leading row yields no tile.
        [[nodiscard]] Result<void> split_plan(const TileReadPlan& plan) noexcept {
            runs_.clear();
            std::size_t covered = 0;
            for (const auto& range : plan.ranges) {
                auto run = run_of_range(range, plan.slice);
                if (!run) {
                    return run.error();
                }
                FileRun next = run.value();
                if (next.row != covered) {
                    break;
                }
                if (!runs_.empty()) {
                    FileRun& prev = runs_.back();
                    if (prev.file_index == next.file_index &&
                        prev.local_frame + prev.num_frames == next.local_frame) {
                        prev.num_frames += next.num_frames;
                        covered += next.num_frames;
                        continue;
                    }
                }
                runs_.push_back(next);
                covered += next.num_frames;
            }
            return Ok();
        }

    public:
        ViewTileGenerator(OpenFileSet files, std::span<const TileReadPlan> plans, bool readahead_hints)
            : files_(std::move(files))
            , plans_(plans.begin(), plans.end())
            , readahead_hints_(readahead_hints) {}

        [[nodiscard]] Result<const Tile*> next() noexcept override {
            while (runs_.empty()) {
                if (next_plan_ >= plans_.size()) {
                    return Ok(static_cast<const Tile*>(nullptr));
                }
                plan_ = &plans_[next_plan_++];
                if (auto split = split_plan(*plan_); !split) {
                    return split.error();
                }
            }
            FileRun run = runs_.front();
            runs_.pop_front();

            const FileHandle& file = files_[run.file_index];
            auto decoded = file.decoded_view();
            if (!decoded) {
                return decoded.error();
            }
            if (readahead_hints_) {
                const std::size_t stride = file.layout().frame_stride();
                auto advised = file.advise_willneed(run.local_frame * stride, run.num_frames * stride);
                if (!advised) {
                    return advised.error();
                }
            }

            tile_.slice = plan_->slice;
            tile_.slice.frame_origin += run.row;
            tile_.slice.num_frames = run.num_frames;
            tile_.data = decoded.value().subview(run.local_frame, run.num_frames,
                                                 plan_->slice.sig_start, plan_->slice.sig_count);
            tile_.zero_copy = true;
            return Ok(static_cast<const Tile*>(&tile_));
        }

        void close() noexcept override {
            files_.close();
            runs_.clear();
            tile_.data = FrameView{};
        }
    };

    /// @brief Copy path of the mmap backend: decode straight out of the mapping
    /// Ranges longer than max_io_size are decoded in element-aligned pieces of at
    /// most max_io_size bytes, unless a decoder needs them whole.
    class MappedCopyTileGenerator final : public CopyTileGenerator {
    private:
        std::size_t max_io_size_;

    protected:
        [[nodiscard]] Result<void> load_ranges(const TileReadPlan& plan) noexcept override {
            const std::size_t itemsize = native_type_.size();
            const std::size_t chunk = std::max(itemsize, max_io_size_ - max_io_size_ % itemsize);
            for (const auto& range : plan.ranges) {
                auto raw = files_[range.file_index].raw_view();
                if (!raw) {
                    return raw.error();
                }
                if (range.stop > raw.value().size()) {
                    return Err(Error::Code::OutOfBounds,
                               "read range [" + std::to_string(range.start) + ", " +
                               std::to_string(range.stop) + ") beyond " +
                               files_[range.file_index].layout().path);
                }
                const uint64_t step = can_split_ranges() ? chunk : range.length();
                for (uint64_t done = 0; done < range.length(); done += step) {
                    const auto size = static_cast<std::size_t>(std::min<uint64_t>(step, range.length() - done));
                    auto decoded = decode_into_tile(raw.value().subspan(range.start + done, size),
                                                    range, done / itemsize);
                    if (!decoded) {
                        return decoded;
                    }
                }
            }
            return Ok();
        }

    public:
        MappedCopyTileGenerator(OpenFileSet files, const TileRequest& request, std::size_t max_io_size)
            : CopyTileGenerator(std::move(files), request)
            , max_io_size_(max_io_size) {}
    };

} // namespace mmap_impl

/// @brief Backend "mmap": maps every file and serves views when allowed
///
/// When requires_copy() is false tiles are strided views into the page cache
/// (Tile::zero_copy is set). Otherwise every range is decoded out of the mapping
/// into a tile buffer owned by the stream.
///
/// Record fields: "verbose", "readahead_hints" (madvise each view before
/// yielding it), "max_io_size" (largest piece decoded at once on the copy path).
class MMapBackend final : public BackendStrategy {
public:
    struct Config {
        bool verbose = false;
        bool readahead_hints = false;
        std::size_t max_io_size = default_max_io_size;
    };

private:
    Config config_;

public:
    MMapBackend() noexcept : MMapBackend(Config{}) {}

    explicit MMapBackend(const Config& config) noexcept
        : BackendStrategy(config.verbose)
        , config_(config) {}

    [[nodiscard]] static Result<std::unique_ptr<BackendStrategy>> from_json(const nlohmann::json& record) noexcept {
        Config parsed;
        if (auto r = config::read_bool(record, "verbose", parsed.verbose); !r) {
            return r.error();
        }
        if (auto r = config::read_bool(record, "readahead_hints", parsed.readahead_hints); !r) {
            return r.error();
        }
        if (auto r = config::read_size(record, "max_io_size", parsed.max_io_size); !r) {
            return r.error();
        }
        std::unique_ptr<BackendStrategy> backend = std::make_unique<MMapBackend>(parsed);
        return Ok(std::move(backend));
    }

    [[nodiscard]] std::string_view id() const noexcept override { return "mmap"; }
    [[nodiscard]] std::string_view name() const noexcept override { return "MMapBackend"; }
    [[nodiscard]] bool supports_zero_copy() const noexcept override { return true; }
    [[nodiscard]] std::size_t max_io_size() const noexcept override { return config_.max_io_size; }

    [[nodiscard]] const Config& config() const noexcept { return config_; }

    [[nodiscard]] Result<TileStream> produce_tiles(const TileRequest& request) const noexcept override {
        if (auto valid = validate_request(request); !valid) {
            return valid.error();
        }
        const bool copy = requires_copy(request);

        auto files = request.fileset->open();
        if (!files) {
            return files.error();
        }

        std::unique_ptr<TileGenerator> generator;
        if (copy) {
            generator = std::make_unique<mmap_impl::MappedCopyTileGenerator>(
                std::move(files.value()), request, config_.max_io_size);
        } else {
            generator = std::make_unique<mmap_impl::ViewTileGenerator>(
                std::move(files.value()), request.read_plans, config_.readahead_hints);
        }
        return Ok(TileStream(std::move(generator)));
    }
};

} // namespace frameio
