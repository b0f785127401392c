#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <iostream>
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

namespace buffered_impl {

    /// @brief Copy path reading through the file descriptor into a staging buffer
    ///
    /// Consecutive ranges of a plan that lie in the same file, in increasing
    /// order, are read with a single seek + read when their combined span fits
    /// in max_io_size (bytes between the ranges, such as frame headers, are read
    /// and skipped). A range longer than max_io_size is read in element-aligned
    /// pieces unless a decoder needs it whole.
    class BufferedTileGenerator final : public CopyTileGenerator {
    private:
        std::size_t max_io_size_;
        std::vector<std::byte> staging_;

        [[nodiscard]] Result<void> read_at(std::size_t file_index, uint64_t start, std::size_t size) noexcept {
            FileHandle& file = files_[file_index];
            staging_.resize(size);
            if (auto r = file.seek(file.layout().file_header + start); !r) {
                return r;
            }
            return file.read_into(std::span<std::byte>(staging_.data(), size));
        }

        [[nodiscard]] Result<void> load_large_range(const ReadRange& range) noexcept {
            const std::size_t itemsize = native_type_.size();
            const std::size_t chunk = std::max(itemsize, max_io_size_ - max_io_size_ % itemsize);
            for (uint64_t done = 0; done < range.length(); done += chunk) {
                const std::size_t size = static_cast<std::size_t>(std::min<uint64_t>(chunk, range.length() - done));
                if (auto r = read_at(range.file_index, range.start + done, size); !r) {
                    return r;
                }
                auto decoded = decode_into_tile(std::span<const std::byte>(staging_.data(), size),
                                                range, done / itemsize);
                if (!decoded) {
                    return decoded;
                }
            }
            return Ok();
        }

    protected:
        [[nodiscard]] Result<void> load_ranges(const TileReadPlan& plan) noexcept override {
            const auto& ranges = plan.ranges;
            std::size_t first = 0;
            while (first < ranges.size()) {
                const ReadRange& head = ranges[first];
                if (head.length() > max_io_size_ && can_split_ranges()) {
                    if (auto r = load_large_range(head); !r) {
                        return r;
                    }
                    ++first;
                    continue;
                }

                // Extend the group while the next range follows in the same file
                std::size_t last = first + 1;
                while (last < ranges.size() &&
                       ranges[last].file_index == head.file_index &&
                       ranges[last].start >= ranges[last - 1].stop &&
                       ranges[last].stop - head.start <= max_io_size_) {
                    ++last;
                }
                const uint64_t span = ranges[last - 1].stop - head.start;
                if (auto r = read_at(head.file_index, head.start, static_cast<std::size_t>(span)); !r) {
                    return r;
                }
                for (std::size_t i = first; i < last; ++i) {
                    const ReadRange& range = ranges[i];
                    auto input = std::span<const std::byte>(staging_.data() + (range.start - head.start),
                                                            static_cast<std::size_t>(range.length()));
                    if (auto decoded = decode_into_tile(input, range); !decoded) {
                        return decoded;
                    }
                }
                first = last;
            }
            return Ok();
        }

    public:
        BufferedTileGenerator(OpenFileSet files, const TileRequest& request, std::size_t max_io_size)
            : CopyTileGenerator(std::move(files), request)
            , max_io_size_(max_io_size) {}

        void close() noexcept override {
            CopyTileGenerator::close();
            staging_.clear();
            staging_.shrink_to_fit();
        }
    };

} // namespace buffered_impl

/// @brief Backend "buffered": explicit reads through a bounded staging buffer
///
/// Never yields views: every tile is read with seek()/read_into() and decoded
/// into a buffer owned by the stream, so supports_zero_copy() is false and the
/// eligibility decision only affects logging. Useful where mapping files is slow
/// or unavailable (network file systems, cold storage).
///
/// Record fields: "verbose", "buffer_size" (bytes per read, default 16 MiB).
class BufferedBackend final : public BackendStrategy {
public:
    static constexpr std::size_t default_buffer_size = std::size_t{16} << 20;

    struct Config {
        bool verbose = false;
        std::size_t buffer_size = default_buffer_size;
    };

private:
    Config config_;

public:
    BufferedBackend() noexcept : BufferedBackend(Config{}) {}

    explicit BufferedBackend(const Config& config) noexcept
        : BackendStrategy(config.verbose)
        , config_(config) {}

    [[nodiscard]] static Result<std::unique_ptr<BackendStrategy>> from_json(const nlohmann::json& record) noexcept {
        Config parsed;
        if (auto r = config::read_bool(record, "verbose", parsed.verbose); !r) {
            return r.error();
        }
        if (auto r = config::read_size(record, "buffer_size", parsed.buffer_size); !r) {
            return r.error();
        }
        std::unique_ptr<BackendStrategy> backend = std::make_unique<BufferedBackend>(parsed);
        return Ok(std::move(backend));
    }

    [[nodiscard]] std::string_view id() const noexcept override { return "buffered"; }
    [[nodiscard]] std::string_view name() const noexcept override { return "BufferedBackend"; }
    [[nodiscard]] std::size_t max_io_size() const noexcept override { return config_.buffer_size; }

    [[nodiscard]] const Config& config() const noexcept { return config_; }

    [[nodiscard]] Result<TileStream> produce_tiles(const TileRequest& request) const noexcept override {
        if (auto valid = validate_request(request); !valid) {
            return valid.error();
        }
        if (!requires_copy(request) && verbose_) {
            std::cerr << name() << ": zero-copy eligible, reading through buffers\n";
        }

        auto files = request.fileset->open();
        if (!files) {
            return files.error();
        }
        std::unique_ptr<TileGenerator> generator = std::make_unique<buffered_impl::BufferedTileGenerator>(
            std::move(files.value()), request, config_.buffer_size);
        return Ok(TileStream(std::move(generator)));
    }
};

} // namespace frameio
