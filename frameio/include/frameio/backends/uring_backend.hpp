#pragma once

#if defined(__linux__)

#include <algorithm>
#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <iostream>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include <liburing.h>
#include <nlohmann/json.hpp>
#include "copy_tile_generator.hpp"
#include "../backend.hpp"
#include "../config.hpp"
#include "../fileset.hpp"
#include "../tile_stream.hpp"
#include "../types/result.hpp"
#include "../types/tile.hpp"

namespace frameio {

namespace uring_impl {

    /// One read in flight: fd-relative offset and destination, advanced on short reads
    struct PendingRead {
        int fd;
        uint64_t offset;
        std::byte* dest;
        std::size_t remaining;
    };

    /// @brief Copy path submitting the reads of each tile to io_uring
    ///
    /// All ranges of a plan are read into one staging buffer, at most
    /// queue_depth reads in flight at a time, and decoded once every read of
    /// the tile has completed. init_ring() must succeed before the first tile.
    class UringTileGenerator final : public CopyTileGenerator {
    private:
        std::unique_ptr<io_uring> ring_;
        uint32_t queue_depth_{0};
        std::size_t max_io_size_;
        std::vector<std::byte> staging_;
        std::vector<PendingRead> reads_;

        void release_ring() noexcept {
            if (ring_) {
                io_uring_queue_exit(ring_.get());
                ring_.reset();
            }
        }

        [[nodiscard]] Result<void> run_reads() noexcept {
            if (!ring_) {
                return Err(Error::Code::IoUringError, "io_uring is not initialized");
            }
            std::vector<std::size_t> queue(reads_.size());
            for (std::size_t i = 0; i < queue.size(); ++i) {
                queue[i] = i;
            }

            while (!queue.empty()) {
                const std::size_t batch = std::min<std::size_t>(queue.size(), queue_depth_);
                for (std::size_t i = 0; i < batch; ++i) {
                    io_uring_sqe* sqe = io_uring_get_sqe(ring_.get());
                    if (sqe == nullptr) {
                        return Err(Error::Code::IoUringError, "io_uring submission queue is full");
                    }
                    const PendingRead& read = reads_[queue[i]];
                    io_uring_prep_read(sqe, read.fd, read.dest, static_cast<unsigned>(read.remaining), read.offset);
                    io_uring_sqe_set_data(sqe, reinterpret_cast<void*>(static_cast<uintptr_t>(queue[i])));
                }

                int submitted = io_uring_submit(ring_.get());
                if (submitted < 0) {
                    return Err(Error::Code::IoUringError,
                               "io_uring_submit failed: " + std::string(std::strerror(-submitted)));
                }

                // Reap every submitted read before reporting a failure; the kernel writes into staging_
                std::vector<std::size_t> retry;
                Error failure{Error::Code::Success};
                for (int n = 0; n < submitted; ++n) {
                    io_uring_cqe* cqe = nullptr;
                    int ret = io_uring_wait_cqe(ring_.get(), &cqe);
                    if (ret < 0) {
                        return Err(Error::Code::IoUringError,
                                   "io_uring_wait_cqe failed: " + std::string(std::strerror(-ret)));
                    }
                    const auto index = static_cast<std::size_t>(
                        reinterpret_cast<uintptr_t>(io_uring_cqe_get_data(cqe)));
                    const int res = cqe->res;
                    io_uring_cqe_seen(ring_.get(), cqe);

                    PendingRead& read = reads_[index];
                    if (res < 0) {
                        failure = Err(Error::Code::ReadError, "io_uring read failed: " + std::string(std::strerror(-res)));
                    } else if (res == 0) {
                        failure = Err(Error::Code::UnexpectedEndOfFile, "io_uring read hit end of file");
                    } else {
                        const auto done = static_cast<std::size_t>(res);
                        read.offset += done;
                        read.dest += done;
                        read.remaining -= done;
                        if (read.remaining > 0) {
                            retry.push_back(index);
                        }
                    }
                }
                if (failure.is_error()) {
                    return failure;
                }
                if (static_cast<std::size_t>(submitted) != batch) {
                    return Err(Error::Code::IoUringError,
                               "io_uring accepted " + std::to_string(submitted) + " of " +
                               std::to_string(batch) + " reads");
                }

                retry.insert(retry.end(), queue.begin() + static_cast<std::ptrdiff_t>(batch), queue.end());
                queue = std::move(retry);
            }
            return Ok();
        }

    protected:
        [[nodiscard]] Result<void> load_ranges(const TileReadPlan& plan) noexcept override {
            uint64_t total = 0;
            for (const auto& range : plan.ranges) {
                total += range.length();
            }
            staging_.resize(static_cast<std::size_t>(total));
            reads_.clear();

            const std::size_t itemsize = native_type_.size();
            const std::size_t chunk = can_split_ranges()
                ? std::max(itemsize, max_io_size_ - max_io_size_ % itemsize)
                : 0;

            std::size_t offset = 0;
            for (const auto& range : plan.ranges) {
                auto fd = files_[range.file_index].fileno();
                if (!fd) {
                    return fd.error();
                }
                const uint64_t base = files_[range.file_index].layout().file_header + range.start;
                const uint64_t length = range.length();
                const uint64_t step = chunk == 0 ? length : chunk;
                for (uint64_t done = 0; done < length; done += step) {
                    const auto size = static_cast<std::size_t>(std::min<uint64_t>(step, length - done));
                    reads_.push_back(PendingRead{fd.value(), base + done, staging_.data() + offset + done, size});
                }
                offset += static_cast<std::size_t>(length);
            }

            if (auto r = run_reads(); !r) {
                return r;
            }

            offset = 0;
            for (const auto& range : plan.ranges) {
                auto input = std::span<const std::byte>(staging_.data() + offset,
                                                        static_cast<std::size_t>(range.length()));
                if (auto decoded = decode_into_tile(input, range); !decoded) {
                    return decoded;
                }
                offset += static_cast<std::size_t>(range.length());
            }
            return Ok();
        }

    public:
        UringTileGenerator(OpenFileSet files, const TileRequest& request, std::size_t max_io_size)
            : CopyTileGenerator(std::move(files), request)
            , max_io_size_(max_io_size) {}

        ~UringTileGenerator() override { release_ring(); }

        /// Set up the ring, halving the queue depth while the kernel refuses for lack of memory
        [[nodiscard]] Result<void> init_ring(uint32_t queue_depth) noexcept {
            release_ring();
            ring_ = std::make_unique<io_uring>();
            int ret = -ENOMEM;
            uint32_t depth = queue_depth;
            while (depth >= 1) {
                ret = io_uring_queue_init(depth, ring_.get(), 0);
                if (ret == -ENOMEM && depth > 1) {
                    depth /= 2;
                    continue;
                }
                break;
            }
            if (ret < 0) {
                ring_.reset();
                return Err(Error::Code::IoUringError,
                           "Failed to initialize io_uring: " + std::string(std::strerror(-ret)) +
                           " (tried queue_depth down to " + std::to_string(depth) + "). " +
                           "Try increasing RLIMIT_MEMLOCK with: ulimit -l unlimited");
            }
            queue_depth_ = depth;
            return Ok();
        }

        [[nodiscard]] uint32_t queue_depth() const noexcept { return queue_depth_; }

        void close() noexcept override {
            release_ring();
            CopyTileGenerator::close();
            staging_.clear();
            staging_.shrink_to_fit();
            reads_.clear();
        }
    };

} // namespace uring_impl

/// @brief Backend "uring": batched asynchronous reads with io_uring
///
/// Like the buffered backend it always copies. Each stream owns a ring of
/// queue_depth entries; every tile's reads are submitted together and reaped
/// before the tile is decoded.
///
/// Record fields: "verbose", "queue_depth" (default 64), "max_io_size" (default 1 MiB).
/// Requires Linux 5.1+ and liburing.
class UringBackend final : public BackendStrategy {
public:
    struct Config {
        bool verbose = false;
        std::size_t queue_depth = 64;
        std::size_t max_io_size = default_max_io_size;
    };

private:
    Config config_;

public:
    UringBackend() noexcept : UringBackend(Config{}) {}

    explicit UringBackend(const Config& config) noexcept
        : BackendStrategy(config.verbose)
        , config_(config) {}

    [[nodiscard]] static Result<std::unique_ptr<BackendStrategy>> from_json(const nlohmann::json& record) noexcept {
        Config parsed;
        if (auto r = config::read_bool(record, "verbose", parsed.verbose); !r) {
            return r.error();
        }
        if (auto r = config::read_size(record, "queue_depth", parsed.queue_depth); !r) {
            return r.error();
        }
        if (auto r = config::read_size(record, "max_io_size", parsed.max_io_size); !r) {
            return r.error();
        }
        std::unique_ptr<BackendStrategy> backend = std::make_unique<UringBackend>(parsed);
        return Ok(std::move(backend));
    }

    [[nodiscard]] std::string_view id() const noexcept override { return "uring"; }
    [[nodiscard]] std::string_view name() const noexcept override { return "UringBackend"; }
    [[nodiscard]] std::size_t max_io_size() const noexcept override { return config_.max_io_size; }

    [[nodiscard]] const Config& config() const noexcept { return config_; }

    [[nodiscard]] Result<TileStream> produce_tiles(const TileRequest& request) const noexcept override {
        if (auto valid = validate_request(request); !valid) {
            return valid.error();
        }
        if (!requires_copy(request) && verbose_) {
            std::cerr << name() << ": zero-copy eligible, reading through io_uring\n";
        }

        auto files = request.fileset->open();
        if (!files) {
            return files.error();
        }
        auto generator = std::make_unique<uring_impl::UringTileGenerator>(
            std::move(files.value()), request, config_.max_io_size);
        const auto depth = static_cast<uint32_t>(std::min<std::size_t>(config_.queue_depth, 4096));
        if (auto ring = generator->init_ring(depth); !ring) {
            return ring.error();
        }
        if (verbose_ && generator->queue_depth() != depth) {
            std::cerr << name() << ": queue depth reduced to " << generator->queue_depth() << "\n";
        }
        return Ok(TileStream(std::unique_ptr<TileGenerator>(std::move(generator))));
    }
};

} // namespace frameio

#endif // __linux__
