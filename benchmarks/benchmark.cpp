#include <benchmark/benchmark.h>
#include <cstdint>
#include <string>

#include "benchmark_helpers.hpp"

#include "../frameio/include/frameio/backends/buffered_backend.hpp"
#include "../frameio/include/frameio/backends/mmap_backend.hpp"
#include "../frameio/include/frameio/corrections.hpp"
#include "../frameio/include/frameio/read_planner.hpp"
#ifdef FRAMEIO_HAVE_LIBURING
#include "../frameio/include/frameio/backends/uring_backend.hpp"
#endif

using namespace frameio;
using namespace frameio_bench;

namespace {

/// Delivery path exercised by a benchmark
enum class ReadMode { Native, Convert, Corrected };

TileRequest make_request(const TilingScheme& scheme, const FileSet& fileset,
                         const std::vector<TileReadPlan>& plans, ReadMode mode,
                         const std::shared_ptr<const CorrectionSet>& corrections) {
    TileRequest request;
    request.tiling_scheme = &scheme;
    request.fileset = &fileset;
    request.read_plans = plans;
    request.native_type = fileset[0].native_type;
    request.read_type = mode == ReadMode::Native ? request.native_type : element_type_of<float>();
    if (mode == ReadMode::Corrected) {
        request.corrections = corrections;
    }
    return request;
}

} // namespace

// ============================================================================
// Full dataset pass
// ============================================================================

template <typename Backend>
static void BM_ReadAllTiles(benchmark::State& state) {
    // Parameters: frame width, tile depth, read mode
    const std::size_t width = static_cast<std::size_t>(state.range(0));
    const std::size_t depth = static_cast<std::size_t>(state.range(1));
    const ReadMode mode = static_cast<ReadMode>(state.range(2));

    DatasetConfig config{width, width, 64, 4};
    TempFileManager temp_mgr;
    DatasetGenerator gen(temp_mgr);
    FileSet fileset = gen.create_dataset("read_all_" + config.name(), config);

    TilingScheme scheme{depth, {width, width}};
    auto plans = make_read_plans(scheme, fileset);
    if (!plans) {
        state.SkipWithError(("Failed to plan reads " + plans.error().message).c_str());
        return;
    }

    auto corrections = std::make_shared<PixelCorrections>(
        std::vector<float>(config.sig_size(), 1.0f), std::vector<float>(config.sig_size(), 0.5f));
    const TileRequest request = make_request(scheme, fileset, plans.value(), mode, corrections);

    Backend backend;
    for (auto _ : state) {
        auto stream = backend.produce_tiles(request);
        if (!stream) {
            state.SkipWithError(("Failed to produce tiles " + stream.error().message).c_str());
            return;
        }
        while (true) {
            auto tile = stream.value().next();
            if (!tile) {
                state.SkipWithError(("Failed to read tile " + tile.error().message).c_str());
                return;
            }
            if (tile.value() == nullptr) {
                break;
            }
            benchmark::DoNotOptimize(tile.value()->data.data);
        }
    }

    state.SetBytesProcessed(static_cast<int64_t>(state.iterations() * config.num_bytes()));
}

// ============================================================================
// Signal subrange (partial frames)
// ============================================================================

template <typename Backend>
static void BM_ReadSignalBand(benchmark::State& state) {
    // Parameters: frame width, number of rows in the band
    const std::size_t width = static_cast<std::size_t>(state.range(0));
    const std::size_t rows = static_cast<std::size_t>(state.range(1));

    DatasetConfig config{width, width, 128, 2, 8};
    TempFileManager temp_mgr;
    DatasetGenerator gen(temp_mgr);
    FileSet fileset = gen.create_dataset("band_" + config.name(), config);

    TilingScheme scheme{16, {width, width}, (width / 2) * width, rows * width};
    auto plans = make_read_plans(scheme, fileset);
    if (!plans) {
        state.SkipWithError(("Failed to plan reads " + plans.error().message).c_str());
        return;
    }
    const TileRequest request = make_request(scheme, fileset, plans.value(), ReadMode::Native, nullptr);

    Backend backend;
    std::size_t bytes_processed = 0;
    for (auto _ : state) {
        auto stream = backend.produce_tiles(request);
        if (!stream) {
            state.SkipWithError(("Failed to produce tiles " + stream.error().message).c_str());
            return;
        }
        while (true) {
            auto tile = stream.value().next();
            if (!tile) {
                state.SkipWithError(("Failed to read tile " + tile.error().message).c_str());
                return;
            }
            if (tile.value() == nullptr) {
                break;
            }
            const FrameView& data = tile.value()->data;
            bytes_processed += data.num_frames * data.frame_elements * data.dtype.size();
            benchmark::DoNotOptimize(data.data);
        }
    }

    state.SetBytesProcessed(static_cast<int64_t>(bytes_processed));
}

// ============================================================================
// Benchmark Registration
// ============================================================================

BENCHMARK(BM_ReadAllTiles<MMapBackend>)
    ->Args({256, 16, 0})    // 256x256, depth 16, zero-copy
    ->Args({256, 16, 1})    // 256x256, depth 16, u16 -> f32
    ->Args({256, 16, 2})    // 256x256, depth 16, corrected
    ->Args({512, 48, 0})    // tiles straddle files
    ->Args({512, 48, 1})
    ->Name("MMap/ReadAllTiles")
    ->Unit(benchmark::kMillisecond);

BENCHMARK(BM_ReadAllTiles<BufferedBackend>)
    ->Args({256, 16, 0})
    ->Args({256, 16, 1})
    ->Args({256, 16, 2})
    ->Args({512, 48, 0})
    ->Args({512, 48, 1})
    ->Name("Buffered/ReadAllTiles")
    ->Unit(benchmark::kMillisecond);

BENCHMARK(BM_ReadSignalBand<MMapBackend>)
    ->Args({512, 8})
    ->Args({512, 64})
    ->Name("MMap/ReadSignalBand")
    ->Unit(benchmark::kMillisecond);

BENCHMARK(BM_ReadSignalBand<BufferedBackend>)
    ->Args({512, 8})
    ->Args({512, 64})
    ->Name("Buffered/ReadSignalBand")
    ->Unit(benchmark::kMillisecond);

#ifdef FRAMEIO_HAVE_LIBURING
BENCHMARK(BM_ReadAllTiles<UringBackend>)
    ->Args({256, 16, 0})
    ->Args({256, 16, 1})
    ->Args({256, 16, 2})
    ->Args({512, 48, 0})
    ->Args({512, 48, 1})
    ->Name("Uring/ReadAllTiles")
    ->Unit(benchmark::kMillisecond);

BENCHMARK(BM_ReadSignalBand<UringBackend>)
    ->Args({512, 8})
    ->Args({512, 64})
    ->Name("Uring/ReadSignalBand")
    ->Unit(benchmark::kMillisecond);
#endif // FRAMEIO_HAVE_LIBURING

BENCHMARK_MAIN();
