#pragma once

#include <cstdint>
#include <filesystem>
#include <random>
#include <string>
#include <vector>

#include <benchmark/benchmark.h>

#include "../frameio/include/frameio/fileset.hpp"
#include "../frameio/include/frameio/types/element_type.hpp"

namespace frameio_bench {

/// Dataset configuration
struct DatasetConfig {
    std::size_t frame_width;
    std::size_t frame_height;
    std::size_t frames_per_file;
    std::size_t num_files;
    std::size_t frame_header = 0;
    frameio::ElementType native_type = frameio::element_type_of<uint16_t>();

    std::string name() const;
    std::size_t sig_size() const { return frame_width * frame_height; }
    std::size_t total_frames() const { return frames_per_file * num_files; }
    std::size_t num_bytes() const { return total_frames() * sig_size() * native_type.size(); }
};

/// Temporary directory holding the benchmark datasets
class TempFileManager {
public:
    TempFileManager();
    ~TempFileManager();

    /// Get path for a temporary raw file
    std::filesystem::path get_temp_path(const std::string& name);

    /// Clean up all temporary files
    void cleanup_all();

private:
    std::filesystem::path temp_dir_;
    std::vector<std::filesystem::path> temp_files_;
};

/// Writes multi-file raw datasets filled with random samples
class DatasetGenerator {
public:
    explicit DatasetGenerator(TempFileManager& temp_mgr, uint64_t seed = 42)
        : temp_manager_(temp_mgr), rng_(seed) {}

    /// Create the files of a dataset and return their layouts
    frameio::FileSet create_dataset(const std::string& name, const DatasetConfig& config);

private:
    TempFileManager& temp_manager_;
    std::mt19937_64 rng_;
};

} // namespace frameio_bench
