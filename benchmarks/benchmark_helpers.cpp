#include "benchmark_helpers.hpp"

#include <fstream>
#include <sstream>
#include <unistd.h>

namespace frameio_bench {

std::string DatasetConfig::name() const {
    std::ostringstream oss;
    oss << frame_width << "x" << frame_height << "x" << total_frames();
    if (num_files > 1) {
        oss << "_" << num_files << "files";
    }
    if (frame_header > 0) {
        oss << "_hdr" << frame_header;
    }
    return oss.str();
}

// ============================================================================
// TempFileManager
// ============================================================================

TempFileManager::TempFileManager() {
    temp_dir_ = std::filesystem::temp_directory_path() /
                ("frameio_benchmarks_" + std::to_string(::getpid()));
    std::filesystem::create_directories(temp_dir_);
}

TempFileManager::~TempFileManager() {
    cleanup_all();
}

std::filesystem::path TempFileManager::get_temp_path(const std::string& name) {
    auto path = temp_dir_ / (name + ".raw");
    temp_files_.push_back(path);
    return path;
}

void TempFileManager::cleanup_all() {
    for (const auto& path : temp_files_) {
        std::error_code ec;
        std::filesystem::remove(path, ec);
    }
    temp_files_.clear();

    std::error_code ec;
    std::filesystem::remove(temp_dir_, ec);
}

// ============================================================================
// DatasetGenerator
// ============================================================================

frameio::FileSet DatasetGenerator::create_dataset(const std::string& name, const DatasetConfig& config) {
    std::vector<frameio::FileLayout> layouts;
    std::uniform_int_distribution<int> byte_dist(0, 255);

    for (std::size_t i = 0; i < config.num_files; ++i) {
        frameio::FileLayout layout;
        layout.path = temp_manager_.get_temp_path(name + "_" + std::to_string(i)).string();
        layout.native_type = config.native_type;
        layout.frame_header = config.frame_header;
        layout.sig_shape = {config.frame_height, config.frame_width};
        layout.num_frames = config.frames_per_file;

        // Random bytes are valid samples for every integer dtype
        std::vector<char> bytes(layout.expected_file_size());
        for (auto& b : bytes) {
            b = static_cast<char>(byte_dist(rng_));
        }
        std::ofstream file(layout.path, std::ios::binary | std::ios::trunc);
        file.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
        layouts.push_back(std::move(layout));
    }
    return frameio::FileSet(std::move(layouts));
}

} // namespace frameio_bench
