#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <string_view>
#include "corrections.hpp"
#include "decoder.hpp"
#include "fileset.hpp"
#include "tile_stream.hpp"
#include "types/element_type.hpp"
#include "types/result.hpp"
#include "types/tile.hpp"

namespace frameio {

/// @brief First condition that forbids zero-copy delivery
enum class CopyReason : uint8_t {
    None,                 ///< Views into the mapped files are allowed
    Roi,                  ///< A frame selection is given
    Decode,               ///< Native and read types differ, or a decoder is configured
    FileTooSmallForTile,  ///< Some file holds fewer frames than the tile depth
    Corrections,          ///< An active correction set is given
    NegativeSyncOffset    ///< Leading logical frames have no physical frame
};

[[nodiscard]] constexpr const char* to_string(CopyReason reason) noexcept {
    switch (reason) {
        case CopyReason::None: return "none";
        case CopyReason::Roi: return "roi";
        case CopyReason::Decode: return "decode";
        case CopyReason::FileTooSmallForTile: return "file too small for tile";
        case CopyReason::Corrections: return "corrections";
        case CopyReason::NegativeSyncOffset: return "negative sync offset";
    }
    return "?";
}

/// @brief Arguments of one tile production
/// @note The pointed-to scheme, fileset and ROI only need to outlive the
/// produce_tiles() call; the returned stream copies what it keeps.
struct TileRequest {
    const TilingScheme* tiling_scheme{nullptr};
    const FileSet* fileset{nullptr};
    std::span<const TileReadPlan> read_plans;
    const RoiMask* roi{nullptr};
    ElementType native_type;
    ElementType read_type;
    std::shared_ptr<const Decoder> decoder;
    std::shared_ptr<const CorrectionSet> corrections;
    int64_t sync_offset{0};
};

/// @brief Strategy for delivering tiles of a frame-oriented dataset
///
/// Holds only configuration. The eligibility test, I/O sizing and the
/// correction hook are shared by all backends; produce_tiles() is the part
/// every concrete backend supplies.
class BackendStrategy {
protected:
    bool verbose_{false};

    /// Checks shared by every produce_tiles() implementation
    [[nodiscard]] static Result<void> validate_request(const TileRequest& request) noexcept;

public:
    static constexpr std::size_t default_max_io_size = std::size_t{1} << 20;

    explicit BackendStrategy(bool verbose = false) noexcept
        : verbose_(verbose) {}

    virtual ~BackendStrategy() = default;

    /// Registry identifier ("mmap", "buffered", ...)
    [[nodiscard]] virtual std::string_view id() const noexcept = 0;

    /// Prefix of log lines
    [[nodiscard]] virtual std::string_view name() const noexcept = 0;

    /// Whether this backend ever yields views into mapped files
    [[nodiscard]] virtual bool supports_zero_copy() const noexcept {
        return false;
    }

    /// Largest single read issued by the backend, in bytes
    [[nodiscard]] virtual std::size_t max_io_size() const noexcept {
        return default_max_io_size;
    }

    [[nodiscard]] bool verbose() const noexcept {
        return verbose_;
    }

    /// @brief Evaluate the zero-copy eligibility conditions
    ///
    /// Conditions, in order: ROI given; decode needed; scheme and fileset both
    /// given and the smallest file holds fewer frames than the tile depth;
    /// corrections given and active; negative sync offset.
    /// @return The first condition that holds, CopyReason::None if zero-copy is legal
    [[nodiscard]] static CopyReason copy_reason(
        const RoiMask* roi,
        ElementType native_type,
        ElementType read_type,
        bool decoder_present,
        const TilingScheme* tiling_scheme,
        const FileSet* fileset,
        int64_t sync_offset,
        const CorrectionSet* corrections) noexcept;

    [[nodiscard]] static CopyReason copy_reason(const TileRequest& request) noexcept;

    /// @brief True when the data must be materialized through a copy
    /// Logs the deciding condition when the backend is verbose.
    [[nodiscard]] bool requires_copy(
        const RoiMask* roi,
        ElementType native_type,
        ElementType read_type,
        bool decoder_present,
        const TilingScheme* tiling_scheme,
        const FileSet* fileset,
        int64_t sync_offset,
        const CorrectionSet* corrections) const noexcept;

    [[nodiscard]] bool requires_copy(const TileRequest& request) const noexcept;

    [[nodiscard]] static bool needs_decode(bool decoder_present,
                                           ElementType native_type,
                                           ElementType read_type) noexcept {
        return decoder_present || !(native_type == read_type);
    }

    /// @brief Run the correction set over one tile buffer; no-op without a set
    [[nodiscard]] static Result<void> apply_corrections(
        MutableFrameView buffer,
        const TileSlice& region,
        const CorrectionSet* corrections) noexcept {
        if (corrections == nullptr) {
            return Ok();
        }
        return corrections->apply(buffer, region);
    }

    /// @brief Start delivering the tiles of request.read_plans, in plan order
    /// @note Files are opened here; open failures are reported before any tile is pulled.
    [[nodiscard]] virtual Result<TileStream> produce_tiles(const TileRequest& request) const noexcept = 0;
};

} // namespace frameio

#define FRAMEIO_BACKEND_HEADER
#include "impl/backend_impl.hpp"
