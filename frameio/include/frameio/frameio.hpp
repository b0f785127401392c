#pragma once

/// Main header of the frameio tile-delivery library
///
/// frameio reads large frame-oriented datasets split over many files and
/// delivers them as tiles (groups of consecutive frames), either as views
/// into the page cache or through an explicit read + decode path.
///
/// Key features:
/// - No exceptions: uses Result<T> for error handling
/// - Zero-copy eligibility decided once per partition (BackendStrategy::requires_copy)
/// - Pluggable backends selected by a JSON record (BackendRegistry)
/// - Lazy, pull-based tile streams that close their files when abandoned
///
/// Example usage:
/// ```cpp
/// #include <frameio/frameio.hpp>
///
/// using namespace frameio;
///
/// FileSet fileset({layout_a, layout_b});
/// TilingScheme scheme{.depth = 16, .sig_shape = {256, 256}};
/// auto plans = make_read_plans(scheme, fileset);
///
/// auto backend = BackendRegistry::instance().construct(nlohmann::json{{"id", "mmap"}});
///
/// TileRequest request;
/// request.tiling_scheme = &scheme;
/// request.fileset = &fileset;
/// request.read_plans = plans.value();
/// request.native_type = layout_a.native_type;
/// request.read_type = element_type_of<float>();
///
/// auto stream = backend.value()->produce_tiles(request);
/// while (true) {
///     auto tile = stream.value().next();
///     if (!tile || tile.value() == nullptr) break;
///     process(tile.value()->slice, tile.value()->data);
/// }
/// ```

#include "types/result.hpp"
#include "types/element_type.hpp"
#include "types/tile.hpp"
#include "file_handle.hpp"
#include "fileset.hpp"
#include "read_planner.hpp"
#include "decoder.hpp"
#include "corrections.hpp"
#include "config.hpp"
#include "tile_stream.hpp"
#include "backend.hpp"
#include "backends/mmap_backend.hpp"
#include "backends/buffered_backend.hpp"
#include "backend_registry.hpp"
