#pragma once

#include <memory>
#include <utility>
#include "types/result.hpp"
#include "types/tile.hpp"

namespace frameio {

/// @brief Backend-side producer behind a TileStream
/// next() returns the next tile, or nullptr once the sequence is exhausted.
/// close() releases every resource (open files, mappings, buffers); it is
/// called exactly once by the owning stream.
class TileGenerator {
public:
    virtual ~TileGenerator() = default;

    [[nodiscard]] virtual Result<const Tile*> next() noexcept = 0;

    virtual void close() noexcept = 0;
};

/// @brief Lazy, one-shot, pull-based sequence of tiles
///
/// @code{.cpp}
/// auto stream = backend.produce_tiles(request);
/// while (true) {
///     auto tile = stream.value().next();
///     if (!tile) { /* I/O or decode error, stream is closed */ }
///     if (tile.value() == nullptr) break;
///     consume(*tile.value());
/// }
/// @endcode
///
/// A tile stays valid until the next call to next() or until the stream is closed.
/// The stream closes its generator on exhaustion, on the first error, on close()
/// and on destruction, so abandoning it early releases all files.
class TileStream {
private:
    std::unique_ptr<TileGenerator> generator_;
    bool closed_{false};

public:
    TileStream() noexcept = default;

    explicit TileStream(std::unique_ptr<TileGenerator> generator) noexcept
        : generator_(std::move(generator)) {}

    ~TileStream() noexcept {
        close();
    }

    TileStream(const TileStream&) = delete;
    TileStream& operator=(const TileStream&) = delete;

    TileStream(TileStream&& other) noexcept
        : generator_(std::move(other.generator_))
        , closed_(other.closed_) {
        other.closed_ = true;
    }

    TileStream& operator=(TileStream&& other) noexcept {
        if (this != &other) {
            close();
            generator_ = std::move(other.generator_);
            closed_ = other.closed_;
            other.closed_ = true;
        }
        return *this;
    }

    [[nodiscard]] Result<const Tile*> next() noexcept {
        if (closed_ || !generator_) {
            return Ok(static_cast<const Tile*>(nullptr));
        }
        auto result = generator_->next();
        if (!result || result.value() == nullptr) {
            close();
        }
        return result;
    }

    void close() noexcept {
        if (!closed_ && generator_) {
            generator_->close();
        }
        closed_ = true;
    }

    [[nodiscard]] bool is_closed() const noexcept {
        return closed_ || !generator_;
    }
};

} // namespace frameio
