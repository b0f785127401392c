#pragma once

#include <bit>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <limits>
#include <span>
#include <string>
#include <type_traits>
#include "types/element_type.hpp"
#include "types/result.hpp"

namespace frameio {

/// @brief Format-specific decoder used on the copy path
///
/// A decoder turns the raw bytes of one read range into elements of the
/// requested read type. Its mere presence forces the copy path, since a view
/// into the file cannot carry a value transformation.
///
/// Implementations must be safe to call concurrently from several streams.
class Decoder {
public:
    virtual ~Decoder() = default;

    /// @param input Raw bytes of one read range, as stored in the file
    /// @param native_type On-disk element type of the dataset
    /// @param output Destination, exactly the decoded element count times read_type.size()
    /// @param read_type Requested element type
    [[nodiscard]] virtual Result<void> decode(
        std::span<const std::byte> input,
        ElementType native_type,
        std::span<std::byte> output,
        ElementType read_type) const noexcept = 0;
};

namespace detail {

    template <typename T>
    [[nodiscard]] inline T load_element(const std::byte* src, bool swap) noexcept {
        if constexpr (sizeof(T) == 1) {
            T value;
            std::memcpy(&value, src, 1);
            return value;
        } else {
            using Bits = std::conditional_t<sizeof(T) == 2, uint16_t,
                         std::conditional_t<sizeof(T) == 4, uint32_t, uint64_t>>;
            Bits bits;
            std::memcpy(&bits, src, sizeof(T));
            if (swap) {
                bits = byteswap(bits);
            }
            return std::bit_cast<T>(bits);
        }
    }

    template <typename T>
    inline void store_element(std::byte* dst, T value, bool swap) noexcept {
        if constexpr (sizeof(T) == 1) {
            std::memcpy(dst, &value, 1);
        } else {
            using Bits = std::conditional_t<sizeof(T) == 2, uint16_t,
                         std::conditional_t<sizeof(T) == 4, uint32_t, uint64_t>>;
            Bits bits = std::bit_cast<Bits>(value);
            if (swap) {
                bits = byteswap(bits);
            }
            std::memcpy(dst, &bits, sizeof(T));
        }
    }

    /// Numeric cast; floating point into an integer saturates, NaN becomes 0
    template <typename Out, typename In>
    [[nodiscard]] inline Out convert_value(In value) noexcept {
        if constexpr (std::is_floating_point_v<In> && std::is_integral_v<Out>) {
            if (std::isnan(value)) {
                return Out{0};
            }
            if (value <= static_cast<In>(std::numeric_limits<Out>::lowest())) {
                return std::numeric_limits<Out>::lowest();
            }
            // max() may round up when converted to In, so compare with >=
            if (value >= static_cast<In>(std::numeric_limits<Out>::max())) {
                return std::numeric_limits<Out>::max();
            }
            return static_cast<Out>(value);
        } else if constexpr (std::is_same_v<In, double> && std::is_same_v<Out, float>) {
            if (value > static_cast<double>(std::numeric_limits<float>::max())) {
                return std::numeric_limits<float>::infinity();
            }
            if (value < static_cast<double>(std::numeric_limits<float>::lowest())) {
                return -std::numeric_limits<float>::infinity();
            }
            return static_cast<float>(value);
        } else {
            return static_cast<Out>(value);
        }
    }

    template <typename In, typename Out>
    inline void convert_loop(const std::byte* src, bool swap_in,
                             std::byte* dst, bool swap_out, std::size_t count) noexcept {
        for (std::size_t i = 0; i < count; ++i) {
            In value = load_element<In>(src + i * sizeof(In), swap_in);
            store_element<Out>(dst + i * sizeof(Out), convert_value<Out>(value), swap_out);
        }
    }

} // namespace detail

/// @brief Default element conversion: byte-order fix-up plus numeric cast
/// Used on the copy path when native and read types differ and no decoder is configured.
/// Floating point values outside the range of an integer read type saturate; NaN reads as 0.
[[nodiscard]] inline Result<void> convert_elements(
    std::span<const std::byte> input,
    ElementType native_type,
    std::span<std::byte> output,
    ElementType read_type) noexcept {

    if (input.size() % native_type.size() != 0) {
        return Err(Error::Code::InvalidArgument,
                   "input of " + std::to_string(input.size()) +
                   " bytes is not a whole number of " + native_type.name() + " elements");
    }
    const std::size_t count = input.size() / native_type.size();
    if (output.size() != count * read_type.size()) {
        return Err(Error::Code::OutOfBounds,
                   "output buffer does not hold " + std::to_string(count) + " " +
                   read_type.name() + " elements");
    }

    if (native_type == read_type) {
        std::memcpy(output.data(), input.data(), input.size());
        return Ok();
    }

    const bool swap_in = native_type.needs_byteswap();
    const bool swap_out = read_type.needs_byteswap();
    dispatch_dtype(native_type.kind, [&](auto in_tag) {
        using In = decltype(in_tag);
        dispatch_dtype(read_type.kind, [&](auto out_tag) {
            using Out = decltype(out_tag);
            detail::convert_loop<In, Out>(input.data(), swap_in, output.data(), swap_out, count);
        });
    });
    return Ok();
}

/// @brief Decode one range with `decoder` if given, else with convert_elements()
[[nodiscard]] inline Result<void> decode_range(
    const Decoder* decoder,
    std::span<const std::byte> input,
    ElementType native_type,
    std::span<std::byte> output,
    ElementType read_type) noexcept {
    if (decoder != nullptr) {
        return decoder->decode(input, native_type, output, read_type);
    }
    return convert_elements(input, native_type, output, read_type);
}

} // namespace frameio
