#pragma once

#include <bit>
#include <cstddef>
#include <cstdint>
#include <string>
#include <type_traits>

namespace frameio {

/// @brief Numeric kind of a dataset element
enum class DType : uint8_t {
    U8, U16, U32, U64,
    I8, I16, I32, I64,
    F32, F64
};

/// @brief Size in bytes of one element of the given kind
[[nodiscard]] constexpr std::size_t element_size(DType kind) noexcept {
    switch (kind) {
        case DType::U8:
        case DType::I8:
            return 1;
        case DType::U16:
        case DType::I16:
            return 2;
        case DType::U32:
        case DType::I32:
        case DType::F32:
            return 4;
        case DType::U64:
        case DType::I64:
        case DType::F64:
            return 8;
    }
    return 0;
}

[[nodiscard]] constexpr bool is_floating_point(DType kind) noexcept {
    return kind == DType::F32 || kind == DType::F64;
}

[[nodiscard]] constexpr const char* dtype_name(DType kind) noexcept {
    switch (kind) {
        case DType::U8:  return "u8";  case DType::U16: return "u16";
        case DType::U32: return "u32"; case DType::U64: return "u64";
        case DType::I8:  return "i8";  case DType::I16: return "i16";
        case DType::I32: return "i32"; case DType::I64: return "i64";
        case DType::F32: return "f32"; case DType::F64: return "f64";
    }
    return "?";
}

/// @brief Element kind plus the byte order it is stored in
/// @note The on-disk ("native") type of a dataset may be foreign-endian;
/// the requested read type is normally host order.
struct ElementType {
    DType kind{DType::U8};
    std::endian order{std::endian::native};

    [[nodiscard]] constexpr std::size_t size() const noexcept { return element_size(kind); }

    /// Single-byte elements have no byte order to honor
    [[nodiscard]] constexpr bool needs_byteswap() const noexcept {
        return size() > 1 && order != std::endian::native;
    }

    [[nodiscard]] std::string name() const {
        std::string out = size() > 1 ? (order == std::endian::little ? "<" : ">") : "|";
        return out + dtype_name(kind);
    }

    friend constexpr bool operator==(const ElementType& a, const ElementType& b) noexcept {
        if (a.kind != b.kind) {
            return false;
        }
        return a.size() == 1 || a.order == b.order;
    }
};

/// @brief Map a C++ arithmetic type to its DType
template <typename T>
struct dtype_of;

template <> struct dtype_of<uint8_t>  { static constexpr DType value = DType::U8; };
template <> struct dtype_of<uint16_t> { static constexpr DType value = DType::U16; };
template <> struct dtype_of<uint32_t> { static constexpr DType value = DType::U32; };
template <> struct dtype_of<uint64_t> { static constexpr DType value = DType::U64; };
template <> struct dtype_of<int8_t>   { static constexpr DType value = DType::I8; };
template <> struct dtype_of<int16_t>  { static constexpr DType value = DType::I16; };
template <> struct dtype_of<int32_t>  { static constexpr DType value = DType::I32; };
template <> struct dtype_of<int64_t>  { static constexpr DType value = DType::I64; };
template <> struct dtype_of<float>    { static constexpr DType value = DType::F32; };
template <> struct dtype_of<double>   { static constexpr DType value = DType::F64; };

/// @brief Host-order ElementType for a C++ arithmetic type
template <typename T>
[[nodiscard]] constexpr ElementType element_type_of(std::endian order = std::endian::native) noexcept {
    return ElementType{dtype_of<T>::value, order};
}

/// @brief Byte-swap an integral value
template <typename T>
    requires std::is_integral_v<T>
[[nodiscard]] constexpr T byteswap(T value) noexcept {
    if constexpr (sizeof(T) == 1) {
        return value;
    } else if constexpr (sizeof(T) == 2) {
        return static_cast<T>(__builtin_bswap16(static_cast<uint16_t>(value)));
    } else if constexpr (sizeof(T) == 4) {
        return static_cast<T>(__builtin_bswap32(static_cast<uint32_t>(value)));
    } else {
        return static_cast<T>(__builtin_bswap64(static_cast<uint64_t>(value)));
    }
}

/// @brief Invoke func with a default-constructed value of the C++ type matching kind
/// Used to turn a runtime DType into a template instantiation.
template <typename F>
constexpr decltype(auto) dispatch_dtype(DType kind, F&& func) {
    switch (kind) {
        case DType::U8:  return func(uint8_t{});
        case DType::U16: return func(uint16_t{});
        case DType::U32: return func(uint32_t{});
        case DType::U64: return func(uint64_t{});
        case DType::I8:  return func(int8_t{});
        case DType::I16: return func(int16_t{});
        case DType::I32: return func(int32_t{});
        case DType::I64: return func(int64_t{});
        case DType::F32: return func(float{});
        case DType::F64: return func(double{});
    }
    return func(uint8_t{});
}

} // namespace frameio
