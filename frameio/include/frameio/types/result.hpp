#pragma once

#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace frameio {

/// @brief Error reported by every fallible frameio operation
struct Error {
    enum class Code {
        Success,
        FileNotFound,        ///< open() failed
        ReadError,           ///< read/seek/stat failure reported by the OS
        UnexpectedEndOfFile, ///< file ended before a read was satisfied
        MmapError,           ///< mmap() failed
        FileClosed,          ///< access to a FileHandle after close()
        MisalignedLayout,    ///< frame header/footer not a multiple of the element size
        InvalidLayout,       ///< file size does not match the declared frame layout
        InvalidArgument,     ///< caller passed inconsistent parameters
        OutOfBounds,         ///< range outside a file or a tile
        UnsupportedType,     ///< element type not handled by an operation
        UnknownBackend,      ///< no backend registered under the requested id
        InvalidConfig,       ///< malformed backend selection record
        NotImplemented,      ///< backend does not provide the requested operation
        IoUringError         ///< io_uring setup/submission/completion failure
    };

    Code code;
    std::string message;

    Error(Code c, std::string msg = "") noexcept
        : code(c), message(std::move(msg)) {}

    [[nodiscard]] bool is_error() const noexcept {
        return code != Code::Success;
    }
};

/// @brief Value-or-error return type; frameio does not throw
template <typename T>
class [[nodiscard]] Result {
private:
    std::variant<T, Error> data_;

public:
    Result(T&& value) noexcept(std::is_nothrow_move_constructible_v<T>)
        : data_(std::in_place_index<0>, std::move(value)) {}

    Result(const T& value) noexcept(std::is_nothrow_copy_constructible_v<T>)
        : data_(std::in_place_index<0>, value) {}

    Result(Error&& error) noexcept
        : data_(std::in_place_index<1>, std::move(error)) {}

    Result(const Error& error) noexcept
        : data_(std::in_place_index<1>, error) {}

    [[nodiscard]] bool is_ok() const noexcept { return data_.index() == 0; }
    [[nodiscard]] bool is_error() const noexcept { return data_.index() == 1; }
    [[nodiscard]] explicit operator bool() const noexcept { return is_ok(); }

    [[nodiscard]] T& value() & noexcept { return std::get<0>(data_); }
    [[nodiscard]] const T& value() const& noexcept { return std::get<0>(data_); }
    [[nodiscard]] T&& value() && noexcept { return std::get<0>(std::move(data_)); }

    [[nodiscard]] const Error& error() const noexcept { return std::get<1>(data_); }

    template <typename U>
    [[nodiscard]] T value_or(U&& default_value) const& {
        if (is_ok()) {
            return value();
        }
        return static_cast<T>(std::forward<U>(default_value));
    }

    /// Chain an operation returning Result<U> on success, forward the error otherwise
    template <typename F>
    [[nodiscard]] auto and_then(F&& func) && -> decltype(func(std::declval<T&&>())) {
        if (is_ok()) {
            return func(std::move(value()));
        }
        using RetType = decltype(func(std::declval<T&&>()));
        return RetType{error()};
    }
};

template <>
class [[nodiscard]] Result<void> {
private:
    std::variant<std::monostate, Error> data_;

public:
    Result() noexcept : data_(std::monostate{}) {}

    Result(Error&& error) noexcept : data_(std::move(error)) {}

    Result(const Error& error) noexcept : data_(error) {}

    [[nodiscard]] bool is_ok() const noexcept { return data_.index() == 0; }
    [[nodiscard]] bool is_error() const noexcept { return data_.index() == 1; }
    [[nodiscard]] explicit operator bool() const noexcept { return is_ok(); }

    [[nodiscard]] const Error& error() const noexcept { return std::get<1>(data_); }
};

template <typename T>
[[nodiscard]] inline Result<std::decay_t<T>> Ok(T&& value) {
    return Result<std::decay_t<T>>{std::forward<T>(value)};
}

[[nodiscard]] inline Result<void> Ok() {
    return Result<void>{};
}

[[nodiscard]] inline Error Err(Error::Code code, std::string message = "") {
    return Error{code, std::move(message)};
}

/// @brief Human readable name of an error code, used in log lines and test output
[[nodiscard]] inline const char* to_string(Error::Code code) noexcept {
    switch (code) {
        case Error::Code::Success: return "Success";
        case Error::Code::FileNotFound: return "FileNotFound";
        case Error::Code::ReadError: return "ReadError";
        case Error::Code::UnexpectedEndOfFile: return "UnexpectedEndOfFile";
        case Error::Code::MmapError: return "MmapError";
        case Error::Code::FileClosed: return "FileClosed";
        case Error::Code::MisalignedLayout: return "MisalignedLayout";
        case Error::Code::InvalidLayout: return "InvalidLayout";
        case Error::Code::InvalidArgument: return "InvalidArgument";
        case Error::Code::OutOfBounds: return "OutOfBounds";
        case Error::Code::UnsupportedType: return "UnsupportedType";
        case Error::Code::UnknownBackend: return "UnknownBackend";
        case Error::Code::InvalidConfig: return "InvalidConfig";
        case Error::Code::NotImplemented: return "NotImplemented";
        case Error::Code::IoUringError: return "IoUringError";
    }
    return "Unknown";
}

} // namespace frameio
