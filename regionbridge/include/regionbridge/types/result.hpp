#pragma once

#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace regionbridge {

/// Error type for codec and export operations
struct Error {
    enum class Code {
        Success,
        DecodeError,        ///< Malformed exchange-format text or member of the wrong type
        InvalidArgument,    ///< Non-positive chunk size, zero-area region, negative coordinates
        UnsupportedFormat,  ///< Unknown export format name
        IOError,            ///< Pixel storage could not be read
        EncodeError,        ///< Raster cannot be represented by the selected codec
        OutOfBounds,        ///< Request outside the image, or payload over container limits
        MemoryError
    };

    Code code;
    std::string message;

    Error(Code c, std::string msg = "") noexcept
        : code(c), message(std::move(msg)) {}

    [[nodiscard]] bool is_success() const noexcept {
        return code == Code::Success;
    }

    [[nodiscard]] bool is_error() const noexcept {
        return code != Code::Success;
    }
};

/// Short name of an error code, used in log lines
[[nodiscard]] constexpr const char* to_string(Error::Code code) noexcept {
    switch (code) {
        case Error::Code::Success: return "Success";
        case Error::Code::DecodeError: return "DecodeError";
        case Error::Code::InvalidArgument: return "InvalidArgument";
        case Error::Code::UnsupportedFormat: return "UnsupportedFormat";
        case Error::Code::IOError: return "IOError";
        case Error::Code::EncodeError: return "EncodeError";
        case Error::Code::OutOfBounds: return "OutOfBounds";
        case Error::Code::MemoryError: return "MemoryError";
    }
    return "Unknown";
}

/// Result type for operations that may fail without exceptions
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

    [[nodiscard]] bool is_ok() const noexcept {
        return data_.index() == 0;
    }

    [[nodiscard]] bool is_error() const noexcept {
        return data_.index() == 1;
    }

    [[nodiscard]] explicit operator bool() const noexcept {
        return is_ok();
    }

    [[nodiscard]] T& value() & noexcept {
        return std::get<0>(data_);
    }

    [[nodiscard]] const T& value() const& noexcept {
        return std::get<0>(data_);
    }

    [[nodiscard]] T&& value() && noexcept {
        return std::get<0>(std::move(data_));
    }

    [[nodiscard]] const Error& error() const noexcept {
        return std::get<1>(data_);
    }
};

// Specialization for void
template <>
class [[nodiscard]] Result<void> {
private:
    std::variant<std::monostate, Error> data_;

public:
    Result() noexcept : data_(std::monostate{}) {}

    Result(Error&& error) noexcept
        : data_(std::move(error)) {}

    Result(const Error& error) noexcept
        : data_(error) {}

    [[nodiscard]] bool is_ok() const noexcept {
        return std::holds_alternative<std::monostate>(data_);
    }

    [[nodiscard]] bool is_error() const noexcept {
        return std::holds_alternative<Error>(data_);
    }

    [[nodiscard]] explicit operator bool() const noexcept {
        return is_ok();
    }

    [[nodiscard]] const Error& error() const noexcept {
        return std::get<Error>(data_);
    }
};

template <typename T>
[[nodiscard]] Result<std::decay_t<T>> Ok(T&& value) {
    return Result<std::decay_t<T>>{std::forward<T>(value)};
}

[[nodiscard]] inline Result<void> Ok() {
    return Result<void>{};
}

[[nodiscard]] inline Error Err(Error::Code code, std::string message = "") {
    return Error{code, std::move(message)};
}

} // namespace regionbridge
