#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace dmconcept {

/// @brief Failure of a codec operation
/// @details `offset` is the byte position in the source or sink where the
/// problem was detected, when there is one.
struct Error {
    enum class Code {
        Success,
        FileNotFound,
        SourceReadError,     ///< The byte source failed
        SinkWriteError,      ///< The byte sink failed or cannot take the file
        OutOfBounds,
        MemoryError,
        TruncatedInput,      ///< The data ended inside a declared length
        MalformedTag,        ///< The tag stream contradicts its own grammar
        UnknownTypeCode,
        UnsupportedVersion,  ///< Version marker or byte order flag
        UnrecognizedLayout,  ///< No image can be built from the tag tree
        InvalidMetadata      ///< Metadata does not describe the array given
    };

    Code code;
    std::string message;
    std::optional<std::uint64_t> offset;

    Error(Code c, std::string msg = {}, std::optional<std::uint64_t> at = std::nullopt) noexcept
        : code(c), message(std::move(msg)), offset(at) {}
};

/// @brief Value or Error, returned instead of throwing
template <typename T>
class [[nodiscard]] Result {
private:
    std::variant<T, Error> state_;

public:
    Result(T&& value) noexcept(std::is_nothrow_move_constructible_v<T>)
        : state_(std::in_place_index<0>, std::move(value)) {}
    Result(const T& value)
        : state_(std::in_place_index<0>, value) {}
    Result(Error error) noexcept
        : state_(std::in_place_index<1>, std::move(error)) {}

    [[nodiscard]] bool is_ok() const noexcept { return state_.index() == 0; }
    [[nodiscard]] bool is_error() const noexcept { return state_.index() == 1; }

    /// @pre is_ok()
    [[nodiscard]] T& value() & noexcept { return *std::get_if<0>(&state_); }
    [[nodiscard]] const T& value() const& noexcept { return *std::get_if<0>(&state_); }
    [[nodiscard]] T&& value() && noexcept { return std::move(*std::get_if<0>(&state_)); }

    /// @pre is_error()
    [[nodiscard]] const Error& error() const noexcept { return *std::get_if<1>(&state_); }
};

template <>
class [[nodiscard]] Result<void> {
private:
    std::optional<Error> error_;

public:
    Result() noexcept = default;
    Result(Error error) noexcept : error_(std::move(error)) {}

    [[nodiscard]] bool is_ok() const noexcept { return !error_.has_value(); }
    [[nodiscard]] bool is_error() const noexcept { return error_.has_value(); }

    /// @pre is_error()
    [[nodiscard]] const Error& error() const noexcept { return *error_; }
};

template <typename T>
[[nodiscard]] Result<std::decay_t<T>> Ok(T&& value) {
    return Result<std::decay_t<T>>(std::forward<T>(value));
}

[[nodiscard]] inline Result<void> Ok() noexcept {
    return Result<void>{};
}

[[nodiscard]] inline Error Err(Error::Code code, std::string message = {},
                               std::optional<std::uint64_t> offset = std::nullopt) noexcept {
    return Error{code, std::move(message), offset};
}

} // namespace dmconcept
