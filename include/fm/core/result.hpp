/**
 * @file result.hpp
 * @brief Result<T, E> return type and the library's Error value
 */

#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <variant>

namespace fm {

enum class ErrorCode {
    InvalidArgument,
    NotFound,
    IOError
};

inline const char* to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::InvalidArgument: return "InvalidArgument";
        case ErrorCode::NotFound: return "NotFound";
        case ErrorCode::IOError: return "IOError";
    }
    return "Unknown";
}

/**
 * @brief Failure description carried by Result
 */
struct Error {
    ErrorCode code = ErrorCode::IOError;
    std::string message;
    std::filesystem::path path; ///< Offending path, empty when not tied to one

    Error() = default;
    Error(ErrorCode c, std::string msg, std::filesystem::path p = {})
        : code(c), message(std::move(msg)), path(std::move(p)) {}

    std::string describe() const {
        std::string text = std::string(to_string(code)) + ": " + message;
        if (!path.empty()) {
            text += " (" + path.string() + ")";
        }
        return text;
    }
};

// Helper wrapper types for disambiguation when T == E
template<typename T>
struct OkValue {
    T value;
    explicit OkValue(T v) : value(std::move(v)) {}
};

template<typename E>
struct ErrValue {
    E error;
    explicit ErrValue(E e) : error(std::move(e)) {}
};

template<typename T, typename E = Error>
class Result {
private:
    std::variant<T, E> data_;

public:
    Result(OkValue<T> ok) : data_(std::in_place_index<0>, std::move(ok.value)) {}

    Result(ErrValue<E> err) : data_(std::in_place_index<1>, std::move(err.error)) {}

    bool is_ok() const { return data_.index() == 0; }
    bool is_error() const { return data_.index() == 1; }

    T& value() { return std::get<0>(data_); }
    const T& value() const { return std::get<0>(data_); }

    E& error() { return std::get<1>(data_); }
    const E& error() const { return std::get<1>(data_); }

    T value_or(T default_value) const {
        return is_ok() ? value() : std::move(default_value);
    }
};

template<typename E>
class Result<void, E> {
public:
    Result() : error_(std::nullopt) {}
    Result(ErrValue<E> err) : error_(std::move(err.error)) {}

    bool is_ok() const { return !error_.has_value(); }
    bool is_error() const { return error_.has_value(); }

    const E& error() const { return error_.value(); }

private:
    std::optional<E> error_;
};

template<typename T>
Result<T> Ok(T value) { return Result<T>(OkValue<T>(std::move(value))); }

template<typename E = Error>
Result<void, E> Ok() { return Result<void, E>(); }

template<typename T, typename E>
Result<T, E> Err(E error) { return Result<T, E>(ErrValue<E>(std::move(error))); }

template<typename T>
Result<T> Err(ErrorCode code, std::string message, std::filesystem::path path = {}) {
    return Result<T>(ErrValue<Error>(Error(code, std::move(message), std::move(path))));
}

} // namespace fm
