#pragma once

#include <cstddef>
#include <string>
#include <utility>
#include <variant>

namespace uuidkey {

enum class ErrorCode {
    InvalidKeyFormat,
    InvalidUuidLength,
    InvalidUuidFormat,
    InvalidUuidByteLength,
    EmptyPrefix,
    InvalidPrefix,
    EmptyInput,
    WrongPartCount,
    InsufficientLength,
    InvalidChecksumFormat,
    ChecksumMismatch,
    EntropyUnavailable,
};

const char* ErrorCodeName(ErrorCode code);

struct Error {
    ErrorCode code;
    std::string message;

    Error(ErrorCode c, std::string msg) : code(c), message(std::move(msg)) {}

    // error[Code]: message
    std::string Format() const;
};

// Either a value or the Error that prevented producing it.
template <typename T>
class Result {
public:
    // Implicit so that a failing call can return its Error directly.
    Result(Error error) : data_(std::in_place_index<1>, std::move(error)) {}

    static Result Ok(T value) { return Result(std::in_place_index<0>, std::move(value)); }
    static Result Fail(ErrorCode code, std::string message) { return Result(Error(code, std::move(message))); }

    bool ok() const noexcept { return data_.index() == 0; }
    explicit operator bool() const noexcept { return ok(); }

    T& value() & { return std::get<0>(data_); }
    const T& value() const& { return std::get<0>(data_); }
    T&& value() && { return std::get<0>(std::move(data_)); }

    const Error& error() const& { return std::get<1>(data_); }
    Error&& error() && { return std::get<1>(std::move(data_)); }

private:
    template <std::size_t I, typename U>
    Result(std::in_place_index_t<I> tag, U&& payload) : data_(tag, std::forward<U>(payload)) {}

    std::variant<T, Error> data_;
};

}  // namespace uuidkey
