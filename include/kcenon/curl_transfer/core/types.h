/**
 * @file types.h
 * @brief Core type definitions for curl_transfer
 */

#ifndef KCENON_CURL_TRANSFER_CORE_TYPES_H
#define KCENON_CURL_TRANSFER_CORE_TYPES_H

#include <cstdint>
#include <optional>
#include <string>
#include <utility>

namespace kcenon::curl_transfer {

/**
 * @brief Error codes for library-level operations
 *
 * These cover construction and scheduling misuse reported through
 * result<T>. Failures of a running transfer are reported through the
 * delegate as transfer_error instead.
 */
enum class error_code {
    success = 0,

    // Usage errors (-100 to -119)
    missing_delegate = -100,
    invalid_url = -101,
    already_started = -102,
    invalid_argument = -103,

    // Engine setup errors (-120 to -139)
    engine_init_failed = -120,
    engine_option_failed = -121,

    // Scheduler errors (-140 to -159)
    scheduler_init_failed = -140,
    scheduler_stopped = -141,
    shared_state_init_failed = -142,

    // Upload source errors (-160 to -179)
    source_read_failed = -160,
    source_not_rewindable = -161,
    source_rewind_failed = -162,

    // Internal errors (-200 to -219)
    internal_error = -200,
};

/**
 * @brief Convert error code to string
 */
[[nodiscard]] constexpr auto to_string(error_code code) -> const char* {
    switch (code) {
        case error_code::success:
            return "success";
        case error_code::missing_delegate:
            return "delegate is required";
        case error_code::invalid_url:
            return "invalid url";
        case error_code::already_started:
            return "handle already started";
        case error_code::invalid_argument:
            return "invalid argument";
        case error_code::engine_init_failed:
            return "engine handle initialization failed";
        case error_code::engine_option_failed:
            return "engine option rejected";
        case error_code::scheduler_init_failed:
            return "scheduler initialization failed";
        case error_code::scheduler_stopped:
            return "scheduler stopped";
        case error_code::shared_state_init_failed:
            return "shared state initialization failed";
        case error_code::source_read_failed:
            return "upload source read failed";
        case error_code::source_not_rewindable:
            return "upload source cannot rewind";
        case error_code::source_rewind_failed:
            return "upload source rewind failed";
        case error_code::internal_error:
            return "internal error";
        default:
            return "unknown error";
    }
}

/**
 * @brief Error type with code and optional message
 */
struct error {
    error_code code;
    std::string message;

    error() : code(error_code::success) {}
    explicit error(error_code c) : code(c), message(to_string(c)) {}
    error(error_code c, std::string msg) : code(c), message(std::move(msg)) {}

    [[nodiscard]] explicit operator bool() const noexcept {
        return code != error_code::success;
    }
};

/**
 * @brief Wrapper for unexpected error (used with result<T>)
 */
struct unexpected {
    error err;

    explicit unexpected(error e) : err(std::move(e)) {}
};

/**
 * @brief Result type for operations that can fail
 *
 * A simple Result type similar to std::expected (C++23).
 * Contains either a value of type T or an error.
 */
template <typename T>
class result {
public:
    result() : value_(std::nullopt), error_{} {}

    result(T value) : value_(std::move(value)), error_{} {}

    result(unexpected u) : value_(std::nullopt), error_(std::move(u.err)) {}

    result(const result&) = default;
    result(result&&) noexcept = default;
    auto operator=(const result&) -> result& = default;
    auto operator=(result&&) noexcept -> result& = default;

    [[nodiscard]] auto has_value() const noexcept -> bool { return value_.has_value(); }
    [[nodiscard]] explicit operator bool() const noexcept { return value_.has_value(); }

    [[nodiscard]] auto value() & -> T& { return *value_; }
    [[nodiscard]] auto value() const& -> const T& { return *value_; }
    [[nodiscard]] auto value() && -> T&& { return std::move(*value_); }

    [[nodiscard]] auto error() const -> const struct error& { return error_; }

private:
    std::optional<T> value_;
    struct error error_;
};

/**
 * @brief Specialization of result for void return type
 */
template <>
class result<void> {
public:
    result() : has_value_(true) {}

    result(unexpected u) : has_value_(false), error_(std::move(u.err)) {}

    result(const result&) = default;
    result(result&&) noexcept = default;
    auto operator=(const result&) -> result& = default;
    auto operator=(result&&) noexcept -> result& = default;

    [[nodiscard]] auto has_value() const noexcept -> bool { return has_value_; }
    [[nodiscard]] explicit operator bool() const noexcept { return has_value_; }

    [[nodiscard]] auto error() const -> const struct error& { return error_; }

private:
    bool has_value_;
    struct error error_;
};

/**
 * @brief User credential applied to a transfer
 */
struct credential {
    std::string user;
    std::string password;

    [[nodiscard]] auto empty() const noexcept -> bool {
        return user.empty() && password.empty();
    }
};

}  // namespace kcenon::curl_transfer

#endif  // KCENON_CURL_TRANSFER_CORE_TYPES_H
