/**
 * @file transfer_error.h
 * @brief Unified error reported for failed transfers
 *
 * libcurl reports failures in three independent code spaces: CURLcode for a
 * single transfer, CURLMcode for the multi handle and CURLSHcode for the
 * share handle. transfer_error carries the code together with its domain, a
 * readable message, and the HTTP/FTP response code when one was received.
 */

#ifndef KCENON_CURL_TRANSFER_CORE_TRANSFER_ERROR_H
#define KCENON_CURL_TRANSFER_CORE_TRANSFER_ERROR_H

#include <curl/curl.h>

#include <cstdint>
#include <string>
#include <string_view>

namespace kcenon::curl_transfer {

/**
 * @brief Code space a transfer_error's native code belongs to
 */
enum class error_domain {
    engine,        ///< CURLcode (per-transfer)
    scheduler,     ///< CURLMcode (multi handle)
    shared_state,  ///< CURLSHcode (share handle)
    transfer       ///< transfer_error_code (cancellation, misuse)
};

[[nodiscard]] constexpr auto to_string(error_domain domain) noexcept -> const char* {
    switch (domain) {
        case error_domain::engine: return "curl.easy";
        case error_domain::scheduler: return "curl.multi";
        case error_domain::shared_state: return "curl.share";
        case error_domain::transfer: return "transfer";
        default: return "unknown";
    }
}

/**
 * @brief Native codes of the transfer domain
 */
enum class transfer_error_code : int32_t {
    cancelled = -999,
    usage_error = -1000,
};

/**
 * @brief Coarse classification used by callers deciding how to react
 */
enum class error_kind {
    engine,
    scheduler,
    shared_state,
    cancelled,
    usage
};

[[nodiscard]] constexpr auto to_string(error_kind kind) noexcept -> const char* {
    switch (kind) {
        case error_kind::engine: return "engine";
        case error_kind::scheduler: return "scheduler";
        case error_kind::shared_state: return "shared_state";
        case error_kind::cancelled: return "cancelled";
        case error_kind::usage: return "usage";
        default: return "unknown";
    }
}

/**
 * @brief Error delivered through transfer_delegate::on_failed
 *
 * A response code of 400 or above never creates a transfer_error on its
 * own; it is attached to an error only as context.
 */
class transfer_error {
public:
    /**
     * @brief Error from a per-transfer CURLcode
     * @param code Non-zero engine status
     * @param detail Text captured in CURLOPT_ERRORBUFFER; when empty the
     *        generic curl_easy_strerror() text is used
     */
    [[nodiscard]] static auto from_engine(CURLcode code, std::string_view detail = {})
        -> transfer_error;

    [[nodiscard]] static auto from_scheduler(CURLMcode code) -> transfer_error;

    [[nodiscard]] static auto from_shared_state(CURLSHcode code) -> transfer_error;

    [[nodiscard]] static auto cancelled() -> transfer_error;

    [[nodiscard]] static auto usage(std::string message) -> transfer_error;

    auto with_response_code(long code) -> transfer_error&;
    auto with_failing_url(std::string url) -> transfer_error&;

    [[nodiscard]] auto domain() const noexcept -> error_domain { return domain_; }
    [[nodiscard]] auto native_code() const noexcept -> int { return native_code_; }
    [[nodiscard]] auto message() const -> const std::string& { return message_; }

    /**
     * @brief HTTP/FTP status code received before the failure, 0 if none
     */
    [[nodiscard]] auto response_code() const noexcept -> long { return response_code_; }

    [[nodiscard]] auto failing_url() const -> const std::string& { return failing_url_; }

    [[nodiscard]] auto kind() const noexcept -> error_kind;
    [[nodiscard]] auto is_cancelled() const noexcept -> bool {
        return kind() == error_kind::cancelled;
    }

    /**
     * @brief One-line description, e.g. "curl.easy(7): Couldn't connect to server"
     */
    [[nodiscard]] auto to_string() const -> std::string;

private:
    transfer_error(error_domain domain, int code, std::string message);

    error_domain domain_;
    int native_code_;
    std::string message_;
    long response_code_ = 0;
    std::string failing_url_;
};

}  // namespace kcenon::curl_transfer

#endif  // KCENON_CURL_TRANSFER_CORE_TRANSFER_ERROR_H
