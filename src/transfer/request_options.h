/**
 * @file request_options.h
 * @brief Translation of a transfer_request into engine options
 *
 * Internal header.
 */

#ifndef KCENON_CURL_TRANSFER_SRC_TRANSFER_REQUEST_OPTIONS_H
#define KCENON_CURL_TRANSFER_SRC_TRANSFER_REQUEST_OPTIONS_H

#include "kcenon/curl_transfer/core/global_config.h"
#include "kcenon/curl_transfer/core/types.h"
#include "kcenon/curl_transfer/transfer/transfer_request.h"

#include <curl/curl.h>

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace kcenon::curl_transfer::detail {

/**
 * @brief Sets engine options and keeps the first failure
 */
class option_writer {
public:
    explicit option_writer(CURL* easy) : easy_(easy) {}

    template <typename T>
    void set(CURLoption option, T value, std::string_view name) {
        if (failure_) {
            return;
        }
        CURLcode code = curl_easy_setopt(easy_, option, value);
        if (code != CURLE_OK) {
            failure_ = error{error_code::engine_option_failed,
                             std::string(name) + ": " + curl_easy_strerror(code)};
        }
    }

    [[nodiscard]] auto finish() const -> result<void> {
        if (failure_) {
            return unexpected{*failure_};
        }
        return {};
    }

private:
    CURL* easy_;
    std::optional<error> failure_;
};

/**
 * @brief Body mode chosen for a request
 */
enum class body_mode {
    none,
    upload,
    post
};

[[nodiscard]] auto select_body_mode(const transfer_request& request) -> body_mode;

/**
 * @brief Remove a leading "bytes=" unit from a Range header value
 */
[[nodiscard]] auto strip_range_unit(std::string_view value) -> std::string;

/**
 * @brief True for schemes that authenticate the server with an SSH host key
 */
[[nodiscard]] auto uses_ssh_host_key(std::string_view url) -> bool;

/**
 * @brief Apply method, headers, body sizes, timeouts, options and credentials
 *
 * Callbacks are not installed here. Every curl_slist created is appended to
 * @p aux_lists, whose owner frees them after the easy handle.
 *
 * @param body_size Known size of the upload body, if any
 */
[[nodiscard]] auto apply_request_options(CURL* easy,
                                         const transfer_request& request,
                                         std::optional<uint64_t> body_size,
                                         const std::optional<credential>& user,
                                         const proxy_settings& proxy,
                                         std::vector<curl_slist*>& aux_lists) -> result<void>;

}  // namespace kcenon::curl_transfer::detail

#endif  // KCENON_CURL_TRANSFER_SRC_TRANSFER_REQUEST_OPTIONS_H
