/**
 * @file transfer_error.cpp
 * @brief Mapping of libcurl status codes into transfer_error
 */

#include "kcenon/curl_transfer/core/transfer_error.h"

#include <utility>

namespace kcenon::curl_transfer {

transfer_error::transfer_error(error_domain domain, int code, std::string message)
    : domain_(domain), native_code_(code), message_(std::move(message)) {}

auto transfer_error::from_engine(CURLcode code, std::string_view detail) -> transfer_error {
    std::string message = detail.empty() ? std::string(curl_easy_strerror(code))
                                         : std::string(detail);
    // CURLOPT_ERRORBUFFER text usually carries a trailing newline
    while (!message.empty() && (message.back() == '\n' || message.back() == '\r')) {
        message.pop_back();
    }
    return transfer_error(error_domain::engine, static_cast<int>(code), std::move(message));
}

auto transfer_error::from_scheduler(CURLMcode code) -> transfer_error {
    return transfer_error(error_domain::scheduler, static_cast<int>(code),
                          curl_multi_strerror(code));
}

auto transfer_error::from_shared_state(CURLSHcode code) -> transfer_error {
    return transfer_error(error_domain::shared_state, static_cast<int>(code),
                          curl_share_strerror(code));
}

auto transfer_error::cancelled() -> transfer_error {
    return transfer_error(error_domain::transfer,
                          static_cast<int>(transfer_error_code::cancelled),
                          "transfer cancelled");
}

auto transfer_error::usage(std::string message) -> transfer_error {
    return transfer_error(error_domain::transfer,
                          static_cast<int>(transfer_error_code::usage_error),
                          std::move(message));
}

auto transfer_error::with_response_code(long code) -> transfer_error& {
    response_code_ = code;
    return *this;
}

auto transfer_error::with_failing_url(std::string url) -> transfer_error& {
    failing_url_ = std::move(url);
    return *this;
}

auto transfer_error::kind() const noexcept -> error_kind {
    switch (domain_) {
        case error_domain::engine:
            return error_kind::engine;
        case error_domain::scheduler:
            return error_kind::scheduler;
        case error_domain::shared_state:
            return error_kind::shared_state;
        case error_domain::transfer:
            if (native_code_ == static_cast<int>(transfer_error_code::cancelled)) {
                return error_kind::cancelled;
            }
            return error_kind::usage;
    }
    return error_kind::usage;
}

auto transfer_error::to_string() const -> std::string {
    std::string text = curl_transfer::to_string(domain_);
    text += "(" + std::to_string(native_code_) + "): " + message_;
    if (response_code_ != 0) {
        text += " [response " + std::to_string(response_code_) + "]";
    }
    return text;
}

}  // namespace kcenon::curl_transfer
