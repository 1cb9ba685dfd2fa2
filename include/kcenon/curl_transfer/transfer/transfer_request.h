/**
 * @file transfer_request.h
 * @brief Protocol-neutral description of a transfer
 */

#ifndef KCENON_CURL_TRANSFER_TRANSFER_TRANSFER_REQUEST_H
#define KCENON_CURL_TRANSFER_TRANSFER_TRANSFER_REQUEST_H

#include "kcenon/curl_transfer/transfer/transfer_types.h"
#include "kcenon/curl_transfer/transfer/upload_source.h"

#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace kcenon::curl_transfer {

/**
 * @brief A request to be turned into a transfer_handle
 *
 * @code
 * transfer_request req;
 * req.url = "ftp://example.com/pub/file.bin";
 * req.add_header("Range", "bytes=0-1023");
 * @endcode
 *
 * A non-empty body or a body_source switches the transfer into upload mode
 * for every protocol, except for method "POST" which posts it.
 */
struct transfer_request {
    std::string url;
    std::string method = "GET";
    std::vector<std::pair<std::string, std::string>> headers;

    /// In-memory body; ignored when body_source is set
    std::vector<std::byte> body;

    /// Streaming body
    std::unique_ptr<upload_source> body_source;

    std::optional<std::chrono::milliseconds> timeout;
    std::optional<std::chrono::milliseconds> connect_timeout;

    transfer_options options;

    transfer_request() = default;
    explicit transfer_request(std::string request_url) : url(std::move(request_url)) {}

    auto add_header(std::string name, std::string value) -> transfer_request& {
        headers.emplace_back(std::move(name), std::move(value));
        return *this;
    }

    auto set_body(std::string_view text) -> transfer_request& {
        body.resize(text.size());
        for (std::size_t i = 0; i < text.size(); ++i) {
            body[i] = static_cast<std::byte>(text[i]);
        }
        return *this;
    }

    [[nodiscard]] auto has_body() const noexcept -> bool {
        return body_source != nullptr || !body.empty();
    }
};

}  // namespace kcenon::curl_transfer

#endif  // KCENON_CURL_TRANSFER_TRANSFER_TRANSFER_REQUEST_H
