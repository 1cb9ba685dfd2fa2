/**
 * @file transfer_response.h
 * @brief Response metadata and the header-section parser
 */

#ifndef KCENON_CURL_TRANSFER_TRANSFER_TRANSFER_RESPONSE_H
#define KCENON_CURL_TRANSFER_TRANSFER_TRANSFER_RESPONSE_H

#include <map>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace kcenon::curl_transfer {

/**
 * @brief Header fields keyed by lower-cased name
 */
using header_map = std::map<std::string, std::string>;

/**
 * @brief Status code and headers of one header section
 *
 * Immutable once built. A transfer may produce several responses, for
 * example a "100 Continue" followed by the final "200 OK".
 */
class transfer_response {
public:
    transfer_response() = default;
    transfer_response(std::string url, long status_code, header_map headers);

    [[nodiscard]] auto url() const -> const std::string& { return url_; }
    [[nodiscard]] auto status_code() const noexcept -> long { return status_code_; }
    [[nodiscard]] auto headers() const -> const header_map& { return headers_; }

    /**
     * @brief Case-insensitive header lookup
     */
    [[nodiscard]] auto header(std::string_view name) const -> std::optional<std::string>;

    /**
     * @brief Value of Content-Length when present and numeric
     */
    [[nodiscard]] auto content_length() const -> std::optional<long long>;

    /**
     * @brief True for 1xx informational responses
     */
    [[nodiscard]] auto is_interim() const noexcept -> bool {
        return status_code_ >= 100 && status_code_ < 200;
    }

private:
    std::string url_;
    long status_code_ = 0;
    header_map headers_;
};

/**
 * @brief Builds a transfer_response from raw header lines
 *
 * The first line is the status line. HTTP ("HTTP/1.1 200 OK", "HTTP/2 204")
 * and FTP style replies ("226 Transfer complete", "220-Welcome") are
 * understood; anything else keeps the fallback status code.
 *
 * Remaining lines are "Name: Value" pairs:
 * - names are lower-cased
 * - a repeated name is folded into one value joined by ", "
 * - a line starting with a space or tab continues the previous value
 * - lines without a colon are ignored
 *
 * Pure function, no I/O.
 */
class response_builder {
public:
    /**
     * @brief Parse one header section
     * @param url URL the response belongs to
     * @param lines Raw lines in arrival order, with or without CRLF
     * @param fallback_status Status to use when the status line cannot be parsed
     */
    [[nodiscard]] static auto build(std::string url,
                                    std::span<const std::string> lines,
                                    long fallback_status = 0) -> transfer_response;

    /**
     * @brief Extract the status code from a status line
     */
    [[nodiscard]] static auto parse_status_line(std::string_view line)
        -> std::optional<long>;
};

}  // namespace kcenon::curl_transfer

#endif  // KCENON_CURL_TRANSFER_TRANSFER_TRANSFER_RESPONSE_H
