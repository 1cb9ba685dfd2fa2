/**
 * @file transfer_types.h
 * @brief Enumerations and options shared by transfer components
 */

#ifndef KCENON_CURL_TRANSFER_TRANSFER_TRANSFER_TYPES_H
#define KCENON_CURL_TRANSFER_TRANSFER_TRANSFER_TYPES_H

#include <cstddef>
#include <optional>
#include <string>

namespace kcenon::curl_transfer {

/**
 * @brief Lifecycle of a transfer handle
 *
 * running -> canceling -> completed, or running -> completed.
 * Transitions are monotonic.
 */
enum class handle_state {
    running,
    canceling,
    completed
};

[[nodiscard]] constexpr auto to_string(handle_state state) noexcept -> const char* {
    switch (state) {
        case handle_state::running: return "running";
        case handle_state::canceling: return "canceling";
        case handle_state::completed: return "completed";
        default: return "unknown";
    }
}

/**
 * @brief Kind of data passed to transfer_delegate::on_debug_info
 */
enum class debug_info_type {
    text,
    header_in,
    header_out,
    data_in,
    data_out,
    ssl_data_in,
    ssl_data_out
};

[[nodiscard]] constexpr auto to_string(debug_info_type type) noexcept -> const char* {
    switch (type) {
        case debug_info_type::text: return "text";
        case debug_info_type::header_in: return "header_in";
        case debug_info_type::header_out: return "header_out";
        case debug_info_type::data_in: return "data_in";
        case debug_info_type::data_out: return "data_out";
        case debug_info_type::ssl_data_in: return "ssl_data_in";
        case debug_info_type::ssl_data_out: return "ssl_data_out";
        default: return "unknown";
    }
}

/**
 * @brief Per-transfer engine options
 */
struct transfer_options {
    /// Deliver the engine's debug stream through on_debug_info
    bool verbose = false;

    /// known_hosts file for SSH based protocols; enables the host key check
    std::optional<std::string> known_hosts_path;

    /// Receive buffer size hint in bytes
    std::optional<std::size_t> buffer_size;

    /// Create missing remote directories on FTP/SFTP uploads
    bool ftp_create_missing_dirs = false;

    /// Send credentials only after the server names an HTTP auth scheme.
    /// The request body is then sent twice, so its source must rewind.
    bool any_http_auth = false;
};

}  // namespace kcenon::curl_transfer

#endif  // KCENON_CURL_TRANSFER_TRANSFER_TRANSFER_TYPES_H
